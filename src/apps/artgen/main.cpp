// Headless batch generator: runs one batch against a JSON document (C++20)
#include <artboard_loaders/batch_inputs.hpp>
#include <artboard_loaders/json_writer.hpp>
#include <artboard_log/logger.hpp>
#include <artboard_model/errors.hpp>
#include <artboard_pipeline/batch_coordinator.hpp>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <string>

namespace {

void print_usage(const char* argv0) {
    (void)fprintf(stderr,
        "usage: %s [--document FILE] [--sizes FILE | --presets] [--config FILE]\n"
        "          [--out FILE] [--document-out FILE] [--log-file FILE] [--verbose]\n",
        argv0);
}

} // namespace

int main(int argc, char* argv[])
{
    artboard_loaders::BatchInputPaths paths;
    std::string out_path;
    std::string document_out_path;
    std::string log_file;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& target) {
            if (i + 1 >= argc) return false;
            target = argv[++i];
            return true;
        };

        bool ok = true;
        if (arg == "--document") ok = value(paths.document);
        else if (arg == "--sizes") ok = value(paths.sizes);
        else if (arg == "--presets") paths.sizes.clear();
        else if (arg == "--config") ok = value(paths.config);
        else if (arg == "--out") ok = value(out_path);
        else if (arg == "--document-out") ok = value(document_out_path);
        else if (arg == "--log-file") ok = value(log_file);
        else if (arg == "--verbose") verbose = true;
        else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            (void)fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            ok = false;
        }
        if (!ok) {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (verbose || !log_file.empty()) {
        artboard_log::LogSettings settings;
        settings.level = verbose ? "debug" : "info";
        settings.file = log_file;
        artboard_log::configure(settings);
    }

    auto inputs = artboard_loaders::load_batch_inputs(paths);
    if (!inputs) {
        (void)fprintf(stderr, "could not load inputs\n");
        return 1;
    }

    // Command-line logging flags win over the config file.
    if (inputs->config.logging && !verbose && log_file.empty())
        artboard_log::configure(*inputs->config.logging);

    artboard_model::BatchResult result;
    try {
        result = artboard_pipeline::generate_batch(inputs->document, inputs->sizes,
            inputs->config.sources, inputs->config.options,
            [](std::size_t index, std::size_t total, const std::string& name) {
                (void)printf("[%zu/%zu] %s\n", index, total, name.c_str());
            });
    } catch (const artboard_model::ConfigurationError& e) {
        (void)fprintf(stderr, "configuration error: %s\n", e.what());
        return 1;
    } catch (const artboard_model::GenerationError& e) {
        artboard_log::logger()->critical("batch aborted: {}", e.what());
        (void)fprintf(stderr, "batch aborted: %s\n", e.what());
        return 1;
    }

    (void)printf("created %zu, skipped %zu, failed %zu\n",
        result.created.size(), result.skipped.size(), result.failed.size());
    for (const auto& s : result.skipped)
        (void)printf("  skipped %s: %s\n", s.name.c_str(), s.reason.c_str());
    for (const auto& f : result.failed)
        (void)printf("  failed %s%s%s: %s\n", f.name.c_str(), f.phase.empty() ? "" : " during ",
            f.phase.c_str(), f.reason.c_str());

    if (!out_path.empty() && !artboard_loaders::write_batch_result_json_file(result, out_path))
        return 1;
    if (!document_out_path.empty()
        && !artboard_loaders::write_document_json_file(inputs->document, document_out_path))
        return 1;

    return result.failed.empty() ? 0 : 2;
}
