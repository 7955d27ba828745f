// Batch preview: runs a batch, then shows the document. ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <artboard_loaders/batch_inputs.hpp>
#include <artboard_log/logger.hpp>
#include <artboard_model/errors.hpp>
#include <artboard_pipeline/batch_coordinator.hpp>
#include <canvas/canvas.hpp>
#include <spdlog/spdlog.h>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <algorithm>
#include <cstdio>
#include <string>
#include <unordered_set>
#include <vector>

int main(int argc, char* argv[])
{
    bool auto_overlap_test = false;
    artboard_loaders::BatchInputPaths paths;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--auto-overlap-test") {
            auto_overlap_test = true;
        } else if ((arg == "--document" || arg == "--sizes" || arg == "--config") && i + 1 < argc) {
            std::string& target = arg == "--document" ? paths.document
                : arg == "--sizes" ? paths.sizes : paths.config;
            target = argv[++i];
        } else {
            (void)fprintf(stderr, "usage: %s [--document FILE] [--sizes FILE] [--config FILE] [--auto-overlap-test]\n",
                argv[0]);
            return 1;
        }
    }

    auto inputs = artboard_loaders::load_batch_inputs(paths);
    if (!inputs) {
        (void)fprintf(stderr, "could not load inputs\n");
        return 1;
    }
    if (inputs->config.logging)
        artboard_log::configure(*inputs->config.logging);

    const std::vector<artboard_host::LayerId> before = inputs->document.top_level();
    artboard_model::BatchResult result;
    try {
        result = artboard_pipeline::generate_batch(inputs->document, inputs->sizes,
            inputs->config.sources, inputs->config.options);
    } catch (const artboard_model::GenerationError& e) {
        (void)fprintf(stderr, "batch aborted: %s\n", e.what());
        if (auto_overlap_test) return 1;
    }

    std::unordered_set<artboard_host::LayerId> generated;
    for (auto id : inputs->document.top_level()) {
        if (std::find(before.begin(), before.end(), id) == before.end()) generated.insert(id);
    }

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    int window_width = 1280;
    int window_height = 720;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Artboards", window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;

    ImGui::StyleColorsDark();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 17.0f;
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg) != nullptr)
            break;
    }

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    canvas::ArtboardCanvas artboard_canvas;
    artboard_canvas.set_document(&inputs->document);
    artboard_canvas.set_highlighted(generated);

    bool running = true;
    bool fitted = false;
    int frame = 0;
    int test_exit_code = 0;

    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Artboards", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

        ImGui::Text("%s: %zu created, %zu skipped, %zu failed", inputs->document.name().c_str(),
            result.created.size(), result.skipped.size(), result.failed.size());
        ImGui::SameLine();
        ImGui::Checkbox("content", &artboard_canvas.render_options().show_content);
        ImGui::SameLine();
        ImGui::Checkbox("guides", &artboard_canvas.render_options().show_guides);
        ImGui::SameLine();
        const bool refit = ImGui::Button("Fit");
        if (const auto hovered = artboard_canvas.hovered()) {
            if (const auto* layer = inputs->document.layer(*hovered)) {
                ImGui::SameLine();
                ImGui::TextDisabled("%s", layer->name.c_str());
            }
        }

        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar);
            if (!fitted || refit) {
                artboard_canvas.fit_to_document(canvas_size.x, canvas_size.y);
                fitted = true;
            }
            artboard_canvas.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }
        ImGui::End();

        if (auto_overlap_test && frame >= 1) {
            const std::size_t overlaps = artboard_canvas.current_overlap_count();
            (void)fprintf(stderr, "[auto-overlap-test] frame=%d artboards=%zu overlap_count=%zu\n",
                frame, inputs->document.top_level().size(), overlaps);
            test_exit_code = overlaps == 0 ? 0 : 2;
            running = false;
        }

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
        ++frame;
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    if (auto_overlap_test) {
        return test_exit_code;
    }
    return 0;
}
