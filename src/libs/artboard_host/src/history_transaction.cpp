#include <artboard_host/history_transaction.hpp>
#include <artboard_log/logger.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace artboard_host {

HistoryTransaction::HistoryTransaction(HostDocument& host, const std::string& name)
    : host_(host)
    , name_(name)
{
    host_.suspend_history(name_);
    artboard_log::logger()->debug("history suspended: {}", name_);
}

HistoryTransaction::~HistoryTransaction() {
    try {
        host_.resume_history();
        artboard_log::logger()->debug("history resumed: {}", name_);
    } catch (const std::exception& e) {
        artboard_log::logger()->error("could not resume history \"{}\": {}", name_, e.what());
    } catch (...) {
        artboard_log::logger()->error("could not resume history \"{}\": unknown error", name_);
    }
}

} // namespace artboard_host
