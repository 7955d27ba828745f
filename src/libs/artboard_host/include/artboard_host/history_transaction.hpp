#pragma once

#include <artboard_host/host_document.hpp>
#include <string>

namespace artboard_host {

// Groups every host call made during its lifetime into one undoable history step.
// The history is resumed on every exit path; a failing resume is logged, not thrown.
class HistoryTransaction {
public:
    HistoryTransaction(HostDocument& host, const std::string& name);
    ~HistoryTransaction();

    HistoryTransaction(const HistoryTransaction&) = delete;
    HistoryTransaction& operator=(const HistoryTransaction&) = delete;

    const std::string& name() const { return name_; }

private:
    HostDocument& host_;
    std::string name_;
};

} // namespace artboard_host
