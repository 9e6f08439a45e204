#pragma once

#include "termdash/metrics_collector.hpp"
#include <optional>

namespace termdash {

struct AppState;

// The two side effects reachable from the keyboard.
// Neither reports failure to the caller: the next tick shows what happened.
class ActionExecutor {
public:
    explicit ActionExecutor(MetricsCollector& collector);

    // Kill the process under the cursor, if any
    void terminate_selected(AppState& state);

    // Remember the pid under the cursor for the inspector
    void inspect_selected(AppState& state);

    // Extended fields of the inspected process, read on each call
    std::optional<ProcessDetail> fetch_detail(const AppState& state);

private:
    MetricsCollector& collector_;
};

} // namespace termdash
