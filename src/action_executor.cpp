#include "termdash/action_executor.hpp"
#include "termdash/app_state.hpp"

namespace termdash {

ActionExecutor::ActionExecutor(MetricsCollector& collector)
    : collector_(collector)
{
}

void ActionExecutor::terminate_selected(AppState& state) {
    const ProcessRow* row = state.cursor.selected(state.view);
    if (!row) {
        return;
    }

    DebugLogger::log("action: terminate pid ", row->pid, " (", row->name, ")");
    if (collector_.terminate(row->pid)) {
        state.status_message = "Killed " + std::to_string(row->pid) + " (" + row->name + ")";
    } else {
        state.status_message = "Could not kill " + std::to_string(row->pid) + " (" + row->name + ")";
    }
}

void ActionExecutor::inspect_selected(AppState& state) {
    const ProcessRow* row = state.cursor.selected(state.view);
    if (row) {
        state.inspected_pid = row->pid;
        DebugLogger::log("action: inspect pid ", row->pid, " (", row->name, ")");
    } else {
        state.inspected_pid.reset();
    }
}

std::optional<ProcessDetail> ActionExecutor::fetch_detail(const AppState& state) {
    if (state.mode != InputMode::DetailInspect || !state.inspected_pid) {
        return std::nullopt;
    }
    return collector_.inspect(*state.inspected_pid);
}

} // namespace termdash
