#pragma once

#include "termdash/config_manager.hpp"
#include "termdash/metrics_collector.hpp"
#include "termdash/action_executor.hpp"
#include "termdash/app_state.hpp"
#include "termdash/display.hpp"
#include "termdash/terminal.hpp"
#include <memory>
#include <atomic>
#include <chrono>
#include <fstream>

namespace termdash {

constexpr std::chrono::milliseconds kTickInterval{1000};

// Time left before the next tick is due; zero once it is overdue
std::chrono::milliseconds time_until_tick(std::chrono::steady_clock::time_point last_tick,
                                          std::chrono::steady_clock::time_point now,
                                          std::chrono::milliseconds interval = kTickInterval);

class Dashboard {
public:
    explicit Dashboard(const std::string& config_path);
    ~Dashboard();

    // Initialize all components
    bool initialize();

    // Main event loop. Throws TerminalError if the terminal fails.
    void run();

    // Stop after the current iteration
    void stop();

private:
    void event_loop(TerminalSession& terminal);
    void tick();

    std::string config_path_;
    ConfigManager config_manager_;
    std::unique_ptr<MetricsCollector> metrics_collector_;
    std::unique_ptr<ActionExecutor> actions_;
    std::unique_ptr<Display> display_;
    std::unique_ptr<AppState> state_;
    std::string host_name_;
    std::ofstream log_file_;

    std::atomic<bool> running_{false};
};

} // namespace termdash
