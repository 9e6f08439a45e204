#include "termdash/dashboard.hpp"
#include <iostream>
#include <unistd.h>
#include <climits>

namespace termdash {

std::chrono::milliseconds time_until_tick(std::chrono::steady_clock::time_point last_tick,
                                          std::chrono::steady_clock::time_point now,
                                          std::chrono::milliseconds interval)
{
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick);
    if (elapsed >= interval) {
        return std::chrono::milliseconds(0);
    }
    return interval - elapsed;
}

Dashboard::Dashboard(const std::string& config_path)
    : config_path_(config_path)
    , config_manager_(config_path)
{
}

Dashboard::~Dashboard() {
    if (log_file_.is_open()) {
        DebugLogger::set_enabled(false);
        DebugLogger::set_sink(nullptr);
        log_file_.close();
    }
}

bool Dashboard::initialize() {
    // Load configuration
    if (!config_manager_.load()) {
        std::cerr << "Failed to load configuration from " << config_path_ << "\n";
        return false;
    }

    // Validate configuration
    std::string validation_error;
    if (!config_manager_.validate_config(validation_error)) {
        std::cerr << "Configuration validation failed: " << validation_error << "\n";
        return false;
    }

    const auto& config = config_manager_.get_config();

    // stderr belongs to the UI while it runs, so debug output goes to a file
    if (config.debug_logging) {
        log_file_.open(config.log_path, std::ios::app);
        if (!log_file_.is_open()) {
            std::cerr << "Failed to open log file: " << config.log_path << "\n";
            return false;
        }
        DebugLogger::set_sink(&log_file_);
        DebugLogger::set_enabled(true);
    }
    DebugLogger::log("config: ", config_path_.empty() ? "<defaults>" : config_path_,
                     " history_size=", config.history_size,
                     " process_limit=", config.process_limit,
                     " theme=", config.display.theme);

    char host[HOST_NAME_MAX + 1] = {};
    host_name_ = gethostname(host, sizeof(host) - 1) == 0 ? host : "Unknown";

    // Initialize components
    metrics_collector_ = create_metrics_collector();
    actions_ = std::make_unique<ActionExecutor>(*metrics_collector_);
    display_ = std::make_unique<Display>(config.display, config.thresholds);
    state_ = std::make_unique<AppState>(static_cast<size_t>(config.history_size),
                                        static_cast<size_t>(config.process_limit));
    state_->theme = parse_theme(config.display.theme).value_or(ThemePreset::Default);

    return true;
}

void Dashboard::run() {
    if (!metrics_collector_ || !actions_ || !display_ || !state_) {
        std::cerr << "Dashboard not initialized. Call initialize() first.\n";
        return;
    }

    running_ = true;

    // Leaving this scope, normally or by exception, restores the terminal
    TerminalSession terminal;
    event_loop(terminal);
}

void Dashboard::stop() {
    running_ = false;
}

void Dashboard::tick() {
    handle_tick(*state_, metrics_collector_->sample());
}

void Dashboard::event_loop(TerminalSession& terminal) {
    // First sample now so the first frame is not empty
    tick();
    auto last_tick = std::chrono::steady_clock::now();

    while (running_) {
        auto size = terminal.size();
        Frame frame{*state_, actions_->fetch_detail(*state_), host_name_, size.rows, size.cols};
        terminal.write(display_->compose(frame));

        auto timeout = time_until_tick(last_tick, std::chrono::steady_clock::now());
        for (const KeyEvent& key : terminal.poll_keys(timeout)) {
            handle_key(*state_, key, *actions_);
            if (state_->should_quit) {
                break;
            }
        }

        if (std::chrono::steady_clock::now() - last_tick >= kTickInterval) {
            tick();
            last_tick = std::chrono::steady_clock::now();
        }

        if (state_->should_quit) {
            DebugLogger::log("quit requested");
            running_ = false;
        }
    }
}

} // namespace termdash
