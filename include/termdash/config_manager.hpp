#pragma once

#include <typiconf/typiconf.hpp>
#include <string>

namespace termdash {

struct ThresholdConfig {
    double warning = 70.0;
    double critical = 80.0;

    bool validate() const {
        return warning >= 0.0 && warning <= 100.0 &&
               critical >= 0.0 && critical <= 100.0 &&
               warning < critical;
    }

    TYPICONF_DEFINE_FIELDS(ThresholdConfig,
        TYPICONF_FIELD(warning),
        TYPICONF_FIELD(critical)
    )
};

struct DisplayConfig {
    std::string theme = "default";
    bool show_graphs = true;
    int graph_width = 60;

    TYPICONF_DEFINE_FIELDS(DisplayConfig,
        TYPICONF_FIELD(theme),
        TYPICONF_FIELD(show_graphs),
        TYPICONF_FIELD(graph_width)
    )
};

// No tick interval: it is fixed at kTickInterval.
struct TermDashConfig {
    std::string version = "1.0";
    int history_size = 100;
    int process_limit = 20;
    bool debug_logging = false;
    std::string log_path = "./termdash.log";
    DisplayConfig display;
    ThresholdConfig thresholds;

    bool validate() const;

    TYPICONF_DEFINE_FIELDS(TermDashConfig,
        TYPICONF_FIELD(version),
        TYPICONF_FIELD(history_size),
        TYPICONF_FIELD(process_limit),
        TYPICONF_FIELD(debug_logging),
        TYPICONF_FIELD(log_path),
        TYPICONF_FIELD(display),
        TYPICONF_FIELD(thresholds)
    )
};

class ConfigManager {
public:
    // Empty path: built-in defaults, no file is read
    explicit ConfigManager(const std::string& config_path = "");

    // Load configuration
    bool load();

    // Access configuration
    const TermDashConfig& get_config() const { return config_; }

    // Validation
    bool validate_config(std::string& error_msg) const;

private:
    std::string config_path_;
    TermDashConfig config_;
};

} // namespace termdash
