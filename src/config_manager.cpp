#include "termdash/config_manager.hpp"
#include "termdash/app_state.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <cctype>

// Reads the YAML subset the config uses: top-level scalars and one level of sections
namespace termdash {

bool TermDashConfig::validate() const {
    if (history_size <= 0 || process_limit <= 0) {
        return false;
    }
    if (!thresholds.validate()) {
        return false;
    }
    if (display.graph_width < 10 || display.graph_width > history_size) {
        return false;
    }
    return parse_theme(display.theme).has_value();
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
{
}

// Helper function to trim whitespace
static std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

// Helper to parse double value from string
static bool parse_double(const std::string& value, double& out) {
    std::istringstream iss(value);
    double parsed;
    if (!(iss >> parsed) || !iss.eof()) {
        return false;
    }
    out = parsed;
    return true;
}

// Helper to parse int value from string
static bool parse_int(const std::string& value, int& out) {
    std::istringstream iss(value);
    int parsed;
    if (!(iss >> parsed) || !iss.eof()) {
        return false;
    }
    out = parsed;
    return true;
}

// Helper to parse bool value from string
static bool parse_bool(const std::string& value) {
    std::string lower = value;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower == "true" || lower == "yes" || lower == "1";
}

bool ConfigManager::load() {
    // Reset config to defaults
    config_ = TermDashConfig{};

    if (config_path_.empty()) {
        return true;
    }

    std::ifstream file(config_path_);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << config_path_ << "\n";
        return false;
    }

    std::string raw_line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(file, raw_line)) {
        ++line_number;

        // Strip trailing comments
        size_t hash = raw_line.find(" #");
        if (hash != std::string::npos) {
            raw_line.erase(hash);
        }
        std::string line = trim(raw_line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            std::cerr << config_path_ << ":" << line_number << ": expected 'key: value'\n";
            return false;
        }

        std::string key = trim(line.substr(0, colon_pos));
        std::string value = trim(line.substr(colon_pos + 1));

        // Remove quotes from string values
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        bool indented = !raw_line.empty() && (raw_line[0] == ' ' || raw_line[0] == '\t');

        // Section headers (no indent, no value)
        if (!indented) {
            current_section.clear();
            if (value.empty()) {
                current_section = key;
                continue;
            }
        }

        bool ok = true;
        if (current_section.empty()) {
            if (key == "version") config_.version = value;
            else if (key == "history_size") ok = parse_int(value, config_.history_size);
            else if (key == "process_limit") ok = parse_int(value, config_.process_limit);
            else if (key == "debug_logging") config_.debug_logging = parse_bool(value);
            else if (key == "log_path") config_.log_path = value;
        }
        else if (current_section == "display") {
            if (key == "theme") config_.display.theme = value;
            else if (key == "show_graphs") config_.display.show_graphs = parse_bool(value);
            else if (key == "graph_width") ok = parse_int(value, config_.display.graph_width);
        }
        else if (current_section == "thresholds") {
            if (key == "warning") ok = parse_double(value, config_.thresholds.warning);
            else if (key == "critical") ok = parse_double(value, config_.thresholds.critical);
        }

        if (!ok) {
            std::cerr << config_path_ << ":" << line_number << ": invalid value for '" << key << "'\n";
            return false;
        }
    }

    return true;
}

bool ConfigManager::validate_config(std::string& error_msg) const {
    if (config_.history_size <= 0) {
        error_msg = "history_size must be positive";
        return false;
    }

    if (config_.process_limit <= 0) {
        error_msg = "process_limit must be positive";
        return false;
    }

    if (!config_.thresholds.validate()) {
        error_msg = "Gauge thresholds invalid: warning must be less than critical";
        return false;
    }

    if (config_.display.graph_width < 10 || config_.display.graph_width > config_.history_size) {
        error_msg = "graph_width must be between 10 and history_size";
        return false;
    }

    if (!parse_theme(config_.display.theme)) {
        error_msg = "Unknown theme '" + config_.display.theme + "'";
        return false;
    }

    return config_.validate();
}

} // namespace termdash
