#pragma once

#include "termdash/app_state.hpp"
#include "termdash/config_manager.hpp"
#include "termdash/history_buffer.hpp"
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace termdash {

enum class Level {
    Normal,
    Warning,
    Critical
};

// What one frame shows. `state` is read, never written.
struct Frame {
    const AppState& state;
    std::optional<ProcessDetail> detail;     // Only filled in DetailInspect
    std::string host_name;
    int rows = 24;
    int cols = 80;
};

class Display {
public:
    Display(const DisplayConfig& config, const ThresholdConfig& thresholds);

    // Full screen contents, cursor-home first, one write's worth
    std::string compose(const Frame& frame);

private:
    struct Palette {
        const char* accent;
        const char* cpu_graph;
        const char* memory_graph;
        const char* network_graph;
        const char* normal;
        const char* warning;
        const char* critical;
        const char* selected;
        const char* dim;
    };

    void render_header(const Frame& frame);
    void render_history(const AppState& state);
    void render_gauges(const AppState& state);
    void render_processes(const AppState& state, int rows);
    void render_filter_bar(const AppState& state);
    void render_detail(const Frame& frame, int rows);
    void render_disks_and_network(const AppState& state, int rows);
    void render_footer(const AppState& state);

    // Helper rendering functions
    std::string create_progress_bar(double percentage, int width, Level level);
    std::string create_graph(const HistoryBuffer& history, int width, double max_value);
    Level get_level(double value) const;

    // Color helpers (ANSI escape codes)
    std::string colorize(const std::string& text, const char* code);
    std::string colorize(const std::string& text, Level level);
    const char* color_code(Level level) const;
    std::string reset_color() const;

    // Append one padded, cleared line
    void emit(const std::string& text);
    void emit_blank() { emit(""); }

    static Palette palette_for(ThemePreset theme);

    DisplayConfig config_;
    ThresholdConfig thresholds_;
    Palette palette_;
    bool mono_ = false;
    int cols_ = 80;
    int lines_ = 0;
    std::ostringstream out_;
};

// Helper functions for formatting
std::string format_bytes(uint64_t bytes);
std::string format_duration(std::chrono::seconds duration);

// Cut or pad plain text to exactly `width` cells. Control bytes become '?'.
std::string fit(const std::string& text, size_t width);

} // namespace termdash
