#pragma once

#include "termdash/metrics_collector.hpp"
#include "termdash/history_buffer.hpp"
#include "termdash/process_view.hpp"
#include "termdash/input.hpp"
#include <string>
#include <optional>

namespace termdash {

class ActionExecutor;

enum class InputMode {
    Normal,
    SearchEdit,
    DetailInspect
};

enum class ThemePreset {
    Default,
    Ocean,
    Solarized,
    Mono
};

ThemePreset next_theme(ThemePreset theme);
const char* theme_name(ThemePreset theme);
std::optional<ThemePreset> parse_theme(const std::string& name);
const char* mode_name(InputMode mode);

// Everything the event loop owns. Only handle_key() and handle_tick() change it.
struct AppState {
    AppState(size_t history_size, size_t process_limit);

    Snapshot snapshot;
    bool has_snapshot = false;

    HistoryBuffer cpu_history;
    HistoryBuffer memory_history;
    HistoryBuffer rx_history;                // Bytes received per tick, all interfaces
    HistoryBuffer tx_history;                // Bytes sent per tick, all interfaces

    ProcessView view;
    Cursor cursor;
    size_t process_limit;

    InputMode mode = InputMode::Normal;
    std::string search_query;
    std::optional<int> inspected_pid;
    ThemePreset theme = ThemePreset::Default;

    std::string status_message;
    bool should_quit = false;
};

// Route one key event by the current mode
void handle_key(AppState& state, const KeyEvent& key, ActionExecutor& actions);

// Store a fresh snapshot, feed the histories and rebuild the process view
void handle_tick(AppState& state, Snapshot snapshot);

// Rebuild the process view from the stored snapshot and re-sync the cursor
void refresh_view(AppState& state);

} // namespace termdash
