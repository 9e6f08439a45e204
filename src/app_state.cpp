#include "termdash/app_state.hpp"
#include "termdash/action_executor.hpp"
#include <cctype>
#include <utility>

namespace termdash {

AppState::AppState(size_t history_size, size_t process_limit)
    : cpu_history(history_size)
    , memory_history(history_size)
    , rx_history(history_size)
    , tx_history(history_size)
    , process_limit(process_limit)
{
}

ThemePreset next_theme(ThemePreset theme) {
    switch (theme) {
        case ThemePreset::Default:   return ThemePreset::Ocean;
        case ThemePreset::Ocean:     return ThemePreset::Solarized;
        case ThemePreset::Solarized: return ThemePreset::Mono;
        case ThemePreset::Mono:      return ThemePreset::Default;
    }
    return ThemePreset::Default;
}

const char* theme_name(ThemePreset theme) {
    switch (theme) {
        case ThemePreset::Default:   return "default";
        case ThemePreset::Ocean:     return "ocean";
        case ThemePreset::Solarized: return "solarized";
        case ThemePreset::Mono:      return "mono";
    }
    return "default";
}

std::optional<ThemePreset> parse_theme(const std::string& name) {
    for (ThemePreset theme : {ThemePreset::Default, ThemePreset::Ocean,
                              ThemePreset::Solarized, ThemePreset::Mono}) {
        if (name == theme_name(theme)) {
            return theme;
        }
    }
    return std::nullopt;
}

const char* mode_name(InputMode mode) {
    switch (mode) {
        case InputMode::Normal:        return "Normal";
        case InputMode::SearchEdit:    return "SearchEdit";
        case InputMode::DetailInspect: return "DetailInspect";
    }
    return "Normal";
}

static void enter_mode(AppState& state, InputMode mode) {
    DebugLogger::log("mode: ", mode_name(state.mode), " -> ", mode_name(mode));
    state.mode = mode;
}

static void handle_normal_key(AppState& state, const KeyEvent& key, ActionExecutor& actions) {
    switch (key.code) {
        case KeyCode::Escape:
            state.should_quit = true;
            return;
        case KeyCode::Down:
            state.cursor.next();
            return;
        case KeyCode::Up:
            state.cursor.previous();
            return;
        case KeyCode::Delete:
            actions.terminate_selected(state);
            return;
        case KeyCode::Enter:
            actions.inspect_selected(state);
            enter_mode(state, InputMode::DetailInspect);
            return;
        case KeyCode::Char:
            break;
        default:
            return;
    }

    switch (key.ch) {
        case 'q':
        case 'Q':
            state.should_quit = true;
            break;
        case 'j':
            state.cursor.next();
            break;
        case 'k':
            state.cursor.previous();
            break;
        case 'x':
            actions.terminate_selected(state);
            break;
        case '/':
            state.cursor.reset();
            enter_mode(state, InputMode::SearchEdit);
            break;
        case 't':
            state.theme = next_theme(state.theme);
            break;
    }
}

// Drop the last character, with all of its UTF-8 bytes
static void pop_character(std::string& text) {
    while (!text.empty()) {
        unsigned char c = static_cast<unsigned char>(text.back());
        text.pop_back();
        if ((c & 0xC0) != 0x80) {
            break;
        }
    }
}

static void handle_search_key(AppState& state, const KeyEvent& key) {
    switch (key.code) {
        case KeyCode::Char:
            if (!std::iscntrl(static_cast<unsigned char>(key.ch))) {
                state.search_query.push_back(key.ch);
                refresh_view(state);
            }
            break;
        case KeyCode::Backspace:
            if (!state.search_query.empty()) {
                pop_character(state.search_query);
                refresh_view(state);
            }
            break;
        case KeyCode::Enter:
            enter_mode(state, InputMode::Normal);
            break;
        case KeyCode::Escape:
            state.search_query.clear();
            refresh_view(state);
            enter_mode(state, InputMode::Normal);
            break;
        default:
            break;
    }
}

static void handle_detail_key(AppState& state, const KeyEvent& key) {
    switch (key.code) {
        case KeyCode::Escape:
        case KeyCode::Enter:
        case KeyCode::Backspace:
            state.inspected_pid.reset();
            enter_mode(state, InputMode::Normal);
            break;
        default:
            break;
    }
}

void handle_key(AppState& state, const KeyEvent& key, ActionExecutor& actions) {
    if (key.kind != KeyKind::Press) {
        return;
    }

    switch (state.mode) {
        case InputMode::Normal:
            handle_normal_key(state, key, actions);
            break;
        case InputMode::SearchEdit:
            handle_search_key(state, key);
            break;
        case InputMode::DetailInspect:
            handle_detail_key(state, key);
            break;
    }
}

// Bytes moved since the previous snapshot, summed over interfaces seen in both.
// A counter that went backwards (interface reset) contributes nothing.
static void network_deltas(const std::vector<NetworkMetrics>& before,
                           const std::vector<NetworkMetrics>& after,
                           double& received, double& sent)
{
    received = 0.0;
    sent = 0.0;
    for (const auto& now : after) {
        for (const auto& prev : before) {
            if (prev.interface_name != now.interface_name) {
                continue;
            }
            if (now.bytes_received >= prev.bytes_received) {
                received += static_cast<double>(now.bytes_received - prev.bytes_received);
            }
            if (now.bytes_sent >= prev.bytes_sent) {
                sent += static_cast<double>(now.bytes_sent - prev.bytes_sent);
            }
            break;
        }
    }
}

void handle_tick(AppState& state, Snapshot snapshot) {
    double received = 0.0;
    double sent = 0.0;
    if (state.has_snapshot) {
        network_deltas(state.snapshot.network, snapshot.network, received, sent);
    }

    state.cpu_history.push(snapshot.cpu.overall_usage);
    state.memory_history.push(snapshot.memory.usage_percent);
    state.rx_history.push(received);
    state.tx_history.push(sent);

    state.snapshot = std::move(snapshot);
    state.has_snapshot = true;

    refresh_view(state);
}

void refresh_view(AppState& state) {
    state.view = build_process_view(state.snapshot.processes, state.search_query, state.process_limit);
    state.cursor.sync(state.view.size());
}

} // namespace termdash
