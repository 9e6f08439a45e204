#include "termdash/display.hpp"
#include <iomanip>
#include <algorithm>
#include <cmath>
#include <ctime>

namespace termdash {

Display::Display(const DisplayConfig& config, const ThresholdConfig& thresholds)
    : config_(config)
    , thresholds_(thresholds)
    , palette_(palette_for(ThemePreset::Default))
{
}

Display::Palette Display::palette_for(ThemePreset theme) {
    switch (theme) {
        case ThemePreset::Default:
            return {"\033[1;30;46m", "\033[32m", "\033[35m", "\033[36m",
                    "\033[32m", "\033[33m", "\033[31m", "\033[1;37;41m", "\033[90m"};
        case ThemePreset::Ocean:
            return {"\033[1;37;44m", "\033[96m", "\033[94m", "\033[36m",
                    "\033[96m", "\033[93m", "\033[91m", "\033[1;30;106m", "\033[34m"};
        case ThemePreset::Solarized:
            return {"\033[1;30;43m", "\033[33m", "\033[36m", "\033[32m",
                    "\033[32m", "\033[33m", "\033[31m", "\033[1;37;45m", "\033[90m"};
        case ThemePreset::Mono:
            return {"\033[7m", "", "", "", "", "", "", "\033[7m", ""};
    }
    return palette_for(ThemePreset::Default);
}

const char* Display::color_code(Level level) const {
    switch (level) {
        case Level::Normal:   return palette_.normal;
        case Level::Warning:  return palette_.warning;
        case Level::Critical: return palette_.critical;
    }
    return "";
}

std::string Display::reset_color() const {
    return "\033[0m";
}

std::string Display::colorize(const std::string& text, const char* code) {
    if (code == nullptr || *code == '\0') {
        return text;
    }
    return code + text + reset_color();
}

std::string Display::colorize(const std::string& text, Level level) {
    return colorize(text, color_code(level));
}

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

std::string format_duration(std::chrono::seconds duration) {
    long long total = std::max<long long>(0, duration.count());
    long long days = total / 86400;
    long long hours = (total % 86400) / 3600;
    long long minutes = (total % 3600) / 60;
    long long seconds = total % 60;

    std::ostringstream oss;
    if (days > 0) {
        oss << days << "d ";
    }
    oss << hours << "h " << std::setw(2) << std::setfill('0') << minutes << "m "
        << std::setw(2) << seconds << "s";
    return oss.str();
}

std::string fit(const std::string& text, size_t width) {
    std::string result;
    size_t cells = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (cells == width) break;
            ++cells;
        }
        // Process names and command lines must not reach the terminal as controls
        result.push_back(c < 0x20 || c == 0x7F ? '?' : text[i]);
    }
    result.append(width - cells, ' ');
    return result;
}

Level Display::get_level(double value) const {
    if (value >= thresholds_.critical) {
        return Level::Critical;
    } else if (value >= thresholds_.warning) {
        return Level::Warning;
    }
    return Level::Normal;
}

std::string Display::create_progress_bar(double percentage, int width, Level level) {
    int filled = static_cast<int>(std::clamp(percentage, 0.0, 100.0) / 100.0 * width);
    std::string bar;
    for (int i = 0; i < width; ++i) {
        bar += i < filled ? "█" : "░";
    }
    return colorize(bar, level);
}

std::string Display::create_graph(const HistoryBuffer& history, int width, double max_value) {
    // Unicode block characters for different heights
    const char* blocks[] = {" ", "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};

    if (max_value <= 0.0) max_value = 1.0;

    // Newest samples on the right
    size_t count = std::min(history.size(), static_cast<size_t>(std::max(0, width)));
    size_t start = history.size() - count;

    std::ostringstream oss;
    for (size_t i = start; i < history.size(); ++i) {
        int block_index = static_cast<int>(std::lround(history.at(i) / max_value * 8));
        block_index = std::min(8, std::max(0, block_index));
        oss << blocks[block_index];
    }

    return oss.str();
}

void Display::emit(const std::string& text) {
    if (lines_ > 0) {
        out_ << "\r\n";
    }
    out_ << text << reset_color() << "\033[K";
    ++lines_;
}

void Display::render_header(const Frame& frame) {
    std::string title = " TERM-DASH v0.3 ";
    std::string host = " | Host: " + frame.host_name + " ";
    std::string keys = " [Q] Quit [/] Filter [Up/Down] Select [X] Kill [Enter] Details [T] Theme ";

    size_t used = title.size() + host.size();
    std::string legend = used < static_cast<size_t>(cols_) ? fit(keys, cols_ - used) : "";
    emit(colorize(title, palette_.accent) + fit(host, std::min<size_t>(host.size(), cols_)) +
         colorize(legend, palette_.warning));
}

void Display::render_history(const AppState& state) {
    int width = std::max(10, std::min(config_.graph_width, cols_ - 16));

    std::ostringstream cpu;
    cpu << std::fixed << std::setprecision(0) << std::setw(4) << state.cpu_history.latest() << "%";
    emit("CPU  " + colorize(create_graph(state.cpu_history, width, 100.0), palette_.cpu_graph) + cpu.str());

    std::ostringstream mem;
    mem << std::fixed << std::setprecision(0) << std::setw(4) << state.memory_history.latest() << "%";
    emit("MEM  " + colorize(create_graph(state.memory_history, width, 100.0), palette_.memory_graph) + mem.str());
}

void Display::render_gauges(const AppState& state) {
    const auto& memory = state.snapshot.memory;
    double cpu = state.cpu_history.latest();
    double mem = state.memory_history.latest();
    int bar_width = std::max(10, std::min(30, (cols_ - 60) / 2));

    std::ostringstream line;
    line << "CPU: " << create_progress_bar(cpu, bar_width, get_level(cpu))
         << " " << colorize(std::to_string(static_cast<int>(cpu)) + "%", get_level(cpu))
         << "   MEM: " << create_progress_bar(mem, bar_width, get_level(mem))
         << " " << colorize(std::to_string(static_cast<int>(mem)) + "%", get_level(mem))
         << " (" << format_bytes(memory.used_bytes) << " / " << format_bytes(memory.total_bytes) << ")";
    emit(line.str());
}

void Display::render_processes(const AppState& state, int rows) {
    const size_t pid_w = 7, cpu_w = 8, mem_w = 12;
    size_t name_w = static_cast<size_t>(std::max(8, cols_ - static_cast<int>(pid_w + cpu_w + mem_w) - 1));

    std::string title = state.search_query.empty()
                            ? " Top Processes (CPU) "
                            : " Search: '" + state.search_query + "' ";
    title += "(" + std::to_string(state.view.size()) + ")";
    emit(colorize(fit(title, cols_), palette_.accent));

    emit(colorize(fit("PID", pid_w) + fit("NAME", name_w) + fit("    CPU", cpu_w) + fit("         MEM", mem_w),
                  palette_.warning));

    // Scroll so the cursor row is always visible
    size_t visible = static_cast<size_t>(std::max(1, rows - 2));
    size_t offset = 0;
    if (auto index = state.cursor.index(); index && *index >= visible) {
        offset = *index - visible + 1;
    }

    for (size_t i = offset; i < state.view.size() && i < offset + visible; ++i) {
        const auto& row = state.view[i];

        std::ostringstream cpu;
        cpu << std::fixed << std::setprecision(1) << std::setw(6) << row.cpu_percent << "% ";
        std::ostringstream mem;
        mem << std::fixed << std::setprecision(1) << std::setw(9)
            << static_cast<double>(row.memory_bytes) / 1048576.0 << " MB";

        std::string text = fit(std::to_string(row.pid), pid_w) + fit(row.name, name_w) +
                           fit(cpu.str(), cpu_w) + fit(mem.str(), mem_w);
        bool selected = state.cursor.index() && *state.cursor.index() == i;
        emit(selected ? colorize(text, palette_.selected) : text);
    }

    size_t drawn = std::min(state.view.size() - std::min(state.view.size(), offset), visible);
    if (state.view.empty()) {
        emit(colorize(state.search_query.empty() ? "  (no processes)" : "  (no matches)", palette_.dim));
        ++drawn;
    }
    for (; drawn < visible; ++drawn) {
        emit_blank();
    }
}

void Display::render_filter_bar(const AppState& state) {
    if (state.mode == InputMode::SearchEdit) {
        emit(colorize(fit(" Filter | Search: " + state.search_query + "_", cols_), palette_.warning));
    } else {
        emit(colorize(fit(" Filter | Search: " + state.search_query + " (Press '/')", cols_), palette_.dim));
    }
}

void Display::render_detail(const Frame& frame, int rows) {
    const AppState& state = frame.state;
    int start = lines_;

    if (!state.inspected_pid) {
        emit(colorize(fit(" Process Details ", cols_), palette_.accent));
        emit("  No process selected");
    } else if (!frame.detail) {
        emit(colorize(fit(" Process Details: " + std::to_string(*state.inspected_pid) + " ", cols_), palette_.accent));
        emit("  Process " + std::to_string(*state.inspected_pid) + " no longer exists");
    } else {
        const ProcessDetail& d = *frame.detail;
        emit(colorize(fit(" Process Details: " + std::to_string(d.pid) + " (" + d.name + ") ", cols_),
                      palette_.accent));

        std::ostringstream line;
        line << "  Status:   " << std::left << std::setw(14) << d.status
             << "Parent: " << std::setw(8) << d.parent_pid << "Threads: " << d.thread_count;
        emit(line.str());

        emit("  Resident: " + fit(format_bytes(d.resident_bytes), 14) + "Virtual: " + format_bytes(d.virtual_bytes));

        auto start_time = std::chrono::system_clock::to_time_t(d.start_time);
        std::tm tm;
        localtime_r(&start_time, &tm);
        std::ostringstream started;
        started << "  Started:  " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
                << "   (up " << format_duration(d.run_time) << ")";
        emit(started.str());

        emit("  Disk I/O: read " + format_bytes(d.disk_read_bytes) +
             ", written " + format_bytes(d.disk_written_bytes));
        emit(fit("  Command:  " + d.command_line, cols_));
    }

    emit(colorize("  [Esc/Enter/Backspace] Back", palette_.dim));
    while (lines_ - start < rows) {
        emit_blank();
    }
}

void Display::render_disks_and_network(const AppState& state, int rows) {
    const auto& snapshot = state.snapshot;
    int start = lines_;
    int budget = rows;

    size_t half = static_cast<size_t>(cols_ / 2);
    std::vector<std::string> left;
    std::vector<std::string> right;

    left.push_back(colorize(fit(" Disks ", half - 1), palette_.accent) + " ");
    left.push_back(fit(fit("MOUNT", half / 2) + fit("TOTAL", 12) + "USED", half));
    for (const auto& disk : snapshot.disks) {
        std::ostringstream total;
        total << std::fixed << std::setprecision(1)
              << static_cast<double>(disk.total_bytes) / 1073741824.0 << " GB";
        std::string used = std::to_string(static_cast<int>(disk.usage_percent)) + "%";
        left.push_back(fit(disk.mount_point, half / 2) + fit(total.str(), 12) +
                       colorize(fit(used, half - half / 2 - 12), get_level(disk.usage_percent)));
    }

    right.push_back(colorize(fit(" Network ", cols_ - half), palette_.accent));
    right.push_back(fit(fit("INTERFACE", 16) + fit("RECEIVED", 14) + "SENT", cols_ - half));
    for (const auto& net : snapshot.network) {
        right.push_back(fit(fit(net.interface_name, 16) + fit(format_bytes(net.bytes_received), 14) +
                            format_bytes(net.bytes_sent), cols_ - half));
    }

    int graph_width = std::max(10, std::min(config_.graph_width, static_cast<int>(cols_ - half) - 20));
    if (config_.show_graphs) {
        double net_max = std::max(state.rx_history.max(), state.tx_history.max());
        right.push_back("RX " + colorize(create_graph(state.rx_history, graph_width, net_max), palette_.network_graph) +
                        " " + format_bytes(static_cast<uint64_t>(state.rx_history.latest())) + "/s");
        right.push_back("TX " + colorize(create_graph(state.tx_history, graph_width, net_max), palette_.network_graph) +
                        " " + format_bytes(static_cast<uint64_t>(state.tx_history.latest())) + "/s");
    }

    size_t height = std::min(static_cast<size_t>(std::max(0, budget)), std::max(left.size(), right.size()));
    for (size_t i = 0; i < height; ++i) {
        std::string l = i < left.size() ? left[i] : std::string(half, ' ');
        std::string r = i < right.size() ? right[i] : "";
        emit(l + r);
    }
    while (lines_ - start < rows) {
        emit_blank();
    }
}

void Display::render_footer(const AppState& state) {
    std::string text = " Mode: " + std::string(mode_name(state.mode)) + " | Theme: " + theme_name(state.theme);
    if (!state.status_message.empty()) {
        text += " | " + state.status_message;
    }
    emit(colorize(fit(text, cols_), palette_.dim));
}

std::string Display::compose(const Frame& frame) {
    const AppState& state = frame.state;

    out_.str("");
    out_.clear();
    lines_ = 0;
    cols_ = std::max(80, frame.cols);
    palette_ = palette_for(state.theme);

    out_ << "\033[H";

    int graph_rows = config_.show_graphs ? 2 : 0;
    // header + gauges + filter bar + footer
    int fixed_rows = 4 + graph_rows;
    int remaining = std::max(6, frame.rows - fixed_rows);

    int bottom_rows;
    if (state.mode == InputMode::DetailInspect) {
        bottom_rows = 8;
    } else {
        int wanted = 2 + static_cast<int>(std::max(state.snapshot.disks.size(),
                                                   state.snapshot.network.size() + (config_.show_graphs ? 2 : 0)));
        bottom_rows = std::min(wanted, remaining / 2);
    }
    int process_rows = std::max(3, remaining - bottom_rows);

    render_header(frame);
    if (config_.show_graphs) {
        render_history(state);
    }
    render_gauges(state);
    render_processes(state, process_rows);
    render_filter_bar(state);
    if (state.mode == InputMode::DetailInspect) {
        render_detail(frame, bottom_rows);
    } else {
        render_disks_and_network(state, bottom_rows);
    }
    render_footer(state);

    out_ << "\033[J";
    return out_.str();
}

} // namespace termdash
