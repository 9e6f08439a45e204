#pragma once

#include <vector>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>
#include <iostream>

namespace termdash {

class DebugLogger {
public:
    static void set_enabled(bool enabled) { enabled_ = enabled; }
    static bool is_enabled() { return enabled_; }

    // Defaults to std::cerr; the dashboard points it at the log file because
    // stderr shares the terminal with the UI.
    static void set_sink(std::ostream* sink) { sink_ = sink ? sink : &std::cerr; }

    template<typename... Args>
    static void log(Args&&... args) {
        if (enabled_) {
            *sink_ << "[DEBUG] " << timestamp() << " ";
            ((*sink_ << args), ...);
            *sink_ << std::endl;
        }
    }

    static std::string timestamp();

private:
    static bool enabled_;
    static std::ostream* sink_;
};

struct CpuMetrics {
    double overall_usage = 0.0;              // 0-100%, all logical processors
    uint32_t core_count = 0;
};

struct MemoryMetrics {
    uint64_t total_bytes = 0;
    uint64_t available_bytes = 0;
    uint64_t used_bytes = 0;
    double usage_percent = 0.0;

    uint64_t swap_total_bytes = 0;
    uint64_t swap_used_bytes = 0;
};

struct DiskMetrics {
    std::string mount_point;
    std::string device;
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
    double usage_percent = 0.0;
};

struct NetworkMetrics {
    std::string interface_name;
    uint64_t bytes_received = 0;             // Cumulative counters since boot
    uint64_t bytes_sent = 0;
};

struct ProcessMetrics {
    int pid = 0;
    std::string name;
    double cpu_percent = 0.0;                // 100% = one logical processor
    uint64_t resident_bytes = 0;
};

// Extended fields, only read while a process is being inspected
struct ProcessDetail {
    int pid = 0;
    std::string name;
    std::string status;                      // "Running", "Sleeping", ...
    int parent_pid = 0;
    int thread_count = 0;
    uint64_t resident_bytes = 0;
    uint64_t virtual_bytes = 0;
    std::chrono::system_clock::time_point start_time;
    std::chrono::seconds run_time{0};
    uint64_t disk_read_bytes = 0;
    uint64_t disk_written_bytes = 0;
    std::string command_line;
};

// One point-in-time reading. Replaced wholesale every tick.
struct Snapshot {
    CpuMetrics cpu;
    MemoryMetrics memory;
    std::vector<DiskMetrics> disks;
    std::vector<NetworkMetrics> network;
    std::map<int, ProcessMetrics> processes;
    std::chrono::steady_clock::time_point timestamp;
};

class MetricsCollector {
public:
    virtual ~MetricsCollector() = default;

    // Resources that cannot be read this tick are left out of the snapshot.
    virtual Snapshot sample() = 0;

    // Best effort. Returns false if the signal could not be delivered.
    virtual bool terminate(int pid) = 0;

    // std::nullopt if the process is gone.
    virtual std::optional<ProcessDetail> inspect(int pid) = 0;
};

// Factory function
std::unique_ptr<MetricsCollector> create_metrics_collector();

} // namespace termdash
