#include "termdash/metrics_collector.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <set>
#include <filesystem>
#include <algorithm>
#include <iterator>
#include <cctype>
#include <ctime>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <unistd.h>

namespace termdash {

namespace {

// Fields of /proc/<pid>/stat that follow the parenthesised command name
struct ProcStat {
    std::string comm;
    char state = '?';
    int ppid = 0;
    uint64_t utime = 0;
    uint64_t stime = 0;
    int num_threads = 0;
    uint64_t starttime = 0;
    uint64_t vsize = 0;
    int64_t rss_pages = 0;
};

std::optional<ProcStat> read_proc_stat(int pid) {
    std::ifstream file("/proc/" + std::to_string(pid) + "/stat");
    std::string content;
    if (!file || !std::getline(file, content)) {
        return std::nullopt;
    }

    // comm may itself contain spaces and parentheses
    size_t comm_begin = content.find('(');
    size_t comm_end = content.rfind(')');
    if (comm_begin == std::string::npos || comm_end == std::string::npos || comm_end < comm_begin) {
        return std::nullopt;
    }

    ProcStat stat;
    stat.comm = content.substr(comm_begin + 1, comm_end - comm_begin - 1);

    std::istringstream iss(content.substr(comm_end + 1));
    int64_t pgrp, session, tty_nr, tpgid, cutime, cstime, priority, nice, itrealvalue;
    uint64_t flags, minflt, cminflt, majflt, cmajflt;
    iss >> stat.state >> stat.ppid >> pgrp >> session >> tty_nr >> tpgid
        >> flags >> minflt >> cminflt >> majflt >> cmajflt
        >> stat.utime >> stat.stime >> cutime >> cstime >> priority >> nice
        >> stat.num_threads >> itrealvalue >> stat.starttime >> stat.vsize >> stat.rss_pages;
    if (iss.fail()) {
        return std::nullopt;
    }
    return stat;
}

std::string describe_state(char state) {
    switch (state) {
        case 'R': return "Running";
        case 'S': return "Sleeping";
        case 'D': return "Disk sleep";
        case 'Z': return "Zombie";
        case 'T': return "Stopped";
        case 't': return "Tracing stop";
        case 'X': return "Dead";
        case 'I': return "Idle";
        default:  return "Unknown";
    }
}

bool is_pid_directory(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(),
                                        [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

class LinuxMetricsCollector : public MetricsCollector {
public:
    LinuxMetricsCollector() {
        core_count_ = static_cast<uint32_t>(std::max(1L, sysconf(_SC_NPROCESSORS_ONLN)));
        page_size_ = static_cast<uint64_t>(sysconf(_SC_PAGESIZE));
        clock_ticks_ = std::max(1L, sysconf(_SC_CLK_TCK));
        // Prime the CPU counters, system-wide and per process, so the first
        // sample has a baseline
        read_cpu_stats(prev_total_, prev_idle_);
        collect_processes(0);
    }

    Snapshot sample() override {
        Snapshot snapshot;
        snapshot.timestamp = std::chrono::steady_clock::now();

        unsigned long long total_diff = 0;
        snapshot.cpu = collect_cpu(total_diff);
        snapshot.memory = collect_memory();
        snapshot.disks = collect_disks();
        snapshot.network = collect_network();
        snapshot.processes = collect_processes(total_diff);

        return snapshot;
    }

    bool terminate(int pid) override {
        if (pid <= 0) {
            DebugLogger::log("terminate: refusing pid ", pid);
            return false;
        }
        if (::kill(static_cast<pid_t>(pid), SIGKILL) != 0) {
            DebugLogger::log("terminate: kill(", pid, ") failed: ", std::strerror(errno));
            return false;
        }
        DebugLogger::log("terminate: sent SIGKILL to ", pid);
        return true;
    }

    std::optional<ProcessDetail> inspect(int pid) override {
        auto stat = read_proc_stat(pid);
        if (!stat) {
            DebugLogger::log("inspect: pid ", pid, " is gone");
            return std::nullopt;
        }

        ProcessDetail detail;
        detail.pid = pid;
        detail.name = stat->comm;
        detail.status = describe_state(stat->state);
        detail.parent_pid = stat->ppid;
        detail.thread_count = stat->num_threads;
        detail.resident_bytes = static_cast<uint64_t>(std::max<int64_t>(0, stat->rss_pages)) * page_size_;
        detail.virtual_bytes = stat->vsize;

        uint64_t start_seconds = stat->starttime / static_cast<uint64_t>(clock_ticks_);
        detail.start_time = std::chrono::system_clock::from_time_t(
            static_cast<std::time_t>(read_boot_time() + start_seconds));
        double uptime = read_uptime();
        if (uptime > static_cast<double>(start_seconds)) {
            detail.run_time = std::chrono::seconds(static_cast<int64_t>(uptime) - static_cast<int64_t>(start_seconds));
        }

        // Needs ptrace access for other users' processes; stays zero otherwise
        std::ifstream io_file("/proc/" + std::to_string(pid) + "/io");
        std::string line;
        while (std::getline(io_file, line)) {
            std::istringstream iss(line);
            std::string key;
            uint64_t value = 0;
            iss >> key >> value;
            if (key == "read_bytes:") {
                detail.disk_read_bytes = value;
            } else if (key == "write_bytes:") {
                detail.disk_written_bytes = value;
            }
        }

        std::ifstream cmdline_file("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
        std::string cmdline((std::istreambuf_iterator<char>(cmdline_file)), std::istreambuf_iterator<char>());
        std::replace(cmdline.begin(), cmdline.end(), '\0', ' ');
        while (!cmdline.empty() && cmdline.back() == ' ') {
            cmdline.pop_back();
        }
        // Kernel threads have no command line
        detail.command_line = cmdline.empty() ? "[" + stat->comm + "]" : cmdline;

        return detail;
    }

private:
    CpuMetrics collect_cpu(unsigned long long& total_diff) {
        CpuMetrics metrics;
        metrics.core_count = core_count_;

        unsigned long long total = 0, idle = 0;
        if (!read_cpu_stats(total, idle)) {
            DebugLogger::log("sample: /proc/stat unreadable, cpu omitted");
            return metrics;
        }

        total_diff = total > prev_total_ ? total - prev_total_ : 0;
        unsigned long long idle_diff = idle > prev_idle_ ? idle - prev_idle_ : 0;

        if (total_diff > 0) {
            metrics.overall_usage = 100.0 * (1.0 - static_cast<double>(idle_diff) / total_diff);
            metrics.overall_usage = std::clamp(metrics.overall_usage, 0.0, 100.0);
        }

        prev_total_ = total;
        prev_idle_ = idle;
        return metrics;
    }

    MemoryMetrics collect_memory() {
        MemoryMetrics metrics;

        std::ifstream meminfo("/proc/meminfo");
        std::string line;
        uint64_t swap_free = 0;

        while (std::getline(meminfo, line)) {
            std::istringstream iss(line);
            std::string key;
            uint64_t value = 0;
            iss >> key >> value;

            // Convert kB to bytes
            value *= 1024;

            if (key == "MemTotal:") {
                metrics.total_bytes = value;
            } else if (key == "MemAvailable:") {
                metrics.available_bytes = value;
            } else if (key == "SwapTotal:") {
                metrics.swap_total_bytes = value;
            } else if (key == "SwapFree:") {
                swap_free = value;
            }
        }

        metrics.used_bytes = metrics.total_bytes > metrics.available_bytes
                                 ? metrics.total_bytes - metrics.available_bytes : 0;
        metrics.swap_used_bytes = metrics.swap_total_bytes > swap_free
                                      ? metrics.swap_total_bytes - swap_free : 0;
        if (metrics.total_bytes > 0) {
            metrics.usage_percent = static_cast<double>(metrics.used_bytes) / metrics.total_bytes * 100.0;
        }

        return metrics;
    }

    std::vector<DiskMetrics> collect_disks() {
        std::vector<DiskMetrics> metrics;
        std::set<std::string> seen_devices;

        std::ifstream mounts("/proc/mounts");
        std::string line;

        while (std::getline(mounts, line)) {
            std::istringstream iss(line);
            std::string device, mount_point;
            iss >> device >> mount_point;

            // Block devices only; bind mounts of the same device are listed once
            if (device.rfind("/dev/", 0) != 0 || !seen_devices.insert(device).second) {
                continue;
            }

            struct statvfs stat;
            if (statvfs(mount_point.c_str(), &stat) != 0) {
                DebugLogger::log("sample: statvfs(", mount_point, ") failed, disk omitted");
                continue;
            }

            DiskMetrics disk;
            disk.mount_point = mount_point;
            disk.device = device;
            disk.total_bytes = static_cast<uint64_t>(stat.f_blocks) * stat.f_frsize;
            disk.used_bytes = static_cast<uint64_t>(stat.f_blocks - stat.f_bfree) * stat.f_frsize;
            if (disk.total_bytes == 0) {
                continue;
            }
            disk.usage_percent = static_cast<double>(disk.used_bytes) / disk.total_bytes * 100.0;
            metrics.push_back(disk);
        }

        return metrics;
    }

    std::vector<NetworkMetrics> collect_network() {
        std::vector<NetworkMetrics> network_metrics;
        std::ifstream net_file("/proc/net/dev");
        std::string line;

        // Skip header lines
        std::getline(net_file, line);
        std::getline(net_file, line);

        while (std::getline(net_file, line)) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }

            std::string if_name = line.substr(0, colon);
            if_name.erase(0, if_name.find_first_not_of(' '));

            // Skip loopback
            if (if_name == "lo") continue;

            // 8 receive columns followed by 8 transmit columns
            std::istringstream iss(line.substr(colon + 1));
            uint64_t fields[16] = {};
            for (auto& field : fields) {
                iss >> field;
            }
            if (iss.fail()) {
                DebugLogger::log("sample: malformed /proc/net/dev row for ", if_name);
                continue;
            }

            NetworkMetrics net;
            net.interface_name = if_name;
            net.bytes_received = fields[0];
            net.bytes_sent = fields[8];
            network_metrics.push_back(net);
        }

        return network_metrics;
    }

    std::map<int, ProcessMetrics> collect_processes(unsigned long long total_diff) {
        std::map<int, ProcessMetrics> processes;
        std::map<int, uint64_t> current_times;

        // Jiffies one logical processor accumulates over the interval
        double per_core_diff = static_cast<double>(total_diff) / core_count_;

        std::error_code ec;
        for (std::filesystem::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
            const std::string name = it->path().filename().string();
            if (!is_pid_directory(name)) {
                continue;
            }

            int pid = std::stoi(name);
            // The process may exit between listing and reading
            auto stat = read_proc_stat(pid);
            if (!stat) {
                continue;
            }

            ProcessMetrics process;
            process.pid = pid;
            process.name = stat->comm;
            process.resident_bytes = static_cast<uint64_t>(std::max<int64_t>(0, stat->rss_pages)) * page_size_;

            uint64_t cpu_time = stat->utime + stat->stime;
            current_times[pid] = cpu_time;

            auto prev = prev_process_times_.find(pid);
            if (prev != prev_process_times_.end() && per_core_diff > 0.0 && cpu_time >= prev->second) {
                process.cpu_percent = 100.0 * static_cast<double>(cpu_time - prev->second) / per_core_diff;
            }

            processes.emplace(pid, std::move(process));
        }
        if (ec) {
            DebugLogger::log("sample: /proc listing failed: ", ec.message());
        }

        // Exited pids drop out here
        prev_process_times_ = std::move(current_times);
        return processes;
    }

    bool read_cpu_stats(unsigned long long& total, unsigned long long& idle) {
        std::ifstream stat_file("/proc/stat");
        std::string line;
        if (!std::getline(stat_file, line)) {
            return false;
        }

        std::istringstream iss(line);
        std::string cpu;
        unsigned long long user, nice, system, idle_val, iowait, irq, softirq, steal;
        iss >> cpu >> user >> nice >> system >> idle_val >> iowait >> irq >> softirq >> steal;
        if (iss.fail() || cpu != "cpu") {
            return false;
        }

        total = user + nice + system + idle_val + iowait + irq + softirq + steal;
        idle = idle_val + iowait;
        return true;
    }

    long read_boot_time() {
        std::ifstream stat_file("/proc/stat");
        std::string line;
        while (std::getline(stat_file, line)) {
            if (line.rfind("btime ", 0) == 0) {
                return std::stol(line.substr(6));
            }
        }
        return 0;
    }

    double read_uptime() {
        std::ifstream uptime_file("/proc/uptime");
        double uptime = 0.0;
        uptime_file >> uptime;
        return uptime;
    }

    uint32_t core_count_;
    uint64_t page_size_;
    long clock_ticks_;
    unsigned long long prev_total_ = 0;
    unsigned long long prev_idle_ = 0;
    std::map<int, uint64_t> prev_process_times_;
};

std::unique_ptr<MetricsCollector> create_linux_metrics_collector() {
    return std::make_unique<LinuxMetricsCollector>();
}

} // namespace termdash
