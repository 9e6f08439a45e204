#include "termdash/metrics_collector.hpp"
#include <iomanip>
#include <sstream>
#include <ctime>

namespace termdash {

bool DebugLogger::enabled_ = false;
std::ostream* DebugLogger::sink_ = &std::cerr;

std::string DebugLogger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm;
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

// Platform-specific implementations are in platform/ subdirectory

#ifdef __linux__
    std::unique_ptr<MetricsCollector> create_metrics_collector() {
        extern std::unique_ptr<MetricsCollector> create_linux_metrics_collector();
        return create_linux_metrics_collector();
    }
#else
    #error "Unsupported platform"
#endif

} // namespace termdash
