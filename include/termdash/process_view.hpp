#pragma once

#include "termdash/metrics_collector.hpp"
#include <vector>
#include <string>
#include <map>
#include <optional>
#include <cstddef>

namespace termdash {

struct ProcessRow {
    int pid = 0;
    std::string name;
    double cpu_percent = 0.0;
    uint64_t memory_bytes = 0;
};

using ProcessView = std::vector<ProcessRow>;

// Empty query: every process, busiest first, cut to `limit` rows.
// Otherwise: processes whose name contains `query` (case-insensitive),
// busiest first, not cut.
ProcessView build_process_view(const std::map<int, ProcessMetrics>& processes,
                               const std::string& query,
                               size_t limit);

bool name_matches(const std::string& name, const std::string& query);

// Highlighted position in the process view. Follows the row position, not the pid.
class Cursor {
public:
    void next();
    void previous();

    // Call after every rebuild with the new view length
    void sync(size_t view_size);

    // Back to the first row (absent if the view is empty)
    void reset();

    std::optional<size_t> index() const { return index_; }
    size_t view_size() const { return view_size_; }

    // Row under the cursor, or nullptr
    const ProcessRow* selected(const ProcessView& view) const;

private:
    std::optional<size_t> index_;
    size_t view_size_ = 0;
};

} // namespace termdash
