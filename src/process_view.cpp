#include "termdash/process_view.hpp"
#include <algorithm>
#include <cctype>

namespace termdash {

static std::string to_lower(const std::string& str) {
    std::string lower = str;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower;
}

bool name_matches(const std::string& name, const std::string& query) {
    return to_lower(name).find(to_lower(query)) != std::string::npos;
}

ProcessView build_process_view(const std::map<int, ProcessMetrics>& processes,
                               const std::string& query,
                               size_t limit)
{
    ProcessView view;
    view.reserve(processes.size());

    const std::string needle = to_lower(query);
    for (const auto& [pid, process] : processes) {
        if (!needle.empty() && to_lower(process.name).find(needle) == std::string::npos) {
            continue;
        }
        view.push_back({pid, process.name, process.cpu_percent, process.resident_bytes});
    }

    // Equal CPU keeps pid order
    std::stable_sort(view.begin(), view.end(), [](const ProcessRow& a, const ProcessRow& b) {
        return a.cpu_percent > b.cpu_percent;
    });

    if (needle.empty() && view.size() > limit) {
        view.resize(limit);
    }

    return view;
}

void Cursor::next() {
    if (view_size_ == 0) {
        return;
    }
    if (!index_ || *index_ + 1 >= view_size_) {
        index_ = 0;
    } else {
        index_ = *index_ + 1;
    }
}

void Cursor::previous() {
    if (view_size_ == 0) {
        return;
    }
    if (!index_) {
        index_ = 0;
    } else if (*index_ == 0) {
        index_ = view_size_ - 1;
    } else {
        index_ = *index_ - 1;
    }
}

void Cursor::sync(size_t view_size) {
    view_size_ = view_size;
    if (view_size_ == 0) {
        index_.reset();
    } else if (!index_) {
        index_ = 0;
    } else if (*index_ >= view_size_) {
        index_ = view_size_ - 1;
    }
}

void Cursor::reset() {
    if (view_size_ == 0) {
        index_.reset();
    } else {
        index_ = 0;
    }
}

const ProcessRow* Cursor::selected(const ProcessView& view) const {
    if (!index_ || *index_ >= view.size()) {
        return nullptr;
    }
    return &view[*index_];
}

} // namespace termdash
