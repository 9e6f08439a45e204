#include "termdash/history_buffer.hpp"
#include <algorithm>
#include <stdexcept>

namespace termdash {

HistoryBuffer::HistoryBuffer(size_t capacity)
    : samples_(capacity, 0.0)
{
    if (capacity == 0) {
        throw std::invalid_argument("history buffer capacity must be positive");
    }
}

void HistoryBuffer::push(double value) {
    samples_[head_] = value;
    head_ = (head_ + 1) % samples_.size();
}

double HistoryBuffer::latest() const {
    return samples_[(head_ + samples_.size() - 1) % samples_.size()];
}

double HistoryBuffer::max() const {
    return *std::max_element(samples_.begin(), samples_.end());
}

double HistoryBuffer::at(size_t i) const {
    if (i >= samples_.size()) {
        throw std::out_of_range("history buffer index out of range");
    }
    return samples_[(head_ + i) % samples_.size()];
}

std::vector<double> HistoryBuffer::values() const {
    std::vector<double> ordered;
    ordered.reserve(samples_.size());
    ordered.insert(ordered.end(), samples_.begin() + head_, samples_.end());
    ordered.insert(ordered.end(), samples_.begin(), samples_.begin() + head_);
    return ordered;
}

} // namespace termdash
