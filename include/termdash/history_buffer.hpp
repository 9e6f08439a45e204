#pragma once

#include <vector>
#include <cstddef>

namespace termdash {

// Fixed-length rolling window of samples, oldest first.
// Starts out holding `capacity` zeroes, so its size never changes.
class HistoryBuffer {
public:
    explicit HistoryBuffer(size_t capacity);

    // Drop the oldest sample and append `value`
    void push(double value);

    double latest() const;
    double max() const;

    // i = 0 is the oldest sample
    double at(size_t i) const;
    size_t size() const { return samples_.size(); }
    size_t capacity() const { return samples_.size(); }

    // Copy in chronological order
    std::vector<double> values() const;

private:
    std::vector<double> samples_;
    size_t head_ = 0;    // Index of the oldest sample
};

} // namespace termdash
