// include/trend_engine/indicators/rolling_window.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

namespace trend_engine {

/**
 * @brief Fixed-capacity circular buffer
 *
 * Storage is allocated once at construction; pushes overwrite the oldest
 * slot through a cursor, so no push ever reallocates.
 */
template <typename T>
class RollingWindow {
public:
    explicit RollingWindow(size_t capacity) : buffer_(capacity), capacity_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("RollingWindow capacity must be positive");
        }
    }

    /**
     * @brief Append a value
     * @return The value evicted to make room, if the window was full
     */
    std::optional<T> push(const T& value) {
        std::optional<T> evicted;
        if (size_ == capacity_) {
            evicted = buffer_[cursor_];
        } else {
            ++size_;
        }
        buffer_[cursor_] = value;
        cursor_ = (cursor_ + 1) % capacity_;
        return evicted;
    }

    /**
     * @brief Access by age, 0 being the newest value
     */
    const T& operator[](size_t age) const {
        if (age >= size_) {
            throw std::out_of_range("RollingWindow index out of range");
        }
        return buffer_[(cursor_ + capacity_ - 1 - age) % capacity_];
    }

    const T& newest() const {
        return (*this)[0];
    }

    const T& oldest() const {
        return (*this)[size_ - 1];
    }

    size_t size() const {
        return size_;
    }

    size_t capacity() const {
        return capacity_;
    }

    bool empty() const {
        return size_ == 0;
    }

    bool full() const {
        return size_ == capacity_;
    }

    void clear() {
        size_ = 0;
        cursor_ = 0;
    }

private:
    std::vector<T> buffer_;
    size_t capacity_;
    size_t cursor_{0};
    size_t size_{0};
};

/**
 * @brief Simple moving average over a RollingWindow with a running sum
 *
 * The running sum is rebuilt from the window once per full turn of the
 * buffer, which keeps updates O(1) amortized and bounds floating-point drift.
 */
class RollingMean {
public:
    explicit RollingMean(size_t period) : window_(period) {}

    void add(double value) {
        auto evicted = window_.push(value);
        sum_ += value;
        if (evicted) {
            sum_ -= *evicted;
            if (++evictions_ >= window_.capacity()) {
                resync();
            }
        }
    }

    bool ready() const {
        return window_.full();
    }

    /**
     * @brief Mean of the last `period` values, nullopt while warming up
     */
    std::optional<double> value() const {
        if (!ready()) {
            return std::nullopt;
        }
        return sum_ / static_cast<double>(window_.size());
    }

    size_t count() const {
        return window_.size();
    }

    size_t period() const {
        return window_.capacity();
    }

    const RollingWindow<double>& window() const {
        return window_;
    }

    void clear() {
        window_.clear();
        sum_ = 0.0;
        evictions_ = 0;
    }

private:
    void resync() {
        double total = 0.0;
        for (size_t i = 0; i < window_.size(); ++i) {
            total += window_[i];
        }
        sum_ = total;
        evictions_ = 0;
    }

    RollingWindow<double> window_;
    double sum_{0.0};
    size_t evictions_{0};
};

}  // namespace trend_engine
