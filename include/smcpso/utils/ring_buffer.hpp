/**
 * @file ring_buffer.hpp
 * @brief Fixed-capacity ring buffer sized at runtime
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>

namespace smcpso::utils {

/**
 * @brief Ring buffer with runtime capacity
 *
 * Used as a trailing window: pushOverwrite() keeps the newest `capacity`
 * samples. Not thread-safe; each simulation owns its own window.
 */
template<typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity = 1)
        : buffer_(std::max<size_t>(capacity, 1)), head_(0), tail_(0), count_(0) {}

    bool push(const T& item) {
        if (count_ >= buffer_.size()) return false;

        buffer_[head_] = item;
        head_ = (head_ + 1) % buffer_.size();
        count_++;
        return true;
    }

    /**
     * @brief Push, overwriting oldest if full
     */
    void pushOverwrite(const T& item) {
        if (count_ >= buffer_.size()) {
            tail_ = (tail_ + 1) % buffer_.size();
            count_--;
        }
        push(item);
    }

    /**
     * @brief Element by age, 0 = oldest
     */
    const T& operator[](size_t index) const {
        return buffer_[(tail_ + index) % buffer_.size()];
    }

    bool empty() const { return count_ == 0; }
    bool full() const { return count_ >= buffer_.size(); }
    size_t size() const { return count_; }
    size_t capacity() const { return buffer_.size(); }

    void clear() {
        head_ = tail_ = count_ = 0;
    }

    /**
     * @brief Largest element currently held (T{} when empty)
     */
    T max() const {
        if (count_ == 0) return T{};
        T result = (*this)[0];
        for (size_t i = 1; i < count_; ++i) {
            result = std::max(result, (*this)[i]);
        }
        return result;
    }

private:
    std::vector<T> buffer_;
    size_t head_;
    size_t tail_;
    size_t count_;
};

}  // namespace smcpso::utils
