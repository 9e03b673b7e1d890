// SPDX-License-Identifier: MIT
/**
 * @file ring_buffer.hpp
 * @brief Fixed-capacity rolling window backed by a single allocation
 */

#pragma once

#include <cstddef>
#include <vector>

namespace hedgelab {

/**
 * @brief Rolling window that keeps the most recent `capacity` values
 *
 * Storage is allocated once at construction. Pushing into a full buffer
 * overwrites the oldest element. Indexing is oldest-first, so
 * `buf[0]` is the oldest retained value and `buf[size() - 1]` the newest.
 *
 * Not thread-safe: each owner (strategy, reward model) keeps its own.
 */
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : storage_(capacity)
    {}

    void push(const T& value) {
        if (storage_.empty()) return;
        storage_[(head_ + size_) % storage_.size()] = value;
        if (size_ < storage_.size()) {
            ++size_;
        } else {
            head_ = (head_ + 1) % storage_.size();
        }
    }

    const T& operator[](size_t i) const {
        return storage_[(head_ + i) % storage_.size()];
    }

    const T& back() const { return (*this)[size_ - 1]; }

    size_t size() const noexcept { return size_; }
    size_t capacity() const noexcept { return storage_.size(); }
    bool empty() const noexcept { return size_ == 0; }
    bool full() const noexcept { return size_ == storage_.size(); }

    void clear() noexcept {
        head_ = 0;
        size_ = 0;
    }

    /// Copy the window oldest-first into a contiguous vector
    std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(size_);
        for (size_t i = 0; i < size_; ++i) {
            out.push_back((*this)[i]);
        }
        return out;
    }

private:
    std::vector<T> storage_;
    size_t head_ = 0;
    size_t size_ = 0;
};

}  // namespace hedgelab
