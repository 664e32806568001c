#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace MetricStream {

/**
 * @brief Fixed-capacity circular buffer that overwrites its oldest entry when full.
 *
 * All logical operations (find/filter/map/toArray) walk items in chronological
 * order starting at head_, independent of the physical slot layout.
 *
 * Index arithmetic uses a bitmask when the capacity is a power of 2 and modulo
 * otherwise; both paths behave identically.
 *
 * Not thread-safe: the owning StorageBackend serializes access.
 */
template<typename T>
class RingBuffer {
public:
    struct Stats {
        size_t capacity;
        size_t size;
        size_t available_space;
        double utilization_percent;
        bool is_empty;
        bool is_full;
        bool is_power_of_two;
    };

    explicit RingBuffer(size_t capacity)
        : capacity_(capacity),
          is_power_of_two_(capacity > 0 && (capacity & (capacity - 1)) == 0),
          mask_(is_power_of_two_ ? capacity - 1 : 0) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer capacity must be positive");
        }
        buffer_.resize(capacity);
    }

    // O(1). When full, the oldest item is dropped.
    void enqueue(const T& item) {
        buffer_[tail_] = item;
        advance(tail_);
        commitEnqueue();
    }

    void enqueue(T&& item) {
        buffer_[tail_] = std::move(item);
        advance(tail_);
        commitEnqueue();
    }

    // O(1). std::nullopt when empty.
    std::optional<T> dequeue() {
        if (size_ == 0) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(*buffer_[head_]));
        buffer_[head_].reset();
        advance(head_);
        --size_;
        return item;
    }

    // Oldest item, without removing it
    std::optional<T> peek() const {
        if (size_ == 0) return std::nullopt;
        return buffer_[head_];
    }

    // Newest item, without removing it
    std::optional<T> peekLast() const {
        if (size_ == 0) return std::nullopt;
        size_t last = is_power_of_two_ ? ((tail_ + capacity_ - 1) & mask_)
                                       : ((tail_ + capacity_ - 1) % capacity_);
        return buffer_[last];
    }

    void enqueueBatch(const std::vector<T>& items) {
        for (const auto& item : items) {
            enqueue(item);
        }
    }

    std::vector<T> dequeueBatch(size_t count) {
        std::vector<T> result;
        size_t actual = std::min(count, size_);
        result.reserve(actual);
        for (size_t i = 0; i < actual; ++i) {
            result.push_back(std::move(*dequeue()));
        }
        return result;
    }

    // Oldest first
    std::vector<T> toArray() const {
        std::vector<T> result;
        result.reserve(size_);
        for (size_t i = 0; i < size_; ++i) {
            result.push_back(*buffer_[physical(i)]);
        }
        return result;
    }

    // Newest first
    std::vector<T> toArrayReverse() const {
        std::vector<T> result;
        result.reserve(size_);
        for (size_t i = size_; i-- > 0; ) {
            result.push_back(*buffer_[physical(i)]);
        }
        return result;
    }

    // Logical [start, end) slice, clamped to the current size
    std::vector<T> slice(size_t start, size_t end) const {
        std::vector<T> result;
        end = std::min(end, size_);
        for (size_t i = start; i < end; ++i) {
            result.push_back(*buffer_[physical(i)]);
        }
        return result;
    }

    std::optional<T> find(const std::function<bool(const T&, size_t)>& predicate) const {
        for (size_t i = 0; i < size_; ++i) {
            const T& item = *buffer_[physical(i)];
            if (predicate(item, i)) {
                return item;
            }
        }
        return std::nullopt;
    }

    std::vector<T> filter(const std::function<bool(const T&, size_t)>& predicate) const {
        std::vector<T> result;
        for (size_t i = 0; i < size_; ++i) {
            const T& item = *buffer_[physical(i)];
            if (predicate(item, i)) {
                result.push_back(item);
            }
        }
        return result;
    }

    template<typename Mapper>
    auto map(Mapper&& mapper) const -> std::vector<decltype(mapper(std::declval<const T&>(), size_t{}))> {
        std::vector<decltype(mapper(std::declval<const T&>(), size_t{}))> result;
        result.reserve(size_);
        for (size_t i = 0; i < size_; ++i) {
            result.push_back(mapper(*buffer_[physical(i)], i));
        }
        return result;
    }

    void forEach(const std::function<void(const T&)>& visit) const {
        for (size_t i = 0; i < size_; ++i) {
            visit(*buffer_[physical(i)]);
        }
    }

    // O(capacity): releases the stored items
    void clear() {
        for (auto& slot : buffer_) {
            slot.reset();
        }
        head_ = 0;
        tail_ = 0;
        size_ = 0;
    }

    bool isEmpty() const { return size_ == 0; }
    bool isFull() const { return size_ == capacity_; }
    size_t size() const { return size_; }
    size_t capacity() const { return capacity_; }
    size_t availableSpace() const { return capacity_ - size_; }
    bool isPowerOfTwo() const { return is_power_of_two_; }

    Stats stats() const {
        return Stats{
            capacity_,
            size_,
            availableSpace(),
            static_cast<double>(size_) * 100.0 / static_cast<double>(capacity_),
            isEmpty(),
            isFull(),
            is_power_of_two_
        };
    }

private:
    void advance(size_t& index) const {
        index = is_power_of_two_ ? ((index + 1) & mask_) : ((index + 1) % capacity_);
    }

    void commitEnqueue() {
        if (size_ < capacity_) {
            ++size_;
        } else {
            // Full: tail_ just overwrote the oldest slot, move head_ past it
            advance(head_);
        }
    }

    size_t physical(size_t logical) const {
        return is_power_of_two_ ? ((head_ + logical) & mask_)
                                : ((head_ + logical) % capacity_);
    }

    size_t capacity_;
    bool is_power_of_two_;
    size_t mask_;
    std::vector<std::optional<T>> buffer_;
    size_t head_ = 0;
    size_t tail_ = 0;
    size_t size_ = 0;
};

} // namespace MetricStream
