#pragma once

#include <atomic>
#include <optional>
#include <memory>
#include <cstddef>
#include <vector>

namespace MetricStream {

/**
 * @brief Unbounded multi-producer / single-consumer queue (Vyukov algorithm).
 *
 * push() is safe from any number of threads. pop()/drain() must be called by
 * one consumer at a time; callers serialize draining externally.
 *
 * pop() may report empty while a producer is still linking its node; that item
 * is picked up by the next drain.
 */
template<typename T>
class MpscQueue {
public:
    MpscQueue() : size_(0) {
        // Initialize with a dummy node (simplifies push/pop logic)
        Node* dummy = new Node();
        head_.store(dummy, std::memory_order_relaxed);
        tail_.store(dummy, std::memory_order_relaxed);
    }

    ~MpscQueue() {
        while (pop().has_value()) {}
        delete head_.load(std::memory_order_relaxed);
    }

    // Non-copyable, non-movable
    MpscQueue(const MpscQueue&) = delete;
    MpscQueue& operator=(const MpscQueue&) = delete;
    MpscQueue(MpscQueue&&) = delete;
    MpscQueue& operator=(MpscQueue&&) = delete;

    void push(T item) {
        Node* node = new Node(std::move(item));

        // Count before linking so a concurrent pop never drives size_ below zero
        size_.fetch_add(1, std::memory_order_relaxed);

        // Swing tail to the new node, then link the previous tail to it
        Node* prev = tail_.exchange(node, std::memory_order_acq_rel);
        prev->next.store(node, std::memory_order_release);
    }

    std::optional<T> pop() {
        Node* head = head_.load(std::memory_order_relaxed);
        Node* next = head->next.load(std::memory_order_acquire);

        if (next == nullptr) {
            return std::nullopt;
        }

        // next becomes the new dummy
        T item = std::move(next->data);
        head_.store(next, std::memory_order_relaxed);
        delete head;

        size_.fetch_sub(1, std::memory_order_relaxed);
        return item;
    }

    /**
     * @brief Non-blocking poll loop: move every currently visible item into `out`
     * @return Number of items drained
     */
    size_t drain(std::vector<T>& out) {
        size_t count = 0;
        while (auto item = pop()) {
            out.push_back(std::move(*item));
            ++count;
        }
        return count;
    }

    // Approximate; may briefly lag concurrent push/pop
    size_t size() const {
        return size_.load(std::memory_order_relaxed);
    }

    bool empty() const {
        Node* head = head_.load(std::memory_order_relaxed);
        return head->next.load(std::memory_order_acquire) == nullptr;
    }

private:
    struct Node {
        T data{};
        std::atomic<Node*> next{nullptr};

        Node() = default;
        explicit Node(T&& item) : data(std::move(item)) {}
    };

    // Cache line padding to prevent false sharing
    alignas(64) std::atomic<Node*> head_;  // Consumer reads from head
    alignas(64) std::atomic<Node*> tail_;  // Producers write to tail
    alignas(64) std::atomic<size_t> size_;
};

} // namespace MetricStream
