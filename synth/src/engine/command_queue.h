// ==============================================================================
// Acordes Engine - Command Queue
// ==============================================================================
// Unbounded multi-producer / single-consumer FIFO between any number of
// producer threads and the render thread.
//
// Intrusive linked list with a stub node (Vyukov MPSC):
//   producers: head_.exchange(node), then prev->next.store(node)
//   consumer:  follows tail_->next
// enqueue() never blocks. drain() never blocks, never allocates and never
// frees: the consumer applies each value in place and pushes the node it
// stepped past onto a lock-free "retired" stack. Producers take the whole
// retired stack at the start of each enqueue() and delete it on their own
// thread, so the render thread does no heap work at all.
// ==============================================================================

#pragma once

#include "engine_log.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <new>
#include <optional>
#include <utility>

namespace Acordes {

template <typename T>
class MpscQueue {
public:
    MpscQueue() {
        Node* stub = new Node();
        head_.store(stub, std::memory_order_relaxed);
        tail_ = stub;
    }

    ~MpscQueue() {
        Node* node = tail_;
        while (node != nullptr) {
            Node* next = node->next.load(std::memory_order_relaxed);
            delete node;
            node = next;
        }
        deleteChain(retired_.exchange(nullptr, std::memory_order_acquire));
    }

    MpscQueue(const MpscQueue&) = delete;
    MpscQueue& operator=(const MpscQueue&) = delete;

    /// @brief Append a value. Safe from any number of threads at once.
    ///
    /// Allocates one node. If that allocation fails the value is dropped,
    /// counted in droppedCount(), and false is returned; nothing throws.
    bool enqueue(T value) noexcept {
        collectGarbage();

        Node* node = nullptr;
        try {
            node = new Node();
        } catch (const std::bad_alloc&) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
#if ACORDES_ENGINE_DEBUG
            logEngine("command dropped: node allocation failed");
#endif
            return false;
        }
        node->value.emplace(std::move(value));

        Node* prev = head_.exchange(node, std::memory_order_acq_rel);
        prev->next.store(node, std::memory_order_release);
        return true;
    }

    /// @brief Consumer only. Call fn(value) for every value whose enqueue
    /// has completed, in FIFO order.
    /// @return Number of values consumed
    template <typename Fn>
    size_t drain(Fn&& fn) {
        size_t count = 0;
        while (true) {
            Node* next = tail_->next.load(std::memory_order_acquire);
            if (next == nullptr) {
                break;
            }
            fn(*next->value);
            retire(tail_);
            tail_ = next;
            ++count;
        }
        return count;
    }

    /// @brief Consumer only. True when no completed value is waiting.
    [[nodiscard]] bool empty() const noexcept {
        return tail_->next.load(std::memory_order_acquire) == nullptr;
    }

    [[nodiscard]] uint64_t droppedCount() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::optional<T> value;
        Node* retiredNext{nullptr};
    };

    /// Treiber push; only the consumer pushes.
    void retire(Node* node) noexcept {
        node->retiredNext = retired_.load(std::memory_order_relaxed);
        while (!retired_.compare_exchange_weak(node->retiredNext, node,
                                               std::memory_order_release,
                                               std::memory_order_relaxed)) {
        }
    }

    void collectGarbage() noexcept {
        deleteChain(retired_.exchange(nullptr, std::memory_order_acquire));
    }

    static void deleteChain(Node* node) noexcept {
        while (node != nullptr) {
            Node* next = node->retiredNext;
            delete node;
            node = next;
        }
    }

    std::atomic<Node*> head_{nullptr};
    Node* tail_{nullptr};
    std::atomic<Node*> retired_{nullptr};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace Acordes
