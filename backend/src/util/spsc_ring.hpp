#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

// Single-Producer / Single-Consumer ring buffer with a runtime bound.
// - Storage is rounded up to a power of two so wrap-around stays a bitmask.
// - `limit` is the high-water mark: try_push refuses once `limit` items
//   are queued, even if the power-of-two storage has spare slots.
// - SPSC: exactly one producer thread calls try_push,
//         exactly one consumer thread calls try_pop.
template <typename T>
class SpscRing {
public:
    explicit SpscRing(std::size_t limit)
    : limit_(limit == 0 ? 1 : limit)
    , slots_(round_up_pow2(limit_ + 1))
    , mask_(slots_ - 1)
    , buf_(new Storage[slots_])
    , head_(0), tail_(0) {
        for (std::size_t i = 0; i < slots_; ++i) {
            new (&buf_[i]) T();
        }
    }
    ~SpscRing() {
        for (std::size_t i = 0; i < slots_; ++i) {
            ptr(i)->~T();
        }
    }

    // Non-copyable
    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    // Producer: attempt to push; returns false at the high-water mark (caller decides policy)
    bool try_push(T&& v) {
        const std::size_t head = head_.load(std::memory_order_relaxed);
        const std::size_t tail = tail_.load(std::memory_order_acquire);
        if (((head - tail) & mask_) >= limit_) {
            // full
            return false;
        }
        *ptr(head) = std::move(v);
        head_.store((head + 1) & mask_, std::memory_order_release);
        return true;
    }

    // Consumer: attempt to pop; returns false if empty
    bool try_pop(T& out) {
        const std::size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) {
            // empty
            return false;
        }
        out = std::move(*ptr(tail));
        tail_.store((tail + 1) & mask_, std::memory_order_release);
        return true;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }
    std::size_t size() const {
        return (head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire)) & mask_;
    }
    std::size_t capacity() const { return limit_; }

private:
    using Storage = typename std::aligned_storage<sizeof(T), alignof(T)>::type;

    static std::size_t round_up_pow2(std::size_t n) {
        std::size_t p = 1;
        while (p < n) p <<= 1;
        return p;
    }

    T* ptr(std::size_t i) { return reinterpret_cast<T*>(&buf_[i]); }
    const T* ptr(std::size_t i) const { return reinterpret_cast<const T*>(&buf_[i]); }

    std::size_t limit_;
    std::size_t slots_;
    std::size_t mask_;
    std::unique_ptr<Storage[]> buf_;
    std::atomic<std::size_t> head_; // producer writes
    std::atomic<std::size_t> tail_; // consumer writes
};
