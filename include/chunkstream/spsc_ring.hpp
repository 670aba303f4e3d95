// ============================================================================
// spsc_ring.hpp -- Single-Producer Single-Consumer Ring Buffer
//
// Lock-free bounded FIFO used to hand block descriptors from the producer
// thread to the chunk writer thread, and block ids back again.
//
// head_/tail_ count pushes and pops since construction and are never
// wrapped; the slot is `count & MASK`. All N slots are usable. Each side
// keeps a private copy of the other side's counter and only reloads the
// shared atomic when the copy says the ring is full (or empty).
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <new>
#include <type_traits>

namespace spsc {

#if defined(__cpp_lib_hardware_interference_size)
constexpr std::size_t CL = std::hardware_destructive_interference_size;
#else
constexpr std::size_t CL = 64;
#endif

template <class T, std::size_t N>
class Ring {
  static_assert(N >= 2 && (N & (N - 1)) == 0, "N must be a power of two >= 2");
  static_assert(std::is_trivially_copyable_v<T>,
                "Ring slots hold trivially copyable values");

public:
  Ring() = default;
  Ring(const Ring&) = delete;
  Ring& operator=(const Ring&) = delete;

  /// Producer side. Returns false when all N slots are taken.
  bool push(const T& v) noexcept {
    const std::size_t h = head_.load(std::memory_order_relaxed);
    if (h - tail_seen_ == N) {
      tail_seen_ = tail_.load(std::memory_order_acquire);
      if (h - tail_seen_ == N) return false;
    }
    slots_[h & MASK] = v;
    head_.store(h + 1, std::memory_order_release);
    return true;
  }

  /// Consumer side. Returns false when nothing is queued.
  bool pop(T& out) noexcept {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    if (t == head_seen_) {
      head_seen_ = head_.load(std::memory_order_acquire);
      if (t == head_seen_) return false;
    }
    out = slots_[t & MASK];
    tail_.store(t + 1, std::memory_order_release);
    return true;
  }

  static constexpr std::size_t capacity() noexcept { return N; }

  /// Exact only while neither side is running.
  std::size_t size() const noexcept {
    return head_.load(std::memory_order_acquire) -
           tail_.load(std::memory_order_acquire);
  }
  bool empty() const noexcept { return size() == 0; }
  bool full() const noexcept { return size() == N; }

private:
  static constexpr std::size_t MASK = N - 1;

  alignas(CL) std::atomic<std::size_t> head_{0};  // written by the producer
  std::size_t                          tail_seen_{0};
  alignas(CL) std::atomic<std::size_t> tail_{0};  // written by the consumer
  std::size_t                          head_seen_{0};
  alignas(CL) T slots_[N]{};
};

} // namespace spsc
