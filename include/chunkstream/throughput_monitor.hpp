// ============================================================================
// throughput_monitor.hpp -- pass-through byte counter with periodic reports
//
// Sits between the archive producer and the channel. Every write is
// forwarded downstream unchanged and immediately; the monitor only counts.
// When at least `interval` has passed since the last report it emits a
// ProgressSnapshot to the Reporter; finish() emits a final one.
// ============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "chunkstream/byte_sink.hpp"
#include "chunkstream/reporter.hpp"

namespace chunkstream {

// ============================================================================
// `ThroughputMonitor` class
// Counters are atomic so snapshot() may be called from any thread; write()
// and finish() are called from the producer thread only.
// ============================================================================
class ThroughputMonitor : public ByteSink {
public:
  using clock = std::chrono::steady_clock;

  /// @param label     Name shown in progress lines (source short name).
  /// @param next      Downstream sink; receives every byte.
  /// @param reporter  Where snapshots go; may be null to only count.
  /// @param interval  Minimum time between periodic snapshots.
  ThroughputMonitor(std::string label, ByteSink& next, Reporter* reporter,
                    std::chrono::milliseconds interval =
                      std::chrono::milliseconds(1000));

  void write(const void* data, std::size_t len) override;
  void finish() override;

  /// Snapshot of the counters with derived rates. Does not reset the
  /// instantaneous-rate window.
  ProgressSnapshot snapshot() const;

  std::uint64_t bytes() const noexcept {
    return bytes_.load(std::memory_order_relaxed);
  }
  std::uint64_t reports() const noexcept {
    return reports_.load(std::memory_order_relaxed);
  }

private:
  void report(clock::time_point now, bool final);

  std::string               label_;
  ByteSink&                 next_;
  Reporter*                 reporter_;
  std::chrono::nanoseconds  interval_;

  clock::time_point         start_;
  clock::time_point         last_report_;
  std::uint64_t             last_bytes_{0};

  std::atomic<std::uint64_t> bytes_{0};
  std::atomic<std::uint64_t> reports_{0};
};

} // namespace chunkstream
