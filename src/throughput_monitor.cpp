// ============================================================================
// throughput_monitor.cpp -- implementation of ThroughputMonitor
//
// bytes_        : Total bytes forwarded downstream.
// reports_      : Number of snapshots handed to the reporter.
// last_bytes_   : bytes_ at the previous report, for the instantaneous rate.
// ============================================================================
#include "chunkstream/throughput_monitor.hpp"

#include <utility>

namespace chunkstream {

ThroughputMonitor::ThroughputMonitor(std::string label, ByteSink& next,
                                     Reporter* reporter,
                                     std::chrono::milliseconds interval)
  : label_(std::move(label)),
    next_(next),
    reporter_(reporter),
    interval_(interval),
    start_(clock::now()),
    last_report_(start_) {}

void ThroughputMonitor::write(const void* data, std::size_t len) {
  // Forward first: a downstream failure must not be counted as transferred.
  next_.write(data, len);
  bytes_.fetch_add(len, std::memory_order_relaxed);

  if (reporter_) {
    const auto now = clock::now();
    if (now - last_report_ >= interval_) report(now, false);
  }
}

void ThroughputMonitor::finish() {
  next_.finish();
  if (reporter_) report(clock::now(), true);
}

ProgressSnapshot ThroughputMonitor::snapshot() const {
  ProgressSnapshot s;
  s.label       = label_;
  s.bytes       = bytes_.load(std::memory_order_relaxed);
  s.elapsed_sec = std::chrono::duration<double>(clock::now() - start_).count();
  if (s.elapsed_sec <= 0.0) s.elapsed_sec = 1e-9; // avoid div-by-zero
  s.avg_rate_bps = s.bytes / s.elapsed_sec;
  s.rate_bps     = s.avg_rate_bps;
  return s;
}

void ThroughputMonitor::report(clock::time_point now, bool final) {
  ProgressSnapshot s;
  s.label       = label_;
  s.bytes       = bytes_.load(std::memory_order_relaxed);
  s.final       = final;
  s.elapsed_sec = std::chrono::duration<double>(now - start_).count();
  if (s.elapsed_sec <= 0.0) s.elapsed_sec = 1e-9;

  double window = std::chrono::duration<double>(now - last_report_).count();
  if (window <= 0.0) window = 1e-9;
  s.rate_bps     = (s.bytes - last_bytes_) / window;
  s.avg_rate_bps = s.bytes / s.elapsed_sec;

  last_report_ = now;
  last_bytes_  = s.bytes;
  reports_.fetch_add(1, std::memory_order_relaxed);
  reporter_->progress(s);
}

} // namespace chunkstream
