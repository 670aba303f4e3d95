// ============================================================================
// reporter.hpp -- Reporting sink for chunkstream
//
// The core never prints directly. Status lines, warnings, errors and
// throughput snapshots go through a Reporter handed to each component, so
// the caller decides where they end up (terminal, log file, a test buffer).
// Each call is one chronological event; timestamps are taken inside the
// call, never from state shared across runs.
//
// Types and interfaces defined:
// - ProgressSnapshot: bytes transferred, elapsed time and rates.
// - Reporter: abstract sink (thread-safe implementations required, the
//   chunk writer reports from its own thread).
// - StdioReporter: timestamped lines on stdout/stderr, tee'd to a log file.
// ============================================================================
#pragma once
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace chunkstream {

// ============================================================================
// `ProgressSnapshot` struct
// ============================================================================
struct ProgressSnapshot {
  std::string   label;                // source short name
  std::uint64_t bytes{0};             // cumulative bytes through the monitor
  double        elapsed_sec{0.0};
  double        rate_bps{0.0};        // bytes/sec since previous snapshot
  double        avg_rate_bps{0.0};    // bytes/sec since start
  bool          final{false};         // emitted once when the stream ends
};

// ============================================================================
// `Reporter` interface
// ============================================================================
class Reporter {
public:
  virtual ~Reporter() = default;

  virtual void info(const std::string& msg) = 0;
  virtual void warn(const std::string& msg) = 0;
  virtual void error(const std::string& msg) = 0;
  virtual void progress(const ProgressSnapshot& snap) = 0;
};

/// Current local time as "YYYY-mm-dd HH:MM:SS".
std::string timestamp_now();

/// pv -brt style rendering: "1.25GiB 0:01:05 [19.30MiB/s]".
std::string format_progress(const ProgressSnapshot& snap);

// ============================================================================
// `StdioReporter` class
// Writes "[timestamp] LEVEL message" lines. Info and progress go to `out`,
// warnings and errors to `err`; every line is also appended to the log file
// when one is open.
// ============================================================================
class StdioReporter : public Reporter {
public:
  explicit StdioReporter(std::FILE* out = stdout, std::FILE* err = stderr);
  ~StdioReporter() override;

  StdioReporter(const StdioReporter&) = delete;
  StdioReporter& operator=(const StdioReporter&) = delete;

  /// Open (append) a log file. Returns false and leaves logging to the
  /// terminal only if the file cannot be opened.
  bool open_log(const std::string& path);
  const std::string& log_path() const noexcept { return log_path_; }

  void info(const std::string& msg) override;
  void warn(const std::string& msg) override;
  void error(const std::string& msg) override;
  void progress(const ProgressSnapshot& snap) override;

private:
  void emit(std::FILE* stream, const char* level, const std::string& msg);

  std::mutex  mu_;
  std::FILE*  out_;
  std::FILE*  err_;
  std::FILE*  log_{nullptr};
  std::string log_path_;
};

} // namespace chunkstream
