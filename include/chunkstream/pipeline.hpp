// ============================================================================
// pipeline.hpp -- Pipeline Coordinator for chunkstream
//
// For each source, in order:
//
//   ArchiveProducer -> ThroughputMonitor -> StreamChannel -> ChunkWriter
//   (caller thread)                                          (own thread)
//
// Missing sources are Skipped with a warning; any failure of one source is
// recorded in its RunResult and the run moves on to the next source.
// Sources run one at a time so local buffering stays within one channel.
// ============================================================================
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "chunkstream/archive_producer.hpp"
#include "chunkstream/chunk_writer.hpp"
#include "chunkstream/reporter.hpp"
#include "chunkstream/stream_channel.hpp"

namespace chunkstream {

enum class RunStatus { Completed, Skipped, Failed };

const char* to_string(RunStatus s) noexcept;

// ============================================================================
// `RunResult` struct
// ============================================================================
struct RunResult {
  std::string source;
  std::string name;
  RunStatus   status{RunStatus::Failed};
  std::string error_kind;      // "ReadError", "WriteError", ... when Failed
  std::string error;           // message when Failed or Skipped
  uint64_t    bytes{0};        // stream bytes written to chunks
  uint64_t    chunks{0};       // chunks completely written
  double      elapsed_sec{0.0};
};

/// True when no source Failed (Skipped sources are not failures).
bool run_succeeded(const std::vector<RunResult>& results) noexcept;

// ============================================================================
// `PipelineConfig` struct
// ============================================================================
struct PipelineConfig {
  std::filesystem::path     dest_base;
  uint64_t                  chunk_bytes = 5ull * 1024 * 1024 * 1024;
  ChannelConfig             channel;
  ChunkWriterConfig         writer;     // output_dir/name/chunk_bytes are set per source
  ProducerConfig            producer;
  std::chrono::milliseconds report_interval{1000};
};

// ============================================================================
// `PipelineCoordinator` class
// ============================================================================
/// Local buffering of one source: the channel plus the stdio buffer of the
/// open chunk. Together they hold at most `chunk_bytes`.
struct BufferBudget {
  ChannelConfig channel;
  std::size_t   io_buffer_bytes{0};
};

/// Give the stdio buffer up to half of the chunk and the channel the rest.
BufferBudget split_buffer_budget(const ChannelConfig& channel,
                                 std::size_t io_buffer_bytes,
                                 uint64_t chunk_bytes);

class PipelineCoordinator {
public:
  PipelineCoordinator(PipelineConfig cfg, Reporter& reporter);

  /// Create the destination base and check it is writable. Throws
  /// PermissionError / WriteError; run() calls it first.
  void prepare_destination();

  /// Back up one source. Never throws for per-source failures.
  RunResult run_one(const std::filesystem::path& source);

  /// Back up every source in order and return one result per source.
  std::vector<RunResult> run(const std::vector<std::filesystem::path>& sources);

private:
  PipelineConfig cfg_;
  Reporter&      reporter_;
};

} // namespace chunkstream
