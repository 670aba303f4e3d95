// ============================================================================
// chunk_writer.hpp -- Chunk Writer for chunkstream
//
// This header defines the ChunkWriter class, responsible for persisting the
// archive stream of one source as a sequence of fixed-size chunk files
// ("<name>.tar.part_NNNNNN") written straight to the destination directory.
//
// Core features:
//
// - Exact chunk boundaries: every chunk but the last holds exactly
//   `chunk_bytes`; a stream ending on a boundary leaves no empty chunk.
// - Chunks are opened lazily when the first byte for them arrives, with
//   O_EXCL so an existing file is never overwritten, and closed as soon as
//   they are full (flush, optional fsync, checked close).
// - Optional I/O backends: stdio (default) or Linux io_uring.
// - Can be fed synchronously (ByteSink) or drain a StreamChannel on its
//   own thread (start()/join()).
//
// Types and interfaces defined:
// - ChunkWriterConfig: output directory, set name, chunk size, I/O options.
// - ChunkInfo: one finished chunk (index, path, size).
// - ChunkWriter: main class; Stats: counters for the writer.
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "chunkstream/byte_sink.hpp"
#include "chunkstream/reporter.hpp"
#include "chunkstream/stream_channel.hpp"

namespace chunkstream {

// ============================================================================
// ChunkWriterConfig: configuration for the ChunkWriter class
// ============================================================================
struct ChunkWriterConfig {
  std::string output_dir;                                  // DEST_BASE/<name>
  std::string name;                                        // chunk set name
  uint64_t    chunk_bytes     = 5ull * 1024 * 1024 * 1024; // 5 GiB chunks
  std::size_t io_buffer_bytes = 8ull * 1024 * 1024;        // stdio buffer, 0 = none
  bool        fsync_chunks    = true;    // fsync each chunk before close
  bool        overwrite       = false;   // remove an existing set first

  // io_uring (Linux-only; ignored when built without liburing)
  bool        use_io_uring    = false;   // enable io_uring backend
  unsigned    uring_qd        = 64;      // SQ/CQ depth
  unsigned    max_inflight    = 32;      // cap in-flight write requests
};

// ============================================================================
// ChunkInfo: a chunk file that was completely written and closed
// ============================================================================
struct ChunkInfo {
  uint64_t    index{0};
  std::string path;
  uint64_t    bytes{0};
};

// ============================================================================
// ChunkWriter: partitions a byte stream into numbered chunk files
// ============================================================================
class ChunkWriter : public ByteSink {
public:
  /// Constructor for the ChunkWriter class
  /// @param cfg The writer configuration
  /// @param reporter Receives one line per chunk opened/closed (may be null)
  explicit ChunkWriter(ChunkWriterConfig cfg, Reporter* reporter = nullptr);
  ~ChunkWriter() override;

  ChunkWriter(const ChunkWriter&) = delete;
  ChunkWriter& operator=(const ChunkWriter&) = delete;

  /// Create the output directory and check it holds no chunks of this set
  /// (or remove them when `overwrite` is set). Throws WriteError.
  void prepare();

  /// Append bytes to the chunk set. Throws WriteError.
  void write(const void* data, std::size_t len) override;

  /// Close the last chunk. Throws WriteError.
  void finish() override;

  /// Drain `channel` on a background thread until end of stream. A write
  /// failure aborts the channel so the producer stops too.
  void start(StreamChannel& channel);

  /// Wait for the background thread; rethrows its WriteError, if any.
  /// Returns quietly when the producer aborted the channel.
  void join();

  /// Chunks completely written so far, in index order.
  const std::vector<ChunkInfo>& chunks() const noexcept;

  /// Total stream bytes written to chunk files.
  uint64_t bytes_written() const noexcept;

  struct Stats {
    std::atomic<uint64_t> chunks_opened{0};
    std::atomic<uint64_t> chunks_closed{0};
    std::atomic<uint64_t> bytes_written{0};
    std::atomic<uint64_t> io_errors{0};
    std::atomic<uint64_t> uring_submits{0};
    std::atomic<uint64_t> uring_completions{0};
    std::atomic<uint64_t> uring_sq_full{0};
  };
  const Stats& stats() const noexcept;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace chunkstream
