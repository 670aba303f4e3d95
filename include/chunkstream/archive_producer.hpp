// ============================================================================
// archive_producer.hpp -- Archive Producer for chunkstream
//
// Serializes one source directory tree into a single pax (ustar-compatible)
// tar stream and pushes it into a ByteSink. Traversal, metadata lookup and
// hard link detection are done by libarchive's disk reader; the tree is
// walked incrementally and file contents stream through a fixed buffer, so
// memory does not grow with the size of the tree.
//
// Member names are the source path without its leading '/', which is what
// `tar -c /abs/source` writes; `tar -xpf -` in / restores in place.
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "chunkstream/byte_sink.hpp"
#include "chunkstream/reporter.hpp"

namespace chunkstream {

// ============================================================================
// `ProducerConfig` struct
// ============================================================================
struct ProducerConfig {
  std::size_t read_buffer_bytes = 64 * 1024;   // file data read size
  /// Paths never archived, nor descended into (e.g. the destination when it
  /// lies inside the source). Matched by device and inode.
  std::vector<std::filesystem::path> exclude;
};

// ============================================================================
// `ArchiveProducer` class
// ============================================================================
class ArchiveProducer {
public:
  explicit ArchiveProducer(ProducerConfig cfg = {}, Reporter* reporter = nullptr);

  ArchiveProducer(const ArchiveProducer&) = delete;
  ArchiveProducer& operator=(const ArchiveProducer&) = delete;

  /// Stream `source` into `sink` and call sink.finish() after the tar
  /// trailer. Throws ReadError if the tree cannot be read (any unreadable
  /// or vanished file aborts the whole stream); exceptions thrown by the
  /// sink propagate unchanged. After a failure no trailer is written.
  void produce(const std::filesystem::path& source, ByteSink& sink);

  struct Stats {
    std::atomic<uint64_t> entries{0};
    std::atomic<uint64_t> files{0};
    std::atomic<uint64_t> dirs{0};
    std::atomic<uint64_t> symlinks{0};
    std::atomic<uint64_t> hardlinks{0};
    std::atomic<uint64_t> skipped{0};      // sockets, excluded paths
    std::atomic<uint64_t> file_bytes{0};   // regular file payload
  };
  const Stats& stats() const noexcept { return stats_; }

private:
  ProducerConfig cfg_;
  Reporter*      reporter_;
  Stats          stats_;
};

} // namespace chunkstream
