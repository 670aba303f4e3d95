// ============================================================================
// restore.hpp -- Restore Reconstructor for chunkstream
//
// Inverse of the chunk writer: finds the chunk set of one source in its
// destination directory, validates it, and streams the concatenation
//
// - into libarchive's disk writer under a target directory (restore),
// - through the tar reader without writing anything (verify), or
// - unchanged into a ByteSink, e.g. stdout for `| tar -xpf -` (concatenate).
//
// Validation always runs first, so a gap or a size mismatch fails before a
// single file is extracted.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "chunkstream/byte_sink.hpp"
#include "chunkstream/chunk_set.hpp"
#include "chunkstream/reporter.hpp"

namespace chunkstream {

// ============================================================================
// `RestoreOptions` struct
// ============================================================================
struct RestoreOptions {
  /// Chunk size the set was written with; the first chunk's size if unset.
  std::optional<uint64_t> chunk_bytes;
  /// Restore uid/gid. Defaults to true when running as root.
  std::optional<bool>     preserve_owner;
  std::size_t             read_buffer_bytes = 64 * 1024;
};

// ============================================================================
// `RestoreSummary` struct
// ============================================================================
struct RestoreSummary {
  uint64_t chunks{0};
  uint64_t stream_bytes{0};
  uint64_t entries{0};      // archive members (restore/verify only)
};

// ============================================================================
// `RestoreReconstructor` class
// ============================================================================
class RestoreReconstructor {
public:
  /// @param set_dir  Directory holding the chunks (DEST_BASE/<name>).
  /// @param name     Chunk set name (the source's short name).
  RestoreReconstructor(std::filesystem::path set_dir, std::string name,
                       RestoreOptions opts = {}, Reporter* reporter = nullptr);

  /// Discover and validate the chunk set. Throws RestoreError.
  const ChunkSet& load();

  /// Extract the archive under `target_dir` (created if needed).
  RestoreSummary restore(const std::filesystem::path& target_dir);

  /// Read the whole archive, checking every header and member.
  RestoreSummary verify();

  /// Write the reconstructed stream to `out`, then out.finish().
  RestoreSummary concatenate(ByteSink& out);

private:
  std::filesystem::path   set_dir_;
  std::string             name_;
  RestoreOptions          opts_;
  Reporter*               reporter_;
  std::optional<ChunkSet> set_;
};

} // namespace chunkstream
