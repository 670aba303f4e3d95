// ============================================================================
// errors.hpp -- Error taxonomy for chunkstream
//
// Every failure the core can raise derives from std::runtime_error. The
// pipeline coordinator catches the per-source kinds (ReadError, WriteError,
// PermissionError) and records them in that source's RunResult; ConfigError
// and a PermissionError on the destination abort the run before any I/O.
// ============================================================================
#pragma once
#include <stdexcept>
#include <string>

namespace chunkstream {

/// Bad chunk size, empty source list, missing destination, bad config file.
struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Required access to a source or the destination is not available.
struct PermissionError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// A source file became unreadable or vanished mid-stream.
struct ReadError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Destination unwritable, full or gone.
struct WriteError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Chunk set has a gap, a duplicate, a size mismatch, or does not unpack.
struct RestoreError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Format "<what>: <strerror(err)>".
std::string errno_message(const std::string& what, int err);

} // namespace chunkstream
