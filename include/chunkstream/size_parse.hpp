// ============================================================================
// size_parse.hpp -- Human-readable byte counts ("5G", "512MiB", "10GB")
// ============================================================================
#pragma once
#include <cstdint>
#include <string>

namespace chunkstream {

/// Parse a byte count with an optional suffix.
///
///   (none), B          bytes
///   K M G T P E        powers of 1024 (also KiB ... EiB)
///   KB MB GB TB PB EB  powers of 1000
///
/// Suffixes are case-insensitive. Throws ConfigError on anything that is not
/// a positive integer count fitting in 64 bits.
uint64_t parse_size(const std::string& text);

/// Format bytes with binary units, e.g. "1.50GiB". Used for log lines.
std::string format_bytes(uint64_t bytes);

} // namespace chunkstream
