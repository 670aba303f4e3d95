// ============================================================================
// chunk_naming.hpp -- On-disk names of chunk files
//
//   DEST_BASE/<name>/<name>.tar.part_<NNNNNN>
//
// NNNNNN is the 1-based chunk index, zero-padded to CHUNK_INDEX_WIDTH so a
// shell glob lists the set in stream order. Readers accept any width (sets
// written by older tools used 3 digits) and compare indices numerically.
// ============================================================================
#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chunkstream {

constexpr unsigned CHUNK_INDEX_WIDTH = 6;
constexpr uint64_t MAX_CHUNK_INDEX   = 999999;

/// "<name>.tar.part_" -- everything before the index digits.
std::string chunk_prefix(const std::string& name);

/// File name of chunk `index` of set `name`. Throws WriteError if the index
/// is 0 or does not fit in CHUNK_INDEX_WIDTH digits.
std::string chunk_file_name(const std::string& name, uint64_t index);

/// `dir / chunk_file_name(name, index)`.
std::filesystem::path chunk_path(const std::filesystem::path& dir,
                                 const std::string& name, uint64_t index);

/// Index of `filename` if it is a chunk of set `name`, of any padding width.
std::optional<uint64_t> parse_chunk_index(const std::string& filename,
                                          const std::string& name);

/// Short name of a source path: its last component, ignoring trailing
/// separators. Empty for "/".
std::string source_short_name(const std::filesystem::path& source);

} // namespace chunkstream
