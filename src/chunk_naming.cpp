// ============================================================================
// chunk_naming.cpp -- implementation of chunk file naming
// ============================================================================
#include "chunkstream/chunk_naming.hpp"
#include "chunkstream/errors.hpp"

#include <cctype>
#include <cstdio>
#include <limits>

namespace fs = std::filesystem;

namespace chunkstream {

std::string chunk_prefix(const std::string& name) {
  return name + ".tar.part_";
}

std::string chunk_file_name(const std::string& name, uint64_t index) {
  if (index == 0 || index > MAX_CHUNK_INDEX) {
    throw WriteError("chunk index " + std::to_string(index) + " of '" + name +
                     "' does not fit in " + std::to_string(CHUNK_INDEX_WIDTH) +
                     " digits; use a larger chunk size");
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%0*llu", static_cast<int>(CHUNK_INDEX_WIDTH),
                static_cast<unsigned long long>(index));
  return chunk_prefix(name) + buf;
}

fs::path chunk_path(const fs::path& dir, const std::string& name,
                    uint64_t index) {
  return dir / chunk_file_name(name, index);
}

std::optional<uint64_t> parse_chunk_index(const std::string& filename,
                                          const std::string& name) {
  const std::string prefix = chunk_prefix(name);
  if (filename.size() <= prefix.size()) return std::nullopt;
  if (filename.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

  uint64_t value = 0;
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  for (std::size_t i = prefix.size(); i < filename.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(filename[i]);
    if (!std::isdigit(c)) return std::nullopt;
    const uint64_t d = c - '0';
    if (value > (kMax - d) / 10) return std::nullopt;
    value = value * 10 + d;
  }
  return value;
}

std::string source_short_name(const fs::path& source) {
  fs::path p = source.lexically_normal();
  if (!p.has_filename()) p = p.parent_path();   // "/data/" -> "/data"
  if (p == p.root_path()) return {};
  return p.filename().string();
}

} // namespace chunkstream
