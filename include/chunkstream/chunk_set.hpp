// ============================================================================
// chunk_set.hpp -- Discovery, validation and sequential reading of a chunk set
//
// A ChunkSet is the list of "<name>.tar.part_<N>" files found in one
// directory, sorted by numeric index. validate() checks the properties that
// make the concatenation trustworthy before anything reads it:
//
// - indices are unique and contiguous from 1 (a gap means a lost chunk),
// - every chunk but the last has exactly the chunk size,
// - the last chunk is non-empty and not larger than the chunk size.
//
// ChunkSetReader then reads the files back to back as one stream and
// re-checks each file's size as it goes, catching files that changed after
// discovery.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunkstream {

struct ChunkFile {
  uint64_t              index{0};
  std::filesystem::path path;
  uint64_t              size{0};
};

// ============================================================================
// `ChunkSet` class
// ============================================================================
class ChunkSet {
public:
  /// List the chunks of `name` in `dir`, sorted by index. Throws
  /// RestoreError if the directory cannot be read. The result may be empty.
  static ChunkSet discover(const std::filesystem::path& dir,
                           const std::string& name);

  /// Throws RestoreError describing the first problem found. When
  /// `chunk_bytes` is not given the size of chunk 1 is taken as the limit.
  void validate(std::optional<uint64_t> chunk_bytes = std::nullopt) const;

  const std::string&             name()  const noexcept { return name_; }
  const std::filesystem::path&   dir()   const noexcept { return dir_; }
  const std::vector<ChunkFile>&  files() const noexcept { return files_; }
  bool                           empty() const noexcept { return files_.empty(); }
  uint64_t                       total_bytes() const noexcept;

private:
  std::string            name_;
  std::filesystem::path  dir_;
  std::vector<ChunkFile> files_;
};

// ============================================================================
// `ChunkSetReader` class
// Reads the chunk files of a validated set in index order as one stream.
// ============================================================================
class ChunkSetReader {
public:
  explicit ChunkSetReader(const ChunkSet& set);
  ~ChunkSetReader();

  ChunkSetReader(const ChunkSetReader&) = delete;
  ChunkSetReader& operator=(const ChunkSetReader&) = delete;

  /// Read up to `len` bytes; returns 0 at the end of the last chunk.
  /// Throws RestoreError if a chunk cannot be read or its size differs
  /// from the size seen at discovery.
  std::size_t read(void* buf, std::size_t len);

  uint64_t bytes_read() const noexcept { return total_; }

  /// Chunks fully consumed so far.
  std::size_t chunks_done() const noexcept { return next_; }

private:
  void open_next();
  void close_current();

  const ChunkSet& set_;
  std::size_t     next_{0};       // index into set_.files() of the open file
  int             fd_{-1};
  uint64_t        in_file_{0};    // bytes read from the open file
  uint64_t        total_{0};
};

} // namespace chunkstream
