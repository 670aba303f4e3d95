// ============================================================================
// chunk_set.cpp -- implementation of ChunkSet and ChunkSetReader
// ============================================================================
#include "chunkstream/chunk_set.hpp"
#include "chunkstream/chunk_naming.hpp"
#include "chunkstream/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chunkstream {

// ============================================================================
// ChunkSet
// ============================================================================
ChunkSet ChunkSet::discover(const fs::path& dir, const std::string& name) {
  ChunkSet set;
  set.name_ = name;
  set.dir_  = dir;

  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto idx = parse_chunk_index(it->path().filename().string(), name);
    if (!idx) continue;
    std::error_code sec;
    if (!it->is_regular_file(sec)) continue;
    const auto size = it->file_size(sec);
    if (sec) {
      throw RestoreError("cannot stat " + it->path().string() + ": " +
                         sec.message());
    }
    set.files_.push_back(ChunkFile{*idx, it->path(), size});
  }
  if (ec) {
    throw RestoreError("cannot list " + dir.string() + ": " + ec.message());
  }

  std::sort(set.files_.begin(), set.files_.end(),
            [](const ChunkFile& a, const ChunkFile& b) {
              return a.index < b.index;
            });
  return set;
}

uint64_t ChunkSet::total_bytes() const noexcept {
  uint64_t total = 0;
  for (const auto& f : files_) total += f.size;
  return total;
}

void ChunkSet::validate(std::optional<uint64_t> chunk_bytes) const {
  if (files_.empty()) {
    throw RestoreError("no chunk files of '" + name_ + "' in " + dir_.string());
  }

  // Gaps and duplicates. Report every missing index up to a handful.
  std::vector<uint64_t> missing;
  uint64_t expect = 1;
  for (const auto& f : files_) {
    if (f.index == 0) {
      throw RestoreError("chunk set '" + name_ + "' has a file numbered 0 (" +
                         f.path.filename().string() + ")");
    }
    if (f.index < expect) {
      throw RestoreError("chunk set '" + name_ + "' has two files for chunk " +
                         std::to_string(f.index) + " (" + f.path.filename().string() +
                         ")");
    }
    for (; expect < f.index && missing.size() < 8; ++expect) missing.push_back(expect);
    expect = f.index + 1;
  }
  if (!missing.empty()) {
    std::string list;
    for (auto m : missing) {
      if (!list.empty()) list += ", ";
      list += chunk_file_name(name_, m);
    }
    throw RestoreError("chunk set '" + name_ + "' in " + dir_.string() +
                       " has a gap: missing " + list);
  }

  const uint64_t limit = chunk_bytes ? *chunk_bytes : files_.front().size;
  if (limit == 0) {
    throw RestoreError("chunk " + files_.front().path.string() + " is empty");
  }
  for (std::size_t i = 0; i + 1 < files_.size(); ++i) {
    if (files_[i].size != limit) {
      throw RestoreError("chunk " + files_[i].path.string() + " is " +
                         std::to_string(files_[i].size) + " bytes, expected " +
                         std::to_string(limit) + " (truncated or corrupt)");
    }
  }
  const auto& last = files_.back();
  if (last.size == 0 || last.size > limit) {
    throw RestoreError("last chunk " + last.path.string() + " is " +
                       std::to_string(last.size) + " bytes, expected 1.." +
                       std::to_string(limit));
  }
}

// ============================================================================
// ChunkSetReader
// ============================================================================
ChunkSetReader::ChunkSetReader(const ChunkSet& set) : set_(set) {}

ChunkSetReader::~ChunkSetReader() { close_current(); }

void ChunkSetReader::open_next() {
  const auto& f = set_.files()[next_];
  fd_ = ::open(f.path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    throw RestoreError(errno_message("cannot open " + f.path.string(), errno));
  }
  in_file_ = 0;
}

void ChunkSetReader::close_current() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

std::size_t ChunkSetReader::read(void* buf, std::size_t len) {
  if (len == 0) return 0;
  while (next_ < set_.files().size()) {
    if (fd_ < 0) open_next();
    const auto& f = set_.files()[next_];

    ssize_t n = ::read(fd_, buf, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw RestoreError(errno_message("cannot read " + f.path.string(), errno));
    }
    if (n > 0) {
      in_file_ += static_cast<uint64_t>(n);
      if (in_file_ > f.size) {
        throw RestoreError("chunk " + f.path.string() + " grew after discovery");
      }
      total_ += static_cast<uint64_t>(n);
      return static_cast<std::size_t>(n);
    }
    if (in_file_ != f.size) {
      throw RestoreError("chunk " + f.path.string() + " is " +
                         std::to_string(in_file_) + " bytes, expected " +
                         std::to_string(f.size));
    }
    close_current();
    ++next_;
  }
  return 0;
}

} // namespace chunkstream
