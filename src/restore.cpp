// ============================================================================
// restore.cpp -- implementation of RestoreReconstructor
// ============================================================================
#include "chunkstream/restore.hpp"
#include "chunkstream/errors.hpp"
#include "chunkstream/size_parse.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <exception>
#include <memory>
#include <utility>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chunkstream {

namespace {

using ArchivePtr = std::unique_ptr<struct archive, int (*)(struct archive*)>;

/// libarchive read source over a ChunkSetReader.
struct ReadContext {
  ChunkSetReader*    reader{nullptr};
  std::vector<char>  buffer;
  std::exception_ptr error;      // what the reader threw
};

la_ssize_t callback_read(struct archive* a, void* self, const void** out) {
  auto* ctx = static_cast<ReadContext*>(self);
  *out = ctx->buffer.data();
  try {
    return static_cast<la_ssize_t>(
      ctx->reader->read(ctx->buffer.data(), ctx->buffer.size()));
  } catch (const std::exception& err) {
    ctx->error = std::current_exception();
    archive_set_error(a, EIO, "chunk source threw exception: %s", err.what());
    return -1;
  }
}

/// Opens a tar reader over the chunk set and converts its failures.
class TarReader {
public:
  TarReader(ChunkSetReader& reader, std::size_t buffer_bytes)
  : archive_(archive_read_new(), archive_read_free) {
    if (!archive_) throw RestoreError("failed to initialize libarchive reader");
    ctx_.reader = &reader;
    ctx_.buffer.resize(buffer_bytes ? buffer_bytes : 64 * 1024);
    archive_read_support_format_tar(archive_.get());
    check(archive_read_open(archive_.get(), &ctx_, nullptr, callback_read, nullptr),
          "failed to open archive stream");
  }

  struct archive* get() const noexcept { return archive_.get(); }

  /// Returns false at the end of the archive.
  bool next(struct archive_entry** entry, Reporter* reporter) {
    int r = archive_read_next_header(archive_.get(), entry);
    if (r == ARCHIVE_EOF) return false;
    if (r == ARCHIVE_WARN) {
      if (reporter) reporter->warn(message());
      return true;
    }
    check(r, "cannot read archive header");
    return true;
  }

  void check(int r, const std::string& what) {
    if (r == ARCHIVE_OK || r == ARCHIVE_EOF) return;
    if (ctx_.error) std::rethrow_exception(ctx_.error);
    throw RestoreError(what + ": " + message());
  }

  void close() { check(archive_read_close(archive_.get()), "failed to close archive"); }

private:
  std::string message() const {
    const char* s = archive_error_string(archive_.get());
    return s ? s : "unknown libarchive error";
  }

  ArchivePtr  archive_;
  ReadContext ctx_;
};

/// Read what the tar reader left (record padding) so every chunk is
/// size-checked to its end.
void drain(ChunkSetReader& reader) {
  std::vector<char> buf(64 * 1024);
  while (reader.read(buf.data(), buf.size()) > 0) {}
}

} // namespace

RestoreReconstructor::RestoreReconstructor(fs::path set_dir, std::string name,
                                           RestoreOptions opts,
                                           Reporter* reporter)
  : set_dir_(std::move(set_dir)),
    name_(std::move(name)),
    opts_(std::move(opts)),
    reporter_(reporter) {}

const ChunkSet& RestoreReconstructor::load() {
  if (!set_) {
    ChunkSet set = ChunkSet::discover(set_dir_, name_);
    set.validate(opts_.chunk_bytes);
    if (reporter_) {
      reporter_->info("Found " + std::to_string(set.files().size()) +
                      " chunk(s) of '" + name_ + "' in " + set_dir_.string() +
                      " (" + format_bytes(set.total_bytes()) + ")");
    }
    set_ = std::move(set);
  }
  return *set_;
}

RestoreSummary RestoreReconstructor::restore(const fs::path& target_dir) {
  const ChunkSet& set = load();

  std::error_code ec;
  fs::create_directories(target_dir, ec);
  if (ec) {
    throw RestoreError("cannot create " + target_dir.string() + ": " + ec.message());
  }
  // Symlink checks apply to the whole path, the target's own parents included.
  const fs::path root = fs::canonical(target_dir, ec);
  if (ec) {
    throw RestoreError("cannot resolve " + target_dir.string() + ": " + ec.message());
  }

  const bool owner = opts_.preserve_owner ? *opts_.preserve_owner
                                          : (::geteuid() == 0);
  int flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_ACL |
              ARCHIVE_EXTRACT_XATTR | ARCHIVE_EXTRACT_FFLAGS |
              ARCHIVE_EXTRACT_SECURE_SYMLINKS | ARCHIVE_EXTRACT_SECURE_NODOTDOT;
  if (owner) flags |= ARCHIVE_EXTRACT_OWNER;

  ArchivePtr disk(archive_write_disk_new(), archive_write_free);
  if (!disk) throw RestoreError("failed to initialize libarchive disk writer");
  archive_write_disk_set_options(disk.get(), flags);
  archive_write_disk_set_standard_lookup(disk.get());

  auto disk_error = [&](const std::string& what) {
    const char* s = archive_error_string(disk.get());
    return RestoreError(what + ": " + (s ? s : "unknown libarchive error"));
  };

  ChunkSetReader reader(set);
  TarReader tar(reader, opts_.read_buffer_bytes);
  const std::string prefix = root.string();

  RestoreSummary sum;
  struct archive_entry* entry = nullptr;
  while (tar.next(&entry, reporter_)) {
    const std::string name = archive_entry_pathname(entry);
    archive_entry_copy_pathname(entry, (prefix + "/" + name).c_str());

    // Hard link targets are member names too.
    if (const char* target = archive_entry_hardlink(entry)) {
      archive_entry_copy_hardlink(entry, (prefix + "/" + target).c_str());
    }

    int r = archive_read_extract2(tar.get(), entry, disk.get());
    if (r == ARCHIVE_WARN) {
      if (reporter_) {
        const char* s = archive_error_string(tar.get());
        reporter_->warn(name + ": " + (s ? s : "warning"));
      }
    } else if (r != ARCHIVE_OK) {
      tar.check(r, "cannot extract " + name);
    }
    ++sum.entries;
  }
  tar.close();
  drain(reader);

  // Directory modes and times are applied on close.
  if (archive_write_close(disk.get()) != ARCHIVE_OK) {
    throw disk_error("cannot finish extraction into " + prefix);
  }

  sum.chunks       = reader.chunks_done();
  sum.stream_bytes = reader.bytes_read();
  if (reporter_) {
    reporter_->info("Restored " + std::to_string(sum.entries) + " entries of '" +
                    name_ + "' into " + prefix);
  }
  return sum;
}

RestoreSummary RestoreReconstructor::verify() {
  const ChunkSet& set = load();

  ChunkSetReader reader(set);
  TarReader tar(reader, opts_.read_buffer_bytes);

  RestoreSummary sum;
  struct archive_entry* entry = nullptr;
  std::vector<char> buf(64 * 1024);
  while (tar.next(&entry, reporter_)) {
    // Read member data so truncation inside a file is caught too.
    for (;;) {
      la_ssize_t n = archive_read_data(tar.get(), buf.data(), buf.size());
      if (n == 0) break;
      if (n < 0) {
        tar.check(static_cast<int>(n),
                  std::string("cannot read member ") + archive_entry_pathname(entry));
        break;
      }
    }
    ++sum.entries;
  }
  tar.close();
  drain(reader);

  sum.chunks       = reader.chunks_done();
  sum.stream_bytes = reader.bytes_read();
  if (reporter_) {
    reporter_->info("Verified '" + name_ + "': " + std::to_string(sum.chunks) +
                    " chunk(s), " + std::to_string(sum.entries) + " entries");
  }
  return sum;
}

RestoreSummary RestoreReconstructor::concatenate(ByteSink& out) {
  const ChunkSet& set = load();

  ChunkSetReader reader(set);
  std::vector<char> buf(opts_.read_buffer_bytes ? opts_.read_buffer_bytes : 64 * 1024);
  for (;;) {
    const std::size_t n = reader.read(buf.data(), buf.size());
    if (n == 0) break;
    out.write(buf.data(), n);
  }
  out.finish();

  RestoreSummary sum;
  sum.chunks       = reader.chunks_done();
  sum.stream_bytes = reader.bytes_read();
  return sum;
}

} // namespace chunkstream
