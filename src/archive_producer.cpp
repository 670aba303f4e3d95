// ============================================================================
// archive_producer.cpp -- implementation of ArchiveProducer
// ============================================================================
#include "chunkstream/archive_producer.hpp"
#include "chunkstream/errors.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <exception>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace chunkstream {

namespace {

using ArchivePtr  = std::unique_ptr<struct archive, int (*)(struct archive*)>;
using EntryPtr    = std::unique_ptr<struct archive_entry, void (*)(struct archive_entry*)>;
using ResolverPtr = std::unique_ptr<struct archive_entry_linkresolver,
                                    void (*)(struct archive_entry_linkresolver*)>;

/// State shared with libarchive's write callback.
struct WriteContext {
  ByteSink*          sink{nullptr};
  std::exception_ptr error;       // what the sink threw
  bool               stopped{false};
};

la_ssize_t callback_write(struct archive* a, void* self, const void* buffer,
                          size_t length) {
  auto* ctx = static_cast<WriteContext*>(self);
  // After a failure libarchive still flushes the trailer on free; keep it
  // out of the stream so a broken archive never looks complete.
  if (ctx->stopped) {
    archive_set_error(a, ECANCELED, "stream stopped");
    return -1;
  }
  try {
    ctx->sink->write(buffer, length);
  } catch (const std::exception& err) {
    ctx->error = std::current_exception();
    ctx->stopped = true;
    archive_set_error(a, EIO, "sink threw exception: %s", err.what());
    return -1;
  }
  return static_cast<la_ssize_t>(length);
}

/// Where an entry lives, for messages. libarchive may only know the bare
/// name of an entry it failed on.
std::string entry_location(const fs::path& source, const char* src_path) {
  if (!src_path || !*src_path) return source.string();
  if (src_path[0] == '/') return src_path;
  return std::string(src_path) + " (in " + source.string() + ")";
}

std::string archive_message(struct archive* a) {
  const char* s = archive_error_string(a);
  return s ? s : "unknown libarchive error";
}

} // namespace

ArchiveProducer::ArchiveProducer(ProducerConfig cfg, Reporter* reporter)
  : cfg_(std::move(cfg)), reporter_(reporter) {
  if (cfg_.read_buffer_bytes == 0) cfg_.read_buffer_bytes = 64 * 1024;
}

void ArchiveProducer::produce(const fs::path& source, ByteSink& sink) {
  WriteContext ctx;
  ctx.sink = &sink;

  // Rethrow whatever the sink raised in preference to libarchive's summary.
  auto fail_write = [&](struct archive* a, const std::string& what) {
    ctx.stopped = true;
    if (ctx.error) std::rethrow_exception(ctx.error);
    throw ReadError(what + ": " + archive_message(a));
  };

  std::set<std::pair<dev_t, ino_t>> excluded;
  for (const auto& p : cfg_.exclude) {
    struct stat st;
    if (::stat(p.c_str(), &st) == 0) excluded.emplace(st.st_dev, st.st_ino);
  }

  ArchivePtr out(archive_write_new(), archive_write_free);
  if (!out) throw ReadError("failed to initialize libarchive writer");
  if (archive_write_set_format_pax_restricted(out.get()) != ARCHIVE_OK) {
    throw ReadError("failed to select tar format: " + archive_message(out.get()));
  }

  ArchivePtr disk(archive_read_disk_new(), archive_read_free);
  if (!disk) throw ReadError("failed to initialize libarchive disk reader");
  archive_read_disk_set_standard_lookup(disk.get());
  archive_read_disk_set_symlink_physical(disk.get());

  ResolverPtr links(archive_entry_linkresolver_new(),
                    archive_entry_linkresolver_free);
  if (!links) throw ReadError("failed to initialize hard link resolver");
  archive_entry_linkresolver_set_strategy(links.get(), archive_format(out.get()));

  try {
    if (archive_write_open(out.get(), &ctx, nullptr, callback_write, nullptr)
        != ARCHIVE_OK) {
      fail_write(out.get(), "failed to open archive stream");
    }
    if (archive_read_disk_open(disk.get(), source.c_str()) != ARCHIVE_OK) {
      throw ReadError("cannot read " + source.string() + ": " +
                      archive_message(disk.get()));
    }

    std::vector<char> buf(cfg_.read_buffer_bytes);
    for (;;) {
      EntryPtr entry(archive_entry_new(), archive_entry_free);
      int r = archive_read_next_header2(disk.get(), entry.get());
      if (r == ARCHIVE_EOF) break;
      const char* src_path = archive_entry_sourcepath(entry.get());
      const std::string where = entry_location(source, src_path);
      if (r == ARCHIVE_WARN) {
        if (reporter_) reporter_->warn(where + ": " + archive_message(disk.get()));
      } else if (r != ARCHIVE_OK) {
        throw ReadError("cannot read " + where + ": " +
                        archive_message(disk.get()));
      }

      const auto key = std::make_pair(archive_entry_dev(entry.get()),
                                      archive_entry_ino(entry.get()));
      if (excluded.count(key)) {
        stats_.skipped.fetch_add(1, std::memory_order_relaxed);
        if (reporter_) reporter_->info("Excluding " + where);
        continue;
      }
      archive_read_disk_descend(disk.get());

      const auto type = archive_entry_filetype(entry.get());
      if (type == AE_IFSOCK) {
        stats_.skipped.fetch_add(1, std::memory_order_relaxed);
        if (reporter_) reporter_->warn(where + ": socket ignored");
        continue;
      }

      std::string name = archive_entry_pathname(entry.get());
      const auto first = name.find_first_not_of('/');
      if (first == std::string::npos) continue;   // the root itself
      archive_entry_copy_pathname(entry.get(), name.c_str() + first);

      struct archive_entry* e = entry.get();
      struct archive_entry* spare = nullptr;
      archive_entry_linkify(links.get(), &e, &spare);
      // tar strategies never defer entries
      if (spare) archive_entry_free(spare);
      if (!e) continue;

      r = archive_write_header(out.get(), e);
      if (r == ARCHIVE_WARN) {
        if (reporter_) reporter_->warn(where + ": " + archive_message(out.get()));
      } else if (r != ARCHIVE_OK) {
        fail_write(out.get(), "cannot archive " + where);
      }

      stats_.entries.fetch_add(1, std::memory_order_relaxed);
      if (archive_entry_hardlink(e)) {
        stats_.hardlinks.fetch_add(1, std::memory_order_relaxed);
      } else if (type == AE_IFDIR) {
        stats_.dirs.fetch_add(1, std::memory_order_relaxed);
      } else if (type == AE_IFLNK) {
        stats_.symlinks.fetch_add(1, std::memory_order_relaxed);
      } else if (type == AE_IFREG) {
        stats_.files.fetch_add(1, std::memory_order_relaxed);
      }

      const la_int64_t size = archive_entry_size(e);
      if (type == AE_IFREG && size > 0 && !archive_entry_hardlink(e)) {
        la_int64_t total = 0;
        for (;;) {
          la_ssize_t n = archive_read_data(disk.get(), buf.data(), buf.size());
          if (n < 0) {
            throw ReadError("cannot read " + where + ": " +
                            archive_message(disk.get()));
          }
          if (n == 0) break;
          la_ssize_t want = n;
          if (total + n > size) {
            want = static_cast<la_ssize_t>(size - total);
          }
          if (want > 0) {
            la_ssize_t w = archive_write_data(out.get(), buf.data(),
                                              static_cast<size_t>(want));
            if (w < 0) fail_write(out.get(), "cannot archive " + where);
          }
          total += n;
        }
        if (total < size) {
          throw ReadError(where + ": file shrank while being archived (" +
                          std::to_string(total) + " of " +
                          std::to_string(size) + " bytes)");
        }
        if (total > size && reporter_) {
          reporter_->warn(where + ": file grew while being archived; kept the first " +
                          std::to_string(size) + " bytes");
        }
        stats_.file_bytes.fetch_add(static_cast<uint64_t>(size),
                                    std::memory_order_relaxed);
      }

      if (archive_write_finish_entry(out.get()) != ARCHIVE_OK) {
        fail_write(out.get(), "cannot archive " + where);
      }
    }

    if (archive_write_close(out.get()) != ARCHIVE_OK) {
      fail_write(out.get(), "failed to finish archive stream");
    }
  } catch (...) {
    ctx.stopped = true;
    throw;
  }

  sink.finish();
}

} // namespace chunkstream
