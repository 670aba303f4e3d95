// ============================================================================
// chunk_writer.cpp -- implementation of the ChunkWriter class
// ============================================================================
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <thread>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "chunkstream/chunk_naming.hpp"
#include "chunkstream/chunk_writer.hpp"
#include "chunkstream/errors.hpp"
#include "chunkstream/size_parse.hpp"

#ifndef CHUNKSTREAM_HAS_URING
  #define CHUNKSTREAM_HAS_URING 0
#endif

#if CHUNKSTREAM_HAS_URING
  #include <liburing.h>
#endif

namespace fs = std::filesystem;

namespace chunkstream {

// ============================================================================
// Impl: implementation of the ChunkWriter class
// ============================================================================
struct ChunkWriter::Impl {
  ChunkWriterConfig cfg;
  Reporter*         reporter;

  /// Thread draining a channel, and the error it ended with
  std::thread        th;
  StreamChannel*     channel{nullptr};
  std::exception_ptr thread_error;

  /// Statistics for the writer
  Stats              stats_;
  std::vector<ChunkInfo> done;

  /// Index of the open chunk (0 before the first one)
  uint64_t          chunk_idx{0};
  /// Bytes written to the open chunk
  uint64_t          chunk_bytes_written{0};
  bool              chunk_open{false};
  std::string       chunk_path_str;

  /// File descriptor of the open chunk (both backends)
  int               fd{-1};
  /// stdio stream over fd for the stdio backend
  std::FILE*        fp{nullptr};
  std::vector<char> stdio_buf;

  bool              use_uring{false};

#if CHUNKSTREAM_HAS_URING
  /// One submitted write; user_data is the slot index.
  struct Pending {
    const std::byte* data{nullptr};
    std::size_t      len{0};
    uint64_t         offset{0};
    int64_t          block{-1};     // channel block id, -1 = caller memory
    bool             busy{false};
  };
  io_uring             ring{};
  bool                 ring_ready{false};
  unsigned             inflight{0};
  std::vector<Pending> slots;
  std::vector<uint32_t> block_refs;  // outstanding writes per channel block
#endif

  Impl(ChunkWriterConfig c, Reporter* r)
  : cfg(std::move(c)), reporter(r) {
    use_uring = cfg.use_io_uring && CHUNKSTREAM_HAS_URING;
  }

  ~Impl() {
    abandon_chunk();
#if CHUNKSTREAM_HAS_URING
    if (ring_ready) io_uring_queue_exit(&ring);
#endif
  }

  void info(const std::string& m) { if (reporter) reporter->info(m); }
  void warn(const std::string& m) { if (reporter) reporter->warn(m); }

  [[noreturn]] void fail(const std::string& what, int err) {
    stats_.io_errors.fetch_add(1, std::memory_order_relaxed);
    throw WriteError(errno_message(what, err));
  }

  /// Ensure the output directory exists and holds no foreign chunks
  void prepare() {
    if (cfg.chunk_bytes == 0) {
      throw WriteError("ChunkWriter: chunk size must be positive");
    }
    std::error_code ec;
    fs::create_directories(cfg.output_dir, ec);
    if (ec) {
      stats_.io_errors.fetch_add(1, std::memory_order_relaxed);
      throw WriteError("failed to create output dir " + cfg.output_dir +
                       ": " + ec.message());
    }

    std::vector<fs::path> existing;
    for (fs::directory_iterator it(cfg.output_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
      if (parse_chunk_index(it->path().filename().string(), cfg.name)) {
        existing.push_back(it->path());
      }
    }
    if (ec) {
      throw WriteError("failed to list " + cfg.output_dir + ": " + ec.message());
    }
    if (existing.empty()) return;

    if (!cfg.overwrite) {
      throw WriteError(cfg.output_dir + " already holds " +
                       std::to_string(existing.size()) + " chunk file(s) of '" +
                       cfg.name + "'; refusing to mix chunk sets "
                       "(enable overwrite to replace them)");
    }
    warn("Removing " + std::to_string(existing.size()) +
         " chunk file(s) of a previous '" + cfg.name + "' backup in " +
         cfg.output_dir);
    for (const auto& p : existing) {
      if (!fs::remove(p, ec) || ec) {
        throw WriteError("failed to remove " + p.string() + ": " +
                         (ec ? ec.message() : std::string("not removed")));
      }
    }
  }

  /// Open the next chunk file. O_EXCL: never replace an existing file.
  void open_chunk() {
    const uint64_t idx = chunk_idx + 1;
    const auto path = chunk_path(cfg.output_dir, cfg.name, idx).string();

#if CHUNKSTREAM_HAS_URING
    if (use_uring && !ring_ready) {
      int rc = io_uring_queue_init(cfg.uring_qd ? cfg.uring_qd : 64, &ring, 0);
      if (rc < 0) fail("io_uring_queue_init", -rc);
      ring_ready = true;
      slots.assign(std::max(1u, cfg.max_inflight), Pending{});
      if (block_refs.empty()) block_refs.assign(StreamChannel::MAX_BLOCKS, 0);
    }
#endif

    fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) fail("failed to create chunk " + path, errno);

    if (!use_uring) {
      fp = ::fdopen(fd, "wb");
      if (!fp) {
        const int err = errno;
        ::close(fd);
        fd = -1;
        fail("fdopen " + path, err);
      }
      // The stdio buffer is local unflushed data too: keep it under a chunk.
      // Zero means unbuffered, not the libc default.
      const std::size_t n = static_cast<std::size_t>(
        std::min<uint64_t>(cfg.io_buffer_bytes, cfg.chunk_bytes));
      int rc;
      if (n > 0) {
        stdio_buf.resize(n);
        rc = std::setvbuf(fp, stdio_buf.data(), _IOFBF, stdio_buf.size());
      } else {
        rc = std::setvbuf(fp, nullptr, _IONBF, 0);
      }
      if (rc != 0) {
        std::fclose(fp);
        fp = nullptr;
        fd = -1;
        fail("setvbuf " + path, EINVAL);
      }
    }

    chunk_idx = idx;
    chunk_bytes_written = 0;
    chunk_open = true;
    chunk_path_str = path;
    stats_.chunks_opened.fetch_add(1, std::memory_order_relaxed);
    info("Writing " + path);
  }

  /// Flush, fsync and close the open chunk; every step is checked because
  /// network filesystems often report errors only at close.
  void close_chunk() {
    if (!chunk_open) return;
#if CHUNKSTREAM_HAS_URING
    if (use_uring) drain();
#endif
    if (fp) {
      if (std::fflush(fp) != 0) fail("failed to flush " + chunk_path_str, errno);
    }
    if (cfg.fsync_chunks && ::fsync(fd) != 0) {
      fail("failed to fsync " + chunk_path_str, errno);
    }
    int rc;
    if (fp) {
      rc = std::fclose(fp);
      fp = nullptr;
    } else {
      rc = ::close(fd);
    }
    fd = -1;
    chunk_open = false;
    if (rc != 0) fail("failed to close " + chunk_path_str, errno);

    done.push_back(ChunkInfo{chunk_idx, chunk_path_str, chunk_bytes_written});
    stats_.chunks_closed.fetch_add(1, std::memory_order_relaxed);
    info("Closed " + chunk_path_str + " (" + format_bytes(chunk_bytes_written) + ")");
  }

  /// Close the open chunk after a failure. The file is left as it is; its
  /// short size marks it on restore. Close errors are moot at this point.
  void abandon_chunk() noexcept {
#if CHUNKSTREAM_HAS_URING
    if (use_uring && ring_ready) {
      // The kernel may still read from channel blocks; wait it out.
      while (inflight > 0) {
        io_uring_cqe* cqe;
        if (io_uring_wait_cqe(&ring, &cqe) != 0) break;
        auto& s = slots[io_uring_cqe_get_data64(cqe)];
        s.busy = false;
        io_uring_cqe_seen(&ring, cqe);
        --inflight;
      }
    }
#endif
    if (fp) { std::fclose(fp); fp = nullptr; fd = -1; }
    if (fd >= 0) { ::close(fd); fd = -1; }
    chunk_open = false;
  }

  /// Write one piece that fits in the open chunk.
  void put(const std::byte* p, std::size_t n, int64_t block) {
    if (!use_uring) {
      (void)block;
      errno = 0;
      if (std::fwrite(p, 1, n, fp) != n) {
        fail("failed to write " + chunk_path_str, errno ? errno : EIO);
      }
      return;
    }
#if CHUNKSTREAM_HAS_URING
    uring_write(p, n, chunk_bytes_written, block);
#endif
  }

  /// Core chunking loop. `block` is the channel block holding `p`, or -1.
  void consume(const std::byte* p, std::size_t n, int64_t block) {
    while (n > 0) {
      if (!chunk_open) open_chunk();
      const uint64_t room = cfg.chunk_bytes - chunk_bytes_written;
      const std::size_t k = static_cast<std::size_t>(std::min<uint64_t>(n, room));
      put(p, k, block);
      chunk_bytes_written += k;
      stats_.bytes_written.fetch_add(k, std::memory_order_relaxed);
      p += k;
      n -= k;
      if (chunk_bytes_written == cfg.chunk_bytes) close_chunk();
    }
  }

#if CHUNKSTREAM_HAS_URING
  /// Enqueue a write; waits for a completion if queue/inflight are full.
  /// Writes from caller memory (block < 0) complete before returning.
  void uring_write(const std::byte* data, std::size_t len, uint64_t offset,
                   int64_t block) {
    for (;;) {
      if (inflight >= slots.size()) { reap_one(); continue; }

      io_uring_sqe* sqe = io_uring_get_sqe(&ring);
      if (!sqe) {
        stats_.uring_sq_full.fetch_add(1, std::memory_order_relaxed);
        io_uring_submit(&ring);
        reap_one();
        continue;
      }

      std::size_t slot = 0;
      while (slots[slot].busy) ++slot;
      slots[slot] = Pending{data, len, offset, block, true};

      io_uring_prep_write(sqe, fd, data, static_cast<unsigned>(len), offset);
      io_uring_sqe_set_data64(sqe, slot);
      int ret = io_uring_submit(&ring);
      if (ret < 0) {
        slots[slot].busy = false;
        fail("io_uring_submit " + chunk_path_str, -ret);
      }
      ++inflight;
      if (block >= 0) ++block_refs[static_cast<std::size_t>(block)];
      stats_.uring_submits.fetch_add(1, std::memory_order_relaxed);
      break;
    }
    if (block < 0) drain();
  }

  /// Wait for one completion; finish short writes synchronously.
  void reap_one() {
    io_uring_cqe* cqe;
    int rc = io_uring_wait_cqe(&ring, &cqe);
    if (rc < 0) fail("io_uring_wait_cqe " + chunk_path_str, -rc);
    Pending s = slots[io_uring_cqe_get_data64(cqe)];
    slots[io_uring_cqe_get_data64(cqe)].busy = false;
    const int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);
    --inflight;
    stats_.uring_completions.fetch_add(1, std::memory_order_relaxed);

    if (res < 0) fail("failed to write " + chunk_path_str, -res);
    std::size_t written = static_cast<std::size_t>(res);
    while (written < s.len) {
      ssize_t w = ::pwrite(fd, s.data + written, s.len - written,
                           static_cast<off_t>(s.offset + written));
      if (w < 0) {
        if (errno == EINTR) continue;
        fail("failed to write " + chunk_path_str, errno);
      }
      if (w == 0) fail("failed to write " + chunk_path_str, ENOSPC);
      written += static_cast<std::size_t>(w);
    }
    if (s.block >= 0) {
      auto& refs = block_refs[static_cast<std::size_t>(s.block)];
      if (--refs == 0 && channel) {
        channel->release(BlockDesc{static_cast<uint32_t>(s.block), 0, 0});
      }
    }
  }

  void drain() {
    while (inflight > 0) reap_one();
  }
#endif

  /// Main loop for the writer thread
  void loop() {
    try {
      BlockDesc d{};
      while (channel->next(d)) {
#if CHUNKSTREAM_HAS_URING
        if (use_uring) {
          // Hold a reference while consuming so a completion reaped at a
          // chunk boundary cannot hand the block back early.
          if (block_refs.empty()) block_refs.assign(StreamChannel::MAX_BLOCKS, 0);
          ++block_refs[d.id];
          consume(channel->data(d), d.len, d.id);
          if (--block_refs[d.id] == 0) channel->release(d);
          continue;
        }
#endif
        consume(channel->data(d), d.len, -1);
        channel->release(d);
      }
      close_chunk();
    } catch (const ChannelAborted&) {
      // The producer gave up; its error is the one the caller reports.
      abandon_chunk();
    } catch (const std::exception&) {
      thread_error = std::current_exception();
      channel->abort();
      abandon_chunk();
    }
  }
};

// ============================================================================
// `ChunkWriter` class
// ============================================================================
ChunkWriter::ChunkWriter(ChunkWriterConfig cfg, Reporter* reporter)
: impl_(std::make_unique<Impl>(std::move(cfg), reporter)) {}

ChunkWriter::~ChunkWriter() {
  // Never leave the thread running on a channel that is about to go away.
  if (impl_ && impl_->th.joinable()) {
    impl_->channel->abort();
    impl_->th.join();
  }
}

void ChunkWriter::prepare() { impl_->prepare(); }

void ChunkWriter::write(const void* data, std::size_t len) {
  try {
    impl_->consume(static_cast<const std::byte*>(data), len, -1);
  } catch (const WriteError&) {
    impl_->abandon_chunk();
    throw;
  }
}

void ChunkWriter::finish() {
  try {
    impl_->close_chunk();
  } catch (const WriteError&) {
    impl_->abandon_chunk();
    throw;
  }
}

void ChunkWriter::start(StreamChannel& channel) {
  if (impl_->th.joinable()) {
    throw std::logic_error("ChunkWriter: already started");
  }
  impl_->channel = &channel;
  impl_->th = std::thread([this]{ impl_->loop(); });
}

void ChunkWriter::join() {
  if (impl_->th.joinable()) impl_->th.join();
  if (impl_->thread_error) {
    auto e = impl_->thread_error;
    impl_->thread_error = nullptr;
    std::rethrow_exception(e);
  }
}

const std::vector<ChunkInfo>& ChunkWriter::chunks() const noexcept {
  return impl_->done;
}

uint64_t ChunkWriter::bytes_written() const noexcept {
  return impl_->stats_.bytes_written.load(std::memory_order_relaxed);
}

const ChunkWriter::Stats& ChunkWriter::stats() const noexcept {
  return impl_->stats_;
}

} // namespace chunkstream
