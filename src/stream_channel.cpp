// ============================================================================
// stream_channel.cpp -- implementation of StreamChannel
// ============================================================================
#include "chunkstream/stream_channel.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

namespace chunkstream {

namespace {

// BlockDesc::len is 32 bits.
constexpr std::size_t MAX_BLOCK_BYTES = std::size_t(1) << 30;

/// Yield a few times, then sleep. The writer may stall for seconds on a
/// slow mount.
struct Backoff {
  unsigned spins = 0;
  void pause() {
    ++spins;
    if (spins < 64) {
      std::this_thread::yield();
    } else {
      std::this_thread::sleep_for(std::chrono::microseconds(
        spins < 1024 ? 50 : 500));
    }
  }
};

} // namespace

ChannelConfig ChannelConfig::bounded_by(uint64_t limit) const {
  ChannelConfig out = *this;
  if (out.blocks == 0) out.blocks = 1;
  if (out.blocks > StreamChannel::MAX_BLOCKS) out.blocks = StreamChannel::MAX_BLOCKS;
  if (out.block_bytes == 0) out.block_bytes = 1;
  if (out.block_bytes > MAX_BLOCK_BYTES) out.block_bytes = MAX_BLOCK_BYTES;
  if (limit == 0) return out;

  if (uint64_t(out.blocks) * out.block_bytes > limit) {
    if (limit < out.blocks) {
      out.blocks = static_cast<uint32_t>(limit);
      out.block_bytes = 1;
    } else {
      out.block_bytes = std::min<uint64_t>(out.block_bytes, limit / out.blocks);
    }
  }
  return out;
}

StreamChannel::StreamChannel(ChannelConfig cfg)
  : pool_(std::min<uint32_t>(std::max<uint32_t>(cfg.blocks, 1u), MAX_BLOCKS),
          std::min(cfg.block_bytes, MAX_BLOCK_BYTES)) {
  for (uint32_t i = 0; i < pool_.size(); ++i) {
    free_q_.push(i);
  }
}

void StreamChannel::acquire_block() {
  Backoff backoff;
  uint32_t id = 0;
  while (!free_q_.pop(id)) {
    if (aborted()) throw ChannelAborted();
    stats_.producer_waits.fetch_add(1, std::memory_order_relaxed);
    backoff.pause();
  }
  cur_ = BlockDesc{id, 0, seq_++};
  have_block_ = true;
}

void StreamChannel::publish_block() {
  // data_q_ has a slot for every block in the pool, so this cannot fail.
  data_q_.push(cur_);
  have_block_ = false;
}

void StreamChannel::write(const void* data, std::size_t len) {
  const auto* src = static_cast<const std::byte*>(data);
  const std::size_t bb = pool_.block_bytes();
  while (len > 0) {
    if (aborted()) throw ChannelAborted();
    if (!have_block_) acquire_block();

    const std::size_t n = std::min<std::size_t>(len, bb - cur_.len);
    std::memcpy(pool_.data(cur_.id) + cur_.len, src, n);
    cur_.len += static_cast<uint32_t>(n);
    src += n;
    len -= n;
    bytes_in_.fetch_add(n, std::memory_order_relaxed);

    if (cur_.len == bb) publish_block();
  }
}

void StreamChannel::finish() {
  if (aborted()) throw ChannelAborted();
  if (have_block_) {
    if (cur_.len > 0) {
      publish_block();
    } else {
      // Only the writer pushes to free_q_; an unused last block is simply
      // dropped since the stream is over.
      have_block_ = false;
    }
  }
  closed_.store(true, std::memory_order_release);
}

bool StreamChannel::next(BlockDesc& out) {
  Backoff backoff;
  for (;;) {
    if (aborted()) throw ChannelAborted();
    if (data_q_.pop(out)) return true;
    // closed_ is stored after the last push, so one more pop settles it.
    if (closed_.load(std::memory_order_acquire)) {
      return data_q_.pop(out);
    }
    stats_.consumer_waits.fetch_add(1, std::memory_order_relaxed);
    backoff.pause();
  }
}

void StreamChannel::release(const BlockDesc& d) noexcept {
  free_q_.push(d.id);
}

} // namespace chunkstream
