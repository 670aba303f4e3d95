// ============================================================================
// stream_channel.hpp -- Bounded byte channel between pipeline threads
//
// The producer thread writes the archive stream into the channel as a
// ByteSink; the chunk writer thread drains it block by block. Storage is a
// BlockPool plus two SPSC rings:
//
//   free ring  : writer -> producer, ids of blocks ready for reuse
//   data ring  : producer -> writer, descriptors of filled blocks
//
// A full channel blocks the producer (backpressure), an empty channel
// blocks the writer. Either side may abort(), which wakes the other with
// ChannelAborted. Bytes leave the channel in exactly the order they entered.
// ============================================================================
#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

#include "chunkstream/block_pool.hpp"
#include "chunkstream/byte_sink.hpp"
#include "chunkstream/spsc_ring.hpp"

namespace chunkstream {

/// Raised on either side of an aborted channel.
struct ChannelAborted : std::runtime_error {
  ChannelAborted() : std::runtime_error("stream channel aborted") {}
};

// ============================================================================
// `ChannelConfig` struct
// ============================================================================
struct ChannelConfig {
  std::size_t block_bytes = 1024 * 1024;
  uint32_t    blocks      = 32;

  /// Shrink the geometry so the whole pool holds at most `limit` bytes
  /// (the chunk size): the local buffer never exceeds one chunk.
  ChannelConfig bounded_by(uint64_t limit) const;
};

// ============================================================================
// `StreamChannel` class
// ============================================================================
class StreamChannel : public ByteSink {
public:
  static constexpr std::size_t RING_SLOTS = 256;
  static constexpr uint32_t    MAX_BLOCKS = RING_SLOTS;

  explicit StreamChannel(ChannelConfig cfg);

  StreamChannel(const StreamChannel&) = delete;
  StreamChannel& operator=(const StreamChannel&) = delete;

  // ---- producer side ------------------------------------------------------

  /// Copy bytes into blocks, publishing each block as it fills.
  /// Blocks while no free block is available. Throws ChannelAborted.
  void write(const void* data, std::size_t len) override;

  /// Publish the partially filled block (if any) and mark end of stream.
  void finish() override;

  // ---- consumer side ------------------------------------------------------

  /// Wait for the next filled block. Returns false at end of stream.
  /// Throws ChannelAborted.
  bool next(BlockDesc& out);

  /// Bytes of a block obtained from next().
  const std::byte* data(const BlockDesc& d) const noexcept {
    return pool_.data(d.id);
  }

  /// Hand a block back to the producer.
  void release(const BlockDesc& d) noexcept;

  // ---- either side --------------------------------------------------------

  void abort() noexcept { aborted_.store(true, std::memory_order_release); }
  bool aborted() const noexcept {
    return aborted_.load(std::memory_order_acquire);
  }

  std::size_t capacity_bytes() const noexcept { return pool_.total_bytes(); }
  std::size_t block_bytes() const noexcept { return pool_.block_bytes(); }
  uint64_t    bytes_in() const noexcept {
    return bytes_in_.load(std::memory_order_relaxed);
  }

  struct Stats {
    std::atomic<uint64_t> producer_waits{0};   // polls with no free block
    std::atomic<uint64_t> consumer_waits{0};   // polls with no filled block
  };
  const Stats& stats() const noexcept { return stats_; }

private:
  void acquire_block();
  void publish_block();

  BlockPool pool_;
  spsc::Ring<uint32_t, RING_SLOTS>  free_q_;
  spsc::Ring<BlockDesc, RING_SLOTS> data_q_;

  // producer-owned state
  bool        have_block_{false};
  BlockDesc   cur_{};
  uint64_t    seq_{0};

  std::atomic<bool>     closed_{false};
  std::atomic<bool>     aborted_{false};
  std::atomic<uint64_t> bytes_in_{0};
  Stats                 stats_;
};

} // namespace chunkstream
