// ============================================================================
// block_pool.hpp -- Fixed pool of stream blocks
//
// The channel between the archive producer and the chunk writer moves the
// stream in fixed-size blocks drawn from this pool. The pool is allocated
// once per source and is the whole local buffer budget of a run: nothing
// else in the pipeline holds unflushed stream bytes.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <vector>

namespace chunkstream {

// ============================================================================
// BlockDesc: tiny descriptor passed through the SPSC ring.
// ============================================================================
struct BlockDesc {
  uint32_t id;     // block index in the pool
  uint32_t len;    // valid bytes in the block
  uint64_t seq;    // block number in the stream (ordering/telemetry)
};

// ============================================================================
// BlockPool
// ============================================================================
class BlockPool {
public:
  /// Constructor for the BlockPool class.
  /// @param block_count The number of blocks in the pool.
  /// @param block_bytes The number of bytes per block.
  /// @param alignment The alignment of the block storage.
  BlockPool(uint32_t block_count, std::size_t block_bytes,
            std::size_t alignment = 64)
  : N_(block_count), block_bytes_(block_bytes), alignment_(alignment),
    blocks_(block_count, nullptr) {
    if (N_ == 0 || block_bytes_ == 0) {
      throw std::invalid_argument("invalid block pool sizes");
    }
    try {
      for (uint32_t i = 0; i < N_; ++i) {
        blocks_[i] = static_cast<std::byte*>(
          ::operator new(block_bytes_, std::align_val_t(alignment_)));
      }
    } catch (...) {
      free_all();
      throw;
    }
  }

  ~BlockPool() { free_all(); }

  BlockPool(const BlockPool&) = delete;
  BlockPool& operator=(const BlockPool&) = delete;

  uint32_t    size() const noexcept { return N_; }
  std::size_t block_bytes() const noexcept { return block_bytes_; }
  std::size_t total_bytes() const noexcept { return std::size_t(N_) * block_bytes_; }

  std::byte*       data(uint32_t id)       noexcept { return blocks_[id]; }
  const std::byte* data(uint32_t id) const noexcept { return blocks_[id]; }

private:
  void free_all() noexcept {
    for (auto*& p : blocks_) {
      if (p) ::operator delete(p, std::align_val_t(alignment_));
      p = nullptr;
    }
  }

  const uint32_t N_;
  const std::size_t block_bytes_;
  const std::size_t alignment_;
  std::vector<std::byte*> blocks_;
};

} // namespace chunkstream
