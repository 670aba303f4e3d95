// ============================================================================
// byte_sink.hpp -- Push interface between stream stages
// ============================================================================
#pragma once
#include <cstddef>

namespace chunkstream {

// ============================================================================
// `ByteSink` interface
// A stage that accepts an ordered byte stream. write() may block
// (backpressure) and throws on failure; finish() marks end of stream.
// ============================================================================
class ByteSink {
public:
  virtual ~ByteSink() = default;

  virtual void write(const void* data, std::size_t len) = 0;
  virtual void finish() {}
};

} // namespace chunkstream
