// ============================================================================
// errors.cpp -- helpers for the error taxonomy
// ============================================================================
#include "chunkstream/errors.hpp"

#include <cstring>

namespace chunkstream {

std::string errno_message(const std::string& what, int err) {
  return what + ": " + std::strerror(err);
}

} // namespace chunkstream
