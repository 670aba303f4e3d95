// ============================================================================
// size_parse.cpp -- implementation of parse_size / format_bytes
// ============================================================================
#include "chunkstream/size_parse.hpp"
#include "chunkstream/errors.hpp"

#include <cctype>
#include <cstdio>
#include <limits>

namespace chunkstream {

namespace {

struct Suffix {
  const char* text;
  unsigned    base;     // 1024 or 1000
  unsigned    power;
};

// Longest spellings first so "KIB" is not matched as "K" + garbage.
constexpr Suffix kSuffixes[] = {
  {"KIB", 1024, 1}, {"MIB", 1024, 2}, {"GIB", 1024, 3},
  {"TIB", 1024, 4}, {"PIB", 1024, 5}, {"EIB", 1024, 6},
  {"KB",  1000, 1}, {"MB",  1000, 2}, {"GB",  1000, 3},
  {"TB",  1000, 4}, {"PB",  1000, 5}, {"EB",  1000, 6},
  {"K",   1024, 1}, {"M",   1024, 2}, {"G",   1024, 3},
  {"T",   1024, 4}, {"P",   1024, 5}, {"E",   1024, 6},
  {"B",   1,    0},
};

} // namespace

uint64_t parse_size(const std::string& text) {
  std::size_t i = 0;
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;

  const std::size_t digits_begin = i;
  uint64_t value = 0;
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  for (; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])); ++i) {
    const uint64_t d = static_cast<uint64_t>(text[i] - '0');
    if (value > (kMax - d) / 10) {
      throw ConfigError("size '" + text + "' is too large");
    }
    value = value * 10 + d;
  }
  if (i == digits_begin) {
    throw ConfigError("size '" + text + "' does not start with a number");
  }

  std::string suffix;
  for (; i < text.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (std::isspace(c)) continue;
    suffix.push_back(static_cast<char>(std::toupper(c)));
  }

  uint64_t multiplier = 1;
  if (!suffix.empty()) {
    const Suffix* found = nullptr;
    for (const auto& s : kSuffixes) {
      if (suffix == s.text) { found = &s; break; }
    }
    if (!found) {
      throw ConfigError("size '" + text + "' has unknown suffix '" + suffix + "'");
    }
    for (unsigned p = 0; p < found->power; ++p) multiplier *= found->base;
  }

  if (value == 0) {
    throw ConfigError("size '" + text + "' must be positive");
  }
  if (value > kMax / multiplier) {
    throw ConfigError("size '" + text + "' is too large");
  }
  return value * multiplier;
}

std::string format_bytes(uint64_t bytes) {
  static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
  double v = static_cast<double>(bytes);
  std::size_t u = 0;
  while (v >= 1024.0 && u + 1 < sizeof(units) / sizeof(units[0])) {
    v /= 1024.0;
    ++u;
  }
  char buf[32];
  if (u == 0) {
    std::snprintf(buf, sizeof(buf), "%lluB", static_cast<unsigned long long>(bytes));
  } else {
    std::snprintf(buf, sizeof(buf), "%.2f%s", v, units[u]);
  }
  return buf;
}

} // namespace chunkstream
