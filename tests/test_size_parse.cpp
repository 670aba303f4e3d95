// ============================================================================
// test_size_parse.cpp -- Test chunk size parsing and byte formatting
// ============================================================================
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "chunkstream/errors.hpp"
#include "chunkstream/size_parse.hpp"

#define EXPECT_TRUE(x) do{ \
  if(!(x)){ \
    std::fprintf(stderr,"EXPECT_TRUE failed: %s @ %s:%d\n",#x,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_EQ(a,b) do{ \
  auto _va=(a); auto _vb=(b); \
  if(!((_va)==(_vb))){ \
    std::fprintf(stderr,"EXPECT_EQ failed: %s=%llu %s=%llu @ %s:%d\n", \
                 #a,(unsigned long long)_va,#b,(unsigned long long)_vb,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_THROW(stmt, type) do{ \
  bool _thrown=false; \
  try { stmt; } catch (const type&) { _thrown=true; } \
  if(!_thrown){ \
    std::fprintf(stderr,"EXPECT_THROW failed: %s did not throw %s @ %s:%d\n", \
                 #stmt,#type,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

using chunkstream::ConfigError;
using chunkstream::format_bytes;
using chunkstream::parse_size;

constexpr uint64_t KiB = 1024ull;
constexpr uint64_t MiB = KiB * 1024;
constexpr uint64_t GiB = MiB * 1024;

// ============================================================================
// Test 1: binary suffixes
// ============================================================================
void test_binary_suffixes() {
  EXPECT_EQ(parse_size("1K"), KiB);
  EXPECT_EQ(parse_size("5G"), 5 * GiB);
  EXPECT_EQ(parse_size("1g"), GiB);
  EXPECT_EQ(parse_size("512MiB"), 512 * MiB);
  EXPECT_EQ(parse_size("2T"), 2 * GiB * 1024);
  EXPECT_EQ(parse_size("15E"), 15ull << 60);
  std::puts("test_binary_suffixes: OK");
}

// ============================================================================
// Test 2: decimal suffixes and plain byte counts
// ============================================================================
void test_decimal_and_plain() {
  EXPECT_EQ(parse_size("1KB"), 1000ull);
  EXPECT_EQ(parse_size("5GB"), 5000000000ull);
  EXPECT_EQ(parse_size("4096"), 4096ull);
  EXPECT_EQ(parse_size("12B"), 12ull);
  EXPECT_EQ(parse_size(" 5 G "), 5 * GiB);
  std::puts("test_decimal_and_plain: OK");
}

// ============================================================================
// Test 3: rejected sizes
// ============================================================================
void test_rejected() {
  EXPECT_THROW(parse_size(""), ConfigError);
  EXPECT_THROW(parse_size("G"), ConfigError);
  EXPECT_THROW(parse_size("0"), ConfigError);
  EXPECT_THROW(parse_size("0G"), ConfigError);
  EXPECT_THROW(parse_size("-5G"), ConfigError);
  EXPECT_THROW(parse_size("5X"), ConfigError);
  EXPECT_THROW(parse_size("1.5G"), ConfigError);
  EXPECT_THROW(parse_size("16E"), ConfigError);                    // 2^64
  EXPECT_THROW(parse_size("99999999999999999999"), ConfigError);   // > 64 bits
  std::puts("test_rejected: OK");
}

// ============================================================================
// Test 4: human-readable formatting
// ============================================================================
void test_format() {
  EXPECT_TRUE(format_bytes(0) == "0B");
  EXPECT_TRUE(format_bytes(123) == "123B");
  EXPECT_TRUE(format_bytes(KiB) == "1.00KiB");
  EXPECT_TRUE(format_bytes(3 * GiB / 2) == "1.50GiB");
  EXPECT_TRUE(format_bytes(5 * GiB) == "5.00GiB");
  std::puts("test_format: OK");
}

int main() {
  std::puts("Running size parsing tests...");
  test_binary_suffixes();
  test_decimal_and_plain();
  test_rejected();
  test_format();
  std::puts("All tests PASSED.");
  return 0;
}
