// ============================================================================
// test_chunk_set.cpp -- Test chunk discovery, validation and reading
// ============================================================================
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

#include "chunkstream/chunk_naming.hpp"
#include "chunkstream/chunk_set.hpp"
#include "chunkstream/errors.hpp"

#define EXPECT_TRUE(x) do{ \
  if(!(x)){ \
    std::fprintf(stderr,"EXPECT_TRUE failed: %s @ %s:%d\n",#x,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_EQ(a,b) do{ \
  auto _va=(a); auto _vb=(b); \
  if(!((_va)==(_vb))){ \
    std::fprintf(stderr,"EXPECT_EQ failed: %s=%lld %s=%lld @ %s:%d\n", \
                 #a,(long long)_va,#b,(long long)_vb,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

using chunkstream::ChunkSet;
using chunkstream::ChunkSetReader;
using chunkstream::RestoreError;

namespace fs = std::filesystem;

static fs::path make_tmpdir(const std::string& tag) {
  fs::path dir = fs::temp_directory_path() /
                 ("chunkstream_cs_" + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static void put(const fs::path& p, const std::string& content) {
  std::ofstream f(p, std::ios::binary);
  f << content;
}

/// Returns the RestoreError message, or "" if validation passed.
static std::string validate_error(const ChunkSet& set,
                                  std::optional<uint64_t> limit = std::nullopt) {
  try {
    set.validate(limit);
  } catch (const RestoreError& e) {
    return e.what();
  }
  return {};
}

static std::string read_all(const ChunkSet& set) {
  ChunkSetReader r(set);
  std::string out;
  char buf[3];
  for (;;) {
    std::size_t n = r.read(buf, sizeof(buf));
    if (n == 0) break;
    out.append(buf, n);
  }
  EXPECT_EQ(r.chunks_done(), set.files().size());
  EXPECT_EQ(r.bytes_read(), out.size());
  return out;
}

// ============================================================================
// Test 1: naming helpers
// ============================================================================
void test_naming() {
  using chunkstream::parse_chunk_index;
  using chunkstream::source_short_name;
  EXPECT_EQ(parse_chunk_index("home.tar.part_000012", "home").value(), 12u);
  EXPECT_EQ(parse_chunk_index("home.tar.part_3", "home").value(), 3u);
  EXPECT_EQ(parse_chunk_index("home.tar.part_1234567", "home").value(), 1234567u);
  EXPECT_TRUE(!parse_chunk_index("home.tar.part_", "home"));
  EXPECT_TRUE(!parse_chunk_index("home.tar.part_01x", "home"));
  EXPECT_TRUE(!parse_chunk_index("homework.tar.part_000001", "home"));
  EXPECT_TRUE(!parse_chunk_index("home.tar", "home"));

  EXPECT_TRUE(source_short_name("/home/user-data") == "user-data");
  EXPECT_TRUE(source_short_name("/mnt/disk1/") == "disk1");
  EXPECT_TRUE(source_short_name("/").empty());
  std::puts("test_naming: OK");
}

// ============================================================================
// Test 2: numeric order regardless of padding width
// ============================================================================
void test_discover_order() {
  auto dir = make_tmpdir("order");
  put(dir / "d.tar.part_10", "jj");
  put(dir / "d.tar.part_000002", "bb");
  put(dir / "d.tar.part_9", "ii");
  put(dir / "d.tar.part_1", "aa");
  for (int i = 3; i <= 8; ++i) {
    put(dir / chunkstream::chunk_file_name("d", i), std::string(2, char('a' + i - 1)));
  }
  put(dir / "other.tar.part_000001", "zz");
  put(dir / "d.tar", "zz");

  auto set = ChunkSet::discover(dir, "d");
  EXPECT_EQ(set.files().size(), 10u);
  for (std::size_t i = 0; i < set.files().size(); ++i) {
    EXPECT_EQ(set.files()[i].index, i + 1);
  }
  EXPECT_TRUE(validate_error(set).empty());
  EXPECT_EQ(set.total_bytes(), 20u);
  EXPECT_TRUE(read_all(set) == "aabbccddeeffgghhiijj");

  fs::remove_all(dir);
  std::puts("test_discover_order: OK");
}

// ============================================================================
// Test 3: gaps, duplicates and empty sets are rejected
// ============================================================================
void test_structure_errors() {
  auto dir = make_tmpdir("structure");

  auto empty = ChunkSet::discover(dir, "s");
  EXPECT_TRUE(empty.empty());
  EXPECT_TRUE(!validate_error(empty).empty());

  put(dir / "s.tar.part_000001", "12345");
  put(dir / "s.tar.part_000002", "12345");
  put(dir / "s.tar.part_000004", "12");
  auto gap = ChunkSet::discover(dir, "s");
  const auto msg = validate_error(gap);
  EXPECT_TRUE(msg.find("gap") != std::string::npos);
  EXPECT_TRUE(msg.find("s.tar.part_000003") != std::string::npos);

  put(dir / "s.tar.part_000003", "12345");
  EXPECT_TRUE(validate_error(ChunkSet::discover(dir, "s")).empty());

  put(dir / "s.tar.part_3", "12345");       // same index, other width
  const auto dup = validate_error(ChunkSet::discover(dir, "s"));
  EXPECT_TRUE(dup.find("two files") != std::string::npos);
  fs::remove(dir / "s.tar.part_3");

  put(dir / "s.tar.part_000000", "12345");
  EXPECT_TRUE(!validate_error(ChunkSet::discover(dir, "s")).empty());
  fs::remove(dir / "s.tar.part_000000");

  // Missing first chunk is a gap too.
  fs::remove(dir / "s.tar.part_000001");
  EXPECT_TRUE(validate_error(ChunkSet::discover(dir, "s")).find("part_000001") !=
              std::string::npos);

  fs::remove_all(dir);
  std::puts("test_structure_errors: OK");
}

// ============================================================================
// Test 4: size rules
// ============================================================================
void test_size_errors() {
  auto dir = make_tmpdir("sizes");
  put(dir / "z.tar.part_000001", "12345");
  put(dir / "z.tar.part_000002", "1234");   // truncated middle chunk
  put(dir / "z.tar.part_000003", "12");
  auto set = ChunkSet::discover(dir, "z");
  EXPECT_TRUE(validate_error(set).find("truncated") != std::string::npos);

  put(dir / "z.tar.part_000002", "12345");
  set = ChunkSet::discover(dir, "z");
  EXPECT_TRUE(validate_error(set).empty());
  EXPECT_TRUE(validate_error(set, 5).empty());
  EXPECT_TRUE(!validate_error(set, 6).empty());   // configured size differs

  put(dir / "z.tar.part_000003", "");             // empty last chunk
  EXPECT_TRUE(!validate_error(ChunkSet::discover(dir, "z")).empty());

  put(dir / "z.tar.part_000003", "1234567");      // last larger than the rest
  EXPECT_TRUE(!validate_error(ChunkSet::discover(dir, "z")).empty());

  fs::remove_all(dir);
  std::puts("test_size_errors: OK");
}

// ============================================================================
// Test 5: the reader re-checks sizes seen at discovery
// ============================================================================
void test_reader_size_check() {
  auto dir = make_tmpdir("reader");
  put(dir / "r.tar.part_000001", "abcd");
  put(dir / "r.tar.part_000002", "ef");
  auto set = ChunkSet::discover(dir, "r");
  set.validate();

  // Chunk 1 shrinks after discovery.
  put(dir / "r.tar.part_000001", "abc");
  bool threw = false;
  try {
    read_all(set);
  } catch (const RestoreError& e) {
    threw = true;
    EXPECT_TRUE(std::string(e.what()).find("part_000001") != std::string::npos);
  }
  EXPECT_TRUE(threw);

  // Chunk 2 disappears.
  put(dir / "r.tar.part_000001", "abcd");
  fs::remove(dir / "r.tar.part_000002");
  threw = false;
  try { read_all(set); } catch (const RestoreError&) { threw = true; }
  EXPECT_TRUE(threw);

  fs::remove_all(dir);
  std::puts("test_reader_size_check: OK");
}

int main() {
  std::puts("Running chunk set tests...");
  test_naming();
  test_discover_order();
  test_structure_errors();
  test_size_errors();
  test_reader_size_check();
  std::puts("All tests PASSED.");
  return 0;
}
