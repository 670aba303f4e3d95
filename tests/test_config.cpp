// ============================================================================
// test_config.cpp -- Test TOML configuration loading and validation
// ============================================================================
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "chunkstream/config.hpp"
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

using chunkstream::Config;
using chunkstream::ConfigError;
using chunkstream::load_config;
using chunkstream::validate_config;

namespace fs = std::filesystem;

static fs::path write_config(const std::string& tag, const std::string& body) {
  fs::path p = fs::temp_directory_path() /
               ("chunkstream_cfg_" + tag + "_" + std::to_string(::getpid()) + ".toml");
  std::ofstream f(p);
  f << body;
  return p;
}

static bool load_fails(const std::string& tag, const std::string& body) {
  auto p = write_config(tag, body);
  bool threw = false;
  try { load_config(p.string()); } catch (const ConfigError&) { threw = true; }
  fs::remove(p);
  return threw;
}

static bool validate_fails(const Config& cfg) {
  try { validate_config(cfg); } catch (const ConfigError&) { return true; }
  return false;
}

// ============================================================================
// Test 1: defaults
// ============================================================================
void test_defaults() {
  Config cfg;
  EXPECT_TRUE(cfg.CHUNK_SIZE == "5G");
  EXPECT_TRUE(cfg.FSYNC_CHUNKS);
  EXPECT_TRUE(!cfg.OVERWRITE);
  EXPECT_TRUE(!cfg.USE_IO_URING);
  EXPECT_EQ(cfg.REPORT_INTERVAL_MS, 1000u);
  EXPECT_TRUE(chunkstream::default_log_path().rfind("/var/log/stream_chunk_backup_", 0) == 0);
  std::puts("test_defaults: OK");
}

// ============================================================================
// Test 2: every table is read
// ============================================================================
void test_load_full() {
  auto p = write_config("full", R"(
[backup]
sources    = ["/home/user-data", "/mnt/disk1"]
dest       = "/mnt/garage/Backups/MIAB"
chunk_size = "1G"
log_file   = "/tmp/backup.log"
overwrite  = true

[io]
block_bytes     = 65536
blocks          = 8
io_buffer_bytes = 1048576
fsync_chunks    = false
use_io_uring    = true
uring_qd        = 128
max_inflight    = 16

[report]
interval_ms = 250
)");
  Config cfg = load_config(p.string());
  fs::remove(p);

  EXPECT_EQ(cfg.SOURCES.size(), 2u);
  EXPECT_TRUE(cfg.SOURCES[1] == "/mnt/disk1");
  EXPECT_TRUE(cfg.DEST_BASE == "/mnt/garage/Backups/MIAB");
  EXPECT_TRUE(cfg.CHUNK_SIZE == "1G");
  EXPECT_TRUE(cfg.LOG_FILE == "/tmp/backup.log");
  EXPECT_TRUE(cfg.OVERWRITE);
  EXPECT_EQ(cfg.BLOCK_BYTES, 65536u);
  EXPECT_EQ(cfg.BLOCKS, 8u);
  EXPECT_EQ(cfg.IO_BUFFER_BYTES, 1048576u);
  EXPECT_TRUE(!cfg.FSYNC_CHUNKS);
  EXPECT_TRUE(cfg.USE_IO_URING);
  EXPECT_EQ(cfg.URING_QD, 128u);
  EXPECT_EQ(cfg.MAX_INFLIGHT, 16u);
  EXPECT_EQ(cfg.REPORT_INTERVAL_MS, 250u);

  auto resolved = validate_config(cfg);
  EXPECT_EQ(resolved.sources.size(), 2u);
  EXPECT_EQ(resolved.pipeline.chunk_bytes, 1024ull * 1024 * 1024);
  EXPECT_EQ(resolved.pipeline.channel.block_bytes, 65536u);
  EXPECT_EQ(resolved.pipeline.channel.blocks, 8u);
  EXPECT_TRUE(resolved.pipeline.writer.overwrite);
  EXPECT_TRUE(!resolved.pipeline.writer.fsync_chunks);
  EXPECT_EQ(resolved.pipeline.report_interval.count(), 250);
  std::puts("test_load_full: OK");
}

// ============================================================================
// Test 3: partial file keeps defaults; numeric chunk size accepted
// ============================================================================
void test_load_partial() {
  auto p = write_config("partial", R"(
[backup]
chunk_size = 4096
)");
  Config cfg = load_config(p.string());
  fs::remove(p);
  EXPECT_TRUE(cfg.CHUNK_SIZE == "4096");
  EXPECT_TRUE(cfg.SOURCES.empty());
  EXPECT_EQ(cfg.BLOCKS, 32u);
  std::puts("test_load_partial: OK");
}

// ============================================================================
// Test 4: malformed files are configuration errors
// ============================================================================
void test_load_errors() {
  EXPECT_TRUE(load_fails("syntax", "[backup\nsources = ["));
  EXPECT_TRUE(load_fails("type", "[backup]\ndest = 42\n"));
  EXPECT_TRUE(load_fails("sources", "[backup]\nsources = \"/home\"\n"));
  EXPECT_TRUE(load_fails("elems", "[backup]\nsources = [1, 2]\n"));
  EXPECT_TRUE(load_fails("bool", "[io]\nfsync_chunks = \"yes\"\n"));
  EXPECT_TRUE(load_fails("range", "[io]\nblocks = -1\n"));
  std::puts("test_load_errors: OK");
}

// ============================================================================
// Test 5: validation before any I/O
// ============================================================================
void test_validate() {
  Config ok;
  ok.SOURCES   = {"/srv/a", "/srv/b/"};
  ok.DEST_BASE = "/mnt/dest";
  auto r = validate_config(ok);
  EXPECT_TRUE(r.sources[1] == fs::path("/srv/b/"));
  EXPECT_TRUE(r.pipeline.dest_base == fs::path("/mnt/dest"));

  Config no_src = ok;   no_src.SOURCES.clear();
  Config no_dest = ok;  no_dest.DEST_BASE.clear();
  Config bad_size = ok; bad_size.CHUNK_SIZE = "0";
  Config bad_unit = ok; bad_unit.CHUNK_SIZE = "5Q";
  Config dup = ok;      dup.SOURCES = {"/srv/a/data", "/backup/data"};
  Config root = ok;     root.SOURCES = {"/"};
  Config no_blocks = ok; no_blocks.BLOCKS = 0;

  EXPECT_TRUE(validate_fails(no_src));
  EXPECT_TRUE(validate_fails(no_dest));
  EXPECT_TRUE(validate_fails(bad_size));
  EXPECT_TRUE(validate_fails(bad_unit));
  EXPECT_TRUE(validate_fails(dup));
  EXPECT_TRUE(validate_fails(root));
  EXPECT_TRUE(validate_fails(no_blocks));
  std::puts("test_validate: OK");
}

int main() {
  std::puts("Running config tests...");
  test_defaults();
  test_load_full();
  test_load_partial();
  test_load_errors();
  test_validate();
  std::puts("All tests PASSED.");
  return 0;
}
