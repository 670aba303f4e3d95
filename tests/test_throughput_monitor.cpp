// ============================================================================
// test_throughput_monitor.cpp -- Test the pass-through throughput monitor
// ============================================================================
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "chunkstream/byte_sink.hpp"
#include "chunkstream/reporter.hpp"
#include "chunkstream/throughput_monitor.hpp"

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

using chunkstream::ByteSink;
using chunkstream::ProgressSnapshot;
using chunkstream::Reporter;
using chunkstream::ThroughputMonitor;
using namespace std::chrono_literals;

/// Collects everything written to it.
struct VectorSink : ByteSink {
  std::vector<uint8_t> bytes;
  int  finished{0};
  bool fail_next{false};
  void write(const void* data, std::size_t len) override {
    if (fail_next) throw std::runtime_error("sink failure");
    const auto* p = static_cast<const uint8_t*>(data);
    bytes.insert(bytes.end(), p, p + len);
  }
  void finish() override { ++finished; }
};

/// Keeps progress snapshots; other events are ignored.
struct RecordingReporter : Reporter {
  std::vector<ProgressSnapshot> snaps;
  void info(const std::string&) override {}
  void warn(const std::string&) override {}
  void error(const std::string&) override {}
  void progress(const ProgressSnapshot& s) override { snaps.push_back(s); }
};

// ============================================================================
// Test 1: bytes pass through unchanged and in order
// ============================================================================
void test_pass_through() {
  VectorSink sink;
  ThroughputMonitor mon("data", sink, nullptr);

  std::vector<uint8_t> input(4096);
  for (std::size_t i = 0; i < input.size(); ++i) input[i] = static_cast<uint8_t>(i * 13);
  for (std::size_t off = 0; off < input.size(); off += 100) {
    mon.write(input.data() + off, std::min<std::size_t>(100, input.size() - off));
  }
  mon.finish();

  EXPECT_TRUE(sink.bytes == input);
  EXPECT_EQ(sink.finished, 1);
  EXPECT_EQ(mon.bytes(), input.size());
  EXPECT_EQ(mon.reports(), 0u);          // no reporter, nothing reported
  std::puts("test_pass_through: OK");
}

// ============================================================================
// Test 2: snapshots are cumulative and the last one is final
// ============================================================================
void test_snapshots() {
  VectorSink sink;
  RecordingReporter rep;
  ThroughputMonitor mon("home", sink, &rep, 0ms);   // report on every write

  const char chunk[10] = {};
  for (int i = 0; i < 5; ++i) mon.write(chunk, sizeof(chunk));
  mon.finish();

  EXPECT_EQ(rep.snaps.size(), 6u);
  for (std::size_t i = 0; i < 5; ++i) {
    EXPECT_EQ(rep.snaps[i].bytes, (i + 1) * 10);
    EXPECT_TRUE(!rep.snaps[i].final);
    EXPECT_TRUE(rep.snaps[i].label == "home");
  }
  const auto& last = rep.snaps.back();
  EXPECT_TRUE(last.final);
  EXPECT_EQ(last.bytes, 50u);
  EXPECT_TRUE(last.elapsed_sec > 0.0);
  EXPECT_TRUE(last.avg_rate_bps > 0.0);
  EXPECT_EQ(mon.reports(), 6u);
  std::puts("test_snapshots: OK");
}

// ============================================================================
// Test 3: the interval bounds how often snapshots are emitted
// ============================================================================
void test_interval() {
  VectorSink sink;
  RecordingReporter rep;
  ThroughputMonitor mon("slow", sink, &rep, std::chrono::milliseconds(3600 * 1000));

  const char chunk[64] = {};
  for (int i = 0; i < 1000; ++i) mon.write(chunk, sizeof(chunk));
  EXPECT_EQ(rep.snaps.size(), 0u);
  mon.finish();
  EXPECT_EQ(rep.snaps.size(), 1u);
  EXPECT_TRUE(rep.snaps[0].final);
  EXPECT_EQ(rep.snaps[0].bytes, 64000u);

  auto s = mon.snapshot();
  EXPECT_EQ(s.bytes, 64000u);
  std::puts("test_interval: OK");
}

// ============================================================================
// Test 4: bytes a failing sink refused are not counted
// ============================================================================
void test_downstream_failure() {
  VectorSink sink;
  ThroughputMonitor mon("x", sink, nullptr);
  const char chunk[8] = {};
  mon.write(chunk, sizeof(chunk));
  sink.fail_next = true;
  bool threw = false;
  try { mon.write(chunk, sizeof(chunk)); } catch (const std::runtime_error&) { threw = true; }
  EXPECT_TRUE(threw);
  EXPECT_EQ(mon.bytes(), 8u);
  std::puts("test_downstream_failure: OK");
}

// ============================================================================
// Test 5: progress line shape (bytes, H:MM:SS, rate)
// ============================================================================
void test_format_progress() {
  ProgressSnapshot s;
  s.label = "home";
  s.bytes = 3ull * 1024 * 1024 * 1024 / 2;
  s.elapsed_sec = 3725.0;
  s.rate_bps = 1024.0 * 1024.0;
  s.avg_rate_bps = s.rate_bps;
  const std::string line = chunkstream::format_progress(s);
  EXPECT_TRUE(line.find("home") != std::string::npos);
  EXPECT_TRUE(line.find("1.50GiB") != std::string::npos);
  EXPECT_TRUE(line.find("1:02:05") != std::string::npos);
  EXPECT_TRUE(line.find("1.00MiB/s") != std::string::npos);
  std::puts("test_format_progress: OK");
}

int main() {
  std::puts("Running throughput monitor tests...");
  test_pass_through();
  test_snapshots();
  test_interval();
  test_downstream_failure();
  test_format_progress();
  std::puts("All tests PASSED.");
  return 0;
}
