// ============================================================================
// reporter.cpp -- implementation of StdioReporter and formatting helpers
// ============================================================================
#include "chunkstream/reporter.hpp"
#include "chunkstream/size_parse.hpp"

#include <chrono>
#include <ctime>

namespace chunkstream {

std::string timestamp_now() {
  auto now = std::chrono::system_clock::now();
  std::time_t now_time_t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf;
  localtime_r(&now_time_t, &tm_buf);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return buf;
}

std::string format_progress(const ProgressSnapshot& snap) {
  const auto secs = static_cast<unsigned long long>(snap.elapsed_sec);
  char buf[160];
  std::snprintf(buf, sizeof(buf), "%s %s %llu:%02llu:%02llu [%s/s] avg [%s/s]%s",
                snap.label.c_str(),
                format_bytes(snap.bytes).c_str(),
                secs / 3600, (secs / 60) % 60, secs % 60,
                format_bytes(static_cast<uint64_t>(snap.rate_bps)).c_str(),
                format_bytes(static_cast<uint64_t>(snap.avg_rate_bps)).c_str(),
                snap.final ? " (done)" : "");
  return buf;
}

StdioReporter::StdioReporter(std::FILE* out, std::FILE* err)
  : out_(out), err_(err) {}

StdioReporter::~StdioReporter() {
  if (log_) std::fclose(log_);
}

bool StdioReporter::open_log(const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  std::FILE* fp = std::fopen(path.c_str(), "a");
  if (!fp) return false;
  if (log_) std::fclose(log_);
  log_ = fp;
  log_path_ = path;
  std::setvbuf(log_, nullptr, _IOLBF, 0);
  return true;
}

void StdioReporter::info(const std::string& msg)  { emit(out_, "INFO", msg); }
void StdioReporter::warn(const std::string& msg)  { emit(err_, "WARNING", msg); }
void StdioReporter::error(const std::string& msg) { emit(err_, "ERROR", msg); }

void StdioReporter::progress(const ProgressSnapshot& snap) {
  emit(out_, "PROGRESS", format_progress(snap));
}

void StdioReporter::emit(std::FILE* stream, const char* level,
                         const std::string& msg) {
  const std::string ts = timestamp_now();
  std::lock_guard<std::mutex> lk(mu_);
  if (stream) {
    std::fprintf(stream, "[%s] %s %s\n", ts.c_str(), level, msg.c_str());
    std::fflush(stream);
  }
  if (log_) {
    std::fprintf(log_, "[%s] %s %s\n", ts.c_str(), level, msg.c_str());
  }
}

} // namespace chunkstream
