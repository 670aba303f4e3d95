// ============================================================================
// pipeline.cpp -- implementation of PipelineCoordinator
// ============================================================================
#include "chunkstream/pipeline.hpp"
#include "chunkstream/chunk_naming.hpp"
#include "chunkstream/errors.hpp"
#include "chunkstream/size_parse.hpp"
#include "chunkstream/throughput_monitor.hpp"

#include <algorithm>
#include <cerrno>
#include <exception>
#include <utility>
#include <unistd.h>

namespace fs = std::filesystem;

namespace chunkstream {

namespace {

/// Name of the error class, for RunResult::error_kind.
std::string error_kind(const std::exception& e) {
  if (dynamic_cast<const ReadError*>(&e))       return "ReadError";
  if (dynamic_cast<const WriteError*>(&e))      return "WriteError";
  if (dynamic_cast<const PermissionError*>(&e)) return "PermissionError";
  if (dynamic_cast<const ConfigError*>(&e))     return "ConfigError";
  return "Error";
}

} // namespace

const char* to_string(RunStatus s) noexcept {
  switch (s) {
    case RunStatus::Completed: return "Completed";
    case RunStatus::Skipped:   return "Skipped";
    case RunStatus::Failed:    return "Failed";
  }
  return "Unknown";
}

bool run_succeeded(const std::vector<RunResult>& results) noexcept {
  for (const auto& r : results) {
    if (r.status == RunStatus::Failed) return false;
  }
  return true;
}

BufferBudget split_buffer_budget(const ChannelConfig& channel,
                                 std::size_t io_buffer_bytes,
                                 uint64_t chunk_bytes) {
  BufferBudget b;
  b.io_buffer_bytes = static_cast<std::size_t>(
    std::min<uint64_t>(io_buffer_bytes, chunk_bytes / 2));
  // chunk_bytes - io_buffer_bytes >= 1 for any positive chunk size.
  b.channel = channel.bounded_by(chunk_bytes - b.io_buffer_bytes);
  return b;
}

PipelineCoordinator::PipelineCoordinator(PipelineConfig cfg, Reporter& reporter)
  : cfg_(std::move(cfg)), reporter_(reporter) {}

void PipelineCoordinator::prepare_destination() {
  std::error_code ec;
  fs::create_directories(cfg_.dest_base, ec);
  if (ec) {
    if (ec == std::errc::permission_denied) {
      throw PermissionError("cannot create destination " +
                            cfg_.dest_base.string() + ": " + ec.message());
    }
    throw WriteError("cannot create destination " + cfg_.dest_base.string() +
                     ": " + ec.message());
  }
  if (!fs::is_directory(cfg_.dest_base, ec)) {
    throw WriteError("destination " + cfg_.dest_base.string() +
                     " is not a directory");
  }
  if (::access(cfg_.dest_base.c_str(), W_OK | X_OK) != 0) {
    throw PermissionError(errno_message(
      "destination " + cfg_.dest_base.string() + " is not writable", errno));
  }
}

RunResult PipelineCoordinator::run_one(const fs::path& source) {
  RunResult res;
  res.source = source.string();
  res.name   = source_short_name(source);
  const auto t0 = std::chrono::steady_clock::now();
  auto elapsed = [&] {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  };
  auto failed = [&](const std::string& kind, const std::string& msg) {
    res.status      = RunStatus::Failed;
    res.error_kind  = kind;
    res.error       = msg;
    res.elapsed_sec = elapsed();
    reporter_.error("Failed " + res.source + ": " + msg);
    return res;
  };

  std::error_code ec;
  if (!fs::is_directory(source, ec)) {
    res.status = RunStatus::Skipped;
    res.error  = fs::exists(source, ec) ? "not a directory" : "not found";
    reporter_.warn(res.source + " " + res.error + ", skipping");
    return res;
  }
  if (res.name.empty()) {
    return failed("ConfigError", "cannot derive a chunk set name from the path");
  }
  if (::access(source.c_str(), R_OK | X_OK) != 0) {
    return failed("PermissionError",
                  errno_message("source is not readable", errno));
  }

  const fs::path dest = cfg_.dest_base / res.name;
  reporter_.info("Streaming " + res.source + " -> " + dest.string() +
                 " (chunk size: " + format_bytes(cfg_.chunk_bytes) + ")");

  try {
    const BufferBudget budget =
      split_buffer_budget(cfg_.channel, cfg_.writer.io_buffer_bytes, cfg_.chunk_bytes);

    ChunkWriterConfig wcfg = cfg_.writer;
    wcfg.output_dir      = dest.string();
    wcfg.name            = res.name;
    wcfg.chunk_bytes     = cfg_.chunk_bytes;
    wcfg.io_buffer_bytes = budget.io_buffer_bytes;

    // Declared before the writer: the writer thread reads from it.
    StreamChannel channel(budget.channel);
    ChunkWriter writer(wcfg, &reporter_);
    writer.prepare();

    ProducerConfig pcfg = cfg_.producer;
    pcfg.exclude.push_back(cfg_.dest_base);
    ArchiveProducer producer(pcfg, &reporter_);
    ThroughputMonitor monitor(res.name, channel, &reporter_, cfg_.report_interval);

    std::exception_ptr producer_error;
    std::exception_ptr writer_error;

    writer.start(channel);
    try {
      producer.produce(source, monitor);
    } catch (const ChannelAborted&) {
      // The writer aborted; join() below yields the cause.
    } catch (const std::exception&) {
      producer_error = std::current_exception();
      channel.abort();
    }
    try {
      writer.join();
    } catch (const std::exception&) {
      writer_error = std::current_exception();
    }

    res.bytes  = writer.bytes_written();
    res.chunks = writer.chunks().size();

    // One error per source: a writer failure is the root cause of the
    // producer's abort, never the other way round.
    if (writer_error) std::rethrow_exception(writer_error);
    if (producer_error) std::rethrow_exception(producer_error);

    res.status      = RunStatus::Completed;
    res.elapsed_sec = elapsed();
    reporter_.info("Completed " + res.source + " (" + std::to_string(res.chunks) +
                   " chunk(s), " + format_bytes(res.bytes) + ")");
  } catch (const std::exception& e) {
    return failed(error_kind(e), e.what());
  }
  return res;
}

std::vector<RunResult> PipelineCoordinator::run(const std::vector<fs::path>& sources) {
  reporter_.info("=== STREAM CHUNK BACKUP STARTED ===");
  reporter_.info("Destination: " + cfg_.dest_base.string());
  prepare_destination();

  std::vector<RunResult> results;
  results.reserve(sources.size());
  for (const auto& src : sources) {
    results.push_back(run_one(src));
  }

  std::size_t completed = 0, skipped = 0, failed = 0;
  for (const auto& r : results) {
    switch (r.status) {
      case RunStatus::Completed: ++completed; break;
      case RunStatus::Skipped:   ++skipped;   break;
      case RunStatus::Failed:    ++failed;    break;
    }
  }
  const std::string summary = std::to_string(completed) + " completed, " +
                              std::to_string(skipped) + " skipped, " +
                              std::to_string(failed) + " failed";
  if (failed) {
    reporter_.error("=== BACKUP FINISHED WITH ERRORS: " + summary + " ===");
  } else {
    reporter_.info("=== BACKUP COMPLETED: " + summary + " ===");
  }
  return results;
}

} // namespace chunkstream
