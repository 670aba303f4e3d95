// ============================================================================
// config.cpp -- Configuration loading implementation
//
// This file implements load_config, which reads configuration values from a
// TOML file, and validate_config, which turns a Config into the pipeline's
// settings.
// ============================================================================
#include "chunkstream/config.hpp"
#include "chunkstream/chunk_naming.hpp"
#include "chunkstream/errors.hpp"
#include "chunkstream/size_parse.hpp"

#include <toml++/toml.hpp>

#include <chrono>
#include <ctime>
#include <map>

namespace fs = std::filesystem;

namespace chunkstream {

namespace {

/// Copy `tbl[section][key]` into `out` if present; wrong types are errors.
template <class T>
void read_value(const toml::table& tbl, const char* section, const char* key,
                T& out, const std::string& path) {
  auto node = tbl[section][key];
  if (!node) return;
  if (auto v = node.template value<T>()) {
    out = *v;
    return;
  }
  throw ConfigError(path + ": [" + section + "]." + key + " has the wrong type");
}

} // namespace

// ============================================================================
// Load configuration from TOML file
// ============================================================================
Config load_config(const std::string& config_path) {
  Config cfg;

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path);
  } catch (const toml::parse_error& err) {
    throw ConfigError("error parsing config file '" + config_path + "': " +
                      std::string(err.description()));
  }

  // Backup set
  if (auto node = tbl["backup"]["sources"]) {
    auto* arr = node.as_array();
    if (!arr) {
      throw ConfigError(config_path + ": [backup].sources must be an array");
    }
    for (auto& el : *arr) {
      auto v = el.value<std::string>();
      if (!v) {
        throw ConfigError(config_path + ": [backup].sources must hold strings");
      }
      cfg.SOURCES.push_back(*v);
    }
  }
  read_value(tbl, "backup", "dest",       cfg.DEST_BASE,  config_path);
  read_value(tbl, "backup", "log_file",   cfg.LOG_FILE,   config_path);
  read_value(tbl, "backup", "overwrite",  cfg.OVERWRITE,  config_path);
  if (auto node = tbl["backup"]["chunk_size"]) {
    // Accept "5G" as well as a plain byte count.
    if (auto s = node.value<std::string>()) {
      cfg.CHUNK_SIZE = *s;
    } else if (auto n = node.value<int64_t>()) {
      cfg.CHUNK_SIZE = std::to_string(*n);
    } else {
      throw ConfigError(config_path + ": [backup].chunk_size has the wrong type");
    }
  }

  // I/O
  read_value(tbl, "io", "block_bytes",     cfg.BLOCK_BYTES,     config_path);
  read_value(tbl, "io", "blocks",          cfg.BLOCKS,          config_path);
  read_value(tbl, "io", "io_buffer_bytes", cfg.IO_BUFFER_BYTES, config_path);
  read_value(tbl, "io", "fsync_chunks",    cfg.FSYNC_CHUNKS,    config_path);
  read_value(tbl, "io", "use_io_uring",    cfg.USE_IO_URING,    config_path);
  read_value(tbl, "io", "uring_qd",        cfg.URING_QD,        config_path);
  read_value(tbl, "io", "max_inflight",    cfg.MAX_INFLIGHT,    config_path);

  // Reporting
  read_value(tbl, "report", "interval_ms", cfg.REPORT_INTERVAL_MS, config_path);

  return cfg;
}

ResolvedConfig validate_config(const Config& cfg) {
  if (cfg.SOURCES.empty()) {
    throw ConfigError("at least one source directory is required");
  }
  if (cfg.DEST_BASE.empty()) {
    throw ConfigError("a destination directory is required");
  }
  const uint64_t chunk_bytes = parse_size(cfg.CHUNK_SIZE);
  if (cfg.BLOCKS == 0 || cfg.BLOCK_BYTES == 0) {
    throw ConfigError("[io] blocks and block_bytes must be positive");
  }

  ResolvedConfig out;
  std::map<std::string, std::string> names;
  for (const auto& s : cfg.SOURCES) {
    if (s.empty()) throw ConfigError("empty source path");
    fs::path p = fs::absolute(fs::path(s)).lexically_normal();
    const std::string name = source_short_name(p);
    if (name.empty() || name == "." || name == "..") {
      throw ConfigError("cannot derive a backup name from source '" + s + "'");
    }
    auto [it, inserted] = names.emplace(name, s);
    if (!inserted) {
      throw ConfigError("sources '" + it->second + "' and '" + s +
                        "' would both be stored as '" + name + "'");
    }
    out.sources.push_back(std::move(p));
  }

  PipelineConfig& pc = out.pipeline;
  pc.dest_base         = fs::absolute(fs::path(cfg.DEST_BASE)).lexically_normal();
  pc.chunk_bytes       = chunk_bytes;
  pc.channel.block_bytes = static_cast<std::size_t>(cfg.BLOCK_BYTES);
  pc.channel.blocks      = cfg.BLOCKS;
  pc.writer.io_buffer_bytes = static_cast<std::size_t>(cfg.IO_BUFFER_BYTES);
  pc.writer.fsync_chunks    = cfg.FSYNC_CHUNKS;
  pc.writer.overwrite       = cfg.OVERWRITE;
  pc.writer.use_io_uring    = cfg.USE_IO_URING;
  pc.writer.uring_qd        = cfg.URING_QD;
  pc.writer.max_inflight    = cfg.MAX_INFLIGHT;
  pc.report_interval = std::chrono::milliseconds(cfg.REPORT_INTERVAL_MS);
  return out;
}

std::string default_log_path() {
  std::time_t now = std::time(nullptr);
  std::tm tm_buf;
  localtime_r(&now, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", &tm_buf);
  return std::string("/var/log/stream_chunk_backup_") + ts + ".log";
}

} // namespace chunkstream
