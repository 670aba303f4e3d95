// ============================================================================
// config.hpp -- Configuration structure for chunkstream
//
// This header defines the Config struct that holds all configuration values
// for a backup or restore run. Values come from defaults, then an optional
// TOML configuration file, then the command line.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "chunkstream/pipeline.hpp"

namespace chunkstream {

// ============================================================================
// Configuration structure
// ============================================================================
struct Config {
  // ==========================================================================
  // Backup set
  // ==========================================================================
  std::vector<std::string> SOURCES;                     // directories to back up
  std::string DEST_BASE;                                // mounted destination
  std::string CHUNK_SIZE      { "5G" };                 // human-readable
  std::string LOG_FILE;                                 // empty = default path
  bool        OVERWRITE       { false };                // replace existing sets

  // ==========================================================================
  // Channel / writer I/O
  // ==========================================================================
  uint64_t    BLOCK_BYTES     { 1024 * 1024 };          // channel block size
  uint32_t    BLOCKS          { 32 };                   // channel block count
  uint64_t    IO_BUFFER_BYTES { 8ull * 1024 * 1024 };   // stdio buffer per chunk
  bool        FSYNC_CHUNKS    { true };
  bool        USE_IO_URING    { false };                // Linux, liburing builds only
  unsigned    URING_QD        { 64 };                   // SQ/CQ depth
  unsigned    MAX_INFLIGHT    { 32 };                   // cap in-flight writes

  // ==========================================================================
  // Reporting
  // ==========================================================================
  uint64_t    REPORT_INTERVAL_MS { 1000 };
};

// ============================================================================
// Load configuration from TOML file (throws ConfigError)
// ============================================================================
Config load_config(const std::string& config_path);

// ============================================================================
// Check a configuration before any I/O and resolve it for the pipeline.
// Throws ConfigError for: no sources, no destination, bad chunk size,
// a source without a usable name, two sources with the same name.
// ============================================================================
struct ResolvedConfig {
  std::vector<std::filesystem::path> sources;   // absolute, normalized
  PipelineConfig                     pipeline;
};
ResolvedConfig validate_config(const Config& cfg);

/// Default log file: /var/log/stream_chunk_backup_<YYYYmmdd_HHMMSS>.log
std::string default_log_path();

} // namespace chunkstream
