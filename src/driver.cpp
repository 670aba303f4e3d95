// ============================================================================
// `driver.cpp` -- command-line front end for chunkstream
//
// Usage:
//   chunkstream [backup] [options] --src DIR [--src DIR ...] --dest DIR
//   chunkstream restore --dest DIR --name NAME --target DIR [--chunk-size SIZE]
//   chunkstream verify  --dest DIR --name NAME [--chunk-size SIZE]
//   chunkstream cat     --dest DIR --name NAME            (stream to stdout)
//
//  - backup streams each source into DEST/<name>/<name>.tar.part_NNNNNN.
//  - restore/verify/cat read the chunk set in DEST/<name>.
//  - Configuration can be loaded from a TOML file via --config; command-line
//    values override it.
//
// Exit codes: 0 ok, 1 usage/configuration/permission error, 2 a source
// failed or the chunk set could not be restored.
// ============================================================================
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

#include "chunkstream/byte_sink.hpp"
#include "chunkstream/config.hpp"
#include "chunkstream/errors.hpp"
#include "chunkstream/pipeline.hpp"
#include "chunkstream/reporter.hpp"
#include "chunkstream/restore.hpp"
#include "chunkstream/size_parse.hpp"

namespace fs = std::filesystem;

using chunkstream::Config;
using chunkstream::ConfigError;
using chunkstream::PermissionError;
using chunkstream::StdioReporter;

namespace {

constexpr int EXIT_OK     = 0;
constexpr int EXIT_USAGE  = 1;
constexpr int EXIT_FAILED = 2;

void show_help(const char* argv0) {
  std::printf(
    "Usage:\n"
    "  %s [backup] [options] --src DIR [--src DIR ...] --dest DIR\n"
    "  %s restore --dest DIR --name NAME --target DIR [--chunk-size SIZE]\n"
    "  %s verify  --dest DIR --name NAME [--chunk-size SIZE]\n"
    "  %s cat     --dest DIR --name NAME > NAME.tar\n"
    "\n"
    "Backup options:\n"
    "  --dest DIR            Destination base directory (mounted & writable)\n"
    "  --src DIR             Source directory to back up (repeatable)\n"
    "  --chunk-size SIZE     Chunk size (default: 5G), e.g. 1G, 5G, 512MiB\n"
    "  --log FILE            Log file path\n"
    "                        Default: /var/log/stream_chunk_backup_<timestamp>.log\n"
    "  --config FILE         Load options from a TOML config file\n"
    "  --overwrite           Replace chunk sets left by an earlier run\n"
    "  --io-uring            Write chunks with io_uring (Linux builds only)\n"
    "  --no-fsync            Do not fsync chunks before closing them\n"
    "  -h, --help            Show this help and exit\n"
    "\n"
    "Restore options:\n"
    "  --name NAME           Chunk set name (the source directory's name)\n"
    "  --target DIR          Directory to extract into\n"
    "  --chunk-size SIZE     Expected chunk size (default: size of chunk 1)\n"
    "\n"
    "Output layout:\n"
    "  DEST/<name>/<name>.tar.part_000001, _000002, ...\n"
    "\n"
    "Manual restore:\n"
    "  cat DEST/<name>/<name>.tar.part_* | tar -xpf -\n",
    argv0, argv0, argv0, argv0);
}

/// Writes a restored stream to a file descriptor (stdout for `cat`).
class FdSink : public chunkstream::ByteSink {
public:
  explicit FdSink(int fd) : fd_(fd) {}
  void write(const void* data, std::size_t len) override {
    const char* p = static_cast<const char*>(data);
    while (len > 0) {
      ssize_t n = ::write(fd_, p, len);
      if (n < 0) {
        if (errno == EINTR) continue;
        throw chunkstream::WriteError(
          chunkstream::errno_message("write to output failed", errno));
      }
      p += n;
      len -= static_cast<std::size_t>(n);
    }
  }
private:
  int fd_;
};

struct Args {
  std::string              command{"backup"};
  std::optional<std::string> config_path;
  std::vector<std::string> sources;
  std::optional<std::string> dest;
  std::optional<std::string> chunk_size;
  std::optional<std::string> log_file;
  std::string              name;
  std::string              target;
  bool                     overwrite{false};
  bool                     io_uring{false};
  bool                     no_fsync{false};
  bool                     help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  int i = 1;
  if (i < argc && argv[i][0] != '-') {
    a.command = argv[i++];
    if (a.command != "backup" && a.command != "restore" &&
        a.command != "verify" && a.command != "cat") {
      throw ConfigError("unknown command: " + a.command);
    }
  }
  auto value = [&](const std::string& opt) -> std::string {
    if (i + 1 >= argc) throw ConfigError(opt + " requires a value");
    return argv[++i];
  };
  for (; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--src")             a.sources.push_back(value(arg));
    else if (arg == "--dest")       a.dest = value(arg);
    else if (arg == "--chunk-size") a.chunk_size = value(arg);
    else if (arg == "--log")        a.log_file = value(arg);
    else if (arg == "--config" || arg == "-c") a.config_path = value(arg);
    else if (arg == "--name")       a.name = value(arg);
    else if (arg == "--target")     a.target = value(arg);
    else if (arg == "--overwrite")  a.overwrite = true;
    else if (arg == "--io-uring")   a.io_uring = true;
    else if (arg == "--no-fsync")   a.no_fsync = true;
    else if (arg == "-h" || arg == "--help") a.help = true;
    else throw ConfigError("unknown option: " + arg);
  }
  return a;
}

int run_backup(const Args& args) {
  Config cfg;
  if (args.config_path) {
    if (!fs::is_regular_file(*args.config_path)) {
      throw ConfigError("config file not found: " + *args.config_path);
    }
    cfg = chunkstream::load_config(*args.config_path);
  }
  if (!args.sources.empty()) cfg.SOURCES = args.sources;
  if (args.dest)       cfg.DEST_BASE  = *args.dest;
  if (args.chunk_size) cfg.CHUNK_SIZE = *args.chunk_size;
  if (args.log_file)   cfg.LOG_FILE   = *args.log_file;
  if (args.overwrite)  cfg.OVERWRITE  = true;
  if (args.io_uring)   cfg.USE_IO_URING = true;
  if (args.no_fsync)   cfg.FSYNC_CHUNKS = false;

  // Everything is checked before the first byte of I/O.
  auto resolved = chunkstream::validate_config(cfg);

  StdioReporter reporter;
  const bool explicit_log = !cfg.LOG_FILE.empty();
  const std::string log_path = explicit_log ? cfg.LOG_FILE
                                            : chunkstream::default_log_path();
  if (!reporter.open_log(log_path)) {
    if (explicit_log) throw ConfigError("cannot open log file " + log_path);
    reporter.warn("cannot open log file " + log_path + ", logging to terminal only");
  } else {
    reporter.info("Log file: " + log_path);
  }
  if (::geteuid() != 0) {
    reporter.warn("not running as root: unreadable files fail their source "
                  "and ownership is recorded as seen by this user");
  }

  chunkstream::PipelineCoordinator coordinator(resolved.pipeline, reporter);
  const auto results = coordinator.run(resolved.sources);
  for (const auto& r : results) {
    std::string line = r.source + ": " + chunkstream::to_string(r.status);
    if (r.status == chunkstream::RunStatus::Completed) {
      line += " (" + std::to_string(r.chunks) + " chunk(s), " +
              chunkstream::format_bytes(r.bytes) + ")";
    } else if (!r.error.empty()) {
      line += " (" + (r.error_kind.empty() ? r.error
                                           : r.error_kind + ": " + r.error) + ")";
    }
    if (r.status == chunkstream::RunStatus::Failed) reporter.error(line);
    else reporter.info(line);
  }
  return chunkstream::run_succeeded(results) ? EXIT_OK : EXIT_FAILED;
}

int run_restore(const Args& args) {
  if (!args.dest)        throw ConfigError("--dest is required");
  if (args.name.empty()) throw ConfigError("--name is required");
  if (args.command == "restore" && args.target.empty()) {
    throw ConfigError("--target is required");
  }

  chunkstream::RestoreOptions opts;
  if (args.chunk_size) opts.chunk_bytes = chunkstream::parse_size(*args.chunk_size);

  // `cat` owns stdout; keep its status lines on stderr.
  StdioReporter reporter(args.command == "cat" ? stderr : stdout, stderr);
  if (args.log_file && !reporter.open_log(*args.log_file)) {
    throw ConfigError("cannot open log file " + *args.log_file);
  }

  const fs::path set_dir = fs::path(*args.dest) / args.name;
  chunkstream::RestoreReconstructor rec(set_dir, args.name, opts, &reporter);
  try {
    if (args.command == "restore") {
      rec.restore(args.target);
    } else if (args.command == "verify") {
      rec.verify();
    } else {
      FdSink out(STDOUT_FILENO);
      rec.concatenate(out);
    }
  } catch (const chunkstream::RestoreError& e) {
    reporter.error(e.what());
    return EXIT_FAILED;
  } catch (const chunkstream::WriteError& e) {
    reporter.error(e.what());
    return EXIT_FAILED;
  }
  return EXIT_OK;
}

} // namespace

// ============================================================================
// Main
// ============================================================================
int main(int argc, char** argv) {
  try {
    Args args = parse_args(argc, argv);
    if (args.help) {
      show_help(argv[0]);
      return EXIT_OK;
    }
    if (args.command == "backup") return run_backup(args);
    return run_restore(args);
  } catch (const ConfigError& ex) {
    std::fprintf(stderr, "ERROR: %s\n\n", ex.what());
    show_help(argv[0]);
    return EXIT_USAGE;
  } catch (const PermissionError& ex) {
    std::fprintf(stderr, "ERROR: %s\n", ex.what());
    return EXIT_USAGE;
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "FATAL: %s\n", ex.what());
    return EXIT_FAILED;
  }
}
