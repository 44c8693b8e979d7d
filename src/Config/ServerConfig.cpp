#include "Config/ServerConfig.hpp"

#include <filesystem>
#include <system_error>

#include "TaskManager/errors.hpp"

DEFINE_string(addr, "0.0.0.0", "HTTP API listen address");
DEFINE_int32(port, 8080, "HTTP API listen port");
DEFINE_string(data_dir, "./data", "Directory captured streams are written to");
DEFINE_string(log_dir, "logs", "Log directory");
DEFINE_string(log_level, "INFO", "Minimum log level: DEBUG, INFO, WARN, ERROR");
DEFINE_uint64(log_max_file_size, 10 * 1024 * 1024,
              "Rotate the log file once it reaches this many bytes");
DEFINE_uint64(log_max_backup_files, 3, "Number of rotated log files to keep");
DEFINE_int32(connect_timeout_sec, 30,
             "Connection establishment timeout for stream sources");
DEFINE_int32(progress_interval_ms, 1000,
             "Minimum interval between progress updates of a capture");
DEFINE_int32(chunk_size, 32 * 1024, "Maximum bytes read per chunk");
DEFINE_int32(delete_wait_ms, 10000,
             "How long deleting an active task waits for its capture to exit");
DEFINE_int32(max_concurrent_captures, 64,
             "Concurrency of the capture arena (running captures)");
DEFINE_int32(progress_report_sec, 30,
             "Interval of the active capture summary in the log, 0 disables");
DEFINE_int32(request_timeout_ms, 10000,
             "Deadline for reading one HTTP request before the connection is "
             "closed");
DEFINE_bool(follow_redirects, true,
            "Follow HTTP redirects when connecting to a stream source");
DEFINE_string(custom_tbb_parallel_control, "",
              "TBB arena concurrency control, e.g. capture:64");

namespace streamcap {

namespace {

void requirePositive(const char* name, int64_t value) {
  if (value <= 0) {
    throw InvalidArgument(std::string("--") + name + " must be positive");
  }
}

}  // namespace

ServerConfig LoadServerConfigFromFlags() {
  requirePositive("connect_timeout_sec", FLAGS_connect_timeout_sec);
  requirePositive("progress_interval_ms", FLAGS_progress_interval_ms);
  requirePositive("chunk_size", FLAGS_chunk_size);
  requirePositive("delete_wait_ms", FLAGS_delete_wait_ms);
  requirePositive("max_concurrent_captures", FLAGS_max_concurrent_captures);
  requirePositive("request_timeout_ms", FLAGS_request_timeout_ms);
  if (FLAGS_port <= 0 || FLAGS_port > 65535) {
    throw InvalidArgument("--port out of range: " + std::to_string(FLAGS_port));
  }
  if (FLAGS_data_dir.empty()) {
    throw InvalidArgument("--data_dir must not be empty");
  }

  ServerConfig cfg;
  cfg.address = FLAGS_addr;
  cfg.port = static_cast<uint16_t>(FLAGS_port);
  cfg.progressReportSec = FLAGS_progress_report_sec;
  cfg.requestTimeout = std::chrono::milliseconds(FLAGS_request_timeout_ms);

  std::error_code ec;
  auto absDataDir = std::filesystem::absolute(FLAGS_data_dir, ec);
  if (ec) {
    throw InvalidArgument("cannot resolve --data_dir " + FLAGS_data_dir +
                          ": " + ec.message());
  }
  cfg.dataDir = absDataDir.lexically_normal().string();

  cfg.log.logFilePath = FLAGS_log_dir;
  cfg.log.maxFileSize = FLAGS_log_max_file_size;
  cfg.log.maxBackupFiles = FLAGS_log_max_backup_files;
  cfg.log.minLevel = utils::ParseLogLevel(FLAGS_log_level);

  cfg.manager.dataDir = cfg.dataDir;
  cfg.manager.client.connectTimeout =
      std::chrono::seconds(FLAGS_connect_timeout_sec);
  cfg.manager.client.chunkSize = static_cast<size_t>(FLAGS_chunk_size);
  cfg.manager.client.followRedirects = FLAGS_follow_redirects;
  cfg.manager.progressInterval =
      std::chrono::milliseconds(FLAGS_progress_interval_ms);
  cfg.manager.deleteWaitTimeout =
      std::chrono::milliseconds(FLAGS_delete_wait_ms);
  cfg.manager.maxConcurrentCaptures = FLAGS_max_concurrent_captures;
  return cfg;
}

}  // namespace streamcap
