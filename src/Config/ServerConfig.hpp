#ifndef STREAMCAP_SERVER_CONFIG_HPP_
#define STREAMCAP_SERVER_CONFIG_HPP_

#include <gflags/gflags.h>

#include <chrono>
#include <cstdint>
#include <string>

#include "TaskManager/TaskManager.hpp"
#include "utils/logger.hpp"

DECLARE_string(addr);
DECLARE_int32(port);
DECLARE_string(data_dir);
DECLARE_string(log_dir);
DECLARE_string(log_level);
DECLARE_uint64(log_max_file_size);
DECLARE_uint64(log_max_backup_files);
DECLARE_int32(connect_timeout_sec);
DECLARE_int32(progress_interval_ms);
DECLARE_int32(chunk_size);
DECLARE_int32(delete_wait_ms);
DECLARE_int32(max_concurrent_captures);
DECLARE_int32(progress_report_sec);
DECLARE_int32(request_timeout_ms);
DECLARE_bool(follow_redirects);

namespace streamcap {

struct ServerConfig {
  std::string address = "0.0.0.0";
  uint16_t port = 8080;
  std::string dataDir = "./data";
  int progressReportSec = 30;
  // 单个 HTTP 请求的读取期限
  std::chrono::milliseconds requestTimeout{10000};
  utils::LogConfig log;
  TaskManagerOptions manager;
};

// 从已解析的命令行参数构造配置；参数非法时抛出 InvalidArgument。
// dataDir 会被转换为绝对路径。
ServerConfig LoadServerConfigFromFlags();

}  // namespace streamcap

#endif  // STREAMCAP_SERVER_CONFIG_HPP_
