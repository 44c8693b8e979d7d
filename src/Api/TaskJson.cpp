#include "Api/TaskJson.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace streamcap {

std::string FormatTimestamp(Clock::time_point tp) {
  auto t = Clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;
  if (ms.count() < 0) ms += std::chrono::milliseconds(1000);
  std::tm tm;
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count() << "Z";
  return oss.str();
}

void to_json(nlohmann::json& j, const Task& task) {
  j = nlohmann::json{
      {"id", task.id},
      {"url", task.sourceUrl},
      {"file_name", task.fileName},
      {"file_path", task.filePath},
      {"status", TaskStatusName(task.status)},
      {"file_size", task.bytesWritten},
      {"start_time", FormatTimestamp(task.startedAt)},
      {"end_time", nullptr},
      {"error_message", task.errorDetail},
      {"stopped", task.stoppedByUser},
  };
  if (task.endedAt) {
    j["end_time"] = FormatTimestamp(*task.endedAt);
  }
}

}  // namespace streamcap
