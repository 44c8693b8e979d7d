#ifndef STREAMCAP_TASK_JSON_HPP_
#define STREAMCAP_TASK_JSON_HPP_

#include <nlohmann/json.hpp>

#include <string>

#include "TaskManager/Task.hpp"

namespace streamcap {

// UTC, 毫秒精度，如 2024-05-01T12:00:00.250Z
std::string FormatTimestamp(Clock::time_point tp);

void to_json(nlohmann::json& j, const Task& task);

}  // namespace streamcap

#endif  // STREAMCAP_TASK_JSON_HPP_
