#include "Api/ApiRouter.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdint>
#include <functional>
#include <sstream>

#include "Api/TaskJson.hpp"
#include "TaskManager/errors.hpp"
#include "utils/logger.hpp"

namespace streamcap {

namespace {

using json = nlohmann::json;

const std::string kTasksPath = "/api/tasks";
const std::string kTasksPrefix = "/api/tasks/";
const std::string kStopPrefix = "/api/tasks/stop/";
const std::string kDeleteActivePrefix = "/api/tasks/delete/active/";
const std::string kDeleteFinishedPrefix = "/api/tasks/delete/completed/";

ApiResponse jsonResponse(int status, const json& body) {
  ApiResponse response;
  response.status = status;
  // 无效 UTF-8 替换为 U+FFFD，不抛 type_error
  response.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
  return response;
}

ApiResponse errorResponse(int status, const std::string& message) {
  return jsonResponse(status, json{{"error", message}});
}

ApiResponse successResponse() {
  return jsonResponse(200, json{{"status", "success"}});
}

bool startsWith(const std::string& text, const std::string& prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool isValidUtf8(const std::string& text) {
  size_t i = 0;
  while (i < text.size()) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    size_t extra = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + extra >= text.size()) return false;
    for (size_t k = 1; k <= extra; ++k) {
      unsigned char cc = static_cast<unsigned char>(text[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // 过长编码、代理区和超出 Unicode 范围的码点
    static const uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
    if (cp < kMinForLength[extra] || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

// 错误类型到 HTTP 状态码
ApiResponse guarded(const std::function<ApiResponse()>& fn) {
  try {
    return fn();
  } catch (const InvalidArgument& e) {
    return errorResponse(400, e.what());
  } catch (const NotFound& e) {
    return errorResponse(404, e.what());
  } catch (const AlreadyExists& e) {
    return errorResponse(409, e.what());
  } catch (const CaptureError& e) {
    LOG(ERROR) << "Request failed: " << e.what();
    return errorResponse(500, e.what());
  } catch (const json::exception& e) {
    LOG(ERROR) << "Response encoding failed: " << e.what();
    return errorResponse(500, "failed to encode response");
  }
}

}  // namespace

std::string UrlDecode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < text.size() &&
               hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hexValue(text[i + 1]) * 16 +
                                      hexValue(text[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::map<std::string, std::string> ParseFormBody(const std::string& body) {
  std::map<std::string, std::string> fields;
  std::istringstream ss(body);
  std::string pair;
  while (std::getline(ss, pair, '&')) {
    if (pair.empty()) continue;
    auto pos = pair.find('=');
    if (pos == std::string::npos) {
      fields[UrlDecode(pair)] = "";
    } else {
      fields[UrlDecode(pair.substr(0, pos))] = UrlDecode(pair.substr(pos + 1));
    }
  }
  return fields;
}

ApiRouter::ApiRouter(TaskManager& manager) : manager_(manager) {}

ApiResponse ApiRouter::handle(const ApiRequest& request) {
  std::string path = request.target.substr(0, request.target.find('?'));
  const std::string& method = request.method;

  if (path == kTasksPath) {
    if (method != "POST") return errorResponse(405, "method not allowed");
    return createTask(request);
  }
  if (path == "/api/tasks/active") {
    if (method != "GET") return errorResponse(405, "method not allowed");
    return listActive();
  }
  if (path == "/api/tasks/completed") {
    if (method != "GET") return errorResponse(405, "method not allowed");
    return listFinished();
  }

  struct Route {
    const std::string& prefix;
    const char* method;
    ApiResponse (ApiRouter::*action)(const std::string&);
  };
  const Route routes[] = {
      {kStopPrefix, "POST", &ApiRouter::stopTask},
      {kDeleteActivePrefix, "DELETE", &ApiRouter::deleteActive},
      {kDeleteFinishedPrefix, "DELETE", &ApiRouter::deleteFinished},
  };
  for (const auto& route : routes) {
    if (!startsWith(path, route.prefix)) continue;
    if (method != route.method) return errorResponse(405, "method not allowed");
    std::string id = path.substr(route.prefix.size());
    if (id.empty()) return errorResponse(400, "task id must not be empty");
    return (this->*route.action)(id);
  }

  if (startsWith(path, kTasksPrefix)) {
    std::string id = path.substr(kTasksPrefix.size());
    if (!id.empty() && id.find('/') == std::string::npos) {
      if (method != "GET") return errorResponse(405, "method not allowed");
      return getTask(id);
    }
  }
  return errorResponse(404, "no route for " + path);
}

ApiResponse ApiRouter::createTask(const ApiRequest& request) {
  std::string url;
  std::string fileName;
  if (startsWith(request.contentType, "application/json")) {
    try {
      json body = json::parse(request.body);
      if (!body.is_object()) {
        return errorResponse(400, "request body must be a JSON object");
      }
      url = body.value("url", "");
      fileName = body.value("file_name", "");
    } catch (const json::exception& e) {
      return errorResponse(400, std::string("invalid JSON: ") + e.what());
    }
  } else {
    auto form = ParseFormBody(request.body);
    url = form["url"];
    fileName = form["file_name"];
  }
  if (!isValidUtf8(url) || !isValidUtf8(fileName)) {
    return errorResponse(400, "url and file_name must be valid UTF-8");
  }

  return guarded([&]() {
    Task task = manager_.createTask(url, fileName);
    return jsonResponse(200, json(task));
  });
}

ApiResponse ApiRouter::listActive() {
  return guarded(
      [&]() { return jsonResponse(200, json(manager_.getActiveTasks())); });
}

ApiResponse ApiRouter::listFinished() {
  return guarded(
      [&]() { return jsonResponse(200, json(manager_.getFinishedTasks())); });
}

ApiResponse ApiRouter::getTask(const std::string& id) {
  auto task = manager_.getTask(id);
  if (!task) return errorResponse(404, "task not found: " + id);
  return jsonResponse(200, json(*task));
}

ApiResponse ApiRouter::stopTask(const std::string& id) {
  return guarded([&]() {
    manager_.stopTask(id);
    return successResponse();
  });
}

ApiResponse ApiRouter::deleteActive(const std::string& id) {
  return guarded([&]() {
    manager_.deleteActiveTask(id);
    return successResponse();
  });
}

ApiResponse ApiRouter::deleteFinished(const std::string& id) {
  return guarded([&]() {
    manager_.deleteFinishedTask(id);
    return successResponse();
  });
}

}  // namespace streamcap
