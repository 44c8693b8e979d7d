#ifndef STREAMCAP_API_ROUTER_HPP_
#define STREAMCAP_API_ROUTER_HPP_

#include <map>
#include <string>

#include "TaskManager/TaskManager.hpp"

namespace streamcap {

struct ApiRequest {
  std::string method;  // "GET", "POST", "DELETE" ...
  std::string target;  // 路径，可带查询串
  std::string contentType;
  std::string body;
};

struct ApiResponse {
  int status = 200;
  std::string contentType = "application/json";
  std::string body;
};

// 把 HTTP 请求映射到 TaskManager 调用，与具体传输层无关
class ApiRouter {
 public:
  explicit ApiRouter(TaskManager& manager);

  ApiResponse handle(const ApiRequest& request);

 private:
  ApiResponse createTask(const ApiRequest& request);
  ApiResponse listActive();
  ApiResponse listFinished();
  ApiResponse getTask(const std::string& id);
  ApiResponse stopTask(const std::string& id);
  ApiResponse deleteActive(const std::string& id);
  ApiResponse deleteFinished(const std::string& id);

  TaskManager& manager_;
};

// application/x-www-form-urlencoded 解析
std::map<std::string, std::string> ParseFormBody(const std::string& body);
std::string UrlDecode(const std::string& text);

}  // namespace streamcap

#endif  // STREAMCAP_API_ROUTER_HPP_
