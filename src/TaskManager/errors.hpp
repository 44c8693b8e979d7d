#ifndef STREAMCAP_ERRORS_HPP_
#define STREAMCAP_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace streamcap {

// 所有可向调用方抛出的错误的基类，API 层据此映射 HTTP 状态码
class CaptureError : public std::runtime_error {
 public:
  explicit CaptureError(const std::string& msg) : std::runtime_error(msg) {}
};

class InvalidArgument : public CaptureError {
 public:
  explicit InvalidArgument(const std::string& msg) : CaptureError(msg) {}
};

class NotFound : public CaptureError {
 public:
  explicit NotFound(const std::string& msg) : CaptureError(msg) {}
};

class AlreadyExists : public CaptureError {
 public:
  explicit AlreadyExists(const std::string& msg) : CaptureError(msg) {}
};

// 本地文件创建/写入/删除失败
class IOFailure : public CaptureError {
 public:
  explicit IOFailure(const std::string& msg) : CaptureError(msg) {}
};

// 请求无法构造（URL 非法、协议不支持等）
class RequestFailure : public CaptureError {
 public:
  explicit RequestFailure(const std::string& msg) : CaptureError(msg) {}
};

// 连接建立失败，或响应流中途断开
class ConnectionFailure : public CaptureError {
 public:
  explicit ConnectionFailure(const std::string& msg) : CaptureError(msg) {}
};

class UnexpectedStatus : public CaptureError {
 public:
  explicit UnexpectedStatus(long status)
      : CaptureError("server returned unexpected status code: " +
                     std::to_string(status)),
        status_(status) {}

  long status() const { return status_; }

 private:
  long status_;
};

}  // namespace streamcap

#endif  // STREAMCAP_ERRORS_HPP_
