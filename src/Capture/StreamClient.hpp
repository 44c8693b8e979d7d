#ifndef STREAMCAP_STREAM_CLIENT_HPP_
#define STREAMCAP_STREAM_CLIENT_HPP_

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "TaskManager/CancellationToken.hpp"

namespace streamcap {

struct StreamClientOptions {
  // 仅限制连接建立阶段；直播流没有整体超时
  std::chrono::milliseconds connectTimeout{std::chrono::seconds(30)};
  std::chrono::seconds keepAlive{30};
  // 单次回调交付的最大字节数
  size_t chunkSize = 32 * 1024;
  bool followRedirects = true;
};

enum class FetchResult {
  kEndOfStream,     // 服务端正常结束响应体
  kCancelled,       // 取消标志被触发
  kHandlerAborted,  // onOpen / onData 返回 false
};

/**
 * @brief 流式 HTTP GET 客户端
 *
 * fetch 阻塞直到流结束、失败或被取消。收到成功状态码后先调用一次
 * onOpen（即使响应体为空），之后按块调用 onData。两个回调返回 false
 * 都会中止传输。取消标志必须能打断正在阻塞的读取。
 *
 * 失败通过异常报告：RequestFailure、ConnectionFailure、UnexpectedStatus。
 */
class StreamClient {
 public:
  using OpenHandler = std::function<bool()>;
  using DataHandler = std::function<bool(const char* data, size_t size)>;

  virtual ~StreamClient() = default;

  virtual FetchResult fetch(const std::string& url,
                            const CancellationToken& token,
                            const OpenHandler& onOpen,
                            const DataHandler& onData) = 0;
};

using StreamClientFactory =
    std::function<std::shared_ptr<StreamClient>(const StreamClientOptions&)>;

}  // namespace streamcap

#endif  // STREAMCAP_STREAM_CLIENT_HPP_
