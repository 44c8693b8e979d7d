#ifndef STREAMCAP_CURL_STREAM_CLIENT_HPP_
#define STREAMCAP_CURL_STREAM_CLIENT_HPP_

#include <string>

#include "Capture/StreamClient.hpp"

namespace streamcap {

// 基于 libcurl easy 接口的流式客户端，每个录制任务持有一个实例
class CurlStreamClient : public StreamClient {
 public:
  explicit CurlStreamClient(StreamClientOptions options);
  ~CurlStreamClient() override = default;

  FetchResult fetch(const std::string& url, const CancellationToken& token,
                    const OpenHandler& onOpen,
                    const DataHandler& onData) override;

 private:
  StreamClientOptions options_;
};

std::shared_ptr<StreamClient> MakeCurlStreamClient(
    const StreamClientOptions& options);

}  // namespace streamcap

#endif  // STREAMCAP_CURL_STREAM_CLIENT_HPP_
