#include "Capture/CurlStreamClient.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <utility>

#include "TaskManager/errors.hpp"
#include "utils/logger.hpp"

namespace streamcap {

namespace {

constexpr long kHttpOk = 200;

struct CurlEasyDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

void ensureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, []() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      LOG(ERROR) << "curl_global_init failed: " << curl_easy_strerror(rc);
    }
  });
}

struct TransferState {
  CURL* curl;
  const CancellationToken* token;
  const StreamClient::OpenHandler* onOpen;
  const StreamClient::DataHandler* onData;
  bool opened = false;
  bool cancelled = false;
  bool handlerAborted = false;
  long badStatus = 0;
};

// 回调中不允许异常穿过 libcurl 的 C 栈帧
bool invokeOpen(TransferState* st) {
  try {
    return (*st->onOpen)();
  } catch (const std::exception& e) {
    LOG(ERROR) << "open handler threw: " << e.what();
    return false;
  }
}

bool invokeData(TransferState* st, const char* data, size_t size) {
  try {
    return (*st->onData)(data, size);
  } catch (const std::exception& e) {
    LOG(ERROR) << "data handler threw: " << e.what();
    return false;
  }
}

// 写入回调：返回值不等于 size * nmemb 时 libcurl 以 CURLE_WRITE_ERROR 中止
size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* st = static_cast<TransferState*>(userdata);
  size_t total = size * nmemb;
  if (st->token->isCancelled()) {
    st->cancelled = true;
    return 0;
  }
  if (!st->opened) {
    long code = 0;
    curl_easy_getinfo(st->curl, CURLINFO_RESPONSE_CODE, &code);
    if (code != kHttpOk) {
      st->badStatus = code;
      return 0;
    }
    st->opened = true;
    if (!invokeOpen(st)) {
      st->handlerAborted = true;
      return 0;
    }
  }
  if (!invokeData(st, ptr, total)) {
    st->handlerAborted = true;
    return 0;
  }
  return total;
}

// 空闲时 libcurl 也会大约每秒调用一次，用来打断阻塞中的读取
int on_transfer_info(void* clientp, curl_off_t, curl_off_t, curl_off_t,
                     curl_off_t) {
  auto* st = static_cast<TransferState*>(clientp);
  if (st->token->isCancelled()) {
    st->cancelled = true;
    return 1;
  }
  return 0;
}

bool isRequestError(CURLcode rc) {
  switch (rc) {
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
    case CURLE_BAD_FUNCTION_ARGUMENT:
    case CURLE_NOT_BUILT_IN:
      return true;
    default:
      return false;
  }
}

}  // namespace

CurlStreamClient::CurlStreamClient(StreamClientOptions options)
    : options_(std::move(options)) {
  ensureCurlGlobalInit();
}

FetchResult CurlStreamClient::fetch(const std::string& url,
                                    const CancellationToken& token,
                                    const OpenHandler& onOpen,
                                    const DataHandler& onData) {
  CurlEasyPtr curl(curl_easy_init());
  if (!curl) {
    throw RequestFailure("curl_easy_init failed for " + url);
  }

  TransferState state;
  state.curl = curl.get();
  state.token = &token;
  state.onOpen = &onOpen;
  state.onData = &onData;

  char errbuf[CURL_ERROR_SIZE] = {0};
  CURL* h = curl.get();
  curl_easy_setopt(h, CURLOPT_URL, url.c_str());
  curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(h, CURLOPT_PROTOCOLS,
                   static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
  curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS,
                   static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION,
                   options_.followRedirects ? 1L : 0L);
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_TIMEOUT, 0L);
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(options_.connectTimeout.count()));
  curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
  curl_easy_setopt(h, CURLOPT_TCP_KEEPIDLE,
                   static_cast<long>(options_.keepAlive.count()));
  curl_easy_setopt(h, CURLOPT_TCP_KEEPINTVL,
                   static_cast<long>(options_.keepAlive.count()));
  curl_easy_setopt(h, CURLOPT_BUFFERSIZE,
                   static_cast<long>(options_.chunkSize));
  curl_easy_setopt(h, CURLOPT_USERAGENT, "stream-capture/1.0");
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, on_transfer_info);
  curl_easy_setopt(h, CURLOPT_XFERINFODATA, &state);

  LOG(DEBUG) << "GET " << url;
  CURLcode rc = curl_easy_perform(h);

  if (state.cancelled || rc == CURLE_ABORTED_BY_CALLBACK) {
    return FetchResult::kCancelled;
  }
  if (state.badStatus != 0) {
    throw UnexpectedStatus(state.badStatus);
  }
  if (state.handlerAborted) {
    return FetchResult::kHandlerAborted;
  }

  if (rc == CURLE_OK) {
    if (!state.opened) {
      // 响应体为空时 write_body 不会被调用
      long code = 0;
      curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
      if (code != kHttpOk) {
        throw UnexpectedStatus(code);
      }
      state.opened = true;
      if (!invokeOpen(&state)) return FetchResult::kHandlerAborted;
    }
    return FetchResult::kEndOfStream;
  }

  if (token.isCancelled()) {
    return FetchResult::kCancelled;
  }

  std::string detail = errbuf[0] ? std::string(errbuf) : curl_easy_strerror(rc);
  if (isRequestError(rc)) {
    throw RequestFailure("failed to build request: " + detail);
  }
  if (state.opened) {
    throw ConnectionFailure("failed to read stream: " + detail);
  }
  throw ConnectionFailure("failed to connect: " + detail);
}

std::shared_ptr<StreamClient> MakeCurlStreamClient(
    const StreamClientOptions& options) {
  return std::make_shared<CurlStreamClient>(options);
}

}  // namespace streamcap
