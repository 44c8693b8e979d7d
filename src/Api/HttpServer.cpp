#include "Api/HttpServer.hpp"

#include <sys/socket.h>

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <utility>

#include "utils/logger.hpp"
#include "utils/tbb_manager.hpp"

namespace streamcap {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {
const char kArenaName[] = "http";
constexpr int kArenaConcurrency = 16;

std::string toString(boost::beast::string_view sv) {
  return std::string(sv.data(), sv.size());
}
}  // namespace

HttpServer::HttpServer(ApiRouter& router, std::string address, uint16_t port,
                       std::chrono::milliseconds requestTimeout)
    : router_(router),
      address_(std::move(address)),
      port_(port),
      requestTimeout_(requestTimeout),
      acceptor_(ioc_) {
  utils::TBBManager::GetInstance().SetDefaultConcurrency(kArenaName,
                                                         kArenaConcurrency);
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::start() {
  if (running_.load()) return;
  tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(boost::asio::socket_base::max_listen_connections);
  running_.store(true);
  timer_.start();
  acceptThread_ = std::thread(&HttpServer::acceptLoop, this);
  LOG(INFO) << "HTTP API listening on " << address_ << ":" << port();
}

uint16_t HttpServer::port() const {
  boost::system::error_code ec;
  auto endpoint = acceptor_.local_endpoint(ec);
  return ec ? port_ : endpoint.port();
}

void HttpServer::stop() {
  if (!running_.exchange(false)) return;

  // 阻塞中的 accept 在监听套接字被 shutdown 后返回错误
  ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
  if (acceptThread_.joinable()) acceptThread_.join();
  boost::system::error_code ec;
  acceptor_.close(ec);

  {
    std::unique_lock<std::mutex> lock(connectionsMutex_);
    for (const auto& socket : connections_) {
      ::shutdown(socket->native_handle(), SHUT_RDWR);
    }
    connectionsCv_.wait(lock, [this]() { return activeConnections_ == 0; });
  }
  // 看门狗回调可能持有最后一个套接字引用，在 ioc_ 之前结束
  timer_.stop();
  LOG(INFO) << "HTTP API stopped";
}

void HttpServer::acceptLoop() {
  while (running_.load()) {
    auto socket = std::make_shared<tcp::socket>(ioc_);
    boost::system::error_code ec;
    acceptor_.accept(*socket, ec);
    if (ec) {
      if (running_.load()) {
        LOG(WARN) << "accept failed: " << ec.message();
        continue;
      }
      break;
    }
    trackConnection(socket, true);
    utils::TBBManager::GetInstance().Enqueue(kArenaName, [this, socket]() mutable {
      serveConnection(socket);
      trackConnection(socket, false);
      // 套接字引用 ioc_，必须在计数归零前释放
      socket.reset();
      std::lock_guard<std::mutex> lock(connectionsMutex_);
      if (--activeConnections_ == 0) connectionsCv_.notify_all();
    });
  }
}

void HttpServer::trackConnection(const std::shared_ptr<tcp::socket>& socket,
                                 bool add) {
  std::lock_guard<std::mutex> lock(connectionsMutex_);
  if (add) {
    connections_.insert(socket);
    ++activeConnections_;
  } else {
    connections_.erase(socket);
  }
}

void HttpServer::serveConnection(const std::shared_ptr<tcp::socket>& socket) {
  boost::beast::flat_buffer buffer;
  http::request<http::string_body> req;
  boost::system::error_code ec;
  // 同步读不受 SO_RCVTIMEO 约束，超时后由定时器 shutdown 套接字打断
  std::weak_ptr<tcp::socket> weak = socket;
  auto watchdog = timer_.addOnceTask(requestTimeout_, [weak]() {
    if (auto s = weak.lock()) ::shutdown(s->native_handle(), SHUT_RDWR);
  });
  http::read(*socket, buffer, req, ec);
  timer_.cancel(watchdog);
  if (ec) {
    if (ec != http::error::end_of_stream) {
      LOG(DEBUG) << "read request failed: " << ec.message();
    }
    return;
  }

  ApiRequest request;
  request.method = toString(req.method_string());
  request.target = toString(req.target());
  request.contentType = toString(req[http::field::content_type]);
  request.body = req.body();

  ApiResponse response = router_.handle(request);
  LOG(INFO) << request.method << " " << request.target << " -> "
            << response.status;

  http::response<http::string_body> res{
      static_cast<http::status>(response.status), req.version()};
  res.set(http::field::server, "stream-capture");
  res.set(http::field::content_type, response.contentType);
  res.keep_alive(false);
  res.body() = std::move(response.body);
  res.prepare_payload();

  http::write(*socket, res, ec);
  if (ec) {
    LOG(DEBUG) << "write response failed: " << ec.message();
  }
  socket->shutdown(tcp::socket::shutdown_send, ec);
}

}  // namespace streamcap
