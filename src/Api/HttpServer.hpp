#ifndef STREAMCAP_HTTP_SERVER_HPP_
#define STREAMCAP_HTTP_SERVER_HPP_

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "Api/ApiRouter.hpp"
#include "utils/timer.hpp"

namespace streamcap {

/**
 * @brief 同步 HTTP/1.1 服务，把请求交给 ApiRouter
 *
 * 一个线程负责 accept，每个连接作为一个任务提交到 TBB 的 "http" arena，
 * 处理一个请求后关闭连接。读取请求超过 requestTimeout 的连接会被
 * shutdown，避免空闲客户端占满 arena 的线程。
 */
class HttpServer {
 public:
  HttpServer(ApiRouter& router, std::string address, uint16_t port,
             std::chrono::milliseconds requestTimeout = std::chrono::seconds(10));
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // 绑定并开始监听，失败时抛出 boost::system::system_error
  void start();
  // 停止 accept 并等待进行中的连接处理完毕
  void stop();

  // 实际监听端口（构造时传 0 则由系统分配）
  uint16_t port() const;

 private:
  void acceptLoop();
  void serveConnection(const std::shared_ptr<boost::asio::ip::tcp::socket>& socket);
  void trackConnection(const std::shared_ptr<boost::asio::ip::tcp::socket>& socket,
                       bool add);

  ApiRouter& router_;
  std::string address_;
  uint16_t port_;
  std::chrono::milliseconds requestTimeout_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  // 读请求的超时看门狗；析构先于 ioc_
  utils::Timer timer_;
  std::thread acceptThread_;
  std::atomic<bool> running_{false};
  std::mutex connectionsMutex_;
  std::condition_variable connectionsCv_;
  int activeConnections_ = 0;  // guarded by connectionsMutex_
  std::set<std::shared_ptr<boost::asio::ip::tcp::socket>> connections_;
};

}  // namespace streamcap

#endif  // STREAMCAP_HTTP_SERVER_HPP_
