#include <gtest/gtest.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/system/system_error.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "Api/ApiRouter.hpp"
#include "Api/HttpServer.hpp"
#include "fake_stream_client.hpp"
#include "test_utils.hpp"

namespace streamcap {
namespace {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

struct HttpResult {
  int status = 0;
  std::string contentType;
  std::string body;
};

HttpResult Send(uint16_t port, http::verb method, const std::string& target,
                const std::string& body = "",
                const std::string& contentType = "application/json") {
  boost::asio::io_context ioc;
  tcp::socket socket(ioc);
  socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));

  http::request<http::string_body> req{method, target, 11};
  req.set(http::field::host, "127.0.0.1");
  if (!body.empty()) {
    req.set(http::field::content_type, contentType);
    req.body() = body;
  }
  req.prepare_payload();
  http::write(socket, req);

  boost::beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(socket, buffer, res);

  HttpResult result;
  result.status = static_cast<int>(res.result_int());
  auto contentTypeField = res[http::field::content_type];
  result.contentType =
      std::string(contentTypeField.data(), contentTypeField.size());
  result.body = res.body();
  boost::system::error_code ec;
  socket.shutdown(tcp::socket::shutdown_both, ec);
  return result;
}

class HttpServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    TaskManagerOptions options;
    options.dataDir = dir_.str();
    options.progressInterval = std::chrono::milliseconds(0);
    manager_ = std::make_unique<TaskManager>(
        options, testutil::FakeClientFactory(testutil::LiveScript({"FLV"})));
    router_ = std::make_unique<ApiRouter>(*manager_);
    server_ = std::make_unique<HttpServer>(*router_, "127.0.0.1", 0);
    server_->start();
  }

  void TearDown() override {
    server_->stop();
    manager_->shutdown();
  }

  testutil::TempDir dir_;
  std::unique_ptr<TaskManager> manager_;
  std::unique_ptr<ApiRouter> router_;
  std::unique_ptr<HttpServer> server_;
};

TEST_F(HttpServerTest, BindsEphemeralPort) { EXPECT_NE(server_->port(), 0); }

TEST_F(HttpServerTest, TaskLifecycleOverHttp) {
  uint16_t port = server_->port();

  HttpResult created = Send(port, http::verb::post, "/api/tasks",
                            R"({"url": "http://live.example.com/a.flv", "file_name": "room"})");
  ASSERT_EQ(created.status, 200) << created.body;
  EXPECT_EQ(created.contentType, "application/json");
  json task = json::parse(created.body);
  std::string id = task["id"];
  EXPECT_EQ(task["file_name"].get<std::string>(), "room.flv");

  HttpResult active = Send(port, http::verb::get, "/api/tasks/active");
  ASSERT_EQ(active.status, 200);
  EXPECT_EQ(json::parse(active.body).size(), 1u);

  HttpResult stop = Send(port, http::verb::post, "/api/tasks/stop/" + id);
  EXPECT_EQ(stop.status, 200);
  ASSERT_TRUE(testutil::WaitUntil([&]() {
    auto current = manager_->getTask(id);
    return current && current->status == TaskStatus::kCompleted;
  }));

  HttpResult removed =
      Send(port, http::verb::delete_, "/api/tasks/delete/completed/" + id);
  EXPECT_EQ(removed.status, 200);
  EXPECT_EQ(Send(port, http::verb::get, "/api/tasks/" + id).status, 404);
}

TEST_F(HttpServerTest, FormEncodedCreate) {
  HttpResult created =
      Send(server_->port(), http::verb::post, "/api/tasks",
           "url=http%3A%2F%2Flive.example.com%2Fb.flv",
           "application/x-www-form-urlencoded");
  ASSERT_EQ(created.status, 200) << created.body;
  json task = json::parse(created.body);
  EXPECT_EQ(task["url"].get<std::string>(), "http://live.example.com/b.flv");
}

TEST_F(HttpServerTest, ErrorsCarryJsonBody) {
  HttpResult missing =
      Send(server_->port(), http::verb::post, "/api/tasks/stop/404404");
  EXPECT_EQ(missing.status, 404);
  EXPECT_TRUE(json::parse(missing.body).contains("error"));

  HttpResult wrongMethod =
      Send(server_->port(), http::verb::put, "/api/tasks/active");
  EXPECT_EQ(wrongMethod.status, 405);
}

TEST_F(HttpServerTest, StopRefusesNewConnections) {
  uint16_t port = server_->port();
  server_->stop();
  EXPECT_THROW(Send(port, http::verb::get, "/api/tasks/active"),
               boost::system::system_error);
}

TEST_F(HttpServerTest, IdleConnectionsTimeOut) {
  server_->stop();
  server_ = std::make_unique<HttpServer>(*router_, "127.0.0.1", 0,
                                         std::chrono::milliseconds(200));
  server_->start();
  uint16_t port = server_->port();

  // 比 http arena 的线程更多的空闲连接，都不发送请求
  boost::asio::io_context ioc;
  std::vector<std::unique_ptr<tcp::socket>> idle;
  for (int i = 0; i < 20; ++i) {
    auto socket = std::make_unique<tcp::socket>(ioc);
    socket->connect(
        tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    idle.push_back(std::move(socket));
  }

  HttpResult active = Send(port, http::verb::get, "/api/tasks/active");
  EXPECT_EQ(active.status, 200);

  // 服务端超时后关闭连接，客户端读到 EOF
  char byte = 0;
  boost::system::error_code ec;
  idle.front()->read_some(boost::asio::buffer(&byte, 1), ec);
  EXPECT_TRUE(ec);
}

TEST(HttpServerBindTest, PortInUseThrows) {
  testutil::TempDir dir;
  TaskManagerOptions options;
  options.dataDir = dir.str();
  TaskManager manager(options,
                      testutil::FakeClientFactory(testutil::LiveScript()));
  ApiRouter router(manager);
  HttpServer first(router, "127.0.0.1", 0);
  first.start();

  // SO_REUSEADDR 不允许绑定到仍在监听的端口
  HttpServer second(router, "127.0.0.1", first.port());
  EXPECT_THROW(second.start(), boost::system::system_error);
  first.stop();
}

}  // namespace
}  // namespace streamcap
