#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "chatraw/server.hpp"

using chatraw::IRoute;
using chatraw::Server;

namespace {

// Holds the connection open until the test releases it
class HeldRoute : public IRoute {
 public:
  explicit HeldRoute(std::shared_future<void> release) : release_(std::move(release)) {}

  bool match(const std::string& method, const std::string& path) override {
    return method == "GET" && path == "/held";
  }

  void handle(SocketType sock, const std::string& /*body*/) override {
    entered_.set_value();
    release_.wait();
    send_response(sock, 200, "{\"held\":true}");
  }

  std::future<void> entered() { return entered_.get_future(); }

 private:
  std::promise<void> entered_;
  std::shared_future<void> release_;
};

std::string fetch(const std::string& port, const std::string& request) {
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_port = htons(static_cast<uint16_t>(std::stoi(port)));
  inet_pton(AF_INET, "127.0.0.1", &address.sin_addr);
  if (connect(sock, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
    close(sock);
    return "";
  }

  send(sock, request.data(), request.size(), 0);
  std::string response;
  char buffer[1024];
  ssize_t n;
  while ((n = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
    response.append(buffer, static_cast<size_t>(n));
  }
  close(sock);
  return response;
}

} // namespace

TEST(ServerTest, BindsAnEphemeralPortWhenAskedForZero) {
  Server server("0", "127.0.0.1");

  ASSERT_TRUE(server.init());

  EXPECT_NE(server.getPort(), "0");
  EXPECT_GT(std::stoi(server.getPort()), 0);
}

TEST(ServerTest, ShutdownWaitsForConnectionsStillInFlight) {
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  auto route = std::make_unique<HeldRoute>(released);
  auto entered = route->entered();

  Server server("0", "127.0.0.1");
  ASSERT_TRUE(server.init());
  server.addRoute(std::move(route));
  std::thread loop([&server]() { server.run(); });

  auto response = std::async(std::launch::async, [&server]() {
    return fetch(server.getPort(), "GET /held HTTP/1.1\r\nHost: localhost\r\n\r\n");
  });
  ASSERT_EQ(entered.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(server.activeConnections(), 1u);

  server.stop();
  loop.join();

  auto drained = std::async(std::launch::async, [&server]() { server.waitForConnections(); });
  EXPECT_EQ(drained.wait_for(std::chrono::milliseconds(200)), std::future_status::timeout);

  release.set_value();
  ASSERT_EQ(drained.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(server.activeConnections(), 0u);
  EXPECT_NE(response.get().find("{\"held\":true}"), std::string::npos);
}

TEST(ServerTest, UnknownPathAnswersNotFound) {
  Server server("0", "127.0.0.1");
  ASSERT_TRUE(server.init());
  std::thread loop([&server]() { server.run(); });

  const std::string response = fetch(server.getPort(), "GET /nowhere HTTP/1.1\r\nHost: localhost\r\n\r\n");

  server.stop();
  loop.join();
  server.waitForConnections();
  EXPECT_EQ(response.compare(0, 12, "HTTP/1.1 404"), 0);
}
