#include <catch2/catch_test_macros.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>

#include "ticketsim/net/http_client.hpp"

using namespace ticketsim;

namespace {

// Accepts one connection on 127.0.0.1, records the raw request and replies with a canned
// response.
class one_shot_server {
public:
  one_shot_server(int status, std::string body) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 1);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    worker_ = std::thread([this, status, body = std::move(body)] { serve(status, body); });
  }
  ~one_shot_server() {
    if (worker_.joinable()) worker_.join();
    ::close(fd_);
  }
  one_shot_server(const one_shot_server&) = delete;
  one_shot_server& operator=(const one_shot_server&) = delete;

  auto url() const -> std::string {
    return "http://127.0.0.1:" + std::to_string(port_) + "/api/embed";
  }
  // Joins the server thread; call after the client returns.
  auto request() -> const std::string& {
    if (worker_.joinable()) worker_.join();
    return request_;
  }

private:
  void serve(int status, const std::string& body) {
    const int conn = ::accept(fd_, nullptr, nullptr);
    if (conn < 0) return;
    char buf[4096];
    std::size_t header_end = std::string::npos;
    std::size_t content_length = 0;
    while (true) {
      const auto n = ::recv(conn, buf, sizeof(buf), 0);
      if (n <= 0) break;
      request_.append(buf, static_cast<std::size_t>(n));
      if (header_end == std::string::npos) {
        header_end = request_.find("\r\n\r\n");
        if (header_end != std::string::npos) {
          const auto cl = request_.find("Content-Length: ");
          if (cl != std::string::npos && cl < header_end) {
            content_length = std::strtoul(request_.c_str() + cl + 16, nullptr, 10);
          }
        }
      }
      if (header_end != std::string::npos && request_.size() >= header_end + 4 + content_length) {
        break;
      }
    }
    const std::string reply = "HTTP/1.1 " + std::to_string(status) + " X\r\n" +
                              "Content-Type: application/json\r\n" +
                              "Content-Length: " + std::to_string(body.size()) + "\r\n" +
                              "Connection: close\r\n\r\n" + body;
    ::send(conn, reply.data(), reply.size(), 0);
    ::close(conn);
  }

  int fd_{-1};
  unsigned short port_{0};
  std::string request_;
  std::thread worker_;
};

auto contains(const std::string& hay, std::string_view needle) -> bool {
  return hay.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("post_json sends the body and every configured header", "[http][net]") {
  one_shot_server server(200, R"({"ok":true})");
  net::post_options opts;
  opts.timeout = std::chrono::milliseconds(5000);
  opts.headers.push_back("Authorization: Bearer secret-token");
  opts.headers.push_back("X-Ticket-Source: helpdesk");

  auto resp = net::post_json(server.url(), R"({"model":"all-minilm"})", opts);
  REQUIRE(resp.has_value());
  REQUIRE(resp->status == 200);
  REQUIRE(resp->body == R"({"ok":true})");

  const auto& req = server.request();
  REQUIRE(req.starts_with("POST /api/embed "));
  REQUIRE(contains(req, "Content-Type: application/json"));
  REQUIRE(contains(req, "Authorization: Bearer secret-token"));
  REQUIRE(contains(req, "X-Ticket-Source: helpdesk"));
  REQUIRE(contains(req, R"({"model":"all-minilm"})"));
}

TEST_CASE("post_json returns non-2xx statuses as responses", "[http][net]") {
  one_shot_server server(503, R"({"error":"loading"})");
  auto resp = net::post_json(server.url(), "{}");
  REQUIRE(resp.has_value());
  REQUIRE(resp->status == 503);
  REQUIRE_FALSE(net::is_success(resp->status));
}

TEST_CASE("post_json reports transport failures as provider_failed", "[http][net][errors]") {
  net::post_options opts;
  opts.timeout = std::chrono::milliseconds(2000);
  auto resp = net::post_json("unsupported://127.0.0.1/api/embed", "{}", opts);
  REQUIRE_FALSE(resp.has_value());
  REQUIRE(resp.error().code == core::error_code::provider_failed);
}
