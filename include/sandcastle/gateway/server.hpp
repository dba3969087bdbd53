#pragma once

#include "sandcastle/common/result.hpp"
#include "sandcastle/runtime/admin.hpp"
#include "sandcastle/runtime/runtime_manager.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <unordered_map>

namespace sandcastle::gateway {

struct ServerOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8000;
};

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
};

[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);

/// Minimal HTTP/1.1 server exposing the runtime administration operations.
/// One accept thread; requests are handled one at a time.
class AdminServer {
public:
  explicit AdminServer(runtime::RuntimeManager &manager);
  ~AdminServer();

  AdminServer(const AdminServer &) = delete;
  AdminServer &operator=(const AdminServer &) = delete;

  [[nodiscard]] common::Status start(const ServerOptions &options);
  void stop();

  [[nodiscard]] std::uint16_t port() const { return bound_port_; }
  [[nodiscard]] bool is_running() const { return running_.load(); }

  /// Route a parsed request without touching sockets.
  [[nodiscard]] HttpResponse dispatch(const HttpRequest &request);

private:
  void accept_loop();
  void handle_client(int client_fd);

  runtime::RuntimeAdmin admin_;
  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;
};

} // namespace sandcastle::gateway
