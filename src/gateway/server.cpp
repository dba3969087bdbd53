#include "sandcastle/gateway/server.hpp"

#include "sandcastle/common/fs.hpp"
#include "sandcastle/health/health.hpp"
#include "sandcastle/observability/global.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sandcastle::gateway {

namespace {

constexpr std::size_t kMaxBodySize = 64 * 1024;
constexpr int kListenBacklog = 64;
constexpr const char *kValidatePrefix = "/runtime/validate/";

std::string status_text(const int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  default:
    return "OK";
  }
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  std::stringstream stream(query);
  std::string part;
  while (std::getline(stream, part, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[part] = "";
      continue;
    }
    out[part.substr(0, eq)] = part.substr(eq + 1);
  }
  return out;
}

HttpResponse make_json_response(const int status, const std::string &body) {
  return HttpResponse{.status = status, .content_type = "application/json", .body = body};
}

HttpResponse from_admin(const runtime::AdminResponse &response) {
  return make_json_response(response.http_status, response.body);
}

std::size_t parse_content_length(const HttpRequest &request) {
  const auto it = request.headers.find("content-length");
  if (it == request.headers.end()) {
    return 0;
  }
  std::size_t value = 0;
  const std::string text = common::trim(it->second);
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return 0;
  }
  return value;
}

} // namespace

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  out << "\r\n";
  out << response.body;
  return out.str();
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure("incomplete request",
                                                common::ErrorCode::InvalidArgument);
  }

  std::istringstream head_stream(raw.substr(0, header_end));
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure("missing request line",
                                                common::ErrorCode::InvalidArgument);
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure("invalid request line",
                                                common::ErrorCode::InvalidArgument);
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto colon = line.find(':');
    if (line.empty() || colon == std::string::npos) {
      continue;
    }
    request.headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }

  request.body = raw.substr(header_end + 4);
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }
  return common::Result<HttpRequest>::success(std::move(request));
}

AdminServer::AdminServer(runtime::RuntimeManager &manager) : admin_(manager) {}

AdminServer::~AdminServer() { stop(); }

common::Status AdminServer::start(const ServerOptions &options) {
  if (running_) {
    return common::Status::error("admin server already running");
  }
  health::mark_component_starting("gateway");

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    health::mark_component_error("gateway", "failed to create listen socket");
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  const std::string host = options.host == "localhost" ? "127.0.0.1" : options.host;
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    health::mark_component_error("gateway", "invalid bind host");
    return common::Status::error("invalid bind host: " + options.host,
                                 common::ErrorCode::Config);
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
      listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    health::mark_component_error("gateway", msg);
    return common::Status::error("bind failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  health::mark_component_ok("gateway");
  return common::Status::success();
}

void AdminServer::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  health::reset_component("gateway");
}

HttpResponse AdminServer::dispatch(const HttpRequest &request) {
  const std::string &path = request.path;
  if (path == "/health") {
    if (request.method != "GET") {
      return make_json_response(405, R"({"detail":"method not allowed"})");
    }
    return make_json_response(200, health::snapshot_json());
  }
  if (path == "/runtime/status" && request.method == "GET") {
    return from_admin(admin_.status());
  }
  if (path == "/runtime/switch" && request.method == "POST") {
    return from_admin(admin_.switch_runtime(request.body));
  }
  if (path == "/runtime/health" && request.method == "GET") {
    return from_admin(admin_.health());
  }
  if (common::starts_with(path, kValidatePrefix) && request.method == "GET") {
    const std::string name = path.substr(std::strlen(kValidatePrefix));
    if (name.empty() || name.find('/') != std::string::npos) {
      return make_json_response(404, R"({"detail":"not found"})");
    }
    return from_admin(admin_.validate_runtime(name));
  }
  if (path == "/runtime/status" || path == "/runtime/switch" || path == "/runtime/health" ||
      common::starts_with(path, kValidatePrefix)) {
    return make_json_response(405, R"({"detail":"method not allowed"})");
  }
  return make_json_response(404, R"({"detail":"not found"})");
}

void AdminServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }
    handle_client(client);
    close(client);
  }
}

void AdminServer::handle_client(const int client_fd) {
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t content_length = 0;
  std::size_t header_end = std::string::npos;
  while (raw.size() < kMaxBodySize + 8192) {
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    if (header_end == std::string::npos) {
      header_end = raw.find("\r\n\r\n");
      if (header_end == std::string::npos) {
        continue;
      }
      if (auto head = parse_http_request(raw.substr(0, header_end + 4)); head.ok()) {
        content_length = parse_content_length(head.value());
      }
      if (content_length > kMaxBodySize) {
        const auto text =
            render_http_response(make_json_response(413, R"({"detail":"request too large"})"));
        (void)send(client_fd, text.data(), text.size(), 0);
        return;
      }
    }
    if (raw.size() >= header_end + 4 + content_length) {
      break;
    }
  }

  auto parsed = parse_http_request(raw);
  HttpResponse response;
  if (!parsed.ok()) {
    observability::record_error("gateway", parsed.error());
    response = make_json_response(400, R"({"detail":"invalid request"})");
  } else {
    response = dispatch(parsed.value());
  }
  const std::string text = render_http_response(response);
  (void)send(client_fd, text.data(), text.size(), 0);
}

} // namespace sandcastle::gateway
