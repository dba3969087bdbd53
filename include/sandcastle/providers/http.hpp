#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace sandcastle::providers {

using HttpHeaders = std::unordered_map<std::string, std::string>;

/// One file part of a multipart/form-data upload.
struct MultipartFile {
  std::string field;
  std::string filename;
  std::string content;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HttpHeaders headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

/// Blocking HTTP transport. Implementations must be safe to call from
/// several threads at once.
class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                         std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url,
                                               const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse delete_request(const std::string &url,
                                                    const HttpHeaders &headers,
                                                    std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_multipart(const std::string &url,
                                                    const HttpHeaders &headers,
                                                    const MultipartFile &file,
                                                    std::uint64_t timeout_ms) = 0;
};

/// libcurl-backed client; one easy handle per request.
class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                 std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse delete_request(const std::string &url, const HttpHeaders &headers,
                                            std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_multipart(const std::string &url, const HttpHeaders &headers,
                                            const MultipartFile &file,
                                            std::uint64_t timeout_ms) override;
};

} // namespace sandcastle::providers
