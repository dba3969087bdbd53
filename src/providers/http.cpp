#include "sandcastle/providers/http.hpp"

#include "sandcastle/common/fs.hpp"

#include <curl/curl.h>

#include <optional>

namespace sandcastle::providers {

namespace {

enum class Method { Get, Post, Delete, Multipart };

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    (*headers)[key] = common::trim(header.substr(separator + 1));
  }
  return total;
}

HttpResponse execute_request(const Method method, const std::string &url,
                             const HttpHeaders &headers, const std::optional<std::string> &body,
                             const std::uint64_t timeout_ms, const MultipartFile *file = nullptr) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "Sandcastle/0.1");

  curl_mime *mime = nullptr;
  switch (method) {
  case Method::Get:
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    break;
  case Method::Post:
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    if (body.has_value()) {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    } else {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
    }
    break;
  case Method::Delete:
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    break;
  case Method::Multipart:
    mime = curl_mime_init(curl);
    if (file != nullptr) {
      curl_mimepart *part = curl_mime_addpart(mime);
      curl_mime_name(part, file->field.c_str());
      curl_mime_filename(part, file->filename.c_str());
      curl_mime_data(part, file->content.data(), file->content.size());
    }
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    break;
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  if (mime != nullptr) {
    curl_mime_free(mime);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::get(const std::string &url, const HttpHeaders &headers,
                                 const std::uint64_t timeout_ms) {
  return execute_request(Method::Get, url, headers, std::nullopt, timeout_ms);
}

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  HttpHeaders with_content_type = headers;
  if (!with_content_type.contains("Content-Type")) {
    with_content_type["Content-Type"] = "application/json";
  }
  return execute_request(Method::Post, url, with_content_type, body, timeout_ms);
}

HttpResponse CurlHttpClient::delete_request(const std::string &url, const HttpHeaders &headers,
                                            const std::uint64_t timeout_ms) {
  return execute_request(Method::Delete, url, headers, std::nullopt, timeout_ms);
}

HttpResponse CurlHttpClient::post_multipart(const std::string &url, const HttpHeaders &headers,
                                            const MultipartFile &file,
                                            const std::uint64_t timeout_ms) {
  return execute_request(Method::Multipart, url, headers, std::nullopt, timeout_ms, &file);
}

} // namespace sandcastle::providers
