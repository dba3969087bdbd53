#include "sandcastle/providers/daytona.hpp"

#include "sandcastle/common/fs.hpp"
#include "sandcastle/common/json_util.hpp"
#include "sandcastle/observability/global.hpp"

#include <charconv>
#include <chrono>
#include <sstream>
#include <thread>

namespace sandcastle::providers {

namespace {

constexpr const char *kRuntime = "daytona";

template <typename Fn> HttpResponse timed(const std::string &operation, Fn &&send) {
  const auto started = std::chrono::steady_clock::now();
  HttpResponse response = send();
  observability::record_backend_latency(
      kRuntime, operation,
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started));
  return response;
}

std::string backend_message(const HttpResponse &response) {
  if (auto message = common::json_get_string(response.body, "message"); !message.empty()) {
    return message;
  }
  if (auto error = common::json_get_string(response.body, "error"); !error.empty()) {
    return error;
  }
  const std::string body = common::trim(response.body);
  return body.empty() ? "no response body" : body;
}

common::Status check_response(const HttpResponse &response, const std::string &operation) {
  if (response.network_error) {
    return common::Status::error("daytona " + operation + " failed: " +
                                     (response.timeout ? std::string("request timed out: ")
                                                       : std::string()) +
                                     response.network_error_message,
                                 common::ErrorCode::Backend);
  }
  if (response.status >= 200 && response.status < 300) {
    return common::Status::success();
  }

  const std::string message = "daytona " + operation + " failed (HTTP " +
                              std::to_string(response.status) + "): " + backend_message(response);
  if (response.status == 401 || response.status == 403) {
    return common::Status::error(message, common::ErrorCode::Config);
  }
  if (response.status == 404) {
    return common::Status::error(message, common::ErrorCode::NotFound);
  }
  return common::Status::error(message, common::ErrorCode::Backend);
}

common::Result<SandboxHandle> parse_handle(const std::string &body) {
  const auto fields = common::json_parse_flat(body);
  const auto id = fields.find("id");
  if (id == fields.end() || id->second.empty()) {
    return common::Result<SandboxHandle>::failure("daytona response is missing a sandbox id",
                                                  common::ErrorCode::Backend);
  }

  SandboxHandle handle;
  handle.id = id->second;
  handle.runtime = kRuntime;
  if (const auto state = fields.find("state"); state != fields.end()) {
    handle.state = parse_sandbox_state(state->second);
  }
  if (const auto labels = fields.find("labels"); labels != fields.end()) {
    if (auto project = common::json_get_string(labels->second, "id"); !project.empty()) {
      handle.project_id = std::move(project);
    }
  }
  handle.payload = body;
  return common::Result<SandboxHandle>::success(std::move(handle));
}

std::optional<int> parse_exit_code(const common::JsonFlatMap &fields) {
  const auto it = fields.find("exitCode");
  if (it == fields.end() || it->second.empty() || it->second == "null") {
    return std::nullopt;
  }
  int value = 0;
  const auto *first = it->second.data();
  const auto *last = first + it->second.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

common::Result<SandboxHandle> as_handle_failure(const common::Status &status) {
  return common::Result<SandboxHandle>::failure(status.error(), status.code());
}

common::Status require_path(const std::string &path) {
  if (common::trim(path).empty()) {
    return common::Status::error("file path is empty", common::ErrorCode::InvalidArgument);
  }
  return common::Status::success();
}

std::uint64_t parse_size(const std::string &raw) {
  std::uint64_t value = 0;
  const auto *first = raw.data();
  (void)std::from_chars(first, first + raw.size(), value);
  return value;
}

std::string base_name(const std::string &path) {
  const auto slash = path.find_last_of('/');
  const std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
  return name.empty() ? "upload" : name;
}

} // namespace

std::vector<std::string> missing_daytona_configuration(const config::DaytonaConfig &config) {
  std::vector<std::string> missing;
  if (common::trim(config.api_key).empty()) {
    missing.emplace_back("daytona.api_key");
  }
  if (common::trim(config.server_url).empty()) {
    missing.emplace_back("daytona.server_url");
  }
  if (common::trim(config.target).empty()) {
    missing.emplace_back("daytona.target");
  }
  return missing;
}

DaytonaProvider::DaytonaProvider(config::DaytonaConfig config,
                                 std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), base_url_(common::trim(config_.server_url)),
      http_client_(std::move(http_client)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string DaytonaProvider::sandbox_url(const std::string &sandbox_id) const {
  return base_url_ + "/sandbox/" + common::url_encode(sandbox_id);
}

std::string DaytonaProvider::session_url(const std::string &sandbox_id) const {
  return base_url_ + "/toolbox/" + common::url_encode(sandbox_id) + "/toolbox/process/session";
}

std::string DaytonaProvider::files_url(const std::string &sandbox_id, const std::string &action,
                                       const std::string &path) const {
  std::string url = base_url_ + "/toolbox/" + common::url_encode(sandbox_id) + "/toolbox/files";
  if (!action.empty()) {
    url += "/" + action;
  }
  return url + "?path=" + common::url_encode(path);
}

HttpHeaders DaytonaProvider::auth_headers() const {
  return {{"Authorization", "Bearer " + config_.api_key},
          {"Accept", "application/json"},
          {"X-Daytona-Source", "sandcastle"}};
}

std::string
DaytonaProvider::build_create_body(const std::string &password,
                                   const std::optional<std::string> &project_id) const {
  const std::string env = common::json_string_object({
      {"CHROME_PERSISTENT_SESSION", "true"},
      {"RESOLUTION", "1024x768x24"},
      {"RESOLUTION_WIDTH", "1024"},
      {"RESOLUTION_HEIGHT", "768"},
      {"VNC_PASSWORD", password},
      {"ANONYMIZED_TELEMETRY", "false"},
      {"CHROME_PATH", ""},
      {"CHROME_USER_DATA", ""},
      {"CHROME_DEBUGGING_PORT", "9222"},
      {"CHROME_DEBUGGING_HOST", "localhost"},
      {"CHROME_CDP", ""},
  });

  std::ostringstream body;
  body << "{";
  body << "\"image\":" << common::json_quote(config_.image) << ",";
  body << "\"public\":" << (config_.public_access ? "true" : "false") << ",";
  body << "\"target\":" << common::json_quote(config_.target) << ",";
  body << "\"cpu\":" << config_.cpu << ",";
  body << "\"memory\":" << config_.memory_gb << ",";
  body << "\"disk\":" << config_.disk_gb << ",";
  if (project_id.has_value()) {
    body << "\"labels\":" << common::json_string_object({{"id", *project_id}}) << ",";
  }
  body << "\"env\":" << env;
  body << "}";
  return body.str();
}

common::Status DaytonaProvider::warmup() {
  const auto response = timed("warmup", [&] {
    return http_client_->get(base_url_ + "/sandbox?labels=" + common::url_encode("{}"),
                             auth_headers(), config_.request_timeout_ms);
  });
  return check_response(response, "handshake");
}

common::Result<SandboxHandle> DaytonaProvider::create(const std::string &password,
                                                      const std::optional<std::string> &project_id) {
  const std::string body = build_create_body(password, project_id);
  const auto response = timed("create", [&] {
    return http_client_->post_json(base_url_ + "/sandbox", auth_headers(), body,
                                   config_.request_timeout_ms);
  });
  if (auto status = check_response(response, "create sandbox"); !status.ok()) {
    observability::record_error(kRuntime, status.error());
    return as_handle_failure(status);
  }

  auto parsed = parse_handle(response.body);
  if (!parsed.ok()) {
    observability::record_error(kRuntime, parsed.error());
    return parsed;
  }
  SandboxHandle handle = std::move(parsed.value());
  if (!handle.project_id.has_value()) {
    handle.project_id = project_id;
  }
  observability::record_sandbox_lifecycle(kRuntime, handle.id, "create",
                                          std::string(to_string(handle.state)));

  if (auto bootstrap = start_supervisord_session(handle); !bootstrap.ok()) {
    return as_handle_failure(bootstrap);
  }
  return common::Result<SandboxHandle>::success(std::move(handle));
}

common::Result<SandboxHandle> DaytonaProvider::start(const SandboxHandle &handle) {
  const auto response = timed("start", [&] {
    return http_client_->post_json(sandbox_url(handle.id) + "/start", auth_headers(), "{}",
                                   config_.request_timeout_ms);
  });
  if (auto status = check_response(response, "start sandbox " + handle.id); !status.ok()) {
    observability::record_error(kRuntime, status.error());
    return as_handle_failure(status);
  }

  SandboxHandle started = handle;
  started.state = SandboxState::Running;
  observability::record_sandbox_lifecycle(kRuntime, started.id, "start", "running");
  return common::Result<SandboxHandle>::success(std::move(started));
}

common::Result<SandboxHandle> DaytonaProvider::get_current_sandbox(const std::string &sandbox_id) {
  if (sandbox_id.empty()) {
    return common::Result<SandboxHandle>::failure("sandbox id is empty",
                                                  common::ErrorCode::InvalidArgument);
  }
  const auto response = timed("get", [&] {
    return http_client_->get(sandbox_url(sandbox_id), auth_headers(), config_.request_timeout_ms);
  });
  if (auto status = check_response(response, "get sandbox " + sandbox_id); !status.ok()) {
    if (status.code() != common::ErrorCode::NotFound) {
      observability::record_error(kRuntime, status.error());
    }
    return as_handle_failure(status);
  }
  return parse_handle(response.body);
}

common::Result<SandboxHandle> DaytonaProvider::ensure_running(const std::string &sandbox_id) {
  auto current = get_current_sandbox(sandbox_id);
  if (!current.ok()) {
    return current;
  }
  const SandboxState state = current.value().state;
  if (state != SandboxState::Archived && state != SandboxState::Stopped) {
    return current;
  }

  observability::record_sandbox_lifecycle(kRuntime, sandbox_id, "restart",
                                          std::string(to_string(state)));
  if (auto started = start(current.value()); !started.ok()) {
    return started;
  }
  if (config_.restart_settle_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.restart_settle_ms));
  }

  auto refreshed = get_current_sandbox(sandbox_id);
  if (!refreshed.ok()) {
    return refreshed;
  }
  if (auto bootstrap = start_supervisord_session(refreshed.value()); !bootstrap.ok()) {
    return as_handle_failure(bootstrap);
  }
  return refreshed;
}

common::Status DaytonaProvider::create_session(const std::string &sandbox_id,
                                               const std::string &session) {
  const std::string body = common::json_string_object({{"sessionId", session}});
  const auto response = timed("create_session", [&] {
    return http_client_->post_json(session_url(sandbox_id), auth_headers(), body,
                                   config_.request_timeout_ms);
  });
  if (!response.network_error && response.status == 409) {
    return common::Status::success();
  }
  auto status = check_response(response, "create session " + session);
  if (!status.ok() && !response.network_error &&
      common::to_lower(backend_message(response)).find("already exists") != std::string::npos) {
    return common::Status::success();
  }
  return status;
}

common::Result<ExecutionResult> DaytonaProvider::run_session_command(const std::string &sandbox_id,
                                                                     const std::string &session,
                                                                     const std::string &command,
                                                                     const bool async_exec) {
  std::ostringstream body;
  body << "{\"command\":" << common::json_quote(command)
       << ",\"async\":" << (async_exec ? "true" : "false") << "}";

  const auto response = timed("exec", [&] {
    return http_client_->post_json(session_url(sandbox_id) + "/" + common::url_encode(session) +
                                       "/exec",
                                   auth_headers(), body.str(), config_.command_timeout_ms);
  });
  if (auto status = check_response(response, "exec in session " + session); !status.ok()) {
    return common::Result<ExecutionResult>::failure(status.error(), status.code());
  }

  const auto fields = common::json_parse_flat(response.body);
  ExecutionResult result;
  if (const auto it = fields.find("cmdId"); it != fields.end() && it->second != "null") {
    result.command_id = it->second;
  }
  if (const auto it = fields.find("output"); it != fields.end() && it->second != "null") {
    result.stdout_text = it->second;
  }
  result.exit_code = parse_exit_code(fields);
  result.completed = !async_exec;
  return common::Result<ExecutionResult>::success(std::move(result));
}

common::Result<ExecutionResult> DaytonaProvider::exec(const SandboxHandle &handle,
                                                      const ExecutionRequest &request) {
  const std::string session = request.session_or_default();
  const auto started = std::chrono::steady_clock::now();

  if (auto status = create_session(handle.id, session); !status.ok()) {
    observability::record_error(kRuntime, status.error());
    return common::Result<ExecutionResult>::failure(status.error(), status.code());
  }

  auto result = run_session_command(handle.id, session, request.command, request.async_exec);
  if (!result.ok()) {
    observability::record_error(kRuntime, result.error());
    return result;
  }
  observability::record_command_exec(
      kRuntime, handle.id, session, request.async_exec,
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started),
      result.value().exit_code);
  return result;
}

common::Status DaytonaProvider::start_supervisord_session(const SandboxHandle &handle) {
  if (auto status = create_session(handle.id, kBootstrapSession); !status.ok()) {
    const std::string message =
        "failed to start supervisord session for " + handle.id + ": " + status.error();
    observability::record_error(kRuntime, message);
    return common::Status::error(message, common::ErrorCode::Bootstrap);
  }

  auto submitted = run_session_command(handle.id, kBootstrapSession, config_.entrypoint, true);
  if (!submitted.ok()) {
    const std::string message =
        "failed to launch supervisord in " + handle.id + ": " + submitted.error();
    observability::record_error(kRuntime, message);
    return common::Status::error(message, common::ErrorCode::Bootstrap);
  }
  observability::record_sandbox_lifecycle(kRuntime, handle.id, "bootstrap",
                                          std::string(to_string(handle.state)));
  return common::Status::success();
}

common::Status DaytonaProvider::remove(const std::string &sandbox_id) {
  const auto response = timed("delete", [&] {
    return http_client_->delete_request(sandbox_url(sandbox_id) + "?force=true", auth_headers(),
                                        config_.request_timeout_ms);
  });
  auto status = check_response(response, "delete sandbox " + sandbox_id);
  if (!status.ok() && status.code() != common::ErrorCode::NotFound) {
    observability::record_error(kRuntime, status.error());
    return status;
  }
  observability::record_sandbox_lifecycle(kRuntime, sandbox_id, "delete", "destroyed");
  return common::Status::success();
}

common::Status DaytonaProvider::upload_file(const SandboxHandle &handle, const std::string &path,
                                            const std::string &content) {
  if (auto valid = require_path(path); !valid.ok()) {
    return valid;
  }
  const MultipartFile file{.field = "file", .filename = base_name(path), .content = content};
  const auto response = timed("upload", [&] {
    return http_client_->post_multipart(files_url(handle.id, "upload", path), auth_headers(), file,
                                        config_.request_timeout_ms);
  });
  auto status = check_response(response, "upload " + path);
  if (!status.ok()) {
    observability::record_error(kRuntime, status.error());
  }
  return status;
}

common::Result<std::string> DaytonaProvider::download_file(const SandboxHandle &handle,
                                                           const std::string &path) {
  if (auto valid = require_path(path); !valid.ok()) {
    return common::Result<std::string>::failure(valid.error(), valid.code());
  }
  HttpHeaders headers = auth_headers();
  headers["Accept"] = "application/octet-stream";
  const auto response = timed("download", [&] {
    return http_client_->get(files_url(handle.id, "download", path), headers,
                             config_.request_timeout_ms);
  });
  if (auto status = check_response(response, "download " + path); !status.ok()) {
    if (status.code() != common::ErrorCode::NotFound) {
      observability::record_error(kRuntime, status.error());
    }
    return common::Result<std::string>::failure(status.error(), status.code());
  }
  return common::Result<std::string>::success(response.body);
}

common::Result<std::vector<FileInfo>> DaytonaProvider::list_files(const SandboxHandle &handle,
                                                                  const std::string &path) {
  using Listing = common::Result<std::vector<FileInfo>>;
  if (auto valid = require_path(path); !valid.ok()) {
    return Listing::failure(valid.error(), valid.code());
  }
  const auto response = timed("list_files", [&] {
    return http_client_->get(files_url(handle.id, "", path), auth_headers(),
                             config_.request_timeout_ms);
  });
  if (auto status = check_response(response, "list files in " + path); !status.ok()) {
    if (status.code() != common::ErrorCode::NotFound) {
      observability::record_error(kRuntime, status.error());
    }
    return Listing::failure(status.error(), status.code());
  }

  std::vector<FileInfo> files;
  for (const auto &object : common::json_split_top_level_objects(common::trim(response.body))) {
    const auto fields = common::json_parse_flat(object);
    FileInfo info;
    if (const auto it = fields.find("name"); it != fields.end()) {
      info.name = it->second;
    }
    if (const auto it = fields.find("isDir"); it != fields.end()) {
      info.is_dir = it->second == "true";
    }
    if (const auto it = fields.find("size"); it != fields.end()) {
      info.size = parse_size(it->second);
    }
    if (const auto it = fields.find("modTime"); it != fields.end()) {
      info.mod_time = it->second;
    }
    files.push_back(std::move(info));
  }
  return Listing::success(std::move(files));
}

common::Status DaytonaProvider::delete_file(const SandboxHandle &handle, const std::string &path) {
  if (auto valid = require_path(path); !valid.ok()) {
    return valid;
  }
  const auto response = timed("delete_file", [&] {
    return http_client_->delete_request(files_url(handle.id, "", path), auth_headers(),
                                        config_.request_timeout_ms);
  });
  auto status = check_response(response, "delete file " + path);
  if (!status.ok() && status.code() != common::ErrorCode::NotFound) {
    observability::record_error(kRuntime, status.error());
  }
  return status;
}

common::Result<std::string> DaytonaProvider::get_preview_link(const SandboxHandle &handle,
                                                              const std::uint16_t port) {
  if (port == 0) {
    return common::Result<std::string>::failure("preview port must be between 1 and 65535",
                                                common::ErrorCode::InvalidArgument);
  }
  const auto response = timed("preview", [&] {
    return http_client_->get(sandbox_url(handle.id) + "/ports/" + std::to_string(port) +
                                 "/preview-url",
                             auth_headers(), config_.request_timeout_ms);
  });
  if (auto status = check_response(response, "preview link for port " + std::to_string(port));
      !status.ok()) {
    observability::record_error(kRuntime, status.error());
    return common::Result<std::string>::failure(status.error(), status.code());
  }
  std::string url = common::json_get_string(response.body, "url");
  if (url.empty()) {
    return common::Result<std::string>::failure("daytona preview response is missing a url",
                                                common::ErrorCode::Backend);
  }
  return common::Result<std::string>::success(std::move(url));
}

common::Result<std::vector<SandboxHandle>>
DaytonaProvider::find_by_project(const std::string &project_id) {
  using Handles = common::Result<std::vector<SandboxHandle>>;
  const std::string labels = common::json_string_object({{"id", project_id}});
  const auto response = timed("list", [&] {
    return http_client_->get(base_url_ + "/sandbox?labels=" + common::url_encode(labels),
                             auth_headers(), config_.request_timeout_ms);
  });
  if (auto status = check_response(response, "list sandboxes"); !status.ok()) {
    observability::record_error(kRuntime, status.error());
    return Handles::failure(status.error(), status.code());
  }

  std::vector<SandboxHandle> handles;
  for (const auto &object : common::json_split_top_level_objects(common::trim(response.body))) {
    auto parsed = parse_handle(object);
    if (parsed.ok()) {
      handles.push_back(std::move(parsed.value()));
    }
  }
  return Handles::success(std::move(handles));
}

} // namespace sandcastle::providers
