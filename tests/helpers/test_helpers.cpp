#include "tests/helpers/test_helpers.hpp"

#include "sandcastle/common/fs.hpp"
#include "sandcastle/common/json_util.hpp"
#include "sandcastle/observability/global.hpp"

#include <fstream>
#include <memory>
#include <random>
#include <sstream>

namespace sandcastle::testing {

namespace {

std::string percent_decode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(value[i]);
    }
  }
  return out;
}

struct ParsedUrl {
  std::vector<std::string> segments;
  std::string query;
};

ParsedUrl parse_url(const std::string &url) {
  ParsedUrl parsed;
  std::string rest = url;
  const std::string base = kFakeDaytonaUrl;
  if (common::starts_with(rest, base)) {
    rest = rest.substr(base.size());
  }
  if (const auto q = rest.find('?'); q != std::string::npos) {
    parsed.query = rest.substr(q + 1);
    rest = rest.substr(0, q);
  }
  std::stringstream stream(rest);
  std::string segment;
  while (std::getline(stream, segment, '/')) {
    if (!segment.empty()) {
      parsed.segments.push_back(percent_decode(segment));
    }
  }
  return parsed;
}

providers::HttpResponse respond(const std::uint16_t status, std::string body) {
  providers::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  return response;
}

providers::HttpResponse not_found(const std::string &what) {
  return respond(404, "{\"message\":" + common::json_quote(what + " not found") + "}");
}

bool is_files_route(const std::vector<std::string> &seg) {
  return seg.size() >= 4 && seg[0] == "toolbox" && seg[2] == "toolbox" && seg[3] == "files";
}

std::string query_path(const std::string &query) {
  return common::starts_with(query, "path=") ? percent_decode(query.substr(5)) : std::string();
}

} // namespace

config::Config daytona_test_config() {
  config::Config config;
  config.sandbox.runtime = "daytona";
  config.daytona.api_key = "test-key";
  config.daytona.server_url = kFakeDaytonaUrl;
  config.daytona.target = "us";
  config.daytona.restart_settle_ms = 0;
  config.observability.backend = "noop";
  return config;
}

providers::HttpResponse FakeDaytonaBackend::get(const std::string &url,
                                                const providers::HttpHeaders &headers,
                                                std::uint64_t) {
  const auto parsed = parse_url(url);
  std::lock_guard<std::mutex> lock(mutex_);

  if (parsed.segments.size() == 1 && parsed.segments[0] == "sandbox") {
    remember("list", headers);
    if (auto failure = injected("list"); failure.has_value()) {
      return *failure;
    }
    std::string labels = "{}";
    if (common::starts_with(parsed.query, "labels=")) {
      labels = percent_decode(parsed.query.substr(7));
    }
    const std::string project = common::json_get_string(labels, "id");
    std::vector<std::string> items;
    for (const auto &[id, sandbox] : sandboxes_) {
      if (project.empty() || sandbox.project_id == project) {
        items.push_back(sandbox_json(sandbox));
      }
    }
    return respond(200, "[" + common::join(items, ",") + "]");
  }

  if (parsed.segments.size() == 2 && parsed.segments[0] == "sandbox") {
    remember("get", headers);
    if (auto failure = injected("get"); failure.has_value()) {
      return *failure;
    }
    const auto it = sandboxes_.find(parsed.segments[1]);
    if (it == sandboxes_.end()) {
      return not_found("sandbox");
    }
    return respond(200, sandbox_json(it->second));
  }

  if (parsed.segments.size() == 5 && parsed.segments[0] == "sandbox" &&
      parsed.segments[2] == "ports" && parsed.segments[4] == "preview-url") {
    remember("preview", headers);
    if (auto failure = injected("preview"); failure.has_value()) {
      return *failure;
    }
    if (sandboxes_.count(parsed.segments[1]) == 0) {
      return not_found("sandbox");
    }
    return respond(200, "{\"url\":\"https://" + parsed.segments[3] + "-" + parsed.segments[1] +
                            ".proxy.daytona.test\",\"token\":\"preview-token\"}");
  }

  if (is_files_route(parsed.segments)) {
    const bool download = parsed.segments.size() == 5 && parsed.segments[4] == "download";
    const std::string operation = download ? "download" : "list_files";
    remember(operation, headers);
    if (auto failure = injected(operation); failure.has_value()) {
      return *failure;
    }
    const auto it = sandboxes_.find(parsed.segments[1]);
    if (it == sandboxes_.end()) {
      return not_found("sandbox");
    }
    const std::string path = query_path(parsed.query);
    if (!download) {
      return list_directory(it->second, path);
    }
    const auto file = it->second.files.find(path);
    if (file == it->second.files.end()) {
      return not_found("file");
    }
    return respond(200, file->second);
  }
  return not_found("route");
}

providers::HttpResponse FakeDaytonaBackend::post_multipart(const std::string &url,
                                                           const providers::HttpHeaders &headers,
                                                           const providers::MultipartFile &file,
                                                           std::uint64_t) {
  const auto parsed = parse_url(url);
  std::lock_guard<std::mutex> lock(mutex_);
  remember("upload", headers);
  if (auto failure = injected("upload"); failure.has_value()) {
    return *failure;
  }
  if (!is_files_route(parsed.segments) || parsed.segments.size() != 5 ||
      parsed.segments[4] != "upload") {
    return not_found("route");
  }
  const auto it = sandboxes_.find(parsed.segments[1]);
  if (it == sandboxes_.end()) {
    return not_found("sandbox");
  }
  last_upload_field_ = file.field;
  it->second.files[query_path(parsed.query)] = file.content;
  return respond(200, "");
}

providers::HttpResponse FakeDaytonaBackend::list_directory(const Sandbox &sandbox,
                                                           const std::string &path) const {
  std::string prefix = path;
  if (prefix.empty() || prefix.back() != '/') {
    prefix += "/";
  }
  std::map<std::string, std::pair<bool, std::size_t>> children;
  for (const auto &[file_path, content] : sandbox.files) {
    if (!common::starts_with(file_path, prefix)) {
      continue;
    }
    const std::string rest = file_path.substr(prefix.size());
    const auto slash = rest.find('/');
    if (slash == std::string::npos) {
      children[rest] = {false, content.size()};
    } else {
      children[rest.substr(0, slash)] = {true, 0};
    }
  }
  if (children.empty()) {
    return not_found("directory");
  }
  std::vector<std::string> items;
  for (const auto &[name, info] : children) {
    items.push_back("{\"name\":" + common::json_quote(name) +
                    ",\"isDir\":" + (info.first ? "true" : "false") +
                    ",\"size\":" + std::to_string(info.second) +
                    ",\"modTime\":\"2025-01-01T00:00:00Z\"}");
  }
  return respond(200, "[" + common::join(items, ",") + "]");
}

providers::HttpResponse FakeDaytonaBackend::post_json(const std::string &url,
                                                      const providers::HttpHeaders &headers,
                                                      const std::string &body, std::uint64_t) {
  const auto parsed = parse_url(url);
  const auto &seg = parsed.segments;
  std::lock_guard<std::mutex> lock(mutex_);

  if (seg.size() == 1 && seg[0] == "sandbox") {
    remember("create", headers);
    last_create_body_ = body;
    if (auto failure = injected("create"); failure.has_value()) {
      return *failure;
    }
    Sandbox sandbox;
    sandbox.id = "sb-" + std::to_string(next_id_++);
    const auto fields = common::json_parse_flat(body);
    if (const auto labels = fields.find("labels"); labels != fields.end()) {
      if (auto project = common::json_get_string(labels->second, "id"); !project.empty()) {
        sandbox.project_id = std::move(project);
      }
    }
    const std::string json = sandbox_json(sandbox);
    sandboxes_[sandbox.id] = std::move(sandbox);
    return respond(200, json);
  }

  if (seg.size() == 3 && seg[0] == "sandbox" && seg[2] == "start") {
    remember("start", headers);
    if (auto failure = injected("start"); failure.has_value()) {
      return *failure;
    }
    const auto it = sandboxes_.find(seg[1]);
    if (it == sandboxes_.end()) {
      return not_found("sandbox");
    }
    it->second.state = state_after_start_;
    return respond(200, "{}");
  }

  if (seg.size() >= 5 && seg[0] == "toolbox" && seg[2] == "toolbox" && seg[3] == "process" &&
      seg[4] == "session") {
    const auto it = sandboxes_.find(seg[1]);
    if (seg.size() == 5) {
      remember("session", headers);
      if (auto failure = injected("session"); failure.has_value()) {
        return *failure;
      }
      if (it == sandboxes_.end()) {
        return not_found("sandbox");
      }
      const std::string session = common::json_get_string(body, "sessionId");
      if (!it->second.sessions.insert(session).second) {
        return respond(409, "{\"message\":\"Session " + session + " already exists\"}");
      }
      return respond(200, "");
    }
    if (seg.size() == 7 && seg[6] == "exec") {
      remember("exec", headers);
      if (auto failure = injected("exec"); failure.has_value()) {
        return *failure;
      }
      if (it == sandboxes_.end()) {
        return not_found("sandbox");
      }
      if (it->second.sessions.count(seg[5]) == 0) {
        return not_found("session");
      }
      return run_command(it->second, seg[5], body);
    }
  }
  return not_found("route");
}

providers::HttpResponse FakeDaytonaBackend::delete_request(const std::string &url,
                                                           const providers::HttpHeaders &headers,
                                                           std::uint64_t) {
  const auto parsed = parse_url(url);
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_files_route(parsed.segments)) {
    remember("delete_file", headers);
    if (auto failure = injected("delete_file"); failure.has_value()) {
      return *failure;
    }
    const auto it = sandboxes_.find(parsed.segments[1]);
    if (it == sandboxes_.end()) {
      return not_found("sandbox");
    }
    if (it->second.files.erase(query_path(parsed.query)) == 0) {
      return not_found("file");
    }
    return respond(200, "");
  }
  remember("delete", headers);
  if (auto failure = injected("delete"); failure.has_value()) {
    return *failure;
  }
  if (parsed.segments.size() != 2 || parsed.segments[0] != "sandbox" ||
      parsed.query != "force=true") {
    return respond(400, "{\"message\":\"bad delete request\"}");
  }
  if (sandboxes_.erase(parsed.segments[1]) == 0) {
    return not_found("sandbox");
  }
  return respond(200, "");
}

providers::HttpResponse FakeDaytonaBackend::run_command(Sandbox &sandbox,
                                                        const std::string &session,
                                                        const std::string &body) {
  const std::string command = common::trim(common::json_get_string(body, "command"));
  const bool async_exec = common::json_get_bool(body, "async", false);
  sandbox.commands.emplace_back(session, command);
  const std::string cmd_id = "cmd-" + std::to_string(next_command_++);

  if (async_exec) {
    return respond(200, "{\"cmdId\":" + common::json_quote(cmd_id) +
                            ",\"output\":null,\"exitCode\":null}");
  }

  auto &env = sandbox.session_env[session];
  std::string output;
  int exit_code = 0;
  if (common::starts_with(command, "export ")) {
    const std::string assignment = command.substr(7);
    if (const auto eq = assignment.find('='); eq != std::string::npos) {
      env[assignment.substr(0, eq)] = assignment.substr(eq + 1);
    }
  } else if (common::starts_with(command, "exit ")) {
    exit_code = std::stoi(command.substr(5));
  } else if (common::starts_with(command, "echo $")) {
    const auto it = env.find(command.substr(6));
    output = (it == env.end() ? std::string() : it->second) + "\n";
  } else if (common::starts_with(command, "echo ")) {
    output = command.substr(5) + "\n";
  }

  return respond(200, "{\"cmdId\":" + common::json_quote(cmd_id) +
                          ",\"output\":" + common::json_quote(output) +
                          ",\"exitCode\":" + std::to_string(exit_code) + "}");
}

std::string FakeDaytonaBackend::sandbox_json(const Sandbox &sandbox) const {
  std::ostringstream out;
  out << "{\"id\":" << common::json_quote(sandbox.id)
      << ",\"state\":" << common::json_quote(sandbox.state) << ",\"labels\":";
  if (sandbox.project_id.has_value()) {
    out << common::json_string_object({{"id", *sandbox.project_id}});
  } else {
    out << "{}";
  }
  out << "}";
  return out.str();
}

std::string FakeDaytonaBackend::add_sandbox(const std::string &state,
                                            const std::optional<std::string> &project_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Sandbox sandbox;
  sandbox.id = "sb-" + std::to_string(next_id_++);
  sandbox.state = state;
  sandbox.project_id = project_id;
  const std::string id = sandbox.id;
  sandboxes_[id] = std::move(sandbox);
  return id;
}

void FakeDaytonaBackend::set_state(const std::string &id, const std::string &state) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto it = sandboxes_.find(id); it != sandboxes_.end()) {
    it->second.state = state;
  }
}

void FakeDaytonaBackend::set_state_after_start(std::string state) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_after_start_ = std::move(state);
}

void FakeDaytonaBackend::fail(const std::string &operation, const std::uint16_t status,
                              std::string body) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_[operation] = respond(status, std::move(body));
}

void FakeDaytonaBackend::fail_network(const std::string &operation) {
  std::lock_guard<std::mutex> lock(mutex_);
  providers::HttpResponse response;
  response.network_error = true;
  response.network_error_message = "Could not resolve host: daytona.test";
  failures_[operation] = std::move(response);
}

void FakeDaytonaBackend::clear_failures() {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_.clear();
}

std::optional<FakeDaytonaBackend::Sandbox>
FakeDaytonaBackend::sandbox(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto it = sandboxes_.find(id); it != sandboxes_.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool FakeDaytonaBackend::has_session(const std::string &id, const std::string &session) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sandboxes_.find(id);
  return it != sandboxes_.end() && it->second.sessions.count(session) > 0;
}

std::size_t FakeDaytonaBackend::count(const std::string &operation) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = counts_.find(operation);
  return it == counts_.end() ? 0 : it->second;
}

std::string FakeDaytonaBackend::last_create_body() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_create_body_;
}

std::string FakeDaytonaBackend::last_authorization() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_authorization_;
}

std::string FakeDaytonaBackend::last_upload_field() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_upload_field_;
}

std::optional<providers::HttpResponse> FakeDaytonaBackend::injected(const std::string &operation) {
  if (const auto it = failures_.find(operation); it != failures_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void FakeDaytonaBackend::remember(const std::string &operation,
                                  const providers::HttpHeaders &headers) {
  ++counts_[operation];
  if (const auto it = headers.find("Authorization"); it != headers.end()) {
    last_authorization_ = it->second;
  }
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ScopedRecordingObserver::ScopedRecordingObserver() {
  auto observer = std::make_unique<RecordingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ScopedRecordingObserver::~ScopedRecordingObserver() { observability::set_global_observer(nullptr); }

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("sandcastle-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

config::Config temp_config(const TempWorkspace &workspace) {
  auto config = daytona_test_config();
  config.e2b.base_path = (workspace.path() / "sandbox").string();
  return config;
}

} // namespace sandcastle::testing
