#include "sandcastle/providers/e2b.hpp"

#include "sandcastle/common/fs.hpp"
#include "sandcastle/common/process.hpp"
#include "sandcastle/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>

namespace sandcastle::providers {

namespace {

constexpr const char *kRuntime = "e2b";

} // namespace

E2bProvider::E2bProvider(config::E2bConfig config)
    : config_(std::move(config)), base_path_(config_.base_path) {}

SandboxHandle E2bProvider::make_handle(const std::string &sandbox_id,
                                       const std::optional<std::string> &project_id) const {
  SandboxHandle handle;
  handle.id = sandbox_id;
  handle.runtime = kRuntime;
  handle.state = SandboxState::Running;
  handle.project_id = project_id;
  return handle;
}

common::Result<SandboxHandle> E2bProvider::create(const std::string &password,
                                                  const std::optional<std::string> &project_id) {
  (void)password;
  auto handle = make_handle(base_path_.string(), project_id);
  observability::record_sandbox_lifecycle(kRuntime, handle.id, "create", "running");
  return common::Result<SandboxHandle>::success(std::move(handle));
}

common::Result<SandboxHandle> E2bProvider::start(const SandboxHandle &handle) {
  return common::Result<SandboxHandle>::success(handle);
}

common::Result<SandboxHandle> E2bProvider::get_current_sandbox(const std::string &sandbox_id) {
  return common::Result<SandboxHandle>::success(make_handle(sandbox_id, std::nullopt));
}

common::Result<SandboxHandle> E2bProvider::ensure_running(const std::string &sandbox_id) {
  return get_current_sandbox(sandbox_id);
}

common::Status E2bProvider::remove(const std::string &sandbox_id) {
  observability::record_sandbox_lifecycle(kRuntime, sandbox_id, "delete", "running");
  return common::Status::success();
}

common::Result<ExecutionResult> E2bProvider::exec(const SandboxHandle &handle,
                                                  const ExecutionRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  auto ran = common::run_shell_command(request.command, base_path_,
                                       std::chrono::milliseconds(config_.command_timeout_ms));
  if (!ran.ok()) {
    observability::record_error(kRuntime, ran.error());
    return common::Result<ExecutionResult>::failure(ran.error(), ran.code());
  }

  auto &process = ran.value();
  ExecutionResult result;
  result.stdout_text = std::move(process.stdout_text);
  result.stderr_text = std::move(process.stderr_text);
  result.exit_code = process.exit_code;
  if (process.timed_out) {
    result.stderr_text += "command timed out after " +
                          std::to_string(config_.command_timeout_ms) + " ms\n";
  }

  observability::record_command_exec(
      kRuntime, handle.id, request.session_or_default(), false,
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started),
      result.exit_code);
  return common::Result<ExecutionResult>::success(std::move(result));
}

common::Result<std::filesystem::path> E2bProvider::resolve(const std::string &path) const {
  using Resolved = common::Result<std::filesystem::path>;
  if (common::trim(path).empty()) {
    return Resolved::failure("file path is empty", common::ErrorCode::InvalidArgument);
  }
  if (path.find('\0') != std::string::npos) {
    return Resolved::failure("file path contains a null byte", common::ErrorCode::InvalidArgument);
  }

  std::filesystem::path candidate(path);
  if (candidate.is_relative()) {
    candidate = base_path_ / candidate;
  }
  std::error_code ec;
  const auto canonical_candidate = std::filesystem::weakly_canonical(candidate, ec);
  if (ec) {
    return Resolved::failure("cannot resolve " + path + ": " + ec.message(),
                             common::ErrorCode::InvalidArgument);
  }
  const auto canonical_base = std::filesystem::weakly_canonical(base_path_, ec);
  if (ec) {
    return Resolved::failure("cannot resolve base path: " + ec.message(),
                             common::ErrorCode::Config);
  }
  if (!common::is_subpath(canonical_candidate, canonical_base)) {
    return Resolved::failure("path escapes the sandbox base path: " + path,
                             common::ErrorCode::InvalidArgument);
  }
  return Resolved::success(canonical_candidate);
}

common::Status E2bProvider::upload_file(const SandboxHandle &handle, const std::string &path,
                                        const std::string &content) {
  (void)handle;
  auto target = resolve(path);
  if (!target.ok()) {
    return common::Status::error(target.error(), target.code());
  }

  std::error_code ec;
  std::filesystem::create_directories(target.value().parent_path(), ec);
  if (ec) {
    return common::Status::error("failed to create parent directory for " + path + ": " +
                                 ec.message());
  }

  const std::string temp_path = target.value().string() + ".tmp";
  std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return common::Status::error("failed to open " + temp_path + " for writing");
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  if (!out) {
    return common::Status::error("failed to write " + temp_path);
  }
  std::filesystem::rename(temp_path, target.value(), ec);
  if (ec) {
    return common::Status::error("failed to replace " + path + ": " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::string> E2bProvider::download_file(const SandboxHandle &handle,
                                                       const std::string &path) {
  (void)handle;
  auto source = resolve(path);
  if (!source.ok()) {
    return common::Result<std::string>::failure(source.error(), source.code());
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(source.value(), ec)) {
    return common::Result<std::string>::failure("file not found: " + path,
                                                common::ErrorCode::NotFound);
  }
  std::ifstream in(source.value(), std::ios::binary);
  if (!in) {
    return common::Result<std::string>::failure("failed to open " + path);
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return common::Result<std::string>::success(std::move(content));
}

common::Result<std::vector<FileInfo>> E2bProvider::list_files(const SandboxHandle &handle,
                                                              const std::string &path) {
  using Listing = common::Result<std::vector<FileInfo>>;
  (void)handle;
  auto directory = resolve(path);
  if (!directory.ok()) {
    return Listing::failure(directory.error(), directory.code());
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(directory.value(), ec)) {
    return Listing::failure("directory not found: " + path, common::ErrorCode::NotFound);
  }

  std::vector<FileInfo> files;
  for (const auto &entry : std::filesystem::directory_iterator(directory.value(), ec)) {
    FileInfo info;
    std::error_code entry_ec;
    info.name = entry.path().filename().string();
    info.is_dir = entry.is_directory(entry_ec);
    if (!info.is_dir && entry.is_regular_file(entry_ec)) {
      info.size = entry.file_size(entry_ec);
    }
    const auto written = entry.last_write_time(entry_ec);
    if (!entry_ec) {
      info.mod_time = common::format_rfc3339(std::chrono::file_clock::to_sys(written));
    }
    files.push_back(std::move(info));
  }
  if (ec) {
    return Listing::failure("failed to list " + path + ": " + ec.message());
  }
  std::sort(files.begin(), files.end(),
            [](const FileInfo &a, const FileInfo &b) { return a.name < b.name; });
  return Listing::success(std::move(files));
}

common::Status E2bProvider::delete_file(const SandboxHandle &handle, const std::string &path) {
  (void)handle;
  auto target = resolve(path);
  if (!target.ok()) {
    return common::Status::error(target.error(), target.code());
  }
  std::error_code ec;
  if (target.value() == std::filesystem::weakly_canonical(base_path_, ec)) {
    return common::Status::error("refusing to delete the sandbox base path",
                                 common::ErrorCode::InvalidArgument);
  }
  if (!std::filesystem::exists(target.value(), ec)) {
    return common::Status::error("file not found: " + path, common::ErrorCode::NotFound);
  }
  std::filesystem::remove_all(target.value(), ec);
  if (ec) {
    return common::Status::error("failed to delete " + path + ": " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::string> E2bProvider::get_preview_link(const SandboxHandle &handle,
                                                          const std::uint16_t port) {
  (void)handle;
  if (port == 0) {
    return common::Result<std::string>::failure("preview port must be between 1 and 65535",
                                                common::ErrorCode::InvalidArgument);
  }
  return common::Result<std::string>::success("http://localhost:" + std::to_string(port));
}

} // namespace sandcastle::providers
