#pragma once

#include "sandcastle/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sandcastle::providers {

inline constexpr const char *kDefaultSession = "default";
inline constexpr const char *kBootstrapSession = "supervisord-session";

enum class SandboxState {
  Running,
  Starting,
  Stopping,
  Stopped,
  Archiving,
  Archived,
  Error,
  Destroyed,
  Unknown,
};

[[nodiscard]] std::string_view to_string(SandboxState state);

/// Maps backend state strings (case-insensitive). `started` and `running`
/// both mean Running; anything unrecognized is Unknown.
[[nodiscard]] SandboxState parse_sandbox_state(const std::string &value);

/// Opaque token for one sandbox. `payload` is the raw backend document; only
/// the provider that produced the handle interprets it.
struct SandboxHandle {
  std::string id;
  std::string runtime;
  SandboxState state = SandboxState::Unknown;
  std::optional<std::string> project_id;
  std::string payload;

  [[nodiscard]] std::string to_json() const;
};

struct ExecutionRequest {
  std::string command;
  std::optional<std::string> session;
  bool async_exec = false;

  [[nodiscard]] std::string session_or_default() const {
    return session.value_or(kDefaultSession);
  }
};

struct ExecutionResult {
  std::string stdout_text;
  std::string stderr_text;
  std::optional<int> exit_code;
  std::string command_id;
  /// False when an async command was only accepted by the backend.
  bool completed = true;

  [[nodiscard]] bool succeeded() const { return completed && exit_code.value_or(-1) == 0; }
  [[nodiscard]] std::string to_json() const;
};

struct FileInfo {
  std::string name;
  bool is_dir = false;
  std::uint64_t size = 0;
  std::string mod_time;

  [[nodiscard]] std::string to_json() const;
};

/// Backend contract. Calls block the caller. Distinct sandboxes may be driven
/// from different threads; commands for one session must be issued by one
/// caller at a time so their FIFO order is preserved.
class SandboxProvider {
public:
  virtual ~SandboxProvider() = default;

  [[nodiscard]] virtual common::Result<SandboxHandle>
  create(const std::string &password, const std::optional<std::string> &project_id) = 0;

  /// Idempotent: starting a running sandbox is a no-op success.
  [[nodiscard]] virtual common::Result<SandboxHandle> start(const SandboxHandle &handle) = 0;

  [[nodiscard]] virtual common::Result<SandboxHandle>
  get_current_sandbox(const std::string &sandbox_id) = 0;

  /// Creates `request.session` if absent, then runs the command in it.
  [[nodiscard]] virtual common::Result<ExecutionResult>
  exec(const SandboxHandle &handle, const ExecutionRequest &request) = 0;

  /// Brings an archived or stopped sandbox back to a usable state.
  [[nodiscard]] virtual common::Result<SandboxHandle>
  ensure_running(const std::string &sandbox_id) = 0;

  [[nodiscard]] virtual common::Status remove(const std::string &sandbox_id) = 0;

  /// Writes `content` to `path`, replacing an existing file and creating
  /// missing parent directories.
  [[nodiscard]] virtual common::Status upload_file(const SandboxHandle &handle,
                                                   const std::string &path,
                                                   const std::string &content) = 0;
  [[nodiscard]] virtual common::Result<std::string> download_file(const SandboxHandle &handle,
                                                                  const std::string &path) = 0;
  /// Direct children of the directory at `path`.
  [[nodiscard]] virtual common::Result<std::vector<FileInfo>>
  list_files(const SandboxHandle &handle, const std::string &path) = 0;
  [[nodiscard]] virtual common::Status delete_file(const SandboxHandle &handle,
                                                   const std::string &path) = 0;

  /// URL reaching a service that listens on `port` inside the sandbox.
  [[nodiscard]] virtual common::Result<std::string> get_preview_link(const SandboxHandle &handle,
                                                                     std::uint16_t port) = 0;

  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sandcastle::providers
