#pragma once

#include "sandcastle/config/schema.hpp"
#include "sandcastle/providers/http.hpp"
#include "sandcastle/providers/traits.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sandcastle::providers {

/// Names of required Daytona settings that are empty, in config-key form.
[[nodiscard]] std::vector<std::string>
missing_daytona_configuration(const config::DaytonaConfig &config);

/// Remote sandboxes managed through the Daytona REST API.
///
/// Every sandbox runs a supervisord process that is launched through the
/// `supervisord-session` bootstrap session on create and after any restart.
class DaytonaProvider final : public SandboxProvider {
public:
  explicit DaytonaProvider(config::DaytonaConfig config,
                           std::shared_ptr<HttpClient> http_client =
                               std::make_shared<CurlHttpClient>());

  [[nodiscard]] common::Result<SandboxHandle>
  create(const std::string &password, const std::optional<std::string> &project_id) override;
  [[nodiscard]] common::Result<SandboxHandle> start(const SandboxHandle &handle) override;
  [[nodiscard]] common::Result<SandboxHandle>
  get_current_sandbox(const std::string &sandbox_id) override;
  [[nodiscard]] common::Result<ExecutionResult> exec(const SandboxHandle &handle,
                                                     const ExecutionRequest &request) override;

  /// Archived or stopped sandboxes get one start, one settle wait, one
  /// re-fetch and a fresh bootstrap. The re-fetched handle is returned as is.
  [[nodiscard]] common::Result<SandboxHandle>
  ensure_running(const std::string &sandbox_id) override;
  [[nodiscard]] common::Status remove(const std::string &sandbox_id) override;
  [[nodiscard]] std::string_view name() const override { return "daytona"; }

  [[nodiscard]] common::Status upload_file(const SandboxHandle &handle, const std::string &path,
                                           const std::string &content) override;
  [[nodiscard]] common::Result<std::string> download_file(const SandboxHandle &handle,
                                                          const std::string &path) override;
  [[nodiscard]] common::Result<std::vector<FileInfo>>
  list_files(const SandboxHandle &handle, const std::string &path) override;
  [[nodiscard]] common::Status delete_file(const SandboxHandle &handle,
                                           const std::string &path) override;
  /// Asks the backend for the port's preview URL; the URL is returned as is.
  [[nodiscard]] common::Result<std::string> get_preview_link(const SandboxHandle &handle,
                                                             std::uint16_t port) override;

  /// Authenticated round trip used to fail fast on bad credentials.
  [[nodiscard]] common::Status warmup();

  [[nodiscard]] common::Result<std::vector<SandboxHandle>>
  find_by_project(const std::string &project_id);

  /// Idempotent; an existing session is not an error.
  [[nodiscard]] common::Status create_session(const std::string &sandbox_id,
                                              const std::string &session);

  [[nodiscard]] common::Status start_supervisord_session(const SandboxHandle &handle);

private:
  [[nodiscard]] std::string sandbox_url(const std::string &sandbox_id) const;
  [[nodiscard]] std::string session_url(const std::string &sandbox_id) const;
  [[nodiscard]] std::string files_url(const std::string &sandbox_id, const std::string &action,
                                      const std::string &path) const;
  [[nodiscard]] HttpHeaders auth_headers() const;
  [[nodiscard]] std::string build_create_body(const std::string &password,
                                              const std::optional<std::string> &project_id) const;
  [[nodiscard]] common::Result<ExecutionResult>
  run_session_command(const std::string &sandbox_id, const std::string &session,
                      const std::string &command, bool async_exec);

  config::DaytonaConfig config_;
  std::string base_url_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace sandcastle::providers
