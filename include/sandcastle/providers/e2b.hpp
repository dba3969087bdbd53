#pragma once

#include "sandcastle/config/schema.hpp"
#include "sandcastle/providers/traits.hpp"

#include <filesystem>

namespace sandcastle::providers {

/// Local stand-in for the E2B backend: every sandbox is the configured base
/// directory and commands run through `/bin/sh` on the host.
class E2bProvider final : public SandboxProvider {
public:
  explicit E2bProvider(config::E2bConfig config);

  [[nodiscard]] common::Result<SandboxHandle>
  create(const std::string &password, const std::optional<std::string> &project_id) override;
  [[nodiscard]] common::Result<SandboxHandle> start(const SandboxHandle &handle) override;
  [[nodiscard]] common::Result<SandboxHandle>
  get_current_sandbox(const std::string &sandbox_id) override;

  /// Synchronous; `session` and `async_exec` are accepted and ignored.
  [[nodiscard]] common::Result<ExecutionResult> exec(const SandboxHandle &handle,
                                                     const ExecutionRequest &request) override;
  [[nodiscard]] common::Result<SandboxHandle>
  ensure_running(const std::string &sandbox_id) override;
  [[nodiscard]] common::Status remove(const std::string &sandbox_id) override;
  [[nodiscard]] std::string_view name() const override { return "e2b"; }

  /// File calls resolve relative paths against the base path. Any path that
  /// resolves outside it fails with InvalidArgument.
  [[nodiscard]] common::Status upload_file(const SandboxHandle &handle, const std::string &path,
                                           const std::string &content) override;
  [[nodiscard]] common::Result<std::string> download_file(const SandboxHandle &handle,
                                                          const std::string &path) override;
  [[nodiscard]] common::Result<std::vector<FileInfo>>
  list_files(const SandboxHandle &handle, const std::string &path) override;
  [[nodiscard]] common::Status delete_file(const SandboxHandle &handle,
                                           const std::string &path) override;
  /// Services run on the host, so the link is `http://localhost:<port>`.
  [[nodiscard]] common::Result<std::string> get_preview_link(const SandboxHandle &handle,
                                                             std::uint16_t port) override;

  [[nodiscard]] const std::filesystem::path &base_path() const { return base_path_; }

private:
  [[nodiscard]] SandboxHandle make_handle(const std::string &sandbox_id,
                                          const std::optional<std::string> &project_id) const;
  [[nodiscard]] common::Result<std::filesystem::path> resolve(const std::string &path) const;

  config::E2bConfig config_;
  std::filesystem::path base_path_;
};

} // namespace sandcastle::providers
