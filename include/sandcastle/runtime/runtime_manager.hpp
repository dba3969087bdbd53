#pragma once

#include "sandcastle/common/result.hpp"
#include "sandcastle/config/schema.hpp"
#include "sandcastle/providers/http.hpp"
#include "sandcastle/providers/traits.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sandcastle::runtime {

enum class RuntimeKind { Daytona, E2b };

[[nodiscard]] std::string_view runtime_name(RuntimeKind kind);

/// Case-insensitive, surrounding whitespace ignored.
[[nodiscard]] std::optional<RuntimeKind> parse_runtime(const std::string &value);
[[nodiscard]] std::vector<std::string> available_runtimes();
[[nodiscard]] std::string unknown_runtime_message(const std::string &value);

struct RuntimeInfo {
  std::string runtime;
  std::vector<std::string> available_runtimes;
  bool configured = false;
  /// Runtime-specific string settings, e.g. `daytona_server`.
  std::vector<std::pair<std::string, std::string>> details;

  [[nodiscard]] std::string to_json() const;
};

struct ValidationReport {
  std::string runtime;
  bool is_configured = false;
  RuntimeInfo configuration;

  [[nodiscard]] std::string to_json() const;
};

struct SwitchOutcome {
  std::string previous;
  std::string current;
};

/// Owns the active runtime selection and a cache of constructed providers.
///
/// Reads of the selection are lock-free. Switches and probes are serialized
/// on one mutex and only a validated runtime is ever published.
class RuntimeManager {
public:
  using ProviderFactory = std::function<common::Result<std::shared_ptr<providers::SandboxProvider>>(
      RuntimeKind, const config::Config &)>;

  /// Builds providers through `providers::create_provider` over one shared client.
  [[nodiscard]] static ProviderFactory
  default_provider_factory(std::shared_ptr<providers::HttpClient> http_client =
                               std::make_shared<providers::CurlHttpClient>());

  RuntimeManager(config::Config config, RuntimeKind initial,
                 ProviderFactory factory = default_provider_factory());
  virtual ~RuntimeManager() = default;

  RuntimeManager(const RuntimeManager &) = delete;
  RuntimeManager &operator=(const RuntimeManager &) = delete;

  /// Fails with UnknownRuntime when `sandbox.runtime` names no backend.
  [[nodiscard]] static common::Result<std::unique_ptr<RuntimeManager>>
  from_config(const config::Config &config,
              ProviderFactory factory = default_provider_factory());

  [[nodiscard]] RuntimeKind current_runtime() const;
  [[nodiscard]] std::string current_runtime_name() const;

  // get_runtime_info() and validate_runtime_config() are virtual so tests can
  // stand in a failing configuration store underneath RuntimeAdmin.
  [[nodiscard]] virtual RuntimeInfo get_runtime_info() const;
  [[nodiscard]] RuntimeInfo runtime_info(RuntimeKind kind) const;

  /// Never fails; an unconfigured runtime is reported as false.
  [[nodiscard]] virtual bool validate_runtime_config() const;
  [[nodiscard]] bool validate_runtime_config(RuntimeKind kind) const;
  [[nodiscard]] std::vector<std::string> missing_configuration(RuntimeKind kind) const;

  [[nodiscard]] common::Result<SwitchOutcome> switch_runtime(const std::string &name);

  /// Evaluates another runtime without changing the published selection.
  [[nodiscard]] common::Result<ValidationReport> probe_runtime(const std::string &name);

  [[nodiscard]] common::Result<std::shared_ptr<providers::SandboxProvider>> active_provider();
  [[nodiscard]] common::Result<std::shared_ptr<providers::SandboxProvider>>
  provider_for(RuntimeKind kind);
  /// The backend that issued `handle`, whatever runtime is selected now.
  [[nodiscard]] common::Result<std::shared_ptr<providers::SandboxProvider>>
  provider_for_handle(const providers::SandboxHandle &handle);
  [[nodiscard]] std::size_t cached_provider_count() const;

  [[nodiscard]] common::Result<providers::SandboxHandle>
  create_sandbox(const std::string &password, const std::optional<std::string> &project_id);
  [[nodiscard]] common::Result<providers::SandboxHandle>
  get_or_start_sandbox(const std::string &sandbox_id);
  [[nodiscard]] common::Status delete_sandbox(const std::string &sandbox_id);
  [[nodiscard]] common::Result<providers::ExecutionResult>
  exec(const providers::SandboxHandle &handle, const providers::ExecutionRequest &request);

  [[nodiscard]] common::Result<std::string> generate_access_password() const;

  [[nodiscard]] const config::Config &config() const { return config_; }

private:
  config::Config config_;
  std::atomic<RuntimeKind> runtime_;
  ProviderFactory factory_;
  std::mutex switch_mutex_;
  mutable std::mutex providers_mutex_;
  std::unordered_map<std::string, std::shared_ptr<providers::SandboxProvider>> providers_;
};

} // namespace sandcastle::runtime
