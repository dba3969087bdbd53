#include "sandcastle/runtime/runtime_manager.hpp"

#include "sandcastle/common/fs.hpp"
#include "sandcastle/common/json_util.hpp"
#include "sandcastle/health/health.hpp"
#include "sandcastle/observability/global.hpp"
#include "sandcastle/providers/daytona.hpp"
#include "sandcastle/providers/factory.hpp"

#include <sstream>

namespace sandcastle::runtime {

namespace {

constexpr std::size_t kAccessPasswordBytes = 16;

template <typename T>
common::Result<T> provider_failure(
    const common::Result<std::shared_ptr<providers::SandboxProvider>> &provider) {
  return common::Result<T>::failure(provider.error(), provider.code());
}

} // namespace

std::string_view runtime_name(const RuntimeKind kind) {
  switch (kind) {
  case RuntimeKind::Daytona:
    return "daytona";
  case RuntimeKind::E2b:
    return "e2b";
  }
  return "daytona";
}

std::optional<RuntimeKind> parse_runtime(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "daytona") {
    return RuntimeKind::Daytona;
  }
  if (normalized == "e2b") {
    return RuntimeKind::E2b;
  }
  return std::nullopt;
}

std::vector<std::string> available_runtimes() { return {"daytona", "e2b"}; }

std::string unknown_runtime_message(const std::string &value) {
  return "Invalid runtime '" + value + "'. Must be 'daytona' or 'e2b'";
}

std::string RuntimeInfo::to_json() const {
  std::ostringstream out;
  out << "{\"runtime\":" << common::json_quote(runtime)
      << ",\"available_runtimes\":" << common::json_string_array(available_runtimes) << ","
      << common::json_quote(runtime + "_configured") << ":" << (configured ? "true" : "false");
  for (const auto &[key, value] : details) {
    out << "," << common::json_quote(key) << ":" << common::json_quote(value);
  }
  out << "}";
  return out.str();
}

std::string ValidationReport::to_json() const {
  std::ostringstream out;
  out << "{\"runtime\":" << common::json_quote(runtime)
      << ",\"is_configured\":" << (is_configured ? "true" : "false")
      << ",\"configuration\":" << configuration.to_json() << "}";
  return out.str();
}

RuntimeManager::ProviderFactory
RuntimeManager::default_provider_factory(std::shared_ptr<providers::HttpClient> http_client) {
  return [http_client = std::move(http_client)](const RuntimeKind kind,
                                                const config::Config &config) {
    return providers::create_provider(std::string(runtime_name(kind)), config, http_client);
  };
}

RuntimeManager::RuntimeManager(config::Config config, const RuntimeKind initial,
                               ProviderFactory factory)
    : config_(std::move(config)), runtime_(initial), factory_(std::move(factory)) {
  health::mark_component_ok("runtime");
}

common::Result<std::unique_ptr<RuntimeManager>>
RuntimeManager::from_config(const config::Config &config, ProviderFactory factory) {
  using ManagerResult = common::Result<std::unique_ptr<RuntimeManager>>;
  const auto kind = parse_runtime(config.sandbox.runtime);
  if (!kind.has_value()) {
    const std::string message = unknown_runtime_message(config.sandbox.runtime);
    observability::record_error("runtime", message);
    health::mark_component_error("runtime", message);
    return ManagerResult::failure(message, common::ErrorCode::UnknownRuntime);
  }
  return ManagerResult::success(
      std::make_unique<RuntimeManager>(config, *kind, std::move(factory)));
}

RuntimeKind RuntimeManager::current_runtime() const { return runtime_.load(); }

std::string RuntimeManager::current_runtime_name() const {
  return std::string(runtime_name(current_runtime()));
}

RuntimeInfo RuntimeManager::get_runtime_info() const { return runtime_info(current_runtime()); }

RuntimeInfo RuntimeManager::runtime_info(const RuntimeKind kind) const {
  RuntimeInfo info;
  info.runtime = std::string(runtime_name(kind));
  info.available_runtimes = available_runtimes();
  switch (kind) {
  case RuntimeKind::Daytona:
    info.configured = providers::missing_daytona_configuration(config_.daytona).empty();
    info.details = {{"daytona_server", config_.daytona.server_url},
                    {"daytona_target", config_.daytona.target}};
    break;
  case RuntimeKind::E2b:
    info.configured = true;
    info.details = {{"e2b_base_path", config_.e2b.base_path}};
    break;
  }
  return info;
}

std::vector<std::string> RuntimeManager::missing_configuration(const RuntimeKind kind) const {
  if (kind == RuntimeKind::Daytona) {
    return providers::missing_daytona_configuration(config_.daytona);
  }
  return {};
}

bool RuntimeManager::validate_runtime_config() const {
  return validate_runtime_config(current_runtime());
}

bool RuntimeManager::validate_runtime_config(const RuntimeKind kind) const {
  const auto missing = missing_configuration(kind);
  if (missing.empty()) {
    return true;
  }
  observability::record_error("runtime", std::string(runtime_name(kind)) +
                                             " configuration is missing: " +
                                             common::join(missing, ", "));
  return false;
}

common::Result<SwitchOutcome> RuntimeManager::switch_runtime(const std::string &name) {
  std::lock_guard<std::mutex> lock(switch_mutex_);
  const std::string previous = current_runtime_name();

  const auto kind = parse_runtime(name);
  if (!kind.has_value()) {
    const std::string message = unknown_runtime_message(name);
    observability::record_runtime_switch(previous, name, false, "unknown runtime");
    return common::Result<SwitchOutcome>::failure(message, common::ErrorCode::UnknownRuntime);
  }

  const std::string requested(runtime_name(*kind));
  if (!validate_runtime_config(*kind)) {
    const std::string message = "Runtime '" + requested + "' is not properly configured";
    observability::record_runtime_switch(previous, requested, false, "not configured");
    return common::Result<SwitchOutcome>::failure(message, common::ErrorCode::Config);
  }

  runtime_.store(*kind);
  health::mark_component_ok("runtime");
  observability::record_runtime_switch(previous, requested, true);
  return common::Result<SwitchOutcome>::success(
      SwitchOutcome{.previous = previous, .current = requested});
}

common::Result<ValidationReport> RuntimeManager::probe_runtime(const std::string &name) {
  std::lock_guard<std::mutex> lock(switch_mutex_);
  const auto kind = parse_runtime(name);
  if (!kind.has_value()) {
    return common::Result<ValidationReport>::failure(unknown_runtime_message(name),
                                                     common::ErrorCode::UnknownRuntime);
  }

  ValidationReport report;
  report.runtime = std::string(runtime_name(*kind));
  report.is_configured = validate_runtime_config(*kind);
  report.configuration = runtime_info(*kind);
  return common::Result<ValidationReport>::success(std::move(report));
}

common::Result<std::shared_ptr<providers::SandboxProvider>> RuntimeManager::active_provider() {
  return provider_for(current_runtime());
}

common::Result<std::shared_ptr<providers::SandboxProvider>>
RuntimeManager::provider_for(const RuntimeKind kind) {
  using ProviderResult = common::Result<std::shared_ptr<providers::SandboxProvider>>;
  const std::string name(runtime_name(kind));

  {
    std::lock_guard<std::mutex> lock(providers_mutex_);
    if (const auto it = providers_.find(name); it != providers_.end()) {
      return ProviderResult::success(it->second);
    }
  }
  if (!factory_) {
    return ProviderResult::failure("no provider factory installed", common::ErrorCode::Internal);
  }

  // Construction may hit the network, so it runs unlocked. When two callers
  // race, the first instance cached wins and the other is dropped.
  auto created = factory_(kind, config_);
  if (!created.ok()) {
    return created;
  }
  if (created.value() == nullptr) {
    return ProviderResult::failure("provider factory returned no provider for " + name,
                                   common::ErrorCode::Internal);
  }

  std::lock_guard<std::mutex> lock(providers_mutex_);
  const auto [it, inserted] = providers_.try_emplace(name, created.value());
  if (inserted) {
    observability::record_metric(observability::CachedProvidersMetric{.count = providers_.size()});
  }
  return ProviderResult::success(it->second);
}

common::Result<std::shared_ptr<providers::SandboxProvider>>
RuntimeManager::provider_for_handle(const providers::SandboxHandle &handle) {
  // Handles stay bound to the backend that issued them across switches.
  return provider_for(parse_runtime(handle.runtime).value_or(current_runtime()));
}

std::size_t RuntimeManager::cached_provider_count() const {
  std::lock_guard<std::mutex> lock(providers_mutex_);
  return providers_.size();
}

common::Result<providers::SandboxHandle>
RuntimeManager::create_sandbox(const std::string &password,
                               const std::optional<std::string> &project_id) {
  auto provider = active_provider();
  if (!provider.ok()) {
    return provider_failure<providers::SandboxHandle>(provider);
  }
  return provider.value()->create(password, project_id);
}

common::Result<providers::SandboxHandle>
RuntimeManager::get_or_start_sandbox(const std::string &sandbox_id) {
  auto provider = active_provider();
  if (!provider.ok()) {
    return provider_failure<providers::SandboxHandle>(provider);
  }
  return provider.value()->ensure_running(sandbox_id);
}

common::Status RuntimeManager::delete_sandbox(const std::string &sandbox_id) {
  auto provider = active_provider();
  if (!provider.ok()) {
    return common::Status::error(provider.error(), provider.code());
  }
  return provider.value()->remove(sandbox_id);
}

common::Result<providers::ExecutionResult>
RuntimeManager::exec(const providers::SandboxHandle &handle,
                     const providers::ExecutionRequest &request) {
  auto provider = provider_for_handle(handle);
  if (!provider.ok()) {
    return provider_failure<providers::ExecutionResult>(provider);
  }
  return provider.value()->exec(handle, request);
}

common::Result<std::string> RuntimeManager::generate_access_password() const {
  return common::random_hex(kAccessPasswordBytes);
}

} // namespace sandcastle::runtime
