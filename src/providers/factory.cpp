#include "sandcastle/providers/factory.hpp"

#include "sandcastle/common/fs.hpp"
#include "sandcastle/health/health.hpp"
#include "sandcastle/observability/global.hpp"

namespace sandcastle::providers {

common::Result<std::shared_ptr<DaytonaProvider>>
create_daytona_provider(const config::DaytonaConfig &config,
                        std::shared_ptr<HttpClient> http_client) {
  using ProviderResult = common::Result<std::shared_ptr<DaytonaProvider>>;
  health::mark_component_starting("provider.daytona");

  if (const auto missing = missing_daytona_configuration(config); !missing.empty()) {
    const std::string message =
        "Daytona runtime is not configured, missing: " + common::join(missing, ", ");
    observability::record_error("daytona", message);
    health::mark_component_error("provider.daytona", message);
    return ProviderResult::failure(message, common::ErrorCode::Config);
  }
  if (http_client == nullptr) {
    return ProviderResult::failure("daytona provider requires an http client",
                                   common::ErrorCode::InvalidArgument);
  }

  auto provider = std::make_shared<DaytonaProvider>(config, std::move(http_client));
  if (auto status = provider->warmup(); !status.ok()) {
    observability::record_error("daytona", status.error());
    health::mark_component_error("provider.daytona", status.error());
    return ProviderResult::failure(status.error(), status.code());
  }

  health::mark_component_ok("provider.daytona");
  observability::record_provider_ready("daytona", "server=" + config.server_url +
                                                      " target=" + config.target);
  return ProviderResult::success(std::move(provider));
}

common::Result<std::shared_ptr<E2bProvider>> create_e2b_provider(const config::E2bConfig &config) {
  using ProviderResult = common::Result<std::shared_ptr<E2bProvider>>;
  health::mark_component_starting("provider.e2b");

  const auto dir = common::ensure_dir(config.base_path);
  if (!dir.ok()) {
    observability::record_error("e2b", dir.error());
    health::mark_component_error("provider.e2b", dir.error());
    return ProviderResult::failure(dir.error(), common::ErrorCode::Config);
  }

  health::mark_component_ok("provider.e2b");
  observability::record_provider_ready(
      "e2b", "local stub, commands run on the host in " + config.base_path, true);
  return ProviderResult::success(std::make_shared<E2bProvider>(config));
}

common::Result<std::shared_ptr<SandboxProvider>>
create_provider(const std::string &runtime, const config::Config &config,
                std::shared_ptr<HttpClient> http_client) {
  using ProviderResult = common::Result<std::shared_ptr<SandboxProvider>>;
  const std::string name = common::to_lower(common::trim(runtime));

  if (name == "daytona") {
    auto created = create_daytona_provider(config.daytona, std::move(http_client));
    if (!created.ok()) {
      return ProviderResult::failure(created.error(), created.code());
    }
    return ProviderResult::success(created.value());
  }
  if (name == "e2b") {
    auto created = create_e2b_provider(config.e2b);
    if (!created.ok()) {
      return ProviderResult::failure(created.error(), created.code());
    }
    return ProviderResult::success(created.value());
  }
  return ProviderResult::failure("Invalid runtime '" + runtime + "'. Must be 'daytona' or 'e2b'",
                                 common::ErrorCode::UnknownRuntime);
}

} // namespace sandcastle::providers
