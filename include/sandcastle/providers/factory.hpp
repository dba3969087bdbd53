#pragma once

#include "sandcastle/common/result.hpp"
#include "sandcastle/config/schema.hpp"
#include "sandcastle/providers/daytona.hpp"
#include "sandcastle/providers/e2b.hpp"
#include "sandcastle/providers/http.hpp"

#include <memory>
#include <string>

namespace sandcastle::providers {

/// Fails with Config when credentials are missing or rejected and with
/// Backend when the server cannot be reached.
[[nodiscard]] common::Result<std::shared_ptr<DaytonaProvider>>
create_daytona_provider(const config::DaytonaConfig &config,
                        std::shared_ptr<HttpClient> http_client =
                            std::make_shared<CurlHttpClient>());

[[nodiscard]] common::Result<std::shared_ptr<E2bProvider>>
create_e2b_provider(const config::E2bConfig &config);

/// Dispatch on a runtime name (`daytona` or `e2b`).
[[nodiscard]] common::Result<std::shared_ptr<SandboxProvider>>
create_provider(const std::string &runtime, const config::Config &config,
                std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

} // namespace sandcastle::providers
