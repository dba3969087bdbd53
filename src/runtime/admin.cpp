#include "sandcastle/runtime/admin.hpp"

#include "sandcastle/common/fs.hpp"
#include "sandcastle/common/json_util.hpp"
#include "sandcastle/observability/global.hpp"

#include <exception>
#include <sstream>

namespace sandcastle::runtime {

namespace {

AdminResponse error_response(const int http_status, const std::string &message) {
  return AdminResponse{.http_status = http_status,
                       .body = "{\"detail\":" + common::json_quote(message) + "}"};
}

int status_for(const common::ErrorCode code) {
  switch (code) {
  case common::ErrorCode::UnknownRuntime:
  case common::ErrorCode::Config:
  case common::ErrorCode::InvalidArgument:
    return 400;
  case common::ErrorCode::NotFound:
    return 404;
  default:
    return 500;
  }
}

} // namespace

RuntimeAdmin::RuntimeAdmin(RuntimeManager &manager) : manager_(manager) {}

AdminResponse RuntimeAdmin::status() const {
  try {
    const RuntimeInfo info = manager_.get_runtime_info();
    std::ostringstream body;
    body << "{\"current_runtime\":" << common::json_quote(info.runtime)
         << ",\"available_runtimes\":" << common::json_string_array(info.available_runtimes)
         << ",\"runtime_configured\":" << (manager_.validate_runtime_config() ? "true" : "false")
         << ",\"runtime_info\":" << info.to_json() << "}";
    return AdminResponse{.http_status = 200, .body = body.str()};
  } catch (const std::exception &ex) {
    observability::record_error("runtime.admin", std::string("status failed: ") + ex.what());
    return error_response(500, std::string("Failed to get runtime status: ") + ex.what());
  }
}

AdminResponse RuntimeAdmin::switch_runtime(const std::string &body) {
  try {
    const std::string requested = common::trim(common::json_get_string(body, "runtime"));
    if (requested.empty()) {
      return error_response(400, "Request body must include a non-empty 'runtime' field");
    }

    auto outcome = manager_.switch_runtime(requested);
    if (!outcome.ok()) {
      return error_response(status_for(outcome.code()), outcome.error());
    }

    const auto &switched = outcome.value();
    std::ostringstream out;
    out << "{\"status\":\"success\",\"message\":"
        << common::json_quote("Runtime switched to '" + switched.current + "'")
        << ",\"previous_runtime\":" << common::json_quote(switched.previous)
        << ",\"current_runtime\":" << common::json_quote(switched.current) << "}";
    return AdminResponse{.http_status = 200, .body = out.str()};
  } catch (const std::exception &ex) {
    observability::record_error("runtime.admin", std::string("switch failed: ") + ex.what());
    return error_response(500, std::string("Failed to switch runtime: ") + ex.what());
  }
}

AdminResponse RuntimeAdmin::validate_runtime(const std::string &name) {
  try {
    auto report = manager_.probe_runtime(name);
    if (!report.ok()) {
      return error_response(status_for(report.code()), report.error());
    }
    return AdminResponse{.http_status = 200, .body = report.value().to_json()};
  } catch (const std::exception &ex) {
    observability::record_error("runtime.admin", std::string("validate failed: ") + ex.what());
    return error_response(500, std::string("Failed to validate runtime: ") + ex.what());
  }
}

AdminResponse RuntimeAdmin::health() const {
  try {
    const std::string runtime = manager_.get_runtime_info().runtime;
    const bool configured = manager_.validate_runtime_config();
    std::ostringstream out;
    out << "{\"status\":" << common::json_quote(configured ? "healthy" : "unhealthy")
        << ",\"runtime\":" << common::json_quote(runtime)
        << ",\"configured\":" << (configured ? "true" : "false")
        << ",\"timestamp\":" << common::json_quote(common::now_rfc3339()) << "}";
    return AdminResponse{.http_status = 200, .body = out.str()};
  } catch (const std::exception &ex) {
    observability::record_error("runtime.admin", std::string("health failed: ") + ex.what());
    std::ostringstream out;
    out << "{\"status\":\"error\",\"error\":" << common::json_quote(ex.what())
        << ",\"timestamp\":" << common::json_quote(common::now_rfc3339()) << "}";
    return AdminResponse{.http_status = 200, .body = out.str()};
  }
}

} // namespace sandcastle::runtime
