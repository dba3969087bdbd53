#include "sandcastle/health/health.hpp"

#include "sandcastle/common/fs.hpp"
#include "sandcastle/common/json_util.hpp"

#include <mutex>
#include <sstream>

namespace sandcastle::health {

namespace {

std::mutex g_mutex;
std::map<std::string, ComponentStatus> g_components;

} // namespace

void mark_component_starting(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = g_components[name];
  component.status = "starting";
  component.updated_at = common::now_rfc3339();
  component.last_error.reset();
}

void mark_component_ok(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = g_components[name];
  component.status = "ok";
  component.updated_at = common::now_rfc3339();
  component.last_ok = component.updated_at;
  component.last_error.reset();
}

void mark_component_error(const std::string &name, const std::string &error) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = g_components[name];
  component.status = "error";
  component.updated_at = common::now_rfc3339();
  component.last_error = error;
}

void reset_component(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_components.erase(name);
}

std::optional<ComponentStatus> get_component(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto it = g_components.find(name);
  if (it == g_components.end()) {
    return std::nullopt;
  }
  return it->second;
}

HealthSnapshot snapshot() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return HealthSnapshot{.components = g_components};
}

std::string snapshot_json() {
  const auto snap = snapshot();
  std::ostringstream json;
  json << "{\"components\":{";
  bool first = true;
  for (const auto &[name, status] : snap.components) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << common::json_quote(name) << ":{";
    json << "\"status\":" << common::json_quote(status.status);
    if (!status.updated_at.empty()) {
      json << ",\"updated_at\":" << common::json_quote(status.updated_at);
    }
    if (status.last_ok.has_value()) {
      json << ",\"last_ok\":" << common::json_quote(*status.last_ok);
    }
    if (status.last_error.has_value()) {
      json << ",\"last_error\":" << common::json_quote(*status.last_error);
    }
    json << "}";
  }
  json << "}}";
  return json.str();
}

void clear() {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_components.clear();
}

} // namespace sandcastle::health
