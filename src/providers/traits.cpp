#include "sandcastle/providers/traits.hpp"

#include "sandcastle/common/fs.hpp"
#include "sandcastle/common/json_util.hpp"

#include <sstream>

namespace sandcastle::providers {

std::string_view to_string(const SandboxState state) {
  switch (state) {
  case SandboxState::Running:
    return "running";
  case SandboxState::Starting:
    return "starting";
  case SandboxState::Stopping:
    return "stopping";
  case SandboxState::Stopped:
    return "stopped";
  case SandboxState::Archiving:
    return "archiving";
  case SandboxState::Archived:
    return "archived";
  case SandboxState::Error:
    return "error";
  case SandboxState::Destroyed:
    return "destroyed";
  case SandboxState::Unknown:
    return "unknown";
  }
  return "unknown";
}

SandboxState parse_sandbox_state(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "started" || normalized == "running") {
    return SandboxState::Running;
  }
  if (normalized == "starting" || normalized == "creating" || normalized == "restoring" ||
      normalized == "pending_build" || normalized == "building_image") {
    return SandboxState::Starting;
  }
  if (normalized == "stopping") {
    return SandboxState::Stopping;
  }
  if (normalized == "stopped") {
    return SandboxState::Stopped;
  }
  if (normalized == "archiving") {
    return SandboxState::Archiving;
  }
  if (normalized == "archived") {
    return SandboxState::Archived;
  }
  if (normalized == "error" || normalized == "build_failed") {
    return SandboxState::Error;
  }
  if (normalized == "destroyed" || normalized == "destroying") {
    return SandboxState::Destroyed;
  }
  return SandboxState::Unknown;
}

std::string SandboxHandle::to_json() const {
  std::ostringstream out;
  out << "{\"id\":" << common::json_quote(id) << ",\"runtime\":" << common::json_quote(runtime)
      << ",\"state\":" << common::json_quote(std::string(to_string(state)));
  if (project_id.has_value()) {
    out << ",\"project_id\":" << common::json_quote(*project_id);
  }
  out << "}";
  return out.str();
}

std::string ExecutionResult::to_json() const {
  std::ostringstream out;
  out << "{\"completed\":" << (completed ? "true" : "false");
  if (exit_code.has_value()) {
    out << ",\"exit_code\":" << *exit_code;
  }
  if (!command_id.empty()) {
    out << ",\"command_id\":" << common::json_quote(command_id);
  }
  out << ",\"stdout\":" << common::json_quote(stdout_text)
      << ",\"stderr\":" << common::json_quote(stderr_text) << "}";
  return out.str();
}

std::string FileInfo::to_json() const {
  std::ostringstream out;
  out << "{\"name\":" << common::json_quote(name) << ",\"is_dir\":" << (is_dir ? "true" : "false")
      << ",\"size\":" << size << ",\"mod_time\":" << common::json_quote(mod_time) << "}";
  return out.str();
}

} // namespace sandcastle::providers
