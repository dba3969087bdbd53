#pragma once

#include "sandcastle/runtime/runtime_manager.hpp"

#include <string>

namespace sandcastle::runtime {

struct AdminResponse {
  int http_status = 200;
  std::string body;
};

/// JSON administration operations over a RuntimeManager. Every operation
/// turns failures into a structured payload; `health` never fails.
class RuntimeAdmin {
public:
  explicit RuntimeAdmin(RuntimeManager &manager);

  [[nodiscard]] AdminResponse status() const;

  /// Body is `{"runtime": "<name>"}`.
  [[nodiscard]] AdminResponse switch_runtime(const std::string &body);
  [[nodiscard]] AdminResponse validate_runtime(const std::string &name);
  [[nodiscard]] AdminResponse health() const;

private:
  RuntimeManager &manager_;
};

} // namespace sandcastle::runtime
