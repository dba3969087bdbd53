#pragma once

#include <cstdint>
#include <string>

namespace sandcastle::config {

struct SandboxConfig {
  std::string runtime = "daytona";
};

struct DaytonaConfig {
  std::string api_key;
  std::string server_url;
  std::string target;
  std::string image = "kortix/suna:0.1.2.8";
  std::string entrypoint = "/usr/bin/supervisord -n -c /etc/supervisor/conf.d/supervisord.conf";
  bool public_access = true;
  std::uint32_t cpu = 2;
  std::uint32_t memory_gb = 4;
  std::uint32_t disk_gb = 5;
  std::uint64_t request_timeout_ms = 30'000;
  std::uint64_t command_timeout_ms = 300'000;
  std::uint64_t restart_settle_ms = 100;
};

struct E2bConfig {
  std::string base_path = "/tmp/suna-sandbox";
  std::uint64_t command_timeout_ms = 60'000;
};

struct GatewayConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  SandboxConfig sandbox;
  DaytonaConfig daytona;
  E2bConfig e2b;
  GatewayConfig gateway;
  ObservabilityConfig observability;
};

} // namespace sandcastle::config
