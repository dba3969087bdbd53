#include "sandcastle/cli/commands.hpp"

#include "sandcastle/common/fs.hpp"
#include "sandcastle/config/config.hpp"
#include "sandcastle/gateway/server.hpp"
#include "sandcastle/observability/factory.hpp"
#include "sandcastle/observability/global.hpp"
#include "sandcastle/providers/daytona.hpp"
#include "sandcastle/runtime/admin.hpp"
#include "sandcastle/runtime/runtime_manager.hpp"

#include <charconv>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sandcastle::cli {

namespace {

std::string version_string() {
#ifdef SANDCASTLE_VERSION
  return std::string("sandcastle ") + SANDCASTLE_VERSION;
#else
  return "sandcastle 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--") {
      return false;
    }
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  std::uint64_t value = 0;
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (raw.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

struct GlobalOptions {
  std::optional<std::string> runtime;
};

bool apply_global_options(std::vector<std::string> &args, GlobalOptions &options,
                          std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--") {
      break;
    }
    if (args[i] == "--config" || args[i] == "--runtime") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + args[i];
        return false;
      }
      if (args[i] == "--config") {
        config::set_config_path_override(args[i + 1]);
      } else {
        options.runtime = args[i + 1];
      }
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

/// Loaded configuration plus a manager with the requested runtime selected.
struct Session {
  config::Config config;
  std::unique_ptr<runtime::RuntimeManager> manager;
};

common::Result<Session> open_session(const GlobalOptions &options) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return common::Result<Session>::failure(cfg.error(), cfg.code());
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<Session>::failure(warnings.error(), warnings.code());
  }

  auto manager = runtime::RuntimeManager::from_config(cfg.value());
  if (!manager.ok()) {
    return common::Result<Session>::failure(manager.error(), manager.code());
  }
  if (options.runtime.has_value()) {
    auto switched = manager.value()->switch_runtime(*options.runtime);
    if (!switched.ok()) {
      return common::Result<Session>::failure(switched.error(), switched.code());
    }
  }
  return common::Result<Session>::success(
      Session{.config = cfg.value(), .manager = std::move(manager.value())});
}

int print_admin(const runtime::AdminResponse &response) {
  (response.http_status == 200 ? std::cout : std::cerr) << response.body << "\n";
  return response.http_status == 200 ? 0 : 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  sandcastle [--config PATH] [--runtime NAME] <command> [options]\n\n";
  std::cout << "RUNTIME\n";
  std::cout << "  status                      Show the selected runtime and its configuration\n";
  std::cout << "  validate <runtime>          Check whether a runtime is configured\n";
  std::cout << "  health                      Runtime health probe\n\n";
  std::cout << "SANDBOXES\n";
  std::cout << "  create [--project ID] [--password PW]\n";
  std::cout << "  ensure <sandbox-id>         Start an archived or stopped sandbox\n";
  std::cout << "  exec <sandbox-id> [--session S] [--async] -- <command...>\n";
  std::cout << "  delete <sandbox-id>\n";
  std::cout << "  find <project-id>           List Daytona sandboxes labelled with a project\n\n";
  std::cout << "FILES\n";
  std::cout << "  ls <sandbox-id> [path]\n";
  std::cout << "  upload <sandbox-id> <local-file> <path>\n";
  std::cout << "  download <sandbox-id> <path>   Write the file to stdout\n";
  std::cout << "  rm <sandbox-id> <path>\n";
  std::cout << "  preview <sandbox-id> <port>    Public URL for a port inside the sandbox\n\n";
  std::cout << "SERVICES\n";
  std::cout << "  serve [--host H] [--port P] [--duration-secs N]\n\n";
  std::cout << "  version, help\n";
}

int run_status(const GlobalOptions &options) {
  auto session = open_session(options);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  if (auto path = config::config_path(); path.ok()) {
    std::cerr << "Config: " << path.value().string() << "\n";
  }
  runtime::RuntimeAdmin admin(*session.value().manager);
  return print_admin(admin.status());
}

int run_validate(std::vector<std::string> args, const GlobalOptions &options) {
  if (args.empty()) {
    std::cerr << "usage: sandcastle validate <runtime>\n";
    return 1;
  }
  auto session = open_session(options);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  runtime::RuntimeAdmin admin(*session.value().manager);
  return print_admin(admin.validate_runtime(args[0]));
}

int run_health(const GlobalOptions &options) {
  auto session = open_session(options);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  runtime::RuntimeAdmin admin(*session.value().manager);
  return print_admin(admin.health());
}

int run_create(std::vector<std::string> args, const GlobalOptions &options) {
  std::string project;
  std::string password;
  const bool has_project = take_option(args, "--project", "-p", project);
  (void)take_option(args, "--password", "", password);

  auto session = open_session(options);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  auto &manager = *session.value().manager;
  if (password.empty()) {
    auto generated = manager.generate_access_password();
    if (!generated.ok()) {
      std::cerr << generated.error() << "\n";
      return 1;
    }
    password = generated.value();
    std::cerr << "Access password: " << password << "\n";
  }

  auto handle = manager.create_sandbox(
      password, has_project ? std::optional<std::string>(project) : std::nullopt);
  if (!handle.ok()) {
    std::cerr << handle.error() << "\n";
    return 1;
  }
  std::cout << handle.value().to_json() << "\n";
  return 0;
}

int run_ensure(std::vector<std::string> args, const GlobalOptions &options) {
  if (args.empty()) {
    std::cerr << "usage: sandcastle ensure <sandbox-id>\n";
    return 1;
  }
  auto session = open_session(options);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  auto handle = session.value().manager->get_or_start_sandbox(args[0]);
  if (!handle.ok()) {
    std::cerr << handle.error() << "\n";
    return 1;
  }
  std::cout << handle.value().to_json() << "\n";
  return 0;
}

int run_exec(std::vector<std::string> args, const GlobalOptions &options) {
  providers::ExecutionRequest request;
  std::string session_name;
  if (take_option(args, "--session", "-s", session_name)) {
    request.session = session_name;
  }
  request.async_exec = take_flag(args, "--async");

  if (args.empty()) {
    std::cerr << "usage: sandcastle exec <sandbox-id> [--session S] [--async] -- <command...>\n";
    return 1;
  }
  const std::string sandbox_id = args[0];
  std::vector<std::string> command_tokens(args.begin() + 1, args.end());
  if (!command_tokens.empty() && command_tokens.front() == "--") {
    command_tokens.erase(command_tokens.begin());
  }
  request.command = common::join(command_tokens, " ");
  if (common::trim(request.command).empty()) {
    std::cerr << "missing command to execute\n";
    return 1;
  }

  auto session = open_session(options);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  auto &manager = *session.value().manager;
  auto handle = manager.get_or_start_sandbox(sandbox_id);
  if (!handle.ok()) {
    std::cerr << handle.error() << "\n";
    return 1;
  }
  auto result = manager.exec(handle.value(), request);
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return 1;
  }

  const auto &executed = result.value();
  if (!executed.completed) {
    std::cout << "submitted";
    if (!executed.command_id.empty()) {
      std::cout << " " << executed.command_id;
    }
    std::cout << "\n";
    return 0;
  }
  std::cout << executed.stdout_text;
  std::cerr << executed.stderr_text;
  return executed.exit_code.value_or(1);
}

int run_delete(std::vector<std::string> args, const GlobalOptions &options) {
  if (args.empty()) {
    std::cerr << "usage: sandcastle delete <sandbox-id>\n";
    return 1;
  }
  auto session = open_session(options);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  auto status = session.value().manager->delete_sandbox(args[0]);
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  std::cout << "deleted " << args[0] << "\n";
  return 0;
}

int run_find(std::vector<std::string> args, const GlobalOptions &options) {
  if (args.empty()) {
    std::cerr << "usage: sandcastle find <project-id>\n";
    return 1;
  }
  auto session = open_session(options);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  auto provider = session.value().manager->provider_for(runtime::RuntimeKind::Daytona);
  if (!provider.ok()) {
    std::cerr << provider.error() << "\n";
    return 1;
  }
  auto daytona = std::dynamic_pointer_cast<providers::DaytonaProvider>(provider.value());
  if (daytona == nullptr) {
    std::cerr << "find requires the daytona provider\n";
    return 1;
  }
  auto handles = daytona->find_by_project(args[0]);
  if (!handles.ok()) {
    std::cerr << handles.error() << "\n";
    return 1;
  }
  for (const auto &handle : handles.value()) {
    std::cout << handle.to_json() << "\n";
  }
  return 0;
}

/// A started sandbox plus the backend that owns it.
struct SandboxTarget {
  providers::SandboxHandle handle;
  std::shared_ptr<providers::SandboxProvider> provider;
};

common::Result<SandboxTarget> open_sandbox(runtime::RuntimeManager &manager,
                                           const std::string &sandbox_id) {
  auto handle = manager.get_or_start_sandbox(sandbox_id);
  if (!handle.ok()) {
    return common::Result<SandboxTarget>::failure(handle.error(), handle.code());
  }
  auto provider = manager.provider_for_handle(handle.value());
  if (!provider.ok()) {
    return common::Result<SandboxTarget>::failure(provider.error(), provider.code());
  }
  return common::Result<SandboxTarget>::success(
      SandboxTarget{.handle = std::move(handle.value()), .provider = provider.value()});
}

int run_file_command(const std::string &command, std::vector<std::string> args,
                     const GlobalOptions &options) {
  const std::size_t required = command == "ls" ? 1 : (command == "upload" ? 3 : 2);
  if (args.size() < required) {
    std::cerr << "usage: see `sandcastle help` for " << command << "\n";
    return 1;
  }

  std::optional<std::uint16_t> port;
  if (command == "preview") {
    const auto parsed = parse_u64(args[1]);
    if (!parsed.has_value() || *parsed == 0 || *parsed > std::numeric_limits<std::uint16_t>::max()) {
      std::cerr << "invalid port: " << args[1] << "\n";
      return 1;
    }
    port = static_cast<std::uint16_t>(*parsed);
  }
  std::string upload_content;
  if (command == "upload") {
    std::ifstream in(args[1], std::ios::binary);
    if (!in) {
      std::cerr << "cannot read " << args[1] << "\n";
      return 1;
    }
    upload_content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  auto session = open_session(options);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  auto target = open_sandbox(*session.value().manager, args[0]);
  if (!target.ok()) {
    std::cerr << target.error() << "\n";
    return 1;
  }
  auto &provider = *target.value().provider;
  const auto &handle = target.value().handle;

  if (command == "ls") {
    auto files = provider.list_files(handle, args.size() > 1 ? args[1] : ".");
    if (!files.ok()) {
      std::cerr << files.error() << "\n";
      return 1;
    }
    for (const auto &file : files.value()) {
      std::cout << file.to_json() << "\n";
    }
    return 0;
  }
  if (command == "upload") {
    auto status = provider.upload_file(handle, args[2], upload_content);
    if (!status.ok()) {
      std::cerr << status.error() << "\n";
      return 1;
    }
    std::cout << "uploaded " << upload_content.size() << " bytes to " << args[2] << "\n";
    return 0;
  }
  if (command == "download") {
    auto content = provider.download_file(handle, args[1]);
    if (!content.ok()) {
      std::cerr << content.error() << "\n";
      return 1;
    }
    std::cout << content.value();
    return 0;
  }
  if (command == "rm") {
    auto status = provider.delete_file(handle, args[1]);
    if (!status.ok()) {
      std::cerr << status.error() << "\n";
      return 1;
    }
    std::cout << "deleted " << args[1] << "\n";
    return 0;
  }

  auto link = provider.get_preview_link(handle, *port);
  if (!link.ok()) {
    std::cerr << link.error() << "\n";
    return 1;
  }
  std::cout << link.value() << "\n";
  return 0;
}

int run_serve(std::vector<std::string> args, const GlobalOptions &options) {
  std::string host;
  std::string port_raw;
  std::string duration_raw;
  (void)take_option(args, "--host", "", host);
  (void)take_option(args, "--port", "-p", port_raw);
  (void)take_option(args, "--duration-secs", "", duration_raw);

  auto session = open_session(options);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }

  gateway::ServerOptions server_options;
  server_options.host = host.empty() ? session.value().config.gateway.host : host;
  server_options.port = session.value().config.gateway.port;
  if (!port_raw.empty()) {
    const auto port = parse_u64(port_raw);
    if (!port.has_value() || *port > std::numeric_limits<std::uint16_t>::max()) {
      std::cerr << "invalid port: " << port_raw << "\n";
      return 1;
    }
    server_options.port = static_cast<std::uint16_t>(*port);
  }
  std::optional<std::uint64_t> duration;
  if (!duration_raw.empty()) {
    duration = parse_u64(duration_raw);
    if (!duration.has_value()) {
      std::cerr << "invalid duration: " << duration_raw << "\n";
      return 1;
    }
  }

  gateway::AdminServer server(*session.value().manager);
  if (auto status = server.start(server_options); !status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }
  std::cout << "Admin server listening on " << server_options.host << ":" << server.port()
            << " (runtime " << session.value().manager->current_runtime_name() << ")\n";

  if (duration.has_value()) {
    std::this_thread::sleep_for(std::chrono::seconds(*duration));
    server.stop();
    return 0;
  }

  std::cout << "Press Enter to stop...\n";
  std::string line;
  std::getline(std::cin, line);
  server.stop();
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  GlobalOptions options;
  std::string global_error;
  if (!apply_global_options(args, options, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "status") {
    return run_status(options);
  }
  if (subcommand == "validate") {
    return run_validate(std::move(args), options);
  }
  if (subcommand == "health") {
    return run_health(options);
  }
  if (subcommand == "create") {
    return run_create(std::move(args), options);
  }
  if (subcommand == "ensure") {
    return run_ensure(std::move(args), options);
  }
  if (subcommand == "exec") {
    return run_exec(std::move(args), options);
  }
  if (subcommand == "delete") {
    return run_delete(std::move(args), options);
  }
  if (subcommand == "find") {
    return run_find(std::move(args), options);
  }
  if (subcommand == "ls" || subcommand == "upload" || subcommand == "download" ||
      subcommand == "rm" || subcommand == "preview") {
    return run_file_command(subcommand, std::move(args), options);
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args), options);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace sandcastle::cli
