#include "sandcastle/config/config.hpp"

#include "sandcastle/common/fs.hpp"
#include "sandcastle/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace sandcastle::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".sandcastle";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SANDCASTLE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("SANDCASTLE_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::uint32_t get_u32(const common::TomlDocument &doc, const std::string &key,
                      const std::uint32_t fallback) {
  const std::uint64_t value = doc.get_u64(key, fallback);
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    return fallback;
  }
  return static_cast<std::uint32_t>(value);
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }
  for (const char ch : host) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '.' || ch == '-' || ch == ':')) {
      return false;
    }
  }
  return true;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory", common::ErrorCode::Config);
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error(), home.code());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error(), cfg_dir.code());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (auto value = env_value("SANDBOX_RUNTIME")) {
    config.sandbox.runtime = common::to_lower(common::trim(*value));
  }
  if (auto value = env_value("DAYTONA_API_KEY")) {
    config.daytona.api_key = *value;
  }
  if (auto value = env_value("DAYTONA_SERVER_URL")) {
    config.daytona.server_url = *value;
  }
  if (auto value = env_value("DAYTONA_TARGET")) {
    config.daytona.target = *value;
  }
  if (auto value = env_value("SANDBOX_IMAGE_NAME")) {
    config.daytona.image = *value;
  }
  if (auto value = env_value("SANDBOX_ENTRYPOINT")) {
    config.daytona.entrypoint = *value;
  }
  if (auto value = env_value("E2B_BASE_PATH")) {
    config.e2b.base_path = common::expand_path(*value);
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error(), common::ErrorCode::Config);
  }
  const auto &doc = parsed.value();

  Config config;
  config.sandbox.runtime =
      common::to_lower(common::trim(doc.get_string("sandbox.runtime", config.sandbox.runtime)));

  auto &daytona = config.daytona;
  daytona.api_key = expand_config_value(doc.get_string("daytona.api_key", daytona.api_key));
  daytona.server_url =
      expand_config_value(doc.get_string("daytona.server_url", daytona.server_url));
  daytona.target = expand_config_value(doc.get_string("daytona.target", daytona.target));
  daytona.image = doc.get_string("daytona.image", daytona.image);
  daytona.entrypoint = doc.get_string("daytona.entrypoint", daytona.entrypoint);
  daytona.public_access = doc.get_bool("daytona.public", daytona.public_access);
  daytona.cpu = get_u32(doc, "daytona.cpu", daytona.cpu);
  daytona.memory_gb = get_u32(doc, "daytona.memory_gb", daytona.memory_gb);
  daytona.disk_gb = get_u32(doc, "daytona.disk_gb", daytona.disk_gb);
  daytona.request_timeout_ms =
      doc.get_u64("daytona.request_timeout_ms", daytona.request_timeout_ms);
  daytona.command_timeout_ms =
      doc.get_u64("daytona.command_timeout_ms", daytona.command_timeout_ms);
  daytona.restart_settle_ms = doc.get_u64("daytona.restart_settle_ms", daytona.restart_settle_ms);

  config.e2b.base_path = common::expand_path(doc.get_string("e2b.base_path", config.e2b.base_path));
  config.e2b.command_timeout_ms =
      doc.get_u64("e2b.command_timeout_ms", config.e2b.command_timeout_ms);

  config.gateway.host = doc.get_string("gateway.host", config.gateway.host);
  const int port = doc.get_int("gateway.port", config.gateway.port);
  if (port < 0 || port > 65535) {
    return common::Result<Config>::failure("gateway.port must be 1-65535",
                                           common::ErrorCode::Config);
  }
  config.gateway.port = static_cast<std::uint16_t>(port);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error(), common::ErrorCode::Config);
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           common::ErrorCode::Config);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                           common::ErrorCode::Config);
  }
  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error(), common::ErrorCode::Config);
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message(),
                                   common::ErrorCode::Config);
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file",
                                 common::ErrorCode::Config);
  }

  file << "[sandbox]\n";
  file << "runtime = " << common::quote_toml_string(config.sandbox.runtime) << "\n";

  const auto &daytona = config.daytona;
  file << "\n[daytona]\n";
  if (!daytona.api_key.empty()) {
    file << "api_key = " << common::quote_toml_string(daytona.api_key) << "\n";
  }
  file << "server_url = " << common::quote_toml_string(daytona.server_url) << "\n";
  file << "target = " << common::quote_toml_string(daytona.target) << "\n";
  file << "image = " << common::quote_toml_string(daytona.image) << "\n";
  file << "entrypoint = " << common::quote_toml_string(daytona.entrypoint) << "\n";
  file << "public = " << bool_to_toml(daytona.public_access) << "\n";
  file << "cpu = " << daytona.cpu << "\n";
  file << "memory_gb = " << daytona.memory_gb << "\n";
  file << "disk_gb = " << daytona.disk_gb << "\n";
  file << "request_timeout_ms = " << daytona.request_timeout_ms << "\n";
  file << "command_timeout_ms = " << daytona.command_timeout_ms << "\n";
  file << "restart_settle_ms = " << daytona.restart_settle_ms << "\n";

  file << "\n[e2b]\n";
  file << "base_path = " << common::quote_toml_string(config.e2b.base_path) << "\n";
  file << "command_timeout_ms = " << config.e2b.command_timeout_ms << "\n";

  file << "\n[gateway]\n";
  file << "host = " << common::quote_toml_string(config.gateway.host) << "\n";
  file << "port = " << config.gateway.port << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file",
                                 common::ErrorCode::Config);
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message(),
                                 common::ErrorCode::Config);
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const std::string runtime = common::to_lower(common::trim(config.sandbox.runtime));
  if (runtime != "daytona" && runtime != "e2b") {
    return Warnings::failure("Invalid sandbox.runtime: '" + config.sandbox.runtime +
                                 "'. Must be 'daytona' or 'e2b'",
                             common::ErrorCode::UnknownRuntime);
  }

  const auto &daytona = config.daytona;
  if (daytona.cpu == 0 || daytona.memory_gb == 0 || daytona.disk_gb == 0) {
    return Warnings::failure("daytona.cpu, daytona.memory_gb and daytona.disk_gb must be > 0",
                             common::ErrorCode::Config);
  }
  if (daytona.request_timeout_ms == 0 || daytona.command_timeout_ms == 0 ||
      config.e2b.command_timeout_ms == 0) {
    return Warnings::failure("timeouts must be > 0", common::ErrorCode::Config);
  }
  if (common::trim(daytona.image).empty()) {
    return Warnings::failure("daytona.image must not be empty", common::ErrorCode::Config);
  }
  if (common::trim(config.e2b.base_path).empty()) {
    return Warnings::failure("e2b.base_path must not be empty", common::ErrorCode::Config);
  }

  if (config.gateway.port == 0) {
    return Warnings::failure("gateway.port must be 1-65535", common::ErrorCode::Config);
  }
  if (!is_valid_host(config.gateway.host)) {
    return Warnings::failure("gateway.host is invalid: " + config.gateway.host,
                             common::ErrorCode::Config);
  }

  if (daytona.api_key.empty()) {
    warnings.push_back("Daytona API key is missing (daytona.api_key or DAYTONA_API_KEY)");
  }
  if (daytona.server_url.empty()) {
    warnings.push_back("Daytona server URL is missing (daytona.server_url or DAYTONA_SERVER_URL)");
  }
  if (daytona.target.empty()) {
    warnings.push_back("Daytona target is missing (daytona.target or DAYTONA_TARGET)");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace sandcastle::config
