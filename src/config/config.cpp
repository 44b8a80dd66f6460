#include "almanac/config/config.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace almanac::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".almanac";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *SCHEDULE_FILENAME = "schedules.json";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("ALMANAC_CONFIG_PATH"); env != nullptr && *env != '\0') {
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

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
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
      out.push_back(ch == 'n' ? '\n' : ch == 't' ? '\t' : ch);
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
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
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
    if (!key.empty()) {
      set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
    }
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const auto env_file = env_value("ALMANAC_ENV_FILE"); env_file.has_value()) {
    candidates.emplace_back(common::expand_path(*env_file));
  }
  // First file wins: set_env_if_missing never overwrites.
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

bool is_valid_host(const std::string &host) {
  const std::string trimmed = common::trim(host);
  if (trimmed.empty()) {
    return false;
  }
  for (const char ch : trimmed) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == '/' || ch == '?') {
      return false;
    }
  }
  return true;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
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
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
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

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<std::filesystem::path> schedule_file(const Config &config) {
  const std::string configured = common::trim(config.schedule.file);
  if (!configured.empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(configured)));
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / SCHEDULE_FILENAME);
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const auto base_url = env_value("OPENROUTER_BASE_URL"); base_url.has_value()) {
    config.provider.base_url = *base_url;
  }
  if (const auto model = env_value("ALMANAC_MODEL"); model.has_value()) {
    config.provider.model = *model;
  } else if (const auto legacy_model = env_value("MODEL_NAME"); legacy_model.has_value()) {
    config.provider.model = *legacy_model;
  }
  if (const auto schedule = env_value("ALMANAC_SCHEDULE_FILE"); schedule.has_value()) {
    config.schedule.file = *schedule;
  }

  if (const auto api_key = env_value("ALMANAC_API_KEY"); api_key.has_value()) {
    config.provider.api_key = *api_key;
    return;
  }
  if (config.provider.api_key.has_value() && !common::trim(*config.provider.api_key).empty()) {
    return;
  }
  if (const auto openrouter = env_value("OPENROUTER_API_KEY"); openrouter.has_value()) {
    config.provider.api_key = *openrouter;
    return;
  }
  // OpenRouter keys are sometimes exported under the OpenAI name.
  if (const auto openai = env_value("OPENAI_API_KEY");
      openai.has_value() && common::starts_with(*openai, "sk-or-")) {
    config.provider.api_key = *openai;
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  if (doc.has("provider.api_key")) {
    config.provider.api_key = expand_config_value(doc.get_string("provider.api_key"));
  }
  config.provider.base_url =
      expand_config_value(doc.get_string("provider.base_url", config.provider.base_url));
  config.provider.model = doc.get_string("provider.model", config.provider.model);
  config.provider.temperature =
      doc.get_double("provider.temperature", config.provider.temperature);
  config.provider.timeout_ms = doc.get_u64("provider.timeout_ms", config.provider.timeout_ms);
  config.provider.max_retries = static_cast<std::uint32_t>(
      doc.get_u64("provider.max_retries", config.provider.max_retries));
  config.provider.backoff_ms = doc.get_u64("provider.backoff_ms", config.provider.backoff_ms);

  config.gateway.host = doc.get_string("gateway.host", config.gateway.host);
  const auto port = doc.get_int("gateway.port", config.gateway.port);
  if (port < 0 || port > 65535) {
    return common::Result<Config>::failure("gateway.port must be 1-65535");
  }
  config.gateway.port = static_cast<std::uint16_t>(port);
  config.gateway.max_clients =
      static_cast<std::size_t>(doc.get_u64("gateway.max_clients", config.gateway.max_clients));
  config.gateway.tls_enabled = doc.get_bool("gateway.tls_enabled", config.gateway.tls_enabled);
  config.gateway.tls_cert_file =
      expand_config_value(doc.get_string("gateway.tls_cert_file", config.gateway.tls_cert_file));
  config.gateway.tls_key_file =
      expand_config_value(doc.get_string("gateway.tls_key_file", config.gateway.tls_key_file));

  config.agent.max_tool_iterations = static_cast<std::uint32_t>(
      doc.get_u64("agent.max_tool_iterations", config.agent.max_tool_iterations));
  config.agent.system_prompt_file = expand_config_value(
      doc.get_string("agent.system_prompt_file", config.agent.system_prompt_file));

  config.schedule.file = expand_config_value(doc.get_string("schedule.file", config.schedule.file));

  config.notifier.enabled = doc.get_bool("notifier.enabled", config.notifier.enabled);
  config.notifier.interval_secs = static_cast<std::uint32_t>(
      doc.get_u64("notifier.interval_secs", config.notifier.interval_secs));
  config.notifier.sink = doc.get_string("notifier.sink", config.notifier.sink);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.provider.temperature < 0.0 || config.provider.temperature > 2.0) {
    return common::Result<std::vector<std::string>>::failure(
        "provider.temperature must be between 0.0 and 2.0");
  }
  if (common::trim(config.provider.base_url).empty()) {
    return common::Result<std::vector<std::string>>::failure("provider.base_url is empty");
  }
  if (!config.provider.api_key.has_value() || common::trim(*config.provider.api_key).empty()) {
    warnings.push_back("no API key configured; set OPENROUTER_API_KEY or provider.api_key");
  }

  if (config.gateway.port == 0) {
    return common::Result<std::vector<std::string>>::failure("gateway.port must be 1-65535");
  }
  if (!is_valid_host(config.gateway.host)) {
    return common::Result<std::vector<std::string>>::failure("gateway.host is invalid: " +
                                                              config.gateway.host);
  }
  if (config.gateway.max_clients == 0) {
    return common::Result<std::vector<std::string>>::failure("gateway.max_clients must be > 0");
  }
  if (config.gateway.tls_enabled) {
    if (config.gateway.tls_cert_file.empty() || config.gateway.tls_key_file.empty()) {
      return common::Result<std::vector<std::string>>::failure(
          "gateway TLS requires tls_cert_file and tls_key_file");
    }
    std::error_code ec;
    if (!std::filesystem::exists(config.gateway.tls_cert_file, ec)) {
      warnings.push_back("gateway.tls_cert_file does not exist: " + config.gateway.tls_cert_file);
    }
  }

  if (config.agent.max_tool_iterations == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "agent.max_tool_iterations must be > 0");
  }
  if (!config.agent.system_prompt_file.empty()) {
    std::error_code ec;
    if (!std::filesystem::exists(config.agent.system_prompt_file, ec)) {
      warnings.push_back("agent.system_prompt_file not found, using built-in prompt");
    }
  }

  if (config.notifier.interval_secs == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "notifier.interval_secs must be > 0");
  }
  const std::string sink = common::to_lower(common::trim(config.notifier.sink));
  if (sink != "log" && sink != "desktop") {
    return common::Result<std::vector<std::string>>::failure("Invalid notifier.sink: " +
                                                              config.notifier.sink);
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend != "log" && backend != "debug" && backend != "errors" && backend != "none" &&
      backend != "noop") {
    warnings.push_back("unknown observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace almanac::config
