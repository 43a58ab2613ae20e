#include "devpulse/config/config.hpp"

#include "devpulse/common/fs.hpp"
#include "devpulse/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace devpulse::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".devpulse";
constexpr const char *CONFIG_FILENAME = "config.toml";

std::optional<std::filesystem::path>
resolved_override(const std::optional<std::filesystem::path> &explicit_path) {
  if (explicit_path.has_value() && !explicit_path->empty()) {
    return std::filesystem::path(common::expand_path(explicit_path->string()));
  }
  if (const char *env = std::getenv("DEVPULSE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<std::uint64_t> env_u64(const char *name) {
  const auto raw = env_value(name);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  auto parsed = common::parse_duration(*raw);
  if (!parsed.ok() || parsed.value().count() < 0) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(parsed.value().count());
}

std::optional<std::string> optional_string(const common::TomlDocument &doc,
                                           const std::string &key,
                                           const std::optional<std::string> &fallback) {
  if (!doc.has(key)) {
    return fallback;
  }
  const std::string value = common::expand_path(doc.get_string(key));
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::uint64_t duration_ms(const common::TomlDocument &doc, const std::string &key,
                          std::uint64_t fallback_ms) {
  const auto value =
      doc.get_duration(key, std::chrono::milliseconds(static_cast<std::int64_t>(fallback_ms)));
  return value.count() < 0 ? fallback_ms : static_cast<std::uint64_t>(value.count());
}

std::uint64_t duration_secs(const common::TomlDocument &doc, const std::string &key,
                            std::uint64_t fallback_secs) {
  if (!doc.has(key)) {
    return fallback_secs;
  }
  // Bare integers in *_secs keys are seconds; suffixed strings are converted.
  const std::string raw = doc.get_string(key);
  if (!raw.empty() && raw.find_first_not_of("0123456789_") == std::string::npos) {
    return doc.get_u64(key, fallback_secs);
  }
  auto parsed = common::parse_duration(raw);
  if (!parsed.ok() || parsed.value().count() < 0) {
    return fallback_secs;
  }
  return static_cast<std::uint64_t>(parsed.value().count()) / 1000;
}

bool is_valid_subject_token(const std::string &subject) {
  if (subject.empty() || subject.front() == '.' || subject.back() == '.') {
    return false;
  }
  for (std::size_t i = 0; i < subject.size(); ++i) {
    const char ch = subject[i];
    if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '*' || ch == '>') {
      return false;
    }
    if (ch == '.' && i + 1 < subject.size() && subject[i + 1] == '.') {
      return false;
    }
  }
  return true;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path>
config_path(const std::optional<std::filesystem::path> &explicit_path) {
  if (const auto override_path = resolved_override(explicit_path); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER /
                                                        CONFIG_FILENAME);
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error(), parsed.kind());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &health = config.health;
  health.cooldown_secs = duration_secs(doc, "health.cooldown_secs", health.cooldown_secs);
  health.cleanup_interval_secs =
      duration_secs(doc, "health.cleanup_interval_secs", health.cleanup_interval_secs);
  health.max_concurrent =
      static_cast<std::uint32_t>(doc.get_u64("health.max_concurrent", health.max_concurrent));
  health.worker_threads =
      static_cast<std::uint32_t>(doc.get_u64("health.worker_threads", health.worker_threads));
  health.queue_capacity =
      static_cast<std::uint32_t>(doc.get_u64("health.queue_capacity", health.queue_capacity));
  health.retry_attempts =
      static_cast<std::uint32_t>(doc.get_u64("health.retry_attempts", health.retry_attempts));
  health.initial_delay_ms = duration_ms(doc, "health.initial_delay_ms", health.initial_delay_ms);
  health.request_timeout_ms =
      duration_ms(doc, "health.request_timeout_ms", health.request_timeout_ms);
  health.user_agent = doc.get_string("health.user_agent", health.user_agent);
  health.max_body_bytes = doc.get_u64("health.max_body_bytes", health.max_body_bytes);
  health.publish_status_changes =
      doc.get_bool("health.publish_status_changes", health.publish_status_changes);

  auto &bus = config.bus;
  bus.urls = doc.get_string_array("bus.urls", bus.urls);
  bus.client_id = doc.get_string("bus.client_id", bus.client_id);
  bus.subject_prefix = doc.get_string("bus.subject_prefix", bus.subject_prefix);
  bus.user = optional_string(doc, "bus.user", bus.user);
  bus.password = optional_string(doc, "bus.password", bus.password);
  bus.token = optional_string(doc, "bus.token", bus.token);
  bus.connect_timeout_ms = duration_ms(doc, "bus.connect_timeout_ms", bus.connect_timeout_ms);
  bus.reconnect_wait_ms = duration_ms(doc, "bus.reconnect_wait_ms", bus.reconnect_wait_ms);
  bus.max_reconnect_attempts = static_cast<std::uint32_t>(
      doc.get_u64("bus.max_reconnect_attempts", bus.max_reconnect_attempts));
  bus.ping_interval_secs = duration_secs(doc, "bus.ping_interval_secs", bus.ping_interval_secs);
  bus.max_pings_outstanding = static_cast<std::uint32_t>(
      doc.get_u64("bus.max_pings_outstanding", bus.max_pings_outstanding));
  bus.close_timeout_ms = duration_ms(doc, "bus.close_timeout_ms", bus.close_timeout_ms);
  bus.publish_timeout_ms = duration_ms(doc, "bus.publish_timeout_ms", bus.publish_timeout_ms);

  config.storage.backend = doc.get_string("storage.backend", config.storage.backend);
  config.storage.path = doc.get_string("storage.path", config.storage.path);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level = doc.get_string("observability.level", config.observability.level);

  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (const auto url = env_value("DEVPULSE_BUS_URL"); url.has_value()) {
    std::vector<std::string> urls;
    std::stringstream stream(*url);
    std::string part;
    while (std::getline(stream, part, ',')) {
      part = common::trim(part);
      if (!part.empty()) {
        urls.push_back(part);
      }
    }
    if (!urls.empty()) {
      config.bus.urls = std::move(urls);
    }
  }
  if (const auto client_id = env_value("DEVPULSE_BUS_CLIENT_ID"); client_id.has_value()) {
    config.bus.client_id = *client_id;
  }
  if (const auto prefix = env_value("DEVPULSE_SUBJECT_PREFIX"); prefix.has_value()) {
    config.bus.subject_prefix = *prefix;
  }
  if (const auto token = env_value("DEVPULSE_BUS_TOKEN"); token.has_value()) {
    config.bus.token = *token;
  }
  if (const auto path = env_value("DEVPULSE_STORAGE_PATH"); path.has_value()) {
    config.storage.path = *path;
  }
  if (const auto level = env_value("DEVPULSE_LOG_LEVEL"); level.has_value()) {
    config.observability.level = *level;
  }
  if (const auto timeout = env_u64("DEVPULSE_HEALTH_TIMEOUT_MS"); timeout.has_value()) {
    config.health.request_timeout_ms = *timeout;
  }
  if (const auto attempts = env_value("DEVPULSE_HEALTH_RETRY_ATTEMPTS"); attempts.has_value()) {
    try {
      config.health.retry_attempts = static_cast<std::uint32_t>(std::stoul(*attempts));
    } catch (const std::exception &) {
      // Invalid values leave the file setting in place.
    }
  }
  if (const auto delay = env_u64("DEVPULSE_HEALTH_INITIAL_DELAY_MS"); delay.has_value()) {
    config.health.initial_delay_ms = *delay;
  }
}

common::Result<Config> load_config(const std::optional<std::filesystem::path> &explicit_path) {
  const auto cfg_path_result = config_path(explicit_path);
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                           parsed.kind());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

std::string render_config(const Config &config) {
  std::ostringstream file;
  const auto &health = config.health;
  file << "[health]\n";
  file << "cooldown_secs = " << health.cooldown_secs << "\n";
  file << "cleanup_interval_secs = " << health.cleanup_interval_secs << "\n";
  file << "max_concurrent = " << health.max_concurrent << "\n";
  file << "worker_threads = " << health.worker_threads << "\n";
  file << "queue_capacity = " << health.queue_capacity << "\n";
  file << "retry_attempts = " << health.retry_attempts << "\n";
  file << "initial_delay_ms = " << health.initial_delay_ms << "\n";
  file << "request_timeout_ms = " << health.request_timeout_ms << "\n";
  file << "user_agent = " << common::quote_toml_string(health.user_agent) << "\n";
  file << "max_body_bytes = " << health.max_body_bytes << "\n";
  file << "publish_status_changes = " << bool_to_toml(health.publish_status_changes) << "\n";

  const auto &bus = config.bus;
  file << "\n[bus]\n";
  file << "urls = " << common::toml_string_array(bus.urls) << "\n";
  file << "client_id = " << common::quote_toml_string(bus.client_id) << "\n";
  file << "subject_prefix = " << common::quote_toml_string(bus.subject_prefix) << "\n";
  if (bus.user.has_value()) {
    file << "user = " << common::quote_toml_string(*bus.user) << "\n";
  }
  if (bus.password.has_value()) {
    file << "password = " << common::quote_toml_string(*bus.password) << "\n";
  }
  if (bus.token.has_value()) {
    file << "token = " << common::quote_toml_string(*bus.token) << "\n";
  }
  file << "connect_timeout_ms = " << bus.connect_timeout_ms << "\n";
  file << "reconnect_wait_ms = " << bus.reconnect_wait_ms << "\n";
  file << "max_reconnect_attempts = " << bus.max_reconnect_attempts << "\n";
  file << "ping_interval_secs = " << bus.ping_interval_secs << "\n";
  file << "max_pings_outstanding = " << bus.max_pings_outstanding << "\n";
  file << "close_timeout_ms = " << bus.close_timeout_ms << "\n";
  file << "publish_timeout_ms = " << bus.publish_timeout_ms << "\n";

  file << "\n[storage]\n";
  file << "backend = " << common::quote_toml_string(config.storage.backend) << "\n";
  file << "path = " << common::quote_toml_string(config.storage.path) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "level = " << common::quote_toml_string(config.observability.level) << "\n";
  return file.str();
}

common::Status save_config(const Config &config,
                           const std::optional<std::filesystem::path> &explicit_path) {
  const auto cfg_path_result = config_path(explicit_path);
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      return common::Status::error("Unable to write temporary config file");
    }
    file << render_config(config);
    if (!file) {
      return common::Status::error("Failed to write temporary config file");
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(tmp_path, path, rename_ec);
  if (rename_ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    return common::Status::error("Failed to replace config file: " + rename_ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  const auto &health = config.health;
  if (health.cooldown_secs == 0) {
    errors.emplace_back("health.cooldown_secs must be positive");
  }
  if (health.cleanup_interval_secs == 0) {
    errors.emplace_back("health.cleanup_interval_secs must be positive");
  }
  if (health.max_concurrent == 0) {
    errors.emplace_back("health.max_concurrent must be at least 1");
  }
  if (health.worker_threads == 0) {
    errors.emplace_back("health.worker_threads must be at least 1");
  }
  if (health.queue_capacity == 0) {
    errors.emplace_back("health.queue_capacity must be at least 1");
  }
  if (health.retry_attempts == 0) {
    errors.emplace_back("health.retry_attempts must be at least 1");
  }
  if (health.request_timeout_ms == 0) {
    errors.emplace_back("health.request_timeout_ms must be positive");
  }
  if (health.max_body_bytes == 0) {
    errors.emplace_back("health.max_body_bytes must be positive");
  }
  if (health.initial_delay_ms == 0 && health.retry_attempts > 1) {
    warnings.emplace_back("health.initial_delay_ms is 0: retries will not back off");
  }
  if (health.worker_threads < health.max_concurrent) {
    warnings.emplace_back("health.worker_threads is below health.max_concurrent; "
                          "concurrency is capped by the worker count");
  }

  const auto &bus = config.bus;
  if (bus.urls.empty()) {
    errors.emplace_back("bus.urls must list at least one server");
  }
  for (const auto &url : bus.urls) {
    if (!common::starts_with(common::to_lower(url), "nats://")) {
      errors.push_back("bus.urls entry must use nats://: " + url);
    }
  }
  if (common::trim(bus.client_id).empty()) {
    errors.emplace_back("bus.client_id is required");
  }
  if (!is_valid_subject_token(bus.subject_prefix)) {
    errors.push_back("bus.subject_prefix is not a valid subject: " + bus.subject_prefix);
  }
  if (bus.connect_timeout_ms == 0) {
    errors.emplace_back("bus.connect_timeout_ms must be positive");
  }
  if (bus.close_timeout_ms == 0) {
    errors.emplace_back("bus.close_timeout_ms must be positive");
  }
  if (bus.publish_timeout_ms == 0) {
    errors.emplace_back("bus.publish_timeout_ms must be positive");
  }
  if (bus.user.has_value() != bus.password.has_value()) {
    warnings.emplace_back("bus.user and bus.password should be set together");
  }
  if (bus.token.has_value() && bus.user.has_value()) {
    warnings.emplace_back("bus.token and bus.user are both set; the token takes precedence");
  }

  const std::string storage = common::to_lower(common::trim(config.storage.backend));
  if (storage != "sqlite" && storage != "memory") {
    errors.push_back("Invalid storage.backend: " + config.storage.backend);
  }
  if (storage == "sqlite" && common::trim(config.storage.path).empty()) {
    errors.emplace_back("storage.path is required for the sqlite backend");
  }

  std::stringstream backends(common::to_lower(config.observability.backend));
  std::string backend;
  while (std::getline(backends, backend, ',')) {
    backend = common::trim(backend);
    if (!backend.empty() && backend != "log" && backend != "none" && backend != "noop") {
      errors.push_back("Invalid observability.backend: " + backend);
    }
  }
  const std::string level = common::to_lower(common::trim(config.observability.level));
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    errors.push_back("Invalid observability.level: " + config.observability.level);
  }

  if (!errors.empty()) {
    std::string message = errors.front();
    for (std::size_t i = 1; i < errors.size(); ++i) {
      message += "; " + errors[i];
    }
    return common::Result<std::vector<std::string>>::failure(message,
                                                             common::ErrorKind::Validation);
  }
  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace devpulse::config
