#include "hotword/config/config.hpp"

#include "hotword/common/fs.hpp"
#include "hotword/common/toml.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace hotword::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".hotword";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *PREFERENCES_FILENAME = "preferences.db";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("HOTWORD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

common::Status read_ms(const common::TomlDocument &doc, const std::string &key,
                       std::chrono::milliseconds &out) {
  const auto raw = doc.get_u64(key, static_cast<std::uint64_t>(out.count()));
  if (raw > static_cast<std::uint64_t>(MAX_DURATION.count())) {
    return common::Status::error(key + " must be at most " +
                                 std::to_string(MAX_DURATION.count()));
  }
  out = std::chrono::milliseconds(static_cast<std::int64_t>(raw));
  return common::Status::success();
}

common::Status check_duration(const char *key, std::chrono::milliseconds value) {
  if (value.count() < 0) {
    return common::Status::error(std::string(key) + " must not be negative");
  }
  if (value > MAX_DURATION) {
    return common::Status::error(std::string(key) + " must be at most " +
                                 std::to_string(MAX_DURATION.count()));
  }
  return common::Status::success();
}

bool env_flag(const char *value) {
  const std::string normalized = common::to_lower(common::trim(value));
  return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
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
  return path.ok() && std::filesystem::exists(path.value());
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

common::Result<std::filesystem::path> preferences_path(const Config &config) {
  const std::string configured = common::trim(config.preferences.path);
  if (!configured.empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(configured)));
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / PREFERENCES_FILENAME);
}

void apply_env_overrides(Config &config) {
  if (const char *ua = std::getenv("HOTWORD_USER_AGENT"); ua != nullptr && *ua != '\0') {
    config.probe.user_agent = ua;
  }
  if (const char *phrases = std::getenv("HOTWORD_PHRASES"); phrases != nullptr && *phrases) {
    auto parsed = common::split(common::to_lower(phrases), ',');
    if (!parsed.empty()) {
      config.wake.phrases = std::move(parsed);
    }
  }
  if (const char *debug = std::getenv("HOTWORD_DEBUG"); debug != nullptr && *debug != '\0') {
    config.observability.debug = env_flag(debug);
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  auto &wake = config.wake;
  wake.phrases = doc.get_string_array("wake.phrases", wake.phrases);
  for (auto &phrase : wake.phrases) {
    phrase = common::to_lower(common::trim(phrase));
  }
  wake.max_distance =
      static_cast<std::size_t>(doc.get_u64("wake.max_distance", wake.max_distance));
  const std::pair<const char *, std::chrono::milliseconds *> durations[] = {
      {"wake.cooldown_ms", &wake.cooldown},
      {"wake.min_interval_ms", &wake.min_interval},
      {"wake.watchdog_interval_ms", &wake.watchdog_interval},
      {"wake.restart_delay_min_ms", &wake.restart_delay_min},
      {"wake.restart_delay_max_ms", &wake.restart_delay_max},
      {"wake.burst_restart_delay_ms", &wake.burst_restart_delay},
  };
  for (const auto &[key, target] : durations) {
    if (auto status = read_ms(doc, key, *target); !status.ok()) {
      return common::Result<Config>::from_status(status);
    }
  }
  wake.require_user_interaction =
      doc.get_bool("wake.require_user_interaction", wake.require_user_interaction);
  wake.auto_start = doc.get_bool("wake.auto_start", wake.auto_start);
  wake.language = doc.get_string("wake.language", wake.language);

  config.probe.user_agent = doc.get_string("probe.user_agent", config.probe.user_agent);
  config.probe.recognition_available =
      doc.get_bool("probe.recognition_available", config.probe.recognition_available);

  config.preferences.path = doc.get_string("preferences.path", config.preferences.path);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.debug = doc.get_bool("observability.debug", config.observability.debug);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  const auto &wake = config.wake;
  out << "[wake]\n";
  out << "phrases = " << common::toml_string_array(wake.phrases) << "\n";
  out << "max_distance = " << wake.max_distance << "\n";
  out << "cooldown_ms = " << wake.cooldown.count() << "\n";
  out << "min_interval_ms = " << wake.min_interval.count() << "\n";
  out << "watchdog_interval_ms = " << wake.watchdog_interval.count() << "\n";
  out << "restart_delay_min_ms = " << wake.restart_delay_min.count() << "\n";
  out << "restart_delay_max_ms = " << wake.restart_delay_max.count() << "\n";
  out << "burst_restart_delay_ms = " << wake.burst_restart_delay.count() << "\n";
  out << "require_user_interaction = " << bool_to_toml(wake.require_user_interaction) << "\n";
  out << "auto_start = " << bool_to_toml(wake.auto_start) << "\n";
  out << "language = " << common::quote_toml_string(wake.language) << "\n";

  out << "\n[probe]\n";
  out << "user_agent = " << common::quote_toml_string(config.probe.user_agent) << "\n";
  out << "recognition_available = " << bool_to_toml(config.probe.recognition_available)
      << "\n";

  out << "\n[preferences]\n";
  out << "path = " << common::quote_toml_string(config.preferences.path) << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "debug = " << bool_to_toml(config.observability.debug) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
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

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }
  file << render_config(config);
  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Failure = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;
  const auto &wake = config.wake;

  if (wake.phrases.empty()) {
    return Failure::failure("wake.phrases must contain at least one phrase");
  }
  std::size_t shortest = std::string::npos;
  for (const auto &phrase : wake.phrases) {
    if (common::trim(phrase).empty()) {
      return Failure::failure("wake.phrases must not contain empty phrases");
    }
    shortest = std::min(shortest, phrase.size());
  }
  if (wake.max_distance >= shortest) {
    warnings.push_back("wake.max_distance is not smaller than the shortest phrase; "
                       "almost any short fragment will match");
  }

  const std::pair<const char *, std::chrono::milliseconds> durations[] = {
      {"wake.cooldown_ms", wake.cooldown},
      {"wake.min_interval_ms", wake.min_interval},
      {"wake.watchdog_interval_ms", wake.watchdog_interval},
      {"wake.restart_delay_min_ms", wake.restart_delay_min},
      {"wake.restart_delay_max_ms", wake.restart_delay_max},
      {"wake.burst_restart_delay_ms", wake.burst_restart_delay},
  };
  for (const auto &[key, value] : durations) {
    if (auto status = check_duration(key, value); !status.ok()) {
      return Failure::from_status(status);
    }
  }
  if (wake.cooldown.count() <= 0) {
    return Failure::failure("wake.cooldown_ms must be greater than zero");
  }
  if (wake.restart_delay_min > wake.restart_delay_max) {
    return Failure::failure("wake.restart_delay_min_ms must not exceed wake.restart_delay_max_ms");
  }
  if (wake.watchdog_interval.count() == 0) {
    warnings.push_back("wake.watchdog_interval_ms is 0; silent engine deaths will not be healed");
  }
  if (common::trim(wake.language).empty()) {
    return Failure::failure("wake.language must not be empty");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty() && backend != "log" && backend != "none" && backend != "noop") {
    return Failure::failure("Invalid observability.backend: " + config.observability.backend);
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace hotword::config
