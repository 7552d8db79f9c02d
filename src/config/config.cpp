#include "tasktide/config/config.hpp"

#include "tasktide/common/fs.hpp"
#include "tasktide/common/toml.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace tasktide::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".tasktide";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TASKTIDE_CONFIG_PATH"); env != nullptr && *env != '\0') {
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
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  setenv(name.c_str(), value.c_str(), 0);
#endif
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
  if (const char *env_file = std::getenv("TASKTIDE_ENV_FILE");
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

template <typename T> std::optional<T> env_number(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string value = common::trim(raw);
  T parsed{};
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

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

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

std::filesystem::path persistence_dir(const Config &config) {
  return std::filesystem::path(expand_config_path(config.scheduler.persistence_path));
}

common::Result<std::filesystem::path> tasks_file_path(const Config &config) {
  const std::filesystem::path raw(expand_config_path(config.scheduler.tasks_file));
  if (raw.is_absolute()) {
    return common::Result<std::filesystem::path>::success(raw);
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / raw);
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *path = std::getenv("TASKTIDE_PERSISTENCE_PATH"); path != nullptr && *path) {
    config.scheduler.persistence_path = path;
  } else if (const char *legacy = std::getenv("SCHEDULER_PERSISTENCE_PATH");
             legacy != nullptr && *legacy) {
    config.scheduler.persistence_path = legacy;
  }

  if (const auto max_instances = env_number<std::uint32_t>("SCHEDULER_MAX_INSTANCES");
      max_instances.has_value()) {
    config.scheduler.max_instances = *max_instances;
  }

  if (const auto retention = env_number<std::uint32_t>("SCHEDULER_RETENTION_DAYS");
      retention.has_value()) {
    config.scheduler.retention_days = *retention;
  }
}

common::Result<Config> load_config() {
  load_dotenv_files();

  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  auto &scheduler = config.scheduler;

  scheduler.persistence_path =
      expand_config_value(doc.get_string("scheduler.persistence_path", scheduler.persistence_path));
  scheduler.max_instances = static_cast<std::uint32_t>(
      doc.get_u64("scheduler.max_instances", scheduler.max_instances));
  scheduler.misfire_grace_seconds =
      doc.get_u64("scheduler.misfire_grace_seconds", scheduler.misfire_grace_seconds);
  scheduler.coalesce = doc.get_bool("scheduler.coalesce", scheduler.coalesce);
  scheduler.worker_threads = static_cast<std::uint32_t>(
      doc.get_u64("scheduler.worker_threads", scheduler.worker_threads));
  scheduler.retention_days = static_cast<std::uint32_t>(
      doc.get_u64("scheduler.retention_days", scheduler.retention_days));
  scheduler.cleanup_hour =
      static_cast<std::uint32_t>(doc.get_u64("scheduler.cleanup_hour", scheduler.cleanup_hour));
  scheduler.tasks_file =
      expand_config_value(doc.get_string("scheduler.tasks_file", scheduler.tasks_file));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
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

  const auto &scheduler = config.scheduler;
  file << "[scheduler]\n";
  file << "persistence_path = " << common::quote_toml_string(scheduler.persistence_path) << "\n";
  file << "max_instances = " << scheduler.max_instances << "\n";
  file << "misfire_grace_seconds = " << scheduler.misfire_grace_seconds << "\n";
  file << "coalesce = " << bool_to_toml(scheduler.coalesce) << "\n";
  file << "worker_threads = " << scheduler.worker_threads << "\n";
  file << "retention_days = " << scheduler.retention_days << "\n";
  file << "cleanup_hour = " << scheduler.cleanup_hour << "\n";
  file << "tasks_file = " << common::quote_toml_string(scheduler.tasks_file) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

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
  std::vector<std::string> warnings;
  const auto &scheduler = config.scheduler;

  if (common::trim(scheduler.persistence_path).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "scheduler.persistence_path must not be empty");
  }
  if (scheduler.max_instances == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "scheduler.max_instances must be > 0");
  }
  if (scheduler.worker_threads == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "scheduler.worker_threads must be > 0");
  }
  if (scheduler.retention_days == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "scheduler.retention_days must be > 0");
  }
  if (scheduler.cleanup_hour > 23) {
    return common::Result<std::vector<std::string>>::failure(
        "scheduler.cleanup_hour must be 0-23");
  }

  if (scheduler.misfire_grace_seconds == 0) {
    warnings.push_back("scheduler.misfire_grace_seconds is 0; any late fire will be dropped");
  }
  if (scheduler.worker_threads < scheduler.max_instances) {
    warnings.push_back("scheduler.worker_threads is lower than scheduler.max_instances");
  }

  std::stringstream backends(common::to_lower(config.observability.backend));
  std::string backend;
  while (std::getline(backends, backend, ',')) {
    backend = common::trim(backend);
    if (!backend.empty() && backend != "log" && backend != "none" && backend != "noop") {
      warnings.push_back("Unknown observability.backend '" + backend + "', falling back to log");
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace tasktide::config
