#pragma once

#include "tasktide/common/result.hpp"
#include "tasktide/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace tasktide::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] std::string expand_config_path(const std::string &path);

/// Persistence directory with `~` and `$VARS` expanded.
[[nodiscard]] std::filesystem::path persistence_dir(const Config &config);

/// Tasks file; relative paths resolve against the config directory.
[[nodiscard]] common::Result<std::filesystem::path> tasks_file_path(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Errors fail the result; questionable but usable values come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace tasktide::config
