#include "config.hpp"

#include <array>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "devready/common/diagnostic.hpp"
#include "devready/probe/tool_probe.hpp"

namespace devready::driver {

namespace {

namespace fs = std::filesystem;

auto FieldError(
    const fs::path& config_path, std::string_view table, std::string_view key,
    std::string_view expected) -> Diagnostic {
  return Diagnostic::HostError(
      fmt::format(
          "{}: '{}.{}' must be {}", config_path.string(), table, key,
          expected));
}

// Overwrite `target` if `key` is present; it must be a string.
auto ReadString(
    const toml::table& table, const fs::path& config_path,
    std::string_view table_name, std::string_view key, std::string& target)
    -> Result<void> {
  const toml::node* node = table.get(key);
  if (node == nullptr) {
    return {};
  }
  auto value = node->value<std::string>();
  if (!value) {
    return std::unexpected(
        FieldError(config_path, table_name, key, "a string"));
  }
  target = *value;
  return {};
}

auto ApplyToolTable(
    const toml::table& root, std::string_view table_name,
    const fs::path& config_path, probe::ToolProbe& probe) -> Result<void> {
  const toml::node* node = root.get(table_name);
  if (node == nullptr) {
    return {};
  }
  const toml::table* table = node->as_table();
  if (table == nullptr) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: '{}' must be a table", config_path.string(),
                table_name)));
  }

  const std::array<std::pair<std::string_view, std::string*>, 4>
      string_fields = {{
      {"name", &probe.name},
      {"command", &probe.path_command},
      {"executable", &probe.executable},
      {"install_url", &probe.install_url},
  }};
  for (const auto& [key, target] : string_fields) {
    auto result = ReadString(*table, config_path, table_name, key, *target);
    if (!result) {
      return result;
    }
  }

  if (const toml::node* dirs = table->get("install_dirs")) {
    const toml::array* arr = dirs->as_array();
    if (arr == nullptr) {
      return std::unexpected(
          FieldError(
              config_path, table_name, "install_dirs",
              "an array of strings"));
    }
    std::vector<std::string> raw;
    for (const auto& elem : *arr) {
      auto str = elem.value<std::string>();
      if (!str) {
        return std::unexpected(
            FieldError(
                config_path, table_name, "install_dirs",
                "an array of strings"));
      }
      raw.push_back(*str);
    }
    probe.known_install_dirs = probe::ExpandInstallDirs(raw);
  }

  if (probe.path_command.empty()) {
    return std::unexpected(
        FieldError(config_path, table_name, "command", "a non-empty string"));
  }
  return {};
}

}  // namespace

auto FindConfig(const std::optional<std::string>& cli_value)
    -> std::optional<fs::path> {
  if (cli_value) {
    return fs::path(*cli_value);
  }
  if (const char* env_path = std::getenv("DEVREADY_CONFIG")) {
    if (*env_path != '\0') {
      return fs::path(env_path);
    }
  }
  return std::nullopt;
}

auto LoadConfig(const fs::path& config_path) -> Result<CheckConfig> {
  CheckConfig config;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("config file not found: {}", config_path.string())));
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [vcs] and [editor] sections (optional)
  if (auto result = ApplyToolTable(tbl, "vcs", config_path, config.vcs);
      !result) {
    return std::unexpected(result.error());
  }
  if (auto result = ApplyToolTable(tbl, "editor", config_path, config.editor);
      !result) {
    return std::unexpected(result.error());
  }

  // [path] section (optional)
  if (auto path = tbl["path"]) {
    if (auto* path_table = path.as_table()) {
      std::string store;
      if (auto result =
              ReadString(*path_table, config_path, "path", "store", store);
          !result) {
        return std::unexpected(result.error());
      }
      if (!store.empty()) {
        config.path_store = store;
      }
    } else {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "{}: 'path' must be a table", config_path.string())));
    }
  }

  return config;
}

}  // namespace devready::driver
