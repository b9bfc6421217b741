#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "devready/common/diagnostic.hpp"
#include "devready/probe/tool_probe.hpp"

namespace devready::driver {

struct CheckConfig {
  probe::ToolProbe vcs = probe::DefaultVcsProbe();
  probe::ToolProbe editor = probe::DefaultEditorProbe();
  // Location of the persistent path store, where the platform allows one.
  std::optional<std::string> path_store;
};

// Config file named on the command line, else by DEVREADY_CONFIG.
// Returns nullopt when neither is given; no file is searched for.
auto FindConfig(const std::optional<std::string>& cli_value)
    -> std::optional<std::filesystem::path>;

// Parse an override file on top of the built-in probes.
// Returns error Diagnostic on parse errors or mistyped fields.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<CheckConfig>;

}  // namespace devready::driver
