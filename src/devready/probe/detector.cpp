#include "devready/probe/detector.hpp"

#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "devready/platform/platform.hpp"
#include "devready/probe/tool_probe.hpp"

namespace devready::probe {

auto ResolveOnSearchPath(const ToolProbe& probe, platform::Platform& platform)
    -> std::optional<std::string> {
  auto resolved = platform.ResolveCommand(probe.path_command);
  if (!resolved) {
    spdlog::warn(
        "resolving '{}' failed: {}", probe.path_command,
        resolved.error().Describe());
    return std::nullopt;
  }
  if (!resolved->has_value()) {
    return std::nullopt;
  }
  return (*resolved)->string();
}

auto Detect(const ToolProbe& probe, platform::Platform& platform)
    -> InstallationState {
  if (auto location = ResolveOnSearchPath(probe, platform)) {
    spdlog::info("{}: '{}' resolves to {}", probe.name, probe.path_command,
                 *location);
    return FoundOnPath{.location = *location};
  }

  for (const auto& dir : probe.known_install_dirs) {
    auto candidate = std::filesystem::path(dir) / probe.executable;
    auto is_file = platform.IsFile(candidate);
    if (!is_file) {
      spdlog::debug(
          "{}: treating '{}' as absent: {}", probe.name, candidate.string(),
          is_file.error().Describe());
      continue;
    }
    if (*is_file) {
      spdlog::info(
          "{}: installed in {} but not on the search path", probe.name, dir);
      return FoundNotOnPath{.directory = dir};
    }
    spdlog::debug("{}: no {} in {}", probe.name, probe.executable, dir);
  }

  spdlog::info("{}: not installed", probe.name);
  return NotFound{};
}

}  // namespace devready::probe
