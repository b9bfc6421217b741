#pragma once

#include <optional>
#include <string>

#include "devready/platform/platform.hpp"
#include "devready/probe/tool_probe.hpp"

namespace devready::probe {

// Resolve probe.path_command on the current process's search path. A failing
// resolver is logged and reported as "not resolved".
auto ResolveOnSearchPath(const ToolProbe& probe, platform::Platform& platform)
    -> std::optional<std::string>;

// Classify a tool. Install directories are only consulted when the command
// does not resolve. Never fails: collaborator errors count as "not found".
auto Detect(const ToolProbe& probe, platform::Platform& platform)
    -> InstallationState;

}  // namespace devready::probe
