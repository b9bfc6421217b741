#include "devready/report/run_result.hpp"

#include <variant>

#include "devready/common/overloaded.hpp"
#include "devready/probe/tool_probe.hpp"

namespace devready::report {

auto Categorize(const probe::InstallationState& state) -> ToolStatus {
  return std::visit(
      Overloaded{
          [](const probe::NotFound&) { return ToolStatus::kNotInstalled; },
          [](const probe::FoundNotOnPath&) {
            return ToolStatus::kInstalledNotReachable;
          },
          [](const probe::FoundOnPath&) { return ToolStatus::kReachable; },
      },
      state);
}

auto StatusLabel(ToolStatus status) -> const char* {
  switch (status) {
    case ToolStatus::kReachable:
      return "installed & reachable";
    case ToolStatus::kInstalledNotReachable:
      return "installed, not reachable";
    case ToolStatus::kNotInstalled:
      return "not installed";
  }
  return "unknown";
}

auto IsReady(const RunResult& result) -> bool {
  return Categorize(result.vcs.state) == ToolStatus::kReachable &&
         Categorize(result.editor.state) == ToolStatus::kReachable;
}

}  // namespace devready::report
