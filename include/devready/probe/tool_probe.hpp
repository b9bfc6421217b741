#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace devready::probe {

// What to look for when checking one tool. Built once at startup.
struct ToolProbe {
  std::string name;          // Display name, e.g. "Git"
  std::string path_command;  // Bare command resolved on the search path
  std::string executable;    // File expected inside an install directory
  // Candidate install directories, highest priority first: user-local, then
  // machine-wide 64-bit, then machine-wide 32-bit.
  std::vector<std::string> known_install_dirs;
  std::string install_url;  // Shown when the tool is not installed

  auto operator==(const ToolProbe&) const -> bool = default;
};

struct NotFound {
  auto operator==(const NotFound&) const -> bool = default;
};

// Installed in `directory` (the containing directory, not the executable),
// which is not on the current search path.
struct FoundNotOnPath {
  std::string directory;

  auto operator==(const FoundNotOnPath&) const -> bool = default;
};

// Resolved on the current search path at `location`.
struct FoundOnPath {
  std::string location;

  auto operator==(const FoundOnPath&) const -> bool = default;
};

using InstallationState = std::variant<NotFound, FoundNotOnPath, FoundOnPath>;

// Expand %NAME% (Windows style) and $NAME / ${NAME} (POSIX style) references
// against the process environment. Returns nullopt if a referenced variable
// is unset or empty.
auto ExpandEnvironmentReferences(std::string_view text)
    -> std::optional<std::string>;

// Expand every directory, dropping those that reference unset variables.
auto ExpandInstallDirs(const std::vector<std::string>& dirs)
    -> std::vector<std::string>;

// Built-in probes for the version-control client (Git) and the editor
// (Visual Studio Code), with this platform's install locations.
auto DefaultVcsProbe() -> ToolProbe;
auto DefaultEditorProbe() -> ToolProbe;

}  // namespace devready::probe
