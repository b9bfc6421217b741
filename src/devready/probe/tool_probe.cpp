#include "devready/probe/tool_probe.hpp"

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace devready::probe {

namespace {

auto LookupVariable(const std::string& name) -> std::optional<std::string> {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

auto IsNameChar(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

}  // namespace

auto ExpandEnvironmentReferences(std::string_view text)
    -> std::optional<std::string> {
  std::string result;
  size_t i = 0;
  while (i < text.size()) {
    char c = text[i];

    // %NAME%, allowing the parentheses in %ProgramFiles(x86)%
    if (c == '%') {
      auto close = text.find('%', i + 1);
      if (close != std::string_view::npos && close > i + 1) {
        auto value =
            LookupVariable(std::string(text.substr(i + 1, close - i - 1)));
        if (!value) {
          return std::nullopt;
        }
        result += *value;
        i = close + 1;
        continue;
      }
    }

    if (c == '$' && i + 1 < text.size()) {
      // ${NAME}
      if (text[i + 1] == '{') {
        auto close = text.find('}', i + 2);
        if (close != std::string_view::npos) {
          auto value =
              LookupVariable(std::string(text.substr(i + 2, close - i - 2)));
          if (!value) {
            return std::nullopt;
          }
          result += *value;
          i = close + 1;
          continue;
        }
      }
      // $NAME
      size_t end = i + 1;
      while (end < text.size() && IsNameChar(text[end])) {
        ++end;
      }
      if (end > i + 1) {
        auto value =
            LookupVariable(std::string(text.substr(i + 1, end - i - 1)));
        if (!value) {
          return std::nullopt;
        }
        result += *value;
        i = end;
        continue;
      }
    }

    result += c;
    ++i;
  }
  return result;
}

auto ExpandInstallDirs(const std::vector<std::string>& dirs)
    -> std::vector<std::string> {
  std::vector<std::string> expanded;
  for (const auto& dir : dirs) {
    if (auto value = ExpandEnvironmentReferences(dir)) {
      expanded.push_back(*std::move(value));
    } else {
      spdlog::debug("dropping install directory '{}': unset variable", dir);
    }
  }
  return expanded;
}

auto DefaultVcsProbe() -> ToolProbe {
#ifdef _WIN32
  return ToolProbe{
      .name = "Git",
      .path_command = "git",
      .executable = "git.exe",
      .known_install_dirs = ExpandInstallDirs({
          "%LOCALAPPDATA%\\Programs\\Git\\cmd",
          "%ProgramFiles%\\Git\\cmd",
          "%ProgramFiles(x86)%\\Git\\cmd",
      }),
      .install_url = "https://git-scm.com/download/win",
  };
#else
  return ToolProbe{
      .name = "Git",
      .path_command = "git",
      .executable = "git",
      .known_install_dirs = ExpandInstallDirs({
          "$HOME/.local/bin",
          "/usr/local/git/bin",
          "/opt/git/bin",
      }),
      .install_url = "https://git-scm.com/downloads",
  };
#endif
}

auto DefaultEditorProbe() -> ToolProbe {
#ifdef _WIN32
  return ToolProbe{
      .name = "Visual Studio Code",
      .path_command = "code",
      .executable = "code.cmd",
      .known_install_dirs = ExpandInstallDirs({
          "%LOCALAPPDATA%\\Programs\\Microsoft VS Code\\bin",
          "%ProgramFiles%\\Microsoft VS Code\\bin",
          "%ProgramFiles(x86)%\\Microsoft VS Code\\bin",
      }),
      .install_url = "https://code.visualstudio.com/download",
  };
#else
  return ToolProbe{
      .name = "Visual Studio Code",
      .path_command = "code",
      .executable = "code",
      .known_install_dirs = ExpandInstallDirs({
          "$HOME/.local/share/code/bin",
          "/usr/share/code/bin",
          "/opt/visual-studio-code/bin",
      }),
      .install_url = "https://code.visualstudio.com/download",
  };
#endif
}

}  // namespace devready::probe
