#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "devready/common/diagnostic.hpp"
#include "devready/platform/platform.hpp"
#include "devready/platform/search_path.hpp"

namespace devready::platform {

namespace {

namespace fs = std::filesystem;

constexpr auto kEnvironmentKey =
    "SYSTEM\\CurrentControlSet\\Control\\Session Manager\\Environment";
constexpr auto kPathValue = "Path";

auto Win32Message(LSTATUS status) -> std::string {
  return std::system_category().message(static_cast<int>(status));
}

auto GetVariable(const char* name) -> std::optional<std::string> {
  DWORD size = ::GetEnvironmentVariableA(name, nullptr, 0);
  if (size == 0) {
    return std::nullopt;
  }
  std::string value(size, '\0');
  DWORD written = ::GetEnvironmentVariableA(name, value.data(), size);
  value.resize(written);
  return value;
}

// Extensions tried for a bare command name, from PATHEXT.
auto ExecutableExtensions() -> std::vector<std::string> {
  auto pathext = GetVariable("PATHEXT").value_or(".COM;.EXE;.BAT;.CMD");
  std::vector<std::string> extensions;
  for (const auto& ext : SplitSearchPath(pathext, ';')) {
    auto trimmed = TrimSegment(ext);
    if (!trimmed.empty()) {
      extensions.emplace_back(trimmed);
    }
  }
  return extensions;
}

auto IsRegularFile(const fs::path& candidate) -> bool {
  std::error_code ec;
  bool is_file = fs::is_regular_file(candidate, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    spdlog::debug("skipping '{}': {}", candidate.string(), ec.message());
  }
  return is_file;
}

class WindowsPlatform final : public Platform {
 public:
  auto ResolveCommand(std::string_view command)
      -> Result<std::optional<fs::path>> override {
    if (command.empty()) {
      return std::unexpected(Diagnostic::HostError("empty command name"));
    }

    auto extensions = ExecutableExtensions();
    bool has_extension = fs::path(command).has_extension();

    for (const auto& segment :
         SplitSearchPath(ProcessSearchPath(), kPathListDelimiter)) {
      auto dir = TrimSegment(segment);
      if (dir.empty()) {
        continue;
      }
      fs::path base = fs::path(dir) / command;
      if (has_extension && IsRegularFile(base)) {
        return base;
      }
      for (const auto& ext : extensions) {
        fs::path candidate = base;
        candidate += ext;
        if (IsRegularFile(candidate)) {
          return candidate;
        }
      }
    }
    return std::nullopt;
  }

  auto IsFile(const fs::path& path) -> Result<bool> override {
    std::error_code ec;
    bool is_file = fs::is_regular_file(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "cannot inspect '{}': {}", path.string(), ec.message())));
    }
    return is_file;
  }

  [[nodiscard]] auto ProcessSearchPath() const -> std::string override {
    return GetVariable("PATH").value_or("");
  }

  auto SetProcessSearchPath(const std::string& value) -> Result<void> override {
    if (::SetEnvironmentVariableA("PATH", value.c_str()) == 0) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "cannot set PATH: {}",
                  Win32Message(static_cast<LSTATUS>(::GetLastError())))));
    }
    // Keep the CRT copy used by getenv() in sync.
    if (::_putenv_s("PATH", value.c_str()) != 0) {
      return std::unexpected(
          Diagnostic::HostError("cannot update the C runtime copy of PATH"));
    }
    return {};
  }

  [[nodiscard]] auto IsElevated() const -> bool override {
    HANDLE token = nullptr;
    if (::OpenProcessToken(::GetCurrentProcess(), TOKEN_QUERY, &token) == 0) {
      return false;
    }
    TOKEN_ELEVATION elevation{};
    DWORD size = sizeof(elevation);
    bool elevated = ::GetTokenInformation(
                        token, TokenElevation, &elevation, sizeof(elevation),
                        &size) != 0 &&
                    elevation.TokenIsElevated != 0;
    ::CloseHandle(token);
    return elevated;
  }
};

// Machine-scope Path value under HKLM. Writing needs an elevated process.
class RegistryPathStore final : public PathStore {
 public:
  [[nodiscard]] auto Read() const -> Result<std::string> override {
    constexpr DWORD kFlags = RRF_RT_REG_SZ | RRF_RT_REG_EXPAND_SZ |
                             RRF_NOEXPAND;
    DWORD size = 0;
    LSTATUS status = ::RegGetValueA(
        HKEY_LOCAL_MACHINE, kEnvironmentKey, kPathValue, kFlags, nullptr,
        nullptr, &size);
    if (status == ERROR_FILE_NOT_FOUND) {
      return std::string();
    }
    if (status != ERROR_SUCCESS) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "cannot read machine Path: {}", Win32Message(status))));
    }

    std::string value(size, '\0');
    status = ::RegGetValueA(
        HKEY_LOCAL_MACHINE, kEnvironmentKey, kPathValue, kFlags, nullptr,
        value.data(), &size);
    if (status != ERROR_SUCCESS) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "cannot read machine Path: {}", Win32Message(status))));
    }
    // size includes the terminating null.
    value.resize(size > 0 ? size - 1 : 0);
    return value;
  }

  auto Write(const std::string& value) -> Result<void> override {
    HKEY key = nullptr;
    LSTATUS status = ::RegOpenKeyExA(
        HKEY_LOCAL_MACHINE, kEnvironmentKey, 0, KEY_SET_VALUE, &key);
    if (status != ERROR_SUCCESS) {
      auto diag = Diagnostic::HostError(
          fmt::format("cannot open machine environment key: {}",
                      Win32Message(status)));
      if (status == ERROR_ACCESS_DENIED) {
        return std::unexpected(
            std::move(diag).WithNote(
                "updating the machine Path requires administrator rights"));
      }
      return std::unexpected(std::move(diag));
    }

    status = ::RegSetValueExA(
        key, kPathValue, 0, REG_EXPAND_SZ,
        reinterpret_cast<const BYTE*>(value.c_str()),
        static_cast<DWORD>(value.size() + 1));
    ::RegCloseKey(key);
    if (status != ERROR_SUCCESS) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "cannot write machine Path: {}", Win32Message(status))));
    }

    // Let Explorer and new consoles pick up the change.
    DWORD_PTR result = 0;
    if (::SendMessageTimeoutA(
            HWND_BROADCAST, WM_SETTINGCHANGE, 0,
            reinterpret_cast<LPARAM>("Environment"), SMTO_ABORTIFHUNG, 5000,
            &result) == 0) {
      spdlog::debug("environment change broadcast timed out");
    }
    return {};
  }

  [[nodiscard]] auto Location() const -> std::string override {
    return fmt::format("HKLM\\{}\\{}", kEnvironmentKey, kPathValue);
  }
};

}  // namespace

auto CreateNativePlatform() -> std::unique_ptr<Platform> {
  return std::make_unique<WindowsPlatform>();
}

auto CreateNativePathStore(const std::optional<std::string>& location)
    -> std::unique_ptr<PathStore> {
  if (location) {
    spdlog::warn(
        "path store location '{}' ignored; the machine Path lives in the "
        "registry",
        *location);
  }
  return std::make_unique<RegistryPathStore>();
}

}  // namespace devready::platform
