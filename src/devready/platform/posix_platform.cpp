#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "devready/common/diagnostic.hpp"
#include "devready/platform/environment_file_store.hpp"
#include "devready/platform/platform.hpp"
#include "devready/platform/search_path.hpp"

namespace devready::platform {

namespace {

namespace fs = std::filesystem;

auto IsExecutableFile(const fs::path& candidate) -> bool {
  std::error_code ec;
  if (!fs::is_regular_file(candidate, ec)) {
    if (ec && ec != std::errc::no_such_file_or_directory) {
      spdlog::debug("skipping '{}': {}", candidate.string(), ec.message());
    }
    return false;
  }
  return ::access(candidate.c_str(), X_OK) == 0;
}

class PosixPlatform final : public Platform {
 public:
  auto ResolveCommand(std::string_view command)
      -> Result<std::optional<fs::path>> override {
    if (command.empty()) {
      return std::unexpected(Diagnostic::HostError("empty command name"));
    }

    // Names with a slash are not looked up on the search path.
    if (command.find('/') != std::string_view::npos) {
      fs::path direct(command);
      if (IsExecutableFile(direct)) {
        return direct;
      }
      return std::nullopt;
    }

    for (const auto& segment :
         SplitSearchPath(ProcessSearchPath(), kPathListDelimiter)) {
      // An empty segment means the current directory.
      fs::path dir = segment.empty() ? fs::path(".") : fs::path(segment);
      fs::path candidate = dir / command;
      if (IsExecutableFile(candidate)) {
        return candidate;
      }
    }
    return std::nullopt;
  }

  auto IsFile(const fs::path& path) -> Result<bool> override {
    std::error_code ec;
    bool is_file = fs::is_regular_file(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory &&
        ec != std::errc::not_a_directory) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "cannot inspect '{}': {}", path.string(), ec.message())));
    }
    return is_file;
  }

  [[nodiscard]] auto ProcessSearchPath() const -> std::string override {
    const char* value = std::getenv("PATH");
    return value != nullptr ? std::string(value) : std::string();
  }

  auto SetProcessSearchPath(const std::string& value) -> Result<void> override {
    if (::setenv("PATH", value.c_str(), 1) != 0) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("cannot set PATH: {}", std::strerror(errno))));
    }
    return {};
  }

  [[nodiscard]] auto IsElevated() const -> bool override {
    return ::geteuid() == 0;
  }
};

}  // namespace

auto CreateNativePlatform() -> std::unique_ptr<Platform> {
  return std::make_unique<PosixPlatform>();
}

auto CreateNativePathStore(const std::optional<std::string>& location)
    -> std::unique_ptr<PathStore> {
  return std::make_unique<EnvironmentFileStore>(
      location.value_or(kDefaultEnvironmentFile));
}

}  // namespace devready::platform
