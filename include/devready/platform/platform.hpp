#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "devready/common/diagnostic.hpp"

namespace devready::platform {

// Process-local view of the operating system: command resolution against the
// inherited search path, file checks, and the privilege of the current
// process. Implementations never throw; failures come back as Diagnostics.
class Platform {
 public:
  virtual ~Platform() = default;

  // Resolve a bare command name against the current process's search path.
  // nullopt means "not found"; an error means the lookup itself failed.
  [[nodiscard]] virtual auto ResolveCommand(std::string_view command)
      -> Result<std::optional<std::filesystem::path>> = 0;

  // True if `path` names an existing regular file.
  [[nodiscard]] virtual auto IsFile(const std::filesystem::path& path)
      -> Result<bool> = 0;

  [[nodiscard]] virtual auto ProcessSearchPath() const -> std::string = 0;
  [[nodiscard]] virtual auto SetProcessSearchPath(const std::string& value)
      -> Result<void> = 0;

  // Administrator token on Windows, effective uid 0 elsewhere.
  [[nodiscard]] virtual auto IsElevated() const -> bool = 0;
};

// Durable, machine-scope copy of the search path inherited by new sessions.
class PathStore {
 public:
  virtual ~PathStore() = default;

  // Current stored value. An unset variable reads as "".
  [[nodiscard]] virtual auto Read() const -> Result<std::string> = 0;

  // Replace the stored value. On error the stored value is unchanged.
  [[nodiscard]] virtual auto Write(const std::string& value)
      -> Result<void> = 0;

  // Human-readable location, e.g. "/etc/environment".
  [[nodiscard]] virtual auto Location() const -> std::string = 0;
};

// Delimiter between search path segments on this platform.
#ifdef _WIN32
inline constexpr char kPathListDelimiter = ';';
#else
inline constexpr char kPathListDelimiter = ':';
#endif

auto CreateNativePlatform() -> std::unique_ptr<Platform>;

// `location` overrides the store location where the platform supports it
// (the environment file on POSIX); the Windows registry store ignores it.
auto CreateNativePathStore(const std::optional<std::string>& location)
    -> std::unique_ptr<PathStore>;

}  // namespace devready::platform
