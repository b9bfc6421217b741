#pragma once

#include <filesystem>
#include <string>

#include "devready/common/diagnostic.hpp"
#include "devready/platform/platform.hpp"

namespace devready::platform {

inline constexpr auto kDefaultEnvironmentFile = "/etc/environment";

// PathStore backed by a pam_env style environment file (KEY=VALUE lines, as in
// /etc/environment). Only the assignment of `variable` is rewritten; every
// other line is preserved as-is. Writes go through a sibling temporary file
// and a rename, so a failed write leaves the original file untouched.
class EnvironmentFileStore final : public PathStore {
 public:
  explicit EnvironmentFileStore(
      std::filesystem::path file, std::string variable = "PATH");

  [[nodiscard]] auto Read() const -> Result<std::string> override;
  [[nodiscard]] auto Write(const std::string& value) -> Result<void> override;
  [[nodiscard]] auto Location() const -> std::string override;

 private:
  std::filesystem::path file_;
  std::string variable_;
};

}  // namespace devready::platform
