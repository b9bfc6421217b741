#include "devready/platform/environment_file_store.hpp"

#include <algorithm>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "devready/common/diagnostic.hpp"

namespace devready::platform {

namespace {

namespace fs = std::filesystem;

struct FileContents {
  std::vector<std::string> lines;
  bool trailing_newline = true;
};

// Parsed `[export ]NAME=VALUE` line.
struct Assignment {
  bool exported = false;
  std::string value;
};

auto Unquote(std::string_view value) -> std::string {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return std::string(value.substr(1, value.size() - 2));
  }
  return std::string(value);
}

auto ParseAssignment(std::string_view line, std::string_view variable)
    -> std::optional<Assignment> {
  auto start = line.find_first_not_of(" \t");
  if (start == std::string_view::npos) {
    return std::nullopt;
  }
  line.remove_prefix(start);
  if (line.starts_with('#')) {
    return std::nullopt;
  }

  Assignment assignment;
  constexpr std::string_view kExport = "export ";
  if (line.starts_with(kExport)) {
    assignment.exported = true;
    line.remove_prefix(kExport.size());
    line.remove_prefix(std::min(line.find_first_not_of(' '), line.size()));
  }

  if (!line.starts_with(variable) || line.size() <= variable.size() ||
      line[variable.size()] != '=') {
    return std::nullopt;
  }
  line.remove_prefix(variable.size() + 1);

  auto end = line.find_last_not_of(" \t\r");
  line = (end == std::string_view::npos) ? std::string_view{}
                                         : line.substr(0, end + 1);
  assignment.value = Unquote(line);
  return assignment;
}

// Missing file reads as empty contents; unreadable file is an error.
auto ReadContents(const fs::path& file) -> Result<FileContents> {
  FileContents contents;

  std::error_code ec;
  bool exists = fs::exists(file, ec);
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot access '{}': {}", file.string(), ec.message())));
  }
  if (!exists) {
    return contents;
  }

  std::ifstream in(file, std::ios::binary);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("cannot read '{}'", file.string())));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  std::string text = buffer.str();

  contents.trailing_newline = text.empty() || text.back() == '\n';
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    contents.lines.push_back(line);
  }
  return contents;
}

}  // namespace

EnvironmentFileStore::EnvironmentFileStore(fs::path file, std::string variable)
    : file_(std::move(file)), variable_(std::move(variable)) {
}

auto EnvironmentFileStore::Read() const -> Result<std::string> {
  auto contents = ReadContents(file_);
  if (!contents) {
    return std::unexpected(contents.error());
  }

  // pam_env applies assignments in order; the last one wins.
  std::string value;
  for (const auto& line : contents->lines) {
    if (auto assignment = ParseAssignment(line, variable_)) {
      value = std::move(assignment->value);
    }
  }
  return value;
}

auto EnvironmentFileStore::Write(const std::string& value) -> Result<void> {
  auto contents = ReadContents(file_);
  if (!contents) {
    return std::unexpected(contents.error());
  }

  std::optional<size_t> last_assignment;
  bool exported = false;
  for (size_t i = 0; i < contents->lines.size(); ++i) {
    if (auto assignment = ParseAssignment(contents->lines[i], variable_)) {
      last_assignment = i;
      exported = assignment->exported;
    }
  }

  std::string new_line =
      fmt::format("{}{}=\"{}\"", exported ? "export " : "", variable_, value);
  if (last_assignment) {
    contents->lines[*last_assignment] = std::move(new_line);
  } else {
    contents->lines.push_back(std::move(new_line));
    contents->trailing_newline = true;
  }

  std::string text;
  for (size_t i = 0; i < contents->lines.size(); ++i) {
    text += contents->lines[i];
    if (i + 1 < contents->lines.size() || contents->trailing_newline) {
      text += '\n';
    }
  }

  fs::path temp_path = file_;
  temp_path += ".devready.tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("cannot write '{}'", file_.string()))
              .WithNote("updating the machine search path requires root"));
    }
    out << text;
    out.flush();
    if (!out) {
      std::error_code ignored;
      fs::remove(temp_path, ignored);
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("failed to write '{}'", temp_path.string())));
    }
  }

  std::error_code ec;
  auto status = fs::status(file_, ec);
  if (!ec && fs::exists(status)) {
    fs::permissions(temp_path, status.permissions(), ec);
    if (ec) {
      spdlog::debug(
          "could not copy permissions to '{}': {}", temp_path.string(),
          ec.message());
    }
  }

  fs::rename(temp_path, file_, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp_path, ignored);
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot replace '{}': {}", file_.string(), ec.message())));
  }

  spdlog::debug("wrote {} to '{}'", variable_, file_.string());
  return {};
}

auto EnvironmentFileStore::Location() const -> std::string {
  return file_.string();
}

}  // namespace devready::platform
