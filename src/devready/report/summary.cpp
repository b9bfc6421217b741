#include "devready/report/summary.hpp"

#include <cstdio>
#include <string>
#include <variant>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "devready/common/overloaded.hpp"
#include "devready/probe/tool_probe.hpp"
#include "devready/reconcile/path_reconciler.hpp"
#include "devready/report/run_result.hpp"

namespace devready::report {

namespace {

constexpr int kNameWidth = 20;

auto StatusStyle(ToolStatus status, bool color) -> fmt::text_style {
  if (!color) {
    return {};
  }
  switch (status) {
    case ToolStatus::kReachable:
      return fmt::fg(fmt::terminal_color::bright_green) | fmt::emphasis::bold;
    case ToolStatus::kInstalledNotReachable:
      return fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold;
    case ToolStatus::kNotInstalled:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
  }
  return {};
}

auto Emphasis(bool color) -> fmt::text_style {
  return color ? fmt::emphasis::bold : fmt::text_style{};
}

auto FormatToolLine(const ToolResult& tool, bool color) -> std::string {
  auto status = Categorize(tool.state);
  std::string detail = std::visit(
      Overloaded{
          [](const probe::NotFound&) { return std::string(); },
          [](const probe::FoundNotOnPath& found) {
            return fmt::format(" (in {})", found.directory);
          },
          [](const probe::FoundOnPath& found) {
            return fmt::format(" ({})", found.location);
          },
      },
      tool.state);
  return fmt::format(
      "  {:<{}}{}{}\n", tool.probe.name, kNameWidth,
      fmt::styled(StatusLabel(status), StatusStyle(status, color)), detail);
}

auto DescribeReconciliation(const ReconciliationRecord& record)
    -> std::string {
  return std::visit(
      Overloaded{
          [&](const reconcile::AlreadyPresent&) {
            return fmt::format(
                "{} is already in {}", record.directory, record.store_location);
          },
          [&](const reconcile::AppliedAndVerified&) {
            return fmt::format(
                "added {} to {}", record.directory, record.store_location);
          },
          [&](const reconcile::AppliedButUnverified&) {
            return fmt::format(
                "added {} to {}, not yet visible in this session",
                record.directory, record.store_location);
          },
          [&](const reconcile::Failed& failed) {
            return fmt::format(
                "could not update {}: {}", record.store_location,
                failed.reason);
          },
      },
      record.outcome);
}

auto ElevationHint() -> const char* {
#ifdef _WIN32
  return "from an administrator prompt";
#else
  return "as root (e.g. with sudo)";
#endif
}

void AddVcsRecommendations(
    const RunResult& result, std::vector<std::string>& out) {
  const auto& probe = result.vcs.probe;
  std::visit(
      Overloaded{
          [&](const probe::NotFound&) {
            out.push_back(
                fmt::format(
                    "Install {} from {}, then run this check again.",
                    probe.name, probe.install_url));
          },
          [&](const probe::FoundNotOnPath& found) {
            if (!result.reconciliation) {
              out.push_back(
                  fmt::format(
                      "Add {} to your search path so '{}' can be run from a "
                      "terminal.",
                      found.directory, probe.path_command));
              return;
            }
            std::visit(
                Overloaded{
                    [&](const reconcile::Failed&) {
                      out.push_back(
                          fmt::format(
                              "Run this check again {} so it can add {} to "
                              "the search path.",
                              ElevationHint(), found.directory));
                    },
                    [&](const auto&) {
                      out.push_back(
                          fmt::format(
                              "Open a new terminal session so the updated "
                              "search path takes effect for '{}'.",
                              probe.path_command));
                    },
                },
                result.reconciliation->outcome);
          },
          [](const probe::FoundOnPath&) {},
      },
      result.vcs.state);
}

void AddEditorRecommendations(
    const RunResult& result, std::vector<std::string>& out) {
  const auto& probe = result.editor.probe;
  std::visit(
      Overloaded{
          [&](const probe::NotFound&) {
            out.push_back(
                fmt::format(
                    "Install {} from {}.", probe.name, probe.install_url));
          },
          [&](const probe::FoundNotOnPath& found) {
            out.push_back(
                fmt::format(
                    "Add {} to your search path so '{}' can be run from a "
                    "terminal.",
                    found.directory, probe.path_command));
          },
          [](const probe::FoundOnPath&) {},
      },
      result.editor.state);
}

}  // namespace

auto BuildRecommendations(const RunResult& result)
    -> std::vector<std::string> {
  std::vector<std::string> recommendations;
  AddVcsRecommendations(result, recommendations);
  AddEditorRecommendations(result, recommendations);
  return recommendations;
}

auto FormatSummary(const RunResult& result, bool color) -> std::string {
  std::string out;
  out += fmt::format(
      "{}\n", fmt::styled("Development environment check", Emphasis(color)));
  out += FormatToolLine(result.vcs, color);
  out += FormatToolLine(result.editor, color);
  if (result.reconciliation) {
    out += fmt::format(
        "  {:<{}}{}\n", "Search path", kNameWidth,
        DescribeReconciliation(*result.reconciliation));
  }
  out += "\n";

  auto recommendations = BuildRecommendations(result);
  if (recommendations.empty()) {
    out += fmt::format(
        "{}\n",
        fmt::styled(
            "Your machine is ready for development.",
            color ? fmt::fg(fmt::terminal_color::bright_green) |
                        fmt::emphasis::bold
                  : fmt::text_style{}));
    return out;
  }

  out += fmt::format("{}\n", fmt::styled("Recommendations:", Emphasis(color)));
  for (const auto& recommendation : recommendations) {
    out += fmt::format("  - {}\n", recommendation);
  }
  return out;
}

void PrintSummary(const RunResult& result, bool color, FILE* sink) {
  fmt::print(sink, "{}", FormatSummary(result, color));
  std::fflush(sink);
}

}  // namespace devready::report
