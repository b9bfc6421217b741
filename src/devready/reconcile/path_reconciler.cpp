#include "devready/reconcile/path_reconciler.hpp"

#include <string>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "devready/platform/platform.hpp"
#include "devready/platform/search_path.hpp"
#include "devready/probe/detector.hpp"
#include "devready/probe/tool_probe.hpp"

namespace devready::reconcile {

namespace {

// Make the new directory visible to resolution in this process.
void ExtendProcessSearchPath(
    const std::string& directory, const ReconcileOptions& options,
    platform::Platform& platform) {
  auto current = platform.ProcessSearchPath();
  if (platform::ContainsSegment(
          current, directory, options.delimiter, options.ignore_case)) {
    return;
  }
  auto result = platform.SetProcessSearchPath(
      platform::AppendSegment(current, directory, options.delimiter));
  if (!result) {
    spdlog::warn(
        "could not extend this process's search path: {}",
        result.error().Describe());
  }
}

}  // namespace

auto Reconcile(
    const std::string& directory, const probe::ToolProbe& probe,
    platform::PathStore& store, platform::Platform& platform,
    const ReconcileOptions& options) -> ReconciliationOutcome {
  // A segment cannot hold its own delimiter.
  if (directory.find(options.delimiter) != std::string::npos) {
    return Failed{
        .reason = fmt::format(
            "cannot add {} to the search path: the directory name contains "
            "the '{}' separator",
            directory, options.delimiter)};
  }

  auto current = store.Read();
  if (!current) {
    return Failed{
        .reason = fmt::format(
            "cannot read the search path from {}: {}", store.Location(),
            current.error().Describe())};
  }

  for (int attempt = 1; attempt <= options.max_attempts; ++attempt) {
    if (platform::ContainsSegment(
            *current, directory, options.delimiter, options.ignore_case)) {
      spdlog::info("{} is already on the stored search path", directory);
      return AlreadyPresent{};
    }

    std::string updated =
        platform::AppendSegment(*current, directory, options.delimiter);

    // Someone else may have edited the value since it was read.
    auto fresh = store.Read();
    if (!fresh) {
      return Failed{
          .reason = fmt::format(
              "cannot read the search path from {}: {}", store.Location(),
              fresh.error().Describe())};
    }
    if (*fresh != *current) {
      spdlog::warn(
          "search path in {} changed while updating it (attempt {}/{})",
          store.Location(), attempt, options.max_attempts);
      current = std::move(fresh);
      continue;
    }

    auto written = store.Write(updated);
    if (!written) {
      return Failed{.reason = written.error().Describe()};
    }
    spdlog::info("added {} to the search path in {}", directory,
                 store.Location());

    ExtendProcessSearchPath(directory, options, platform);

    if (probe::ResolveOnSearchPath(probe, platform)) {
      return AppliedAndVerified{.new_path_value = updated};
    }
    return AppliedButUnverified{};
  }

  return Failed{
      .reason = fmt::format(
          "search path in {} kept changing during the update",
          store.Location())};
}

}  // namespace devready::reconcile
