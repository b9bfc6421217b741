#include "check.hpp"

#include <optional>
#include <variant>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "devready/common/diagnostic.hpp"
#include "devready/probe/detector.hpp"
#include "devready/reconcile/path_reconciler.hpp"
#include "devready/report/run_result.hpp"
#include "logging.hpp"
#include "print.hpp"

namespace devready::driver {

auto RunCheck(
    const CheckOptions& options, platform::Platform& platform,
    platform::PathStore& store) -> report::RunResult {
  report::RunResult result{
      .vcs = {.probe = options.vcs, .state = probe::NotFound{}},
      .editor = {.probe = options.editor, .state = probe::NotFound{}},
      .reconciliation = std::nullopt,
      .elevated = platform.IsElevated(),
  };

  {
    PhaseTimer timer("detect");
    result.vcs.state = probe::Detect(options.vcs, platform);
  }

  const auto* unreachable =
      std::get_if<probe::FoundNotOnPath>(&result.vcs.state);
  if (unreachable != nullptr && options.reconcile) {
    PhaseTimer timer("reconcile");
    if (!result.elevated) {
      PrintDiagnostic(
          Diagnostic::Warning(
              fmt::format(
                  "not running elevated; updating {} will probably fail",
                  store.Location()))
              .WithNote(
                  fmt::format(
                      "{} is installed in {}", options.vcs.name,
                      unreachable->directory)));
    }

    auto outcome = reconcile::Reconcile(
        unreachable->directory, options.vcs, store, platform,
        options.reconcile_options);
    result.reconciliation = report::ReconciliationRecord{
        .directory = unreachable->directory,
        .store_location = store.Location(),
        .outcome = outcome,
    };

    if (std::holds_alternative<reconcile::AppliedAndVerified>(outcome)) {
      result.vcs.state = probe::Detect(options.vcs, platform);
    }
  }

  {
    PhaseTimer timer("detect");
    result.editor.state = probe::Detect(options.editor, platform);
  }

  spdlog::debug("ready: {}", report::IsReady(result));
  return result;
}

}  // namespace devready::driver
