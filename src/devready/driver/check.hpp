#pragma once

#include "devready/platform/platform.hpp"
#include "devready/probe/tool_probe.hpp"
#include "devready/reconcile/path_reconciler.hpp"
#include "devready/report/run_result.hpp"

namespace devready::driver {

struct CheckOptions {
  probe::ToolProbe vcs;
  probe::ToolProbe editor;
  // Try to put an installed but unreachable VCS client on the stored path.
  bool reconcile = true;
  reconcile::ReconcileOptions reconcile_options;
};

// Detect the VCS client, reconcile it if needed, then detect the editor.
// Always produces a complete result.
auto RunCheck(
    const CheckOptions& options, platform::Platform& platform,
    platform::PathStore& store) -> report::RunResult;

}  // namespace devready::driver
