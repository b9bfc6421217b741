#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "devready/probe/tool_probe.hpp"
#include "devready/reconcile/path_reconciler.hpp"

namespace devready::report {

struct ToolResult {
  probe::ToolProbe probe;
  probe::InstallationState state;
};

struct ReconciliationRecord {
  std::string directory;
  std::string store_location;
  reconcile::ReconciliationOutcome outcome;
};

// Everything one run found out. Read-only once produced.
struct RunResult {
  ToolResult vcs;
  ToolResult editor;
  // Present only when reconciliation was attempted for the VCS client.
  std::optional<ReconciliationRecord> reconciliation;
  bool elevated = false;
};

enum class ToolStatus : uint8_t {
  kReachable,
  kInstalledNotReachable,
  kNotInstalled,
};

auto Categorize(const probe::InstallationState& state) -> ToolStatus;
auto StatusLabel(ToolStatus status) -> const char*;

// True when both tools resolve on the search path at the end of the run.
auto IsReady(const RunResult& result) -> bool;

}  // namespace devready::report
