#pragma once

#include <string>
#include <variant>

#include "devready/platform/platform.hpp"
#include "devready/platform/search_path.hpp"
#include "devready/probe/tool_probe.hpp"

namespace devready::reconcile {

// The directory was already a segment of the stored search path; nothing was
// written. A new session may still be needed to see it.
struct AlreadyPresent {
  auto operator==(const AlreadyPresent&) const -> bool = default;
};

// Stored search path updated and the tool now resolves in this process.
struct AppliedAndVerified {
  std::string new_path_value;

  auto operator==(const AppliedAndVerified&) const -> bool = default;
};

// Stored search path updated, but the tool still does not resolve here.
struct AppliedButUnverified {
  auto operator==(const AppliedButUnverified&) const -> bool = default;
};

// Reading or writing the stored search path failed; it is unchanged.
struct Failed {
  std::string reason;

  auto operator==(const Failed&) const -> bool = default;
};

using ReconciliationOutcome =
    std::variant<AlreadyPresent, AppliedAndVerified, AppliedButUnverified,
                 Failed>;

struct ReconcileOptions {
  char delimiter = platform::kPathListDelimiter;
  bool ignore_case = platform::kIgnoreSegmentCase;
  // Read-modify-write attempts when the stored value changes between the
  // read and the write.
  int max_attempts = 3;
};

// Append `directory` to the persistent search path unless already present,
// mirror the change into the current process, and check that `probe` now
// resolves. A directory containing the delimiter cannot be stored as one
// segment and is refused. Never fails: every collaborator error becomes
// Failed.
auto Reconcile(
    const std::string& directory, const probe::ToolProbe& probe,
    platform::PathStore& store, platform::Platform& platform,
    const ReconcileOptions& options = {}) -> ReconciliationOutcome;

}  // namespace devready::reconcile
