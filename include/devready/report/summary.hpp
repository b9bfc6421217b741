#pragma once

#include <cstdio>
#include <string>
#include <vector>

#include "devready/report/run_result.hpp"

namespace devready::report {

// Actionable next steps, in display order. Empty when the machine is ready.
auto BuildRecommendations(const RunResult& result) -> std::vector<std::string>;

// Full human-readable summary: banner, one line per tool, the reconciliation
// outcome if any, and the recommendations.
auto FormatSummary(const RunResult& result, bool color) -> std::string;

void PrintSummary(const RunResult& result, bool color, FILE* sink = stdout);

}  // namespace devready::report
