#pragma once

#include <chrono>
#include <string>

namespace devready::driver {

// Install the stderr logger. 0 = warnings only, 1 = info, 2+ = debug.
// All log output goes to stderr to keep stdout for the summary.
void ConfigureLogging(int verbosity);

// RAII helper for timing run phases. Logs begin on construction, done with
// the elapsed time on destruction (debug level).
class PhaseTimer {
 public:
  explicit PhaseTimer(std::string phase_name);
  ~PhaseTimer();

  PhaseTimer(const PhaseTimer&) = delete;
  PhaseTimer& operator=(const PhaseTimer&) = delete;
  PhaseTimer(PhaseTimer&&) = delete;
  PhaseTimer& operator=(PhaseTimer&&) = delete;

 private:
  std::string phase_name_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace devready::driver
