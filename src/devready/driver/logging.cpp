#include "logging.hpp"

#include <chrono>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace devready::driver {

void ConfigureLogging(int verbosity) {
  auto logger = spdlog::stderr_color_mt("devready");
  logger->set_pattern("[devready][%H:%M:%S][%l] %v");

  if (verbosity >= 2) {
    logger->set_level(spdlog::level::debug);
  } else if (verbosity == 1) {
    logger->set_level(spdlog::level::info);
  } else {
    logger->set_level(spdlog::level::warn);
  }
  spdlog::set_default_logger(std::move(logger));
}

PhaseTimer::PhaseTimer(std::string phase_name)
    : phase_name_(std::move(phase_name)),
      start_(std::chrono::steady_clock::now()) {
  spdlog::debug("{}: begin", phase_name_);
}

PhaseTimer::~PhaseTimer() {
  auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_);
  spdlog::debug("{}: done ({:.3f}s)", phase_name_, duration.count() / 1000.0);
}

}  // namespace devready::driver
