#include <argparse/argparse.hpp>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include <fmt/core.h>

#include "check.hpp"
#include "config.hpp"
#include "devready/platform/platform.hpp"
#include "devready/report/run_result.hpp"
#include "devready/report/summary.hpp"
#include "logging.hpp"
#include "print.hpp"

namespace {

// Persistent store location: CLI, then DEVREADY_PATH_STORE, then config.
auto PathStoreLocation(
    const argparse::ArgumentParser& program,
    const devready::driver::CheckConfig& config) -> std::optional<std::string> {
  if (auto location = program.present("--path-store")) {
    return location;
  }
  if (const char* env_location = std::getenv("DEVREADY_PATH_STORE")) {
    if (*env_location != '\0') {
      return std::string(env_location);
    }
  }
  return config.path_store;
}

auto LoadCheckConfig(const argparse::ArgumentParser& program)
    -> devready::Result<devready::driver::CheckConfig> {
  auto config_path =
      devready::driver::FindConfig(program.present("--config"));
  if (!config_path) {
    return devready::driver::CheckConfig{};
  }
  return devready::driver::LoadConfig(*config_path);
}

// NO_COLOR only counts when set to a non-empty value.
auto NoColorRequested() -> bool {
  const char* value = std::getenv("NO_COLOR");
  return value != nullptr && *value != '\0';
}

void WaitForEnter() {
  fmt::print("Press Enter to exit...");
  std::fflush(stdout);
  std::string ignored;
  std::getline(std::cin, ignored);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  int verbosity = 0;

  argparse::ArgumentParser program("devready", "0.1.0");
  program.add_description(
      "Check that Git and Visual Studio Code are installed and reachable, "
      "and put Git on the machine search path if it is installed but not "
      "reachable");
  program.add_argument("--config")
      .help("TOML file overriding the built-in tool probes")
      .metavar("FILE");
  program.add_argument("--path-store")
      .help("Environment file holding the machine search path")
      .metavar("FILE");
  program.add_argument("--no-reconcile")
      .default_value(false)
      .implicit_value(true)
      .help("Report only; never modify the machine search path");
  program.add_argument("--no-color")
      .default_value(false)
      .implicit_value(true)
      .help("Disable colored output");
  program.add_argument("--pause")
      .default_value(false)
      .implicit_value(true)
      .help("Wait for Enter before exiting");
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase log verbosity (repeatable)");

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    devready::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  bool color = !program.get<bool>("--no-color") && !NoColorRequested();
  devready::driver::SetColorEnabled(color);
  devready::driver::ConfigureLogging(verbosity);

  auto config = LoadCheckConfig(program);
  if (!config) {
    devready::driver::PrintDiagnostic(config.error());
    return 1;
  }

  auto platform = devready::platform::CreateNativePlatform();
  auto store = devready::platform::CreateNativePathStore(
      PathStoreLocation(program, *config));

  devready::driver::CheckOptions options{
      .vcs = config->vcs,
      .editor = config->editor,
      .reconcile = !program.get<bool>("--no-reconcile"),
      .reconcile_options = {},
  };
  auto result = devready::driver::RunCheck(options, *platform, *store);

  {
    devready::driver::PhaseTimer timer("report");
    devready::report::PrintSummary(result, color);
  }

  if (program.get<bool>("--pause")) {
    WaitForEnter();
  }

  return devready::report::IsReady(result) ? 0 : 1;
}
