#pragma once

#include <expected>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace app {

struct CommandLineOptions {
  std::string workspace;
  std::vector<std::string> files;
  bool list_toolchains = false;
};

/// Parse `--workspace=<dir> [--file=<path>]... [--list-toolchains]`
/// Returns a message describing the problem on invalid input
auto ParseArguments(const std::vector<std::string>& args)
    -> std::expected<CommandLineOptions, std::string>;

auto Usage() -> std::string;

/// Setup structured logging with named loggers
/// Returns configured loggers for the buildcore, scheduler and toolchain
/// components. Loggers write to stderr so stdout stays machine-readable.
auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
