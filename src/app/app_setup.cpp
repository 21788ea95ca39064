#include "app/app_setup.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string_view>
#include <unordered_map>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kDefaultLogLevel = "info";
constexpr std::string_view kLogPattern = "[%n][%L] %v";

struct LoggerConfig {
  std::string_view name;
  spdlog::level::level_enum level;
};

auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum {
  static const std::unordered_map<std::string_view, spdlog::level::level_enum>
      kLevelMap = {
          {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},   {"off", spdlog::level::off},
      };

  if (auto it = kLevelMap.find(level_str); it != kLevelMap.end()) {
    return it->second;
  }
  return spdlog::level::info;
}

auto GetLogLevelFromEnv() -> spdlog::level::level_enum {
  const char* env_level = std::getenv("SPDLOG_LEVEL");
  return ParseLogLevel(env_level != nullptr ? env_level : kDefaultLogLevel);
}

void ConfigureLogger(
    std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
  logger->set_pattern(std::string(kLogPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
}

}  // namespace

auto ParseArguments(const std::vector<std::string>& args)
    -> std::expected<CommandLineOptions, std::string> {
  constexpr std::string_view kWorkspacePrefix = "--workspace=";
  constexpr std::string_view kFilePrefix = "--file=";
  constexpr std::string_view kListToolchains = "--list-toolchains";

  CommandLineOptions options;
  for (size_t i = 1; i < args.size(); ++i) {
    std::string_view arg = args[i];
    if (arg.starts_with(kWorkspacePrefix)) {
      options.workspace = std::string(arg.substr(kWorkspacePrefix.length()));
    } else if (arg.starts_with(kFilePrefix)) {
      options.files.emplace_back(arg.substr(kFilePrefix.length()));
    } else if (arg == kListToolchains) {
      options.list_toolchains = true;
    } else {
      return std::unexpected("Unknown argument: " + args[i]);
    }
  }

  if (options.workspace.empty()) {
    return std::unexpected(std::string("Missing --workspace=<dir>"));
  }
  return options;
}

auto Usage() -> std::string {
  return "Usage: buildcore --workspace=<dir> [--file=<path>]... "
         "[--list-toolchains]";
}

auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_log_level = GetLogLevelFromEnv();
  spdlog::set_level(user_log_level);

  constexpr std::array kLoggerConfigs = {
      LoggerConfig{.name = "buildcore", .level = spdlog::level::trace},
      LoggerConfig{.name = "scheduler", .level = spdlog::level::info},
      LoggerConfig{.name = "toolchain", .level = spdlog::level::info},
  };

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;

  for (const auto& config : kLoggerConfigs) {
    auto logger = spdlog::stderr_color_mt(std::string(config.name));
    // The main component follows SPDLOG_LEVEL; the others never go below
    // their own floor
    const auto level = (config.name == "buildcore")
                           ? user_log_level
                           : std::max(config.level, user_log_level);
    ConfigureLogger(logger, level);
    loggers[std::string(config.name)] = std::move(logger);
  }

  return loggers;
}

}  // namespace app
