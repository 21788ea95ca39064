#include "buildcore/core/buildcore_config_file.hpp"

#include <yaml-cpp/yaml.h>

namespace buildcore {

namespace {

// Accepts a single scalar or a sequence
auto ReadStringList(const YAML::Node& node) -> std::vector<std::string> {
  std::vector<std::string> values;
  if (!node) {
    return values;
  }
  if (node.IsScalar()) {
    values.push_back(node.as<std::string>());
    return values;
  }
  for (const auto& item : node) {
    values.push_back(item.as<std::string>());
  }
  return values;
}

auto ReadMilliseconds(const YAML::Node& node)
    -> std::optional<std::chrono::milliseconds> {
  if (!node) {
    return std::nullopt;
  }
  auto value = node.as<int64_t>();
  if (value < 0) {
    throw YAML::Exception(node.Mark(), "delay must not be negative");
  }
  return std::chrono::milliseconds(value);
}

}  // namespace

BuildCoreConfigFile::BuildCoreConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto BuildCoreConfigFile::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> BuildCoreConfigFile {
  return BuildCoreConfigFile(logger);
}

auto BuildCoreConfigFile::LoadFromFile(
    const CanonicalPath& config_path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<BuildCoreConfigFile> {
  BuildCoreConfigFile config(logger);

  if (!std::filesystem::exists(config_path.Path())) {
    config.logger_->debug(
        "No .buildcore configuration file found at {}", config_path);
    return std::nullopt;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.String());

    if (yaml["Scheduler"]) {
      const auto& scheduler = yaml["Scheduler"];
      if (scheduler["MaxConcurrentJobs"]) {
        auto jobs = scheduler["MaxConcurrentJobs"].as<int>();
        if (jobs < 1) {
          config.logger_->warn(
              "Ignoring Scheduler.MaxConcurrentJobs {} (must be at least 1)",
              jobs);
        } else {
          config.scheduler_.max_concurrent_jobs = static_cast<size_t>(jobs);
        }
      }
    }

    if (yaml["Debounce"]) {
      const auto& debounce = yaml["Debounce"];
      config.debounce_.build_settings =
          ReadMilliseconds(debounce["BuildSettingsMs"]);
      config.debounce_.source_files =
          ReadMilliseconds(debounce["SourceFilesMs"]);
    }

    if (yaml["Toolchains"]) {
      const auto& toolchains = yaml["Toolchains"];
      for (const auto& path : ReadStringList(toolchains["SearchPaths"])) {
        config.toolchains_.search_paths.emplace_back(path);
      }
      if (toolchains["Default"]) {
        config.toolchains_.default_identifier =
            toolchains["Default"].as<std::string>();
      }
      if (toolchains["IncludeEnvironment"]) {
        config.toolchains_.include_environment =
            toolchains["IncludeEnvironment"].as<bool>();
      }
      if (toolchains["IncludePlatformDefaults"]) {
        config.toolchains_.include_platform_defaults =
            toolchains["IncludePlatformDefaults"].as<bool>();
      }
      config.logger_->debug(
          "Loaded {} toolchain search path(s)",
          config.toolchains_.search_paths.size());
    }

    if (yaml["Fallback"]) {
      const auto& fallback = yaml["Fallback"];
      config.fallback_.arguments = ReadStringList(fallback["Arguments"]);
      config.fallback_.c_arguments = ReadStringList(fallback["CArguments"]);
      config.fallback_.cxx_arguments = ReadStringList(fallback["CxxArguments"]);
      config.fallback_.swift_arguments =
          ReadStringList(fallback["SwiftArguments"]);
      if (fallback["SdkPath"]) {
        config.fallback_.sdk_path = fallback["SdkPath"].as<std::string>();
      }
    }

    config.logger_->debug(
        "Loaded .buildcore configuration from {}", config_path);
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .buildcore configuration file: {}", e.what());
    return std::nullopt;
  } catch (const std::exception& e) {
    config.logger_->error(
        "Error loading .buildcore configuration file: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace buildcore
