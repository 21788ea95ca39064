#include "buildcore/core/config_manager.hpp"

#include <utility>

#include "buildcore/services/task_scheduler.hpp"
#include "buildcore/utils/path_utils.hpp"

namespace buildcore {

ConfigManager::ConfigManager(
    asio::any_io_executor executor, CanonicalPath workspace_root,
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      strand_(asio::make_strand(executor)),
      workspace_root_(std::move(workspace_root)) {
}

auto ConfigManager::Create(
    asio::any_io_executor executor, CanonicalPath workspace_root,
    std::shared_ptr<spdlog::logger> logger) -> std::shared_ptr<ConfigManager> {
  return std::make_shared<ConfigManager>(
      executor, std::move(workspace_root), std::move(logger));
}

auto ConfigManager::LoadConfig() -> asio::awaitable<bool> {
  co_await asio::post(strand_, asio::use_awaitable);

  auto config_path = GetConfigPath();
  auto loaded_config = BuildCoreConfigFile::LoadFromFile(config_path, logger_);

  if (loaded_config) {
    config_ = std::move(loaded_config.value());
    logger_->info("ConfigManager loaded {}", config_path);
    LogConfig();
    co_return true;
  }

  logger_->debug("ConfigManager using defaults for {}", workspace_root_);
  config_.reset();
  co_return false;
}

auto ConfigManager::HandleConfigFileChange(CanonicalPath config_path)
    -> asio::awaitable<bool> {
  co_await asio::post(strand_, asio::use_awaitable);

  if (!IsConfigFile(config_path.Path())) {
    logger_->debug("ConfigManager ignoring non-config file: {}", config_path);
    co_return false;
  }

  if (config_path != GetConfigPath()) {
    logger_->warn(
        "ConfigManager ignoring config file outside current workspace: {}",
        config_path);
    co_return false;
  }

  logger_->info("ConfigManager reloading config file: {}", config_path);
  auto loaded_config = BuildCoreConfigFile::LoadFromFile(config_path, logger_);

  if (loaded_config) {
    config_ = std::move(loaded_config.value());
    logger_->info("ConfigManager successfully reloaded configuration");
    LogConfig();
    co_return true;
  }

  // Deleted or broken: fall back to defaults rather than keep stale values
  logger_->info("ConfigManager config file was removed or contains errors");
  config_.reset();
  co_return false;
}

auto ConfigManager::GetMaxConcurrentJobs() const -> size_t {
  if (config_ && config_->GetScheduler().max_concurrent_jobs) {
    return *config_->GetScheduler().max_concurrent_jobs;
  }
  return services::TaskScheduler::DefaultMaxConcurrentJobs();
}

auto ConfigManager::GetManagerOptions() const -> services::ManagerOptions {
  services::ManagerOptions options;
  if (!config_) {
    return options;
  }

  const auto& debounce = config_->GetDebounce();
  if (debounce.build_settings) {
    options.settings_changed_delay = *debounce.build_settings;
  }
  if (debounce.source_files) {
    options.source_files_changed_delay = *debounce.source_files;
  }
  return options;
}

auto ConfigManager::GetToolchainSearchOptions() const
    -> services::ToolchainSearchOptions {
  services::ToolchainSearchOptions options;
  if (!config_) {
    return options;
  }

  const auto& toolchains = config_->GetToolchains();
  for (const auto& path : toolchains.search_paths) {
    if (path.is_absolute()) {
      options.search_paths.push_back(path);
    } else {
      options.search_paths.push_back(workspace_root_.Path() / path);
    }
  }
  options.include_environment = toolchains.include_environment;
  options.include_platform_defaults = toolchains.include_platform_defaults;
  options.default_identifier = toolchains.default_identifier;
  return options;
}

auto ConfigManager::GetFallbackOptions() const -> FallbackBuildSystemOptions {
  if (!config_) {
    return {};
  }

  const auto& fallback = config_->GetFallback();
  return FallbackBuildSystemOptions{
      .arguments = fallback.arguments,
      .c_arguments = fallback.c_arguments,
      .cxx_arguments = fallback.cxx_arguments,
      .swift_arguments = fallback.swift_arguments,
      .sdk_path = fallback.sdk_path,
  };
}

auto ConfigManager::LogConfig() const -> void {
  if (!config_) {
    return;
  }
  logger_->debug("  Max concurrent jobs: {}", GetMaxConcurrentJobs());
  logger_->debug(
      "  Toolchain search paths: {}",
      config_->GetToolchains().search_paths.size());
  logger_->debug(
      "  Fallback arguments: {}", config_->GetFallback().arguments.size());
}

}  // namespace buildcore
