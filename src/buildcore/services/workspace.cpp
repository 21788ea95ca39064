#include "buildcore/services/workspace.hpp"

#include <utility>

#include "buildcore/core/fallback_build_system.hpp"
#include "buildcore/utils/path_utils.hpp"

namespace buildcore::services {

Workspace::Workspace(
    asio::any_io_executor executor, CanonicalPath workspace_root,
    std::shared_ptr<spdlog::logger> logger,
    std::shared_ptr<spdlog::logger> scheduler_logger,
    std::shared_ptr<spdlog::logger> toolchain_logger)
    : executor_(executor),
      workspace_root_(std::move(workspace_root)),
      logger_(logger ? logger : spdlog::default_logger()),
      scheduler_logger_(scheduler_logger ? scheduler_logger : logger_),
      toolchain_logger_(toolchain_logger ? toolchain_logger : logger_) {
}

auto Workspace::Create(
    asio::any_io_executor executor, CanonicalPath workspace_root,
    std::shared_ptr<spdlog::logger> logger,
    std::shared_ptr<spdlog::logger> scheduler_logger,
    std::shared_ptr<spdlog::logger> toolchain_logger)
    -> std::shared_ptr<Workspace> {
  return std::make_shared<Workspace>(
      executor, std::move(workspace_root), std::move(logger),
      std::move(scheduler_logger), std::move(toolchain_logger));
}

auto Workspace::Initialize() -> asio::awaitable<void> {
  config_manager_ = ConfigManager::Create(executor_, workspace_root_, logger_);
  co_await config_manager_->LoadConfig();

  toolchain_registry_ = ToolchainRegistry::Create(
      config_manager_->GetToolchainSearchOptions(), toolchain_logger_);
  toolchain_registry_->Scan();

  scheduler_ = TaskScheduler::Create(
      executor_, config_manager_->GetMaxConcurrentJobs(), scheduler_logger_);

  manager_ = BuildSystemManager::Create(
      executor_,
      FallbackBuildSystem::Create(
          executor_, workspace_root_, config_manager_->GetFallbackOptions(),
          logger_),
      scheduler_, config_manager_->GetManagerOptions(), toolchain_registry_,
      logger_);

  logger_->info("Workspace {} initialized", workspace_root_);
}

auto Workspace::HandleFilesChanged(std::vector<FileEvent> events)
    -> asio::awaitable<void> {
  if (!manager_) {
    logger_->warn(
        "Workspace {} not initialized, dropping {} file event(s)",
        workspace_root_, events.size());
    co_return;
  }

  bool has_config_change = false;
  std::vector<FileEvent> build_events;
  for (auto& event : events) {
    if (IsConfigFile(UriToPath(event.uri))) {
      if (CanonicalPath::FromUri(event.uri) ==
          config_manager_->GetConfigPath()) {
        has_config_change = true;
      } else {
        logger_->debug(
            "Ignoring config file of another workspace: {}", event.uri);
      }
      continue;
    }
    build_events.push_back(std::move(event));
  }

  if (!build_events.empty()) {
    co_await manager_->FilesDidChange(std::move(build_events));
  }

  // The configuration affects every component
  if (has_config_change) {
    co_await HandleConfigChange();
  }
}

auto Workspace::HandleConfigChange() -> asio::awaitable<void> {
  if (!manager_) {
    co_return;
  }

  co_await config_manager_->HandleConfigFileChange(
      config_manager_->GetConfigPath());

  scheduler_->SetMaxConcurrentJobs(config_manager_->GetMaxConcurrentJobs());

  toolchain_registry_->SetOptions(config_manager_->GetToolchainSearchOptions());
  auto summary = toolchain_registry_->Scan();
  logger_->debug(
      "Toolchains after config change: {} added, {} removed, {} unchanged",
      summary.added, summary.removed, summary.unchanged);

  co_await manager_->SetOptions(config_manager_->GetManagerOptions());

  // Fallback arguments live in the backend itself
  if (co_await manager_->Kind() == BuildSystemKind::kFallback) {
    co_await manager_->Reconfigure(FallbackBuildSystem::Create(
        executor_, workspace_root_, config_manager_->GetFallbackOptions(),
        logger_));
  }
}

}  // namespace buildcore::services
