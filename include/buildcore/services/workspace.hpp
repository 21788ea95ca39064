#pragma once

#include <memory>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "buildcore/core/config_manager.hpp"
#include "buildcore/core/file_event.hpp"
#include "buildcore/services/build_system_manager.hpp"
#include "buildcore/services/task_scheduler.hpp"
#include "buildcore/services/toolchain_registry.hpp"
#include "buildcore/utils/canonical_path.hpp"

namespace buildcore::services {

// Wires one workspace together: the .buildcore configuration, the task
// scheduler, the toolchain registry and a BuildSystemManager over the
// fallback backend. Configuration changes are pushed into every component.
class Workspace {
 public:
  Workspace(
      asio::any_io_executor executor, CanonicalPath workspace_root,
      std::shared_ptr<spdlog::logger> logger = nullptr,
      std::shared_ptr<spdlog::logger> scheduler_logger = nullptr,
      std::shared_ptr<spdlog::logger> toolchain_logger = nullptr);

  static auto Create(
      asio::any_io_executor executor, CanonicalPath workspace_root,
      std::shared_ptr<spdlog::logger> logger = nullptr,
      std::shared_ptr<spdlog::logger> scheduler_logger = nullptr,
      std::shared_ptr<spdlog::logger> toolchain_logger = nullptr)
      -> std::shared_ptr<Workspace>;

  // Loads the config, scans toolchains and starts the manager. Getters
  // return nullptr until this completes.
  auto Initialize() -> asio::awaitable<void>;

  // Changes to the workspace's .buildcore reload the configuration; every
  // other event goes to the manager
  auto HandleFilesChanged(std::vector<FileEvent> events)
      -> asio::awaitable<void>;

  // Reloads .buildcore and applies it to the scheduler, the registry and the
  // manager
  auto HandleConfigChange() -> asio::awaitable<void>;

  [[nodiscard]] auto GetWorkspaceRoot() const -> const CanonicalPath& {
    return workspace_root_;
  }

  [[nodiscard]] auto GetConfigManager() const
      -> std::shared_ptr<ConfigManager> {
    return config_manager_;
  }

  [[nodiscard]] auto GetScheduler() const -> std::shared_ptr<TaskScheduler> {
    return scheduler_;
  }

  [[nodiscard]] auto GetToolchainRegistry() const
      -> std::shared_ptr<ToolchainRegistry> {
    return toolchain_registry_;
  }

  [[nodiscard]] auto GetManager() const
      -> std::shared_ptr<BuildSystemManager> {
    return manager_;
  }

 private:
  asio::any_io_executor executor_;
  CanonicalPath workspace_root_;

  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<spdlog::logger> scheduler_logger_;
  std::shared_ptr<spdlog::logger> toolchain_logger_;

  std::shared_ptr<ConfigManager> config_manager_;
  std::shared_ptr<TaskScheduler> scheduler_;
  std::shared_ptr<ToolchainRegistry> toolchain_registry_;
  std::shared_ptr<BuildSystemManager> manager_;
};

}  // namespace buildcore::services
