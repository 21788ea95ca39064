#pragma once

#include <memory>
#include <optional>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "buildcore/core/buildcore_config_file.hpp"
#include "buildcore/core/fallback_build_system.hpp"
#include "buildcore/services/build_system_manager.hpp"
#include "buildcore/services/toolchain_registry.hpp"
#include "buildcore/utils/canonical_path.hpp"

namespace buildcore {

// Owns the workspace's .buildcore file and turns it into the options of the
// components it configures. Without a valid file every getter returns
// defaults.
class ConfigManager {
 public:
  explicit ConfigManager(
      asio::any_io_executor executor, CanonicalPath workspace_root,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  static auto Create(
      asio::any_io_executor executor, CanonicalPath workspace_root,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::shared_ptr<ConfigManager>;

  // Load the config file from the workspace root
  // Returns true if a config was found and loaded
  auto LoadConfig() -> asio::awaitable<bool>;

  // Handle a change to the config file
  // Returns true if a new valid config was loaded
  auto HandleConfigFileChange(CanonicalPath config_path)
      -> asio::awaitable<bool>;

  [[nodiscard]] auto HasValidConfig() const -> bool {
    return config_.has_value();
  }

  [[nodiscard]] auto GetWorkspaceRoot() const -> const CanonicalPath& {
    return workspace_root_;
  }

  [[nodiscard]] auto GetConfigPath() const -> CanonicalPath {
    return workspace_root_ / BuildCoreConfigFile::kFileName;
  }

  [[nodiscard]] auto GetMaxConcurrentJobs() const -> size_t;

  [[nodiscard]] auto GetManagerOptions() const -> services::ManagerOptions;

  // Relative search paths are resolved against the workspace root
  [[nodiscard]] auto GetToolchainSearchOptions() const
      -> services::ToolchainSearchOptions;

  [[nodiscard]] auto GetFallbackOptions() const -> FallbackBuildSystemOptions;

 private:
  auto LogConfig() const -> void;

  std::shared_ptr<spdlog::logger> logger_;

  asio::any_io_executor executor_;
  asio::strand<asio::any_io_executor> strand_;

  // The loaded configuration (if any)
  std::optional<BuildCoreConfigFile> config_;

  CanonicalPath workspace_root_;
};

}  // namespace buildcore
