#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "buildcore/utils/canonical_path.hpp"

namespace buildcore {

// Represents the contents of a .buildcore configuration file
class BuildCoreConfigFile {
 public:
  static constexpr auto kFileName = ".buildcore";

  struct SchedulerSettings {
    std::optional<size_t> max_concurrent_jobs;
  };

  struct DebounceSettings {
    std::optional<std::chrono::milliseconds> build_settings;
    std::optional<std::chrono::milliseconds> source_files;
  };

  struct ToolchainSettings {
    // As written; relative entries are resolved by the caller
    std::vector<std::filesystem::path> search_paths;
    std::optional<std::string> default_identifier;
    bool include_environment = true;
    bool include_platform_defaults = true;
  };

  struct FallbackSettings {
    std::vector<std::string> arguments;
    std::vector<std::string> c_arguments;
    std::vector<std::string> cxx_arguments;
    std::vector<std::string> swift_arguments;
    std::optional<std::string> sdk_path;
  };

  explicit BuildCoreConfigFile(
      std::shared_ptr<spdlog::logger> logger = nullptr);

  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger = nullptr)
      -> BuildCoreConfigFile;

  // Returns std::nullopt if the file doesn't exist or cannot be parsed
  static auto LoadFromFile(
      const CanonicalPath& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<BuildCoreConfigFile>;

  [[nodiscard]] auto GetScheduler() const -> const SchedulerSettings& {
    return scheduler_;
  }

  [[nodiscard]] auto GetDebounce() const -> const DebounceSettings& {
    return debounce_;
  }

  [[nodiscard]] auto GetToolchains() const -> const ToolchainSettings& {
    return toolchains_;
  }

  [[nodiscard]] auto GetFallback() const -> const FallbackSettings& {
    return fallback_;
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;

  SchedulerSettings scheduler_;
  DebounceSettings debounce_;
  ToolchainSettings toolchains_;
  FallbackSettings fallback_;
};

}  // namespace buildcore
