#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <spdlog/spdlog.h>

#include "buildcore/core/build_system.hpp"

namespace buildcore {

struct FallbackBuildSystemOptions {
  // Passed to every compiler invocation
  std::vector<std::string> arguments;
  // Added for C and Objective-C files
  std::vector<std::string> c_arguments;
  // Added for C++ and Objective-C++ files
  std::vector<std::string> cxx_arguments;
  std::vector<std::string> swift_arguments;
  std::optional<std::string> sdk_path;
};

// Last-resort backend used when nothing describes the project. Every file
// with a recognized extension gets heuristic settings in a single
// `fallback` target.
class FallbackBuildSystem : public BuildSystem {
 public:
  static constexpr auto kTargetId = "fallback";
  static constexpr auto kRunDestinationId = "fallback";

  FallbackBuildSystem(
      asio::any_io_executor executor, CanonicalPath project_root,
      FallbackBuildSystemOptions options,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  static auto Create(
      asio::any_io_executor executor, CanonicalPath project_root,
      FallbackBuildSystemOptions options,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::unique_ptr<FallbackBuildSystem>;

  [[nodiscard]] auto Kind() const -> BuildSystemKind override {
    return BuildSystemKind::kFallback;
  }

  [[nodiscard]] static auto Target() -> ConfiguredTarget {
    return ConfiguredTarget{
        .target_id = kTargetId, .run_destination_id = kRunDestinationId};
  }

  // Arguments used for `path`, without consulting any build description
  [[nodiscard]] auto ArgumentsFor(
      const std::filesystem::path& path, Language language) const
      -> std::vector<std::string>;

  auto BuildSettings(
      std::string uri, ConfiguredTarget target, Language language)
      -> asio::awaitable<std::expected<
          std::optional<FileBuildSettings>, BuildCoreError>> override;

  auto ConfiguredTargets(std::string uri)
      -> asio::awaitable<std::vector<ConfiguredTarget>> override;

  auto GenerateBuildGraph()
      -> asio::awaitable<std::expected<void, BuildCoreError>> override;

  auto TopologicalSort(std::vector<ConfiguredTarget> targets)
      -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>> override;

  auto TargetsDependingOn(std::vector<ConfiguredTarget> targets)
      -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>> override;

  [[nodiscard]] auto SupportsPreparation() const -> bool override {
    return false;
  }

  auto Prepare(
      std::vector<ConfiguredTarget> targets,
      ProcessResultCallback on_process_result)
      -> asio::awaitable<std::expected<void, BuildCoreError>> override;

  auto DefaultLanguage(std::string uri)
      -> asio::awaitable<std::optional<Language>> override;

  auto RegisterForChangeNotifications(std::string uri) -> void override;
  auto UnregisterForChangeNotifications(std::string uri) -> void override;

  auto FilesDidChange(std::vector<FileEvent> events) -> void override;

  auto FileHandlingCapability(std::string uri)
      -> asio::awaitable<buildcore::FileHandlingCapability> override;

  auto SourceFiles() -> asio::awaitable<std::vector<SourceFileInfo>> override;

 private:
  asio::any_io_executor executor_;
  FallbackBuildSystemOptions options_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace buildcore
