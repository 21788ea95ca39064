#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/awaitable.hpp>

#include "buildcore/core/configured_target.hpp"
#include "buildcore/core/file_build_settings.hpp"
#include "buildcore/core/file_event.hpp"
#include "buildcore/core/file_handling_capability.hpp"
#include "buildcore/core/index_process_result.hpp"
#include "buildcore/core/path_prefix_mapping.hpp"
#include "buildcore/core/source_file_info.hpp"
#include "buildcore/error/error.hpp"
#include "buildcore/utils/canonical_path.hpp"

namespace buildcore {

enum class BuildSystemKind {
  kPackage,
  kCompilationDatabase,
  kBuildServer,
  kFallback,
};

[[nodiscard]] auto ToString(BuildSystemKind kind) -> std::string_view;

// Fixed facts about a backend, supplied when it is constructed
struct BuildSystemInfo {
  CanonicalPath project_root;
  std::optional<CanonicalPath> index_store_path;
  std::optional<CanonicalPath> index_database_path;
  std::vector<PathPrefixMapping> index_prefix_mappings;
};

// Receiver of backend events. The manager implements this; backends only
// ever hold it weakly.
class BuildSystemDelegate {
 public:
  BuildSystemDelegate() = default;
  virtual ~BuildSystemDelegate() = default;

  BuildSystemDelegate(const BuildSystemDelegate&) = delete;
  auto operator=(const BuildSystemDelegate&) -> BuildSystemDelegate& = delete;
  BuildSystemDelegate(BuildSystemDelegate&&) = delete;
  auto operator=(BuildSystemDelegate&&) -> BuildSystemDelegate& = delete;

  // Settings of these documents may have changed
  virtual auto FileBuildSettingsChanged(std::vector<std::string> uris)
      -> void = 0;

  // Something these documents depend on was rebuilt
  virtual auto FilesDependenciesUpdated(std::vector<std::string> uris)
      -> void = 0;

  // The target graph changed; every document may be affected
  virtual auto BuildTargetsChanged() -> void = 0;

  virtual auto FileHandlingCapabilityChanged() -> void = 0;

  virtual auto SourceFilesChanged() -> void = 0;
};

using ProcessResultCallback = std::function<void(const IndexProcessResult&)>;

// One backend kind (package build, compilation database, build server,
// fallback). Exactly one instance is active per manager.
//
// All query methods are coroutines so backends can wait on external work.
// Absence ("no settings", "sort unsupported") is std::nullopt; capability and
// operational failures are BuildCoreError.
class BuildSystem {
 public:
  virtual ~BuildSystem() = default;

  BuildSystem(const BuildSystem&) = delete;
  auto operator=(const BuildSystem&) -> BuildSystem& = delete;
  BuildSystem(BuildSystem&&) = delete;
  auto operator=(BuildSystem&&) -> BuildSystem& = delete;

  [[nodiscard]] virtual auto Kind() const -> BuildSystemKind = 0;

  [[nodiscard]] auto Info() const -> const BuildSystemInfo& {
    return info_;
  }

  [[nodiscard]] auto ProjectRoot() const -> const CanonicalPath& {
    return info_.project_root;
  }

  auto SetDelegate(std::weak_ptr<BuildSystemDelegate> delegate) -> void {
    delegate_ = std::move(delegate);
  }

  // Settings for `uri` compiled as part of `target` in `language`. nullopt
  // when the backend has no settings for the combination.
  virtual auto BuildSettings(
      std::string uri, ConfiguredTarget target, Language language)
      -> asio::awaitable<
          std::expected<std::optional<FileBuildSettings>, BuildCoreError>> = 0;

  // Every (target, destination) pair that compiles `uri`, possibly empty
  virtual auto ConfiguredTargets(std::string uri)
      -> asio::awaitable<std::vector<ConfiguredTarget>> = 0;

  virtual auto GenerateBuildGraph()
      -> asio::awaitable<std::expected<void, BuildCoreError>> = 0;

  // Dependencies first; nullopt when the backend cannot order targets
  virtual auto TopologicalSort(std::vector<ConfiguredTarget> targets)
      -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>> = 0;

  // Targets that (transitively) depend on any of `targets`. nullopt means the
  // backend cannot tell, and callers must assume everything does.
  virtual auto TargetsDependingOn(std::vector<ConfiguredTarget> targets)
      -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>> = 0;

  [[nodiscard]] virtual auto SupportsPreparation() const -> bool = 0;

  // Brings `targets` to a state where they can be indexed. The callback is
  // invoked once for every process the backend spawns.
  virtual auto Prepare(
      std::vector<ConfiguredTarget> targets,
      ProcessResultCallback on_process_result)
      -> asio::awaitable<std::expected<void, BuildCoreError>> = 0;

  virtual auto DefaultLanguage(std::string uri)
      -> asio::awaitable<std::optional<Language>> = 0;

  virtual auto RegisterForChangeNotifications(std::string uri) -> void = 0;
  virtual auto UnregisterForChangeNotifications(std::string uri) -> void = 0;

  virtual auto FilesDidChange(std::vector<FileEvent> events) -> void = 0;

  virtual auto FileHandlingCapability(std::string uri)
      -> asio::awaitable<buildcore::FileHandlingCapability> = 0;

  virtual auto SourceFiles() -> asio::awaitable<std::vector<SourceFileInfo>> = 0;

 protected:
  explicit BuildSystem(BuildSystemInfo info) : info_(std::move(info)) {
  }

  // Null once the manager has gone away
  [[nodiscard]] auto Delegate() const -> std::shared_ptr<BuildSystemDelegate> {
    return delegate_.lock();
  }

 private:
  BuildSystemInfo info_;
  std::weak_ptr<BuildSystemDelegate> delegate_;
};

}  // namespace buildcore
