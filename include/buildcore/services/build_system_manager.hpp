#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/strand.hpp>
#include <spdlog/spdlog.h>

#include "buildcore/core/build_system.hpp"
#include "buildcore/error/error.hpp"
#include "buildcore/services/task_scheduler.hpp"
#include "buildcore/services/toolchain_registry.hpp"
#include "buildcore/utils/debouncer.hpp"
#include "buildcore/utils/shared_result.hpp"

namespace buildcore::services {

struct ManagerOptions {
  // Quiet period before a burst of settings changes for one document (or a
  // target graph change) is acted upon
  std::chrono::milliseconds settings_changed_delay{50};

  // Quiet period before source-file subscribers hear about a change
  std::chrono::milliseconds source_files_changed_delay{200};

  // Cached settings are kept for at most this many unregistered documents,
  // oldest evicted first
  size_t max_unregistered_documents = 64;
};

using SubscriptionId = uint64_t;

using SettingsChangedHandler = std::function<void(
    const std::string& uri, const std::optional<FileBuildSettings>& settings)>;
using DependenciesUpdatedHandler =
    std::function<void(const std::vector<std::string>& uris)>;
using SourceFilesChangedHandler = std::function<void()>;

// Owns the active build system and answers every build question on its
// behalf.
//
// - Settings are cached per (document, target, language); concurrent
//   queries for the same key share one backend call
// - Backend change events are debounced per document, invalidate the cache
//   and reach handlers only when the delivered settings actually change
// - Graph generation and preparation run as TaskScheduler jobs
//
// All state lives on an internal strand. Handlers are invoked on that strand
// and must not block.
class BuildSystemManager
    : public BuildSystemDelegate,
      public std::enable_shared_from_this<BuildSystemManager> {
 public:
  BuildSystemManager(
      asio::any_io_executor executor, std::unique_ptr<BuildSystem> backend,
      std::shared_ptr<TaskScheduler> scheduler, ManagerOptions options,
      std::shared_ptr<ToolchainRegistry> toolchain_registry,
      std::shared_ptr<spdlog::logger> logger);

  // Also installs the manager as the backend's delegate
  static auto Create(
      asio::any_io_executor executor, std::unique_ptr<BuildSystem> backend,
      std::shared_ptr<TaskScheduler> scheduler, ManagerOptions options = {},
      std::shared_ptr<ToolchainRegistry> toolchain_registry = nullptr,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::shared_ptr<BuildSystemManager>;

  ~BuildSystemManager() override = default;

  BuildSystemManager(const BuildSystemManager&) = delete;
  auto operator=(const BuildSystemManager&) -> BuildSystemManager& = delete;
  BuildSystemManager(BuildSystemManager&&) = delete;
  auto operator=(BuildSystemManager&&) -> BuildSystemManager& = delete;

  // Queries

  // nullopt when the backend has no settings; backend failures fall back to
  // the last known value
  auto BuildSettings(std::string uri, ConfiguredTarget target, Language language)
      -> asio::awaitable<std::optional<FileBuildSettings>>;

  // Settings in the document's canonical configured target
  auto BuildSettingsForDocument(std::string uri, Language language)
      -> asio::awaitable<std::optional<FileBuildSettings>>;

  // Smallest of ConfiguredTargets(uri), so the choice is stable
  auto CanonicalConfiguredTarget(std::string uri)
      -> asio::awaitable<std::optional<ConfiguredTarget>>;

  auto ConfiguredTargets(std::string uri)
      -> asio::awaitable<std::vector<ConfiguredTarget>>;

  auto TopologicalSort(std::vector<ConfiguredTarget> targets)
      -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>>;

  // nullopt means every target must be assumed to depend on `targets`
  auto TargetsDependingOn(std::vector<ConfiguredTarget> targets)
      -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>>;

  auto DefaultLanguage(std::string uri)
      -> asio::awaitable<std::optional<Language>>;

  auto SourceFiles() -> asio::awaitable<std::vector<SourceFileInfo>>;

  auto FileHandlingCapability(std::string uri)
      -> asio::awaitable<buildcore::FileHandlingCapability>;

  auto ToolchainForDocument(std::string uri, Language language)
      -> asio::awaitable<std::expected<ToolchainPtr, BuildCoreError>>;

  auto Kind() -> asio::awaitable<BuildSystemKind>;
  auto ProjectRoot() -> asio::awaitable<CanonicalPath>;
  auto IndexStorePath() -> asio::awaitable<std::optional<CanonicalPath>>;
  auto IndexDatabasePath() -> asio::awaitable<std::optional<CanonicalPath>>;
  auto IndexPrefixMappings() -> asio::awaitable<std::vector<PathPrefixMapping>>;

  // Jobs

  // Concurrent calls share one highest-priority job and its result
  auto GenerateBuildGraph()
      -> asio::awaitable<std::expected<void, BuildCoreError>>;

  // `on_process_result` is called once per process the backend spawns
  auto Prepare(
      std::vector<ConfiguredTarget> targets,
      ProcessResultCallback on_process_result = nullptr,
      TaskPriority priority = TaskPriority::kMedium)
      -> asio::awaitable<std::expected<void, BuildCoreError>>;

  // Document lifecycle

  // Guarantees one settings notification for `uri`, even when the backend
  // knows nothing about it. Registering again re-arms the guarantee.
  auto RegisterForChangeNotifications(std::string uri, Language language)
      -> asio::awaitable<void>;

  auto UnregisterForChangeNotifications(std::string uri)
      -> asio::awaitable<void>;

  auto FilesDidChange(std::vector<FileEvent> events) -> asio::awaitable<void>;

  // Delays apply to debounces scheduled from now on
  auto SetOptions(ManagerOptions options) -> asio::awaitable<void>;

  // Replaces the backend after draining everything that still uses the old
  // one. Every registered document is notified again.
  auto Reconfigure(std::unique_ptr<BuildSystem> backend)
      -> asio::awaitable<void>;

  // Handlers

  auto AddSettingsChangedHandler(SettingsChangedHandler handler)
      -> SubscriptionId;
  auto AddDependenciesUpdatedHandler(DependenciesUpdatedHandler handler)
      -> SubscriptionId;
  auto AddSourceFilesChangedHandler(SourceFilesChangedHandler handler)
      -> SubscriptionId;
  auto RemoveHandler(SubscriptionId id) -> void;

  // BuildSystemDelegate, callable from any thread

  auto FileBuildSettingsChanged(std::vector<std::string> uris) -> void override;
  auto FilesDependenciesUpdated(std::vector<std::string> uris) -> void override;
  auto BuildTargetsChanged() -> void override;
  auto FileHandlingCapabilityChanged() -> void override;
  auto SourceFilesChanged() -> void override;

  [[nodiscard]] auto GetScheduler() const -> std::shared_ptr<TaskScheduler> {
    return scheduler_;
  }

 private:
  struct CacheKey {
    ConfiguredTarget target;
    Language language;

    auto operator==(const CacheKey&) const -> bool = default;
  };

  struct CacheKeyHash {
    auto operator()(const CacheKey& key) const noexcept -> std::size_t {
      return std::hash<ConfiguredTarget>{}(key.target) ^
             (static_cast<std::size_t>(key.language) << 1);
    }
  };

  // Unknown -> Pending -> Known -> Stale -> Pending
  enum class CacheState { kUnknown, kPending, kKnown, kStale };

  // One backend query; every concurrent caller receives its result
  using PendingQuery = utils::SharedResult<std::optional<FileBuildSettings>>;

  struct CacheEntry {
    CacheState state = CacheState::kUnknown;
    // Known value, or the last known one while Stale
    std::optional<FileBuildSettings> value;
    std::shared_ptr<PendingQuery> pending;
    // Bumped by every invalidation; results of older queries are dropped
    uint64_t generation = 0;
  };

  using DocumentCache = std::unordered_map<CacheKey, CacheEntry, CacheKeyHash>;

  struct Registration {
    uint64_t id = 0;
    Language language = Language::kC;
    // Newest recomputation; older ones in flight are superseded
    uint64_t recompute_generation = 0;
    // Outer nullopt until the first notification has been delivered
    std::optional<std::optional<FileBuildSettings>> last_notified;
  };

  using PendingGraphGeneration =
      utils::SharedResult<std::expected<void, BuildCoreError>>;

  // All private members below run on strand_
  auto FindEntry(const std::string& uri, const CacheKey& key) -> CacheEntry*;
  auto TrackUnregisteredDocument(const std::string& uri) -> void;
  auto InvalidateDocument(const std::string& uri) -> void;
  auto InvalidateAll() -> void;
  auto ScheduleSettingsRecompute(const std::string& uri) -> void;
  auto RecomputeAllRegistered() -> void;
  auto ProcessSettingsChange(std::string uri) -> asio::awaitable<void>;
  auto RunBuildGraphGeneration()
      -> asio::awaitable<std::expected<void, BuildCoreError>>;
  auto RefreshConfiguredTargets() -> asio::awaitable<void>;
  // nullopt when the backend threw
  auto QueryConfiguredTargets(
      std::shared_ptr<BuildSystem> backend, const std::string& uri)
      -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>>;
  auto DrainOutstandingWork() -> asio::awaitable<void>;

  auto DispatchSettingsChanged(
      const std::string& uri, const std::optional<FileBuildSettings>& settings)
      -> void;
  auto DispatchDependenciesUpdated(const std::vector<std::string>& uris)
      -> void;
  auto DispatchSourceFilesChanged() -> void;

  static auto SettingsDebounceKey(const std::string& uri) -> std::string {
    return "settings:" + uri;
  }
  static constexpr auto kBuildTargetsDebounceKey = "global:build-targets";
  static constexpr auto kSourceFilesDebounceKey = "global:source-files";

  asio::any_io_executor executor_;
  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<TaskScheduler> scheduler_;
  std::shared_ptr<ToolchainRegistry> toolchain_registry_;
  ManagerOptions options_;
  utils::Debouncer debouncer_;
  std::atomic<SubscriptionId> next_subscription_id_{1};

  // Protected by strand_
  asio::strand<asio::any_io_executor> strand_;
  std::shared_ptr<BuildSystem> backend_;
  uint64_t backend_generation_ = 0;
  std::unordered_map<std::string, DocumentCache> cache_;
  // Unregistered documents with cache entries, oldest first
  std::deque<std::string> unregistered_documents_;
  // Registered documents only
  std::unordered_map<std::string, std::vector<ConfiguredTarget>>
      document_targets_;
  std::unordered_map<std::string, Registration> registrations_;
  uint64_t next_registration_id_ = 1;
  std::unordered_set<std::string> pending_invalidations_;
  // Registered documents only
  std::unordered_map<std::string, std::string> document_toolchains_;
  std::shared_ptr<PendingGraphGeneration> pending_graph_;
  std::vector<JobHandle> prepare_jobs_;

  std::unordered_map<SubscriptionId, SettingsChangedHandler> settings_handlers_;
  std::unordered_map<SubscriptionId, DependenciesUpdatedHandler>
      dependencies_handlers_;
  std::unordered_map<SubscriptionId, SourceFilesChangedHandler>
      source_files_handlers_;
};

}  // namespace buildcore::services
