#include "buildcore/services/build_system_manager.hpp"

#include <algorithm>
#include <utility>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "buildcore/utils/path_utils.hpp"
#include "buildcore/utils/scoped_timer.hpp"

namespace buildcore::services {

BuildSystemManager::BuildSystemManager(
    asio::any_io_executor executor, std::unique_ptr<BuildSystem> backend,
    std::shared_ptr<TaskScheduler> scheduler, ManagerOptions options,
    std::shared_ptr<ToolchainRegistry> toolchain_registry,
    std::shared_ptr<spdlog::logger> logger)
    : executor_(executor),
      logger_(logger ? logger : spdlog::default_logger()),
      scheduler_(std::move(scheduler)),
      toolchain_registry_(std::move(toolchain_registry)),
      options_(options),
      debouncer_(executor, logger_),
      strand_(asio::make_strand(executor)),
      backend_(std::move(backend)) {
}

auto BuildSystemManager::Create(
    asio::any_io_executor executor, std::unique_ptr<BuildSystem> backend,
    std::shared_ptr<TaskScheduler> scheduler, ManagerOptions options,
    std::shared_ptr<ToolchainRegistry> toolchain_registry,
    std::shared_ptr<spdlog::logger> logger)
    -> std::shared_ptr<BuildSystemManager> {
  auto* raw_backend = backend.get();
  auto manager = std::make_shared<BuildSystemManager>(
      executor, std::move(backend), std::move(scheduler), options,
      std::move(toolchain_registry), std::move(logger));
  raw_backend->SetDelegate(manager);
  manager->logger_->debug(
      "BuildSystemManager created for {} build system at {}",
      ToString(raw_backend->Kind()), raw_backend->ProjectRoot());
  return manager;
}

// Queries

auto BuildSystemManager::BuildSettings(
    std::string uri, ConfiguredTarget target, Language language)
    -> asio::awaitable<std::optional<FileBuildSettings>> {
  co_await asio::post(strand_, asio::use_awaitable);

  CacheKey key{.target = target, .language = language};
  if (!cache_.contains(uri) && !registrations_.contains(uri)) {
    TrackUnregisteredDocument(uri);
  }
  auto& entry = cache_[uri][key];

  if (entry.state == CacheState::kKnown) {
    co_return entry.value;
  }

  // Join the query already in flight
  if (entry.state == CacheState::kPending && entry.pending) {
    auto pending = entry.pending;
    co_return co_await pending->AsyncWait(asio::use_awaitable);
  }

  auto pending = std::make_shared<PendingQuery>(executor_);
  auto last_known = entry.value;
  auto generation = entry.generation;
  auto backend_generation = backend_generation_;
  auto backend = backend_;
  entry.state = CacheState::kPending;
  entry.pending = pending;

  std::expected<std::optional<FileBuildSettings>, BuildCoreError> result;
  try {
    result = co_await backend->BuildSettings(uri, target, language);
  } catch (const std::exception& e) {
    result = BuildCoreError::Unexpected(
        BuildCoreErrorCode::BackendQueryFailed, e.what());
  }

  co_await asio::post(strand_, asio::use_awaitable);

  auto* current = FindEntry(uri, key);
  bool is_current = current != nullptr && current->generation == generation &&
                    current->pending == pending &&
                    backend_generation_ == backend_generation;

  std::optional<FileBuildSettings> value;
  if (result) {
    value = std::move(*result);
    if (is_current) {
      current->state = CacheState::kKnown;
      current->value = value;
    }
  } else {
    logger_->warn(
        "Build settings query failed for {} in {}: {}", uri, target,
        result.error().message());
    value = last_known;
    if (is_current) {
      current->state =
          last_known ? CacheState::kStale : CacheState::kUnknown;
    }
  }

  if (is_current) {
    current->pending.reset();
  }

  pending->Set(value);
  co_return value;
}

auto BuildSystemManager::BuildSettingsForDocument(
    std::string uri, Language language)
    -> asio::awaitable<std::optional<FileBuildSettings>> {
  auto target = co_await CanonicalConfiguredTarget(uri);
  if (!target) {
    logger_->debug("No configured target for {}", uri);
    co_return std::nullopt;
  }
  co_return co_await BuildSettings(std::move(uri), *target, language);
}

auto BuildSystemManager::CanonicalConfiguredTarget(std::string uri)
    -> asio::awaitable<std::optional<ConfiguredTarget>> {
  auto targets = co_await ConfiguredTargets(std::move(uri));
  if (targets.empty()) {
    co_return std::nullopt;
  }
  co_return *std::ranges::min_element(targets);
}

auto BuildSystemManager::ConfiguredTargets(std::string uri)
    -> asio::awaitable<std::vector<ConfiguredTarget>> {
  co_await asio::post(strand_, asio::use_awaitable);

  auto backend = backend_;
  auto backend_generation = backend_generation_;
  auto targets = co_await QueryConfiguredTargets(backend, uri);

  co_await asio::post(strand_, asio::use_awaitable);

  if (!targets) {
    co_return std::vector<ConfiguredTarget>{};
  }

  // Remembered only to detect changes after graph generation
  if (backend_generation == backend_generation_ &&
      registrations_.contains(uri)) {
    auto sorted = *targets;
    std::ranges::sort(sorted);
    document_targets_[uri] = std::move(sorted);
  }
  co_return std::move(*targets);
}

auto BuildSystemManager::TopologicalSort(std::vector<ConfiguredTarget> targets)
    -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>> {
  co_await asio::post(strand_, asio::use_awaitable);
  auto backend = backend_;
  co_return co_await backend->TopologicalSort(std::move(targets));
}

auto BuildSystemManager::TargetsDependingOn(
    std::vector<ConfiguredTarget> targets)
    -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>> {
  co_await asio::post(strand_, asio::use_awaitable);
  auto backend = backend_;
  co_return co_await backend->TargetsDependingOn(std::move(targets));
}

auto BuildSystemManager::DefaultLanguage(std::string uri)
    -> asio::awaitable<std::optional<Language>> {
  co_await asio::post(strand_, asio::use_awaitable);
  auto backend = backend_;
  if (auto language = co_await backend->DefaultLanguage(uri)) {
    co_return language;
  }
  co_return LanguageForPath(UriToPath(uri));
}

auto BuildSystemManager::SourceFiles()
    -> asio::awaitable<std::vector<SourceFileInfo>> {
  co_await asio::post(strand_, asio::use_awaitable);
  auto backend = backend_;
  co_return co_await backend->SourceFiles();
}

auto BuildSystemManager::FileHandlingCapability(std::string uri)
    -> asio::awaitable<buildcore::FileHandlingCapability> {
  co_await asio::post(strand_, asio::use_awaitable);
  auto backend = backend_;
  co_return co_await backend->FileHandlingCapability(std::move(uri));
}

auto BuildSystemManager::ToolchainForDocument(
    std::string uri, Language language)
    -> asio::awaitable<std::expected<ToolchainPtr, BuildCoreError>> {
  co_await asio::post(strand_, asio::use_awaitable);

  if (!toolchain_registry_) {
    co_return BuildCoreError::Unexpected(
        BuildCoreErrorCode::NoToolchainFound, "no toolchain registry");
  }

  auto capability = language == Language::kSwift ? ToolchainCapability::kSwift
                                                 : ToolchainCapability::kClang;

  if (auto it = document_toolchains_.find(uri);
      it != document_toolchains_.end()) {
    auto remembered = toolchain_registry_->ToolchainWithIdentifier(it->second);
    if (remembered && (*remembered)->Supports(capability)) {
      co_return remembered;
    }
    logger_->info(
        "Toolchain {} for {} was removed, selecting another", it->second, uri);
    document_toolchains_.erase(it);
  }

  auto selected =
      toolchain_registry_->SelectToolchain(ToolchainRequest{
          .version = std::nullopt, .capability = capability});
  if (selected) {
    if (registrations_.contains(uri)) {
      document_toolchains_[uri] = (*selected)->Identifier();
    }
  } else {
    logger_->warn(
        "No toolchain for {} ({}): {}", uri, ToString(language),
        selected.error().message());
  }
  co_return selected;
}

auto BuildSystemManager::Kind() -> asio::awaitable<BuildSystemKind> {
  co_await asio::post(strand_, asio::use_awaitable);
  co_return backend_->Kind();
}

auto BuildSystemManager::ProjectRoot() -> asio::awaitable<CanonicalPath> {
  co_await asio::post(strand_, asio::use_awaitable);
  co_return backend_->Info().project_root;
}

auto BuildSystemManager::IndexStorePath()
    -> asio::awaitable<std::optional<CanonicalPath>> {
  co_await asio::post(strand_, asio::use_awaitable);
  co_return backend_->Info().index_store_path;
}

auto BuildSystemManager::IndexDatabasePath()
    -> asio::awaitable<std::optional<CanonicalPath>> {
  co_await asio::post(strand_, asio::use_awaitable);
  co_return backend_->Info().index_database_path;
}

auto BuildSystemManager::IndexPrefixMappings()
    -> asio::awaitable<std::vector<PathPrefixMapping>> {
  co_await asio::post(strand_, asio::use_awaitable);
  co_return backend_->Info().index_prefix_mappings;
}

// Jobs

auto BuildSystemManager::GenerateBuildGraph()
    -> asio::awaitable<std::expected<void, BuildCoreError>> {
  co_await asio::post(strand_, asio::use_awaitable);

  if (pending_graph_) {
    auto pending = pending_graph_;
    co_return co_await pending->AsyncWait(asio::use_awaitable);
  }

  auto pending = std::make_shared<PendingGraphGeneration>(executor_);
  pending_graph_ = pending;

  // Waiters are released whatever the generation ends with
  std::expected<void, BuildCoreError> outcome;
  try {
    outcome = co_await RunBuildGraphGeneration();
  } catch (const std::exception& e) {
    outcome = BuildCoreError::Unexpected(
        BuildCoreErrorCode::BuildGraphGenerationFailed, e.what());
  }
  co_await asio::post(strand_, asio::use_awaitable);

  if (!outcome) {
    logger_->error(
        "Build graph generation failed: {}", outcome.error().message());
  }

  if (pending_graph_ == pending) {
    pending_graph_.reset();
  }
  pending->Set(outcome);
  co_return outcome;
}

auto BuildSystemManager::Prepare(
    std::vector<ConfiguredTarget> targets,
    ProcessResultCallback on_process_result, TaskPriority priority)
    -> asio::awaitable<std::expected<void, BuildCoreError>> {
  co_await asio::post(strand_, asio::use_awaitable);

  auto backend = backend_;
  if (!backend->SupportsPreparation()) {
    co_return BuildCoreError::Unexpected(
        BuildCoreErrorCode::PrepareNotSupported,
        fmt::format("{} build system", ToString(backend->Kind())));
  }

  auto description = fmt::format("prepare {}", fmt::join(targets, ", "));
  auto error = std::make_shared<std::optional<BuildCoreError>>();

  auto job = scheduler_->Schedule(
      description, priority,
      [backend, targets, on_process_result, error, description,
       logger = logger_]() -> asio::awaitable<JobResult> {
        utils::ScopedTimer timer(description, logger);
        auto result = co_await backend->Prepare(
            targets, [on_process_result, logger](const IndexProcessResult& r) {
              if (!r.Succeeded()) {
                logger->warn("{}", r.Summary());
                if (!r.error_output.empty()) {
                  logger->debug("{}", r.error_output);
                }
              }
              if (on_process_result) {
                on_process_result(r);
              }
            });
        if (!result) {
          *error = result.error();
          co_return JobResult::Failed(result.error().message());
        }
        co_return JobResult::Succeeded();
      });
  prepare_jobs_.push_back(job);

  auto job_result = co_await job->Wait();
  co_await asio::post(strand_, asio::use_awaitable);
  std::erase(prepare_jobs_, job);

  switch (job_result.status) {
    case JobStatus::kSucceeded:
      co_return std::expected<void, BuildCoreError>{};
    case JobStatus::kCancelled:
      co_return BuildCoreError::Unexpected(
          BuildCoreErrorCode::JobCancelled, description);
    case JobStatus::kFailed:
    case JobStatus::kDependencyFailed:
      break;
  }

  logger_->error("{} failed: {}", description, job_result.message);
  if (*error) {
    co_return std::unexpected(**error);
  }
  co_return BuildCoreError::Unexpected(
      BuildCoreErrorCode::PrepareFailed, job_result.message);
}

// Document lifecycle

auto BuildSystemManager::RegisterForChangeNotifications(
    std::string uri, Language language) -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);

  logger_->debug("Registered {} ({})", uri, ToString(language));
  registrations_[uri] = Registration{
      .id = next_registration_id_++,
      .language = language,
      .recompute_generation = 0,
      .last_notified = std::nullopt};
  std::erase(unregistered_documents_, uri);
  backend_->RegisterForChangeNotifications(uri);

  // Delivers the guaranteed first notification
  ScheduleSettingsRecompute(uri);
}

auto BuildSystemManager::UnregisterForChangeNotifications(std::string uri)
    -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);

  if (registrations_.erase(uri) == 0) {
    co_return;
  }
  logger_->debug("Unregistered {}", uri);

  debouncer_.Cancel(SettingsDebounceKey(uri));
  pending_invalidations_.erase(uri);
  cache_.erase(uri);
  document_targets_.erase(uri);
  document_toolchains_.erase(uri);
  backend_->UnregisterForChangeNotifications(uri);
}

auto BuildSystemManager::FilesDidChange(std::vector<FileEvent> events)
    -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);
  backend_->FilesDidChange(std::move(events));
}

auto BuildSystemManager::SetOptions(ManagerOptions options)
    -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);
  options_ = options;
  logger_->debug(
      "Manager options updated: settings delay {}ms, source files delay {}ms",
      options_.settings_changed_delay.count(),
      options_.source_files_changed_delay.count());
}

auto BuildSystemManager::Reconfigure(std::unique_ptr<BuildSystem> backend)
    -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);
  logger_->info(
      "Reconfiguring: {} build system at {}", ToString(backend->Kind()),
      backend->ProjectRoot());

  co_await DrainOutstandingWork();

  // No await between the final drain check and the swap
  auto old_backend = std::exchange(backend_, std::move(backend));
  backend_generation_++;
  old_backend->SetDelegate({});
  backend_->SetDelegate(weak_from_this());

  cache_.clear();
  unregistered_documents_.clear();
  document_targets_.clear();
  document_toolchains_.clear();
  pending_invalidations_.clear();
  debouncer_.CancelAll();

  for (auto& [uri, registration] : registrations_) {
    registration.last_notified.reset();
    backend_->RegisterForChangeNotifications(uri);
    ScheduleSettingsRecompute(uri);
  }
  debouncer_.Schedule(
      kSourceFilesDebounceKey, options_.source_files_changed_delay,
      [weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
          asio::post(self->strand_, [self]() {
            self->DispatchSourceFilesChanged();
          });
        }
      });
}

auto BuildSystemManager::DrainOutstandingWork() -> asio::awaitable<void> {
  // Work can start while we wait, so loop until a pass finds none
  while (true) {
    std::vector<std::shared_ptr<PendingQuery>> queries;
    for (const auto& [uri, document_cache] : cache_) {
      for (const auto& [key, entry] : document_cache) {
        if (entry.pending) {
          queries.push_back(entry.pending);
        }
      }
    }
    auto graph = pending_graph_;
    auto prepare_jobs = prepare_jobs_;

    if (queries.empty() && !graph && prepare_jobs.empty()) {
      co_return;
    }

    logger_->debug(
        "Draining {} queries, {} graph job(s), {} prepare job(s)",
        queries.size(), graph ? 1 : 0, prepare_jobs.size());

    for (const auto& job : prepare_jobs) {
      scheduler_->Cancel(job);
    }
    for (const auto& job : prepare_jobs) {
      co_await job->Wait();
    }
    if (graph) {
      co_await graph->AsyncWait(asio::use_awaitable);
    }
    for (const auto& query : queries) {
      co_await query->AsyncWait(asio::use_awaitable);
    }

    co_await asio::post(strand_, asio::use_awaitable);
    // Finished Prepare() calls erase their own jobs once they resume
    std::erase_if(
        prepare_jobs_, [](const JobHandle& job) { return job->IsFinished(); });
    // Queries whose generation moved on never clear their own pending slot
    for (auto& [uri, document_cache] : cache_) {
      for (auto& [key, entry] : document_cache) {
        if (entry.pending && entry.pending->IsReady()) {
          entry.pending.reset();
          if (entry.state == CacheState::kPending) {
            entry.state =
                entry.value ? CacheState::kStale : CacheState::kUnknown;
          }
        }
      }
    }
    if (pending_graph_ && pending_graph_->IsReady()) {
      pending_graph_.reset();
    }
  }
}

// Handlers

auto BuildSystemManager::AddSettingsChangedHandler(
    SettingsChangedHandler handler) -> SubscriptionId {
  auto id = next_subscription_id_.fetch_add(1, std::memory_order_relaxed);
  asio::post(
      strand_, [self = shared_from_this(), id, h = std::move(handler)]() mutable {
        self->settings_handlers_.emplace(id, std::move(h));
      });
  return id;
}

auto BuildSystemManager::AddDependenciesUpdatedHandler(
    DependenciesUpdatedHandler handler) -> SubscriptionId {
  auto id = next_subscription_id_.fetch_add(1, std::memory_order_relaxed);
  asio::post(
      strand_, [self = shared_from_this(), id, h = std::move(handler)]() mutable {
        self->dependencies_handlers_.emplace(id, std::move(h));
      });
  return id;
}

auto BuildSystemManager::AddSourceFilesChangedHandler(
    SourceFilesChangedHandler handler) -> SubscriptionId {
  auto id = next_subscription_id_.fetch_add(1, std::memory_order_relaxed);
  asio::post(
      strand_, [self = shared_from_this(), id, h = std::move(handler)]() mutable {
        self->source_files_handlers_.emplace(id, std::move(h));
      });
  return id;
}

auto BuildSystemManager::RemoveHandler(SubscriptionId id) -> void {
  asio::post(strand_, [self = shared_from_this(), id]() {
    self->settings_handlers_.erase(id);
    self->dependencies_handlers_.erase(id);
    self->source_files_handlers_.erase(id);
  });
}

// BuildSystemDelegate

auto BuildSystemManager::FileBuildSettingsChanged(std::vector<std::string> uris)
    -> void {
  asio::post(strand_, [self = shared_from_this(), uris = std::move(uris)]() {
    for (const auto& uri : uris) {
      // Invalidation waits for the debounce so a burst costs one query
      self->pending_invalidations_.insert(uri);
      self->ScheduleSettingsRecompute(uri);
    }
  });
}

auto BuildSystemManager::FilesDependenciesUpdated(std::vector<std::string> uris)
    -> void {
  asio::post(strand_, [self = shared_from_this(), uris = std::move(uris)]() {
    self->DispatchDependenciesUpdated(uris);
  });
}

auto BuildSystemManager::BuildTargetsChanged() -> void {
  debouncer_.Schedule(
      kBuildTargetsDebounceKey, options_.settings_changed_delay,
      [weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
          asio::post(self->strand_, [self]() {
            self->logger_->debug("Build targets changed, invalidating all");
            self->InvalidateAll();
            self->RecomputeAllRegistered();
          });
        }
      });
}

auto BuildSystemManager::FileHandlingCapabilityChanged() -> void {
  // Same effect as a target change; both share one debounce key
  BuildTargetsChanged();
}

auto BuildSystemManager::SourceFilesChanged() -> void {
  debouncer_.Schedule(
      kSourceFilesDebounceKey, options_.source_files_changed_delay,
      [weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
          asio::post(self->strand_, [self]() {
            self->DispatchSourceFilesChanged();
          });
        }
      });
}

// Private

auto BuildSystemManager::FindEntry(const std::string& uri, const CacheKey& key)
    -> CacheEntry* {
  auto doc_it = cache_.find(uri);
  if (doc_it == cache_.end()) {
    return nullptr;
  }
  auto entry_it = doc_it->second.find(key);
  if (entry_it == doc_it->second.end()) {
    return nullptr;
  }
  return &entry_it->second;
}

auto BuildSystemManager::TrackUnregisteredDocument(const std::string& uri)
    -> void {
  unregistered_documents_.push_back(uri);
  while (unregistered_documents_.size() >
         std::max<size_t>(1, options_.max_unregistered_documents)) {
    auto evicted = std::move(unregistered_documents_.front());
    unregistered_documents_.pop_front();
    cache_.erase(evicted);
    logger_->trace("Evicted cached settings for {}", evicted);
  }
}

auto BuildSystemManager::InvalidateDocument(const std::string& uri) -> void {
  auto doc_it = cache_.find(uri);
  if (doc_it == cache_.end()) {
    return;
  }
  for (auto& [key, entry] : doc_it->second) {
    entry.generation++;
    entry.pending.reset();
    entry.state = entry.value ? CacheState::kStale : CacheState::kUnknown;
  }
  logger_->trace("Invalidated cached settings for {}", uri);
}

auto BuildSystemManager::InvalidateAll() -> void {
  for (const auto& [uri, document_cache] : cache_) {
    InvalidateDocument(uri);
  }
  pending_invalidations_.clear();
}

auto BuildSystemManager::ScheduleSettingsRecompute(const std::string& uri)
    -> void {
  debouncer_.Schedule(
      SettingsDebounceKey(uri), options_.settings_changed_delay,
      [weak = weak_from_this(), uri]() {
        if (auto self = weak.lock()) {
          asio::co_spawn(
              self->strand_,
              [self, uri]() -> asio::awaitable<void> {
                co_await self->ProcessSettingsChange(uri);
              },
              asio::detached);
        }
      });
}

auto BuildSystemManager::RecomputeAllRegistered() -> void {
  for (const auto& [uri, registration] : registrations_) {
    asio::co_spawn(
        strand_,
        [self = shared_from_this(), uri]() -> asio::awaitable<void> {
          co_await self->ProcessSettingsChange(uri);
        },
        asio::detached);
  }
}

auto BuildSystemManager::ProcessSettingsChange(std::string uri)
    -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);

  // Invalidation happens before the notification it causes
  if (pending_invalidations_.erase(uri) > 0) {
    InvalidateDocument(uri);
  }

  auto it = registrations_.find(uri);
  if (it == registrations_.end()) {
    co_return;
  }
  auto registration_id = it->second.id;
  auto generation = ++it->second.recompute_generation;
  auto language = it->second.language;

  auto settings = co_await BuildSettingsForDocument(uri, language);
  co_await asio::post(strand_, asio::use_awaitable);

  it = registrations_.find(uri);
  if (it == registrations_.end() || it->second.id != registration_id ||
      it->second.recompute_generation != generation) {
    logger_->trace("Settings recomputation for {} was superseded", uri);
    co_return;
  }

  auto& registration = it->second;
  if (registration.last_notified && *registration.last_notified == settings) {
    logger_->trace("Settings for {} unchanged, not notifying", uri);
    co_return;
  }
  registration.last_notified = settings;
  DispatchSettingsChanged(uri, settings);
}

auto BuildSystemManager::RunBuildGraphGeneration()
    -> asio::awaitable<std::expected<void, BuildCoreError>> {
  auto backend = backend_;
  auto error = std::make_shared<std::optional<BuildCoreError>>();

  auto job = scheduler_->Schedule(
      "generate build graph", TaskPriority::kHigh,
      [backend, error, logger = logger_]() -> asio::awaitable<JobResult> {
        utils::ScopedTimer timer("Build graph generation", logger);
        auto result = co_await backend->GenerateBuildGraph();
        if (!result) {
          *error = result.error();
          co_return JobResult::Failed(result.error().message());
        }
        co_return JobResult::Succeeded();
      });

  auto job_result = co_await job->Wait();
  co_await asio::post(strand_, asio::use_awaitable);

  switch (job_result.status) {
    case JobStatus::kSucceeded:
      break;
    case JobStatus::kCancelled:
      co_return BuildCoreError::Unexpected(
          BuildCoreErrorCode::JobCancelled, "build graph generation");
    case JobStatus::kFailed:
    case JobStatus::kDependencyFailed:
      co_return BuildCoreError::Unexpected(
          BuildCoreErrorCode::BuildGraphGenerationFailed,
          *error ? (*error)->message() : job_result.message);
  }

  co_await RefreshConfiguredTargets();
  co_return std::expected<void, BuildCoreError>{};
}

auto BuildSystemManager::RefreshConfiguredTargets() -> asio::awaitable<void> {
  std::vector<std::string> documents;
  for (const auto& [uri, registration] : registrations_) {
    documents.push_back(uri);
  }

  auto backend = backend_;
  auto backend_generation = backend_generation_;

  for (const auto& uri : documents) {
    auto targets = co_await QueryConfiguredTargets(backend, uri);
    co_await asio::post(strand_, asio::use_awaitable);

    if (backend_generation != backend_generation_) {
      co_return;
    }
    // Unknown answers leave the remembered targets as they are
    if (!targets || !registrations_.contains(uri)) {
      continue;
    }
    std::ranges::sort(*targets);

    auto previous = document_targets_.find(uri);
    bool changed = previous == document_targets_.end() ||
                   previous->second != *targets;
    if (!changed) {
      continue;
    }

    logger_->debug(
        "Configured targets of {} changed: [{}]", uri,
        fmt::join(*targets, ", "));
    document_targets_[uri] = std::move(*targets);
    InvalidateDocument(uri);
    ScheduleSettingsRecompute(uri);
  }
}

auto BuildSystemManager::QueryConfiguredTargets(
    std::shared_ptr<BuildSystem> backend, const std::string& uri)
    -> asio::awaitable<std::optional<std::vector<ConfiguredTarget>>> {
  try {
    co_return co_await backend->ConfiguredTargets(uri);
  } catch (const std::exception& e) {
    logger_->warn("Configured targets query failed for {}: {}", uri, e.what());
  }
  co_return std::nullopt;
}

auto BuildSystemManager::DispatchSettingsChanged(
    const std::string& uri, const std::optional<FileBuildSettings>& settings)
    -> void {
  logger_->debug(
      "Settings changed for {} ({} handler(s))", uri,
      settings_handlers_.size());
  auto handlers = settings_handlers_;
  for (const auto& [id, handler] : handlers) {
    try {
      handler(uri, settings);
    } catch (const std::exception& e) {
      logger_->error("Settings handler {} threw: {}", id, e.what());
    }
  }
}

auto BuildSystemManager::DispatchDependenciesUpdated(
    const std::vector<std::string>& uris) -> void {
  auto handlers = dependencies_handlers_;
  for (const auto& [id, handler] : handlers) {
    try {
      handler(uris);
    } catch (const std::exception& e) {
      logger_->error("Dependencies handler {} threw: {}", id, e.what());
    }
  }
}

auto BuildSystemManager::DispatchSourceFilesChanged() -> void {
  auto handlers = source_files_handlers_;
  for (const auto& [id, handler] : handlers) {
    try {
      handler();
    } catch (const std::exception& e) {
      logger_->error("Source files handler {} threw: {}", id, e.what());
    }
  }
}

}  // namespace buildcore::services
