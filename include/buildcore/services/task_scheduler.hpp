#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/cancellation_signal.hpp>
#include <asio/strand.hpp>
#include <spdlog/spdlog.h>

#include "buildcore/utils/shared_result.hpp"

namespace buildcore::services {

enum class TaskPriority { kLow = 0, kMedium = 1, kHigh = 2 };

enum class JobStatus { kSucceeded, kFailed, kCancelled, kDependencyFailed };

[[nodiscard]] auto ToString(TaskPriority priority) -> std::string_view;
[[nodiscard]] auto ToString(JobStatus status) -> std::string_view;

struct JobResult {
  JobStatus status = JobStatus::kSucceeded;
  std::string message;

  static auto Succeeded() -> JobResult {
    return JobResult{.status = JobStatus::kSucceeded, .message = {}};
  }

  static auto Failed(std::string message) -> JobResult {
    return JobResult{.status = JobStatus::kFailed, .message = std::move(message)};
  }

  static auto Cancelled() -> JobResult {
    return JobResult{.status = JobStatus::kCancelled, .message = "cancelled"};
  }

  static auto DependencyFailed(std::string message) -> JobResult {
    return JobResult{
        .status = JobStatus::kDependencyFailed, .message = std::move(message)};
  }

  [[nodiscard]] auto Ok() const -> bool {
    return status == JobStatus::kSucceeded;
  }
};

// Work performed by a job. Runs on the job's own strand; cancellation arrives
// as operation_aborted from whatever the body is awaiting.
using JobBody = std::function<asio::awaitable<JobResult>()>;

class TaskScheduler;

// A unit of work owned by the scheduler. Callers hold it through JobHandle to
// wait for, cancel or re-prioritize it.
class ScheduledJob {
 public:
  ScheduledJob(
      asio::any_io_executor executor, uint64_t id, std::string description,
      TaskPriority priority, JobBody body,
      std::vector<std::shared_ptr<ScheduledJob>> dependencies);

  ScheduledJob(const ScheduledJob&) = delete;
  auto operator=(const ScheduledJob&) -> ScheduledJob& = delete;
  ScheduledJob(ScheduledJob&&) = delete;
  auto operator=(ScheduledJob&&) -> ScheduledJob& = delete;
  ~ScheduledJob() = default;

  [[nodiscard]] auto Id() const -> uint64_t {
    return id_;
  }

  [[nodiscard]] auto Description() const -> const std::string& {
    return description_;
  }

  // Completes with the terminal result; any number of callers may wait
  auto Wait() -> asio::awaitable<JobResult>;

  [[nodiscard]] auto IsFinished() const -> bool {
    return finished_.load(std::memory_order_acquire);
  }

 private:
  friend class TaskScheduler;

  enum class State { kQueued, kRunning, kFinished };

  const uint64_t id_;
  const std::string description_;
  JobBody body_;
  std::vector<std::shared_ptr<ScheduledJob>> dependencies_;

  // Runs the body; cancellation signals are emitted here
  asio::strand<asio::any_io_executor> strand_;
  asio::cancellation_signal cancel_signal_;

  // Protected by the scheduler strand
  TaskPriority priority_;
  State state_ = State::kQueued;
  bool cancel_requested_ = false;
  JobResult result_;

  utils::SharedResult<JobResult> outcome_;
  std::atomic<bool> finished_{false};
};

using JobHandle = std::shared_ptr<ScheduledJob>;

struct SchedulerStats {
  size_t queued = 0;
  size_t running = 0;
  size_t max_concurrent_jobs = 0;
};

// Runs at most `max_concurrent_jobs` jobs at once.
//
// - Ready jobs start highest priority first, FIFO within a priority
// - A job is ready once every dependency has succeeded; if any dependency
//   ends otherwise, the job resolves kDependencyFailed without running
// - A failing job never affects jobs that do not depend on it
//
// Knows nothing about targets or build systems.
class TaskScheduler : public std::enable_shared_from_this<TaskScheduler> {
 public:
  static auto DefaultMaxConcurrentJobs() -> size_t;

  TaskScheduler(
      asio::any_io_executor executor, size_t max_concurrent_jobs,
      std::shared_ptr<spdlog::logger> logger);

  static auto Create(
      asio::any_io_executor executor,
      size_t max_concurrent_jobs = DefaultMaxConcurrentJobs(),
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::shared_ptr<TaskScheduler>;

  TaskScheduler(const TaskScheduler&) = delete;
  auto operator=(const TaskScheduler&) -> TaskScheduler& = delete;
  TaskScheduler(TaskScheduler&&) = delete;
  auto operator=(TaskScheduler&&) -> TaskScheduler& = delete;
  ~TaskScheduler() = default;

  // Dependencies must come from this scheduler
  auto Schedule(
      std::string description, TaskPriority priority, JobBody body,
      std::vector<JobHandle> dependencies = {}) -> JobHandle;

  // Queued: removed, resolves kCancelled. Running: receives a terminal
  // cancellation and resolves kCancelled. Finished: no effect.
  auto Cancel(const JobHandle& job) -> void;

  // Raises the priority of a queued job; never lowers it
  auto ElevatePriority(const JobHandle& job, TaskPriority priority) -> void;

  auto SetMaxConcurrentJobs(size_t max_concurrent_jobs) -> void;

  // Completes when nothing is queued or running
  auto WaitForIdle() -> asio::awaitable<void>;

  auto Stats() -> asio::awaitable<SchedulerStats>;

  [[nodiscard]] auto GetExecutor() const -> asio::any_io_executor {
    return executor_;
  }

 private:
  // Everything below runs on strand_
  auto Poke() -> void;
  auto Start(const JobHandle& job) -> void;
  auto Finish(const JobHandle& job, JobResult result) -> void;
  auto OnJobCompleted(const JobHandle& job, JobResult result) -> void;
  auto NotifyIdleIfQuiet() -> void;

  asio::any_io_executor executor_;
  std::shared_ptr<spdlog::logger> logger_;
  std::atomic<uint64_t> next_id_{1};

  // Protected by strand_
  asio::strand<asio::any_io_executor> strand_;
  size_t max_concurrent_jobs_;
  std::vector<JobHandle> queued_;
  std::unordered_map<uint64_t, JobHandle> running_;
  std::vector<std::shared_ptr<utils::SharedResult<SchedulerStats>>>
      idle_waiters_;
};

}  // namespace buildcore::services
