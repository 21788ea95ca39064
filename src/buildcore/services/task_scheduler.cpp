#include "buildcore/services/task_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include <asio/bind_cancellation_slot.hpp>
#include <asio/co_spawn.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>
#include <fmt/format.h>

namespace buildcore::services {

auto ToString(TaskPriority priority) -> std::string_view {
  switch (priority) {
    case TaskPriority::kLow:
      return "low";
    case TaskPriority::kMedium:
      return "medium";
    case TaskPriority::kHigh:
      return "high";
  }
  return "unknown";
}

auto ToString(JobStatus status) -> std::string_view {
  switch (status) {
    case JobStatus::kSucceeded:
      return "succeeded";
    case JobStatus::kFailed:
      return "failed";
    case JobStatus::kCancelled:
      return "cancelled";
    case JobStatus::kDependencyFailed:
      return "dependency failed";
  }
  return "unknown";
}

ScheduledJob::ScheduledJob(
    asio::any_io_executor executor, uint64_t id, std::string description,
    TaskPriority priority, JobBody body,
    std::vector<std::shared_ptr<ScheduledJob>> dependencies)
    : id_(id),
      description_(std::move(description)),
      body_(std::move(body)),
      dependencies_(std::move(dependencies)),
      strand_(asio::make_strand(executor)),
      priority_(priority),
      outcome_(executor) {
}

auto ScheduledJob::Wait() -> asio::awaitable<JobResult> {
  co_return co_await outcome_.AsyncWait(asio::use_awaitable);
}

auto TaskScheduler::DefaultMaxConcurrentJobs() -> size_t {
  const auto hw_threads = std::thread::hardware_concurrency();
  return hw_threads == 0 ? 1 : hw_threads;
}

TaskScheduler::TaskScheduler(
    asio::any_io_executor executor, size_t max_concurrent_jobs,
    std::shared_ptr<spdlog::logger> logger)
    : executor_(executor),
      logger_(logger ? logger : spdlog::default_logger()),
      strand_(asio::make_strand(executor)),
      max_concurrent_jobs_(std::max<size_t>(1, max_concurrent_jobs)) {
}

auto TaskScheduler::Create(
    asio::any_io_executor executor, size_t max_concurrent_jobs,
    std::shared_ptr<spdlog::logger> logger) -> std::shared_ptr<TaskScheduler> {
  return std::make_shared<TaskScheduler>(
      std::move(executor), max_concurrent_jobs, std::move(logger));
}

auto TaskScheduler::Schedule(
    std::string description, TaskPriority priority, JobBody body,
    std::vector<JobHandle> dependencies) -> JobHandle {
  auto job = std::make_shared<ScheduledJob>(
      executor_, next_id_.fetch_add(1, std::memory_order_relaxed),
      std::move(description), priority, std::move(body),
      std::move(dependencies));

  asio::post(strand_, [self = shared_from_this(), job]() {
    self->logger_->debug(
        "Queued job #{} '{}' ({} priority)", job->id_, job->description_,
        ToString(job->priority_));
    self->queued_.push_back(job);
    self->Poke();
  });

  return job;
}

auto TaskScheduler::Cancel(const JobHandle& job) -> void {
  asio::post(strand_, [self = shared_from_this(), job]() {
    switch (job->state_) {
      case ScheduledJob::State::kQueued: {
        std::erase(self->queued_, job);
        job->cancel_requested_ = true;
        self->Finish(job, JobResult::Cancelled());
        // Dependents of the cancelled job resolve now
        self->Poke();
        break;
      }
      case ScheduledJob::State::kRunning: {
        if (job->cancel_requested_) {
          return;
        }
        job->cancel_requested_ = true;
        self->logger_->debug(
            "Cancelling running job #{} '{}'", job->id_, job->description_);
        // Signals must be emitted where the job's operations run
        asio::post(job->strand_, [job]() {
          job->cancel_signal_.emit(asio::cancellation_type::terminal);
        });
        break;
      }
      case ScheduledJob::State::kFinished:
        break;
    }
  });
}

auto TaskScheduler::ElevatePriority(const JobHandle& job, TaskPriority priority)
    -> void {
  asio::post(strand_, [self = shared_from_this(), job, priority]() {
    if (job->state_ != ScheduledJob::State::kQueued ||
        priority <= job->priority_) {
      return;
    }
    self->logger_->debug(
        "Elevating job #{} '{}' to {} priority", job->id_, job->description_,
        ToString(priority));
    job->priority_ = priority;
    self->Poke();
  });
}

auto TaskScheduler::SetMaxConcurrentJobs(size_t max_concurrent_jobs) -> void {
  asio::post(strand_, [self = shared_from_this(), max_concurrent_jobs]() {
    self->max_concurrent_jobs_ = std::max<size_t>(1, max_concurrent_jobs);
    self->logger_->debug(
        "Max concurrent jobs set to {}", self->max_concurrent_jobs_);
    self->Poke();
  });
}

auto TaskScheduler::WaitForIdle() -> asio::awaitable<void> {
  co_await asio::post(strand_, asio::use_awaitable);

  if (queued_.empty() && running_.empty()) {
    co_return;
  }

  auto idle = std::make_shared<utils::SharedResult<SchedulerStats>>(executor_);
  idle_waiters_.push_back(idle);
  auto stats = co_await idle->AsyncWait(asio::use_awaitable);
  logger_->trace(
      "Scheduler idle (max {} concurrent jobs)", stats.max_concurrent_jobs);
}

auto TaskScheduler::Stats() -> asio::awaitable<SchedulerStats> {
  co_await asio::post(strand_, asio::use_awaitable);
  co_return SchedulerStats{
      .queued = queued_.size(),
      .running = running_.size(),
      .max_concurrent_jobs = max_concurrent_jobs_};
}

auto TaskScheduler::Poke() -> void {
  // Resolve jobs whose dependencies can no longer succeed. Repeat until
  // stable since each resolution may doom further dependents.
  bool changed = true;
  while (changed) {
    changed = false;
    for (auto it = queued_.begin(); it != queued_.end(); ++it) {
      auto job = *it;
      auto failed_dependency = std::ranges::find_if(
          job->dependencies_, [](const JobHandle& dependency) {
            return dependency->state_ == ScheduledJob::State::kFinished &&
                   !dependency->result_.Ok();
          });
      if (failed_dependency == job->dependencies_.end()) {
        continue;
      }
      queued_.erase(it);
      Finish(
          job, JobResult::DependencyFailed(fmt::format(
                   "dependency '{}' {}", (*failed_dependency)->description_,
                   ToString((*failed_dependency)->result_.status))));
      changed = true;
      break;
    }
  }

  while (running_.size() < max_concurrent_jobs_) {
    auto best = queued_.end();
    for (auto it = queued_.begin(); it != queued_.end(); ++it) {
      const auto& job = *it;
      bool ready = std::ranges::all_of(
          job->dependencies_, [](const JobHandle& dependency) {
            return dependency->state_ == ScheduledJob::State::kFinished;
          });
      if (!ready) {
        continue;
      }
      // Ids grow with submission order, so the lower id wins a tie
      if (best == queued_.end() || job->priority_ > (*best)->priority_ ||
          (job->priority_ == (*best)->priority_ && job->id_ < (*best)->id_)) {
        best = it;
      }
    }
    if (best == queued_.end()) {
      break;
    }

    auto job = *best;
    queued_.erase(best);
    Start(job);
  }

  NotifyIdleIfQuiet();
}

auto TaskScheduler::Start(const JobHandle& job) -> void {
  job->state_ = ScheduledJob::State::kRunning;
  running_.emplace(job->id_, job);
  logger_->debug(
      "Starting job #{} '{}' ({}/{} running)", job->id_, job->description_,
      running_.size(), max_concurrent_jobs_);

  asio::co_spawn(
      job->strand_,
      [job]() -> asio::awaitable<JobResult> { co_return co_await job->body_(); },
      asio::bind_cancellation_slot(
          job->cancel_signal_.slot(),
          [self = shared_from_this(), job](
              std::exception_ptr error, JobResult result) {
            if (error) {
              try {
                std::rethrow_exception(error);
              } catch (const std::system_error& e) {
                if (e.code() == asio::error::operation_aborted) {
                  result = JobResult::Cancelled();
                } else {
                  result = JobResult::Failed(e.what());
                }
              } catch (const std::exception& e) {
                result = JobResult::Failed(e.what());
              } catch (...) {
                result = JobResult::Failed("unknown exception");
              }
            }

            asio::post(self->strand_, [self, job, result]() {
              self->OnJobCompleted(job, result);
            });
          }));
}

auto TaskScheduler::OnJobCompleted(const JobHandle& job, JobResult result)
    -> void {
  running_.erase(job->id_);

  if (job->cancel_requested_) {
    result = JobResult::Cancelled();
  }
  if (result.status == JobStatus::kFailed) {
    logger_->warn(
        "Job #{} '{}' failed: {}", job->id_, job->description_,
        result.message);
  }

  Finish(job, std::move(result));
  Poke();
}

auto TaskScheduler::Finish(const JobHandle& job, JobResult result) -> void {
  job->state_ = ScheduledJob::State::kFinished;
  job->result_ = std::move(result);
  job->finished_.store(true, std::memory_order_release);
  logger_->debug(
      "Job #{} '{}' {}", job->id_, job->description_,
      ToString(job->result_.status));
  job->outcome_.Set(job->result_);
}

auto TaskScheduler::NotifyIdleIfQuiet() -> void {
  if (!queued_.empty() || !running_.empty()) {
    return;
  }
  auto waiters = std::move(idle_waiters_);
  idle_waiters_.clear();
  for (const auto& waiter : waiters) {
    waiter->Set(SchedulerStats{
        .queued = 0, .running = 0, .max_concurrent_jobs = max_concurrent_jobs_});
  }
}

}  // namespace buildcore::services
