#include "buildcore/utils/scoped_timer.hpp"

#include <fmt/format.h>

namespace buildcore::utils {

ScopedTimer::ScopedTimer(
    std::string operation_name, std::shared_ptr<spdlog::logger> logger,
    std::chrono::milliseconds slow_threshold)
    : start_(std::chrono::steady_clock::now()),
      operation_name_(std::move(operation_name)),
      logger_(logger ? logger : spdlog::default_logger()),
      slow_threshold_(slow_threshold) {
}

ScopedTimer::~ScopedTimer() {
  auto elapsed = GetElapsed();
  auto level = elapsed >= slow_threshold_ ? spdlog::level::warn
                                          : spdlog::level::debug;
  logger_->log(
      level, "{} completed ({})", operation_name_, FormatDuration(elapsed));
}

auto ScopedTimer::GetElapsed() const -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_);
}

auto ScopedTimer::FormatDuration(std::chrono::milliseconds duration)
    -> std::string {
  auto count = duration.count();
  if (count >= 1000) {
    return fmt::format("{:.1f}s", static_cast<double>(count) / 1000.0);
  }
  return fmt::format("{}ms", count);
}

}  // namespace buildcore::utils
