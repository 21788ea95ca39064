#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace buildcore::utils {

// Logs "<operation> completed (<duration>)" on destruction. Operations that
// reach `slow_threshold` are logged as warnings, everything else at debug.
class ScopedTimer {
 public:
  static constexpr std::chrono::milliseconds kDefaultSlowThreshold{5000};

  ScopedTimer(
      std::string operation_name, std::shared_ptr<spdlog::logger> logger,
      std::chrono::milliseconds slow_threshold = kDefaultSlowThreshold);
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer&) = delete;
  auto operator=(const ScopedTimer&) -> ScopedTimer& = delete;
  ScopedTimer(ScopedTimer&&) = delete;
  auto operator=(ScopedTimer&&) -> ScopedTimer& = delete;

  [[nodiscard]] auto GetElapsed() const -> std::chrono::milliseconds;

  // "123ms" below one second, "1.2s" above
  static auto FormatDuration(std::chrono::milliseconds duration) -> std::string;

 private:
  std::chrono::steady_clock::time_point start_;
  std::string operation_name_;
  std::shared_ptr<spdlog::logger> logger_;
  std::chrono::milliseconds slow_threshold_;
};

}  // namespace buildcore::utils
