#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <spdlog/spdlog.h>

namespace buildcore::utils {

// Coalesces bursts of Schedule() calls for the same key into one delayed
// action.
//
// - First Schedule(key) arms a timer for `delay`
// - Schedule(key) before expiry re-arms the timer and replaces the action
// - On expiry the latest action runs exactly once and the key is cleared
// - Keys never interact with each other
//
// Actions are posted to the executor, never run on the caller's stack.
class Debouncer {
 public:
  using Action = std::function<void()>;

  explicit Debouncer(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ~Debouncer();

  Debouncer(const Debouncer&) = delete;
  auto operator=(const Debouncer&) -> Debouncer& = delete;
  Debouncer(Debouncer&&) = delete;
  auto operator=(Debouncer&&) -> Debouncer& = delete;

  auto Schedule(std::string key, std::chrono::milliseconds delay, Action action)
      -> void;

  // Drop the pending action for `key` without running it
  auto Cancel(std::string key) -> void;

  // Run the pending action for `key` now instead of at expiry
  auto Flush(std::string key) -> void;

  auto CancelAll() -> void;

  auto HasPending(std::string key) -> asio::awaitable<bool>;

 private:
  struct Pending {
    std::unique_ptr<asio::steady_timer> timer;
    Action action;
    uint64_t generation = 0;
  };

  // Shared with timer handlers so they outlive the Debouncer safely
  struct State {
    explicit State(asio::any_io_executor exec)
        : executor(exec), strand(asio::make_strand(exec)) {
    }

    asio::any_io_executor executor;
    asio::strand<asio::any_io_executor> strand;
    std::unordered_map<std::string, Pending> pending;
    uint64_t next_generation = 0;
    bool shut_down = false;
  };

  static auto Fire(
      const std::shared_ptr<State>& state, const std::string& key,
      uint64_t generation) -> void;

  std::shared_ptr<State> state_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace buildcore::utils
