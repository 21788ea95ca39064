#include "buildcore/utils/debouncer.hpp"

#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

namespace buildcore::utils {

Debouncer::Debouncer(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : state_(std::make_shared<State>(executor)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

Debouncer::~Debouncer() {
  asio::post(state_->strand, [state = state_]() {
    state->shut_down = true;
    state->pending.clear();
  });
}

auto Debouncer::Schedule(
    std::string key, std::chrono::milliseconds delay, Action action) -> void {
  asio::post(
      state_->strand, [state = state_, logger = logger_, key = std::move(key),
                       delay, action = std::move(action)]() mutable {
        if (state->shut_down) {
          return;
        }

        auto& pending = state->pending[key];
        pending.action = std::move(action);
        pending.generation = ++state->next_generation;
        if (!pending.timer) {
          pending.timer = std::make_unique<asio::steady_timer>(state->strand);
        }

        // Re-arming aborts the previous wait; its handler sees
        // operation_aborted
        pending.timer->expires_after(delay);
        pending.timer->async_wait(
            [state, logger, key, generation = pending.generation](
                std::error_code ec) {
              if (ec == asio::error::operation_aborted) {
                return;
              }
              if (ec) {
                logger->warn(
                    "Debouncer timer error for '{}': {}", key, ec.message());
                return;
              }
              Fire(state, key, generation);
            });
      });
}

auto Debouncer::Cancel(std::string key) -> void {
  asio::post(state_->strand, [state = state_, key = std::move(key)]() {
    // Destroying the timer aborts its wait
    state->pending.erase(key);
  });
}

auto Debouncer::Flush(std::string key) -> void {
  asio::post(state_->strand, [state = state_, key = std::move(key)]() {
    auto it = state->pending.find(key);
    if (it == state->pending.end()) {
      return;
    }
    Fire(state, key, it->second.generation);
  });
}

auto Debouncer::CancelAll() -> void {
  asio::post(state_->strand, [state = state_]() { state->pending.clear(); });
}

auto Debouncer::HasPending(std::string key) -> asio::awaitable<bool> {
  co_await asio::post(state_->strand, asio::use_awaitable);
  co_return state_->pending.contains(key);
}

auto Debouncer::Fire(
    const std::shared_ptr<State>& state, const std::string& key,
    uint64_t generation) -> void {
  // Runs on the strand. A handler that was already queued when the key got
  // re-armed carries an old generation and must not run early.
  auto it = state->pending.find(key);
  if (it == state->pending.end() || it->second.generation != generation) {
    return;
  }

  auto action = std::move(it->second.action);
  state->pending.erase(it);
  if (action) {
    asio::post(state->executor, std::move(action));
  }
}

}  // namespace buildcore::utils
