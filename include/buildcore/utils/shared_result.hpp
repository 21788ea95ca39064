#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>

namespace buildcore::utils {

// A value produced once and handed to every caller that asked for it.
//
// Coalesced work (one backend query, one graph generation, one job) creates a
// SharedResult, every interested caller awaits it, and the producer publishes
// the outcome with Set(). Each waiter receives its own copy. Waiters arriving
// after Set() complete immediately with the stored value.
//
// State lives behind a shared_ptr so handlers posted to the internal strand
// stay valid when the SharedResult is destroyed first.
template <typename T>
class SharedResult {
 public:
  explicit SharedResult(asio::any_io_executor executor)
      : state_(std::make_shared<State>(executor)) {
  }

  ~SharedResult() = default;

  SharedResult(const SharedResult&) = delete;
  auto operator=(const SharedResult&) -> SharedResult& = delete;
  SharedResult(SharedResult&&) = delete;
  auto operator=(SharedResult&&) -> SharedResult& = delete;

  //   auto value = co_await result.AsyncWait(asio::use_awaitable);
  template <typename CompletionToken>
  auto AsyncWait(CompletionToken&& token) {
    return asio::async_initiate<CompletionToken, void(T)>(
        [state = state_](auto handler) {
          asio::post(state->strand, [state, h = std::move(handler)]() mutable {
            if (state->value) {
              asio::post(
                  state->executor,
                  [h = std::move(h), value = *state->value]() mutable {
                    std::move(h)(std::move(value));
                  });
              return;
            }
            state->waiters.push_back(
                std::make_unique<ConcreteWaiter<decltype(h)>>(std::move(h)));
          });
        },
        std::forward<CompletionToken>(token));
  }

  // The first value wins; later calls are ignored. Safe from any thread.
  auto Set(T value) -> void {
    asio::post(
        state_->strand, [state = state_, value = std::move(value)]() mutable {
          if (state->value) {
            return;
          }
          state->value = std::move(value);
          state->ready.store(true, std::memory_order_release);

          auto waiters = std::move(state->waiters);
          state->waiters.clear();
          for (auto& waiter : waiters) {
            asio::post(
                state->executor,
                [w = std::move(waiter), copy = *state->value]() mutable {
                  w->Invoke(std::move(copy));
                });
          }
        });
  }

  // Racy snapshot, for draining and tests
  [[nodiscard]] auto IsReady() const -> bool {
    return state_->ready.load(std::memory_order_acquire);
  }

 private:
  struct Waiter {
    Waiter() = default;
    virtual ~Waiter() = default;
    Waiter(const Waiter&) = delete;
    auto operator=(const Waiter&) -> Waiter& = delete;
    Waiter(Waiter&&) = delete;
    auto operator=(Waiter&&) -> Waiter& = delete;
    virtual auto Invoke(T value) -> void = 0;
  };

  template <typename Handler>
  struct ConcreteWaiter : Waiter {
    explicit ConcreteWaiter(Handler&& h) : handler(std::move(h)) {
    }
    auto Invoke(T value) -> void override {
      std::move(handler)(std::move(value));
    }
    Handler handler;
  };

  struct State {
    explicit State(asio::any_io_executor exec)
        : executor(exec), strand(asio::make_strand(exec)) {
    }

    asio::any_io_executor executor;
    // Guards value and waiters
    asio::strand<asio::any_io_executor> strand;
    std::optional<T> value;
    std::atomic<bool> ready{false};
    std::vector<std::unique_ptr<Waiter>> waiters;
  };

  std::shared_ptr<State> state_;
};

}  // namespace buildcore::utils
