// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_SUBSCRIPTION_H_
#define SNAPREEL_CORE_SUBSCRIPTION_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace snapreel {
namespace internal {

/// Move-only handle for a channel subscription. The handler is removed when
/// the handle is destroyed or Unsubscribe() is called. Outliving the channel
/// is allowed.
class Subscription {
 public:
  Subscription() = default;
  explicit Subscription(std::function<void()> unsubscribe)
      : unsubscribe_(std::move(unsubscribe)) {}
  ~Subscription() { Unsubscribe(); }

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  Subscription(Subscription&& other) noexcept
      : unsubscribe_(std::move(other.unsubscribe_)) {
    other.unsubscribe_ = nullptr;
  }

  Subscription& operator=(Subscription&& other) noexcept {
    if (this != &other) {
      Unsubscribe();
      unsubscribe_ = std::move(other.unsubscribe_);
      other.unsubscribe_ = nullptr;
    }
    return *this;
  }

  void Unsubscribe() {
    if (unsubscribe_) {
      auto fn = std::move(unsubscribe_);
      unsubscribe_ = nullptr;
      fn();
    }
  }

  bool active() const { return static_cast<bool>(unsubscribe_); }

 private:
  std::function<void()> unsubscribe_;
};

/// Typed multi-subscriber event channel.
///
/// Emit() may be called from any thread; handlers run on the emitting thread,
/// outside the channel lock, in subscription order.
template <typename... Args>
class EventChannel {
 public:
  using Handler = std::function<void(const Args&...)>;

  EventChannel() : state_(std::make_shared<State>()) {}

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  Subscription Subscribe(Handler handler) {
    uint64_t id = 0;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      id = state_->next_id++;
      state_->handlers.emplace(id, std::move(handler));
    }
    std::weak_ptr<State> weak = state_;
    return Subscription([weak, id]() {
      if (auto state = weak.lock()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->handlers.erase(id);
      }
    });
  }

  void Emit(const Args&... args) const {
    std::vector<Handler> snapshot;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      snapshot.reserve(state_->handlers.size());
      for (const auto& kv : state_->handlers) snapshot.push_back(kv.second);
    }
    for (const auto& handler : snapshot) handler(args...);
  }

  size_t subscriber_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->handlers.size();
  }

 private:
  struct State {
    std::mutex mutex;
    std::map<uint64_t, Handler> handlers;
    uint64_t next_id = 1;
  };

  std::shared_ptr<State> state_;
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_SUBSCRIPTION_H_
