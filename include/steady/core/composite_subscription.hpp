#pragma once
#include <steady/core/subscription.hpp>

#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

namespace steady {

// A group of subscriptions cancelled together. Members can also be cancelled
// individually by the key add() returned (used by switch_map to swap inners).
// Once reset() has run, anything added later is cancelled immediately.
class composite_subscription {
public:
  using key = std::uint64_t;
  static constexpr key no_key = 0;

  composite_subscription() = default;

  key add(subscription s) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!cancelled_) {
        key k = next_key_++;
        subs_.emplace_back(k, std::move(s));
        return k;
      }
    }
    s.reset();
    return no_key;
  }

  // Cancels one member. Unknown or already removed keys are ignored.
  void remove(key k) {
    subscription victim;
    {
      std::lock_guard<std::mutex> lock(m_);
      for (auto it = subs_.begin(); it != subs_.end(); ++it) {
        if (it->first == k) {
          victim = std::move(it->second);
          subs_.erase(it);
          break;
        }
      }
    }
    // cancel outside the lock: the cancel function may call back into us
    victim.reset();
  }

  void reset() {
    std::vector<std::pair<key, subscription>> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (cancelled_) return;
      cancelled_ = true;
      local.swap(subs_);
    }
    for (auto& entry : local) entry.second.reset();
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> lock(m_);
    return cancelled_;
  }

  ~composite_subscription() { reset(); }

  composite_subscription(const composite_subscription&)            = delete;
  composite_subscription& operator=(const composite_subscription&) = delete;

private:
  mutable std::mutex m_;
  bool cancelled_{false};
  key next_key_{1};
  std::vector<std::pair<key, subscription>> subs_;
};

} // namespace steady
