#pragma once
#include <functional>
#include <utility>
#include <steady/core/subscription.hpp>

namespace steady {

// Push source of T values that cannot fail: zero or more on_next calls,
// then optionally one on_done. May emit synchronously inside subscribe().
// Cold by default: every subscribe() runs the subscribe function again.
template <class T>
class observable {
public:
  using value_type = T;
  using OnNext = std::function<void(const T&)>;
  using OnDone = std::function<void()>;
  using subscribe_fn = std::function<subscription(OnNext, OnDone)>;

  static observable create(subscribe_fn impl) {
    return observable(std::move(impl));
  }

  subscription subscribe(OnNext on_next, OnDone on_done = {}) const {
    return impl_(std::move(on_next), std::move(on_done));
  }

private:
  explicit observable(subscribe_fn impl)
    : impl_(std::move(impl)) {}

  subscribe_fn impl_;
};

template <class O>
inline constexpr bool is_observable_v = false;
template <class T>
inline constexpr bool is_observable_v<observable<T>> = true;

} // namespace steady
