#pragma once
#include <steady/core/log.hpp>

#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace steady {

// RAII handle for one registration with a source.
// - Move-only: exactly one owner may cancel.
// - Destruction cancels; release() hands the responsibility to someone else.
// - Whatever the cancel function captured is destroyed on reset(), which is
//   how retained state (cores, inner subscriptions) gets released.
class subscription {
public:
  using cancel_fn = std::function<void()>;

  subscription() noexcept = default;

  explicit subscription(cancel_fn fn) noexcept
    : cancel_(std::move(fn)) {}

  subscription(const subscription&) = delete;
  subscription& operator=(const subscription&) = delete;

  subscription(subscription&& other) noexcept
    : cancel_(std::exchange(other.cancel_, nullptr)) {}

  subscription& operator=(subscription&& other) noexcept {
    if (this != &other) {
      reset();
      cancel_ = std::exchange(other.cancel_, nullptr);
    }
    return *this;
  }

  ~subscription() { reset(); }

  // Cancels once; later calls are no-ops.
  void reset() noexcept {
    if (!cancel_) return;
    // Move out first so a re-entrant reset() from inside the cancel function
    // sees an empty handle.
    cancel_fn fn = std::exchange(cancel_, nullptr);
    try {
      fn();
    } catch (const std::exception& e) {
      log::logger().warn("subscription cancel threw: {}", e.what());
    } catch (...) {
      log::logger().warn("subscription cancel threw a non-std exception");
    }
  }

  // Forget the cancel function without running it.
  void release() noexcept { cancel_ = nullptr; }

  explicit operator bool() const noexcept { return static_cast<bool>(cancel_); }

  void swap(subscription& other) noexcept {
    using std::swap;
    swap(cancel_, other.cancel_);
  }

private:
  cancel_fn cancel_{};
};

template <class F,
          std::enable_if_t<std::is_invocable_v<F&>, int> = 0>
inline subscription make_subscription(F&& f) {
  return subscription(subscription::cancel_fn(std::forward<F>(f)));
}

} // namespace steady
