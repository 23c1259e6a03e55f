#pragma once
#include <steady/core/observable.hpp>
#include <steady/core/subscription.hpp>
#include <steady/core/composite_subscription.hpp>
#include <atomic>
#include <cstddef>
#include <memory>

namespace steady {

// First n values, then completion and cancellation of the upstream.
struct op_take {
  std::size_t n;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, n = n](auto on_next, auto on_done){
      if (n == 0) {
        if (on_done) on_done();
        return subscription{};
      }
      auto left = std::make_shared<std::atomic<std::size_t>>(n);
      auto finished = std::make_shared<std::atomic<bool>>(false);
      auto composite = std::make_shared<composite_subscription>();

      subscription sub = src.subscribe(
        [left, finished, on_next, on_done, composite](const T& v){
          // fetch_sub on 0 would wrap; synchronous sources may keep emitting
          // after we cancelled them
          std::size_t rem = left->load(std::memory_order_acquire);
          do {
            if (rem == 0) return;
          } while (!left->compare_exchange_weak(rem, rem - 1, std::memory_order_acq_rel));
          on_next(v);
          if (rem == 1 && !finished->exchange(true)) {
            if (on_done) on_done();
            composite->reset();
          }
        },
        [finished, on_done]{
          if (!finished->exchange(true) && on_done) on_done();
        }
      );

      // if we already finished during subscribe(), add() cancels right away
      composite->add(std::move(sub));
      return subscription([composite]{ composite->reset(); });
    });
  }
};

inline auto take(std::size_t n){ return op_take{n}; }

// Drops the first n values, forwards the rest.
struct op_skip {
  std::size_t n;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, n = n](auto on_next, auto on_done){
      auto left = std::make_shared<std::atomic<std::size_t>>(n);
      return src.subscribe(
        [left, on_next](const T& v){
          std::size_t rem = left->load(std::memory_order_acquire);
          while (rem > 0) {
            if (left->compare_exchange_weak(rem, rem - 1, std::memory_order_acq_rel)) return;
          }
          on_next(v);
        },
        on_done
      );
    });
  }
};

inline auto skip(std::size_t n){ return op_skip{n}; }

} // namespace steady
