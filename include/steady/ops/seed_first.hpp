#pragma once
#include <steady/core/composite_subscription.hpp>
#include <steady/core/observable.hpp>
#include <steady/core/subject.hpp>
#include <steady/core/subscription.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace steady {

// seed_first(seed, rest): emits seed(first value), then rest applied to every
// later value. rest is subscribed from inside the first delivery, so when the
// first value is a replay (values_with_current), no value emitted meanwhile
// on another thread can fall between the two.
template <class Seed, class Rest>
struct op_seed_first {
  Seed seed;
  Rest rest;

  template <class T>
  auto operator()(const observable<T>& src) const {
    using O = std::decay_t<std::invoke_result_t<const Rest&, observable<T>>>;
    using U = typename O::value_type;

    return observable<U>::create([src, seed = seed, rest = rest](auto on_next, auto on_done) {
      auto later = std::make_shared<subject<T>>();
      auto subs = std::make_shared<composite_subscription>();
      auto first = std::make_shared<std::atomic<bool>>(true);
      std::weak_ptr<composite_subscription> wsubs = subs;

      subs->add(src.subscribe(
        [later, wsubs, first, seed, rest, on_next, on_done](const T& v) {
          if (!first->exchange(false, std::memory_order_acq_rel)) {
            later->on_next(v);
            return;
          }
          if (on_next) on_next(std::invoke(seed, v));
          auto tail = std::invoke(rest, later->as_observable()).subscribe(on_next, on_done);
          // cancelled meanwhile: tail goes out of scope and cancels
          if (auto s = wsubs.lock()) s->add(std::move(tail));
        },
        [later, first, on_done] {
          // no first value: rest was never subscribed
          if (first->exchange(false, std::memory_order_acq_rel)) {
            if (on_done) on_done();
            return;
          }
          later->on_completed();
        }
      ));

      return subscription([subs] { subs->reset(); });
    });
  }
};

template <class Seed, class Rest>
inline auto seed_first(Seed seed, Rest rest) {
  return op_seed_first<Seed, Rest>{ std::move(seed), std::move(rest) };
}

} // namespace steady
