#pragma once
#include <steady/core/composite_subscription.hpp>
#include <steady/core/log.hpp>
#include <steady/core/observable.hpp>
#include <steady/core/subscription.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace steady {

// switch_map: for each outer value builds an inner observable<U>, cancels the
// previous inner and forwards only the newest one.
// Completes when the outer has completed and the active inner has completed.
// Outer deliveries are expected to be serialized; inner events may arrive on
// any thread and are dropped once their inner has been replaced.
template <class F>
struct op_switch_map {
  F f; // F: T -> observable<U>

  template <class T>
  auto operator()(const observable<T>& src) const {
    using InnerObs = std::decay_t<std::invoke_result_t<const F&, const T&>>;
    using U = typename InnerObs::value_type;

    return observable<U>::create([src, f = f](auto on_next, auto on_done) {
      struct state_t {
        std::mutex m;
        std::uint64_t generation{0};
        composite_subscription::key inner_key{composite_subscription::no_key};
        bool outer_done{false};
        bool inner_done{true}; // nothing to wait for before the first inner
        bool finished{false};
        composite_subscription subs;
      };
      auto st = std::make_shared<state_t>();
      std::weak_ptr<state_t> wst = st;

      // true if this call is the one that completes the downstream
      auto claim_finish = [](state_t& s) {
        if (s.finished || !s.outer_done || !s.inner_done) return false;
        s.finished = true;
        return true;
      };

      auto outer = src.subscribe(
        [wst, f, on_next, on_done, claim_finish](const T& v) {
          auto s = wst.lock();
          if (!s) return;

          std::uint64_t gen = 0;
          composite_subscription::key previous = composite_subscription::no_key;
          {
            std::lock_guard<std::mutex> lock(s->m);
            if (s->finished) return;
            gen = ++s->generation;
            s->inner_done = false;
            previous = std::exchange(s->inner_key, composite_subscription::no_key);
          }
          // Cancel the old inner first, then build the new one.
          s->subs.remove(previous);
          log::logger().trace("switch_map: switching to inner #{}", gen);

          InnerObs inner = std::invoke(f, v);
          auto sub = inner.subscribe(
            [wst, gen, on_next](const U& u) {
              auto s2 = wst.lock();
              if (!s2) return;
              {
                std::lock_guard<std::mutex> lock(s2->m);
                if (s2->finished || s2->generation != gen) return;
              }
              if (on_next) on_next(u);
            },
            [wst, gen, on_done, claim_finish] {
              auto s2 = wst.lock();
              if (!s2) return;
              bool fire = false;
              {
                std::lock_guard<std::mutex> lock(s2->m);
                if (s2->generation != gen) return;
                s2->inner_done = true;
                fire = claim_finish(*s2);
              }
              if (fire) {
                if (on_done) on_done();
                s2->subs.reset();
              }
            });

          bool keep = false;
          {
            std::lock_guard<std::mutex> lock(s->m);
            keep = !s->finished && s->generation == gen;
          }
          if (!keep) return; // sub goes out of scope and cancels
          auto key = s->subs.add(std::move(sub));
          std::lock_guard<std::mutex> lock(s->m);
          if (s->generation == gen) s->inner_key = key;
        },
        [wst, on_done, claim_finish] {
          auto s = wst.lock();
          if (!s) return;
          bool fire = false;
          {
            std::lock_guard<std::mutex> lock(s->m);
            s->outer_done = true;
            fire = claim_finish(*s);
          }
          if (fire) {
            if (on_done) on_done();
            s->subs.reset();
          }
        });

      st->subs.add(std::move(outer));
      // The returned subscription is the only owner of the state: cancelling
      // it releases the outer, the active inner and everything they captured.
      return subscription([st] {
        {
          std::lock_guard<std::mutex> lock(st->m);
          st->finished = true;
        }
        st->subs.reset();
      });
    });
  }
};

template <class F>
inline auto switch_map(F f) {
  return op_switch_map<F>{ std::move(f) };
}

} // namespace steady
