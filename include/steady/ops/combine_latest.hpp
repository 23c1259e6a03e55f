#pragma once
#include <steady/core/observable.hpp>
#include <steady/core/subscription.hpp>
#include <steady/core/composite_subscription.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace steady {

// combine_latest(oa, ob, f): once both sides have a value, emits
// f(latestA, latestB) on every new value from either side.
// Completes when BOTH sources have completed.
// Sources may emit on different threads: each update and the emission it
// causes run under one lock, so pairs arrive in update order.
template <class A, class B, class F>
auto combine_latest(const observable<A>& oa, const observable<B>& ob, F f) {
  using R = std::decay_t<std::invoke_result_t<F&, const A&, const B&>>;
  return observable<R>::create([oa, ob, f = std::move(f)](auto on_next, auto on_done){
    struct state_t {
      std::recursive_mutex emit_m; // held from state update through on_next
      std::mutex m;
      std::optional<A> lastA;
      std::optional<B> lastB;
      bool doneA{false};
      bool doneB{false};
    };
    auto st = std::make_shared<state_t>();
    auto comp = std::make_shared<composite_subscription>();

    // f is copied into the callbacks: they outlive this observable object
    auto try_emit = [st, on_next, f]() mutable {
      std::optional<R> out;
      {
        std::lock_guard<std::mutex> lock(st->m);
        if (st->lastA && st->lastB) {
          out.emplace(std::invoke(f, *st->lastA, *st->lastB));
        }
      }
      if (out && on_next) on_next(*out);
    };

    auto finish = [st, comp, on_done](bool& mine){
      bool both_done = false;
      {
        std::lock_guard<std::mutex> lock(st->m);
        mine = true;
        both_done = st->doneA && st->doneB;
      }
      if (both_done) {
        if (on_done) on_done();
        comp->reset();
      }
    };

    comp->add(oa.subscribe(
      [st, try_emit](const A& a) mutable {
        std::lock_guard<std::recursive_mutex> serial(st->emit_m);
        { std::lock_guard<std::mutex> lock(st->m); st->lastA = a; }
        try_emit();
      },
      [st, finish]{
        std::lock_guard<std::recursive_mutex> serial(st->emit_m);
        finish(st->doneA);
      }
    ));

    comp->add(ob.subscribe(
      [st, try_emit](const B& b) mutable {
        std::lock_guard<std::recursive_mutex> serial(st->emit_m);
        { std::lock_guard<std::mutex> lock(st->m); st->lastB = b; }
        try_emit();
      },
      [st, finish]{
        std::lock_guard<std::recursive_mutex> serial(st->emit_m);
        finish(st->doneB);
      }
    ));

    return subscription([comp]{ comp->reset(); });
  });
}

} // namespace steady
