#pragma once
#include <steady/core/observable.hpp>
#include <steady/core/subscription.hpp>
#include <steady/core/composite_subscription.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace steady {

// zip(oa, ob, f): queues values from A and B; every time both queues are
// non-empty, pops one from each and emits f(a, b).
// Completes once one side has completed and its queue is drained.
// Pushes and the emissions they cause are serialized across both sources.
template <class A, class B, class F>
auto zip(const observable<A>& oa, const observable<B>& ob, F f) {
  using R = std::decay_t<std::invoke_result_t<F&, const A&, const B&>>;
  return observable<R>::create([oa, ob, f = std::move(f)](auto on_next, auto on_done){
    struct state_t {
      std::recursive_mutex emit_m; // held from state update through on_next
      std::mutex m;
      std::deque<A> qa;
      std::deque<B> qb;
      bool doneA{false};
      bool doneB{false};
      bool finished{false};
    };
    auto st = std::make_shared<state_t>();
    auto comp = std::make_shared<composite_subscription>();

    auto drain = [st, on_next, on_done, comp, f]() mutable {
      for (;;) {
        std::optional<R> out;
        bool finish = false;
        {
          std::lock_guard<std::mutex> lock(st->m);
          if (st->finished) return;
          if (!st->qa.empty() && !st->qb.empty()) {
            A a = std::move(st->qa.front()); st->qa.pop_front();
            B b = std::move(st->qb.front()); st->qb.pop_front();
            out.emplace(std::invoke(f, a, b));
          } else if ((st->doneA && st->qa.empty()) || (st->doneB && st->qb.empty())) {
            // no further pair can ever be formed
            st->finished = true;
            finish = true;
          }
        }
        if (out) {
          if (on_next) on_next(*out);
          continue;
        }
        if (finish) {
          if (on_done) on_done();
          comp->reset();
        }
        return;
      }
    };

    comp->add(oa.subscribe(
      [st, drain](const A& a) mutable {
        std::lock_guard<std::recursive_mutex> serial(st->emit_m);
        { std::lock_guard<std::mutex> lock(st->m); st->qa.push_back(a); }
        drain();
      },
      [st, drain]() mutable {
        std::lock_guard<std::recursive_mutex> serial(st->emit_m);
        { std::lock_guard<std::mutex> lock(st->m); st->doneA = true; }
        drain();
      }
    ));

    comp->add(ob.subscribe(
      [st, drain](const B& b) mutable {
        std::lock_guard<std::recursive_mutex> serial(st->emit_m);
        { std::lock_guard<std::mutex> lock(st->m); st->qb.push_back(b); }
        drain();
      },
      [st, drain]() mutable {
        std::lock_guard<std::recursive_mutex> serial(st->emit_m);
        { std::lock_guard<std::mutex> lock(st->m); st->doneB = true; }
        drain();
      }
    ));

    return subscription([comp]{ comp->reset(); });
  });
}

} // namespace steady
