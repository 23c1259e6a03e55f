#pragma once
#include <steady/core/observable.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace steady {

// acc = f(acc, v) for every value, emitting each new acc. The seed itself
// is not emitted.
template <class Acc, class F>
struct op_scan {
  Acc seed;
  F f;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<Acc>::create([src, seed = seed, f = f](auto on_next, auto on_done){
      struct state_t {
        explicit state_t(Acc a) : acc(std::move(a)) {}
        std::mutex m;
        Acc acc;
      };
      auto st = std::make_shared<state_t>(seed);
      return src.subscribe(
        [st, f, on_next](const T& v){
          Acc out = [&]{
            std::lock_guard<std::mutex> lock(st->m);
            st->acc = std::invoke(f, st->acc, v);
            return st->acc;
          }();
          on_next(out);
        },
        on_done
      );
    });
  }
};

template <class Acc, class F>
inline auto scan(Acc seed, F f) { return op_scan<Acc, F>{ std::move(seed), std::move(f) }; }

} // namespace steady
