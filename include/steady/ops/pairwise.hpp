#pragma once
#include <steady/core/observable.hpp>
#include <memory>
#include <mutex>
#include <utility>

namespace steady {

// Emits {previous, current} for every value; the first value is paired
// with first_previous.
template <class V>
struct op_pairwise {
  V first_previous;
  template <class T>
  auto operator()(const observable<T>& src) const {
    using P = std::pair<T, T>;
    return observable<P>::create([src, first = first_previous](auto on_next, auto on_done){
      struct state_t {
        explicit state_t(T p) : prev(std::move(p)) {}
        std::mutex m;
        T prev;
      };
      auto st = std::make_shared<state_t>(T(first));
      return src.subscribe(
        [st, on_next](const T& v){
          P out = [&]{
            std::lock_guard<std::mutex> lock(st->m);
            P p{ st->prev, v };
            st->prev = v;
            return p;
          }();
          on_next(out);
        },
        on_done
      );
    });
  }
};

template <class V>
inline auto pairwise(V first_previous) { return op_pairwise<V>{ std::move(first_previous) }; }

} // namespace steady
