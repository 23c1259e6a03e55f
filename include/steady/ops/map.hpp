#pragma once
#include <steady/core/observable.hpp>
#include <functional>
#include <type_traits>
#include <utility>

namespace steady {

// F may be any invocable, including a pointer to member.
template <class F>
struct op_map {
  F f;
  template <class T>
  auto operator()(const observable<T>& src) const {
    using U = std::decay_t<std::invoke_result_t<const F&, const T&>>;
    return observable<U>::create([src, f = f](auto on_next, auto on_done){
      return src.subscribe(
        [f, on_next](const T& v){ on_next(std::invoke(f, v)); },
        on_done
      );
    });
  }
};
template <class F> op_map(F)->op_map<F>;
template <class F> inline auto map(F f){ return op_map<F>{ std::move(f) }; }

} // namespace steady
