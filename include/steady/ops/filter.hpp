#pragma once
#include <steady/core/observable.hpp>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace steady {

template <class Pred>
struct op_filter {
  Pred p;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, p = p](auto on_next, auto on_done){
      return src.subscribe(
        [p, on_next](const T& v){ if (std::invoke(p, v)) on_next(v); },
        on_done
      );
    });
  }
};
template <class Pred> op_filter(Pred)->op_filter<Pred>;
template <class Pred> inline auto filter(Pred p){ return op_filter<Pred>{ std::move(p) }; }

// F: T -> std::optional<U>; empty results are dropped, engaged ones unwrapped.
template <class F>
struct op_compact_map {
  F f;
  template <class T>
  auto operator()(const observable<T>& src) const {
    using Opt = std::decay_t<std::invoke_result_t<const F&, const T&>>;
    using U = typename Opt::value_type;
    return observable<U>::create([src, f = f](auto on_next, auto on_done){
      return src.subscribe(
        [f, on_next](const T& v){
          Opt out = std::invoke(f, v);
          if (out) on_next(*out);
        },
        on_done
      );
    });
  }
};
template <class F> inline auto compact_map(F f){ return op_compact_map<F>{ std::move(f) }; }

} // namespace steady
