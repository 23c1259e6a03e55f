#pragma once
#include <steady/core/observable.hpp>
#include <steady/core/subscription.hpp>

#include <functional>
#include <initializer_list>
#include <type_traits>
#include <utility>
#include <vector>

namespace steady {

// Completes immediately without values.
template <class T>
inline observable<T> empty() {
  return observable<T>::create([](auto, auto on_done){
    if (on_done) on_done();
    return subscription{};
  });
}

// Never emits, never completes.
template <class T>
inline observable<T> never() {
  return observable<T>::create([](auto, auto){ return subscription{}; });
}

// One value, then completion. Synchronous.
template <class T>
inline observable<T> just(T value) {
  return observable<T>::create([value = std::move(value)](auto on_next, auto on_done){
    if (on_next) on_next(value);
    if (on_done) on_done();
    return subscription{};
  });
}

// Every element in order, then completion. Synchronous.
template <class T>
inline observable<T> from_values(std::vector<T> values) {
  return observable<T>::create([values = std::move(values)](auto on_next, auto on_done){
    for (const auto& v : values) if (on_next) on_next(v);
    if (on_done) on_done();
    return subscription{};
  });
}

template <class T>
inline observable<T> from_values(std::initializer_list<T> values) {
  return from_values(std::vector<T>(values));
}

// factory() runs on every subscribe(); its observable is subscribed in turn.
template <class F>
inline auto defer(F factory) {
  using O = std::decay_t<std::invoke_result_t<const F&>>;
  using T = typename O::value_type;
  return observable<T>::create([factory = std::move(factory)](auto on_next, auto on_done){
    O inner = std::invoke(factory);
    return inner.subscribe(std::move(on_next), std::move(on_done));
  });
}

} // namespace steady
