#pragma once
#include <steady/core/observable.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace steady {

// Suppresses a value if eq(previous, value) holds. The first value always passes.
// State is per subscription.
template <class Eq>
struct op_distinct_until_changed {
  Eq eq;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, eq = eq](auto on_next, auto on_done){
      struct state_t {
        std::mutex m;
        std::optional<T> prev;
      };
      auto st = std::make_shared<state_t>();
      return src.subscribe(
        [st, eq, on_next](const T& v){
          {
            std::lock_guard<std::mutex> lock(st->m);
            if (st->prev && std::invoke(eq, *st->prev, v)) return;
            st->prev = v;
          }
          on_next(v);
        },
        on_done
      );
    });
  }
};

template <class Eq>
inline auto distinct_until_changed(Eq eq) { return op_distinct_until_changed<Eq>{ std::move(eq) }; }
inline auto distinct_until_changed() { return distinct_until_changed(std::equal_to<>{}); }

// Passes a value only if key(value) has never been seen on this subscription.
template <class Key>
struct op_unique_by {
  Key key;
  template <class T>
  auto operator()(const observable<T>& src) const {
    using K = std::decay_t<std::invoke_result_t<const Key&, const T&>>;
    return observable<T>::create([src, key = key](auto on_next, auto on_done){
      struct state_t {
        std::mutex m;
        std::unordered_set<K> seen;
      };
      auto st = std::make_shared<state_t>();
      return src.subscribe(
        [st, key, on_next](const T& v){
          bool fresh = false;
          {
            std::lock_guard<std::mutex> lock(st->m);
            fresh = st->seen.insert(std::invoke(key, v)).second;
          }
          if (fresh) on_next(v);
        },
        on_done
      );
    });
  }
};

template <class Key>
inline auto unique_by(Key key) { return op_unique_by<Key>{ std::move(key) }; }

} // namespace steady
