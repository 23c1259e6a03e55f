#pragma once
#include <steady/core/observable.hpp>
#include <steady/core/pipeline.hpp>
#include <steady/core/result.hpp>
#include <steady/core/scheduler.hpp>
#include <steady/core/sources.hpp>
#include <steady/core/subject.hpp>
#include <steady/core/subscription.hpp>
#include <steady/ops/combine_latest.hpp>
#include <steady/ops/distinct.hpp>
#include <steady/ops/filter.hpp>
#include <steady/ops/map.hpp>
#include <steady/ops/observe_on.hpp>
#include <steady/ops/pairwise.hpp>
#include <steady/ops/scan.hpp>
#include <steady/ops/seed_first.hpp>
#include <steady/ops/start_with.hpp>
#include <steady/ops/switch_map.hpp>
#include <steady/ops/take.hpp>
#include <steady/ops/zip.hpp>
#include <steady/property/distributor.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

namespace steady {

template <class T> class property;

template <class P>
inline constexpr bool is_property_v = false;
template <class T>
inline constexpr bool is_property_v<property<T>> = true;

// property<T>: an observable value that always has a current value.
//
// - value() is available synchronously at any time after construction.
// - values_with_current() replays the current value to each new observer
//   before subscribe() returns, then forwards later values.
// - values_without_current() forwards later values only.
// - However many observers attach, the producer is subscribed exactly once,
//   eagerly, when the property is constructed.
//
// A property is a cheap, copyable, read-only handle. The producer
// subscription stays alive while any handle or any observer subscription
// exists, and is cancelled when the last of them goes away.
template <class T>
class property {
public:
  using value_type = T;

  // `initial`, then whatever `then` sends. `then` is subscribed immediately,
  // so if it emits synchronously value() is already its last value when the
  // constructor returns.
  property(T initial, observable<T> then)
    : core_(distributor<T>::connect(then | start_with(std::move(initial)))) {}

  // A constant: `value`, then completion.
  explicit property(T value)
    : property(std::move(value), empty<T>()) {}

  // Mirrors a stateful subject. The property keeps the subject alive.
  explicit property(const std::shared_ptr<current_value_subject<T>>& subject)
    : core_(distributor<T>::connect(subject->as_observable())) {}

  // Wraps a producer that emits at least once synchronously on subscribe().
  // Aborts (contract violation) if it does not.
  static property adopt(const observable<T>& producer) {
    return property(distributor<T>::connect(producer));
  }

  T value() const { return core_->current(); }

  observable<T> values_with_current() const {
    auto core = core_;
    return observable<T>::create([core](auto on_next, auto on_done){
      return core->attach(std::move(on_next), std::move(on_done), true);
    });
  }

  observable<T> values_without_current() const {
    auto core = core_;
    return observable<T>::create([core](auto on_next, auto on_done){
      return core->attach(std::move(on_next), std::move(on_done), false);
    });
  }

  // ---- lift framework -----------------------------------------------------

  // Applies op to values_with_current(). op must produce an output for the
  // current value it is guaranteed to receive first (map, combine_latest,
  // zip do; filter, skip, take may not - use lift_from_current for those).
  template <class Op>
  auto lift(Op op) const {
    using O = std::decay_t<std::invoke_result_t<Op&, observable<T>>>;
    using U = typename O::value_type;
    return property<U>::adopt(std::invoke(op, values_with_current()));
  }

  // The derived current value is seed(current value); op handles every later
  // value. Both come from one values_with_current() subscription, so a value
  // sent by another thread while deriving is never lost.
  template <class Seed, class Op>
  auto lift_from_current(Seed seed, Op op) const {
    auto src = values_with_current() | steady::seed_first(std::move(seed), std::move(op));
    return property<typename decltype(src)::value_type>::adopt(src);
  }

  // Starts with `initial`; op handles the values after the current one.
  template <class U, class Op>
  property<U> lift(U initial, Op op) const {
    return lift_from_current([initial = std::move(initial)](const T&){ return initial; }, std::move(op));
  }

  // Combines this and other through a binary stream operator.
  template <class U, class Op>
  auto lift_with(const property<U>& other, Op op) const {
    using O = std::decay_t<std::invoke_result_t<Op&, observable<T>, observable<U>>>;
    using R = typename O::value_type;
    return property<R>::adopt(std::invoke(op, values_with_current(), other.values_with_current()));
  }

  // Applies a transform that may throw to every value; each attempt becomes
  // a result<U>, so one failure never ends the property.
  template <class F>
  auto catching_lift(F f) const {
    using U = std::decay_t<std::invoke_result_t<const F&, const T&>>;
    return lift(steady::map([f = std::move(f)](const T& v){
      return result<U>::capture([&]{ return std::invoke(f, v); });
    }));
  }

  // ---- operators ------------------------------------------------------------

  template <class F>
  auto map(F f) const { return lift(steady::map(std::move(f))); }

  template <class V>
  property<V> map_to(V v) const {
    return lift(steady::map([v = std::move(v)](const T&){ return v; }));
  }

  // Several projections at once (typically pointers to members) as a tuple.
  template <class... Fs>
  auto project(Fs... fs) const {
    return lift(steady::map([fs...](const T& v){
      return std::make_tuple(std::invoke(fs, v)...);
    }));
  }

  // Switch-latest: follows the property returned for the newest value.
  template <class F>
    requires is_property_v<std::decay_t<std::invoke_result_t<const F&, const T&>>>
  auto flat_map(F f) const {
    return lift(steady::switch_map([f = std::move(f)](const T& v){
      return std::invoke(f, v).values_with_current();
    }));
  }

  // The current value is kept if pred accepts it, otherwise `fallback`.
  template <class Pred>
  property filter(T fallback, Pred pred) const {
    auto seed = [pred, fallback = std::move(fallback)](const T& v) -> T {
      return std::invoke(pred, v) ? v : fallback;
    };
    return lift_from_current(std::move(seed), steady::filter(std::move(pred)));
  }

  // f returns std::optional<U>; the current value is f(current) if engaged,
  // otherwise `fallback`.
  template <class U, class F>
  property<U> compact_map(U fallback, F f) const {
    auto seed = [f, fallback = std::move(fallback)](const T& v) -> U {
      auto first = std::invoke(f, v);
      return first ? U(std::move(*first)) : fallback;
    };
    return lift_from_current(std::move(seed), steady::compact_map(std::move(f)));
  }

  // The current value counts as the first element: it survives only for n == 0.
  property drop(std::size_t n, T fallback) const {
    if (n == 0) return lift_from_current(std::identity{}, steady::skip(0));
    return lift(std::move(fallback), steady::skip(n - 1));
  }

  // At most n values in total, the current one included.
  property prefix(std::size_t n, T fallback) const {
    if (n == 0) return lift(std::move(fallback), steady::take(0));
    return lift_from_current(std::identity{}, steady::take(n - 1));
  }

  template <class Acc, class F>
  property<Acc> scan(Acc initial, F f) const {
    return lift(initial, steady::scan(initial, std::move(f)));
  }

  // Current value stays synchronous; later values arrive through ex.
  // ex must outlive the property.
  property receive_on(executor& ex) const {
    return lift_from_current(std::identity{}, steady::observe_on(ex));
  }

  property receive_on(std::shared_ptr<executor> ex) const {
    return lift_from_current(std::identity{}, steady::observe_on(std::move(ex)));
  }

  template <class Eq = std::equal_to<>>
  property remove_duplicates(Eq eq = {}) const {
    return lift(steady::distinct_until_changed(std::move(eq)));
  }

  template <class Key = std::identity>
  property unique_values(Key key = {}) const {
    return lift(steady::unique_by(std::move(key)));
  }

  // {previous, current}; the current value is paired with first_previous.
  property<std::pair<T, T>> combine_previous(T first_previous) const {
    return lift(steady::pairwise(std::move(first_previous)));
  }

  template <class U>
  property<std::pair<T, U>> combine_latest(const property<U>& other) const {
    return lift_with(other, [](const observable<T>& a, const observable<U>& b){
      return steady::combine_latest(a, b, [](const T& x, const U& y){ return std::pair<T, U>(x, y); });
    });
  }

  template <class U>
  property<std::pair<T, U>> zip(const property<U>& other) const {
    return lift_with(other, [](const observable<T>& a, const observable<U>& b){
      return steady::zip(a, b, [](const T& x, const U& y){ return std::pair<T, U>(x, y); });
    });
  }

  template <class F>
  auto try_map(F f) const { return catching_lift(std::move(f)); }

  // decoder.decode<U>(value) may throw.
  template <class U, class Decoder>
  property<result<U>> decode(Decoder decoder) const {
    return catching_lift([decoder = std::move(decoder)](const T& v) -> U {
      return decoder.template decode<U>(v);
    });
  }

  // encoder.encode(value) may throw.
  template <class Encoder>
  auto encode(Encoder encoder) const {
    return catching_lift([encoder = std::move(encoder)](const T& v){
      return encoder.encode(v);
    });
  }

  // ---- bool -----------------------------------------------------------------

  property<bool> negate() const requires std::same_as<T, bool> {
    return map([](bool b){ return !b; });
  }

  property<bool> logical_and(const property<bool>& other) const requires std::same_as<T, bool> {
    return combine_latest(other).map([](const std::pair<bool, bool>& p){ return p.first && p.second; });
  }

  property<bool> logical_or(const property<bool>& other) const requires std::same_as<T, bool> {
    return combine_latest(other).map([](const std::pair<bool, bool>& p){ return p.first || p.second; });
  }

private:
  explicit property(std::shared_ptr<distributor<T>> core) : core_(std::move(core)) {}

  std::shared_ptr<distributor<T>> core_;
};

} // namespace steady
