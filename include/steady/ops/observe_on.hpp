#pragma once
#include <steady/core/observable.hpp>
#include <steady/core/scheduler.hpp>
#include <steady/core/subscription.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace steady {

namespace detail {

// One FIFO per subscription. At most one drain task is queued on the
// executor at a time and it reposts itself while items remain, so a
// multi-threaded executor still delivers in upstream order.
// nullopt in the queue marks completion.
template <class T, class ExPtr>
struct observe_on_state : std::enable_shared_from_this<observe_on_state<T, ExPtr>> {
  using OnNext = typename observable<T>::OnNext;
  using OnDone = typename observable<T>::OnDone;

  observe_on_state(ExPtr e, OnNext n, OnDone d)
    : ex(std::move(e)), on_next(std::move(n)), on_done(std::move(d)) {}

  void enqueue(std::optional<T> item) {
    {
      std::lock_guard<std::mutex> lock(m);
      if (!alive.load(std::memory_order_acquire)) return;
      q.push_back(std::move(item));
      if (scheduled) return;
      scheduled = true;
    }
    schedule();
  }

  void schedule() {
    ex->post([self = this->shared_from_this()]{ self->run_one(); });
  }

  // Delivers one item, then hands the executor back before the next one.
  void run_one() {
    std::optional<T> item;
    {
      std::lock_guard<std::mutex> lock(m);
      if (q.empty() || !alive.load(std::memory_order_acquire)) {
        q.clear();
        scheduled = false;
        return;
      }
      item = std::move(q.front());
      q.pop_front();
    }

    if (alive.load(std::memory_order_acquire)) {
      if (item) {
        if (on_next) on_next(*item);
      } else if (on_done) {
        on_done();
      }
    }

    {
      std::lock_guard<std::mutex> lock(m);
      if (q.empty() || !alive.load(std::memory_order_acquire)) {
        q.clear();
        scheduled = false;
        return;
      }
    }
    schedule();
  }

  ExPtr ex;
  OnNext on_next;
  OnDone on_done;
  std::atomic<bool> alive{true};
  std::mutex m;
  std::deque<std::optional<T>> q;
  bool scheduled{false};
};

// ExPtr is executor* (caller keeps the executor alive) or
// std::shared_ptr<executor> (the subscription keeps it alive).
// Items still queued after cancellation are dropped.
template <class T, class ExPtr>
observable<T> observe_on_impl(const observable<T>& src, ExPtr ex) {
  return observable<T>::create([src, ex](auto on_next, auto on_done) {
    auto st = std::make_shared<observe_on_state<T, ExPtr>>(ex, std::move(on_next), std::move(on_done));

    auto up = src.subscribe(
      [st](const T& v){ st->enqueue(std::optional<T>(v)); },
      [st]{ st->enqueue(std::nullopt); }
    );

    auto up_ptr = std::make_shared<subscription>(std::move(up));
    return subscription([st, up_ptr]{
      st->alive.store(false, std::memory_order_release);
      up_ptr->reset();
    });
  });
}

} // namespace detail

// IMPORTANT: ex must outlive the subscription.
struct op_observe_on {
  executor* ex;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return detail::observe_on_impl(src, ex);
  }
};

struct op_observe_on_sp {
  std::shared_ptr<executor> ex;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return detail::observe_on_impl(src, ex);
  }
};

inline auto observe_on(executor& ex){ return op_observe_on{ &ex }; }
inline auto observe_on(std::shared_ptr<executor> ex){ return op_observe_on_sp{ std::move(ex) }; }

} // namespace steady
