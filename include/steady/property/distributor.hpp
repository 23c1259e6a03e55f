#pragma once
#include <steady/core/contract.hpp>
#include <steady/core/log.hpp>
#include <steady/core/observable.hpp>
#include <steady/core/subject.hpp>
#include <steady/core/subscription.hpp>
#include <steady/property/value_cell.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

namespace steady {

// The hidden half of a property: one eager subscription to the producer,
// the current-value cell it feeds, and the observers it fans out to.
//
// Ownership: property handles and observer subscriptions hold shared_ptrs;
// the producer's callbacks only hold a weak_ptr. When the last owner goes
// away the destructor cancels the producer subscription.
//
// Deliveries (and current-value replays) are serialized by emit_m_, so all
// observers see one total order; it is recursive to allow synchronous
// re-entrant emissions from inside an observer callback.
template <class T>
class distributor : public std::enable_shared_from_this<distributor<T>> {
  struct private_tag {};

public:
  using OnNext = typename observable<T>::OnNext;
  using OnDone = typename observable<T>::OnDone;

  explicit distributor(private_tag) {}
  distributor(const distributor&) = delete;
  distributor& operator=(const distributor&) = delete;

  ~distributor() {
    upstream_.reset();
    log::logger().debug("distributor released");
  }

  // Subscribes to producer immediately. The producer must emit at least one
  // value before subscribe() returns; anything else is a contract violation.
  static std::shared_ptr<distributor> connect(const observable<T>& producer) {
    auto d = std::make_shared<distributor>(private_tag{});
    std::weak_ptr<distributor> wd = d;

    subscription up = producer.subscribe(
      [wd](const T& v){ if (auto self = wd.lock()) self->deliver(v); },
      [wd]{ if (auto self = wd.lock()) self->complete(); }
    );

    if (!d->cell_.has_value()) {
      contract_violation("producer promised a synchronous current value but sent none");
    }

    bool completed = false;
    {
      std::lock_guard<std::mutex> lock(d->m_);
      completed = d->slots_.completed;
      if (!completed) d->upstream_ = std::move(up);
    }
    // completed during subscribe(): nothing left to keep alive
    if (completed) up.reset();

    log::logger().debug("distributor connected (completed: {})", completed);
    return d;
  }

  T current() const { return cell_.read(); }

  bool completed() const {
    std::lock_guard<std::mutex> lock(m_);
    return slots_.completed;
  }

  std::size_t observer_count() const {
    std::lock_guard<std::mutex> lock(m_);
    return slots_.slots.size();
  }

  // Registers an observer. With replay_current the current value is
  // delivered synchronously before attach() returns. Observers attaching
  // after completion get the completion right away.
  // The returned subscription keeps this distributor alive.
  subscription attach(OnNext on_next, OnDone on_done, bool replay_current) {
    std::unique_lock<std::recursive_mutex> serial(emit_m_, std::defer_lock);
    if (replay_current) serial.lock();

    std::shared_ptr<typename detail::subject_slots<T>::slot> s;
    bool completed = false;
    {
      std::lock_guard<std::mutex> lock(m_);
      completed = slots_.completed;
      if (!completed) s = slots_.add(on_next, on_done);
    }

    if (completed) {
      if (replay_current && on_next) on_next(cell_.read());
      if (on_done) on_done();
      return subscription{};
    }

    if (replay_current && s->on_next) s->on_next(cell_.read());

    return subscription([self = this->shared_from_this(), id = s->id]{
      std::lock_guard<std::mutex> lock(self->m_);
      self->slots_.remove(id);
    });
  }

private:
  void deliver(const T& v) {
    std::lock_guard<std::recursive_mutex> serial(emit_m_);
    decltype(slots_.slots) local;
    {
      std::lock_guard<std::mutex> lock(m_);
      // a completed property keeps its last value
      if (slots_.completed) return;
      local = slots_.slots;
    }
    // cache before fan-out: an observer reading value() from its callback must see v
    cell_.write(v);
    log::logger().trace("distributor: fan-out to {} observer(s)", local.size());
    detail::subject_slots<T>::emit(local, v);
  }

  void complete() {
    std::lock_guard<std::recursive_mutex> serial(emit_m_);
    decltype(slots_.slots) local;
    subscription up;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (slots_.completed) return;
      slots_.completed = true;
      local.swap(slots_.slots);
      up = std::move(upstream_);
    }
    log::logger().debug("distributor completed, notifying {} observer(s)", local.size());
    detail::subject_slots<T>::finish(local);
    up.reset();
  }

  value_cell<T> cell_;
  std::recursive_mutex emit_m_;
  mutable std::mutex m_; // slots_ and upstream_
  detail::subject_slots<T> slots_;
  subscription upstream_;
};

} // namespace steady
