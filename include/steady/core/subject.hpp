#pragma once
#include <steady/core/observable.hpp>
#include <steady/core/subscription.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace steady {

namespace detail {

// Registration list shared by both subject kinds. Callers hold their own lock.
template <class T>
struct subject_slots {
  using OnNext = typename observable<T>::OnNext;
  using OnDone = typename observable<T>::OnDone;

  struct slot {
    std::uint64_t id;
    OnNext on_next;
    OnDone on_done;
    std::atomic<bool> active{true};
    slot(std::uint64_t i, OnNext n, OnDone d)
      : id(i), on_next(std::move(n)), on_done(std::move(d)) {}
  };

  std::vector<std::shared_ptr<slot>> slots;
  std::uint64_t next_id{1};
  bool completed{false};

  std::shared_ptr<slot> add(OnNext on_next, OnDone on_done) {
    auto s = std::make_shared<slot>(next_id++, std::move(on_next), std::move(on_done));
    slots.push_back(s);
    return s;
  }

  void remove(std::uint64_t id) {
    for (auto it = slots.begin(); it != slots.end(); ++it) {
      if ((*it)->id == id) {
        (*it)->active.store(false, std::memory_order_release);
        slots.erase(it);
        return;
      }
    }
  }

  static void emit(const std::vector<std::shared_ptr<slot>>& local, const T& v) {
    for (auto& s : local) {
      if (s->active.load(std::memory_order_acquire) && s->on_next) s->on_next(v);
    }
  }

  static void finish(const std::vector<std::shared_ptr<slot>>& local) {
    for (auto& s : local) {
      if (s->active.exchange(false, std::memory_order_acq_rel) && s->on_done) s->on_done();
    }
  }
};

} // namespace detail

// subject<T>: hot passthrough source. Must be owned by a std::shared_ptr:
// every subscription made through as_observable() keeps the subject alive
// until it is cancelled.
// Thread-safe; values are fanned out to the observers registered at send time.
template <class T>
class subject : public std::enable_shared_from_this<subject<T>> {
public:
  using OnNext = typename observable<T>::OnNext;
  using OnDone = typename observable<T>::OnDone;

  subject() = default;
  subject(const subject&) = delete;
  subject& operator=(const subject&) = delete;

  observable<T> as_observable() {
    auto self = this->shared_from_this();
    return observable<T>::create([self](OnNext on_next, OnDone on_done) {
      std::uint64_t id = 0;
      {
        std::lock_guard<std::mutex> lock(self->m_);
        if (self->slots_.completed) {
          if (on_done) on_done();
          return subscription{};
        }
        id = self->slots_.add(std::move(on_next), std::move(on_done))->id;
      }
      return subscription([self, id]{
        std::lock_guard<std::mutex> lock(self->m_);
        self->slots_.remove(id);
      });
    });
  }

  void on_next(const T& v) {
    decltype(slots_.slots) local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (slots_.completed) return;
      local = slots_.slots;
    }
    detail::subject_slots<T>::emit(local, v);
  }

  void on_completed() {
    decltype(slots_.slots) local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (slots_.completed) return;
      slots_.completed = true;
      local.swap(slots_.slots);
    }
    detail::subject_slots<T>::finish(local);
  }

  std::size_t observer_count() const {
    std::lock_guard<std::mutex> lock(m_);
    return slots_.slots.size();
  }

private:
  mutable std::mutex m_;
  detail::subject_slots<T> slots_;
};

// current_value_subject<T>: stateful source. A new observer receives the
// current value synchronously inside subscribe(), then every later value.
// Sends and current-value replays are serialized, so no observer can see a
// newer value before its replay.
template <class T>
class current_value_subject : public std::enable_shared_from_this<current_value_subject<T>> {
public:
  using OnNext = typename observable<T>::OnNext;
  using OnDone = typename observable<T>::OnDone;

  explicit current_value_subject(T initial) : value_(std::move(initial)) {}
  current_value_subject(const current_value_subject&) = delete;
  current_value_subject& operator=(const current_value_subject&) = delete;

  T value() const {
    std::lock_guard<std::mutex> lock(m_);
    return value_;
  }

  observable<T> as_observable() {
    auto self = this->shared_from_this();
    return observable<T>::create([self](OnNext on_next, OnDone on_done) {
      std::lock_guard<std::recursive_mutex> serial(self->emit_m_);
      std::shared_ptr<typename detail::subject_slots<T>::slot> s;
      std::optional<T> current;
      bool completed = false;
      {
        std::lock_guard<std::mutex> lock(self->m_);
        current = self->value_;
        completed = self->slots_.completed;
        if (!completed) s = self->slots_.add(std::move(on_next), std::move(on_done));
      }
      if (completed) {
        if (on_next) on_next(*current);
        if (on_done) on_done();
        return subscription{};
      }
      if (s->on_next) s->on_next(*current);
      return subscription([self, id = s->id]{
        std::lock_guard<std::mutex> lock(self->m_);
        self->slots_.remove(id);
      });
    });
  }

  void send(const T& v) {
    std::lock_guard<std::recursive_mutex> serial(emit_m_);
    decltype(slots_.slots) local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (slots_.completed) return;
      value_ = v;
      local = slots_.slots;
    }
    detail::subject_slots<T>::emit(local, v);
  }

  void on_completed() {
    std::lock_guard<std::recursive_mutex> serial(emit_m_);
    decltype(slots_.slots) local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (slots_.completed) return;
      slots_.completed = true;
      local.swap(slots_.slots);
    }
    detail::subject_slots<T>::finish(local);
  }

private:
  mutable std::mutex m_;
  std::recursive_mutex emit_m_;
  T value_;
  detail::subject_slots<T> slots_;
};

} // namespace steady
