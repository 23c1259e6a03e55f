#pragma once

#include <QObject>
#include <QCoreApplication>
#include <QPointer>
#include <QMetaObject>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include <steady/core/scheduler.hpp>
#include <steady/core/observable.hpp>
#include <steady/core/subscription.hpp>
#include <steady/core/pipeline.hpp>
#include <steady/property/property.hpp>

namespace steady {
namespace qt {

// ====================================================================================
// 1) qt_executor - runs tasks on the target QObject's thread via its event loop
// ====================================================================================
class qt_executor : public executor {
public:
  explicit qt_executor(QObject* target = QCoreApplication::instance())
  : target_(target ? target : QCoreApplication::instance()) {}

  void post(std::function<void()> f) override {
    QObject* tgt = target_;
    // target gone (or no application yet): run inline rather than lose the value
    if (!tgt) { f(); return; }
    QMetaObject::invokeMethod(
      tgt,
      [fn = std::move(f)]() mutable { fn(); },
      Qt::QueuedConnection
    );
  }

  QObject* target() const { return target_; }

private:
  QPointer<QObject> target_;
};

// ====================================================================================
// 2) from_signal1 - single-argument Qt signal -> observable<T>
//    Completes when the sender is destroyed. Unsubscribing only disconnects.
// ====================================================================================
template <typename Sender, typename Arg>
inline observable<std::decay_t<Arg>>
from_signal1(Sender* sender, void (Sender::*signal)(Arg)) {
  using T = std::decay_t<Arg>;
  return observable<T>::create([sender, signal](auto on_next, auto on_completed) {
    QPointer<Sender> guard(sender);
    if (!guard) {
      if (on_completed) on_completed();
      return subscription{};
    }

    // AutoConnection: same-thread emits reach the observer before emit returns
    auto value_conn = std::make_shared<QMetaObject::Connection>(
      QObject::connect(guard, signal, guard, [on_next](Arg arg){
        if (on_next) on_next(T(arg));
      }));
    auto destroyed_conn = std::make_shared<QMetaObject::Connection>(
      QObject::connect(guard, &QObject::destroyed, [on_completed]{
        if (on_completed) on_completed();
      }));

    return subscription([value_conn, destroyed_conn]{
      QObject::disconnect(*value_conn);
      QObject::disconnect(*destroyed_conn);
    });
  });
}

// ====================================================================================
// 3) property_from_signal - `initial`, then every value the signal carries
// ====================================================================================
template <typename Sender, typename Arg>
inline property<std::decay_t<Arg>>
property_from_signal(std::decay_t<Arg> initial, Sender* sender, void (Sender::*signal)(Arg)) {
  return property<std::decay_t<Arg>>(std::move(initial), from_signal1(sender, signal));
}

// ====================================================================================
// 4) receive_on(QObject*) - prop | qt::receive_on(widget)
//    Current value stays synchronous; later values arrive on target's thread.
// ====================================================================================
inline auto receive_on(QObject* target) {
  return [target](const auto& prop){
    std::shared_ptr<executor> exec = std::make_shared<qt_executor>(target);
    return prop.receive_on(std::move(exec));
  };
}

} // namespace qt
} // namespace steady
