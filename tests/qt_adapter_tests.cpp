#include <QCoreApplication>
#include <QObject>

#include <cassert>
#include <iostream>

#include <steady/steady.hpp>
#include <steady/adapters/qt.hpp>

using namespace steady;

class Slider : public QObject {
  Q_OBJECT
public:
  void set(int v) { emit valueChanged(v); }
signals:
  void valueChanged(int value);
};

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);

  // --- a signal-backed property follows same-thread emits synchronously ---
  Slider slider;
  auto level = qt::property_from_signal(0, &slider, &Slider::valueChanged);
  assert(level.value() == 0);
  slider.set(5);
  assert(level.value() == 5);

  // --- receive_on(QObject*) defers later values to the event loop ---
  auto on_app = level | qt::receive_on(&app);
  assert(on_app.value() == 5 && "the current value stays synchronous");
  slider.set(6);
  assert(on_app.value() == 5);
  QCoreApplication::processEvents();
  assert(on_app.value() == 6);

  // --- destroying the sender completes the property ---
  {
    auto* temp = new Slider;
    auto p = qt::property_from_signal(1, temp, &Slider::valueChanged);
    bool done = false;
    auto sub = p.values_without_current().subscribe([](int){}, [&]{ done = true; });
    temp->set(2);
    assert(p.value() == 2);
    delete temp;
    assert(done);
    assert(p.value() == 2);
  }

  // --- qt_executor without an explicit target posts to the application ---
  {
    qt::qt_executor ex(nullptr);
    bool ran = false;
    assert(ex.target() == &app);
    ex.post([&]{ ran = true; });
    assert(!ran);
    QCoreApplication::processEvents();
    assert(ran);
  }

  std::cout << "[qt_adapter_tests] OK\n";
  return 0;
}

#include "qt_adapter_tests.moc"
