#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <steady/steady.hpp>

using namespace steady;

int main() {
  // 1) initial + then: synchronous emissions during construction are absorbed
  {
    property<int> p(0, from_values({1, 2, 3}));
    assert(p.value() == 3 && "value must be the last synchronously received value");
  }

  // 2) asynchronous `then`: value stays at initial until something arrives
  {
    auto src = std::make_shared<subject<int>>();
    property<int> p(7, src->as_observable());
    assert(p.value() == 7);
    src->on_next(8);
    assert(p.value() == 8);
  }

  // 3) constant
  {
    property<std::string> p(std::string("hello"));
    assert(p.value() == "hello");
  }

  // 4) stateful source: mirrored directly, no separate initial
  {
    auto cvs = std::make_shared<current_value_subject<int>>(5);
    property<int> p(cvs);
    assert(p.value() == 5);
    cvs->send(6);
    assert(p.value() == 6);
  }

  // 5) values_with_current replays synchronously, as often as asked
  {
    property<int> p(42, never<int>());
    for (int i = 0; i < 3; ++i) {
      std::vector<int> got;
      auto s = p.values_with_current().subscribe([&](int v){ got.push_back(v); });
      assert((got == std::vector<int>{42}) && "replay must happen before subscribe() returns");
    }
  }

  // 6) one upstream subscription no matter how many observers
  {
    int subscriptions = 0;
    auto src = std::make_shared<subject<int>>();
    auto counted = observable<int>::create([&subscriptions, src](auto on_next, auto on_done){
      ++subscriptions;
      return src->as_observable().subscribe(on_next, on_done);
    });

    property<int> p(0, counted);
    std::vector<int> counts(5, 0);
    std::vector<subscription> subs;
    for (int i = 0; i < 5; ++i) {
      subs.push_back(p.values_with_current().subscribe([&counts, i](int){ ++counts[i]; }));
    }
    assert(subscriptions == 1 && "the producer is subscribed exactly once, at construction");
    assert(src->observer_count() == 1);

    src->on_next(1);
    for (int c : counts) assert(c == 2);
  }

  // 7) values_without_current never sees older values
  {
    auto src = std::make_shared<subject<int>>();
    property<int> p(0, src->as_observable());
    src->on_next(1);

    std::vector<int> got;
    auto s = p.values_without_current().subscribe([&](int v){ got.push_back(v); });
    assert(got.empty());
    src->on_next(2);
    src->on_next(3);
    assert((got == std::vector<int>{2, 3}));
  }

  // 8) the cache is updated before observers are notified
  {
    auto src = std::make_shared<subject<int>>();
    property<int> p(0, src->as_observable());
    int checked = 0;
    auto s = p.values_without_current().subscribe([&](int v){
      assert(p.value() == v && "observer must read the value it was just given");
      ++checked;
    });
    src->on_next(10);
    src->on_next(11);
    assert(checked == 2);
  }

  // 9) completion: late observers are completed right away
  {
    property<int> p(3);
    std::vector<int> got;
    bool done_with = false, done_without = false;
    auto s1 = p.values_with_current().subscribe([&](int v){ got.push_back(v); }, [&]{ done_with = true; });
    auto s2 = p.values_without_current().subscribe([&](int){ assert(false); }, [&]{ done_without = true; });
    assert((got == std::vector<int>{3}));
    assert(done_with && done_without);
    assert(p.value() == 3 && "value survives completion");
  }

  // 10) cancelling stops delivery
  {
    auto src = std::make_shared<subject<int>>();
    property<int> p(0, src->as_observable());
    int calls = 0;
    auto s = p.values_without_current().subscribe([&](int){ ++calls; });
    src->on_next(1);
    s.reset();
    src->on_next(2);
    assert(calls == 1);
    assert(p.value() == 2 && "the property itself keeps following its producer");
  }

  // 11) a derived property keeps its parent running after the parent handle is gone
  {
    auto src = std::make_shared<subject<int>>();
    std::optional<property<int>> derived;
    {
      property<int> parent(1, src->as_observable());
      derived.emplace(parent.map([](int v){ return v * 10; }));
    }
    assert(derived->value() == 10);
    src->on_next(2);
    assert(derived->value() == 20);
  }

  // 12) copies share one core
  {
    auto src = std::make_shared<subject<int>>();
    property<int> a(0, src->as_observable());
    property<int> b = a;
    src->on_next(4);
    assert(a.value() == 4 && b.value() == 4);
    assert(src->observer_count() == 1);
  }

  // 13) a producer that keeps sending after its completion does not move the value
  {
    auto unruly = observable<int>::create([](auto on_next, auto on_done){
      on_next(1);
      on_done();
      on_next(2);
      return subscription{};
    });
    property<int> p(0, unruly);
    assert(p.value() == 1 && "values after completion are ignored");

    std::vector<int> got;
    auto s = p.values_with_current().subscribe([&](int v){ got.push_back(v); });
    assert((got == std::vector<int>{1}));
  }

  std::cout << "[property_construction_tests] OK\n";
  return 0;
}
