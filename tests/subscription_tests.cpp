#include <cassert>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <steady/steady.hpp>

using namespace steady;

int main() {
  // --- subscription: reset once, destructor cancels, move transfers ---
  {
    int cancels = 0;
    {
      subscription s([&]{ ++cancels; });
      assert(static_cast<bool>(s));
      s.reset();
      s.reset();
      assert(!s);
    }
    assert(cancels == 1);

    {
      subscription a = make_subscription([&]{ ++cancels; });
      subscription b = std::move(a);
      assert(!a && b);
    }
    assert(cancels == 2 && "only the new owner cancels");

    {
      subscription a([&]{ ++cancels; });
      subscription b([&]{ cancels += 10; });
      b = std::move(a);          // b's old registration is cancelled first
      assert(cancels == 12);
    }
    assert(cancels == 13);

    {
      subscription s([&]{ ++cancels; });
      s.release();
    }
    assert(cancels == 13 && "release() forgets without cancelling");
  }

  // --- a throwing cancel function is contained ---
  {
    subscription s([]{ throw std::runtime_error("cancel failed"); });
    s.reset();
    assert(!s);
  }

  // --- composite_subscription ---
  {
    int cancels = 0;
    composite_subscription group;
    auto k1 = group.add(subscription([&]{ cancels += 1; }));
    auto k2 = group.add(subscription([&]{ cancels += 10; }));
    assert(k1 != composite_subscription::no_key && k1 != k2);

    group.remove(k1);
    assert(cancels == 1);
    group.remove(k1);
    assert(cancels == 1 && "removing twice is harmless");

    group.reset();
    assert(cancels == 11 && group.cancelled());

    auto k3 = group.add(subscription([&]{ cancels += 100; }));
    assert(k3 == composite_subscription::no_key);
    assert(cancels == 111 && "adding to a cancelled group cancels immediately");
  }

  // --- subject bookkeeping ---
  {
    auto src = std::make_shared<subject<int>>();
    int got = 0;
    auto s1 = src->as_observable().subscribe([&](int v){ got += v; });
    auto s2 = src->as_observable().subscribe([&](int v){ got += v * 10; });
    assert(src->observer_count() == 2);
    src->on_next(1);
    assert(got == 11);
    s2.reset();
    src->on_next(1);
    assert(got == 12);

    bool late_done = false;
    src->on_completed();
    auto s3 = src->as_observable().subscribe([](int){}, [&]{ late_done = true; });
    assert(late_done && "subscribing after completion completes right away");
  }

  // --- current_value_subject replays ---
  {
    auto cvs = std::make_shared<current_value_subject<int>>(1);
    int last = 0;
    auto s = cvs->as_observable().subscribe([&](int v){ last = v; });
    assert(last == 1);
    cvs->send(2);
    assert(last == 2 && cvs->value() == 2);
  }

  std::cout << "[subscription_tests] OK\n";
  return 0;
}
