#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>
#include <vector>
#include <steady/steady.hpp>

using namespace steady;
using namespace std::chrono_literals;

int main() {
  // --- filter: a value sent while the derived property is being built is kept ---
  {
    auto src = std::make_shared<subject<int>>();
    property<int> p(1, src->as_observable());

    std::thread sender;
    std::atomic<bool> first_call{true};
    auto accepted = p.filter(0, [&](int){
      if (first_call.exchange(false)) {
        // runs while the current value is being turned into the seed
        sender = std::thread([src]{ src->on_next(2); });
        std::this_thread::sleep_for(50ms);
      }
      return true;
    });
    sender.join();

    assert(p.value() == 2);
    assert(accepted.value() == 2 && "the concurrent value reaches the filtered property");
  }

  // --- receive_on(thread_pool): order survives several workers ---
  {
    constexpr int kValues = 200;
    for (int run = 0; run < 50; ++run) {
      thread_pool pool{4};
      auto src = std::make_shared<subject<int>>();
      property<int> p(0, src->as_observable());
      auto on_pool = p.receive_on(pool);

      // one delivery at a time per subscription, so no lock is needed here
      std::vector<int> seen;
      auto sub = on_pool.values_without_current().subscribe([&](int v){ seen.push_back(v); });

      for (int i = 1; i <= kValues; ++i) src->on_next(i);
      pool.wait_idle();

      assert(on_pool.value() == kValues && "the last value sent is the last value delivered");
      assert(seen.size() == static_cast<std::size_t>(kValues));
      for (std::size_t i = 1; i < seen.size(); ++i) assert(seen[i - 1] < seen[i]);
    }
  }

  // --- combine_latest: parents updated from different threads ---
  {
    constexpr int kValues = 2000;
    auto sa = std::make_shared<subject<int>>();
    auto sb = std::make_shared<subject<int>>();
    property<int> a(0, sa->as_observable());
    property<int> b(0, sb->as_observable());
    auto both = a.combine_latest(b);

    std::vector<std::pair<int, int>> seen;
    auto sub = both.values_without_current().subscribe([&](const std::pair<int, int>& v){ seen.push_back(v); });

    std::thread ta([&]{ for (int i = 1; i <= kValues; ++i) sa->on_next(i); });
    std::thread tb([&]{ for (int i = 1; i <= kValues; ++i) sb->on_next(i); });
    ta.join();
    tb.join();

    assert((both.value() == std::pair<int, int>(kValues, kValues)) && "no stale pair lands last");
    assert(seen.size() == static_cast<std::size_t>(2 * kValues));
    for (std::size_t i = 1; i < seen.size(); ++i) {
      assert(seen[i - 1].first <= seen[i].first && seen[i - 1].second <= seen[i].second);
    }
  }

  // --- zip: pairs stay in lockstep with writers on different threads ---
  {
    constexpr int kValues = 2000;
    auto sa = std::make_shared<subject<int>>();
    auto sb = std::make_shared<subject<int>>();
    property<int> a(0, sa->as_observable());
    property<int> b(0, sb->as_observable());
    auto zipped = a.zip(b);

    std::vector<std::pair<int, int>> seen;
    auto sub = zipped.values_without_current().subscribe([&](const std::pair<int, int>& v){ seen.push_back(v); });

    std::thread ta([&]{ for (int i = 1; i <= kValues; ++i) sa->on_next(i); });
    std::thread tb([&]{ for (int i = 1; i <= kValues; ++i) sb->on_next(i); });
    ta.join();
    tb.join();

    assert((zipped.value() == std::pair<int, int>(kValues, kValues)));
    assert(seen.size() == static_cast<std::size_t>(kValues));
    for (int i = 0; i < kValues; ++i) {
      assert((seen[i] == std::pair<int, int>(i + 1, i + 1)) && "pairs arrive in order");
    }
  }

  std::cout << "[concurrent_operator_tests] OK\n";
  return 0;
}
