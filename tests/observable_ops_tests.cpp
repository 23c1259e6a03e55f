#include <cassert>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <steady/steady.hpp>
#include <iostream>

using namespace steady;

int main() {
  // --- map + filter ---
  {
    auto numbers = std::make_shared<subject<int>>();

    std::vector<int> got;
    auto sub = (numbers->as_observable()
      | map([](const int& x){ return x * 2; })
      | filter([](int x){ return x % 4 == 0; })
    ).subscribe([&](int v){
      got.push_back(v);
    });

    for (int i=1;i<=5;++i) numbers->on_next(i);
    // x*2, then %4==0 => original even numbers: 2->4, 4->8
    assert((got == std::vector<int>{4,8}) && "Should only receive double even numbers");

    sub.reset();
    numbers->on_next(6);
    assert(got.size() == 2 && "nothing after reset()");
  }

  // --- synchronous sources ---
  {
    std::vector<int> got;
    int done = 0;
    auto s1 = from_values({1, 2, 3}).subscribe([&](int v){ got.push_back(v); }, [&]{ ++done; });
    auto s2 = just(4).subscribe([&](int v){ got.push_back(v); }, [&]{ ++done; });
    auto s3 = empty<int>().subscribe([&](int v){ got.push_back(v); }, [&]{ ++done; });
    auto s4 = never<int>().subscribe([&](int v){ got.push_back(v); }, [&]{ ++done; });
    assert((got == std::vector<int>{1, 2, 3, 4}));
    assert(done == 3 && "never() must not complete");

    int built = 0;
    auto counted = defer([&built]{ ++built; return just(built); });
    std::vector<int> deferred;
    auto d1 = counted.subscribe([&](int v){ deferred.push_back(v); });
    auto d2 = counted.subscribe([&](int v){ deferred.push_back(v); });
    assert(built == 2 && "defer runs the factory per subscription");
    assert((deferred == std::vector<int>{1, 2}));
  }

  // --- start_with, scan, pairwise, compact_map ---
  {
    std::vector<int> sums;
    auto s1 = (from_values({1, 2, 3}) | scan(10, [](int acc, int v){ return acc + v; }))
      .subscribe([&](int v){ sums.push_back(v); });
    assert((sums == std::vector<int>{11, 13, 16}) && "the seed itself is not emitted");

    std::vector<std::pair<int, int>> pairs;
    auto s2 = (from_values({2, 3}) | start_with(1) | pairwise(0))
      .subscribe([&](const std::pair<int, int>& p){ pairs.push_back(p); });
    assert((pairs == std::vector<std::pair<int, int>>{{0, 1}, {1, 2}, {2, 3}}));

    std::vector<int> parsed;
    auto s3 = (from_values<std::string>({"1", "x", "3"})
      | compact_map([](const std::string& s) -> std::optional<int> {
          if (s.empty() || s[0] < '0' || s[0] > '9') return std::nullopt;
          return std::stoi(s);
        }))
      .subscribe([&](int v){ parsed.push_back(v); });
    assert((parsed == std::vector<int>{1, 3}));
  }

  // --- map over a pointer to member ---
  {
    struct point { int x; int y; };
    std::vector<int> xs;
    auto sub = (from_values<point>({{1, 2}, {3, 4}}) | map(&point::x))
      .subscribe([&](int x){ xs.push_back(x); });
    assert((xs == std::vector<int>{1, 3}));
  }

  // --- skip ---
  {
    std::vector<int> got;
    auto sub = (from_values({1, 2, 3, 4}) | skip(2)).subscribe([&](int v){ got.push_back(v); });
    assert((got == std::vector<int>{3, 4}));
  }

  // --- seed_first: the first value is seeded, the rest go through the operator ---
  {
    std::vector<int> got;
    bool done = false;
    auto sub = (from_values({1, 2, 3, 4})
      | seed_first([](int v){ return v * 100; }, take(2))
    ).subscribe([&](int v){ got.push_back(v); }, [&]{ done = true; });
    assert((got == std::vector<int>{100, 2, 3}));
    assert(done);

    bool empty_done = false;
    auto sub2 = (empty<int>() | seed_first([](int v){ return v; }, take(1)))
      .subscribe([](int){ assert(false); }, [&]{ empty_done = true; });
    assert(empty_done && "completion before any value is forwarded");
  }

  std::cout << "[observable_ops_tests] OK\n";
  return 0;
}
