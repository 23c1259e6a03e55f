#include <steady/steady.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace steady;
using namespace std::chrono_literals;

int main() {
  strand ui;            // results are shown here, drained by main
  thread_pool io{2};    // "network"

  auto typed = std::make_shared<subject<std::string>>();
  property<std::string> query(std::string(), typed->as_observable());

  // Each query becomes a property: "searching..." now, the result later.
  // flat_map follows only the newest one, so slow stale answers never show.
  auto status = query
    .filter(std::string(), [](const std::string& q){ return q.size() >= 2; })
    .remove_duplicates()
    .flat_map([&io](const std::string& q){
      if (q.empty()) return property<std::string>(std::string("type at least 2 chars"));
      auto answer = observable<std::string>::create([q, &io](auto on_next, auto on_done){
        auto alive = std::make_shared<std::atomic<bool>>(true);
        io.post([q, alive, on_next, on_done]{
          std::this_thread::sleep_for(50ms);
          if (!alive->load()) return;
          on_next("results for '" + q + "'");
          on_done();
        });
        return subscription([alive]{ alive->store(false); });
      });
      return property<std::string>("searching '" + q + "'...", answer);
    })
    .receive_on(ui);

  auto sub = status.values_with_current().subscribe([](const std::string& s){
    std::cout << "[SEARCH] " << s << "\n";
  });

  // "noisy" user input
  for (std::string q : {"q", "qu", "que", "quer", "query"}) {
    typed->on_next(q);
    std::this_thread::sleep_for(10ms);
  }

  // let the last answer arrive, then show everything that was posted to ui
  io.wait_idle();
  ui.drain();
  std::cout << "[FINAL]  " << status.value() << "\n";
  return 0;
}
