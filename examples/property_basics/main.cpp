#include <steady/steady.hpp>
#include <iostream>
#include <memory>
#include <string>

using namespace steady;

struct FileSaved { std::string path; };

int main() {
  auto saves = std::make_shared<subject<FileSaved>>();

  // always has a value, even before the first save
  property<std::string> last_path(std::string("<none>"), saves->as_observable()
    | map([](const FileSaved& e){ return e.path; }));

  auto is_png = last_path.map([](const std::string& p){
    return p.size() >= 4 && p.rfind(".png") == p.size()-4;
  });
  auto saves_seen = last_path.scan(0, [](int n, const std::string&){ return n + 1; });

  std::cout << "[NOW]    " << last_path.value() << " png=" << is_png.value() << "\n";

  // replays the current value, then follows
  auto s1 = last_path.values_with_current().subscribe([](const std::string& p){
    std::cout << "[WITH]   " << p << "\n";
  });
  // later values only
  auto s2 = is_png.remove_duplicates().values_without_current().subscribe([](bool png){
    std::cout << "[PNG]    " << (png ? "yes" : "no") << "\n";
  });

  for (int i = 0; i < 4; ++i) {
    saves->on_next(FileSaved{"/tmp/file" + std::to_string(i) + (i % 2 ? ".png" : ".txt")});
  }

  std::cout << "[COUNT]  " << saves_seen.value() << " saves\n";
}
