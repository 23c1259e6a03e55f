#include <steady/steady.hpp>
#include <iostream>
#include <memory>
#include <string>

using namespace steady;

int main() {
  auto name = std::make_shared<current_value_subject<std::string>>("");
  auto email = std::make_shared<current_value_subject<std::string>>("");
  auto accepted = std::make_shared<current_value_subject<bool>>(false);

  auto name_ok = property<std::string>(name).map([](const std::string& n){ return n.size() >= 3; });
  auto email_ok = property<std::string>(email).map([](const std::string& e){
    auto at = e.find('@');
    auto dot = e.rfind('.');
    return at != std::string::npos && dot != std::string::npos && at < dot && dot+1 < e.size();
  });

  // the button is active only while every rule holds
  auto can_submit = all({ name_ok, email_ok, property<bool>(accepted) }).remove_duplicates();

  auto sub = can_submit.values_with_current().subscribe([](bool ok){
    std::cout << "[FORM] submit_enabled = " << (ok ? "true" : "false") << "\n";
  });

  name->send("Al");               // short name
  email->send("a@b");             // no domain dot
  name->send("Alex");
  email->send("alex@site.com");
  accepted->send(true);           // true
  email->send("alex@site");       // false
  email->send("alex@site.io");    // true again

  return 0;
}
