#pragma once
#include <steady/core/log.hpp>

#include <cstdlib>
#include <source_location>
#include <string_view>

namespace steady {

// A caller broke an API promise (e.g. a producer that was required to emit
// synchronously did not). There is no sensible way to continue with an
// undefined current value, so this logs and aborts instead of throwing.
[[noreturn]] inline void contract_violation(
    std::string_view what,
    std::source_location loc = std::source_location::current()) noexcept {
  auto& lg = log::logger();
  lg.log(spdlog::source_loc{loc.file_name(), static_cast<int>(loc.line()), loc.function_name()},
         spdlog::level::critical, "contract violation: {}", what);
  lg.flush();
  std::abort();
}

} // namespace steady
