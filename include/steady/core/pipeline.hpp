#pragma once
#include <concepts>
#include <utility>

namespace steady {

// src | op  ==  op(src). Found by ADL for observable<T> and property<T>.
template <class T, class Op>
  requires std::invocable<Op, T>
auto operator|(T&& v, Op&& op) -> std::invoke_result_t<Op, T> {
  return std::forward<Op>(op)(std::forward<T>(v));
}

} // namespace steady
