#pragma once
#include <steady/property/property.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace steady {

// n-ary combinators over a collection, built by folding pairwise
// combine_latest / zip from the left. Each step is a property of its own.

template <class T>
property<std::vector<T>> combine_latest(const std::vector<property<T>>& props,
                                        std::vector<T> if_empty = {}) {
  if (props.empty()) return property<std::vector<T>>(std::move(if_empty));

  auto acc = props.front().map([](const T& v){ return std::vector<T>{ v }; });
  for (std::size_t i = 1; i < props.size(); ++i) {
    acc = acc.combine_latest(props[i]).map([](const std::pair<std::vector<T>, T>& p){
      auto out = p.first;
      out.push_back(p.second);
      return out;
    });
  }
  return acc;
}

template <class T>
property<std::vector<T>> zip(const std::vector<property<T>>& props,
                             std::vector<T> if_empty = {}) {
  if (props.empty()) return property<std::vector<T>>(std::move(if_empty));

  auto acc = props.front().map([](const T& v){ return std::vector<T>{ v }; });
  for (std::size_t i = 1; i < props.size(); ++i) {
    acc = acc.zip(props[i]).map([](const std::pair<std::vector<T>, T>& p){
      auto out = p.first;
      out.push_back(p.second);
      return out;
    });
  }
  return acc;
}

// true while every property is true. An empty collection yields `if_empty`.
inline property<bool> all(const std::vector<property<bool>>& props, bool if_empty = true) {
  if (props.empty()) return property<bool>(if_empty);
  return combine_latest(props).map([](const std::vector<bool>& vs){
    return std::all_of(vs.begin(), vs.end(), [](bool b){ return b; });
  });
}

// true while at least one property is true. An empty collection yields `if_empty`.
inline property<bool> any(const std::vector<property<bool>>& props, bool if_empty = false) {
  if (props.empty()) return property<bool>(if_empty);
  return combine_latest(props).map([](const std::vector<bool>& vs){
    return std::any_of(vs.begin(), vs.end(), [](bool b){ return b; });
  });
}

} // namespace steady
