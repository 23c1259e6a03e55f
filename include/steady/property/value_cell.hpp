#pragma once
#include <steady/core/contract.hpp>

#include <mutex>
#include <optional>
#include <utility>

namespace steady {

// Latest value of a property. write() is visible to read() before it returns;
// readers always get a complete copy.
template <class T>
class value_cell {
public:
  value_cell() = default;
  value_cell(const value_cell&) = delete;
  value_cell& operator=(const value_cell&) = delete;

  void write(const T& v) {
    std::lock_guard<std::mutex> lock(m_);
    value_ = v;
  }

  // Reading a cell nobody ever wrote is a construction bug, not a runtime state.
  T read() const {
    std::lock_guard<std::mutex> lock(m_);
    if (!value_) contract_violation("value_cell read before any value was written");
    return *value_;
  }

  bool has_value() const {
    std::lock_guard<std::mutex> lock(m_);
    return value_.has_value();
  }

private:
  mutable std::mutex m_;
  std::optional<T> value_;
};

} // namespace steady
