#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace steady {

// Outcome of one transformation attempt: either a value or the exception the
// attempt threw. Lets a failure travel through a property as ordinary data.
template <class T>
class result {
public:
  using value_type = T;

  static result success(T v) { return result(std::in_place_index<0>, std::move(v)); }
  static result failure(std::exception_ptr e) { return result(std::in_place_index<1>, std::move(e)); }

  // Runs f() and captures whatever it throws.
  template <class F>
  static result capture(F&& f) {
    try {
      return success(std::forward<F>(f)());
    } catch (...) {
      return failure(std::current_exception());
    }
  }

  bool ok() const noexcept { return data_.index() == 0; }
  explicit operator bool() const noexcept { return ok(); }

  // Rethrows the captured exception if this is a failure.
  const T& value() const {
    if (!ok()) std::rethrow_exception(std::get<1>(data_));
    return std::get<0>(data_);
  }

  T value_or(T fallback) const {
    return ok() ? std::get<0>(data_) : std::move(fallback);
  }

  std::exception_ptr error() const noexcept {
    return ok() ? std::exception_ptr{} : std::get<1>(data_);
  }

  // what() of the captured exception, or an empty string.
  std::string error_message() const {
    if (ok()) return {};
    try {
      std::rethrow_exception(std::get<1>(data_));
    } catch (const std::exception& e) {
      return e.what();
    } catch (...) {
      return "unknown exception";
    }
  }

private:
  template <std::size_t I, class A>
  result(std::in_place_index_t<I> tag, A&& a) : data_(tag, std::forward<A>(a)) {}

  std::variant<T, std::exception_ptr> data_;
};

} // namespace steady
