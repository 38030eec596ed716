#pragma once

#include <cassert>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tg::core {

/// Result<T, E>: either a value or an error, never both.
/// Used for every fallible scheduler operation instead of bool + out-param.
template <typename T, typename E> class Result {
public:
  static Result Ok(T value) {
    Result r;
    r.storage_.template emplace<0>(std::move(value));
    return r;
  }

  static Result Err(E error) {
    Result r;
    r.storage_.template emplace<1>(std::move(error));
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return storage_.index() == 0; }
  [[nodiscard]] bool is_err() const noexcept { return storage_.index() == 1; }

  /// Precondition: is_ok().
  [[nodiscard]] const T &value() const & {
    assert(is_ok() && "Result::value() on Err");
    return std::get<0>(storage_);
  }

  [[nodiscard]] T &&value() && {
    assert(is_ok() && "Result::value() on Err");
    return std::get<0>(std::move(storage_));
  }

  /// Precondition: is_err().
  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result::error() on Ok");
    return std::get<1>(storage_);
  }

  [[nodiscard]] E &&error() && {
    assert(is_err() && "Result::error() on Ok");
    return std::get<1>(std::move(storage_));
  }

  [[nodiscard]] T value_or(T fallback) const & {
    return is_ok() ? std::get<0>(storage_) : std::move(fallback);
  }

private:
  Result() = default;
  // Index-based access so Result<std::string, std::string> stays usable.
  std::variant<T, E> storage_;
};

template <typename E> class Result<void, E> {
public:
  static Result Ok() { return Result(); }

  static Result Err(E error) {
    Result r;
    r.has_error_ = true;
    r.error_ = std::move(error);
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return !has_error_; }
  [[nodiscard]] bool is_err() const noexcept { return has_error_; }

  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result<void>::error() on Ok");
    return error_;
  }

private:
  Result() = default;
  bool has_error_ = false;
  E error_{};
};

} // namespace tg::core
