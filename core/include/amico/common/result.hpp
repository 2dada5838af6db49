#pragma once

#include <optional>
#include <utility>

namespace amico {

// -----------------------------------------------------------------------------
// Unit: the empty value type
// -----------------------------------------------------------------------------
// Used as the Response of events that return nothing and as the success value
// of operations that only signal completion (e.g. Result<Unit, AgentError>).
// -----------------------------------------------------------------------------
struct Unit {
  bool operator==(const Unit&) const { return true; }
  bool operator!=(const Unit&) const { return false; }
};

// -----------------------------------------------------------------------------
// Result<T, E>
// -----------------------------------------------------------------------------
//
// @brief  Value-or-error holder returned by every fallible core operation.
//
// @details
// Exactly one of `value` / `error` is engaged for results built through the
// success() / failure() factories. The members are public so call sites can
// read `*result.value` or `result.error->message` directly.
//
// Thread model: Plain value type; no internal synchronization.
// -----------------------------------------------------------------------------
template <typename T, typename E>
struct Result {
  std::optional<T> value;
  std::optional<E> error;

  static Result success(T v) {
    Result r;
    r.value.emplace(std::move(v));
    return r;
  }

  static Result failure(E e) {
    Result r;
    r.error.emplace(std::move(e));
    return r;
  }

  bool ok() const { return value.has_value(); }
  bool failed() const { return error.has_value(); }
  explicit operator bool() const { return ok(); }
};

}  // namespace amico
