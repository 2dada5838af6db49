#pragma once

#include "amico/common/result.hpp"

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace amico {

// -----------------------------------------------------------------------------
// System<In, Out, Err>
// -----------------------------------------------------------------------------
//
// @brief  A named, typed side-effecting operation run by the SystemExecutor.
//
// @details
// Implementations declare their contract through the template arguments and
// put the side effect in run(). The executor binds one system per
// (Input, Output) pair:
//
//   class EchoSystem final : public System<std::string, std::string> {
//    public:
//     std::string name() const override { return "Echo"; }
//     Result<std::string, std::string> run(const std::string& in) override {
//       return Result<std::string, std::string>::success(in);
//     }
//   };
//
// run() executes on an executor worker thread. With more than one worker
// the same instance may run concurrently, so shared state inside a system
// needs its own synchronization.
//
// Failure: return a failed Result, or throw a std::exception. Both become
// SystemError::ExecutionFailed and a Failed(reason) status.
// -----------------------------------------------------------------------------
template <typename In, typename Out, typename Err = std::string>
class System {
 public:
  using Input = In;
  using Output = Out;
  using Error = Err;

  virtual ~System() = default;

  virtual std::string name() const = 0;
  virtual Result<Out, Err> run(const In& input) = 0;
};

namespace detail {

template <typename T, typename = void>
struct has_what : std::false_type {};

template <typename T>
struct has_what<T, std::void_t<decltype(std::declval<const T&>().what())>>
    : std::true_type {};

template <typename T, typename = void>
struct has_message : std::false_type {};

template <typename T>
struct has_message<T, std::void_t<decltype(std::declval<const T&>().message)>>
    : std::true_type {};

}  // namespace detail

// Failure reason recorded for a system error value.
template <typename Err>
std::string describe_error(const Err& error) {
  if constexpr (std::is_convertible_v<const Err&, std::string>) {
    return std::string(error);
  } else if constexpr (detail::has_what<Err>::value) {
    return std::string(error.what());
  } else if constexpr (detail::has_message<Err>::value) {
    return std::string(error.message);
  } else {
    return "system error";
  }
}

// -----------------------------------------------------------------------------
// FunctionSystem: System backed by a callable
// -----------------------------------------------------------------------------
template <typename In, typename Out, typename Err = std::string>
class FunctionSystem final : public System<In, Out, Err> {
 public:
  using Fn = std::function<Result<Out, Err>(const In&)>;

  FunctionSystem(std::string name, Fn fn)
      : name_(std::move(name)), fn_(std::move(fn)) {}

  std::string name() const override { return name_; }
  Result<Out, Err> run(const In& input) override { return fn_(input); }

 private:
  std::string name_;
  Fn fn_;
};

// Wraps `f` as a System<In, Out>. `f` returns either Result<Out, std::string>
// or a plain Out (always successful).
template <typename In, typename Out, typename F>
std::shared_ptr<FunctionSystem<In, Out>> make_system(std::string name, F&& f) {
  using R = std::invoke_result_t<std::decay_t<F>&, const In&>;
  using Fn = typename FunctionSystem<In, Out>::Fn;

  if constexpr (std::is_same_v<R, Result<Out, std::string>>) {
    return std::make_shared<FunctionSystem<In, Out>>(std::move(name),
                                                     Fn(std::forward<F>(f)));
  } else {
    static_assert(std::is_convertible_v<R, Out>,
                  "callable must return Out or Result<Out, std::string>");
    return std::make_shared<FunctionSystem<In, Out>>(
        std::move(name), Fn([fn = std::forward<F>(f)](const In& in) mutable {
          return Result<Out, std::string>::success(Out(fn(in)));
        }));
  }
}

}  // namespace amico
