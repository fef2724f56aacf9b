#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "efsm/detail/describe.hpp"

namespace efsm {

enum class ErrorKind : unsigned {
  NoTransition = 0,
  InternalError = 1,
  TransitionFailure = 2,
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::NoTransition:
      return "NoTransition";
    case ErrorKind::InternalError:
      return "InternalError";
    case ErrorKind::TransitionFailure:
      return "TransitionFailure";
  }
  return "Unknown";
}

// Fatal machine error. Any of these returned from a handler or hook aborts
// the current wave; the owner is expected to shut the machine down.
template <typename Event, typename State, typename Cause>
class Error {
 public:
  // No transition is registered for the event in the given state.
  struct NoTransition {
    Event event;
    State state;

    bool operator==(const NoTransition&) const = default;
  };

  // Application failure reported by a transition handler or hook.
  struct InternalError {
    Event event;
    State state;
    Cause cause;

    bool operator==(const InternalError&) const = default;
  };

  struct TransitionFailure {
    bool operator==(const TransitionFailure&) const = default;
  };

  using Variant = std::variant<NoTransition, InternalError, TransitionFailure>;

  Error(NoTransition value) : detail_(std::move(value)) {}
  Error(InternalError value) : detail_(std::move(value)) {}
  Error(TransitionFailure value) : detail_(value) {}

  [[nodiscard]] static Error no_transition(Event event, State state) {
    return Error{NoTransition{std::move(event), std::move(state)}};
  }

  [[nodiscard]] static Error internal(Event event, State state, Cause cause) {
    return Error{
        InternalError{std::move(event), std::move(state), std::move(cause)}};
  }

  [[nodiscard]] static Error transition_failure() {
    return Error{TransitionFailure{}};
  }

  [[nodiscard]] ErrorKind kind() const noexcept {
    return static_cast<ErrorKind>(detail_.index());
  }

  [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind() == k; }

  template <typename T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&detail_);
  }

  [[nodiscard]] const Variant& variant() const noexcept { return detail_; }

  // Event and state are absent for TransitionFailure.
  [[nodiscard]] const Event* event() const noexcept {
    if (auto* e = std::get_if<NoTransition>(&detail_)) return &e->event;
    if (auto* e = std::get_if<InternalError>(&detail_)) return &e->event;
    return nullptr;
  }

  [[nodiscard]] const State* state() const noexcept {
    if (auto* e = std::get_if<NoTransition>(&detail_)) return &e->state;
    if (auto* e = std::get_if<InternalError>(&detail_)) return &e->state;
    return nullptr;
  }

  [[nodiscard]] const Cause* cause() const noexcept {
    if (auto* e = std::get_if<InternalError>(&detail_)) return &e->cause;
    return nullptr;
  }

  [[nodiscard]] std::string to_string() const {
    return std::visit(
        [](const auto& e) -> std::string {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, NoTransition>) {
            return fmt::format("NoTransition(event={}, state={})",
                               detail::describe(e.event),
                               detail::describe(e.state));
          } else if constexpr (std::is_same_v<T, InternalError>) {
            return fmt::format("InternalError(event={}, state={}, cause={})",
                               detail::describe(e.event),
                               detail::describe(e.state),
                               detail::describe(e.cause));
          } else {
            return "TransitionFailure";
          }
        },
        detail_);
  }

  bool operator==(const Error&) const = default;

 private:
  Variant detail_;
};

// Thrown when the machine is driven in a way its access contract forbids,
// e.g. process() from inside a handler or reading the extended state while
// a wave is running.
class ReentrancyError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

}  // namespace efsm
