#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "efsm/detail/describe.hpp"
#include "efsm/detail/queue.hpp"
#include "efsm/detail/tables.hpp"
#include "efsm/errors.hpp"
#include "efsm/logging.hpp"
#include "efsm/result.hpp"
#include "efsm/snapshot.hpp"

namespace efsm {

template <typename T>
concept Key = std::copyable<T> && std::equality_comparable<T> &&
              requires(const T& value) {
                { std::hash<T>{}(value) } -> std::convertible_to<std::size_t>;
              };

// Flat finite state machine with extended state.
//
//  * State, Event  - hashable identifiers; a transition is registered per
//                    (state, event) pair
//  * ExtendedState - value owned by the machine, mutated only by handlers
//  * Payload       - optional per-event argument moved into the handler
//  * Cause         - application error carried by InternalError
//
// Events are processed in waves: process() captures the queue, runs the
// captured events in order and leaves anything emitted during the wave for
// the next call. The first error aborts the wave and discards the events
// that were not run yet.
template <Key State, Key Event, typename ExtendedState,
          typename Payload = std::monostate, typename Cause = std::string>
class Machine {
 public:
  using state_type = State;
  using event_type = Event;
  using extended_state_type = ExtendedState;
  using payload_type = Payload;

  using QueuedEvent = efsm::QueuedEvent<Event, Payload>;
  using Events = std::vector<QueuedEvent>;
  using Error = efsm::Error<Event, State, Cause>;
  using Snapshot = efsm::Snapshot<State, Event>;

  // Handlers either fail or return events to append to the queue.
  using TransitionResult = Result<std::optional<Events>, Error>;
  using TransitionFn = std::function<TransitionResult(
      ExtendedState&, const Event&, std::optional<Payload>)>;
  using HookFn = std::function<TransitionResult(ExtendedState&)>;

  Machine(State initial_state, ExtendedState extended_state, std::string name,
          std::shared_ptr<spdlog::logger> logger = logging::default_logger())
      : name_(std::move(name)),
        initial_state_(initial_state),
        current_state_(std::move(initial_state)),
        extended_state_(std::move(extended_state)),
        logger_(logger ? std::move(logger) : logging::null_logger()) {
    logger_->trace("FSM {} created in state {}", name_,
                   detail::describe(current_state_));
  }

  Machine(const Machine&) = delete;
  Machine& operator=(const Machine&) = delete;
  Machine(Machine&&) = default;
  Machine& operator=(Machine&&) = default;
  ~Machine() = default;

  // --- Handler result helpers ---

  [[nodiscard]] static TransitionResult done() { return std::nullopt; }

  // Accepts plain events and QueuedEvents (for events with a payload).
  template <typename... Es>
  [[nodiscard]] static TransitionResult emit(Es&&... events) {
    Events out;
    out.reserve(sizeof...(Es));
    (out.push_back(to_queued(std::forward<Es>(events))), ...);
    return std::optional<Events>{std::move(out)};
  }

  [[nodiscard]] static TransitionResult fail(Error error) {
    return Unexpected<Error>{std::move(error)};
  }

  // --- Registration ---

  // Registers the transition taken on `event` while in `from`. Returns false
  // when a previous transition for the same pair was overwritten.
  bool add_transition(State from, Event event, State to, TransitionFn handler,
                      std::optional<std::string> name = std::nullopt) {
    const std::string from_text = detail::describe(from);
    const std::string event_text = detail::describe(event);
    logger_->trace("FSM {} adding transition {} --{}--> {} ({})", name_,
                   from_text, event_text, detail::describe(to),
                   name.value_or(""));
    const bool inserted =
        transitions_.insert(std::move(from), std::move(event), std::move(to),
                            std::move(handler), std::move(name));
    if (!inserted) {
      logger_->warn("FSM {} overwrote transition for state {} on event {}",
                    name_, from_text, event_text);
    }
    return inserted;
  }

  // Hook run when a transition leaves (Exit) or enters (Enter) `state`.
  // Self-transitions run neither. Returns false on overwrite.
  bool add_hook(State state, Direction direction, HookFn hook,
                std::optional<std::string> name = std::nullopt) {
    const std::string state_text = detail::describe(state);
    logger_->trace("FSM {} adding {} hook for state {} ({})", name_,
                   to_string(direction), state_text, name.value_or(""));
    const bool inserted = hooks_.insert(std::move(state), direction,
                                        std::move(hook), std::move(name));
    if (!inserted) {
      logger_->warn("FSM {} overwrote {} hook for state {}", name_,
                    to_string(direction), state_text);
    }
    return inserted;
  }

  bool add_entry_hook(State state, HookFn hook,
                      std::optional<std::string> name = std::nullopt) {
    return add_hook(std::move(state), Direction::Enter, std::move(hook),
                    std::move(name));
  }

  bool add_exit_hook(State state, HookFn hook,
                     std::optional<std::string> name = std::nullopt) {
    return add_hook(std::move(state), Direction::Exit, std::move(hook),
                    std::move(name));
  }

  // --- Queue ---

  // Appends events at the back of the queue without processing them.
  Result<std::size_t, Error> enqueue(Events events) {
    logger_->trace("FSM {} adding {} events", name_, events.size());
    return queue_.append(std::move(events));
  }

  Result<std::size_t, Error> enqueue(Event event,
                                     std::optional<Payload> payload = {}) {
    Events events;
    events.push_back(QueuedEvent{std::move(event), std::move(payload)});
    return enqueue(std::move(events));
  }

  // Processes the events queued at the time of the call and returns how many
  // were captured. Events emitted meanwhile stay queued for the next call.
  // The first error ends the call; captured events that did not run yet are
  // dropped and the machine must be shut down. Throws ReentrancyError when
  // called from inside a handler or hook.
  Result<std::size_t, Error> process() {
    if (processing_) {
      throw ReentrancyError("FSM " + name_ +
                            ": process() called while processing");
    }
    processing_scope scope(processing_);

    auto wave = queue_.take_all();
    const std::size_t captured = wave.size();
    logger_->debug("FSM {} processing {} events", name_, captured);

    for (std::size_t i = 0; i < captured; ++i) {
      if (auto failure = step(std::move(wave[i]))) {
        logger_->debug("FSM {} aborted on {}, discarding {} events", name_,
                       failure->to_string(), captured - i - 1);
        return Unexpected<Error>{std::move(*failure)};
      }
    }

    logger_->debug("FSM {} processed {} events, {} pending", name_, captured,
                   queue_.size());
    return captured;
  }

  // --- Inspection ---

  [[nodiscard]] const std::string& name() const noexcept { return name_; }

  [[nodiscard]] State current_state() const { return current_state_; }

  [[nodiscard]] const State& initial_state() const noexcept {
    return initial_state_;
  }

  // Must not be held across a call to process(). Throws ReentrancyError
  // while a wave is running.
  [[nodiscard]] const ExtendedState& extended_state() const {
    if (processing_) {
      throw ReentrancyError("FSM " + name_ +
                            ": extended state borrowed while processing");
    }
    return extended_state_;
  }

  [[nodiscard]] bool pending() const noexcept { return !queue_.empty(); }

  [[nodiscard]] std::size_t pending_count() const noexcept {
    return queue_.size();
  }

  [[nodiscard]] Snapshot snapshot() const {
    Snapshot snap{initial_state_, {}, {}};
    snap.transitions.reserve(transitions_.size());
    transitions_.for_each([&](const State& from, const Event& event,
                              const auto& entry) {
      snap.transitions.push_back({from, event, entry.target, entry.name});
    });
    snap.hooks.reserve(hooks_.size());
    hooks_.for_each(
        [&](const State& state, Direction direction, const auto& entry) {
          snap.hooks.push_back({state, direction, entry.name});
        });
    return snap;
  }

  [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept {
    return logger_;
  }

 private:
  struct processing_scope {
    explicit processing_scope(bool& flag) : flag_(flag) { flag_ = true; }
    ~processing_scope() { flag_ = false; }
    processing_scope(const processing_scope&) = delete;
    processing_scope& operator=(const processing_scope&) = delete;

    bool& flag_;
  };

  template <typename E>
  static QueuedEvent to_queued(E&& event) {
    if constexpr (std::is_same_v<std::remove_cvref_t<E>, QueuedEvent>) {
      return std::forward<E>(event);
    } else {
      return QueuedEvent{Event(std::forward<E>(event)), std::nullopt};
    }
  }

  // Runs one event of a wave. Returns the error that aborts the wave, if
  // any.
  std::optional<Error> step(QueuedEvent queued) {
    const State state = current_state_;
    logger_->trace("FSM {} processing event {}/{}", name_,
                   detail::describe(queued.event), detail::describe(state));

    const auto* entry = transitions_.find(state, queued.event);
    if (!entry) {
      return Error::no_transition(std::move(queued.event), state);
    }

    // Copied so that a handler may re-register its own slot.
    const State target = entry->target;
    const TransitionFn handler = entry->handler;
    const bool leaves_state = !(target == state);

    if (leaves_state) {
      if (auto failure = run_hook(state, Direction::Exit)) return failure;
    }

    auto outcome =
        handler(extended_state_, queued.event, std::move(queued.payload));
    if (!outcome.has_value()) {
      return std::move(outcome).error();
    }
    append_emitted(std::move(outcome).value());

    logger_->trace("FSM {} moving machine to {}", name_,
                   detail::describe(target));
    current_state_ = target;

    if (leaves_state) {
      if (auto failure = run_hook(target, Direction::Enter)) return failure;
    }
    return std::nullopt;
  }

  std::optional<Error> run_hook(const State& state, Direction direction) {
    const auto* entry = hooks_.find(state, direction);
    if (!entry) return std::nullopt;

    logger_->trace("FSM {} {} hook for {} ({})", name_, to_string(direction),
                   detail::describe(state), entry->name.value_or(""));
    const HookFn hook = entry->hook;
    auto outcome = hook(extended_state_);
    if (!outcome.has_value()) {
      return std::move(outcome).error();
    }
    append_emitted(std::move(outcome).value());
    return std::nullopt;
  }

  void append_emitted(std::optional<Events> emitted) {
    if (!emitted || emitted->empty()) return;
    logger_->trace("FSM {} queueing {} emitted events", name_,
                   emitted->size());
    queue_.append(std::move(*emitted));
  }

  std::string name_;
  State initial_state_;
  State current_state_;
  ExtendedState extended_state_;
  detail::event_queue<Event, Payload> queue_;
  detail::transition_table<State, Event, TransitionFn> transitions_;
  detail::entry_exit_table<State, HookFn> hooks_;
  std::shared_ptr<spdlog::logger> logger_;
  bool processing_ = false;
};

}  // namespace efsm
