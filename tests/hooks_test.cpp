#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <optional>
#include <string>
#include <vector>

#include "efsm/efsm.hpp"

namespace {

enum class Light { Red, Green, Yellow };
enum class Cue { Next, Hold, Fault };

struct Journal {
  std::vector<std::string> calls;
};

using Fsm = efsm::Machine<Light, Cue, Journal>;

Fsm::HookFn note(std::string call) {
  return [call](Journal& j) {
    j.calls.push_back(call);
    return Fsm::done();
  };
}

Fsm::TransitionFn effect(std::string call) {
  return [call](Journal& j, const Cue&, std::optional<std::monostate>) {
    j.calls.push_back(call);
    return Fsm::done();
  };
}

Fsm make_machine() {
  Fsm fsm(Light::Red, Journal{}, "lights", efsm::logging::null_logger());
  fsm.add_transition(Light::Red, Cue::Next, Light::Green, effect("red->green"));
  fsm.add_transition(Light::Green, Cue::Next, Light::Yellow,
                     effect("green->yellow"));
  fsm.add_transition(Light::Red, Cue::Hold, Light::Red, effect("red->red"));
  return fsm;
}

}  // namespace

TEST_CASE("Hooks - Exit Then Handler Then Enter") {
  auto fsm = make_machine();
  CHECK(fsm.add_exit_hook(Light::Red, note("exit red")));
  CHECK(fsm.add_entry_hook(Light::Green, note("enter green")));
  // Hooks of states not involved must stay silent
  fsm.add_entry_hook(Light::Red, note("enter red"));
  fsm.add_exit_hook(Light::Green, note("exit green"));

  REQUIRE(fsm.enqueue(Cue::Next).has_value());
  REQUIRE(fsm.process().has_value());

  CHECK(fsm.current_state() == Light::Green);
  CHECK(fsm.extended_state().calls ==
        std::vector<std::string>{"exit red", "red->green", "enter green"});
}

TEST_CASE("Hooks - Self Transition Runs No Hooks") {
  auto fsm = make_machine();
  fsm.add_exit_hook(Light::Red, note("exit red"));
  fsm.add_entry_hook(Light::Red, note("enter red"));

  REQUIRE(fsm.enqueue(Cue::Hold).has_value());
  REQUIRE(fsm.process().has_value());

  CHECK(fsm.current_state() == Light::Red);
  CHECK(fsm.extended_state().calls == std::vector<std::string>{"red->red"});
}

TEST_CASE("Hooks - Generic Registration And Overwrite") {
  auto fsm = make_machine();
  CHECK(fsm.add_hook(Light::Green, efsm::Direction::Enter, note("first")));
  CHECK_FALSE(
      fsm.add_hook(Light::Green, efsm::Direction::Enter, note("second")));

  REQUIRE(fsm.enqueue(Cue::Next).has_value());
  REQUIRE(fsm.process().has_value());
  CHECK(fsm.extended_state().calls ==
        std::vector<std::string>{"red->green", "second"});
}

TEST_CASE("Hooks - Exit Hook Failure Keeps State And Skips Handler") {
  auto fsm = make_machine();
  fsm.add_exit_hook(Light::Red, [](Journal& j) {
    j.calls.push_back("exit red");
    return Fsm::fail(Fsm::Error::internal(Cue::Next, Light::Red, "stuck"));
  });
  fsm.add_entry_hook(Light::Green, note("enter green"));

  REQUIRE(fsm.enqueue(Cue::Next).has_value());
  auto processed = fsm.process();
  REQUIRE_FALSE(processed.has_value());
  CHECK(processed.error() ==
        Fsm::Error::internal(Cue::Next, Light::Red, "stuck"));
  CHECK(fsm.current_state() == Light::Red);
  CHECK(fsm.extended_state().calls == std::vector<std::string>{"exit red"});
}

TEST_CASE("Hooks - Enter Hook Failure Leaves Machine In Target") {
  auto fsm = make_machine();
  fsm.add_entry_hook(Light::Green, [](Journal& j) {
    j.calls.push_back("enter green");
    return Fsm::fail(Fsm::Error::transition_failure());
  });

  REQUIRE(fsm.enqueue(Fsm::Events{{Cue::Next, std::nullopt},
                                  {Cue::Next, std::nullopt}})
              .has_value());
  auto processed = fsm.process();
  REQUIRE_FALSE(processed.has_value());
  CHECK(processed.error().kind() == efsm::ErrorKind::TransitionFailure);
  CHECK(fsm.current_state() == Light::Green);
  // The second Next was discarded with the wave
  CHECK(fsm.extended_state().calls ==
        std::vector<std::string>{"red->green", "enter green"});
  CHECK_FALSE(fsm.pending());
}

TEST_CASE("Hooks - Emitted Events Are Queued") {
  auto fsm = make_machine();
  fsm.add_exit_hook(Light::Red, [](Journal& j) {
    j.calls.push_back("exit red");
    return Fsm::emit(Cue::Next);
  });
  fsm.add_entry_hook(Light::Yellow, note("enter yellow"));

  REQUIRE(fsm.enqueue(Cue::Next).has_value());
  auto first = fsm.process();
  REQUIRE(first.has_value());
  CHECK(first.value() == 1);
  CHECK(fsm.current_state() == Light::Green);
  CHECK(fsm.pending_count() == 1);

  REQUIRE(fsm.process().has_value());
  CHECK(fsm.current_state() == Light::Yellow);
  CHECK(fsm.extended_state().calls ==
        std::vector<std::string>{"exit red", "red->green", "green->yellow",
                                 "enter yellow"});
}

TEST_CASE("Hooks - Events From Completed Steps Survive Failure") {
  auto fsm = make_machine();
  fsm.add_exit_hook(Light::Red, [](Journal&) {
    return Fsm::fail(Fsm::Error::transition_failure());
  });
  fsm.add_transition(Light::Red, Cue::Fault, Light::Yellow,
                     [](Journal&, const Cue&, std::optional<std::monostate>) {
                       return Fsm::emit(Cue::Hold);
                     });

  // The handler of a self transition runs without hooks and emits Hold;
  // the failing exit hook aborts the second step.
  fsm.add_transition(Light::Red, Cue::Hold, Light::Red,
                     [](Journal&, const Cue&, std::optional<std::monostate>) {
                       return Fsm::emit(Cue::Hold);
                     });
  REQUIRE(fsm.enqueue(Fsm::Events{{Cue::Hold, std::nullopt},
                                  {Cue::Fault, std::nullopt}})
              .has_value());
  auto processed = fsm.process();
  REQUIRE_FALSE(processed.has_value());
  CHECK(fsm.current_state() == Light::Red);
  CHECK(fsm.pending_count() == 1);
}
