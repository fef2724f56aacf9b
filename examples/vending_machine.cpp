#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>

#include "efsm/dot.hpp"
#include "efsm/efsm.hpp"
#include "efsm/logging.hpp"

namespace {

enum class State { Closed, Checking, Open };
enum class Event { GotCoin, AcceptMoney, RejectMoney, Timeout };
enum class Coin { Good, Bad };

struct Counters {
  unsigned coins = 0;
  unsigned opened = 0;
  unsigned closed = 0;
};

using Fsm = efsm::Machine<State, Event, Counters, Coin>;

void build(Fsm& fsm) {
  fsm.add_transition(
      State::Closed, Event::GotCoin, State::Checking,
      [](Counters&, const Event& event,
         std::optional<Coin> coin) -> Fsm::TransitionResult {
        if (!coin) {
          return Fsm::fail(
              Fsm::Error::internal(event, State::Closed, "coin missing"));
        }
        return *coin == Coin::Good ? Fsm::emit(Event::AcceptMoney)
                                   : Fsm::emit(Event::RejectMoney);
      },
      "ProcessCoin");
  fsm.add_transition(
      State::Checking, Event::AcceptMoney, State::Open,
      [](Counters& c, const Event&, std::optional<Coin>) {
        ++c.coins;
        return Fsm::done();
      },
      "Accepted");

  auto nothing = [](Counters&, const Event&, std::optional<Coin>) {
    return Fsm::done();
  };
  fsm.add_transition(State::Checking, Event::RejectMoney, State::Closed,
                     nothing, "Rejected");
  fsm.add_transition(State::Checking, Event::GotCoin, State::Checking,
                     nothing, "IgnoreAnotherCoin");
  fsm.add_transition(State::Open, Event::Timeout, State::Closed, nothing,
                     "TimeOut");

  fsm.add_entry_hook(
      State::Open,
      [](Counters& c) {
        ++c.opened;
        return Fsm::done();
      },
      "CountOpens");
  fsm.add_exit_hook(
      State::Open,
      [](Counters& c) {
        ++c.closed;
        return Fsm::done();
      },
      "CountClose");
}

bool drain(Fsm& fsm) {
  while (fsm.pending()) {
    auto processed = fsm.process();
    if (!processed) {
      std::cerr << "coin still failed: " << processed.error().to_string()
                << '\n';
      return false;
    }
  }
  return true;
}

}  // namespace

// Drives a coin operated still through a few coins and a timeout, then
// prints its graph. Set SPDLOG_LEVEL=efsm=trace to follow every step.
int main() {
  efsm::logging::configure_from_env();

  Fsm fsm(State::Closed, Counters{}, "coin_still");
  build(fsm);

  if (!fsm.enqueue(Fsm::Events{{Event::GotCoin, Coin::Bad},
                               {Event::GotCoin, Coin::Good}})) {
    return 1;
  }
  if (!drain(fsm)) return 1;
  // The good coin arrived while the bad one was being checked and was
  // ignored.
  std::cout << "after coins: opened=" << fsm.extended_state().opened << '\n';

  if (!fsm.enqueue(Event::GotCoin, Coin::Good) || !drain(fsm)) return 1;
  if (!fsm.enqueue(Event::Timeout) || !drain(fsm)) return 1;

  const auto& counters = fsm.extended_state();
  std::cout << "coins=" << counters.coins << " opened=" << counters.opened
            << " closed=" << counters.closed << '\n';

  const std::unordered_map<State, std::string> states{
      {State::Closed, "Closed"},
      {State::Checking, "Checking"},
      {State::Open, "Open"}};
  const std::unordered_map<Event, std::string> events{
      {Event::GotCoin, "GotCoin"},
      {Event::AcceptMoney, "AcceptMoney"},
      {Event::RejectMoney, "RejectMoney"},
      {Event::Timeout, "Timeout"}};
  if (auto ec = efsm::write_dot(fsm.snapshot(), states, events, fsm.name())) {
    std::cerr << "cannot write graph: " << ec.message() << '\n';
    return 1;
  }
  return 0;
}
