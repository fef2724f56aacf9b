#pragma once

#include <optional>
#include <string>
#include <vector>

#include "efsm/detail/tables.hpp"

namespace efsm {

// Read-only copy of everything registered on a machine, consumed by
// diagnostics such as the DOT exporter.
template <typename State, typename Event>
struct Snapshot {
  struct TransitionEdge {
    State from;
    Event event;
    State to;
    std::optional<std::string> name;
  };

  struct HookEdge {
    State state;
    Direction direction;
    std::optional<std::string> name;
  };

  State initial;
  std::vector<TransitionEdge> transitions;
  std::vector<HookEdge> hooks;

  [[nodiscard]] bool has_hook(const State& state, Direction direction) const {
    for (const auto& hook : hooks) {
      if (hook.direction == direction && hook.state == state) return true;
    }
    return false;
  }
};

}  // namespace efsm
