#pragma once

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include "efsm/detail/describe.hpp"
#include "efsm/detail/tables.hpp"
#include "efsm/snapshot.hpp"

namespace efsm {

namespace detail {

// Escapes a label for use inside a quoted DOT string.
inline std::string dot_escape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        out += c;
    }
  }
  return out;
}

inline std::string dot_graph_id(std::string_view name) {
  std::string id = "G";
  for (char c : name) {
    const bool ident = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       (c >= '0' && c <= '9') || c == '_';
    id += ident ? c : '_';
  }
  return id;
}

}  // namespace detail

// Renders a machine snapshot as a Graphviz digraph. States become nodes
// (the initial one a diamond), hooks become dashed "shadow" nodes attached
// to their state. Output order is fixed by label so the same machine
// always renders the same text.
template <typename State, typename Event>
class DotExporter {
 public:
  using Snapshot = efsm::Snapshot<State, Event>;
  using StateLabels = std::unordered_map<State, std::string>;
  using EventLabels = std::unordered_map<Event, std::string>;

  DotExporter(Snapshot snapshot, StateLabels state_labels,
              EventLabels event_labels, std::string graph_name)
      : snapshot_(std::move(snapshot)),
        state_labels_(std::move(state_labels)),
        event_labels_(std::move(event_labels)),
        graph_name_(std::move(graph_name)) {}

  void render(std::ostream& out) const {
    const auto nodes = collect_nodes();

    std::unordered_map<State, std::string> state_ids;
    std::unordered_map<detail::pair_key<State, Direction>, std::string,
                       detail::pair_key_hash<State, Direction>>
        shadow_ids;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
      const auto id = "N" + std::to_string(i);
      if (nodes[i].shadow) {
        shadow_ids.emplace(
            detail::pair_key<State, Direction>{nodes[i].state,
                                               *nodes[i].shadow},
            id);
      } else {
        state_ids.emplace(nodes[i].state, id);
      }
    }

    out << "digraph " << detail::dot_graph_id(graph_name_) << " {\n";

    // --- Nodes ---
    for (std::size_t i = 0; i < nodes.size(); ++i) {
      const auto& node = nodes[i];
      out << "    N" << i << " [label=\"" << detail::dot_escape(node.label)
          << "\"";
      if (node.shadow) {
        out << ", shape=plain, style=dashed";
      } else if (node.state == snapshot_.initial) {
        out << ", shape=diamond";
      } else {
        out << ", shape=oval";
      }
      out << "];\n";
    }

    // --- Edges ---
    std::vector<edge> edges;
    edges.reserve(snapshot_.transitions.size() + snapshot_.hooks.size());
    for (const auto& t : snapshot_.transitions) {
      edges.push_back({state_ids.at(t.from), state_ids.at(t.to),
                       detail::dot_escape(t.name.value_or("")) + "\\n|" +
                           detail::dot_escape(event_label(t.event)) + "|",
                       state_label(t.from)});
    }
    for (const auto& h : snapshot_.hooks) {
      const auto& shadow =
          shadow_ids.at(detail::pair_key<State, Direction>{h.state,
                                                           h.direction});
      const auto& state = state_ids.at(h.state);
      auto label = detail::dot_escape(h.name.value_or(""));
      if (h.direction == Direction::Enter) {
        edges.push_back({shadow, state, std::move(label), state_label(h.state)});
      } else {
        edges.push_back({state, shadow, std::move(label), state_label(h.state)});
      }
    }
    std::stable_sort(edges.begin(), edges.end(),
                     [](const edge& a, const edge& b) {
                       return std::tie(a.label, a.order, a.from, a.to) <
                              std::tie(b.label, b.order, b.from, b.to);
                     });
    for (const auto& e : edges) {
      out << "    " << e.from << " -> " << e.to << " [label=\"" << e.label
          << "\", dir=both, arrowhead=normal, arrowtail=none];\n";
    }

    out << "}\n";
  }

  // Writes the graph to `path`, or to standard output when no path is
  // given. An empty error code means success.
  [[nodiscard]] std::error_code write(
      const std::optional<std::filesystem::path>& path = std::nullopt) const {
    if (!path) {
      render(std::cout);
      std::cout.flush();
      return std::cout ? std::error_code{}
                       : std::make_error_code(std::errc::io_error);
    }

    errno = 0;
    std::ofstream file(*path, std::ios::out | std::ios::trunc);
    if (!file) return last_error();
    render(file);
    file.close();
    if (!file) return last_error();
    return {};
  }

 private:
  struct node {
    State state;
    std::optional<Direction> shadow;
    std::string label;
    std::string order;
  };

  struct edge {
    std::string from;
    std::string to;
    std::string label;
    std::string order;
  };

  static std::error_code last_error() {
    if (errno != 0) return {errno, std::generic_category()};
    return std::make_error_code(std::errc::io_error);
  }

  [[nodiscard]] std::string state_label(const State& state) const {
    auto it = state_labels_.find(state);
    return it == state_labels_.end() ? "?" : it->second;
  }

  [[nodiscard]] std::string event_label(const Event& event) const {
    auto it = event_labels_.find(event);
    return it == event_labels_.end() ? "" : it->second;
  }

  // State nodes sorted by label, then one shadow node per hook sorted by
  // the label of the state it belongs to. Ties keep registration order.
  [[nodiscard]] std::vector<node> collect_nodes() const {
    std::vector<State> states;
    auto add_state = [&](const State& state) {
      if (std::find(states.begin(), states.end(), state) == states.end()) {
        states.push_back(state);
      }
    };
    add_state(snapshot_.initial);
    for (const auto& t : snapshot_.transitions) {
      add_state(t.from);
      add_state(t.to);
    }
    for (const auto& h : snapshot_.hooks) add_state(h.state);
    // Label-only states come last. Two of them sharing a label and without
    // a printable value keep the label map's order.
    for (const auto& [state, label] : state_labels_) add_state(state);

    std::vector<node> nodes;
    nodes.reserve(states.size() + snapshot_.hooks.size());
    for (const auto& state : states) {
      nodes.push_back(
          {state, std::nullopt, state_label(state), detail::describe(state)});
    }
    auto by_label = [](const node& a, const node& b) {
      return std::tie(a.label, a.order) < std::tie(b.label, b.order);
    };
    std::stable_sort(nodes.begin(), nodes.end(), by_label);

    std::vector<node> shadows;
    shadows.reserve(snapshot_.hooks.size());
    for (const auto& h : snapshot_.hooks) {
      shadows.push_back({h.state, h.direction, to_string(h.direction),
                         state_label(h.state) + '\x1f' +
                             detail::describe(h.state)});
    }
    std::stable_sort(shadows.begin(), shadows.end(),
                     [](const node& a, const node& b) {
                       return std::tie(a.order, a.label) <
                              std::tie(b.order, b.label);
                     });
    nodes.insert(nodes.end(), shadows.begin(), shadows.end());
    return nodes;
  }

  Snapshot snapshot_;
  StateLabels state_labels_;
  EventLabels event_labels_;
  std::string graph_name_;
};

// Convenience wrapper: renders `snapshot` to `path` (standard output when
// empty).
template <typename State, typename Event>
[[nodiscard]] std::error_code write_dot(
    const Snapshot<State, Event>& snapshot,
    const std::unordered_map<State, std::string>& state_labels,
    const std::unordered_map<Event, std::string>& event_labels,
    const std::string& graph_name,
    const std::optional<std::filesystem::path>& path = std::nullopt) {
  return DotExporter<State, Event>(snapshot, state_labels, event_labels,
                                   graph_name)
      .write(path);
}

}  // namespace efsm
