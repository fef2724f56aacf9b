#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace efsm {

enum class Direction : unsigned { Enter, Exit };

[[nodiscard]] constexpr const char* to_string(Direction direction) noexcept {
  return direction == Direction::Enter ? "Enter" : "Exit";
}

}  // namespace efsm

namespace efsm::detail {

inline constexpr std::size_t hash_combine(std::size_t seed,
                                          std::size_t value) noexcept {
  return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

template <typename A, typename B>
struct pair_key {
  A first;
  B second;

  bool operator==(const pair_key&) const = default;
};

template <typename A, typename B>
struct pair_key_hash {
  std::size_t operator()(const pair_key<A, B>& key) const {
    return hash_combine(std::hash<A>{}(key.first), std::hash<B>{}(key.second));
  }
};

// Visits the entries of `entries` in registration order. Each entry carries
// the sequence number it was (last) inserted with.
template <typename Map, typename F>
void for_each_in_order(const Map& entries, F&& fn) {
  std::vector<const typename Map::value_type*> ordered;
  ordered.reserve(entries.size());
  for (const auto& item : entries) ordered.push_back(&item);
  std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
    return a->second.sequence < b->second.sequence;
  });
  for (const auto* item : ordered) {
    fn(item->first.first, item->first.second, item->second);
  }
}

// --- Transition table: (state, event) -> (target, handler, name) ---

template <typename State, typename Handler>
struct transition_entry {
  State target;
  Handler handler;
  std::optional<std::string> name;
  std::size_t sequence = 0;
};

template <typename State, typename Event, typename Handler>
class transition_table {
 public:
  using key_type = pair_key<State, Event>;
  using entry_type = transition_entry<State, Handler>;

  // Returns true when the slot was empty, false when an existing entry was
  // replaced.
  bool insert(State state, Event event, State target, Handler handler,
              std::optional<std::string> name) {
    auto [it, inserted] = entries_.insert_or_assign(
        key_type{std::move(state), std::move(event)},
        entry_type{std::move(target), std::move(handler), std::move(name),
                   next_sequence_++});
    (void)it;
    return inserted;
  }

  [[nodiscard]] const entry_type* find(const State& state,
                                       const Event& event) const {
    auto it = entries_.find(key_type{state, event});
    return it == entries_.end() ? nullptr : &it->second;
  }

  // Registration order; an overwritten entry moves to the end.
  template <typename F>
  void for_each(F&& fn) const {
    for_each_in_order(entries_, std::forward<F>(fn));
  }

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

 private:
  std::unordered_map<key_type, entry_type, pair_key_hash<State, Event>>
      entries_;
  std::size_t next_sequence_ = 0;
};

// --- Entry/exit table: (state, direction) -> (hook, name) ---

template <typename Hook>
struct entry_exit_entry {
  Hook hook;
  std::optional<std::string> name;
  std::size_t sequence = 0;
};

template <typename State, typename Hook>
class entry_exit_table {
 public:
  using key_type = pair_key<State, Direction>;
  using entry_type = entry_exit_entry<Hook>;

  bool insert(State state, Direction direction, Hook hook,
              std::optional<std::string> name) {
    auto [it, inserted] = entries_.insert_or_assign(
        key_type{std::move(state), direction},
        entry_type{std::move(hook), std::move(name), next_sequence_++});
    (void)it;
    return inserted;
  }

  [[nodiscard]] const entry_type* find(const State& state,
                                       Direction direction) const {
    auto it = entries_.find(key_type{state, direction});
    return it == entries_.end() ? nullptr : &it->second;
  }

  // Registration order; an overwritten entry moves to the end.
  template <typename F>
  void for_each(F&& fn) const {
    for_each_in_order(entries_, std::forward<F>(fn));
  }

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

 private:
  std::unordered_map<key_type, entry_type, pair_key_hash<State, Direction>>
      entries_;
  std::size_t next_sequence_ = 0;
};

}  // namespace efsm::detail
