#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace efsm {

// An event together with the payload it carries into its transition
// handler. The payload is owned by the queued event and moved out on
// dispatch.
template <typename Event, typename Payload>
struct QueuedEvent {
  Event event;
  std::optional<Payload> payload{};
};

}  // namespace efsm

namespace efsm::detail {

// Unbounded FIFO of pending events.
template <typename Event, typename Payload>
class event_queue {
 public:
  using value_type = QueuedEvent<Event, Payload>;

  void push(value_type event) { events_.push_back(std::move(event)); }

  // Appends in order and returns the number of events added.
  std::size_t append(std::vector<value_type>&& events) {
    const std::size_t count = events.size();
    events_.insert(events_.end(), std::make_move_iterator(events.begin()),
                   std::make_move_iterator(events.end()));
    events.clear();
    return count;
  }

  // Moves every pending event out, leaving the queue empty.
  [[nodiscard]] std::vector<value_type> take_all() {
    std::vector<value_type> wave;
    wave.reserve(events_.size());
    std::move(events_.begin(), events_.end(), std::back_inserter(wave));
    events_.clear();
    return wave;
  }

  [[nodiscard]] bool empty() const noexcept { return events_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }

 private:
  std::deque<value_type> events_;
};

}  // namespace efsm::detail
