#pragma once

#include "fleetfeast/Action.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace fleetfeast {

// Ordered multi-producer / single-consumer queue of pending agent actions.
//
// Producers (agent bridge, HTTP submissions) push at any time. The simulation loop
// drains everything in one step at the top of a tick; an action pushed after the
// drain waits for the next tick. A batch pushed with pushAll() is never split across
// two drains.
class ActionQueue {
public:
  explicit ActionQueue(std::string name = "pending_actions");

  const std::string& name() const { return m_name; }

  void push(PendingAction action);
  void pushAll(std::vector<PendingAction> actions);

  std::vector<PendingAction> drain();

  std::size_t size() const;

  // Total actions ever pushed.
  std::uint64_t pushedTotal() const;

private:
  std::string m_name;

  mutable std::mutex m_mutex;
  std::deque<PendingAction> m_items;
  std::uint64_t m_pushed = 0;
};

} // namespace fleetfeast
