#include "fleetfeast/ActionQueue.hpp"

#include <utility>

namespace fleetfeast {

ActionQueue::ActionQueue(std::string name)
    : m_name(std::move(name))
{
}

void ActionQueue::push(PendingAction action)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  m_items.push_back(std::move(action));
  ++m_pushed;
}

void ActionQueue::pushAll(std::vector<PendingAction> actions)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  for (PendingAction& a : actions) m_items.push_back(std::move(a));
  m_pushed += actions.size();
}

std::vector<PendingAction> ActionQueue::drain()
{
  std::deque<PendingAction> taken;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    taken.swap(m_items);
  }

  std::vector<PendingAction> out;
  out.reserve(taken.size());
  for (PendingAction& a : taken) out.push_back(std::move(a));
  return out;
}

std::size_t ActionQueue::size() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_items.size();
}

std::uint64_t ActionQueue::pushedTotal() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_pushed;
}

} // namespace fleetfeast
