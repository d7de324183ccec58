#include "fleetfeast/Broadcaster.hpp"

#include <algorithm>
#include <utility>

namespace fleetfeast {

Subscription::Subscription(std::size_t capacity)
    : m_capacity(std::max<std::size_t>(1, capacity))
{
}

SnapshotPtr Subscription::next(std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lock(m_mutex);
  m_cv.wait_for(lock, timeout, [this] { return !m_items.empty() || m_closed; });
  if (m_items.empty()) return nullptr;

  SnapshotPtr s = std::move(m_items.front());
  m_items.pop_front();
  return s;
}

SnapshotPtr Subscription::tryNext()
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_items.empty()) return nullptr;
  SnapshotPtr s = std::move(m_items.front());
  m_items.pop_front();
  return s;
}

void Subscription::close()
{
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
  }
  m_cv.notify_all();
}

bool Subscription::closed() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_closed;
}

std::size_t Subscription::pending() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_items.size();
}

std::uint64_t Subscription::dropped() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_dropped;
}

void Subscription::offer(const SnapshotPtr& s)
{
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) return;
    while (m_items.size() >= m_capacity) {
      m_items.pop_front();
      ++m_dropped;
    }
    m_items.push_back(s);
  }
  m_cv.notify_one();
}

StateBroadcaster::StateBroadcaster(std::size_t queueCapacity)
    : m_capacity(std::max<std::size_t>(1, queueCapacity))
{
}

std::shared_ptr<Subscription> StateBroadcaster::subscribe(bool primeWithLatest)
{
  auto sub = std::make_shared<Subscription>(m_capacity);

  std::lock_guard<std::mutex> lock(m_mutex);
  if (primeWithLatest && m_latest) sub->offer(m_latest);
  m_subs.push_back(sub);
  return sub;
}

void StateBroadcaster::unsubscribe(const std::shared_ptr<Subscription>& sub)
{
  if (!sub) return;
  sub->close();

  std::lock_guard<std::mutex> lock(m_mutex);
  m_subs.erase(std::remove_if(m_subs.begin(), m_subs.end(),
                              [&](const std::weak_ptr<Subscription>& w) {
                                const auto p = w.lock();
                                return !p || p == sub;
                              }),
               m_subs.end());
}

void StateBroadcaster::publish(SnapshotPtr snapshot)
{
  if (!snapshot) return;

  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_latest = snapshot;
    ++m_published;

    targets.reserve(m_subs.size());
    auto out = m_subs.begin();
    for (auto it = m_subs.begin(); it != m_subs.end(); ++it) {
      if (auto p = it->lock()) {
        targets.push_back(std::move(p));
        *out++ = *it;
      }
    }
    m_subs.erase(out, m_subs.end());
  }

  for (const auto& sub : targets) sub->offer(snapshot);
}

SnapshotPtr StateBroadcaster::latest() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_latest;
}

std::size_t StateBroadcaster::subscriberCount() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  std::size_t n = 0;
  for (const auto& w : m_subs) {
    if (!w.expired()) ++n;
  }
  return n;
}

std::uint64_t StateBroadcaster::publishedCount() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_published;
}

void StateBroadcaster::closeAll()
{
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& w : m_subs) {
      if (auto p = w.lock()) targets.push_back(std::move(p));
    }
    m_subs.clear();
  }
  for (const auto& sub : targets) sub->close();
}

} // namespace fleetfeast
