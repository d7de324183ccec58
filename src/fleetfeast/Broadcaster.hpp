#pragma once

#include "fleetfeast/Snapshot.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace fleetfeast {

// One observer's bounded inbox. When full, the oldest unread snapshot is dropped.
class Subscription {
public:
  explicit Subscription(std::size_t capacity);

  // Blocks up to `timeout` for the next snapshot. Returns nullptr on timeout or once
  // the subscription is closed and drained.
  SnapshotPtr next(std::chrono::milliseconds timeout);

  // Non-blocking variant.
  SnapshotPtr tryNext();

  void close();
  bool closed() const;

  std::size_t pending() const;
  std::uint64_t dropped() const;

private:
  friend class StateBroadcaster;

  void offer(const SnapshotPtr& s);

  const std::size_t m_capacity;

  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque<SnapshotPtr> m_items;
  bool m_closed = false;
  std::uint64_t m_dropped = 0;
};

// Fans published snapshots out to any number of subscribers.
//
// publish() never blocks on a subscriber: it copies the subscriber list, releases the
// list lock, then offers the same immutable snapshot to each inbox. Subscriptions are
// held weakly, so a disconnected observer that drops its shared_ptr simply stops
// receiving.
class StateBroadcaster {
public:
  explicit StateBroadcaster(std::size_t queueCapacity = 8);

  // primeWithLatest: start the inbox with the most recent snapshot, if any.
  std::shared_ptr<Subscription> subscribe(bool primeWithLatest = false);
  void unsubscribe(const std::shared_ptr<Subscription>& sub);

  void publish(SnapshotPtr snapshot);

  SnapshotPtr latest() const;

  std::size_t subscriberCount() const;
  std::uint64_t publishedCount() const;

  // Closes every inbox so blocked readers wake up (used on shutdown).
  void closeAll();

private:
  const std::size_t m_capacity;

  mutable std::mutex m_mutex;
  std::vector<std::weak_ptr<Subscription>> m_subs;
  SnapshotPtr m_latest;
  std::uint64_t m_published = 0;
};

} // namespace fleetfeast
