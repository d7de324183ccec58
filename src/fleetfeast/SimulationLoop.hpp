#pragma once

#include "fleetfeast/ActionQueue.hpp"
#include "fleetfeast/Broadcaster.hpp"
#include "fleetfeast/Sim.hpp"
#include "fleetfeast/StateStore.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace fleetfeast {

struct LoopOptions {
  std::chrono::milliseconds tickPeriod{1000};

  std::string stateKey = "fleet_feast:game_state";

  // Halt after this many consecutive store failures (only with requireDurability).
  bool requireDurability = false;
  int storeFailureLimit = 30;
};

struct LoopStatus {
  bool running = false;
  bool halted = false;
  std::string haltReason;

  std::int64_t tick = 0;
  std::uint64_t ticksRun = 0;
  std::uint64_t overruns = 0;

  int consecutiveStoreFailures = 0;
  std::uint64_t totalStoreFailures = 0;
  std::string lastStoreError;
};

// Fixed-rate driver. Owns the WorldState exclusively; everything else sees the
// snapshots it publishes.
//
// Each period: drain the queue, Simulator::step, publish the snapshot, write it to the
// store. Ticks are never skipped or compressed: an overrunning tick pushes the next one
// to the next period boundary after now.
class SimulationLoop {
public:
  SimulationLoop(Simulator sim, WorldState world, ActionQueue& queue, StateBroadcaster& broadcaster,
                 StateStore* store, LoopOptions opt);
  ~SimulationLoop();

  SimulationLoop(const SimulationLoop&) = delete;
  SimulationLoop& operator=(const SimulationLoop&) = delete;

  // Publishes the current world, then starts the tick thread.
  bool start(std::string& outError);

  // Wakes the thread immediately and joins it.
  void stop();

  bool running() const;
  LoopStatus status() const;

  // One tick boundary on the calling thread. Only valid while the thread is not running.
  TickReport tickOnce();

  // Publish + store the current world without stepping.
  void publishCurrent();

  const Simulator& simulator() const { return m_sim; }

private:
  void run();
  void persist(const SnapshotPtr& snapshot);

  Simulator m_sim;
  WorldState m_world;
  ActionQueue& m_queue;
  StateBroadcaster& m_broadcaster;
  StateStore* m_store = nullptr;
  LoopOptions m_opt;

  std::thread m_thread;

  std::mutex m_waitMutex;
  std::condition_variable m_waitCv;
  bool m_stopRequested = false;

  mutable std::mutex m_statusMutex;
  LoopStatus m_status;
};

} // namespace fleetfeast
