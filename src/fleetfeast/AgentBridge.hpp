#pragma once

#include "fleetfeast/ActionQueue.hpp"
#include "fleetfeast/Broadcaster.hpp"
#include "fleetfeast/DecisionMaker.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace fleetfeast {

struct AgentOptions {
  std::chrono::milliseconds period{30000};

  // Deadline for the whole cycle, forecast rounds included.
  std::chrono::milliseconds timeout{10000};

  int horizonMinutes = 60;
  int maxToolRounds = 3;

  DemandParams demand;
};

enum class CycleOutcome : std::uint8_t {
  Enqueued = 0,
  Hold,       // implicit hold: nothing enqueued
  Timeout,
  Failed,     // decision-maker error or malformed reply
  Busy,       // a previous request is still running
  NoSnapshot,
};

const char* ToString(CycleOutcome o);

struct CycleResult {
  CycleOutcome outcome = CycleOutcome::Hold;
  std::optional<PendingAction> action; // set when Enqueued
  int toolRounds = 0;
  std::string detail;
};

struct AgentStatus {
  bool running = false;
  bool inFlight = false;

  std::uint64_t cycles = 0;
  std::uint64_t enqueued = 0;
  std::uint64_t holds = 0;
  std::uint64_t timeouts = 0;
  std::uint64_t failures = 0;

  std::string lastError;
  std::string lastAction;
};

// Periodically asks the decision-maker for one action and pushes it to the queue.
//
// The decision-maker runs on a worker thread so a slow or hung call never stalls the
// bridge: the cycle holds when the deadline passes, and later cycles keep holding
// until the stale call returns. The bridge only ever reads published snapshots and
// writes to the action queue.
class AgentBridge {
public:
  AgentBridge(std::shared_ptr<DecisionMaker> maker, StateBroadcaster& broadcaster, ActionQueue& queue,
              AgentOptions opt);
  ~AgentBridge();

  AgentBridge(const AgentBridge&) = delete;
  AgentBridge& operator=(const AgentBridge&) = delete;

  bool start(std::string& outError);
  void stop();

  // One cycle on the calling thread.
  CycleResult runCycle();

  AgentStatus status() const;

private:
  struct Worker;

  void run();
  void record(const CycleResult& r);

  std::shared_ptr<DecisionMaker> m_maker;
  StateBroadcaster& m_broadcaster;
  ActionQueue& m_queue;
  AgentOptions m_opt;

  std::shared_ptr<Worker> m_worker;
  std::thread m_thread;

  std::mutex m_waitMutex;
  std::condition_variable m_waitCv;
  bool m_stopRequested = false;

  mutable std::mutex m_statusMutex;
  AgentStatus m_status;
};

} // namespace fleetfeast
