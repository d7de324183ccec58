#include "fleetfeast/SimulationLoop.hpp"

#include "fleetfeast/Log.hpp"

#include <sstream>
#include <utility>

namespace fleetfeast {

SimulationLoop::SimulationLoop(Simulator sim, WorldState world, ActionQueue& queue, StateBroadcaster& broadcaster,
                               StateStore* store, LoopOptions opt)
    : m_sim(std::move(sim))
    , m_world(std::move(world))
    , m_queue(queue)
    , m_broadcaster(broadcaster)
    , m_store(store)
    , m_opt(std::move(opt))
{
  if (m_opt.tickPeriod.count() < 1) m_opt.tickPeriod = std::chrono::milliseconds(1);
  if (m_opt.storeFailureLimit < 1) m_opt.storeFailureLimit = 1;
  m_status.tick = m_world.currentTick;
}

SimulationLoop::~SimulationLoop()
{
  stop();
}

bool SimulationLoop::start(std::string& outError)
{
  outError.clear();
  if (m_thread.joinable()) {
    outError = "simulation loop already started";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(m_waitMutex);
    m_stopRequested = false;
  }
  {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    if (m_status.halted) {
      outError = "simulation loop halted: " + m_status.haltReason;
      return false;
    }
    m_status.running = true;
  }

  publishCurrent();
  m_thread = std::thread([this] { run(); });
  return true;
}

void SimulationLoop::stop()
{
  {
    std::lock_guard<std::mutex> lock(m_waitMutex);
    m_stopRequested = true;
  }
  m_waitCv.notify_all();

  if (m_thread.joinable()) m_thread.join();

  std::lock_guard<std::mutex> lock(m_statusMutex);
  m_status.running = false;
}

bool SimulationLoop::running() const
{
  std::lock_guard<std::mutex> lock(m_statusMutex);
  return m_status.running;
}

LoopStatus SimulationLoop::status() const
{
  std::lock_guard<std::mutex> lock(m_statusMutex);
  return m_status;
}

void SimulationLoop::publishCurrent()
{
  SnapshotPtr snap = MakeSnapshot(m_world);
  m_broadcaster.publish(snap);
  persist(snap);
}

TickReport SimulationLoop::tickOnce()
{
  const std::vector<PendingAction> actions = m_queue.drain();
  TickReport report = m_sim.step(m_world, actions);

  {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    m_status.tick = m_world.currentTick;
    ++m_status.ticksRun;
  }

  if (LogEnabled(LogLevel::Debug)) {
    std::ostringstream oss;
    oss << "tick " << report.tick << " sold=" << report.sold << " revenue=" << report.revenue
        << " arrivals=" << report.arrivals << " restocks=" << report.restocksCompleted
        << " actions=" << actions.size();
    LogDebug("sim", oss.str());
  }

  publishCurrent();
  return report;
}

void SimulationLoop::persist(const SnapshotPtr& snapshot)
{
  if (!m_store || !snapshot) return;

  std::string err;
  const bool ok = m_store->put(m_opt.stateKey, snapshot->json, err);

  std::lock_guard<std::mutex> lock(m_statusMutex);
  if (ok) {
    if (m_status.consecutiveStoreFailures > 0) {
      LogInfo("sim", "state store recovered after " + std::to_string(m_status.consecutiveStoreFailures) +
                         " failed write(s)");
    }
    m_status.consecutiveStoreFailures = 0;
    m_status.lastStoreError.clear();
    return;
  }

  ++m_status.consecutiveStoreFailures;
  ++m_status.totalStoreFailures;
  m_status.lastStoreError = err;
  LogWarn("sim", "state store write failed (" + std::to_string(m_status.consecutiveStoreFailures) +
                     " consecutive): " + err);

  if (m_opt.requireDurability && m_status.consecutiveStoreFailures >= m_opt.storeFailureLimit) {
    m_status.halted = true;
    m_status.haltReason = "state store unavailable for " + std::to_string(m_status.consecutiveStoreFailures) +
                          " consecutive ticks: " + err;
    LogError("sim", "halting: " + m_status.haltReason);
  }
}

void SimulationLoop::run()
{
  using clock = std::chrono::steady_clock;
  const auto period = std::chrono::duration_cast<clock::duration>(m_opt.tickPeriod);

  LogInfo("sim", "tick loop started at tick " + std::to_string(m_world.currentTick) + ", period " +
                     std::to_string(m_opt.tickPeriod.count()) + " ms");

  auto next = clock::now() + period;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(m_waitMutex);
      if (m_waitCv.wait_until(lock, next, [this] { return m_stopRequested; })) break;
    }

    tickOnce();

    {
      std::lock_guard<std::mutex> lock(m_statusMutex);
      if (m_status.halted) break;
    }

    const auto now = clock::now();
    next += period;
    if (next <= now) {
      const auto behind = (now - next) / period + 1;
      next += period * behind;
      std::lock_guard<std::mutex> lock(m_statusMutex);
      ++m_status.overruns;
    }
  }

  std::lock_guard<std::mutex> lock(m_statusMutex);
  m_status.running = false;
  LogInfo("sim", "tick loop stopped at tick " + std::to_string(m_status.tick));
}

} // namespace fleetfeast
