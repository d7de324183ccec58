#include "fleetfeast/AgentBridge.hpp"

#include "fleetfeast/Log.hpp"

#include <utility>

namespace fleetfeast {

// Single-slot job runner. Shared with its thread so a hung decision-maker can be
// abandoned on shutdown without the bridge waiting for it.
struct AgentBridge::Worker {
  std::shared_ptr<DecisionMaker> maker;

  std::mutex mutex;
  std::condition_variable cv;
  bool stop = false;

  bool hasJob = false;
  bool busy = false;
  std::uint64_t jobId = 0;
  DecisionRequest job;

  bool hasResult = false;
  std::uint64_t resultId = 0;
  bool resultOk = false;
  std::string reply;
  std::string error;

  std::thread thread;

  static void Loop(std::shared_ptr<Worker> self)
  {
    while (true) {
      DecisionRequest req;
      std::uint64_t id = 0;
      {
        std::unique_lock<std::mutex> lock(self->mutex);
        self->cv.wait(lock, [&] { return self->stop || self->hasJob; });
        if (self->stop) return;
        req = std::move(self->job);
        id = self->jobId;
        self->hasJob = false;
        self->busy = true;
      }

      std::string reply;
      std::string err;
      const bool ok = self->maker->decide(req, reply, err);

      {
        std::lock_guard<std::mutex> lock(self->mutex);
        self->busy = false;
        self->hasResult = true;
        self->resultId = id;
        self->resultOk = ok;
        self->reply = std::move(reply);
        self->error = std::move(err);
      }
      self->cv.notify_all();
    }
  }

  bool inFlight()
  {
    std::lock_guard<std::mutex> lock(mutex);
    return busy || hasJob;
  }

  // Returns false when a previous job is still pending.
  bool submit(DecisionRequest req, std::uint64_t& outId)
  {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (busy || hasJob) return false;
      job = std::move(req);
      outId = ++jobId;
      hasJob = true;
      hasResult = false;
    }
    cv.notify_all();
    return true;
  }

  bool waitFor(std::uint64_t id, std::chrono::steady_clock::time_point deadline, bool& ok, std::string& outReply,
               std::string& outError)
  {
    std::unique_lock<std::mutex> lock(mutex);
    if (!cv.wait_until(lock, deadline, [&] { return hasResult && resultId == id; })) return false;
    ok = resultOk;
    outReply = std::move(reply);
    outError = std::move(error);
    hasResult = false;
    return true;
  }
};

namespace {

// Empty output or a bare JSON null.
bool IsImplicitHold(const std::string& reply)
{
  const std::size_t first = reply.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return true;
  const std::size_t last = reply.find_last_not_of(" \t\r\n");
  return reply.compare(first, last - first + 1, "null") == 0;
}

} // namespace

const char* ToString(CycleOutcome o)
{
  switch (o) {
  case CycleOutcome::Enqueued: return "enqueued";
  case CycleOutcome::Hold: return "hold";
  case CycleOutcome::Timeout: return "timeout";
  case CycleOutcome::Failed: return "failed";
  case CycleOutcome::Busy: return "busy";
  case CycleOutcome::NoSnapshot: return "no-snapshot";
  default: return "unknown";
  }
}

AgentBridge::AgentBridge(std::shared_ptr<DecisionMaker> maker, StateBroadcaster& broadcaster, ActionQueue& queue,
                         AgentOptions opt)
    : m_maker(std::move(maker))
    , m_broadcaster(broadcaster)
    , m_queue(queue)
    , m_opt(std::move(opt))
{
  if (m_maker) {
    m_worker = std::make_shared<Worker>();
    m_worker->maker = m_maker;
    m_worker->thread = std::thread(&Worker::Loop, m_worker);
  }
}

AgentBridge::~AgentBridge()
{
  stop();

  if (m_worker) {
    {
      std::lock_guard<std::mutex> lock(m_worker->mutex);
      m_worker->stop = true;
    }
    m_worker->cv.notify_all();

    // A call that is still running (e.g. a hung external command) is left to finish on
    // its own; the worker state outlives the bridge through the shared_ptr.
    if (m_worker->inFlight()) {
      LogWarn("agent", "abandoning in-flight decision on shutdown");
      m_worker->thread.detach();
    } else if (m_worker->thread.joinable()) {
      m_worker->thread.join();
    }
  }
}

bool AgentBridge::start(std::string& outError)
{
  outError.clear();
  if (!m_maker) {
    outError = "agent bridge has no decision maker";
    return false;
  }
  if (m_thread.joinable()) {
    outError = "agent bridge already started";
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(m_waitMutex);
    m_stopRequested = false;
  }
  {
    std::lock_guard<std::mutex> lock(m_statusMutex);
    m_status.running = true;
  }
  m_thread = std::thread([this] { run(); });
  return true;
}

void AgentBridge::stop()
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

AgentStatus AgentBridge::status() const
{
  std::lock_guard<std::mutex> lock(m_statusMutex);
  AgentStatus s = m_status;
  s.inFlight = m_worker && m_worker->inFlight();
  return s;
}

CycleResult AgentBridge::runCycle()
{
  CycleResult r;
  if (!m_worker) {
    r.outcome = CycleOutcome::Hold;
    r.detail = "agent disabled";
    return r;
  }

  if (m_worker->inFlight()) {
    r.outcome = CycleOutcome::Busy;
    r.detail = "previous decision still running";
    record(r);
    return r;
  }

  DecisionRequest req;
  req.snapshot = m_broadcaster.latest();
  if (!req.snapshot) {
    r.outcome = CycleOutcome::NoSnapshot;
    r.detail = "no snapshot published yet";
    record(r);
    return r;
  }
  req.horizonMinutes = m_opt.horizonMinutes;
  req.ranking = RankZones(req.snapshot->world, m_opt.demand, m_opt.horizonMinutes);

  const auto deadline = std::chrono::steady_clock::now() + m_opt.timeout;

  for (int round = 0; round <= m_opt.maxToolRounds; ++round) {
    req.round = round;

    std::uint64_t id = 0;
    if (!m_worker->submit(req, id)) {
      r.outcome = CycleOutcome::Busy;
      r.detail = "previous decision still running";
      record(r);
      return r;
    }

    bool ok = false;
    std::string reply;
    std::string err;
    if (!m_worker->waitFor(id, deadline, ok, reply, err)) {
      r.outcome = CycleOutcome::Timeout;
      r.detail = "no decision within " + std::to_string(m_opt.timeout.count()) + " ms";
      record(r);
      return r;
    }
    if (!ok) {
      r.outcome = CycleOutcome::Failed;
      r.detail = m_maker->name() + std::string(" failed: ") + err;
      record(r);
      return r;
    }

    PendingAction action;
    if (!ParseAgentReply(reply, action, err)) {
      r.outcome = CycleOutcome::Failed;
      r.detail = err;
      record(r);
      return r;
    }

    if (const auto* f = std::get_if<ForecastAction>(&action)) {
      // Answered from the same snapshot, then the decision-maker is asked again.
      ZoneForecast zf;
      if (ForecastZone(req.snapshot->world, m_opt.demand, f->zoneId, f->hoursAhead, zf, err)) {
        req.forecasts.push_back(std::move(zf));
      } else {
        req.toolErrors.push_back("get_zone_forecast(" + f->zoneId + "): " + err);
      }
      ++r.toolRounds;
      continue;
    }

    if (IsImplicitHold(reply)) {
      r.outcome = CycleOutcome::Hold;
      r.detail = "empty reply";
      record(r);
      return r;
    }

    m_queue.push(action);
    r.outcome = CycleOutcome::Enqueued;
    r.detail = ActionToJson(action);
    r.action = std::move(action);
    record(r);
    return r;
  }

  r.outcome = CycleOutcome::Hold;
  r.detail = "forecast round limit reached";
  record(r);
  return r;
}

void AgentBridge::record(const CycleResult& r)
{
  std::lock_guard<std::mutex> lock(m_statusMutex);
  ++m_status.cycles;
  switch (r.outcome) {
  case CycleOutcome::Enqueued:
    ++m_status.enqueued;
    m_status.lastAction = r.detail;
    LogInfo("agent", "enqueued " + r.detail);
    return;
  case CycleOutcome::Timeout:
    ++m_status.timeouts;
    ++m_status.holds;
    break;
  case CycleOutcome::Failed:
    ++m_status.failures;
    ++m_status.holds;
    break;
  default:
    ++m_status.holds;
    break;
  }

  if (r.outcome == CycleOutcome::Hold) {
    LogDebug("agent", "hold: " + r.detail);
    return;
  }
  m_status.lastError = r.detail;
  LogWarn("agent", std::string(ToString(r.outcome)) + ", holding: " + r.detail);
}

void AgentBridge::run()
{
  LogInfo("agent", std::string("agent bridge started (") + m_maker->name() + ", period " +
                       std::to_string(m_opt.period.count()) + " ms)");

  while (true) {
    {
      std::unique_lock<std::mutex> lock(m_waitMutex);
      if (m_waitCv.wait_for(lock, m_opt.period, [this] { return m_stopRequested; })) break;
    }
    runCycle();
  }

  LogInfo("agent", "agent bridge stopped");
}

} // namespace fleetfeast
