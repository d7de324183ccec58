#pragma once

#include "fleetfeast/Forecast.hpp"
#include "fleetfeast/Snapshot.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fleetfeast {

// Everything an external decision-maker sees for one agent cycle.
struct DecisionRequest {
  SnapshotPtr snapshot;

  int horizonMinutes = 60;
  std::vector<ZoneRanking> ranking;

  // Forecast tool calls already answered this cycle (oldest first), and the error
  // text for forecast calls that could not be answered.
  std::vector<ZoneForecast> forecasts;
  std::vector<std::string> toolErrors;

  // 0 for the first call of a cycle, incremented after each forecast round.
  int round = 0;
};

// {"state": <snapshot>, "forecast": {"horizon_minutes", "zones": [...]},
//  "tool_results": [...], "tool_errors": [...], "round": n, "tools": [...]}
std::string DecisionRequestToJson(const DecisionRequest& req);

// Produces one reply per call, in the agent reply format:
//   {"tool": "dispatch_truck", "arguments": {...}}   (or a queue entry, or empty / null)
//
// Called from the agent bridge's worker thread, one call at a time.
class DecisionMaker {
public:
  virtual ~DecisionMaker() = default;

  virtual const char* name() const = 0;

  virtual bool decide(const DecisionRequest& req, std::string& outReply, std::string& outError) = 0;
};

// Deterministic autopilot.
//
// Priorities, first match wins:
//  1) restock an IDLE truck whose inventory is below restockFraction of capacity,
//     when its zone has parking;
//  2) move an idle or serving truck from the weakest occupied zone to the best
//     forecast zone with free parking, when the gain is worth the trip;
//  3) hold.
struct HeuristicConfig {
  double restockFraction = 0.25;

  // The target zone must beat the truck's current zone by this factor and margin.
  double minGainRatio = 1.25;
  double minGainOrders = 0.5;
};

class HeuristicDecisionMaker final : public DecisionMaker {
public:
  explicit HeuristicDecisionMaker(HeuristicConfig cfg = {});

  const char* name() const override { return "heuristic"; }
  bool decide(const DecisionRequest& req, std::string& outReply, std::string& outError) override;

private:
  HeuristicConfig m_cfg;
};

// Runs `<command> <request.json>` through the shell and reads the reply from stdout.
// A non-zero exit status is a failure.
class CommandDecisionMaker final : public DecisionMaker {
public:
  explicit CommandDecisionMaker(std::string command);

  const char* name() const override { return "command"; }
  bool decide(const DecisionRequest& req, std::string& outReply, std::string& outError) override;

private:
  std::string m_command;
};

// kind: heuristic | command | none. "none" yields a null maker (agent disabled).
bool MakeDecisionMaker(const std::string& kind, const std::string& command, std::shared_ptr<DecisionMaker>& out,
                       std::string& outError);

} // namespace fleetfeast
