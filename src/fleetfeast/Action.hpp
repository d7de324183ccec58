#pragma once

#include "fleetfeast/Json.hpp"

#include <string>
#include <variant>
#include <vector>

namespace fleetfeast {

// An empty targetZone means "serve where the truck stands" (queue type "serve").
struct DispatchAction {
  std::string truckId;
  std::string targetZone;
  std::string reasoning;
};

struct RestockAction {
  std::string truckId;
  std::string reasoning;
};

// Read-only. Answered by the agent bridge; never applied from the queue.
struct ForecastAction {
  std::string zoneId;
  int hoursAhead = 1;
  std::string reasoning;
};

struct HoldAction {
  std::string reasoning;
  std::string truckId; // optional
};

using PendingAction = std::variant<DispatchAction, RestockAction, ForecastAction, HoldAction>;

// "dispatch", "serve", "restock", "forecast", "hold".
const char* ActionKind(const PendingAction& a);
const std::string& ActionReasoning(const PendingAction& a);

// Queue entry form:
//   {"type": "dispatch|serve|restock|forecast|hold", "truck_id": ..., "target_zone": ...,
//    "zone_id": ..., "hours_ahead": ..., "reasoning": ...}
bool ParseActionJson(const JsonValue& v, PendingAction& out, std::string& outError);

// Tool-call form {"tool": "dispatch_truck", "arguments": {...}}. Objects with a "type"
// member are parsed as queue entries instead.
bool ParseToolCallJson(const JsonValue& v, PendingAction& out, std::string& outError);

// Decision-maker reply text. Empty or "null" yields HoldAction.
bool ParseAgentReply(const std::string& text, PendingAction& out, std::string& outError);

// Action submission body: one action object or an array of them. All-or-nothing.
bool ParseActionSubmission(const std::string& text, std::vector<PendingAction>& out, std::string& outError);

// Serialize in queue entry form.
void WriteActionJson(JsonWriter& w, const PendingAction& a);
std::string ActionToJson(const PendingAction& a);

} // namespace fleetfeast
