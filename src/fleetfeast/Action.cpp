#include "fleetfeast/Action.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace fleetfeast {

namespace {

bool RequireString(const JsonValue& obj, const char* key, std::string& out, std::string& err)
{
  if (!GetJsonString(obj, key, out) || out.empty()) {
    err = std::string("missing or empty string '") + key + "'";
    return false;
  }
  return true;
}

// Optional string member; a present but non-string value is an error.
bool OptionalString(const JsonValue& obj, const char* key, std::string& out, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v || v->isNull()) return true;
  if (!v->isString()) {
    err = std::string("expected string for '") + key + "'";
    return false;
  }
  out = v->stringValue;
  return true;
}

bool ParseHours(const JsonValue& obj, int& out, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, "hours_ahead");
  if (!v || v->isNull()) return true;
  if (!v->isNumber() || !std::isfinite(v->numberValue) || v->numberValue < 1.0 || v->numberValue > 168.0) {
    err = "hours_ahead must be a number in 1..168";
    return false;
  }
  out = static_cast<int>(std::lround(v->numberValue));
  return true;
}

bool ParseDispatch(const JsonValue& obj, const char* zoneKey, PendingAction& out, std::string& err)
{
  DispatchAction a;
  if (!RequireString(obj, "truck_id", a.truckId, err)) return false;
  if (!GetJsonString(obj, zoneKey, a.targetZone) || a.targetZone.empty()) {
    // Accept both spellings regardless of form.
    const char* alt = (std::string(zoneKey) == "target_zone") ? "destination_zone" : "target_zone";
    if (!RequireString(obj, alt, a.targetZone, err)) {
      err = std::string("missing or empty string '") + zoneKey + "'";
      return false;
    }
  }
  if (!OptionalString(obj, "reasoning", a.reasoning, err)) return false;
  out = std::move(a);
  return true;
}

bool ParseServe(const JsonValue& obj, PendingAction& out, std::string& err)
{
  DispatchAction a;
  if (!RequireString(obj, "truck_id", a.truckId, err)) return false;
  if (!OptionalString(obj, "reasoning", a.reasoning, err)) return false;
  out = std::move(a);
  return true;
}

bool ParseRestock(const JsonValue& obj, PendingAction& out, std::string& err)
{
  RestockAction a;
  if (!RequireString(obj, "truck_id", a.truckId, err)) return false;
  if (!OptionalString(obj, "reasoning", a.reasoning, err)) return false;
  out = std::move(a);
  return true;
}

bool ParseForecast(const JsonValue& obj, PendingAction& out, std::string& err)
{
  ForecastAction a;
  if (!RequireString(obj, "zone_id", a.zoneId, err)) return false;
  if (!ParseHours(obj, a.hoursAhead, err)) return false;
  if (!OptionalString(obj, "reasoning", a.reasoning, err)) return false;
  out = std::move(a);
  return true;
}

bool ParseHold(const JsonValue& obj, PendingAction& out, std::string& err)
{
  HoldAction a;
  if (obj.isObject()) {
    if (!OptionalString(obj, "truck_id", a.truckId, err)) return false;
    if (!OptionalString(obj, "reasoning", a.reasoning, err)) return false;
  }
  out = std::move(a);
  return true;
}

} // namespace

const char* ActionKind(const PendingAction& a)
{
  if (const auto* d = std::get_if<DispatchAction>(&a)) return d->targetZone.empty() ? "serve" : "dispatch";
  if (std::holds_alternative<RestockAction>(a)) return "restock";
  if (std::holds_alternative<ForecastAction>(a)) return "forecast";
  return "hold";
}

const std::string& ActionReasoning(const PendingAction& a)
{
  return std::visit([](const auto& x) -> const std::string& { return x.reasoning; }, a);
}

bool ParseActionJson(const JsonValue& v, PendingAction& out, std::string& outError)
{
  outError.clear();
  if (!v.isObject()) {
    outError = "action must be a JSON object";
    return false;
  }

  std::string type;
  if (!GetJsonString(v, "type", type)) {
    outError = "action is missing string 'type'";
    return false;
  }

  if (type == "dispatch") return ParseDispatch(v, "target_zone", out, outError);
  if (type == "serve") return ParseServe(v, out, outError);
  if (type == "restock") return ParseRestock(v, out, outError);
  if (type == "forecast") return ParseForecast(v, out, outError);
  if (type == "hold") return ParseHold(v, out, outError);

  outError = "unknown action type '" + type + "'";
  return false;
}

bool ParseToolCallJson(const JsonValue& v, PendingAction& out, std::string& outError)
{
  outError.clear();
  if (!v.isObject()) {
    outError = "tool call must be a JSON object";
    return false;
  }
  if (FindJsonMember(v, "type")) return ParseActionJson(v, out, outError);

  std::string tool;
  if (!GetJsonString(v, "tool", tool) && !GetJsonString(v, "name", tool)) {
    outError = "tool call is missing string 'tool'";
    return false;
  }

  static const JsonValue kEmptyArgs = JsonValue::MakeObject();
  const JsonValue* args = FindJsonMember(v, "arguments");
  if (!args || args->isNull()) args = &kEmptyArgs;
  if (!args->isObject()) {
    outError = "tool call 'arguments' must be an object";
    return false;
  }

  if (tool == "dispatch_truck") return ParseDispatch(*args, "destination_zone", out, outError);
  if (tool == "start_serving") return ParseServe(*args, out, outError);
  if (tool == "restock_inventory") return ParseRestock(*args, out, outError);
  if (tool == "get_zone_forecast") return ParseForecast(*args, out, outError);
  if (tool == "hold_position") return ParseHold(*args, out, outError);

  outError = "unknown tool '" + tool + "'";
  return false;
}

bool ParseAgentReply(const std::string& text, PendingAction& out, std::string& outError)
{
  outError.clear();

  const std::size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    out = HoldAction{};
    return true;
  }

  JsonValue v;
  if (!ParseJson(text, v, outError)) {
    outError = "malformed reply: " + outError;
    return false;
  }
  if (v.isNull()) {
    out = HoldAction{};
    return true;
  }
  return ParseToolCallJson(v, out, outError);
}

bool ParseActionSubmission(const std::string& text, std::vector<PendingAction>& out, std::string& outError)
{
  out.clear();
  JsonValue v;
  if (!ParseJson(text, v, outError)) return false;

  if (v.isObject()) {
    PendingAction a;
    if (!ParseActionJson(v, a, outError)) return false;
    out.push_back(std::move(a));
    return true;
  }

  if (!v.isArray()) {
    outError = "expected an action object or an array of actions";
    return false;
  }

  std::vector<PendingAction> parsed;
  parsed.reserve(v.arrayValue.size());
  for (std::size_t i = 0; i < v.arrayValue.size(); ++i) {
    PendingAction a;
    std::string err;
    if (!ParseActionJson(v.arrayValue[i], a, err)) {
      outError = "action[" + std::to_string(i) + "]: " + err;
      return false;
    }
    parsed.push_back(std::move(a));
  }
  out = std::move(parsed);
  return true;
}

void WriteActionJson(JsonWriter& w, const PendingAction& a)
{
  w.beginObject();
  w.key("type");
  w.stringValue(ActionKind(a));

  if (const auto* d = std::get_if<DispatchAction>(&a)) {
    w.key("truck_id");
    w.stringValue(d->truckId);
    if (!d->targetZone.empty()) {
      w.key("target_zone");
      w.stringValue(d->targetZone);
    }
  } else if (const auto* r = std::get_if<RestockAction>(&a)) {
    w.key("truck_id");
    w.stringValue(r->truckId);
  } else if (const auto* f = std::get_if<ForecastAction>(&a)) {
    w.key("zone_id");
    w.stringValue(f->zoneId);
    w.key("hours_ahead");
    w.intValue(f->hoursAhead);
  } else if (const auto* h = std::get_if<HoldAction>(&a)) {
    if (!h->truckId.empty()) {
      w.key("truck_id");
      w.stringValue(h->truckId);
    }
  }

  const std::string& reasoning = ActionReasoning(a);
  if (!reasoning.empty()) {
    w.key("reasoning");
    w.stringValue(reasoning);
  }
  w.endObject();
}

std::string ActionToJson(const PendingAction& a)
{
  std::ostringstream oss;
  JsonWriter w(oss);
  WriteActionJson(w, a);
  return oss.str();
}

} // namespace fleetfeast
