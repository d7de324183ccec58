#include "fleetfeast/ConfigIO.hpp"

#include "fleetfeast/Env.hpp"
#include "fleetfeast/FileSync.hpp"
#include "fleetfeast/Log.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <set>
#include <sstream>

namespace fleetfeast {

namespace {

bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!std::isfinite(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  double d = static_cast<double>(io);
  if (!ApplyF64(root, key, d, err)) return false;
  if (d < -2147483648.0 || d > 2147483647.0) {
    err = std::string("integer out of range for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(std::lround(d));
  return true;
}

bool ApplyString(const JsonValue& root, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

// Seeds are accepted as numbers or as strings ("12345", "0xBEEF") since JSON doubles
// cannot hold every 64-bit value.
bool ApplySeed(const JsonValue& root, const char* key, std::uint64_t& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (v->isNumber()) {
    if (!std::isfinite(v->numberValue) || v->numberValue < 0.0 || v->numberValue >= 18446744073709551616.0) {
      err = std::string("expected non-negative seed for key '") + key + "'";
      return false;
    }
    io = static_cast<std::uint64_t>(v->numberValue);
    return true;
  }
  if (v->isString()) {
    const std::string& s = v->stringValue;
    int base = 10;
    std::size_t start = 0;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
      base = 16;
      start = 2;
    }
    const char* digits = s.c_str() + start;
    char* end = nullptr;
    errno = 0;
    const unsigned long long parsed = std::strtoull(digits, &end, base);
    if (errno != 0 || *digits == '\0' || *digits == '-' || !end || *end != '\0') {
      err = std::string("invalid seed string for key '") + key + "': " + s;
      return false;
    }
    io = static_cast<std::uint64_t>(parsed);
    return true;
  }
  err = std::string("expected number or string for key '") + key + "'";
  return false;
}

bool ApplyPeakHours(const JsonValue& zone, std::vector<PeakWindow>& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(zone, "peak_hours");
  if (!v) return true;
  if (!v->isArray()) {
    err = "expected array for key 'peak_hours'";
    return false;
  }

  std::vector<PeakWindow> windows;
  for (const JsonValue& w : v->arrayValue) {
    if (!w.isArray() || w.arrayValue.size() != 2 || !w.arrayValue[0].isNumber() || !w.arrayValue[1].isNumber()) {
      err = "peak_hours entries must be [startMinute, endMinute] pairs";
      return false;
    }
    PeakWindow pw;
    pw.startMinute = static_cast<int>(std::lround(w.arrayValue[0].numberValue));
    pw.endMinute = static_cast<int>(std::lround(w.arrayValue[1].numberValue));
    windows.push_back(pw);
  }
  io = std::move(windows);
  return true;
}

bool ApplyTravelCosts(const JsonValue& zone, std::map<std::string, int>& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(zone, "travel_costs");
  if (!v) v = FindJsonMember(zone, "costs");
  if (!v) return true;
  if (!v->isObject()) {
    err = "expected object for key 'travel_costs'";
    return false;
  }

  for (const auto& kv : v->objectValue) {
    if (!kv.second.isNumber() || !std::isfinite(kv.second.numberValue)) {
      err = "travel cost to '" + kv.first + "' must be a number";
      return false;
    }
    io[kv.first] = static_cast<int>(std::lround(kv.second.numberValue));
  }
  return true;
}

bool ApplyZoneJson(const JsonValue& v, ZoneConfig& z, std::string& err)
{
  if (!ApplyString(v, "type", z.type, err)) return false;
  if (!ApplyF64(v, "base_multiplier", z.baseMultiplier, err)) return false;
  if (!ApplyF64(v, "peak_multiplier", z.peakMultiplier, err)) return false;
  if (!ApplyF64(v, "max_orders", z.maxOrders, err)) return false;
  if (!ApplyI32(v, "num_of_parking_spots", z.parkingCapacity, err)) return false;
  if (!ApplyI32(v, "parking_capacity", z.parkingCapacity, err)) return false;
  if (!ApplyPeakHours(v, z.peakHours, err)) return false;
  if (!ApplyTravelCosts(v, z.travelCost, err)) return false;
  return true;
}

bool ApplyTruckJson(const JsonValue& v, TruckConfig& t, std::string& err)
{
  if (!ApplyString(v, "current_zone", t.startZone, err)) return false;
  if (!ApplyString(v, "restock_zone", t.restockZone, err)) return false;
  if (!ApplyI32(v, "inventory", t.inventory, err)) return false;
  if (!ApplyI32(v, "max_inventory", t.maxInventory, err)) return false;
  if (!ApplyF64(v, "speed_multiplier", t.speedMultiplier, err)) return false;
  if (!ApplyF64(v, "unit_price", t.unitPrice, err)) return false;
  if (!ApplyF64(v, "restock_fixed_fee", t.restockFixedFee, err)) return false;
  if (!ApplyF64(v, "restock_per_unit_cost", t.restockPerUnitCost, err)) return false;
  return true;
}

template <typename T, typename ApplyFn>
bool ApplyEntries(const JsonValue& root, const char* key, std::vector<T>& io, ApplyFn apply, std::string& err)
{
  const JsonValue* arr = FindJsonMember(root, key);
  if (!arr) return true;
  if (!arr->isArray()) {
    err = std::string("expected array for key '") + key + "'";
    return false;
  }

  for (std::size_t i = 0; i < arr->arrayValue.size(); ++i) {
    const JsonValue& v = arr->arrayValue[i];
    std::string id;
    if (!v.isObject() || !GetJsonString(v, "id", id) || id.empty()) {
      err = std::string(key) + "[" + std::to_string(i) + "] must be an object with a non-empty string 'id'";
      return false;
    }

    T* target = nullptr;
    for (T& existing : io) {
      if (existing.id == id) target = &existing;
    }
    if (!target) {
      io.emplace_back();
      target = &io.back();
      target->id = id;
    }

    std::string entryErr;
    if (!apply(v, *target, entryErr)) {
      err = std::string(key) + " '" + id + "': " + entryErr;
      return false;
    }
  }
  return true;
}

void WriteZone(JsonWriter& w, const ZoneConfig& z)
{
  w.beginObject();
  w.key("id");
  w.stringValue(z.id);
  w.key("type");
  w.stringValue(z.type);
  w.key("base_multiplier");
  w.numberValue(z.baseMultiplier);
  w.key("peak_multiplier");
  w.numberValue(z.peakMultiplier);
  w.key("max_orders");
  w.numberValue(z.maxOrders);
  w.key("num_of_parking_spots");
  w.intValue(z.parkingCapacity);

  w.key("peak_hours");
  w.beginArray();
  for (const PeakWindow& pw : z.peakHours) {
    w.beginArray();
    w.intValue(pw.startMinute);
    w.intValue(pw.endMinute);
    w.endArray();
  }
  w.endArray();

  w.key("travel_costs");
  w.beginObject();
  for (const auto& kv : z.travelCost) {
    w.key(kv.first);
    w.intValue(kv.second);
  }
  w.endObject();
  w.endObject();
}

void WriteTruck(JsonWriter& w, const TruckConfig& t)
{
  w.beginObject();
  w.key("id");
  w.stringValue(t.id);
  w.key("current_zone");
  w.stringValue(t.startZone);
  w.key("restock_zone");
  w.stringValue(t.restockZone);
  w.key("inventory");
  w.intValue(t.inventory);
  w.key("max_inventory");
  w.intValue(t.maxInventory);
  w.key("speed_multiplier");
  w.numberValue(t.speedMultiplier);
  w.key("unit_price");
  w.numberValue(t.unitPrice);
  w.key("restock_fixed_fee");
  w.numberValue(t.restockFixedFee);
  w.key("restock_per_unit_cost");
  w.numberValue(t.restockPerUnitCost);
  w.endObject();
}

bool ValidateZones(const SimConfig& cfg, std::string& err)
{
  const CityConfig& city = cfg.city;
  if (city.zones.empty()) {
    err = "city has no zones";
    return false;
  }

  std::set<std::string> ids;
  for (const ZoneConfig& z : city.zones) {
    if (z.id.empty()) {
      err = "zone with empty id";
      return false;
    }
    if (!ids.insert(z.id).second) {
      err = "duplicate zone id '" + z.id + "'";
      return false;
    }
  }

  for (const ZoneConfig& z : city.zones) {
    const std::string where = "zone '" + z.id + "': ";
    if (!(z.baseMultiplier >= 0.0) || !(z.baseMultiplier <= z.peakMultiplier)) {
      err = where + "multipliers must satisfy 0 <= base_multiplier <= peak_multiplier";
      return false;
    }
    if (!(z.maxOrders >= 0.0) || !std::isfinite(z.maxOrders)) {
      err = where + "max_orders must be >= 0";
      return false;
    }
    if (z.parkingCapacity < 0) {
      err = where + "negative parking capacity";
      return false;
    }
    for (const PeakWindow& pw : z.peakHours) {
      if (pw.startMinute < 0 || pw.startMinute > pw.endMinute || pw.endMinute > cfg.dayLength) {
        std::ostringstream oss;
        oss << where << "peak window [" << pw.startMinute << ", " << pw.endMinute << "] outside 0.." << cfg.dayLength;
        err = oss.str();
        return false;
      }
    }

    for (const auto& kv : z.travelCost) {
      if (ids.find(kv.first) == ids.end()) {
        err = where + "travel cost references unknown zone '" + kv.first + "'";
        return false;
      }
      if (kv.first == z.id) {
        if (kv.second != 0) {
          err = where + "travel cost to itself must be 0";
          return false;
        }
        continue;
      }
      if (kv.second <= 0) {
        err = where + "travel cost to '" + kv.first + "' must be positive";
        return false;
      }
    }

    for (const ZoneConfig& other : city.zones) {
      if (other.id == z.id) continue;
      const auto it = z.travelCost.find(other.id);
      if (it == z.travelCost.end()) {
        err = where + "missing travel cost to '" + other.id + "'";
        return false;
      }
      const auto back = other.travelCost.find(z.id);
      if (back == other.travelCost.end() || back->second != it->second) {
        err = where + "travel cost to '" + other.id + "' is not symmetric";
        return false;
      }
    }
  }
  return true;
}

bool ValidateTrucks(const SimConfig& cfg, std::string& err)
{
  std::set<std::string> zoneIds;
  for (const ZoneConfig& z : cfg.city.zones) zoneIds.insert(z.id);

  std::set<std::string> ids;
  for (const TruckConfig& t : cfg.city.trucks) {
    if (t.id.empty()) {
      err = "truck with empty id";
      return false;
    }
    if (!ids.insert(t.id).second) {
      err = "duplicate truck id '" + t.id + "'";
      return false;
    }

    const std::string where = "truck '" + t.id + "': ";
    if (zoneIds.find(t.startZone) == zoneIds.end()) {
      err = where + "unknown current_zone '" + t.startZone + "'";
      return false;
    }
    if (!t.restockZone.empty() && zoneIds.find(t.restockZone) == zoneIds.end()) {
      err = where + "unknown restock_zone '" + t.restockZone + "'";
      return false;
    }
    if (t.maxInventory < 1 || t.inventory < 0 || t.inventory > t.maxInventory) {
      err = where + "inventory must satisfy 0 <= inventory <= max_inventory, max_inventory >= 1";
      return false;
    }
    if (!(t.speedMultiplier > 0.0) || !std::isfinite(t.speedMultiplier)) {
      err = where + "speed_multiplier must be > 0";
      return false;
    }
    if (t.unitPrice < 0.0 || t.restockFixedFee < 0.0 || t.restockPerUnitCost < 0.0) {
      err = where + "prices and restock costs must be >= 0";
      return false;
    }
  }
  return true;
}

} // namespace

bool ApplyCityConfigJson(const JsonValue& root, SimConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "city JSON must be an object";
    return false;
  }

  std::string err;
  bool replace = false;
  if (!ApplyBool(root, "replace", replace, err) || !ApplyI32(root, "day_length", ioCfg.dayLength, err) ||
      !ApplySeed(root, "seed", ioCfg.seed, err) || !ApplyF64(root, "noise_amplitude", ioCfg.noiseAmplitude, err) ||
      !ApplyI32(root, "history_cap", ioCfg.historyCap, err) ||
      !ApplyI32(root, "restock_ticks", ioCfg.restockTicks, err) ||
      !ApplyI32(root, "action_log_cap", ioCfg.actionLogCap, err)) {
    outError = err;
    return false;
  }

  if (replace) ioCfg.city = CityConfig{};

  if (!ApplyEntries(root, "zones", ioCfg.city.zones, ApplyZoneJson, err) ||
      !ApplyEntries(root, "trucks", ioCfg.city.trucks, ApplyTruckJson, err)) {
    outError = err;
    return false;
  }

  outError.clear();
  return true;
}

bool LoadCityConfigJsonFile(const std::string& path, SimConfig& ioCfg, std::string& outError)
{
  std::string text;
  std::string err;
  if (!ReadFileText(path, text, err)) {
    outError = err;
    return false;
  }

  JsonValue root;
  if (!ParseJson(text, root, err)) {
    outError = path + ": " + err;
    return false;
  }

  if (!ApplyCityConfigJson(root, ioCfg, err)) {
    outError = path + ": " + err;
    return false;
  }

  outError.clear();
  return true;
}

std::string CityConfigToJson(const SimConfig& cfg, int indentSpaces)
{
  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.pretty = indentSpaces > 0;
  opt.indent = indentSpaces;
  JsonWriter w(oss, opt);

  w.beginObject();
  w.key("day_length");
  w.intValue(cfg.dayLength);
  w.key("seed");
  w.stringValue(std::to_string(cfg.seed));
  w.key("noise_amplitude");
  w.numberValue(cfg.noiseAmplitude);
  w.key("history_cap");
  w.intValue(cfg.historyCap);
  w.key("restock_ticks");
  w.intValue(cfg.restockTicks);
  w.key("action_log_cap");
  w.intValue(cfg.actionLogCap);
  w.key("replace");
  w.boolValue(true);

  w.key("zones");
  w.beginArray();
  for (const ZoneConfig& z : cfg.city.zones) WriteZone(w, z);
  w.endArray();

  w.key("trucks");
  w.beginArray();
  for (const TruckConfig& t : cfg.city.trucks) WriteTruck(w, t);
  w.endArray();
  w.endObject();

  oss << "\n";
  return oss.str();
}

bool ApplyEnvironment(ServerConfig& ioCfg, std::string& outError)
{
  std::string err;
  SimConfig& sim = ioCfg.sim;

  const bool ok = ReadEnvInt("FLEETFEAST_TICK_MS", ioCfg.tickMs, err) &&
                  ReadEnvInt("FLEETFEAST_AGENT_PERIOD_MS", ioCfg.agentPeriodMs, err) &&
                  ReadEnvInt("FLEETFEAST_AGENT_TIMEOUT_MS", ioCfg.agentTimeoutMs, err) &&
                  ReadEnvInt("FLEETFEAST_DAY_LENGTH", sim.dayLength, err) &&
                  ReadEnvU64("FLEETFEAST_SEED", sim.seed, err) &&
                  ReadEnvDouble("FLEETFEAST_NOISE", sim.noiseAmplitude, err) &&
                  ReadEnvInt("FLEETFEAST_HISTORY", sim.historyCap, err) &&
                  ReadEnvInt("FLEETFEAST_RESTOCK_TICKS", sim.restockTicks, err) &&
                  ReadEnvInt("FLEETFEAST_FORECAST_HORIZON", ioCfg.forecastHorizonMinutes, err) &&
                  ReadEnvString("FLEETFEAST_STORE_DIR", ioCfg.storeDir) &&
                  ReadEnvString("FLEETFEAST_STATE_KEY", ioCfg.stateKey) &&
                  ReadEnvString("FLEETFEAST_QUEUE", ioCfg.queueName) &&
                  ReadEnvBool("FLEETFEAST_REQUIRE_DURABILITY", ioCfg.requireDurability, err) &&
                  ReadEnvInt("FLEETFEAST_STORE_FAILURE_LIMIT", ioCfg.storeFailureLimit, err) &&
                  ReadEnvInt("FLEETFEAST_SUBSCRIBER_QUEUE", ioCfg.subscriberQueue, err) &&
                  ReadEnvString("FLEETFEAST_HTTP_HOST", ioCfg.httpHost) &&
                  ReadEnvInt("FLEETFEAST_HTTP_PORT", ioCfg.httpPort, err) &&
                  ReadEnvString("FLEETFEAST_AGENT", ioCfg.agent) &&
                  ReadEnvString("FLEETFEAST_AGENT_COMMAND", ioCfg.agentCommand) &&
                  ReadEnvString("FLEETFEAST_CITY", ioCfg.cityPath) &&
                  ReadEnvString("FLEETFEAST_LOG_FILE", ioCfg.logFile) &&
                  ReadEnvString("FLEETFEAST_LOG_LEVEL", ioCfg.logLevel);
  if (!ok) {
    outError = err;
    return false;
  }
  outError.clear();
  return true;
}

bool ValidateSimConfig(const SimConfig& cfg, std::string& outError)
{
  outError.clear();
  if (cfg.dayLength < 1) {
    outError = "day length must be >= 1";
    return false;
  }
  if (!(cfg.noiseAmplitude >= 0.0 && cfg.noiseAmplitude < 1.0)) {
    outError = "noise amplitude must be in [0, 1)";
    return false;
  }
  if (cfg.historyCap < 1) {
    outError = "history cap must be >= 1";
    return false;
  }
  if (cfg.restockTicks < 1) {
    outError = "restock ticks must be >= 1";
    return false;
  }
  if (cfg.actionLogCap < 1) {
    outError = "action log cap must be >= 1";
    return false;
  }

  return ValidateZones(cfg, outError) && ValidateTrucks(cfg, outError);
}

bool ValidateServerConfig(const ServerConfig& cfg, std::string& outError)
{
  outError.clear();
  if (cfg.tickMs < 1 || cfg.agentPeriodMs < 1 || cfg.agentTimeoutMs < 1) {
    outError = "tick, agent period and agent timeout must be >= 1 ms";
    return false;
  }
  if (cfg.forecastHorizonMinutes < 1) {
    outError = "forecast horizon must be >= 1 minute";
    return false;
  }
  if (cfg.maxToolRounds < 0) {
    outError = "max tool rounds must be >= 0";
    return false;
  }
  if (cfg.agent != "heuristic" && cfg.agent != "command" && cfg.agent != "none") {
    outError = "unknown agent '" + cfg.agent + "' (expected heuristic|command|none)";
    return false;
  }
  if (cfg.agent == "command" && cfg.agentCommand.empty()) {
    outError = "agent 'command' requires FLEETFEAST_AGENT_COMMAND";
    return false;
  }
  if (cfg.stateKey.empty() || cfg.queueName.empty()) {
    outError = "state key and queue name must be non-empty";
    return false;
  }
  if (cfg.storeFailureLimit < 1) {
    outError = "store failure limit must be >= 1";
    return false;
  }
  if (cfg.subscriberQueue < 1) {
    outError = "subscriber queue must be >= 1";
    return false;
  }
  if (cfg.httpPort < 0 || cfg.httpPort > 65535) {
    outError = "http port must be in 0..65535";
    return false;
  }
  LogLevel level = LogLevel::Info;
  if (!ParseLogLevel(cfg.logLevel, level)) {
    outError = "unknown log level '" + cfg.logLevel + "'";
    return false;
  }

  return ValidateSimConfig(cfg.sim, outError);
}

} // namespace fleetfeast
