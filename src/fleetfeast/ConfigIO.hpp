#pragma once

#include "fleetfeast/Config.hpp"
#include "fleetfeast/Json.hpp"

#include <string>

namespace fleetfeast {

// JSON helpers for the city file (FLEETFEAST_CITY / --city).
//
// Layout (all keys optional, snake_case):
//   {
//     "day_length": 1440, "seed": 1, "noise_amplitude": 0.1, "history_cap": 60,
//     "restock_ticks": 10, "action_log_cap": 20,
//     "replace": false,
//     "zones":  [{"id": "downtown-1", "type": "downtown", "base_multiplier": 0.2, ...}],
//     "trucks": [{"id": "truck-1", "current_zone": "downtown-1", ...}]
//   }
//
// Merge semantics: missing keys leave the existing config unchanged. Zone and truck
// entries are matched by id; unknown ids are appended. "replace": true starts from an
// empty city instead of the built-in one.

bool ApplyCityConfigJson(const JsonValue& root, SimConfig& ioCfg, std::string& outError);
bool LoadCityConfigJsonFile(const std::string& path, SimConfig& ioCfg, std::string& outError);

// Full config (sim keys + zones + trucks), loadable again by LoadCityConfigJsonFile.
std::string CityConfigToJson(const SimConfig& cfg, int indentSpaces = 2);

// Reads the FLEETFEAST_* variables. Unset variables keep their current value.
bool ApplyEnvironment(ServerConfig& ioCfg, std::string& outError);

// Static checks. Any failure is a fatal configuration error.
bool ValidateSimConfig(const SimConfig& cfg, std::string& outError);
bool ValidateServerConfig(const ServerConfig& cfg, std::string& outError);

} // namespace fleetfeast
