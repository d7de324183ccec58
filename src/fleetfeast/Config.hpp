#pragma once

#include "fleetfeast/World.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace fleetfeast {

// Static description of one zone, as loaded from the city JSON.
struct ZoneConfig {
  std::string id;
  std::string type;

  double baseMultiplier = 0.0;
  double peakMultiplier = 1.0;
  double maxOrders = 0.0;

  std::vector<PeakWindow> peakHours;

  // Minutes to every other zone. Must be symmetric and complete.
  std::map<std::string, int> travelCost;

  int parkingCapacity = 1;
};

struct TruckConfig {
  std::string id;
  std::string startZone;

  // Empty => restock where the truck starts.
  std::string restockZone;

  int inventory = 0;
  int maxInventory = 0;
  double speedMultiplier = 1.0;

  double unitPrice = 100.0;
  double restockFixedFee = 200.0;
  double restockPerUnitCost = 30.0;
};

struct CityConfig {
  std::vector<ZoneConfig> zones;
  std::vector<TruckConfig> trucks;
};

// Five zones and three trucks.
CityConfig DefaultCity();

// Everything that determines WorldState(t+1) from WorldState(t) and the actions.
// Two runs with equal SimConfig and equal action streams produce identical worlds.
struct SimConfig {
  // Minutes (ticks) per simulated day.
  int dayLength = kDefaultDayLength;

  std::uint64_t seed = 1;

  // Relative demand noise amplitude, in [0, 1).
  double noiseAmplitude = 0.10;

  // Per-zone demand history length.
  int historyCap = 60;

  // Ticks a truck spends restocking.
  int restockTicks = 10;

  // Number of action outcomes kept in the world (and every snapshot).
  int actionLogCap = 20;

  CityConfig city = DefaultCity();
};

// Process-level settings for the server binary.
struct ServerConfig {
  SimConfig sim;

  int tickMs = 1000;

  int agentPeriodMs = 30000;
  int agentTimeoutMs = 10000;

  // Forecast horizon the agent bridge ranks zones over, in minutes.
  int forecastHorizonMinutes = 60;

  // Forecast tool calls answered per agent cycle before the cycle gives up and holds.
  int maxToolRounds = 3;

  // heuristic | command | none
  std::string agent = "heuristic";
  std::string agentCommand;

  // Empty => in-memory store.
  std::string storeDir;
  std::string stateKey = "fleet_feast:game_state";
  std::string queueName = "pending_actions";

  bool requireDurability = false;
  int storeFailureLimit = 30;

  int subscriberQueue = 8;

  std::string httpHost = "0.0.0.0";
  int httpPort = 8000;

  std::string cityPath;

  std::string logFile;
  int logKeepFiles = 3;
  std::string logLevel = "info";
};

} // namespace fleetfeast
