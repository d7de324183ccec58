#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace fleetfeast {

constexpr int kDefaultDayLength = 1440;

// [startMinute, endMinute] minute-of-day range with elevated demand.
struct PeakWindow {
  int startMinute = 0;
  int endMinute = 0;
};

struct Zone {
  std::string id;
  std::string type; // downtown, university, park, stadium, residential, ...

  double baseMultiplier = 0.0;
  double peakMultiplier = 0.0;

  // Orders per minute at full intensity.
  double maxOrders = 0.0;

  std::vector<PeakWindow> peakHours;

  // Travel time in minutes to every zone, indexed by zone index (0 on the diagonal).
  std::vector<int> travelCost;

  int parkingCapacity = 0;

  // Most recent computed demand values, oldest first.
  std::deque<double> demandHistory;
};

enum class TruckStatus : std::uint8_t {
  Idle = 0,
  Moving,
  Serving,
  Restocking,
};

// "IDLE", "MOVING", "SERVING", "RESTOCKING".
const char* ToString(TruckStatus s);
bool ParseTruckStatus(const std::string& s, TruckStatus& out);

struct Truck {
  std::string id;

  TruckStatus status = TruckStatus::Idle;

  // Zone indices into WorldState::zones. destinationZone is -1 unless Moving.
  int currentZone = -1;
  int destinationZone = -1;

  int inventory = 0;
  int maxInventory = 0;

  double speedMultiplier = 1.0;

  double totalRevenue = 0.0;
  double unitPrice = 0.0;
  double restockFixedFee = 0.0;
  double restockPerUnitCost = 0.0;

  int restockZone = -1;

  // Moving: the leg started at departTick and completes at arrivalTick.
  std::int64_t departTick = 0;
  std::int64_t arrivalTick = 0;
  bool restockBound = false;

  // Restocking: completes when the world enters restockFinishTick.
  std::int64_t restockFinishTick = 0;

  // Units sold during the last tick (for snapshots and tests).
  int lastSold = 0;
};

// Result of applying one queued action. Kept in a bounded log so rejections reach the
// agent's next context through the snapshot.
struct ActionOutcome {
  std::int64_t tick = 0;
  std::string kind; // dispatch, serve, restock, forecast, hold
  std::string truckId;
  std::string target;
  bool accepted = false;
  std::string reason;
  std::string reasoning;
};

struct WorldState {
  std::int64_t currentTick = 0;
  int dayLength = kDefaultDayLength;

  std::vector<Zone> zones;
  std::vector<Truck> trucks;

  std::size_t historyCap = 60;

  std::deque<ActionOutcome> recentActions;
  std::size_t actionLogCap = 20;

  int minuteOfDay() const { return MinuteOfDay(currentTick, dayLength); }
  std::int64_t day() const { return currentTick / dayLength; }

  // -1 when not found.
  int findZone(const std::string& id) const;
  int findTruck(const std::string& id) const;

  // Trucks parked at the zone (any status but Moving).
  int occupancy(int zoneIndex) const;

  void pushDemand(int zoneIndex, double demand);
  void recordOutcome(ActionOutcome outcome);

  static int MinuteOfDay(std::int64_t tick, int dayLength)
  {
    if (dayLength <= 0) return 0;
    return static_cast<int>(tick % dayLength);
  }
};

} // namespace fleetfeast
