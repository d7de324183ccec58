#include "fleetfeast/Action.hpp"
#include "fleetfeast/ActionProcessor.hpp"
#include "fleetfeast/Config.hpp"
#include "fleetfeast/ConfigIO.hpp"
#include "fleetfeast/DecisionMaker.hpp"
#include "fleetfeast/Demand.hpp"
#include "fleetfeast/Fleet.hpp"
#include "fleetfeast/Forecast.hpp"
#include "fleetfeast/Json.hpp"
#include "fleetfeast/Log.hpp"
#include "fleetfeast/Random.hpp"
#include "fleetfeast/Sim.hpp"
#include "fleetfeast/Snapshot.hpp"
#include "fleetfeast/World.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

using namespace fleetfeast;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const double _a = static_cast<double>(a);                                                                       \
    const double _b = static_cast<double>(b);                                                                       \
    if (!(std::fabs(_a - _b) <= (eps))) {                                                                            \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (" << _a   \
                << " vs " << _b << ")\n";                                                                         \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                    \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

// -----------------------------------------------------------------------------------------------
// Fixtures
//
// A three-zone city with flat demand (base == peak, no peak windows) and no noise, so
// demand per tick equals max_orders exactly:
//   downtown 4/min (2 spots), university 8/min (1 spot), park 0/min (1 spot)
// -----------------------------------------------------------------------------------------------

static ZoneConfig FlatZone(const char* id, double maxOrders, int parking)
{
  ZoneConfig z;
  z.id = id;
  z.type = id;
  z.baseMultiplier = 1.0;
  z.peakMultiplier = 1.0;
  z.maxOrders = maxOrders;
  z.parkingCapacity = parking;
  return z;
}

static void Link(SimConfig& cfg, const char* a, const char* b, int minutes)
{
  for (ZoneConfig& z : cfg.city.zones) {
    if (z.id == a) z.travelCost[b] = minutes;
    if (z.id == b) z.travelCost[a] = minutes;
  }
}

static TruckConfig MakeTruck(const char* id, const char* zone, const char* restockZone, int inventory, int maxInventory)
{
  TruckConfig t;
  t.id = id;
  t.startZone = zone;
  t.restockZone = restockZone;
  t.inventory = inventory;
  t.maxInventory = maxInventory;
  t.speedMultiplier = 1.0;
  return t;
}

static SimConfig FlatCity()
{
  SimConfig cfg;
  cfg.noiseAmplitude = 0.0;
  cfg.restockTicks = 5;
  cfg.city = CityConfig{};
  cfg.city.zones.push_back(FlatZone("downtown", 4.0, 2));
  cfg.city.zones.push_back(FlatZone("university", 8.0, 1));
  cfg.city.zones.push_back(FlatZone("park", 0.0, 1));
  Link(cfg, "downtown", "university", 10);
  Link(cfg, "downtown", "park", 20);
  Link(cfg, "university", "park", 15);

  cfg.city.trucks.push_back(MakeTruck("truck-a", "downtown", "downtown", 50, 50));
  cfg.city.trucks.push_back(MakeTruck("truck-b", "university", "downtown", 5, 20));
  cfg.city.trucks.push_back(MakeTruck("truck-c", "park", "park", 2, 10));
  return cfg;
}

static bool Build(const SimConfig& cfg, WorldState& world)
{
  std::string err;
  const bool ok = BuildWorld(cfg, world, err);
  if (!ok) std::cerr << "BuildWorld: " << err << "\n";
  return ok;
}

static const Truck& TruckById(const WorldState& w, const std::string& id)
{
  return w.trucks[static_cast<std::size_t>(w.findTruck(id))];
}

static DispatchAction Dispatch(const char* truck, const char* zone)
{
  DispatchAction d;
  d.truckId = truck;
  d.targetZone = zone;
  return d;
}

static RestockAction Restock(const char* truck)
{
  RestockAction r;
  r.truckId = truck;
  return r;
}

static TickReport Step(const Simulator& sim, WorldState& world, std::vector<PendingAction> actions = {})
{
  return sim.step(world, actions);
}

// -----------------------------------------------------------------------------------------------
// Demand
// -----------------------------------------------------------------------------------------------

static void TestDemandDeterministic()
{
  WorldState world;
  ASSERT_TRUE(Build(SimConfig{}, world));

  DemandParams p;
  p.seed = 0xC0FFEEu;
  p.noiseAmplitude = 0.10;

  for (std::size_t zi = 0; zi < world.zones.size(); ++zi) {
    const Zone& z = world.zones[zi];
    for (std::int64_t t = 0; t < 1440; t += 7) {
      const double a = DemandAt(z, static_cast<int>(zi), t, p);
      const double b = DemandAt(z, static_cast<int>(zi), t, p);
      EXPECT_EQ(a, b);

      // Same minute on the next day.
      EXPECT_EQ(a, DemandAt(z, static_cast<int>(zi), t + 1440, p));
    }
  }

  // A different seed changes the noise somewhere in the day.
  DemandParams q = p;
  q.seed = p.seed + 1;
  bool differs = false;
  for (std::int64_t t = 0; t < 1440 && !differs; ++t) {
    differs = DemandAt(world.zones[0], 0, t, p) != DemandAt(world.zones[0], 0, t, q);
  }
  EXPECT_TRUE(differs);
}

static void TestDemandBoundedNoise()
{
  WorldState world;
  ASSERT_TRUE(Build(SimConfig{}, world));

  DemandParams p;
  p.seed = 7;
  p.noiseAmplitude = 0.10;

  for (std::size_t zi = 0; zi < world.zones.size(); ++zi) {
    const Zone& z = world.zones[zi];
    for (int m = 0; m < 1440; ++m) {
      const double signal = DemandSignal(z, m, 1440);
      const double d = DemandAt(z, static_cast<int>(zi), m, p);
      EXPECT_TRUE(d >= 0.0);
      EXPECT_TRUE(std::fabs(d - signal) <= 0.10 * signal + 1e-9);
    }
  }

  p.noiseAmplitude = 0.0;
  EXPECT_EQ(DemandAt(world.zones[0], 0, 300, p), DemandSignal(world.zones[0], 300, 1440));
}

static void TestDemandPeaks()
{
  WorldState world;
  ASSERT_TRUE(Build(SimConfig{}, world));

  const int downtown = world.findZone("downtown-1");
  ASSERT_TRUE(downtown >= 0);
  const Zone& z = world.zones[static_cast<std::size_t>(downtown)];

  // Centre of the 11:00-14:00 window: full peak level and full boost.
  EXPECT_NEAR(DemandSignal(z, 750, 1440), z.maxOrders * z.peakMultiplier, 1e-9);
  EXPECT_TRUE(DemandSignal(z, 750, 1440) > DemandSignal(z, 300, 1440));
  EXPECT_TRUE(DemandSignal(z, 700, 1440) > DemandSignal(z, 600, 1440));
  EXPECT_NEAR(DemandSignal(z, 300, 1440), z.maxOrders * z.baseMultiplier, 1e-3);

  const int stadium = world.findZone("stadium-1");
  ASSERT_TRUE(stadium >= 0);
  const Zone& s = world.zones[static_cast<std::size_t>(stadium)];
  EXPECT_TRUE(DemandSignal(s, 1200, 1440) > 5.0 * DemandSignal(s, 600, 1440));
}

static void TestDemandHistory()
{
  SimConfig cfg = FlatCity();
  cfg.historyCap = 5;
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));

  // BuildWorld records tick 0.
  for (const Zone& z : world.zones) EXPECT_EQ(z.demandHistory.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(CurrentDemand(world.zones[1]), 8.0);

  Simulator sim(cfg);
  for (int i = 0; i < 3; ++i) Step(sim, world);
  EXPECT_EQ(world.zones[0].demandHistory.size(), static_cast<std::size_t>(4));

  for (int i = 0; i < 10; ++i) Step(sim, world);
  EXPECT_EQ(world.zones[0].demandHistory.size(), static_cast<std::size_t>(5));
  EXPECT_EQ(world.zones[0].demandHistory.back(), 4.0);
  EXPECT_EQ(world.zones[2].demandHistory.back(), 0.0);
}

static void TestClock()
{
  EXPECT_EQ(WorldState::MinuteOfDay(0, 1440), 0);
  EXPECT_EQ(WorldState::MinuteOfDay(1439, 1440), 1439);
  EXPECT_EQ(WorldState::MinuteOfDay(1440, 1440), 0);
  EXPECT_EQ(WorldState::MinuteOfDay(1500, 1440), 60);

  WorldState w;
  w.currentTick = 2 * 1440 + 5;
  EXPECT_EQ(w.day(), static_cast<std::int64_t>(2));
  EXPECT_EQ(w.minuteOfDay(), 5);
}

// -----------------------------------------------------------------------------------------------
// Fleet state machine
// -----------------------------------------------------------------------------------------------

static void TestTravelTicks()
{
  EXPECT_EQ(TravelTicks(10, 1.0), 10);
  EXPECT_EQ(TravelTicks(15, 0.5), 30);
  EXPECT_EQ(TravelTicks(10, 0.8), 13);
  EXPECT_EQ(TravelTicks(10, 3.0), 4);
  EXPECT_EQ(TravelTicks(0, 1.0), 1);
  EXPECT_EQ(TravelTicks(1, 4.0), 1);
}

static void TestDispatchArrivesAndServes()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  // truck-a: IDLE downtown, 50 units; downtown->university is 10 minutes at speed 1.
  TickReport r = Step(sim, world, {Dispatch("truck-a", "university")});
  ASSERT_TRUE(r.outcomes.size() == 1);
  EXPECT_TRUE(r.outcomes[0].accepted);
  EXPECT_TRUE(TruckById(world, "truck-a").status == TruckStatus::Moving);
  EXPECT_EQ(TruckById(world, "truck-a").arrivalTick, static_cast<std::int64_t>(10));

  for (int i = 1; i < 9; ++i) Step(sim, world);
  EXPECT_EQ(world.currentTick, static_cast<std::int64_t>(9));
  EXPECT_TRUE(TruckById(world, "truck-a").status == TruckStatus::Moving);

  r = Step(sim, world);
  EXPECT_EQ(world.currentTick, static_cast<std::int64_t>(10));
  EXPECT_EQ(r.arrivals, 1);
  const Truck& a = TruckById(world, "truck-a");
  EXPECT_TRUE(a.status == TruckStatus::Serving);
  EXPECT_EQ(a.currentZone, world.findZone("university"));
  EXPECT_EQ(a.destinationZone, -1);

  // Arrival tick does not sell.
  EXPECT_EQ(a.inventory, 50);
  EXPECT_EQ(r.sold, 0);
}

static void TestSellOutThenReturnToRestock()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  // truck-b: 5 units at university (demand 8), restocks downtown.
  TickReport r = Step(sim, world, {Dispatch("truck-b", "university")});
  ASSERT_TRUE(r.outcomes.size() == 1);
  EXPECT_TRUE(r.outcomes[0].accepted);

  const Truck& b = TruckById(world, "truck-b");
  EXPECT_EQ(r.sold, 5);
  EXPECT_EQ(b.inventory, 0);
  EXPECT_EQ(b.lastSold, 5);
  EXPECT_NEAR(b.totalRevenue, 500.0, 1e-9);
  EXPECT_TRUE(b.status == TruckStatus::Serving);

  r = Step(sim, world);
  EXPECT_EQ(r.sold, 0);
  EXPECT_TRUE(b.status == TruckStatus::Moving);
  EXPECT_TRUE(b.restockBound);
  EXPECT_EQ(b.destinationZone, world.findZone("downtown"));
  EXPECT_EQ(b.arrivalTick, static_cast<std::int64_t>(2 + 10));

  while (world.currentTick < 12) Step(sim, world);
  EXPECT_TRUE(b.status == TruckStatus::Restocking);
  EXPECT_EQ(b.currentZone, world.findZone("downtown"));
  EXPECT_EQ(b.restockFinishTick, static_cast<std::int64_t>(12 + 5));

  while (world.currentTick < 16) Step(sim, world);
  EXPECT_TRUE(b.status == TruckStatus::Restocking);

  r = Step(sim, world);
  EXPECT_EQ(r.restocksCompleted, 1);
  EXPECT_TRUE(b.status == TruckStatus::Idle);
  EXPECT_EQ(b.inventory, 20);

  // 200 fixed + 30 per unit for 20 units.
  EXPECT_NEAR(r.restockCost, 800.0, 1e-9);
  EXPECT_NEAR(b.totalRevenue, 500.0 - 800.0, 1e-9);
}

static void TestIdleEmptyTruckRestocksInPlace()
{
  SimConfig cfg = FlatCity();
  cfg.city.trucks[2].inventory = 0;
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  Step(sim, world);
  const Truck& c = TruckById(world, "truck-c");
  EXPECT_TRUE(c.status == TruckStatus::Restocking);
  EXPECT_EQ(c.restockFinishTick, static_cast<std::int64_t>(1 + 5));
}

static void TestSharedZoneDemand()
{
  SimConfig cfg = FlatCity();
  // Two full trucks serve university (8/min) together.
  cfg.city.zones[1].parkingCapacity = 2;
  cfg.city.trucks[1].inventory = 20;
  cfg.city.trucks[0].startZone = "university";
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  const TickReport r = Step(sim, world, {Dispatch("truck-a", "university"), Dispatch("truck-b", "university")});
  EXPECT_EQ(r.sold, 8);
  EXPECT_NEAR(r.servedZoneDemand, 8.0, 1e-9);
  EXPECT_EQ(TruckById(world, "truck-a").lastSold + TruckById(world, "truck-b").lastSold, 8);
}

// -----------------------------------------------------------------------------------------------
// Action processor
// -----------------------------------------------------------------------------------------------

static void TestArrivalServesBehindBusyTruck()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  // truck-a serves downtown (4/min) from tick 0; truck-b drives in from university.
  Step(sim, world, {Dispatch("truck-a", "downtown"), Dispatch("truck-b", "downtown")});
  EXPECT_EQ(TruckById(world, "truck-b").arrivalTick, static_cast<std::int64_t>(10));
  for (int i = 1; i < 9; ++i) Step(sim, world);

  // truck-a steps first and takes every order of the arrival tick.
  const TickReport r = Step(sim, world);
  EXPECT_EQ(world.currentTick, static_cast<std::int64_t>(10));
  EXPECT_EQ(r.arrivals, 1);
  EXPECT_EQ(TruckById(world, "truck-a").lastSold, 4);
  const Truck& b = TruckById(world, "truck-b");
  EXPECT_EQ(b.currentZone, world.findZone("downtown"));
  EXPECT_TRUE(b.status == TruckStatus::Serving);

  Step(sim, world);
  EXPECT_TRUE(TruckById(world, "truck-b").status == TruckStatus::Serving);
}

static void TestRestockWhileRestockingRejected()
{
  SimConfig cfg = FlatCity();
  cfg.city.trucks[2].inventory = 0;
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  Step(sim, world);
  const Truck before = TruckById(world, "truck-c");
  ASSERT_TRUE(before.status == TruckStatus::Restocking);

  const std::vector<ActionOutcome> out = ApplyPendingActions(world, {Restock("truck-c")}, sim.fleetParams());
  ASSERT_TRUE(out.size() == 1);
  EXPECT_FALSE(out[0].accepted);
  EXPECT_EQ(out[0].reason, std::string("invalid state for restock"));

  const Truck& after = TruckById(world, "truck-c");
  EXPECT_TRUE(after.status == TruckStatus::Restocking);
  EXPECT_EQ(after.restockFinishTick, before.restockFinishTick);
  EXPECT_EQ(after.inventory, before.inventory);

  const std::vector<ActionOutcome> d = ApplyPendingActions(world, {Dispatch("truck-c", "downtown")}, sim.fleetParams());
  ASSERT_TRUE(d.size() == 1);
  EXPECT_FALSE(d[0].accepted);
  EXPECT_EQ(d[0].reason, std::string("invalid state for dispatch"));
}

static void TestProcessorRejections()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  const FleetParams fp = Simulator(cfg).fleetParams();

  ForecastAction f;
  f.zoneId = "downtown";

  const std::vector<ActionOutcome> out =
      ApplyPendingActions(world,
                          {Dispatch("truck-z", "downtown"), Dispatch("truck-a", "mars"), PendingAction(f),
                           Restock("truck-a"), Restock("nobody")},
                          fp);
  ASSERT_TRUE(out.size() == 5);
  EXPECT_EQ(out[0].reason, std::string("unknown truck"));
  EXPECT_EQ(out[1].reason, std::string("unknown zone"));
  EXPECT_EQ(out[2].reason, std::string("forecast is not queueable"));
  EXPECT_EQ(out[3].reason, std::string("inventory already full"));
  EXPECT_EQ(out[4].reason, std::string("unknown truck"));
  for (const ActionOutcome& o : out) EXPECT_FALSE(o.accepted);

  // Nothing moved, and every outcome reached the log.
  for (const Truck& t : world.trucks) EXPECT_TRUE(t.status == TruckStatus::Idle);
  EXPECT_EQ(world.recentActions.size(), static_cast<std::size_t>(5));
  EXPECT_EQ(world.recentActions.back().kind, std::string("restock"));
}

static void TestHoldIsNoOp()
{
  const SimConfig cfg = FlatCity();
  WorldState a;
  WorldState b;
  ASSERT_TRUE(Build(cfg, a));
  ASSERT_TRUE(Build(cfg, b));
  Simulator sim(cfg);

  HoldAction h;
  h.reasoning = "nothing to do";
  const TickReport r = Step(sim, a, {h});
  Step(sim, b);

  ASSERT_TRUE(r.outcomes.size() == 1);
  EXPECT_TRUE(r.outcomes[0].accepted);
  EXPECT_EQ(r.outcomes[0].kind, std::string("hold"));
  EXPECT_EQ(r.outcomes[0].reasoning, std::string("nothing to do"));

  // Same world apart from the logged outcome.
  a.recentActions.clear();
  EXPECT_EQ(WorldToJson(a), WorldToJson(b));
}

static void TestLastActionPerTruckWins()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  const TickReport r = Step(sim, world, {Dispatch("truck-a", "university"), Dispatch("truck-a", "park")});
  ASSERT_TRUE(r.outcomes.size() == 2);
  EXPECT_TRUE(r.outcomes[0].accepted);
  EXPECT_TRUE(r.outcomes[1].accepted);

  // The second dispatch replaces the first; it does not compound on it.
  const Truck& a = TruckById(world, "truck-a");
  EXPECT_TRUE(a.status == TruckStatus::Moving);
  EXPECT_EQ(a.destinationZone, world.findZone("park"));
  EXPECT_EQ(a.currentZone, world.findZone("downtown"));
  EXPECT_EQ(a.arrivalTick, static_cast<std::int64_t>(20));
}

static void TestRerouteAndTurnBack()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  Step(sim, world, {Dispatch("truck-a", "university")});
  Step(sim, world);
  Step(sim, world);
  ASSERT_TRUE(world.currentTick == 3);

  // Same destination: nothing changes.
  TickReport r = Step(sim, world, {Dispatch("truck-a", "university")});
  ASSERT_TRUE(r.outcomes.size() == 1);
  EXPECT_EQ(r.outcomes[0].reason, std::string("already en route"));
  EXPECT_EQ(TruckById(world, "truck-a").arrivalTick, static_cast<std::int64_t>(10));

  // Turning back takes the 4 ticks already driven.
  r = Step(sim, world, {Dispatch("truck-a", "downtown")});
  EXPECT_TRUE(r.outcomes[0].accepted);
  const Truck& a = TruckById(world, "truck-a");
  EXPECT_EQ(a.destinationZone, world.findZone("downtown"));
  EXPECT_EQ(a.arrivalTick, static_cast<std::int64_t>(4 + 4));

  // Reroute elsewhere: measured from the departure zone at the current tick.
  r = Step(sim, world, {Dispatch("truck-a", "park")});
  EXPECT_TRUE(r.outcomes[0].accepted);
  EXPECT_EQ(a.destinationZone, world.findZone("park"));
  EXPECT_EQ(a.arrivalTick, static_cast<std::int64_t>(5 + 20));
}

static void TestDispatchOntoRestockRun()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  // truck-b sells its 5 units at university, then heads for downtown to restock.
  Step(sim, world, {Dispatch("truck-b", "university")});
  Step(sim, world);
  const Truck& b = TruckById(world, "truck-b");
  ASSERT_TRUE(b.status == TruckStatus::Moving);
  EXPECT_TRUE(b.restockBound);
  EXPECT_EQ(b.destinationZone, world.findZone("downtown"));
  EXPECT_EQ(b.departTick, static_cast<std::int64_t>(2));
  EXPECT_EQ(b.arrivalTick, static_cast<std::int64_t>(12));

  // Dispatching to the same zone keeps the trip and drops the restock intent.
  const TickReport r = Step(sim, world, {Dispatch("truck-b", "downtown")});
  ASSERT_TRUE(r.outcomes.size() == 1);
  EXPECT_TRUE(r.outcomes[0].accepted);
  EXPECT_FALSE(b.restockBound);
  EXPECT_EQ(b.departTick, static_cast<std::int64_t>(2));
  EXPECT_EQ(b.arrivalTick, static_cast<std::int64_t>(12));

  while (world.currentTick < 12) Step(sim, world);
  EXPECT_EQ(b.currentZone, world.findZone("downtown"));
  // Still empty, so it restocks where it stands.
  EXPECT_TRUE(b.status == TruckStatus::Restocking);
}

static void TestServeInPlace()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  PendingAction serve;
  std::string err;
  ASSERT_TRUE(ParseAgentReply(R"({"tool": "start_serving", "arguments": {"truck_id": "truck-b"}})", serve, err));

  TickReport r = Step(sim, world, {serve, Dispatch("truck-a", "park")});
  ASSERT_TRUE(r.outcomes.size() == 2);
  EXPECT_TRUE(r.outcomes[0].accepted);
  EXPECT_EQ(r.outcomes[0].kind, std::string("serve"));
  EXPECT_EQ(r.outcomes[0].target, std::string("university"));
  EXPECT_TRUE(TruckById(world, "truck-b").status == TruckStatus::Serving);
  EXPECT_EQ(TruckById(world, "truck-b").currentZone, world.findZone("university"));
  EXPECT_EQ(r.sold, 5);

  // A moving truck has no zone to serve.
  DispatchAction moving;
  moving.truckId = "truck-a";
  r = Step(sim, world, {moving});
  ASSERT_TRUE(r.outcomes.size() == 1);
  EXPECT_FALSE(r.outcomes[0].accepted);
  EXPECT_EQ(r.outcomes[0].reason, std::string("truck is moving"));
  EXPECT_EQ(TruckById(world, "truck-a").destinationZone, world.findZone("park"));
}

static void TestHoldForTruckCancelsEarlierAction()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  HoldAction h;
  h.truckId = "truck-a";
  h.reasoning = "changed my mind";
  const TickReport r = Step(sim, world, {Dispatch("truck-a", "university"), h, Dispatch("truck-c", "downtown")});
  ASSERT_TRUE(r.outcomes.size() == 3);
  EXPECT_EQ(r.outcomes[1].kind, std::string("hold"));
  EXPECT_EQ(r.outcomes[1].truckId, std::string("truck-a"));
  EXPECT_TRUE(r.outcomes[1].accepted);

  const Truck& a = TruckById(world, "truck-a");
  EXPECT_TRUE(a.status == TruckStatus::Idle);
  EXPECT_EQ(a.currentZone, world.findZone("downtown"));
  EXPECT_EQ(a.destinationZone, -1);
  EXPECT_TRUE(TruckById(world, "truck-c").status == TruckStatus::Moving);
}

static void TestRestockRules()
{
  SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);

  // Idle and not full, alone at park (1 spot).
  TickReport r = Step(sim, world, {Restock("truck-c")});
  ASSERT_TRUE(r.outcomes.size() == 1);
  EXPECT_TRUE(r.outcomes[0].accepted);
  EXPECT_EQ(r.outcomes[0].target, std::string("park"));
  EXPECT_TRUE(TruckById(world, "truck-c").status == TruckStatus::Restocking);

  // Moving trucks cannot restock.
  Step(sim, world, {Dispatch("truck-b", "park")});
  r = Step(sim, world, {Restock("truck-b")});
  EXPECT_EQ(r.outcomes[0].reason, std::string("invalid state for restock"));

  // Two trucks parked at a one-spot zone.
  WorldState crowded;
  ASSERT_TRUE(Build(cfg, crowded));
  crowded.trucks[1].currentZone = crowded.findZone("park");
  const std::vector<ActionOutcome> out = ApplyPendingActions(crowded, {Restock("truck-c")}, sim.fleetParams());
  ASSERT_TRUE(out.size() == 1);
  EXPECT_FALSE(out[0].accepted);
  EXPECT_EQ(out[0].reason, std::string("no parking capacity"));
  EXPECT_EQ(crowded.occupancy(crowded.findZone("park")), 2);
}

static void TestActionLogIsBounded()
{
  SimConfig cfg = FlatCity();
  cfg.actionLogCap = 4;
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));

  std::vector<PendingAction> holds;
  for (int i = 0; i < 10; ++i) {
    HoldAction h;
    h.reasoning = "h" + std::to_string(i);
    holds.push_back(h);
  }
  ApplyPendingActions(world, holds, FleetParams{});
  EXPECT_EQ(world.recentActions.size(), static_cast<std::size_t>(4));
  EXPECT_EQ(world.recentActions.front().reasoning, std::string("h6"));
  EXPECT_EQ(world.recentActions.back().reasoning, std::string("h9"));
}

// -----------------------------------------------------------------------------------------------
// Whole-simulation invariants
// -----------------------------------------------------------------------------------------------

static std::vector<PendingAction> RandomActions(const WorldState& world, RNG& rng)
{
  std::vector<PendingAction> out;
  if (!rng.chance(0.2)) return out;

  const int count = 1 + static_cast<int>(rng.rangeU32(3));
  for (int i = 0; i < count; ++i) {
    const Truck& t = world.trucks[rng.rangeU32(static_cast<std::uint32_t>(world.trucks.size()))];
    const std::uint32_t kind = rng.rangeU32(4);
    if (kind <= 1) {
      const Zone& z = world.zones[rng.rangeU32(static_cast<std::uint32_t>(world.zones.size()))];
      DispatchAction d;
      d.truckId = t.id;
      d.targetZone = z.id;
      out.push_back(d);
    } else if (kind == 2) {
      RestockAction r;
      r.truckId = t.id;
      out.push_back(r);
    } else {
      out.push_back(HoldAction{});
    }
  }
  return out;
}

static std::string RunRandom(const SimConfig& cfg, std::uint64_t actionSeed, int ticks, bool checkInvariants)
{
  WorldState world;
  if (!Build(cfg, world)) return std::string();
  Simulator sim(cfg);
  RNG rng(actionSeed);

  for (int i = 0; i < ticks; ++i) {
    const TickReport r = sim.step(world, RandomActions(world, rng));
    if (!checkInvariants) continue;

    EXPECT_TRUE(static_cast<double>(r.sold) <= r.servedZoneDemand + 1e-9);
    for (const Truck& t : world.trucks) {
      EXPECT_TRUE(t.inventory >= 0 && t.inventory <= t.maxInventory);
      if (t.status == TruckStatus::Moving) {
        EXPECT_TRUE(t.destinationZone >= 0);
        EXPECT_TRUE(t.arrivalTick > world.currentTick);
      } else {
        EXPECT_EQ(t.destinationZone, -1);
      }
      if (t.status == TruckStatus::Restocking) EXPECT_TRUE(t.restockFinishTick > world.currentTick);
    }
    for (const Zone& z : world.zones) EXPECT_TRUE(z.demandHistory.back() >= 0.0);
  }
  return WorldToJson(world);
}

static void TestInvariantsUnderRandomActions()
{
  SimConfig cfg;
  cfg.seed = 99;
  const std::string json = RunRandom(cfg, 1234, 3 * 1440, true);
  EXPECT_FALSE(json.empty());
}

static void TestReplayDeterminism()
{
  SimConfig cfg;
  cfg.seed = 0xFEEDu;

  const std::string a = RunRandom(cfg, 42, 2000, false);
  const std::string b = RunRandom(cfg, 42, 2000, false);
  EXPECT_FALSE(a.empty());
  EXPECT_EQ(a, b);

  SimConfig other = cfg;
  other.seed = 0xFEEEu;
  EXPECT_NE(a, RunRandom(other, 42, 2000, false));
}

// -----------------------------------------------------------------------------------------------
// Config
// -----------------------------------------------------------------------------------------------

static void TestDefaultCityIsValid()
{
  const SimConfig cfg{};
  std::string err;
  EXPECT_TRUE(ValidateSimConfig(cfg, err));
  EXPECT_EQ(cfg.city.zones.size(), static_cast<std::size_t>(5));
  EXPECT_EQ(cfg.city.trucks.size(), static_cast<std::size_t>(3));

  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  EXPECT_EQ(TruckById(world, "truck-1").inventory, 150);
  EXPECT_EQ(world.zones[0].travelCost[0], 0);
}

static void TestCityJsonMerge()
{
  SimConfig cfg;
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(R"({"seed": "0x10", "restock_ticks": 3,
                            "zones": [{"id": "downtown-1", "max_orders": 9}],
                            "trucks": [{"id": "truck-2", "inventory": 10}]})",
                        root, err));
  ASSERT_TRUE(ApplyCityConfigJson(root, cfg, err));

  EXPECT_EQ(cfg.seed, static_cast<std::uint64_t>(16));
  EXPECT_EQ(cfg.restockTicks, 3);
  EXPECT_EQ(cfg.city.zones.size(), static_cast<std::size_t>(5));
  EXPECT_EQ(cfg.city.zones[0].maxOrders, 9.0);
  EXPECT_EQ(cfg.city.zones[0].baseMultiplier, 0.20);
  EXPECT_EQ(cfg.city.trucks[1].inventory, 10);
  EXPECT_EQ(cfg.city.trucks[1].maxInventory, 100);
  EXPECT_TRUE(ValidateSimConfig(cfg, err));
}

static void TestCityJsonReplaceAndRoundTrip()
{
  SimConfig cfg;
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(R"({"replace": true,
      "zones": [{"id": "a", "base_multiplier": 0.5, "peak_multiplier": 1.0, "max_orders": 3,
                 "num_of_parking_spots": 1, "peak_hours": [[600, 660]], "travel_costs": {"b": 5}},
                {"id": "b", "max_orders": 2, "parking_capacity": 3, "costs": {"a": 5}}],
      "trucks": [{"id": "t", "current_zone": "a", "inventory": 3, "max_inventory": 6}]})",
                        root, err));
  ASSERT_TRUE(ApplyCityConfigJson(root, cfg, err));
  EXPECT_TRUE(ValidateSimConfig(cfg, err));
  EXPECT_EQ(cfg.city.zones.size(), static_cast<std::size_t>(2));
  EXPECT_EQ(cfg.city.zones[1].parkingCapacity, 3);
  ASSERT_TRUE(cfg.city.zones[0].peakHours.size() == 1);
  EXPECT_EQ(cfg.city.zones[0].peakHours[0].endMinute, 660);

  // Written config loads back into an equal config.
  SimConfig back;
  JsonValue again;
  ASSERT_TRUE(ParseJson(CityConfigToJson(cfg), again, err));
  ASSERT_TRUE(ApplyCityConfigJson(again, back, err));
  EXPECT_EQ(CityConfigToJson(back), CityConfigToJson(cfg));
}

static void TestConfigValidation()
{
  std::string err;

  auto expectInvalid = [&](const char* json, const char* needle) {
    SimConfig cfg;
    JsonValue root;
    std::string e;
    if (!ParseJson(json, root, e)) {
      ++g_failures;
      std::cerr << "bad test json: " << json << "\n";
      return;
    }
    const bool applied = ApplyCityConfigJson(root, cfg, e);
    const bool valid = applied && ValidateSimConfig(cfg, e);
    EXPECT_FALSE(valid);
    if (e.find(needle) == std::string::npos) {
      ++g_failures;
      std::cerr << "expected error containing '" << needle << "', got '" << e << "'\n";
    }
  };

  expectInvalid(R"({"zones": [{"id": "new-zone"}]})", "travel cost");
  expectInvalid(R"({"zones": [{"id": "park-1", "travel_costs": {"stadium-1": 21}}]})", "not symmetric");
  expectInvalid(R"({"zones": [{"id": "park-1", "base_multiplier": 2.0}]})", "multipliers");
  expectInvalid(R"({"zones": [{"id": "park-1", "peak_hours": [[900, 800]]}]})", "peak window");
  expectInvalid(R"({"zones": [{"id": "park-1", "num_of_parking_spots": -1}]})", "parking");
  expectInvalid(R"({"trucks": [{"id": "truck-1", "inventory": 500}]})", "inventory");
  expectInvalid(R"({"trucks": [{"id": "truck-1", "current_zone": "moon"}]})", "unknown current_zone");
  expectInvalid(R"({"trucks": [{"id": "truck-1", "speed_multiplier": 0}]})", "speed_multiplier");
  expectInvalid(R"({"noise_amplitude": 1.5})", "noise");
  expectInvalid(R"({"seed": -3})", "seed");
  expectInvalid(R"({"zones": {"id": "x"}})", "expected array");

  ServerConfig server;
  EXPECT_TRUE(ValidateServerConfig(server, err));
  server.agent = "oracle";
  EXPECT_FALSE(ValidateServerConfig(server, err));
  server.agent = "command";
  EXPECT_FALSE(ValidateServerConfig(server, err));
  server.agentCommand = "/bin/true";
  EXPECT_TRUE(ValidateServerConfig(server, err));
  server.httpPort = 70000;
  EXPECT_FALSE(ValidateServerConfig(server, err));
}

// -----------------------------------------------------------------------------------------------
// Actions
// -----------------------------------------------------------------------------------------------

static void TestParseActions()
{
  PendingAction a;
  std::string err;
  JsonValue v;

  ASSERT_TRUE(ParseJson(R"({"type": "dispatch", "truck_id": "truck-1", "target_zone": "park-1", "reasoning": "r"})",
                        v, err));
  ASSERT_TRUE(ParseActionJson(v, a, err));
  const auto* d = std::get_if<DispatchAction>(&a);
  ASSERT_TRUE(d != nullptr);
  EXPECT_EQ(d->truckId, std::string("truck-1"));
  EXPECT_EQ(d->targetZone, std::string("park-1"));
  EXPECT_EQ(ActionReasoning(a), std::string("r"));

  ASSERT_TRUE(ParseJson(R"({"type": "forecast", "zone_id": "park-1"})", v, err));
  ASSERT_TRUE(ParseActionJson(v, a, err));
  ASSERT_TRUE(std::holds_alternative<ForecastAction>(a));
  EXPECT_EQ(std::get<ForecastAction>(a).hoursAhead, 1);

  ASSERT_TRUE(ParseJson(R"({"type": "teleport", "truck_id": "truck-1"})", v, err));
  EXPECT_FALSE(ParseActionJson(v, a, err));
  ASSERT_TRUE(ParseJson(R"({"type": "restock"})", v, err));
  EXPECT_FALSE(ParseActionJson(v, a, err));
  ASSERT_TRUE(ParseJson(R"({"type": "forecast", "zone_id": "park-1", "hours_ahead": 500})", v, err));
  EXPECT_FALSE(ParseActionJson(v, a, err));

  // Tool-call form.
  ASSERT_TRUE(ParseAgentReply(R"({"tool": "dispatch_truck",
                                  "arguments": {"truck_id": "truck-2", "destination_zone": "stadium-1"}})",
                              a, err));
  ASSERT_TRUE(std::holds_alternative<DispatchAction>(a));
  EXPECT_EQ(std::get<DispatchAction>(a).targetZone, std::string("stadium-1"));

  ASSERT_TRUE(ParseAgentReply(R"({"tool": "get_zone_forecast", "arguments": {"zone_id": "park-1", "hours_ahead": 3}})",
                              a, err));
  ASSERT_TRUE(std::holds_alternative<ForecastAction>(a));
  EXPECT_EQ(std::get<ForecastAction>(a).hoursAhead, 3);

  ASSERT_TRUE(ParseAgentReply(R"({"tool": "hold_position"})", a, err));
  EXPECT_TRUE(std::holds_alternative<HoldAction>(a));

  ASSERT_TRUE(ParseAgentReply(R"({"tool": "hold_position", "arguments": {"truck_id": "truck-4", "reasoning": "wait"}})",
                              a, err));
  ASSERT_TRUE(std::holds_alternative<HoldAction>(a));
  EXPECT_EQ(std::get<HoldAction>(a).truckId, std::string("truck-4"));
  EXPECT_EQ(ActionReasoning(a), std::string("wait"));
  EXPECT_FALSE(ParseAgentReply(R"({"tool": "hold_position", "arguments": {"truck_id": 4}})", a, err));

  ASSERT_TRUE(ParseAgentReply(R"({"tool": "start_serving", "arguments": {"truck_id": "truck-1", "reasoning": "busy here"}})",
                              a, err));
  ASSERT_TRUE(std::holds_alternative<DispatchAction>(a));
  EXPECT_EQ(std::get<DispatchAction>(a).truckId, std::string("truck-1"));
  EXPECT_TRUE(std::get<DispatchAction>(a).targetZone.empty());
  EXPECT_EQ(std::string(ActionKind(a)), std::string("serve"));
  EXPECT_FALSE(ParseAgentReply(R"({"tool": "start_serving", "arguments": {}})", a, err));

  // Empty or null replies hold.
  ASSERT_TRUE(ParseAgentReply("   \n", a, err));
  EXPECT_TRUE(std::holds_alternative<HoldAction>(a));
  ASSERT_TRUE(ParseAgentReply(" null ", a, err));
  EXPECT_TRUE(std::holds_alternative<HoldAction>(a));

  EXPECT_FALSE(ParseAgentReply("{not json", a, err));
  EXPECT_FALSE(ParseAgentReply(R"({"tool": "launch_rocket"})", a, err));
}

static void TestParseSubmission()
{
  std::vector<PendingAction> out;
  std::string err;

  ASSERT_TRUE(ParseActionSubmission(R"({"type": "hold"})", out, err));
  EXPECT_EQ(out.size(), static_cast<std::size_t>(1));

  ASSERT_TRUE(ParseActionSubmission(
      R"([{"type": "restock", "truck_id": "truck-3"}, {"type": "dispatch", "truck_id": "truck-1", "target_zone": "park-1"}])",
      out, err));
  ASSERT_TRUE(out.size() == 2);
  EXPECT_EQ(std::string(ActionKind(out[0])), std::string("restock"));
  EXPECT_EQ(std::string(ActionKind(out[1])), std::string("dispatch"));

  // One bad entry rejects the whole batch.
  EXPECT_FALSE(ParseActionSubmission(R"([{"type": "hold"}, {"type": "dispatch", "truck_id": "truck-1"}])", out, err));
  EXPECT_TRUE(out.empty());
  EXPECT_TRUE(err.find("action[1]") != std::string::npos);

  EXPECT_FALSE(ParseActionSubmission("42", out, err));
}

static void TestActionJsonRoundTrip()
{
  ForecastAction f;
  f.zoneId = "stadium-1";
  f.hoursAhead = 6;
  f.reasoning = "game tonight";
  const std::string json = ActionToJson(f);

  std::vector<PendingAction> out;
  std::string err;
  ASSERT_TRUE(ParseActionSubmission(json, out, err));
  ASSERT_TRUE(out.size() == 1);
  const auto* back = std::get_if<ForecastAction>(&out[0]);
  ASSERT_TRUE(back != nullptr);
  EXPECT_EQ(back->zoneId, f.zoneId);
  EXPECT_EQ(back->hoursAhead, 6);
  EXPECT_EQ(back->reasoning, f.reasoning);

  // Serving in place has no target zone on the wire.
  DispatchAction serve;
  serve.truckId = "truck-2";
  const std::string serveJson = ActionToJson(serve);
  EXPECT_TRUE(serveJson.find("\"type\":\"serve\"") != std::string::npos);
  EXPECT_TRUE(serveJson.find("target_zone") == std::string::npos);
  ASSERT_TRUE(ParseActionSubmission(serveJson, out, err));
  ASSERT_TRUE(out.size() == 1);
  EXPECT_EQ(std::string(ActionKind(out[0])), std::string("serve"));

  HoldAction hold;
  hold.truckId = "truck-3";
  ASSERT_TRUE(ParseActionSubmission(ActionToJson(hold), out, err));
  ASSERT_TRUE(out.size() == 1);
  ASSERT_TRUE(std::holds_alternative<HoldAction>(out[0]));
  EXPECT_EQ(std::get<HoldAction>(out[0]).truckId, std::string("truck-3"));
}

// -----------------------------------------------------------------------------------------------
// Forecast, snapshot, heuristic agent
// -----------------------------------------------------------------------------------------------

static void TestForecast()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  const DemandParams dp = Simulator(cfg).demandParams();

  ZoneForecast f;
  std::string err;
  ASSERT_TRUE(ForecastZone(world, dp, "university", 3, f, err));
  EXPECT_EQ(f.fromTick, static_cast<std::int64_t>(1));
  ASSERT_TRUE(f.hours.size() == 3);
  EXPECT_EQ(f.hours[0].hour, 1);
  EXPECT_EQ(f.hours[1].startMinute, 61);
  for (const HourlyForecast& h : f.hours) EXPECT_NEAR(h.meanDemand, 8.0, 1e-9);

  EXPECT_FALSE(ForecastZone(world, dp, "nowhere", 1, f, err));
  EXPECT_FALSE(ForecastZone(world, dp, "park", 0, f, err));
  EXPECT_FALSE(ForecastZone(world, dp, "park", kMaxForecastHours + 1, f, err));

  const std::vector<ZoneRanking> ranking = RankZones(world, dp, 60);
  ASSERT_TRUE(ranking.size() == 3);
  EXPECT_EQ(ranking[0].zoneId, std::string("university"));
  EXPECT_EQ(ranking[1].zoneId, std::string("downtown"));
  EXPECT_EQ(ranking[2].zoneId, std::string("park"));
  EXPECT_EQ(ranking[0].occupancy, 1);

  // Matches the demand the simulation will actually record.
  WorldState real;
  ASSERT_TRUE(Build(SimConfig{}, real));
  const Simulator sim{SimConfig{}};
  ZoneForecast rf;
  ASSERT_TRUE(ForecastZone(real, sim.demandParams(), "downtown-1", 1, rf, err));
  double sum = 0.0;
  for (int i = 0; i < 60; ++i) {
    sim.step(real, {});
    sum += CurrentDemand(real.zones[0]);
  }
  EXPECT_NEAR(rf.hours[0].meanDemand, sum / 60.0, 1e-9);
}

static void TestSnapshotJson()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  Simulator sim(cfg);
  Step(sim, world, {Dispatch("truck-a", "university"), Restock("truck-a")});

  const SnapshotPtr snap = MakeSnapshot(world);
  ASSERT_TRUE(snap != nullptr);
  EXPECT_EQ(snap->tick, static_cast<std::int64_t>(1));
  EXPECT_EQ(snap->minuteOfDay, 1);

  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(snap->json, root, err));

  double n = 0.0;
  EXPECT_TRUE(GetJsonNumber(root, "current_time", n) && n == 1.0);
  EXPECT_TRUE(GetJsonNumber(root, "day", n) && n == 0.0);

  const JsonValue* zones = FindJsonMember(root, "zones");
  ASSERT_TRUE(zones && zones->isArray() && zones->arrayValue.size() == 3);
  const JsonValue* demand = FindJsonMember(zones->arrayValue[1], "demand");
  ASSERT_TRUE(demand && demand->isArray());
  EXPECT_EQ(demand->arrayValue.size(), static_cast<std::size_t>(2));

  const JsonValue* trucks = FindJsonMember(root, "trucks");
  ASSERT_TRUE(trucks && trucks->isArray() && trucks->arrayValue.size() == 3);
  const JsonValue& a = trucks->arrayValue[0];
  std::string s;
  EXPECT_TRUE(GetJsonString(a, "status", s) && s == "MOVING");
  EXPECT_TRUE(GetJsonString(a, "destination_zone", s) && s == "university");
  EXPECT_TRUE(GetJsonNumber(a, "arrival_tick", n) && n == 10.0);
  EXPECT_TRUE(FindJsonMember(trucks->arrayValue[1], "destination_zone") == nullptr);

  const JsonValue* log = FindJsonMember(root, "recent_actions");
  ASSERT_TRUE(log && log->isArray() && log->arrayValue.size() == 2);
  const JsonValue* accepted = FindJsonMember(log->arrayValue[1], "accepted");
  ASSERT_TRUE(accepted && accepted->isBool());
  EXPECT_FALSE(accepted->boolValue);
}

static PendingAction Decide(const WorldState& world, const DemandParams& dp)
{
  HeuristicDecisionMaker maker;
  DecisionRequest req;
  req.snapshot = MakeSnapshot(world);
  req.ranking = RankZones(world, dp, 60);

  std::string reply;
  std::string err;
  PendingAction a = HoldAction{};
  if (!maker.decide(req, reply, err) || !ParseAgentReply(reply, a, err)) {
    ++g_failures;
    std::cerr << "heuristic decision failed: " << err << "\n";
  }
  return a;
}

static void TestHeuristicDecisions()
{
  SimConfig cfg = FlatCity();
  const DemandParams dp = Simulator(cfg).demandParams();

  // truck-c holds 2 of 10: restock it first.
  {
    WorldState world;
    ASSERT_TRUE(Build(cfg, world));
    const PendingAction a = Decide(world, dp);
    const auto* r = std::get_if<RestockAction>(&a);
    ASSERT_TRUE(r != nullptr);
    EXPECT_EQ(r->truckId, std::string("truck-c"));
  }

  // University is full, downtown has a free spot: move the truck idling at the dead park.
  cfg.city.trucks[2].inventory = 10;
  {
    WorldState world;
    ASSERT_TRUE(Build(cfg, world));
    const PendingAction a = Decide(world, dp);
    const auto* d = std::get_if<DispatchAction>(&a);
    ASSERT_TRUE(d != nullptr);
    EXPECT_EQ(d->truckId, std::string("truck-c"));
    EXPECT_EQ(d->targetZone, std::string("downtown"));
    EXPECT_FALSE(d->reasoning.empty());

    // Once truck-c is on its way, only the empty park is free: hold.
    Simulator sim(cfg);
    sim.step(world, {a});
    const PendingAction next = Decide(world, dp);
    EXPECT_TRUE(std::holds_alternative<HoldAction>(next));
  }
}

static void TestDecisionRequestJson()
{
  const SimConfig cfg = FlatCity();
  WorldState world;
  ASSERT_TRUE(Build(cfg, world));
  const DemandParams dp = Simulator(cfg).demandParams();

  DecisionRequest req;
  req.snapshot = MakeSnapshot(world);
  req.ranking = RankZones(world, dp, 60);
  ZoneForecast f;
  std::string err;
  ASSERT_TRUE(ForecastZone(world, dp, "park", 2, f, err));
  req.forecasts.push_back(f);
  req.round = 1;

  JsonValue root;
  ASSERT_TRUE(ParseJson(DecisionRequestToJson(req), root, err));
  EXPECT_TRUE(FindJsonMember(root, "state") != nullptr);
  const JsonValue* results = FindJsonMember(root, "tool_results");
  ASSERT_TRUE(results && results->isArray());
  EXPECT_EQ(results->arrayValue.size(), static_cast<std::size_t>(1));
  double round = 0.0;
  EXPECT_TRUE(GetJsonNumber(root, "round", round) && round == 1.0);
}

int main()
{
  SetLogLevel(LogLevel::Error);

  TestDemandDeterministic();
  TestDemandBoundedNoise();
  TestDemandPeaks();
  TestDemandHistory();
  TestClock();

  TestTravelTicks();
  TestDispatchArrivesAndServes();
  TestSellOutThenReturnToRestock();
  TestIdleEmptyTruckRestocksInPlace();
  TestSharedZoneDemand();
  TestArrivalServesBehindBusyTruck();

  TestRestockWhileRestockingRejected();
  TestProcessorRejections();
  TestHoldIsNoOp();
  TestLastActionPerTruckWins();
  TestRerouteAndTurnBack();
  TestDispatchOntoRestockRun();
  TestServeInPlace();
  TestHoldForTruckCancelsEarlierAction();
  TestRestockRules();
  TestActionLogIsBounded();

  TestInvariantsUnderRandomActions();
  TestReplayDeterminism();

  TestDefaultCityIsValid();
  TestCityJsonMerge();
  TestCityJsonReplaceAndRoundTrip();
  TestConfigValidation();

  TestParseActions();
  TestParseSubmission();
  TestActionJsonRoundTrip();

  TestForecast();
  TestSnapshotJson();
  TestHeuristicDecisions();
  TestDecisionRequestJson();

  if (g_failures == 0) {
    std::cout << "fleetfeast_tests: OK\n";
    return 0;
  }

  std::cerr << "fleetfeast_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
