#include "fleetfeast/Config.hpp"

#include <utility>

namespace fleetfeast {

namespace {

ZoneConfig MakeZone(const char* id, const char* type, double base, double peak, double maxOrders, int parking,
                    std::vector<PeakWindow> peaks)
{
  ZoneConfig z;
  z.id = id;
  z.type = type;
  z.baseMultiplier = base;
  z.peakMultiplier = peak;
  z.maxOrders = maxOrders;
  z.parkingCapacity = parking;
  z.peakHours = std::move(peaks);
  return z;
}

void Link(CityConfig& city, const std::string& a, const std::string& b, int minutes)
{
  for (ZoneConfig& z : city.zones) {
    if (z.id == a) z.travelCost[b] = minutes;
    if (z.id == b) z.travelCost[a] = minutes;
  }
}

TruckConfig MakeTruck(const char* id, const char* zone, int inventory, int maxInventory, double speed)
{
  TruckConfig t;
  t.id = id;
  t.startZone = zone;
  t.restockZone = zone;
  t.inventory = inventory;
  t.maxInventory = maxInventory;
  t.speedMultiplier = speed;
  return t;
}

} // namespace

CityConfig DefaultCity()
{
  CityConfig city;

  // Lunch rush downtown, lunch + dinner on campus, after-work park, evening events, dinner at home.
  city.zones.push_back(MakeZone("downtown-1", "downtown", 0.20, 1.00, 6.0, 2, {{660, 840}}));
  city.zones.push_back(MakeZone("university-1", "university", 0.30, 0.85, 5.0, 1, {{660, 840}, {1080, 1260}}));
  city.zones.push_back(MakeZone("park-1", "park", 0.15, 0.70, 4.0, 1, {{720, 780}, {1020, 1200}}));
  city.zones.push_back(MakeZone("residential-1", "residential", 0.25, 0.80, 4.0, 2, {{1020, 1260}}));
  city.zones.push_back(MakeZone("stadium-1", "stadium", 0.05, 1.00, 10.0, 1, {{1080, 1320}}));

  // Direct roads; the remaining pairs use the shortest chain of them.
  Link(city, "downtown-1", "university-1", 10);
  Link(city, "downtown-1", "park-1", 15);
  Link(city, "downtown-1", "residential-1", 30);
  Link(city, "university-1", "residential-1", 15);
  Link(city, "park-1", "residential-1", 10);
  Link(city, "park-1", "stadium-1", 20);
  Link(city, "downtown-1", "stadium-1", 35);
  Link(city, "university-1", "park-1", 25);
  Link(city, "university-1", "stadium-1", 45);
  Link(city, "residential-1", "stadium-1", 30);

  city.trucks.push_back(MakeTruck("truck-1", "downtown-1", 150, 200, 0.5));
  city.trucks.push_back(MakeTruck("truck-2", "university-1", 70, 100, 1.0));
  city.trucks.push_back(MakeTruck("truck-3", "residential-1", 50, 50, 0.8));
  return city;
}

} // namespace fleetfeast
