#pragma once

#include <string>

// Build/version metadata for FleetFeast.
//
// CMake defines these macros for all targets via fleetfeast_core's PUBLIC compile
// definitions (see CMakeLists.txt). Fallbacks keep the header usable elsewhere.

#ifndef FLEETFEAST_VERSION_MAJOR
#define FLEETFEAST_VERSION_MAJOR 0
#endif

#ifndef FLEETFEAST_VERSION_MINOR
#define FLEETFEAST_VERSION_MINOR 0
#endif

#ifndef FLEETFEAST_VERSION_PATCH
#define FLEETFEAST_VERSION_PATCH 0
#endif

#ifndef FLEETFEAST_VERSION_STRING
#define FLEETFEAST_VERSION_STRING "0.0.0"
#endif

namespace fleetfeast {

struct FleetFeastVersion {
  int major;
  int minor;
  int patch;
};

inline constexpr FleetFeastVersion FleetFeastVersionNumbers()
{
  return FleetFeastVersion{FLEETFEAST_VERSION_MAJOR, FLEETFEAST_VERSION_MINOR, FLEETFEAST_VERSION_PATCH};
}

inline constexpr const char* FleetFeastVersionString()
{
  return FLEETFEAST_VERSION_STRING;
}

// "fleetfeast/<version>", used as the HTTP Server header and in health reports.
inline std::string FleetFeastServerTag()
{
  return std::string("fleetfeast/") + FleetFeastVersionString();
}

} // namespace fleetfeast
