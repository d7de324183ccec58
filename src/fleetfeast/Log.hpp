#pragma once

#include <cstdint>
#include <string>

namespace fleetfeast {

// Leveled diagnostic lines.
//
// Each call writes one whole line to std::cerr:
//   [warn] [sim] store write failed: ...
//
// std::cerr is what LogTee duplicates into the log file (with timestamps and thread
// ids), so nothing here knows about files. Lines from different threads never
// interleave.

enum class LogLevel : std::uint8_t {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
  Off = 4,
};

const char* ToString(LogLevel level);

// Accepts debug/info/warn/warning/error/off (case-insensitive).
bool ParseLogLevel(const std::string& s, LogLevel& out);

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

bool LogEnabled(LogLevel level);

void LogLine(LogLevel level, const char* component, const std::string& message);

inline void LogDebug(const char* component, const std::string& message) { LogLine(LogLevel::Debug, component, message); }
inline void LogInfo(const char* component, const std::string& message) { LogLine(LogLevel::Info, component, message); }
inline void LogWarn(const char* component, const std::string& message) { LogLine(LogLevel::Warn, component, message); }
inline void LogError(const char* component, const std::string& message) { LogLine(LogLevel::Error, component, message); }

} // namespace fleetfeast
