#include "fleetfeast/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace fleetfeast {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

std::mutex& LogMutex()
{
  static std::mutex m;
  return m;
}

} // namespace

const char* ToString(LogLevel level)
{
  switch (level) {
  case LogLevel::Debug: return "debug";
  case LogLevel::Info: return "info";
  case LogLevel::Warn: return "warn";
  case LogLevel::Error: return "error";
  case LogLevel::Off: return "off";
  }
  return "unknown";
}

bool ParseLogLevel(const std::string& s, LogLevel& out)
{
  std::string lower = s;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") out = LogLevel::Debug;
  else if (lower == "info") out = LogLevel::Info;
  else if (lower == "warn" || lower == "warning") out = LogLevel::Warn;
  else if (lower == "error") out = LogLevel::Error;
  else if (lower == "off" || lower == "none") out = LogLevel::Off;
  else return false;
  return true;
}

void SetLogLevel(LogLevel level)
{
  g_level.store(static_cast<int>(level));
}

LogLevel GetLogLevel()
{
  return static_cast<LogLevel>(g_level.load());
}

bool LogEnabled(LogLevel level)
{
  return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

void LogLine(LogLevel level, const char* component, const std::string& message)
{
  if (!LogEnabled(level)) return;

  // Build the line first so the critical section is a single write.
  std::string line;
  line.reserve(message.size() + 24);
  line += '[';
  line += ToString(level);
  line += "] ";
  if (component && *component) {
    line += '[';
    line += component;
    line += "] ";
  }
  line += message;
  line += '\n';

  std::scoped_lock<std::mutex> lock(LogMutex());
  std::cerr << line;
  std::cerr.flush();
}

} // namespace fleetfeast
