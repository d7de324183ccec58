#pragma once

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

namespace fleetfeast {

// Environment variable read helper. Empty values are treated as unset.
inline std::optional<std::string> GetEnvVar(const char* name)
{
  if (!name || !*name) return std::nullopt;

#if defined(_WIN32) && defined(_MSC_VER)
  char* buf = nullptr;
  std::size_t len = 0;
  if (_dupenv_s(&buf, &len, name) != 0 || !buf) return std::nullopt;

  std::string out(buf);
  std::free(buf);
  if (out.empty()) return std::nullopt;
  return out;
#else
  const char* v = std::getenv(name);
  if (!v || !*v) return std::nullopt;
  return std::string(v);
#endif
}

// Typed readers. A missing variable leaves `io` untouched and succeeds; a present but
// malformed one fails with a message naming the variable.
inline bool ReadEnvString(const char* name, std::string& io)
{
  if (const auto v = GetEnvVar(name)) io = *v;
  return true;
}

inline bool ReadEnvI64(const char* name, std::int64_t& io, std::string& outError)
{
  const auto v = GetEnvVar(name);
  if (!v) return true;

  char* end = nullptr;
  errno = 0;
  const long long parsed = std::strtoll(v->c_str(), &end, 10);
  if (errno != 0 || !end || *end != '\0') {
    outError = std::string(name) + ": expected an integer, got '" + *v + "'";
    return false;
  }
  io = static_cast<std::int64_t>(parsed);
  return true;
}

inline bool ReadEnvInt(const char* name, int& io, std::string& outError)
{
  std::int64_t wide = io;
  if (!ReadEnvI64(name, wide, outError)) return false;
  if (wide < INT32_MIN || wide > INT32_MAX) {
    outError = std::string(name) + ": integer out of range";
    return false;
  }
  io = static_cast<int>(wide);
  return true;
}

inline bool ReadEnvU64(const char* name, std::uint64_t& io, std::string& outError)
{
  const auto v = GetEnvVar(name);
  if (!v) return true;

  std::string digits = *v;
  int base = 10;
  if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
    base = 16;
    digits = digits.substr(2);
  }
  char* end = nullptr;
  errno = 0;
  const unsigned long long parsed = std::strtoull(digits.c_str(), &end, base);
  if (errno != 0 || digits.empty() || digits[0] == '-' || !end || *end != '\0') {
    outError = std::string(name) + ": expected an unsigned integer, got '" + *v + "'";
    return false;
  }
  io = static_cast<std::uint64_t>(parsed);
  return true;
}

inline bool ReadEnvDouble(const char* name, double& io, std::string& outError)
{
  const auto v = GetEnvVar(name);
  if (!v) return true;

  char* end = nullptr;
  errno = 0;
  const double parsed = std::strtod(v->c_str(), &end);
  if (errno != 0 || !end || *end != '\0' || !std::isfinite(parsed)) {
    outError = std::string(name) + ": expected a finite number, got '" + *v + "'";
    return false;
  }
  io = parsed;
  return true;
}

inline bool ReadEnvBool(const char* name, bool& io, std::string& outError)
{
  const auto v = GetEnvVar(name);
  if (!v) return true;

  const std::string& s = *v;
  if (s == "1" || s == "true" || s == "TRUE" || s == "yes" || s == "on") {
    io = true;
    return true;
  }
  if (s == "0" || s == "false" || s == "FALSE" || s == "no" || s == "off") {
    io = false;
    return true;
  }
  outError = std::string(name) + ": expected 0/1/true/false, got '" + s + "'";
  return false;
}

} // namespace fleetfeast
