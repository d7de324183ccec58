#pragma once

// Small argv parsing helpers shared by the fleetfeast binaries.
//
// Everything is strict: the whole token must parse, floats must be finite, and
// integers must fit the target type.

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fleetfeast::cli {

inline bool EnsureDir(const std::filesystem::path& p)
{
  if (p.empty()) return false;
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec) return false;
  return std::filesystem::is_directory(p, ec);
}

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  std::error_code ec;
  const std::filesystem::path parent = file.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) return false;
  }
  return true;
}

template <typename T>
inline bool ParseSigned(std::string_view s, T* out)
{
  if (!out) return false;
  // from_chars rejects a leading '+'.
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  T v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseI32(std::string_view s, int* out) { return ParseSigned(s, out); }
inline bool ParseI64(std::string_view s, std::int64_t* out) { return ParseSigned(s, out); }

// Decimal or 0x-prefixed hex.
inline bool ParseU64(std::string_view s, std::uint64_t* out)
{
  if (!out) return false;
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int base = 10;
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    base = 16;
    s.remove_prefix(2);
  }
  if (s.empty()) return false;

  std::uint64_t v = 0;
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, base);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline bool ParseF64(std::string_view s, double* out)
{
  if (!out) return false;
  if (s.empty()) return false;

  std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (errno != 0) return false;
  if (!end || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

inline bool ParseBool01(std::string_view s, bool* out)
{
  if (!out) return false;
  std::string lower(s);
  for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  if (lower == "0" || lower == "false" || lower == "off" || lower == "no") {
    *out = false;
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "on" || lower == "yes") {
    *out = true;
    return true;
  }
  return false;
}

// "250", "250ms", "2s", "1m". A bare number is milliseconds. Result must be >= 1.
inline bool ParseDurationMs(std::string_view s, int* outMs)
{
  if (!outMs) return false;

  std::int64_t scale = 1;
  if (s.size() > 2 && s.substr(s.size() - 2) == "ms") {
    s.remove_suffix(2);
  } else if (!s.empty() && s.back() == 's') {
    scale = 1000;
    s.remove_suffix(1);
  } else if (!s.empty() && s.back() == 'm') {
    scale = 60000;
    s.remove_suffix(1);
  }

  std::int64_t v = 0;
  if (!ParseI64(s, &v)) return false;
  if (v < 1 || v > 0x7fffffff / scale) return false;
  *outMs = static_cast<int>(v * scale);
  return true;
}

inline std::string HexU64(std::uint64_t v)
{
  std::ostringstream oss;
  oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << v;
  return oss.str();
}

inline std::vector<std::string> SplitCommaList(std::string_view s)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

} // namespace fleetfeast::cli
