#include "fleetfeast/StateStore.hpp"

#include "fleetfeast/FileSync.hpp"

#include <system_error>
#include <utility>

#include <unistd.h>

namespace fleetfeast {

namespace {

std::string SanitizeKey(const std::string& key)
{
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' ||
                    c == '-' || c == '_';
    out.push_back(ok ? c : '_');
  }
  if (out.empty() || out[0] == '.') out.insert(out.begin(), '_');
  return out;
}

} // namespace

bool MemoryStateStore::put(const std::string& key, const std::string& value, std::string& outError)
{
  if (!m_available.load()) {
    outError = "memory store unavailable";
    return false;
  }
  std::lock_guard<std::mutex> lock(m_mutex);
  m_values[key] = value;
  outError.clear();
  return true;
}

bool MemoryStateStore::get(const std::string& key, std::string& outValue, bool& found, std::string& outError)
{
  found = false;
  if (!m_available.load()) {
    outError = "memory store unavailable";
    return false;
  }
  std::lock_guard<std::mutex> lock(m_mutex);
  const auto it = m_values.find(key);
  if (it != m_values.end()) {
    outValue = it->second;
    found = true;
  }
  outError.clear();
  return true;
}

bool MemoryStateStore::ping(std::string& outError)
{
  if (!m_available.load()) {
    outError = "memory store unavailable";
    return false;
  }
  outError.clear();
  return true;
}

FileStateStore::FileStateStore(std::filesystem::path dir)
    : m_dir(std::move(dir))
{
}

std::filesystem::path FileStateStore::pathForKey(const std::string& key) const
{
  return m_dir / (SanitizeKey(key) + ".json");
}

std::string FileStateStore::describe() const
{
  return "file:" + m_dir.string();
}

bool FileStateStore::put(const std::string& key, const std::string& value, std::string& outError)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return WriteFileAtomic(pathForKey(key), value, outError);
}

bool FileStateStore::get(const std::string& key, std::string& outValue, bool& found, std::string& outError)
{
  found = false;
  outError.clear();

  const std::filesystem::path p = pathForKey(key);
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) {
    if (ec) {
      outError = "unable to stat " + p.string() + ": " + ec.message();
      return false;
    }
    return true;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  if (!ReadFileText(p, outValue, outError)) return false;
  found = true;
  return true;
}

bool FileStateStore::ping(std::string& outError)
{
  outError.clear();
  std::error_code ec;
  if (!std::filesystem::is_directory(m_dir, ec)) {
    outError = "store directory missing: " + m_dir.string();
    return false;
  }
  if (::access(m_dir.c_str(), W_OK) != 0) {
    outError = "store directory not writable: " + m_dir.string();
    return false;
  }
  return true;
}

std::unique_ptr<StateStore> MakeStateStore(const std::string& dir)
{
  if (dir.empty()) return std::make_unique<MemoryStateStore>();
  return std::make_unique<FileStateStore>(dir);
}

} // namespace fleetfeast
