#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace fleetfeast {

// Durable key-value slot for the latest serialized snapshot.
//
// Implementations must be safe to call from multiple threads (the tick loop writes,
// the health check pings).
class StateStore {
public:
  virtual ~StateStore() = default;

  virtual bool put(const std::string& key, const std::string& value, std::string& outError) = 0;

  // found=false with a true return means the key is simply absent.
  virtual bool get(const std::string& key, std::string& outValue, bool& found, std::string& outError) = 0;

  // Reachability probe.
  virtual bool ping(std::string& outError) = 0;

  virtual std::string describe() const = 0;
};

// Process-local store. setAvailable(false) makes every call fail, which is how tests
// and the CLI simulate an unreachable backend.
class MemoryStateStore final : public StateStore {
public:
  bool put(const std::string& key, const std::string& value, std::string& outError) override;
  bool get(const std::string& key, std::string& outValue, bool& found, std::string& outError) override;
  bool ping(std::string& outError) override;
  std::string describe() const override { return "memory"; }

  void setAvailable(bool available) { m_available.store(available); }

private:
  std::atomic<bool> m_available{true};
  std::mutex m_mutex;
  std::map<std::string, std::string> m_values;
};

// One file per key under a directory, replaced atomically on every put.
// Key characters outside [A-Za-z0-9._-] map to '_' in the file name.
class FileStateStore final : public StateStore {
public:
  explicit FileStateStore(std::filesystem::path dir);

  bool put(const std::string& key, const std::string& value, std::string& outError) override;
  bool get(const std::string& key, std::string& outValue, bool& found, std::string& outError) override;
  bool ping(std::string& outError) override;
  std::string describe() const override;

  std::filesystem::path pathForKey(const std::string& key) const;

private:
  std::filesystem::path m_dir;
  std::mutex m_mutex;
};

// Empty dir => MemoryStateStore.
std::unique_ptr<StateStore> MakeStateStore(const std::string& dir);

} // namespace fleetfeast
