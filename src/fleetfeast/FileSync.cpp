#include "fleetfeast/FileSync.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace fleetfeast {

namespace {

bool FsyncPath(const std::filesystem::path& path, int flags, const char* what, std::string& outError)
{
  const int fd = ::open(path.c_str(), flags);
  if (fd < 0) {
    outError = std::string("Unable to open ") + what + " for sync: " + path.string() + ": " + std::strerror(errno);
    return false;
  }

  if (::fsync(fd) != 0) {
    outError = std::string("fsync failed for ") + what + ": " + path.string() + ": " + std::strerror(errno);
    ::close(fd);
    return false;
  }
  ::close(fd);
  return true;
}

} // namespace

bool SyncFile(const std::filesystem::path& path, std::string& outError)
{
  outError.clear();
  if (path.empty()) {
    outError = "SyncFile path is empty";
    return false;
  }

  if (FsyncPath(path, O_RDWR, "file", outError)) return true;
  // Read-only descriptors can still be fsync'd on most filesystems.
  return FsyncPath(path, O_RDONLY, "file", outError);
}

bool SyncDirectory(const std::filesystem::path& dir, std::string& outError)
{
  outError.clear();
  if (dir.empty()) {
    outError = "SyncDirectory path is empty";
    return false;
  }

  int flags = O_RDONLY;
#ifdef O_DIRECTORY
  flags |= O_DIRECTORY;
#endif
  return FsyncPath(dir, flags, "directory", outError);
}

void BestEffortSyncDirectory(const std::filesystem::path& dir)
{
  std::string err;
  (void)SyncDirectory(dir, err);
}

bool WriteFileAtomic(const std::filesystem::path& path, const std::string& data, std::string& outError)
{
  outError.clear();
  if (path.empty()) {
    outError = "WriteFileAtomic path is empty";
    return false;
  }

  std::error_code ec;
  const std::filesystem::path parent = path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "Unable to create directory " + parent.string() + ": " + ec.message();
      return false;
    }
  }

  std::filesystem::path tmp = path;
  tmp += ".tmp";

  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
      outError = "Unable to open file for writing: " + tmp.string();
      return false;
    }
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    f.flush();
    if (!f) {
      outError = "Write failed: " + tmp.string();
      return false;
    }
  }

  if (!SyncFile(tmp, outError)) {
    std::filesystem::remove(tmp, ec);
    return false;
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    outError = "Unable to rename " + tmp.string() + " -> " + path.string() + ": " + ec.message();
    std::filesystem::remove(tmp, ec);
    return false;
  }

  if (!parent.empty()) BestEffortSyncDirectory(parent);
  return true;
}

bool ReadFileText(const std::filesystem::path& path, std::string& outText, std::string& outError)
{
  outText.clear();
  outError.clear();

  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "Unable to open file: " + path.string();
    return false;
  }

  std::ostringstream oss;
  oss << f.rdbuf();
  if (f.bad()) {
    outError = "Read failed: " + path.string();
    return false;
  }
  outText = oss.str();
  return true;
}

} // namespace fleetfeast
