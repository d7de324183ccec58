#pragma once

#include <filesystem>
#include <string>

namespace fleetfeast {

// Filesystem durability helpers used by the file-backed state store.
//
// std::ofstream::flush() does not put bytes on stable storage. A snapshot is
// only considered written after:
//   1) write <path>.tmp
//   2) fsync(tmp)
//   3) rename(tmp -> path)
//   4) fsync(parent directory)

bool SyncFile(const std::filesystem::path& path, std::string& outError);

// Some filesystems refuse to fsync a directory; callers treat that as best-effort.
bool SyncDirectory(const std::filesystem::path& dir, std::string& outError);

void BestEffortSyncDirectory(const std::filesystem::path& dir);

// Replace `path` with `data` using the sequence above. Readers never observe a
// partially written file.
bool WriteFileAtomic(const std::filesystem::path& path, const std::string& data, std::string& outError);

// Read a whole file. Returns false if it cannot be opened or read.
bool ReadFileText(const std::filesystem::path& path, std::string& outText, std::string& outError);

} // namespace fleetfeast
