#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace fleetfeast {

// RAII helper that duplicates std::cout/std::cerr into a log file.
//
// The server runs unattended, so the console is often gone by the time someone wants
// to know why the agent stopped dispatching. Console output is untouched; the file copy
// gets one prefix per line:
//   2026-01-27T16:40:12.345Z [ERR] [t=0x1234abcd] [warn] [sim] store write failed
//
// Rotation on start: <log> -> <log>.1 -> <log>.2 ... up to keepFiles.

struct LogTeeOptions {
  std::filesystem::path path;

  // Number of rotated backups to keep (>=0). 0 truncates the existing file.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  bool prefixLines = true;

  // Tick loop, agent bridge and HTTP connections all log; the thread id tells them apart.
  bool prefixThreadId = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start logging. If already active, it is stopped first.
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original std::cout/std::cerr buffers and close the file.
  void stop();

  bool active() const { return m_impl != nullptr; }
  const std::filesystem::path& path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace fleetfeast
