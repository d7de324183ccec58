#include "fleetfeast/LogTee.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

namespace fleetfeast {

namespace {

std::filesystem::path RotatedPath(const std::filesystem::path& base, int idx)
{
  if (idx <= 0) return base;
  std::filesystem::path p = base;
  p += "." + std::to_string(idx);
  return p;
}

std::string UtcTimestamp()
{
  using clock = std::chrono::system_clock;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now().time_since_epoch());
  const std::time_t tt = static_cast<std::time_t>(ms.count() / 1000);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1,
                tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count() % 1000));
  return buf;
}

// Shared by the stdout and stderr buffers: one file, one lock, one line-start flag.
struct FileSink {
  std::ofstream file;
  std::mutex mutex;
  bool atLineStart = true;
  bool prefixLines = true;
  bool prefixThreadId = true;
};

class TeeBuf final : public std::streambuf {
public:
  TeeBuf(std::streambuf* console, FileSink* sink, const char* tag)
      : m_console(console)
      , m_sink(sink)
      , m_tag(tag)
  {
  }

protected:
  int overflow(int ch) override
  {
    if (ch == traits_type::eof()) return traits_type::not_eof(ch);
    const char c = static_cast<char>(ch);
    return (xsputn(&c, 1) == 1) ? ch : traits_type::eof();
  }

  std::streamsize xsputn(const char* s, std::streamsize n) override
  {
    if (n <= 0) return 0;
    std::scoped_lock<std::mutex> lock(m_sink->mutex);
    const std::streamsize console = m_console->sputn(s, n);
    writeFileLocked(s, n);
    return console;
  }

  int sync() override
  {
    std::scoped_lock<std::mutex> lock(m_sink->mutex);
    const int a = m_console->pubsync();
    m_sink->file.flush();
    return (a == 0 && m_sink->file.good()) ? 0 : -1;
  }

private:
  std::string prefix() const
  {
    std::ostringstream oss;
    oss << UtcTimestamp() << " [" << m_tag << "] ";
    if (m_sink->prefixThreadId) {
      const std::size_t tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
      oss << "[t=0x" << std::hex << (tid & 0xFFFFFFFFu) << std::dec << "] ";
    }
    return oss.str();
  }

  void writeFileLocked(const char* s, std::streamsize n)
  {
    std::ofstream& f = m_sink->file;
    if (!m_sink->prefixLines) {
      f.write(s, n);
      return;
    }

    const char* p = s;
    const char* end = s + n;
    while (p < end) {
      if (m_sink->atLineStart) {
        f << prefix();
        m_sink->atLineStart = false;
      }
      const char* nl = static_cast<const char*>(std::memchr(p, '\n', static_cast<std::size_t>(end - p)));
      const char* stop = nl ? nl + 1 : end;
      f.write(p, stop - p);
      if (nl) {
        m_sink->atLineStart = true;
        // Flush per line so the file is useful even if the process dies right after.
        f.flush();
      }
      p = stop;
    }
  }

  std::streambuf* m_console = nullptr;
  FileSink* m_sink = nullptr;
  const char* m_tag = "";
};

} // namespace

struct LogTee::Impl {
  std::filesystem::path path;
  FileSink sink;
  std::streambuf* origCout = nullptr;
  std::streambuf* origCerr = nullptr;
  std::unique_ptr<TeeBuf> coutBuf;
  std::unique_ptr<TeeBuf> cerrBuf;
};

LogTee::LogTee() = default;

LogTee::~LogTee()
{
  stop();
}

const std::filesystem::path& LogTee::path() const
{
  static const std::filesystem::path kEmpty;
  return m_impl ? m_impl->path : kEmpty;
}

bool LogTee::Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError)
{
  outError.clear();
  if (keepFiles <= 0) return true;

  std::error_code ec;
  for (int i = keepFiles; i >= 1; --i) {
    const std::filesystem::path dst = RotatedPath(basePath, i);
    const std::filesystem::path src = RotatedPath(basePath, i - 1);
    if (!std::filesystem::exists(src, ec)) continue;

    std::filesystem::remove(dst, ec);
    std::filesystem::rename(src, dst, ec);
    if (ec) {
      outError = "failed to rotate log '" + src.string() + "' -> '" + dst.string() + "': " + ec.message();
      return false;
    }
  }
  return true;
}

bool LogTee::start(const LogTeeOptions& opt, std::string& outError)
{
  outError.clear();
  stop();

  if (opt.path.empty()) {
    outError = "log path is empty";
    return false;
  }

  const std::filesystem::path parent = opt.path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      outError = "failed to create log directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  if (!Rotate(opt.path, opt.keepFiles, outError)) return false;

  auto impl = std::make_unique<Impl>();
  impl->path = opt.path;
  impl->sink.prefixLines = opt.prefixLines;
  impl->sink.prefixThreadId = opt.prefixThreadId;
  impl->sink.file.open(opt.path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!impl->sink.file) {
    outError = "unable to open log file for writing: " + opt.path.string();
    return false;
  }

  if (opt.teeStdout) {
    impl->origCout = std::cout.rdbuf();
    impl->coutBuf = std::make_unique<TeeBuf>(impl->origCout, &impl->sink, "OUT");
    std::cout.rdbuf(impl->coutBuf.get());
  }
  if (opt.teeStderr) {
    impl->origCerr = std::cerr.rdbuf();
    impl->cerrBuf = std::make_unique<TeeBuf>(impl->origCerr, &impl->sink, "ERR");
    std::cerr.rdbuf(impl->cerrBuf.get());
  }

  m_impl = std::move(impl);
  return true;
}

void LogTee::stop()
{
  if (!m_impl) return;

  // Restore first so logging during teardown never reaches a closed file.
  if (m_impl->coutBuf && std::cout.rdbuf() == m_impl->coutBuf.get()) std::cout.rdbuf(m_impl->origCout);
  if (m_impl->cerrBuf && std::cerr.rdbuf() == m_impl->cerrBuf.get()) std::cerr.rdbuf(m_impl->origCerr);

  m_impl->sink.file.flush();
  m_impl.reset();
}

} // namespace fleetfeast
