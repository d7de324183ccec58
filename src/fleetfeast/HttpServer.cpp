#include "fleetfeast/HttpServer.hpp"

#include "fleetfeast/Json.hpp"
#include "fleetfeast/Log.hpp"
#include "fleetfeast/Version.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace fleetfeast {

namespace {

std::string ToLower(std::string s)
{
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string Trim(const std::string& s)
{
  const std::size_t a = s.find_first_not_of(" \t");
  if (a == std::string::npos) return std::string();
  const std::size_t b = s.find_last_not_of(" \t\r");
  return s.substr(a, b - a + 1);
}

bool SendAll(int fd, const char* data, std::size_t size)
{
  std::size_t sent = 0;
  while (sent < size) {
    const ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

std::string ResponseHead(int status, const std::string& contentType, std::size_t contentLength, bool streaming,
                         const std::vector<std::pair<std::string, std::string>>& extra)
{
  std::ostringstream oss;
  oss << "HTTP/1.1 " << status << " " << HttpReasonPhrase(status) << "\r\n";
  oss << "Server: " << FleetFeastServerTag() << "\r\n";
  oss << "Content-Type: " << contentType << "\r\n";
  oss << "Access-Control-Allow-Origin: *\r\n";
  if (streaming) {
    oss << "Cache-Control: no-cache\r\n";
  } else {
    oss << "Content-Length: " << contentLength << "\r\n";
  }
  oss << "Connection: close\r\n";
  for (const auto& h : extra) oss << h.first << ": " << h.second << "\r\n";
  oss << "\r\n";
  return oss.str();
}

void SendResponse(int fd, const HttpResponse& r)
{
  const std::string head = ResponseHead(r.status, r.contentType, r.body.size(), false, r.headers);
  if (SendAll(fd, head.data(), head.size())) SendAll(fd, r.body.data(), r.body.size());
}

int HexDigit(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Reads the request head and body. Returns an HTTP status on failure (0 = peer gone).
int ReadRequest(int fd, const HttpServerOptions& opt, HttpRequest& req, std::string& err)
{
  std::string buf;
  std::size_t headEnd = std::string::npos;
  char chunk[4096];

  while (headEnd == std::string::npos) {
    const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return buf.empty() ? 0 : 408;
    buf.append(chunk, static_cast<std::size_t>(n));
    headEnd = buf.find("\r\n\r\n");
    if (headEnd == std::string::npos && buf.size() > opt.maxHeaderBytes) {
      err = "request head too large";
      return 431;
    }
  }

  if (!ParseHttpRequestHead(buf.substr(0, headEnd + 4), req, err)) return 400;

  std::size_t contentLength = 0;
  const auto it = req.headers.find("content-length");
  if (it != req.headers.end()) {
    char* end = nullptr;
    const unsigned long long v = std::strtoull(it->second.c_str(), &end, 10);
    if (!end || *end != '\0' || it->second.empty()) {
      err = "invalid Content-Length";
      return 400;
    }
    if (v > opt.maxBodyBytes) {
      err = "request body too large";
      return 413;
    }
    contentLength = static_cast<std::size_t>(v);
  } else if (req.headers.count("transfer-encoding")) {
    err = "chunked request bodies are not supported";
    return 411;
  }

  req.body = buf.substr(headEnd + 4);
  while (req.body.size() < contentLength) {
    const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      err = "incomplete request body";
      return 408;
    }
    req.body.append(chunk, static_cast<std::size_t>(n));
  }
  if (req.body.size() > contentLength) req.body.resize(contentLength);
  return 200;
}

} // namespace

std::string PercentDecode(const std::string& s)
{
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < s.size()) {
      const int hi = HexDigit(s[i + 1]);
      const int lo = HexDigit(s[i + 2]);
      if (hi < 0 || lo < 0) {
        out.push_back(c);
        continue;
      }
      out.push_back(static_cast<char>(hi * 16 + lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string HttpRequest::queryParam(const std::string& name, const std::string& fallback) const
{
  std::size_t pos = 0;
  while (pos <= query.size()) {
    std::size_t amp = query.find('&', pos);
    if (amp == std::string::npos) amp = query.size();
    const std::string pair = query.substr(pos, amp - pos);
    const std::size_t eq = pair.find('=');
    const std::string key = PercentDecode(pair.substr(0, eq));
    if (key == name) return (eq == std::string::npos) ? std::string() : PercentDecode(pair.substr(eq + 1));
    pos = amp + 1;
  }
  return fallback;
}

HttpResponse HttpResponse::Json(int status, std::string body)
{
  HttpResponse r;
  r.status = status;
  r.body = std::move(body);
  return r;
}

HttpResponse HttpResponse::Error(int status, const std::string& message)
{
  return Json(status, "{\"error\":\"" + JsonEscape(message) + "\"}");
}

const char* HttpReasonPhrase(int status)
{
  switch (status) {
  case 200: return "OK";
  case 202: return "Accepted";
  case 204: return "No Content";
  case 400: return "Bad Request";
  case 404: return "Not Found";
  case 405: return "Method Not Allowed";
  case 408: return "Request Timeout";
  case 411: return "Length Required";
  case 413: return "Payload Too Large";
  case 431: return "Request Header Fields Too Large";
  case 500: return "Internal Server Error";
  case 503: return "Service Unavailable";
  default: return "Unknown";
  }
}

bool ParseHttpRequestHead(const std::string& head, HttpRequest& out, std::string& outError)
{
  out = HttpRequest{};

  std::size_t lineEnd = head.find("\r\n");
  if (lineEnd == std::string::npos) {
    outError = "missing request line";
    return false;
  }

  std::istringstream line(head.substr(0, lineEnd));
  std::string version;
  if (!(line >> out.method >> out.target >> version) || version.rfind("HTTP/1.", 0) != 0) {
    outError = "malformed request line";
    return false;
  }
  if (out.target.empty() || out.target[0] != '/') {
    outError = "request target must be an absolute path";
    return false;
  }

  const std::size_t q = out.target.find('?');
  out.path = PercentDecode(out.target.substr(0, q));
  if (q != std::string::npos) out.query = out.target.substr(q + 1);

  std::size_t pos = lineEnd + 2;
  while (pos < head.size()) {
    const std::size_t end = head.find("\r\n", pos);
    if (end == std::string::npos || end == pos) break;
    const std::string h = head.substr(pos, end - pos);
    const std::size_t colon = h.find(':');
    if (colon == std::string::npos || colon == 0) {
      outError = "malformed header line";
      return false;
    }
    out.headers[ToLower(Trim(h.substr(0, colon)))] = Trim(h.substr(colon + 1));
    pos = end + 2;
  }
  return true;
}

bool HttpStream::write(const std::string& data)
{
  if (!m_ok) return false;
  m_ok = SendAll(m_fd, data.data(), data.size());
  return m_ok;
}

HttpServer::HttpServer(HttpServerOptions opt)
    : m_opt(std::move(opt))
{
}

HttpServer::~HttpServer()
{
  stop();
}

void HttpServer::route(const std::string& method, const std::string& path, Handler h)
{
  m_routes.push_back(Route{method, path, false, std::move(h)});
}

void HttpServer::routePrefix(const std::string& method, const std::string& prefix, Handler h)
{
  m_routes.push_back(Route{method, prefix, true, std::move(h)});
}

void HttpServer::routeStream(const std::string& method, const std::string& path, const std::string& contentType,
                             StreamHandler h)
{
  m_streams.push_back(StreamRoute{method, path, contentType, std::move(h)});
}

HttpResponse HttpServer::handle(const HttpRequest& req) const
{
  const Route* best = nullptr;
  bool pathKnown = false;
  for (const Route& r : m_routes) {
    const bool match = r.prefix ? req.path.rfind(r.path, 0) == 0 : req.path == r.path;
    if (!match) continue;
    pathKnown = true;
    if (r.method != req.method) continue;
    if (!best || (!r.prefix && best->prefix) || (r.prefix && best->prefix && r.path.size() > best->path.size())) {
      best = &r;
    }
  }
  for (const StreamRoute& s : m_streams) {
    if (s.path == req.path) pathKnown = true;
  }

  if (!best) {
    if (req.method == "OPTIONS" && pathKnown) {
      HttpResponse r;
      r.status = 204;
      r.headers.push_back({"Access-Control-Allow-Methods", "GET, POST, OPTIONS"});
      r.headers.push_back({"Access-Control-Allow-Headers", "Content-Type"});
      return r;
    }
    return pathKnown ? HttpResponse::Error(405, "method not allowed") : HttpResponse::Error(404, "not found");
  }
  return best->handler(req);
}

bool HttpServer::start(std::string& outError)
{
  outError.clear();
  if (m_listenFd >= 0) {
    outError = "http server already started";
    return false;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  addrinfo* res = nullptr;
  const std::string port = std::to_string(m_opt.port);
  const char* host = m_opt.host.empty() ? nullptr : m_opt.host.c_str();
  const int gai = ::getaddrinfo(host, port.c_str(), &hints, &res);
  if (gai != 0) {
    outError = "getaddrinfo(" + m_opt.host + "): " + ::gai_strerror(gai);
    return false;
  }

  int fd = -1;
  std::string lastErr = "no usable address";
  for (addrinfo* ai = res; ai; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      lastErr = std::string("socket: ") + std::strerror(errno);
      continue;
    }
    const int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, 64) == 0) break;
    lastErr = std::string("bind/listen: ") + std::strerror(errno);
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);

  if (fd < 0) {
    outError = "unable to listen on " + m_opt.host + ":" + port + ": " + lastErr;
    return false;
  }

  sockaddr_storage bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
    if (bound.ss_family == AF_INET) {
      m_boundPort = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
    } else if (bound.ss_family == AF_INET6) {
      m_boundPort = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
    }
  }

  m_listenFd = fd;
  m_stopping.store(false);
  m_acceptThread = std::thread([this] { acceptLoop(); });
  LogInfo("http", "listening on " + m_opt.host + ":" + std::to_string(m_boundPort));
  return true;
}

void HttpServer::stop()
{
  if (m_stopping.exchange(true)) return;

  if (m_acceptThread.joinable()) m_acceptThread.join();
  if (m_listenFd >= 0) {
    ::close(m_listenFd);
    m_listenFd = -1;
  }

  {
    // Unblock connection threads stuck in recv/send.
    std::lock_guard<std::mutex> lock(m_connMutex);
    for (int fd : m_openFds) ::shutdown(fd, SHUT_RDWR);
  }
  reapConnections(true);
}

void HttpServer::reapConnections(bool all)
{
  std::vector<Connection> finished;
  {
    std::lock_guard<std::mutex> lock(m_connMutex);
    auto it = m_connections.begin();
    while (it != m_connections.end()) {
      if (all || it->done->load()) {
        finished.push_back(std::move(*it));
        it = m_connections.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (Connection& c : finished) {
    if (c.thread.joinable()) c.thread.join();
  }
}

void HttpServer::acceptLoop()
{
  while (!m_stopping.load()) {
    pollfd pfd{};
    pfd.fd = m_listenFd;
    pfd.events = POLLIN;
    const int pr = ::poll(&pfd, 1, 250);
    reapConnections(false);
    if (pr <= 0) continue;

    const int fd = ::accept(m_listenFd, nullptr, nullptr);
    if (fd < 0) {
      if (errno != EINTR && errno != EAGAIN) LogWarn("http", std::string("accept failed: ") + std::strerror(errno));
      continue;
    }

    timeval tv{};
    tv.tv_sec = m_opt.readTimeoutMs / 1000;
    tv.tv_usec = (m_opt.readTimeoutMs % 1000) * 1000;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::lock_guard<std::mutex> lock(m_connMutex);
    if (static_cast<int>(m_connections.size()) >= m_opt.maxConnections) {
      SendResponse(fd, HttpResponse::Error(503, "too many connections"));
      ::close(fd);
      continue;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    m_openFds.insert(fd);
    Connection c;
    c.done = done;
    c.thread = std::thread([this, fd, done] {
      serve(fd);
      {
        std::lock_guard<std::mutex> l(m_connMutex);
        m_openFds.erase(fd);
      }
      ::close(fd);
      done->store(true);
    });
    m_connections.push_back(std::move(c));
  }
}

void HttpServer::serve(int fd)
{
  HttpRequest req;
  std::string err;
  const int status = ReadRequest(fd, m_opt, req, err);
  if (status == 0) return;
  if (status != 200) {
    SendResponse(fd, HttpResponse::Error(status, err.empty() ? HttpReasonPhrase(status) : err));
    return;
  }

  LogDebug("http", req.method + " " + req.target);

  for (const StreamRoute& s : m_streams) {
    if (s.path != req.path || s.method != req.method) continue;
    const std::string head = ResponseHead(200, s.contentType, 0, true, {});
    if (!SendAll(fd, head.data(), head.size())) return;
    HttpStream stream(fd);
    s.handler(req, stream);
    return;
  }

  SendResponse(fd, handle(req));
}

} // namespace fleetfeast
