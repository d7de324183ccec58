#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fleetfeast {

struct HttpRequest {
  std::string method;
  std::string target; // raw request target
  std::string path;   // target without the query string
  std::string query;

  // Header names are lower-cased.
  std::map<std::string, std::string> headers;
  std::string body;

  // Percent-decoded query parameter, or `fallback` when absent.
  std::string queryParam(const std::string& name, const std::string& fallback = std::string()) const;
};

struct HttpResponse {
  int status = 200;
  std::string contentType = "application/json";
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;

  static HttpResponse Json(int status, std::string body);
  // {"error": message}
  static HttpResponse Error(int status, const std::string& message);
};

const char* HttpReasonPhrase(int status);

// Open response body for long-lived streams (text/event-stream).
class HttpStream {
public:
  explicit HttpStream(int fd)
      : m_fd(fd)
  {
  }

  // False once the peer is gone.
  bool write(const std::string& data);
  bool ok() const { return m_ok; }

private:
  int m_fd = -1;
  bool m_ok = true;
};

struct HttpServerOptions {
  std::string host = "0.0.0.0";
  int port = 8000;

  std::size_t maxHeaderBytes = 16 * 1024;
  std::size_t maxBodyBytes = 1024 * 1024;

  int maxConnections = 64;

  // Receive timeout for request headers and body.
  int readTimeoutMs = 10000;
};

// Minimal HTTP/1.1 server: one thread per connection, one request per connection
// (Connection: close). Enough for the UI, the agent sidecar and health probes.
class HttpServer {
public:
  using Handler = std::function<HttpResponse(const HttpRequest&)>;
  using StreamHandler = std::function<void(const HttpRequest&, HttpStream&)>;

  explicit HttpServer(HttpServerOptions opt);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Exact path match.
  void route(const std::string& method, const std::string& path, Handler h);
  // Longest matching prefix wins among prefix routes.
  void routePrefix(const std::string& method, const std::string& prefix, Handler h);
  // Response headers are sent by the server; the handler writes the body until it returns.
  void routeStream(const std::string& method, const std::string& path, const std::string& contentType,
                   StreamHandler h);

  bool start(std::string& outError);
  void stop();

  bool stopping() const { return m_stopping.load(); }

  // Bound port (useful with port 0).
  int port() const { return m_boundPort; }

  // Dispatch without a socket (tests).
  HttpResponse handle(const HttpRequest& req) const;

private:
  struct Route {
    std::string method;
    std::string path;
    bool prefix = false;
    Handler handler;
  };

  struct StreamRoute {
    std::string method;
    std::string path;
    std::string contentType;
    StreamHandler handler;
  };

  struct Connection {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void acceptLoop();
  void serve(int fd);
  void reapConnections(bool all);

  HttpServerOptions m_opt;

  std::vector<Route> m_routes;
  std::vector<StreamRoute> m_streams;

  int m_listenFd = -1;
  int m_boundPort = 0;
  std::atomic<bool> m_stopping{false};
  std::thread m_acceptThread;

  std::mutex m_connMutex;
  std::vector<Connection> m_connections;
  std::set<int> m_openFds;
};

// Parse a raw request head ("GET /x?y=1 HTTP/1.1\r\nHost: ...\r\n\r\n"); body excluded.
bool ParseHttpRequestHead(const std::string& head, HttpRequest& out, std::string& outError);

std::string PercentDecode(const std::string& s);

} // namespace fleetfeast
