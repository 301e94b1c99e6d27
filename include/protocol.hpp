#pragma once

#include <optional>
#include <string>

struct ServerConfig;

// Owns a connected socket; closes it on destruction.
class Connection {
 public:
  explicit Connection(int fd) : fd_(fd) {}
  ~Connection();

  Connection(Connection&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  Connection& operator=(Connection&& other) noexcept;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  int fd() const { return fd_; }

 private:
  int fd_;
};

class LineReader {
 public:
  explicit LineReader(size_t max_line = 8192);

  // Returns a line without '\n' (and strips optional '\r').
  // Returns nullopt on disconnect/error.
  // If line too long, returns "**LINE_TOO_LONG**".
  std::optional<std::string> read_line(int fd);

 private:
  size_t max_line_;
  std::string buffer_;
};

bool send_all(int fd, const char* data, size_t len);
bool send_str(int fd, const std::string& s);

struct Route {
  std::string status_line;
  std::string filename;
  bool delayed = false;  // the /sleep route
};

// Picks the response for a request line such as "GET / HTTP/1.1".
Route route_request(const std::string& request_line);

// "<status_line>\r\nContent-Length: N\r\n\r\n<body>"
std::string build_response(const std::string& status_line,
                           const std::string& body);

std::optional<std::string> read_file(const std::string& path);

// Reads one request from `conn`, answers it, then lets `conn` close.
// Any I/O failure is logged and only drops this connection.
void handle_connection(Connection conn, const ServerConfig& cfg);
