#include "protocol.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#include "config.hpp"
#include "log.hpp"

static const char kOk[] = "HTTP/1.1 200 OK";
static const char kNotFound[] = "HTTP/1.1 404 NOT FOUND";
static const char kServerError[] = "HTTP/1.1 500 INTERNAL SERVER ERROR";

Connection::~Connection() {
  if (fd_ >= 0) ::close(fd_);
}

Connection& Connection::operator=(Connection&& other) noexcept {
  if (this != &other) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

LineReader::LineReader(size_t max_line) : max_line_(max_line) {}

std::optional<std::string> LineReader::read_line(int fd) {
  while (true) {
    auto pos = buffer_.find('\n');
    if (pos != std::string::npos) {
      std::string line = buffer_.substr(0, pos);
      buffer_.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (line.size() > max_line_) return std::string("**LINE_TOO_LONG**");
      return line;
    }

    char tmp[4096];
    ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      return std::nullopt;
    }
    if (n == 0) return std::nullopt;
    buffer_.append(tmp, tmp + n);

    if (buffer_.size() > max_line_ + 4096) {
      return std::string("**LINE_TOO_LONG**");
    }
  }
}

bool send_all(int fd, const char* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return false;
    sent += static_cast<size_t>(n);
  }
  return true;
}

bool send_str(int fd, const std::string& s) {
  return send_all(fd, s.data(), s.size());
}

Route route_request(const std::string& request_line) {
  if (request_line == "GET / HTTP/1.1") return {kOk, "hello.html", false};
  if (request_line == "GET /sleep HTTP/1.1") return {kOk, "hello.html", true};
  return {kNotFound, "404.html", false};
}

std::string build_response(const std::string& status_line,
                           const std::string& body) {
  std::ostringstream out;
  out << status_line << "\r\n";
  out << "Content-Length: " << body.size() << "\r\n";
  out << "\r\n";
  out << body;
  return out.str();
}

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void handle_connection(Connection conn, const ServerConfig& cfg) {
  LineReader lr(8192);

  auto line = lr.read_line(conn.fd());
  if (!line.has_value()) {
    log_line("Connection closed before a request line arrived");
    return;
  }
  log_line("Request: " + *line);

  Route route = route_request(*line);
  if (route.delayed) std::this_thread::sleep_for(cfg.sleep_delay);

  std::string path = cfg.root + "/" + route.filename;
  auto body = read_file(path);

  std::string resp;
  if (body.has_value()) {
    resp = build_response(route.status_line, *body);
  } else {
    log_line("Cannot read " + path + "; answering 500");
    resp = build_response(kServerError, "");
  }

  if (!send_str(conn.fd(), resp)) {
    log_errno("send");
  }
}
