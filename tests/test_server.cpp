#undef NDEBUG
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "server.hpp"

using namespace std::chrono_literals;

static std::string request(uint16_t port, const std::string& req) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  assert(fd >= 0);

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  assert(inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);
  assert(::connect(fd, (sockaddr*)&addr, sizeof(addr)) == 0);

  assert(::send(fd, req.data(), req.size(), 0) ==
         static_cast<ssize_t>(req.size()));

  std::string out;
  char buf[1024];
  ssize_t n;
  while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) out.append(buf, buf + n);
  ::close(fd);
  return out;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

static ServerConfig test_config() {
  ServerConfig cfg;
  cfg.port = 0;
  cfg.threads = 4;
  cfg.root = TEST_WWW_DIR;
  cfg.sleep_delay = 200ms;
  cfg.verbose = false;
  return cfg;
}

static void test_serves_routes_then_stops_after_limit() {
  ServerConfig cfg = test_config();
  cfg.max_connections = 3;

  Server s(cfg);
  assert(s.listen());
  assert(s.port() != 0);

  bool ok = false;
  std::thread t([&] { ok = s.run(); });

  std::string r1 = request(s.port(), "GET / HTTP/1.1\r\n\r\n");
  assert(starts_with(r1, "HTTP/1.1 200 OK\r\n"));
  assert(r1.find("Hello!") != std::string::npos);

  std::string r2 = request(s.port(), "GET /nowhere HTTP/1.1\r\n\r\n");
  assert(starts_with(r2, "HTTP/1.1 404 NOT FOUND\r\n"));

  std::string r3 = request(s.port(), "GET /sleep HTTP/1.1\r\n\r\n");
  assert(starts_with(r3, "HTTP/1.1 200 OK\r\n"));

  t.join();  // run() returns on its own after three connections
  assert(ok);
  assert(s.accepted() == 3);
}

static void test_slow_requests_overlap() {
  ServerConfig cfg = test_config();
  cfg.max_connections = 4;

  Server s(cfg);
  assert(s.listen());
  std::thread server([&] { s.run(); });

  auto t0 = std::chrono::steady_clock::now();
  std::vector<std::thread> clients;
  std::vector<std::string> responses(4);
  for (int i = 0; i < 4; i++) {
    clients.emplace_back([&, i] {
      responses[i] = request(s.port(), "GET /sleep HTTP/1.1\r\n\r\n");
    });
  }
  for (auto& c : clients) c.join();
  auto elapsed = std::chrono::steady_clock::now() - t0;
  server.join();

  for (auto& r : responses) assert(starts_with(r, "HTTP/1.1 200 OK\r\n"));
  // Four 200ms requests on four workers: one wave, not four (800ms).
  assert(elapsed < 600ms);
}

static void test_stop_breaks_accept() {
  Server s(test_config());
  assert(s.listen());

  bool ok = false;
  std::thread t([&] { ok = s.run(); });
  std::this_thread::sleep_for(50ms);
  s.stop();
  t.join();

  assert(ok);
  assert(s.accepted() == 0);
}

static void test_stop_before_listen_is_kept() {
  Server s(test_config());
  s.stop();
  assert(!s.listen());
  assert(!s.run());
  assert(s.accepted() == 0);
}

static void test_stop_between_listen_and_run() {
  Server s(test_config());
  assert(s.listen());
  s.stop();
  assert(s.run());  // returns at once without accepting
  assert(s.accepted() == 0);
  s.stop();  // listen fd is still owned by `s`; shutting it again is harmless
}

static void test_invalid_thread_count_rejected() {
  for (int threads : {0, -3}) {
    ServerConfig cfg = test_config();
    cfg.threads = threads;
    Server s(cfg);
    assert(s.listen());
    assert(!s.run());
    assert(s.accepted() == 0);
  }
}

static void test_bad_host_rejected() {
  ServerConfig cfg = test_config();
  cfg.host = "not-an-address";
  Server s(cfg);
  assert(!s.listen());
  assert(!s.run());
}

int main() {
  set_log_enabled(false);

  test_serves_routes_then_stops_after_limit();
  test_slow_requests_overlap();
  test_stop_breaks_accept();
  test_stop_before_listen_is_kept();
  test_stop_between_listen_and_run();
  test_invalid_thread_count_rejected();
  test_bad_host_rejected();

  std::cout << "server ok\n";
  return 0;
}
