#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>

#include "config.hpp"

// Single-threaded accept loop that hands every connection to a ThreadPool.
class Server {
 public:
  explicit Server(ServerConfig cfg);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  bool listen();  // create, bind and listen; reports errors via perror
  bool run();     // blocking accept loop; shuts the pool down on exit

  // Safe from another thread or a signal handler. Sticky: a stop requested
  // before listen() or run() makes them return without serving.
  void stop();

  // Bound port; differs from the configured one when that was 0.
  uint16_t port() const { return bound_port_; }
  size_t accepted() const { return accepted_.load(); }

 private:
  ServerConfig cfg_;
  // Closed only by the destructor, so stop() never touches a stale fd.
  std::atomic<int> listen_fd_{-1};
  std::atomic<bool> stopping_{false};
  std::atomic<size_t> accepted_{0};
  uint16_t bound_port_ = 0;
};
