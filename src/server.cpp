#include "server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <string>
#include <utility>

#include "log.hpp"
#include "protocol.hpp"
#include "thread_pool.hpp"

Server::Server(ServerConfig cfg) : cfg_(std::move(cfg)) {}

Server::~Server() {
  int fd = listen_fd_.exchange(-1);
  if (fd != -1) ::close(fd);
}

bool Server::listen() {
  if (stopping_.load() || listen_fd_.load() != -1) return false;

  int listen_fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd < 0) {
    perror("socket");
    return false;
  }

  int yes = 1;
  if (setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
    perror("setsockopt");
    ::close(listen_fd);
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(cfg_.port);
  if (inet_pton(AF_INET, cfg_.host.c_str(), &addr.sin_addr) != 1) {
    log_line("Invalid IPv4 address: " + cfg_.host);
    ::close(listen_fd);
    return false;
  }

  if (bind(listen_fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
    perror("bind");
    ::close(listen_fd);
    return false;
  }

  if (::listen(listen_fd, 256) < 0) {
    perror("listen");
    ::close(listen_fd);
    return false;
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (getsockname(listen_fd, (sockaddr*)&bound, &len) < 0) {
    perror("getsockname");
    ::close(listen_fd);
    return false;
  }
  bound_port_ = ntohs(bound.sin_port);

  listen_fd_.store(listen_fd);
  // A stop() that raced with setup had no fd to shut down yet.
  if (stopping_.load()) ::shutdown(listen_fd, SHUT_RDWR);
  return true;
}

bool Server::run() {
  int listen_fd = listen_fd_.load();
  if (listen_fd < 0) return false;

  if (cfg_.threads < 1) {
    log_line("Invalid thread count: " + std::to_string(cfg_.threads));
    return false;
  }

  ThreadPool pool(static_cast<size_t>(cfg_.threads));

  log_line("Listening on " + cfg_.host + ":" + std::to_string(bound_port_) +
           " with " + std::to_string(cfg_.threads) + " threads");

  while (!stopping_.load()) {
    if (cfg_.max_connections > 0 &&
        accepted_.load() >= static_cast<size_t>(cfg_.max_connections)) {
      log_line("Served " + std::to_string(accepted_.load()) +
               " connections; shutting down.");
      break;
    }

    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int client_fd = ::accept(listen_fd, (sockaddr*)&client_addr, &client_len);

    if (client_fd < 0) {
      // If stop() shut the socket down, accept fails; exit loop cleanly
      if (stopping_.load()) break;
      if (errno == EINTR) continue;
      if (errno == EBADF || errno == EINVAL) break;
      perror("accept");
      continue;
    }

    accepted_.fetch_add(1);
    log_line("Connection established!");

    Connection conn(client_fd);
    const ServerConfig& cfg = cfg_;
    bool ok = pool.execute([conn = std::move(conn), &cfg]() mutable {
      handle_connection(std::move(conn), cfg);
    });

    if (!ok) {
      log_line("Pool is shut down; dropping connection");
      break;
    }
  }

  // Queued connections are still served before the workers exit.
  pool.shutdown();
  log_line(pool.stats().render(pool.size()));

  // Stop accepting; the fd itself is closed by the destructor.
  ::shutdown(listen_fd, SHUT_RDWR);

  log_line("Server stopped.");
  return true;
}

void Server::stop() {
  stopping_.store(true);

  // Shutting the socket down wakes accept().
  int fd = listen_fd_.load();
  if (fd != -1) ::shutdown(fd, SHUT_RDWR);
}
