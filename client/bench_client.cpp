#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static bool send_all(int fd, const char* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return false;
    sent += (size_t)n;
  }
  return true;
}

// Reads until the server closes the connection.
static bool recv_all(int fd, std::string& out) {
  out.clear();
  char buf[4096];
  while (true) {
    ssize_t n = recv(fd, buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return true;
    out.append(buf, buf + n);
  }
}

static int connect_to(const std::string& host, int port) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return -1;

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons((uint16_t)port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(fd);
    return -1;
  }

  if (connect(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
    close(fd);
    return -1;
  }
  return fd;
}

int main(int argc, char** argv) {
  std::string host = "127.0.0.1";
  int port = 7878;
  int clients = 16;
  int seconds = 5;
  std::string path = "/";

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto need = [&]() {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << a << "\n";
        std::exit(1);
      }
      return std::string(argv[++i]);
    };
    if (a == "--host")
      host = need();
    else if (a == "--port")
      port = std::stoi(need());
    else if (a == "--clients")
      clients = std::stoi(need());
    else if (a == "--seconds")
      seconds = std::stoi(need());
    else if (a == "--path")
      path = need();
    else if (a == "--help") {
      std::cout << "bench_client --host 127.0.0.1 --port 7878 --clients 16 "
                   "--seconds 5 --path /\n";
      return 0;
    }
  }

  std::atomic<bool> start{false};
  std::atomic<bool> stop{false};
  std::atomic<uint64_t> ok{0};
  std::atomic<uint64_t> errors{0};

  const std::string request = "GET " + path + " HTTP/1.1\r\n\r\n";

  // One request per connection: the server closes after each response.
  auto worker = [&]() {
    while (!start.load()) std::this_thread::yield();

    std::string resp;
    while (!stop.load()) {
      int fd = connect_to(host, port);
      if (fd < 0) {
        errors.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      if (send_all(fd, request.data(), request.size()) && recv_all(fd, resp) &&
          resp.compare(0, 9, "HTTP/1.1 ") == 0) {
        ok.fetch_add(1);
      } else {
        errors.fetch_add(1);
      }
      close(fd);
    }
  };

  std::vector<std::thread> ts;
  ts.reserve(clients);
  for (int i = 0; i < clients; i++) ts.emplace_back(worker);

  auto t0 = std::chrono::steady_clock::now();
  start.store(true);
  std::this_thread::sleep_for(std::chrono::seconds(seconds));
  stop.store(true);

  for (auto& t : ts) t.join();
  auto t1 = std::chrono::steady_clock::now();

  double sec = std::chrono::duration<double>(t1 - t0).count();
  uint64_t total = ok.load();
  std::cout << "clients=" << clients << " seconds=" << sec
            << " requests=" << total << " errors=" << errors.load()
            << " req/sec=" << (total / sec) << "\n";
}
