#include <csignal>
#include <iostream>

#include "config.hpp"
#include "log.hpp"
#include "server.hpp"

static Server* g_server = nullptr;

static void on_signal(int) {
  if (g_server) g_server->stop();
}

int main(int argc, char** argv) {
  ServerConfig cfg;

  switch (parse_args(argc, argv, cfg, std::cerr)) {
    case ParseResult::Help:
      print_usage(std::cout);
      return 0;
    case ParseResult::Error:
      print_usage(std::cerr);
      return 1;
    case ParseResult::Ok:
      break;
  }

  set_log_enabled(cfg.verbose);

  Server s(cfg);
  if (!s.listen()) return 1;

  g_server = &s;
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::cerr << "Press Ctrl+C to stop gracefully.\n";

  bool ok = s.run();
  g_server = nullptr;
  return ok ? 0 : 1;
}
