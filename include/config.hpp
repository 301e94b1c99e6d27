#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>

struct ServerConfig {
  std::string host = "127.0.0.1";
  uint16_t port = 7878;
  int threads = 4;
  std::string root = "www";
  int max_connections = 0;  // 0 = serve until stopped
  std::chrono::milliseconds sleep_delay{5000};
  bool verbose = true;
};

enum class ParseResult { Ok, Help, Error };

// Out-of-range values fall back to the current setting in `cfg`.
// A flag missing its value is an error, reported on `err`.
ParseResult parse_args(int argc, char** argv, ServerConfig& cfg,
                       std::ostream& err);

void print_usage(std::ostream& out);
