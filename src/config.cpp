#include "config.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

static uint16_t parse_u16(const char* s, uint16_t def) {
  try {
    int v = std::stoi(s);
    if (v < 0 || v > 65535) return def;
    return static_cast<uint16_t>(v);
  } catch (const std::logic_error&) {
    return def;
  }
}

static int parse_i32(const char* s, int def, int lo, int hi) {
  try {
    int v = std::stoi(s);
    if (v < lo || v > hi) return def;
    return v;
  } catch (const std::logic_error&) {
    return def;
  }
}

void print_usage(std::ostream& out) {
  out << "Usage: server [--host ADDR] [--port N] [--threads N] [--root DIR]\n"
      << "              [--max-connections N] [--sleep-ms N] [--quiet]\n"
      << "Routes: GET / | GET /sleep | anything else -> 404\n";
}

ParseResult parse_args(int argc, char** argv, ServerConfig& cfg,
                       std::ostream& err) {
  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto need = [&](const char* flag) -> const char* {
      if (i + 1 >= argc) {
        err << "Missing value for " << flag << "\n";
        return nullptr;
      }
      return argv[++i];
    };

    const char* v = nullptr;
    if (a == "--help") {
      return ParseResult::Help;
    } else if (a == "--quiet") {
      cfg.verbose = false;
    } else if (a == "--host") {
      if (!(v = need("--host"))) return ParseResult::Error;
      cfg.host = v;
    } else if (a == "--port") {
      if (!(v = need("--port"))) return ParseResult::Error;
      cfg.port = parse_u16(v, cfg.port);
    } else if (a == "--threads") {
      if (!(v = need("--threads"))) return ParseResult::Error;
      cfg.threads = parse_i32(v, cfg.threads, 1, 256);
    } else if (a == "--root") {
      if (!(v = need("--root"))) return ParseResult::Error;
      cfg.root = v;
    } else if (a == "--max-connections") {
      if (!(v = need("--max-connections"))) return ParseResult::Error;
      cfg.max_connections =
          parse_i32(v, cfg.max_connections, 0, 2000000);
    } else if (a == "--sleep-ms") {
      if (!(v = need("--sleep-ms"))) return ParseResult::Error;
      cfg.sleep_delay = std::chrono::milliseconds(parse_i32(
          v, static_cast<int>(cfg.sleep_delay.count()), 0, 600000));
    } else {
      err << "Unknown option " << a << "\n";
      return ParseResult::Error;
    }
  }
  return ParseResult::Ok;
}
