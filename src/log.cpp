#include "log.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>

static std::mutex g_log_mu;
static std::atomic<bool> g_log_enabled{true};

void log_line(const std::string& msg) {
  if (!g_log_enabled.load()) return;
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << msg << '\n';
}

void log_errno(const std::string& what) {
  int err = errno;
  log_line(what + ": " + std::strerror(err));
}

void set_log_enabled(bool on) { g_log_enabled.store(on); }
