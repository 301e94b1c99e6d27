#include "stats.hpp"

#include <sstream>

void Stats::on_start() { start_ = std::chrono::steady_clock::now(); }

void Stats::inc_live() { live_.fetch_add(1); }

void Stats::dec_live() { live_.fetch_sub(1); }

void Stats::inc_completed() { completed_.fetch_add(1); }

void Stats::inc_failed() { failed_.fetch_add(1); }

int Stats::live() const { return live_.load(); }

uint64_t Stats::completed() const { return completed_.load(); }

uint64_t Stats::failed() const { return failed_.load(); }

std::string Stats::render(size_t threads) const {
  auto now = std::chrono::steady_clock::now();
  auto up =
      std::chrono::duration_cast<std::chrono::seconds>(now - start_).count();

  std::ostringstream out;

  out << "UPTIME " << up << "s\n";
  out << "THREADS " << threads << "\n";
  out << "LIVE_WORKERS " << live_.load() << "\n";
  out << "JOBS_COMPLETED " << completed_.load() << "\n";
  out << "JOBS_FAILED " << failed_.load() << "\n";

  return out.str();
}
