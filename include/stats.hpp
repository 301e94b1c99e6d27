#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

// Counters shared by a pool and its workers.
class Stats {
 public:
  void on_start();
  void inc_live();
  void dec_live();
  void inc_completed();
  void inc_failed();

  int live() const;
  uint64_t completed() const;
  uint64_t failed() const;

  std::string render(size_t threads) const;

 private:
  std::chrono::steady_clock::time_point start_;
  std::atomic<int> live_{0};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failed_{0};
};
