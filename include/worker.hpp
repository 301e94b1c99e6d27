#pragma once
#include <cstddef>
#include <memory>
#include <thread>

#include "channel.hpp"
#include "message.hpp"
#include "stats.hpp"

// One long-lived thread pulling messages off a shared channel.
//
// A job that throws (of any type) is caught here, logged and counted as
// failed; the worker then moves on to its next message.
class Worker {
 public:
  Worker(size_t id, std::shared_ptr<Channel<Message>> rx, Stats& stats);
  ~Worker();

  Worker(Worker&&) = default;
  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  // Safe to call more than once.
  void join();

  size_t id() const { return id_; }
  bool joined() const { return !thread_.joinable(); }

 private:
  static void run(size_t id, std::shared_ptr<Channel<Message>> rx,
                  Stats& stats);

  size_t id_;
  std::thread thread_;
};
