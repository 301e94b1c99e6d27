#pragma once
#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

#include "channel.hpp"
#include "job.hpp"
#include "message.hpp"
#include "stats.hpp"
#include "worker.hpp"

// Fixed-size pool of workers fed from one unbounded FIFO channel.
class ThreadPool {
 public:
  // Throws std::invalid_argument if size == 0.
  explicit ThreadPool(size_t size);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Queues the job for exactly one worker. Never blocks on capacity.
  // Returns false (and drops the job) once shutdown has begun.
  bool execute(Job job);

  // Sends one Terminate per worker and joins them all. Jobs already queued
  // when this is called still run first. Later calls are no-ops.
  void shutdown();

  size_t size() const { return workers_.size(); }
  bool is_shut_down() const { return shut_down_.load(); }
  const Stats& stats() const { return stats_; }

 private:
  Stats stats_;
  std::shared_ptr<Channel<Message>> chan_;
  std::vector<Worker> workers_;
  std::atomic<bool> shut_down_{false};
};
