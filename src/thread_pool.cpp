#include "thread_pool.hpp"

#include <stdexcept>
#include <string>

#include "log.hpp"

ThreadPool::ThreadPool(size_t size)
    : chan_(std::make_shared<Channel<Message>>()) {
  if (size == 0) throw std::invalid_argument("ThreadPool size must be > 0");

  stats_.on_start();
  workers_.reserve(size);
  try {
    for (size_t i = 0; i < size; i++) {
      workers_.emplace_back(i, chan_, stats_);
    }
  } catch (...) {
    // Spawning failed part way; release the workers we already have.
    for (size_t i = 0; i < workers_.size(); i++) {
      chan_->send(Message::terminate());
    }
    for (auto& w : workers_) w.join();
    throw;
  }
}

ThreadPool::~ThreadPool() { shutdown(); }

bool ThreadPool::execute(Job job) {
  if (shut_down_.load()) return false;
  return chan_->send(Message::new_job(std::move(job)));
}

void ThreadPool::shutdown() {
  if (shut_down_.exchange(true)) return;

  log_line("Sending terminate message to all workers.");
  for (size_t i = 0; i < workers_.size(); i++) {
    chan_->send(Message::terminate());
  }

  log_line("Shutting down all workers.");
  for (auto& w : workers_) {
    log_line("Shutting down worker " + std::to_string(w.id()));
    w.join();
  }

  // Anything that raced in behind the terminates is never run; destroy it
  // now so captured resources (sockets) are released.
  chan_->close();
  size_t dropped = 0;
  while (chan_->recv()) dropped++;
  if (dropped > 0) {
    log_line("Dropped " + std::to_string(dropped) +
             " job(s) queued after shutdown.");
  }
}
