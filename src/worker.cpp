#include "worker.hpp"

#include <exception>
#include <functional>
#include <string>

#include "log.hpp"

Worker::Worker(size_t id, std::shared_ptr<Channel<Message>> rx, Stats& stats)
    : id_(id) {
  stats.inc_live();
  try {
    thread_ = std::thread(&Worker::run, id, std::move(rx), std::ref(stats));
  } catch (...) {
    stats.dec_live();
    throw;
  }
}

Worker::~Worker() { join(); }

void Worker::join() {
  if (thread_.joinable()) thread_.join();
}

void Worker::run(size_t id, std::shared_ptr<Channel<Message>> rx,
                 Stats& stats) {
  const std::string tag = "Worker " + std::to_string(id);

  while (true) {
    auto msg = rx->recv();
    if (!msg.has_value()) {
      log_line(tag + " lost its channel; exiting.");
      break;
    }

    if (msg->kind == Message::Kind::Terminate) {
      log_line(tag + " was told to terminate.");
      break;
    }

    log_line(tag + " got a job; executing.");
    try {
      msg->job.run();
      stats.inc_completed();
    } catch (const std::exception& e) {
      stats.inc_failed();
      log_line(tag + " job failed: " + e.what());
    } catch (...) {
      stats.inc_failed();
      log_line(tag + " job failed: unknown exception");
    }
  }

  stats.dec_live();
}
