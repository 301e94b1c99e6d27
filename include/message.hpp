#pragma once
#include <utility>

#include "job.hpp"

// What travels over the pool's channel: either a job to run or a request
// for the receiving worker to exit.
struct Message {
  enum class Kind { NewJob, Terminate };

  static Message new_job(Job job) { return Message(Kind::NewJob, std::move(job)); }
  static Message terminate() { return Message(Kind::Terminate, Job()); }

  Kind kind;
  Job job;

 private:
  Message(Kind k, Job j) : kind(k), job(std::move(j)) {}
};
