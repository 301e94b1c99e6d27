#undef NDEBUG
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "job.hpp"
#include "message.hpp"

static void test_accepts_only_void_callables() {
  auto fn = [] {};
  auto takes_arg = [](int) {};
  static_assert(std::is_constructible<Job, decltype(fn)>::value, "");
  static_assert(!std::is_constructible<Job, int>::value, "");
  static_assert(!std::is_constructible<Job, std::string>::value, "");
  static_assert(!std::is_constructible<Job, decltype(takes_arg)>::value, "");
  (void)fn;
  (void)takes_arg;
}

static void test_runs_once() {
  int calls = 0;
  Job job([&calls] { calls++; });
  assert(job);
  job.run();
  assert(calls == 1);
  assert(!job);
  job.run();  // empty: nothing happens
  assert(calls == 1);
}

static void test_move_only_capture() {
  auto p = std::make_unique<int>(41);
  int out = 0;
  Job job([p = std::move(p), &out]() mutable { out = ++*p; });
  Job moved = std::move(job);
  assert(!job);
  moved.run();
  assert(out == 42);
}

static void test_unrun_job_releases_captures() {
  auto token = std::make_shared<int>(0);
  {
    Job job([token] { (void)token; });
    assert(token.use_count() == 2);
  }
  assert(token.use_count() == 1);
}

static void test_throwing_job_is_consumed() {
  Job job([] { throw std::runtime_error("boom"); });
  bool caught = false;
  try {
    job.run();
  } catch (const std::runtime_error&) {
    caught = true;
  }
  assert(caught);
  assert(!job);
}

static void test_message_kinds() {
  int calls = 0;
  Message m = Message::new_job(Job([&calls] { calls++; }));
  assert(m.kind == Message::Kind::NewJob);
  m.job.run();
  assert(calls == 1);

  Message t = Message::terminate();
  assert(t.kind == Message::Kind::Terminate);
  assert(!t.job);
}

int main() {
  test_accepts_only_void_callables();
  test_runs_once();
  test_move_only_capture();
  test_unrun_job_releases_captures();
  test_throwing_job_is_consumed();
  test_message_kinds();
  std::cout << "job ok\n";
  return 0;
}
