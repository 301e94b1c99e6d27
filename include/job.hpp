#pragma once
#include <memory>
#include <type_traits>
#include <utility>

// Move-only, type-erased `void()` callable that runs at most once.
// Unlike std::function it accepts move-only captures (e.g. a Connection).
class Job {
 public:
  Job() = default;

  template <typename F,
            typename = std::enable_if_t<
                !std::is_same<std::decay_t<F>, Job>::value &&
                std::is_invocable_r<void, std::decay_t<F>&>::value>>
  Job(F&& f)
      : impl_(std::make_unique<Impl<std::decay_t<F>>>(std::forward<F>(f))) {}

  Job(Job&&) noexcept = default;
  Job& operator=(Job&&) noexcept = default;

  Job(const Job&) = delete;
  Job& operator=(const Job&) = delete;

  explicit operator bool() const { return impl_ != nullptr; }

  // Consumes the callable: the job is empty afterwards, even if it throws.
  void run() {
    auto impl = std::move(impl_);
    if (impl) impl->call();
  }

 private:
  struct Callable {
    virtual ~Callable() = default;
    virtual void call() = 0;
  };

  template <typename F>
  struct Impl : Callable {
    explicit Impl(F&& f) : fn(std::move(f)) {}
    explicit Impl(const F& f) : fn(f) {}
    void call() override { fn(); }
    F fn;
  };

  std::unique_ptr<Callable> impl_;
};
