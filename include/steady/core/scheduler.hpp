#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>

namespace steady {

// Where receive_on() delivers subsequent values.
struct executor {
  virtual ~executor() = default;
  virtual void post(std::function<void()> f) = 0;
};

// Runs the task on the posting thread before post() returns.
struct inline_executor final : executor {
  void post(std::function<void()> f) override { f(); }
};

// FIFO queue without a thread of its own: tasks run when the owner calls
// drain() (e.g. from a UI loop, or from a test to make async delivery
// deterministic). Tasks posted while draining run in the same drain().
class strand final : public executor {
public:
  void post(std::function<void()> f) override {
    std::lock_guard<std::mutex> lock(m_);
    q_.push(std::move(f));
  }

  // Returns the number of tasks that ran.
  std::size_t drain() {
    std::size_t ran = 0;
    while (run_one()) ++ran;
    return ran;
  }

  bool run_one() {
    std::function<void()> f;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (q_.empty()) return false;
      f = std::move(q_.front());
      q_.pop();
    }
    f();
    return true;
  }

  std::size_t pending() const {
    std::lock_guard<std::mutex> lock(m_);
    return q_.size();
  }

private:
  mutable std::mutex m_;
  std::queue<std::function<void()>> q_;
};

} // namespace steady
