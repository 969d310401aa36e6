#ifndef SYNCTIMER_TIMER_HPP
#define SYNCTIMER_TIMER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <utility>

#include "task.hpp"

namespace synctimer {

struct timer_shared;

// Schedules one-off and repeating tasks, executed in deadline order on a
// single background thread owned by the timer. Tasks should be short-lived:
// a slow body delays every other pending task.
//
// The scheduling methods may be called from any number of threads.
class timer {
public:
  // Starts the background thread immediately. Throws std::system_error if the
  // thread cannot be created.
  timer();

  // Same, reserving room for `capacity` pending tasks up front
  explicit timer(std::size_t capacity);

  // Shuts the background thread down; pending tasks are discarded
  ~timer();

  timer(const timer &) = delete;
  timer &operator=(const timer &) = delete;

  // Run `fn` once, after `delay`
  template <typename Rep, typename Period>
  [[nodiscard]] task_guard schedule_in(std::chrono::duration<Rep, Period> delay,
                                       std::function<void()> fn) {
    return push(once_callable{std::move(fn)},
                deadline_after(task_clock::now(), to_ticks(delay)));
  }

  // Run `fn` once at a wall-clock time. The time is converted to a monotonic
  // deadline here and never re-synced, so later clock adjustments do not
  // move it. A time in the past runs as soon as possible.
  [[nodiscard]] task_guard
  schedule_at(std::chrono::system_clock::time_point when,
              std::function<void()> fn);

  // Run `fn` every `interval`, the first time one interval from now. Each run
  // is due one interval after the previous one finished, so slow bodies
  // drift rather than overlap.
  template <typename Rep, typename Period>
  [[nodiscard]] task_guard
  schedule_repeating(std::chrono::duration<Rep, Period> interval,
                     std::function<void()> fn) {
    const auto ticks = to_ticks(interval);
    return push(repeating_callable{std::move(fn), ticks},
                deadline_after(task_clock::now(), ticks));
  }

  // Run `fn` as soon as possible. Cannot be cancelled.
  void schedule_immediately(std::function<void()> fn);

  // Stop the background thread and wait for it. Idempotent; called by the
  // destructor, and safe to call from several threads at once. Tasks
  // scheduled afterwards never run.
  void shutdown();

private:
  // Saturates instead of overflowing, so e.g. seconds::max() means "never".
  // Negative durations become zero.
  template <typename Rep, typename Period>
  static task_clock::duration to_ticks(std::chrono::duration<Rep, Period> d) {
    using source = std::chrono::duration<Rep, Period>;
    if (d <= source::zero())
      return task_clock::duration::zero();
    if (d > std::chrono::duration_cast<source>(task_clock::duration::max()))
      return task_clock::duration::max();
    return std::chrono::duration_cast<task_clock::duration>(d);
  }

  task_guard push(task_callable callable, task_clock::time_point next);

  std::shared_ptr<timer_shared> shared_;
  std::thread executor_thread_;
  std::atomic<bool> shut_down_{false};
};

} // namespace synctimer

#endif // SYNCTIMER_TIMER_HPP
