#ifndef SYNCTIMER_TASK_HPP
#define SYNCTIMER_TASK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <variant>

namespace synctimer {

using task_clock = std::chrono::steady_clock;

// `from + d`, clamped to time_point::max() instead of overflowing. A
// non-positive `d` yields `from`.
inline task_clock::time_point deadline_after(task_clock::time_point from,
                                             task_clock::duration d) noexcept {
  if (d <= task_clock::duration::zero())
    return from;
  if (d > task_clock::time_point::max() - from)
    return task_clock::time_point::max();
  return from + d;
}

// Flags shared by every record of one submission (and by its guard)
struct task_state {
  std::shared_ptr<std::atomic<bool>> running =
      std::make_shared<std::atomic<bool>>(false);
  std::shared_ptr<std::atomic<bool>> cancelled =
      std::make_shared<std::atomic<bool>>(false);
};

struct once_callable {
  std::function<void()> fn;
};

struct repeating_callable {
  std::function<void()> fn;
  task_clock::duration interval;
};

using task_callable = std::variant<once_callable, repeating_callable>;

struct ready_status {
  bool now;
  task_clock::duration remaining; // zero when now is true
};

class task_guard;

class task_record {
public:
  task_record(std::uint64_t id, task_clock::time_point next_execution,
              task_callable callable);
  task_record(std::uint64_t id, task_clock::time_point next_execution,
              task_state state, task_callable callable);

  task_record(task_record &&) noexcept = default;
  task_record &operator=(task_record &&) noexcept = default;
  task_record(const task_record &) = delete;
  task_record &operator=(const task_record &) = delete;

  // Run the body. A repeating record returns its successor, due one interval
  // after the body completed. Exceptions from the body propagate and leave
  // the running flag set, so any record sharing this state is never run
  // again.
  std::optional<task_record> run() &&;

  std::uint64_t id() const noexcept { return id_; }
  task_clock::time_point next_execution() const noexcept {
    return next_execution_;
  }
  bool cancelled() const noexcept {
    return state_.cancelled->load(std::memory_order_acquire);
  }
  bool repeating() const noexcept {
    return std::holds_alternative<repeating_callable>(callable_);
  }
  ready_status ready(task_clock::time_point now) const noexcept;

  task_guard guard() const;

  // Min-heap: earliest deadline first, lower id first on ties
  bool operator>(const task_record &other) const noexcept {
    if (next_execution_ != other.next_execution_)
      return next_execution_ > other.next_execution_;
    return id_ > other.id_;
  }

private:
  std::uint64_t id_;
  task_clock::time_point next_execution_;
  task_state state_;
  task_callable callable_;
};

// Handle to a scheduled task. Destroying it cancels the task unless detach()
// was called first. Cancellation is best-effort: a run that has already
// started completes, only later runs of a repeating task are prevented.
class task_guard {
public:
  task_guard(std::uint64_t task_id,
             std::shared_ptr<std::atomic<bool>> cancelled) noexcept;
  ~task_guard();

  task_guard(task_guard &&other) noexcept;
  task_guard &operator=(task_guard &&other) noexcept;
  task_guard(const task_guard &) = delete;
  task_guard &operator=(const task_guard &) = delete;

  // Id of the underlying task, for debugging
  std::uint64_t task_id() const noexcept { return task_id_; }

  // Give up control: the task runs regardless of this guard's lifetime
  void detach() noexcept;

  // Cancel now instead of at destruction
  void cancel() noexcept;

  bool attached() const noexcept { return cancelled_ != nullptr; }

private:
  std::uint64_t task_id_;
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace synctimer

#endif // SYNCTIMER_TASK_HPP
