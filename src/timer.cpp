#include "synctimer/timer.hpp"
#include "synctimer/executor.hpp"
#include "synctimer/log.hpp"
#include "synctimer/timer_shared.hpp"

#include <mutex>
#include <system_error>

namespace synctimer {

timer::timer() : timer(0) {}

timer::timer(std::size_t capacity)
    : shared_(std::make_shared<timer_shared>(capacity)) {
  executor_thread_ = std::thread(
      [exec = executor(shared_)]() mutable { exec.run_until_done(); });
}

timer::~timer() { shutdown(); }

task_guard timer::push(task_callable callable, task_clock::time_point next) {
  bool stopped = false;
  task_guard guard = [&] {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    stopped = shared_->done;
    const std::uint64_t id = shared_->next_id++;
    task_record record(id, next, std::move(callable));
    task_guard g = record.guard();
    shared_->tasks.push(std::move(record));
    return g;
  }();
  shared_->changed.notify_one();

  if (stopped)
    SYNCTIMER_LOG_WARN("task {} scheduled on a shut down timer; it will not run",
                       guard.task_id());
  return guard;
}

task_guard timer::schedule_at(std::chrono::system_clock::time_point when,
                              std::function<void()> fn) {
  const auto wall_now = std::chrono::system_clock::now();
  auto next = task_clock::now();
  if (when > wall_now)
    next = deadline_after(next, to_ticks(when - wall_now));
  return push(once_callable{std::move(fn)}, next);
}

void timer::schedule_immediately(std::function<void()> fn) {
  push(once_callable{std::move(fn)}, task_clock::now()).detach();
}

void timer::shutdown() {
  // Only the first caller joins; concurrent callers return at once
  if (shut_down_.exchange(true, std::memory_order_acq_rel))
    return;
  if (!executor_thread_.joinable())
    return;

  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->done = true;
  }
  shared_->changed.notify_one();

  try {
    executor_thread_.join();
  } catch (const std::system_error &e) {
    // e.g. shutdown() from a task body, i.e. on the executor thread itself
    SYNCTIMER_LOG_ERROR("error joining timer thread: {}", e.what());
    executor_thread_.detach();
    return;
  }

  bool failed = false;
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    failed = shared_->executor_failed;
  }
  if (failed)
    SYNCTIMER_LOG_ERROR("timer thread exited abnormally; pending tasks were "
                        "not run");
}

} // namespace synctimer
