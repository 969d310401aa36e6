#include "synctimer/executor.hpp"
#include "synctimer/allocator.hpp"
#include "synctimer/config.hpp"
#include "synctimer/log.hpp"

#include <exception>
#include <mutex>
#include <utility>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace synctimer {

executor::executor(std::shared_ptr<timer_shared> shared)
    : shared_(std::move(shared)), batch_(mi_resource()),
      successors_(mi_resource()) {
  batch_.reserve(config::max_batch_size);
  successors_.reserve(config::max_batch_size);
}

void executor::run_until_done() {
#if defined(__linux__)
  pthread_setname_np(pthread_self(), "synctimer-exec");
#endif

  try {
    loop();
  } catch (const std::exception &e) {
    SYNCTIMER_LOG_ERROR("timer executor terminated: {}", e.what());
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->executor_failed = true;
  } catch (...) {
    SYNCTIMER_LOG_ERROR("timer executor terminated by a non-standard exception");
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->executor_failed = true;
  }
}

void executor::loop() {
  while (true) {
    next_action action = collect_batch();
    switch (action.kind) {
    case action_kind::exit:
      discard_pending();
      return;
    case action_kind::execute_batch:
      execute_batch();
      reinsert_successors();
      break;
    case action_kind::sleep_until:
      if (!sleep_until(action.sleep_for, action.epoch)) {
        discard_pending();
        return;
      }
      break;
    }
  }
}

executor::next_action executor::collect_batch() {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  if (shared_->done)
    return {action_kind::exit};

  const std::uint64_t epoch = shared_->next_id;
  const auto now = task_clock::now();
  auto &tasks = shared_->tasks;

  while (batch_.size() < config::max_batch_size && !tasks.empty()) {
    ready_status ready = tasks.top().ready(now);
    if (!ready.now) {
      if (batch_.empty())
        return {action_kind::sleep_until, ready.remaining, epoch};
      break;
    }
    batch_.push_back(tasks.pop());
  }

  if (batch_.empty())
    return {action_kind::sleep_until, config::default_loop_time, epoch};
  return {action_kind::execute_batch};
}

void executor::execute_batch() {
  for (auto &record : batch_) {
    const std::uint64_t id = record.id();
    if (record.cancelled()) {
      SYNCTIMER_LOG_DEBUG("encountered cancelled task {}", id);
      continue;
    }

    try {
      if (auto successor = std::move(record).run())
        successors_.push_back(std::move(*successor));
    } catch (const std::exception &e) {
      SYNCTIMER_LOG_ERROR("uncaught exception when running task {}: {}", id,
                          e.what());
    } catch (...) {
      SYNCTIMER_LOG_ERROR("uncaught non-standard exception when running task {}",
                          id);
    }
  }
  batch_.clear();
}

void executor::reinsert_successors() {
  if (successors_.empty())
    return;

  std::lock_guard<std::mutex> lock(shared_->mutex);
  for (auto &successor : successors_)
    shared_->tasks.push(std::move(successor));
  successors_.clear();
}

bool executor::sleep_until(task_clock::duration duration,
                           std::uint64_t seen_epoch) {
  std::unique_lock<std::mutex> lock(shared_->mutex);
  if (shared_->done)
    return false;

  // A submission landed after the schedule was inspected; its deadline may
  // be earlier than the one this sleep was computed from.
  if (shared_->next_id != seen_epoch)
    return true;

  if (shared_->changed.wait_until(
          lock, deadline_after(task_clock::now(), duration)) ==
      std::cv_status::no_timeout)
    SYNCTIMER_LOG_DEBUG("timer executor woken by a schedule change");
  return true;
}

void executor::discard_pending() {
  // Callbacks are destroyed outside the lock
  task_heap pending;
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    std::swap(pending, shared_->tasks);
  }
  const std::size_t discarded = pending.size();
  if (discarded > 0)
    SYNCTIMER_LOG_DEBUG("timer executor exiting; discarded {} pending tasks",
                        discarded);
}

} // namespace synctimer
