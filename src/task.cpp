#include "synctimer/task.hpp"
#include "synctimer/log.hpp"

#include <utility>

namespace synctimer {

task_record::task_record(std::uint64_t id,
                         task_clock::time_point next_execution,
                         task_callable callable)
    : task_record(id, next_execution, task_state{}, std::move(callable)) {}

task_record::task_record(std::uint64_t id,
                         task_clock::time_point next_execution,
                         task_state state, task_callable callable)
    : id_(id), next_execution_(next_execution), state_(std::move(state)),
      callable_(std::move(callable)) {}

std::optional<task_record> task_record::run() && {
  if (state_.running->exchange(true, std::memory_order_acquire)) {
    SYNCTIMER_LOG_ERROR(
        "task {} is still marked running after a failed run; not running "
        "again",
        id_);
    return std::nullopt;
  }

  if (auto *once = std::get_if<once_callable>(&callable_)) {
    once->fn();
    state_.running->store(false, std::memory_order_release);
    return std::nullopt;
  }

  auto &repeating = std::get<repeating_callable>(callable_);
  repeating.fn();
  // Drift model: the next run is one interval after this one finished
  auto next = deadline_after(task_clock::now(), repeating.interval);
  state_.running->store(false, std::memory_order_release);
  return task_record(id_, next, std::move(state_), std::move(callable_));
}

ready_status task_record::ready(task_clock::time_point now) const noexcept {
  if (now >= next_execution_)
    return {true, task_clock::duration::zero()};
  return {false, next_execution_ - now};
}

task_guard task_record::guard() const {
  return task_guard(id_, state_.cancelled);
}

// --- task_guard ---

task_guard::task_guard(std::uint64_t task_id,
                       std::shared_ptr<std::atomic<bool>> cancelled) noexcept
    : task_id_(task_id), cancelled_(std::move(cancelled)) {}

task_guard::~task_guard() { cancel(); }

task_guard::task_guard(task_guard &&other) noexcept
    : task_id_(other.task_id_), cancelled_(std::move(other.cancelled_)) {}

task_guard &task_guard::operator=(task_guard &&other) noexcept {
  if (this != &other) {
    cancel();
    task_id_ = other.task_id_;
    cancelled_ = std::move(other.cancelled_);
  }
  return *this;
}

void task_guard::detach() noexcept { cancelled_.reset(); }

void task_guard::cancel() noexcept {
  if (cancelled_) {
    cancelled_->store(true, std::memory_order_release);
    cancelled_.reset();
  }
}

} // namespace synctimer
