#ifndef SYNCTIMER_TIMER_SHARED_HPP
#define SYNCTIMER_TIMER_SHARED_HPP

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "task_heap.hpp"

namespace synctimer {

// State shared between a timer and its executor thread. Every field except
// the synchronization members is protected by mutex.
struct timer_shared {
  explicit timer_shared(std::size_t capacity = 0) {
    if (capacity > 0)
      tasks.reserve(capacity);
  }

  timer_shared(const timer_shared &) = delete;
  timer_shared &operator=(const timer_shared &) = delete;

  task_heap tasks;
  // Next id to hand out. Also serves as the epoch the executor compares
  // before sleeping, since it changes on every submission.
  std::uint64_t next_id = 1;
  bool done = false;
  bool executor_failed = false;

  std::mutex mutex;
  std::condition_variable changed;
};

} // namespace synctimer

#endif // SYNCTIMER_TIMER_SHARED_HPP
