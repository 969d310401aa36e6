#ifndef SYNCTIMER_EXECUTOR_HPP
#define SYNCTIMER_EXECUTOR_HPP

#include <cstdint>
#include <memory>
#include <memory_resource>
#include <vector>

#include "task.hpp"
#include "timer_shared.hpp"

namespace synctimer {

/*
  Body of the timer's background thread. Each iteration pulls up to
  config::max_batch_size due records under the lock, runs them with the lock
  released, then pushes any repeating successors back in one locked section.
  When nothing is due it sleeps on timer_shared::changed until the earliest
  deadline, unless a submission arrived since the schedule was inspected.
*/
class executor {
public:
  explicit executor(std::shared_ptr<timer_shared> shared);

  // Returns once timer_shared::done is observed
  void run_until_done();

private:
  enum class action_kind { execute_batch, sleep_until, exit };

  struct next_action {
    action_kind kind;
    task_clock::duration sleep_for{};
    std::uint64_t epoch = 0;
  };

  void loop();
  next_action collect_batch();
  void execute_batch();
  void reinsert_successors();
  // false once shutdown has been requested
  bool sleep_until(task_clock::duration duration, std::uint64_t seen_epoch);
  void discard_pending();

  std::shared_ptr<timer_shared> shared_;
  std::pmr::vector<task_record> batch_;
  std::pmr::vector<task_record> successors_;
};

} // namespace synctimer

#endif // SYNCTIMER_EXECUTOR_HPP
