#ifndef SYNCTIMER_TASK_HEAP_HPP
#define SYNCTIMER_TASK_HEAP_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory_resource>
#include <utility>
#include <vector>

#include "allocator.hpp"
#include "task.hpp"

namespace synctimer {

// Binary min-heap of task records ordered by (next_execution, id).
// Not thread-safe; timer_shared guards it with its mutex.
class task_heap {
public:
  explicit task_heap(std::pmr::memory_resource *resource = mi_resource())
      : records_(resource) {}

  void reserve(std::size_t capacity) { records_.reserve(capacity); }

  bool empty() const noexcept { return records_.empty(); }
  std::size_t size() const noexcept { return records_.size(); }

  // Earliest record. Undefined if empty.
  const task_record &top() const { return records_.front(); }

  void push(task_record record) {
    records_.push_back(std::move(record));
    std::push_heap(records_.begin(), records_.end(), std::greater<>{});
  }

  task_record pop() {
    std::pop_heap(records_.begin(), records_.end(), std::greater<>{});
    task_record record = std::move(records_.back());
    records_.pop_back();
    return record;
  }

  void clear() noexcept { records_.clear(); }

private:
  std::pmr::vector<task_record> records_;
};

} // namespace synctimer

#endif // SYNCTIMER_TASK_HEAP_HPP
