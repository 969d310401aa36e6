#ifndef SYNCTIMER_ALLOCATOR_HPP
#define SYNCTIMER_ALLOCATOR_HPP

#include <cstddef>
#include <memory_resource>

namespace synctimer {

// PMR memory_resource backed by mimalloc (mi_malloc_aligned / mi_free_aligned)
class mi_memory_resource : public std::pmr::memory_resource {
  void *do_allocate(std::size_t bytes, std::size_t alignment) override;
  void do_deallocate(void *p, std::size_t bytes,
                     std::size_t alignment) override;
  bool do_is_equal(const memory_resource &other) const noexcept override;
};

// Process-wide mimalloc resource used for task storage and executor buffers.
// Never destroyed: a timer with static storage duration may still release
// task storage through it during static teardown.
std::pmr::memory_resource *mi_resource() noexcept;

} // namespace synctimer

#endif // SYNCTIMER_ALLOCATOR_HPP
