#ifndef SYNCTIMER_CONFIG_HPP
#define SYNCTIMER_CONFIG_HPP

#include <chrono>
#include <cstddef>

// Build-time tuning. Override through the CMake cache variables of the same
// name (or -D on the compiler command line).
#ifndef SYNCTIMER_MAX_BATCH_SIZE
#define SYNCTIMER_MAX_BATCH_SIZE 8
#endif

#ifndef SYNCTIMER_DEFAULT_LOOP_TIME_MS
#define SYNCTIMER_DEFAULT_LOOP_TIME_MS 500
#endif

namespace synctimer::config {

// Upper bound on ready tasks popped per executor iteration
inline constexpr std::size_t max_batch_size = SYNCTIMER_MAX_BATCH_SIZE;

// How long the executor sleeps when the schedule is empty
inline constexpr std::chrono::milliseconds default_loop_time{
    SYNCTIMER_DEFAULT_LOOP_TIME_MS};

static_assert(max_batch_size > 0, "SYNCTIMER_MAX_BATCH_SIZE must be positive");
static_assert(default_loop_time.count() > 0,
              "SYNCTIMER_DEFAULT_LOOP_TIME_MS must be positive");

} // namespace synctimer::config

#endif // SYNCTIMER_CONFIG_HPP
