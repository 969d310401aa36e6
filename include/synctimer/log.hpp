#ifndef SYNCTIMER_LOG_HPP
#define SYNCTIMER_LOG_HPP

#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/core/LogLevel.h>

namespace synctimer::log {

// Process-wide logger. The first call starts the Quill backend thread and
// creates the console sink; the initial level is read from the
// SYNCTIMER_LOG_LEVEL environment variable (default: info).
quill::Logger *get_logger();

void set_level(quill::LogLevel level);

} // namespace synctimer::log

#define SYNCTIMER_LOG_DEBUG(...)                                             \
  LOG_DEBUG(::synctimer::log::get_logger(), __VA_ARGS__)
#define SYNCTIMER_LOG_INFO(...)                                             \
  LOG_INFO(::synctimer::log::get_logger(), __VA_ARGS__)
#define SYNCTIMER_LOG_WARN(...)                                             \
  LOG_WARNING(::synctimer::log::get_logger(), __VA_ARGS__)
#define SYNCTIMER_LOG_ERROR(...)                                             \
  LOG_ERROR(::synctimer::log::get_logger(), __VA_ARGS__)

#endif // SYNCTIMER_LOG_HPP
