#include "synctimer/log.hpp"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/sinks/ConsoleSink.h>

#include <cstdlib>
#include <exception>
#include <string>
#include <utility>

namespace synctimer::log {

static constexpr const char *LOG_LEVEL_ENV = "SYNCTIMER_LOG_LEVEL";

quill::Logger *get_logger() {
  static quill::Logger *const logger = [] {
    quill::Backend::start();

    auto sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>(
        "synctimer_console");
    quill::Logger *created =
        quill::Frontend::create_or_get_logger("synctimer", std::move(sink));

    created->set_log_level(quill::LogLevel::Info);
    if (const char *env = std::getenv(LOG_LEVEL_ENV)) {
      try {
        created->set_log_level(quill::loglevel_from_string(env));
      } catch (const std::exception &e) {
        LOG_WARNING(created, "ignoring {}={}: {}", LOG_LEVEL_ENV,
                    std::string(env), e.what());
      }
    }
    return created;
  }();
  return logger;
}

void set_level(quill::LogLevel level) { get_logger()->set_log_level(level); }

} // namespace synctimer::log
