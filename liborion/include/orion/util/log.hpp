// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef ORION_UTIL_LOG_HPP
#define ORION_UTIL_LOG_HPP

#include <array>
#include <format>
#include <iostream>
#include <string>
#include <string_view>

#define ORION_LOG_LEVEL_OFF   0
#define ORION_LOG_LEVEL_FATAL 1
#define ORION_LOG_LEVEL_ERROR 2
#define ORION_LOG_LEVEL_WARN  3
#define ORION_LOG_LEVEL_INFO  4
#define ORION_LOG_LEVEL_DEBUG 5
#define ORION_LOG_LEVEL_TRACE 6

// Upper bound compiled into the binaries. Messages above the runtime level
// (see set_log_level) are formatted lazily and dropped.
#ifndef ORION_LOG_LEVEL
#define ORION_LOG_LEVEL ORION_LOG_LEVEL_INFO
#endif

namespace orion {
namespace util {

inline int log_level = ORION_LOG_LEVEL_ERROR;

inline constexpr std::array<std::string_view, 7> log_level_names = {
  "off", "fatal", "error", "warn", "info", "debug", "trace"
};

inline bool set_log_level(std::string_view name) {
  for (size_t i = 0; i < log_level_names.size(); ++i) {
    if (log_level_names[i] == name) {
      log_level = static_cast<int>(i);
      return true;
    }
  }
  return false;
}

template<typename... Args>
void log(int level, std::string_view fmt, Args&&... args) {
  if (level > log_level) {
    return;
  }
  std::string message;
  if constexpr (sizeof...(Args) == 0) {
    message = std::string(fmt);
  } else {
    message = std::vformat(fmt, std::make_format_args(args...));
  }
  std::clog << message << std::endl;
}

}  // namespace util
}  // namespace orion

#if ORION_LOG_LEVEL >= ORION_LOG_LEVEL_FATAL
#define ORION_LOG_FATAL(FMT, ...) ::orion::util::log(ORION_LOG_LEVEL_FATAL, "\033[95m[F]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define ORION_LOG_FATAL(FMT, ...) do { } while (false)
#endif

#if ORION_LOG_LEVEL >= ORION_LOG_LEVEL_ERROR
#define ORION_LOG_ERROR(FMT, ...) ::orion::util::log(ORION_LOG_LEVEL_ERROR, "\033[91m[E]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define ORION_LOG_ERROR(FMT, ...) do { } while (false)
#endif

#if ORION_LOG_LEVEL >= ORION_LOG_LEVEL_WARN
#define ORION_LOG_WARN(FMT, ...) ::orion::util::log(ORION_LOG_LEVEL_WARN, "\033[93m[W]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define ORION_LOG_WARN(FMT, ...) do { } while (false)
#endif

#if ORION_LOG_LEVEL >= ORION_LOG_LEVEL_INFO
#define ORION_LOG_INFO(FMT, ...) ::orion::util::log(ORION_LOG_LEVEL_INFO, "\033[92m[I]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define ORION_LOG_INFO(FMT, ...) do { } while (false)
#endif

#if ORION_LOG_LEVEL >= ORION_LOG_LEVEL_DEBUG
#define ORION_LOG_DEBUG(FMT, ...) ::orion::util::log(ORION_LOG_LEVEL_DEBUG, "\033[94m[D]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define ORION_LOG_DEBUG(FMT, ...) do { } while (false)
#endif

#if ORION_LOG_LEVEL >= ORION_LOG_LEVEL_TRACE
#define ORION_LOG_TRACE(FMT, ...) ::orion::util::log(ORION_LOG_LEVEL_TRACE, "\033[96m[T]\033[0m " FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define ORION_LOG_TRACE(FMT, ...) do { } while (false)
#endif

#endif  // ORION_UTIL_LOG_HPP
