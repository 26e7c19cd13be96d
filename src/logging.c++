//
// Copyright (c) 2020-2022, Leonid Yuriev <leo@yuriev.ru>.
// SPDX-License-Identifier: Apache-2.0
//
// Leveled logging of mapkv, also fed by the libmdbx debug callback.
//

#include "internals.h++"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace mapkv {
namespace logging {

namespace {

std::atomic<int> threshold{warning};
std::atomic<logger> sink{nullptr};

void stderr_logger(level priority, const char *function, int line,
                   const char *message) noexcept {
  const time_t now = time(nullptr);
  struct tm tm;
  if (localtime_r(&now, &tm) == nullptr)
    std::memset(&tm, 0, sizeof(tm));
  fprintf(stderr, "[ %02d%02d%02d-%02d:%02d:%02d %-7s ] %s:%d %s\n",
          tm.tm_year % 100, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
          tm.tm_sec, level2str(priority), function ? function : "?", line,
          message);
}

void deliver_ap(level priority, const char *function, int line,
                const char *format, va_list ap) noexcept {
  char buf[1024];
  int len = vsnprintf(buf, sizeof(buf), format, ap);
  if (len < 0)
    return;
  if (size_t(len) >= sizeof(buf))
    len = int(sizeof(buf) - 1);
  while (len > 0 && (buf[len - 1] == '\n' || buf[len - 1] == '\r'))
    buf[--len] = '\0';

  const logger output = sink.load(std::memory_order_acquire);
  (output ? output : stderr_logger)(priority, function, line, buf);
}

void mdbx_logger(MDBX_log_level_t priority, const char *function, int line,
                 const char *fmt, va_list args) noexcept {
  if (!enabled(level(priority)))
    return;
  if (priority == MDBX_LOG_FATAL)
    output(fatal, function, line, "mdbx: fatal failure");
  deliver_ap(level(priority), function, line, fmt, args);
}

} // namespace

void setup(level priority, logger output, bool engine_too) {
  threshold.store(priority, std::memory_order_relaxed);
  sink.store(output, std::memory_order_release);
  const int rc =
      mdbx_setup_debug(engine_too ? MDBX_log_level_t(priority)
                                  : MDBX_LOG_DONTCHANGE,
                       MDBX_DBG_DONTCHANGE,
                       engine_too ? static_cast<MDBX_debug_func *>(mdbx_logger)
                                  : MDBX_LOGGER_DONTCHANGE);
  if (rc < 0)
    ::mapkv::error::from_native(rc).throw_exception();
  TRACE("logging threshold %s, engine %s", level2str(priority),
        engine_too ? "routed" : "untouched");
}

level get_level() noexcept {
  return level(threshold.load(std::memory_order_relaxed));
}

bool enabled(level priority) noexcept {
  return priority <= threshold.load(std::memory_order_relaxed);
}

const char *level2str(level priority) noexcept {
  switch (priority) {
  default:
    return "invalid/unknown";
  case extra:
    return "extra";
  case trace:
    return "trace";
  case debug:
    return "debug";
  case verbose:
    return "verbose";
  case notice:
    return "notice";
  case warning:
    return "warning";
  case error:
    return "error";
  case fatal:
    return "fatal";
  }
}

void output(level priority, const char *function, int line, const char *format,
            ...) noexcept {
  va_list ap;
  va_start(ap, format);
  deliver_ap(priority, function, line, format, ap);
  va_end(ap);
}

} // namespace logging
} // namespace mapkv
