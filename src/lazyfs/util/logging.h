// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once
// Rate-limited variants of KJ_LOG. Output goes to kj's log sink like any other KJ_LOG.

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/time.h>

namespace lazyfs {

// Logs at most once per `interval` from a given call site, dropping the rest.
#define LFS_LOG_RATE_LIMITED(interval, severity, ...)                                              \
  do {                                                                                             \
    static kj::TimePoint lfsLastLogged = kj::origin<kj::TimePoint>() - (interval);                 \
    auto lfsNow = kj::systemCoarseMonotonicClock().now();                                          \
    if (KJ_UNLIKELY(lfsNow - lfsLastLogged >= (interval))) {                                       \
      lfsLastLogged = lfsNow;                                                                      \
      KJ_LOG(severity, __VA_ARGS__);                                                               \
    }                                                                                              \
  } while (false)

#define LOG_PERIODICALLY(severity, ...) LFS_LOG_RATE_LIMITED(1 * kj::MINUTES, severity, __VA_ARGS__)
#define LOG_WARNING_PERIODICALLY(...) LOG_PERIODICALLY(WARNING, __VA_ARGS__)

}  // namespace lazyfs
