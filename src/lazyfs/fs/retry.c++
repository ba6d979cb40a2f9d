// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "retry.h"

#include <lazyfs/util/entropy.h>

#include <errno.h>
#include <time.h>

namespace lazyfs {

kj::Duration randomBackoff() {
  int64_t jitterUs = static_cast<int64_t>(randomBelow(BACKOFF_JITTER / kj::MICROSECONDS));
  return MIN_BACKOFF + jitterUs * kj::MICROSECONDS;
}

namespace {

class SystemBlockingDelay final: public BlockingDelay {
 public:
  void sleep(kj::Duration duration) override {
    auto ns = duration / kj::NANOSECONDS;
    if (ns <= 0) return;

    struct timespec remaining = {
      .tv_sec = static_cast<time_t>(ns / 1'000'000'000),
      .tv_nsec = static_cast<long>(ns % 1'000'000'000),
    };
    while (nanosleep(&remaining, &remaining) < 0) {
      int error = errno;
      // Only a signal can interrupt us, in which case `remaining` holds what's left.
      KJ_REQUIRE(error == EINTR, "nanosleep() failed", error);
    }
  }
};

}  // namespace

BlockingDelay& systemBlockingDelay() {
  static SystemBlockingDelay delay;
  return delay;
}

}  // namespace lazyfs
