// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once
#include <kj/test.h>
#include <kj/time.h>

namespace lazyfs {

// Checks that `code` throws a kj::Exception whose type is `expType` and whose description
// contains `expSubstring`.
#define LFS_EXPECT_THROW(expType, expSubstring, code, ...)                                         \
  do {                                                                                             \
    KJ_IF_SOME(e, ::kj::runCatchingExceptions([&]() { (void)({ code; }); })) {                     \
      KJ_EXPECT(e.getType() == ::kj::Exception::Type::expType,                                     \
          "code threw wrong exception type: " #code, e, ##__VA_ARGS__);                            \
      KJ_EXPECT(e.getDescription().contains(expSubstring),                                         \
          "exception description didn't match", e, ##__VA_ARGS__);                                 \
    } else {                                                                                       \
      KJ_FAIL_EXPECT("code did not throw: " #code, ##__VA_ARGS__);                                 \
    }                                                                                              \
  } while (false)

// A kj::MonotonicClock that only moves when told to.
class ManualClock final: public kj::MonotonicClock {
 public:
  kj::TimePoint now() const override {
    return time;
  }
  void advance(kj::Duration duration) {
    time = time + duration;
  }

 private:
  kj::TimePoint time = kj::origin<kj::TimePoint>();
};

}  // namespace lazyfs
