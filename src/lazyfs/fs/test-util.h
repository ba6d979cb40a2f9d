// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once
// Helpers for tests that drive nodes and the retry policy without real time passing.

#include <lazyfs/fs/retry.h>
#include <lazyfs/util/test.h>

#include <kj/async.h>
#include <kj/timer.h>
#include <kj/vector.h>

namespace lazyfs {

// Records the pauses the blocking retry loop asks for instead of sleeping.
class RecordingDelay final: public BlockingDelay {
 public:
  void sleep(kj::Duration duration) override {
    pauses.add(duration);
  }

  kj::Vector<kj::Duration> pauses;
};

// Waits for `promise`, jumping `timer` forward to each pending timer event as the loop runs dry.
template <typename T>
T waitAdvancing(kj::Promise<T> promise, kj::TimerImpl& timer, kj::WaitScope& waitScope) {
  while (!promise.poll(waitScope)) {
    KJ_IF_SOME(next, timer.nextEvent()) {
      timer.advanceTo(next);
    } else {
      break;
    }
  }
  return promise.wait(waitScope);
}

}  // namespace lazyfs
