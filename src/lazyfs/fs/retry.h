// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <lazyfs/fs/fs-error.h>

#include <kj/async.h>
#include <kj/debug.h>
#include <kj/one-of.h>
#include <kj/time.h>
#include <kj/timer.h>

namespace lazyfs {

// Outcome of a retried filesystem action. `data` holds the action's result on success and the
// caller-supplied fallback otherwise; `error` is set iff every attempt failed.
template <typename T>
struct Attempt {
  T data;
  kj::Maybe<FsFailure> error;

  bool ok() const {
    return error == kj::none;
  }
};

// Fixed retry policy: at most two attempts, with a jittered pause in between when the first
// failure is transient (see isTransient()).
constexpr uint MAX_ATTEMPTS = 2;
constexpr kj::Duration MIN_BACKOFF = 100 * kj::MILLISECONDS;
constexpr kj::Duration BACKOFF_JITTER = 100 * kj::MILLISECONDS;

// Uniformly distributed in [MIN_BACKOFF, MIN_BACKOFF + BACKOFF_JITTER).
kj::Duration randomBackoff();

// Blocks the calling thread. The blocking variant of the retry loop sleeps through this so
// tests can record pauses instead of taking them.
class BlockingDelay {
 public:
  virtual ~BlockingDelay() noexcept(false) = default;
  virtual void sleep(kj::Duration duration) = 0;
};

// Sleeps with nanosleep(), resuming after signal interruptions.
BlockingDelay& systemBlockingDelay();

// Runs `action(params...)`, which returns kj::OneOf<FsFailure, T>, up to MAX_ATTEMPTS times.
// Only transient failures are retried, after sleeping for randomBackoff(). An action that throws
// is recorded as an FsError::FAILED failure and not retried. Never throws.
template <typename T, typename Func, typename... Params>
Attempt<T> attempt(BlockingDelay& delay, T fallback, Func&& action, Params&&... params) {
  for (uint i = 0;; i++) {
    kj::Maybe<kj::OneOf<FsFailure, T>> outcome;
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { outcome = action(params...); })) {
      return {kj::mv(fallback), FsFailure::fromException(exception)};
    }

    auto& result = KJ_ASSERT_NONNULL(outcome);
    KJ_SWITCH_ONEOF(result) {
      KJ_CASE_ONEOF(value, T) {
        return {kj::mv(value), kj::none};
      }
      KJ_CASE_ONEOF(failure, FsFailure) {
        if (!isTransient(failure.code) || i + 1 >= MAX_ATTEMPTS) {
          return {kj::mv(fallback), kj::mv(failure)};
        }
        KJ_LOG(INFO, "retrying after transient filesystem failure", failure);
        delay.sleep(randomBackoff());
      }
    }
  }
}

// Suspending counterpart of attempt(). `action(params...)` returns
// kj::Promise<kj::OneOf<FsFailure, T>>; the backoff pause waits on `timer` so other tasks on the
// event loop keep running. The returned promise never rejects.
template <typename T, typename Func, typename... Params>
kj::Promise<Attempt<T>> attemptAsync(kj::Timer& timer, T fallback, Func action, Params... params) {
  for (uint i = 0;; i++) {
    auto outcome = co_await kj::evalNow([&]() { return action(params...); })
                       .then([](kj::OneOf<FsFailure, T>&& result) { return kj::mv(result); },
                           [](kj::Exception&& exception) -> kj::OneOf<FsFailure, T> {
      return FsFailure::fromException(exception);
    });

    KJ_IF_SOME(value, outcome.template tryGet<T>()) {
      co_return Attempt<T>{kj::mv(value), kj::none};
    }
    auto& failure = outcome.template get<FsFailure>();
    if (!isTransient(failure.code) || i + 1 >= MAX_ATTEMPTS) {
      co_return Attempt<T>{kj::mv(fallback), kj::mv(failure)};
    }
    KJ_LOG(INFO, "retrying after transient filesystem failure", failure);
    co_await timer.afterDelay(randomBackoff());
  }
}

}  // namespace lazyfs
