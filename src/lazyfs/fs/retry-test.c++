// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "retry.h"

#include <lazyfs/fs/test-util.h>

#include <errno.h>

namespace lazyfs {
namespace {

using Result = kj::OneOf<FsFailure, int>;

bool isBackoff(kj::Duration pause) {
  return pause >= MIN_BACKOFF && pause < MIN_BACKOFF + BACKOFF_JITTER;
}

KJ_TEST("randomBackoff stays within the jitter window") {
  for (int i = 0; i < 200; i++) {
    KJ_EXPECT(isBackoff(randomBackoff()));
  }
}

KJ_TEST("attempt returns the first success without pausing") {
  RecordingDelay delay;
  uint calls = 0;
  auto result = attempt(delay, -1, [&]() -> Result {
    ++calls;
    return 42;
  });
  KJ_EXPECT(result.ok());
  KJ_EXPECT(result.data == 42);
  KJ_EXPECT(calls == 1);
  KJ_EXPECT(delay.pauses.size() == 0);
}

KJ_TEST("attempt retries a transient failure once") {
  RecordingDelay delay;
  uint calls = 0;
  auto result = attempt(delay, -1, [&]() -> Result {
    if (calls++ == 0) return FsFailure::fromErrno(EBUSY, "open", "./a");
    return 7;
  });
  KJ_EXPECT(result.ok());
  KJ_EXPECT(result.data == 7);
  KJ_EXPECT(calls == 2);
  KJ_ASSERT(delay.pauses.size() == 1);
  KJ_EXPECT(isBackoff(delay.pauses[0]), delay.pauses[0]);
}

KJ_TEST("attempt gives up after the second transient failure") {
  RecordingDelay delay;
  uint calls = 0;
  auto result = attempt(delay, -1, [&]() -> Result {
    ++calls;
    return FsFailure::fromErrno(ENOENT, "stat", "./a");
  });
  KJ_EXPECT(!result.ok());
  KJ_EXPECT(result.data == -1);
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.error).code == FsError::NOT_FOUND);
  KJ_EXPECT(calls == MAX_ATTEMPTS);
  KJ_EXPECT(delay.pauses.size() == 1);
}

KJ_TEST("attempt does not retry other failures") {
  RecordingDelay delay;
  uint calls = 0;
  auto result = attempt(delay, -1, [&]() -> Result {
    ++calls;
    return FsFailure::fromErrno(EACCES, "open", "./a");
  });
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.error).code == FsError::PERMISSION_DENIED);
  KJ_EXPECT(calls == 1);
  KJ_EXPECT(delay.pauses.size() == 0);
}

KJ_TEST("attempt records a throwing action as a failure") {
  RecordingDelay delay;
  uint calls = 0;
  auto result = attempt(delay, -1, [&]() -> Result {
    ++calls;
    KJ_FAIL_REQUIRE("primitive blew up");
  });
  auto& failure = KJ_ASSERT_NONNULL(result.error);
  KJ_EXPECT(failure.code == FsError::FAILED);
  KJ_EXPECT(failure.description.contains("primitive blew up"), failure.description);
  KJ_EXPECT(calls == 1);
  KJ_EXPECT(delay.pauses.size() == 0);
}

KJ_TEST("attempt forwards parameters to the action") {
  RecordingDelay delay;
  auto result = attempt(delay, kj::String(),
      [](kj::StringPtr a, int b) -> kj::OneOf<FsFailure, kj::String> { return kj::str(a, b); },
      "x"_kj, 3);
  KJ_EXPECT(result.data == "x3");
}

struct AsyncFixture {
  kj::EventLoop loop;
  kj::WaitScope waitScope{loop};
  kj::TimerImpl timer{kj::origin<kj::TimePoint>()};
};

KJ_TEST("attemptAsync waits on the timer between attempts") {
  AsyncFixture f;
  uint calls = 0;
  auto start = f.timer.now();
  auto promise = attemptAsync(f.timer, -1, [&]() -> kj::Promise<Result> {
    if (calls++ == 0) return Result(FsFailure::fromErrno(ENOENT, "stat", "./a"));
    return Result(5);
  });

  KJ_EXPECT(!promise.poll(f.waitScope));
  KJ_EXPECT(calls == 1);

  auto result = waitAdvancing(kj::mv(promise), f.timer, f.waitScope);
  KJ_EXPECT(result.ok());
  KJ_EXPECT(result.data == 5);
  KJ_EXPECT(calls == 2);
  KJ_EXPECT(isBackoff(f.timer.now() - start), f.timer.now() - start);
}

KJ_TEST("attemptAsync does not pause for permanent failures") {
  AsyncFixture f;
  uint calls = 0;
  auto promise = attemptAsync(f.timer, -1, [&]() -> kj::Promise<Result> {
    ++calls;
    return Result(FsFailure::fromErrno(EEXIST, "mkdir", "./a"));
  });
  auto result = promise.wait(f.waitScope);
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.error).code == FsError::ALREADY_EXISTS);
  KJ_EXPECT(calls == 1);
  KJ_EXPECT(f.timer.now() == kj::origin<kj::TimePoint>());
}

KJ_TEST("attemptAsync turns rejections and throws into failures") {
  AsyncFixture f;

  auto rejected = attemptAsync(f.timer, -1, []() -> kj::Promise<Result> {
    return KJ_EXCEPTION(FAILED, "rejected");
  }).wait(f.waitScope);
  KJ_EXPECT(KJ_ASSERT_NONNULL(rejected.error).code == FsError::FAILED);

  auto thrown = attemptAsync(f.timer, -1, []() -> kj::Promise<Result> {
    KJ_FAIL_REQUIRE("thrown before returning a promise");
  }).wait(f.waitScope);
  auto& failure = KJ_ASSERT_NONNULL(thrown.error);
  KJ_EXPECT(failure.description.contains("thrown before returning"), failure.description);
  KJ_EXPECT(thrown.data == -1);
}

}  // namespace
}  // namespace lazyfs
