// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "ttl-cache.h"

#include <lazyfs/util/test.h>

#include <kj/debug.h>
#include <kj/test.h>

namespace lazyfs {
namespace {

constexpr kj::Duration MAX_AGE = 100 * kj::MILLISECONDS;

KJ_TEST("ttlGet() serves a fresh value without regenerating") {
  ManualClock clock;
  kj::Maybe<CacheEntry<int>> slot;
  uint calls = 0;
  auto generate = [&]() { return static_cast<int>(++calls); };

  KJ_EXPECT(KJ_ASSERT_NONNULL(ttlGet(slot, generate, MAX_AGE, clock).tryGetValue()) == 1);
  clock.advance(99 * kj::MILLISECONDS);
  KJ_EXPECT(KJ_ASSERT_NONNULL(ttlGet(slot, generate, MAX_AGE, clock).tryGetValue()) == 1);
  KJ_EXPECT(calls == 1);
}

KJ_TEST("ttlGet() regenerates once the entry is maxAge old") {
  ManualClock clock;
  kj::Maybe<CacheEntry<int>> slot;
  uint calls = 0;
  auto generate = [&]() { return static_cast<int>(++calls); };

  ttlGet(slot, generate, MAX_AGE, clock);
  clock.advance(MAX_AGE);
  auto& entry = ttlGet(slot, generate, MAX_AGE, clock);
  KJ_EXPECT(calls == 2);
  KJ_EXPECT(KJ_ASSERT_NONNULL(entry.tryGetValue()) == 2);
  KJ_EXPECT(entry.timestamp == clock.now());
}

KJ_TEST("ttlGet() records a thrown exception and retries it on the next access") {
  ManualClock clock;
  kj::Maybe<CacheEntry<kj::String>> slot;
  bool fail = true;
  auto generate = [&]() -> kj::String {
    if (fail) {
      KJ_FAIL_REQUIRE("generator failed");
    }
    return kj::str("ok");
  };

  auto& failed = ttlGet(slot, generate, MAX_AGE, clock);
  KJ_EXPECT(failed.isError());
  KJ_EXPECT(KJ_ASSERT_NONNULL(failed.tryGetError()).getDescription().contains("generator failed"));

  // Still inside the window, but errors are never served.
  fail = false;
  auto& recovered = ttlGet(slot, generate, MAX_AGE, clock);
  KJ_EXPECT(!recovered.isError());
  KJ_EXPECT(KJ_ASSERT_NONNULL(recovered.tryGetValue()) == "ok");
}

KJ_TEST("a zero maxAge regenerates on every access") {
  ManualClock clock;
  kj::Maybe<CacheEntry<int>> slot;
  uint calls = 0;
  auto generate = [&]() { return static_cast<int>(++calls); };

  ttlGet(slot, generate, 0 * kj::SECONDS, clock);
  ttlGet(slot, generate, 0 * kj::SECONDS, clock);
  KJ_EXPECT(calls == 2);
}

KJ_TEST("tryGetFresh() ignores stale entries and errors") {
  ManualClock clock;
  kj::Maybe<CacheEntry<int>> slot;
  KJ_EXPECT(tryGetFresh(slot, clock.now(), MAX_AGE) == kj::none);

  slot.emplace(CacheEntry<int>{7, clock.now()});
  KJ_EXPECT(KJ_ASSERT_NONNULL(tryGetFresh(slot, clock.now(), MAX_AGE)) == 7);
  KJ_EXPECT(tryGetFresh(slot, clock.now() + MAX_AGE, MAX_AGE) == kj::none);

  slot.emplace(CacheEntry<int>{KJ_EXCEPTION(FAILED, "nope"), clock.now()});
  KJ_EXPECT(tryGetFresh(slot, clock.now(), MAX_AGE) == kj::none);
}

}  // namespace
}  // namespace lazyfs
