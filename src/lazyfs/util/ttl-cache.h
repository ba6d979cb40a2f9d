// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/async.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/one-of.h>
#include <kj/time.h>

#include <type_traits>

namespace lazyfs {

// A read-through cache slot with a fixed freshness window.
//
// A CacheEntry records the outcome of one computation, either the value it produced or the
// exception it threw, together with the time it was computed. Errors are cached too, but
// ttlGet() never serves one: a slot holding an error is recomputed on the next access.
//
//   kj::Maybe<CacheEntry<Stat>> cachedStat;
//   auto& entry = ttlGet(cachedStat, [&]() { return readStat(); }, 100 * kj::MILLISECONDS, clock);
//   KJ_IF_SOME(stat, entry.tryGetValue()) { ... }
//
// The generator must be synchronous. The retry policy (see fs/retry.h) is meant to run inside
// the generator, so a stale window wraps the transient-fault masking rather than the reverse.
template <typename T>
struct CacheEntry {
  kj::OneOf<T, kj::Exception> result;
  kj::TimePoint timestamp;

  bool isError() const {
    return result.template is<kj::Exception>();
  }

  // A negative maxAge makes every entry stale.
  bool isFresh(kj::TimePoint now, kj::Duration maxAge) const {
    return now - timestamp < maxAge;
  }

  kj::Maybe<T&> tryGetValue() {
    return result.template tryGet<T>();
  }
  kj::Maybe<const T&> tryGetValue() const {
    return result.template tryGet<T>();
  }

  kj::Maybe<const kj::Exception&> tryGetError() const {
    return result.template tryGet<kj::Exception>();
  }
};

namespace _ {  // private

template <typename T>
constexpr bool isPromise = false;
template <typename T>
constexpr bool isPromise<kj::Promise<T>> = true;

}  // namespace _

// The value in `slot`, if it holds one computed less than `maxAge` before `now`. Callers that
// can't use ttlGet() because their computation suspends check with this first and then
// `slot.emplace()` the outcome themselves.
template <typename T>
kj::Maybe<T&> tryGetFresh(kj::Maybe<CacheEntry<T>>& slot, kj::TimePoint now, kj::Duration maxAge) {
  KJ_IF_SOME(entry, slot) {
    if (entry.isFresh(now, maxAge)) {
      return entry.tryGetValue();
    }
  }
  return kj::none;
}

// Returns the entry in `slot` if it holds a value younger than `maxAge`. Otherwise runs
// `generate()`, stores its value (or the kj::Exception it threw) in `slot` stamped with the
// current time, and returns the new entry.
template <typename T, typename Func>
CacheEntry<T>& ttlGet(kj::Maybe<CacheEntry<T>>& slot,
    Func&& generate,
    kj::Duration maxAge,
    const kj::MonotonicClock& clock) {
  using Result = std::invoke_result_t<Func&>;
  static_assert(!_::isPromise<std::remove_cvref_t<Result>>,
      "ttlGet() needs a synchronous generator; a promise cannot be cached as a final value");
  static_assert(std::is_convertible_v<Result, T>, "generator result doesn't match the slot type");

  auto now = clock.now();
  if (tryGetFresh(slot, now, maxAge) != kj::none) {
    return KJ_ASSERT_NONNULL(slot);
  }

  kj::Maybe<T> generated;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { generated = generate(); })) {
    return slot.emplace(CacheEntry<T>{kj::mv(exception), now});
  }
  return slot.emplace(CacheEntry<T>{kj::mv(KJ_ASSERT_NONNULL(generated)), now});
}

}  // namespace lazyfs
