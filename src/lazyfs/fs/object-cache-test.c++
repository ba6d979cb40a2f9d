// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "object-cache.h"

#include <kj/test.h>

namespace lazyfs {
namespace {

struct Thing: public kj::Refcounted {
  explicit Thing(kj::StringPtr name): name(kj::str(name)) {}
  kj::String name;
};

KJ_TEST("ObjectCache returns the same object per key") {
  ObjectCache<Thing> cache;
  uint created = 0;
  auto make = [&](kj::StringPtr key) {
    return cache.getOrCreate(key, [&]() {
      ++created;
      return kj::rc<Thing>(key);
    });
  };

  auto a1 = make("./a");
  auto a2 = make("./a");
  auto b = make("./b");
  KJ_EXPECT(a1.get() == a2.get());
  KJ_EXPECT(a1.get() != b.get());
  KJ_EXPECT(a1->name == "./a");
  KJ_EXPECT(created == 2);
  KJ_EXPECT(cache.size() == 2);

  KJ_EXPECT(KJ_ASSERT_NONNULL(cache.find("./b")).get() == b.get());
  KJ_EXPECT(cache.find("./c") == kj::none);
}

KJ_TEST("ObjectCache::clear starts over without invalidating held objects") {
  ObjectCache<Thing> cache;
  auto old = cache.getOrCreate("./a", []() { return kj::rc<Thing>("./a"); });
  cache.clear();
  KJ_EXPECT(cache.size() == 0);
  KJ_EXPECT(cache.find("./a") == kj::none);

  auto fresh = cache.getOrCreate("./a", []() { return kj::rc<Thing>("./a"); });
  KJ_EXPECT(fresh.get() != old.get());
  KJ_EXPECT(old->name == "./a");
}

}  // namespace
}  // namespace lazyfs
