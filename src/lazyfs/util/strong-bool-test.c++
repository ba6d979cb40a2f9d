// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "strong-bool.h"

#include <kj/test.h>

#include <type_traits>

namespace lazyfs {
namespace {

LFS_STRONG_BOOL(Truncate);
LFS_STRONG_BOOL(FollowLinks);

static_assert(!std::is_default_constructible_v<Truncate>);
static_assert(!std::is_convertible_v<bool, Truncate>);
static_assert(!std::is_convertible_v<Truncate, bool>);
static_assert(!std::is_convertible_v<Truncate, FollowLinks>);

KJ_TEST("LFS_STRONG_BOOL values") {
  Truncate yes = Truncate::YES;
  Truncate no = Truncate::NO;

  KJ_EXPECT(yes);
  KJ_EXPECT(!no);
  KJ_EXPECT(yes == Truncate::YES);
  KJ_EXPECT(yes != no);
  KJ_EXPECT(kj::str(yes) == "Truncate::YES");
  KJ_EXPECT(kj::str(FollowLinks(FollowLinks::NO)) == "FollowLinks::NO");
}

}  // namespace
}  // namespace lazyfs
