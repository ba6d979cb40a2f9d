// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "entropy.h"

#include <kj/test.h>

namespace lazyfs {
namespace {

KJ_TEST("getEntropy() fills requests larger than its buffer") {
  kj::byte buffer[1000] = {};
  getEntropy(buffer);

  // 1000 zero bytes from a working RNG is not going to happen.
  bool allZero = true;
  for (auto b: buffer) {
    if (b != 0) allZero = false;
  }
  KJ_EXPECT(!allZero);
}

KJ_TEST("randomBelow() stays in range") {
  for (int i = 0; i < 1000; i++) {
    KJ_EXPECT(randomBelow(7) < 7);
  }
  KJ_EXPECT(randomBelow(1) == 0);
}

KJ_TEST("randomBelow() rejects a zero bound") {
  KJ_EXPECT_THROW_MESSAGE("non-zero bound", randomBelow(0));
}

}  // namespace
}  // namespace lazyfs
