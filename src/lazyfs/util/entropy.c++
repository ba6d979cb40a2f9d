// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "entropy.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <kj/debug.h>

#include <stdint.h>
#include <string.h>

namespace lazyfs {
namespace {

// Random bytes drawn from RAND_bytes() a block at a time and handed out in order.
class EntropyPool {
 public:
  void take(kj::ArrayPtr<kj::byte> output) {
    while (output.size() > 0) {
      if (next == block.size()) refill();
      size_t n = kj::min(block.size() - next, output.size());
      memcpy(output.begin(), block.begin() + next, n);
      next += n;
      output = output.slice(n);
    }
  }

 private:
  kj::FixedArray<kj::byte, 256> block;
  size_t next = block.size();

  void refill() {
    if (RAND_bytes(block.begin(), block.size()) != 1) {
      auto code = ERR_get_error();
      ERR_clear_error();
      KJ_FAIL_REQUIRE("RAND_bytes() failed", code);
    }
    next = 0;
  }
};

}  // namespace

void getEntropy(kj::ArrayPtr<kj::byte> output) {
  thread_local EntropyPool pool;
  pool.take(output);
}

uint64_t randomBelow(uint64_t bound) {
  KJ_REQUIRE(bound > 0, "randomBelow() requires a non-zero bound");

  // Rejection sampling keeps the distribution uniform when `bound` does not divide 2^64.
  const uint64_t limit = UINT64_MAX - (UINT64_MAX % bound);
  for (;;) {
    uint64_t value;
    getEntropy(kj::arrayPtr(reinterpret_cast<kj::byte*>(&value), sizeof(value)));
    if (value < limit) {
      return value % bound;
    }
  }
}

}  // namespace lazyfs
