// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/array.h>

namespace lazyfs {

// Fills `output` with cryptographically-random bytes.
void getEntropy(kj::ArrayPtr<kj::byte> output);

// Returns a uniformly distributed integer in [0, bound). `bound` must be non-zero.
uint64_t randomBelow(uint64_t bound);

}  // namespace lazyfs
