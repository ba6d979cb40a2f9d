// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <lazyfs/config.capnp.h>

#include <kj/string.h>
#include <kj/time.h>

namespace lazyfs {

// Error-handling mode. See config.capnp for what each one does.
enum class Mode {
  STRICT,
  NORMAL,
  FORGIVING,
};

kj::StringPtr KJ_STRINGIFY(Mode mode);

// Accepts "strict", "normal" and "forgiving", ignoring case.
kj::Maybe<Mode> parseMode(kj::StringPtr name);

// Settings shared by a resolver, its node cache and every node in it. Passed by value at
// construction; there is no process-wide mode.
struct Config {
  Mode mode = Mode::NORMAL;

  kj::Duration statMaxAge = 100 * kj::MILLISECONDS;
  kj::Duration childrenMaxAge = 100 * kj::MILLISECONDS;
  kj::Duration dataMaxAge = 100 * kj::MILLISECONDS;

  bool isStrict() const {
    return mode == Mode::STRICT;
  }
  bool isForgiving() const {
    return mode == Mode::FORGIVING;
  }

  static Config fromReader(config::Config::Reader reader);

  // Parses Cap'n Proto text format, e.g. "(mode = strict, dataMaxAgeMs = 0)". Throws on
  // syntax errors and unknown fields.
  static Config parse(kj::StringPtr text);
};

}  // namespace lazyfs
