// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "config.h"

#include <capnp/message.h>
#include <kj/test.h>

namespace lazyfs {
namespace {

KJ_TEST("default config") {
  Config config;
  KJ_EXPECT(config.mode == Mode::NORMAL);
  KJ_EXPECT(!config.isStrict());
  KJ_EXPECT(!config.isForgiving());
  KJ_EXPECT(config.statMaxAge == 100 * kj::MILLISECONDS);
  KJ_EXPECT(config.childrenMaxAge == 100 * kj::MILLISECONDS);
  KJ_EXPECT(config.dataMaxAge == 100 * kj::MILLISECONDS);

  auto parsed = Config::parse("()");
  KJ_EXPECT(parsed.mode == Mode::NORMAL);
  KJ_EXPECT(parsed.dataMaxAge == 100 * kj::MILLISECONDS);
}

KJ_TEST("config text format") {
  auto config = Config::parse("(mode = strict, statMaxAgeMs = 50, dataMaxAgeMs = 0)");
  KJ_EXPECT(config.isStrict());
  KJ_EXPECT(config.statMaxAge == 50 * kj::MILLISECONDS);
  KJ_EXPECT(config.childrenMaxAge == 100 * kj::MILLISECONDS);
  KJ_EXPECT(config.dataMaxAge == 0 * kj::MILLISECONDS);

  KJ_EXPECT(Config::parse("(mode = forgiving)").isForgiving());

  KJ_EXPECT_THROW(FAILED, Config::parse("(noSuchField = 1)"));
  KJ_EXPECT_THROW(FAILED, Config::parse("(mode = lenient)"));
}

KJ_TEST("config from a built message") {
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<config::Config>();
  root.setMode(config::Config::Mode::FORGIVING);
  root.setChildrenMaxAgeMs(250);

  auto config = Config::fromReader(root.asReader());
  KJ_EXPECT(config.mode == Mode::FORGIVING);
  KJ_EXPECT(config.childrenMaxAge == 250 * kj::MILLISECONDS);
  KJ_EXPECT(config.statMaxAge == 100 * kj::MILLISECONDS);
}

KJ_TEST("mode names") {
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseMode("strict")) == Mode::STRICT);
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseMode("Normal")) == Mode::NORMAL);
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseMode("FORGIVING")) == Mode::FORGIVING);
  KJ_EXPECT(parseMode("lax") == kj::none);
  KJ_EXPECT(kj::str(Mode::STRICT) == "strict");
}

}  // namespace
}  // namespace lazyfs
