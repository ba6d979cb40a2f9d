// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "config.h"

#include <capnp/message.h>
#include <capnp/serialize-text.h>
#include <kj/debug.h>

namespace lazyfs {

kj::StringPtr KJ_STRINGIFY(Mode mode) {
  switch (mode) {
    case Mode::STRICT:
      return "strict"_kj;
    case Mode::NORMAL:
      return "normal"_kj;
    case Mode::FORGIVING:
      return "forgiving"_kj;
  }
  KJ_UNREACHABLE;
}

kj::Maybe<Mode> parseMode(kj::StringPtr name) {
  auto lower = kj::heapString(name);
  for (char& c: lower) {
    if ('A' <= c && c <= 'Z') c = c - 'A' + 'a';
  }

  for (auto mode: {Mode::STRICT, Mode::NORMAL, Mode::FORGIVING}) {
    if (lower == KJ_STRINGIFY(mode)) {
      return mode;
    }
  }
  return kj::none;
}

Config Config::fromReader(config::Config::Reader reader) {
  Config result;
  switch (reader.getMode()) {
    case config::Config::Mode::STRICT:
      result.mode = Mode::STRICT;
      break;
    case config::Config::Mode::NORMAL:
      result.mode = Mode::NORMAL;
      break;
    case config::Config::Mode::FORGIVING:
      result.mode = Mode::FORGIVING;
      break;
    default:
      KJ_FAIL_REQUIRE("unknown mode in config", static_cast<uint16_t>(reader.getMode()));
  }
  result.statMaxAge = reader.getStatMaxAgeMs() * kj::MILLISECONDS;
  result.childrenMaxAge = reader.getChildrenMaxAgeMs() * kj::MILLISECONDS;
  result.dataMaxAge = reader.getDataMaxAgeMs() * kj::MILLISECONDS;
  return result;
}

Config Config::parse(kj::StringPtr text) {
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<config::Config>();
  capnp::TextCodec codec;
  codec.decode(text, root);
  return fromReader(root.asReader());
}

}  // namespace lazyfs
