// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "lazyfs.h"

namespace lazyfs {

LazyFs::LazyFs(
    Config config, FsOps& ops, BlockingDelay& delay, const kj::MonotonicClock& clock)
    : config(config),
      ops(ops),
      delay(delay),
      clock(clock),
      resolver(config, [&ops]() { return ops.currentDirectory(); }) {}

kj::Rc<Node> LazyFs::get(kj::ArrayPtr<const PathArg> args) {
  return lookup(resolver.resolveChecked(args));
}

kj::Rc<Node> LazyFs::lookup(kj::StringPtr canonicalPath) {
  return nodes.getOrCreate(
      canonicalPath, [&]() { return kj::rc<Node>(*this, kj::str(canonicalPath)); });
}

kj::Maybe<kj::Rc<Node>> LazyFs::findCached(kj::StringPtr canonicalPath) {
  return nodes.find(canonicalPath);
}

void LazyFs::reset() {
  nodes.clear();
}

AsyncLazyFs::AsyncLazyFs(Config config, AsyncFsOps& ops, kj::Timer& timer)
    : config(config),
      ops(ops),
      timer(timer),
      resolver(config, [&ops]() { return ops.currentDirectory(); }) {}

kj::Rc<AsyncNode> AsyncLazyFs::get(kj::ArrayPtr<const PathArg> args) {
  return lookup(resolver.resolveChecked(args));
}

kj::Rc<AsyncNode> AsyncLazyFs::lookup(kj::StringPtr canonicalPath) {
  return nodes.getOrCreate(
      canonicalPath, [&]() { return kj::rc<AsyncNode>(*this, kj::str(canonicalPath)); });
}

kj::Maybe<kj::Rc<AsyncNode>> AsyncLazyFs::findCached(kj::StringPtr canonicalPath) {
  return nodes.find(canonicalPath);
}

void AsyncLazyFs::reset() {
  nodes.clear();
}

}  // namespace lazyfs
