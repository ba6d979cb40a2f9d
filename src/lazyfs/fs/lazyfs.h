// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once
// Entry points. A LazyFs (or AsyncLazyFs) owns the path resolver and the identity cache, and
// hands out nodes:
//
//   auto ops = lazyfs::newDiskFsOps();
//   lazyfs::LazyFs fs(lazyfs::Config{}, *ops);
//   auto log = fs.get("logs", 2025, "app.log");
//   log->appendBytes("started\n"_kjb);
//
// Each instance carries its own Config; there is no process-wide mode or cache.

#include <lazyfs/config.h>
#include <lazyfs/fs/async-node.h>
#include <lazyfs/fs/fs-ops.h>
#include <lazyfs/fs/node.h>
#include <lazyfs/fs/object-cache.h>
#include <lazyfs/fs/path-resolver.h>
#include <lazyfs/fs/retry.h>

#include <kj/time.h>
#include <kj/timer.h>

namespace lazyfs {

class LazyFs {
 public:
  // `ops`, `delay` and `clock` must outlive this object, which must in turn outlive every node
  // it hands out.
  LazyFs(Config config,
      FsOps& ops,
      BlockingDelay& delay = systemBlockingDelay(),
      const kj::MonotonicClock& clock = kj::systemPreciseMonotonicClock());
  KJ_DISALLOW_COPY_AND_MOVE(LazyFs);

  // The node for the path built from `params` (see PathArg). Unusable arguments throw
  // "invalid path arguments" unless the mode is forgiving.
  template <typename... Params>
  kj::Rc<Node> get(Params&&... params) {
    auto args = pathArgs(kj::fwd<Params>(params)...);
    return lookup(resolver.resolveChecked(args));
  }
  kj::Rc<Node> get(kj::ArrayPtr<const PathArg> args);

  // The node for an already-canonical path.
  kj::Rc<Node> lookup(kj::StringPtr canonicalPath);
  kj::Maybe<kj::Rc<Node>> findCached(kj::StringPtr canonicalPath);

  // Drops every cached node. Nodes that callers still hold keep working, but later lookups
  // create new ones.
  void reset();
  size_t cacheSize() const {
    return nodes.size();
  }

  const Config& getConfig() const {
    return config;
  }
  FsOps& getOps() {
    return ops;
  }
  BlockingDelay& getDelay() {
    return delay;
  }
  const kj::MonotonicClock& getClock() const {
    return clock;
  }
  PathResolver& getResolver() {
    return resolver;
  }

 private:
  Config config;
  FsOps& ops;
  BlockingDelay& delay;
  const kj::MonotonicClock& clock;
  PathResolver resolver;
  ObjectCache<Node> nodes;
};

// Suspending counterpart of LazyFs. Cache freshness is measured on `timer`, which also paces
// retries.
class AsyncLazyFs {
 public:
  AsyncLazyFs(Config config, AsyncFsOps& ops, kj::Timer& timer);
  KJ_DISALLOW_COPY_AND_MOVE(AsyncLazyFs);

  template <typename... Params>
  kj::Rc<AsyncNode> get(Params&&... params) {
    auto args = pathArgs(kj::fwd<Params>(params)...);
    return lookup(resolver.resolveChecked(args));
  }
  kj::Rc<AsyncNode> get(kj::ArrayPtr<const PathArg> args);

  kj::Rc<AsyncNode> lookup(kj::StringPtr canonicalPath);
  kj::Maybe<kj::Rc<AsyncNode>> findCached(kj::StringPtr canonicalPath);

  void reset();
  size_t cacheSize() const {
    return nodes.size();
  }

  const Config& getConfig() const {
    return config;
  }
  AsyncFsOps& getOps() {
    return ops;
  }
  kj::Timer& getTimer() {
    return timer;
  }
  PathResolver& getResolver() {
    return resolver;
  }

 private:
  Config config;
  AsyncFsOps& ops;
  kj::Timer& timer;
  PathResolver resolver;
  ObjectCache<AsyncNode> nodes;
};

}  // namespace lazyfs
