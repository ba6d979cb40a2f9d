// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <lazyfs/fs/node-state.h>

#include <kj/async.h>
#include <kj/function.h>
#include <kj/refcount.h>

namespace lazyfs {

class AsyncLazyFs;

// Suspending counterpart of Node, obtained from AsyncLazyFs::get(). It follows the same caching,
// invalidation and mode rules; OS calls and retry pauses suspend the calling task instead of
// blocking the thread.
//
// Operations on one node are not serialized. Callers that start several operations on the same
// node concurrently race on its cached attributes. A node must stay alive until the promises it
// returned settle; holding the kj::Rc is enough.
class AsyncNode final: public kj::Refcounted, public kj::EnableAddRefToThis<AsyncNode> {
 public:
  AsyncNode(AsyncLazyFs& fs, kj::String path);

  kj::StringPtr getPath() const {
    return path;
  }
  kj::String toString() const {
    return kj::str(path);
  }
  kj::Array<kj::String> getParts() const {
    return splitPath(path);
  }
  kj::StringPtr getName() const {
    return baseName(path);
  }
  kj::StringPtr getExtension() const {
    return extensionOf(path);
  }

  kj::Promise<kj::Maybe<Stat>> stat();
  kj::Promise<Kind> kind();
  kj::Promise<bool> exists();
  kj::Promise<kj::Maybe<bool>> isFile();
  kj::Promise<kj::Maybe<bool>> isFolder();
  kj::Promise<kj::Maybe<uint64_t>> size();

  // Computing a parent path doesn't touch the filesystem, so this doesn't suspend.
  kj::Rc<AsyncNode> parent();

  kj::Promise<kj::Rc<AsyncNode>> createDirectory(kj::Maybe<kj::StringPtr> name = kj::none);
  kj::Promise<kj::Rc<AsyncNode>> create() {
    return createDirectory();
  }

  kj::Promise<kj::Array<kj::Rc<AsyncNode>>> listChildren();
  // `filter` runs on one entry at a time, in name order.
  kj::Promise<kj::Array<kj::Rc<AsyncNode>>> listChildren(
      kj::Function<kj::Promise<bool>(AsyncNode&)> filter);
  kj::Promise<kj::Array<kj::Rc<AsyncNode>>> listFiles();
  kj::Promise<kj::Array<kj::Rc<AsyncNode>>> listFolders();
  kj::Promise<kj::Array<kj::Rc<AsyncNode>>> siblings();

  kj::Promise<kj::Maybe<kj::Array<kj::byte>>> readBytes();
  kj::Promise<kj::Maybe<kj::String>> readText();

  // `data` is copied before the first suspension point.
  kj::Promise<bool> writeBytes(
      kj::ArrayPtr<const kj::byte> data, Overwrite overwrite = Overwrite::NO);
  kj::Promise<bool> appendBytes(
      kj::ArrayPtr<const kj::byte> data, MustExist mustExist = MustExist::NO);
  kj::Promise<bool> overwrite(kj::ArrayPtr<const kj::byte> data);

  kj::Rc<AsyncNode> nested(kj::StringPtr suffix);
  kj::Promise<kj::Maybe<kj::Rc<AsyncNode>>> descend(kj::StringPtr name);

  void invalidate() {
    caches.invalidate();
  }

 private:
  AsyncLazyFs& fs;
  kj::String path;
  NodeCaches caches;
  kj::Maybe<kj::String> parentPathCache;

  kj::Maybe<kj::Rc<AsyncNode>> tryParent();
  kj::Promise<bool> prepareParent();
  void invalidateAfterMutation();
  kj::Promise<kj::Array<kj::String>> listNames();
  kj::Promise<kj::Rc<AsyncNode>> createSelf();
  kj::Promise<kj::Rc<AsyncNode>> createChild(kj::String name);

  enum class WriteMode { TRUNCATE, APPEND };
  kj::Promise<bool> write(
      kj::Array<kj::byte> data, WriteMode mode, Overwrite overwrite, MustExist mustExist);
};

}  // namespace lazyfs
