// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "async-node.h"

#include <lazyfs/fs/lazyfs.h>
#include <lazyfs/fs/retry.h>

#include <kj/debug.h>
#include <kj/vector.h>

namespace lazyfs {

AsyncNode::AsyncNode(AsyncLazyFs& fs, kj::String path): fs(fs), path(kj::mv(path)) {}

kj::Promise<kj::Maybe<Stat>> AsyncNode::stat() {
  auto now = fs.getTimer().now();
  KJ_IF_SOME(value, tryGetFresh(caches.stat, now, fs.getConfig().statMaxAge)) {
    co_return value;
  }

  auto result = co_await attemptAsync(
      fs.getTimer(), Stat{}, [this]() { return fs.getOps().stat(path); });
  KJ_IF_SOME(failure, result.error) {
    caches.stat.emplace(CacheEntry<Stat>{toException(failure), now});
    co_return kj::none;
  }
  caches.stat.emplace(CacheEntry<Stat>{result.data, now});
  co_return result.data;
}

kj::Promise<Kind> AsyncNode::kind() {
  co_return kindOf(co_await stat());
}

kj::Promise<bool> AsyncNode::exists() {
  co_return (co_await stat()) != kj::none;
}

kj::Promise<kj::Maybe<bool>> AsyncNode::isFile() {
  co_return isKind(co_await kind(), Kind::FILE);
}

kj::Promise<kj::Maybe<bool>> AsyncNode::isFolder() {
  co_return isKind(co_await kind(), Kind::FOLDER);
}

kj::Promise<kj::Maybe<uint64_t>> AsyncNode::size() {
  KJ_IF_SOME(s, co_await stat()) {
    co_return s.size;
  }
  co_return kj::none;
}

kj::Rc<AsyncNode> AsyncNode::parent() {
  KJ_IF_SOME(cached, parentPathCache) {
    return fs.lookup(cached);
  }
  auto& computed = parentPathCache.emplace(parentPath(fs.getResolver(), path));
  return fs.lookup(computed);
}

kj::Maybe<kj::Rc<AsyncNode>> AsyncNode::tryParent() {
  if (parentPathCache == kj::none) {
    KJ_IF_SOME(computed, tryParentPath(fs.getResolver(), path)) {
      parentPathCache = kj::mv(computed);
    } else {
      return kj::none;
    }
  }
  return fs.lookup(KJ_ASSERT_NONNULL(parentPathCache));
}

kj::Promise<kj::Rc<AsyncNode>> AsyncNode::createDirectory(kj::Maybe<kj::StringPtr> name) {
  KJ_IF_SOME(childName, name) {
    if (childName.size() > 0) {
      return createChild(kj::str(childName));
    }
  }
  return createSelf();
}

kj::Promise<kj::Rc<AsyncNode>> AsyncNode::createChild(kj::String name) {
  checkChildName(name);
  if (co_await kind() == Kind::FILE) {
    failConflict("cannot create a folder inside a file", path);
  }
  auto child = fs.lookup(childPath(fs.getResolver(), path, name));
  co_return co_await child->createDirectory();
}

kj::Promise<kj::Rc<AsyncNode>> AsyncNode::createSelf() {
  switch (co_await kind()) {
    case Kind::FOLDER:
      co_return addRefToThis();
    case Kind::FILE:
      failConflict("cannot create a folder over an existing file", path);
    case Kind::ABSENT:
      break;
  }

  auto result = co_await attemptAsync(fs.getTimer(), false,
      [this]() { return fs.getOps().makeDirectory(path, Recursive::YES); });
  checkCreateFailure(fs.getConfig(), result.error, path);
  if (result.ok()) {
    invalidateAfterMutation();
  }
  co_return addRefToThis();
}

kj::Promise<kj::Array<kj::String>> AsyncNode::listNames() {
  auto now = fs.getTimer().now();
  KJ_IF_SOME(names, tryGetFresh(caches.children, now, fs.getConfig().childrenMaxAge)) {
    co_return KJ_MAP(name, names) { return kj::str(name); };
  }

  auto result = co_await attemptAsync(fs.getTimer(), kj::Array<kj::String>(),
      [this]() { return fs.getOps().listDirectory(path); });
  KJ_IF_SOME(failure, result.error) {
    caches.children.emplace(CacheEntry<kj::Array<kj::String>>{toException(failure), now});
    checkFailure(fs.getConfig(), result.error);
    co_return kj::Array<kj::String>();
  }

  auto names = KJ_MAP(name, result.data) { return kj::str(name); };
  caches.children.emplace(CacheEntry<kj::Array<kj::String>>{kj::mv(result.data), now});
  co_return names;
}

kj::Promise<kj::Array<kj::Rc<AsyncNode>>> AsyncNode::listChildren() {
  return listChildren([](AsyncNode&) -> kj::Promise<bool> { return true; });
}

kj::Promise<kj::Array<kj::Rc<AsyncNode>>> AsyncNode::listChildren(
    kj::Function<kj::Promise<bool>(AsyncNode&)> filter) {
  bool folder = co_await kind() == Kind::FOLDER;
  checkApplies(fs.getConfig(), folder, "cannot list children of a non-folder", path);
  if (!folder) co_return kj::Array<kj::Rc<AsyncNode>>();

  auto names = co_await listNames();
  kj::Vector<kj::Rc<AsyncNode>> result;
  for (auto& name: names) {
    auto child = fs.lookup(childPath(fs.getResolver(), path, name));
    if (co_await filter(*child.get())) {
      result.add(kj::mv(child));
    }
  }
  co_return result.releaseAsArray();
}

kj::Promise<kj::Array<kj::Rc<AsyncNode>>> AsyncNode::listFiles() {
  return listChildren([](AsyncNode& child) {
    return child.kind().then([](Kind kind) { return kind == Kind::FILE; });
  });
}

kj::Promise<kj::Array<kj::Rc<AsyncNode>>> AsyncNode::listFolders() {
  return listChildren([](AsyncNode& child) {
    return child.kind().then([](Kind kind) { return kind == Kind::FOLDER; });
  });
}

kj::Promise<kj::Array<kj::Rc<AsyncNode>>> AsyncNode::siblings() {
  auto up = parent();
  bool folder = co_await up->kind() == Kind::FOLDER;
  checkApplies(fs.getConfig(), folder, "cannot list children of a non-folder", up->getPath());
  if (!folder) co_return kj::Array<kj::Rc<AsyncNode>>();

  auto all = co_await up->listChildren();
  kj::Vector<kj::Rc<AsyncNode>> result(all.size());
  bool found = false;
  for (auto& child: all) {
    if (child.get() == this) {
      found = true;
    } else {
      result.add(kj::mv(child));
    }
  }

  auto self = co_await kind();
  if (!found && self != Kind::ABSENT) {
    reportMissingFromParent(fs.getConfig(), path, self);
  }
  co_return result.releaseAsArray();
}

kj::Promise<kj::Maybe<kj::Array<kj::byte>>> AsyncNode::readBytes() {
  bool file = co_await kind() == Kind::FILE;
  checkApplies(fs.getConfig(), file, "cannot read data of a non-file", path);
  if (!file) co_return kj::none;

  auto now = fs.getTimer().now();
  KJ_IF_SOME(data, tryGetFresh(caches.data, now, fs.getConfig().dataMaxAge)) {
    co_return kj::heapArray<kj::byte>(data.asPtr());
  }

  auto result = co_await attemptAsync(fs.getTimer(), kj::Array<kj::byte>(),
      [this]() { return fs.getOps().readFile(path); });
  KJ_IF_SOME(failure, result.error) {
    caches.data.emplace(CacheEntry<kj::Array<kj::byte>>{toException(failure), now});
    checkFailure(fs.getConfig(), result.error);
    co_return kj::none;
  }

  auto copy = kj::heapArray<kj::byte>(result.data.asPtr());
  caches.data.emplace(CacheEntry<kj::Array<kj::byte>>{kj::mv(result.data), now});
  co_return kj::mv(copy);
}

kj::Promise<kj::Maybe<kj::String>> AsyncNode::readText() {
  KJ_IF_SOME(bytes, co_await readBytes()) {
    co_return kj::str(bytes.asPtr().asChars());
  }
  co_return kj::none;
}

kj::Promise<bool> AsyncNode::prepareParent() {
  KJ_IF_SOME(up, tryParent()) {
    switch (co_await up->kind()) {
      case Kind::FOLDER:
        co_return true;
      case Kind::FILE:
        failConflict("the parent of the write target is a file", path);
      case Kind::ABSENT:
        break;
    }
    auto created = co_await up->createDirectory();
    switch (co_await created->kind()) {
      case Kind::FOLDER:
        co_return true;
      case Kind::FILE:
        failConflict("the parent of the write target is a file", path);
      case Kind::ABSENT:
        co_return false;
    }
  }
  co_return true;
}

kj::Promise<bool> AsyncNode::writeBytes(kj::ArrayPtr<const kj::byte> data, Overwrite overwrite) {
  return write(kj::heapArray(data), WriteMode::TRUNCATE, overwrite, MustExist::NO);
}

kj::Promise<bool> AsyncNode::appendBytes(kj::ArrayPtr<const kj::byte> data, MustExist mustExist) {
  return write(kj::heapArray(data), WriteMode::APPEND, Overwrite::YES, mustExist);
}

kj::Promise<bool> AsyncNode::overwrite(kj::ArrayPtr<const kj::byte> data) {
  return write(kj::heapArray(data), WriteMode::TRUNCATE, Overwrite::YES, MustExist::YES);
}

kj::Promise<bool> AsyncNode::write(
    kj::Array<kj::byte> data, WriteMode mode, Overwrite overwrite, MustExist mustExist) {
  auto self = co_await kind();
  if (mustExist && self != Kind::FILE) {
    failConflict(mode == WriteMode::APPEND ? "append target does not exist"_kj
                                           : "overwrite target does not exist as a file"_kj,
        path);
  }
  if (!overwrite && self == Kind::FILE) {
    failConflict("write target already exists and overwrite is disabled", path);
  }
  if (self == Kind::FOLDER) {
    rejectFolderWrite(fs.getConfig(), path);
    co_return false;
  }
  if (!co_await prepareParent()) co_return false;

  auto result = co_await attemptAsync(fs.getTimer(), size_t(0), [this, &data, mode]() {
    return mode == WriteMode::APPEND ? fs.getOps().appendFile(path, data)
                                     : fs.getOps().writeFile(path, data);
  });
  checkFailure(fs.getConfig(), result.error);
  if (!result.ok()) co_return false;

  invalidateAfterMutation();
  co_return true;
}

kj::Rc<AsyncNode> AsyncNode::nested(kj::StringPtr suffix) {
  return fs.lookup(childPath(fs.getResolver(), path, suffix));
}

kj::Promise<kj::Maybe<kj::Rc<AsyncNode>>> AsyncNode::descend(kj::StringPtr name) {
  return kind().then(
      [this, name = kj::str(name)](Kind actual) -> kj::Maybe<kj::Rc<AsyncNode>> {
    bool file = actual == Kind::FILE;
    checkApplies(fs.getConfig(), !file, "cannot look inside a file", path);
    if (file) return kj::none;
    return nested(name);
  });
}

void AsyncNode::invalidateAfterMutation() {
  caches.invalidate();
  forEachAncestor(fs.getResolver(), path, [this](kj::StringPtr ancestor) {
    KJ_IF_SOME(up, fs.findCached(ancestor)) {
      bool existed = up->caches.isKnownFolder();
      up->invalidate();
      return !existed;
    }
    return true;
  });
}

}  // namespace lazyfs
