// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "node.h"

#include <lazyfs/fs/lazyfs.h>
#include <lazyfs/fs/retry.h>

#include <kj/debug.h>
#include <kj/vector.h>

namespace lazyfs {

Node::Node(LazyFs& fs, kj::String path): fs(fs), path(kj::mv(path)) {}

kj::Maybe<Stat> Node::stat() {
  auto& entry = ttlGet(caches.stat, [&]() -> Stat {
    auto result = attempt(fs.getDelay(), Stat{}, [&]() { return fs.getOps().stat(path); });
    KJ_IF_SOME(failure, result.error) {
      throwFailure(failure);
    }
    return result.data;
  }, fs.getConfig().statMaxAge, fs.getClock());

  KJ_IF_SOME(value, entry.tryGetValue()) {
    return value;
  }
  return kj::none;
}

Kind Node::kind() {
  return kindOf(stat());
}

bool Node::exists() {
  return stat() != kj::none;
}

kj::Maybe<bool> Node::isFile() {
  return isKind(kind(), Kind::FILE);
}

kj::Maybe<bool> Node::isFolder() {
  return isKind(kind(), Kind::FOLDER);
}

kj::Maybe<uint64_t> Node::size() {
  return stat().map([](const Stat& s) { return s.size; });
}

kj::Rc<Node> Node::parent() {
  KJ_IF_SOME(cached, parentPathCache) {
    return fs.lookup(cached);
  }
  auto& computed = parentPathCache.emplace(parentPath(fs.getResolver(), path));
  return fs.lookup(computed);
}

kj::Maybe<kj::Rc<Node>> Node::tryParent() {
  if (parentPathCache == kj::none) {
    KJ_IF_SOME(computed, tryParentPath(fs.getResolver(), path)) {
      parentPathCache = kj::mv(computed);
    } else {
      return kj::none;
    }
  }
  return fs.lookup(KJ_ASSERT_NONNULL(parentPathCache));
}

kj::Rc<Node> Node::createDirectory(kj::Maybe<kj::StringPtr> name) {
  auto self = kind();

  KJ_IF_SOME(childName, name) {
    if (childName.size() > 0) {
      checkChildName(childName);
      if (self == Kind::FILE) {
        failConflict("cannot create a folder inside a file", path);
      }
      auto child = fs.lookup(childPath(fs.getResolver(), path, childName));
      return child->createDirectory();
    }
  }

  switch (self) {
    case Kind::FOLDER:
      return addRefToThis();
    case Kind::FILE:
      failConflict("cannot create a folder over an existing file", path);
    case Kind::ABSENT:
      break;
  }

  auto result = attempt(fs.getDelay(), false,
      [&]() { return fs.getOps().makeDirectory(path, Recursive::YES); });
  checkCreateFailure(fs.getConfig(), result.error, path);
  if (result.ok()) {
    invalidateAfterMutation();
  }
  return addRefToThis();
}

kj::Array<kj::String> Node::listNames() {
  auto& entry = ttlGet(caches.children, [&]() -> kj::Array<kj::String> {
    auto result = attempt(fs.getDelay(), kj::Array<kj::String>(),
        [&]() { return fs.getOps().listDirectory(path); });
    KJ_IF_SOME(failure, result.error) {
      throwFailure(failure);
    }
    return kj::mv(result.data);
  }, fs.getConfig().childrenMaxAge, fs.getClock());

  KJ_IF_SOME(error, entry.tryGetError()) {
    if (fs.getConfig().isStrict()) {
      kj::throwFatalException(kj::cp(error));
    }
    return nullptr;
  }
  auto& names = KJ_ASSERT_NONNULL(entry.tryGetValue());
  return KJ_MAP(name, names) { return kj::str(name); };
}

kj::Array<kj::Rc<Node>> Node::listChildren() {
  return listChildren([](Node&) { return true; });
}

kj::Array<kj::Rc<Node>> Node::listChildren(kj::FunctionParam<bool(Node&)> filter) {
  bool folder = kind() == Kind::FOLDER;
  checkApplies(fs.getConfig(), folder, "cannot list children of a non-folder", path);
  if (!folder) return nullptr;

  kj::Vector<kj::Rc<Node>> result;
  for (auto& name: listNames()) {
    auto child = fs.lookup(childPath(fs.getResolver(), path, name));
    if (filter(*child.get())) {
      result.add(kj::mv(child));
    }
  }
  return result.releaseAsArray();
}

kj::Array<kj::Rc<Node>> Node::listFiles() {
  return listChildren([](Node& child) { return child.kind() == Kind::FILE; });
}

kj::Array<kj::Rc<Node>> Node::listFolders() {
  return listChildren([](Node& child) { return child.kind() == Kind::FOLDER; });
}

kj::Array<kj::Rc<Node>> Node::siblings() {
  auto up = parent();
  bool folder = up->kind() == Kind::FOLDER;
  checkApplies(fs.getConfig(), folder, "cannot list children of a non-folder", up->getPath());
  if (!folder) return nullptr;

  auto all = up->listChildren();
  kj::Vector<kj::Rc<Node>> result(all.size());
  bool found = false;
  for (auto& child: all) {
    if (child.get() == this) {
      found = true;
    } else {
      result.add(kj::mv(child));
    }
  }

  auto self = kind();
  if (!found && self != Kind::ABSENT) {
    reportMissingFromParent(fs.getConfig(), path, self);
  }
  return result.releaseAsArray();
}

kj::Maybe<kj::Array<kj::byte>> Node::readBytes() {
  bool file = kind() == Kind::FILE;
  checkApplies(fs.getConfig(), file, "cannot read data of a non-file", path);
  if (!file) return kj::none;

  auto& entry = ttlGet(caches.data, [&]() -> kj::Array<kj::byte> {
    auto result = attempt(fs.getDelay(), kj::Array<kj::byte>(),
        [&]() { return fs.getOps().readFile(path); });
    KJ_IF_SOME(failure, result.error) {
      throwFailure(failure);
    }
    return kj::mv(result.data);
  }, fs.getConfig().dataMaxAge, fs.getClock());

  KJ_IF_SOME(error, entry.tryGetError()) {
    if (fs.getConfig().isStrict()) {
      kj::throwFatalException(kj::cp(error));
    }
    return kj::none;
  }
  return kj::heapArray<kj::byte>(KJ_ASSERT_NONNULL(entry.tryGetValue()).asPtr());
}

kj::Maybe<kj::String> Node::readText() {
  KJ_IF_SOME(bytes, readBytes()) {
    return kj::str(bytes.asPtr().asChars());
  }
  return kj::none;
}

bool Node::prepareParent() {
  KJ_IF_SOME(up, tryParent()) {
    switch (up->kind()) {
      case Kind::FOLDER:
        return true;
      case Kind::FILE:
        failConflict("the parent of the write target is a file", path);
      case Kind::ABSENT:
        break;
    }
    switch (up->createDirectory()->kind()) {
      case Kind::FOLDER:
        return true;
      case Kind::FILE:
        failConflict("the parent of the write target is a file", path);
      case Kind::ABSENT:
        // Only reachable in forgiving mode, where the failed create was already logged.
        return false;
    }
  }
  return true;
}

bool Node::writeBytes(kj::ArrayPtr<const kj::byte> data, Overwrite overwrite) {
  auto self = kind();
  if (!overwrite && self == Kind::FILE) {
    failConflict("write target already exists and overwrite is disabled", path);
  }
  if (self == Kind::FOLDER) {
    rejectFolderWrite(fs.getConfig(), path);
    return false;
  }
  if (!prepareParent()) return false;

  auto result = attempt(fs.getDelay(), size_t(0),
      [&]() { return fs.getOps().writeFile(path, data); });
  checkFailure(fs.getConfig(), result.error);
  if (!result.ok()) return false;

  invalidateAfterMutation();
  return true;
}

bool Node::appendBytes(kj::ArrayPtr<const kj::byte> data, MustExist mustExist) {
  auto self = kind();
  if (mustExist && self != Kind::FILE) {
    failConflict("append target does not exist", path);
  }
  if (self == Kind::FOLDER) {
    rejectFolderWrite(fs.getConfig(), path);
    return false;
  }
  if (!prepareParent()) return false;

  auto result = attempt(fs.getDelay(), size_t(0),
      [&]() { return fs.getOps().appendFile(path, data); });
  checkFailure(fs.getConfig(), result.error);
  if (!result.ok()) return false;

  invalidateAfterMutation();
  return true;
}

bool Node::overwrite(kj::ArrayPtr<const kj::byte> data) {
  if (kind() != Kind::FILE) {
    failConflict("overwrite target does not exist as a file", path);
  }
  return writeBytes(data, Overwrite::YES);
}

kj::Rc<Node> Node::nested(kj::StringPtr suffix) {
  return fs.lookup(childPath(fs.getResolver(), path, suffix));
}

kj::Maybe<kj::Rc<Node>> Node::descend(kj::StringPtr name) {
  bool file = kind() == Kind::FILE;
  checkApplies(fs.getConfig(), !file, "cannot look inside a file", path);
  if (file) return kj::none;
  return nested(name);
}

void Node::invalidateAfterMutation() {
  caches.invalidate();
  // A recursive create can bring several ancestors into existence. Walk up through them, and
  // through the first ancestor already known to be a folder, whose listing gained an entry.
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
