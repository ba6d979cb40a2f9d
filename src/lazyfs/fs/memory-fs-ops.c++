// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "memory-fs-ops.h"

#include <lazyfs/fs/path-resolver.h>

#include <kj/debug.h>

#include <errno.h>

#include <algorithm>

namespace lazyfs {
namespace {

// Parent of a normalized absolute path. The root is its own parent.
kj::StringPtr parentKey(kj::StringPtr key, kj::String& storage) {
  KJ_IF_SOME(slash, key.findLast('/')) {
    if (slash == 0) return "/"_kj;
    storage = kj::str(key.slice(0, slash));
    return storage;
  }
  return "/"_kj;
}

kj::StringPtr baseName(kj::StringPtr key) {
  KJ_IF_SOME(slash, key.findLast('/')) {
    return key.slice(slash + 1);
  }
  return key;
}

}  // namespace

MemoryFsOps::MemoryFsOps(kj::StringPtr workingDirectory) {
  entries.insert(kj::str("/"), Entry{.type = FsType::DIRECTORY});
  cwd = kj::str("/");
  cwd = absolute(workingDirectory);
  addDirectory(cwd);
}

kj::String MemoryFsOps::absolute(kj::StringPtr path) const {
  return resolvePath(cwd, path);
}

void MemoryFsOps::addDirectory(kj::StringPtr path) {
  auto key = absolute(path);
  KJ_IF_SOME(entry, entries.find(key)) {
    KJ_REQUIRE(entry.type == FsType::DIRECTORY, "a file is in the way", key);
    return;
  }
  kj::String storage;
  auto parent = kj::str(parentKey(key, storage));
  addDirectory(parent);
  entries.insert(kj::mv(key), Entry{.type = FsType::DIRECTORY});
}

void MemoryFsOps::addFile(kj::StringPtr path, kj::ArrayPtr<const kj::byte> content) {
  auto key = absolute(path);
  kj::String storage;
  addDirectory(parentKey(key, storage));

  Entry entry{.type = FsType::FILE};
  entry.content.addAll(content);
  entries.upsert(kj::mv(key), kj::mv(entry), [](Entry& existing, Entry&& replacement) {
    KJ_REQUIRE(existing.type == FsType::FILE, "a directory is in the way");
    existing = kj::mv(replacement);
  });
}

void MemoryFsOps::remove(kj::StringPtr path) {
  auto key = absolute(path);
  auto prefix = kj::str(key, "/");
  kj::Vector<kj::String> doomed;
  for (auto& entry: entries) {
    if (entry.key == key || entry.key.startsWith(prefix)) {
      doomed.add(kj::str(entry.key));
    }
  }
  for (auto& name: doomed) {
    entries.erase(name);
  }
}

void MemoryFsOps::injectFailure(kj::StringPtr path, int error, uint times) {
  auto key = absolute(path);
  auto& queue = pendingFailures.findOrCreate(key, [&]() {
    return kj::HashMap<kj::String, kj::Vector<int>>::Entry{kj::str(key), {}};
  });
  for (uint i = 0; i < times; i++) {
    queue.add(error);
  }
}

kj::Maybe<kj::ArrayPtr<const kj::byte>> MemoryFsOps::tryGetContent(kj::StringPtr path) const {
  KJ_IF_SOME(entry, entries.find(absolute(path))) {
    if (entry.type == FsType::FILE) {
      return entry.content.asPtr();
    }
  }
  return kj::none;
}

kj::Maybe<FsFailure> MemoryFsOps::takeInjectedFailure(
    kj::StringPtr key, kj::StringPtr operation, kj::StringPtr path) {
  KJ_IF_SOME(queue, pendingFailures.find(key)) {
    if (queue.size() > 0) {
      int error = queue[0];
      for (size_t i = 1; i < queue.size(); i++) {
        queue[i - 1] = queue[i];
      }
      queue.removeLast();
      return FsFailure::fromErrno(error, operation, path);
    }
  }
  return kj::none;
}

kj::Maybe<FsFailure> MemoryFsOps::checkParent(
    kj::StringPtr key, kj::StringPtr operation, kj::StringPtr path) {
  kj::String storage;
  KJ_IF_SOME(parent, entries.find(parentKey(key, storage))) {
    if (parent.type != FsType::DIRECTORY) {
      return FsFailure::fromErrno(ENOTDIR, operation, path);
    }
    return kj::none;
  }
  return FsFailure::fromErrno(ENOENT, operation, path);
}

kj::OneOf<FsFailure, Stat> MemoryFsOps::stat(kj::StringPtr path) {
  ++counts.stat;
  auto key = absolute(path);
  KJ_IF_SOME(failure, takeInjectedFailure(key, "stat"_kj, path)) {
    return kj::mv(failure);
  }
  KJ_IF_SOME(entry, entries.find(key)) {
    return Stat{
      .type = entry.type,
      .size = entry.type == FsType::FILE ? entry.content.size() : 0,
    };
  }
  return FsFailure::fromErrno(ENOENT, "stat"_kj, path);
}

kj::OneOf<FsFailure, kj::Array<kj::String>> MemoryFsOps::listDirectory(kj::StringPtr path) {
  ++counts.listDirectory;
  auto key = absolute(path);
  KJ_IF_SOME(failure, takeInjectedFailure(key, "opendir"_kj, path)) {
    return kj::mv(failure);
  }
  KJ_IF_SOME(entry, entries.find(key)) {
    if (entry.type != FsType::DIRECTORY) {
      return FsFailure::fromErrno(ENOTDIR, "opendir"_kj, path);
    }
  } else {
    return FsFailure::fromErrno(ENOENT, "opendir"_kj, path);
  }

  kj::Vector<kj::String> names;
  for (auto& entry: entries) {
    if (entry.key == "/"_kj) continue;
    kj::String storage;
    if (parentKey(entry.key, storage) == key) {
      names.add(kj::str(baseName(entry.key)));
    }
  }
  auto result = names.releaseAsArray();
  std::sort(result.begin(), result.end());
  return kj::mv(result);
}

kj::OneOf<FsFailure, kj::Array<kj::byte>> MemoryFsOps::readFile(kj::StringPtr path) {
  ++counts.readFile;
  auto key = absolute(path);
  KJ_IF_SOME(failure, takeInjectedFailure(key, "open"_kj, path)) {
    return kj::mv(failure);
  }
  KJ_IF_SOME(entry, entries.find(key)) {
    if (entry.type == FsType::DIRECTORY) {
      return FsFailure::fromErrno(EISDIR, "read"_kj, path);
    }
    return kj::heapArray<kj::byte>(entry.content.asPtr());
  }
  return FsFailure::fromErrno(ENOENT, "open"_kj, path);
}

kj::OneOf<FsFailure, size_t> MemoryFsOps::writeFile(
    kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) {
  ++counts.writeFile;
  return store(path, data, false, "write"_kj);
}

kj::OneOf<FsFailure, size_t> MemoryFsOps::appendFile(
    kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) {
  ++counts.appendFile;
  return store(path, data, true, "append"_kj);
}

kj::OneOf<FsFailure, size_t> MemoryFsOps::store(
    kj::StringPtr path, kj::ArrayPtr<const kj::byte> data, bool append, kj::StringPtr operation) {
  auto key = absolute(path);
  KJ_IF_SOME(failure, takeInjectedFailure(key, operation, path)) {
    return kj::mv(failure);
  }
  KJ_IF_SOME(failure, checkParent(key, operation, path)) {
    return kj::mv(failure);
  }

  KJ_IF_SOME(entry, entries.find(key)) {
    if (entry.type == FsType::DIRECTORY) {
      return FsFailure::fromErrno(EISDIR, operation, path);
    }
    if (!append) {
      entry.content.clear();
    }
    entry.content.addAll(data);
    return data.size();
  }

  Entry entry{.type = FsType::FILE};
  entry.content.addAll(data);
  entries.insert(kj::mv(key), kj::mv(entry));
  return data.size();
}

kj::OneOf<FsFailure, bool> MemoryFsOps::makeDirectory(kj::StringPtr path, Recursive recursive) {
  ++counts.makeDirectory;
  auto key = absolute(path);
  KJ_IF_SOME(failure, takeInjectedFailure(key, "mkdir"_kj, path)) {
    return kj::mv(failure);
  }

  KJ_IF_SOME(entry, entries.find(key)) {
    if (entry.type == FsType::DIRECTORY && recursive) {
      return false;
    }
    return FsFailure::fromErrno(EEXIST, "mkdir"_kj, path);
  }

  if (!recursive) {
    KJ_IF_SOME(failure, checkParent(key, "mkdir"_kj, path)) {
      return kj::mv(failure);
    }
    entries.insert(kj::mv(key), Entry{.type = FsType::DIRECTORY});
    return true;
  }

  // Walk down from the root, creating what's missing.
  for (size_t end = 1; end <= key.size(); end++) {
    if (end < key.size() && key[end] != '/') continue;
    auto prefix = kj::str(key.slice(0, end));
    KJ_IF_SOME(entry, entries.find(prefix)) {
      if (entry.type != FsType::DIRECTORY) {
        return FsFailure::fromErrno(end == key.size() ? EEXIST : ENOTDIR, "mkdir"_kj, path);
      }
      continue;
    }
    entries.insert(kj::mv(prefix), Entry{.type = FsType::DIRECTORY});
  }
  return true;
}

kj::OneOf<FsFailure, kj::String> MemoryFsOps::currentDirectory() {
  return kj::str(cwd);
}

}  // namespace lazyfs
