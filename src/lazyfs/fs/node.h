// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <lazyfs/fs/node-state.h>

#include <kj/function.h>
#include <kj/refcount.h>

namespace lazyfs {

class LazyFs;

// A filesystem entry, identified by its canonical path, with lazily computed and briefly cached
// attributes. Obtain nodes from LazyFs::get(); there is one live node per canonical path.
//
// Reads (stat, children, data) go through the retry policy and are cached for the durations
// in Config. A failed read is never served from the cache. Every successful mutation drops all
// of the node's cached attributes, and those of the ancestors it may have created, before
// returning.
//
// The owning LazyFs must outlive the node. Not thread-safe: a single caller should own the
// operations issued against a given path.
class Node final: public kj::Refcounted, public kj::EnableAddRefToThis<Node> {
 public:
  Node(LazyFs& fs, kj::String path);

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

  // kj::none if the entry is missing or the stat failed.
  kj::Maybe<Stat> stat();
  Kind kind();
  bool exists();
  kj::Maybe<bool> isFile();
  kj::Maybe<bool> isFolder();
  kj::Maybe<uint64_t> size();

  // Throws "unsupported parent" for the filesystem root.
  kj::Rc<Node> parent();

  // Without a name, creates this folder and any missing ancestors, doing nothing if it is
  // already a folder. With a name, does the same for the child folder `name` and returns it.
  // Throws a structural conflict if a file is in the way.
  kj::Rc<Node> createDirectory(kj::Maybe<kj::StringPtr> name = kj::none);
  kj::Rc<Node> create() {
    return createDirectory();
  }

  // Entries of this folder in name order. Empty if this isn't a folder (strict mode throws).
  kj::Array<kj::Rc<Node>> listChildren();
  // Keeps the entries for which `filter` returns true, evaluated in order.
  kj::Array<kj::Rc<Node>> listChildren(kj::FunctionParam<bool(Node&)> filter);
  kj::Array<kj::Rc<Node>> listFiles();
  kj::Array<kj::Rc<Node>> listFolders();
  // The parent's children other than this node.
  kj::Array<kj::Rc<Node>> siblings();

  // Contents of this file. kj::none if this isn't a file (strict mode throws) or if the read
  // failed.
  kj::Maybe<kj::Array<kj::byte>> readBytes();
  kj::Maybe<kj::String> readText();

  // Returns whether the write happened. Without Overwrite::YES an existing file is a structural
  // conflict. A missing parent folder is created first.
  bool writeBytes(kj::ArrayPtr<const kj::byte> data, Overwrite overwrite = Overwrite::NO);
  bool appendBytes(kj::ArrayPtr<const kj::byte> data, MustExist mustExist = MustExist::NO);
  // Replaces the contents of an existing file. Throws if this isn't one.
  bool overwrite(kj::ArrayPtr<const kj::byte> data);

  // The node at `suffix` under this one, which need not exist.
  kj::Rc<Node> nested(kj::StringPtr suffix);
  // Like nested(), but refuses to look inside a file: kj::none, or a throw in strict mode.
  kj::Maybe<kj::Rc<Node>> descend(kj::StringPtr name);

  // Forget cached attributes, e.g. after changing the entry behind lazyfs's back.
  void invalidate() {
    caches.invalidate();
  }

 private:
  LazyFs& fs;
  kj::String path;
  NodeCaches caches;
  kj::Maybe<kj::String> parentPathCache;

  kj::Maybe<kj::Rc<Node>> tryParent();
  // Makes sure the folder a write lands in exists. False if it couldn't be created and the mode
  // tolerates that.
  bool prepareParent();
  void invalidateAfterMutation();
  kj::Array<kj::String> listNames();
};

}  // namespace lazyfs
