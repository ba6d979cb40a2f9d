// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/map.h>
#include <kj/refcount.h>
#include <kj/string.h>

namespace lazyfs {

// Identity map from canonical path to node. For as long as an entry exists, every lookup of its
// key returns the same object, which is what lets callers compare nodes by address.
//
// Entries are never evicted. clear() drops all of them at once; objects that callers still hold
// stay alive through their own references, but the next lookup of the same key creates a new
// object.
template <typename T>
class ObjectCache {
 public:
  ObjectCache() = default;
  KJ_DISALLOW_COPY_AND_MOVE(ObjectCache);

  // Returns the object stored under `key`, calling `create()` to make one on a miss.
  // `create()` must return a kj::Rc<T>.
  template <typename Func>
  kj::Rc<T> getOrCreate(kj::StringPtr key, Func&& create) {
    auto& entry = entries.findOrCreate(key, [&]() {
      return typename kj::HashMap<kj::String, kj::Rc<T>>::Entry{kj::str(key), create()};
    });
    return entry.addRef();
  }

  kj::Maybe<kj::Rc<T>> find(kj::StringPtr key) {
    KJ_IF_SOME(entry, entries.find(key)) {
      return entry.addRef();
    }
    return kj::none;
  }

  size_t size() const {
    return entries.size();
  }

  void clear() {
    entries.clear();
  }

 private:
  kj::HashMap<kj::String, kj::Rc<T>> entries;
};

}  // namespace lazyfs
