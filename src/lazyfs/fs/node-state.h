// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once
// Pieces shared by the blocking Node and the suspending AsyncNode: the kind enumeration, the
// cached attribute slots, path arithmetic, and the rules deciding when a mismatch raises.

#include <lazyfs/config.h>
#include <lazyfs/fs/fs-ops.h>
#include <lazyfs/fs/path-resolver.h>
#include <lazyfs/util/strong-bool.h>
#include <lazyfs/util/ttl-cache.h>

#include <kj/function.h>

namespace lazyfs {

enum class Kind {
  FILE,
  FOLDER,
  // Missing, unreadable, or neither a regular file nor a directory.
  ABSENT,
};

kj::StringPtr KJ_STRINGIFY(Kind kind);

Kind kindOf(const kj::Maybe<Stat>& stat);

// isFile()/isFolder() answer true or false only when the entry's kind is known.
inline kj::Maybe<bool> isKind(Kind actual, Kind wanted) {
  if (actual == Kind::ABSENT) return kj::none;
  return actual == wanted;
}

LFS_STRONG_BOOL(Overwrite);
LFS_STRONG_BOOL(MustExist);

struct NodeCaches {
  kj::Maybe<CacheEntry<Stat>> stat;
  // Entry names, valid while the node is a folder.
  kj::Maybe<CacheEntry<kj::Array<kj::String>>> children;
  // File contents, valid while the node is a file.
  kj::Maybe<CacheEntry<kj::Array<kj::byte>>> data;

  // Drops all three. Every successful mutation calls this; there is no partial invalidation.
  void invalidate() {
    stat = kj::none;
    children = kj::none;
    data = kj::none;
  }

  // Whether the last successful stat, fresh or not, found a folder.
  bool isKnownFolder() const {
    KJ_IF_SOME(entry, stat) {
      KJ_IF_SOME(value, entry.tryGetValue()) {
        return value.type == FsType::DIRECTORY;
      }
    }
    return false;
  }
};

// "./a/b" -> [".", "a", "b"]; "/a" -> ["", "a"].
kj::Array<kj::String> splitPath(kj::StringPtr path);

// Last segment.
kj::StringPtr baseName(kj::StringPtr path);

// Text after the last dot of the base name, or "" when there is none.
kj::StringPtr extensionOf(kj::StringPtr path);

// Canonical path of the parent. Paths with more than two segments drop their last one; shorter
// ones go through the absolute form, so "." yields the working directory's parent. The
// filesystem root and bare drive letters have no parent and return kj::none.
kj::Maybe<kj::String> tryParentPath(PathResolver& resolver, kj::StringPtr path);

// Calls `visit` on each ancestor of `path`, nearest first, until it returns false or there is no
// further parent.
void forEachAncestor(
    PathResolver& resolver, kj::StringPtr path, kj::FunctionParam<bool(kj::StringPtr)> visit);

// Like tryParentPath() but throws "unsupported parent" where that returns kj::none.
kj::String parentPath(PathResolver& resolver, kj::StringPtr path);

// Canonical path of `name` (or of a longer relative suffix) under `path`.
kj::String childPath(PathResolver& resolver, kj::StringPtr path, kj::StringPtr suffix);

// A folder name for createDirectory(). Throws "invalid path arguments" if it holds a separator.
void checkChildName(kj::StringPtr name);

// Mode rules. These take the already-computed condition so both node variants word their
// errors the same way.

// Raised in every mode: the caller asked for a shape the filesystem can't have.
[[noreturn]] void failConflict(kj::StringPtr what, kj::StringPtr path);

// An operation that doesn't apply to the entry's kind. Throws in strict mode; otherwise the
// caller returns an empty result.
void checkApplies(const Config& config, bool applies, kj::StringPtr what, kj::StringPtr path);

// A mutation aimed at a folder. Throws in strict mode; otherwise logs a warning and the caller
// returns false.
void rejectFolderWrite(const Config& config, kj::StringPtr path);

// A failed OS primitive. Throws in strict mode.
void checkFailure(const Config& config, kj::Maybe<FsFailure>& error);

// A failed folder creation. A file in the way (ENOTDIR, EEXIST) is a structural conflict in every
// mode. Any other failure throws unless the mode is forgiving, which logs it.
void checkCreateFailure(const Config& config, kj::Maybe<FsFailure>& error, kj::StringPtr path);

// The node was missing from its parent's listing even though it exists.
void reportMissingFromParent(const Config& config, kj::StringPtr path, Kind kind);

}  // namespace lazyfs
