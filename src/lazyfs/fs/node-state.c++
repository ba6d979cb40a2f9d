// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "node-state.h"

#include <lazyfs/util/logging.h>

#include <kj/debug.h>
#include <kj/vector.h>

namespace lazyfs {
namespace {

// "/", "C:" and "C:/", in any case.
bool isUnsupportedRoot(kj::StringPtr path) {
  if (path == "/") return true;
  if (path.size() < 2 || path.size() > 3 || path[1] != ':') return false;
  char drive = path[0];
  bool letter = ('a' <= drive && drive <= 'z') || ('A' <= drive && drive <= 'Z');
  return letter && (path.size() == 2 || path[2] == '/');
}

}  // namespace

kj::StringPtr KJ_STRINGIFY(Kind kind) {
  switch (kind) {
    case Kind::FILE:
      return "file"_kj;
    case Kind::FOLDER:
      return "folder"_kj;
    case Kind::ABSENT:
      return "absent"_kj;
  }
  KJ_UNREACHABLE;
}

Kind kindOf(const kj::Maybe<Stat>& stat) {
  KJ_IF_SOME(s, stat) {
    switch (s.type) {
      case FsType::FILE:
        return Kind::FILE;
      case FsType::DIRECTORY:
        return Kind::FOLDER;
      case FsType::OTHER:
        return Kind::ABSENT;
    }
  }
  return Kind::ABSENT;
}

kj::Array<kj::String> splitPath(kj::StringPtr path) {
  kj::Vector<kj::String> parts;
  size_t start = 0;
  for (size_t i = 0; i <= path.size(); i++) {
    if (i == path.size() || path[i] == '/') {
      parts.add(kj::str(path.slice(start, i)));
      start = i + 1;
    }
  }
  return parts.releaseAsArray();
}

kj::StringPtr baseName(kj::StringPtr path) {
  KJ_IF_SOME(slash, path.findLast('/')) {
    return path.slice(slash + 1);
  }
  return path;
}

kj::StringPtr extensionOf(kj::StringPtr path) {
  auto name = baseName(path);
  KJ_IF_SOME(dot, name.findLast('.')) {
    return name.slice(dot + 1);
  }
  return ""_kj;
}

kj::Maybe<kj::String> tryParentPath(PathResolver& resolver, kj::StringPtr path) {
  if (isUnsupportedRoot(path)) return kj::none;

  auto parts = splitPath(path);
  if (parts.size() > 2) {
    return resolver.canonicalize(kj::strArray(parts.slice(0, parts.size() - 1), "/"));
  }

  auto absolute = resolver.absolute(path);
  if (isUnsupportedRoot(absolute)) return kj::none;
  auto slash = KJ_ASSERT_NONNULL(absolute.findLast('/'));
  if (slash == 0) {
    return resolver.canonicalize("/");
  }
  return resolver.canonicalize(kj::str(absolute.asPtr().slice(0, slash)));
}

void forEachAncestor(
    PathResolver& resolver, kj::StringPtr path, kj::FunctionParam<bool(kj::StringPtr)> visit) {
  auto next = tryParentPath(resolver, path);
  for (;;) {
    KJ_IF_SOME(ancestor, next) {
      if (!visit(ancestor)) return;
      next = tryParentPath(resolver, ancestor);
    } else {
      return;
    }
  }
}

kj::String parentPath(PathResolver& resolver, kj::StringPtr path) {
  KJ_IF_SOME(parent, tryParentPath(resolver, path)) {
    return kj::mv(parent);
  }
  KJ_FAIL_REQUIRE("unsupported parent", "the filesystem root has no parent", path);
}

kj::String childPath(PathResolver& resolver, kj::StringPtr path, kj::StringPtr suffix) {
  return resolver.canonicalize(kj::str(path, "/", suffix));
}

void checkChildName(kj::StringPtr name) {
  KJ_REQUIRE(name.findFirst('/') == kj::none && name.findFirst('\\') == kj::none,
      "invalid path arguments", "folder name must not contain a separator", name);
}

void failConflict(kj::StringPtr what, kj::StringPtr path) {
  KJ_FAIL_REQUIRE("structural conflict", what, path);
}

void checkApplies(const Config& config, bool applies, kj::StringPtr what, kj::StringPtr path) {
  if (!applies && config.isStrict()) {
    KJ_FAIL_REQUIRE("structural conflict", what, path, config.mode);
  }
}

void rejectFolderWrite(const Config& config, kj::StringPtr path) {
  if (config.isStrict()) {
    KJ_FAIL_REQUIRE("structural conflict", "cannot write to a folder", path);
  }
  KJ_LOG(WARNING, "ignoring write to a folder", path);
}

void checkFailure(const Config& config, kj::Maybe<FsFailure>& error) {
  KJ_IF_SOME(failure, error) {
    if (config.isStrict()) {
      throwFailure(failure);
    }
  }
}

void checkCreateFailure(const Config& config, kj::Maybe<FsFailure>& error, kj::StringPtr path) {
  KJ_IF_SOME(failure, error) {
    if (failure.code == FsError::NOT_DIRECTORY || failure.code == FsError::ALREADY_EXISTS) {
      KJ_FAIL_REQUIRE("structural conflict", "a file is in the way of the folder", path, failure);
    }
    if (!config.isForgiving()) {
      throwFailure(failure);
    }
    KJ_LOG(WARNING, "failed to create folder", failure);
  }
}

void reportMissingFromParent(const Config& config, kj::StringPtr path, Kind kind) {
  if (config.isStrict()) {
    KJ_FAIL_REQUIRE("node not found among its parent's children", path, kind);
  }
  LOG_WARNING_PERIODICALLY("node not found among its parent's children", path, kind);
}

}  // namespace lazyfs
