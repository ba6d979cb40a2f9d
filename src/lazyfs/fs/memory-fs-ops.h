// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <lazyfs/fs/fs-ops.h>

#include <kj/map.h>
#include <kj/vector.h>

namespace lazyfs {

// An FsOps table backed by an in-memory tree. Nothing touches the disk.
//
// Relative paths are resolved against a fixed working directory (by default "/work", which
// exists from the start along with "/"). Every primitive is counted, and failures can be
// queued per path to exercise the retry policy:
//
//   MemoryFsOps ops;
//   ops.addFile("/work/a.txt", "hello"_kjb);
//   ops.injectFailure("/work/a.txt", EBUSY);   // the next primitive on a.txt fails once
//
// Not thread-safe.
class MemoryFsOps final: public FsOps {
 public:
  explicit MemoryFsOps(kj::StringPtr workingDirectory = "/work"_kj);
  KJ_DISALLOW_COPY_AND_MOVE(MemoryFsOps);

  // How many times each primitive was called, including calls that failed.
  struct CallCounts {
    uint stat = 0;
    uint listDirectory = 0;
    uint readFile = 0;
    uint writeFile = 0;
    uint appendFile = 0;
    uint makeDirectory = 0;

    uint mutations() const {
      return writeFile + appendFile + makeDirectory;
    }
  };
  const CallCounts& getCallCounts() const {
    return counts;
  }
  void resetCallCounts() {
    counts = {};
  }

  // Seed the tree. Missing ancestors are created as directories. Paths may be relative.
  void addDirectory(kj::StringPtr path);
  void addFile(kj::StringPtr path, kj::ArrayPtr<const kj::byte> content);
  void remove(kj::StringPtr path);

  // The next `times` primitives that touch `path` fail with `error` (an errno value) instead of
  // running.
  void injectFailure(kj::StringPtr path, int error, uint times = 1);

  // Contents of the file at `path`, or kj::none if there is no such file.
  kj::Maybe<kj::ArrayPtr<const kj::byte>> tryGetContent(kj::StringPtr path) const;

  kj::OneOf<FsFailure, Stat> stat(kj::StringPtr path) override;
  kj::OneOf<FsFailure, kj::Array<kj::String>> listDirectory(kj::StringPtr path) override;
  kj::OneOf<FsFailure, kj::Array<kj::byte>> readFile(kj::StringPtr path) override;
  kj::OneOf<FsFailure, size_t> writeFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) override;
  kj::OneOf<FsFailure, size_t> appendFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) override;
  kj::OneOf<FsFailure, bool> makeDirectory(kj::StringPtr path, Recursive recursive) override;
  kj::OneOf<FsFailure, kj::String> currentDirectory() override;

 private:
  struct Entry {
    FsType type;
    kj::Vector<kj::byte> content;
  };

  kj::String cwd;
  // Keyed by normalized absolute path.
  kj::HashMap<kj::String, Entry> entries;
  kj::HashMap<kj::String, kj::Vector<int>> pendingFailures;
  CallCounts counts;

  kj::String absolute(kj::StringPtr path) const;
  kj::Maybe<FsFailure> takeInjectedFailure(
      kj::StringPtr key, kj::StringPtr operation, kj::StringPtr path);
  // Checks that the parent of `key` exists and is a directory.
  kj::Maybe<FsFailure> checkParent(kj::StringPtr key, kj::StringPtr operation, kj::StringPtr path);
  kj::OneOf<FsFailure, size_t> store(kj::StringPtr path,
      kj::ArrayPtr<const kj::byte> data,
      bool append,
      kj::StringPtr operation);
};

}  // namespace lazyfs
