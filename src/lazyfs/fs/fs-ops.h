// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <lazyfs/fs/fs-error.h>
#include <lazyfs/util/strong-bool.h>

#include <kj/array.h>
#include <kj/async.h>
#include <kj/memory.h>
#include <kj/one-of.h>
#include <kj/string.h>
#include <kj/time.h>

// The OS primitives every node operation bottoms out in. Nodes never call the OS directly; they
// hold an FsOps (or AsyncFsOps) table chosen at construction, which is how the tests substitute
// an in-memory tree for the disk.
//
// Paths handed to a table are canonical paths as produced by PathResolver: "." or "./a/b" for
// entries under the working directory, "/x/y" for everything else. The table resolves relative
// paths against its own notion of the working directory (currentDirectory()).
//
// None of the primitives throw for OS-level faults. They report an FsFailure instead, so that
// the retry policy in retry.h can classify it.

namespace lazyfs {

enum class FsType {
  FILE,
  DIRECTORY,
  // Sockets, devices, fifos and anything else that is neither a file nor a directory.
  OTHER,
};

// Metadata about a filesystem entry, following symlinks.
struct Stat final {
  FsType type = FsType::FILE;

  // Size in bytes. Directories report whatever the OS reports.
  uint64_t size = 0;

  kj::Date lastModified = kj::UNIX_EPOCH;
};

LFS_STRONG_BOOL(Recursive);

class FsOps {
 public:
  virtual ~FsOps() noexcept(false) = default;

  virtual kj::OneOf<FsFailure, Stat> stat(kj::StringPtr path) = 0;

  // Names of the entries in the directory, excluding "." and "..", sorted bytewise.
  virtual kj::OneOf<FsFailure, kj::Array<kj::String>> listDirectory(kj::StringPtr path) = 0;

  virtual kj::OneOf<FsFailure, kj::Array<kj::byte>> readFile(kj::StringPtr path) = 0;

  // Creates or truncates the file. Returns the number of bytes written.
  virtual kj::OneOf<FsFailure, size_t> writeFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) = 0;

  // Creates the file if needed. Returns the number of bytes written.
  virtual kj::OneOf<FsFailure, size_t> appendFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) = 0;

  // With Recursive::YES, missing ancestors are created too and an existing directory at `path`
  // is not an error. Returns true if a directory was created.
  virtual kj::OneOf<FsFailure, bool> makeDirectory(kj::StringPtr path, Recursive recursive) = 0;

  // Absolute path of the working directory, without a trailing slash except for "/".
  virtual kj::OneOf<FsFailure, kj::String> currentDirectory() = 0;
};

// Suspending version of FsOps. Same contracts; results are delivered through promises that
// resolve to an FsFailure rather than rejecting.
class AsyncFsOps {
 public:
  virtual ~AsyncFsOps() noexcept(false) = default;

  virtual kj::Promise<kj::OneOf<FsFailure, Stat>> stat(kj::StringPtr path) = 0;
  virtual kj::Promise<kj::OneOf<FsFailure, kj::Array<kj::String>>> listDirectory(
      kj::StringPtr path) = 0;
  virtual kj::Promise<kj::OneOf<FsFailure, kj::Array<kj::byte>>> readFile(kj::StringPtr path) = 0;
  virtual kj::Promise<kj::OneOf<FsFailure, size_t>> writeFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) = 0;
  virtual kj::Promise<kj::OneOf<FsFailure, size_t>> appendFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) = 0;
  virtual kj::Promise<kj::OneOf<FsFailure, bool>> makeDirectory(
      kj::StringPtr path, Recursive recursive) = 0;

  // Resolving paths is synchronous in both variants, so this one doesn't suspend.
  virtual kj::OneOf<FsFailure, kj::String> currentDirectory() = 0;
};

// The real filesystem, through POSIX calls on the calling thread.
kj::Own<FsOps> newDiskFsOps();

// Adapts a blocking table for use from an event loop. Each primitive is started from a
// kj::evalLater() continuation, so the calling task yields before the underlying call runs.
// `inner` must outlive the returned object. The path and data arguments are copied before
// yielding.
kj::Own<AsyncFsOps> newAsyncFsOps(FsOps& inner);

// Runs `inner` on a dedicated thread. The calling thread's event loop keeps running while a
// primitive is in progress; results come back through kj::Executor. The calling thread must have
// a kj::EventLoop, and the returned object must be destroyed on that thread. Destruction stops and
// joins the worker.
kj::Own<AsyncFsOps> newWorkerThreadFsOps(kj::Own<FsOps> inner);

// The real filesystem, for use from an event loop: newDiskFsOps() on a worker thread.
kj::Own<AsyncFsOps> newDiskAsyncFsOps();

}  // namespace lazyfs
