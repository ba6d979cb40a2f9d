// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/exception.h>
#include <kj/string.h>

namespace lazyfs {

// Classification of a failed filesystem primitive.
enum class FsError {
  // The path, or one of its ancestors, does not exist. Transient.
  NOT_FOUND,
  // The resource is momentarily held by someone else. Transient.
  BUSY,
  PERMISSION_DENIED,
  ALREADY_EXISTS,
  // A path component that must be a directory is not one.
  NOT_DIRECTORY,
  // A file operation was aimed at a directory.
  IS_DIRECTORY,
  NO_SPACE,
  // Anything else, including exceptions thrown by the primitive itself.
  FAILED,
};

kj::StringPtr KJ_STRINGIFY(FsError error);

// Not-found and resource-busy failures are expected to clear up on an immediate retry: entries
// that are being replaced disappear for a moment and locks are released. Everything else is
// reported as-is.
inline bool isTransient(FsError error) {
  return error == FsError::NOT_FOUND || error == FsError::BUSY;
}

// A failed filesystem primitive. Primitives return this instead of throwing.
struct FsFailure {
  FsError code;
  // The errno reported by the OS, or 0 when the failure didn't come from a syscall.
  int osErrno = 0;
  kj::String description;

  static FsFailure fromErrno(int error, kj::StringPtr operation, kj::StringPtr path);
  static FsFailure fromException(const kj::Exception& exception);

  FsFailure clone() const;
};

kj::String KJ_STRINGIFY(const FsFailure& failure);

FsError classifyErrno(int error);

// Raises `failure` as a kj::Exception. Used where the configured mode escalates I/O failures.
[[noreturn]] void throwFailure(const FsFailure& failure);

// The exception throwFailure() would throw, for storing rather than raising.
kj::Exception toException(const FsFailure& failure);

}  // namespace lazyfs
