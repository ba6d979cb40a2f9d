// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "fs-error.h"

#include <kj/debug.h>

#include <errno.h>
#include <string.h>

namespace lazyfs {

kj::StringPtr KJ_STRINGIFY(FsError error) {
  switch (error) {
    case FsError::NOT_FOUND:
      return "not-found"_kj;
    case FsError::BUSY:
      return "resource-busy"_kj;
    case FsError::PERMISSION_DENIED:
      return "permission-denied"_kj;
    case FsError::ALREADY_EXISTS:
      return "already-exists"_kj;
    case FsError::NOT_DIRECTORY:
      return "not-directory"_kj;
    case FsError::IS_DIRECTORY:
      return "is-directory"_kj;
    case FsError::NO_SPACE:
      return "no-space"_kj;
    case FsError::FAILED:
      return "failed"_kj;
  }
  KJ_UNREACHABLE;
}

FsError classifyErrno(int error) {
  switch (error) {
    case ENOENT:
      return FsError::NOT_FOUND;
    case EBUSY:
      return FsError::BUSY;
    case EACCES:
    case EPERM:
      return FsError::PERMISSION_DENIED;
    case EEXIST:
      return FsError::ALREADY_EXISTS;
    case ENOTDIR:
      return FsError::NOT_DIRECTORY;
    case EISDIR:
      return FsError::IS_DIRECTORY;
    case ENOSPC:
#ifdef EDQUOT
    case EDQUOT:
#endif
      return FsError::NO_SPACE;
    default:
      return FsError::FAILED;
  }
}

FsFailure FsFailure::fromErrno(int error, kj::StringPtr operation, kj::StringPtr path) {
  return FsFailure{
    .code = classifyErrno(error),
    .osErrno = error,
    .description = kj::str(operation, "(", path, "): ", strerror(error)),
  };
}

FsFailure FsFailure::fromException(const kj::Exception& exception) {
  return FsFailure{
    .code = FsError::FAILED,
    .osErrno = 0,
    .description = kj::str(exception.getDescription()),
  };
}

FsFailure FsFailure::clone() const {
  return FsFailure{
    .code = code,
    .osErrno = osErrno,
    .description = kj::str(description),
  };
}

kj::String KJ_STRINGIFY(const FsFailure& failure) {
  return kj::str(failure.code, ": ", failure.description);
}

void throwFailure(const FsFailure& failure) {
  KJ_FAIL_REQUIRE("filesystem operation failed", failure);
}

kj::Exception toException(const FsFailure& failure) {
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { throwFailure(failure); })) {
    return kj::mv(exception);
  }
  KJ_UNREACHABLE;
}

}  // namespace lazyfs
