// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "fs-error.h"

#include <lazyfs/util/test.h>

#include <errno.h>

namespace lazyfs {
namespace {

KJ_TEST("errno values are classified") {
  KJ_EXPECT(classifyErrno(ENOENT) == FsError::NOT_FOUND);
  KJ_EXPECT(classifyErrno(EBUSY) == FsError::BUSY);
  KJ_EXPECT(classifyErrno(EACCES) == FsError::PERMISSION_DENIED);
  KJ_EXPECT(classifyErrno(EPERM) == FsError::PERMISSION_DENIED);
  KJ_EXPECT(classifyErrno(EEXIST) == FsError::ALREADY_EXISTS);
  KJ_EXPECT(classifyErrno(ENOTDIR) == FsError::NOT_DIRECTORY);
  KJ_EXPECT(classifyErrno(EISDIR) == FsError::IS_DIRECTORY);
  KJ_EXPECT(classifyErrno(ENOSPC) == FsError::NO_SPACE);
  KJ_EXPECT(classifyErrno(EIO) == FsError::FAILED);
}

KJ_TEST("only not-found and busy are transient") {
  KJ_EXPECT(isTransient(FsError::NOT_FOUND));
  KJ_EXPECT(isTransient(FsError::BUSY));
  KJ_EXPECT(!isTransient(FsError::PERMISSION_DENIED));
  KJ_EXPECT(!isTransient(FsError::ALREADY_EXISTS));
  KJ_EXPECT(!isTransient(FsError::IS_DIRECTORY));
  KJ_EXPECT(!isTransient(FsError::FAILED));
}

KJ_TEST("failures carry the operation and path") {
  auto failure = FsFailure::fromErrno(ENOENT, "stat", "./missing");
  KJ_EXPECT(failure.code == FsError::NOT_FOUND);
  KJ_EXPECT(failure.osErrno == ENOENT);
  KJ_EXPECT(failure.description.startsWith("stat(./missing): "), failure.description);
  KJ_EXPECT(kj::str(failure).startsWith("not-found: stat(./missing)"), failure);

  auto copy = failure.clone();
  KJ_EXPECT(copy.code == failure.code);
  KJ_EXPECT(copy.description == failure.description);
}

KJ_TEST("exceptions become FAILED") {
  auto exception = KJ_EXCEPTION(FAILED, "disk on fire");
  auto failure = FsFailure::fromException(exception);
  KJ_EXPECT(failure.code == FsError::FAILED);
  KJ_EXPECT(failure.osErrno == 0);
  KJ_EXPECT(failure.description.contains("disk on fire"), failure.description);
}

KJ_TEST("throwFailure and toException agree") {
  auto failure = FsFailure::fromErrno(EACCES, "open", "/secret");
  LFS_EXPECT_THROW(FAILED, "filesystem operation failed", throwFailure(failure));

  auto exception = toException(failure);
  KJ_EXPECT(exception.getType() == kj::Exception::Type::FAILED);
  KJ_EXPECT(exception.getDescription().contains("filesystem operation failed"));
  KJ_EXPECT(exception.getDescription().contains("/secret"));
}

}  // namespace
}  // namespace lazyfs
