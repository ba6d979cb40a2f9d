// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "fs-ops.h"

#include <kj/async.h>
#include <kj/filesystem.h>
#include <kj/mutex.h>
#include <kj/test.h>
#include <kj/timer.h>

#include <errno.h>
#include <stdlib.h>

namespace lazyfs {
namespace {

// A scratch directory under $TMPDIR (or /tmp), removed with everything in it on destruction.
class TempDir {
 public:
  TempDir() {
    const char* tmp = getenv("TMPDIR");
    auto pattern = kj::str(tmp == nullptr ? "/tmp" : tmp, "/lazyfs-test.XXXXXX");
    if (mkdtemp(pattern.begin()) == nullptr) {
      KJ_FAIL_SYSCALL("mkdtemp", errno, pattern);
    }
    path = kj::mv(pattern);
  }
  ~TempDir() noexcept(false) {
    auto disk = kj::newDiskFilesystem();
    disk->getRoot().remove(kj::Path(nullptr).eval(path));
  }
  KJ_DISALLOW_COPY_AND_MOVE(TempDir);

  kj::String operator()(kj::StringPtr name) const {
    return kj::str(path, "/", name);
  }

 private:
  kj::String path;
};

template <typename T>
FsError failureCode(kj::OneOf<FsFailure, T>& result) {
  return KJ_ASSERT_NONNULL(result.template tryGet<FsFailure>()).code;
}

KJ_TEST("disk ops write, append and read files") {
  TempDir dir;
  auto ops = newDiskFsOps();
  auto file = dir("a.txt");

  KJ_EXPECT(ops->writeFile(file, "hello"_kjb).get<size_t>() == 5);
  KJ_EXPECT(ops->appendFile(file, ", world"_kjb).get<size_t>() == 7);

  auto content = ops->readFile(file);
  KJ_EXPECT(content.get<kj::Array<kj::byte>>().asPtr() == "hello, world"_kjb);

  auto stat = ops->stat(file);
  KJ_EXPECT(stat.get<Stat>().type == FsType::FILE);
  KJ_EXPECT(stat.get<Stat>().size == 12);
  KJ_EXPECT(stat.get<Stat>().lastModified > kj::UNIX_EPOCH);
}

KJ_TEST("disk ops report classified failures") {
  TempDir dir;
  auto ops = newDiskFsOps();

  auto missing = ops->stat(dir("nope"));
  KJ_EXPECT(failureCode(missing) == FsError::NOT_FOUND);
  KJ_EXPECT(KJ_ASSERT_NONNULL(missing.tryGet<FsFailure>()).osErrno == ENOENT);

  auto readDir = ops->readFile(dir(""));
  KJ_EXPECT(failureCode(readDir) == FsError::IS_DIRECTORY);

  auto orphan = ops->writeFile(dir("x/y.txt"), "z"_kjb);
  KJ_EXPECT(failureCode(orphan) == FsError::NOT_FOUND);
}

KJ_TEST("disk ops create directories and list them sorted") {
  TempDir dir;
  auto ops = newDiskFsOps();

  KJ_EXPECT(ops->makeDirectory(dir("p/q/r"), Recursive::YES).get<bool>());
  KJ_EXPECT(!ops->makeDirectory(dir("p/q/r"), Recursive::YES).get<bool>());
  auto exists = ops->makeDirectory(dir("p"), Recursive::NO);
  KJ_EXPECT(failureCode(exists) == FsError::ALREADY_EXISTS);

  KJ_EXPECT(ops->writeFile(dir("p/b"), "1"_kjb).is<size_t>());
  KJ_EXPECT(ops->writeFile(dir("p/a"), "2"_kjb).is<size_t>());
  auto listing = ops->listDirectory(dir("p"));
  auto& names = listing.get<kj::Array<kj::String>>();
  KJ_ASSERT(names.size() == 3);
  KJ_EXPECT(names[0] == "a");
  KJ_EXPECT(names[1] == "b");
  KJ_EXPECT(names[2] == "q");

  auto throughFile = ops->makeDirectory(dir("p/a/c"), Recursive::YES);
  KJ_EXPECT(failureCode(throughFile) == FsError::NOT_DIRECTORY);
}

KJ_TEST("disk ops know the working directory") {
  auto ops = newDiskFsOps();
  auto cwd = ops->currentDirectory();
  KJ_EXPECT(cwd.get<kj::String>().startsWith("/"));
}

KJ_TEST("async adapter yields before calling through") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TempDir dir;
  auto disk = newDiskFsOps();
  auto ops = newAsyncFsOps(*disk);

  auto data = kj::heapArray("queued"_kjb);
  auto write = ops->writeFile(dir("later.txt"), data);
  for (auto& b: data) b = 0;
  auto early = disk->stat(dir("later.txt"));
  KJ_EXPECT(failureCode(early) == FsError::NOT_FOUND);

  KJ_EXPECT(write.wait(waitScope).get<size_t>() == 6);
  auto read = ops->readFile(dir("later.txt")).wait(waitScope);
  KJ_EXPECT(read.get<kj::Array<kj::byte>>().asPtr() == "queued"_kjb);
}

// stat() blocks until the test opens the gate. Everything else fails.
class GatedFsOps final: public FsOps {
 public:
  struct Gate {
    bool entered = false;
    bool open = false;
  };
  kj::MutexGuarded<Gate> gate;

  kj::OneOf<FsFailure, Stat> stat(kj::StringPtr path) override {
    auto lock = gate.lockExclusive();
    lock->entered = true;
    lock.wait([](const Gate& state) { return state.open; });
    return Stat{.type = FsType::FILE, .size = 3};
  }
  kj::OneOf<FsFailure, kj::Array<kj::String>> listDirectory(kj::StringPtr path) override {
    return FsFailure::fromErrno(EACCES, "opendir"_kj, path);
  }
  kj::OneOf<FsFailure, kj::Array<kj::byte>> readFile(kj::StringPtr path) override {
    return FsFailure::fromErrno(EACCES, "open"_kj, path);
  }
  kj::OneOf<FsFailure, size_t> writeFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) override {
    return FsFailure::fromErrno(EACCES, "write"_kj, path);
  }
  kj::OneOf<FsFailure, size_t> appendFile(
      kj::StringPtr path, kj::ArrayPtr<const kj::byte> data) override {
    return FsFailure::fromErrno(EACCES, "append"_kj, path);
  }
  kj::OneOf<FsFailure, bool> makeDirectory(kj::StringPtr path, Recursive recursive) override {
    return FsFailure::fromErrno(EACCES, "mkdir"_kj, path);
  }
  kj::OneOf<FsFailure, kj::String> currentDirectory() override {
    return kj::str("/gated");
  }
};

KJ_TEST("worker thread ops keep the loop running during a blocked call") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  kj::TimerImpl timer(kj::origin<kj::TimePoint>());

  auto gated = kj::heap<GatedFsOps>();
  auto& gate = gated->gate;
  auto ops = newWorkerThreadFsOps(kj::mv(gated));

  auto pending = ops->stat("./slow");
  gate.lockExclusive().wait([](const GatedFsOps::Gate& state) { return state.entered; });

  bool fired = false;
  auto tick = timer.afterDelay(10 * kj::MILLISECONDS).then([&]() { fired = true; });
  timer.advanceTo(timer.now() + 10 * kj::MILLISECONDS);
  tick.wait(waitScope);
  KJ_EXPECT(fired);
  KJ_EXPECT(!pending.poll(waitScope));

  gate.lockExclusive()->open = true;
  auto result = pending.wait(waitScope);
  KJ_EXPECT(result.get<Stat>().size == 3);

  // Failures and the synchronous working directory come back the same way.
  auto listed = ops->listDirectory("./dir").wait(waitScope);
  KJ_EXPECT(failureCode(listed) == FsError::PERMISSION_DENIED);
  KJ_EXPECT(ops->currentDirectory().get<kj::String>() == "/gated");
}

KJ_TEST("disk ops on a worker thread") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  TempDir dir;
  auto ops = newDiskAsyncFsOps();

  KJ_EXPECT(ops->makeDirectory(dir("x/y"), Recursive::YES).wait(waitScope).get<bool>());
  KJ_EXPECT(ops->writeFile(dir("x/y/f"), "abc"_kjb).wait(waitScope).get<size_t>() == 3);
  auto read = ops->readFile(dir("x/y/f")).wait(waitScope);
  KJ_EXPECT(read.get<kj::Array<kj::byte>>().asPtr() == "abc"_kjb);
  auto missing = ops->stat(dir("nope")).wait(waitScope);
  KJ_EXPECT(failureCode(missing) == FsError::NOT_FOUND);
}

}  // namespace
}  // namespace lazyfs
