// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "async-node.h"

#include <lazyfs/fs/lazyfs.h>
#include <lazyfs/fs/memory-fs-ops.h>
#include <lazyfs/fs/test-util.h>

#include <errno.h>

namespace lazyfs {
namespace {

struct AsyncFixture {
  explicit AsyncFixture(Mode mode = Mode::NORMAL)
      : waitScope(loop),
        timer(kj::origin<kj::TimePoint>()),
        asyncOps(newAsyncFsOps(ops)),
        fs(Config{.mode = mode}, *asyncOps, timer) {}

  template <typename T>
  T wait(kj::Promise<T> promise) {
    return waitAdvancing(kj::mv(promise), timer, waitScope);
  }

  kj::Duration elapsed() const {
    return timer.now() - kj::origin<kj::TimePoint>();
  }

  kj::EventLoop loop;
  kj::WaitScope waitScope;
  kj::TimerImpl timer;
  MemoryFsOps ops;
  kj::Own<AsyncFsOps> asyncOps;
  AsyncLazyFs fs;
};

kj::String joinPaths(kj::ArrayPtr<const kj::Rc<AsyncNode>> nodes) {
  return kj::strArray(KJ_MAP(node, nodes) { return node->getPath(); }, " ");
}

KJ_TEST("async nodes share identity and naming rules") {
  AsyncFixture f;
  auto node = f.fs.get("logs", 2025, "app.log");
  KJ_EXPECT(node->getPath() == "./logs/2025/app.log");
  KJ_EXPECT(node->getExtension() == "log");
  KJ_EXPECT(f.fs.get("/work/logs/2025/app.log") == node);
  KJ_EXPECT(node->parent() == f.fs.get("logs/2025"));
  LFS_EXPECT_THROW(FAILED, "unsupported parent", f.fs.get("/")->parent());
  LFS_EXPECT_THROW(FAILED, "invalid path arguments", f.fs.get("a", false));
}

KJ_TEST("async queries") {
  AsyncFixture f;
  f.ops.addFile("a.txt", "abc"_kjb);
  f.ops.addDirectory("dir");

  auto file = f.fs.get("a.txt");
  KJ_EXPECT(f.wait(file->kind()) == Kind::FILE);
  KJ_EXPECT(f.wait(file->exists()));
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.wait(file->isFile())));
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.wait(file->size())) == 3);
  KJ_EXPECT(f.ops.getCallCounts().stat == 1);

  auto dir = f.fs.get("dir");
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.wait(dir->isFolder())));
  KJ_EXPECT(f.elapsed() == 0 * kj::SECONDS);
}

KJ_TEST("async retries wait on the timer") {
  AsyncFixture f;
  auto missing = f.fs.get("missing");
  KJ_EXPECT(f.wait(missing->kind()) == Kind::ABSENT);
  KJ_EXPECT(f.wait(missing->isFile()) == kj::none);
  KJ_EXPECT(f.ops.getCallCounts().stat == 4);

  auto elapsed = f.elapsed();
  KJ_EXPECT(elapsed >= 2 * MIN_BACKOFF, elapsed);
  KJ_EXPECT(elapsed < 2 * (MIN_BACKOFF + BACKOFF_JITTER), elapsed);
}

KJ_TEST("async cache freshness follows the timer") {
  AsyncFixture f;
  f.ops.addFile("a", "x"_kjb);
  auto node = f.fs.get("a");
  KJ_EXPECT(f.wait(node->kind()) == Kind::FILE);
  KJ_EXPECT(f.wait(node->kind()) == Kind::FILE);
  KJ_EXPECT(f.ops.getCallCounts().stat == 1);

  f.timer.advanceTo(f.timer.now() + 100 * kj::MILLISECONDS);
  KJ_EXPECT(f.wait(node->kind()) == Kind::FILE);
  KJ_EXPECT(f.ops.getCallCounts().stat == 2);
}

KJ_TEST("async queries on different nodes run concurrently") {
  AsyncFixture f;
  f.ops.addFile("a", "x"_kjb);
  auto a = f.fs.get("a");
  auto b = f.fs.get("b");

  auto both = kj::joinPromises(kj::arr(a->kind(), b->kind()));
  auto kinds = f.wait(kj::mv(both));
  KJ_EXPECT(kinds[0] == Kind::FILE);
  KJ_EXPECT(kinds[1] == Kind::ABSENT);
}

KJ_TEST("async createDirectory") {
  AsyncFixture f;
  auto node = f.fs.get("x", "y");
  KJ_EXPECT(f.wait(node->createDirectory()) == node);
  KJ_EXPECT(f.wait(node->kind()) == Kind::FOLDER);

  f.ops.resetCallCounts();
  KJ_EXPECT(f.wait(node->create()) == node);
  KJ_EXPECT(f.ops.getCallCounts().mutations() == 0);

  auto child = f.wait(node->createDirectory("child"_kj));
  KJ_EXPECT(child == f.fs.get("x/y/child"));
  KJ_EXPECT(f.wait(child->kind()) == Kind::FOLDER);

  LFS_EXPECT_THROW(FAILED, "invalid path arguments", f.wait(node->createDirectory("a/b"_kj)));

  f.ops.addFile("f", "x"_kjb);
  LFS_EXPECT_THROW(FAILED, "structural conflict", f.wait(f.fs.get("f")->createDirectory()));
}

KJ_TEST("async writes") {
  AsyncFixture f;
  auto node = f.fs.get("new", "f.txt");

  auto data = kj::heapArray("abc"_kjb);
  auto write = node->writeBytes(data);
  data[0] = 'z';
  KJ_EXPECT(f.wait(kj::mv(write)));
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.ops.tryGetContent("new/f.txt")) == "abc"_kjb);
  KJ_EXPECT(f.wait(f.fs.get("new")->kind()) == Kind::FOLDER);

  LFS_EXPECT_THROW(FAILED, "structural conflict", f.wait(node->writeBytes("d"_kjb)));
  KJ_EXPECT(f.wait(node->writeBytes("def"_kjb, Overwrite::YES)));
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.wait(node->readText())) == "def");

  KJ_EXPECT(f.wait(node->appendBytes("gh"_kjb, MustExist::YES)));
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.wait(node->readText())) == "defgh");

  KJ_EXPECT(f.wait(node->overwrite("i"_kjb)));
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.wait(node->readText())) == "i");

  auto other = f.fs.get("other");
  LFS_EXPECT_THROW(FAILED, "structural conflict", f.wait(other->overwrite("x"_kjb)));
  LFS_EXPECT_THROW(
      FAILED, "structural conflict", f.wait(other->appendBytes("x"_kjb, MustExist::YES)));
}

KJ_TEST("async writes to folders apply the mode") {
  {
    AsyncFixture f;
    f.ops.addDirectory("dir");
    f.ops.resetCallCounts();
    KJ_EXPECT_LOG(WARNING, "ignoring write to a folder");
    KJ_EXPECT(!f.wait(f.fs.get("dir")->writeBytes("x"_kjb, Overwrite::YES)));
    KJ_EXPECT(f.ops.getCallCounts().mutations() == 0);
  }
  {
    AsyncFixture f(Mode::STRICT);
    f.ops.addDirectory("dir");
    LFS_EXPECT_THROW(
        FAILED, "structural conflict", f.wait(f.fs.get("dir")->appendBytes("x"_kjb)));
  }
}

KJ_TEST("async writes below a file further up are conflicts in every mode") {
  for (auto mode: {Mode::NORMAL, Mode::FORGIVING}) {
    AsyncFixture f(mode);
    f.ops.addFile("f", "x"_kjb);
    LFS_EXPECT_THROW(
        FAILED, "structural conflict", f.wait(f.fs.get("f", "x", "y")->writeBytes("y"_kjb)));
    LFS_EXPECT_THROW(
        FAILED, "structural conflict", f.wait(f.fs.get("f", "x")->createDirectory()));
    KJ_EXPECT(f.ops.getCallCounts().writeFile == 0);
  }
}

KJ_TEST("async failed folder creation applies the mode") {
  {
    AsyncFixture f;
    f.ops.injectFailure("d", EACCES, 2);
    LFS_EXPECT_THROW(
        FAILED, "filesystem operation failed", f.wait(f.fs.get("d")->createDirectory()));
  }
  {
    AsyncFixture f(Mode::FORGIVING);
    f.ops.injectFailure("p", EACCES, 3);
    KJ_EXPECT_LOG(WARNING, "failed to create folder");
    KJ_EXPECT(!f.wait(f.fs.get("p", "f")->writeBytes("x"_kjb)));
    KJ_EXPECT(f.ops.getCallCounts().writeFile == 0);
  }
}

KJ_TEST("async reads apply the mode") {
  {
    AsyncFixture f;
    f.ops.addFile("locked", "x"_kjb);
    auto node = f.fs.get("locked");
    KJ_EXPECT(f.wait(node->kind()) == Kind::FILE);
    f.ops.injectFailure("locked", EACCES);
    KJ_EXPECT(f.wait(node->readBytes()) == kj::none);
    KJ_EXPECT(KJ_ASSERT_NONNULL(f.wait(node->readText())) == "x");
    KJ_EXPECT(f.wait(f.fs.get(".")->readBytes()) == kj::none);
  }
  {
    // Only one event loop may exist per thread, so the strict fixture gets its own scope.
    AsyncFixture f(Mode::STRICT);
    f.ops.addFile("locked", "x"_kjb);
    auto node = f.fs.get("locked");
    KJ_EXPECT(f.wait(node->kind()) == Kind::FILE);
    f.ops.injectFailure("locked", EACCES);
    LFS_EXPECT_THROW(FAILED, "filesystem operation failed", f.wait(node->readBytes()));
    LFS_EXPECT_THROW(FAILED, "structural conflict", f.wait(f.fs.get(".")->readBytes()));
  }
}

KJ_TEST("async listing, siblings and invalidation") {
  AsyncFixture f;
  f.ops.addFile("dir/b", "22"_kjb);
  f.ops.addFile("dir/a", "1"_kjb);
  f.ops.addDirectory("dir/sub");
  auto dir = f.fs.get("dir");

  KJ_EXPECT(joinPaths(f.wait(dir->listChildren())) == "./dir/a ./dir/b ./dir/sub");
  KJ_EXPECT(joinPaths(f.wait(dir->listFiles())) == "./dir/a ./dir/b");
  KJ_EXPECT(joinPaths(f.wait(dir->listFolders())) == "./dir/sub");

  auto big = f.wait(dir->listChildren([](AsyncNode& child) {
    return child.size().then([](kj::Maybe<uint64_t> size) {
      KJ_IF_SOME(s, size) {
        return s > 1;
      }
      return false;
    });
  }));
  KJ_EXPECT(joinPaths(big) == "./dir/b");

  KJ_EXPECT(joinPaths(f.wait(f.fs.get("dir/a")->siblings())) == "./dir/b ./dir/sub");

  KJ_EXPECT(f.wait(f.fs.get("dir/c")->writeBytes("3"_kjb)));
  KJ_EXPECT(joinPaths(f.wait(dir->listFiles())) == "./dir/a ./dir/b ./dir/c");

  KJ_EXPECT(f.wait(f.fs.get("dir/x/y/z")->writeBytes("4"_kjb)));
  KJ_EXPECT(joinPaths(f.wait(dir->listFolders())) == "./dir/sub ./dir/x");
}

KJ_TEST("async descend") {
  AsyncFixture f;
  f.ops.addFile("dir/file", "x"_kjb);
  auto dir = f.fs.get("dir");
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.wait(dir->descend("file"))) == f.fs.get("dir/file"));
  KJ_EXPECT(f.wait(f.fs.get("dir/file")->descend("x")) == kj::none);
  KJ_EXPECT(dir->nested("p/q") == f.fs.get("dir/p/q"));
}

KJ_TEST("async reset") {
  AsyncFixture f;
  auto old = f.fs.get("a");
  f.fs.reset();
  KJ_EXPECT(f.fs.cacheSize() == 0);
  KJ_EXPECT(f.fs.get("a") != old);
}

}  // namespace
}  // namespace lazyfs
