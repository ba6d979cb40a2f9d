// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "node.h"

#include <lazyfs/fs/lazyfs.h>
#include <lazyfs/fs/memory-fs-ops.h>
#include <lazyfs/fs/test-util.h>

#include <errno.h>

namespace lazyfs {
namespace {

struct Fixture {
  explicit Fixture(Mode mode = Mode::NORMAL)
      : fs(Config{.mode = mode}, ops, delay, clock) {}

  MemoryFsOps ops;
  RecordingDelay delay;
  ManualClock clock;
  LazyFs fs;
};

kj::Array<kj::String> paths(kj::ArrayPtr<const kj::Rc<Node>> nodes) {
  return KJ_MAP(node, nodes) { return kj::str(node->getPath()); };
}

// -----------------------------------------------------------------------------
// identity and naming

KJ_TEST("one node per canonical path") {
  Fixture f;
  auto a = f.fs.get("a");
  KJ_EXPECT(f.fs.get("./a").get() == a.get());
  KJ_EXPECT(f.fs.get("/work/a").get() == a.get());
  KJ_EXPECT(f.fs.get("b", "..", "a/").get() == a.get());
  KJ_EXPECT(f.fs.get(*a.get()).get() == a.get());
  KJ_EXPECT(f.fs.get("b").get() != a.get());
  KJ_EXPECT(f.fs.cacheSize() == 2);
}

KJ_TEST("node naming") {
  Fixture f;
  auto node = f.fs.get("docs", "Report.Final.TXT");
  KJ_EXPECT(node->getPath() == "./docs/Report.Final.TXT");
  KJ_EXPECT(node->toString() == "./docs/Report.Final.TXT");
  KJ_EXPECT(node->getName() == "Report.Final.TXT");
  KJ_EXPECT(node->getExtension() == "TXT");
  KJ_EXPECT(kj::strArray(node->getParts(), "|") == ".|docs|Report.Final.TXT");

  KJ_EXPECT(f.fs.get("docs")->getExtension() == "");
  KJ_EXPECT(f.fs.get("/etc/hosts")->getPath() == "/etc/hosts");
}

KJ_TEST("invalid arguments throw unless forgiving") {
  {
    Fixture f;
    LFS_EXPECT_THROW(FAILED, "invalid path arguments", f.fs.get("a", true));
    KJ_EXPECT(f.fs.cacheSize() == 0);
  }
  {
    Fixture f(Mode::FORGIVING);
    KJ_EXPECT_LOG(WARNING, "invalid path arguments");
    KJ_EXPECT(f.fs.get("a", true, "b")->getPath() == "./a/b");
  }
}

// -----------------------------------------------------------------------------
// queries and caching

KJ_TEST("kind and stat queries") {
  Fixture f;
  f.ops.addFile("a.txt", "abc"_kjb);
  f.ops.addDirectory("dir");

  auto file = f.fs.get("a.txt");
  KJ_EXPECT(file->kind() == Kind::FILE);
  KJ_EXPECT(file->exists());
  KJ_EXPECT(KJ_ASSERT_NONNULL(file->isFile()));
  KJ_EXPECT(!KJ_ASSERT_NONNULL(file->isFolder()));
  KJ_EXPECT(KJ_ASSERT_NONNULL(file->size()) == 3);

  auto dir = f.fs.get("dir");
  KJ_EXPECT(dir->kind() == Kind::FOLDER);
  KJ_EXPECT(KJ_ASSERT_NONNULL(dir->isFolder()));

  auto missing = f.fs.get("missing");
  KJ_EXPECT(missing->kind() == Kind::ABSENT);
  KJ_EXPECT(!missing->exists());
  KJ_EXPECT(missing->isFile() == kj::none);
  KJ_EXPECT(missing->isFolder() == kj::none);
  KJ_EXPECT(missing->size() == kj::none);
}

KJ_TEST("stat is cached until it ages out") {
  Fixture f;
  f.ops.addFile("a", "x"_kjb);
  auto node = f.fs.get("a");

  KJ_EXPECT(node->kind() == Kind::FILE);
  KJ_EXPECT(node->kind() == Kind::FILE);
  KJ_EXPECT(node->exists());
  KJ_EXPECT(f.ops.getCallCounts().stat == 1);

  f.clock.advance(99 * kj::MILLISECONDS);
  KJ_EXPECT(node->kind() == Kind::FILE);
  KJ_EXPECT(f.ops.getCallCounts().stat == 1);

  f.clock.advance(1 * kj::MILLISECONDS);
  KJ_EXPECT(node->kind() == Kind::FILE);
  KJ_EXPECT(f.ops.getCallCounts().stat == 2);
}

KJ_TEST("external changes show after invalidate or expiry") {
  Fixture f;
  f.ops.addFile("a", "x"_kjb);
  auto node = f.fs.get("a");
  KJ_EXPECT(node->kind() == Kind::FILE);

  f.ops.remove("a");
  KJ_EXPECT(node->kind() == Kind::FILE);
  node->invalidate();
  KJ_EXPECT(node->kind() == Kind::ABSENT);
}

KJ_TEST("missing entries are retried and never cached") {
  Fixture f;
  auto node = f.fs.get("ghost");
  KJ_EXPECT(node->kind() == Kind::ABSENT);
  KJ_EXPECT(node->kind() == Kind::ABSENT);

  // Not-found is transient, so each query costs two stats and one pause.
  KJ_EXPECT(f.ops.getCallCounts().stat == 4);
  KJ_EXPECT(f.delay.pauses.size() == 2);
}

KJ_TEST("a busy entry is retried once") {
  Fixture f;
  f.ops.addFile("a", "x"_kjb);
  f.ops.injectFailure("a", EBUSY);
  KJ_EXPECT(f.fs.get("a")->kind() == Kind::FILE);
  KJ_EXPECT(f.ops.getCallCounts().stat == 2);
  KJ_ASSERT(f.delay.pauses.size() == 1);
  KJ_EXPECT(f.delay.pauses[0] >= 100 * kj::MILLISECONDS);
  KJ_EXPECT(f.delay.pauses[0] < 200 * kj::MILLISECONDS);
}

KJ_TEST("permission failures are not retried") {
  Fixture f;
  f.ops.addFile("a", "x"_kjb);
  f.ops.injectFailure("a", EACCES);
  KJ_EXPECT(f.fs.get("a")->kind() == Kind::ABSENT);
  KJ_EXPECT(f.ops.getCallCounts().stat == 1);
  KJ_EXPECT(f.delay.pauses.size() == 0);
}

// -----------------------------------------------------------------------------
// navigation

KJ_TEST("parent") {
  Fixture f;
  auto deep = f.fs.get("a", "b", "c");
  KJ_EXPECT(deep->parent().get() == f.fs.get("a", "b").get());
  KJ_EXPECT(f.fs.get("a")->parent().get() == f.fs.get(".").get());
  KJ_EXPECT(f.fs.get(".")->parent()->getPath() == "/");
  KJ_EXPECT(f.fs.get("/etc")->parent()->getPath() == "/");
  LFS_EXPECT_THROW(FAILED, "unsupported parent", f.fs.get("/")->parent());
}

KJ_TEST("nested and descend") {
  Fixture f;
  f.ops.addFile("dir/file", "x"_kjb);
  auto dir = f.fs.get("dir");

  KJ_EXPECT(dir->nested("x/y").get() == f.fs.get("dir", "x", "y").get());
  KJ_EXPECT(KJ_ASSERT_NONNULL(dir->descend("file")).get() == f.fs.get("dir/file").get());
  KJ_EXPECT(f.fs.get("dir/file")->descend("inner") == kj::none);
  KJ_EXPECT(f.fs.get("nothing")->descend("inner") != kj::none);

  Fixture strict(Mode::STRICT);
  strict.ops.addFile("file", "x"_kjb);
  LFS_EXPECT_THROW(FAILED, "structural conflict", strict.fs.get("file")->descend("inner"));
}

KJ_TEST("listing children") {
  Fixture f;
  f.ops.addFile("dir/b.txt", "1"_kjb);
  f.ops.addFile("dir/a.txt", "22"_kjb);
  f.ops.addDirectory("dir/sub");
  auto dir = f.fs.get("dir");

  auto children = dir->listChildren();
  KJ_EXPECT(kj::strArray(paths(children), " ") == "./dir/a.txt ./dir/b.txt ./dir/sub");
  KJ_EXPECT(children[0].get() == f.fs.get("dir/a.txt").get());

  KJ_EXPECT(kj::strArray(paths(dir->listFiles()), " ") == "./dir/a.txt ./dir/b.txt");
  KJ_EXPECT(kj::strArray(paths(dir->listFolders()), " ") == "./dir/sub");

  auto big = dir->listChildren([](Node& child) {
    KJ_IF_SOME(size, child.size()) {
      return size > 1;
    }
    return false;
  });
  KJ_EXPECT(kj::strArray(paths(big), " ") == "./dir/a.txt");

  KJ_EXPECT(f.fs.get("dir/a.txt")->listChildren().size() == 0);
  KJ_EXPECT(f.fs.get("nope")->listChildren().size() == 0);
}

KJ_TEST("listing is cached like stat") {
  Fixture f;
  f.ops.addFile("dir/a", "1"_kjb);
  auto dir = f.fs.get("dir");
  KJ_EXPECT(dir->listChildren().size() == 1);

  f.ops.addFile("dir/b", "2"_kjb);
  KJ_EXPECT(dir->listChildren().size() == 1);
  KJ_EXPECT(f.ops.getCallCounts().listDirectory == 1);

  f.clock.advance(100 * kj::MILLISECONDS);
  KJ_EXPECT(dir->listChildren().size() == 2);
  KJ_EXPECT(f.ops.getCallCounts().listDirectory == 2);
}

KJ_TEST("siblings") {
  Fixture f;
  f.ops.addFile("dir/a", "1"_kjb);
  f.ops.addFile("dir/b", "2"_kjb);
  f.ops.addDirectory("dir/c");

  auto b = f.fs.get("dir/b");
  auto siblings = b->siblings();
  KJ_ASSERT(siblings.size() == 2);
  KJ_EXPECT(siblings[0].get() == f.fs.get("dir/a").get());
  KJ_EXPECT(siblings[1].get() == f.fs.get("dir/c").get());

  // An absent node is simply not among them.
  KJ_EXPECT(f.fs.get("dir/zzz")->siblings().size() == 3);
}

KJ_TEST("a node missing from a stale parent listing is reported") {
  {
    Fixture f;
    f.ops.addFile("dir/a", "1"_kjb);
    KJ_EXPECT(f.fs.get("dir")->listChildren().size() == 1);
    f.ops.addFile("dir/late", "2"_kjb);

    KJ_EXPECT_LOG(WARNING, "node not found among its parent's children");
    auto siblings = f.fs.get("dir/late")->siblings();
    KJ_EXPECT(siblings.size() == 1);
  }
  {
    Fixture f(Mode::STRICT);
    f.ops.addFile("dir/a", "1"_kjb);
    KJ_EXPECT(f.fs.get("dir")->listChildren().size() == 1);
    f.ops.addFile("dir/late", "2"_kjb);
    LFS_EXPECT_THROW(FAILED, "node not found among its parent's children",
        f.fs.get("dir/late")->siblings());
  }
}

// -----------------------------------------------------------------------------
// reading

KJ_TEST("reading files") {
  Fixture f;
  f.ops.addFile("a.txt", "hello"_kjb);
  auto node = f.fs.get("a.txt");

  auto read = node->readBytes();
  auto& bytes = KJ_ASSERT_NONNULL(read);
  KJ_EXPECT(bytes.asPtr() == "hello"_kjb);
  KJ_EXPECT(KJ_ASSERT_NONNULL(node->readText()) == "hello");
  KJ_EXPECT(f.ops.getCallCounts().readFile == 1);

  // Callers get copies; mutating one doesn't touch the cache.
  bytes[0] = 'j';
  KJ_EXPECT(KJ_ASSERT_NONNULL(node->readText()) == "hello");

  KJ_EXPECT(f.fs.get(".")->readBytes() == kj::none);
  KJ_EXPECT(f.fs.get("missing")->readText() == kj::none);
}

KJ_TEST("reading applies the mode") {
  Fixture strict(Mode::STRICT);
  LFS_EXPECT_THROW(FAILED, "structural conflict", strict.fs.get(".")->readBytes());
  LFS_EXPECT_THROW(FAILED, "structural conflict", strict.fs.get("missing")->readBytes());

  strict.ops.addFile("locked", "x"_kjb);
  auto locked = strict.fs.get("locked");
  KJ_EXPECT(locked->kind() == Kind::FILE);
  strict.ops.injectFailure("locked", EACCES);
  LFS_EXPECT_THROW(FAILED, "filesystem operation failed", locked->readBytes());

  Fixture normal;
  normal.ops.addFile("locked", "x"_kjb);
  auto other = normal.fs.get("locked");
  KJ_EXPECT(other->kind() == Kind::FILE);
  normal.ops.injectFailure("locked", EACCES);
  KJ_EXPECT(other->readBytes() == kj::none);
  // The failure isn't cached.
  KJ_EXPECT(KJ_ASSERT_NONNULL(other->readText()) == "x");
}

KJ_TEST("listing failures apply the mode") {
  Fixture strict(Mode::STRICT);
  strict.ops.addDirectory("dir");
  auto dir = strict.fs.get("dir");
  KJ_EXPECT(dir->kind() == Kind::FOLDER);
  strict.ops.injectFailure("dir", EACCES);
  LFS_EXPECT_THROW(FAILED, "filesystem operation failed", dir->listChildren());
  LFS_EXPECT_THROW(FAILED, "structural conflict", strict.fs.get("missing")->listChildren());

  Fixture normal;
  normal.ops.addFile("dir/a", "1"_kjb);
  auto other = normal.fs.get("dir");
  KJ_EXPECT(other->kind() == Kind::FOLDER);
  normal.ops.injectFailure("dir", EACCES);
  KJ_EXPECT(other->listChildren().size() == 0);
  KJ_EXPECT(other->listChildren().size() == 1);
}

// -----------------------------------------------------------------------------
// mutations

KJ_TEST("createDirectory") {
  Fixture f;
  auto node = f.fs.get("x", "y");
  auto created = node->createDirectory();
  KJ_EXPECT(created.get() == node.get());
  KJ_EXPECT(node->kind() == Kind::FOLDER);
  KJ_EXPECT(f.fs.get("x")->kind() == Kind::FOLDER);

  f.ops.resetCallCounts();
  node->createDirectory();
  node->create();
  KJ_EXPECT(f.ops.getCallCounts().mutations() == 0);

  auto child = node->createDirectory("child"_kj);
  KJ_EXPECT(child.get() == f.fs.get("x/y/child").get());
  KJ_EXPECT(child->kind() == Kind::FOLDER);
  KJ_EXPECT(node->createDirectory(""_kj).get() == node.get());

  LFS_EXPECT_THROW(FAILED, "invalid path arguments", node->createDirectory("a/b"_kj));
}

KJ_TEST("createDirectory conflicts with files") {
  Fixture f;
  f.ops.addFile("f", "x"_kjb);
  auto file = f.fs.get("f");
  LFS_EXPECT_THROW(FAILED, "structural conflict", file->createDirectory());
  LFS_EXPECT_THROW(FAILED, "structural conflict", file->createDirectory("sub"_kj));
  KJ_EXPECT(f.ops.getCallCounts().mutations() == 0);
}

KJ_TEST("writing a new file creates its folders") {
  Fixture f;
  auto node = f.fs.get("new", "deep", "f.txt");
  KJ_EXPECT(node->kind() == Kind::ABSENT);

  KJ_EXPECT(node->writeBytes("hi"_kjb));
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.ops.tryGetContent("new/deep/f.txt")) == "hi"_kjb);
  KJ_EXPECT(node->kind() == Kind::FILE);
  KJ_EXPECT(f.fs.get("new", "deep")->kind() == Kind::FOLDER);
}

KJ_TEST("overwriting requires consent") {
  Fixture f;
  f.ops.addFile("a", "old"_kjb);
  auto node = f.fs.get("a");
  KJ_EXPECT(KJ_ASSERT_NONNULL(node->readText()) == "old");

  LFS_EXPECT_THROW(FAILED, "structural conflict", node->writeBytes("new"_kjb));
  KJ_EXPECT(KJ_ASSERT_NONNULL(f.ops.tryGetContent("a")) == "old"_kjb);

  KJ_EXPECT(node->writeBytes("new"_kjb, Overwrite::YES));
  KJ_EXPECT(KJ_ASSERT_NONNULL(node->readText()) == "new");

  KJ_EXPECT(node->overwrite("newer"_kjb));
  KJ_EXPECT(KJ_ASSERT_NONNULL(node->readText()) == "newer");
  LFS_EXPECT_THROW(FAILED, "structural conflict", f.fs.get("b")->overwrite("x"_kjb));
}

KJ_TEST("appending") {
  Fixture f;
  auto log = f.fs.get("logs", "app.log");
  LFS_EXPECT_THROW(FAILED, "structural conflict", log->appendBytes("x"_kjb, MustExist::YES));

  KJ_EXPECT(log->appendBytes("one\n"_kjb));
  KJ_EXPECT(log->appendBytes("two\n"_kjb, MustExist::YES));
  KJ_EXPECT(KJ_ASSERT_NONNULL(log->readText()) == "one\ntwo\n");
  KJ_EXPECT(KJ_ASSERT_NONNULL(log->size()) == 8);
}

KJ_TEST("writes into a file's path are conflicts") {
  Fixture f;
  f.ops.addFile("f", "x"_kjb);
  LFS_EXPECT_THROW(FAILED, "structural conflict", f.fs.get("f", "inner")->writeBytes("y"_kjb));
}

KJ_TEST("a file further up the path is a conflict in every mode") {
  for (auto mode: {Mode::NORMAL, Mode::FORGIVING}) {
    Fixture f(mode);
    f.ops.addFile("f", "x"_kjb);
    LFS_EXPECT_THROW(FAILED, "structural conflict", f.fs.get("f", "x", "y")->writeBytes("y"_kjb));
    LFS_EXPECT_THROW(FAILED, "structural conflict", f.fs.get("f", "x")->createDirectory());
    LFS_EXPECT_THROW(
        FAILED, "structural conflict", f.fs.get("f", "x", "y")->appendBytes("y"_kjb));
    KJ_EXPECT(f.ops.getCallCounts().writeFile == 0);
    KJ_EXPECT(f.ops.getCallCounts().appendFile == 0);
    KJ_EXPECT(KJ_ASSERT_NONNULL(f.ops.tryGetContent("f")) == "x"_kjb);
  }
}

KJ_TEST("failed folder creation applies the mode") {
  {
    Fixture normal;
    // One failure for the stat, one for mkdir.
    normal.ops.injectFailure("d", EACCES, 2);
    LFS_EXPECT_THROW(FAILED, "filesystem operation failed", normal.fs.get("d")->createDirectory());
  }
  {
    Fixture forgiving(Mode::FORGIVING);
    forgiving.ops.injectFailure("d", EACCES, 2);
    auto node = forgiving.fs.get("d");
    {
      KJ_EXPECT_LOG(WARNING, "failed to create folder");
      KJ_EXPECT(node->createDirectory() == node);
    }
    KJ_EXPECT(node->kind() == Kind::ABSENT);
  }
  {
    Fixture forgiving(Mode::FORGIVING);
    // The parent is stat'ed by the write, again by createDirectory, then mkdir fails.
    forgiving.ops.injectFailure("p", EACCES, 3);
    KJ_EXPECT_LOG(WARNING, "failed to create folder");
    KJ_EXPECT(!forgiving.fs.get("p", "f")->writeBytes("x"_kjb));
    KJ_EXPECT(forgiving.ops.getCallCounts().writeFile == 0);
  }
}

KJ_TEST("writes to a folder apply the mode") {
  Fixture normal;
  normal.ops.addDirectory("dir");
  normal.ops.resetCallCounts();
  {
    KJ_EXPECT_LOG(WARNING, "ignoring write to a folder");
    KJ_EXPECT(!normal.fs.get("dir")->writeBytes("x"_kjb, Overwrite::YES));
  }
  {
    KJ_EXPECT_LOG(WARNING, "ignoring write to a folder");
    KJ_EXPECT(!normal.fs.get("dir")->appendBytes("x"_kjb));
  }
  KJ_EXPECT(normal.ops.getCallCounts().mutations() == 0);

  Fixture strict(Mode::STRICT);
  strict.ops.addDirectory("dir");
  LFS_EXPECT_THROW(FAILED, "structural conflict",
      strict.fs.get("dir")->writeBytes("x"_kjb, Overwrite::YES));
}

KJ_TEST("failed writes apply the mode") {
  Fixture normal;
  normal.ops.addDirectory("dir");
  auto node = normal.fs.get("dir", "f");
  // One failure for the stat that finds nothing there, one for the write.
  normal.ops.injectFailure("dir/f", ENOSPC, 2);
  KJ_EXPECT(!node->writeBytes("x"_kjb));
  KJ_EXPECT(normal.ops.tryGetContent("dir/f") == kj::none);

  Fixture strict(Mode::STRICT);
  strict.ops.addDirectory("dir");
  auto other = strict.fs.get("dir", "f");
  strict.ops.injectFailure("dir/f", ENOSPC, 2);
  LFS_EXPECT_THROW(FAILED, "filesystem operation failed", other->writeBytes("x"_kjb));
}

KJ_TEST("mutations invalidate the node and its parent") {
  Fixture f;
  f.ops.addFile("dir/a", "1"_kjb);
  auto dir = f.fs.get("dir");
  KJ_EXPECT(dir->listChildren().size() == 1);

  auto b = f.fs.get("dir/b");
  KJ_EXPECT(b->kind() == Kind::ABSENT);
  KJ_EXPECT(b->writeBytes("2"_kjb));

  // No clock movement needed.
  KJ_EXPECT(b->kind() == Kind::FILE);
  KJ_EXPECT(dir->listChildren().size() == 2);

  auto sub = dir->createDirectory("sub"_kj);
  KJ_EXPECT(dir->listFolders().size() == 1);
  KJ_EXPECT(sub->listChildren().size() == 0);
}

KJ_TEST("a recursive create invalidates every folder it brought into existence") {
  Fixture f;
  f.ops.addDirectory("a");
  auto top = f.fs.get(".");
  auto a = f.fs.get("a");
  KJ_EXPECT(kj::strArray(paths(top->listChildren()), " ") == "./a");
  KJ_EXPECT(a->listChildren().size() == 0);

  KJ_EXPECT(f.fs.get("a", "b", "c", "f.txt")->writeBytes("x"_kjb));
  KJ_EXPECT(kj::strArray(paths(a->listChildren()), " ") == "./a/b");
  KJ_EXPECT(kj::strArray(paths(f.fs.get("a/b")->listChildren()), " ") == "./a/b/c");

  // "a" already existed, so nothing above it changed.
  f.ops.resetCallCounts();
  KJ_EXPECT(top->listChildren().size() == 1);
  KJ_EXPECT(f.ops.getCallCounts().listDirectory == 0);
}

// -----------------------------------------------------------------------------
// reset

KJ_TEST("reset drops every cached node") {
  Fixture f;
  f.ops.addFile("a", "x"_kjb);
  auto old = f.fs.get("a");
  KJ_EXPECT(old->kind() == Kind::FILE);
  KJ_EXPECT(f.fs.cacheSize() == 1);

  f.fs.reset();
  KJ_EXPECT(f.fs.cacheSize() == 0);
  auto fresh = f.fs.get("a");
  KJ_EXPECT(fresh.get() != old.get());

  // The old node still works.
  KJ_EXPECT(KJ_ASSERT_NONNULL(old->readText()) == "x");
}

}  // namespace
}  // namespace lazyfs
