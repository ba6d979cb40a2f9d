// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "memory-fs-ops.h"

#include <kj/test.h>

#include <errno.h>

namespace lazyfs {
namespace {

template <typename T>
FsError failureCode(kj::OneOf<FsFailure, T>& result) {
  return KJ_ASSERT_NONNULL(result.template tryGet<FsFailure>()).code;
}

KJ_TEST("MemoryFsOps starts with the working directory") {
  MemoryFsOps ops;
  KJ_EXPECT(ops.currentDirectory().get<kj::String>() == "/work");

  auto root = ops.stat("/");
  KJ_EXPECT(root.get<Stat>().type == FsType::DIRECTORY);
  auto cwd = ops.stat(".");
  KJ_EXPECT(cwd.get<Stat>().type == FsType::DIRECTORY);

  auto missing = ops.stat("./nope");
  KJ_EXPECT(failureCode(missing) == FsError::NOT_FOUND);
}

KJ_TEST("MemoryFsOps reads and writes files") {
  MemoryFsOps ops;
  ops.addFile("notes/a.txt", "hello"_kjb);
  KJ_EXPECT(ops.stat("./notes").get<Stat>().type == FsType::DIRECTORY);
  KJ_EXPECT(ops.stat("./notes/a.txt").get<Stat>().size == 5);

  KJ_EXPECT(ops.appendFile("./notes/a.txt", " world"_kjb).get<size_t>() == 6);
  auto read = ops.readFile("/work/notes/a.txt");
  KJ_EXPECT(read.get<kj::Array<kj::byte>>().asPtr() == "hello world"_kjb);

  KJ_EXPECT(ops.writeFile("./notes/a.txt", "bye"_kjb).get<size_t>() == 3);
  KJ_EXPECT(KJ_ASSERT_NONNULL(ops.tryGetContent("./notes/a.txt")) == "bye"_kjb);

  auto orphan = ops.writeFile("./nowhere/b.txt", "x"_kjb);
  KJ_EXPECT(failureCode(orphan) == FsError::NOT_FOUND);
  auto intoFile = ops.writeFile("./notes/a.txt/c", "x"_kjb);
  KJ_EXPECT(failureCode(intoFile) == FsError::NOT_DIRECTORY);
  auto overDir = ops.writeFile("./notes", "x"_kjb);
  KJ_EXPECT(failureCode(overDir) == FsError::IS_DIRECTORY);
}

KJ_TEST("MemoryFsOps lists directories in name order") {
  MemoryFsOps ops;
  ops.addFile("d/b", "1"_kjb);
  ops.addFile("d/a", "2"_kjb);
  ops.addDirectory("d/c/deeper");

  auto names = ops.listDirectory("./d");
  auto& list = names.get<kj::Array<kj::String>>();
  KJ_ASSERT(list.size() == 3);
  KJ_EXPECT(list[0] == "a");
  KJ_EXPECT(list[1] == "b");
  KJ_EXPECT(list[2] == "c");

  auto notDir = ops.listDirectory("./d/a");
  KJ_EXPECT(failureCode(notDir) == FsError::NOT_DIRECTORY);
}

KJ_TEST("MemoryFsOps makeDirectory") {
  MemoryFsOps ops;
  KJ_EXPECT(ops.makeDirectory("./x/y/z", Recursive::YES).get<bool>());
  KJ_EXPECT(ops.stat("./x/y").get<Stat>().type == FsType::DIRECTORY);
  KJ_EXPECT(!ops.makeDirectory("./x/y/z", Recursive::YES).get<bool>());

  auto exists = ops.makeDirectory("./x", Recursive::NO);
  KJ_EXPECT(failureCode(exists) == FsError::ALREADY_EXISTS);
  auto orphan = ops.makeDirectory("./p/q", Recursive::NO);
  KJ_EXPECT(failureCode(orphan) == FsError::NOT_FOUND);

  ops.addFile("f", "data"_kjb);
  auto throughFile = ops.makeDirectory("./f/g", Recursive::YES);
  KJ_EXPECT(failureCode(throughFile) == FsError::NOT_DIRECTORY);
}

KJ_TEST("MemoryFsOps injected failures and call counts") {
  MemoryFsOps ops;
  ops.addFile("a", "x"_kjb);
  ops.resetCallCounts();
  ops.injectFailure("a", EBUSY, 2);

  auto first = ops.stat("./a");
  KJ_EXPECT(failureCode(first) == FsError::BUSY);
  auto second = ops.readFile("./a");
  KJ_EXPECT(failureCode(second) == FsError::BUSY);
  KJ_EXPECT(ops.stat("./a").is<Stat>());

  KJ_EXPECT(ops.writeFile("./b", "y"_kjb).is<size_t>());
  KJ_EXPECT(ops.makeDirectory("./c", Recursive::YES).is<bool>());
  auto& counts = ops.getCallCounts();
  KJ_EXPECT(counts.stat == 2);
  KJ_EXPECT(counts.readFile == 1);
  KJ_EXPECT(counts.mutations() == 2);

  ops.remove("./c");
  ops.remove("./a");
  KJ_EXPECT(ops.tryGetContent("./a") == kj::none);
  KJ_EXPECT(!ops.stat("./c").is<Stat>());
}

}  // namespace
}  // namespace lazyfs
