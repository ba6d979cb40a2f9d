// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "path-resolver.h"

#include <lazyfs/util/test.h>

#include <errno.h>

#include <cmath>

namespace lazyfs {
namespace {

PathResolver makeResolver(kj::StringPtr cwd, Mode mode = Mode::NORMAL) {
  return PathResolver(Config{.mode = mode},
      [cwd = kj::str(cwd)]() -> kj::OneOf<FsFailure, kj::String> { return kj::str(cwd); });
}

template <typename... Params>
kj::String resolveArgs(PathResolver& resolver, Params&&... params) {
  auto args = pathArgs(kj::fwd<Params>(params)...);
  auto resolved = resolver.resolve(args);
  KJ_EXPECT(resolved.problems.size() == 0, kj::strArray(resolved.problems, ", "));
  return kj::mv(resolved.path);
}

struct Located {
  kj::StringPtr getPath() const {
    return "./reports"_kj;
  }
};

KJ_TEST("separators are normalized") {
  KJ_EXPECT(normalizeSeparators("a\\b?c//d/") == "a/bc/d");
  KJ_EXPECT(normalizeSeparators("/") == "/");
  KJ_EXPECT(normalizeSeparators("//") == "/");
  KJ_EXPECT(normalizeSeparators("") == "");
}

KJ_TEST("resolvePath eliminates dot segments") {
  KJ_EXPECT(resolvePath("/work", "a/./b/../c") == "/work/a/c");
  KJ_EXPECT(resolvePath("/work", "/etc/hosts") == "/etc/hosts");
  KJ_EXPECT(resolvePath("/work", "../../..") == "/");
  KJ_EXPECT(resolvePath("/", "") == "/");
  KJ_EXPECT(resolvePath("/work", "..//../a") == "/a");
  KJ_EXPECT(resolvePath("/work", "/../x/../../y") == "/y");
}

KJ_TEST("relativize only shortens descendants of the working directory") {
  KJ_EXPECT(relativize("/work", "/work") == ".");
  KJ_EXPECT(relativize("/work/a/b", "/work") == "./a/b");
  KJ_EXPECT(relativize("/workshop", "/work") == "/workshop");
  KJ_EXPECT(relativize("/etc", "/work") == "/etc");
  KJ_EXPECT(relativize("/a", "/") == "/a");
  KJ_EXPECT(relativize("/work/a", "/work/a/b") == "/work/a");
}

KJ_TEST("segments are joined and canonicalized") {
  auto resolver = makeResolver("/work");
  KJ_EXPECT(resolveArgs(resolver, "a", "", "b//c/", "d\\e") == "./a/b/c/d/e");
  KJ_EXPECT(resolveArgs(resolver, "") == ".");
  KJ_EXPECT(resolveArgs(resolver, "", "x") == "./x");
  KJ_EXPECT(resolveArgs(resolver) == ".");
  KJ_EXPECT(resolveArgs(resolver, "/tmp", "x") == "/tmp/x");
  KJ_EXPECT(resolveArgs(resolver, "..") == "/");
  KJ_EXPECT(resolveArgs(resolver, "a", nullptr, kj::none, "b") == "./a/b");
}

KJ_TEST("numbers become segments") {
  auto resolver = makeResolver("/work");
  KJ_EXPECT(resolveArgs(resolver, "logs", 2025, 3.0, 1.5) == "./logs/2025/3/1.5");
  KJ_EXPECT(resolveArgs(resolver, "n", -4) == "./n/-4");
}

KJ_TEST("arrays are flattened after the top-level arguments") {
  auto resolver = makeResolver("/work");
  KJ_EXPECT(resolveArgs(resolver, PathArg::list("b", "c"), "a") == "./a/b/c");
  KJ_EXPECT(resolveArgs(resolver, PathArg::list("x", PathArg::list("y"))) == "./x/y");
}

KJ_TEST("records contribute their path field") {
  auto resolver = makeResolver("/work");

  auto fields = kj::heapArrayBuilder<PathArg::Field>(3);
  fields.add(PathArg::Field{kj::str("size"), PathArg(12)});
  fields.add(PathArg::Field{kj::str("name"), PathArg("")});
  fields.add(PathArg::Field{kj::str("file_path"), PathArg("data/in.csv")});
  KJ_EXPECT(resolveArgs(resolver, PathArg::record(fields.finish())) == "./data/in.csv");

  KJ_EXPECT(resolveArgs(resolver, Located(), "q1.txt") == "./reports/q1.txt");
}

KJ_TEST("per-element callback shape resolves like the element alone") {
  auto resolver = makeResolver("/work");
  KJ_EXPECT(resolveArgs(resolver, "b", 1, PathArg::list("a", "b")) == "./b");
  KJ_EXPECT(resolveArgs(resolver, "b", 1.0, PathArg::list("a", "b")) == "./b");

  // Not a callback when the element doesn't match.
  KJ_EXPECT(resolveArgs(resolver, "b", 0, PathArg::list("a", "b")) == "./b/0/a/b");
}

KJ_TEST("unusable arguments are reported with their flattened index") {
  auto resolver = makeResolver("/work");
  auto args = pathArgs("a", true, "b*c", std::nan(""), PathArg::list("ok", "<no>"));
  auto resolved = resolver.resolve(args);

  KJ_EXPECT(resolved.path == "./a/ok");
  KJ_ASSERT(resolved.problems.size() == 4);
  KJ_EXPECT(resolved.problems[0].index == 1);
  KJ_EXPECT(resolved.problems[0].value == "true");
  KJ_EXPECT(resolved.problems[1].index == 2);
  KJ_EXPECT(resolved.problems[1].value == "\"b*c\"");
  KJ_EXPECT(resolved.problems[2].index == 3);
  KJ_EXPECT(resolved.problems[2].value == "NaN");
  KJ_EXPECT(resolved.problems[3].index == 6);
  KJ_EXPECT(kj::str(resolved.problems[0]) == "#1 true");

  auto empty = kj::heapArrayBuilder<PathArg::Field>(1);
  empty.add(PathArg::Field{kj::str("title"), PathArg("x")});
  auto record = pathArgs(PathArg::record(empty.finish()));
  KJ_EXPECT(resolver.resolve(record).problems.size() == 1);
}

KJ_TEST("resolveChecked applies the mode") {
  auto args = pathArgs("a", false, "b");

  for (auto mode: {Mode::STRICT, Mode::NORMAL}) {
    auto resolver = makeResolver("/work", mode);
    LFS_EXPECT_THROW(FAILED, "invalid path arguments", resolver.resolveChecked(args), mode);
  }

  auto forgiving = makeResolver("/work", Mode::FORGIVING);
  KJ_EXPECT_LOG(WARNING, "invalid path arguments");
  KJ_EXPECT(forgiving.resolveChecked(args) == "./a/b");
}

KJ_TEST("canonical paths are fixed points") {
  auto resolver = makeResolver("/work");
  for (auto input: {"a/b/../c"_kj, "/work/x"_kj, "."_kj, "/"_kj, "..\\up"_kj, "/tmp//y/"_kj}) {
    auto once = resolver.canonicalize(input);
    KJ_EXPECT(resolver.canonicalize(once) == once, input, once);
  }
  KJ_EXPECT(resolver.canonicalize("/work/x") == "./x");
  KJ_EXPECT(resolver.canonicalize("..\\up") == "/up");
  KJ_EXPECT(resolver.absolute("./x") == "/work/x");
  KJ_EXPECT(resolver.absolute(".") == "/work");
}

KJ_TEST("paths stay absolute when the working directory is the root") {
  auto resolver = makeResolver("/");
  KJ_EXPECT(resolver.canonicalize("a") == "/a");
  KJ_EXPECT(resolver.canonicalize(".") == "/");
}

KJ_TEST("a failing working directory lookup propagates") {
  PathResolver resolver(Config{}, []() -> kj::OneOf<FsFailure, kj::String> {
    return FsFailure::fromErrno(ENOENT, "getcwd", "");
  });
  LFS_EXPECT_THROW(FAILED, "filesystem operation failed", resolver.canonicalize("a"));
}

KJ_TEST("PathArg stringifies like JSON") {
  auto arg = PathArg::list("a\"b", 1, 2.5, nullptr, true);
  KJ_EXPECT(kj::str(arg) == "[\"a\\\"b\", 1, 2.5, null, true]", arg);
  KJ_EXPECT(kj::str(PathArg(Located())) == "{\"path\": \"./reports\"}");
}

KJ_TEST("PathArg equality is structural") {
  KJ_EXPECT(PathArg::list("a", 1) == PathArg::list("a", 1.0));
  KJ_EXPECT(!(PathArg::list("a", 1) == PathArg::list("a", 2)));
  KJ_EXPECT(!(PathArg("1") == PathArg(1)));
  auto original = PathArg::list("x", PathArg::list(3));
  KJ_EXPECT(original.clone() == original);
}

}  // namespace
}  // namespace lazyfs
