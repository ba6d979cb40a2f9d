// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <lazyfs/config.h>
#include <lazyfs/fs/fs-error.h>

#include <kj/array.h>
#include <kj/function.h>
#include <kj/one-of.h>
#include <kj/string.h>

#include <type_traits>

namespace lazyfs {

// One argument to a path lookup.
//
// Lookups accept a loose mix of values, so that `fs.get("logs", 2025, "app.log")`,
// `fs.get(someNode, "child")` and `fs.get(listOfSegments)` all work. A PathArg is one of:
//
// * null (nullptr or kj::none), which is skipped;
// * a boolean, which is never a valid segment;
// * an integer or a floating-point number, stringified;
// * a string;
// * an array of further arguments, flattened into the argument list;
// * a record of string keys to values. A record contributes the first of `name`, `path`,
//   `filePath`, `filepath`, `file_path`, `fullPath`, `fullpath`, `full_path` holding a non-empty
//   string. Any object with a `getPath()` method converts to the record {path: getPath()}.
class PathArg {
 public:
  enum class Type {
    NULL_,
    BOOLEAN,
    INTEGER,
    NUMBER,
    STRING,
    ARRAY,
    RECORD,
  };

  struct Field;

  PathArg(decltype(nullptr)): type(Type::NULL_) {}
  PathArg(kj::None): type(Type::NULL_) {}
  PathArg(bool value): type(Type::BOOLEAN), boolean(value) {}
  PathArg(double value): type(Type::NUMBER), number(value) {}
  PathArg(const char* value): type(Type::STRING), text(kj::str(value)) {}
  PathArg(kj::StringPtr value): type(Type::STRING), text(kj::str(value)) {}
  PathArg(kj::String&& value): type(Type::STRING), text(kj::mv(value)) {}
  PathArg(const kj::String& value): type(Type::STRING), text(kj::str(value)) {}
  PathArg(kj::Array<PathArg>&& elements): type(Type::ARRAY), elements(kj::mv(elements)) {}

  template <typename T,
      typename = kj::EnableIf<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
  PathArg(T value): type(Type::INTEGER),
                    integer(static_cast<int64_t>(value)) {}

  template <typename T, typename = decltype(kj::instance<const T&>().getPath())>
  PathArg(const T& object): PathArg(pathRecord(object.getPath())) {}

  PathArg(PathArg&&) = default;
  PathArg& operator=(PathArg&&) = default;

  static PathArg record(kj::Array<Field> fields);

  // An array argument built from heterogeneous values: `PathArg::list("a", 1, nullptr)`.
  template <typename... Params>
  static PathArg list(Params&&... params);

  Type getType() const {
    return type;
  }
  bool getBoolean() const;
  int64_t getInteger() const;
  double getNumber() const;
  kj::StringPtr getString() const;
  kj::ArrayPtr<const PathArg> getElements() const;
  kj::ArrayPtr<const Field> getFields() const;

  // The first recognized path key of a record holding a non-empty string.
  kj::Maybe<kj::StringPtr> findPathField() const;

  PathArg clone() const;

  // Structural equality. Numbers compare by value regardless of representation.
  bool operator==(const PathArg& other) const;

 private:
  explicit PathArg(Type type): type(type) {}

  static PathArg pathRecord(kj::StringPtr path);

  Type type;
  bool boolean = false;
  int64_t integer = 0;
  double number = 0;
  kj::String text;
  kj::Array<PathArg> elements;
  kj::Array<Field> fields;
};

struct PathArg::Field {
  kj::String key;
  PathArg value;
};

// JSON-like rendering, used when reporting problems.
kj::String KJ_STRINGIFY(const PathArg& arg);

template <typename... Params>
PathArg PathArg::list(Params&&... params) {
  auto builder = kj::heapArrayBuilder<PathArg>(sizeof...(params));
  (builder.add(kj::fwd<Params>(params)), ...);
  return PathArg(builder.finish());
}

template <typename... Params>
kj::Array<PathArg> pathArgs(Params&&... params) {
  auto builder = kj::heapArrayBuilder<PathArg>(sizeof...(params));
  (builder.add(kj::fwd<Params>(params)), ...);
  return builder.finish();
}

// An argument that could not be turned into a path segment. `index` counts positions in the
// flattened argument list: array elements are numbered after all top-level arguments.
struct Problem {
  size_t index;
  kj::String value;
};

kj::String KJ_STRINGIFY(const Problem& problem);

struct ResolvedPath {
  kj::String path;
  kj::Array<Problem> problems;
};

// Slash-separated text cleanup: backslashes become slashes, `?` is dropped, runs of slashes
// collapse, and a trailing slash is removed unless the whole path is "/".
kj::String normalizeSeparators(kj::StringPtr path);

// Resolves `path` against the absolute directory `base`, eliminating "." and ".." segments.
// ".." at the root stays at the root. Returns an absolute path without a trailing slash.
kj::String resolvePath(kj::StringPtr base, kj::StringPtr path);

// Expresses the absolute path `path` relative to the absolute directory `cwd`: "." for `cwd`
// itself, "./rest" for a descendant, and `path` unchanged otherwise. When `cwd` is "/" paths stay
// absolute.
kj::String relativize(kj::StringPtr path, kj::StringPtr cwd);

// Turns call arguments into canonical paths.
//
// A canonical path is "." or "./a/b" for entries at or under the working directory and an
// absolute "/a/b" for everything else. It never contains ".", ".." (other than the leading "."),
// empty segments, backslashes or a trailing slash, so canonicalizing it again is a no-op.
//
// The working directory is read from `currentDirectory` on every resolution.
class PathResolver {
 public:
  using CurrentDirectory = kj::Function<kj::OneOf<FsFailure, kj::String>()>;

  PathResolver(Config config, CurrentDirectory currentDirectory);

  // Never throws for unusable arguments; they are reported in `problems`. Throws only if the
  // working directory can't be determined.
  ResolvedPath resolve(kj::ArrayPtr<const PathArg> args);

  // resolve(), then applies the configured mode to any problems: strict and normal mode throw
  // "invalid path arguments", forgiving mode logs a warning and returns the path built from the
  // usable arguments.
  kj::String resolveChecked(kj::ArrayPtr<const PathArg> args);

  // Canonical form of a single path string.
  kj::String canonicalize(kj::StringPtr path);

  // Absolute form of a canonical path.
  kj::String absolute(kj::StringPtr path);

  // Normalized absolute working directory.
  kj::String currentDirectory();

  const Config& getConfig() const {
    return config;
  }

 private:
  Config config;
  CurrentDirectory getCwd;
};

}  // namespace lazyfs
