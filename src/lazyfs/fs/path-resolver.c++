// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "path-resolver.h"

#include <kj/debug.h>
#include <kj/encoding.h>
#include <kj/filesystem.h>
#include <kj/vector.h>

#include <cmath>

namespace lazyfs {
namespace {

constexpr kj::StringPtr PATH_KEYS[] = {
  "name"_kj,
  "path"_kj,
  "filePath"_kj,
  "filepath"_kj,
  "file_path"_kj,
  "fullPath"_kj,
  "fullpath"_kj,
  "full_path"_kj,
};

// Characters no segment may contain.
bool hasForbiddenChar(kj::StringPtr text) {
  for (char c: text) {
    switch (c) {
      case '"':
      case '<':
      case '>':
      case '*':
      case '\0':
        return true;
      default:
        break;
    }
  }
  return false;
}

// Integral doubles print without a fractional part, so 3.0 and 3 name the same segment.
kj::Maybe<int64_t> asIndex(double value) {
  if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 9007199254740992.0) {
    return static_cast<int64_t>(value);
  }
  return kj::none;
}

kj::Maybe<int64_t> numericValue(const PathArg& arg) {
  switch (arg.getType()) {
    case PathArg::Type::INTEGER:
      return arg.getInteger();
    case PathArg::Type::NUMBER:
      return asIndex(arg.getNumber());
    default:
      return kj::none;
  }
}

// A call shaped like (element, index, array) with array[index] == element comes from using a
// lookup as a per-element callback. Only the element names a path.
bool isElementCallback(kj::ArrayPtr<const PathArg> args) {
  if (args.size() != 3 || args[2].getType() != PathArg::Type::ARRAY) {
    return false;
  }
  if (args[1].getType() != PathArg::Type::INTEGER && args[1].getType() != PathArg::Type::NUMBER) {
    return false;
  }
  KJ_IF_SOME(index, numericValue(args[1])) {
    auto elements = args[2].getElements();
    return index >= 0 && static_cast<uint64_t>(index) < elements.size() &&
        elements[index] == args[0];
  }
  return false;
}

// kj::Path::eval() refuses to climb above its root, but path resolution stays at the root
// instead. Feeds `text` to eval() one segment at a time, dropping ".." segments at the root.
kj::Path evalClamped(kj::Path base, kj::StringPtr text) {
  if (text.startsWith("/")) {
    base = kj::Path(nullptr);
  }
  size_t start = 0;
  for (size_t i = 0; i <= text.size(); i++) {
    if (i < text.size() && text[i] != '/') continue;
    auto part = kj::str(text.slice(start, i));
    start = i + 1;
    if (part == ".." && base.size() == 0) continue;
    base = kj::mv(base).eval(part);
  }
  return base;
}

}  // namespace

// =======================================================================================
// PathArg

PathArg PathArg::record(kj::Array<Field> fields) {
  PathArg result(Type::RECORD);
  result.fields = kj::mv(fields);
  return result;
}

PathArg PathArg::pathRecord(kj::StringPtr path) {
  auto builder = kj::heapArrayBuilder<Field>(1);
  builder.add(Field{kj::str("path"), PathArg(path)});
  return record(builder.finish());
}

bool PathArg::getBoolean() const {
  KJ_REQUIRE(type == Type::BOOLEAN);
  return boolean;
}

int64_t PathArg::getInteger() const {
  KJ_REQUIRE(type == Type::INTEGER);
  return integer;
}

double PathArg::getNumber() const {
  KJ_REQUIRE(type == Type::NUMBER);
  return number;
}

kj::StringPtr PathArg::getString() const {
  KJ_REQUIRE(type == Type::STRING);
  return text;
}

kj::ArrayPtr<const PathArg> PathArg::getElements() const {
  KJ_REQUIRE(type == Type::ARRAY);
  return elements;
}

kj::ArrayPtr<const PathArg::Field> PathArg::getFields() const {
  KJ_REQUIRE(type == Type::RECORD);
  return fields;
}

kj::Maybe<kj::StringPtr> PathArg::findPathField() const {
  if (type != Type::RECORD) return kj::none;

  for (auto key: PATH_KEYS) {
    for (auto& field: fields) {
      if (field.key == key && field.value.type == Type::STRING && field.value.text.size() > 0) {
        return field.value.getString();
      }
    }
  }
  return kj::none;
}

PathArg PathArg::clone() const {
  PathArg result(type);
  result.boolean = boolean;
  result.integer = integer;
  result.number = number;
  if (type == Type::STRING) {
    result.text = kj::str(text);
  }
  result.elements = KJ_MAP(element, elements) { return element.clone(); };
  result.fields = KJ_MAP(field, fields) { return Field{kj::str(field.key), field.value.clone()}; };
  return result;
}

bool PathArg::operator==(const PathArg& other) const {
  if (type != other.type) {
    if ((type == Type::INTEGER && other.type == Type::NUMBER) ||
        (type == Type::NUMBER && other.type == Type::INTEGER)) {
      KJ_IF_SOME(left, numericValue(*this)) {
        KJ_IF_SOME(right, numericValue(other)) {
          return left == right;
        }
      }
      return false;
    }
    return false;
  }

  switch (type) {
    case Type::NULL_:
      return true;
    case Type::BOOLEAN:
      return boolean == other.boolean;
    case Type::INTEGER:
      return integer == other.integer;
    case Type::NUMBER:
      return number == other.number;
    case Type::STRING:
      return text == other.text;
    case Type::ARRAY:
      if (elements.size() != other.elements.size()) return false;
      for (auto i: kj::indices(elements)) {
        if (!(elements[i] == other.elements[i])) return false;
      }
      return true;
    case Type::RECORD:
      if (fields.size() != other.fields.size()) return false;
      for (auto i: kj::indices(fields)) {
        if (fields[i].key != other.fields[i].key) return false;
        if (!(fields[i].value == other.fields[i].value)) return false;
      }
      return true;
  }
  KJ_UNREACHABLE;
}

kj::String KJ_STRINGIFY(const PathArg& arg) {
  switch (arg.getType()) {
    case PathArg::Type::NULL_:
      return kj::str("null");
    case PathArg::Type::BOOLEAN:
      return kj::str(arg.getBoolean() ? "true" : "false");
    case PathArg::Type::INTEGER:
      return kj::str(arg.getInteger());
    case PathArg::Type::NUMBER: {
      double value = arg.getNumber();
      KJ_IF_SOME(index, asIndex(value)) {
        return kj::str(index);
      }
      if (std::isnan(value)) return kj::str("NaN");
      if (std::isinf(value)) return kj::str(value < 0 ? "-Infinity" : "Infinity");
      return kj::str(value);
    }
    case PathArg::Type::STRING:
      return kj::str('"', kj::encodeCEscape(arg.getString()), '"');
    case PathArg::Type::ARRAY:
      return kj::str("[", kj::strArray(arg.getElements(), ", "), "]");
    case PathArg::Type::RECORD: {
      auto fields = KJ_MAP(field, arg.getFields()) {
        return kj::str('"', kj::encodeCEscape(field.key), "\": ", field.value);
      };
      return kj::str("{", kj::strArray(fields, ", "), "}");
    }
  }
  KJ_UNREACHABLE;
}

kj::String KJ_STRINGIFY(const Problem& problem) {
  return kj::str("#", problem.index, " ", problem.value);
}

// =======================================================================================
// Path text

kj::String normalizeSeparators(kj::StringPtr path) {
  kj::Vector<char> result(path.size() + 1);
  for (char c: path) {
    if (c == '?') continue;
    if (c == '\\') c = '/';
    if (c == '/' && result.size() > 0 && result.back() == '/') continue;
    result.add(c);
  }
  if (result.size() > 1 && result.back() == '/') {
    result.removeLast();
  }
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

kj::String resolvePath(kj::StringPtr base, kj::StringPtr path) {
  auto result = evalClamped(kj::Path(nullptr), base);
  return evalClamped(kj::mv(result), path).toString(true);
}

kj::String relativize(kj::StringPtr path, kj::StringPtr cwd) {
  if (cwd == "/") {
    return kj::str(path);
  }
  auto target = kj::Path(nullptr).eval(path);
  auto base = kj::Path(nullptr).eval(cwd);
  if (!target.startsWith(base)) {
    return kj::str(path);
  }
  auto rest = target.slice(base.size(), target.size());
  if (rest.size() == 0) {
    return kj::str(".");
  }
  return kj::str("./", rest.toString());
}

// =======================================================================================
// PathResolver

PathResolver::PathResolver(Config config, CurrentDirectory currentDirectory)
    : config(config),
      getCwd(kj::mv(currentDirectory)) {}

kj::String PathResolver::currentDirectory() {
  auto result = getCwd();
  KJ_SWITCH_ONEOF(result) {
    KJ_CASE_ONEOF(failure, FsFailure) {
      throwFailure(failure);
    }
    KJ_CASE_ONEOF(cwd, kj::String) {
      return resolvePath("/", normalizeSeparators(cwd));
    }
  }
  KJ_UNREACHABLE;
}

ResolvedPath PathResolver::resolve(kj::ArrayPtr<const PathArg> args) {
  // Arrays are flattened by appending their elements to the end of the work list, not in place.
  kj::Vector<const PathArg*> work;
  if (isElementCallback(args)) {
    work.add(&args[0]);
  } else {
    for (auto& arg: args) {
      work.add(&arg);
    }
  }

  kj::Vector<kj::String> parts;
  kj::Vector<Problem> problems;
  auto reject = [&](size_t index, const PathArg& arg) {
    problems.add(Problem{index, kj::str(arg)});
  };

  for (size_t i = 0; i < work.size(); i++) {
    const PathArg& arg = *work[i];
    switch (arg.getType()) {
      case PathArg::Type::NULL_:
        break;
      case PathArg::Type::BOOLEAN:
        reject(i, arg);
        break;
      case PathArg::Type::INTEGER:
        parts.add(kj::str(arg.getInteger()));
        break;
      case PathArg::Type::NUMBER:
        if (std::isfinite(arg.getNumber())) {
          parts.add(kj::str(arg));
        } else {
          reject(i, arg);
        }
        break;
      case PathArg::Type::STRING: {
        auto text = arg.getString();
        if (parts.size() == 0 && text.size() == 0) {
          parts.add(kj::str("."));
        } else if (hasForbiddenChar(text)) {
          reject(i, arg);
        } else {
          parts.add(kj::str(text));
        }
        break;
      }
      case PathArg::Type::ARRAY:
        for (auto& element: arg.getElements()) {
          work.add(&element);
        }
        break;
      case PathArg::Type::RECORD:
        KJ_IF_SOME(text, arg.findPathField()) {
          if (hasForbiddenChar(text)) {
            reject(i, arg);
          } else {
            parts.add(kj::str(text));
          }
        } else {
          reject(i, arg);
        }
        break;
    }
  }

  return ResolvedPath{
    .path = canonicalize(kj::strArray(parts, "/")),
    .problems = problems.releaseAsArray(),
  };
}

kj::String PathResolver::resolveChecked(kj::ArrayPtr<const PathArg> args) {
  auto resolved = resolve(args);
  if (resolved.problems.size() > 0) {
    auto list = kj::strArray(resolved.problems, ", ");
    if (config.isForgiving()) {
      KJ_LOG(WARNING, "invalid path arguments", list, resolved.path);
    } else {
      KJ_FAIL_REQUIRE("invalid path arguments", list);
    }
  }
  return kj::mv(resolved.path);
}

kj::String PathResolver::canonicalize(kj::StringPtr path) {
  auto cwd = currentDirectory();
  return relativize(resolvePath(cwd, normalizeSeparators(path)), cwd);
}

kj::String PathResolver::absolute(kj::StringPtr path) {
  return resolvePath(currentDirectory(), normalizeSeparators(path));
}

}  // namespace lazyfs
