// Copyright (c) 2025 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/string.h>

namespace lazyfs {

// LFS_STRONG_BOOL(Flag) declares an option type spelled `Flag::YES` or `Flag::NO` at call sites,
// e.g. `node.writeBytes(data, Overwrite::YES)`. It has no default constructor and doesn't convert
// to or from `bool` implicitly; test it with `if (flag)`.
#define LFS_STRONG_BOOL(Type)                                                                      \
  class Type final {                                                                               \
    enum class Value : bool { NO_ = false, YES_ = true };                                          \
                                                                                                   \
   public:                                                                                         \
    static constexpr Value NO = Value::NO_;                                                        \
    static constexpr Value YES = Value::YES_;                                                      \
    constexpr Type(Value value): set(value == Value::YES_) {}                                      \
    constexpr explicit operator bool() const {                                                     \
      return set;                                                                                  \
    }                                                                                              \
    constexpr bool operator==(const Type& other) const = default;                                  \
    friend kj::StringPtr KJ_STRINGIFY(const Type& flag) {                                          \
      return flag.set ? #Type "::YES"_kj : #Type "::NO"_kj;                                        \
    }                                                                                              \
                                                                                                   \
   private:                                                                                        \
    bool set;                                                                                      \
  }

}  // namespace lazyfs
