// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <kj/common.h>
#include <kj/one-of.h>
#include <kj/string.h>

namespace urlpat {

// Controls how a pattern is parsed and how its regular expression is generated.
// @see https://urlpattern.spec.whatwg.org/#options
struct CompileOptions {
  // Separates path segments. A segment wildcard matches anything except this character.
  kj::Maybe<char> delimiter;

  // When this character immediately precedes a placeholder it is absorbed as the
  // placeholder's prefix instead of being treated as fixed text.
  kj::Maybe<char> prefix;

  // Letters in fixed text, prefixes and suffixes are matched case-insensitively.
  bool ignoreCase = false;

  static const CompileOptions DEFAULT;
  static const CompileOptions HOSTNAME;
  static const CompileOptions PATHNAME;
};

struct ParseError {
  enum class Kind {
    UNEXPECTED_END,
    PARENTHESES_MISMATCH,
    MISSING_CLOSING_CURLY,
    DUPLICATE_NAME,
  };

  Kind kind;

  // Byte offset into the pattern where the error was detected.
  size_t index = 0;

  kj::String message;

  static ParseError unexpectedEnd(size_t index, kj::StringPtr detail);
  static ParseError parenthesesMismatch(size_t index);
  static ParseError missingClosingCurly(size_t index);
  static ParseError duplicateName(size_t index, kj::StringPtr name);
};

// If the value is T, the operation is successful. Otherwise the ParseError describes
// the first problem found; no partial result is produced.
template <typename T>
using Result = kj::OneOf<T, ParseError>;

kj::StringPtr KJ_STRINGIFY(ParseError::Kind kind);
kj::String KJ_STRINGIFY(const ParseError& error);

}  // namespace urlpat
