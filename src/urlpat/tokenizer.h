// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <urlpat/common.h>

#include <kj/array.h>
#include <kj/one-of.h>
#include <kj/string.h>

namespace urlpat {

// Pattern strings are parsed by first interpreting them into a list of Tokens. Each
// token has a type, a position index in the input string, and a value. The value is
// either an individual character or a substring of the input. Once the tokens are
// determined, parsePattern() converts them into a Part list.
//
// Tokens holding a substring point into the input, so the input must outlive them.
struct Token {
  // In STRICT mode, invalid sequences detected by the tokenizer are reported as a
  // ParseError. In LENIENT mode they are marked with INVALID_CHAR tokens and tokenizing
  // continues.
  enum class Policy {
    STRICT,
    LENIENT,
  };

  enum class Type {
    INVALID_CHAR,   // 0
    OPEN,           // 1
    CLOSE,          // 2
    REGEXP,         // 3
    NAME,           // 4
    CHAR,           // 5
    ESCAPED_CHAR,   // 6
    PLUS,           // 7
    QUESTION_MARK,  // 8
    ASTERISK,       // 9
    END,            // 10
  };

  Type type = Type::INVALID_CHAR;
  size_t index = 0;
  kj::OneOf<char, kj::ArrayPtr<const char>> value = (char)0;

  operator kj::String() const;

  bool operator==(char other) const;

  static Token asterisk(size_t index);
  static Token char_(size_t index, char codepoint);
  static Token close(size_t index);
  static Token end(size_t index);
  static Token escapedChar(size_t index, char codepoint);
  static Token invalidChar(size_t index, char codepoint);
  static Token invalidSegment(size_t index, kj::ArrayPtr<const char> segment);
  static Token name(size_t index, kj::ArrayPtr<const char> name);
  static Token open(size_t index);
  static Token plus(size_t index);
  static Token questionMark(size_t index);
  static Token regex(size_t index, kj::ArrayPtr<const char> regex);
};

kj::StringPtr KJ_STRINGIFY(Token::Type type);

// Scans the input once, left to right. The returned list always ends with exactly one
// END token.
KJ_WARN_UNUSED_RESULT Result<kj::Array<Token>> tokenize(
    kj::StringPtr input, Token::Policy policy = Token::Policy::STRICT);

}  // namespace urlpat
