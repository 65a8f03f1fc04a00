// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "tokenizer.h"

#include <kj/debug.h>
#include <kj/vector.h>

namespace urlpat {

namespace {

inline bool isAsciiLetter(char c) {
  return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
}

}  // namespace

Token::operator kj::String() const {
  KJ_SWITCH_ONEOF(value) {
    KJ_CASE_ONEOF(codepoint, char) {
      return kj::str(codepoint);
    }
    KJ_CASE_ONEOF(ptr, kj::ArrayPtr<const char>) {
      return kj::str(ptr);
    }
  }
  KJ_UNREACHABLE;
}

bool Token::operator==(char other) const {
  KJ_SWITCH_ONEOF(value) {
    KJ_CASE_ONEOF(codepoint, char) {
      return codepoint == other;
    }
    KJ_CASE_ONEOF(string, kj::ArrayPtr<const char>) {
      return false;
    }
  }
  KJ_UNREACHABLE;
}

Token Token::asterisk(size_t index) {
  return {
    .type = Type::ASTERISK,
    .index = index,
    .value = '*',
  };
}

Token Token::char_(size_t index, char codepoint) {
  return {
    .type = Type::CHAR,
    .index = index,
    .value = codepoint,
  };
}

Token Token::close(size_t index) {
  return {
    .type = Type::CLOSE,
    .index = index,
    .value = '}',
  };
}

Token Token::end(size_t index) {
  return {
    .type = Type::END,
    .index = index,
  };
}

Token Token::escapedChar(size_t index, char codepoint) {
  return {
    .type = Type::ESCAPED_CHAR,
    .index = index,
    .value = codepoint,
  };
}

Token Token::invalidChar(size_t index, char codepoint) {
  return {
    .type = Type::INVALID_CHAR,
    .index = index,
    .value = codepoint,
  };
}

Token Token::invalidSegment(size_t index, kj::ArrayPtr<const char> segment) {
  return {
    .type = Type::INVALID_CHAR,
    .index = index,
    .value = segment,
  };
}

Token Token::name(size_t index, kj::ArrayPtr<const char> name) {
  return {
    .type = Type::NAME,
    .index = index,
    .value = name,
  };
}

Token Token::open(size_t index) {
  return {
    .type = Type::OPEN,
    .index = index,
    .value = '{',
  };
}

Token Token::plus(size_t index) {
  return {
    .type = Type::PLUS,
    .index = index,
    .value = '+',
  };
}

Token Token::questionMark(size_t index) {
  return {
    .type = Type::QUESTION_MARK,
    .index = index,
    .value = '?',
  };
}

Token Token::regex(size_t index, kj::ArrayPtr<const char> regex) {
  return {
    .type = Type::REGEXP,
    .index = index,
    .value = regex,
  };
}

kj::StringPtr KJ_STRINGIFY(Token::Type type) {
  switch (type) {
    case Token::Type::INVALID_CHAR:  return "invalid-char"_kj;
    case Token::Type::OPEN:          return "open"_kj;
    case Token::Type::CLOSE:         return "close"_kj;
    case Token::Type::REGEXP:        return "regexp"_kj;
    case Token::Type::NAME:          return "name"_kj;
    case Token::Type::CHAR:          return "char"_kj;
    case Token::Type::ESCAPED_CHAR:  return "escaped-char"_kj;
    case Token::Type::PLUS:          return "plus"_kj;
    case Token::Type::QUESTION_MARK: return "question-mark"_kj;
    case Token::Type::ASTERISK:      return "asterisk"_kj;
    case Token::Type::END:           return "end"_kj;
  }
  KJ_UNREACHABLE;
}

Result<kj::Array<Token>> tokenize(kj::StringPtr input, Token::Policy policy) {
  size_t pos = 0;
  kj::Vector<Token> tokenList(input.size() + 1);

  while (pos < input.size()) {
    auto c = input[pos];
    switch (c) {
      case '*': {
        tokenList.add(Token::asterisk(pos++));
        break;
      }
      case '+': {
        tokenList.add(Token::plus(pos++));
        break;
      }
      case '?': {
        tokenList.add(Token::questionMark(pos++));
        break;
      }
      case '\\': {
        // The escape character is invalid if it comes at the end!
        if (pos + 1 == input.size()) {
          if (policy == Token::Policy::STRICT) {
            return ParseError::unexpectedEnd(pos, "invalid escape character"_kj);
          }
          tokenList.add(Token::invalidChar(pos++, c));
        } else {
          tokenList.add(Token::escapedChar(pos, input[pos + 1]));
          pos += 2;
        }
        break;
      }
      case '{': {
        tokenList.add(Token::open(pos++));
        break;
      }
      case '}': {
        tokenList.add(Token::close(pos++));
        break;
      }
      case ':': {
        // The run of letters may be empty; the parser decides what an empty name means.
        size_t start = ++pos;
        while (pos < input.size() && isAsciiLetter(input[pos])) {
          pos++;
        }
        tokenList.add(Token::name(start - 1, input.slice(start, pos)));
        break;
      }
      case '(': {
        size_t depth = 1;
        size_t start = ++pos;
        while (pos < input.size()) {
          auto rc = input[pos];
          if (rc == '\\') {
            // An escaped character is copied verbatim and never changes the depth.
            pos += 2;
            continue;
          } else if (rc == ')') {
            if (--depth == 0) break;
          } else if (rc == '(') {
            depth++;
          }
          pos++;
        }
        if (depth > 0) {
          if (policy == Token::Policy::STRICT) {
            return ParseError::parenthesesMismatch(start - 1);
          }
          tokenList.add(Token::invalidSegment(start - 1, input.slice(start - 1, input.size())));
          pos = input.size();
          break;
        }
        KJ_DASSERT(input[pos] == ')');
        tokenList.add(Token::regex(start - 1, input.slice(start, pos)));
        pos++;
        break;
      }
      default: {
        tokenList.add(Token::char_(pos++, c));
        break;
      }
    }
  }

  tokenList.add(Token::end(input.size()));
  return tokenList.releaseAsArray();
}

}  // namespace urlpat
