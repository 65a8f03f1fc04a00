// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "common.h"

#include <kj/debug.h>

namespace urlpat {

const CompileOptions CompileOptions::DEFAULT{};
const CompileOptions CompileOptions::HOSTNAME{.delimiter = '.'};
const CompileOptions CompileOptions::PATHNAME{.delimiter = '/', .prefix = '/'};

ParseError ParseError::unexpectedEnd(size_t index, kj::StringPtr detail) {
  return {
    .kind = Kind::UNEXPECTED_END,
    .index = index,
    .message = kj::str("Syntax error in URL Pattern: ", detail, " at ", index),
  };
}

ParseError ParseError::parenthesesMismatch(size_t index) {
  return {
    .kind = Kind::PARENTHESES_MISMATCH,
    .index = index,
    .message = kj::str("Syntax error in URL Pattern: unterminated regex group at ", index),
  };
}

ParseError ParseError::missingClosingCurly(size_t index) {
  return {
    .kind = Kind::MISSING_CLOSING_CURLY,
    .index = index,
    .message = kj::str("Syntax error in URL Pattern: Missing required close token at ", index),
  };
}

ParseError ParseError::duplicateName(size_t index, kj::StringPtr name) {
  return {
    .kind = Kind::DUPLICATE_NAME,
    .index = index,
    .message = kj::str("Syntax error in URL Pattern: Duplicated part names [", name, "]"),
  };
}

kj::StringPtr KJ_STRINGIFY(ParseError::Kind kind) {
  switch (kind) {
    case ParseError::Kind::UNEXPECTED_END:        return "UnexpectedEnd"_kj;
    case ParseError::Kind::PARENTHESES_MISMATCH:  return "ParenthesesMismatch"_kj;
    case ParseError::Kind::MISSING_CLOSING_CURLY: return "MissingClosingCurly"_kj;
    case ParseError::Kind::DUPLICATE_NAME:        return "DuplicateName"_kj;
  }
  KJ_UNREACHABLE;
}

kj::String KJ_STRINGIFY(const ParseError& error) {
  return kj::str(error.kind, ": ", error.message);
}

}  // namespace urlpat
