// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "tokenizer.h"

#include <kj/test.h>

namespace urlpat {
namespace {

kj::String text(const Token& token) {
  return kj::String(token);
}

kj::Array<Token> tokenizeOk(kj::StringPtr input, Token::Policy policy = Token::Policy::STRICT) {
  auto result = tokenize(input, policy);
  KJ_IF_SOME(err, result.tryGet<ParseError>()) {
    KJ_FAIL_ASSERT("unexpected tokenizer error", input, err);
  }
  return kj::mv(result.get<kj::Array<Token>>());
}

ParseError tokenizeErr(kj::StringPtr input) {
  auto result = tokenize(input);
  KJ_ASSERT(result.is<ParseError>(), input);
  return kj::mv(result.get<ParseError>());
}

KJ_TEST("Tokenizer classifies every token type") {
  auto tokens = tokenizeOk("/:foo(bar)?*+{x}\\."_kj);
  struct Expected {
    Token::Type type;
    size_t index;
  };
  static const Expected kExpected[] = {
    {Token::Type::CHAR, 0},
    {Token::Type::NAME, 1},
    {Token::Type::REGEXP, 5},
    {Token::Type::QUESTION_MARK, 10},
    {Token::Type::ASTERISK, 11},
    {Token::Type::PLUS, 12},
    {Token::Type::OPEN, 13},
    {Token::Type::CHAR, 14},
    {Token::Type::CLOSE, 15},
    {Token::Type::ESCAPED_CHAR, 16},
    {Token::Type::END, 18},
  };
  KJ_ASSERT(tokens.size() == kj::size(kExpected));
  for (auto i: kj::indices(tokens)) {
    KJ_EXPECT(tokens[i].type == kExpected[i].type, i);
    KJ_EXPECT(tokens[i].index == kExpected[i].index, i);
  }

  KJ_EXPECT(text(tokens[0]) == "/");
  KJ_EXPECT(text(tokens[1]) == "foo");
  KJ_EXPECT(text(tokens[2]) == "bar");
  KJ_EXPECT(text(tokens[7]) == "x");
  KJ_EXPECT(text(tokens[9]) == ".");
}

KJ_TEST("Tokenizer appends exactly one end token") {
  auto empty = tokenizeOk(""_kj);
  KJ_ASSERT(empty.size() == 1);
  KJ_EXPECT(empty[0].type == Token::Type::END);
  KJ_EXPECT(empty[0].index == 0);

  auto tokens = tokenizeOk("abc"_kj);
  KJ_ASSERT(tokens.size() == 4);
  KJ_EXPECT(tokens[3].type == Token::Type::END);
  KJ_EXPECT(tokens[3].index == 3);
}

KJ_TEST("Names are runs of ASCII letters") {
  auto tokens = tokenizeOk(":ab1"_kj);
  KJ_ASSERT(tokens.size() == 3);
  KJ_EXPECT(tokens[0].type == Token::Type::NAME);
  KJ_EXPECT(text(tokens[0]) == "ab");
  KJ_EXPECT(tokens[1].type == Token::Type::CHAR);
  KJ_EXPECT(text(tokens[1]) == "1");

  auto camel = tokenizeOk(":userId/"_kj);
  KJ_EXPECT(text(camel[0]) == "userId");
  KJ_EXPECT(text(camel[1]) == "/");

  // The run may be empty.
  auto bare = tokenizeOk(":"_kj);
  KJ_ASSERT(bare.size() == 2);
  KJ_EXPECT(bare[0].type == Token::Type::NAME);
  KJ_EXPECT(text(bare[0]) == "");

  auto underscore = tokenizeOk(":_x"_kj);
  KJ_EXPECT(text(underscore[0]) == "");
  KJ_EXPECT(text(underscore[1]) == "_");
}

KJ_TEST("Regexp groups track nesting depth") {
  auto nested = tokenizeOk("((a)b)c"_kj);
  KJ_ASSERT(nested.size() == 3);
  KJ_EXPECT(nested[0].type == Token::Type::REGEXP);
  KJ_EXPECT(text(nested[0]) == "(a)b");
  KJ_EXPECT(text(nested[1]) == "c");
  KJ_EXPECT(nested[1].index == 6);

  auto escaped = tokenizeOk("(a\\)b)"_kj);
  KJ_ASSERT(escaped.size() == 2);
  KJ_EXPECT(text(escaped[0]) == "a\\)b");

  auto empty = tokenizeOk("()"_kj);
  KJ_ASSERT(empty.size() == 2);
  KJ_EXPECT(empty[0].type == Token::Type::REGEXP);
  KJ_EXPECT(text(empty[0]) == "");
}

KJ_TEST("Unterminated regexp groups are rejected") {
  auto err = tokenizeErr("(abc"_kj);
  KJ_EXPECT(err.kind == ParseError::Kind::PARENTHESES_MISMATCH);
  KJ_EXPECT(err.index == 0);

  auto nested = tokenizeErr("/x((a)"_kj);
  KJ_EXPECT(nested.kind == ParseError::Kind::PARENTHESES_MISMATCH);
  KJ_EXPECT(nested.index == 2);

  auto escapedClose = tokenizeErr("(a\\)"_kj);
  KJ_EXPECT(escapedClose.kind == ParseError::Kind::PARENTHESES_MISMATCH);

  auto trailingEscape = tokenizeErr("(a\\"_kj);
  KJ_EXPECT(trailingEscape.kind == ParseError::Kind::PARENTHESES_MISMATCH);
}

KJ_TEST("Escapes carry the escaped character") {
  auto tokens = tokenizeOk("\\:\\{"_kj);
  KJ_ASSERT(tokens.size() == 3);
  KJ_EXPECT(tokens[0].type == Token::Type::ESCAPED_CHAR);
  KJ_EXPECT(text(tokens[0]) == ":");
  KJ_EXPECT(tokens[1].type == Token::Type::ESCAPED_CHAR);
  KJ_EXPECT(text(tokens[1]) == "{");
  KJ_EXPECT(tokens[1].index == 2);

  auto err = tokenizeErr("abc\\"_kj);
  KJ_EXPECT(err.kind == ParseError::Kind::UNEXPECTED_END);
  KJ_EXPECT(err.index == 3);
}

KJ_TEST("Lenient policy marks invalid sequences instead of failing") {
  auto escape = tokenizeOk("a\\"_kj, Token::Policy::LENIENT);
  KJ_ASSERT(escape.size() == 3);
  KJ_EXPECT(escape[1].type == Token::Type::INVALID_CHAR);
  KJ_EXPECT(text(escape[1]) == "\\");
  KJ_EXPECT(escape[2].type == Token::Type::END);

  auto group = tokenizeOk("x(ab"_kj, Token::Policy::LENIENT);
  KJ_ASSERT(group.size() == 3);
  KJ_EXPECT(group[1].type == Token::Type::INVALID_CHAR);
  KJ_EXPECT(group[1].index == 1);
  KJ_EXPECT(text(group[1]) == "(ab");
  KJ_EXPECT(group[2].type == Token::Type::END);
  KJ_EXPECT(group[2].index == 4);
}

}  // namespace
}  // namespace urlpat
