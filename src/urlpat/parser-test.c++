// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "parser.h"

#include <kj/test.h>

namespace urlpat {
namespace {

kj::Array<Part> parseOk(kj::StringPtr input, const CompileOptions& options) {
  auto result = parsePattern(input, options);
  KJ_IF_SOME(err, result.tryGet<ParseError>()) {
    KJ_FAIL_ASSERT("unexpected parse error", input, err);
  }
  return kj::mv(result.get<kj::Array<Part>>());
}

ParseError parseErr(kj::StringPtr input, const CompileOptions& options) {
  auto result = parsePattern(input, options);
  KJ_ASSERT(result.is<ParseError>(), input);
  return kj::mv(result.get<ParseError>());
}

void expectPart(const Part& part,
    Part::Type type,
    kj::StringPtr value,
    kj::StringPtr name,
    kj::StringPtr prefix = ""_kj,
    kj::StringPtr suffix = ""_kj,
    Part::Modifier modifier = Part::Modifier::NONE) {
  KJ_EXPECT(part.type == type);
  KJ_EXPECT(part.value == value);
  KJ_EXPECT(part.name == name);
  KJ_EXPECT(part.prefix == prefix);
  KJ_EXPECT(part.suffix == suffix);
  KJ_EXPECT(part.modifier == modifier);
}

KJ_TEST("Plain text coalesces into one fixed part") {
  auto parts = parseOk("/foo/bar"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(parts.size() == 1);
  expectPart(parts[0], Part::Type::FIXED_TEXT, "/foo/bar"_kj, ""_kj);

  // Braces around plain text and escapes are folded into the same pending text.
  auto braced = parseOk("ab{cd}\\:ef"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(braced.size() == 1);
  expectPart(braced[0], Part::Type::FIXED_TEXT, "abcd:ef"_kj, ""_kj);

  KJ_EXPECT(parseOk(""_kj, CompileOptions::PATHNAME).size() == 0);
}

KJ_TEST("Configured prefix character is absorbed by the placeholder") {
  auto parts = parseOk("/foo/:bar"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(parts.size() == 2);
  expectPart(parts[0], Part::Type::FIXED_TEXT, "/foo"_kj, ""_kj);
  expectPart(parts[1], Part::Type::SEGMENT_WILDCARD, ""_kj, "bar"_kj, "/"_kj);

  // Any other character in front of a placeholder stays fixed text.
  auto other = parseOk("a:foo"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(other.size() == 2);
  expectPart(other[0], Part::Type::FIXED_TEXT, "a"_kj, ""_kj);
  expectPart(other[1], Part::Type::SEGMENT_WILDCARD, ""_kj, "foo"_kj);

  // Without a configured prefix nothing is absorbed.
  auto none = parseOk("/:foo"_kj, CompileOptions::DEFAULT);
  KJ_ASSERT(none.size() == 2);
  expectPart(none[0], Part::Type::FIXED_TEXT, "/"_kj, ""_kj);
  expectPart(none[1], Part::Type::SEGMENT_WILDCARD, ""_kj, "foo"_kj);
}

KJ_TEST("Placeholder kinds") {
  auto parts = parseOk("/:foo(bar)?"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(parts.size() == 1);
  expectPart(parts[0], Part::Type::REGEXP, "bar"_kj, "foo"_kj, "/"_kj, ""_kj,
      Part::Modifier::OPTIONAL);

  auto wildcard = parseOk("/*"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(wildcard.size() == 1);
  expectPart(wildcard[0], Part::Type::FULL_WILDCARD, ""_kj, "0"_kj, "/"_kj);

  // A '*' after a name is a modifier, not a wildcard.
  auto repeated = parseOk(":foo*"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(repeated.size() == 1);
  expectPart(repeated[0], Part::Type::SEGMENT_WILDCARD, ""_kj, "foo"_kj, ""_kj, ""_kj,
      Part::Modifier::ZERO_OR_MORE);

  auto plus = parseOk("/(\\d+)+"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(plus.size() == 1);
  expectPart(plus[0], Part::Type::REGEXP, "\\d+"_kj, "0"_kj, "/"_kj, ""_kj,
      Part::Modifier::ONE_OR_MORE);
}

KJ_TEST("Brace groups capture prefix and suffix") {
  auto parts = parseOk("{a:foo(bar)b}?"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(parts.size() == 1);
  expectPart(parts[0], Part::Type::REGEXP, "bar"_kj, "foo"_kj, "a"_kj, "b"_kj,
      Part::Modifier::OPTIONAL);

  auto wildcard = parseOk("{x*y}"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(wildcard.size() == 1);
  expectPart(wildcard[0], Part::Type::FULL_WILDCARD, ""_kj, "0"_kj, "x"_kj, "y"_kj);

  auto optional = parseOk("/path{/}?"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(optional.size() == 2);
  expectPart(optional[0], Part::Type::FIXED_TEXT, "/path"_kj, ""_kj);
  expectPart(optional[1], Part::Type::FIXED_TEXT, "/"_kj, ""_kj, ""_kj, ""_kj,
      Part::Modifier::OPTIONAL);

  // An empty group with a modifier produces nothing.
  KJ_EXPECT(parseOk("{}?"_kj, CompileOptions::PATHNAME).size() == 0);
}

KJ_TEST("Unnamed placeholders get per-compile ordinals") {
  auto parts = parseOk("(a)/(b)/*/:"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(parts.size() == 4);
  KJ_EXPECT(parts[0].name == "0");
  KJ_EXPECT(parts[1].name == "1");
  KJ_EXPECT(parts[2].name == "2");
  KJ_EXPECT(parts[3].name == "3");
  KJ_EXPECT(parts[3].type == Part::Type::SEGMENT_WILDCARD);

  // The counter restarts for every compile.
  auto again = parseOk("(a)"_kj, CompileOptions::PATHNAME);
  KJ_EXPECT(again[0].name == "0");
}

KJ_TEST("Duplicate names are rejected") {
  auto err = parseErr("/:foo/:foo"_kj, CompileOptions::PATHNAME);
  KJ_EXPECT(err.kind == ParseError::Kind::DUPLICATE_NAME);
  KJ_EXPECT(err.index == 6);
  KJ_EXPECT(err.message.contains("[foo]"_kj));

  KJ_EXPECT(parseErr("{:id}{:id}"_kj, CompileOptions::PATHNAME).kind ==
      ParseError::Kind::DUPLICATE_NAME);

  // Distinct names, and any number of unnamed groups, are fine.
  KJ_EXPECT(parseOk("/:foo/:bar/(a)/(b)/*"_kj, CompileOptions::PATHNAME).size() == 5);
}

KJ_TEST("Unclosed brace groups are rejected") {
  auto err = parseErr("{abc"_kj, CompileOptions::PATHNAME);
  KJ_EXPECT(err.kind == ParseError::Kind::MISSING_CLOSING_CURLY);
  KJ_EXPECT(err.index == 4);

  KJ_EXPECT(parseErr("/{:foo"_kj, CompileOptions::PATHNAME).kind ==
      ParseError::Kind::MISSING_CLOSING_CURLY);
  KJ_EXPECT(parseErr("{a{b}}"_kj, CompileOptions::PATHNAME).kind ==
      ParseError::Kind::MISSING_CLOSING_CURLY);
}

KJ_TEST("Tokens that cannot start a part require the end of input") {
  auto stray = parseErr("abc}"_kj, CompileOptions::PATHNAME);
  KJ_EXPECT(stray.kind == ParseError::Kind::UNEXPECTED_END);
  KJ_EXPECT(stray.index == 3);

  KJ_EXPECT(parseErr("?"_kj, CompileOptions::PATHNAME).kind == ParseError::Kind::UNEXPECTED_END);
  KJ_EXPECT(parseErr("/a+"_kj, CompileOptions::PATHNAME).kind == ParseError::Kind::UNEXPECTED_END);

  // Tokenizer errors pass through unchanged.
  KJ_EXPECT(parseErr("/(abc"_kj, CompileOptions::PATHNAME).kind ==
      ParseError::Kind::PARENTHESES_MISMATCH);
}

KJ_TEST("Invalid characters from a lenient tokenizer are rejected by the parser") {
  auto tokens = tokenize("a\\"_kj, Token::Policy::LENIENT);
  KJ_ASSERT(tokens.is<kj::Array<Token>>());
  auto result = parsePattern(tokens.get<kj::Array<Token>>().asPtr(), CompileOptions::PATHNAME);
  KJ_ASSERT(result.is<ParseError>());
  KJ_EXPECT(result.get<ParseError>().kind == ParseError::Kind::UNEXPECTED_END);
  KJ_EXPECT(result.get<ParseError>().index == 1);
}

}  // namespace
}  // namespace urlpat
