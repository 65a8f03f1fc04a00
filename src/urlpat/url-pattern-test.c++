// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "url-pattern.h"

#include <urlpat/regex.h>

#include <kj/test.h>
#include <kj/vector.h>

#include <regex>

namespace urlpat {
namespace {

kj::String compileOk(kj::StringPtr pattern, const CompileOptions& options) {
  auto result = compilePattern(pattern, options);
  KJ_IF_SOME(err, result.tryGet<ParseError>()) {
    KJ_FAIL_ASSERT("unexpected compile error", pattern, err);
  }
  return kj::mv(result.get<kj::String>());
}

ParseError compileErr(kj::StringPtr pattern, const CompileOptions& options) {
  auto result = compilePattern(pattern, options);
  KJ_ASSERT(result.is<ParseError>(), pattern);
  return kj::mv(result.get<ParseError>());
}

KJ_TEST("compilePattern produces anchored regular expressions") {
  KJ_EXPECT(compileOk("abc"_kj, CompileOptions::PATHNAME) == "^abc$");
  KJ_EXPECT(compileOk("{foo}"_kj, CompileOptions::PATHNAME) == "^foo$");
  KJ_EXPECT(compileOk("{bar}?"_kj, CompileOptions::PATHNAME) == "^(?:bar)?$");
  KJ_EXPECT(compileOk("/:bar"_kj, CompileOptions::PATHNAME) == "^(?:\\/([^\\/]+?))$");
  KJ_EXPECT(compileOk("/:foo/:bar?"_kj, CompileOptions::PATHNAME) ==
      "^(?:\\/([^\\/]+?))(?:\\/([^\\/]+?))?$");
  KJ_EXPECT(compileOk("/:foo(bar)?"_kj, CompileOptions::PATHNAME) == "^(?:\\/(bar))?$");
  KJ_EXPECT(compileOk("{a:foo(bar)b}?"_kj, CompileOptions::PATHNAME) == "^(?:a(bar)b)?$");
}

KJ_TEST("Literal-only patterns compile to the escaped literal under every option set") {
  static const CompileOptions* const OPTIONS[] = {
    &CompileOptions::DEFAULT,
    &CompileOptions::HOSTNAME,
    &CompileOptions::PATHNAME,
  };
  static const kj::StringPtr LITERALS[] = {
    ""_kj,
    "abc"_kj,
    "/foo/bar"_kj,
    "www.example.com"_kj,
    "a-b_c~d%20"_kj,
    "[x]|$^."_kj,
  };

  for (auto options: OPTIONS) {
    for (auto literal: LITERALS) {
      KJ_EXPECT(compileOk(literal, *options) == kj::str("^", escapeRegexString(literal), "$"),
          literal);
    }
  }

  KJ_EXPECT(compileOk("www.example.com"_kj, CompileOptions::HOSTNAME) ==
      "^www\\.example\\.com$");
  KJ_EXPECT(compileOk("/foo/bar"_kj, CompileOptions::DEFAULT) == "^\\/foo\\/bar$");
}

KJ_TEST("Compiling the same pattern twice is byte-identical") {
  static const kj::StringPtr PATTERNS[] = {
    "/:foo/:bar?"_kj,
    "{a:foo(bar)b}?"_kj,
    "/(\\d+)/*"_kj,
    "{:sub.}*example.com"_kj,
  };
  static const CompileOptions* const OPTIONS[] = {
    &CompileOptions::DEFAULT,
    &CompileOptions::HOSTNAME,
    &CompileOptions::PATHNAME,
  };

  for (auto options: OPTIONS) {
    for (auto pattern: PATTERNS) {
      auto first = Component::compile(pattern, *options);
      auto second = Component::compile(pattern, *options);
      KJ_EXPECT(first.getRegex() == second.getRegex(), pattern);
      KJ_EXPECT(first.getPattern() == second.getPattern(), pattern);
      KJ_ASSERT(first.getNames().size() == second.getNames().size(), pattern);
      for (auto i: kj::indices(first.getNames())) {
        KJ_EXPECT(first.getNames()[i] == second.getNames()[i], pattern);
      }
      KJ_EXPECT(compileOk(pattern, *options) == first.getRegex(), pattern);
    }
  }
}

KJ_TEST("Very long patterns compile") {
  auto literal = kj::heapString(200000);
  for (auto& c: literal) {
    c = 'a';
  }
  KJ_EXPECT(compileOk(literal, CompileOptions::PATHNAME) == kj::str("^", literal, "$"));

  kj::Vector<char> groups;
  for (auto i = 0; i < 20000; i++) {
    groups.addAll("(x)"_kj);
  }
  auto input = kj::heapString(groups.asPtr());
  auto result = Component::tryCompile(input, CompileOptions::PATHNAME);
  KJ_ASSERT(result.is<Component>());
  auto& component = result.get<Component>();
  KJ_EXPECT(component.getPattern() == input);
  KJ_EXPECT(component.getRegex() == kj::str("^", input, "$"));
  KJ_ASSERT(component.getNames().size() == 20000);
  KJ_EXPECT(component.getNames()[19999] == "19999");
}

KJ_TEST("compilePattern reports the first error") {
  auto duplicate = compileErr("/:foo/:foo"_kj, CompileOptions::PATHNAME);
  KJ_EXPECT(duplicate.kind == ParseError::Kind::DUPLICATE_NAME);
  KJ_EXPECT(duplicate.index == 6);

  auto curly = compileErr("{abc"_kj, CompileOptions::PATHNAME);
  KJ_EXPECT(curly.kind == ParseError::Kind::MISSING_CLOSING_CURLY);
  KJ_EXPECT(curly.index == 4);

  auto paren = compileErr("/(abc"_kj, CompileOptions::PATHNAME);
  KJ_EXPECT(paren.kind == ParseError::Kind::PARENTHESES_MISMATCH);
  KJ_EXPECT(paren.index == 1);

  auto stray = compileErr("a?"_kj, CompileOptions::PATHNAME);
  KJ_EXPECT(stray.kind == ParseError::Kind::UNEXPECTED_END);
  KJ_EXPECT(stray.index == 1);

  // The tokenizer error wins even when the parser would also fail.
  KJ_EXPECT(compileErr("/:a/:a/(x"_kj, CompileOptions::PATHNAME).kind ==
      ParseError::Kind::PARENTHESES_MISMATCH);
}

KJ_TEST("ParseError stringifies with its kind") {
  auto err = compileErr("{abc"_kj, CompileOptions::PATHNAME);
  KJ_EXPECT(kj::str(err) ==
      "MissingClosingCurly: Syntax error in URL Pattern: Missing required close token at 4");
  KJ_EXPECT(kj::str(ParseError::Kind::UNEXPECTED_END) == "UnexpectedEnd");
  KJ_EXPECT(kj::str(ParseError::Kind::DUPLICATE_NAME) == "DuplicateName");
}

KJ_TEST("Component keeps the normalized pattern, regex and names") {
  auto result = Component::tryCompile("/books/{:id}/:rest*"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(result.is<Component>());
  auto& component = result.get<Component>();

  KJ_EXPECT(component.getPattern() == "/books/{:id}/:rest*");
  KJ_EXPECT(component.getRegex() ==
      "^\\/books\\/([^\\/]+?)(?:\\/((?:[^\\/]+?)(?:\\/(?:[^\\/]+?))*))?$");
  KJ_ASSERT(component.getNames().size() == 2);
  KJ_EXPECT(component.getNames()[0] == "id");
  KJ_EXPECT(component.getNames()[1] == "rest");
  KJ_EXPECT(!component.getIgnoreCase());

  std::regex re(component.getRegex().cStr(), std::regex_constants::ECMAScript);
  std::cmatch match;
  KJ_ASSERT(std::regex_match("/books/42/a/b", match, re));
  KJ_EXPECT(kj::str(match[1].str().c_str()) == "42");
  KJ_EXPECT(kj::str(match[2].str().c_str()) == "a/b");
  KJ_EXPECT(!std::regex_match("/books/42/", match, re));
}

KJ_TEST("Component with default options") {
  auto component = Component::compile("*.example.com"_kj);
  KJ_EXPECT(component.getPattern() == "*.example.com");
  KJ_EXPECT(component.getRegex() == "^(.*)\\.example\\.com$");
  KJ_ASSERT(component.getNames().size() == 1);
  KJ_EXPECT(component.getNames()[0] == "0");
}

KJ_TEST("Component records ignoreCase") {
  CompileOptions options = CompileOptions::PATHNAME;
  options.ignoreCase = true;
  auto component = Component::compile("/Api/:v"_kj, options);
  KJ_EXPECT(component.getIgnoreCase());
  KJ_EXPECT(component.getRegex() == "^\\/[aA][pP][iI](?:\\/([^\\/]+?))$");

  std::regex re(component.getRegex().cStr(), std::regex_constants::ECMAScript);
  KJ_EXPECT(std::regex_match("/API/v1", re));
  KJ_EXPECT(std::regex_match("/api/v1", re));
}

KJ_TEST("Component::compile throws on invalid patterns") {
  KJ_EXPECT_THROW_MESSAGE(
      "Duplicated part names", Component::compile("/:a/:a"_kj, CompileOptions::PATHNAME));
  KJ_EXPECT_THROW_MESSAGE(
      "unterminated regex group", Component::compile("/(a"_kj, CompileOptions::PATHNAME));

  auto result = Component::tryCompile("/:a/:a"_kj, CompileOptions::PATHNAME);
  KJ_ASSERT(result.is<ParseError>());
  KJ_EXPECT(result.get<ParseError>().kind == ParseError::Kind::DUPLICATE_NAME);
}

}  // namespace
}  // namespace urlpat
