// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "regex.h"

#include <kj/test.h>

#include <regex>

namespace urlpat {
namespace {

RegexAndNameList generate(kj::StringPtr input, const CompileOptions& options) {
  auto result = parsePattern(input, options);
  KJ_IF_SOME(err, result.tryGet<ParseError>()) {
    KJ_FAIL_ASSERT("unexpected parse error", input, err);
  }
  return generateRegexAndNameList(result.get<kj::Array<Part>>(), options);
}

kj::String regexFor(kj::StringPtr input, const CompileOptions& options) {
  return kj::mv(generate(input, options).regex);
}

KJ_TEST("Regex escaping") {
  KJ_EXPECT(escapeRegexString("abc"_kj) == "abc");
  KJ_EXPECT(escapeRegexString("/a.b"_kj) == "\\/a\\.b");
  KJ_EXPECT(escapeRegexString(".+*?^${}()[]|/\\"_kj) ==
      "\\.\\+\\*\\?\\^\\$\\{\\}\\(\\)\\[\\]\\|\\/\\\\");
  KJ_EXPECT(escapeRegexString("-_~%"_kj) == "-_~%");

  KJ_EXPECT(escapeRegexString("aB.1"_kj, true) == "[aA][bB]\\.1");
}

KJ_TEST("Segment wildcard excludes the delimiter") {
  KJ_EXPECT(generateSegmentWildcardRegexp(CompileOptions::PATHNAME) == "[^\\/]+?");
  KJ_EXPECT(generateSegmentWildcardRegexp(CompileOptions::HOSTNAME) == "[^\\.]+?");
  KJ_EXPECT(generateSegmentWildcardRegexp(CompileOptions::DEFAULT) == "[^]+?");

  CompileOptions letter{.delimiter = 'x', .ignoreCase = true};
  KJ_EXPECT(generateSegmentWildcardRegexp(letter) == "[^xX]+?");
}

KJ_TEST("Fixed text and brace groups") {
  KJ_EXPECT(regexFor("abc"_kj, CompileOptions::PATHNAME) == "^abc$");
  KJ_EXPECT(regexFor("/"_kj, CompileOptions::PATHNAME) == "^\\/$");
  KJ_EXPECT(regexFor("{foo}"_kj, CompileOptions::PATHNAME) == "^foo$");
  KJ_EXPECT(regexFor("{bar}?"_kj, CompileOptions::PATHNAME) == "^(?:bar)?$");
  KJ_EXPECT(regexFor("/a.b\\+c"_kj, CompileOptions::PATHNAME) == "^\\/a\\.b\\+c$");
  KJ_EXPECT(regexFor("[x]|$^"_kj, CompileOptions::PATHNAME) == "^\\[x\\]\\|\\$\\^$");
  KJ_EXPECT(regexFor(""_kj, CompileOptions::PATHNAME) == "^$");
}

KJ_TEST("Placeholders with and without a prefix") {
  KJ_EXPECT(regexFor(":foo"_kj, CompileOptions::PATHNAME) == "^([^\\/]+?)$");
  KJ_EXPECT(regexFor("/:bar"_kj, CompileOptions::PATHNAME) == "^(?:\\/([^\\/]+?))$");
  KJ_EXPECT(regexFor("/:foo/:bar?"_kj, CompileOptions::PATHNAME) ==
      "^(?:\\/([^\\/]+?))(?:\\/([^\\/]+?))?$");
  KJ_EXPECT(regexFor("(bar)"_kj, CompileOptions::PATHNAME) == "^(bar)$");
  KJ_EXPECT(regexFor("/(bar)?"_kj, CompileOptions::PATHNAME) == "^(?:\\/(bar))?$");
  KJ_EXPECT(regexFor("/:foo(bar)?"_kj, CompileOptions::PATHNAME) == "^(?:\\/(bar))?$");
  KJ_EXPECT(regexFor("{(bar)}?"_kj, CompileOptions::PATHNAME) == "^(bar)?$");
  KJ_EXPECT(regexFor("{a:foo(bar)b}?"_kj, CompileOptions::PATHNAME) == "^(?:a(bar)b)?$");
  KJ_EXPECT(regexFor("{:foo}?"_kj, CompileOptions::PATHNAME) == "^([^\\/]+?)?$");
}

KJ_TEST("Repeated placeholders keep a single capture group") {
  KJ_EXPECT(regexFor(":foo*"_kj, CompileOptions::PATHNAME) == "^((?:[^\\/]+?)*)$");
  KJ_EXPECT(regexFor(":foo+"_kj, CompileOptions::PATHNAME) == "^((?:[^\\/]+?)+)$");
  KJ_EXPECT(regexFor("/:foo*"_kj, CompileOptions::PATHNAME) ==
      "^(?:\\/((?:[^\\/]+?)(?:\\/(?:[^\\/]+?))*))?$");
  KJ_EXPECT(regexFor("/:foo+"_kj, CompileOptions::PATHNAME) ==
      "^(?:\\/((?:[^\\/]+?)(?:\\/(?:[^\\/]+?))*))$");
  KJ_EXPECT(regexFor("{a:foo-}*"_kj, CompileOptions::PATHNAME) ==
      "^(?:a((?:[^\\/]+?)(?:-a(?:[^\\/]+?))*)-)?$");
}

KJ_TEST("Full wildcards") {
  KJ_EXPECT(regexFor("*"_kj, CompileOptions::PATHNAME) == "^(.*)$");
  KJ_EXPECT(regexFor("/*"_kj, CompileOptions::PATHNAME) == "^(?:\\/(.*))$");
  KJ_EXPECT(regexFor("a*"_kj, CompileOptions::PATHNAME) == "^a(.*)$");
}

KJ_TEST("Names are listed in capture group order") {
  auto result = generate("/:foo/(\\d+)/*"_kj, CompileOptions::PATHNAME);
  KJ_EXPECT(result.regex == "^(?:\\/([^\\/]+?))(?:\\/(\\d+))(?:\\/(.*))$");
  KJ_ASSERT(result.names.size() == 3);
  KJ_EXPECT(result.names[0] == "foo");
  KJ_EXPECT(result.names[1] == "0");
  KJ_EXPECT(result.names[2] == "1");

  KJ_EXPECT(generate("/foo/bar"_kj, CompileOptions::PATHNAME).names.size() == 0);
}

KJ_TEST("Delimiter and prefix follow the options") {
  KJ_EXPECT(regexFor("/:foo"_kj, CompileOptions::DEFAULT) == "^\\/([^]+?)$");
  KJ_EXPECT(regexFor(":sub.example.com"_kj, CompileOptions::HOSTNAME) ==
      "^([^\\.]+?)\\.example\\.com$");

  auto regex = regexFor("{:sub.}*example.com"_kj, CompileOptions::HOSTNAME);
  KJ_EXPECT(regex == "^(?:((?:[^\\.]+?)(?:\\.(?:[^\\.]+?))*)\\.)?example\\.com$");

  std::regex re(regex.cStr(), std::regex_constants::ECMAScript);
  std::cmatch match;
  KJ_ASSERT(std::regex_match("a.b.example.com", match, re));
  KJ_EXPECT(kj::str(match[1].str().c_str()) == "a.b");
  KJ_EXPECT(std::regex_match("example.com", match, re));
  KJ_EXPECT(!std::regex_match("a.example.org", match, re));
}

KJ_TEST("Generated expressions match paths") {
  auto regex = regexFor("/books/:id/:rest*"_kj, CompileOptions::PATHNAME);
  std::regex re(regex.cStr(), std::regex_constants::ECMAScript);
  std::cmatch match;

  KJ_ASSERT(std::regex_match("/books/123/a/b", match, re));
  KJ_EXPECT(kj::str(match[1].str().c_str()) == "123");
  KJ_EXPECT(kj::str(match[2].str().c_str()) == "a/b");

  KJ_ASSERT(std::regex_match("/books/123", match, re));
  KJ_EXPECT(!match[2].matched);

  KJ_EXPECT(!std::regex_match("/books/", match, re));
  KJ_EXPECT(!std::regex_match("/books/1/2/", match, re));
}

KJ_TEST("ignoreCase folds letters outside custom groups") {
  CompileOptions options = CompileOptions::PATHNAME;
  options.ignoreCase = true;
  KJ_EXPECT(regexFor("/Foo/:bar"_kj, options) == "^\\/[fF][oO][oO](?:\\/([^\\/]+?))$");
  KJ_EXPECT(regexFor("{x:id-y}"_kj, options) == "^(?:[xX]([^\\/]+?)-[yY])$");

  {
    KJ_EXPECT_LOG(WARNING, "ignoreCase is not applied inside a custom regexp group");
    KJ_EXPECT(regexFor("/(abc)"_kj, options) == "^(?:\\/(abc))$");
  }
}

}  // namespace
}  // namespace urlpat
