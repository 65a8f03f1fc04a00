// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "pattern-string.h"

#include <urlpat/regex.h>

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

kj::String normalize(kj::StringPtr input, const CompileOptions& options) {
  return generatePatternString(parseOk(input, options), options);
}

KJ_TEST("Pattern escaping") {
  KJ_EXPECT(escapePatternString("/foo/bar"_kj) == "/foo/bar");
  KJ_EXPECT(escapePatternString("+*?:{}()\\"_kj) == "\\+\\*\\?\\:\\{\\}\\(\\)\\\\");
  // Regex metacharacters that mean nothing to the pattern syntax are left alone.
  KJ_EXPECT(escapePatternString(".[]^$|"_kj) == ".[]^$|");
}

KJ_TEST("Normalized patterns drop unneeded braces") {
  KJ_EXPECT(normalize("{foo}"_kj, CompileOptions::PATHNAME) == "foo");
  KJ_EXPECT(normalize("{bar}?"_kj, CompileOptions::PATHNAME) == "{bar}?");
  KJ_EXPECT(normalize("/(bar)"_kj, CompileOptions::PATHNAME) == "/(bar)");
  KJ_EXPECT(normalize("{(bar)}?"_kj, CompileOptions::PATHNAME) == "(bar)?");
  KJ_EXPECT(normalize("{/:foo}"_kj, CompileOptions::PATHNAME) == "/:foo");
  KJ_EXPECT(normalize("/:foo/:bar?"_kj, CompileOptions::PATHNAME) == "/:foo/:bar?");
  KJ_EXPECT(normalize("*"_kj, CompileOptions::PATHNAME) == "*");
  KJ_EXPECT(normalize("/*"_kj, CompileOptions::PATHNAME) == "/*");
}

KJ_TEST("Normalized patterns keep braces that change the parse") {
  // Text directly after a name would otherwise extend it.
  KJ_EXPECT(normalize("{:foo}bar"_kj, CompileOptions::PATHNAME) == "{:foo}bar");
  KJ_EXPECT(normalize(":foo{x}"_kj, CompileOptions::PATHNAME) == "{:foo}x");
  KJ_EXPECT(normalize("/:foo{bar}"_kj, CompileOptions::PATHNAME) == "{/:foo}bar");
  KJ_EXPECT(normalize("{/:foo}bar"_kj, CompileOptions::PATHNAME) == "{/:foo}bar");
  // The decision for one placeholder does not leak into the next one.
  KJ_EXPECT(normalize("{a:x}{:foo}bar"_kj, CompileOptions::PATHNAME) == "{a:x}{:foo}bar");

  // A following unnamed group would otherwise become the name's regexp.
  KJ_EXPECT(normalize(":foo{(bar)}"_kj, CompileOptions::PATHNAME) == "{:foo}(bar)");

  // A trailing '/' in the text before would otherwise become the prefix.
  KJ_EXPECT(normalize("/foo/{:bar}"_kj, CompileOptions::PATHNAME) == "/foo/{:bar}");

  // Prefixes other than the configured one, and any suffix, need a group.
  KJ_EXPECT(normalize("{a:foo-}*"_kj, CompileOptions::PATHNAME) == "{a:foo-}*");
  KJ_EXPECT(normalize("{a:foo(bar)b}?"_kj, CompileOptions::PATHNAME) == "{a:foo(bar)b}?");
  KJ_EXPECT(normalize("{:foo\\x}"_kj, CompileOptions::PATHNAME) == "{:foo\\x}");
}

KJ_TEST("Normalized patterns escape literal syntax characters") {
  KJ_EXPECT(normalize("\\:foo"_kj, CompileOptions::PATHNAME) == "\\:foo");
  KJ_EXPECT(normalize("/a\\+b"_kj, CompileOptions::PATHNAME) == "/a\\+b");
}

KJ_TEST("Unnamed segment wildcards render as their regexp") {
  KJ_EXPECT(normalize(":"_kj, CompileOptions::PATHNAME) == "([^\\/]+?)");
  KJ_EXPECT(normalize(":"_kj, CompileOptions::HOSTNAME) == "([^\\.]+?)");
}

KJ_TEST("Normalized patterns compile to the same regex") {
  static const kj::StringPtr PATTERNS[] = {
    "abc"_kj,
    "{bar}?"_kj,
    "/:foo/:bar?"_kj,
    "/(bar)?"_kj,
    "{(bar)}?"_kj,
    "/:foo(bar)?"_kj,
    "{a:foo(bar)b}?"_kj,
    "{a:foo-}*"_kj,
    "/:foo+"_kj,
    ":foo{(bar)}"_kj,
    "{:foo}bar"_kj,
    "/:foo{bar}"_kj,
    "{/:foo}bar"_kj,
    "{a:x}{:foo}bar"_kj,
    "/foo/{:bar}"_kj,
    "/*"_kj,
    "a*"_kj,
    ":"_kj,
    "/a.b\\+c"_kj,
    "/:foo/(\\d+)/*"_kj,
  };

  for (auto pattern: PATTERNS) {
    auto normalized = normalize(pattern, CompileOptions::PATHNAME);
    auto original = generateRegexAndNameList(parseOk(pattern, CompileOptions::PATHNAME),
        CompileOptions::PATHNAME);
    auto reparsed = generateRegexAndNameList(parseOk(normalized, CompileOptions::PATHNAME),
        CompileOptions::PATHNAME);
    KJ_EXPECT(original.regex == reparsed.regex, pattern, normalized);
    KJ_ASSERT(original.names.size() == reparsed.names.size(), pattern, normalized);
    for (auto i: kj::indices(original.names)) {
      KJ_EXPECT(original.names[i] == reparsed.names[i], pattern, normalized);
    }
  }
}

}  // namespace
}  // namespace urlpat
