// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "url-pattern.h"

#include <urlpat/parser.h>
#include <urlpat/pattern-string.h>
#include <urlpat/regex.h>

#include <kj/debug.h>

namespace urlpat {

Component::Component(
    kj::String pattern, kj::String regex, kj::Array<kj::String> names, bool ignoreCase)
    : pattern(kj::mv(pattern)),
      regex(kj::mv(regex)),
      names(kj::mv(names)),
      ignoreCase(ignoreCase) {}

Result<Component> Component::tryCompile(kj::StringPtr pattern, const CompileOptions& options) {
  KJ_SWITCH_ONEOF(parsePattern(pattern, options)) {
    KJ_CASE_ONEOF(err, ParseError) {
      return kj::mv(err);
    }
    KJ_CASE_ONEOF(partList, kj::Array<Part>) {
      auto normalized = generatePatternString(partList, options);
      auto regexAndNameList = generateRegexAndNameList(partList, options);
      return Component(kj::mv(normalized), kj::mv(regexAndNameList.regex),
          kj::mv(regexAndNameList.names), options.ignoreCase);
    }
  }
  KJ_UNREACHABLE;
}

Component Component::compile(kj::StringPtr pattern, const CompileOptions& options) {
  KJ_SWITCH_ONEOF(tryCompile(pattern, options)) {
    KJ_CASE_ONEOF(err, ParseError) {
      KJ_FAIL_REQUIRE("invalid URL pattern", pattern, err);
    }
    KJ_CASE_ONEOF(component, Component) {
      return kj::mv(component);
    }
  }
  KJ_UNREACHABLE;
}

Result<kj::String> compilePattern(kj::StringPtr pattern, const CompileOptions& options) {
  KJ_SWITCH_ONEOF(parsePattern(pattern, options)) {
    KJ_CASE_ONEOF(err, ParseError) {
      return kj::mv(err);
    }
    KJ_CASE_ONEOF(partList, kj::Array<Part>) {
      return kj::mv(generateRegexAndNameList(partList, options).regex);
    }
  }
  KJ_UNREACHABLE;
}

}  // namespace urlpat
