// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <urlpat/common.h>
#include <urlpat/parser.h>

#include <kj/array.h>
#include <kj/string.h>

namespace urlpat {

struct RegexAndNameList {
  kj::String regex;

  // One entry per placeholder part, in capture group order.
  kj::Array<kj::String> names;
};

// Backslash-escapes every regular expression metacharacter in `str`. When ignoreCase is
// set, each ASCII letter is expanded to a two-case character class ("a" -> "[aA]").
kj::String escapeRegexString(kj::ArrayPtr<const char> str, bool ignoreCase = false);

// "[^<delimiter>]+?", or "[^]+?" when no delimiter is configured.
// @see https://urlpattern.spec.whatwg.org/#generate-a-segment-wildcard-regexp
kj::String generateSegmentWildcardRegexp(const CompileOptions& options);

// The generated expression is anchored with ^ and $ and has exactly one capturing group
// per placeholder part.
// @see https://urlpattern.spec.whatwg.org/#generate-a-regular-expression-and-name-list
RegexAndNameList generateRegexAndNameList(
    kj::ArrayPtr<const Part> partList, const CompileOptions& options);

}  // namespace urlpat
