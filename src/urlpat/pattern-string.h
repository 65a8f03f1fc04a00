// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <urlpat/common.h>
#include <urlpat/parser.h>

#include <kj/string.h>

namespace urlpat {

// Backslash-escapes the characters that have meaning in pattern syntax.
kj::String escapePatternString(kj::ArrayPtr<const char> str);

// Renders a part list back into a canonical pattern string which parses to the same
// parts. Braces are only added where they are needed to keep a prefix, suffix or
// adjacent text attached to the right placeholder.
// @see https://urlpattern.spec.whatwg.org/#generate-a-pattern-string
kj::String generatePatternString(kj::ArrayPtr<const Part> partList, const CompileOptions& options);

}  // namespace urlpat
