// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <urlpat/common.h>
#include <urlpat/tokenizer.h>

#include <kj/array.h>
#include <kj/string.h>

namespace urlpat {

// An individual piece of a pattern string: either fixed text or a named placeholder.
// @see https://urlpattern.spec.whatwg.org/#part
struct Part {
  enum class Type {
    FIXED_TEXT,
    REGEXP,
    SEGMENT_WILDCARD,
    FULL_WILDCARD,
  };

  enum class Modifier {
    NONE,
    OPTIONAL,      // ?
    ZERO_OR_MORE,  // *
    ONE_OR_MORE,   // +
  };

  Type type;
  Modifier modifier = Modifier::NONE;

  // The literal text for FIXED_TEXT, the caller's regex fragment for REGEXP, and empty
  // for the two wildcard types.
  kj::String value;

  // Empty for FIXED_TEXT. Placeholders without an explicit name get a decimal ordinal.
  kj::String name;

  // Literal text adjacent to the placeholder inside a {...} group (or the absorbed
  // prefix character). Empty when absent.
  kj::String prefix;
  kj::String suffix;

  inline bool isPlaceholder() const {
    return type != Type::FIXED_TEXT;
  }
};

kj::Maybe<kj::StringPtr> modifierToString(Part::Modifier modifier);

kj::StringPtr KJ_STRINGIFY(Part::Type type);
kj::StringPtr KJ_STRINGIFY(Part::Modifier modifier);

// Consumes the token list exactly once. `tokens` must end with an END token, as produced
// by tokenize(). Only options.prefix is consulted.
KJ_WARN_UNUSED_RESULT Result<kj::Array<Part>> parsePattern(
    kj::ArrayPtr<const Token> tokens, const CompileOptions& options);

// Convenience that tokenizes `input` in STRICT mode and parses the result.
KJ_WARN_UNUSED_RESULT Result<kj::Array<Part>> parsePattern(
    kj::StringPtr input, const CompileOptions& options);

}  // namespace urlpat
