// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#pragma once

#include <urlpat/common.h>

#include <kj/array.h>
#include <kj/string.h>

namespace urlpat {

// A single compiled pattern: the normalized pattern string, the generated regular
// expression, and the names of its capture groups in order.
// @see https://urlpattern.spec.whatwg.org
class Component final {
 public:
  Component(kj::String pattern, kj::String regex, kj::Array<kj::String> names, bool ignoreCase);

  Component(Component&&) = default;
  Component& operator=(Component&&) = default;
  KJ_DISALLOW_COPY(Component);

  // Runs the tokenizer, parser and regex generator over `pattern`, stopping at the first
  // error.
  KJ_WARN_UNUSED_RESULT static Result<Component> tryCompile(
      kj::StringPtr pattern, const CompileOptions& options = CompileOptions::DEFAULT);

  // Like tryCompile() but throws a kj::Exception describing the ParseError. Prefer
  // tryCompile() for patterns that come from untrusted input.
  static Component compile(
      kj::StringPtr pattern, const CompileOptions& options = CompileOptions::DEFAULT);

  inline kj::StringPtr getPattern() const KJ_LIFETIMEBOUND {
    return pattern;
  }
  inline kj::StringPtr getRegex() const KJ_LIFETIMEBOUND {
    return regex;
  }
  // Capture group N of the regex (counting from 1) corresponds to getNames()[N - 1].
  inline kj::ArrayPtr<const kj::String> getNames() const KJ_LIFETIMEBOUND {
    return names.asPtr();
  }

  // Letters outside custom regexp groups are already case-folded in getRegex(). Engines
  // with a native case-insensitive flag should also set it when this is true so that
  // custom regexp groups match the same way.
  inline bool getIgnoreCase() const {
    return ignoreCase;
  }

 private:
  kj::String pattern;
  kj::String regex;
  kj::Array<kj::String> names;
  bool ignoreCase;
};

// Compiles `pattern` into an anchored regular expression. Use Component::tryCompile()
// to also get the capture group names.
KJ_WARN_UNUSED_RESULT Result<kj::String> compilePattern(
    kj::StringPtr pattern, const CompileOptions& options);

}  // namespace urlpat
