// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "regex.h"

#include <kj/debug.h>
#include <kj/string-tree.h>
#include <kj/vector.h>

namespace urlpat {

namespace {

constexpr auto FULL_WILDCARD_REGEXP = ".*"_kjc;

inline bool isRegexMetacharacter(char c) {
  return c == '.' || c == '+' || c == '*' || c == '?' || c == '^' || c == '$' || c == '{' ||
      c == '}' || c == '(' || c == ')' || c == '[' || c == ']' || c == '|' || c == '/' ||
      c == '\\';
}

inline bool isAsciiLetter(char c) {
  return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
}

inline char toLower(char c) {
  return ('A' <= c && c <= 'Z') ? c + ('a' - 'A') : c;
}

inline char toUpper(char c) {
  return ('a' <= c && c <= 'z') ? c - ('a' - 'A') : c;
}

}  // namespace

kj::String escapeRegexString(kj::ArrayPtr<const char> str, bool ignoreCase) {
  // Best case we don't have to escape anything so size remains the same,
  // but let's pad a little just in case.
  kj::Vector<char> result(str.size() + 10);
  for (auto c: str) {
    if (ignoreCase && isAsciiLetter(c)) {
      result.add('[');
      result.add(toLower(c));
      result.add(toUpper(c));
      result.add(']');
      continue;
    }
    if (isRegexMetacharacter(c)) result.add('\\');
    result.add(c);
  }
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

kj::String generateSegmentWildcardRegexp(const CompileOptions& options) {
  KJ_IF_SOME(c, options.delimiter) {
    if (options.ignoreCase && isAsciiLetter(c)) {
      return kj::str("[^", toLower(c), toUpper(c), "]+?");
    }
    return kj::str("[^", escapeRegexString(kj::arrayPtr(&c, 1)), "]+?");
  }
  return kj::str("[^]+?");
}

RegexAndNameList generateRegexAndNameList(
    kj::ArrayPtr<const Part> partList, const CompileOptions& options) {
  // Worst case is that the nameList is equal to partList, although that will almost never
  // be the case, so let's be more conservative in what we reserve.
  kj::Vector<kj::String> nameList(partList.size() / 2);
  auto segmentWildcardRegexp = generateSegmentWildcardRegexp(options);
  kj::Vector<kj::StringTree> regex(partList.size() + 2);
  regex.add(kj::strTree("^"));

  for (auto& part: partList) {
    if (!part.isPlaceholder()) {
      auto escaped = escapeRegexString(part.value, options.ignoreCase);
      KJ_IF_SOME(c, modifierToString(part.modifier)) {
        regex.add(kj::strTree("(?:", kj::mv(escaped), ")", c));
      } else {
        regex.add(kj::strTree(kj::mv(escaped)));
      }
      continue;
    }

    KJ_DASSERT(part.name.size() > 0);
    nameList.add(kj::str(part.name));

    kj::StringPtr value;
    switch (part.type) {
      case Part::Type::SEGMENT_WILDCARD:
        value = segmentWildcardRegexp;
        break;
      case Part::Type::FULL_WILDCARD:
        value = FULL_WILDCARD_REGEXP;
        break;
      case Part::Type::REGEXP:
        if (options.ignoreCase) {
          KJ_LOG(WARNING, "ignoreCase is not applied inside a custom regexp group", part.name,
              part.value);
        }
        value = part.value;
        break;
      case Part::Type::FIXED_TEXT:
        KJ_UNREACHABLE;
    }

    auto escapedPrefix = escapeRegexString(part.prefix, options.ignoreCase);
    auto escapedSuffix = escapeRegexString(part.suffix, options.ignoreCase);

    if (escapedPrefix.size() == 0 && escapedSuffix.size() == 0) {
      if (part.modifier == Part::Modifier::NONE || part.modifier == Part::Modifier::OPTIONAL) {
        regex.add(kj::strTree("(", value, ")", modifierToString(part.modifier).orDefault(""_kj)));
      } else {
        regex.add(kj::strTree(
            "((?:", value, ")", KJ_ASSERT_NONNULL(modifierToString(part.modifier)), ")"));
      }
      continue;
    }

    if (part.modifier == Part::Modifier::NONE || part.modifier == Part::Modifier::OPTIONAL) {
      regex.add(kj::strTree("(?:", escapedPrefix, "(", value, ")", escapedSuffix, ")",
          modifierToString(part.modifier).orDefault(""_kj)));
      continue;
    }

    // Each repetition's suffix is bound to the next repetition's prefix inside the single
    // capturing group, so the group count does not depend on the number of repetitions.
    regex.add(kj::strTree("(?:", escapedPrefix, "((?:", value, ")(?:", escapedSuffix,
        escapedPrefix, "(?:", value, "))*)", escapedSuffix, ")",
        part.modifier == Part::Modifier::ZERO_OR_MORE ? "?"_kj : ""_kj));
  }

  regex.add(kj::strTree("$"));

  return RegexAndNameList{
    .regex = kj::StringTree(regex.releaseAsArray(), ""_kj).flatten(),
    .names = nameList.releaseAsArray(),
  };
}

}  // namespace urlpat
