// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "pattern-string.h"

#include <urlpat/regex.h>

#include <kj/debug.h>
#include <kj/string-tree.h>
#include <kj/vector.h>

namespace urlpat {

namespace {

inline bool isAsciiDigit(char c) {
  return c >= '0' && c <= '9';
}

// Characters the tokenizer would fold into a preceding :name.
inline bool isNameChar(char c) {
  return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
}

}  // namespace

kj::String escapePatternString(kj::ArrayPtr<const char> str) {
  kj::Vector<char> result(str.size() + 10);
  for (auto c: str) {
    if (c == '+' || c == '*' || c == '?' || c == ':' || c == '{' || c == '}' || c == '(' ||
        c == ')' || c == '\\') {
      result.add('\\');
    }
    result.add(c);
  }
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

kj::String generatePatternString(kj::ArrayPtr<const Part> partList, const CompileOptions& options) {
  kj::Vector<kj::StringTree> pattern(partList.size());
  const Part* previousPart = nullptr;
  const Part* nextPart = nullptr;
  bool customName = false;

  const auto isOptionsPrefix = [&](kj::StringPtr text) {
    KJ_IF_SOME(c, options.prefix) {
      return text.size() == 1 && text[0] == c;
    }
    return false;
  };

  const auto checkNeedsGrouping = [&](const Part& part) {
    if (part.suffix.size() > 0) return true;
    if (part.prefix.size() > 0 && !isOptionsPrefix(part.prefix)) return true;
    if (customName && part.type == Part::Type::SEGMENT_WILDCARD &&
        part.modifier == Part::Modifier::NONE && nextPart != nullptr &&
        nextPart->prefix.size() == 0 && nextPart->suffix.size() == 0) {
      // Without braces the following text would extend the name, and a following
      // unnamed group would become this placeholder's regexp.
      if (nextPart->type == Part::Type::FIXED_TEXT) {
        return nextPart->value.size() > 0 && isNameChar(nextPart->value[0]);
      } else {
        return nextPart->name.size() > 0 && isAsciiDigit(nextPart->name[0]);
      }
    }
    return false;
  };

  for (size_t n = 0; n < partList.size(); n++) {
    auto& part = partList[n];
    previousPart = n > 0 ? &partList[n - 1] : nullptr;
    nextPart = n + 1 < partList.size() ? &partList[n + 1] : nullptr;

    if (part.type == Part::Type::FIXED_TEXT) {
      KJ_IF_SOME(c, modifierToString(part.modifier)) {
        pattern.add(kj::strTree("{", escapePatternString(part.value), "}", c));
      } else {
        pattern.add(kj::strTree(escapePatternString(part.value)));
      }
      continue;
    }

    KJ_DASSERT(part.name.size() > 0);
    customName = !isAsciiDigit(part.name[0]);
    bool prefixIsEmpty = part.prefix.size() == 0;
    bool needsGrouping = checkNeedsGrouping(part);

    if (!needsGrouping && prefixIsEmpty && previousPart != nullptr &&
        previousPart->type == Part::Type::FIXED_TEXT && previousPart->value.size() > 0) {
      KJ_IF_SOME(c, options.prefix) {
        if (previousPart->value[previousPart->value.size() - 1] == c) {
          needsGrouping = true;
        }
      }
    }

    auto subPattern = kj::strTree(escapePatternString(part.prefix));
    if (customName) {
      subPattern = kj::strTree(kj::mv(subPattern), ":", part.name);
    }

    switch (part.type) {
      case Part::Type::REGEXP:
        subPattern = kj::strTree(kj::mv(subPattern), "(", part.value, ")");
        break;
      case Part::Type::SEGMENT_WILDCARD:
        if (!customName) {
          subPattern =
              kj::strTree(kj::mv(subPattern), "(", generateSegmentWildcardRegexp(options), ")");
        } else if (part.suffix.size() > 0 && isNameChar(part.suffix[0])) {
          subPattern = kj::strTree(kj::mv(subPattern), "\\");
        }
        break;
      case Part::Type::FULL_WILDCARD:
        if (!customName &&
            (previousPart == nullptr || previousPart->type == Part::Type::FIXED_TEXT ||
                previousPart->modifier != Part::Modifier::NONE || needsGrouping ||
                !prefixIsEmpty)) {
          subPattern = kj::strTree(kj::mv(subPattern), "*");
        } else {
          subPattern = kj::strTree(kj::mv(subPattern), "(.*)");
        }
        break;
      case Part::Type::FIXED_TEXT:
        KJ_UNREACHABLE;
    }

    subPattern = kj::strTree(kj::mv(subPattern), escapePatternString(part.suffix));

    if (needsGrouping) {
      subPattern = kj::strTree("{", kj::mv(subPattern), "}");
    }

    KJ_IF_SOME(c, modifierToString(part.modifier)) {
      subPattern = kj::strTree(kj::mv(subPattern), c);
    }

    pattern.add(kj::mv(subPattern));
  }
  return kj::StringTree(pattern.releaseAsArray(), ""_kj).flatten();
}

}  // namespace urlpat
