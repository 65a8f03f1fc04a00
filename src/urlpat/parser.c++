// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "parser.h"

#include <kj/debug.h>
#include <kj/map.h>
#include <kj/vector.h>

namespace urlpat {

namespace {

constexpr auto MODIFIER_OPTIONAL = "?"_kjc;
constexpr auto MODIFIER_ZERO_OR_MORE = "*"_kjc;
constexpr auto MODIFIER_ONE_OR_MORE = "+"_kjc;

Part::Modifier tokenToModifier(const Token& token) {
  switch (token.type) {
    case Token::Type::QUESTION_MARK:
      return Part::Modifier::OPTIONAL;
    case Token::Type::ASTERISK:
      return Part::Modifier::ZERO_OR_MORE;
    case Token::Type::PLUS:
      return Part::Modifier::ONE_OR_MORE;
    default:
      break;
  }
  KJ_UNREACHABLE;
}

}  // namespace

kj::Maybe<kj::StringPtr> modifierToString(Part::Modifier modifier) {
  switch (modifier) {
    case Part::Modifier::NONE:
      return kj::none;
    case Part::Modifier::OPTIONAL:
      return MODIFIER_OPTIONAL;
    case Part::Modifier::ZERO_OR_MORE:
      return MODIFIER_ZERO_OR_MORE;
    case Part::Modifier::ONE_OR_MORE:
      return MODIFIER_ONE_OR_MORE;
  }
  KJ_UNREACHABLE;
}

kj::StringPtr KJ_STRINGIFY(Part::Type type) {
  switch (type) {
    case Part::Type::FIXED_TEXT:       return "fixed-text"_kj;
    case Part::Type::REGEXP:           return "regexp"_kj;
    case Part::Type::SEGMENT_WILDCARD: return "segment-wildcard"_kj;
    case Part::Type::FULL_WILDCARD:    return "full-wildcard"_kj;
  }
  KJ_UNREACHABLE;
}

kj::StringPtr KJ_STRINGIFY(Part::Modifier modifier) {
  return modifierToString(modifier).orDefault("none"_kj);
}

Result<kj::Array<Part>> parsePattern(
    kj::ArrayPtr<const Token> tokens, const CompileOptions& options) {
  // There should be at least one token in the list (the end token)
  KJ_DASSERT(tokens.size() > 0 && tokens.back().type == Token::Type::END);
  kj::Vector<Part> partList(tokens.size());
  kj::HashSet<kj::String> names;
  kj::Vector<char> pendingFixedValue;
  size_t index = 0;
  size_t nextNumericName = 0;

  auto appendToPendingFixedValue = [&](kj::StringPtr value) {
    pendingFixedValue.addAll(value);
  };

  auto maybeAddPartFromPendingFixedValue = [&]() {
    if (pendingFixedValue.size() == 0) return;
    auto value = kj::heapString(pendingFixedValue.asPtr());
    pendingFixedValue.clear();
    partList.add(Part{
      .type = Part::Type::FIXED_TEXT,
      .modifier = Part::Modifier::NONE,
      .value = kj::mv(value),
    });
  };

  auto tryConsumeToken = [&](Token::Type type) -> kj::Maybe<const Token&> {
    KJ_DASSERT(index < tokens.size());
    auto& next = tokens[index];
    if (next.type != type) {
      return kj::none;
    }
    index++;
    return kj::Maybe<const Token&>(next);
  };

  // A bare `*` is a wildcard only when it is not already attached to a name.
  auto tryConsumeRegexOrWildcardToken = [&](kj::Maybe<const Token&>& nameToken) {
    auto token = tryConsumeToken(Token::Type::REGEXP);
    if (nameToken == kj::none && token == kj::none) {
      token = tryConsumeToken(Token::Type::ASTERISK);
    }
    return token;
  };

  auto tryConsumeModifierToken = [&]() -> kj::Maybe<const Token&> {
    KJ_IF_SOME(token, tryConsumeToken(Token::Type::QUESTION_MARK)) {
      return kj::Maybe<const Token&>(token);
    }
    KJ_IF_SOME(token, tryConsumeToken(Token::Type::PLUS)) {
      return kj::Maybe<const Token&>(token);
    }
    return tryConsumeToken(Token::Type::ASTERISK);
  };

  auto consumeText = [&]() -> kj::String {
    kj::Vector<char> result;
    while (true) {
      KJ_IF_SOME(token, tryConsumeToken(Token::Type::CHAR)) {
        result.add(token.value.get<char>());
      } else KJ_IF_SOME(token, tryConsumeToken(Token::Type::ESCAPED_CHAR)) {
        result.add(token.value.get<char>());
      } else {
        break;
      }
    }
    return kj::heapString(result.asPtr());
  };

  auto addPart = [&](kj::String prefix, kj::Maybe<const Token&> nameToken,
                     kj::Maybe<const Token&> regexOrWildcardToken, kj::String suffix,
                     kj::Maybe<const Token&> modifierToken) -> kj::Maybe<ParseError> {
    auto modifier = modifierToken.map(tokenToModifier).orDefault(Part::Modifier::NONE);
    if (nameToken == kj::none && regexOrWildcardToken == kj::none &&
        modifier == Part::Modifier::NONE) {
      // This was a "{foo}" grouping around plain text.
      KJ_DASSERT(suffix.size() == 0);
      appendToPendingFixedValue(prefix);
      return kj::none;
    }
    maybeAddPartFromPendingFixedValue();
    if (nameToken == kj::none && regexOrWildcardToken == kj::none) {
      KJ_DASSERT(suffix.size() == 0);
      if (prefix.size() > 0) {
        partList.add(Part{
          .type = Part::Type::FIXED_TEXT,
          .modifier = modifier,
          .value = kj::mv(prefix),
        });
      }
      return kj::none;
    }

    auto type = Part::Type::SEGMENT_WILDCARD;
    auto value = kj::str();
    KJ_IF_SOME(token, regexOrWildcardToken) {
      if (token.type == Token::Type::ASTERISK) {
        type = Part::Type::FULL_WILDCARD;
      } else {
        type = Part::Type::REGEXP;
        value = kj::String(token);
      }
    }

    size_t position = 0;
    auto name = kj::str();
    KJ_IF_SOME(token, nameToken) {
      name = kj::String(token);
      position = token.index;
    } else KJ_IF_SOME(token, regexOrWildcardToken) {
      position = token.index;
    }
    // A bare ':' carries an empty identifier and is numbered like an unnamed group.
    if (name.size() == 0) {
      name = kj::str(nextNumericName++);
    }

    if (names.contains(name)) {
      return ParseError::duplicateName(position, name);
    }
    names.insert(kj::str(name));

    partList.add(Part{
      .type = type,
      .modifier = modifier,
      .value = kj::mv(value),
      .name = kj::mv(name),
      .prefix = kj::mv(prefix),
      .suffix = kj::mv(suffix),
    });

    return kj::none;
  };

  while (index < tokens.size()) {
    kj::Maybe<const Token&> charToken = tryConsumeToken(Token::Type::CHAR);
    kj::Maybe<const Token&> nameToken = tryConsumeToken(Token::Type::NAME);
    auto regexOrWildcardToken = tryConsumeRegexOrWildcardToken(nameToken);

    if (nameToken != kj::none || regexOrWildcardToken != kj::none) {
      auto prefix = kj::str();
      KJ_IF_SOME(token, charToken) {
        // Only the configured prefix character is kept structurally. Anything else is
        // ordinary text in front of the placeholder.
        bool isPrefixChar = false;
        KJ_IF_SOME(c, options.prefix) {
          isPrefixChar = token == c;
        }
        if (isPrefixChar) {
          prefix = kj::String(token);
        } else {
          appendToPendingFixedValue(kj::String(token));
        }
      }
      maybeAddPartFromPendingFixedValue();
      auto modifierToken = tryConsumeModifierToken();
      KJ_IF_SOME(err,
          addPart(kj::mv(prefix), nameToken, regexOrWildcardToken, kj::str(), modifierToken)) {
        return kj::mv(err);
      }
      continue;
    }

    kj::Maybe<const Token&> fixedToken = charToken;
    if (fixedToken == kj::none) {
      fixedToken = tryConsumeToken(Token::Type::ESCAPED_CHAR);
    }
    KJ_IF_SOME(token, fixedToken) {
      appendToPendingFixedValue(kj::String(token));
      continue;
    }

    if (tryConsumeToken(Token::Type::OPEN) != kj::none) {
      auto prefix = consumeText();
      auto nameToken = tryConsumeToken(Token::Type::NAME);
      regexOrWildcardToken = tryConsumeRegexOrWildcardToken(nameToken);
      auto suffix = consumeText();
      if (tryConsumeToken(Token::Type::CLOSE) == kj::none) {
        return ParseError::missingClosingCurly(tokens[index].index);
      }
      auto modifierToken = tryConsumeModifierToken();
      KJ_IF_SOME(err,
          addPart(kj::mv(prefix), nameToken, regexOrWildcardToken, kj::mv(suffix),
              modifierToken)) {
        return kj::mv(err);
      }
      continue;
    }

    maybeAddPartFromPendingFixedValue();

    auto& last = tokens[index];
    if (tryConsumeToken(Token::Type::END) == kj::none) {
      return ParseError::unexpectedEnd(
          last.index, kj::str("unexpected ", last.type, " token, expected end"));
    }
  }

  return partList.releaseAsArray();
}

Result<kj::Array<Part>> parsePattern(kj::StringPtr input, const CompileOptions& options) {
  KJ_SWITCH_ONEOF(tokenize(input, Token::Policy::STRICT)) {
    KJ_CASE_ONEOF(err, ParseError) {
      return kj::mv(err);
    }
    KJ_CASE_ONEOF(tokens, kj::Array<Token>) {
      return parsePattern(tokens.asPtr(), options);
    }
  }
  KJ_UNREACHABLE;
}

}  // namespace urlpat
