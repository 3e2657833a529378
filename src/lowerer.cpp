#include "interp/lowerer.hpp"

std::string quoteString(const std::string &text) {
  std::string result = "\"";
  for (char c : text) {
    if (c == '"' || c == '\\')
      result += '\\';

    result += c;
  }

  return result + "\"";
}

// Part

std::string Part::toString() const {
  if (isLiteral())
    return quoteString(text);

  return "EmbeddedSource(" + quoteString(text) + ")";
}

std::string toString(const PartSequence &parts) {
  std::string result = "[";
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      result += ", ";

    result += parts[i].toString();
  }

  return result + "]";
}

bool isAlternating(const PartSequence &parts) noexcept {
  if (parts.size() % 2 == 0)
    return false;

  for (size_t i = 0; i < parts.size(); ++i) {
    if (parts[i].isLiteral() != (i % 2 == 0))
      return false;
  }

  return true;
}

PartSequence normalize(const PartSequence &parts) {
  PartSequence result;
  for (const Part &part : parts) {
    if (part.isLiteral()) {
      if (!result.empty() && result.back().isLiteral()) {
        // Merge adjacent fragments
        result.back() = Part::literal(result.back().getText() + part.getText(),
            result.back().getOffset());
      } else
        result.push_back(part);

      continue;
    }

    if (result.empty() || result.back().isEmbedded())
      result.push_back(Part::literal("", part.getOffset()));

    result.push_back(part);
  }

  if (result.empty())
    result.push_back(Part::literal(""));
  else if (result.back().isEmbedded())
    result.push_back(Part::literal("",
          result.back().getOffset() + result.back().getText().size()));

  return result;
}

// LexError

std::string LexError::getName() const {
  switch (type) {
  case lex_unbalanced_delimiter:
    return "UnbalancedDelimiter";
  case lex_illegal_context:
    return "IllegalContext";
  }

  return ""; // invalid
}

// lower

static bool isIdentifierStart(char c) {
  return c == '_' || isalpha((unsigned char) c);
}

static bool isIdentifierChar(char c) {
  return c == '_' || isalnum((unsigned char) c);
}

static char closingOf(char open) {
  switch (open) {
  case '(':
    return ')';
  case '[':
    return ']';
  case '{':
    return '}';
  }

  return '\0';
}

/*!\brief Scans the grouping opened at raw[open].
 * \param end Set to the index of the matching close on success.
 * \return Returns false and sets error if the grouping is unbalanced.
 */
static bool scanGroup(const std::string &raw, size_t open, size_t &end,
                      LexError &error) {
  std::vector<size_t> openers;
  openers.push_back(open);

  for (size_t i = open + 1; i < raw.size(); ++i) {
    char c = raw[i];
    if (c == '(' || c == '[' || c == '{') {
      openers.push_back(i);
      continue;
    }

    if (c != ')' && c != ']' && c != '}')
      continue;

    char expected = closingOf(raw[openers.back()]);
    if (c != expected) {
      error = LexError(lex_unbalanced_delimiter,
          std::string("Unexpected '") + c + "', expected '" + expected + "'.", i);
      return false;
    }

    openers.pop_back();
    if (openers.empty()) {
      end = i;
      return true;
    }
  }

  error = LexError(lex_unbalanced_delimiter,
      std::string("Unclosed '") + raw[openers.back()]
      + "' in interpolated string literal.", openers.back());
  return false;
}

LowerResult lower(const std::string &raw, const LowerOptions &options) {
  const char intro = options.introducer();

  PartSequence parts;
  std::string buffer;
  size_t bufferStart = 0;

  // Flushes literal text, empty fragments are added by normalize
  auto flush = [&](size_t next) {
    if (!buffer.empty())
      parts.push_back(Part::literal(buffer, bufferStart));

    buffer.clear();
    bufferStart = next;
  };

  size_t i = 0;
  while (i < raw.size()) {
    char c = raw[i];
    bool hasNext = i + 1 < raw.size();
    char next = hasNext ? raw[i + 1] : '\0';

    if (c == intro && next == intro) {
      buffer += intro;
      i += 2;
      continue;
    }

    if (options.convention == conv_brace && c == '}') {
      if (next == '}') {
        buffer += '}';
        i += 2;
        continue;
      }

      return LowerResult::fail(LexError(lex_unbalanced_delimiter,
            "Single '}' in interpolated string literal, use '}}'.", i));
    }

    if (c != intro) {
      buffer += c;
      ++i;
      continue;
    }

    if (options.convention == conv_dollar && hasNext && isIdentifierStart(next)) {
      // $identifier
      size_t end = i + 1;
      while (end < raw.size() && isIdentifierChar(raw[end]))
        ++end;

      flush(end);
      parts.push_back(Part::embedded(raw.substr(i + 1, end - i - 1), i + 1, true));
      i = end;
      continue;
    }

    // Grouping: $(...) or {...}
    size_t open = options.convention == conv_dollar ? i + 1 : i;
    if (options.convention == conv_dollar ? next == '(' : hasNext) {
      size_t close = 0;
      LexError error;
      if (!scanGroup(raw, open, close, error))
        return LowerResult::fail(error);

      flush(close + 1);
      parts.push_back(Part::embedded(raw.substr(open + 1, close - open - 1), open + 1));
      i = close + 1;
      continue;
    }

    if (options.strictIntroducer) {
      return LowerResult::fail(LexError(lex_unbalanced_delimiter,
            options.convention == conv_dollar
            ? "'$' must be followed by an identifier, '(' or '$'."
            : "'{' at end of interpolated string literal, use '{{'.", i));
    }

    // Otherwise unchanged
    buffer += c;
    ++i;
  }

  flush(raw.size());

  if (options.normalize)
    return LowerResult::ok(normalize(parts));

  if (parts.empty())
    parts.push_back(Part::literal(""));

  return LowerResult::ok(parts);
}

LowerResult lower(const InterpolatedLiteral &literal, const LowerOptions &options) {
  return lower(literal.getRaw(), options);
}
