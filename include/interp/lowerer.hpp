#ifndef INTERP_LOWERER_HPP
#define INTERP_LOWERER_HPP

/*!\file interp/lowerer.hpp
 * \brief Lowering of interpolated string literals into literal fragments
 * and embedded source parts.
 */

#include "interp/global.hpp"
#include "interp/lexer.hpp"

/*!\brief Escape convention of interpolated string literals.
 */
enum Convention : int {
  conv_brace,  //!< {expr}, literal braces as {{ and }}
  conv_dollar, //!< $identifier or $(expr), literal dollar as $$
};

/*!\brief Types of parts.
 * \see Part
 */
enum PartType : int {
  part_literal,  //!< Literal text, escapes resolved
  part_embedded, //!< Verbatim source of an embedded expression
};

/*!\brief Types of errors raised for interpolated string literals.
 */
enum LexErrorType : int {
  lex_unbalanced_delimiter, //!< Grouping not closed, or unexpected close
  lex_illegal_context, //!< Literal used outside an argument list
};

/*!\brief Raw text of an i"..." token, without the delimiters.
 */
class InterpolatedLiteral {
  std::string raw;
  TokenPos pos;
public:
  InterpolatedLiteral(const std::string &raw, const TokenPos &pos)
    : raw(raw), pos(pos) {}

  const std::string &getRaw() const noexcept { return raw; }

  /*!\return Returns position of the whole token (i"...").
   */
  const TokenPos &getTokenPos() const noexcept { return pos; }

  /*!\return Returns source position of the byte at offset in getRaw().
   */
  TokenPos getPosition(size_t offset) const noexcept { return pos.at(2 + offset); }
};

/*!\brief One part of a lowered literal.
 */
class Part {
  PartType type;
  std::string text;
  size_t offset;
  bool shorthand;
public:
  /*!\param type
   * \param text Text with escapes resolved (literal) or verbatim (embedded).
   * \param offset Start of text in the raw literal.
   * \param shorthand True for embedded identifiers without grouping ($name).
   */
  Part(PartType type, const std::string &text, size_t offset = 0,
       bool shorthand = false)
    : type{type}, text(text), offset{offset}, shorthand{shorthand} {}

  static Part literal(const std::string &text, size_t offset = 0) {
    return Part(part_literal, text, offset);
  }

  static Part embedded(const std::string &text, size_t offset = 0,
                       bool shorthand = false) {
    return Part(part_embedded, text, offset, shorthand);
  }

  PartType getType() const noexcept { return type; }
  bool isLiteral() const noexcept { return type == part_literal; }
  bool isEmbedded() const noexcept { return type == part_embedded; }
  const std::string &getText() const noexcept { return text; }
  size_t getOffset() const noexcept { return offset; }
  bool isShorthand() const noexcept { return shorthand; }

  /*!\return Returns "text" for literals and EmbeddedSource("text") for
   * embedded source.
   */
  std::string toString() const;

  //! Compares type and text, not positions.
  bool operator ==(const Part &part) const noexcept {
    return type == part.type && text == part.text;
  }

  bool operator !=(const Part &part) const noexcept {
    return !(*this == part);
  }
};

typedef std::vector<Part> PartSequence;

/*!\return Returns the parts as [part, part, ...].
 */
std::string toString(const PartSequence &parts);

/*!\return Returns true if parts is fragment, embedded, fragment, ...,
 * fragment (odd size, literals at even indexes).
 */
bool isAlternating(const PartSequence &parts) noexcept;

/*!\brief Inserts empty fragments at the front, at the back and between
 * adjacent embedded parts. Merges adjacent fragments.
 * \return Returns the normalized sequence, isAlternating() holds for it.
 */
PartSequence normalize(const PartSequence &parts);

/*!\brief Error of lowering (or of the literal's context).
 */
class LexError {
  LexErrorType type;
  std::string msg;
  size_t offset;
public:
  LexError() : type{lex_unbalanced_delimiter}, msg(), offset{0} {}
  LexError(LexErrorType type, const std::string &msg, size_t offset = 0)
    : type{type}, msg(msg), offset{offset} {}

  LexErrorType getType() const noexcept { return type; }
  const std::string &getMessage() const noexcept { return msg; }

  /*!\return Returns offset in the raw literal the error refers to.
   */
  size_t getOffset() const noexcept { return offset; }

  /*!\return Returns "UnbalancedDelimiter" or "IllegalContext".
   */
  std::string getName() const;
};

/*!\brief Configuration of lowering and splicing.
 */
struct LowerOptions {
  Convention convention;

  /*!\brief Enforce fragment/embedded alternation.
   * \see normalize
   */
  bool normalize;

  /*!\brief Prefix spliced arguments with a header expression recording the
   * parts.
   */
  bool emitHeader;

  /*!\brief Treat an introducer which is followed by nothing valid as an
   * error instead of literal text.
   */
  bool strictIntroducer;

  LowerOptions(Convention convention = conv_dollar)
    : convention{convention}, normalize{true},
      emitHeader{convention == conv_dollar}, strictIntroducer{false} {}

  //!\return Returns '{' or '$'.
  char introducer() const noexcept {
    return convention == conv_brace ? '{' : '$';
  }
};

/*!\brief Either a part sequence or an error.
 */
class LowerResult {
  bool success;
  PartSequence parts;
  LexError error;

  LowerResult(bool success, const PartSequence &parts, const LexError &error)
    : success{success}, parts(parts), error(error) {}
public:
  static LowerResult ok(const PartSequence &parts) {
    return LowerResult(true, parts, LexError());
  }

  static LowerResult fail(const LexError &error) {
    return LowerResult(false, PartSequence(), error);
  }

  bool isOk() const noexcept { return success; }
  explicit operator bool() const noexcept { return success; }

  const PartSequence &getParts() const noexcept { return parts; }
  const LexError &getError() const noexcept { return error; }
};

/*!\brief Lowers the raw text of an interpolated string literal.
 *
 * Single pass from left to right. Doubled introducers are literal
 * introducers, an introducer followed by an identifier ($ only) or a
 * grouping starts an embedded part, which ends at the end of the
 * identifier or the matching close. Nested (), [] and {} pairs are
 * tracked inside groupings.
 *
 * \param raw Text between i" and ".
 * \param options
 * \return Returns the parts, or lex_unbalanced_delimiter at the offending
 * offset.
 */
LowerResult lower(const std::string &raw, const LowerOptions &options);

LowerResult lower(const InterpolatedLiteral &literal, const LowerOptions &options);

/*!\return Returns text in double quotes, with " and \ escaped.
 */
std::string quoteString(const std::string &text);

#endif /* INTERP_LOWERER_HPP */
