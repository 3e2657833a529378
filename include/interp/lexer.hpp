#ifndef INTERP_LEXER_HPP
#define INTERP_LEXER_HPP

/*!\file interp/lexer.hpp
 * \brief Lexical Analysis/Tokenizer of the host language.
 */

#include "interp/global.hpp"

/*!\brief Tokens for Tokenizer/Lexical Analysis.
 * \see Lexer::nextToken, Lexer::currentToken
 */
enum Token : int {
  tok_id = 256, //!< Identifier
  tok_num,      //!< Floating-point Number
  tok_int,      //!< Integer number
  tok_str,      //!< String literal "..."
  tok_istr,     //!< Interpolated string literal i"..."
  tok_op,       //!< Binary-Operator

  tok_eol, //!< End of line (new-line character)
  tok_eof, //!< End of file

  tok_obrace, //!< (
  tok_cbrace, //!< )
  tok_comma,  //!< ,
  tok_bang,   //!< ! (template instantiation)
  tok_delim,  //!< ';'

  tok_new,    //!< 'new'
  tok_mixin,  //!< 'mixin'
  tok_pragma, //!< 'pragma'
  tok_assert, //!< 'assert'

  tok_err, //!< Error
};

/*!\brief Operator type.
 * \see Lexer::currentOperator()
 */
enum Operator {
  op_eq, //!< ==
  op_neq, //!< !=
  op_leq, //!< \<=
  op_geq, //!< \>=
  op_le, //!< \<
  op_gt, //!< \>

  op_land, //!< &&
  op_lor, //!< ||

  op_add, //!< +
  op_sub, //!< -
  op_cat, //!< ~
  op_mul, //!< *
  op_div, //!< /
  op_mod, //!< %

  op_dot, //!< .

  op_asg, //!< =
};

/*!\brief Span of a token in the source, columns are zero-based and the end
 * column is inclusive.
 */
class TokenPos {
  size_t start, end, lineStart, lineEnd;
public:
  TokenPos(size_t start, size_t end, size_t lineStart, size_t lineEnd)
    : start{start}, end{end}, lineStart{lineStart}, lineEnd{lineEnd} {}
  TokenPos(const TokenPos &pos0, const TokenPos &pos1)
    : start{pos0.start < pos1.start ? pos0.start : pos1.start},
      end{pos0.end > pos1.end ? pos0.end : pos1.end},
      lineStart{pos0.lineStart < pos1.lineStart ? pos0.lineStart : pos1.lineStart},
      lineEnd{pos0.lineEnd > pos1.lineEnd ? pos0.lineEnd : pos1.lineEnd} {}
  virtual ~TokenPos() {}

  size_t getStart() const noexcept { return start; }
  size_t getEnd() const noexcept { return end; }
  size_t getLineStart() const noexcept { return lineStart; }
  size_t getLineEnd() const noexcept { return lineEnd; }

  /*!\return Returns a single column position, columns after start.
   */
  TokenPos at(size_t columns) const noexcept {
    return TokenPos(start + columns, start + columns, lineStart, lineStart);
  }
};

/*!\return Returns the source spelling of op.
 */
std::string operatorToString(Operator op) noexcept;

/*!\return Returns operator precedence of binary operator op
 */
int getOperatorPrecedence(Operator op);

class Lexer {
  std::size_t line;
  std::size_t column;

  std::string lineStr;

  Token curtok;
  Operator curop;
  double curnum;
  int64_t curint;
  std::string curid;

  int curchar;

  std::istream *input;

  size_t token_start, token_end, token_line;
  std::vector<std::string> lines;

  Lexer *host;
  TokenPos origin;

  size_t errorCount;

  //! Count of '(' not closed yet.
  size_t depth;

  /*!\brief Finishes the current line, the next nextChar() call reads the
   * first character of the next line.
   */
  void newLine();

  /*!\brief Finishes the current token (end position) and makes tok the
   * current token.
   */
  Token token(Token tok) noexcept;

  /*!\brief Lexes the text up to the closing quote into curid.
   * \return Returns tok or tok_err.
   */
  Token quoted(Token tok);
public:
  Lexer(std::istream &input);

  /*!\brief Lexer for source text embedded in a token of host. Errors are
   * reported through host, shifted so that column 0 of input is at origin.
   */
  Lexer(std::istream &input, Lexer &host, const TokenPos &origin);
  virtual ~Lexer();

  /*!\brief Aquire next char.
   * \return Returns next char.
   *
   * Gets next character in file-stream. Also generates a string for the
   * current line and counts the current column.
   */
  int nextChar();

  /*!\return Returns char returned by the latest nextChar() call.
   * \see nextChar
   */
  int currentChar() const noexcept;

  /*!\return Returns next token.
   * \see Token, nextToken
   */
  Token nextToken();

  /*!\return Returns token, which was returned by the latest nextToken() call.
   * \see nextToken
   */
  Token currentToken() const noexcept;

  /*!\return Returns operator, which was returned by the lastest
   * nextToken() == tok_op call.
   */
  Operator currentOperator() const noexcept;

  /*!\return Returns floating-point number, which was returned by the latest
   * nextToken() == tok_num call.
   */
  double currentNumber() const noexcept;

  /*!\return Returns integer number, which was returned by the latest
   * nextToken() = tok_int call.
   */
  std::int64_t currentInteger() const noexcept;

  /*!\return Returns identifier, which was returned by the latest
   * nextToken() == tok_id call. For tok_str and tok_istr the text between
   * the quotes.
   */
  const std::string &currentIdentifier() const noexcept;

  size_t currentLine() const noexcept { return token_line; }

  TokenPos getTokenPos() const noexcept {
    return TokenPos(token_start, token_end, token_line, token_line);
  }

  /*!\return Returns the text of line i (zero-based). The line being lexed
   * may still be incomplete.
   */
  const std::string &getLine(size_t i) const noexcept;

  /*!\return Returns count of errors reported by this lexer.
   */
  size_t getErrorCount() const noexcept { return errorCount; }

  /*!\brief Returns precedence of current token.
   */
  int currentPrecedence();

  /*!\brief Prints error to console (std::cerr).
   * \return Returns tok_err.
   */
  Token reportError(const std::string &msg) noexcept;

  Token reportError(const std::string &msg, const TokenPos &pos) noexcept;

  /*!\return Returns count of '(' lexed (or skipped by reportError) and not
   * closed yet.
   */
  size_t getDepth() const noexcept { return depth; }

  /*!\brief Skips source text, across lines, until every open '(' is closed
   * or the end of input is reached. No tokens are produced.
   *
   * Used for error recovery, currentToken() is unchanged.
   */
  void skipGroups();

  /*!\brief True if lines should be ignored/skipped by nextToken.
   * \see nextToken
   */
  bool skipNewLine = false;

  /*!\brief Prefix to print if line was ignored/skipped by nextToken.
   * \see nextToken, skipNewLine
   */
  std::string skippedNewLinePrefix = "";
};

#endif /* INTERP_LEXER_HPP */
