#include "interp/lexer.hpp"

Lexer::Lexer(std::istream &input)
  : line{0}, column{0}, lineStr(), curtok{tok_eof}, curop{op_asg},
    curnum{0.0}, curint{0}, curid(), curchar{-2}, input{&input},
    token_start{0}, token_end{0}, token_line{0}, lines(),
    host{nullptr}, origin(0, 0, 0, 0), errorCount{0}, depth{0} {
}

Lexer::Lexer(std::istream &input, Lexer &host, const TokenPos &origin)
  : line{0}, column{0}, lineStr(), curtok{tok_eof}, curop{op_asg},
    curnum{0.0}, curint{0}, curid(), curchar{-2}, input{&input},
    token_start{0}, token_end{0}, token_line{0}, lines(),
    host{&host}, origin(origin), errorCount{0}, depth{0} {
}

Lexer::~Lexer() {

}

static Token identifierToken(const std::string &id) {
  if (id == "new")
    return tok_new;
  if (id == "mixin")
    return tok_mixin;
  if (id == "pragma")
    return tok_pragma;
  if (id == "assert")
    return tok_assert;

  return tok_id;
}

static bool isIdentifierStart(int c) {
  return c == '_' || (c >= 0 && isalpha(c));
}

static bool isIdentifierChar(int c) {
  return c == '_' || (c >= 0 && isalnum(c));
}

int Lexer::nextChar() {
  // -2: nothing read on this line yet
  if (curchar >= 0 && curchar != '\n')
    ++column;

  curchar = input->get();

  if (curchar != '\n' && curchar != EOF)
    lineStr += (char) curchar;

  return curchar;
}

int Lexer::currentChar() const noexcept {
  return curchar;
}

Token Lexer::token(Token tok) noexcept {
  token_end = column > token_start ? column - 1 : token_start;
  return curtok = tok;
}

Token Lexer::quoted(Token tok) {
  nextChar(); // eat "

  curid = "";
  while (curchar != '"' && curchar != '\n' && curchar != EOF) {
    curid += (char) curchar;
    nextChar(); // eat char
  }

  if (curchar != '"')
    return curtok = reportError("Expected \", not newline or eof.");

  nextChar(); // eat "

  return token(tok);
}

Token Lexer::nextToken() {
  if (curchar == -2)
    nextChar();

  // Skip spaces
  while (curchar == ' ' || curchar == '\r' || curchar == '\t') {
    nextChar();
  }

  token_start = column;
  token_line = line;

  switch (curchar) {
  case '+':
    nextChar(); // eat +
    curop = op_add;
    return token(tok_op);
  case '-':
    nextChar(); // eat -
    curop = op_sub;
    return token(tok_op);
  case '~':
    nextChar(); // eat ~
    curop = op_cat;
    return token(tok_op);
  case '*':
    nextChar(); // eat *
    curop = op_mul;
    return token(tok_op);
  case '%':
    nextChar(); // eat %
    curop = op_mod;
    return token(tok_op);
  case '/':
    nextChar(); // eat /
    if (curchar == '/') {
      // it's a comment
      while (curchar != '\n' && curchar != EOF)
        nextChar();

      return nextToken();
    }

    curop = op_div;
    return token(tok_op);
  case '=':
    nextChar(); // eat =
    if (curchar == '=') {
      curop = op_eq;
      nextChar(); // eat =
    } else
      curop = op_asg;
    return token(tok_op);
  case '!':
    nextChar(); // eat !
    if (curchar == '=') {
      curop = op_neq;
      nextChar(); // eat =
      return token(tok_op);
    }

    return token(tok_bang);
  case '<':
    nextChar(); // eat <
    if (curchar == '=') {
      curop = op_leq;
      nextChar(); // eat =
    } else
      curop = op_le;
    return token(tok_op);
  case '>':
    nextChar(); // eat >
    if (curchar == '=') {
      curop = op_geq;
      nextChar(); // eat =
    } else
      curop = op_gt;
    return token(tok_op);
  case '.':
    nextChar(); // eat .
    curop = op_dot;
    return token(tok_op);
  case '(':
    nextChar(); // eat (
    ++depth;
    return token(tok_obrace);
  case ')':
    nextChar(); // eat )
    if (depth > 0)
      --depth;
    return token(tok_cbrace);
  case ',':
    nextChar(); // eat ,
    return token(tok_comma);
  case ';':
    nextChar(); // eat ;
    return token(tok_delim);
  case '&':
    nextChar(); // eat &
    if (curchar == '&') {
      nextChar(); // eat &
      curop = op_land;
      return token(tok_op);
    }

    return curtok = reportError("Unknown/Unsupported character!");
  case '|':
    nextChar(); // eat |
    if (curchar == '|') {
      nextChar(); // eat |
      curop = op_lor;
      return token(tok_op);
    }

    return curtok = reportError("Unknown/Unsupported character!");
  case '"':
    return quoted(tok_str);
  }

  if (curchar >= 0 && isdigit(curchar)) {
    // Number
    double num = 0.0;
    curint = 0;
    bool intOverflow = false;
    while (curchar >= 0 && isdigit(curchar)) {
      int digit = curchar - '0';
      if (curint > (INT64_MAX - digit) / 10)
        intOverflow = true;
      else
        curint = curint * 10 + digit;

      num *= 10.0;
      num += digit;

      nextChar(); // Eat digit
    }

    curnum = num;

    if (curchar == '.') {
      nextChar(); // Eat .

      std::size_t digitsAfterComma = 0;
      double numAfterComma = 0.0;
      while (curchar >= 0 && isdigit(curchar)) {
        numAfterComma *= 10.0;
        numAfterComma += curchar - '0';
        nextChar(); // Eat digit
        ++digitsAfterComma; // Increase digit count after comma
      }

      if (digitsAfterComma == 0)
        return curtok = reportError("At least one digit expected after '.'.");

      while (digitsAfterComma-- > 0)
        numAfterComma /= 10.0;

      curnum = num + numAfterComma;
      return token(tok_num);
    } else if (isIdentifierStart(curchar))
      return curtok = reportError("Alphabetic characters are not allowed directly after numbers!");

    if (intOverflow)
      return curtok = reportError("Integer literal too large.");

    // it's an integer
    return token(tok_int);
  }

  if (isIdentifierStart(curchar)) {
    // Identifier
    curid = "";
    while (isIdentifierChar(curchar)) {
      curid += (char) curchar;
      nextChar(); // Eat alnum.
    }

    // i"..." is an interpolated string literal
    if (curid == "i" && curchar == '"')
      return quoted(tok_istr);

    return token(identifierToken(curid));
  }

  if (curchar == '\n') {
    token_end = token_start;
    curtok = tok_eol;

    newLine();

    if (this->skipNewLine) {
      if (!this->skippedNewLinePrefix.empty())
        std::cout << this->skippedNewLinePrefix;

      return this->nextToken();
    }

    return curtok; // don't skip, return line
  }

  if (curchar == EOF)
    return token(tok_eof);

  return curtok = reportError("Unknown/Unsupported character!");
}

void Lexer::newLine() {
  lines.push_back(lineStr);
  lineStr = "";
  ++line;
  column = 0;
  curchar = -2; // we want to reach eol token before next line was typed
}

void Lexer::skipGroups() {
  while (depth > 0 && curchar != EOF) {
    switch (curchar) {
    case '\n':
      newLine();
      break;
    case '"':
      nextChar(); // eat "
      while (curchar != '"' && curchar != '\n' && curchar != EOF)
        nextChar();

      if (curchar != '"')
        continue; // unterminated
      break;
    case '/':
      nextChar(); // eat /
      if (curchar == '/') {
        while (curchar != '\n' && curchar != EOF)
          nextChar();
      }
      continue;
    case '(':
      ++depth;
      break;
    case ')':
      --depth;
      break;
    }

    nextChar();
  }
}

Token Lexer::currentToken() const noexcept {
  return curtok;
}

Operator Lexer::currentOperator() const noexcept {
  return curop;
}

double Lexer::currentNumber() const noexcept {
  return curnum;
}

std::int64_t Lexer::currentInteger() const noexcept {
  return curint;
}

const std::string &Lexer::currentIdentifier() const noexcept {
  return curid;
}

const std::string &Lexer::getLine(size_t i) const noexcept {
  if (i < lines.size())
    return lines[i];

  return lineStr;
}

Token Lexer::reportError(const std::string &msg) noexcept {
  return reportError(msg, TokenPos(token_start, column, token_line, token_line));
}

Token Lexer::reportError(const std::string &msg, const TokenPos &pos) noexcept {
  if (host) {
    // Embedded source, report at the position in the host's line
    return host->reportError(msg,
        TokenPos(origin.getStart() + pos.getStart(),
          origin.getStart() + pos.getEnd(),
          origin.getLineStart(), origin.getLineStart()));
  }

  ++errorCount;

  // Advance to end of line, parentheses still count
  bool inString = false;
  while (curchar != -2 && curchar != '\n' && curchar != EOF) {
    if (curchar == '"')
      inString = !inString;
    else if (!inString && curchar == '(')
      ++depth;
    else if (!inString && curchar == ')' && depth > 0)
      --depth;

    nextChar();
  }

  // Print line
  const std::string &lineText = getLine(pos.getLineStart());
  std::cerr << lineText << std::endl;

  size_t start, end;
  if (pos.getStart() <= pos.getEnd()) {
    start = pos.getStart();
    end = pos.getEnd();
  } else {
    start = pos.getEnd();
    end = pos.getStart();
  }

  // Mark position
  for (size_t i = 0; i < end; ++i) {
    if (i < lineText.size() && lineText[i] == '\t')
      std::cerr << '\t';
    else if (i < start)
      std::cerr << ' ';
    else
      std::cerr << '~';
  }
  std::cerr << '^' << std::endl;

  // Print error message
  if (!msg.empty())
    std::cerr << pos.getLineStart() + 1 << ':' << pos.getStart() + 1 << ": " << msg << std::endl;

  if (!msg.empty() && curtok == tok_eof)
    std::cerr << pos.getLineStart() + 1 << ':' << pos.getStart() + 1 << ": Unexpected end of file." << std::endl;

  return tok_err;
}

int getOperatorPrecedence(Operator op) {
  switch (op) {
  case op_asg:
    return 1;
  case op_lor:
    return 2;
  case op_land:
    return 3;
  case op_eq:
  case op_neq:
  case op_leq:
  case op_geq:
  case op_le:
  case op_gt:
    return 4;
  case op_add:
  case op_sub:
  case op_cat:
    return 5;
  case op_mul:
  case op_div:
  case op_mod:
    return 6;
  case op_dot:
    return 7;
  }

  return 0;
}

int Lexer::currentPrecedence() {
  if (currentToken() == tok_op)
    return getOperatorPrecedence(currentOperator());

  return 0;
}

std::string operatorToString(Operator op) noexcept {
  switch (op) {
  case op_eq:
    return "==";
  case op_neq:
    return "!=";
  case op_leq:
    return "<=";
  case op_geq:
    return ">=";
  case op_le:
    return "<";
  case op_gt:
    return ">";
  case op_land:
    return "&&";
  case op_lor:
    return "||";
  case op_add:
    return "+";
  case op_sub:
    return "-";
  case op_cat:
    return "~";
  case op_mul:
    return "*";
  case op_div:
    return "/";
  case op_mod:
    return "%";
  case op_dot:
    return ".";
  case op_asg:
    return "=";
  }

  return ""; // invalid
}
