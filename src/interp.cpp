#include "interp/interp.hpp"

static bool isEndOfStatement(Token tok) {
  return tok == tok_eol || tok == tok_eof || tok == tok_delim;
}

bool interpret(std::istream &input, const LowerOptions &options,
    bool interpret_mode) {
  Lexer lexer(input);
  if (interpret_mode)
    lexer.skippedNewLinePrefix = "..";

  Pool pool;
  Environment env(options);

  if (interpret_mode)
    std::cout << "> "; // print prefix
  lexer.nextToken(); // aquire first token

  while (lexer.currentToken() != tok_eof) {
    if (lexer.currentToken() == tok_eol || lexer.currentToken() == tok_delim) {
      if (interpret_mode && lexer.currentToken() == tok_eol)
        std::cout << "> ";

      lexer.nextToken(); // eat eol or ;
      continue;
    }

    Expr *expr = parse(pool, lexer, env);
    if (expr && !isEndOfStatement(lexer.currentToken())) {
      expr = reportSyntaxError(lexer, "Expected end of statement.",
          lexer.getTokenPos());
    }

    if (expr)
      std::cout << expr->toString() << std::endl;

    pool.clear();

    if (!expr) {
      // Error recovery, the lexer skipped the rest of the line. Parentheses
      // of the statement still open may continue on the next lines.
      if (interpret_mode)
        std::cout << "Error." << std::endl;

      lexer.skipNewLine = false;
      if (lexer.currentToken() != tok_eof) {
        lexer.skipGroups();
        lexer.nextToken();
      }
    }
  }

  return lexer.getErrorCount() == 0;
}
