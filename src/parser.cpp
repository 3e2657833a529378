#include "interp/parser.hpp"

Expr *parse(Pool &pool, Lexer &lexer, Environment &env, bool topLevel) {
  if (lexer.currentToken() == tok_err)
    return nullptr; // Error forwarding

  if (topLevel) {
    switch (lexer.currentToken()) {
    case tok_eol:
    case tok_eof:
    case tok_delim:
      return nullptr;
    default:
      break;
    }
  }

  Expr *primaryExpr = parsePrimary(pool, lexer, env);
  if (!primaryExpr)
    return nullptr; // error forwarding

  if (lexer.currentToken() != tok_op)
    return primaryExpr;

  // 0 is least binding precedence
  return parseRHS(pool, lexer, env, primaryExpr, 0);
}

static bool isAssignable(const Expr *expr) {
  return expr->getExpressionType() == expr_id
    || (expr->getExpressionType() == expr_biop
        && static_cast<const BiOpExpr*>(expr)->getOperator() == op_dot);
}

Expr *parseRHS(Pool &pool, Lexer &lexer, Environment &env, Expr *lhs, int prec) {
  while (lexer.currentToken() == tok_op && lexer.currentPrecedence() >= prec) {
    Operator op = lexer.currentOperator();
    int opprec = lexer.currentPrecedence();

    if (op == op_asg && !isAssignable(lhs))
      return reportSyntaxError(lexer, "Expected identifier or member on the left of '='!",
          lhs->getTokenPos());

    lexer.nextToken(); // eat op

    Expr *rhs = parsePrimary(pool, lexer, env);
    if (!rhs) return nullptr; // Error forwarding

    while (lexer.currentToken() == tok_op
        && (lexer.currentPrecedence() > opprec
            || (lexer.currentOperator() == op_asg // right associative
                && lexer.currentPrecedence() == opprec))) {
      rhs = parseRHS(pool, lexer, env, rhs, lexer.currentPrecedence());
      if (!rhs) return nullptr; // Error forwarding
    }

    lhs = new BiOpExpr(pool, op, lhs, rhs);
  }

  return lhs;
}
