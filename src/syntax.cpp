#include "interp/syntax.hpp"

bool isPermittedContext(UsageContext ctx, size_t argIndex) noexcept {
  switch (ctx) {
  case ctx_call:
  case ctx_constructor:
  case ctx_mixin:
  case ctx_template:
  case ctx_pragma_msg:
    return true;
  case ctx_assert:
    return argIndex >= 1;
  case ctx_none:
    return false;
  }

  return false;
}

std::string contextToString(UsageContext ctx) {
  switch (ctx) {
  case ctx_none:
    return "expression";
  case ctx_call:
    return "call argument list";
  case ctx_constructor:
    return "constructor argument list";
  case ctx_mixin:
    return "mixin argument list";
  case ctx_template:
    return "template argument list";
  case ctx_pragma_msg:
    return "pragma(msg) argument list";
  case ctx_assert:
    return "assert argument list";
  }

  return ""; // invalid
}

// BiOpExpr

std::string BiOpExpr::toString() const noexcept {
  int prec = getPrecedence();

  // '=' is right associative, everything else left associative
  std::string left = lhs->toString();
  if (lhs->getPrecedence() < prec
      || (op == op_asg && lhs->getPrecedence() == prec))
    left = "(" + left + ")";

  std::string right = rhs->toString();
  if (rhs->getPrecedence() < prec
      || (op != op_asg && rhs->getPrecedence() == prec))
    right = "(" + right + ")";

  if (op == op_dot)
    return left + "." + right;

  return left + " " + operatorToString(op) + " " + right;
}

// NumExpr

std::string NumExpr::toString() const noexcept {
  std::ostringstream out;
  out << num;

  std::string result = out.str();
  if (result.find_first_of(".e") == std::string::npos)
    result += ".0";

  return result;
}

// HeaderExpr

std::string HeaderExpr::toString() const noexcept {
  std::string result = "__header!(";
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      result += ", ";

    const Part &part = parts[i];
    if (part.isLiteral())
      result += "lit(";
    else if (part.isShorthand())
      result += "id(";
    else
      result += "expr(";

    result += quoteString(part.getText()) + ")";
  }

  return result + ")";
}

// CallExpr

std::vector<const Expr*> CallExpr::getValueArguments() const {
  std::vector<const Expr*> result;
  for (const Expr *arg : args) {
    if (arg->getExpressionType() != expr_header)
      result.push_back(arg);
  }

  return result;
}

std::vector<const HeaderExpr*> CallExpr::getHeaders() const {
  std::vector<const HeaderExpr*> result;
  for (const Expr *arg : args) {
    if (arg->getExpressionType() == expr_header)
      result.push_back(static_cast<const HeaderExpr*>(arg));
  }

  return result;
}

std::string CallExpr::toString() const noexcept {
  std::string arglist;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i > 0)
      arglist += ", ";

    arglist += args[i]->toString();
  }

  switch (kind) {
  case call_function:
    return callee->toString() + "(" + arglist + ")";
  case call_template:
    return callee->toString() + "!(" + arglist + ")";
  case call_constructor:
    return "new " + callee->toString() + "(" + arglist + ")";
  case call_mixin:
    return "mixin(" + arglist + ")";
  case call_pragma:
    return "pragma(" + callee->toString()
      + (args.empty() ? "" : ", " + arglist) + ")";
  case call_assert:
    return "assert(" + arglist + ")";
  }

  return ""; // invalid
}

Expr *reportSyntaxError(Lexer &lexer, const std::string &msg, const TokenPos &pos) {
  lexer.skipNewLine = false; // reset new line skip
  lexer.reportError(msg, pos);
  return nullptr;
}
