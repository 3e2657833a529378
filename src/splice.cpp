#include "interp/parser.hpp"

Expr *reportIllegalContext(Lexer &lexer, const InterpolatedLiteral &literal,
    UsageContext ctx, size_t argIndex) {
  std::string msg;
  if (ctx == ctx_assert && argIndex == 0)
    msg = "Interpolated string literal can't be the condition of assert.";
  else if (ctx == ctx_none)
    msg = "Interpolated string literal is only allowed as a whole argument of "
      "a call, constructor, mixin, template instantiation, pragma(msg) or assert.";
  else
    msg = "Interpolated string literal is not allowed in "
      + contextToString(ctx) + ".";

  LexError error(lex_illegal_context, msg);
  return reportSyntaxError(lexer, error.getName() + ": " + error.getMessage(),
      literal.getTokenPos());
}

Expr *parseEmbedded(Pool &pool, Lexer &lexer, Environment &env,
    const InterpolatedLiteral &literal, const Part &part) {
  std::istringstream input(part.getText());
  Lexer sublexer(input, lexer, literal.getPosition(part.getOffset()));
  sublexer.skipNewLine = true;
  sublexer.nextToken();

  Expr *expr = parse(pool, sublexer, env, false);
  if (!expr)
    return nullptr; // Error forwarding

  if (sublexer.currentToken() != tok_eof)
    return reportSyntaxError(sublexer, "Unexpected token after embedded expression.",
        sublexer.getTokenPos());

  return expr;
}

bool spliceInterpolation(Pool &pool, Lexer &lexer, Environment &env,
    const InterpolatedLiteral &literal, std::vector<Expr*> &args) {
  LowerResult result = lower(literal, env.options);
  if (!result) {
    const LexError &error = result.getError();
    reportSyntaxError(lexer, error.getName() + ": " + error.getMessage(),
        literal.getPosition(error.getOffset()));
    return false;
  }

  const PartSequence &parts = result.getParts();
  if (env.options.emitHeader)
    args.push_back(new HeaderExpr(pool, literal.getTokenPos(), parts));

  for (const Part &part : parts) {
    if (part.isLiteral()) {
      args.push_back(new StrExpr(pool, literal.getPosition(part.getOffset()),
            part.getText()));
      continue;
    }

    Expr *expr = parseEmbedded(pool, lexer, env, literal, part);
    if (!expr)
      return false; // Error forwarding

    args.push_back(expr);
  }

  return true;
}
