#include "interp/parser.hpp"

/* only for parsing primary expressions and argument lists */

/*!\brief Parses <arg> (',' <arg>)* up to the closing ')', which is not
 * eaten.
 */
static bool parseArgumentList(Pool &pool, Lexer &lexer, Environment &env,
    UsageContext ctx, std::vector<Expr*> &args) {
  for (size_t argIndex = 0; ; ++argIndex) {
    if (lexer.currentToken() == tok_istr) {
      InterpolatedLiteral literal(lexer.currentIdentifier(), lexer.getTokenPos());
      if (!isPermittedContext(ctx, argIndex)) {
        reportIllegalContext(lexer, literal, ctx, argIndex);
        return false;
      }

      lexer.nextToken(); // eat literal

      // The literal must be the whole argument
      if (lexer.currentToken() != tok_comma
          && lexer.currentToken() != tok_cbrace) {
        reportIllegalContext(lexer, literal, ctx_none);
        return false;
      }

      if (!spliceInterpolation(pool, lexer, env, literal, args))
        return false; // Error forwarding
    } else {
      Expr *arg = parse(pool, lexer, env, false);
      if (!arg)
        return false; // Error forwarding

      args.push_back(arg);
    }

    if (lexer.currentToken() == tok_cbrace)
      return true;

    if (lexer.currentToken() != tok_comma) {
      reportSyntaxError(lexer, "Expected ',' or ')'.", lexer.getTokenPos());
      return false;
    }

    lexer.nextToken(); // eat ,
  }
}

bool parseArguments(Pool &pool, Lexer &lexer, Environment &env,
    UsageContext ctx, std::vector<Expr*> &args) {
  bool skipNewLine = lexer.skipNewLine;
  lexer.skipNewLine = true;
  lexer.nextToken(); // eat (

  if (lexer.currentToken() != tok_cbrace
      && !parseArgumentList(pool, lexer, env, ctx, args))
    return false;

  lexer.skipNewLine = skipNewLine;
  lexer.nextToken(); // eat )

  return true;
}

/*!\brief Expects '(' as current token.
 * \return Returns false after reporting an error if it isn't.
 */
static bool expectOpenBrace(Lexer &lexer, const std::string &after) {
  if (lexer.currentToken() == tok_obrace)
    return true;

  reportSyntaxError(lexer, "Expected '(' after " + after + ".", lexer.getTokenPos());
  return false;
}

/*!\brief Parses 'pragma' '(' <id> [',' <args>] ')'.
 */
static Expr *parsePragma(Pool &pool, Lexer &lexer, Environment &env) {
  TokenPos pos = lexer.getTokenPos();
  lexer.nextToken(); // eat pragma

  if (!expectOpenBrace(lexer, "'pragma'"))
    return nullptr;

  bool skipNewLine = lexer.skipNewLine;
  lexer.skipNewLine = true;
  lexer.nextToken(); // eat (

  if (lexer.currentToken() != tok_id)
    return reportSyntaxError(lexer, "Expected name of pragma.", lexer.getTokenPos());

  Expr *name = new IdExpr(pool, lexer.getTokenPos(), lexer.currentIdentifier());
  UsageContext ctx = lexer.currentIdentifier() == "msg" ? ctx_pragma_msg : ctx_none;
  lexer.nextToken(); // eat name

  std::vector<Expr*> args;
  if (lexer.currentToken() == tok_comma) {
    lexer.nextToken(); // eat ,
    if (!parseArgumentList(pool, lexer, env, ctx, args))
      return nullptr; // Error forwarding
  }

  if (lexer.currentToken() != tok_cbrace)
    return reportSyntaxError(lexer, "Expected ',' or ')'.", lexer.getTokenPos());

  lexer.skipNewLine = skipNewLine;
  lexer.nextToken(); // eat )

  return new CallExpr(pool, pos, call_pragma, ctx, name, args);
}

Expr *parsePrimary(Pool &pool, Lexer &lexer, Environment &env) {
  Expr *result = nullptr;

  switch (lexer.currentToken()) {
    case tok_id: {
        result = new IdExpr(pool, lexer.getTokenPos(), lexer.currentIdentifier());

        lexer.nextToken(); // eat id
        break;
      } // end case tok_id
    case tok_num: {
        result = new NumExpr(pool, lexer.getTokenPos(),
            lexer.currentNumber());

        lexer.nextToken(); // eat num
        break;
      } // end case tok_num
    case tok_int: {
        result = new IntExpr(pool, lexer.getTokenPos(),
            lexer.currentInteger());

        lexer.nextToken(); // eat num
        break;
      } // end case tok_int
    case tok_str: {
        result = new StrExpr(pool, lexer.getTokenPos(),
            lexer.currentIdentifier());

        lexer.nextToken(); // eat string
        break;
      } // end case tok_str
    case tok_istr: {
        // Not an argument (parseArgumentList handles those)
        InterpolatedLiteral literal(lexer.currentIdentifier(), lexer.getTokenPos());
        return reportIllegalContext(lexer, literal, ctx_none);
      } // end case tok_istr
    case tok_obrace: {
        bool skipNewLine = lexer.skipNewLine;
        lexer.skipNewLine = true;
        lexer.nextToken(); // eat (

        result = parse(pool, lexer, env, false);
        if (!result)
          return nullptr; // Error forwarding

        if (lexer.currentToken() != tok_cbrace) {
          return reportSyntaxError(lexer, "Expected matching closing bracket )",
              lexer.getTokenPos());
        }

        lexer.skipNewLine = skipNewLine;
        lexer.nextToken(); // eat )

        break;
      } // end case tok_obrace
    case tok_new: {
        TokenPos pos = lexer.getTokenPos();
        lexer.nextToken(); // eat new

        if (lexer.currentToken() != tok_id)
          return reportSyntaxError(lexer, "Expected type after 'new'.",
              lexer.getTokenPos());

        Expr *type = new IdExpr(pool, lexer.getTokenPos(), lexer.currentIdentifier());
        lexer.nextToken(); // eat id

        if (!expectOpenBrace(lexer, "type"))
          return nullptr;

        std::vector<Expr*> args;
        if (!parseArguments(pool, lexer, env, ctx_constructor, args))
          return nullptr; // Error forwarding

        result = new CallExpr(pool, pos, call_constructor, ctx_constructor, type, args);
        break;
      } // end case tok_new
    case tok_mixin: {
        TokenPos pos = lexer.getTokenPos();
        lexer.nextToken(); // eat mixin

        if (!expectOpenBrace(lexer, "'mixin'"))
          return nullptr;

        std::vector<Expr*> args;
        if (!parseArguments(pool, lexer, env, ctx_mixin, args))
          return nullptr; // Error forwarding

        result = new CallExpr(pool, pos, call_mixin, ctx_mixin, nullptr, args);
        break;
      } // end case tok_mixin
    case tok_assert: {
        TokenPos pos = lexer.getTokenPos();
        lexer.nextToken(); // eat assert

        if (!expectOpenBrace(lexer, "'assert'"))
          return nullptr;

        std::vector<Expr*> args;
        if (!parseArguments(pool, lexer, env, ctx_assert, args))
          return nullptr; // Error forwarding

        if (args.empty())
          return reportSyntaxError(lexer, "Expected condition of assert.", pos);

        result = new CallExpr(pool, pos, call_assert, ctx_assert, nullptr, args);
        break;
      } // end case tok_assert
    case tok_pragma: {
        result = parsePragma(pool, lexer, env);
        if (!result)
          return nullptr; // Error forwarding

        break;
      } // end case tok_pragma
    case tok_err:
      return nullptr; // Error forwarding
    default:
      return reportSyntaxError(lexer, "Expected expression.", lexer.getTokenPos());
  }

  // Calls and template instantiations
  while (true) {
    if (lexer.currentToken() == tok_obrace) {
      std::vector<Expr*> args;
      if (!parseArguments(pool, lexer, env, ctx_call, args))
        return nullptr; // Error forwarding

      result = new CallExpr(pool, result->getTokenPos(), call_function, ctx_call,
          result, args);
      continue;
    }

    if (lexer.currentToken() == tok_bang) {
      lexer.nextToken(); // eat !
      if (!expectOpenBrace(lexer, "'!'"))
        return nullptr;

      std::vector<Expr*> args;
      if (!parseArguments(pool, lexer, env, ctx_template, args))
        return nullptr; // Error forwarding

      result = new CallExpr(pool, result->getTokenPos(), call_template, ctx_template,
          result, args);
      continue;
    }

    break;
  }

  return result;
}
