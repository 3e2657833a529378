#ifndef INTERP_PARSER_HPP
#define INTERP_PARSER_HPP

/*!\file interp/parser.hpp
 * \brief Parser of the host language and splicing of interpolated string
 * literals into argument lists.
 */

#include "interp/global.hpp"
#include "interp/lexer.hpp"
#include "interp/lowerer.hpp"
#include "interp/syntax.hpp"

/*!\brief Parses primary expression, including the calls and template
 * instantiations applied to it.
 * \param pool
 * \param lexer
 * \param env
 * \return Returns nullptr on error, otherwise primary expression.
 */
Expr *parsePrimary(Pool &pool, Lexer &lexer, Environment &env);

/*!\return Returns nullptr on error, otherwise parsed tokens from
 * lexer.currentToken() on.
 *
 * \param pool
 * \param lexer
 * \param env
 * \param topLevel If top level, nullptr is returned if eol occured.
 */
Expr *parse(Pool &pool, Lexer &lexer, Environment &env, bool topLevel = true);

/*!\brief Parse right-hand-side
 * \param pool
 * \param lexer
 * \param env
 * \param lhs Already parsed Left-hand-side
 * \param prec current minimum precedence
 * \return Returns nullptr on error, otherwise parsed RHS.
 */
Expr *parseRHS(Pool &pool, Lexer &lexer, Environment &env, Expr *lhs, int prec);

/*!\brief Parses '(' <args> ')'. Interpolated string literals are checked
 * against ctx and spliced into args.
 * \param pool
 * \param lexer Current token must be '('.
 * \param env
 * \param ctx Context of the argument list.
 * \param args Parsed arguments are appended.
 * \return Returns false on error.
 */
bool parseArguments(Pool &pool, Lexer &lexer, Environment &env,
    UsageContext ctx, std::vector<Expr*> &args);

/*!\brief Lowers literal and appends the parts to args: the header (if
 * enabled), a StrExpr for every fragment and the parsed expression of
 * every embedded source.
 * \return Returns false on error (already reported).
 */
bool spliceInterpolation(Pool &pool, Lexer &lexer, Environment &env,
    const InterpolatedLiteral &literal, std::vector<Expr*> &args);

/*!\brief Parses the source of an embedded part as an expression. Errors
 * are reported at their position inside the literal.
 * \return Returns nullptr on error.
 */
Expr *parseEmbedded(Pool &pool, Lexer &lexer, Environment &env,
    const InterpolatedLiteral &literal, const Part &part);

/*!\brief Reports an IllegalContext error at the literal.
 * \param lexer
 * \param literal
 * \param ctx Context the literal was found in.
 * \param argIndex Index of the literal in the argument list.
 * \return Returns nullptr.
 */
Expr *reportIllegalContext(Lexer &lexer, const InterpolatedLiteral &literal,
    UsageContext ctx, size_t argIndex = 0);

#endif /* INTERP_PARSER_HPP */
