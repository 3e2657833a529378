#ifndef INTERP_INTERP_HPP
#define INTERP_INTERP_HPP

/*!\file interp/interp.hpp
 * \brief Main file of the project. You want to include this, nothing else.
 */

#include "interp/global.hpp"
#include "interp/lexer.hpp"
#include "interp/lowerer.hpp"
#include "interp/parser.hpp"
#include "interp/syntax.hpp"

/*!\mainpage Interpolated string literals
 *
 * Lowering of interpolated string literals (i"...") of a small D-like host
 * language. Every literal, which is an argument of a call, is replaced by
 * its parts: literal fragments become string constants and embedded
 * expressions are parsed and become arguments themselves.
 *
 *     <program> := e | <stmt> | <stmt> <newline> <program>
 *     <stmt> := <expr> | <expr> ';'
 *     <expr> := <primary>
 *             | <expr> <binop> <expr>
 *     <primary> := <id>
 *                | <num>
 *                | <string>
 *                | '(' <expr> ')'
 *                | <primary> '(' <args> ')'
 *                | <primary> '!' '(' <args> ')'
 *                | 'new' <id> '(' <args> ')'
 *                | 'mixin' '(' <args> ')'
 *                | 'pragma' '(' <id> ')'
 *                | 'pragma' '(' <id> ',' <args> ')'
 *                | 'assert' '(' <args> ')'
 *     <args> := e | <arg> | <arg> ',' <args>
 *     <arg> := <expr> | <istring>
 *
 * Precedence:
 *
 * - '=': 1
 * - '||': 2
 * - '&&': 3
 * - '==', '!=', '<=', '>=', '<', '>': 4
 * - '+', '-', '~': 5
 * - '*', '/', '%': 6
 * - '.': 7
 *
 * ## Interpolated string literals
 *
 * With the dollar convention (default):
 *
 *     writeln(i"Hello, $name! $(count + 1) new, $$5 each")
 *
 * lowers to
 *
 *     writeln(__header!(lit("Hello, "), id("name"), lit("! "),
 *       expr("count + 1"), lit(" new, $5 each")),
 *       "Hello, ", name, "! ", count + 1, " new, $5 each")
 *
 * With the brace convention the same literal is written
 * i"Hello, {name}! {count + 1} new, $5 each" and literal braces are
 * doubled ({{ and }}).
 *
 * Literals are only allowed as a whole argument of a call, a constructor,
 * mixin, a template instantiation, pragma(msg) and from the second argument
 * on of assert.
 */

/*!\brief Lowers every statement of input and prints it to std::cout.
 * \param input
 * \param options Convention and lowering options.
 * \param interpret_mode Prints some pretty helpers (line prefixes) if true.
 * \return Returns true on success, false if error occured.
 */
bool interpret(std::istream &input, const LowerOptions &options,
    bool interpret_mode = false);

#endif /* INTERP_INTERP_HPP */
