#ifndef INTERP_SYNTAX_HPP
#define INTERP_SYNTAX_HPP

/*!\file interp/syntax.hpp
 * \brief Syntax tree of the host language.
 */

#include "interp/global.hpp"
#include "interp/lexer.hpp"
#include "interp/lowerer.hpp"
#include "interp/pool.hpp"

class Expr;
class BiOpExpr;
class NumExpr;
class IntExpr;
class IdExpr;
class StrExpr;
class HeaderExpr;
class CallExpr;

/*!\brief Types of expressions.
 * \see Expr, Expr::getExpressionType
 */
enum ExprType : int {
  expr_biop, //!< Binary operator
  expr_num, //!< Floating-point Number
  expr_int, //!< Integer number
  expr_id,  //!< Identifier
  expr_str, //!< String constant
  expr_call, //!< Call, constructor, mixin, template instantiation, ...
  expr_header, //!< Synthesized header of a lowered interpolated literal
};

/*!\brief Syntactic positions of interpolated string literals.
 * \see isPermittedContext
 */
enum UsageContext : int {
  ctx_none, //!< Anything not listed below
  ctx_call, //!< f(...)
  ctx_constructor, //!< new T(...)
  ctx_mixin, //!< mixin(...)
  ctx_template, //!< T!(...)
  ctx_pragma_msg, //!< pragma(msg, ...)
  ctx_assert, //!< assert(...)
};

/*!\brief Kinds of argument lists.
 * \see CallExpr
 */
enum CallKind : int {
  call_function,
  call_template,
  call_constructor,
  call_mixin,
  call_pragma,
  call_assert,
};

/*!\return Returns true if an interpolated string literal may be argument
 * argIndex (zero-based) of an argument list in context ctx.
 *
 * assert only accepts literals as message, so from the second argument on.
 */
bool isPermittedContext(UsageContext ctx, size_t argIndex) noexcept;

/*!\return Returns a description of ctx for messages.
 */
std::string contextToString(UsageContext ctx);

/*!\brief State shared by the parse functions.
 */
class Environment {
public:
  LowerOptions options;

  Environment(const LowerOptions &options = LowerOptions())
    : options(options) {}
  virtual ~Environment() {}
};

/*!\brief Main expression handle (should only be used as parent class).
 *
 * Expressions are owned by the Pool they were created with.
 */
class Expr : public PoolObj {
  TokenPos pos;
  ExprType type;
public:
  Expr(Pool &pool, ExprType type, const TokenPos &pos)
      : PoolObj(pool), pos(pos), type{type} {}

  virtual ~Expr() {}

  /*!\return Returns position of token in code.
   */
  const TokenPos &getTokenPos() const noexcept { return pos; }

  /*!\return Returns expression in the host language.
   */
  virtual std::string toString() const noexcept { return std::string(); }

  /*!\return Returns the type of expression.
   * \see ExprType
   */
  ExprType getExpressionType() const noexcept { return type; }

  /*!\return Returns binding strength when printed. Primary expressions bind
   * stronger than every operator.
   * \see getOperatorPrecedence
   */
  virtual int getPrecedence() const noexcept { return 8; }
};

/*!\brief Binary operator expression.
 */
class BiOpExpr : public Expr {
  Operator op;
  Expr *lhs, *rhs;
public:
  BiOpExpr(Pool &pool, Operator op, Expr *lhs, Expr *rhs)
      : Expr(pool, expr_biop, TokenPos(lhs->getTokenPos(), rhs->getTokenPos())),
        op{op}, lhs{lhs}, rhs{rhs} {}

  virtual ~BiOpExpr() {}

  Operator getOperator() const noexcept { return op; }
  const Expr &getLHS() const noexcept { return *lhs; }
  const Expr &getRHS() const noexcept { return *rhs; }

  virtual std::string toString() const noexcept override;

  virtual int getPrecedence() const noexcept override {
    return getOperatorPrecedence(op);
  }
};

/*!\brief Floating-point number expression.
 */
class NumExpr : public Expr {
  double num;
public:
  NumExpr(Pool &pool, const TokenPos &pos, double num)
      : Expr(pool, expr_num, pos), num{num} {}

  virtual ~NumExpr() {}

  double getNumber() const noexcept { return num; }

  virtual std::string toString() const noexcept override;
};

/*!\brief Integer number expression.
 */
class IntExpr : public Expr {
  std::int64_t num;
public:
  IntExpr(Pool &pool, const TokenPos &pos, std::int64_t num)
      : Expr(pool, expr_int, pos), num{num} {}

  virtual ~IntExpr() {}

  std::int64_t getNumber() const noexcept { return num; }

  virtual std::string toString() const noexcept override {
    return std::to_string(num);
  }
};

/*!\brief Identifier expression.
 */
class IdExpr : public Expr {
  std::string id;
public:
  IdExpr(Pool &pool, const TokenPos &pos, const std::string &id)
      : Expr(pool, expr_id, pos), id(id) {}

  virtual ~IdExpr() {}

  const std::string &getName() const noexcept { return id; }

  virtual std::string toString() const noexcept override {
    return id;
  }
};

/*!\brief String constant, also the fragments of spliced literals.
 */
class StrExpr : public Expr {
  std::string text;
public:
  StrExpr(Pool &pool, const TokenPos &pos, const std::string &text)
      : Expr(pool, expr_str, pos), text(text) {}

  virtual ~StrExpr() {}

  const std::string &getText() const noexcept { return text; }

  virtual std::string toString() const noexcept override {
    return quoteString(text);
  }
};

/*!\brief Compile-time value preceding the arguments of a spliced literal.
 *
 * Records the parts of the literal, so that argument processing can
 * recover its original shape. Argument processing, which doesn't know
 * about it, should skip it.
 * \see CallExpr::getValueArguments
 */
class HeaderExpr : public Expr {
  PartSequence parts;
public:
  HeaderExpr(Pool &pool, const TokenPos &pos, const PartSequence &parts)
      : Expr(pool, expr_header, pos), parts(parts) {}

  virtual ~HeaderExpr() {}

  const PartSequence &getParts() const noexcept { return parts; }

  /*!\return Returns count of arguments following the header, which
   * belong to it.
   */
  size_t getArgumentCount() const noexcept { return parts.size(); }

  virtual std::string toString() const noexcept override;
};

/*!\brief Argument list applied to something.
 */
class CallExpr : public Expr {
  CallKind kind;
  UsageContext ctx;
  Expr *callee;
  std::vector<Expr*> args;
public:
  /*!\param pool
   * \param pos
   * \param kind
   * \param ctx Context of the argument list.
   * \param callee Called function, template or type. Name of the pragma for
   * call_pragma. nullptr for mixin and assert.
   * \param args
   */
  CallExpr(Pool &pool, const TokenPos &pos, CallKind kind, UsageContext ctx,
           Expr *callee, const std::vector<Expr*> &args)
      : Expr(pool, expr_call, pos), kind{kind}, ctx{ctx}, callee{callee},
        args(args) {}

  virtual ~CallExpr() {}

  CallKind getKind() const noexcept { return kind; }
  UsageContext getContext() const noexcept { return ctx; }
  const Expr *getCallee() const noexcept { return callee; }
  const std::vector<Expr*> &getArguments() const noexcept { return args; }

  /*!\return Returns arguments without headers.
   */
  std::vector<const Expr*> getValueArguments() const;

  /*!\return Returns headers of spliced literals in order.
   */
  std::vector<const HeaderExpr*> getHeaders() const;

  virtual std::string toString() const noexcept override;
};

/*!\brief Reports syntax error.
 * \return Returns nullptr.
 */
Expr *reportSyntaxError(Lexer &lexer, const std::string &msg,
    const TokenPos &pos);

#endif /* INTERP_SYNTAX_HPP */
