/** \file   program.hh
 *  \brief  Abstract syntax tree of a parsed tawk program.
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef SRC_TAWK_PROGRAM_HH_INCLUDED
#define SRC_TAWK_PROGRAM_HH_INCLUDED

#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

#include "tawk.hh"

namespace Tawk {

namespace Ast {
struct Expr;
struct Stmt;

using ExprPtr = std::unique_ptr<Expr>;
using ExprList = std::vector<ExprPtr>;
using StmtPtr = std::unique_ptr<Stmt>;
using StmtList = std::vector<StmtPtr>;

/** \brief  A use of a variable name.  \a local is set when the name is a function parameter.  */
struct VarRef
{
  std::string name;                  ///< Name as written.
  std::optional<std::size_t> local;  ///< Index into the function's parameters.
};

struct NumberLit
{
  Floating value;
};

struct StringLit
{
  std::string value;
};

/** \brief  /ERE/.  Outside of a regex context this means $0 ~ /ERE/.  */
struct RegexLit
{
  std::string ere;  ///< Text of the ERE.
  std::regex re;    ///< Compiled expression.
};

struct Variable
{
  VarRef var;
};

/** \brief  array[subscripts...]  */
struct Index
{
  VarRef array;
  ExprList subscripts;
};

/** \brief  $index  */
struct Field
{
  ExprPtr index;
};

struct Unary
{
  enum class Op { negate, plus, not_ };
  Op op;
  ExprPtr operand;
};

struct Binary
{
  enum class Op {
    add,
    subtract,
    multiply,
    divide,
    modulo,
    power,
    concat,
    less,
    less_equal,
    equal,
    not_equal,
    greater_equal,
    greater,
  };
  Op op;
  ExprPtr lhs;
  ExprPtr rhs;
};

/** \brief  lhs ~ re, or lhs !~ re.  */
struct Match
{
  bool negate;
  ExprPtr lhs;
  ExprPtr re;
};

/** \brief  Short-circuiting && and ||.  */
struct Logical
{
  enum class Op { and_, or_ };
  Op op;
  ExprPtr lhs;
  ExprPtr rhs;
};

struct Ternary
{
  ExprPtr cond;
  ExprPtr then;
  ExprPtr otherwise;
};

/** \brief  target op= value.  Target is a Variable, Index, or Field.  */
struct Assign
{
  enum class Op { assign, add, subtract, multiply, divide, modulo, power };
  Op op;
  ExprPtr target;
  ExprPtr value;
};

struct IncDec
{
  bool increment;
  bool prefix;
  ExprPtr target;
};

/** \brief  (subscripts...) in array  */
struct In
{
  ExprList subscripts;
  VarRef array;
};

/** \brief  Call of a name: user, runtime builtin, or foreign function.  */
struct Call
{
  std::string name;
  ExprList args;
};

struct BuiltinCall
{
  Token::BuiltinFunc func;
  ExprList args;
};

/** \brief  getline [target] [< file].  Either pointer may be null.  */
struct Getline
{
  ExprPtr target;
  ExprPtr file;
};

struct Expr
{
  Location location;
  std::variant<NumberLit, StringLit, RegexLit, Variable, Index, Field, Unary, Binary, Match,
               Logical, Ternary, Assign, IncDec, In, Call, BuiltinCall, Getline>
    node;
};

struct ExprStmt
{
  ExprPtr expr;
};

/** \brief  print or printf, with optional redirection.  */
struct Print
{
  enum class Redirect { none, truncate, append, pipe };
  bool printf_;
  ExprList args;
  Redirect redirect;
  ExprPtr dest;
};

struct If
{
  ExprPtr cond;
  StmtPtr then;
  StmtPtr otherwise;  ///< May be null.
};

struct While
{
  ExprPtr cond;
  StmtPtr body;
};

struct DoWhile
{
  StmtPtr body;
  ExprPtr cond;
};

/** \brief  for (init; cond; update) body.  Any of init, cond, and update may be null.  */
struct For
{
  StmtPtr init;
  ExprPtr cond;
  StmtPtr update;
  StmtPtr body;
};

struct ForIn
{
  VarRef var;
  VarRef array;
  StmtPtr body;
};

struct Block
{
  StmtList stmts;
};

struct Next
{
};

struct NextFile
{
};

struct Exit
{
  ExprPtr code;  ///< May be null.
};

struct Return
{
  ExprPtr value;  ///< May be null.
};

struct Break
{
};

struct Continue
{
};

/** \brief  delete array[subscripts], or delete array when subscripts is empty.  */
struct Delete
{
  VarRef array;
  ExprList subscripts;
};

struct Stmt
{
  Location location;
  std::variant<ExprStmt, Print, If, While, DoWhile, For, ForIn, Block, Next, NextFile, Exit,
               Return, Break, Continue, Delete>
    node;
};

/** \brief  Pattern of a rule.  */
struct Pattern
{
  enum class Kind { always, begin, end, expr, range };
  Kind kind;
  ExprPtr first;  ///< Expression, or start of range.
  ExprPtr last;   ///< End of range.
};

struct Rule
{
  Pattern pattern;
  StmtPtr action;
  Location location;
};

struct FunctionDef
{
  std::string name;
  std::vector<std::string> params;
  StmtPtr body;
  Location location;
};

/** \brief       Build an expression node.
 *  \param  loc  Location of the expression.
 *  \param  node Node.
 */
template<typename T>
auto make_expr(Location const& loc, T&& node) -> ExprPtr
{
  return std::make_unique<Expr>(Expr{loc, std::forward<T>(node)});
}

/** \brief       Build a statement node.
 *  \param  loc  Location of the statement.
 *  \param  node Node.
 */
template<typename T>
auto make_stmt(Location const& loc, T&& node) -> StmtPtr
{
  return std::make_unique<Stmt>(Stmt{loc, std::forward<T>(node)});
}
}  // namespace Ast

namespace Details {
class ParseState;
}  // namespace Details

/** \brief  A parsed program.  Immutable once parsing has finished.  */
class Program
{
public:
  Program() = default;
  ~Program() = default;
  Program(Program const&) = delete;
  Program(Program&&) noexcept = default;
  auto operator=(Program const&) -> Program& = delete;
  auto operator=(Program&&) noexcept -> Program& = default;

  /** \brief  Get the rules in program order.  */
  [[nodiscard]] auto rules() const noexcept -> std::vector<Ast::Rule> const&;

  /** \brief  Get the function named \a name, or nullptr if there is no such function.  */
  [[nodiscard]] auto function(std::string const& name) const -> Ast::FunctionDef const*;

  /** \brief  Does the program have a rule of kind \a kind?  */
  [[nodiscard]] auto has_rule(Ast::Pattern::Kind kind) const -> bool;

  /** \brief  Does the program have any rules other than BEGIN rules?  */
  [[nodiscard]] auto needs_input() const -> bool;

private:
  friend class Details::ParseState;

  std::vector<Ast::Rule> rules_;                         ///< Rules in order.
  std::map<std::string, Ast::FunctionDef> functions_;  ///< Function definitions.
};

/** \brief      Compile an extended regular expression with awk syntax.
 *  \param  ere Expression text.
 *  \return     Compiled expression.
 *
 * Throws std::regex_error if \a ere is invalid.
 */
auto compile_ere(std::string const& ere) -> std::regex;

/** \brief        Parse a program.
 *  \param  lexer Lexer to read tokens from.
 *  \return       Parsed program.
 *
 * Throws ParseError (or LexError) on failure.
 */
auto parse(std::unique_ptr<Lexer>&& lexer) -> Program;

}  // namespace Tawk

#endif  // SRC_TAWK_PROGRAM_HH_INCLUDED
