/** \file   parser.cc
 *  \brief  tawk Parser
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk/utils.hh"

#include "tawk-messages.hh"

#include <algorithm>
#include <cassert>
#include <limits>
#include <memory>
#include <regex>
#include <variant>

#include "program.hh"

using Msg = Tawk::Msg;
namespace {
/** \brief       Raise a ParseError.
 *  \param  msg  Message ID
 *  \param  loc  Location of error
 *  \param  args Arguments for the message.
 */
template<typename... Ts>
[[noreturn]] void error(Msg msg, Tawk::Location const& loc, Ts const&... args)
{
  throw Tawk::ParseError(loc, Tawk::Messages::get().format(msg, args...));
}
}  // namespace

namespace Tawk::Details {

/** Types of expression.
 *
 * There are two types of expression: print_expr, and plain expr.
 *
 * There are parsing ambiguities in print and printf which mean we do not know what type of expr we
 * are necessarily in when we start.  However, we can assume that we are in a print_expr for print
 * and printf, and just treat receiving a multiple_expr_list result as a special case.
 */
enum class ExprType {
  print_expr,  ///< Definitely a print_expr.
  expr,        ///< Definitely an expr.
};

/** Types of expression list.
 *
 * There are three types of expression list:
 *  * print_expr_list - used in print & printf statements
 *  * expr_list - A list of expressions that may have only one entry.
 *  * multiple_expr_list - A list of expressions that must have at least two entries.
 */
enum class ExprListType {
  print_expr_list,     ///< Definitely a print_expr_list
  expr_list,           ///< Definitely an expr_list
  multiple_expr_list,  ///< Definitely a multiple_expr_list
};

static auto to_expr_type(ExprListType t) -> ExprType
{
  return t == ExprListType::print_expr_list ? ExprType::print_expr : ExprType::expr;
}

/** Whether an expression is unary or non-unary. */
enum class UnaryType {
  unary,      ///< Unary expression
  non_unary,  ///< Non-unary expression
  both        ///< Expression could be unary or non-unary
};

/** \brief  Result of parsing an expression: nothing, one expression, or a grouped list.  */
class ExprResult
{
public:
  ExprResult() = default;
  explicit ExprResult(Ast::ExprPtr expr) { exprs_.push_back(std::move(expr)); }
  explicit ExprResult(Ast::ExprList exprs) : exprs_(std::move(exprs)) {}

  ~ExprResult() = default;
  ExprResult(ExprResult const&) = delete;
  ExprResult(ExprResult&&) noexcept = default;
  auto operator=(ExprResult const&) -> ExprResult& = delete;
  auto operator=(ExprResult&&) noexcept -> ExprResult& = default;

  [[nodiscard]] auto has_one_value() const noexcept -> bool { return exprs_.size() == 1; }
  [[nodiscard]] auto has_many_values() const noexcept -> bool { return exprs_.size() > 1; }
  [[nodiscard]] auto has_no_values() const noexcept -> bool { return exprs_.empty(); }

  [[nodiscard]] auto is_lvalue() const noexcept -> bool
  {
    return has_one_value() && (std::holds_alternative<Ast::Variable>(exprs_.front()->node) ||
                                std::holds_alternative<Ast::Index>(exprs_.front()->node) ||
                                std::holds_alternative<Ast::Field>(exprs_.front()->node));
  }

  [[nodiscard]] auto is_variable() const noexcept -> bool
  {
    return has_one_value() && std::holds_alternative<Ast::Variable>(exprs_.front()->node);
  }

  [[nodiscard]] auto location() const -> Location const&
  {
    assert(!has_no_values());  // NOLINT
    return exprs_.front()->location;
  }

  [[nodiscard]] auto expr() const -> Ast::Expr const&
  {
    assert(has_one_value());  // NOLINT
    return *exprs_.front();
  }

  /** \brief  Take the single expression out of the result.  */
  auto take() -> Ast::ExprPtr
  {
    assert(has_one_value());  // NOLINT
    auto result{std::move(exprs_.front())};
    exprs_.clear();
    return result;
  }

  /** \brief  Take all the expressions out of the result.  */
  auto take_all() -> Ast::ExprList
  {
    auto result{std::move(exprs_)};
    exprs_.clear();
    return result;
  }

private:
  Ast::ExprList exprs_;
};

constexpr auto is_multiplicative_op(Token::Type type) -> bool
{
  return type == Token::Type::multiply || type == Token::Type::divide ||
         type == Token::Type::modulo;
}

constexpr auto is_additive_op(Token::Type type) -> bool
{
  return type == Token::Type::add || type == Token::Type::subtract;
}

constexpr auto is_comparison_op(Token::Type type) -> bool
{
  return type == Token::Type::eq || type == Token::Type::ne || type == Token::Type::less_than ||
         type == Token::Type::le || type == Token::Type::greater_than || type == Token::Type::ge;
}

constexpr auto is_re_match_op(Token::Type type) -> bool
{
  return type == Token::Type::tilde || type == Token::Type::no_match;
}

constexpr auto is_assignment_op(Token::Type type) -> bool
{
  return type == Token::Type::assign || type == Token::Type::pow_assign ||
         type == Token::Type::mod_assign || type == Token::Type::mul_assign ||
         type == Token::Type::div_assign || type == Token::Type::add_assign ||
         type == Token::Type::sub_assign;
}

auto to_binary_op(Token::Type type) -> Ast::Binary::Op
{
  switch (type) {
  case Token::Type::add:
    return Ast::Binary::Op::add;
  case Token::Type::subtract:
    return Ast::Binary::Op::subtract;
  case Token::Type::multiply:
    return Ast::Binary::Op::multiply;
  case Token::Type::divide:
    return Ast::Binary::Op::divide;
  case Token::Type::modulo:
    return Ast::Binary::Op::modulo;
  case Token::Type::power:
    return Ast::Binary::Op::power;
  case Token::Type::less_than:
    return Ast::Binary::Op::less;
  case Token::Type::le:
    return Ast::Binary::Op::less_equal;
  case Token::Type::eq:
    return Ast::Binary::Op::equal;
  case Token::Type::ne:
    return Ast::Binary::Op::not_equal;
  case Token::Type::ge:
    return Ast::Binary::Op::greater_equal;
  case Token::Type::greater_than:
    return Ast::Binary::Op::greater;
  default:
    assert(false);  // NOLINT
    return Ast::Binary::Op::concat;
  }
}

auto to_assign_op(Token::Type type) -> Ast::Assign::Op
{
  switch (type) {
  case Token::Type::add_assign:
    return Ast::Assign::Op::add;
  case Token::Type::sub_assign:
    return Ast::Assign::Op::subtract;
  case Token::Type::mul_assign:
    return Ast::Assign::Op::multiply;
  case Token::Type::div_assign:
    return Ast::Assign::Op::divide;
  case Token::Type::mod_assign:
    return Ast::Assign::Op::modulo;
  case Token::Type::pow_assign:
    return Ast::Assign::Op::power;
  default:
    assert(type == Token::Type::assign);  // NOLINT
    return Ast::Assign::Op::assign;
  }
}

/** \brief  Minimum and maximum argument counts of a builtin function.  */
struct BuiltinArity
{
  std::size_t min;
  std::size_t max;
};

auto builtin_arity(Token::BuiltinFunc func) -> BuiltinArity
{
  switch (func) {
  case Token::BuiltinFunc::rand:
    return {0, 0};
  case Token::BuiltinFunc::fflush:
  case Token::BuiltinFunc::length:
  case Token::BuiltinFunc::srand:
    return {0, 1};
  case Token::BuiltinFunc::atan2:
  case Token::BuiltinFunc::index:
  case Token::BuiltinFunc::match:
    return {2, 2};
  case Token::BuiltinFunc::gsub:
  case Token::BuiltinFunc::split:
  case Token::BuiltinFunc::sub:
  case Token::BuiltinFunc::substr:
    return {2, 3};
  case Token::BuiltinFunc::sprintf:
    return {1, std::numeric_limits<std::size_t>::max()};
  default:
    return {1, 1};
  }
}

class ParseState
{
public:
  explicit ParseState(std::unique_ptr<Lexer>&& lexer) : lexer_(std::move(lexer)) {}

  /** \brief Parse optional newlines.
   *
   * newline_opt : NEWLINE newline_opt
   *             | empty
   */
  auto parse_newline_opt() -> void
  {
    while (lexer_->peek(false) == Token::Type::newline) {
      lexer_->chew(false);
    }
  }

  /** @brief Results from statement parsing */
  enum class ParseStatementResult {
    none,          ///< Nothing parsed
    unterminated,  ///< Unterminated statement parsed
    terminated     ///< Terminated statement parsed
  };

  /** \brief  Build a reference to the variable \a name, resolving function parameters.  */
  [[nodiscard]] auto var_ref(std::string const& name) const -> Ast::VarRef
  {
    Ast::VarRef ref{name, std::nullopt};
    if (params_ != nullptr) {
      auto it{std::find(params_->begin(), params_->end(), name)};
      if (it != params_->end()) {
        ref.local = static_cast<std::size_t>(it - params_->begin());
      }
    }
    return ref;
  }

  /** \brief  Expect the token \a type, and chew it.  */
  void expect(Token::Type type, Msg msg)
  {
    if (lexer_->peek(false) != type) {
      error(msg, lexer_->location(), lexer_->peek(false));
    }
    lexer_->chew(false);
  }

  /** @brief Parse builtin functions.
   *
   * @param  loc Location of the builtin name.
   * @return     Builtin call expression
   *
   * builtin_func_expr : builtin_func_name LPARENS expr_list_opt RPARENS
   *                   | LENGTH
   *
   * | Pattern                             | Expr or print_expr?  | Unary or non-unary?  |
   * | :---------------------------------- | :------------------- | :------------------- |
   * | builtin_func_name ( expr_list_opt ) | Both                 | Non-unary            |
   * | length                              | Both                 | Non-unary            |
   *
   * The arguments are checked against the arity of each function.  sub and gsub need an lvalue
   * as their third argument, and split needs an array name as its second.
   */
  auto parse_builtin_func_expr() -> ExprResult
  {
    assert(lexer_->peek(false) == Token::Type::builtin_func_name);  // NOLINT

    Location const loc{lexer_->peek(false).location()};
    auto func{lexer_->peek(false).builtin_func_name()};
    lexer_->chew(false);

    if (func == Token::BuiltinFunc::length && lexer_->peek(true) != Token::Type::lparens) {
      return ExprResult{Ast::make_expr(loc, Ast::BuiltinCall{func, {}})};
    }

    if (lexer_->peek(false) != Token::Type::lparens) {
      error(Msg::expected_lparens_after_builtin_func, lexer_->location(), func,
            lexer_->peek(false));
    }
    lexer_->chew(false);
    parse_newline_opt();

    Ast::ExprList args{parse_expr_list_opt(ExprListType::expr_list)};

    if (lexer_->peek(false) != Token::Type::rparens) {
      error(Msg::expected_rparens_after_builtin_func_parameters, lexer_->location(), func,
            lexer_->peek(false));
    }
    lexer_->chew(false);

    auto const arity{builtin_arity(func)};
    if (args.size() < arity.min || args.size() > arity.max) {
      error(Msg::wrong_builtin_argument_count, loc, func, args.size());
    }

    if ((func == Token::BuiltinFunc::sub || func == Token::BuiltinFunc::gsub) &&
        args.size() == 3) {
      auto const& target{args[2]->node};
      if (!std::holds_alternative<Ast::Variable>(target) &&
          !std::holds_alternative<Ast::Index>(target) &&
          !std::holds_alternative<Ast::Field>(target)) {
        error(Msg::lvalue_required_for_sub_target, args[2]->location, func);
      }
    }

    if (func == Token::BuiltinFunc::split && !std::holds_alternative<Ast::Variable>(args[1]->node)) {
      error(Msg::expected_array_name_in_split, args[1]->location);
    }

    return ExprResult{Ast::make_expr(loc, Ast::BuiltinCall{func, std::move(args)})};
  }

  /** @brief Parse a call to a user defined (or foreign) function.
   *
   * func_call : FUNC_NAME LPARENS expr_list_opt RPARENS
   */
  auto parse_func_call_expr() -> ExprResult
  {
    assert(lexer_->peek(false) == Token::Type::func_name);  // NOLINT

    Location const loc{lexer_->peek(false).location()};
    std::string const name{lexer_->peek(false).func_name()};
    lexer_->chew(false);
    expect(Token::Type::lparens, Msg::expected_lparens_after_func_name);
    parse_newline_opt();

    Ast::ExprList args{parse_expr_list_opt(ExprListType::expr_list)};
    expect(Token::Type::rparens, Msg::expected_rparens_after_func_args);

    return ExprResult{Ast::make_expr(loc, Ast::Call{name, std::move(args)})};
  }

  /** @brief Parse a getline expression.
   *
   * simple_get : GETLINE
   *            | GETLINE lvalue
   *
   * getline_expr : simple_get
   *              | simple_get LESS_THAN non_unary_expr
   */
  auto parse_getline_expr() -> ExprResult
  {
    assert(lexer_->peek(false) == Token::Type::getline);  // NOLINT

    Location const loc{lexer_->peek(false).location()};
    lexer_->chew(false);

    Ast::ExprPtr target;
    if (auto const& tok{lexer_->peek(false)};
        tok == Token::Type::name || tok == Token::Type::dollar) {
      ExprResult lvalue{parse_field_expr_opt(UnaryType::non_unary)};
      if (!lvalue.is_lvalue()) {
        error(Msg::expected_lvalue_after_getline, lexer_->location(), lexer_->peek(false));
      }
      target = lvalue.take();
    }

    Ast::ExprPtr file;
    if (lexer_->peek(true) == Token::Type::less_than) {
      lexer_->chew(true);
      ExprResult name{parse_pre_incr_decr_expr_opt(UnaryType::non_unary)};
      if (!name.has_one_value()) {
        error(Msg::expected_expr_after_getline_redirect, lexer_->location(), lexer_->peek(false));
      }
      file = name.take();
    }

    return ExprResult{Ast::make_expr(loc, Ast::Getline{std::move(target), std::move(file)})};
  }

  /** @brief Parse primary expressions, () and lvalues.
   *
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * primary_expr : STRING
   *              | NUMBER
   *              | ERE
   *              | LPARENS expr RPARENS
   *              | LPARENS multiple_expr_list RPARENS
   *              | NAME
   *              | NAME LSQUARE expr_list RSQUARE
   *              | builtin_func
   *              | func_call
   *              | getline_expr
   *
   * | Pattern                             | Expr or print_expr?  | Unary or non-unary?  |
   * | :---------------------------------- | :------------------- | :------------------- |
   * | string                              | Both                 | Non-unary            |
   * | number                              | Both                 | Non-unary            |
   * | ere                                 | Both                 | Non-unary            |
   * | ( expr )                            | Both                 | Non-unary            |
   * | name                                | Both                 | Non-unary            |
   * | name [ expr_list ]                  | Both                 | Non-unary            |
   */
  auto parse_primary_expr_opt(UnaryType unary_type) -> ExprResult
  {
    if (unary_type == UnaryType::unary) {
      return ExprResult{};
    }

    auto const& tok{lexer_->peek(false)};
    Location const loc{tok.location()};
    switch (tok.type()) {
    case Token::Type::integer:
    case Token::Type::floating: {
      Floating const value{tok.number()};
      lexer_->chew(false);
      return ExprResult{Ast::make_expr(loc, Ast::NumberLit{value})};
    }
    case Token::Type::string: {
      std::string value{tok.string()};
      lexer_->chew(false);
      return ExprResult{Ast::make_expr(loc, Ast::StringLit{std::move(value)})};
    }
    case Token::Type::ere: {
      std::string ere{tok.ere()};
      lexer_->chew(false);
      try {
        std::regex re{compile_ere(ere)};
        return ExprResult{Ast::make_expr(loc, Ast::RegexLit{std::move(ere), std::move(re)})};
      }
      catch (std::regex_error const& e) {
        error(Msg::invalid_regex, loc, ere, e.what());
      }
    }
    case Token::Type::lparens: {
      lexer_->chew(false);
      ExprResult result{parse_expr_opt(ExprType::expr)};
      if (result.has_no_values()) {
        error(Msg::expected_expr_after_lparens, lexer_->location(), lexer_->peek(false));
      }

      if (lexer_->peek(false) == Token::Type::comma) {
        // We assume that we are in a multiple_expr_list here, hand over sorting the result to
        // parse_multiple_expr_list_rest here.
        lexer_->chew(false);
        parse_newline_opt();
        Ast::ExprList exprs{result.take_all()};
        parse_multiple_expr_list_rest(exprs);
        result = ExprResult{std::move(exprs)};
      }

      if (lexer_->peek(false) != Token::Type::rparens) {
        error(Msg::expected_rparens_at_end_of_expression, lexer_->location(),
              lexer_->peek(false));
      }
      lexer_->chew(false);
      return result;
    }
    case Token::Type::name: {
      Ast::VarRef ref{var_ref(tok.name())};
      lexer_->chew(false);

      if (lexer_->peek(true) != Token::Type::lsquare) {
        return ExprResult{Ast::make_expr(loc, Ast::Variable{std::move(ref)})};
      }
      lexer_->chew(true);

      Ast::ExprList subscripts{parse_expr_list_opt(ExprListType::expr_list)};
      if (subscripts.empty()) {
        error(Msg::expected_exprs_in_array_subscript, lexer_->location(), lexer_->peek(false));
      }
      if (lexer_->peek(false) != Token::Type::rsquare) {
        error(Msg::expected_rsquare_after_array_subscripts, lexer_->location(),
              lexer_->peek(false));
      }
      lexer_->chew(false);
      return ExprResult{Ast::make_expr(loc, Ast::Index{std::move(ref), std::move(subscripts)})};
    }
    case Token::Type::builtin_func_name:
      return parse_builtin_func_expr();
    case Token::Type::func_name:
      return parse_func_call_expr();
    case Token::Type::getline:
      return parse_getline_expr();
    default:
      return ExprResult{};
    }
  }

  /** @brief Parse a field expression
   *
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * field_expr : DOLLAR field_expr
   *            | DOLLAR pre_incr_decr_expr
   *            | DOLLAR unary_prefix field_expr
   *            | primary_expr
   *
   * | Pattern                             | Expr or print_expr?  | Unary or non-unary?  |
   * | :---------------------------------- | :------------------- | :------------------- |
   * | $ primary_expr                      | Both                 | Non-unary            |
   * | $ ++ lvalue                         | Both                 | Non-unary            |
   * | $ - field_expr                      | Both                 | Non-unary            |
   */
  auto parse_field_expr_opt(UnaryType unary_type) -> ExprResult
  {
    auto const& tok{lexer_->peek(false)};
    if (unary_type == UnaryType::unary || tok != Token::Type::dollar) {
      return parse_primary_expr_opt(unary_type);
    }

    Location const loc{tok.location()};
    lexer_->chew(false);

    ExprResult field_id;
    auto const& next{lexer_->peek(false)};
    if (next == Token::Type::incr || next == Token::Type::decr) {
      field_id = parse_pre_incr_decr_expr_opt(UnaryType::non_unary);
    }
    else if (next == Token::Type::subtract || next == Token::Type::add ||
             next == Token::Type::not_) {
      Location const op_loc{next.location()};
      Ast::Unary::Op const op{next == Token::Type::subtract ? Ast::Unary::Op::negate
                              : next == Token::Type::add    ? Ast::Unary::Op::plus
                                                            : Ast::Unary::Op::not_};
      lexer_->chew(false);
      ExprResult operand{parse_field_expr_opt(UnaryType::non_unary)};
      if (!operand.has_one_value()) {
        error(Msg::expected_expr_after_dollar, lexer_->location(), lexer_->peek(false));
      }
      field_id = ExprResult{Ast::make_expr(op_loc, Ast::Unary{op, operand.take()})};
    }
    else {
      field_id = parse_field_expr_opt(UnaryType::non_unary);
    }

    if (!field_id.has_one_value()) {
      error(Msg::expected_expr_after_dollar, lexer_->location(), lexer_->peek(false));
    }

    return ExprResult{Ast::make_expr(loc, Ast::Field{field_id.take()})};
  }

  /** @brief Parse a post- increment/decrement expression
   *
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * post_incr_decr_expr : lvalue INCR
   *                     | lvalue DECR
   *                     | field_expr
   *
   * | Pattern                             | Expr or print_expr?  | Unary or non-unary?  |
   * | :---------------------------------- | :------------------- | :------------------- |
   * | lvalue ++                           | Both                 | Non-unary            |
   * | lvalue --                           | Both                 | Non-unary            |
   */
  auto parse_post_incr_decr_expr_opt(UnaryType unary_type) -> ExprResult
  {
    ExprResult lvalue{parse_field_expr_opt(unary_type)};

    if (!lvalue.is_lvalue() || unary_type == UnaryType::unary) {
      return lvalue;
    }

    auto const& tok{lexer_->peek(true)};
    if (tok != Token::Type::incr && tok != Token::Type::decr) {
      return lvalue;
    }

    bool const is_incr{tok == Token::Type::incr};
    Location const loc{tok.location()};
    lexer_->chew(true);
    return ExprResult{Ast::make_expr(loc, Ast::IncDec{is_incr, false, lvalue.take()})};
  }

  /** @brief Parse a pre- increment/decrement expression
   *
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * pre_incr_decr_expr : INCR lvalue
   *                    | DECR lvalue
   *                    | post_incr_decr_expr
   *
   * | Pattern                             | Expr or print_expr?  | Unary or non-unary?  |
   * | :---------------------------------- | :------------------- | :------------------- |
   * | ++ lvalue                           | Both                 | Non-unary            |
   * | -- lvalue                           | Both                 | Non-unary            |
   */
  auto parse_pre_incr_decr_expr_opt(UnaryType unary_type) -> ExprResult
  {
    Token const token{lexer_->peek(false)};
    if (unary_type == UnaryType::unary ||
        (token != Token::Type::incr && token != Token::Type::decr)) {
      return parse_post_incr_decr_expr_opt(unary_type);
    }

    bool const is_incr{token == Token::Type::incr};
    lexer_->chew(false);

    ExprResult lvalue{parse_field_expr_opt(unary_type)};
    if (!lvalue.is_lvalue()) {
      error(Msg::expected_lvalue_after_pre_incr_decr, lexer_->location(), token,
            lexer_->peek(false));
    }

    return ExprResult{
      Ast::make_expr(token.location(), Ast::IncDec{is_incr, true, lvalue.take()})};
  }

  /** @brief Parse a power expression
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * power_expr : pre_incr_decr_expr ^ unary_prefix_expr
   *            | pre_incr_decr_expr
   *
   * | Pattern                             | Expr or print_expr?  | Unary or non-unary?  |
   * | :---------------------------------- | :------------------- | :------------------- |
   * | pre_incr_decr_expr ^ power_expr     | Both                 | Both                 |
   *
   * The right hand side goes through the unary prefix parser so that 2^-1 is accepted, and
   * the recursion makes ^ right associative.
   */
  auto parse_power_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    ExprResult lhs{parse_pre_incr_decr_expr_opt(unary_type)};
    if (!lhs.has_one_value() || lexer_->peek(true) != Token::Type::power) {
      return lhs;
    }

    Location const loc{lexer_->peek(true).location()};
    lexer_->chew(true);
    ExprResult rhs{parse_unary_prefix_expr_opt(expr_type, UnaryType::both)};
    if (!rhs.has_one_value()) {
      error(Msg::expected_expr_after_power, lexer_->location(), lexer_->peek(false));
    }

    return ExprResult{
      Ast::make_expr(loc, Ast::Binary{Ast::Binary::Op::power, lhs.take(), rhs.take()})};
  }

  /** @brief Parse unary prefix expressions (!, +, and -)
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * Not quite the right name as ! expr is actually a non-unary expr!
   *
   * unary_prefix_expr : NOT unary_prefix_expr
   *                   | PLUS unary_prefix_expr
   *                   | SUB unary_prefix_expr
   *                   | power_expr
   *
   * | Pattern                             | Expr or print_expr?  | Unary or non-unary?  |
   * | :---------------------------------- | :------------------- | :------------------- |
   * | ! unary_prefix_expr                 | Both                 | Non-unary            |
   * | + unary_prefix_expr                 | Both                 | Unary                |
   * | - unary_prefix_expr                 | Both                 | Unary                |
   */
  auto parse_unary_prefix_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    Token const tok{lexer_->peek(false)};
    std::optional<Ast::Unary::Op> op;
    if (tok == Token::Type::not_ && unary_type != UnaryType::unary) {
      op = Ast::Unary::Op::not_;
    }
    else if (tok == Token::Type::add && unary_type != UnaryType::non_unary) {
      op = Ast::Unary::Op::plus;
    }
    else if (tok == Token::Type::subtract && unary_type != UnaryType::non_unary) {
      op = Ast::Unary::Op::negate;
    }

    if (!op.has_value()) {
      return parse_power_expr_opt(expr_type, unary_type);
    }

    lexer_->chew(false);
    ExprResult operand{parse_unary_prefix_expr_opt(expr_type, UnaryType::both)};
    if (!operand.has_one_value()) {
      error(Msg::expected_expr_after_unary_prefix, lexer_->location(), tok, lexer_->peek(false));
    }

    return ExprResult{Ast::make_expr(tok.location(), Ast::Unary{*op, operand.take()})};
  }

  /** \brief  Build a binary expression from \a lhs and \a rhs, raising an error if \a rhs is
   *          missing.
   */
  auto make_binary(Token const& op, Ast::Binary::Op bin_op, ExprResult& lhs, ExprResult& rhs)
    -> ExprResult
  {
    if (!rhs.has_one_value()) {
      error(Msg::expected_expr_after_binary_op, lexer_->location(), op, lexer_->peek(false));
    }
    return ExprResult{Ast::make_expr(op.location(), Ast::Binary{bin_op, lhs.take(), rhs.take()})};
  }

  /** @brief Parse a multiplicative expression
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * multiplicative_expr : multiplicative_expr * unary_prefix_expr
   *                     | multiplicative_expr / unary_prefix_expr
   *                     | multiplicative_expr % unary_prefix_expr
   *                     | unary_prefix_expr
   *
   * | Pattern                                 | Expr or print_expr?  | Unary or non-unary?  |
   * | :-------------------------------------- | :------------------- | :------------------- |
   * | multiplicative_expr * unary_prefix_expr | Both                 | Both                 |
   * | multiplicative_expr / unary_prefix_expr | Both                 | Both                 |
   * | multiplicative_expr % unary_prefix_expr | Both                 | Both                 |
   */
  auto parse_multiplicative_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    ExprResult lhs{parse_unary_prefix_expr_opt(expr_type, unary_type)};
    if (!lhs.has_one_value()) {
      return lhs;
    }

    while (is_multiplicative_op(lexer_->peek(true).type())) {
      Token const op{lexer_->peek(true)};
      lexer_->chew(true);
      ExprResult rhs{parse_unary_prefix_expr_opt(expr_type, UnaryType::both)};
      lhs = make_binary(op, to_binary_op(op.type()), lhs, rhs);
    }

    return lhs;
  }

  /** @brief Parse an additive expression
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * additive_expr : additive_expr + multiplicative_expr
   *               | additive_expr - multiplicative_expr
   *               | multiplicative_expr
   *
   * | Pattern                                 | Expr or print_expr?  | Unary or non-unary?  |
   * | :-------------------------------------- | :------------------- | :------------------- |
   * | additive_expr + multiplicative_expr     | Both                 | Both                 |
   * | additive_expr - multiplicative_expr     | Both                 | Both                 |
   */
  auto parse_additive_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    ExprResult lhs{parse_multiplicative_expr_opt(expr_type, unary_type)};
    if (!lhs.has_one_value()) {
      return lhs;
    }

    while (is_additive_op(lexer_->peek(true).type())) {
      Token const op{lexer_->peek(true)};
      lexer_->chew(true);
      ExprResult rhs{parse_multiplicative_expr_opt(expr_type, UnaryType::both)};
      lhs = make_binary(op, to_binary_op(op.type()), lhs, rhs);
    }

    return lhs;
  }

  /** @brief Parse a concat expression
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * concat_expr : concat_expr additive_expr(Non-unary)
   *             | additive_expr
   *
   * | Pattern                                 | Expr or print_expr?  | Unary or non-unary?  |
   * | :-------------------------------------- | :------------------- | :------------------- |
   * | concat_expr additive_expr(Non-unary)    | Both                 | Both                 |
   */
  auto parse_concat_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    ExprResult lhs{parse_additive_expr_opt(expr_type, unary_type)};
    if (!lhs.has_one_value()) {
      return lhs;
    }

    while (true) {
      // We are in operator position, so the next token must be lexed with '/' as divide.  A
      // divide can not start an operand so the loop stops there.
      Location const loc{lexer_->peek(true).location()};
      if (lexer_->peek(true) == Token::Type::in || lexer_->peek(true) == Token::Type::getline) {
        break;
      }
      ExprResult rhs{parse_additive_expr_opt(expr_type, UnaryType::non_unary)};
      if (!rhs.has_one_value()) {
        break;
      }
      lhs = ExprResult{
        Ast::make_expr(loc, Ast::Binary{Ast::Binary::Op::concat, lhs.take(), rhs.take()})};
    }

    return lhs;
  }

  /** @brief Parse a comparison expression
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * comparison_expr : concat_expr EQ concat_expr
   *                 | concat_expr NE concat_expr
   *                 | concat_expr LESS_THAN concat_expr
   *                 | concat_expr LE concat_expr
   *                 | concat_expr GREATER_THAN concat_expr
   *                 | concat_expr GE concat_expr
   *                 | concat_expr
   *
   * | Pattern                                 | Expr or print_expr?  | Unary or non-unary?  |
   * | :-------------------------------------- | :------------------- | :------------------- |
   * | concat_expr == concat_expr              | Both                 | Both                 |
   * | concat_expr != concat_expr              | Both                 | Both                 |
   * | concat_expr <  concat_expr              | Both                 | Both                 |
   * | concat_expr <= concat_expr              | Both                 | Both                 |
   * | concat_expr >  concat_expr              | expr                 | Both                 |
   * | concat_expr >= concat_expr              | Both                 | Both                 |
   *
   * In a print_expr a '>' is an output redirection.
   */
  auto parse_comparison_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    ExprResult lhs{parse_concat_expr_opt(expr_type, unary_type)};
    if (!lhs.has_one_value()) {
      return lhs;
    }

    Token const tok{lexer_->peek(true)};
    if (!is_comparison_op(tok.type()) ||
        (expr_type == ExprType::print_expr && tok == Token::Type::greater_than)) {
      return lhs;
    }

    lexer_->chew(true);
    ExprResult rhs{parse_concat_expr_opt(expr_type, UnaryType::both)};
    return make_binary(tok, to_binary_op(tok.type()), lhs, rhs);
  }

  /** @brief Parse a re-match expression
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * re_match_expr : re_match_expr TILDE comparison_expr
   *               | re_match_expr NO_MATCH comparison_expr
   *               | comparison_expr
   *
   * | Pattern                                 | Expr or print_expr?  | Unary or non-unary?  |
   * | :-------------------------------------- | :------------------- | :------------------- |
   * | comparison_expr ~ comparison_expr       | Both                 | Both                 |
   * | comparison_expr !~ comparison_expr      | Both                 | Both                 |
   */
  auto parse_re_match_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    ExprResult lhs{parse_comparison_expr_opt(expr_type, unary_type)};
    if (!lhs.has_one_value()) {
      return lhs;
    }

    while (is_re_match_op(lexer_->peek(true).type())) {
      Token const tok{lexer_->peek(true)};
      lexer_->chew(true);
      ExprResult rhs{parse_comparison_expr_opt(expr_type, UnaryType::both)};
      if (!rhs.has_one_value()) {
        error(Msg::expected_expr_after_binary_op, lexer_->location(), tok, lexer_->peek(false));
      }
      lhs = ExprResult{Ast::make_expr(
        tok.location(), Ast::Match{tok == Token::Type::no_match, lhs.take(), rhs.take()})};
    }

    return lhs;
  }

  /** @brief Parse an in-array expression
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * in_array_expr : in_array_expr IN NAME
   *               | LPARENS multiple_expr_list RPARENS IN NAME
   *               | re_match_expr
   *
   * | Pattern                                 | Expr or print_expr?  | Unary or non-unary?  |
   * | :-------------------------------------- | :------------------- | :------------------- |
   * | re_match_expr in name                   | Both                 | Both                 |
   * | ( multiple_expr_list ) in name          | Both                 | Non-unary            |
   */
  auto parse_in_array_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    ExprResult lhs{parse_re_match_expr_opt(expr_type, unary_type)};
    if (lhs.has_no_values()) {
      return lhs;
    }

    while (lexer_->peek(true) == Token::Type::in) {
      Location const loc{lexer_->peek(true).location()};
      lexer_->chew(true);
      auto const& name{lexer_->peek(false)};
      if (name != Token::Type::name) {
        error(Msg::expected_name_after_in, lexer_->location(), name);
      }
      Ast::VarRef array{var_ref(name.name())};
      lexer_->chew(false);
      lhs = ExprResult{Ast::make_expr(loc, Ast::In{lhs.take_all(), std::move(array)})};
    }

    return lhs;
  }

  /** @brief Parse an and expression
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * and_expr : and_expr AND newline_opt in_array_expr
   *          | in_array_expr
   *
   * | Pattern                                 | Expr or print_expr?  | Unary or non-unary?  |
   * | :-------------------------------------- | :------------------- | :------------------- |
   * | and_expr && in_array_expr               | Both                 | Both                 |
   */
  auto parse_and_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    ExprResult lhs{parse_in_array_expr_opt(expr_type, unary_type)};
    if (!lhs.has_one_value()) {
      return lhs;
    }

    while (lexer_->peek(true) == Token::Type::and_) {
      Token const tok{lexer_->peek(true)};
      lexer_->chew(true);
      parse_newline_opt();
      ExprResult rhs{parse_in_array_expr_opt(expr_type, UnaryType::both)};
      if (!rhs.has_one_value()) {
        error(Msg::expected_expr_after_binary_op, lexer_->location(), tok, lexer_->peek(false));
      }
      lhs = ExprResult{Ast::make_expr(
        tok.location(), Ast::Logical{Ast::Logical::Op::and_, lhs.take(), rhs.take()})};
    }

    return lhs;
  }

  /** @brief Parse an or expression
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * or_expr : or_expr OR newline_opt and_expr
   *         | and_expr
   *
   * | Pattern                                 | Expr or print_expr?  | Unary or non-unary?  |
   * | :-------------------------------------- | :------------------- | :------------------- |
   * | or_expr || and_expr                     | Both                 | Both                 |
   */
  auto parse_or_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    ExprResult lhs{parse_and_expr_opt(expr_type, unary_type)};
    if (!lhs.has_one_value()) {
      return lhs;
    }

    while (lexer_->peek(true) == Token::Type::or_) {
      Token const tok{lexer_->peek(true)};
      lexer_->chew(true);
      parse_newline_opt();
      ExprResult rhs{parse_and_expr_opt(expr_type, UnaryType::both)};
      if (!rhs.has_one_value()) {
        error(Msg::expected_expr_after_binary_op, lexer_->location(), tok, lexer_->peek(false));
      }
      lhs = ExprResult{Ast::make_expr(
        tok.location(), Ast::Logical{Ast::Logical::Op::or_, lhs.take(), rhs.take()})};
    }

    return lhs;
  }

  /** @brief Parse a ternary (? :) expression
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * ternary_expr : or_expr QUERY newline_opt ternary_expr COLON newline_opt ternary_expr
   *              | or_expr
   *
   * | Pattern                                 | Expr or print_expr?  | Unary or non-unary?  |
   * | :-------------------------------------- | :------------------- | :------------------- |
   * | or_expr ? ternary_expr : ternary_expr   | Both                 | Both                 |
   */
  auto parse_ternary_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    ExprResult cond{parse_or_expr_opt(expr_type, unary_type)};
    if (!cond.has_one_value() || lexer_->peek(true) != Token::Type::query) {
      return cond;
    }

    Location const loc{lexer_->peek(true).location()};
    lexer_->chew(true);
    parse_newline_opt();

    ExprResult true_expr{parse_ternary_expr_opt(expr_type, UnaryType::both)};
    if (!true_expr.has_one_value()) {
      error(Msg::expected_expr_after_query, lexer_->location(), lexer_->peek(false));
    }

    if (lexer_->peek(false) != Token::Type::colon) {
      error(Msg::expected_colon_after_truth_expr, lexer_->location(), lexer_->peek(false));
    }
    lexer_->chew(false);
    parse_newline_opt();

    ExprResult false_expr{parse_ternary_expr_opt(expr_type, UnaryType::both)};
    if (!false_expr.has_one_value()) {
      error(Msg::expected_expr_after_colon, lexer_->location(), lexer_->peek(false));
    }

    return ExprResult{Ast::make_expr(
      loc, Ast::Ternary{cond.take(), true_expr.take(), false_expr.take()})};
  }

  /** @brief Parse an assignment expression
   *
   * @param  expr_type  Expression type
   * @param  unary_type What expression class is this?
   * @return            Parsed expression
   *
   * assignment_expr : lvalue ASSIGN assignment_expr
   *                 | lvalue POW_ASSIGN assignment_expr
   *                 | lvalue MOD_ASSIGN assignment_expr
   *                 | lvalue MUL_ASSIGN assignment_expr
   *                 | lvalue DIV_ASSIGN assignment_expr
   *                 | lvalue ADD_ASSIGN assignment_expr
   *                 | lvalue SUB_ASSIGN assignment_expr
   *                 | ternary_expr
   *
   * | Pattern                                 | Expr or print_expr?  | Unary or non-unary?  |
   * | :-------------------------------------- | :------------------- | :------------------- |
   * | lvalue = assignment_expr                | Both                 | Non-unary            |
   * | lvalue ^= assignment_expr               | Both                 | Non-unary            |
   * | lvalue %= assignment_expr               | Both                 | Non-unary            |
   * | lvalue *= assignment_expr               | Both                 | Non-unary            |
   * | lvalue /= assignment_expr               | Both                 | Non-unary            |
   * | lvalue += assignment_expr               | Both                 | Non-unary            |
   * | lvalue -= assignment_expr               | Both                 | Non-unary            |
   */
  auto parse_assignment_expr_opt(ExprType expr_type, UnaryType unary_type) -> ExprResult
  {
    ExprResult lvalue{parse_ternary_expr_opt(expr_type, unary_type)};
    if (!lvalue.is_lvalue()) {
      return lvalue;
    }

    Token const op{lexer_->peek(true)};
    if (!is_assignment_op(op.type())) {
      return lvalue;
    }

    lexer_->chew(true);
    parse_newline_opt();
    ExprResult rhs{parse_assignment_expr_opt(expr_type, UnaryType::both)};
    if (!rhs.has_one_value()) {
      error(Msg::expected_expr_after_binary_op, lexer_->location(), op, lexer_->peek(false));
    }

    return ExprResult{Ast::make_expr(
      op.location(), Ast::Assign{to_assign_op(op.type()), lvalue.take(), rhs.take()})};
  }

  /** @brief Parse an expression (of any type)
   *
   * @param  expr_type  Expression type
   * @return            Parsed expression
   *
   * The official grammar for awk classifies expressions into two main classes: print_expr or
   * expr. The print_expr class is a subset of expr - it basically excludes the '>' comparison,
   * which is the output redirection.
   *
   * Each of these two classes is further subdivided into unary and non-unary.  The purpose of
   * this is to exclude unary '+' and '-' from the right hand side of string concatenation.
   *
   * | Pattern                             | Expr or print_expr?  | Unary or non-unary?  |
   * | :---------------------------------- | :------------------- | :------------------- |
   * | + expr                              | Both                 | Unary                |
   * | - expr                              | Both                 | Unary                |
   * | ( expr )                            | Both                 | Non-unary            |
   * | ! expr                              | Both                 | Non-unary            |
   * | expr * expr                         | Both                 | Both                 |
   * | expr / expr                         | Both                 | Both                 |
   * | expr % expr                         | Both                 | Both                 |
   * | expr ^ expr                         | Both                 | Both                 |
   * | expr + expr                         | Both                 | Both                 |
   * | expr - expr                         | Both                 | Both                 |
   * | expr non_unary_expr                 | Both                 | Both                 |
   * | expr < expr                         | Both                 | Both                 |
   * | expr > expr                         | Expr                 | Both                 |
   * | expr ~ expr                         | Both                 | Both                 |
   * | expr in name                        | Both                 | Both                 |
   * | ( multiple_expr_list ) in name      | Both                 | Non-unary            |
   * | expr && expr                        | Both                 | Both                 |
   * | expr || expr                        | Both                 | Both                 |
   * | expr ? expr : expr                  | Both                 | Both                 |
   * | lvalue = expr                       | Both                 | Non-unary            |
   * | func_name( expr_list_opt )          | Both                 | Non-unary            |
   * | builtin_func_name ( expr_list_opt ) | Both                 | Non-unary            |
   * | simple_get `<` expr                 | Both                 | Non-unary            |
   */
  auto parse_expr_opt(ExprType expr_type) -> ExprResult
  {
    return parse_assignment_expr_opt(expr_type, UnaryType::both);
  }

  auto parse_expr(ExprType expr_type, Msg error_msg) -> Ast::ExprPtr
  {
    ExprResult result{parse_expr_opt(expr_type)};
    if (!result.has_one_value()) {
      error(error_msg, lexer_->location(), lexer_->peek(false));
    }
    return result.take();
  }

  /** @brief Parse the second & subsequent elements of a multiple_expr_list.
   *
   * @param exprs List to append the expressions to.
   */
  void parse_multiple_expr_list_rest(Ast::ExprList& exprs)
  {
    while (true) {
      ExprResult result{parse_expr_opt(ExprType::expr)};
      if (result.has_many_values()) {
        error(Msg::cannot_nest_multiple_expr_lists, lexer_->location());
      }
      if (result.has_no_values()) {
        error(Msg::expected_expr_after_comma, lexer_->location(), lexer_->peek(false));
      }

      exprs.push_back(result.take());

      // Chew the comma, and newline separators.
      if (lexer_->peek(false) != Token::Type::comma) {
        break;
      }
      lexer_->chew(false);
      parse_newline_opt();
    }
  }

  /** @brief Parse an expression list (of any type)
   *
   * @param  list_type What type of list are we processing?
   * @return           Expressions parsed.
   */
  auto parse_expr_list_opt(ExprListType list_type) -> Ast::ExprList
  {
    Ast::ExprList exprs;
    while (true) {
      ExprResult result{parse_expr_opt(to_expr_type(list_type))};
      if (result.has_many_values()) {
        // This turned out to be a multiple_expr_list - so we just lift the results up a level,
        // and return.
        if (!exprs.empty()) {
          error(Msg::cannot_nest_multiple_expr_lists, lexer_->location());
        }
        exprs = result.take_all();
        break;
      }

      if (result.has_no_values()) {
        if (!exprs.empty()) {
          error(Msg::expected_expr_after_comma, lexer_->location(), lexer_->peek(false));
        }
        break;
      }

      exprs.push_back(result.take());

      if (lexer_->peek(false) != Token::Type::comma) {
        break;
      }
      lexer_->chew(false);
      parse_newline_opt();
    }

    if (list_type == ExprListType::multiple_expr_list && exprs.size() == 1) {
      error(Msg::expected_two_exprs_in_list, lexer_->location(), lexer_->peek(false));
    }

    return exprs;
  }

  /** \brief  Turn a parsed statement list into a single statement.  */
  static auto to_stmt(Location const& loc, Ast::StmtList&& stmts) -> Ast::StmtPtr
  {
    if (stmts.size() == 1) {
      return std::move(stmts.front());
    }
    return Ast::make_stmt(loc, Ast::Block{std::move(stmts)});
  }

  /** @brief Parse a body statement of a loop or if.
   *
   * @param  msg Message to report if there is no statement.
   * @param  result Set to whether the statement was terminated.
   * @return Statement parsed.
   */
  auto parse_body(Msg msg, ParseStatementResult& result) -> Ast::StmtPtr
  {
    Location const loc{lexer_->location()};
    Ast::StmtList body;
    result = parse_statement(body, msg);
    return to_stmt(loc, std::move(body));
  }

  /** \brief  Parse a loop body, allowing break and continue.  */
  auto parse_loop_body(Msg msg, ParseStatementResult& result) -> Ast::StmtPtr
  {
    ++loop_depth_;
    auto body{parse_body(msg, result)};
    --loop_depth_;
    return body;
  }

  /** \brief  Parse ( expr ) after keyword \a keyword.  */
  auto parse_paren_cond(Token const& keyword) -> Ast::ExprPtr
  {
    if (lexer_->peek(false) != Token::Type::lparens) {
      error(Msg::expected_lparens_after_keyword, lexer_->location(), keyword,
            lexer_->peek(false));
    }
    lexer_->chew(false);

    ExprResult cond{parse_expr_opt(ExprType::expr)};
    if (!cond.has_one_value()) {
      error(Msg::expected_expr_after_keyword, lexer_->location(), keyword, lexer_->peek(false));
    }

    if (lexer_->peek(false) != Token::Type::rparens) {
      error(Msg::expected_rparens_after_keyword_expr, lexer_->location(), keyword,
            lexer_->peek(false));
    }
    lexer_->chew(false);
    return cond.take();
  }

  /** @brief Parse a do-while statement.
   *
   * do_while_statement : DO newline_opt statement WHILE LPARENS expr RPARENS
   */
  void parse_do_while(Ast::StmtList& out)
  {
    Token const tok{lexer_->peek(false)};
    assert(tok == Token::Type::do_);  // NOLINT
    lexer_->chew(false);
    parse_newline_opt();

    ParseStatementResult result{ParseStatementResult::none};
    auto body{parse_loop_body(Msg::missing_statement_after_keyword, result)};
    parse_newline_opt();

    Token const while_tok{lexer_->peek(false)};
    if (while_tok != Token::Type::while_) {
      error(Msg::expected_while_after_do, lexer_->location(), while_tok);
    }
    lexer_->chew(false);

    auto cond{parse_paren_cond(while_tok)};
    out.push_back(Ast::make_stmt(tok.location(), Ast::DoWhile{std::move(body), std::move(cond)}));
  }

  /** @brief Parse a delete statement.
   *
   * delete_statement : DELETE NAME LSQUARE expr_list RSQUARE
   *                  | DELETE NAME
   */
  void parse_delete_statement(Ast::StmtList& out)
  {
    Location const loc{lexer_->peek(false).location()};
    assert(lexer_->peek(false) == Token::Type::delete_);  // NOLINT
    lexer_->chew(false);

    auto const& name{lexer_->peek(false)};
    if (name != Token::Type::name) {
      error(Msg::expected_array_name_after_delete, lexer_->location(), name);
    }
    Ast::VarRef array{var_ref(name.name())};
    lexer_->chew(false);

    Ast::ExprList subscripts;
    if (lexer_->peek(true) == Token::Type::lsquare) {
      lexer_->chew(true);
      subscripts = parse_expr_list_opt(ExprListType::expr_list);
      if (subscripts.empty()) {
        error(Msg::expected_exprs_in_array_subscript, lexer_->location(), lexer_->peek(false));
      }
      if (lexer_->peek(false) != Token::Type::rsquare) {
        error(Msg::expected_rsquare_after_array_subscripts, lexer_->location(),
              lexer_->peek(false));
      }
      lexer_->chew(false);
    }

    out.push_back(Ast::make_stmt(loc, Ast::Delete{std::move(array), std::move(subscripts)}));
  }

  /** @brief Parse a print statement.
   *
   * simple_print_statement : PRINT print_expr_list_opt
   *                        | PRINT LPARENS multiple_expr_list RPARENS
   *                        | PRINTF print_expr_list
   *                        | PRINTF LPARENS multiple_expr_list RPARENS
   *
   * redirection : GREATER_THAN print_expr
   *             | APPEND print_expr
   *             | PIPE print_expr
   *
   * print_statement : simple_print_statement
   *                 | simple_print_statement redirection
   */
  void parse_print_statement(Ast::StmtList& out)
  {
    Token const tok{lexer_->peek(false)};
    assert(tok == Token::Type::print || tok == Token::Type::printf);  // NOLINT

    bool const is_printf{tok == Token::Type::printf};
    lexer_->chew(false);

    // So the problem we have here is that the token '(' is valid is the first token in
    // print_expr_list_opt.  So if that is the next token we have no idea whether we are parsing a
    // print_expr_list or a multiple_expr_list.  Hence we leave it to the expression parser to
    // work it out.
    Ast::ExprList args{parse_expr_list_opt(ExprListType::print_expr_list)};

    if (is_printf && args.empty()) {
      error(Msg::expected_list_to_printf, lexer_->location(), lexer_->peek(false));
    }

    Ast::Print::Redirect redirect{Ast::Print::Redirect::none};
    Token const redir_tok{lexer_->peek(true)};
    if (redir_tok == Token::Type::greater_than) {
      redirect = Ast::Print::Redirect::truncate;
    }
    else if (redir_tok == Token::Type::append) {
      redirect = Ast::Print::Redirect::append;
    }
    else if (redir_tok == Token::Type::pipe) {
      redirect = Ast::Print::Redirect::pipe;
    }

    Ast::ExprPtr dest;
    if (redirect != Ast::Print::Redirect::none) {
      lexer_->chew(true);
      ExprResult dest_expr{parse_expr_opt(ExprType::print_expr)};
      if (!dest_expr.has_one_value()) {
        error(Msg::expected_expr_after_redirection, lexer_->location(), redir_tok,
              lexer_->peek(false));
      }
      dest = dest_expr.take();
    }

    out.push_back(Ast::make_stmt(
      tok.location(), Ast::Print{is_printf, std::move(args), redirect, std::move(dest)}));
  }

  /** @brief Parse a simple statement.
   *
   * @param  out Where to put the statement.
   * @return     Did we parse anything?
   *
   * simple_statement : DELETE NAME LSQUARE expr_list RSQUARE
   *                  | expr
   *                  | print_statement
   *                  | empty
   */
  auto parse_simple_statement_opt(Ast::StmtList& out) -> bool
  {
    auto const& tok{lexer_->peek(false)};

    if (tok == Token::Type::delete_) {
      parse_delete_statement(out);
      return true;
    }

    if (tok == Token::Type::print || tok == Token::Type::printf) {
      parse_print_statement(out);
      return true;
    }

    Location const loc{tok.location()};
    ExprResult expr{parse_expr_opt(ExprType::expr)};
    if (expr.has_many_values()) {
      error(Msg::unexpected_expression_list, loc);
    }
    if (expr.has_no_values()) {
      return false;
    }

    out.push_back(Ast::make_stmt(loc, Ast::ExprStmt{expr.take()}));
    return true;
  }

  /** @brief Parse a statement which needs a terminator.
   *
   * terminatable_statement : simple_statement
   *                        | BREAK
   *                        | CONTINUE
   *                        | NEXT
   *                        | NEXTFILE
   *                        | EXIT expr_opt
   *                        | RETURN expr_opt
   *                        | do_while_statement
   */
  auto parse_terminatable_statement_opt(Ast::StmtList& out) -> ParseStatementResult
  {
    Token const tok{lexer_->peek(false)};
    Location const& loc{tok.location()};
    switch (tok.type()) {
    case Token::Type::break_:
    case Token::Type::continue_:
      if (loop_depth_ == 0) {
        error(Msg::break_continue_outside_loop, loc, tok);
      }
      lexer_->chew(false);
      if (tok == Token::Type::break_) {
        out.push_back(Ast::make_stmt(loc, Ast::Break{}));
      }
      else {
        out.push_back(Ast::make_stmt(loc, Ast::Continue{}));
      }
      break;
    case Token::Type::next:
    case Token::Type::nextfile:
      if (in_begin_end_) {
        error(Msg::next_in_begin_or_end, loc, tok);
      }
      lexer_->chew(false);
      if (tok == Token::Type::next) {
        out.push_back(Ast::make_stmt(loc, Ast::Next{}));
      }
      else {
        out.push_back(Ast::make_stmt(loc, Ast::NextFile{}));
      }
      break;
    case Token::Type::exit: {
      lexer_->chew(false);
      ExprResult expr{parse_expr_opt(ExprType::expr)};
      out.push_back(Ast::make_stmt(
        loc, Ast::Exit{expr.has_one_value() ? expr.take() : Ast::ExprPtr{}}));
      break;
    }
    case Token::Type::return_: {
      if (params_ == nullptr) {
        error(Msg::return_outside_function, loc);
      }
      lexer_->chew(false);
      ExprResult expr{parse_expr_opt(ExprType::expr)};
      out.push_back(Ast::make_stmt(
        loc, Ast::Return{expr.has_one_value() ? expr.take() : Ast::ExprPtr{}}));
      break;
    }
    case Token::Type::do_:
      parse_do_while(out);
      break;
    default:
      if (!parse_simple_statement_opt(out)) {
        return ParseStatementResult::none;
      }
      break;
    }

    if (lexer_->peek(false) == Token::Type::semicolon ||
        lexer_->peek(false) == Token::Type::newline) {
      lexer_->chew(false);
      parse_newline_opt();
      return ParseStatementResult::terminated;
    }

    return ParseStatementResult::unterminated;
  }

  /** @brief Parse an if statement
   *
   * @param  out Where to put the statement.
   * @return Whether the statement was terminated or not.
   *
   * if_stmt : IF LPARENS expr RPARENS newline_opt statement
   *         | IF LPARENS expr RPARENS newline_opt terminated_statement ELSE newline_opt statement
   */
  auto parse_if_stmt(Ast::StmtList& out) -> ParseStatementResult
  {
    Token const tok{lexer_->peek(false)};
    assert(tok == Token::Type::if_);  // NOLINT
    lexer_->chew(false);

    auto cond{parse_paren_cond(tok)};
    parse_newline_opt();

    ParseStatementResult then_result{ParseStatementResult::none};
    auto then_stmt{parse_body(Msg::missing_statement_after_keyword, then_result)};

    Ast::StmtPtr else_stmt;
    ParseStatementResult result{then_result};
    if (then_result == ParseStatementResult::terminated &&
        lexer_->peek(false) == Token::Type::else_) {
      lexer_->chew(false);
      parse_newline_opt();
      else_stmt = parse_body(Msg::missing_statement_after_keyword, result);
    }

    out.push_back(Ast::make_stmt(
      tok.location(), Ast::If{std::move(cond), std::move(then_stmt), std::move(else_stmt)}));
    return result;
  }

  /** @brief Parse a while statement
   *
   * @param  out Where to put the statement.
   * @return Whether the statement was terminated or not.
   *
   * while_stmt : WHILE LPARENS expr RPARENS newline_opt statement
   */
  auto parse_while_stmt(Ast::StmtList& out) -> ParseStatementResult
  {
    Token const tok{lexer_->peek(false)};
    assert(tok == Token::Type::while_);  // NOLINT
    lexer_->chew(false);

    auto cond{parse_paren_cond(tok)};
    parse_newline_opt();

    ParseStatementResult result{ParseStatementResult::none};
    auto body{parse_loop_body(Msg::missing_statement_after_keyword, result)};
    out.push_back(Ast::make_stmt(tok.location(), Ast::While{std::move(cond), std::move(body)}));
    return result;
  }

  /** @brief Parse a for statement
   *
   * @param  out Where to put the statement.
   * @return Whether the statement was terminated or not.
   *
   * for_stmt : FOR LPARENS simple_statement_opt SEMICOLON expr_opt SEMICOLON simple_statement_opt
   *                RPARENS newline_opt statement
   *          | FOR LPARENS NAME IN NAME RPARENS newline_opt statement
   *
   * We can not tell the two forms apart until we have seen the token after 'NAME IN NAME', so we
   * parse an expression and look at its shape.
   */
  auto parse_for_stmt(Ast::StmtList& out) -> ParseStatementResult
  {
    Token const tok{lexer_->peek(false)};
    assert(tok == Token::Type::for_);  // NOLINT
    lexer_->chew(false);

    if (lexer_->peek(false) != Token::Type::lparens) {
      error(Msg::expected_lparens_after_keyword, lexer_->location(), tok, lexer_->peek(false));
    }
    lexer_->chew(false);

    // Initialisation
    Ast::StmtList init;
    (void)parse_simple_statement_opt(init);

    if (lexer_->peek(false) == Token::Type::rparens && init.size() == 1) {
      if (auto* for_in{as_for_in(*init.front())}; for_in != nullptr) {
        lexer_->chew(false);
        parse_newline_opt();
        auto& in_expr{std::get<Ast::In>(for_in->node)};
        Ast::VarRef var{std::get<Ast::Variable>(in_expr.subscripts.front()->node).var};
        Ast::VarRef array{in_expr.array};
        ParseStatementResult result{ParseStatementResult::none};
        auto body{parse_loop_body(Msg::missing_statement_after_keyword, result)};
        out.push_back(Ast::make_stmt(
          tok.location(), Ast::ForIn{std::move(var), std::move(array), std::move(body)}));
        return result;
      }
    }

    if (lexer_->peek(false) != Token::Type::semicolon) {
      error(Msg::expected_semicolon_in_for, lexer_->location(), lexer_->peek(false));
    }
    lexer_->chew(false);
    parse_newline_opt();

    // Condition
    ExprResult cond{parse_expr_opt(ExprType::expr)};

    if (lexer_->peek(false) != Token::Type::semicolon) {
      error(Msg::expected_semicolon_in_for, lexer_->location(), lexer_->peek(false));
    }
    lexer_->chew(false);
    parse_newline_opt();

    // Update
    Ast::StmtList update;
    (void)parse_simple_statement_opt(update);

    if (lexer_->peek(false) != Token::Type::rparens) {
      error(Msg::expected_rparens_after_keyword_expr, lexer_->location(), tok,
            lexer_->peek(false));
    }
    lexer_->chew(false);
    parse_newline_opt();

    ParseStatementResult result{ParseStatementResult::none};
    auto body{parse_loop_body(Msg::missing_statement_after_keyword, result)};
    out.push_back(Ast::make_stmt(
      tok.location(),
      Ast::For{init.empty() ? Ast::StmtPtr{} : std::move(init.front()),
               cond.has_one_value() ? cond.take() : Ast::ExprPtr{},
               update.empty() ? Ast::StmtPtr{} : std::move(update.front()), std::move(body)}));
    return result;
  }

  /** \brief  If \a stmt is the expression 'NAME in NAME' return that expression.  */
  static auto as_for_in(Ast::Stmt& stmt) -> Ast::Expr*
  {
    auto* expr_stmt{std::get_if<Ast::ExprStmt>(&stmt.node)};
    if (expr_stmt == nullptr) {
      return nullptr;
    }
    auto* in{std::get_if<Ast::In>(&expr_stmt->expr->node)};
    if (in == nullptr || in->subscripts.size() != 1 ||
        !std::holds_alternative<Ast::Variable>(in->subscripts.front()->node)) {
      return nullptr;
    }
    return expr_stmt->expr.get();
  }

  /** @brief Parse an optional statement
   *
   * @param  out Where to put the statement.
   * @return     Flag indicating whether anything was parsed, and if so whether it was
   *             terminated.
   *
   * statement : if_stmt
   *           | while_stmt
   *           | for_stmt
   *           | SEMICOLON newline_opt
   *           | action newline_opt
   *           | terminatable_statement
   */
  auto parse_statement_opt(Ast::StmtList& out) -> ParseStatementResult
  {
    auto const& tok{lexer_->peek(false)};
    if (tok == Token::Type::if_) {
      return parse_if_stmt(out);
    }
    if (tok == Token::Type::while_) {
      return parse_while_stmt(out);
    }
    if (tok == Token::Type::for_) {
      return parse_for_stmt(out);
    }
    if (tok == Token::Type::semicolon) {
      lexer_->chew(false);
      parse_newline_opt();
      return ParseStatementResult::terminated;
    }
    if (tok == Token::Type::lbrace) {
      out.push_back(parse_action());
      parse_newline_opt();
      return ParseStatementResult::terminated;
    }

    return parse_terminatable_statement_opt(out);
  }

  auto parse_statement(Ast::StmtList& out, Msg msg) -> ParseStatementResult
  {
    auto result{parse_statement_opt(out)};

    if (result == ParseStatementResult::none) {
      error(msg, lexer_->location(), lexer_->peek(false));
    }

    return result;
  }

  /** \brief  Parse a statement list.
   *
   * statement_list_opt : statement terminator statement_list_opt
   *                    | statement
   *                    | *empty*
   */
  void parse_statement_list_opt(Ast::StmtList& out)
  {
    bool cont{true};
    while (cont) {
      auto res{parse_statement_opt(out)};
      cont = (res == ParseStatementResult::terminated);
    }
  }

  /** \brief  Parse an optional action.
   *  \return Block holding the action's statements, or nullptr if there is no action.
   *
   * action_opt : LBRACE newline_opt statement_list_opt RBRACE
   *            | empty
   */
  auto parse_action_opt() -> Ast::StmtPtr
  {
    if (lexer_->peek(false) != Token::Type::lbrace) {
      return nullptr;
    }

    Location const loc{lexer_->peek(false).location()};
    lexer_->chew(false);
    parse_newline_opt();

    Ast::StmtList stmts;
    parse_statement_list_opt(stmts);

    if (lexer_->peek(false) != Token::Type::rbrace) {
      error(Msg::missing_rbrace, lexer_->location(), lexer_->peek(false));
    }
    lexer_->chew(false);

    return Ast::make_stmt(loc, Ast::Block{std::move(stmts)});
  }

  /** \brief  Parse an action.
   *
   * action : action_opt (If empty error)
   */
  auto parse_action() -> Ast::StmtPtr
  {
    auto action{parse_action_opt()};
    if (action == nullptr) {
      error(Msg::expected_action, lexer_->location(), lexer_->peek(false));
    }
    return action;
  }

  /** \brief  Parse the action of a BEGIN or END rule.  */
  auto parse_begin_end_action() -> Ast::StmtPtr
  {
    in_begin_end_ = true;
    auto action{parse_action()};
    in_begin_end_ = false;
    return action;
  }

  /** \brief  Parse a function definition name, returning the function name.
   *  \return Function name parsed.
   *
   * func_def_name : NAME
   *               | FUNC_NAME
   */
  auto parse_func_def_name() -> FuncName
  {
    auto const& tok{lexer_->peek(false)};
    if (tok == Token::Type::builtin_func_name) {
      error(Msg::cannot_redefine_builtin_functions, lexer_->location(), tok);
    }
    if (tok != Token::Type::name && tok != Token::Type::func_name) {
      error(Msg::expected_function_name, lexer_->location(), tok);
    }

    FuncName name{tok == Token::Type::name ? tok.name() : tok.func_name()};
    lexer_->chew(false);
    return name;
  }

  /** \brief  Parse a function definition.
   *
   * function_def : FUNCTION func_def_name LPARENS param_list_opt RPARENS newline_opt action
   *
   * param_list_opt : NAME
   *                | param_list_opt COMMA newline_opt NAME
   *                | *empty*
   */
  void parse_function_def()
  {
    Location const loc{lexer_->peek(false).location()};
    assert(lexer_->peek(false) == Token::Type::function);  // NOLINT
    lexer_->chew(false);

    auto name{parse_func_def_name()};
    if (program_.functions_.find(name.get()) != program_.functions_.end()) {
      error(Msg::function_redefined, loc, name.get());
    }

    expect(Token::Type::lparens, Msg::expected_lparens_after_function_name);

    std::vector<std::string> params;
    while (lexer_->peek(false) == Token::Type::name) {
      std::string param{lexer_->peek(false).name()};
      if (param == name.get()) {
        error(Msg::parameter_shadows_function, lexer_->location(), param);
      }
      if (std::find(params.begin(), params.end(), param) != params.end()) {
        error(Msg::duplicate_parameter, lexer_->location(), param, name.get());
      }
      params.push_back(std::move(param));
      lexer_->chew(false);

      if (lexer_->peek(false) != Token::Type::comma) {
        break;
      }
      lexer_->chew(false);
      parse_newline_opt();
      if (lexer_->peek(false) != Token::Type::name) {
        error(Msg::expected_parameter_name, lexer_->location(), lexer_->peek(false));
      }
    }

    expect(Token::Type::rparens, Msg::expected_rparens_after_parameters);
    parse_newline_opt();

    params_ = &params;
    auto body{parse_action()};
    params_ = nullptr;

    std::string key{name.get()};
    program_.functions_.emplace(
      std::move(key), Ast::FunctionDef{name.get(), std::move(params), std::move(body), loc});
  }

  /** \brief Parse an optional item.
   *
   * @return \c true iff we parsed any items.
   *
   * item_optional : action
   *               | normal_pattern action_opt
   *               | normal_pattern COMMA newline_opt normal_pattern action_opt
   *               | BEGIN action
   *               | END action
   *               | function_def
   */
  auto parse_item_opt() -> bool
  {
    item_needs_terminator_ = false;
    Token const tok{lexer_->peek(false)};
    Location const& loc{tok.location()};
    if (tok == Token::Type::lbrace) {
      program_.rules_.push_back(
        Ast::Rule{Ast::Pattern{Ast::Pattern::Kind::always, nullptr, nullptr}, parse_action(), loc});
    }
    else if (tok == Token::Type::begin || tok == Token::Type::end) {
      lexer_->chew(false);
      auto const kind{tok == Token::Type::begin ? Ast::Pattern::Kind::begin
                                                : Ast::Pattern::Kind::end};
      program_.rules_.push_back(
        Ast::Rule{Ast::Pattern{kind, nullptr, nullptr}, parse_begin_end_action(), loc});
    }
    else if (tok == Token::Type::function) {
      parse_function_def();
    }
    else {
      ExprResult first{parse_expr_opt(ExprType::expr)};
      if (first.has_no_values()) {
        return false;
      }
      if (first.has_many_values()) {
        error(Msg::unexpected_expression_list, loc);
      }

      Ast::Pattern pattern{Ast::Pattern::Kind::expr, first.take(), nullptr};
      if (lexer_->peek(false) == Token::Type::comma) {
        lexer_->chew(false);
        parse_newline_opt();
        pattern.kind = Ast::Pattern::Kind::range;
        pattern.last = parse_expr(ExprType::expr, Msg::missing_pattern_after_comma);
      }

      auto action{parse_action_opt()};
      if (action == nullptr) {
        // A missing action prints the record.
        item_needs_terminator_ = true;
        action = Ast::make_stmt(
          loc, Ast::Print{false, Ast::ExprList{}, Ast::Print::Redirect::none, nullptr});
      }
      program_.rules_.push_back(Ast::Rule{std::move(pattern), std::move(action), loc});
    }

    return true;
  }

  /** \brief parse an optional terminator.
   *
   * @return \c true iff we parsed any terminators.
   *
   * terminator_optional : SEMICOLON terminator_optional
   *                     | NEWLINE terminator_optional
   *                     | empty
   */
  auto parse_terminator_opt() -> bool
  {
    bool done{false};
    while (lexer_->peek(false) == Token::Type::semicolon ||
           lexer_->peek(false) == Token::Type::newline) {
      lexer_->chew(false);
      done = true;
    }
    return done;
  }

  /** \brief Parse an item_list:
   *
   * item_list_maybe_unterminated : item terminator item_list_maybe_unterminated
   *                              | item
   *                              | *empty*
   *
   * An item ending in an action or function body may be followed directly by the next item.
   */
  void parse_item_list_maybe_unterminated()
  {
    while (parse_item_opt()) {
      if (!parse_terminator_opt() && item_needs_terminator_) {
        break;
      }
    }
  }

  /** \brief Parse the program
   *
   * program : item_list_maybe_unterminated
   */
  void parse_program()
  {
    (void)parse_terminator_opt();
    parse_item_list_maybe_unterminated();
    if (lexer_->peek(false) != Token::Type::eof) {
      error(Msg::failed_to_read_whole_program, lexer_->location(), lexer_->peek(false));
    }
  }

  auto program() -> Program& { return program_; }

private:
  std::unique_ptr<Lexer> lexer_;
  Program program_;
  std::vector<std::string> const* params_{nullptr};  ///< Parameters of current function.
  unsigned loop_depth_{0};                            ///< Depth of nested loops.
  bool in_begin_end_{false};                          ///< Parsing a BEGIN or END action?
  bool item_needs_terminator_{false};                 ///< Did the last item end without '}'?
};
}  // namespace Tawk::Details

auto Tawk::parse(std::unique_ptr<Lexer>&& lexer) -> Program
{
  Details::ParseState parser{std::move(lexer)};
  parser.parse_program();
  return std::move(parser.program());
}
