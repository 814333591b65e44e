/** \file   execute.cc
 *  \brief  tawk execution engine
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk/utils.hh"

#include "tawk-messages.hh"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "execute.hh"
#include "format.hh"
#include "session.hh"

extern "C" char** environ;  // NOLINT

namespace {
/** \brief  Pops the top call frame when destroyed.  */
class FrameGuard
{
public:
  explicit FrameGuard(std::vector<Tawk::Details::Frame>& frames) : frames_(frames) {}
  ~FrameGuard() { frames_.pop_back(); }
  FrameGuard(FrameGuard const&) = delete;
  FrameGuard(FrameGuard&&) noexcept = delete;
  auto operator=(FrameGuard const&) -> FrameGuard& = delete;
  auto operator=(FrameGuard&&) noexcept -> FrameGuard& = delete;

private:
  std::vector<Tawk::Details::Frame>& frames_;  ///< Call stack.
};

auto divide(Tawk::Floating lhs, Tawk::Floating rhs, Tawk::Location const& loc) -> Tawk::Floating
{
  if (rhs == 0) {
    throw Tawk::TypeError(loc, Tawk::Messages::get().format(Tawk::Msg::division_by_zero, "/"));
  }
  return lhs / rhs;
}

auto modulo(Tawk::Floating lhs, Tawk::Floating rhs, Tawk::Location const& loc) -> Tawk::Floating
{
  if (rhs == 0) {
    throw Tawk::TypeError(loc, Tawk::Messages::get().format(Tawk::Msg::division_by_zero, "%"));
  }
  return std::fmod(lhs, rhs);
}

/** \brief  Largest field index that may be referenced.  */
constexpr Tawk::Floating max_field_index{
  static_cast<Tawk::Floating>(std::numeric_limits<int>::max())};

/** \brief  Convert \a n to an exit status, saturating at the limits of int.  NaN gives 0.  */
auto to_status(Tawk::Floating n) -> int
{
  if (std::isnan(n)) {
    return 0;
  }
  constexpr auto lowest{static_cast<Tawk::Floating>(std::numeric_limits<int>::min())};
  constexpr auto highest{static_cast<Tawk::Floating>(std::numeric_limits<int>::max())};
  return static_cast<int>(std::clamp(std::trunc(n), lowest, highest));
}

auto to_value(bool b) -> Tawk::Value
{
  return Tawk::Value{b ? Tawk::Floating{1} : Tawk::Floating{0}};
}
}  // namespace

Tawk::Details::ExecutionState::ExecutionState(Program const& program, std::ostream& out,
                                              ForeignFunctionRegistry& foreign)
    : program_(program), foreign_(foreign), fields_(regexes_), outputs_(out),
      in_range_(program.rules().size(), false)
{
  set_global("CONVFMT", Value{"%.6g"});
  set_global("FNR", Value{Floating{0}});
  set_global("FS", Value{" "});
  set_global("NR", Value{Floating{0}});
  set_global("OFMT", Value{"%.6g"});
  set_global("OFS", Value{" "});
  set_global("ORS", Value{"\n"});
  set_global("RLENGTH", Value{Floating{-1}});
  set_global("RS", Value{"\n"});
  set_global("RSTART", Value{Floating{0}});
  set_global("SUBSEP", Value{"\034"});

  auto environment{std::make_shared<Array>()};
  for (char** env{environ}; *env != nullptr; ++env) {  // NOLINT
    std::string const e{*env};
    auto const eq{e.find('=')};
    if (eq == std::string::npos) {
      continue;
    }
    environment->ensure(e.substr(0, eq)) = Value::strnum_candidate(e.substr(eq + 1));
  }
  globals_["ENVIRON"].value = environment;

  set_operands({});
  ::srand48(0);
}

auto Tawk::Details::ExecutionState::assign(std::string const& s) -> bool
{
  static std::regex const assignment_re{"^[A-Za-z_][A-Za-z0-9_]*=", std::regex::extended};

  if (!std::regex_search(s, assignment_re)) {
    return false;
  }

  auto const eq{s.find('=')};
  Lexer lexer{std::make_unique<StringReader>(s.substr(eq + 1))};
  std::string value{lexer.peek_cmdline_string().string()};
  Ast::VarRef const ref{s.substr(0, eq), std::nullopt};
  write_var(ref, Value::strnum_candidate(std::move(value)), Location{"cmdline"});
  return true;
}

void Tawk::Details::ExecutionState::set_operands(std::vector<std::string> const& operands)
{
  auto argv{std::make_shared<Array>()};
  argv->ensure("0") = Value{"tawk"};
  std::size_t idx{1};
  for (auto const& operand : operands) {
    argv->ensure(std::to_string(idx++)) = Value::strnum_candidate(operand);
  }
  globals_["ARGV"].value = argv;
  set_global("ARGC", Value{static_cast<Floating>(idx)});
}

void Tawk::Details::ExecutionState::set_input(std::unique_ptr<Reader> reader)
{
  pending_input_ = std::move(reader);
  used_file_operand_ = true;
}

auto Tawk::Details::ExecutionState::run() -> int
{
  using Kind = Ast::Pattern::Kind;
  auto const& rules{program_.rules()};
  bool exiting{false};

  for (auto const& rule : rules) {
    if (rule.pattern.kind == Kind::begin && run_action(rule) == Flow::exit) {
      exiting = true;
      break;
    }
  }

  if (!exiting && program_.needs_input()) {
    /* Records are split on behalf of the first rule that reads them.  */
    auto const reader{std::find_if(rules.begin(), rules.end(), [](Ast::Rule const& rule) {
      return rule.pattern.kind != Kind::begin;
    })};
    Location const& record_loc{reader->location};

    std::string record;
    while (!exiting && next_main_record(record)) {
      set_record(std::move(record), record_loc);
      for (std::size_t i{0}; i < rules.size(); ++i) {
        auto const& rule{rules[i]};
        if (rule.pattern.kind == Kind::begin || rule.pattern.kind == Kind::end) {
          continue;
        }

        /* A function called from a pattern can also leave with next, nextfile or exit.  */
        Flow flow{Flow::normal};
        try {
          if (!rule_matches(rule, i)) {
            continue;
          }
        }
        catch (ControlTransfer const& transfer) {
          flow = transfer.flow;
        }
        if (flow == Flow::normal) {
          flow = run_action(rule);
        }
        if (flow == Flow::next) {
          break;
        }
        if (flow == Flow::nextfile) {
          main_input_.reset();
          break;
        }
        if (flow == Flow::exit) {
          exiting = true;
          break;
        }
      }
    }
  }

  /* exit in END stops END processing, otherwise all END rules run.  */
  for (auto const& rule : rules) {
    if (rule.pattern.kind == Kind::end && run_action(rule) == Flow::exit) {
      break;
    }
  }

  outputs_.close_all();
  return exit_status_;
}

auto Tawk::Details::ExecutionState::global(std::string const& name) const -> Value
{
  if (name == "NF") {
    return Value{static_cast<Floating>(fields_.nf())};
  }

  auto it{globals_.find(name)};
  if (it == globals_.end()) {
    return Value{};
  }
  if (auto const* v{std::get_if<Value>(&it->second.value)}; v != nullptr) {
    return *v;
  }
  return Value{};
}

auto Tawk::Details::ExecutionState::global_array(std::string const& name) const -> Array const*
{
  auto it{globals_.find(name)};
  if (it == globals_.end()) {
    return nullptr;
  }
  if (auto const* a{std::get_if<std::shared_ptr<Array>>(&it->second.value)}; a != nullptr) {
    return a->get();
  }
  return nullptr;
}

auto Tawk::Details::ExecutionState::set_global(std::string const& name, Value v) -> Value&
{
  auto& var{globals_[name]};
  var.value = std::move(v);
  return std::get<Value>(var.value);
}

auto Tawk::Details::ExecutionState::global_string(std::string const& name) const -> std::string
{
  return global(name).to_string(convfmt());
}

auto Tawk::Details::ExecutionState::global_number(std::string const& name) const -> Floating
{
  return global(name).to_number();
}

auto Tawk::Details::ExecutionState::convfmt() const -> std::string
{
  return global("CONVFMT").to_string("%.6g");
}

auto Tawk::Details::ExecutionState::paragraph_mode() const -> bool
{
  return global_string("RS").empty();
}

auto Tawk::Details::ExecutionState::variable(Ast::VarRef const& ref) -> Variable&
{
  if (ref.local.has_value() && !frames_.empty()) {
    return frames_.back().locals.at(*ref.local);
  }
  return globals_[ref.name];
}

auto Tawk::Details::ExecutionState::read_var(Ast::VarRef const& ref, Location const& loc) -> Value
{
  if (!ref.local.has_value() && ref.name == "NF") {
    return Value{static_cast<Floating>(fields_.nf())};
  }

  return std::visit(Overloaded{
                      [](std::monostate) { return Value{}; },
                      [](Value const& v) { return v; },
                      [&ref, &loc](std::shared_ptr<Array> const&) -> Value {
                        throw NameError(
                          loc, Messages::get().format(Msg::array_used_as_scalar, ref.name));
                      },
                    },
                    variable(ref).value);
}

void Tawk::Details::ExecutionState::write_var(Ast::VarRef const& ref, Value const& v,
                                              Location const& loc)
{
  if (!ref.local.has_value()) {
    if (ref.name == "NF") {
      Floating const n{v.to_number()};
      if (n < 0) {
        throw TypeError(loc, Messages::get().format(Msg::negative_nf, n));
      }
      fields_.nf(static_cast<std::size_t>(n), global_string("OFS"), convfmt());
      return;
    }
    if (program_.function(ref.name) != nullptr) {
      throw NameError(loc, Messages::get().format(Msg::assign_to_function, ref.name));
    }
  }

  Variable& var{variable(ref)};
  if (std::holds_alternative<std::shared_ptr<Array>>(var.value)) {
    throw NameError(loc, Messages::get().format(Msg::array_used_as_scalar, ref.name));
  }
  var.value = v;
}

auto Tawk::Details::ExecutionState::array(Ast::VarRef const& ref, Location const& loc) -> Array&
{
  return as_array(variable(ref), ref.name, loc);
}

auto Tawk::Details::ExecutionState::as_array(Variable& var, std::string const& name,
                                             Location const& loc) -> Array&
{
  if (auto* a{std::get_if<std::shared_ptr<Array>>(&var.value)}; a != nullptr) {
    return **a;
  }
  if (std::holds_alternative<Value>(var.value)) {
    throw NameError(loc, Messages::get().format(Msg::scalar_used_as_array, name));
  }

  /* Uninitialized: an argument becomes the caller's array as well.  */
  if (var.caller != nullptr) {
    (void)as_array(*var.caller, name, loc);
    var.value = std::get<std::shared_ptr<Array>>(var.caller->value);
  }
  else {
    var.value = std::make_shared<Array>();
  }
  return *std::get<std::shared_ptr<Array>>(var.value);
}

auto Tawk::Details::ExecutionState::subscript(Ast::ExprList const& subscripts) -> std::string
{
  std::string result;
  std::string const fmt{convfmt()};
  bool first{true};
  for (auto const& s : subscripts) {
    if (!first) {
      result += global_string("SUBSEP");
    }
    result += eval(*s).to_string(fmt);
    first = false;
  }
  return result;
}

auto Tawk::Details::ExecutionState::field_index(Ast::Expr const& index) -> std::size_t
{
  Floating const n{eval(index).to_number()};
  if (std::isnan(n)) {
    return 0;
  }
  if (n < 0 || n > max_field_index) {
    throw TypeError(index.location, Messages::get().format(Msg::negative_field_index, n));
  }
  return static_cast<std::size_t>(n);
}

auto Tawk::Details::ExecutionState::resolve(Ast::Expr const& target) -> LValue
{
  return std::visit(
    Overloaded{
      [](Ast::Variable const& node) { return LValue{LValue::Kind::variable, &node.var}; },
      [this, &target](Ast::Index const& node) {
        std::string const key{subscript(node.subscripts)};
        return LValue{LValue::Kind::element, nullptr,
                      &array(node.array, target.location).ensure(key)};
      },
      [this](Ast::Field const& node) {
        return LValue{LValue::Kind::field, nullptr, nullptr, field_index(*node.index)};
      },
      [&target](auto const&) -> LValue {
        throw TypeError(target.location, Messages::get().format(Msg::not_an_lvalue));
      },
    },
    target.node);
}

auto Tawk::Details::ExecutionState::load(LValue const& lv, Location const& loc) -> Value
{
  switch (lv.kind) {
  case LValue::Kind::variable:
    return read_var(*lv.var, loc);
  case LValue::Kind::element:
    return *lv.element;
  case LValue::Kind::field:
    return fields_.field(lv.field);
  }
  return Value{};
}

void Tawk::Details::ExecutionState::store(LValue const& lv, Value const& v, Location const& loc)
{
  switch (lv.kind) {
  case LValue::Kind::variable:
    write_var(*lv.var, v, loc);
    break;
  case LValue::Kind::element:
    *lv.element = v;
    break;
  case LValue::Kind::field:
    set_field(lv.field, v, loc);
    break;
  }
}

void Tawk::Details::ExecutionState::set_field(std::size_t i, Value const& v, Location const& loc)
{
  fields_.field(i, v, global_string("FS"), global_string("OFS"), convfmt(), paragraph_mode(),
                loc);
}

void Tawk::Details::ExecutionState::set_record(std::string record, Location const& loc)
{
  fields_.set_record(std::move(record), global_string("FS"), paragraph_mode(), loc);
}

auto Tawk::Details::ExecutionState::run_action(Ast::Rule const& rule) -> Flow
{
  try {
    return execute(rule.action);
  }
  catch (ControlTransfer const& transfer) {
    return transfer.flow;
  }
}

auto Tawk::Details::ExecutionState::rule_matches(Ast::Rule const& rule, std::size_t idx) -> bool
{
  switch (rule.pattern.kind) {
  case Ast::Pattern::Kind::always:
    return true;
  case Ast::Pattern::Kind::expr:
    return eval(*rule.pattern.first).to_bool();
  case Ast::Pattern::Kind::range:
    if (!in_range_[idx]) {
      if (!eval(*rule.pattern.first).to_bool()) {
        return false;
      }
      in_range_[idx] = true;
    }
    if (eval(*rule.pattern.last).to_bool()) {
      in_range_[idx] = false;
    }
    return true;
  case Ast::Pattern::Kind::begin:
  case Ast::Pattern::Kind::end:
    return false;
  }
  return false;
}

auto Tawk::Details::ExecutionState::execute(Ast::StmtPtr const& stmt) -> Flow
{
  return execute(*stmt);
}

auto Tawk::Details::ExecutionState::execute_loop(Ast::Stmt const& body, Flow& flow) -> bool
{
  Flow const result{execute(body)};
  switch (result) {
  case Flow::normal:
  case Flow::continue_:
    flow = Flow::normal;
    return true;
  case Flow::break_:
    flow = Flow::normal;
    return false;
  case Flow::next:
  case Flow::nextfile:
  case Flow::exit:
  case Flow::return_:
    flow = result;
    return false;
  }
  return false;
}

auto Tawk::Details::ExecutionState::execute(Ast::Stmt const& stmt) -> Flow
{
  Location const& loc{stmt.location};
  return std::visit(
    Overloaded{
      [this](Ast::ExprStmt const& s) {
        (void)eval(*s.expr);
        return Flow::normal;
      },
      [this, &loc](Ast::Print const& s) { return execute_print(s, loc); },
      [this](Ast::If const& s) {
        if (eval(*s.cond).to_bool()) {
          return execute(s.then);
        }
        return s.otherwise != nullptr ? execute(s.otherwise) : Flow::normal;
      },
      [this](Ast::While const& s) {
        Flow flow{Flow::normal};
        while (eval(*s.cond).to_bool()) {
          if (!execute_loop(*s.body, flow)) {
            break;
          }
        }
        return flow;
      },
      [this](Ast::DoWhile const& s) {
        Flow flow{Flow::normal};
        do {
          if (!execute_loop(*s.body, flow)) {
            break;
          }
        } while (eval(*s.cond).to_bool());
        return flow;
      },
      [this](Ast::For const& s) {
        if (s.init != nullptr) {
          (void)execute(s.init);
        }
        Flow flow{Flow::normal};
        while (s.cond == nullptr || eval(*s.cond).to_bool()) {
          if (!execute_loop(*s.body, flow)) {
            break;
          }
          if (s.update != nullptr) {
            (void)execute(s.update);
          }
        }
        return flow;
      },
      [this, &loc](Ast::ForIn const& s) {
        Array& arr{array(s.array, loc)};
        Flow flow{Flow::normal};
        for (auto const& key : arr.keys()) {
          /* Elements deleted by the body are skipped.  */
          if (!arr.contains(key)) {
            continue;
          }
          write_var(s.var, Value{key}, loc);
          if (!execute_loop(*s.body, flow)) {
            break;
          }
        }
        return flow;
      },
      [this](Ast::Block const& s) {
        for (auto const& stmt : s.stmts) {
          Flow const flow{execute(*stmt)};
          if (flow != Flow::normal) {
            return flow;
          }
        }
        return Flow::normal;
      },
      [](Ast::Next const&) { return Flow::next; },
      [](Ast::NextFile const&) { return Flow::nextfile; },
      [this](Ast::Exit const& s) {
        if (s.code != nullptr) {
          exit_status_ = to_status(eval(*s.code).to_number());
        }
        return Flow::exit;
      },
      [this](Ast::Return const& s) {
        Value result{s.value != nullptr ? eval(*s.value) : Value{}};
        frames_.back().result = std::move(result);
        return Flow::return_;
      },
      [](Ast::Break const&) { return Flow::break_; },
      [](Ast::Continue const&) { return Flow::continue_; },
      [this, &loc](Ast::Delete const& s) {
        Array& arr{array(s.array, loc)};
        if (s.subscripts.empty()) {
          arr.clear();
        }
        else {
          arr.erase(subscript(s.subscripts));
        }
        return Flow::normal;
      },
    },
    stmt.node);
}

auto Tawk::Details::ExecutionState::execute_print(Ast::Print const& print, Location const& loc)
  -> Flow
{
  std::string text;
  if (print.printf_) {
    if (!print.args.empty()) {
      std::string const format{eval(*print.args.front()).to_string(convfmt())};
      std::vector<Value> values;
      for (auto it{print.args.begin() + 1}; it != print.args.end(); ++it) {
        values.push_back(eval(**it));
      }
      text = format_printf(format, values, convfmt());
    }
  }
  else if (print.args.empty()) {
    text = fields_.field(0).to_string(convfmt()) + global_string("ORS");
  }
  else {
    std::string const ofs{global_string("OFS")};
    bool first{true};
    for (auto const& arg : print.args) {
      if (!first) {
        text += ofs;
      }
      text += output_string(eval(*arg));
      first = false;
    }
    text += global_string("ORS");
  }

  if (print.redirect == Ast::Print::Redirect::none) {
    outputs_.standard_output().write(text, loc);
  }
  else {
    std::string const dest{eval(*print.dest).to_string(convfmt())};
    outputs_.get(print.redirect, dest, loc).write(text, loc);
  }
  return Flow::normal;
}

auto Tawk::Details::ExecutionState::output_string(Value const& v) -> std::string
{
  if (v.kind() == Value::Kind::number) {
    return format_number(v.to_number(), global_string("OFMT"));
  }
  return v.to_string(convfmt());
}

auto Tawk::Details::ExecutionState::eval(Ast::Expr const& expr) -> Value
{
  return std::visit([this, &expr](auto const& node) { return eval_node(node, expr.location); },
                    expr.node);
}

auto Tawk::Details::ExecutionState::eval_node(Ast::NumberLit const& node,
                                              [[maybe_unused]] Location const& loc) -> Value
{
  return Value{node.value};
}

auto Tawk::Details::ExecutionState::eval_node(Ast::StringLit const& node,
                                              [[maybe_unused]] Location const& loc) -> Value
{
  return Value{node.value};
}

auto Tawk::Details::ExecutionState::eval_node(Ast::RegexLit const& node,
                                              [[maybe_unused]] Location const& loc) -> Value
{
  std::string const record{fields_.field(0).to_string(convfmt())};
  return to_value(std::regex_search(record, node.re));
}

auto Tawk::Details::ExecutionState::eval_node(Ast::Variable const& node, Location const& loc)
  -> Value
{
  return read_var(node.var, loc);
}

auto Tawk::Details::ExecutionState::eval_node(Ast::Index const& node, Location const& loc)
  -> Value
{
  std::string const key{subscript(node.subscripts)};
  return array(node.array, loc).ensure(key);
}

auto Tawk::Details::ExecutionState::eval_node(Ast::Field const& node,
                                              [[maybe_unused]] Location const& loc) -> Value
{
  return fields_.field(field_index(*node.index));
}

auto Tawk::Details::ExecutionState::eval_node(Ast::Unary const& node,
                                              [[maybe_unused]] Location const& loc) -> Value
{
  Value const operand{eval(*node.operand)};
  switch (node.op) {
  case Ast::Unary::Op::negate:
    return Value{-operand.to_number()};
  case Ast::Unary::Op::plus:
    return Value{operand.to_number()};
  case Ast::Unary::Op::not_:
    return to_value(!operand.to_bool());
  }
  return Value{};
}

auto Tawk::Details::ExecutionState::eval_node(Ast::Binary const& node, Location const& loc)
  -> Value
{
  using Op = Ast::Binary::Op;

  Value const lhs{eval(*node.lhs)};
  Value const rhs{eval(*node.rhs)};
  switch (node.op) {
  case Op::add:
    return Value{lhs.to_number() + rhs.to_number()};
  case Op::subtract:
    return Value{lhs.to_number() - rhs.to_number()};
  case Op::multiply:
    return Value{lhs.to_number() * rhs.to_number()};
  case Op::divide:
    return Value{divide(lhs.to_number(), rhs.to_number(), loc)};
  case Op::modulo:
    return Value{modulo(lhs.to_number(), rhs.to_number(), loc)};
  case Op::power:
    return Value{std::pow(lhs.to_number(), rhs.to_number())};
  case Op::concat: {
    std::string const fmt{convfmt()};
    return Value{lhs.to_string(fmt) + rhs.to_string(fmt)};
  }
  case Op::less:
    return to_value(compare(lhs, rhs, convfmt()) < 0);
  case Op::less_equal:
    return to_value(compare(lhs, rhs, convfmt()) <= 0);
  case Op::equal:
    return to_value(compare(lhs, rhs, convfmt()) == 0);
  case Op::not_equal:
    return to_value(compare(lhs, rhs, convfmt()) != 0);
  case Op::greater_equal:
    return to_value(compare(lhs, rhs, convfmt()) >= 0);
  case Op::greater:
    return to_value(compare(lhs, rhs, convfmt()) > 0);
  }
  return Value{};
}

auto Tawk::Details::ExecutionState::regex(Ast::Expr const& expr) -> std::regex const&
{
  if (auto const* re{std::get_if<Ast::RegexLit>(&expr.node)}; re != nullptr) {
    return re->re;
  }
  return regexes_.get(eval(expr).to_string(convfmt()), expr.location);
}

auto Tawk::Details::ExecutionState::eval_node(Ast::Match const& node,
                                              [[maybe_unused]] Location const& loc) -> Value
{
  std::string const s{eval(*node.lhs).to_string(convfmt())};
  bool const matched{std::regex_search(s, regex(*node.re))};
  return to_value(matched != node.negate);
}

auto Tawk::Details::ExecutionState::eval_node(Ast::Logical const& node,
                                              [[maybe_unused]] Location const& loc) -> Value
{
  bool const lhs{eval(*node.lhs).to_bool()};
  if (node.op == Ast::Logical::Op::and_) {
    return to_value(lhs && eval(*node.rhs).to_bool());
  }
  return to_value(lhs || eval(*node.rhs).to_bool());
}

auto Tawk::Details::ExecutionState::eval_node(Ast::Ternary const& node,
                                              [[maybe_unused]] Location const& loc) -> Value
{
  return eval(*node.cond).to_bool() ? eval(*node.then) : eval(*node.otherwise);
}

auto Tawk::Details::ExecutionState::eval_node(Ast::Assign const& node, Location const& loc)
  -> Value
{
  using Op = Ast::Assign::Op;

  /* The value is evaluated first, so that resolving the target sees its side effects.  */
  Value value{eval(*node.value)};
  LValue const lv{resolve(*node.target)};

  if (node.op != Op::assign) {
    Floating const current{load(lv, loc).to_number()};
    Floating const rhs{value.to_number()};
    switch (node.op) {
    case Op::add:
      value = Value{current + rhs};
      break;
    case Op::subtract:
      value = Value{current - rhs};
      break;
    case Op::multiply:
      value = Value{current * rhs};
      break;
    case Op::divide:
      value = Value{divide(current, rhs, loc)};
      break;
    case Op::modulo:
      value = Value{modulo(current, rhs, loc)};
      break;
    case Op::power:
      value = Value{std::pow(current, rhs)};
      break;
    case Op::assign:
      break;
    }
  }

  store(lv, value, loc);
  return value;
}

auto Tawk::Details::ExecutionState::eval_node(Ast::IncDec const& node, Location const& loc)
  -> Value
{
  LValue const lv{resolve(*node.target)};
  Floating const old_value{load(lv, loc).to_number()};
  Floating const new_value{node.increment ? old_value + 1 : old_value - 1};
  store(lv, Value{new_value}, loc);
  return Value{node.prefix ? new_value : old_value};
}

auto Tawk::Details::ExecutionState::eval_node(Ast::In const& node, Location const& loc) -> Value
{
  std::string const key{subscript(node.subscripts)};
  return to_value(array(node.array, loc).contains(key));
}

auto Tawk::Details::ExecutionState::eval_node(Ast::Getline const& node, Location const& loc)
  -> Value
{
  return getline(node, loc);
}

auto Tawk::Details::ExecutionState::resolve_callee(Ast::Call const& call, Location const& loc)
  -> Callee
{
  if (auto it{callees_.find(&call)}; it != callees_.end()) {
    return it->second;
  }

  std::optional<Callee> callee;
  if (auto const* fn{program_.function(call.name)}; fn != nullptr) {
    callee = fn;
  }
  else if (call.name == "field") {
    callee = RuntimeBuiltin::field;
  }
  else if (call.name == "asort") {
    callee = RuntimeBuiltin::asort;
  }
  else if (call.name == "asorti") {
    callee = RuntimeBuiltin::asorti;
  }
  else if (auto foreign{foreign_.resolve(call.name)}; foreign != nullptr) {
    callee = foreign;
  }
  else {
    throw NameError(loc, Messages::get().format(Msg::undefined_function, call.name));
  }

  callees_.emplace(&call, *callee);
  return *callee;
}

auto Tawk::Details::ExecutionState::eval_node(Ast::Call const& node, Location const& loc) -> Value
{
  return std::visit(Overloaded{
                      [this, &node, &loc](RuntimeBuiltin builtin) {
                        return call_runtime(builtin, node, loc);
                      },
                      [this, &node, &loc](Ast::FunctionDef const* fn) {
                        return call_user(*fn, node, loc);
                      },
                      [this, &node, &loc](std::shared_ptr<ForeignFunction> const& fn) {
                        std::vector<Value> args;
                        args.reserve(node.args.size());
                        for (auto const& arg : node.args) {
                          args.push_back(eval(*arg));
                        }
                        return foreign_.call(*fn, node.name, args, loc, convfmt());
                      },
                    },
                    resolve_callee(node, loc));
}

auto Tawk::Details::ExecutionState::bind_argument(Ast::Expr const& arg) -> Variable
{
  auto const* var{std::get_if<Ast::Variable>(&arg.node)};
  if (var == nullptr || (!var->var.local.has_value() && var->var.name == "NF")) {
    return Variable{eval(arg), nullptr};
  }

  /* Arrays are passed by reference, scalars by value.  */
  Variable& source{variable(var->var)};
  if (std::holds_alternative<std::monostate>(source.value)) {
    return Variable{std::monostate{}, &source};
  }
  return Variable{source.value, nullptr};
}

auto Tawk::Details::ExecutionState::call_user(Ast::FunctionDef const& fn, Ast::Call const& call,
                                              Location const& loc) -> Value
{
  if (call.args.size() > fn.params.size()) {
    throw TypeError(loc, Messages::get().format(Msg::too_many_arguments, fn.name,
                                                call.args.size(), fn.params.size()));
  }

  Frame frame;
  frame.locals.reserve(fn.params.size());
  for (auto const& arg : call.args) {
    frame.locals.push_back(bind_argument(*arg));
  }
  frame.locals.resize(fn.params.size());

  frames_.push_back(std::move(frame));
  FrameGuard const guard{frames_};

  Flow const flow{execute(fn.body)};
  if (flow == Flow::next || flow == Flow::nextfile || flow == Flow::exit) {
    throw ControlTransfer{flow};
  }

  Value result{std::move(frames_.back().result)};
  return result;
}

auto Tawk::Details::ExecutionState::array_argument(Ast::Expr const& arg, std::string const& func)
  -> Array&
{
  auto const* var{std::get_if<Ast::Variable>(&arg.node)};
  if (var == nullptr) {
    throw TypeError(arg.location, Messages::get().format(Msg::array_argument_required, func));
  }
  return array(var->var, arg.location);
}

auto Tawk::Details::ExecutionState::call_runtime(RuntimeBuiltin builtin, Ast::Call const& call,
                                                 Location const& loc) -> Value
{
  switch (builtin) {
  case RuntimeBuiltin::field:
    if (call.args.size() != 1) {
      throw TypeError(loc, Messages::get().format(Msg::wrong_builtin_argument_count, call.name,
                                                  call.args.size()));
    }
    return fields_.field(field_index(*call.args.front()));
  case RuntimeBuiltin::asort:
    return builtin_sort(call, false, loc);
  case RuntimeBuiltin::asorti:
    return builtin_sort(call, true, loc);
  }
  return Value{};
}

auto Tawk::Details::ExecutionState::eval_node(Ast::BuiltinCall const& node, Location const& loc)
  -> Value
{
  using Func = Token::BuiltinFunc;

  switch (node.func) {
  case Func::atan2:
  case Func::cos:
  case Func::exp:
  case Func::int_:
  case Func::log:
  case Func::sin:
  case Func::sqrt:
    return builtin_math(node.func, node.args);
  case Func::rand:
    return Value{::drand48()};
  case Func::srand:
    return builtin_srand(node.args);
  case Func::close:
    return builtin_close(node.args);
  case Func::fflush:
    return builtin_fflush(node.args);
  case Func::system:
    return builtin_system(node.args);
  case Func::gsub:
    return builtin_sub(node.args, true, loc);
  case Func::sub:
    return builtin_sub(node.args, false, loc);
  case Func::index:
    return builtin_index(node.args);
  case Func::length:
    return builtin_length(node.args);
  case Func::match:
    return builtin_match(node.args);
  case Func::split:
    return builtin_split(node.args, loc);
  case Func::substr:
    return builtin_substr(node.args);
  case Func::tolower:
    return builtin_case(node.args, false);
  case Func::toupper:
    return builtin_case(node.args, true);
  case Func::sprintf: {
    std::string const format{eval(*node.args.front()).to_string(convfmt())};
    std::vector<Value> values;
    for (auto it{node.args.begin() + 1}; it != node.args.end(); ++it) {
      values.push_back(eval(**it));
    }
    return Value{format_printf(format, values, convfmt())};
  }
  }
  return Value{};
}

Tawk::Interpreter::Interpreter(Program const& program, std::ostream& out,
                               ForeignFunctionRegistry& foreign)
    : state_(std::make_unique<Details::ExecutionState>(program, out, foreign))
{
}

Tawk::Interpreter::~Interpreter() = default;

auto Tawk::Interpreter::assign(std::string const& assignment) -> bool
{
  return state_->assign(assignment);
}

auto Tawk::Interpreter::run(std::vector<std::string> const& operands) -> int
{
  state_->set_operands(operands);
  return state_->run();
}

auto Tawk::Interpreter::run(std::unique_ptr<Reader> input) -> int
{
  state_->set_input(std::move(input));
  return state_->run();
}

auto Tawk::Interpreter::global(std::string const& name) const -> Value
{
  return state_->global(name);
}

auto Tawk::Interpreter::global_array(std::string const& name) const -> Array const*
{
  return state_->global_array(name);
}
