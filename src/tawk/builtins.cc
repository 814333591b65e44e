/** \file   builtins.cc
 *  \brief  tawk builtin functions
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk-messages.hh"

#include <sys/wait.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <limits>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "session.hh"

namespace {
/** \brief  Round half-way cases up, as POSIX requires for substr.  */
auto round_half(Tawk::Floating f) -> Tawk::Floating { return std::floor(f + 0.5); }

/** \brief          Expand the replacement text of sub and gsub.
 *  \param  repl    Replacement text: & is the matched text, \& a literal &, and \\ a backslash.
 *  \param  matched Matched text.
 */
auto expand_replacement(std::string const& repl, std::string_view matched) -> std::string
{
  std::string result;
  for (std::size_t i{0}; i < repl.size(); ++i) {
    char const c{repl[i]};
    if (c == '\\' && i + 1 < repl.size() && (repl[i + 1] == '&' || repl[i + 1] == '\\')) {
      result += repl[++i];
    }
    else if (c == '&') {
      result += matched;
    }
    else {
      result += c;
    }
  }
  return result;
}

auto count_value(std::size_t n) -> Tawk::Value
{
  return Tawk::Value{static_cast<Tawk::Floating>(n)};
}
}  // namespace

auto Tawk::Details::ExecutionState::builtin_length(Ast::ExprList const& args) -> Value
{
  if (args.empty()) {
    return count_value(fields_.field(0).to_string(convfmt()).size());
  }

  Ast::Expr const& arg{*args.front()};
  if (auto const* var{std::get_if<Ast::Variable>(&arg.node)};
      var != nullptr && (var->var.local.has_value() || var->var.name != "NF")) {
    if (auto const* a{std::get_if<std::shared_ptr<Array>>(&variable(var->var).value)};
        a != nullptr) {
      return count_value((*a)->size());
    }
  }

  return count_value(eval(arg).to_string(convfmt()).size());
}

auto Tawk::Details::ExecutionState::builtin_substr(Ast::ExprList const& args) -> Value
{
  std::string const s{eval(*args[0]).to_string(convfmt())};
  Floating const m{round_half(eval(*args[1]).to_number())};
  Floating end{std::numeric_limits<Floating>::infinity()};
  if (args.size() > 2) {
    end = m + round_half(eval(*args[2]).to_number());
  }

  /* Characters are numbered from 1, and we want those in [start, end).  */
  Floating const start{std::max(m, Floating{1})};
  end = std::min(end, static_cast<Floating>(s.size() + 1));
  if (std::isnan(start) || std::isnan(end) || end <= start) {
    return Value{std::string{}};
  }

  return Value{s.substr(static_cast<std::size_t>(start) - 1, static_cast<std::size_t>(end - start))};
}

auto Tawk::Details::ExecutionState::builtin_index(Ast::ExprList const& args) -> Value
{
  std::string const s{eval(*args[0]).to_string(convfmt())};
  std::string const t{eval(*args[1]).to_string(convfmt())};
  if (t.empty()) {
    return count_value(0);
  }

  auto const pos{s.find(t)};
  return count_value(pos == std::string::npos ? 0 : pos + 1);
}

auto Tawk::Details::ExecutionState::builtin_split(Ast::ExprList const& args, Location const& loc)
  -> Value
{
  std::string const s{eval(*args[0]).to_string(convfmt())};

  std::string fs;
  if (args.size() > 2) {
    if (auto const* re{std::get_if<Ast::RegexLit>(&args[2]->node)}; re != nullptr) {
      fs = re->ere;
    }
    else {
      fs = eval(*args[2]).to_string(convfmt());
    }
  }
  else {
    fs = global_string("FS");
  }

  auto const* var{std::get_if<Ast::Variable>(&args[1]->node)};
  if (var == nullptr) {
    throw TypeError(args[1]->location,
                    Messages::get().format(Msg::split_target_not_array, "split"));
  }
  Variable& target{variable(var->var)};
  if (std::holds_alternative<Value>(target.value)) {
    throw TypeError(loc, Messages::get().format(Msg::split_target_not_array, var->var.name));
  }

  auto parts{fields_.split(s, fs, false, args.size() > 2 ? args[2]->location : loc)};
  Array& arr{as_array(target, var->var.name, loc)};
  arr.clear();
  for (std::size_t i{0}; i < parts.size(); ++i) {
    arr.ensure(std::to_string(i + 1)) = Value::strnum_candidate(std::move(parts[i]));
  }
  return count_value(parts.size());
}

auto Tawk::Details::ExecutionState::builtin_sub(Ast::ExprList const& args, bool global,
                                                Location const& loc) -> Value
{
  std::regex const& re{regex(*args[0])};
  std::string const repl{eval(*args[1]).to_string(convfmt())};
  LValue const target{args.size() > 2 ? resolve(*args[2])
                                      : LValue{LValue::Kind::field, nullptr, nullptr, 0}};
  std::string const text{load(target, loc).to_string(convfmt())};

  std::string result;
  std::size_t count{0};
  auto pos{text.cbegin()};
  bool after_match{false};  // Is pos just after a non-empty match?
  while (true) {
    std::smatch m;
    auto const flags{pos == text.cbegin() ? std::regex_constants::match_default
                                          : std::regex_constants::match_prev_avail};
    if (!std::regex_search(pos, text.cend(), m, re, flags)) {
      break;
    }

    /* An empty match straight after a match doesn't count.  */
    if (m.length(0) == 0 && after_match && m[0].first == pos) {
      if (pos == text.cend()) {
        break;
      }
      result += *pos++;
      after_match = false;
      continue;
    }

    result.append(pos, m[0].first);
    result += expand_replacement(repl, m.str(0));
    ++count;

    if (m.length(0) == 0) {
      if (m[0].first == text.cend()) {
        pos = text.cend();
        break;
      }
      result += *m[0].first;
      pos = m[0].first + 1;
      after_match = false;
    }
    else {
      pos = m[0].second;
      after_match = true;
    }

    if (!global) {
      break;
    }
  }

  if (count != 0) {
    result.append(pos, text.cend());
    store(target, Value{result}, loc);
  }
  return count_value(count);
}

auto Tawk::Details::ExecutionState::builtin_match(Ast::ExprList const& args) -> Value
{
  std::string const s{eval(*args[0]).to_string(convfmt())};
  std::regex const& re{regex(*args[1])};

  Floating start{0};
  Floating length{-1};
  std::smatch m;
  if (std::regex_search(s, m, re)) {
    start = static_cast<Floating>(m.position(0) + 1);
    length = static_cast<Floating>(m.length(0));
  }

  set_global("RSTART", Value{start});
  set_global("RLENGTH", Value{length});
  return Value{start};
}

auto Tawk::Details::ExecutionState::builtin_case(Ast::ExprList const& args, bool upper) -> Value
{
  std::string s{eval(*args[0]).to_string(convfmt())};
  std::transform(s.begin(), s.end(), s.begin(), [upper](unsigned char c) {
    return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
  });
  return Value{s};
}

auto Tawk::Details::ExecutionState::builtin_math(Token::BuiltinFunc func,
                                                 Ast::ExprList const& args) -> Value
{
  Floating const x{eval(*args[0]).to_number()};
  switch (func) {
  case Token::BuiltinFunc::atan2:
    return Value{std::atan2(x, eval(*args[1]).to_number())};
  case Token::BuiltinFunc::cos:
    return Value{std::cos(x)};
  case Token::BuiltinFunc::exp:
    return Value{std::exp(x)};
  case Token::BuiltinFunc::int_:
    return Value{std::trunc(x)};
  case Token::BuiltinFunc::log:
    return Value{std::log(x)};
  case Token::BuiltinFunc::sin:
    return Value{std::sin(x)};
  case Token::BuiltinFunc::sqrt:
    return Value{std::sqrt(x)};
  default:
    break;
  }
  return Value{};
}

auto Tawk::Details::ExecutionState::builtin_srand(Ast::ExprList const& args) -> Value
{
  Floating const previous{seed_};
  seed_ = args.empty() ? static_cast<Floating>(std::time(nullptr)) : eval(*args[0]).to_number();
  ::srand48(static_cast<long>(seed_));  // NOLINT(google-runtime-int)
  return Value{previous};
}

auto Tawk::Details::ExecutionState::builtin_close(Ast::ExprList const& args) -> Value
{
  std::string const name{eval(*args[0]).to_string(convfmt())};
  if (auto result{outputs_.close(name)}; result.has_value()) {
    return Value{static_cast<Floating>(*result)};
  }
  if (input_files_.erase(name) != 0) {
    return Value{Floating{0}};
  }
  return Value{Floating{-1}};
}

auto Tawk::Details::ExecutionState::builtin_system(Ast::ExprList const& args) -> Value
{
  std::string const command{eval(*args[0]).to_string(convfmt())};
  (void)outputs_.flush_all();

  int const status{std::system(command.c_str())};  // NOLINT(cert-env33-c)
  if (status == -1) {
    return Value{Floating{-1}};
  }
  if (WIFEXITED(status)) {                                      // NOLINT(hicpp-signed-bitwise)
    return Value{static_cast<Floating>(WEXITSTATUS(status))};  // NOLINT(hicpp-signed-bitwise)
  }
  if (WIFSIGNALED(status)) {                                         // NOLINT(hicpp-signed-bitwise)
    return Value{static_cast<Floating>(256 + WTERMSIG(status))};  // NOLINT
  }
  return Value{Floating{-1}};
}

auto Tawk::Details::ExecutionState::builtin_fflush(Ast::ExprList const& args) -> Value
{
  bool success{false};
  if (args.empty()) {
    success = outputs_.flush_all();
  }
  else {
    success = outputs_.flush(eval(*args[0]).to_string(convfmt()));
  }
  return Value{success ? Floating{0} : Floating{-1}};
}

auto Tawk::Details::ExecutionState::builtin_sort(Ast::Call const& call, bool indices,
                                                 Location const& loc) -> Value
{
  if (call.args.empty() || call.args.size() > 2) {
    throw TypeError(loc, Messages::get().format(Msg::wrong_builtin_argument_count, call.name,
                                                call.args.size()));
  }

  Array& source{array_argument(*call.args[0], call.name)};
  std::vector<Value> values;
  values.reserve(source.size());
  if (indices) {
    for (auto const& key : source.keys()) {
      values.emplace_back(key);
    }
  }
  else {
    for (auto const& [key, value] : source.elements()) {
      values.push_back(value);
    }

    /* Numbers sort before strings.  */
    std::string const fmt{convfmt()};
    std::stable_sort(values.begin(), values.end(), [&fmt](Value const& lhs, Value const& rhs) {
      bool const lhs_numeric{lhs.is_numeric()};
      if (lhs_numeric != rhs.is_numeric()) {
        return lhs_numeric;
      }
      if (lhs_numeric) {
        return lhs.to_number() < rhs.to_number();
      }
      return lhs.to_string(fmt) < rhs.to_string(fmt);
    });
  }

  Array& dest{call.args.size() > 1 ? array_argument(*call.args[1], call.name) : source};
  dest.clear();
  for (std::size_t i{0}; i < values.size(); ++i) {
    dest.ensure(std::to_string(i + 1)) = values[i];
  }
  return count_value(values.size());
}
