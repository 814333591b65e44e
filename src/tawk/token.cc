/** \file   token.cc
 *  \brief  Implementation of Tawk::Token
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk/utils.hh"

#include <array>
#include <cassert>
#include <iostream>
#include <utility>

#include "tawk.hh"

namespace {
using Type = Tawk::Token::Type;
using BuiltinFunc = Tawk::Token::BuiltinFunc;

/** \brief  Description of a token type: name used in diagnostics, and its program spelling.  */
struct TypeInfo
{
  Type type;
  char const* name;
  char const* spelling;
};

// Must be kept in the same order as Tawk::Token::Type.
constexpr std::array type_info{
  TypeInfo{Type::error, "error", "error"},
  TypeInfo{Type::eof, "eof", "end of file"},
  TypeInfo{Type::newline, "newline", "newline"},
  TypeInfo{Type::name, "name", nullptr},
  TypeInfo{Type::func_name, "func_name", nullptr},
  TypeInfo{Type::builtin_func_name, "builtin_func_name", nullptr},
  TypeInfo{Type::string, "string", nullptr},
  TypeInfo{Type::floating, "floating", nullptr},
  TypeInfo{Type::integer, "integer", nullptr},
  TypeInfo{Type::ere, "ere", nullptr},
  TypeInfo{Type::begin, "begin", "BEGIN"},
  TypeInfo{Type::break_, "break", "break"},
  TypeInfo{Type::continue_, "continue", "continue"},
  TypeInfo{Type::delete_, "delete", "delete"},
  TypeInfo{Type::do_, "do", "do"},
  TypeInfo{Type::else_, "else", "else"},
  TypeInfo{Type::end, "end", "END"},
  TypeInfo{Type::exit, "exit", "exit"},
  TypeInfo{Type::for_, "for", "for"},
  TypeInfo{Type::function, "function", "function"},
  TypeInfo{Type::getline, "getline", "getline"},
  TypeInfo{Type::if_, "if", "if"},
  TypeInfo{Type::in, "in", "in"},
  TypeInfo{Type::next, "next", "next"},
  TypeInfo{Type::nextfile, "nextfile", "nextfile"},
  TypeInfo{Type::print, "print", "print"},
  TypeInfo{Type::printf, "printf", "printf"},
  TypeInfo{Type::return_, "return", "return"},
  TypeInfo{Type::while_, "while", "while"},
  TypeInfo{Type::add_assign, "add_assign", "+="},
  TypeInfo{Type::sub_assign, "sub_assign", "-="},
  TypeInfo{Type::mul_assign, "mul_assign", "*="},
  TypeInfo{Type::div_assign, "div_assign", "/="},
  TypeInfo{Type::mod_assign, "mod_assign", "%="},
  TypeInfo{Type::pow_assign, "pow_assign", "^="},
  TypeInfo{Type::or_, "or", "||"},
  TypeInfo{Type::and_, "and", "&&"},
  TypeInfo{Type::no_match, "no_match", "!~"},
  TypeInfo{Type::eq, "eq", "=="},
  TypeInfo{Type::le, "le", "<="},
  TypeInfo{Type::ge, "ge", ">="},
  TypeInfo{Type::ne, "ne", "!="},
  TypeInfo{Type::incr, "incr", "++"},
  TypeInfo{Type::decr, "decr", "--"},
  TypeInfo{Type::append, "append", ">>"},
  TypeInfo{Type::lbrace, "lbrace", "{"},
  TypeInfo{Type::rbrace, "rbrace", "}"},
  TypeInfo{Type::lparens, "lparens", "("},
  TypeInfo{Type::rparens, "rparens", ")"},
  TypeInfo{Type::lsquare, "lsquare", "["},
  TypeInfo{Type::rsquare, "rsquare", "]"},
  TypeInfo{Type::comma, "comma", ","},
  TypeInfo{Type::semicolon, "semicolon", ";"},
  TypeInfo{Type::add, "add", "+"},
  TypeInfo{Type::subtract, "subtract", "-"},
  TypeInfo{Type::multiply, "multiply", "*"},
  TypeInfo{Type::divide, "divide", "/"},
  TypeInfo{Type::modulo, "modulo", "%"},
  TypeInfo{Type::power, "power", "^"},
  TypeInfo{Type::not_, "not", "!"},
  TypeInfo{Type::greater_than, "greater_than", ">"},
  TypeInfo{Type::less_than, "less_than", "<"},
  TypeInfo{Type::pipe, "pipe", "|"},
  TypeInfo{Type::query, "query", "?"},
  TypeInfo{Type::colon, "colon", ":"},
  TypeInfo{Type::tilde, "tilde", "~"},
  TypeInfo{Type::dollar, "dollar", "$"},
  TypeInfo{Type::assign, "assign", "="},
};

// Must be kept in the same order as Tawk::Token::BuiltinFunc.
constexpr std::array builtin_names{
  std::pair{BuiltinFunc::atan2, "atan2"},     std::pair{BuiltinFunc::close, "close"},
  std::pair{BuiltinFunc::cos, "cos"},         std::pair{BuiltinFunc::exp, "exp"},
  std::pair{BuiltinFunc::fflush, "fflush"},   std::pair{BuiltinFunc::gsub, "gsub"},
  std::pair{BuiltinFunc::index, "index"},     std::pair{BuiltinFunc::int_, "int"},
  std::pair{BuiltinFunc::length, "length"},   std::pair{BuiltinFunc::log, "log"},
  std::pair{BuiltinFunc::match, "match"},     std::pair{BuiltinFunc::rand, "rand"},
  std::pair{BuiltinFunc::sin, "sin"},         std::pair{BuiltinFunc::split, "split"},
  std::pair{BuiltinFunc::sprintf, "sprintf"}, std::pair{BuiltinFunc::sqrt, "sqrt"},
  std::pair{BuiltinFunc::srand, "srand"},     std::pair{BuiltinFunc::sub, "sub"},
  std::pair{BuiltinFunc::substr, "substr"},   std::pair{BuiltinFunc::system, "system"},
  std::pair{BuiltinFunc::tolower, "tolower"}, std::pair{BuiltinFunc::toupper, "toupper"},
};

auto info(Type t) -> TypeInfo const&
{
  auto const& result{type_info.at(static_cast<std::size_t>(t))};
  assert(result.type == t);  // NOLINT
  return result;
}
}  // namespace

Tawk::Token::Token(Type type) : value_(type)
{
  assert(type != Type::integer);            // NOLINT
  assert(type != Type::floating);           // NOLINT
  assert(type != Type::name);               // NOLINT
  assert(type != Type::func_name);          // NOLINT
  assert(type != Type::builtin_func_name);  // NOLINT
  assert(type != Type::string);             // NOLINT
  assert(type != Type::ere);                // NOLINT
  assert(type != Type::error);              // NOLINT
}

Tawk::Token::Token(Type type, std::string const& s) : value_(s)
{
  switch (type) {
  case Type::name:
    value_ = Name{s};
    break;
  case Type::func_name:
    value_ = FuncName{s};
    break;
  case Type::ere:
    value_ = ERE{s};
    break;
  case Type::error:
    value_ = ErrorMsg{s};
    break;
  default:
    assert(type == Type::string);  // NOLINT
    break;
  }
}

Tawk::Token::Token([[maybe_unused]] Type type, BuiltinFunc func) : value_(func)
{
  assert(type == Type::builtin_func_name);  // NOLINT
}

Tawk::Token::Token([[maybe_unused]] Type type, Integer integer) : value_(integer)
{
  assert(type == Type::integer);  // NOLINT
}

Tawk::Token::Token([[maybe_unused]] Type type, Floating floating) : value_(floating)
{
  assert(type == Type::floating);  // NOLINT
}

auto Tawk::Token::type() const -> Token::Type
{
  return std::visit(Overloaded{[](Type t) { return t; },
                               [](BuiltinFunc /*unused*/) { return Type::builtin_func_name; },
                               [](std::string const& /*unused*/) { return Type::string; },
                               [](Name const& /*unused*/) { return Type::name; },
                               [](ERE const& /*unused*/) { return Type::ere; },
                               [](FuncName const& /*unused*/) { return Type::func_name; },
                               [](Integer /*unused*/) { return Type::integer; },
                               [](Floating /*unused*/) { return Type::floating; },
                               [](ErrorMsg const& /*unused*/) { return Type::error; }},
                    value_);
}

auto Tawk::Token::name() const -> std::string const& { return std::get<Name>(value_).get(); }

auto Tawk::Token::func_name() const -> std::string const&
{
  return std::get<FuncName>(value_).get();
}

auto Tawk::Token::ere() const -> std::string const& { return std::get<ERE>(value_).get(); }

auto Tawk::Token::integer() const -> Integer { return std::get<Integer>(value_); }

auto Tawk::Token::floating() const -> Floating { return std::get<Floating>(value_); }

auto Tawk::Token::number() const -> Floating
{
  if (type() == Type::integer) {
    return static_cast<Floating>(integer().get());
  }
  return floating();
}

auto Tawk::Token::string() const -> std::string const& { return std::get<std::string>(value_); }

auto Tawk::Token::error() const -> std::string const& { return std::get<ErrorMsg>(value_).get(); }

auto Tawk::Token::builtin_func_name() const -> BuiltinFunc
{
  return std::get<BuiltinFunc>(value_);
}

auto Tawk::Token::location() const -> Location const& { return location_; }

void Tawk::Token::location(Location const& location) { location_ = location; }

auto Tawk::operator<<(std::ostream& os, Token::Type t) -> std::ostream&
{
  return os << info(t).name;
}

auto Tawk::operator<<(std::ostream& os, Token::BuiltinFunc bf) -> std::ostream&
{
  auto const& entry{builtin_names.at(static_cast<std::size_t>(bf))};
  assert(entry.first == bf);  // NOLINT
  return os << entry.second;
}

auto Tawk::operator<<(std::ostream& os, Token const& token) -> std::ostream&
{
  switch (token.type()) {
  case Token::Type::error:
    os << "ERROR(" << token.error() << ")";
    break;
  case Token::Type::name:
    os << token.name();
    break;
  case Token::Type::func_name:
    os << token.func_name() << "(";
    break;
  case Token::Type::builtin_func_name:
    os << token.builtin_func_name();
    break;
  case Token::Type::string:
    os << "\"" << token.string() << "\"";
    break;
  case Token::Type::integer:
    os << token.integer().get();
    break;
  case Token::Type::floating:
    os << token.floating();
    break;
  case Token::Type::ere:
    os << "/" << token.ere() << "/";
    break;
  default:
    os << info(token.type()).spelling;
    break;
  }
  return os;
}

auto Tawk::operator==(Token const& token, Token::Type type) -> bool
{
  return token.type() == type;
}

auto Tawk::operator==(Token const& token, Token::BuiltinFunc builtin_func) -> bool
{
  return token.type() == Token::Type::builtin_func_name &&
         token.builtin_func_name() == builtin_func;
}

auto Tawk::operator==(Token::Type type, Token const& token) -> bool { return token == type; }

auto Tawk::operator!=(Token const& token, Token::Type type) -> bool { return !(token == type); }

auto Tawk::operator!=(Token::Type type, Token const& token) -> bool { return !(token == type); }

auto Tawk::operator!=(Token const& token, Token::BuiltinFunc builtin_func) -> bool
{
  return !(token == builtin_func);
}
