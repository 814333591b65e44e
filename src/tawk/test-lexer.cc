/** \file   test-lexer.cc
 *  \brief  Tests for tawk's Lexer
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tawk.hh"

namespace {
auto make_lexer(std::string_view input) -> Tawk::Lexer
{
  return Tawk::Lexer(std::make_unique<Tawk::StringReader>(std::string{input}));
}
}  // namespace

TEST_CASE("Tawk::Lexer - Word Tokenizing", "[tawk][lexer]")
{
  auto [input, expected] = GENERATE(table<std::string_view, Tawk::Token::Type>({
    {"BEGIN", Tawk::Token::Type::begin},
    {"break", Tawk::Token::Type::break_},
    {"continue", Tawk::Token::Type::continue_},
    {"delete", Tawk::Token::Type::delete_},
    {"do", Tawk::Token::Type::do_},
    {"else", Tawk::Token::Type::else_},
    {"END", Tawk::Token::Type::end},
    {"exit", Tawk::Token::Type::exit},
    {"for", Tawk::Token::Type::for_},
    {"function", Tawk::Token::Type::function},
    {"getline", Tawk::Token::Type::getline},
    {"if", Tawk::Token::Type::if_},
    {"in", Tawk::Token::Type::in},
    {"next", Tawk::Token::Type::next},
    {"nextfile", Tawk::Token::Type::nextfile},
    {"print", Tawk::Token::Type::print},
    {"printf", Tawk::Token::Type::printf},
    {"return", Tawk::Token::Type::return_},
    {"while", Tawk::Token::Type::while_},
  }));
  auto lexer{make_lexer(input)};
  INFO("Parsing " << input);
  auto t1 = lexer.peek(false);
  REQUIRE(t1.type() == expected);
  lexer.chew(false);
  auto t2 = lexer.peek(false);
  REQUIRE(t2.type() == Tawk::Token::Type::eof);
}

TEST_CASE("Tawk::Lexer - Builtin func Tokenizing", "[tawk][lexer]")
{
  auto [input, expected] = GENERATE(table<std::string_view, Tawk::Token::BuiltinFunc>({
    {"atan2", Tawk::Token::BuiltinFunc::atan2},
    {"close", Tawk::Token::BuiltinFunc::close},
    {"cos", Tawk::Token::BuiltinFunc::cos},
    {"exp", Tawk::Token::BuiltinFunc::exp},
    {"fflush", Tawk::Token::BuiltinFunc::fflush},
    {"gsub", Tawk::Token::BuiltinFunc::gsub},
    {"index", Tawk::Token::BuiltinFunc::index},
    {"int", Tawk::Token::BuiltinFunc::int_},
    {"length", Tawk::Token::BuiltinFunc::length},
    {"log", Tawk::Token::BuiltinFunc::log},
    {"match", Tawk::Token::BuiltinFunc::match},
    {"rand", Tawk::Token::BuiltinFunc::rand},
    {"sin", Tawk::Token::BuiltinFunc::sin},
    {"split", Tawk::Token::BuiltinFunc::split},
    {"sprintf", Tawk::Token::BuiltinFunc::sprintf},
    {"sqrt", Tawk::Token::BuiltinFunc::sqrt},
    {"srand", Tawk::Token::BuiltinFunc::srand},
    {"sub", Tawk::Token::BuiltinFunc::sub},
    {"substr", Tawk::Token::BuiltinFunc::substr},
    {"system", Tawk::Token::BuiltinFunc::system},
    {"tolower", Tawk::Token::BuiltinFunc::tolower},
    {"toupper", Tawk::Token::BuiltinFunc::toupper},
  }));
  auto lexer{make_lexer(input)};
  INFO("Parsing " << input);
  auto t1 = lexer.peek(false);
  REQUIRE(t1.type() == Tawk::Token::Type::builtin_func_name);
  REQUIRE(t1.builtin_func_name() == expected);
  lexer.chew(false);
  auto t2 = lexer.peek(false);
  REQUIRE(t2.type() == Tawk::Token::Type::eof);
}

TEST_CASE("Tawk::Lexer - Name", "[tawk][lexer]")
{
  std::string_view const input{"fred george(\nherbert ( # ignatious\njo # kerry\\\nlonger\nmary\n"};
  auto lexer{make_lexer(input)};
  INFO("Parsing " << input);
  auto t1{lexer.peek(false)};
  REQUIRE(t1.type() == Tawk::Token::Type::name);
  REQUIRE(t1.name() == "fred");
  lexer.chew(false);
  auto t2{lexer.peek(false)};
  REQUIRE(t2.type() == Tawk::Token::Type::func_name);
  REQUIRE(t2.func_name() == "george");
  lexer.chew(false);
  auto t3{lexer.peek(false)};
  REQUIRE(t3.type() == Tawk::Token::Type::lparens);
  lexer.chew(false);
  auto t4{lexer.peek(false)};
  REQUIRE(t4.type() == Tawk::Token::Type::newline);
  lexer.chew(false);
  auto t5{lexer.peek(false)};
  REQUIRE(t5.type() == Tawk::Token::Type::name);
  REQUIRE(t5.name() == "herbert");
  lexer.chew(false);
  auto t6{lexer.peek(false)};
  REQUIRE(t6.type() == Tawk::Token::Type::lparens);
  lexer.chew(false);
  auto t7{lexer.peek(false)};
  REQUIRE(t7.type() == Tawk::Token::Type::newline);
  lexer.chew(false);
  auto t8{lexer.peek(false)};
  REQUIRE(t8.type() == Tawk::Token::Type::name);
  REQUIRE(t8.name() == "jo");
  lexer.chew(false);
  auto t9{lexer.peek(false)};
  REQUIRE(t9.type() == Tawk::Token::Type::newline);
  lexer.chew(false);
  /* A backslash at the end of a comment does not continue it.  */
  auto t10{lexer.peek(false)};
  REQUIRE(t10.type() == Tawk::Token::Type::name);
  REQUIRE(t10.name() == "longer");
  lexer.chew(false);
  auto t11{lexer.peek(false)};
  REQUIRE(t11.type() == Tawk::Token::Type::newline);
  lexer.chew(false);
  auto t12{lexer.peek(false)};
  REQUIRE(t12.type() == Tawk::Token::Type::name);
  REQUIRE(t12.name() == "mary");
  lexer.chew(false);
  auto t13{lexer.peek(false)};
  REQUIRE(t13.type() == Tawk::Token::Type::newline);
  lexer.chew(false);
  auto t14{lexer.peek(false)};
  REQUIRE(t14.type() == Tawk::Token::Type::eof);
}

TEST_CASE("Tawk::Lexer - Strings", "[tawk][lexer]")
{
  auto [input, expected] = GENERATE(
    table<std::string_view, std::string_view>({{"\"a string\"", "a string"},
                                               {"\"\\/\"", "/"},
                                               {"\"a\\\nb\"", "ab"},
                                               {"\"\\\"\"", "\""},
                                               {"\"/\"", "/"},
                                               {"\"\\\\\"", "\\"},
                                               {"\"\\040\"", "\040"},
                                               {"\"\\0401\"", "\0401"},
                                               {"\"\\a\\b\\f\\n\\r\\t\\v\"", "\a\b\f\n\r\t\v"},
                                               {"\"c\\Q\"", "c\\Q"},
                                               {"\"abfnrtv\"", "abfnrtv"}}));
  auto lexer{make_lexer(input)};
  INFO("Parsing " << input);
  auto t1 = lexer.peek(false);
  REQUIRE(t1.type() == Tawk::Token::Type::string);
  REQUIRE(t1.string() == expected);
  lexer.chew(false);
  auto t2 = lexer.peek(false);
  REQUIRE(t2.type() == Tawk::Token::Type::eof);
}

TEST_CASE("Tawk::Lexer - Strings errors", "[tawk][lexer]")
{
  auto [input, expected] =
    GENERATE(table<std::string_view, std::string_view>({{"\"a", "a"}, {"\"e\\777\"", "e\377"}}));
  auto lexer{make_lexer(input)};
  INFO("Parsing " << input);
  auto t1{lexer.peek(false)};
  REQUIRE(t1.type() == Tawk::Token::Type::string);
  REQUIRE(t1.string() == expected);
  lexer.chew(false);
  REQUIRE_THROWS_AS(lexer.peek(false), Tawk::LexError);
  lexer.chew(false);
  auto t3{lexer.peek(false)};
  REQUIRE(t3.type() == Tawk::Token::Type::eof);
}

TEST_CASE("Tawk::Lexer - Strings errors - newline", "[tawk][lexer]")
{
  std::string_view const input{"\"b\n"};
  auto lexer{make_lexer(input)};
  INFO("Parsing " << input);
  auto t1 = lexer.peek(false);
  REQUIRE(t1.type() == Tawk::Token::Type::string);
  REQUIRE(t1.string() == "b");
  lexer.chew(false);
  REQUIRE_THROWS_AS(lexer.peek(false), Tawk::LexError);
  lexer.chew(false);
  auto t3{lexer.peek(false)};
  REQUIRE(t3.type() == Tawk::Token::Type::newline);
  lexer.chew(false);
  auto t4{lexer.peek(false)};
  REQUIRE(t4.type() == Tawk::Token::Type::eof);
}

TEST_CASE("Tawk::Lexer - ERE", "[tawk][lexer]")
{
  auto [input, expected] =
    GENERATE(table<std::string_view, std::string_view>({{"/a string/", "a string"},
                                                        {"/\\//", "/"},
                                                        {"/a\\\nb/", "ab"},
                                                        {"/\"/", "\""},
                                                        {"/\\\\/", "\\\\"},
                                                        {"/\\$/", "\\$"},
                                                        {"/abfnrtv/", "abfnrtv"}}));
  auto lexer{make_lexer(input)};
  INFO("Parsing " << input);
  auto t1 = lexer.peek(false);
  REQUIRE(t1.type() == Tawk::Token::Type::ere);
  REQUIRE(t1.ere() == expected);
  lexer.chew(false);
  auto t2 = lexer.peek(false);
  REQUIRE(t2.type() == Tawk::Token::Type::eof);
}

TEST_CASE("Tawk::Lexer - integers", "[tawk][lexer]")
{
  auto [input, expected] = GENERATE(table<std::string_view, Tawk::Integer::underlying_type>({
    {"0", 0},
    {"12", 12},
    {"0x12", 0x12},
  }));
  auto lexer{make_lexer(input)};
  INFO("Parsing " << input);
  auto t1 = lexer.peek(false);
  REQUIRE(t1.type() == Tawk::Token::Type::integer);
  REQUIRE(t1.integer().get() == expected);
  lexer.chew(false);
  auto t2 = lexer.peek(false);
  REQUIRE(t2.type() == Tawk::Token::Type::eof);
}

TEST_CASE("Tawk::Lexer - floating", "[tawk][lexer]")
{
  auto [input, expected] = GENERATE(table<std::string_view, double>({
    {"0.0", 0.0},
    {"1.5", 1.5},
    {"2e3", 2000.0},
    {"0x1p0", 1.0},
  }));
  auto lexer{make_lexer(input)};
  INFO("Parsing " << input);
  auto t1 = lexer.peek(false);
  REQUIRE(t1.type() == Tawk::Token::Type::floating);
  REQUIRE(t1.floating() == expected);
  lexer.chew(false);
  auto t2 = lexer.peek(false);
  REQUIRE(t2.type() == Tawk::Token::Type::eof);
}

TEST_CASE("Tawk::Lexer - symbols", "[tawk][lexer]")
{
  auto [input, expected] = GENERATE(table<std::string_view, Tawk::Token::Type>({
    {"+=", Tawk::Token::Type::add_assign}, {"-=", Tawk::Token::Type::sub_assign},
    {"*=", Tawk::Token::Type::mul_assign}, {"/=", Tawk::Token::Type::div_assign},
    {"%=", Tawk::Token::Type::mod_assign}, {"^=", Tawk::Token::Type::pow_assign},
    {"||", Tawk::Token::Type::or_},        {"&&", Tawk::Token::Type::and_},
    {"!~", Tawk::Token::Type::no_match},   {"==", Tawk::Token::Type::eq},
    {"<=", Tawk::Token::Type::le},         {">=", Tawk::Token::Type::ge},
    {"!=", Tawk::Token::Type::ne},         {"++", Tawk::Token::Type::incr},
    {"--", Tawk::Token::Type::decr},       {">>", Tawk::Token::Type::append},
    {"{", Tawk::Token::Type::lbrace},      {"}", Tawk::Token::Type::rbrace},
    {"(", Tawk::Token::Type::lparens},     {")", Tawk::Token::Type::rparens},
    {"[", Tawk::Token::Type::lsquare},     {"]", Tawk::Token::Type::rsquare},
    {",", Tawk::Token::Type::comma},       {";", Tawk::Token::Type::semicolon},
    {"\n", Tawk::Token::Type::newline},    {"+", Tawk::Token::Type::add},
    {"-", Tawk::Token::Type::subtract},    {"*", Tawk::Token::Type::multiply},
    {"/", Tawk::Token::Type::divide},      {">", Tawk::Token::Type::greater_than},
    {"<", Tawk::Token::Type::less_than},   {"|", Tawk::Token::Type::pipe},
    {"?", Tawk::Token::Type::query},       {":", Tawk::Token::Type::colon},
    {"~", Tawk::Token::Type::tilde},       {"$", Tawk::Token::Type::dollar},
    {"=", Tawk::Token::Type::assign},      {"%", Tawk::Token::Type::modulo},
    {"^", Tawk::Token::Type::power},       {"!", Tawk::Token::Type::not_},
  }));
  auto lexer{make_lexer(input)};
  INFO("Parsing " << input);
  auto t1 = lexer.peek(true);
  REQUIRE(t1.type() == expected);
  lexer.chew(true);
  auto t2 = lexer.peek(true);
  REQUIRE(t2.type() == Tawk::Token::Type::eof);
}

TEST_CASE("Tawk::Lexer - command line strings", "[tawk][lexer]")
{
  auto [input, expected] = GENERATE(table<std::string_view, std::string_view>({
    {"abc", "abc"},
    {"a\\tb", "a\tb"},
    {"tail\\", "tail\\"},
    {"say \"hi\"", "say \"hi\""},
  }));
  auto lexer{make_lexer(input)};
  INFO("Parsing " << input);
  auto const& t1{lexer.peek_cmdline_string()};
  REQUIRE(t1.type() == Tawk::Token::Type::string);
  REQUIRE(t1.string() == expected);
}

TEST_CASE("Tawk::Lexer - unexpected character", "[tawk][lexer]")
{
  auto lexer{make_lexer("@")};
  REQUIRE_THROWS_AS(lexer.peek(false), Tawk::LexError);
}

TEST_CASE("Tawk::tokenize", "[tawk][lexer]")
{
  using Type = Tawk::Token::Type;
  auto types = [](std::string source) {
    std::vector<Type> result;
    for (auto const& token : Tawk::tokenize(std::move(source))) {
      result.push_back(token.type());
    }
    return result;
  };

  REQUIRE(types("x = 1") == std::vector<Type>{Type::name, Type::assign, Type::integer, Type::eof});
  REQUIRE(types("a / 2 / b") == std::vector<Type>{Type::name, Type::divide, Type::integer,
                                                  Type::divide, Type::name, Type::eof});
  REQUIRE(types("x ~ /a b/") ==
          std::vector<Type>{Type::name, Type::tilde, Type::ere, Type::eof});
  REQUIRE(Tawk::tokenize("").size() == 1);
}
