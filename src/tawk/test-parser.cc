/** \file   test-parser.cc
 *  \brief  Tests for tawk's parser
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "program.hh"
#include "tawk.hh"

namespace {
auto parse_string(std::string_view text) -> Tawk::Program
{
  return Tawk::parse(
    std::make_unique<Tawk::Lexer>(std::make_unique<Tawk::StringReader>(std::string{text})));
}
}  // namespace

TEST_CASE("Tawk::parse - rule kinds", "[tawk][parser]")
{
  auto const program{parse_string("BEGIN { x = 1 }\n/re/\n$1 > 2 { print }\n"
                                  "NR == 1, NR == 3 { print }\n{ y++ } END { print y }")};
  auto const& rules{program.rules()};
  REQUIRE(rules.size() == 6);
  REQUIRE(rules[0].pattern.kind == Tawk::Ast::Pattern::Kind::begin);
  REQUIRE(rules[1].pattern.kind == Tawk::Ast::Pattern::Kind::expr);
  REQUIRE(rules[2].pattern.kind == Tawk::Ast::Pattern::Kind::expr);
  REQUIRE(rules[3].pattern.kind == Tawk::Ast::Pattern::Kind::range);
  REQUIRE(rules[3].pattern.last != nullptr);
  REQUIRE(rules[4].pattern.kind == Tawk::Ast::Pattern::Kind::always);
  REQUIRE(rules[5].pattern.kind == Tawk::Ast::Pattern::Kind::end);

  REQUIRE(program.has_rule(Tawk::Ast::Pattern::Kind::end));
  REQUIRE(program.needs_input());
}

TEST_CASE("Tawk::parse - missing action prints the record", "[tawk][parser]")
{
  auto const program{parse_string("/x/")};
  REQUIRE(program.rules().size() == 1);
  auto const& action{*program.rules().front().action};
  auto const* print{std::get_if<Tawk::Ast::Print>(&action.node)};
  REQUIRE(print != nullptr);
  REQUIRE_FALSE(print->printf_);
  REQUIRE(print->args.empty());
}

TEST_CASE("Tawk::parse - BEGIN only programs need no input", "[tawk][parser]")
{
  auto const program{parse_string("BEGIN { print \"hello\" }")};
  REQUIRE_FALSE(program.needs_input());
  REQUIRE_FALSE(program.has_rule(Tawk::Ast::Pattern::Kind::end));
}

TEST_CASE("Tawk::parse - function definitions", "[tawk][parser]")
{
  auto const program{parse_string("function add(a, b,   tmp) { tmp = a + b; return tmp }\n"
                                  "BEGIN { print add(1, 2) }")};
  auto const* fn{program.function("add")};
  REQUIRE(fn != nullptr);
  REQUIRE(fn->params == std::vector<std::string>{"a", "b", "tmp"});
  REQUIRE(program.function("missing") == nullptr);

  /* Calls to undefined functions are resolved at run time.  */
  REQUIRE_NOTHROW(parse_string("BEGIN { print ai_sentiment(\"x\") }"));
}

TEST_CASE("Tawk::parse - statements", "[tawk][parser]")
{
  auto program_text = GENERATE(as<std::string_view>{},
                               "{ if ($1) print; else print \"no\" }",
                               "{ while (i < 3) i++ }",
                               "{ do { i++ } while (i < 3) }",
                               "{ for (i = 0; i < 3; i++) continue }",
                               "{ for (;;) break }",
                               "{ for (k in a) delete a[k] }",
                               "{ delete a }",
                               "{ a[1, 2] = 3; if ((1, 2) in a) print \"yes\" }",
                               "{ print $1, $2 > \"/dev/null\" }",
                               "{ print $1 >> \"/dev/null\"; printf \"%s\\n\", $2 | \"cat\" }",
                               "{ printf(\"%d\\n\", 3) }",
                               "{ getline; getline x; getline < \"f\"; getline y < \"f\" }",
                               "{ next }",
                               "{ nextfile }",
                               "{ exit 3 }",
                               "{ x = y = 2; x += 1; x ^= 2; x %= 3 }",
                               "{ print length, length($1), length() }",
                               "{ n = split($0, parts, /,/) }",
                               "{ sub(/a/, \"b\"); gsub(\"a\", \"b\", $2) }",
                               "{ print -x ^ 2, !x, x ? 1 : 2, x ~ /re/, x !~ \"re\" }",
                               "{ print 1 \" \" 2 + 3 }",
                               "{ x = $NF; $(NF + 1) = \"new\"; $0 = \"reset\" }",
                               "{ print ++x, x++, --x, x-- }");
  INFO("Parsing " << program_text);
  REQUIRE_NOTHROW(parse_string(program_text));
}

TEST_CASE("Tawk::parse - errors", "[tawk][parser]")
{
  auto program_text = GENERATE(as<std::string_view>{},
                               "{ print ",
                               "{ x = }",
                               "BEGIN",
                               "{ break }",
                               "BEGIN { next }",
                               "END { nextfile }",
                               "{ return 1 }",
                               "function f(a, a) { }",
                               "function f() { } function f() { }",
                               "function length() { }",
                               "{ x = (1 }",
                               "{ a[1 = 2 }",
                               "{ split($0, \"notarray\") }",
                               "{ sub(/a/, \"b\", \"c\") }",
                               "{ substr() }",
                               "{ 1 ? 2 }",
                               "{ getline < }",
                               "{ print } }",
                               "{ print /unterminated }");
  INFO("Parsing " << program_text);
  REQUIRE_THROWS_AS(parse_string(program_text), Tawk::Error);
}

TEST_CASE("Tawk::parse - error locations", "[tawk][parser]")
{
  try {
    (void)parse_string("BEGIN {\n\n  x = ) }");
    FAIL("Expected a parse error");
  }
  catch (Tawk::ParseError const& e) {
    REQUIRE(e.location().line() == 3);
  }
}

TEST_CASE("Tawk::compile_ere", "[tawk][parser]")
{
  REQUIRE(std::regex_search("abc", Tawk::compile_ere("b+")));
  REQUIRE(std::regex_search("a.c", Tawk::compile_ere("a\\.c")));
  REQUIRE_FALSE(std::regex_search("abc", Tawk::compile_ere("^b")));
  REQUIRE_THROWS_AS(Tawk::compile_ere("a("), std::regex_error);
}
