/** \file   test-builtins.cc
 *  \brief  Tests for tawk's builtin functions
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "execute.hh"
#include "foreign.hh"
#include "program.hh"
#include "tawk.hh"

namespace {
auto output_of(std::string_view text, std::string const& input = {},
               std::vector<std::string> const& assignments = {}) -> std::string
{
  auto const program{Tawk::parse(
    std::make_unique<Tawk::Lexer>(std::make_unique<Tawk::StringReader>(std::string{text})))};
  std::ostringstream out;
  std::ostringstream diagnostics;
  Tawk::ForeignFunctionRegistry foreign{diagnostics};
  Tawk::Interpreter interpreter{program, out, foreign};
  for (auto const& assignment : assignments) {
    REQUIRE(interpreter.assign(assignment));
  }
  (void)interpreter.run(std::make_unique<Tawk::StringReader>(input, "input"));
  return out.str();
}
}  // namespace

TEST_CASE("Tawk builtins - length", "[tawk][builtins]")
{
  REQUIRE(output_of("{ print length, length($2), length() }", "abc de\n") == "6 2 6\n");
  REQUIRE(output_of("BEGIN { print length(12345), length(\"\") }") == "5 0\n");
  REQUIRE(output_of("BEGIN { a[1]; a[2]; a[3]; print length(a) }") == "3\n");
}

TEST_CASE("Tawk builtins - substr", "[tawk][builtins]")
{
  auto [call, expected] = GENERATE(table<std::string_view, std::string_view>({
    {"substr(\"hello\", 2, 3)", "ell"},
    {"substr(\"hello\", 0)", "hello"},
    {"substr(\"hello\", -1, 3)", "h"},
    {"substr(\"hello\", 1.5)", "ello"},
    {"substr(\"hello\", 10)", ""},
    {"substr(\"hello\", 2, 100)", "ello"},
    {"substr(\"hello\", 3, 0)", ""},
    {"substr(12345, 2, 2)", "23"},
  }));
  INFO("Evaluating " << call);
  REQUIRE(output_of("BEGIN { print \"[\" " + std::string{call} + " \"]\" }") ==
          "[" + std::string{expected} + "]\n");
}

TEST_CASE("Tawk builtins - index", "[tawk][builtins]")
{
  REQUIRE(output_of("BEGIN { print index(\"hello\", \"ll\"), index(\"hello\", \"z\") }") ==
          "3 0\n");
}

TEST_CASE("Tawk builtins - split", "[tawk][builtins]")
{
  REQUIRE(output_of("BEGIN { n = split(\"a b  c\", arr); print n, arr[1], arr[3] }") ==
          "3 a c\n");
  REQUIRE(output_of("BEGIN { print split(\"a1b22c\", arr, /[0-9]+/), arr[2] }") == "3 b\n");
  REQUIRE(output_of("BEGIN { print split(\"\", arr), length(arr) }") == "0 0\n");
  REQUIRE(output_of("BEGIN { arr[\"x\"] = 1; split(\"p q\", arr); print (\"x\" in arr) }") ==
          "0\n");
  REQUIRE(output_of("BEGIN { split(\"10 9\", arr); print (arr[1] > arr[2]) }") == "1\n");
  REQUIRE(output_of("{ print split($0, arr) }", "a:b c\n", {"FS=:"}) == "2\n");
}

TEST_CASE("Tawk builtins - sub and gsub", "[tawk][builtins]")
{
  REQUIRE(output_of("{ n = gsub(/o/, \"0\"); print n, $0, $2 }", "foo boo\n") ==
          "4 f00 b00 b00\n");
  REQUIRE(output_of("{ sub(/o/, \"[&]\"); print }", "foo\n") == "f[o]o\n");
  REQUIRE(output_of("{ sub(/o/, \"\\\\&\"); print }", "foo\n") == "f&o\n");
  REQUIRE(output_of("{ sub(/b/, \"B\", $2); print; print NF }", "ab bc\n") == "ab Bc\n2\n");
  REQUIRE(output_of("{ n = sub(/z/, \"y\"); print n, $0 }", "ab\n") == "0 ab\n");
  REQUIRE(output_of("BEGIN { s = \"abac\"; n = gsub(\"a.\", \"X\", s); print n, s }") ==
          "2 XX\n");
  REQUIRE(output_of("BEGIN { a[1] = \"aaa\"; gsub(/a/, \"b\", a[1]); print a[1] }") == "bbb\n");
}

TEST_CASE("Tawk builtins - gsub with empty matches", "[tawk][builtins]")
{
  REQUIRE(output_of("BEGIN { s = \"abc\"; n = gsub(/x*/, \"-\", s); print n, s }") ==
          "4 -a-b-c-\n");
  REQUIRE(output_of("BEGIN { s = \"abc\"; n = gsub(/b*/, \"-\", s); print n, s }") ==
          "3 -a-c-\n");
  REQUIRE(output_of("BEGIN { s = \"ab\"; n = gsub(/^/, \">\", s); print n, s }") == "1 >ab\n");
}

TEST_CASE("Tawk builtins - match", "[tawk][builtins]")
{
  REQUIRE(output_of("BEGIN { print match(\"foobar\", /ob/), RSTART, RLENGTH\n"
                    "print match(\"abc\", /z/), RSTART, RLENGTH }") == "3 3 2\n0 0 -1\n");
  REQUIRE(output_of("BEGIN { re = \"[0-9]+\"; if (match(\"ab123c\", re)) "
                    "print substr(\"ab123c\", RSTART, RLENGTH) }") == "123\n");
}

TEST_CASE("Tawk builtins - case conversion", "[tawk][builtins]")
{
  REQUIRE(output_of("BEGIN { print toupper(\"aBc1\"), tolower(\"aBc1\") }") == "ABC1 abc1\n");
}

TEST_CASE("Tawk builtins - arithmetic", "[tawk][builtins]")
{
  REQUIRE(output_of("BEGIN { print int(3.9), int(-3.9), int(\"4.5abc\") }") == "3 -3 4\n");
  REQUIRE(output_of("BEGIN { print sqrt(16), exp(0), log(1), sin(0), cos(0) }") ==
          "4 1 0 0 1\n");
  REQUIRE(output_of("BEGIN { print atan2(0, -1) }") == "3.14159\n");
  REQUIRE(output_of("BEGIN { print 7 % 3, -7 % 3, 2 ^ 10, 2 ^ 3 ^ 2 }") == "1 -1 1024 512\n");
}

TEST_CASE("Tawk builtins - sprintf", "[tawk][builtins]")
{
  REQUIRE(output_of("BEGIN { s = sprintf(\"%05.1f|%s\", 3.14159, \"x\"); print s }") ==
          "003.1|x\n");
}

TEST_CASE("Tawk builtins - rand and srand", "[tawk][builtins]")
{
  REQUIRE(output_of("BEGIN { a = srand(1); b = srand(2); print a, b }") == "0 1\n");
  REQUIRE(output_of("BEGIN { r = rand(); print (r >= 0 && r < 1) }") == "1\n");
  REQUIRE(output_of("BEGIN { srand(5); x = rand(); srand(5); y = rand(); print (x == y) }") ==
          "1\n");
}

TEST_CASE("Tawk builtins - asort and asorti", "[tawk][builtins]")
{
  REQUIRE(output_of("BEGIN { a[\"x\"] = 3; a[\"y\"] = 1; a[\"z\"] = \"b\"; a[\"w\"] = \"a\"\n"
                    "n = asort(a); for (i = 1; i <= n; i++) s = s a[i] \" \"; print n, s }") ==
          "4 1 3 a b \n");
  REQUIRE(output_of("BEGIN { src[\"p\"] = 2; src[\"q\"] = 1; n = asort(src, dst)\n"
                    "print n, dst[1], dst[2], src[\"p\"] }") == "2 1 2 2\n");
  REQUIRE(output_of("BEGIN { a[\"b\"]; a[\"a\"]; n = asorti(a, k); print n, k[1], k[2] }") ==
          "2 a b\n");
  REQUIRE_THROWS_AS(output_of("BEGIN { asort(1) }"), Tawk::TypeError);
  REQUIRE_THROWS_AS(output_of("BEGIN { asort() }"), Tawk::TypeError);
}

TEST_CASE("Tawk builtins - field", "[tawk][builtins]")
{
  REQUIRE(output_of("{ print field(NF), field(0) }", "a b c\n") == "c a b c\n");
  REQUIRE_THROWS_AS(output_of("{ print field(1, 2) }", "a\n"), Tawk::TypeError);
}

TEST_CASE("Tawk builtins - output files and close", "[tawk][builtins]")
{
  auto const path{std::filesystem::temp_directory_path() / "tawk-test-builtins-output.txt"};
  std::string const program{
    "BEGIN { print \"one\" > F; print \"two\" > F; close(F)\n"
    "print \"three\" >> F; close(F)\n"
    "while ((getline line < F) > 0) s = s line; print s; print close(F), close(\"unknown\") }"};
  REQUIRE(output_of(program, {}, {"F=" + path.string()}) == "onetwothree\n0 -1\n");
  std::filesystem::remove(path);
}

TEST_CASE("Tawk builtins - getline from a missing file is quiet", "[tawk][builtins]")
{
  std::ostringstream errors;
  auto* const old_buf{std::cerr.rdbuf(errors.rdbuf())};
  std::string const output{
    output_of("BEGIN { r = (getline line < \"/nonexistent/tawk-missing\"); print r }")};
  std::cerr.rdbuf(old_buf);

  REQUIRE(output == "-1\n");
  REQUIRE(errors.str().empty());
}

TEST_CASE("Tawk builtins - system and fflush", "[tawk][builtins]")
{
  REQUIRE(output_of("BEGIN { print system(\"exit 3\") }") == "3\n");
  REQUIRE(output_of("BEGIN { print fflush(), fflush(\"unknown\") }") == "0 -1\n");
}
