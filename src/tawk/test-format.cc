/** \file   test-format.cc
 *  \brief  Tests for tawk's printf formatting
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <string>
#include <string_view>
#include <vector>

#include "format.hh"
#include "value.hh"

namespace {
auto num(Tawk::Floating f) -> Tawk::Value { return Tawk::Value{f}; }
auto str(char const* s) -> Tawk::Value { return Tawk::Value{s}; }
}  // namespace

TEST_CASE("Tawk::format_printf - strings", "[tawk][format]")
{
  REQUIRE(Tawk::format_printf("plain", {}, "%.6g") == "plain");
  REQUIRE(Tawk::format_printf("%s-%s", {str("a"), str("b")}, "%.6g") == "a-b");
  REQUIRE(Tawk::format_printf("[%5s]", {str("ab")}, "%.6g") == "[   ab]");
  REQUIRE(Tawk::format_printf("[%-5s]", {str("ab")}, "%.6g") == "[ab   ]");
  REQUIRE(Tawk::format_printf("[%.2s]", {str("abcdef")}, "%.6g") == "[ab]");
  REQUIRE(Tawk::format_printf("[%*s]", {num(4), str("x")}, "%.6g") == "[   x]");
  REQUIRE(Tawk::format_printf("%s", {num(0.25)}, "%.6g") == "0.25");
  REQUIRE(Tawk::format_printf("%s", {num(0.123456789)}, "%.2f") == "0.12");
  REQUIRE(Tawk::format_printf("100%%", {}, "%.6g") == "100%");
}

TEST_CASE("Tawk::format_printf - characters", "[tawk][format]")
{
  REQUIRE(Tawk::format_printf("%c", {num(65)}, "%.6g") == "A");
  REQUIRE(Tawk::format_printf("%c", {str("hello")}, "%.6g") == "h");
  REQUIRE(Tawk::format_printf("[%3c]", {str("z")}, "%.6g") == "[  z]");
}

TEST_CASE("Tawk::format_printf - integers", "[tawk][format]")
{
  auto [format, value, expected] =
    GENERATE(table<std::string_view, Tawk::Floating, std::string_view>({
      {"%d", 42.9, "42"},
      {"%d", -42.9, "-42"},
      {"%i", 7, "7"},
      {"%5d", 42, "   42"},
      {"%-5d|", 42, "42   |"},
      {"%05d", 42, "00042"},
      {"%05d", -42, "-0042"},
      {"%+d", 42, "+42"},
      {"% d", 42, " 42"},
      {"%.3d", 7, "007"},
      {"%o", 8, "10"},
      {"%#o", 8, "010"},
      {"%x", 255, "ff"},
      {"%X", 255, "FF"},
      {"%#x", 255, "0xff"},
      {"%u", 3, "3"},
      {"%ld", 12, "12"},
    }));
  INFO("Formatting " << format << " with " << value);
  REQUIRE(Tawk::format_printf(format, {num(value)}, "%.6g") == expected);
}

TEST_CASE("Tawk::format_printf - floating point", "[tawk][format]")
{
  auto [format, value, expected] =
    GENERATE(table<std::string_view, Tawk::Floating, std::string_view>({
      {"%f", 1.5, "1.500000"},
      {"%.2f", 3.14159, "3.14"},
      {"%8.3f", 3.14159, "   3.142"},
      {"%-8.1f|", 2.5, "2.5     |"},
      {"%e", 1234.5, "1.234500e+03"},
      {"%E", 1234.5, "1.234500E+03"},
      {"%g", 0.0001, "0.0001"},
      {"%g", 100000, "100000"},
      {"%g", 1000000, "1e+06"},
      {"%G", 1e-10, "1E-10"},
      {"%+.1f", 2, "+2.0"},
    }));
  INFO("Formatting " << format << " with " << value);
  REQUIRE(Tawk::format_printf(format, {num(value)}, "%.6g") == expected);
}

TEST_CASE("Tawk::format_printf - missing and surplus arguments", "[tawk][format]")
{
  REQUIRE(Tawk::format_printf("[%s][%d]", {}, "%.6g") == "[][0]");
  REQUIRE(Tawk::format_printf("%s", {str("a"), str("b")}, "%.6g") == "a");
  REQUIRE(Tawk::format_printf("%d", {str("12abc")}, "%.6g") == "12");
}

TEST_CASE("Tawk::format_printf - unknown conversions", "[tawk][format]")
{
  REQUIRE(Tawk::format_printf("%k", {}, "%.6g") == "%k");
  REQUIRE(Tawk::format_printf("50%", {}, "%.6g") == "50%");
}

TEST_CASE("Tawk::format_number", "[tawk][format]")
{
  REQUIRE(Tawk::format_number(3, "%.6g") == "3");
  REQUIRE(Tawk::format_number(-0.5, "%.6g") == "-0.5");
  REQUIRE(Tawk::format_number(1.0 / 3.0, "%.6g") == "0.333333");
  REQUIRE(Tawk::format_number(1.0 / 3.0, "%.2g") == "0.33");
  REQUIRE(Tawk::format_number(1e30, "%.6g") == "1e+30");
}
