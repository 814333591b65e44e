/** \file   test-value.cc
 *  \brief  Tests for tawk's Value and Array
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <string>
#include <string_view>
#include <vector>

#include "value.hh"

TEST_CASE("Tawk::Value - uninitialized", "[tawk][value]")
{
  Tawk::Value const v;
  REQUIRE(v.is_uninit());
  REQUIRE(v.is_numeric());
  REQUIRE(v.to_number() == 0.0);
  REQUIRE(v.to_string("%.6g").empty());
  REQUIRE_FALSE(v.to_bool());

  /* Uninitialized compares equal to both 0 and "".  */
  REQUIRE(Tawk::compare(v, Tawk::Value{Tawk::Floating{0}}, "%.6g") == 0);
  REQUIRE(Tawk::compare(v, Tawk::Value{std::string{}}, "%.6g") == 0);
}

TEST_CASE("Tawk::Value - string to number", "[tawk][value]")
{
  auto [input, expected] = GENERATE(table<std::string_view, Tawk::Floating>({
    {"3.14abc", 3.14},
    {"abc", 0.0},
    {"  42", 42.0},
    {"-7x", -7.0},
    {"+.5", 0.5},
    {"1e3", 1000.0},
    {"1e", 1.0},
    {"", 0.0},
    {".", 0.0},
  }));
  INFO("Converting " << input);
  REQUIRE(Tawk::Value{std::string{input}}.to_number() == expected);
}

TEST_CASE("Tawk::Value - number to string", "[tawk][value]")
{
  auto [input, expected] = GENERATE(table<Tawk::Floating, std::string_view>({
    {1.0, "1"},
    {-3.0, "-3"},
    {0.1, "0.1"},
    {3.14159265, "3.14159"},
    {1e6, "1000000"},
    {0.5, "0.5"},
  }));
  INFO("Converting " << input);
  REQUIRE(Tawk::Value{input}.to_string("%.6g") == expected);
}

TEST_CASE("Tawk::Value - strnum candidates", "[tawk][value]")
{
  auto const v1{Tawk::Value::strnum_candidate(" 10 ")};
  REQUIRE(v1.kind() == Tawk::Value::Kind::strnum);
  REQUIRE(v1.to_number() == 10.0);
  REQUIRE(v1.to_string("%.6g") == " 10 ");

  auto const v2{Tawk::Value::strnum_candidate("10abc")};
  REQUIRE(v2.kind() == Tawk::Value::Kind::string);

  auto const v3{Tawk::Value::strnum_candidate("0")};
  REQUIRE_FALSE(v3.to_bool());
  REQUIRE(Tawk::Value{"0"}.to_bool());
}

TEST_CASE("Tawk::Value - comparison", "[tawk][value]")
{
  auto const strnum10{Tawk::Value::strnum_candidate("10")};
  auto const strnum9{Tawk::Value::strnum_candidate("9")};

  /* Two strnums compare numerically, a string forces string comparison.  */
  REQUIRE(Tawk::compare(strnum9, strnum10, "%.6g") < 0);
  REQUIRE(Tawk::compare(Tawk::Value{"9"}, strnum10, "%.6g") > 0);
  REQUIRE(Tawk::compare(strnum10, Tawk::Value{Tawk::Floating{10}}, "%.6g") == 0);
  REQUIRE(Tawk::compare(Tawk::Value{"abc"}, Tawk::Value{"abd"}, "%.6g") < 0);
  REQUIRE(Tawk::compare(Tawk::Value{Tawk::Floating{2}}, Tawk::Value{"10"}, "%.6g") > 0);
}

TEST_CASE("Tawk::parse_number", "[tawk][value]")
{
  REQUIRE(Tawk::parse_number("12") == 12.0);
  REQUIRE(Tawk::parse_number(" -1.5e1\t") == -15.0);
  REQUIRE_FALSE(Tawk::parse_number("12a").has_value());
  REQUIRE_FALSE(Tawk::parse_number("").has_value());
  REQUIRE_FALSE(Tawk::parse_number("+").has_value());
}

TEST_CASE("Tawk::Array", "[tawk][value]")
{
  Tawk::Array a;
  REQUIRE(a.size() == 0);
  REQUIRE_FALSE(a.contains("x"));

  /* Reading through ensure creates the element.  */
  REQUIRE(a.ensure("x").is_uninit());
  REQUIRE(a.contains("x"));
  a.ensure("b") = Tawk::Value{Tawk::Floating{2}};
  a.ensure("a") = Tawk::Value{"one"};
  REQUIRE(a.size() == 3);
  REQUIRE(a.keys() == std::vector<std::string>{"a", "b", "x"});

  a.erase("b");
  REQUIRE_FALSE(a.contains("b"));
  a.erase("missing");
  REQUIRE(a.size() == 2);

  a.clear();
  REQUIRE(a.size() == 0);
}
