/** \file   test-fields.cc
 *  \brief  Tests for tawk's record and field handling
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <regex>
#include <string>
#include <vector>

#include "fields.hh"

namespace {
using Strings = std::vector<std::string>;

Tawk::Location const loc{"test", 1, 1};  // NOLINT
}  // namespace

TEST_CASE("Tawk::Details::Fields - default separator", "[tawk][fields]")
{
  Tawk::Details::RegexCache regexes;
  Tawk::Details::Fields fields{regexes};

  fields.set_record("  alpha  beta\tgamma  ", " ", false, loc);
  REQUIRE(fields.nf() == 3);
  REQUIRE(fields.field(0).to_string("%.6g") == "  alpha  beta\tgamma  ");
  REQUIRE(fields.field(1).to_string("%.6g") == "alpha");
  REQUIRE(fields.field(3).to_string("%.6g") == "gamma");
  REQUIRE(fields.field(4).is_uninit());
}

TEST_CASE("Tawk::Details::Fields - record round trip", "[tawk][fields]")
{
  Tawk::Details::RegexCache regexes;
  Tawk::Details::Fields fields{regexes};

  std::string const record{"a,b,c"};
  fields.set_record(record, ",", false, loc);
  REQUIRE(fields.field(0).to_string("%.6g") == record);

  /* Assigning a field rebuilds $0 with OFS.  */
  fields.field(2, fields.field(2), ",", ",", "%.6g", false, loc);
  REQUIRE(fields.field(0).to_string("%.6g") == record);
  fields.field(2, fields.field(2), ",", "-", "%.6g", false, loc);
  REQUIRE(fields.field(0).to_string("%.6g") == "a-b-c");

  /* The default FS normalizes white space.  */
  fields.set_record(" x   y ", " ", false, loc);
  fields.field(1, fields.field(1), " ", " ", "%.6g", false, loc);
  REQUIRE(fields.field(0).to_string("%.6g") == "x y");
}

TEST_CASE("Tawk::Details::Fields - growing and shrinking", "[tawk][fields]")
{
  Tawk::Details::RegexCache regexes;
  Tawk::Details::Fields fields{regexes};

  fields.set_record("a b", " ", false, loc);
  fields.field(5, Tawk::Value{"e"}, " ", ":", "%.6g", false, loc);
  REQUIRE(fields.nf() == 5);
  REQUIRE(fields.field(0).to_string("%.6g") == "a:b:::e");

  fields.nf(2, " ", "%.6g");
  REQUIRE(fields.nf() == 2);
  REQUIRE(fields.field(0).to_string("%.6g") == "a b");

  fields.field(0, Tawk::Value{"p q r"}, " ", " ", "%.6g", false, loc);
  REQUIRE(fields.nf() == 3);
}

TEST_CASE("Tawk::Details::Fields - field values are strnums", "[tawk][fields]")
{
  Tawk::Details::RegexCache regexes;
  Tawk::Details::Fields fields{regexes};

  fields.set_record("10 abc", " ", false, loc);
  REQUIRE(fields.field(1).kind() == Tawk::Value::Kind::strnum);
  REQUIRE(fields.field(2).kind() == Tawk::Value::Kind::string);
}

TEST_CASE("Tawk::Details::Fields - split", "[tawk][fields]")
{
  Tawk::Details::RegexCache regexes;
  Tawk::Details::Fields fields{regexes};

  REQUIRE(fields.split("", " ", false, loc).empty());
  REQUIRE(fields.split("", ",", false, loc).empty());
  REQUIRE(fields.split("a,,b", ",", false, loc) == Strings{"a", "", "b"});
  REQUIRE(fields.split("a|b", "|", false, loc) == Strings{"a", "b"});
  REQUIRE(fields.split("a1b22c", "[0-9]+", false, loc) == Strings{"a", "b", "c"});
  REQUIRE(fields.split("a:b\nc", ":", true, loc) == Strings{"a", "b", "c"});
  REQUIRE(fields.split("ab", "x*", false, loc) == Strings{"ab"});
  REQUIRE(fields.split("a\tb", "\t", false, loc) == Strings{"a", "b"});
}

TEST_CASE("Tawk::Details::RegexCache - invalid expression", "[tawk][fields]")
{
  Tawk::Details::RegexCache regexes;
  REQUIRE_THROWS_AS(regexes.get("a(", Tawk::Location{"test"}), Tawk::TypeError);
  REQUIRE(std::regex_search("xaay", regexes.get("a+", Tawk::Location{"test"})));
}

TEST_CASE("Tawk::Details::Fields - invalid separator", "[tawk][fields]")
{
  Tawk::Details::RegexCache regexes;
  Tawk::Details::Fields fields{regexes};

  try {
    fields.set_record("a b", "((", false, Tawk::Location{"prog.awk", 3, 7});
    FAIL("Expected a TypeError");
  }
  catch (Tawk::TypeError const& e) {
    REQUIRE(e.location().file_name() == "prog.awk");
    REQUIRE(e.location().line() == 3);
    REQUIRE(e.location().column() == 7);
  }
}
