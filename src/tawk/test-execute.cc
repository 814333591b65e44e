/** \file   test-execute.cc
 *  \brief  End to end tests of running tawk programs
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <cstdlib>
#include <limits>
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
struct RunResult
{
  int status;          ///< Exit status.
  std::string output;  ///< Standard output.
};

auto parse_string(std::string_view text) -> Tawk::Program
{
  return Tawk::parse(
    std::make_unique<Tawk::Lexer>(std::make_unique<Tawk::StringReader>(std::string{text})));
}

auto run_program(std::string_view text, std::string const& input,
                 std::vector<std::string> const& assignments = {}) -> RunResult
{
  auto const program{parse_string(text)};
  std::ostringstream out;
  std::ostringstream diagnostics;
  Tawk::ForeignFunctionRegistry foreign{diagnostics};
  Tawk::Interpreter interpreter{program, out, foreign};
  for (auto const& assignment : assignments) {
    REQUIRE(interpreter.assign(assignment));
  }
  int const status{interpreter.run(std::make_unique<Tawk::StringReader>(input, "input"))};
  return {status, out.str()};
}

auto output_of(std::string_view text, std::string const& input = {}) -> std::string
{
  return run_program(text, input).output;
}
}  // namespace

TEST_CASE("Tawk::Interpreter - summing a field", "[tawk][execute]")
{
  auto const result{run_program("{ s += field(2) } END { print s }", "1 2 3\n4 5 6\n")};
  REQUIRE(result.status == 0);
  REQUIRE(result.output == "7\n");
  REQUIRE(output_of("{ s += $2 }\nEND { print s }", "1 2 3\n4 5 6\n") == "7\n");
}

TEST_CASE("Tawk::Interpreter - field separator assignment", "[tawk][execute]")
{
  auto const result{run_program("{ print field(1), field(3) }", "a,b,c\n", {"FS=,"})};
  REQUIRE(result.output == "a c\n");

  REQUIRE(run_program("{ print $2 }", "a\tb c\td\n", {"FS=\t"}).output == "b c\n");
  REQUIRE(run_program("{ $1 = $1; print }", "a:b:c\n", {"FS=:", "OFS=-"}).output == "a-b-c\n");
}

TEST_CASE("Tawk::Interpreter - rule order and next", "[tawk][execute]")
{
  std::string_view const program{"/a/ { print \"A\" }\n"
                                 "/b/ { next }\n"
                                 "/c/ { print \"C\" }"};
  REQUIRE(output_of(program, "ac\nabc\nc\n") == "A\nC\nA\nC\n");
}

TEST_CASE("Tawk::Interpreter - BEGIN and END", "[tawk][execute]")
{
  REQUIRE(output_of("BEGIN { print \"hello\" }", "ignored\n") == "hello\n");
  REQUIRE(output_of("END { print NR, $0 }", "a\nb\n") == "2 b\n");
  REQUIRE(output_of("BEGIN { printf \"b\" } END { print \"e\" } { printf \"r\" }", "1\n2\n") ==
          "brre\n");
}

TEST_CASE("Tawk::Interpreter - exit status", "[tawk][execute]")
{
  auto const begin_exit{run_program("BEGIN { exit 3 } { print } END { print \"end\" }", "x\n")};
  REQUIRE(begin_exit.status == 3);
  REQUIRE(begin_exit.output == "end\n");

  /* exit without a value keeps the previous status.  */
  auto const keep{run_program("{ exit 4 } END { exit }", "x\n")};
  REQUIRE(keep.status == 4);

  auto const end_exit{
    run_program("END { print \"a\"; exit 1; print \"b\" } END { print \"c\" }", "")};
  REQUIRE(end_exit.status == 1);
  REQUIRE(end_exit.output == "a\n");

  auto const main_exit{run_program("{ print; if (NR == 2) exit }", "1\n2\n3\n")};
  REQUIRE(main_exit.status == 0);
  REQUIRE(main_exit.output == "1\n2\n");
}

TEST_CASE("Tawk::Interpreter - exit status limits", "[tawk][execute]")
{
  REQUIRE(run_program("BEGIN { exit 1e20 }", "").status == std::numeric_limits<int>::max());
  REQUIRE(run_program("BEGIN { exit -1e20 }", "").status == std::numeric_limits<int>::min());
  REQUIRE(run_program("BEGIN { exit 2.7 }", "").status == 2);
  REQUIRE(run_program("BEGIN { exit log(-1) }", "").status == 0);
}

TEST_CASE("Tawk::Interpreter - functions called from patterns", "[tawk][execute]")
{
  auto const exited{run_program("function f() { exit 3 }\nf() { print }", "a\nb\n")};
  REQUIRE(exited.status == 3);
  REQUIRE(exited.output.empty());

  REQUIRE(output_of("function f() { next }\nf() { print } END { print \"end\" }", "a\nb\n") ==
          "end\n");
  REQUIRE(output_of("function f() { if ($1 == \"b\") next; return 1 }\n"
                    "f() { print } { print \"all\", $1 }",
                    "a\nb\nc\n") == "a\nall a\nc\nall c\n");
  REQUIRE(output_of("function f() { nextfile }\nf() { print } END { print NR }", "a\nb\n") ==
          "1\n");

  /* The end of a range can be left early too.  */
  REQUIRE(output_of("function g() { next }\n$1 == \"a\", g() { print } END { print \"end\" }",
                    "a\nb\n") == "end\n");
}

TEST_CASE("Tawk::Interpreter - range patterns", "[tawk][execute]")
{
  REQUIRE(output_of("NR == 2, NR == 3 { print }", "1\n2\n3\n4\n") == "2\n3\n");
  REQUIRE(output_of("/b/, /b/", "a\nb\nc\nb\n") == "b\nb\n");
  REQUIRE(output_of("/start/, /end/", "x\nstart\ny\nend\nz\n") == "start\ny\nend\n");
}

TEST_CASE("Tawk::Interpreter - uninitialized values", "[tawk][execute]")
{
  REQUIRE(output_of("BEGIN { if (x == 0 && x == \"\") print \"yes\" }") == "yes\n");
  REQUIRE(output_of("BEGIN { print length(x), x + 0, \"[\" x \"]\" }") == "0 0 []\n");
  REQUIRE(output_of("{ print \"[\" $5 \"]\", NF }", "a b\n") == "[] 2\n");
}

TEST_CASE("Tawk::Interpreter - comparisons of fields", "[tawk][execute]")
{
  REQUIRE(output_of("{ print ($1 < $2) }", "9 10\n") == "1\n");
  REQUIRE(output_of("{ print ($1 < \"10\") }", "9\n") == "0\n");
  REQUIRE(output_of("$1 == 10 { print \"ten\" }", "10.0\n 10 \n1e1\nten\n") == "ten\nten\nten\n");
}

TEST_CASE("Tawk::Interpreter - user functions", "[tawk][execute]")
{
  std::string_view const program{"function fill(arr) { arr[\"k\"] = 1 }\n"
                                 "function inc(n) { n++; return n }\n"
                                 "BEGIN { fill(a); x = 5; y = inc(x); print a[\"k\"], x, y }"};
  REQUIRE(output_of(program) == "1 5 6\n");

  REQUIRE(output_of("function fact(n) { return n <= 1 ? 1 : n * fact(n - 1) }\n"
                    "BEGIN { print fact(5) }") == "120\n");

  /* Extra parameters are locals, and a missing return value is uninitialized.  */
  REQUIRE(output_of("function f(a,   tmp) { tmp = a * 2; t = tmp }\n"
                    "BEGIN { r = f(4); print t, \"[\" r \"]\", \"[\" tmp \"]\" }") ==
          "8 [] []\n");

  /* next inside a function applies to the calling rule.  */
  REQUIRE(output_of("function skip() { next }\n{ if ($1 == \"b\") skip(); print }",
                    "a\nb\nc\n") == "a\nc\n");
}

TEST_CASE("Tawk::Interpreter - getline", "[tawk][execute]")
{
  REQUIRE(output_of("NR == 1 { getline; print \"after\", $0, NR }", "a\nb\nc\n") ==
          "after b 2\n");
  REQUIRE(output_of("{ getline line; print $0 \"-\" line, NR }", "a\nb\n") == "a-b 2\n");
  REQUIRE(output_of("{ r = getline; print r, $0 }", "only\n") == "0 only\n");
  REQUIRE(output_of("BEGIN { r = (getline line < \"/nonexistent/tawk-input\"); print r }") ==
          "-1\n");
}

TEST_CASE("Tawk::Interpreter - modifying records", "[tawk][execute]")
{
  REQUIRE(output_of("{ NF = 2; print; $5 = \"e\"; print; print NF }", "a b c d\n") ==
          "a b\na b   e\n5\n");
  REQUIRE(output_of("{ $0 = \"x y z\"; print NF, $2 }", "a\n") == "3 y\n");
  REQUIRE(output_of("{ $2 = \"\"; print; print NF }", "a b c\n") == "a  c\n3\n");
  REQUIRE(output_of("{ $3 = \"z\"; print NF }", "a\n") == "3\n");
}

TEST_CASE("Tawk::Interpreter - printf", "[tawk][execute]")
{
  REQUIRE(output_of("BEGIN { printf \"%s=%d\\n\", \"a\", 42; printf(\"%5.2f|\\n\", 3.14159) }") ==
          "a=42\n 3.14|\n");
  REQUIRE(output_of("{ printf \"%-3s|%03d\\n\", $1, $2 }", "ab 7\n") == "ab |007\n");
}

TEST_CASE("Tawk::Interpreter - output formats", "[tawk][execute]")
{
  REQUIRE(output_of("BEGIN { OFMT = \"%.2f\"; CONVFMT = \"%.3f\"; x = 3.14159\n"
                    "print x; print x \"\"; print 10 }") == "3.14\n3.142\n10\n");
  REQUIRE(output_of("BEGIN { OFS = \"-\"; ORS = \"|\"; print \"a\", \"b\"; print \"c\" }") ==
          "a-b|c|");
}

TEST_CASE("Tawk::Interpreter - control flow", "[tawk][execute]")
{
  REQUIRE(output_of("BEGIN {\n"
                    "  while (1) {\n"
                    "    if (++i > 3) break\n"
                    "    if (i == 2) continue\n"
                    "    s = s i\n"
                    "  }\n"
                    "  print s\n"
                    "}") == "13\n");
  REQUIRE(output_of("BEGIN { do { n++ } while (n < 0); print n }") == "1\n");
  REQUIRE(output_of("BEGIN { for (i = 0; i < 3; i++) s = s i; print s }") == "012\n");
  REQUIRE(output_of("{ print; nextfile }", "a\nb\n") == "a\n");
}

TEST_CASE("Tawk::Interpreter - arrays", "[tawk][execute]")
{
  REQUIRE(output_of("BEGIN { a[\"x\"]; if (\"x\" in a) print \"in\"; delete a[\"x\"]\n"
                    "print length(a); if (!(\"y\" in a)) print \"out\"; print length(a) }") ==
          "in\n0\nout\n0\n");
  REQUIRE(output_of("BEGIN { a[\"b\"]; a[\"a\"]; a[\"c\"]; for (k in a) s = s k; print s }") ==
          "abc\n");
  REQUIRE(output_of("BEGIN { a[1, 2] = 3\n"
                    "for (k in a) { split(k, parts, SUBSEP); print parts[1], parts[2] } }") ==
          "1 2\n");
  REQUIRE(output_of("BEGIN { a[1]; a[2]; delete a; print length(a) }") == "0\n");
}

TEST_CASE("Tawk::Interpreter - paragraph mode", "[tawk][execute]")
{
  REQUIRE(output_of("BEGIN { RS = \"\" } { print NR \": \" $1 \"/\" $NF }",
                    "\na b\nc\n\n\nd e\n") == "1: a/c\n2: d/e\n");
}

TEST_CASE("Tawk::Interpreter - command line assignments", "[tawk][execute]")
{
  REQUIRE(run_program("BEGIN { print msg }", "", {"msg=a\\tb"}).output == "a\tb\n");
  REQUIRE(run_program("BEGIN { print (n == 10) }", "", {"n=10.0"}).output == "1\n");

  auto const program{parse_string("BEGIN { print \"x\" }")};
  std::ostringstream out;
  Tawk::ForeignFunctionRegistry foreign{out};
  Tawk::Interpreter interpreter{program, out, foreign};
  REQUIRE_FALSE(interpreter.assign("1x=3"));
  REQUIRE_FALSE(interpreter.assign("novalue"));
  REQUIRE(interpreter.assign("x_1="));
}

TEST_CASE("Tawk::Interpreter - operands", "[tawk][execute]")
{
  auto const program{parse_string("BEGIN { print ARGC, ARGV[1] } END { print x, NR }")};
  std::ostringstream out;
  Tawk::ForeignFunctionRegistry foreign{out};
  Tawk::Interpreter interpreter{program, out, foreign};
  REQUIRE(interpreter.run(std::vector<std::string>{"x=5", "/dev/null"}) == 0);
  REQUIRE(out.str() == "3 x=5\n5 0\n");
}

TEST_CASE("Tawk::Interpreter - unreadable input", "[tawk][execute]")
{
  auto const program{parse_string("{ print }")};
  std::ostringstream out;
  Tawk::ForeignFunctionRegistry foreign{out};
  Tawk::Interpreter interpreter{program, out, foreign};
  REQUIRE_THROWS_AS(interpreter.run(std::vector<std::string>{"/nonexistent/tawk-input"}),
                    Tawk::RuntimeIOError);
}

TEST_CASE("Tawk::Interpreter - ENVIRON", "[tawk][execute]")
{
  REQUIRE(::setenv("TAWK_TEST_VALUE", "42", 1) == 0);
  REQUIRE(output_of("BEGIN { print ENVIRON[\"TAWK_TEST_VALUE\"] + 1 }") == "43\n");
}

TEST_CASE("Tawk::Interpreter - runtime errors", "[tawk][execute]")
{
  REQUIRE_THROWS_AS(run_program("BEGIN { x = 1 / 0 }", ""), Tawk::TypeError);
  REQUIRE_THROWS_AS(run_program("BEGIN { x = 1; x %= 0 }", ""), Tawk::TypeError);
  REQUIRE_THROWS_AS(run_program("{ print $(-1) }", "a\n"), Tawk::TypeError);
  REQUIRE_THROWS_AS(run_program("{ print $1e30 }", "a\n"), Tawk::TypeError);
  REQUIRE_THROWS_AS(run_program("{ $1e30 = 1 }", "a\n"), Tawk::TypeError);
  REQUIRE_THROWS_AS(run_program("BEGIN { s = 1; split(\"a b\", s) }", ""), Tawk::TypeError);
  REQUIRE_THROWS_AS(run_program("function f(a) { }\nBEGIN { f(1, 2) }", ""), Tawk::TypeError);
  REQUIRE_THROWS_AS(run_program("BEGIN { x = \"a(\"; if (\"a\" ~ x) print }", ""),
                    Tawk::TypeError);

  REQUIRE_THROWS_AS(run_program("BEGIN { undefined_function(1) }", ""), Tawk::NameError);
  REQUIRE_THROWS_AS(run_program("BEGIN { a[1] = 1; a = 2 }", ""), Tawk::NameError);
  REQUIRE_THROWS_AS(run_program("BEGIN { x = 1; x[1] = 2 }", ""), Tawk::NameError);
  REQUIRE_THROWS_AS(run_program("BEGIN { a[1] = 1; print a }", ""), Tawk::NameError);
  REQUIRE_THROWS_AS(run_program("function f() { }\nBEGIN { f = 1 }", ""), Tawk::NameError);
}

TEST_CASE("Tawk::Interpreter - invalid field separators report a location", "[tawk][execute]")
{
  auto [program_text, line] = GENERATE(table<std::string_view, unsigned>({
    {"BEGIN { x = 1 }\n{\n  n = split($0, parts, \"((\")\n}", 3},
    {"BEGIN { FS = \"((\" }\n\n{ print $1 }", 3},
    {"BEGIN { x = 1 }\n{ FS = \"((\"; $0 = \"p q\" }", 2},
  }));
  INFO("Running " << program_text);
  try {
    (void)run_program(program_text, "a b\n");
    FAIL("Expected a TypeError");
  }
  catch (Tawk::TypeError const& e) {
    REQUIRE(e.location().line() == line);
  }
}

TEST_CASE("Tawk::Interpreter - output before an error is kept", "[tawk][execute]")
{
  auto const program{parse_string("{ print; if (NR == 2) x = 1 / 0 }")};
  std::ostringstream out;
  Tawk::ForeignFunctionRegistry foreign{out};
  Tawk::Interpreter interpreter{program, out, foreign};
  REQUIRE_THROWS_AS(interpreter.run(std::make_unique<Tawk::StringReader>("a\nb\nc\n", "input")),
                    Tawk::TypeError);
  REQUIRE(out.str().find("a\n") == 0);
}

TEST_CASE("Tawk::Interpreter - globals after the run", "[tawk][execute]")
{
  auto const program{parse_string("{ n = split($0, parts, \":\") } END { total = NR }")};
  std::ostringstream out;
  Tawk::ForeignFunctionRegistry foreign{out};
  Tawk::Interpreter interpreter{program, out, foreign};
  REQUIRE(interpreter.run(std::make_unique<Tawk::StringReader>("a:b:c\n", "input")) == 0);

  REQUIRE(interpreter.global("n").to_number() == 3);
  REQUIRE(interpreter.global("total").to_number() == 1);
  REQUIRE(interpreter.global("NF").to_number() == 1);
  REQUIRE(interpreter.global("missing").is_uninit());

  auto const* parts{interpreter.global_array("parts")};
  REQUIRE(parts != nullptr);
  REQUIRE(parts->size() == 3);
  REQUIRE(parts->elements().at("2").to_string("%.6g") == "b");
  REQUIRE(interpreter.global_array("n") == nullptr);
}
