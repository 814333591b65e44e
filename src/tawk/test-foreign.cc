/** \file   test-foreign.cc
 *  \brief  Tests for foreign functions and the text analysis functions
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <catch2/catch.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "execute.hh"
#include "foreign.hh"
#include "program.hh"
#include "tawk.hh"

namespace {
using Args = std::vector<std::string>;

/** \brief  Provider that never has an answer.  */
class SilentProvider final : public Tawk::TextProvider
{
public:
  auto complete([[maybe_unused]] std::string const& prompt,
                [[maybe_unused]] std::size_t max_tokens) -> std::optional<std::string> override
  {
    return std::nullopt;
  }
};

auto call(Tawk::ForeignFunctionRegistry& registry, std::string const& name,
          std::vector<Tawk::Value> const& args) -> Tawk::Value
{
  auto const fn{registry.resolve(name)};
  REQUIRE(fn != nullptr);
  return registry.call(*fn, name, args, Tawk::Location{"test", 1, 1}, "%.6g");
}

auto text(std::string_view name, std::vector<std::string> const& args) -> std::string
{
  std::ostringstream diagnostics;
  Tawk::ForeignFunctionRegistry registry{diagnostics};
  Tawk::register_text_functions(registry, std::make_shared<Tawk::SimulatedProvider>());

  std::vector<Tawk::Value> values;
  for (auto const& arg : args) {
    values.emplace_back(arg);
  }
  auto const result{call(registry, std::string{name}, values).to_string("%.6g")};
  REQUIRE(diagnostics.str().empty());
  return result;
}

auto run_program(std::string_view program_text, std::string const& input,
                 Tawk::ForeignFunctionRegistry& registry) -> std::string
{
  auto const program{Tawk::parse(std::make_unique<Tawk::Lexer>(
    std::make_unique<Tawk::StringReader>(std::string{program_text})))};
  std::ostringstream out;
  Tawk::Interpreter interpreter{program, out, registry};
  REQUIRE(interpreter.run(std::make_unique<Tawk::StringReader>(input, "input")) == 0);
  return out.str();
}
}  // namespace

TEST_CASE("Tawk::ForeignFunctionRegistry - registration", "[tawk][foreign]")
{
  std::ostringstream diagnostics;
  Tawk::ForeignFunctionRegistry registry{diagnostics};
  REQUIRE(registry.resolve("join") == nullptr);

  registry.add("join", [](Args const& args) {
    std::string result;
    for (auto const& arg : args) {
      result += (result.empty() ? "" : "-") + arg;
    }
    return result;
  });
  registry.add("twelve", [](Args const&) { return std::string{" 12 "}; });

  auto const joined{call(registry, "join", {Tawk::Value{"a"}, Tawk::Value{Tawk::Floating{2}}})};
  REQUIRE(joined.to_string("%.6g") == "a-2");
  REQUIRE(joined.kind() == Tawk::Value::Kind::string);

  /* Results are strnum candidates.  */
  auto const twelve{call(registry, "twelve", {})};
  REQUIRE(twelve.kind() == Tawk::Value::Kind::strnum);
  REQUIRE(twelve.to_number() == 12);

  /* Registering again replaces the function, without invalidating earlier lookups.  */
  auto const previous{registry.resolve("twelve")};
  registry.add("twelve", [](Args const&) { return std::string{"13"}; });
  REQUIRE(call(registry, "twelve", {}).to_number() == 13);
  REQUIRE(registry.call(*previous, "twelve", {}, Tawk::Location{"test", 1, 1}, "%.6g")
            .to_number() == 12);
  REQUIRE(diagnostics.str().empty());
}

TEST_CASE("Tawk::ForeignFunctionRegistry - failures are warnings", "[tawk][foreign]")
{
  std::ostringstream diagnostics;
  Tawk::ForeignFunctionRegistry registry{diagnostics};
  registry.add("fail", [](Args const&) -> std::string {
    throw Tawk::ForeignCallError("service unavailable");
  });
  registry.add("crash", [](Args const&) -> std::string {
    throw std::runtime_error("connection reset");
  });

  auto const failed{call(registry, "fail", {Tawk::Value{"x"}})};
  REQUIRE(failed.kind() == Tawk::Value::Kind::string);
  REQUIRE(failed.to_string("%.6g").empty());
  REQUIRE(diagnostics.str().find("test:1:1: warning: fail failed: service unavailable") !=
          std::string::npos);

  REQUIRE(call(registry, "crash", {}).to_string("%.6g").empty());
  REQUIRE(diagnostics.str().find("crash failed: connection reset") != std::string::npos);
}

TEST_CASE("Tawk::ForeignFunctionRegistry - failures don't stop the run", "[tawk][foreign]")
{
  std::ostringstream diagnostics;
  Tawk::ForeignFunctionRegistry registry{diagnostics};
  registry.add("fail", [](Args const&) -> std::string {
    throw Tawk::ForeignCallError("always fails");
  });

  REQUIRE(run_program("{ r = fail($0); n++; print \"[\" r \"]\" } END { print n }", "a\nb\n",
                      registry) == "[]\n[]\n2\n");
  REQUIRE(diagnostics.str().find("fail failed: always fails") != std::string::npos);
}

TEST_CASE("Tawk::ForeignFunctionRegistry - misuse is fatal", "[tawk][foreign]")
{
  std::ostringstream diagnostics;
  Tawk::ForeignFunctionRegistry registry{diagnostics};
  registry.add("strict", [](Args const&) -> std::string {
    throw Tawk::TypeError(Tawk::Location{std::string_view{}}, "bad arguments");
  });

  try {
    (void)call(registry, "strict", {});
    FAIL("Expected a TypeError");
  }
  catch (Tawk::TypeError const& e) {
    REQUIRE(e.location().file_name() == "test");
  }

  Tawk::register_text_functions(registry, std::make_shared<Tawk::SimulatedProvider>());
  REQUIRE_THROWS_AS(call(registry, "ai_sentiment", {}), Tawk::TypeError);
  REQUIRE_THROWS_AS(
    call(registry, "ai_classify", {Tawk::Value{"a"}, Tawk::Value{"b"}, Tawk::Value{"c"}}),
    Tawk::TypeError);
  REQUIRE(diagnostics.str().empty());
}

TEST_CASE("Tawk text functions - sentiment", "[tawk][foreign]")
{
  REQUIRE(text("ai_sentiment", {"I love this"}) == "positive");
  REQUIRE(text("ai_sentiment", {"This is terrible"}) == "negative");
  REQUIRE(text("ai_sentiment", {"The sky is blue"}) == "neutral");
}

TEST_CASE("Tawk text functions - classification", "[tawk][foreign]")
{
  REQUIRE(text("ai_classify", {"The stock market fell", "sports, business, science"}) ==
          "business");
  REQUIRE(text("ai_classify", {"The team wins the championship", "sports,business"}) ==
          "sports");
  /* An answer naming none of the categories picks the first.  */
  REQUIRE(text("ai_classify", {"Nothing to see", "alpha, beta"}) == "alpha");
}

TEST_CASE("Tawk text functions - other functions", "[tawk][foreign]")
{
  REQUIRE(text("ai_translate", {"Hello"}) == "hola");
  REQUIRE(text("ai_math_word_problem", {"I had 15 apples and ate 7"}) == "8");
  REQUIRE(text("ai_math_word_problem", {"What is six times seven?"}) == "42");
  REQUIRE(text("ai_fact_check", {"Cats can fly"}) == "false");
  REQUIRE(text("ai_fact_check", {"The Pacific Ocean is the largest ocean"}) == "true");
  REQUIRE(text("ai_fact_check", {"It will rain tomorrow"}) == "uncertain");
  REQUIRE(text("ai_entity_extract", {"Alice Smith met Bob Jones"}) == "Alice Smith, Bob Jones");
  REQUIRE(text("ai_extract_info", {"Lunch with Jane Doe", "person"}) == "Jane Doe");
  REQUIRE(text("ai_extract_info", {"lunch at noon", "person"}) == "none");
  REQUIRE(text("ai_summarize", {"A long text", "5"}) == "Brief summary of the content");
  REQUIRE(text("ai_generate", {"Say {0}", "hi"}) ==
          "AI-generated response: Generate text based on this template: Say hi...");
}

TEST_CASE("Tawk text functions - in programs", "[tawk][foreign]")
{
  std::ostringstream diagnostics;
  Tawk::ForeignFunctionRegistry registry{diagnostics};
  Tawk::register_text_functions(registry, std::make_shared<Tawk::SimulatedProvider>());

  REQUIRE(run_program("{ print ai_sentiment($0) }", "I love this\nthis is awful\n", registry) ==
          "positive\nnegative\n");
  REQUIRE(run_program("BEGIN { print ai_math_word_problem(\"15 minus 7\") + 1 }", "",
                      registry) == "9\n");
  REQUIRE(diagnostics.str().empty());
}

TEST_CASE("Tawk text functions - provider without an answer", "[tawk][foreign]")
{
  std::ostringstream diagnostics;
  Tawk::ForeignFunctionRegistry registry{diagnostics};
  Tawk::register_text_functions(registry, std::make_shared<SilentProvider>());

  REQUIRE(call(registry, "ai_sentiment", {Tawk::Value{"I love this"}}).to_string("%.6g").empty());
  REQUIRE(diagnostics.str().find("ai_sentiment failed") != std::string::npos);
}
