/** \file   text-functions.cc
 *  \brief  The ai_* text analysis foreign functions
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk-messages.hh"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "foreign.hh"

namespace {
using Args = std::vector<std::string>;

auto to_lower(std::string s) -> std::string
{
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

auto trim(std::string const& s) -> std::string
{
  auto const begin{s.find_first_not_of(" \t\n")};
  if (begin == std::string::npos) {
    return {};
  }
  auto const end{s.find_last_not_of(" \t\n")};
  return s.substr(begin, end - begin + 1);
}

/** \brief  Throw a TypeError unless \a args has between \a min and \a max elements.  */
void check_arity(std::string_view name, Args const& args, std::size_t min, std::size_t max)
{
  if (args.size() < min || args.size() > max) {
    throw Tawk::TypeError(Tawk::Location{std::string_view{}},
                          Tawk::Messages::get().format(Tawk::Msg::wrong_foreign_argument_count,
                                                       name, args.size()));
  }
}

/** \brief  Get argument \a idx, or \a def if it was not given.  */
auto arg_or(Args const& args, std::size_t idx, std::string_view def) -> std::string
{
  return idx < args.size() ? args[idx] : std::string{def};
}

/** \brief  Ask \a provider to complete \a prompt, throwing ForeignCallError if it can't.  */
auto ask(Tawk::TextProvider& provider, std::string const& prompt, std::size_t max_tokens)
  -> std::string
{
  auto answer{provider.complete(prompt, max_tokens)};
  if (!answer.has_value()) {
    throw Tawk::ForeignCallError(Tawk::Messages::get().format(Tawk::Msg::provider_no_answer));
  }
  return *answer;
}

auto sentiment(Tawk::TextProvider& provider, Args const& args) -> std::string
{
  check_arity("ai_sentiment", args, 1, 1);
  auto const answer{to_lower(ask(
    provider,
    fmt::format("Analyze the sentiment of this text and respond with just one word: positive, "
                "negative, or neutral. Text: {}",
                args[0]),
    50))};
  if (answer.find("positive") != std::string::npos) {
    return "positive";
  }
  if (answer.find("negative") != std::string::npos) {
    return "negative";
  }
  return "neutral";
}

auto classify(Tawk::TextProvider& provider, Args const& args) -> std::string
{
  check_arity("ai_classify", args, 2, 2);
  std::vector<std::string> categories;
  std::string::size_type pos{0};
  while (true) {
    auto const comma{args[1].find(',', pos)};
    categories.push_back(trim(args[1].substr(pos, comma - pos)));
    if (comma == std::string::npos) {
      break;
    }
    pos = comma + 1;
  }

  auto const answer{to_lower(ask(provider,
                                 fmt::format("Classify this text into one of these categories: "
                                             "{}. Respond with just the category name. Text: {}",
                                             args[1], args[0]),
                                 50))};
  for (auto const& category : categories) {
    if (!category.empty() && answer.find(to_lower(category)) != std::string::npos) {
      return category;
    }
  }
  return categories.front();
}

auto translate(Tawk::TextProvider& provider, Args const& args) -> std::string
{
  check_arity("ai_translate", args, 1, 2);
  return trim(ask(provider,
                  fmt::format("Translate this text to {}. Respond with just the translation: {}",
                              arg_or(args, 1, "Spanish"), args[0]),
                  200));
}

auto summarize(Tawk::TextProvider& provider, Args const& args) -> std::string
{
  constexpr std::size_t default_words{20};

  check_arity("ai_summarize", args, 1, 2);
  std::size_t words{default_words};
  if (args.size() > 1) {
    auto const requested{Tawk::parse_number_prefix(args[1])};
    if (requested >= 1) {
      words = static_cast<std::size_t>(requested);
    }
  }
  return trim(ask(provider,
                  fmt::format("Summarize this text in {} words or less: {}", words, args[0]),
                  words * 2));
}

auto extract_info(Tawk::TextProvider& provider, Args const& args) -> std::string
{
  check_arity("ai_extract_info", args, 2, 2);
  return trim(ask(
    provider,
    fmt::format("Extract {} from this text. If not found, return 'none'. Text: {}", args[1],
                args[0]),
    100));
}

auto entity_extract(Tawk::TextProvider& provider, Args const& args) -> std::string
{
  check_arity("ai_entity_extract", args, 1, 2);
  return trim(ask(provider,
                  fmt::format("Extract all {} entities from this text. List them separated by "
                              "commas. Text: {}",
                              arg_or(args, 1, "person"), args[0]),
                  150));
}

auto fact_check(Tawk::TextProvider& provider, Args const& args) -> std::string
{
  check_arity("ai_fact_check", args, 1, 1);
  auto const answer{to_lower(ask(provider,
                                 fmt::format("Is this statement likely true or false based on "
                                             "general knowledge? Respond with 'true', 'false', "
                                             "or 'uncertain': {}",
                                             args[0]),
                                 50))};
  if (answer.find("uncertain") != std::string::npos) {
    return "uncertain";
  }
  if (answer.find("true") != std::string::npos) {
    return "true";
  }
  if (answer.find("false") != std::string::npos) {
    return "false";
  }
  return "uncertain";
}

auto math_word_problem(Tawk::TextProvider& provider, Args const& args) -> std::string
{
  static std::regex const number_re{R"(-?[0-9]+(\.[0-9]+)?)", std::regex::ECMAScript};

  check_arity("ai_math_word_problem", args, 1, 1);
  auto const answer{ask(
    provider,
    fmt::format("Solve this math problem and give just the numerical answer: {}", args[0]), 100)};
  std::smatch m;
  if (std::regex_search(answer, m, number_re)) {
    return m.str(0);
  }
  return "0";
}

auto generate(Tawk::TextProvider& provider, Args const& args) -> std::string
{
  check_arity("ai_generate", args, 1, args.max_size());
  std::string text{args[0]};
  for (std::size_t i{1}; i < args.size(); ++i) {
    auto const placeholder{fmt::format("{{{}}}", i - 1)};
    auto pos{text.find(placeholder)};
    while (pos != std::string::npos) {
      text.replace(pos, placeholder.size(), args[i]);
      pos = text.find(placeholder, pos + args[i].size());
    }
  }
  return trim(ask(provider, fmt::format("Generate text based on this template: {}", text), 200));
}
}  // namespace

void Tawk::register_text_functions(ForeignFunctionRegistry& registry,
                                   std::shared_ptr<TextProvider> provider)
{
  using Handler = std::string (*)(TextProvider&, Args const&);
  std::pair<char const*, Handler> const functions[] = {  // NOLINT(modernize-avoid-c-arrays)
    {"ai_sentiment", sentiment},
    {"ai_classify", classify},
    {"ai_translate", translate},
    {"ai_summarize", summarize},
    {"ai_extract_info", extract_info},
    {"ai_entity_extract", entity_extract},
    {"ai_fact_check", fact_check},
    {"ai_math_word_problem", math_word_problem},
    {"ai_generate", generate},
  };

  for (auto const& [name, handler] : functions) {
    registry.add(name, [provider, handler = handler](Args const& args) {
      return handler(*provider, args);
    });
  }
}
