/** \file   simulated-provider.cc
 *  \brief  Offline text provider using keyword heuristics
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>

#include "foreign.hh"

namespace {
auto to_lower(std::string s) -> std::string
{
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

auto contains(std::string_view haystack, std::string_view needle) -> bool
{
  return haystack.find(needle) != std::string_view::npos;
}

template<std::size_t N>
auto contains_any(std::string_view haystack, std::array<std::string_view, N> const& needles)
  -> bool
{
  return std::any_of(needles.begin(), needles.end(),
                     [haystack](std::string_view needle) { return contains(haystack, needle); });
}

/** \brief  Get the text after the last occurrence of \a marker, or all of \a s.  */
auto text_after(std::string const& s, std::string_view marker) -> std::string
{
  auto pos{s.rfind(marker)};
  if (pos == std::string::npos) {
    return s;
  }
  return s.substr(pos + marker.size());
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

auto simulate_sentiment(std::string const& lower) -> std::string
{
  constexpr std::array<std::string_view, 6> positive{"love",    "amazing", "great",
                                                     "perfect", "excited", "beautiful"};
  constexpr std::array<std::string_view, 6> negative{"hate", "terrible",   "awful",
                                                     "bad",  "frustrated", "stressful"};
  auto const text{trim(text_after(lower, "text:"))};
  if (contains_any(text, positive)) {
    return "positive";
  }
  if (contains_any(text, negative)) {
    return "negative";
  }
  return "neutral";
}

auto simulate_classify(std::string const& lower) -> std::string
{
  constexpr std::array<std::string_view, 4> science{"discover", "species", "ocean", "earthquake"};
  constexpr std::array<std::string_view, 5> business{"stock", "market", "economic", "budget",
                                                     "layoffs"};
  constexpr std::array<std::string_view, 3> sports{"championship", "basketball", "wins"};
  constexpr std::array<std::string_view, 4> technology{"ai", "technology", "tech", "healthcare"};
  constexpr std::array<std::string_view, 4> politics{"political", "leaders", "climate",
                                                     "policies"};
  constexpr std::array<std::string_view, 3> entertainment{"celebrity", "chef", "restaurant"};

  auto const text{trim(text_after(lower, "text:"))};
  if (contains_any(text, science)) {
    return "science";
  }
  if (contains_any(text, business)) {
    return "business";
  }
  if (contains_any(text, sports)) {
    return "sports";
  }
  if (contains_any(text, technology)) {
    return "technology";
  }
  if (contains_any(text, politics)) {
    return "politics";
  }
  if (contains_any(text, entertainment)) {
    return "entertainment";
  }
  return "general";
}

auto simulate_translate(std::string const& lower) -> std::string
{
  constexpr std::array<std::pair<std::string_view, std::string_view>, 7> phrases{{
    {"i love this", "me encanta esto"},
    {"hello", "hola"},
    {"good morning", "buenos días"},
    {"thank you", "gracias"},
    {"laptop", "portátil"},
    {"headphones", "auriculares"},
    {"phone", "teléfono"},
  }};

  auto text{trim(text_after(lower, ":"))};
  for (auto const& [english, spanish] : phrases) {
    auto pos{text.find(english)};
    if (pos == std::string::npos) {
      continue;
    }
    while (pos != std::string::npos) {
      text.replace(pos, english.size(), spanish);
      pos = text.find(english, pos + spanish.size());
    }
    return text;
  }
  return "traducción simulada";
}

auto simulate_person_entities(std::string const& prompt) -> std::string
{
  static std::regex const name_re{R"(\b[A-Z][a-z]+ [A-Z][a-z]+\b)", std::regex::ECMAScript};

  auto const text{text_after(prompt, "Text:")};
  std::string result;
  for (auto it{std::sregex_iterator(text.begin(), text.end(), name_re)};
       it != std::sregex_iterator(); ++it) {
    if (!result.empty()) {
      result += ", ";
    }
    result += it->str();
  }
  return result.empty() ? std::string{"none"} : result;
}

auto simulate_fact_check(std::string const& lower) -> std::string
{
  if (contains(lower, "pacific ocean") && contains(lower, "largest")) {
    return "true";
  }
  if (contains(lower, "cats") && contains(lower, "fly")) {
    return "false";
  }
  return "uncertain";
}
}  // namespace

auto Tawk::SimulatedProvider::complete(std::string const& prompt,
                                       [[maybe_unused]] std::size_t max_tokens)
  -> std::optional<std::string>
{
  constexpr std::size_t echo_length{50};

  auto const lower{to_lower(prompt)};

  if (contains(lower, "sentiment")) {
    return simulate_sentiment(lower);
  }
  if (contains(lower, "classify") && contains(lower, "categories")) {
    return simulate_classify(lower);
  }
  if (contains(lower, "translate") && contains(lower, "spanish")) {
    return simulate_translate(lower);
  }
  if (contains(lower, "extract") && contains(lower, "person")) {
    return simulate_person_entities(prompt);
  }
  if (contains(lower, "summarize")) {
    return "Brief summary of the content";
  }
  if (contains(lower, "math") || contains(lower, "problem")) {
    return (contains(lower, "15") && contains(lower, "7")) ? "8" : "42";
  }
  if (contains(lower, "fact") || contains(lower, "true or false")) {
    return simulate_fact_check(lower);
  }

  return "AI-generated response: " + prompt.substr(0, echo_length) + "...";
}
