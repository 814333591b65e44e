/** \file   value.cc
 *  \brief  Implementation of Tawk::Value and Tawk::Array
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk/utils.hh"

#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include "format.hh"
#include "value.hh"

namespace {
constexpr auto is_blank(char c) -> bool
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

constexpr auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

/** \brief  Result of scanning for a number.  */
struct NumberScan
{
  Tawk::Floating value{0.0};  ///< Value of number, 0 if none found.
  std::size_t end{0};         ///< Index after the last character of the number.
  bool found{false};          ///< Did we find any digits?
};

/** \brief    Scan the number at the start of \a s (after leading blanks).
 *
 * Accepts [+-]digits[.digits][(e|E)[+-]digits] with at least one digit in the mantissa.  The
 * conversion is locale independent.
 */
auto scan_number(std::string_view s) -> NumberScan
{
  NumberScan result;
  std::size_t pos{0};
  while (pos < s.size() && is_blank(s[pos])) {
    ++pos;
  }

  bool negative{false};
  if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
    negative = s[pos] == '-';
    ++pos;
  }

  std::size_t const start{pos};
  bool digits{false};
  while (pos < s.size() && is_digit(s[pos])) {
    ++pos;
    digits = true;
  }
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    while (pos < s.size() && is_digit(s[pos])) {
      ++pos;
      digits = true;
    }
  }
  if (!digits) {
    return result;
  }

  bool negative_exponent{false};
  if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
    std::size_t exp_pos{pos + 1};
    if (exp_pos < s.size() && (s[exp_pos] == '+' || s[exp_pos] == '-')) {
      negative_exponent = s[exp_pos] == '-';
      ++exp_pos;
    }
    if (exp_pos < s.size() && is_digit(s[exp_pos])) {
      while (exp_pos < s.size() && is_digit(s[exp_pos])) {
        ++exp_pos;
      }
      pos = exp_pos;
    }
  }

  Tawk::Floating value{0.0};
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  auto [ptr, ec] = std::from_chars(s.data() + start, s.data() + pos, value);
  if (ec == std::errc::result_out_of_range) {
    value = negative_exponent ? 0.0 : std::numeric_limits<Tawk::Floating>::infinity();
  }

  result.value = negative ? -value : value;
  result.end = pos;
  result.found = true;
  return result;
}
}  // namespace

Tawk::Value::Value(Floating f) : value_(f) {}

Tawk::Value::Value(std::string s) : value_(std::move(s)) {}

Tawk::Value::Value(char const* s) : value_(std::string{s}) {}

auto Tawk::Value::strnum_candidate(std::string s) -> Value
{
  Value result;
  if (auto number{parse_number(s)}; number.has_value()) {
    result.value_ = StrNum{std::move(s), *number};
  }
  else {
    result.value_ = std::move(s);
  }
  return result;
}

auto Tawk::Value::kind() const noexcept -> Kind
{
  return std::visit(Overloaded{
                      [](std::monostate) { return Kind::uninit; },
                      [](std::string const&) { return Kind::string; },
                      [](Floating) { return Kind::number; },
                      [](StrNum const&) { return Kind::strnum; },
                    },
                    value_);
}

auto Tawk::Value::is_uninit() const noexcept -> bool
{
  return std::holds_alternative<std::monostate>(value_);
}

auto Tawk::Value::is_numeric() const noexcept -> bool
{
  return !std::holds_alternative<std::string>(value_);
}

auto Tawk::Value::to_number() const -> Floating
{
  return std::visit(Overloaded{
                      [](std::monostate) { return 0.0; },
                      [](std::string const& s) { return parse_number_prefix(s); },
                      [](Floating f) { return f; },
                      [](StrNum const& sn) { return sn.number; },
                    },
                    value_);
}

auto Tawk::Value::to_string(std::string_view convfmt) const -> std::string
{
  return std::visit(Overloaded{
                      [](std::monostate) { return std::string{}; },
                      [](std::string const& s) { return s; },
                      [convfmt](Floating f) { return format_number(f, convfmt); },
                      [](StrNum const& sn) { return sn.text; },
                    },
                    value_);
}

auto Tawk::Value::to_bool() const -> bool
{
  return std::visit(Overloaded{
                      [](std::monostate) { return false; },
                      [](std::string const& s) { return !s.empty(); },
                      [](Floating f) { return f != 0.0; },
                      [](StrNum const& sn) { return sn.number != 0.0; },
                    },
                    value_);
}

auto Tawk::compare(Value const& lhs, Value const& rhs, std::string_view convfmt) -> int
{
  if (lhs.is_numeric() && rhs.is_numeric()) {
    auto const l{lhs.to_number()};
    auto const r{rhs.to_number()};
    if (l < r) {
      return -1;
    }
    return l > r ? 1 : 0;
  }

  return lhs.to_string(convfmt).compare(rhs.to_string(convfmt));
}

auto Tawk::parse_number_prefix(std::string_view s) -> Floating { return scan_number(s).value; }

auto Tawk::parse_number(std::string_view s) -> std::optional<Floating>
{
  auto const scan{scan_number(s)};
  if (!scan.found) {
    return std::nullopt;
  }

  std::size_t pos{scan.end};
  while (pos < s.size() && is_blank(s[pos])) {
    ++pos;
  }
  if (pos != s.size()) {
    return std::nullopt;
  }

  return scan.value;
}

auto Tawk::Array::ensure(std::string const& key) -> Value& { return elements_[key]; }

auto Tawk::Array::contains(std::string const& key) const -> bool
{
  return elements_.find(key) != elements_.end();
}

void Tawk::Array::erase(std::string const& key) { elements_.erase(key); }

void Tawk::Array::clear() noexcept { elements_.clear(); }

auto Tawk::Array::size() const noexcept -> std::size_t { return elements_.size(); }

auto Tawk::Array::keys() const -> std::vector<std::string>
{
  std::vector<std::string> result;
  result.reserve(elements_.size());
  for (auto const& [key, value] : elements_) {
    result.push_back(key);
  }
  return result;
}

auto Tawk::Array::elements() const noexcept -> Elements const& { return elements_; }
