/** \file   format.cc
 *  \brief  printf style formatting of tawk values
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "format.hh"

namespace {
/** \brief  A decoded formatting_specifier.  */
struct FormatState
{
  bool left_justified_ = false;        /** Are we doing left justified output? */
  bool force_positive_ = false;        /** Do we output '+' for positive? */
  bool force_positive_space_ = false;  /** Do we output ' ' for positive? */
  bool alternative_form_ = false;      /** Do we use the alternative form? */
  bool leading_zeroes_ = false;        /** Do we output leading zeroes? */
  std::string::size_type min_width_ = 0; /** Minimum width.  */
  int precision_ = -1;                   /** Precision, -1 means unspecified.  */
};

enum class State {
  normal,    /**< Normal character.  */
  flags,     /**< Expecting flags part of format specifier.  */
  width,     /**< Expecting width part of format specifier.  */
  precision, /**< Expecting precision part of format specifier.  */
  specifier, /**< Expecting format specifier.  */
};

constexpr int base_decimal = 10;
constexpr int max_width = 1 << 20;

using UnsignedInteger = unsigned long long;  // NOLINT(google-runtime-int)
using SignedInteger = long long;             // NOLINT(google-runtime-int)

/** \brief  Formatter for one printf call.  */
class Printf
{
public:
  Printf(std::vector<Tawk::Value> const& args, std::string_view convfmt)
      : args_(args), convfmt_(convfmt)
  {
  }

  auto process(std::string_view format) -> std::string
  {
    State state = State::normal;
    FormatState format_state;
    std::string_view::size_type spec_start{0};

    for (std::string_view::size_type pos = 0; pos < format.size(); ++pos) {
      char const c{format[pos]};
      switch (state) {
      case State::normal:
        if (c == '%') {
          state = State::flags;
          spec_start = pos;
          format_state = FormatState();
        }
        else {
          result_ += c;
        }
        break;
      case State::flags:
        switch (c) {
        case '-':
          format_state.left_justified_ = true;
          break;
        case '+':
          format_state.force_positive_ = true;
          break;
        case ' ':
          format_state.force_positive_space_ = true;
          break;
        case '#':
          format_state.alternative_form_ = true;
          break;
        case '0':
          format_state.leading_zeroes_ = true;
          break;
        case '*':
          star_width(format_state);
          state = State::width;
          break;
        case '.':
          state = State::precision;
          format_state.precision_ = 0;
          break;
        default:
          state = (c >= '1' && c <= '9') ? State::width : State::specifier;
          --pos;
          break;
        }
        break;
      case State::width:
        if (c >= '0' && c <= '9') {
          format_state.min_width_ = format_state.min_width_ * base_decimal + (c - '0');
          if (format_state.min_width_ > max_width) {
            format_state.min_width_ = max_width;
          }
        }
        else if (c == '.') {
          state = State::precision;
          format_state.precision_ = 0;
        }
        else {
          state = State::specifier;
          --pos;
        }
        break;
      case State::precision:
        if (c >= '0' && c <= '9') {
          format_state.precision_ = format_state.precision_ * base_decimal + (c - '0');
          if (format_state.precision_ > max_width) {
            format_state.precision_ = max_width;
          }
        }
        else if (c == '*') {
          auto const precision{next_number()};
          format_state.precision_ =
            precision < 0 ? -1 : static_cast<int>(std::min<Tawk::Floating>(precision, max_width));
        }
        else {
          state = State::specifier;
          --pos;
        }
        break;
      case State::specifier:
        state = State::normal;
        switch (c) {
        case 'h':
        case 'l':
        case 'L':
        case 'q':
        case 'j':
        case 'z':
        case 't':
          // Length modifiers mean nothing to us.
          state = State::specifier;
          break;
        case '%':
          result_ += '%';
          break;
        case 'c':
          process_char(format_state);
          break;
        case 's':
          process_string(format_state, next_string());
          break;
        case 'd':
        case 'i':
          process_decimal(format_state);
          break;
        case 'o':
        case 'u':
        case 'x':
        case 'X':
          process_unsigned(format_state, c);
          break;
        case 'e':
        case 'E':
        case 'f':
        case 'F':
        case 'g':
        case 'G':
          process_floating(format_state, c);
          break;
        default:
          result_ += format.substr(spec_start, pos + 1 - spec_start);
          break;
        }
        break;
      }
    }

    if (state != State::normal) {
      // Unterminated format specifier: copy it out as is.
      result_ += format.substr(spec_start);
    }

    return result_;
  }

private:
  auto next_arg() -> Tawk::Value const*
  {
    if (next_ == args_.size()) {
      return nullptr;
    }
    return &args_[next_++];
  }

  auto next_number() -> Tawk::Floating
  {
    auto const* arg{next_arg()};
    return arg == nullptr ? 0.0 : arg->to_number();
  }

  auto next_string() -> std::string
  {
    auto const* arg{next_arg()};
    return arg == nullptr ? std::string{} : arg->to_string(convfmt_);
  }

  void star_width(FormatState& format_state)
  {
    auto width{next_number()};
    if (width < 0) {
      format_state.left_justified_ = true;
      width = -width;
    }
    format_state.min_width_ =
      static_cast<std::string::size_type>(std::min<Tawk::Floating>(width, max_width));
  }

  /** \brief              Output a string
   *  \param format_state Formatting state
   *  \param s            String to print
   *
   * Prints the string \a s ensuring that it prints at least the minimum width given in the
   * \a format_state and aligning to left or right as appropriate.
   */
  void print_string(FormatState const& format_state, std::string_view s)
  {
    if (s.length() >= format_state.min_width_) {
      result_ += s;
    }
    else if (format_state.left_justified_) {
      result_ += s;
      result_.append(format_state.min_width_ - s.length(), ' ');
    }
    else {
      result_.append(format_state.min_width_ - s.length(), ' ');
      result_ += s;
    }
  }

  /** \brief              Process a %s format specifier.
   *  \param format_state Formatting state
   *  \param s            String to print
   */
  void process_string(FormatState const& format_state, std::string_view s)
  {
    if (format_state.precision_ != -1 &&
        s.length() > static_cast<unsigned int>(format_state.precision_)) {
      print_string(format_state, s.substr(0, format_state.precision_));
    }
    else {
      print_string(format_state, s);
    }
  }

  /** \brief              Process a %c format specifier.
   *  \param format_state Formatting state
   *
   * Numbers print the character with that code, anything else prints its first character.
   */
  void process_char(FormatState const& format_state)
  {
    auto const* arg{next_arg()};
    if (arg == nullptr) {
      print_string(format_state, "");
      return;
    }

    if (arg->kind() == Tawk::Value::Kind::number) {
      auto const code{static_cast<SignedInteger>(arg->to_number())};
      char const ch{static_cast<char>(code)};
      print_string(format_state, std::string_view{&ch, 1});
      return;
    }

    auto const s{arg->to_string(convfmt_)};
    print_string(format_state, std::string_view{s}.substr(0, 1));
  }

  /** \brief                        Print a number
   *  \param format_state           Format specifier state
   *  \param v                      String form of number to print.
   *  \param prefix                 A prefix to put in front of the number (or "" for none).
   *  \param leading_zero_precision If leading zeros are needed, what precision should we use?
   *
   * This handles formatting a number: ensuring it has enough digits, and then delegates to
   * print_string for alignment and width.
   */
  void print_number(FormatState const& format_state, std::string&& v, std::string_view prefix,
                    std::string::size_type leading_zero_precision)
  {
    std::string s(std::move(v));

    /* Do we need to do leading zero justification?  */
    const bool leading_zeroes = format_state.precision_ == -1 && format_state.leading_zeroes_ &&
                                !format_state.left_justified_;
    /* How many digits must we have? */
    std::string::size_type precision =
      format_state.precision_ > -1 ? static_cast<std::string::size_type>(format_state.precision_)
                                   : (leading_zeroes ? leading_zero_precision : 1);

    if (s == "0" && precision == 0) {
      /* Zero precision and a zero value prints nothing. */
      s.clear();
    }
    else if (s.length() < precision) {
      s = std::string(precision - s.length(), '0') + s;
    }

    s = std::string(prefix) + s;
    print_string(format_state, s);
  }

  /** \brief  Print a non-finite number for an integer conversion.  */
  void print_non_finite(FormatState const& format_state, Tawk::Floating f)
  {
    std::string s{std::isnan(f) ? "nan" : "inf"};
    if (std::signbit(f)) {
      s = "-" + s;
    }
    else if (format_state.force_positive_) {
      s = "+" + s;
    }
    print_string(format_state, s);
  }

  /** \brief              Process the %d or %i format specifier
   *  \param format_state Formatting state
   */
  void process_decimal(FormatState const& format_state)
  {
    auto const f{std::trunc(next_number())};
    if (!std::isfinite(f)) {
      print_non_finite(format_state, f);
      return;
    }

    std::string_view sign =
      format_state.force_positive_ ? "+" : (format_state.force_positive_space_ ? " " : "");

    UnsignedInteger magnitude{0};
    if (f < 0) {
      sign = "-";
      magnitude = -f >= static_cast<Tawk::Floating>(std::numeric_limits<UnsignedInteger>::max())
                    ? std::numeric_limits<UnsignedInteger>::max()
                    : static_cast<UnsignedInteger>(-f);
    }
    else {
      magnitude = f >= static_cast<Tawk::Floating>(std::numeric_limits<UnsignedInteger>::max())
                    ? std::numeric_limits<UnsignedInteger>::max()
                    : static_cast<UnsignedInteger>(f);
    }

    std::string::size_type leading_zero_precision =
      sign.empty() ? format_state.min_width_
                   : (format_state.min_width_ > 1 ? format_state.min_width_ - 1 : 1);
    print_number(format_state, fmt::format("{}", magnitude), sign, leading_zero_precision);
  }

  /** \brief              Process the %o, %u, %x, and %X format specifiers
   *  \param format_state Formatting state (may be modified)
   *  \param conversion   Conversion character.
   *
   * Negative values wrap as they do in C.
   */
  void process_unsigned(FormatState& format_state, char conversion)
  {
    auto const f{std::trunc(next_number())};
    if (!std::isfinite(f)) {
      print_non_finite(format_state, f);
      return;
    }

    UnsignedInteger v{0};
    if (f < 0) {
      v = static_cast<UnsignedInteger>(static_cast<SignedInteger>(
        std::max(f, static_cast<Tawk::Floating>(std::numeric_limits<SignedInteger>::min()))));
    }
    else {
      v = f >= static_cast<Tawk::Floating>(std::numeric_limits<UnsignedInteger>::max())
            ? std::numeric_limits<UnsignedInteger>::max()
            : static_cast<UnsignedInteger>(f);
    }

    switch (conversion) {
    case 'o': {
      std::string s{fmt::format("{:o}", v)};
      if ((format_state.precision_ == -1 ||
           static_cast<std::string::size_type>(format_state.precision_) <= s.length()) &&
          format_state.alternative_form_) {
        format_state.precision_ = static_cast<int>(s.length()) + 1;
      }
      print_number(format_state, std::move(s), "", format_state.min_width_);
      break;
    }
    case 'x':
    case 'X': {
      bool const upper{conversion == 'X'};
      bool has_prefix = v != 0 && format_state.alternative_form_;
      std::string_view prefix = !has_prefix ? "" : (upper ? "0X" : "0x");
      std::string::size_type leading_zero_precision =
        !has_prefix ? format_state.min_width_
                    : (format_state.min_width_ > 2 ? format_state.min_width_ - 2 : 1);
      print_number(format_state, upper ? fmt::format("{:X}", v) : fmt::format("{:x}", v), prefix,
                   leading_zero_precision);
      break;
    }
    default:
      print_number(format_state, fmt::format("{}", v), "", format_state.min_width_);
      break;
    }
  }

  /** \brief              Process the floating point format specifiers
   *  \param format_state Formatting state
   *  \param conversion   Conversion character.
   *
   * We build the equivalent {fmt} format specification and let it do the work.
   */
  void process_floating(FormatState const& format_state, char conversion)
  {
    Tawk::Floating const f{next_number()};

    std::string spec{"{:"};
    if (format_state.left_justified_) {
      spec += '<';
    }
    if (format_state.force_positive_) {
      spec += '+';
    }
    else if (format_state.force_positive_space_) {
      spec += ' ';
    }
    if (format_state.alternative_form_) {
      spec += '#';
    }
    if (format_state.leading_zeroes_ && !format_state.left_justified_) {
      spec += '0';
    }
    if (format_state.min_width_ != 0) {
      spec += std::to_string(format_state.min_width_);
    }
    spec += '.';
    spec += std::to_string(format_state.precision_ == -1 ? 6 : format_state.precision_);
    spec += conversion;
    spec += '}';

    result_ += fmt::vformat(spec, fmt::make_format_args(f));
  }

  std::vector<Tawk::Value> const& args_;  ///< Arguments
  std::string_view convfmt_;              ///< CONVFMT for %s of numbers.
  std::vector<Tawk::Value>::size_type next_{0};  ///< Next argument to use.
  std::string result_;                           ///< Result being built.
};
}  // namespace

auto Tawk::format_number(Floating f, std::string_view fmt) -> std::string
{
  constexpr auto long_min{static_cast<Floating>(std::numeric_limits<long>::min())};  // NOLINT
  if (std::isfinite(f) && f == std::trunc(f) && f >= long_min && f < -long_min) {
    return std::to_string(static_cast<long>(f));  // NOLINT(google-runtime-int)
  }

  return format_printf(fmt, std::vector<Value>{Value{f}}, "%.6g");
}

auto Tawk::format_printf(std::string_view format, std::vector<Value> const& args,
                         std::string_view convfmt) -> std::string
{
  Printf formatter{args, convfmt};
  return formatter.process(format);
}
