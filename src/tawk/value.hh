/** \file   value.hh
 *  \brief  tawk values and arrays
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef SRC_TAWK_VALUE_HH_INCLUDED
#define SRC_TAWK_VALUE_HH_INCLUDED

#include "tawk/utils.hh"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "tawk.hh"

namespace Tawk {

/** \brief  A scalar value.
 *
 * A value is uninitialized, a string, a number, or a strnum.  A strnum is text which came from
 * input and which looks like a number: it keeps both the text and the numeric value, and compares
 * numerically.
 */
class Value
{
public:
  enum class Kind { uninit, string, number, strnum };

  /** \brief  Construct an uninitialized value.  */
  Value() = default;

  /** \brief  Construct a number.  */
  explicit Value(Floating f);

  /** \brief  Construct a string.  */
  explicit Value(std::string s);

  /** \brief  Construct a string.  */
  explicit Value(char const* s);

  /** \brief   Construct a value from input text.
   *  \param s Text
   *  \return  A strnum if the whole of \a s looks like a number, otherwise a string.
   */
  static auto strnum_candidate(std::string s) -> Value;

  /** \brief  Get the kind of value.  */
  [[nodiscard]] auto kind() const noexcept -> Kind;

  /** \brief  Is the value uninitialized?  */
  [[nodiscard]] auto is_uninit() const noexcept -> bool;

  /** \brief  Is this a number, strnum, or uninitialized?  These compare numerically.  */
  [[nodiscard]] auto is_numeric() const noexcept -> bool;

  /** \brief  Get the numeric value.  Strings use their leading numeric prefix.  */
  [[nodiscard]] auto to_number() const -> Floating;

  /** \brief         Get the string value.
   *  \param convfmt Format to use for non-integral numbers.
   */
  [[nodiscard]] auto to_string(std::string_view convfmt) const -> std::string;

  /** \brief  Get the truth value.  */
  [[nodiscard]] auto to_bool() const -> bool;

private:
  struct StrNum
  {
    std::string text;  ///< Text as read.
    Floating number;   ///< Numeric value of text.
  };

  std::variant<std::monostate, std::string, Floating, StrNum> value_;
};

/** \brief         Compare two values.
 *  \param convfmt Format to use when converting numbers to strings.
 *  \return        Negative, zero or positive as \a lhs is less than, equal to or greater than
 *                 \a rhs.
 *
 * Comparison is numeric if both values are numbers, strnums, or uninitialized.  Otherwise it is
 * a byte-wise comparison of the string values.
 */
auto compare(Value const& lhs, Value const& rhs, std::string_view convfmt) -> int;

/** \brief    Parse the numeric prefix of \a s.
 *  \return   Value of the longest numeric prefix after leading blanks, or 0 if there is none.
 */
auto parse_number_prefix(std::string_view s) -> Floating;

/** \brief   Does the whole of \a s (ignoring surrounding blanks) look like a number?
 *  \return  The number if so.
 */
auto parse_number(std::string_view s) -> std::optional<Floating>;

/** \brief  An associative array, indexed by strings.  Iterates in subscript order.  */
class Array
{
public:
  using Elements = std::map<std::string, Value>;

  /** \brief  Get the element \a key, creating it if it doesn't exist.  */
  auto ensure(std::string const& key) -> Value&;

  /** \brief  Does element \a key exist?  Never creates it.  */
  [[nodiscard]] auto contains(std::string const& key) const -> bool;

  /** \brief  Remove element \a key, if it exists.  */
  void erase(std::string const& key);

  /** \brief  Remove all elements.  */
  void clear() noexcept;

  /** \brief  Number of elements.  */
  [[nodiscard]] auto size() const noexcept -> std::size_t;

  /** \brief  Snapshot of the subscripts, in iteration order.  */
  [[nodiscard]] auto keys() const -> std::vector<std::string>;

  [[nodiscard]] auto elements() const noexcept -> Elements const&;

private:
  Elements elements_;  ///< Elements
};

}  // namespace Tawk

#endif  // SRC_TAWK_VALUE_HH_INCLUDED
