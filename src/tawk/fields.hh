/** \file   fields.hh
 *  \brief  tawk record and field handling
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef SRC_TAWK_FIELDS_HH_INCLUDED
#define SRC_TAWK_FIELDS_HH_INCLUDED

#include <map>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "tawk.hh"
#include "value.hh"

namespace Tawk::Details {

/** \brief  Cache of compiled dynamic regular expressions, keyed by their text.  */
class RegexCache
{
public:
  RegexCache() = default;
  ~RegexCache() = default;
  RegexCache(RegexCache const&) = delete;
  RegexCache(RegexCache&&) noexcept = delete;
  auto operator=(RegexCache const&) -> RegexCache& = delete;
  auto operator=(RegexCache&&) noexcept -> RegexCache& = delete;

  /** \brief      Get the compiled form of \a ere.
   *  \param  ere Expression text
   *  \param  loc Location to report errors against.
   *  \return     Compiled expression.
   *
   * Throws TypeError if \a ere is not a valid expression.
   */
  auto get(std::string const& ere, Location const& loc) -> std::regex const&;

private:
  std::map<std::string, std::regex> cache_;  ///< Compiled expressions.
};

/** \brief  The current record, and its fields.
 *
 * $0 and $1...$NF are kept consistent: setting $0 re-splits the fields, and setting a field or NF
 * rebuilds $0.
 */
class Fields
{
public:
  explicit Fields(RegexCache& regexes);
  ~Fields() = default;
  Fields(Fields const&) = delete;
  Fields(Fields&&) noexcept = delete;
  auto operator=(Fields const&) -> Fields& = delete;
  auto operator=(Fields&&) noexcept -> Fields& = delete;

  /** \brief            Set $0 and split it into fields.
   *  \param  record    Record text.
   *  \param  fs        Field separator to use.
   *  \param  paragraph Are we in paragraph mode (newline always separates fields)?
   *  \param  loc       Location to report an invalid \a fs against.
   */
  void set_record(std::string record, std::string const& fs, bool paragraph, Location const& loc);

  /** \brief  Get $i.  Fields beyond NF are uninitialized.  */
  [[nodiscard]] auto field(std::size_t i) const -> Value;

  /** \brief            Set $i.
   *  \param  i         Field index.
   *  \param  v         Value to store.
   *  \param  fs        Field separator (used when i == 0).
   *  \param  ofs       Output field separator (used when i > 0).
   *  \param  convfmt   Conversion format for numbers.
   *  \param  paragraph Are we in paragraph mode?
   *  \param  loc       Location to report an invalid \a fs against.
   *
   * Setting a field beyond NF grows NF, padding with empty fields.
   */
  void field(std::size_t i, Value const& v, std::string const& fs, std::string const& ofs,
             std::string_view convfmt, bool paragraph, Location const& loc);

  /** \brief  Get NF.  */
  [[nodiscard]] auto nf() const noexcept -> std::size_t;

  /** \brief          Set NF, truncating or padding with empty fields, and rebuild $0.
   *  \param  n       New number of fields
   *  \param  ofs     Output field separator.
   *  \param  convfmt Conversion format for numbers.
   */
  void nf(std::size_t n, std::string const& ofs, std::string_view convfmt);

  /** \brief                    Split \a s using the field separator \a fs.
   *  \param  s                 String to split.
   *  \param  fs                Field separator.
   *  \param  newline_separates Is newline always a separator (paragraph mode)?
   *  \param  loc               Location to report an invalid \a fs against.
   *  \return                   Fields.
   *
   * " " splits on runs of blanks and newlines, ignoring leading and trailing ones.  Any other
   * single character is matched literally.  Anything longer is an ERE.  Empty matches never split.
   * An empty string has no fields.
   */
  auto split(std::string const& s, std::string const& fs, bool newline_separates,
             Location const& loc) -> std::vector<std::string>;

private:
  void rebuild_record(std::string const& ofs, std::string_view convfmt);

  static void split_space(std::string const& s, std::vector<std::string>& result);
  static void split_char(std::string const& s, char fs, bool newline_separates,
                         std::vector<std::string>& result);
  static void split_regex(std::string const& s, std::regex const& re,
                          std::vector<std::string>& result);

  RegexCache& regexes_;       ///< Regex cache for FS.
  std::vector<Value> fields_;  ///< $0, $1, ..., $NF.
};

}  // namespace Tawk::Details

#endif  // SRC_TAWK_FIELDS_HH_INCLUDED
