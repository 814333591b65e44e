/** \file   format.hh
 *  \brief  printf style formatting of tawk values
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef SRC_TAWK_FORMAT_HH_INCLUDED
#define SRC_TAWK_FORMAT_HH_INCLUDED

#include <string>
#include <string_view>
#include <vector>

#include "value.hh"

namespace Tawk {

/** \brief         Format a number as a string.
 *  \param  f      Number to format
 *  \param  fmt    printf format to use for non-integral values (CONVFMT or OFMT).
 *  \return        Formatted number
 *
 * Integral values which fit in a long are always printed as integers.
 */
auto format_number(Floating f, std::string_view fmt) -> std::string;

/** \brief         Format \a args according to the printf format string \a format.
 *  \param  format  Format string
 *  \param  args    Arguments.  Missing arguments format as empty strings or zero.
 *  \param  convfmt Format for converting numbers to strings for %s.
 *  \return         Formatted string.
 *
 * Supports the conversions c, d, i, o, x, X, u, e, E, f, F, g, G, s, and %, with the flags '-',
 * '+', ' ', '#', and '0', a width, and a precision.  Width and precision may be given as '*'.
 * Length modifiers are accepted and ignored.  An unrecognised conversion is copied to the output.
 */
auto format_printf(std::string_view format, std::vector<Value> const& args,
                   std::string_view convfmt) -> std::string;

}  // namespace Tawk

#endif  // SRC_TAWK_FORMAT_HH_INCLUDED
