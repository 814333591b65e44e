/** \file   src/util/util-internals.hh
 *  \brief  Helpers shared by the util library implementation.
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#ifndef SRC_UTIL_UTIL_INTERNALS_HH_INCLUDED
#define SRC_UTIL_UTIL_INTERNALS_HH_INCLUDED

#include "tawk/utils.hh"

#include "util-messages.hh"

#include <iostream>

namespace Tawk::Util {

/** \brief       Write a diagnostic prefixed by the program name to standard error.
 *  \param  msg  Message ID
 *  \param  args Arguments for the message.
 */
template<typename... Ts>
void message(Msg msg, Ts const&... args)
{
  std::cerr << Tawk::program_name() << ": "
            << Tawk::Util::Messages::get().format(Tawk::Util::Set::util, msg, args...) << '\n';
}

}  // namespace Tawk::Util

#endif  // SRC_UTIL_UTIL_INTERNALS_HH_INCLUDED
