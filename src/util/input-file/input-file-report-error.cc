/** \file   src/util/input-file/input-file-report-error.cc
 *  \brief  Report an error
 *  \author Copyright 2021, Matthew Grett-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#include "tawk/file.hh"
#include "tawk/utils.hh"

#include "util-internals.hh"
#include "util-messages.hh"

#include <cerrno>
#include <cstring>

void Tawk::StreamInputFile::report_error(Tawk::Util::Msg msg)
{
  int const saved_errno{errno};
  has_error_ = true;
  if (errors_ == Errors::quiet) {
    return;
  }
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  Tawk::Util::message(msg, filename_, saved_errno, std::strerror(saved_errno));
}
