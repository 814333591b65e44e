/** \file  src/util/input-file/input-file-constructor.cc
 *  \brief Constructors for StreamInputFile
 *  \author Copyright 2021, Matthew Grett-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */
#include "tawk/file.hh"

#include "util-messages.hh"

#include <cstdio>
#include <string>

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
Tawk::StreamInputFile::StreamInputFile(std::string_view filename, std::string_view mode,
                                       Errors errors)
    : filename_(filename), errors_(errors)
{
  if (filename_ == "-") {
    filename_ = Tawk::Util::Messages::get().get(Tawk::Util::Set::util, Msg::stdin_name);
    is_stdin_ = true;
    file_ = stdin;
    return;
  }

  std::string const mode_str(mode);
  file_ = std::fopen(filename_.c_str(), mode_str.c_str());
  if (file_ == nullptr) {
    report_error(Msg::file_open_error);
  }
}

Tawk::StreamInputFile::~StreamInputFile()
{
  if (!is_stdin_ && file_ != nullptr) {
    // Too late to do anything if this goes wrong now.
    (void)std::fclose(file_);
  }
}
