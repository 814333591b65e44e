/** \file   src/util/input-file/input-file-queries.cc
 *  \brief  Basic queries for StreamInputFile
 *  \author Copyright 2021, Matthew Grett-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <string_view>

#include "tawk/file.hh"

auto Tawk::StreamInputFile::error() const -> bool
{
  return has_error_ || file_ == nullptr || (std::ferror(file_) != 0);
}

auto Tawk::StreamInputFile::eof() const -> bool
{
  return file_ == nullptr || (std::feof(file_) != 0);
}

auto Tawk::StreamInputFile::filename() const -> std::string_view { return filename_; }
