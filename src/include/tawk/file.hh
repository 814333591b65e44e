/** \file   include/tawk/file.hh
 *  \brief  File utilities
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#ifndef TAWK_FILE_HH_INCLUDED
#define TAWK_FILE_HH_INCLUDED

#include "util-messages.hh"

#include <cstdio>
#include <string>
#include <string_view>

namespace Tawk {

/** \brief  Simple wrapper around FILE*, for reading.
 *
 * We use this instead of std::istream, so that we can avoid some locale dependencies, and also
 * to handle the "-" maps to standard input magic.
 */
class StreamInputFile
{
public:
  /** \brief  Whether errors are written to standard error as well as being flagged.  */
  enum class Errors { report, quiet };

  /** \brief          Constructor
   *  \param filename Name of file to open, '-' for stdin.
   *  \param mode     Mode to open file in, default read-only text.
   *  \param errors   Should errors be reported?
   *
   * Reports an error if we can't open the file, error() will then return true.
   */
  explicit StreamInputFile(std::string_view filename, std::string_view mode = "r",
                           Errors errors = Errors::report);

  /** \brief Destructor
   *
   * Will close the open file if we're not stdin.
   */
  ~StreamInputFile();

  StreamInputFile(StreamInputFile const&) = delete;
  auto operator=(StreamInputFile const&) -> StreamInputFile& = delete;
  StreamInputFile(StreamInputFile&&) = delete;
  auto operator=(StreamInputFile&&) -> StreamInputFile& = delete;

  /** \brief  Get the next character in the stream.
   *  \return EOF on end-of-file or error.
   *
   * Reports an error if we can't read from the file.
   */
  auto getc() -> int;

  /** \brief  Is the error flag set on the stream?
   *  \return \c true if the error flag is set.
   */
  [[nodiscard]] auto error() const -> bool;

  /** \brief  Is the EOF flag set on the stream?
   *  \return \c true iff the end-of-file flag is set.
   */
  [[nodiscard]] auto eof() const -> bool;

  /** \brief  Get the printable name of the file.  */
  [[nodiscard]] auto filename() const -> std::string_view;

private:
  using Msg = Tawk::Util::Msg;

  /** \brief     Report an error on the stream.
   *  \param msg Message ID
   */
  void report_error(Msg msg);

  std::string filename_;   ///< File name.
  FILE* file_{nullptr};    ///< File handle.
  bool is_stdin_{false};   ///< Is the File handle standard input?
  bool has_error_{false};  ///< Have we reported an error?
  Errors errors_;          ///< Do errors get written to standard error?
};

}  // namespace Tawk

#endif  // TAWK_FILE_HH_INCLUDED
