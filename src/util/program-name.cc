/** \file   src/util/program-name.cc
 *  \brief  Program name management.
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */
#include "tawk/utils.hh"

#include <libgen.h>

#include <string>
#include <string_view>

namespace {
/** Manage the Program Name.
 */
class ProgramName
{
public:
  /** Get the static program name object.  */
  static auto get() -> ProgramName&
  {
    static ProgramName pn;
    return pn;
  }

  /** \brief Get the program name.
   */
  [[nodiscard]] auto program_name() const noexcept -> std::string_view { return name_; }

  /** \brief Set the program name.
   *
   * basename() may alter the parameter it is passed, or return a pointer to static data.  So we
   * copy both the input and the output.
   *
   * We don't fail - setting the program name to the input string if basename gives us nothing.
   */
  void program_name(std::string_view argv0)
  {
    std::string n(argv0);
    name_ = ::basename(n.data());  // NOLINT(concurrency-mt-unsafe)
    if (name_.empty()) {
      name_ = argv0;
    }
  }

private:
  ProgramName() noexcept = default;  // NOLINT(bugprone-exception-escape)

  std::string name_{"tawk"};
};
}  // namespace

auto Tawk::program_name() noexcept -> std::string_view
{
  return ProgramName::get().program_name();
}

void Tawk::program_name(std::string_view argv0) { ProgramName::get().program_name(argv0); }
