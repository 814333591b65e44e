/** \file   execute.hh
 *  \brief  Running tawk programs
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef SRC_TAWK_EXECUTE_HH_INCLUDED
#define SRC_TAWK_EXECUTE_HH_INCLUDED

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "foreign.hh"
#include "program.hh"
#include "tawk.hh"
#include "value.hh"

namespace Tawk {

namespace Details {
class ExecutionState;
}  // namespace Details

/** \brief  Runs a parsed program.
 *
 * An interpreter runs its program once.  Fatal errors are reported by throwing a Tawk::Error,
 * output written before the error stays written.
 */
class Interpreter
{
public:
  /** \brief          Constructor
   *  \param  program Program to run.  Must outlive the interpreter.
   *  \param  out     Standard output.
   *  \param  foreign Foreign functions available to the program.
   */
  Interpreter(Program const& program, std::ostream& out, ForeignFunctionRegistry& foreign);
  ~Interpreter();
  Interpreter(Interpreter const&) = delete;
  Interpreter(Interpreter&&) noexcept = delete;
  auto operator=(Interpreter const&) -> Interpreter& = delete;
  auto operator=(Interpreter&&) noexcept -> Interpreter& = delete;

  /** \brief             Process a -v style assignment before the program runs.
   *  \param  assignment Text of the form name=value.
   *  \return            \c false if \a assignment is not an assignment.
   */
  auto assign(std::string const& assignment) -> bool;

  /** \brief           Run the program with main input taken from the operands.
   *  \param  operands Files and var=value assignments, becoming ARGV[1]...
   *  \return          Exit status.
   */
  auto run(std::vector<std::string> const& operands) -> int;

  /** \brief        Run the program with main input read from \a input.
   *  \param  input Reader for main input.
   *  \return       Exit status.
   */
  auto run(std::unique_ptr<Reader> input) -> int;

  /** \brief  Get the value of global variable \a name.  */
  [[nodiscard]] auto global(std::string const& name) const -> Value;

  /** \brief  Get the global array \a name, or nullptr if it isn't an array.  */
  [[nodiscard]] auto global_array(std::string const& name) const -> Array const*;

private:
  std::unique_ptr<Details::ExecutionState> state_;  ///< Run time state.
};

}  // namespace Tawk

#endif  // SRC_TAWK_EXECUTE_HH_INCLUDED
