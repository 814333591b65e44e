/** \file   foreign.hh
 *  \brief  Foreign functions callable from tawk programs
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef SRC_TAWK_FOREIGN_HH_INCLUDED
#define SRC_TAWK_FOREIGN_HH_INCLUDED

#include <cstddef>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tawk.hh"
#include "value.hh"

namespace Tawk {

/** \brief  A function implemented outside of tawk.
 *
 * Implementations report failure by throwing ForeignCallError, and misuse (such as the wrong
 * number of arguments) by throwing TypeError.
 */
class ForeignFunction
{
public:
  ForeignFunction() = default;
  virtual ~ForeignFunction() = default;
  ForeignFunction(ForeignFunction const&) = delete;
  ForeignFunction(ForeignFunction&&) noexcept = delete;
  auto operator=(ForeignFunction const&) -> ForeignFunction& = delete;
  auto operator=(ForeignFunction&&) noexcept -> ForeignFunction& = delete;

  /** \brief       Call the function.
   *  \param  args Arguments, converted to strings.
   *  \return      Result.
   */
  virtual auto invoke(std::vector<std::string> const& args) -> std::string = 0;
};

/** \brief  Foreign function wrapping a callable.  */
class FunctionAdapter final : public ForeignFunction
{
public:
  using Function = std::function<std::string(std::vector<std::string> const&)>;

  explicit FunctionAdapter(Function fn);

  auto invoke(std::vector<std::string> const& args) -> std::string override;

private:
  Function fn_;  ///< Function to call.
};

/** \brief  Registry of foreign functions.  */
class ForeignFunctionRegistry
{
public:
  /** \brief              Constructor
   *  \param  diagnostics Stream to write warnings to.
   */
  explicit ForeignFunctionRegistry(std::ostream& diagnostics = std::cerr);
  ~ForeignFunctionRegistry() = default;
  ForeignFunctionRegistry(ForeignFunctionRegistry const&) = delete;
  ForeignFunctionRegistry(ForeignFunctionRegistry&&) noexcept = delete;
  auto operator=(ForeignFunctionRegistry const&) -> ForeignFunctionRegistry& = delete;
  auto operator=(ForeignFunctionRegistry&&) noexcept -> ForeignFunctionRegistry& = delete;

  /** \brief  Register \a fn as \a name, replacing any previous registration.
   *
   * A replaced function lives on for as long as something that resolved it holds on to it.
   */
  void add(std::string const& name, std::unique_ptr<ForeignFunction> fn);

  /** \brief  Register the callable \a fn as \a name.  */
  void add(std::string const& name, FunctionAdapter::Function fn);

  /** \brief  Find the function \a name, or return nullptr.  */
  [[nodiscard]] auto resolve(std::string const& name) const -> std::shared_ptr<ForeignFunction>;

  /** \brief          Call a foreign function.
   *  \param  fn      Function to call.
   *  \param  name    Name it was called by.
   *  \param  args    Arguments
   *  \param  loc     Location of the call.
   *  \param  convfmt Format to convert numeric arguments with.
   *  \return         Result as a strnum candidate, or "" if the function failed.
   *
   * A failure of the function is reported as a warning and is not fatal.  A TypeError is
   * rethrown with the location of the call.
   */
  auto call(ForeignFunction& fn, std::string const& name, std::vector<Value> const& args,
            Location const& loc, std::string_view convfmt) -> Value;

private:
  std::ostream& diagnostics_;                                          ///< Warning stream.
  std::map<std::string, std::shared_ptr<ForeignFunction>> functions_;  ///< Functions.
};

/** \brief  Provider of natural language completions.  */
class TextProvider
{
public:
  TextProvider() = default;
  virtual ~TextProvider() = default;
  TextProvider(TextProvider const&) = delete;
  TextProvider(TextProvider&&) noexcept = delete;
  auto operator=(TextProvider const&) -> TextProvider& = delete;
  auto operator=(TextProvider&&) noexcept -> TextProvider& = delete;

  /** \brief             Complete \a prompt.
   *  \param  prompt     Prompt
   *  \param  max_tokens Maximum length of answer, in tokens.
   *  \return            Answer, or std::nullopt if no answer is available.
   *
   * Implementations must bound their own latency.
   */
  virtual auto complete(std::string const& prompt, std::size_t max_tokens)
    -> std::optional<std::string> = 0;
};

/** \brief  Offline provider, answering with keyword heuristics.  */
class SimulatedProvider final : public TextProvider
{
public:
  SimulatedProvider() = default;

  auto complete(std::string const& prompt, std::size_t max_tokens)
    -> std::optional<std::string> override;
};

/** \brief           Register the ai_* text analysis functions.
 *  \param registry  Registry to add to.
 *  \param provider  Provider used to answer prompts.
 */
void register_text_functions(ForeignFunctionRegistry& registry,
                             std::shared_ptr<TextProvider> provider);

}  // namespace Tawk

#endif  // SRC_TAWK_FOREIGN_HH_INCLUDED
