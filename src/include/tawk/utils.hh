/** \file   include/tawk/utils.hh
 *  \brief  General utilities
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#ifndef TAWK_UTILS_HH
#define TAWK_UTILS_HH

#include <string_view>
#include <utility>

namespace Tawk {
/** \brief       Set the program name.
 *  \param argv0 argv[0].
 */
void program_name(std::string_view argv0);

/** \brief  Get the program name.
 *  \return Program name.
 */
auto program_name() noexcept -> std::string_view;

/** \brief     Class to provide 'overloaded' lambdas.
 *  \tparam Ts Lambdas to combine
 *
 * This is often used in std::visit calls, for example:
 *
 * \code
 * std::visit(Overloaded{
 *                       [](std::monostate) { return Kind::uninit; },
 *                       [](Floating) { return Kind::number; },
 *                       [](std::string const&) { return Kind::string; },
 *                      }, value_);
 * \endcode
 */
template<class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};

// Template guide.
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/** \brief Helper to wrap types when we need to differentiate between the same underlying type.
 */
template<typename T, typename TId = T>
class TypeWrapper
{
public:
  using underlying_type = T;

  explicit TypeWrapper(T t) : t_(std::move(t)) {}

  template<typename Arg>
  explicit TypeWrapper(Arg arg) : t_(T(arg))
  {
  }

  auto get() -> T& { return t_; }
  [[nodiscard]] auto get() const -> T const& { return t_; }

private:
  T t_;
};

}  // namespace Tawk
#endif  // TAWK_UTILS_HH
