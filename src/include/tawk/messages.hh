/** \file   include/tawk/messages.hh
 *  \brief  Messages utility classes and functions
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#ifndef TAWK_MESSAGES_HH
#define TAWK_MESSAGES_HH

#include <fmt/format.h>

#include <nl_types.h>

#include <array>
#include <string>
#include <string_view>

namespace Tawk {

/** \brief       Message catalogue template class
 *  \tparam Data Data structure.  See below for required members.
 *
 * This class provides the infrastructure to manage i18n messages for a component.  It is
 * configured by the \a Data structure template parameter, which is generated by
 * scripts/gen-messages.py from the component's .messages.json file.
 *
 * Construct the class after calling <tt>::setlocale(LC_ALL, "")</tt> in the main function.
 *
 * \subsection Data structure
 *
 *  - \c SetEnum: Enumeration class giving the list of sets in the catalogue.
 *  - \c MessageEnum: Enumeration class giving the list of messages in the catalogue.
 *  - \c catalogue_: Castable to <tt>const char*</tt>.  Contains the root name of the message
 *    catalogue on disk.
 *  - \c default_set_: Of type \c Data::SetEnum.  Default set to use when none is provided.
 *  - \c messages_: Can be viewed as of type <tt>const char*[][]</tt>.  The first index is to the
 *    set ID, the second is to the message ID.  The string is the default "C" locale message for
 *    that (set, message) tuple.  As there is no set or message 0 the indexing is offset by one.
 */
template<typename Data>
class MessageCatalogue : private Data
{
public:
  /** \brief  Destructor.  */
  ~MessageCatalogue()
  {
    if (catd_ != reinterpret_cast<nl_catd>(-1)) {  // NOLINT
      ::catclose(catd_);
    }
  }

  MessageCatalogue(MessageCatalogue const&) = delete;
  auto operator=(MessageCatalogue const&) -> MessageCatalogue& = delete;
  MessageCatalogue(MessageCatalogue&&) = delete;
  auto operator=(MessageCatalogue&&) -> MessageCatalogue& = delete;

  /** \brief  Get the one instance of this class.
   *  \return Reference to the catalogue.
   */
  static auto get() -> MessageCatalogue const&
  {
    static MessageCatalogue const the_messages;
    return the_messages;
  }

  /** \brief      Get a string_view of the message associated with \a msg in the default set.
   *  \param  msg Message ID.
   *  \return     Message
   */
  [[nodiscard]] auto get(typename Data::MessageEnum msg) const noexcept -> std::string_view
  {
    return get(Data::default_set_, msg);
  }

  /** \brief      Get a string_view of the message associated with (\a set, \a msg) pair.
   *  \param  set Set ID
   *  \param  msg Message ID.
   *  \return     Message
   *
   * This function is not necessarily thread safe, and future calls to any \c MessageCatalogue
   * function may invalidate the returned string view.
   */
  [[nodiscard]] auto get(typename Data::SetEnum set, typename Data::MessageEnum msg) const noexcept
    -> std::string_view
  {
    auto val =
      Data::messages_.at(static_cast<std::size_t>(set) - 1)[static_cast<std::size_t>(msg) - 1];
    if (catd_ == reinterpret_cast<nl_catd>(-1)) {  // NOLINT
      return val;
    }

    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    char* p = ::catgets(catd_, static_cast<int>(set), static_cast<int>(msg), val);
    return {p};
  }

  /** \brief       Format the message with message ID \a msg in the default set.
   *  \param  msg  Message ID.
   *  \param  args Arguments for the formatter
   *  \return      Formatted message
   */
  template<typename... Ts>
  [[nodiscard]] auto format(typename Data::MessageEnum msg, Ts const&... args) const
    -> std::string
  {
    return format(Data::default_set_, msg, args...);
  }

  /** \brief       Format the message with ID pair (\a set, \a msg).
   *  \param  set  Set ID
   *  \param  msg  Message ID.
   *  \param  args Arguments for the formatter
   *  \return      Formatted message
   *
   * Catalogue texts are only known at runtime, so we go through fmt::vformat.
   */
  template<typename... Ts>
  [[nodiscard]] auto format(typename Data::SetEnum set, typename Data::MessageEnum msg,
                            Ts const&... args) const -> std::string
  {
    return fmt::vformat(get(set, msg), fmt::make_format_args(args...));
  }

private:
  /** \brief  Default constructor.  */
  MessageCatalogue() : catd_(::catopen(Data::catalogue_, NL_CAT_LOCALE)) {}

  nl_catd catd_;  ///< Message catalogue handle.
};

}  // namespace Tawk

#endif  // TAWK_MESSAGES_HH
