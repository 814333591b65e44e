/** \file   tawk.hh
 *  \brief  Header file for tawk: tokens, readers, lexer, and errors.
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#ifndef SRC_TAWK_TAWK_HH_INCLUDED
#define SRC_TAWK_TAWK_HH_INCLUDED

#include "tawk/file.hh"
#include "tawk/utils.hh"

#include "tawk-messages.hh"

#include <fmt/format.h>

#include <cstdio>
#include <iosfwd>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Tawk {

/** Internal type to differentiate a name.  */
using Name = TypeWrapper<std::string, struct NameTag>;

/** Internal type to differentiate an ERE.  */
using ERE = TypeWrapper<std::string, struct ERETag>;

/** Internal type to differentiate a function name.  */
using FuncName = TypeWrapper<std::string, struct FuncNameTag>;

/** What we use to represent an integer
 *
 * POSIX says that we should treat 'integers' as signed longs.  Even though this means different
 * behaviours on LP64 and LLP64 systems.
 */
using Integer = TypeWrapper<signed long, struct IntegerTag>;  // NOLINT(google-runtime-int)

/** What we use to represent a floating point number: */
using Floating = double;

/** \brief  A source location.  */
class Location  // NOLINT(bugprone-exception-escape)
{
public:
  using Column = unsigned;
  using Line = unsigned;

  /** \brief  Construct a source location at the first column of the first line of a file.
   *  \param file_name Name of file being processed.
   */
  explicit Location(std::string_view file_name);

  /** \brief Location constructor.  */
  Location(std::string_view file_name, Line line, Column column);

  /** Get file name. */
  [[nodiscard]] auto file_name() const -> std::string const&;

  /** Get column.  */
  [[nodiscard]] auto column() const -> Column;

  /** Get line.  */
  [[nodiscard]] auto line() const -> Line;

  /** \brief Move to next column.
   *
   * We silently saturate to the maximum value of Column.
   */
  void next_column();

  /** \brief Move to next line, and reset column to 1.
   *
   * We silently saturate to the maximum value of Line.
   */
  void next_line();

private:
  std::string file_name_;  ///< File name
  Column column_;          ///< Column number
  Line line_;              ///< Line number
};

auto operator<<(std::ostream& os, Location const& location) -> std::ostream&;

auto operator==(Location const& lhs, Location const& rhs) -> bool;
auto operator!=(Location const& lhs, Location const& rhs) -> bool;

/** \brief  Base class of all fatal tawk errors.
 *
 * what() is the message text, location() where it happened.  An error raised away from any source
 * text has a location with an empty file name.
 */
class Error : public std::runtime_error
{
public:
  Error(Location location, std::string const& msg);

  /** Get the location the error was raised at.  */
  [[nodiscard]] auto location() const noexcept -> Location const&;

private:
  Location location_;  ///< Location of error.
};

/** \brief  Error found while tokenizing the program.  */
class LexError : public Error
{
public:
  using Error::Error;
};

/** \brief  Error found while parsing the program.  */
class ParseError : public Error
{
public:
  using Error::Error;
};

/** \brief  Undeclared function, misuse of an array as a scalar (or vice versa).  */
class NameError : public Error
{
public:
  using Error::Error;
};

/** \brief  Invalid conversion or argument at runtime.  */
class TypeError : public Error
{
public:
  using Error::Error;
};

/** \brief  Unreadable input or unwritable output.  */
class RuntimeIOError : public Error
{
public:
  using Error::Error;
};

/** \brief  Failure of a foreign function.  Caught by the registry, never fatal.  */
class ForeignCallError : public Error
{
public:
  explicit ForeignCallError(std::string const& msg);
};

/** \brief  Token type.
 *
 * Very basic token type stores type along with any extra info needed, and the location the
 * token started at.
 */
class Token
{
public:
  /** \brief  Enum listing builtin functions. */
  enum class BuiltinFunc {
    atan2,
    close,
    cos,
    exp,
    fflush,
    gsub,
    index,
    int_,
    length,
    log,
    match,
    rand,
    sin,
    split,
    sprintf,
    sqrt,
    srand,
    sub,
    substr,
    system,
    tolower,
    toupper,
  };

  /** \brief  Enum listing token types.  */
  enum class Type {
    error,
    eof,
    newline,
    name,
    func_name,
    builtin_func_name,
    string,
    floating,
    integer,
    ere,
    begin,
    break_,
    continue_,
    delete_,
    do_,
    else_,
    end,
    exit,
    for_,
    function,
    getline,
    if_,
    in,
    next,
    nextfile,
    print,
    printf,
    return_,
    while_,
    add_assign,
    sub_assign,
    mul_assign,
    div_assign,
    mod_assign,
    pow_assign,
    or_,
    and_,
    no_match,
    eq,
    le,
    ge,
    ne,
    incr,
    decr,
    append,
    lbrace,
    rbrace,
    lparens,
    rparens,
    lsquare,
    rsquare,
    comma,
    semicolon,
    add,
    subtract,
    multiply,
    divide,
    modulo,
    power,
    not_,
    greater_than,
    less_than,
    pipe,
    query,
    colon,
    tilde,
    dollar,
    assign,
  };

  /** \brief      Construct a token of basic type
   *  \param type Token type
   */
  explicit Token(Type type);

  /** \brief      Construct a token of type Type::name, Type::func_name, Type::ere, Type::string,
   *              or Type::error.
   *  \param type Token type
   *  \param s    Value of name or string
   */
  Token(Type type, std::string const& s);

  /** \brief  Construct a token of Type::builtin_func.
   *  \param type Token type (Builtin_func)
   *  \param func Builtin function
   */
  Token(Type type, BuiltinFunc func);

  /** @brief         Construct a token of Type::integer
   *  @param type    Type::integer
   *  @param integer Integer to store
   */
  Token(Type type, Integer integer);

  /** @brief          Construct a token of Type::floating
   *  @param type     Type::floating
   *  @param floating Floating point number to store
   */
  Token(Type type, Floating floating);

  /** \brief Get token type.  */
  [[nodiscard]] auto type() const -> Type;

  /** \brief  Get name stored in token. */
  [[nodiscard]] auto name() const -> std::string const&;

  /** \brief  Get the function name stored in token. */
  [[nodiscard]] auto func_name() const -> std::string const&;

  /** \brief  Get the ERE name stored in token. */
  [[nodiscard]] auto ere() const -> std::string const&;

  /** \brief  Get integer number stored in token. */
  [[nodiscard]] auto integer() const -> Integer;

  /** \brief  Get floating-point number stored in token. */
  [[nodiscard]] auto floating() const -> Floating;

  /** \brief  Get the numeric value of an integer or floating token. */
  [[nodiscard]] auto number() const -> Floating;

  /** \brief  Get string stored in token. */
  [[nodiscard]] auto string() const -> std::string const&;

  /** \brief  Get the error message.  */
  [[nodiscard]] auto error() const -> std::string const&;

  /** \brief  Get the builtin function type.  */
  [[nodiscard]] auto builtin_func_name() const -> BuiltinFunc;

  /** \brief  Get the location the token starts at.  */
  [[nodiscard]] auto location() const -> Location const&;

  /** \brief  Set the location the token starts at.  */
  void location(Location const& location);

private:
  /** Internal type to hold an error string and differentiate it from string and number.  */
  using ErrorMsg = TypeWrapper<std::string, struct ErrorIntType>;

  /** The value of this token.  */
  std::variant<Type, BuiltinFunc, std::string, Name, ERE, FuncName, Integer, Floating, ErrorMsg>
    value_;
  Location location_{std::string_view{}};  ///< Where the token starts.
};

/** \brief Output operator for token type.  */
auto operator<<(std::ostream& os, Token::Type t) -> std::ostream&;
auto operator<<(std::ostream& os, Token::BuiltinFunc bf) -> std::ostream&;
auto operator<<(std::ostream& os, Token const& token) -> std::ostream&;

/* Comparison operators.  */
auto operator==(Token const& token, Token::Type type) -> bool;
auto operator==(Token const& token, Token::BuiltinFunc builtin_func) -> bool;
auto operator==(Token::Type type, Token const& token) -> bool;
auto operator!=(Token const& token, Token::Type type) -> bool;
auto operator!=(Token const& token, Token::BuiltinFunc builtin_func) -> bool;
auto operator!=(Token::Type type, Token const& token) -> bool;

/** \brief  Reader base class.
 *
 * Base class that allows us to read characters from an input stream (either string or file).
 * Used both for program text and for record input.
 */
class Reader
{
public:
  /** \brief      Construct a reader
   *  \param name Name to use for file in error messages.
   */
  explicit Reader(std::string_view name);

  /** \brief Abstract destructor.  */
  virtual ~Reader() = 0;

  Reader(Reader const&) = delete;
  Reader(Reader&&) noexcept = delete;
  auto operator=(Reader const&) -> Reader& = delete;
  auto operator=(Reader&&) noexcept -> Reader& = delete;

  /** \brief  Peek at the current character.
   *  \return Current character or EOF on end-of-file.
   *
   * Implementations should be lazy - that is not do the peeking until called, hence this method
   * not being `const`.
   */
  virtual auto peek() -> int = 0;

  /** \brief  Chew the current character. */
  void chew();

  /** \brief  Get the current source location.  */
  [[nodiscard]] virtual auto location() const -> Location const&;

private:
  /** \brief  Do the actual chew of a character.  */
  virtual void do_chew() = 0;

  Location location_;  ///< Current source location.
};

/** \brief Read from a string. */
class StringReader : public Reader
{
public:
  /** \brief Constructor
   *  \param s    String to read.
   *  \param name Name to use in locations.
   */
  explicit StringReader(std::string s, std::string_view name = "cmdline");

  auto peek() -> int final;

private:
  void do_chew() final;

  std::string s_;                  ///< String
  std::string::size_type pos_{0};  ///< Current position in string.
};

/** \brief File reader.  "-" reads standard input. */
class FileReader : public Reader
{
public:
  /** \brief        Constructor.
   *  \param f      File name.
   *  \param errors Are errors also written to standard error?
   *
   * Throws RuntimeIOError if the file can not be opened.
   */
  explicit FileReader(std::string_view f,
                      StreamInputFile::Errors errors = StreamInputFile::Errors::report);

  auto peek() -> int final;

private:
  void do_chew() final;

  StreamInputFile file_;  ///< File
  int c_{EOF};            ///< Current character (EOF means needs peeking or EOF)
};

/** \brief Read from multiple files as if they were one, with a newline between each file. */
class FilesReader : public Reader
{
public:
  /** \brief   Constructor.
   *  \param f Vector of files.
   */
  explicit FilesReader(std::vector<std::string> f);

  auto peek() -> int final;
  [[nodiscard]] auto location() const -> Location const& override;

private:
  void do_chew() final;

  /** \brief  Open the file at the top of files_.  */
  void open_front_file();

  std::unique_ptr<StreamInputFile> current_file_;  ///< File
  std::vector<std::string> files_;                 ///< Files still to read.
  Location location_;                              ///< Current location
  int c_{EOF};               ///< Current character (EOF means needs peeking or EOF)
  bool switch_file_{false};  ///< Is c_ the newline separating two files?
};

/** Lexer.  */
class Lexer
{
public:
  /** \brief   Constructor.
   *  \param r Reader to read from.
   */
  explicit Lexer(std::unique_ptr<Reader>&& r);

  /** \brief                Peek the current token.
   *  \param  enable_divide Enable the divide tokens.
   *  \return               Peeked token.
   *
   * Not const as we peek lazily.  Throws LexError if the token is an error.
   */
  auto peek(bool enable_divide) -> Token const&;

  /** \brief                Chew the current token.
   *  \param  enable_divide Enable the divide tokens.
   */
  void chew(bool enable_divide);

  /** @brief  Lex a string from the command line.
   *
   * This basically treats the rest of the characters to be tokenized as a string which is between
   * two quotes.  This is used to lex the second half of the VAR=NAME command line options and
   * operands.
   *
   * Peeked token will have type Token::Type::String.
   */
  auto peek_cmdline_string() -> Token const&;

  /** \brief  Get the current location. */
  [[nodiscard]] auto location() const -> Location const&;

private:
  /** @brief              Lexer.  Main entry point
   *  @param allow_divide are / and /= allowed?
   *
   * All lexing routines end up by calling t_.emplace() to construct an appropriate token.
   */
  void lex(bool allow_divide);

  /** @brief  Skip blanks, comments, and escaped newlines.
   *  @return \c false if we emplaced an error token instead.
   */
  auto lex_blanks() -> bool;

  /** Lex the &&. */
  void lex_and();

  /** Lex a comment.
   *
   * On entry t_->peek() should point to the # at the start of the comment.
   */
  void lex_comment();

  /** Lex a number.
   *
   * On entry t_->peek() should point to the first digit of the number, or a '.'.
   */
  void lex_number();

  /**         Lex an octal-escape.
   *  @return Character encoded in octal sequence.
   *
   * On entry t_->peek() should point to the first digit of the escape sequence.
   */
  auto lex_octal_escape() -> char;

  /** Lex a string or regular expression.
   * @param from_cmdline true if this is a string from the command line.
   *
   * On entry, t_->peek() should point to the opening " or / of the escape sequence.
   */
  void lex_string_or_ere(bool from_cmdline);

  /** Lex a word (name, func_name, or builtin_func_name). */
  void lex_word();

  /**              Lex a symbol
   *  \param plain Token type to use if the next character isn't matched
   *  \param next1 Next character to try and match
   *  \param tok1  Token type to use if next1 matches
   */
  void lex_symbol(Token::Type plain, char next1, Token::Type tok1);

  /**              Lex a symbol
   *  \param plain Token type to use if the next character isn't matched
   *  \param next1 Next character to try and match
   *  \param tok1  Token type to use if next1 matches
   *  \param next2 Next character to try and match
   *  \param tok2  Token type to use if next2 matches
   */
  void lex_symbol(Token::Type plain, char next1, Token::Type tok1, char next2, Token::Type tok2);

  /** \brief       Place an error token at the current location into \a slot.
   *  \param slot  Where to put the token (t_ or t2_).
   *  \param msg   Message ID
   *  \param args  Arguments for the message.
   */
  template<typename... Ts>
  void emplace_error(std::optional<Token>& slot, Msg msg, Ts const&... args)
  {
    slot.emplace(Token::Type::error, Messages::get().format(msg, args...));
    slot->location(r_->location());
  }

  /** \brief  Throw a LexError if \a t is an error token.  */
  static void check_error(Token const& t);

  std::unique_ptr<Reader> r_;  ///< Reader
  std::optional<Token> t_;     ///< Pending token.
  std::optional<Token> t2_;    ///< Second pending token.
};

/** \brief         Tokenize a complete program.
 *  \param  source Program text.
 *  \return        Tokens, ending with an eof token.
 *
 * Whether a '/' is a divide or starts an ERE is decided from the previous token.
 */
auto tokenize(std::string source) -> std::vector<Token>;

}  // namespace Tawk

template<>
struct fmt::formatter<Tawk::Token>
{
  static constexpr auto parse(format_parse_context& ctx)
  {
    if (ctx.begin() != ctx.end() && *ctx.begin() != '}') {
      throw format_error("invalid format");
    }
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(Tawk::Token const& token, FormatContext& ctx) const
  {
    std::ostringstream os;
    os << token;
    return fmt::format_to(ctx.out(), "{0}", os.str());
  }
};

template<>
struct fmt::formatter<Tawk::Token::BuiltinFunc>
{
  static constexpr auto parse(format_parse_context& ctx)
  {
    if (ctx.begin() != ctx.end() && *ctx.begin() != '}') {
      throw format_error("invalid format");
    }
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(Tawk::Token::BuiltinFunc func, FormatContext& ctx) const
  {
    std::ostringstream os;
    os << func;
    return fmt::format_to(ctx.out(), "{0}", os.str());
  }
};

#endif  // SRC_TAWK_TAWK_HH_INCLUDED
