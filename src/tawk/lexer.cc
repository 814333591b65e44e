/** \file   lexer.cc
 *  \brief  Implementation of Tawk::Lexer
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk/utils.hh"

#include "tawk-messages.hh"

#include <cassert>
#include <cctype>
#include <charconv>
#include <limits>
#include <memory>
#include <string_view>
#include <unordered_map>

#include "tawk.hh"

namespace {
auto is_digit(int c) -> bool { return c >= '0' && c <= '9'; }

auto is_hex_digit(int c) -> bool
{
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

auto is_word_start(int c) -> bool
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto is_word_char(int c) -> bool { return is_word_start(c) || is_digit(c); }
}  // namespace

Tawk::Lexer::Lexer(std::unique_ptr<Reader>&& r) : r_(std::move(r)), t_(std::nullopt) {}

void Tawk::Lexer::check_error(Token const& t)
{
  if (t == Token::Type::error) {
    throw LexError(t.location(), t.error());
  }
}

auto Tawk::Lexer::peek(bool enable_divide) -> Tawk::Token const&
{
  // Sometimes we create a second pending token - usually when we have an error and the correction
  // for that error.
  if (!t_.has_value() && t2_.has_value()) {
    t_ = t2_;
    t2_.reset();
  }

  if (!t_.has_value()) {
    lex(enable_divide);
  }

  assert(t_.has_value());  // NOLINT
  check_error(*t_);
  return *t_;
}

auto Tawk::Lexer::peek_cmdline_string() -> Tawk::Token const&
{
  if (!t_.has_value() && t2_.has_value()) {
    t_ = t2_;
    t2_.reset();
  }

  if (!t_.has_value()) {
    Location const start{r_->location()};
    lex_string_or_ere(true);
    t_->location(start);
  }

  assert(t_.has_value());  // NOLINT
  check_error(*t_);
  return *t_;
}

void Tawk::Lexer::chew(bool enable_divide)
{
  /* If we have nothing to chew we need to find something.  */
  if (!t_.has_value()) {
    (void)peek(enable_divide);
  }

  assert(t_.has_value());  // NOLINT
  if (t_->type() != Token::Type::eof) {
    t_.reset();
  }
}

auto Tawk::Lexer::location() const -> Tawk::Location const& { return r_->location(); }

void Tawk::Lexer::lex_and()
{
  assert(r_->peek() == '&');  // NOLINT
  r_->chew();

  if (r_->peek() == '&') {
    t_.emplace(Token::Type::and_);
    r_->chew();
  }
  else {
    emplace_error(t_, Msg::unexpected_token, '&');
  }
}

void Tawk::Lexer::lex_comment()
{
  assert(r_->peek() == '#');  // NOLINT

  // Comments continue to the end of the line, the newline itself is a token.
  while (r_->peek() != EOF && r_->peek() != '\n') {
    r_->chew();
  }
}

auto Tawk::Lexer::lex_blanks() -> bool
{
  while (true) {
    switch (r_->peek()) {
    case ' ':
    case '\t':
    case '\r':
      r_->chew();
      break;
    case '#':
      lex_comment();
      break;
    case '\\':
      r_->chew();
      if (r_->peek() == '\r') {
        r_->chew();
      }
      if (r_->peek() != '\n') {
        emplace_error(t_, Msg::unexpected_token, '\\');
        return false;
      }
      r_->chew();
      break;
    default:
      return true;
    }
  }
}

void Tawk::Lexer::lex_number()
{
  assert(is_digit(r_->peek()) || r_->peek() == '.');  // NOLINT

  std::string num;
  bool hex{false};
  bool floating{false};
  std::size_t exponent_pos{std::string::npos};

  while (true) {
    int const c{r_->peek()};
    if (hex ? is_hex_digit(c) : is_digit(c)) {
      num += static_cast<char>(c);
    }
    else if (c == '.' && !floating && exponent_pos == std::string::npos) {
      num += '.';
      floating = true;
    }
    else if (((!hex && (c == 'e' || c == 'E')) || (hex && (c == 'p' || c == 'P'))) &&
             exponent_pos == std::string::npos && !num.empty()) {
      floating = true;
      exponent_pos = num.size();
      num += static_cast<char>(c);
    }
    else if ((c == '+' || c == '-') && exponent_pos != std::string::npos &&
             exponent_pos + 1 == num.size()) {
      num += static_cast<char>(c);
    }
    else if ((c == 'x' || c == 'X') && !hex && num == "0") {
      num.clear();
      hex = true;
    }
    else {
      break;
    }
    r_->chew();
  }

  auto const* const begin{num.data()};
  auto const* const end{num.data() + num.size()};  // NOLINT
  std::from_chars_result fcr{};
  bool done{false};

  if (!floating) {
    signed long number{0};  // NOLINT(google-runtime-int)
    fcr = std::from_chars(begin, end, number, hex ? 16 : 10);  // NOLINT
    if (fcr.ec == std::errc{} && fcr.ptr == end) {
      t_.emplace(Token::Type::integer, Integer{number});
      done = true;
    }
    else if (fcr.ec == std::errc::result_out_of_range) {
      // Too big for an integer, fall back to a floating point representation.
      floating = true;
    }
  }

  if (floating) {
    Floating number{0.0};
    fcr = std::from_chars(begin, end, number,
                          hex ? std::chars_format::hex : std::chars_format::general);
    if (fcr.ec == std::errc{} && fcr.ptr == end) {
      t_.emplace(Token::Type::floating, number);
      done = true;
    }
  }

  if (done) {
    return;
  }

  t_.emplace(Token::Type::integer, Integer{0});
  if (fcr.ec == std::errc::result_out_of_range) {
    emplace_error(t2_, Msg::number_out_of_range, num);
  }
  else {
    emplace_error(t2_, Msg::invalid_number, num);
  }
}

auto Tawk::Lexer::lex_octal_escape() -> char
{
  assert(r_->peek() >= '0' && r_->peek() < '8');  // NOLINT

  unsigned c{0};
  unsigned len{0};
  std::string representation;
  while (r_->peek() >= '0' && r_->peek() < '8' && len < 3) {
    ++len;
    c <<= 3;
    c |= static_cast<unsigned>(r_->peek() - '0');
    representation += static_cast<char>(r_->peek());
    r_->chew();
  }

  if (c > std::numeric_limits<unsigned char>::max()) {
    emplace_error(t2_, Msg::octal_escape_too_big, representation);
  }

  return static_cast<char>(c);
}

void Tawk::Lexer::lex_string_or_ere(bool from_cmdline)
{
  // We are called in three circumstances:
  //  From the command line - the string ends at EOF, a final \ is kept.
  //  As a string.  First character is ".
  //  As an ERE.  First character is /.
  assert(from_cmdline || r_->peek() == '"' || r_->peek() == '/');  // NOLINT
  bool const is_string = from_cmdline || r_->peek() == '"';
  if (!from_cmdline) {
    r_->chew();
  }

  Token::Type const type{is_string ? Token::Type::string : Token::Type::ere};
  std::string str;

  while (true) {
    int const c{r_->peek()};
    if (c == EOF) {
      t_.emplace(type, str);
      if (!from_cmdline) {
        emplace_error(t2_, Msg::unexpected_eof_in_string);
      }
      return;
    }

    if (c == '\n' && !from_cmdline) {
      // Don't chew the newline.
      t_.emplace(type, str);
      emplace_error(t2_, Msg::unexpected_nl_in_string);
      return;
    }

    r_->chew();
    if ((is_string && !from_cmdline && c == '"') || (!is_string && c == '/')) {
      t_.emplace(type, str);
      return;
    }

    if (c != '\\') {
      str += static_cast<char>(c);
      continue;
    }

    int const e{r_->peek()};
    if (e == EOF) {
      str += '\\';
      continue;
    }

    if (!is_string) {
      // EREs keep their escapes for the regular expression compiler, apart from \/.
      r_->chew();
      if (e == '/') {
        str += '/';
      }
      else if (e != '\n') {
        str += '\\';
        str += static_cast<char>(e);
      }
      continue;
    }

    if (e >= '0' && e < '8') {
      str += lex_octal_escape();
      continue;
    }

    r_->chew();
    switch (e) {
    case '"':
    case '\\':
    case '/':
      str += static_cast<char>(e);
      break;
    case 'a':
      str += '\a';
      break;
    case 'b':
      str += '\b';
      break;
    case 'f':
      str += '\f';
      break;
    case 'n':
      str += '\n';
      break;
    case 'r':
      str += '\r';
      break;
    case 't':
      str += '\t';
      break;
    case 'v':
      str += '\v';
      break;
    case '\n':
      // Continuation line.
      break;
    default:
      str += '\\';
      str += static_cast<char>(e);
      break;
    }
  }
}

void Tawk::Lexer::lex_symbol(Token::Type plain, char next1, Token::Type tok1)
{
  r_->chew();
  if (r_->peek() == next1) {
    r_->chew();
    t_.emplace(tok1);
    return;
  }

  t_.emplace(plain);
}

void Tawk::Lexer::lex_symbol(Token::Type plain, char next1, Token::Type tok1, char next2,
                             Token::Type tok2)
{
  r_->chew();
  if (r_->peek() == next1) {
    r_->chew();
    t_.emplace(tok1);
    return;
  }

  if (r_->peek() == next2) {
    r_->chew();
    t_.emplace(tok2);
    return;
  }

  t_.emplace(plain);
}

void Tawk::Lexer::lex_word()
{
  static const std::unordered_map<std::string, Token::Type> token_map{
    {"BEGIN", Token::Type::begin},
    {"break", Token::Type::break_},
    {"continue", Token::Type::continue_},
    {"delete", Token::Type::delete_},
    {"do", Token::Type::do_},
    {"else", Token::Type::else_},
    {"END", Token::Type::end},
    {"exit", Token::Type::exit},
    {"for", Token::Type::for_},
    {"function", Token::Type::function},
    {"func", Token::Type::function},
    {"getline", Token::Type::getline},
    {"if", Token::Type::if_},
    {"in", Token::Type::in},
    {"next", Token::Type::next},
    {"nextfile", Token::Type::nextfile},
    {"print", Token::Type::print},
    {"printf", Token::Type::printf},
    {"return", Token::Type::return_},
    {"while", Token::Type::while_},
  };

  static const std::unordered_map<std::string, Token::BuiltinFunc> builtin_map{
    {"atan2", Token::BuiltinFunc::atan2},     {"close", Token::BuiltinFunc::close},
    {"cos", Token::BuiltinFunc::cos},         {"exp", Token::BuiltinFunc::exp},
    {"fflush", Token::BuiltinFunc::fflush},   {"gsub", Token::BuiltinFunc::gsub},
    {"index", Token::BuiltinFunc::index},     {"int", Token::BuiltinFunc::int_},
    {"length", Token::BuiltinFunc::length},   {"log", Token::BuiltinFunc::log},
    {"match", Token::BuiltinFunc::match},     {"rand", Token::BuiltinFunc::rand},
    {"sin", Token::BuiltinFunc::sin},         {"split", Token::BuiltinFunc::split},
    {"sprintf", Token::BuiltinFunc::sprintf}, {"sqrt", Token::BuiltinFunc::sqrt},
    {"srand", Token::BuiltinFunc::srand},     {"sub", Token::BuiltinFunc::sub},
    {"substr", Token::BuiltinFunc::substr},   {"system", Token::BuiltinFunc::system},
    {"tolower", Token::BuiltinFunc::tolower}, {"toupper", Token::BuiltinFunc::toupper},
  };

  std::string word;
  while (is_word_char(r_->peek())) {
    word += static_cast<char>(r_->peek());
    r_->chew();
  }

  auto it{token_map.find(word)};
  if (it != token_map.end()) {
    t_.emplace(it->second);
    return;
  }

  auto builtin_it{builtin_map.find(word)};
  if (builtin_it != builtin_map.end()) {
    t_.emplace(Token::Type::builtin_func_name, builtin_it->second);
    return;
  }

  // A function name is a name immediately followed by '('.
  if (r_->peek() == '(') {
    t_.emplace(Token::Type::func_name, word);
    return;
  }

  t_.emplace(Token::Type::name, word);
}

void Tawk::Lexer::lex(bool allow_divide)
{
  if (!lex_blanks()) {
    return;
  }

  Location const start{r_->location()};
  int const c{r_->peek()};

  switch (c) {
  case EOF:
    t_.emplace(Token::Type::eof);
    break;
  case '\n':
    r_->chew();
    t_.emplace(Token::Type::newline);
    break;
  case '"':
    lex_string_or_ere(false);
    break;
  case '/':
    if (allow_divide) {
      lex_symbol(Token::Type::divide, '=', Token::Type::div_assign);
    }
    else {
      lex_string_or_ere(false);
    }
    break;
  case '&':
    lex_and();
    break;
  case '+':
    lex_symbol(Token::Type::add, '=', Token::Type::add_assign, '+', Token::Type::incr);
    break;
  case '-':
    lex_symbol(Token::Type::subtract, '=', Token::Type::sub_assign, '-', Token::Type::decr);
    break;
  case '*':
    lex_symbol(Token::Type::multiply, '=', Token::Type::mul_assign);
    break;
  case '%':
    lex_symbol(Token::Type::modulo, '=', Token::Type::mod_assign);
    break;
  case '^':
    lex_symbol(Token::Type::power, '=', Token::Type::pow_assign);
    break;
  case '!':
    lex_symbol(Token::Type::not_, '=', Token::Type::ne, '~', Token::Type::no_match);
    break;
  case '>':
    lex_symbol(Token::Type::greater_than, '=', Token::Type::ge, '>', Token::Type::append);
    break;
  case '<':
    lex_symbol(Token::Type::less_than, '=', Token::Type::le);
    break;
  case '|':
    lex_symbol(Token::Type::pipe, '|', Token::Type::or_);
    break;
  case '=':
    lex_symbol(Token::Type::assign, '=', Token::Type::eq);
    break;
  default: {
    static const std::unordered_map<int, Token::Type> single_map{
      {'{', Token::Type::lbrace},    {'}', Token::Type::rbrace},    {'(', Token::Type::lparens},
      {')', Token::Type::rparens},   {'[', Token::Type::lsquare},   {']', Token::Type::rsquare},
      {',', Token::Type::comma},     {';', Token::Type::semicolon}, {'?', Token::Type::query},
      {':', Token::Type::colon},     {'~', Token::Type::tilde},     {'$', Token::Type::dollar},
    };

    if (is_digit(c) || c == '.') {
      lex_number();
    }
    else if (is_word_start(c)) {
      lex_word();
    }
    else if (auto it{single_map.find(c)}; it != single_map.end()) {
      r_->chew();
      t_.emplace(it->second);
    }
    else {
      emplace_error(t_, Msg::unexpected_token, static_cast<char>(c));
      r_->chew();
    }
    break;
  }
  }

  t_->location(start);
}

auto Tawk::tokenize(std::string source) -> std::vector<Token>
{
  Lexer lexer{std::make_unique<StringReader>(std::move(source), "program")};
  std::vector<Token> tokens;
  bool divide{false};

  while (true) {
    Token const& token{lexer.peek(divide)};
    tokens.push_back(token);
    if (token == Token::Type::eof) {
      return tokens;
    }

    // After something which ends an operand a '/' is a divide, otherwise it starts an ERE.
    switch (token.type()) {
    case Token::Type::name:
    case Token::Type::integer:
    case Token::Type::floating:
    case Token::Type::string:
    case Token::Type::ere:
    case Token::Type::rparens:
    case Token::Type::rsquare:
    case Token::Type::incr:
    case Token::Type::decr:
    case Token::Type::builtin_func_name:
      divide = true;
      break;
    default:
      divide = false;
      break;
    }
    lexer.chew(divide);
  }
}
