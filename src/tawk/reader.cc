/** \file   reader.cc
 *  \brief  Implementation of Tawk::Location, Tawk::Reader and derived classes
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk/utils.hh"

#include "tawk-messages.hh"

#include <limits>
#include <string_view>

#include "tawk.hh"

Tawk::Location::Location(std::string_view file_name) : file_name_(file_name), column_(1), line_(1)
{
}

// NOLINTNEXTLINE
Tawk::Location::Location(std::string_view file_name, Line line, Column column)
    : file_name_(file_name), column_(column), line_(line)
{
}

auto Tawk::Location::file_name() const -> std::string const& { return file_name_; }

auto Tawk::Location::column() const -> Tawk::Location::Column { return column_; }

auto Tawk::Location::line() const -> Tawk::Location::Line { return line_; }

void Tawk::Location::next_column()
{
  if (column_ < std::numeric_limits<Column>::max()) {
    ++column_;
  }
}

void Tawk::Location::next_line()
{
  if (line_ < std::numeric_limits<Line>::max()) {
    ++line_;
  }
  column_ = 1;
}

auto Tawk::operator<<(std::ostream& os, Tawk::Location const& location) -> std::ostream&
{
  os << location.file_name() << ':' << location.line() << ':' << location.column();
  return os;
}

auto Tawk::operator==(Tawk::Location const& lhs, Tawk::Location const& rhs) -> bool
{
  return lhs.file_name() == rhs.file_name() && lhs.line() == rhs.line() &&
         lhs.column() == rhs.column();
}

auto Tawk::operator!=(Tawk::Location const& lhs, Tawk::Location const& rhs) -> bool
{
  return !(lhs == rhs);
}

Tawk::Reader::Reader(std::string_view name) : location_(name) {}

void Tawk::Reader::chew()
{
  if (peek() == '\n') {
    location_.next_line();
  }
  else {
    location_.next_column();
  }

  do_chew();
}

auto Tawk::Reader::location() const -> Tawk::Location const& { return location_; }

Tawk::Reader::~Reader() = default;

Tawk::StringReader::StringReader(std::string s, std::string_view name)
    : Reader(name), s_(std::move(s))
{
}

auto Tawk::StringReader::peek() -> int
{
  if (pos_ >= s_.length()) {
    return EOF;
  }

  return static_cast<unsigned char>(s_[pos_]);
}

void Tawk::StringReader::do_chew()
{
  if (pos_ < s_.length()) {
    ++pos_;
  }
}

Tawk::FileReader::FileReader(std::string_view f, StreamInputFile::Errors errors)
    : Reader(f), file_(f, "r", errors)
{
  if (file_.error()) {
    throw RuntimeIOError(location(), Messages::get().format(Msg::file_error, file_.filename()));
  }
}

auto Tawk::FileReader::peek() -> int
{
  /* We only read from the file when we know we need to - which is indicated by c_ being EOF.  */
  if (c_ == EOF && !file_.eof()) {
    c_ = file_.getc();

    if (file_.error()) {
      throw RuntimeIOError(location(), Messages::get().format(Msg::file_error, file_.filename()));
    }
  }
  return c_;
}

void Tawk::FileReader::do_chew()
{
  /* Ensure we have something to chew.  */
  (void)peek();

  /* And then clear it... */
  c_ = EOF;
}

Tawk::FilesReader::FilesReader(std::vector<std::string> f)
    : Reader(""), files_(std::move(f)), location_("")
{
  open_front_file();
}

void Tawk::FilesReader::open_front_file()
{
  if (files_.empty()) {
    current_file_.reset();
    return;
  }

  current_file_ = std::make_unique<StreamInputFile>(files_.front());
  location_ = Location(files_.front());

  if (current_file_->error()) {
    throw RuntimeIOError(location_, Messages::get().format(Msg::file_error, files_.front()));
  }

  files_.erase(files_.begin());
}

auto Tawk::FilesReader::peek() -> int
{
  /* We only read from the file when we know we need to - which is indicated by c_ being EOF.  */
  if (c_ != EOF || current_file_ == nullptr) {
    return c_;
  }

  if (!current_file_->eof()) {
    c_ = current_file_->getc();
    if (current_file_->error()) {
      throw RuntimeIOError(location_,
                           Messages::get().format(Msg::file_error, current_file_->filename()));
    }
  }

  /* At the end of the current file: separate it from the next one with a newline.  */
  if (c_ == EOF && !files_.empty()) {
    c_ = '\n';
    switch_file_ = true;
  }

  return c_;
}

void Tawk::FilesReader::do_chew()
{
  /* Ensure we have something to chew.  */
  int const c{peek()};
  if (c == EOF) {
    return;
  }

  c_ = EOF;
  if (switch_file_) {
    switch_file_ = false;
    open_front_file();
  }
  else if (c == '\n') {
    location_.next_line();
  }
  else {
    location_.next_column();
  }
}

auto Tawk::FilesReader::location() const -> Tawk::Location const& { return location_; }
