/** \file   input.cc
 *  \brief  tawk record input: main input, ARGV processing, and getline
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <cstdio>
#include <memory>
#include <string>
#include <utility>

#include "format.hh"
#include "session.hh"

Tawk::Details::RecordReader::RecordReader(std::unique_ptr<Reader> reader)
    : reader_(std::move(reader))
{
}

auto Tawk::Details::RecordReader::read(std::string& record, std::string const& rs) -> bool
{
  record.clear();
  if (rs.empty()) {
    return read_paragraph(record);
  }

  char const sep{rs[0]};
  int c{reader_->peek()};
  if (c == EOF) {
    return false;
  }

  while (c != EOF && c != sep) {
    record += static_cast<char>(c);
    reader_->chew();
    c = reader_->peek();
  }

  if (c == sep) {
    reader_->chew();
  }
  return true;
}

auto Tawk::Details::RecordReader::read_paragraph(std::string& record) -> bool
{
  /* Blank lines separate records, and leading ones are ignored.  */
  while (reader_->peek() == '\n') {
    reader_->chew();
  }

  if (reader_->peek() == EOF) {
    return false;
  }

  while (true) {
    int const c{reader_->peek()};
    if (c == EOF) {
      break;
    }
    reader_->chew();
    if (c == '\n' && reader_->peek() == '\n') {
      while (reader_->peek() == '\n') {
        reader_->chew();
      }
      break;
    }
    record += static_cast<char>(c);
  }

  while (!record.empty() && record.back() == '\n') {
    record.pop_back();
  }
  return true;
}

auto Tawk::Details::ExecutionState::open_next_input() -> bool
{
  if (pending_input_ != nullptr) {
    main_input_ = std::make_unique<RecordReader>(std::move(pending_input_));
    set_global("FNR", Value{Floating{0}});
    return true;
  }

  while (next_argv_ < global_number("ARGC")) {
    std::string const key{format_number(next_argv_, "%.6g")};
    next_argv_ += 1;

    Array const* argv{global_array("ARGV")};
    if (argv == nullptr || !argv->contains(key)) {
      continue;
    }
    std::string const operand{argv->elements().at(key).to_string(convfmt())};
    if (operand.empty() || assign(operand)) {
      continue;
    }

    used_file_operand_ = true;
    main_input_ = std::make_unique<RecordReader>(std::make_unique<FileReader>(operand));
    set_global("FILENAME", Value{operand});
    set_global("FNR", Value{Floating{0}});
    return true;
  }

  if (!used_file_operand_) {
    used_file_operand_ = true;
    main_input_ = std::make_unique<RecordReader>(std::make_unique<FileReader>("-"));
    set_global("FNR", Value{Floating{0}});
    return true;
  }

  return false;
}

auto Tawk::Details::ExecutionState::next_main_record(std::string& record) -> bool
{
  if (input_exhausted_) {
    return false;
  }

  while (true) {
    if (main_input_ == nullptr && !open_next_input()) {
      input_exhausted_ = true;
      return false;
    }

    if (main_input_->read(record, global_string("RS"))) {
      set_global("NR", Value{global_number("NR") + 1});
      set_global("FNR", Value{global_number("FNR") + 1});
      return true;
    }
    main_input_.reset();
  }
}

auto Tawk::Details::ExecutionState::getline(Ast::Getline const& node, Location const& loc)
  -> Value
{
  std::string record;

  if (node.file != nullptr) {
    std::string const name{eval(*node.file).to_string(convfmt())};
    auto it{input_files_.find(name)};
    if (it == input_files_.end()) {
      try {
        it = input_files_
               .emplace(name, std::make_unique<RecordReader>(std::make_unique<FileReader>(
                                name, StreamInputFile::Errors::quiet)))
               .first;
      }
      catch (RuntimeIOError const&) {
        return Value{Floating{-1}};
      }
    }

    try {
      if (!it->second->read(record, global_string("RS"))) {
        return Value{Floating{0}};
      }
    }
    catch (RuntimeIOError const&) {
      return Value{Floating{-1}};
    }
  }
  else {
    try {
      if (!next_main_record(record)) {
        return Value{Floating{0}};
      }
    }
    catch (RuntimeIOError const&) {
      return Value{Floating{-1}};
    }
  }

  if (node.target != nullptr) {
    LValue const lv{resolve(*node.target)};
    store(lv, Value::strnum_candidate(std::move(record)), loc);
  }
  else {
    set_record(std::move(record), loc);
  }
  return Value{Floating{1}};
}
