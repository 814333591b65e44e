/** \file   fields.cc
 *  \brief  tawk record and field handling
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk-messages.hh"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "fields.hh"
#include "program.hh"

auto Tawk::Details::RegexCache::get(std::string const& ere, Location const& loc)
  -> std::regex const&
{
  auto it{cache_.find(ere)};
  if (it != cache_.end()) {
    return it->second;
  }

  try {
    return cache_.emplace(ere, compile_ere(ere)).first->second;
  }
  catch (std::regex_error const& e) {
    throw TypeError(loc, Messages::get().format(Msg::invalid_regex, ere, e.what()));
  }
}

Tawk::Details::Fields::Fields(RegexCache& regexes) : regexes_(regexes)
{
  fields_.emplace_back(std::string{});
}

void Tawk::Details::Fields::set_record(std::string record, std::string const& fs, bool paragraph,
                                       Location const& loc)
{
  auto parts{split(record, fs, paragraph, loc)};

  fields_.clear();
  fields_.reserve(parts.size() + 1);
  fields_.push_back(Value::strnum_candidate(std::move(record)));
  for (auto& part : parts) {
    fields_.push_back(Value::strnum_candidate(std::move(part)));
  }
}

auto Tawk::Details::Fields::field(std::size_t i) const -> Value
{
  if (i < fields_.size()) {
    return fields_[i];
  }

  return Value{};
}

void Tawk::Details::Fields::field(std::size_t i, Value const& v, std::string const& fs,
                                  std::string const& ofs, std::string_view convfmt,
                                  bool paragraph, Location const& loc)
{
  if (i == 0) {
    set_record(v.to_string(convfmt), fs, paragraph, loc);
    return;
  }

  if (i >= fields_.size()) {
    fields_.resize(i + 1, Value{std::string{}});
  }
  fields_[i] = v;
  rebuild_record(ofs, convfmt);
}

auto Tawk::Details::Fields::nf() const noexcept -> std::size_t { return fields_.size() - 1; }

void Tawk::Details::Fields::nf(std::size_t n, std::string const& ofs, std::string_view convfmt)
{
  fields_.resize(n + 1, Value{std::string{}});
  rebuild_record(ofs, convfmt);
}

void Tawk::Details::Fields::rebuild_record(std::string const& ofs, std::string_view convfmt)
{
  std::string record;
  for (auto it{fields_.begin() + 1}; it != fields_.end(); ++it) {
    if (it != fields_.begin() + 1) {
      record += ofs;
    }
    record += it->to_string(convfmt);
  }
  fields_[0] = Value::strnum_candidate(std::move(record));
}

auto Tawk::Details::Fields::split(std::string const& s, std::string const& fs,
                                  bool newline_separates, Location const& loc)
  -> std::vector<std::string>
{
  std::vector<std::string> result;
  if (s.empty()) {
    return result;
  }

  if (fs == " ") {
    split_space(s, result);
  }
  else if (fs.size() == 1) {
    split_char(s, fs[0], newline_separates, result);
  }
  else if (newline_separates) {
    split_regex(s, regexes_.get("(" + fs + ")|\n", loc), result);
  }
  else {
    split_regex(s, regexes_.get(fs, loc), result);
  }

  return result;
}

void Tawk::Details::Fields::split_space(std::string const& s, std::vector<std::string>& result)
{
  std::size_t offset{0};
  while (true) {
    offset = s.find_first_not_of(" \t\n", offset);
    if (offset == std::string::npos) {
      return;
    }
    std::size_t const space{s.find_first_of(" \t\n", offset)};
    if (space == std::string::npos) {
      result.push_back(s.substr(offset));
      return;
    }

    result.push_back(s.substr(offset, space - offset));
    offset = space + 1;
  }
}

void Tawk::Details::Fields::split_char(std::string const& s, char fs, bool newline_separates,
                                       std::vector<std::string>& result)
{
  std::string const separators{newline_separates ? std::string{fs, '\n'} : std::string{fs}};
  std::size_t offset{0};

  while (true) {
    std::size_t const fs_appearance(s.find_first_of(separators, offset));
    if (fs_appearance == std::string::npos) {
      result.push_back(s.substr(offset));
      return;
    }

    result.push_back(s.substr(offset, fs_appearance - offset));
    offset = fs_appearance + 1;
  }
}

void Tawk::Details::Fields::split_regex(std::string const& s, std::regex const& re,
                                        std::vector<std::string>& result)
{
  std::size_t start{0};
  for (auto it{std::sregex_iterator(s.begin(), s.end(), re)}; it != std::sregex_iterator();
       ++it) {
    auto const& match{*it};
    if (match.length(0) == 0) {
      continue;
    }
    auto const pos{static_cast<std::size_t>(match.position(0))};
    result.push_back(s.substr(start, pos - start));
    start = pos + static_cast<std::size_t>(match.length(0));
  }
  result.push_back(s.substr(start));
}
