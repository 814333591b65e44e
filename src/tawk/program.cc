/** \file   program.cc
 *  \brief  tawk parsed program
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <regex>
#include <string>
#include <vector>

#include "program.hh"

auto Tawk::Program::rules() const noexcept -> std::vector<Ast::Rule> const& { return rules_; }

auto Tawk::Program::function(std::string const& name) const -> Ast::FunctionDef const*
{
  auto it{functions_.find(name)};
  if (it == functions_.end()) {
    return nullptr;
  }

  return &it->second;
}

auto Tawk::Program::has_rule(Ast::Pattern::Kind kind) const -> bool
{
  return std::any_of(rules_.begin(), rules_.end(),
                     [kind](Ast::Rule const& rule) { return rule.pattern.kind == kind; });
}

auto Tawk::Program::needs_input() const -> bool
{
  return std::any_of(rules_.begin(), rules_.end(), [](Ast::Rule const& rule) {
    return rule.pattern.kind != Ast::Pattern::Kind::begin;
  });
}

auto Tawk::compile_ere(std::string const& ere) -> std::regex
{
  return std::regex{ere, std::regex_constants::awk};
}
