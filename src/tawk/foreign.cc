/** \file   foreign.cc
 *  \brief  Foreign function registry
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk/utils.hh"

#include "tawk-messages.hh"

#include <exception>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "foreign.hh"

Tawk::FunctionAdapter::FunctionAdapter(Function fn) : fn_(std::move(fn)) {}

auto Tawk::FunctionAdapter::invoke(std::vector<std::string> const& args) -> std::string
{
  return fn_(args);
}

Tawk::ForeignFunctionRegistry::ForeignFunctionRegistry(std::ostream& diagnostics)
    : diagnostics_(diagnostics)
{
}

void Tawk::ForeignFunctionRegistry::add(std::string const& name,
                                        std::unique_ptr<ForeignFunction> fn)
{
  functions_[name] = std::move(fn);
}

void Tawk::ForeignFunctionRegistry::add(std::string const& name, FunctionAdapter::Function fn)
{
  add(name, std::make_unique<FunctionAdapter>(std::move(fn)));
}

auto Tawk::ForeignFunctionRegistry::resolve(std::string const& name) const
  -> std::shared_ptr<ForeignFunction>
{
  auto it{functions_.find(name)};
  return it == functions_.end() ? nullptr : it->second;
}

auto Tawk::ForeignFunctionRegistry::call(ForeignFunction& fn, std::string const& name,
                                         std::vector<Value> const& args, Location const& loc,
                                         std::string_view convfmt) -> Value
{
  std::vector<std::string> strings;
  strings.reserve(args.size());
  for (auto const& arg : args) {
    strings.push_back(arg.to_string(convfmt));
  }

  std::string reason;
  try {
    return Value::strnum_candidate(fn.invoke(strings));
  }
  catch (TypeError const& e) {
    throw TypeError(loc, e.what());
  }
  catch (ForeignCallError const& e) {
    reason = e.what();
  }
  catch (Error const&) {
    throw;
  }
  catch (std::exception const& e) {
    reason = e.what();
  }

  diagnostics_ << program_name() << ": "
               << Messages::get().format(Msg::warning_label, loc.file_name(), loc.line(),
                                         loc.column())
               << Messages::get().format(Msg::foreign_call_failed, name, reason) << '\n';
  return Value{std::string{}};
}
