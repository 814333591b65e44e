/** \file   tawk.cc
 *  \brief  Main program for tawk
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include "tawk/utils.hh"

#include "tawk-messages.hh"

#include <unistd.h>

#include <clocale>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "execute.hh"
#include "foreign.hh"
#include "program.hh"
#include "tawk.hh"

using Msg = Tawk::Msg;

namespace {
/** Exit status for errors.  */
constexpr int error_exit_status = 2;

/** \brief       Report a usage error and exit.
 *  \param  msg  Message ID
 *  \param  args Arguments for the message.
 */
template<typename... Ts>
[[noreturn]] void usage_error(Msg msg, Ts... args)
{
  std::cerr << Tawk::program_name() << ": "
            << Tawk::Messages::get().format(Tawk::Set::tawk, msg, args...) << '\n'
            << Tawk::Messages::get().format(Tawk::Set::tawk, Msg::usage, Tawk::program_name())
            << '\n';
  std::exit(error_exit_status);  // NOLINT(concurrency-mt-unsafe)
}

/** \brief    Report a fatal error and exit.
 *  \param  e Error to report.
 */
[[noreturn]] void fatal_error(Tawk::Error const& e)
{
  std::cout.flush();
  std::cerr << Tawk::program_name() << ": ";
  auto const& loc{e.location()};
  if (loc.file_name().empty()) {
    std::cerr << Tawk::Messages::get().format(Msg::error_label_no_location);
  }
  else {
    std::cerr << Tawk::Messages::get().format(Msg::error_label, loc.file_name(), loc.line(),
                                              loc.column());
  }
  std::cerr << e.what() << '\n';
  std::exit(error_exit_status);  // NOLINT(concurrency-mt-unsafe)
}

}  // namespace

auto main(int argc, char** argv) -> int
try {
  (void)std::setlocale(LC_ALL, "");  // NOLINT(concurrency-mt-unsafe)
  std::span<char*> const args(argv, static_cast<std::size_t>(argc));
  Tawk::program_name(args[0]);

  int c = 0;
  std::vector<std::string> variable_assignments;
  std::vector<std::string> files;
  while ((c = ::getopt(argc, argv, ":F:f:v:")) != -1) {  // NOLINT(concurrency-mt-unsafe)
    switch (c) {
    case 'F': {
      std::string fs_var_assign{"FS="};
      fs_var_assign += std::string{optarg} == "t" ? "\t" : optarg;
      variable_assignments.push_back(fs_var_assign);
      break;
    }
    case 'f':
      files.emplace_back(optarg);
      break;
    case 'v':
      variable_assignments.emplace_back(optarg);
      break;
    case ':':
      usage_error(Msg::missing_option_argument, static_cast<char>(optopt));
    case '?':
    default:
      usage_error(Msg::unrecognised_option, static_cast<char>(optopt));
    }
  }

  std::unique_ptr<Tawk::Reader> reader{nullptr};
  if (files.empty()) {
    if (optind >= argc) {
      usage_error(Msg::missing_program);
    }
    reader = std::make_unique<Tawk::StringReader>(args[optind++]);
  }
  else {
    reader = std::make_unique<Tawk::FilesReader>(files);
  }

  std::vector<std::string> operands;
  for (; optind < argc; ++optind) {
    operands.emplace_back(args[optind]);
  }

  try {
    auto const program{Tawk::parse(std::make_unique<Tawk::Lexer>(std::move(reader)))};

    Tawk::ForeignFunctionRegistry foreign;
    Tawk::register_text_functions(foreign, std::make_shared<Tawk::SimulatedProvider>());

    Tawk::Interpreter interpreter(program, std::cout, foreign);
    for (auto const& assignment : variable_assignments) {
      if (!interpreter.assign(assignment)) {
        usage_error(Msg::invalid_assignment, assignment);
      }
    }

    return interpreter.run(operands);
  }
  catch (Tawk::Error const& e) {
    fatal_error(e);
  }
}
catch (std::exception const& e) {
  std::cout.flush();
  std::cerr << Tawk::program_name() << ": "
            << Tawk::Messages::get().format(Msg::uncaught_std_exception, e.what()) << '\n';
  return error_exit_status;
}
