/** \file   test-main.cc
 *  \brief  Main file for tawk unit tests
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <clocale>

auto main(int argc, char* argv[]) -> int
{
  std::setlocale(LC_ALL, "C");  // NOLINT(concurrency-mt-unsafe)
  int const result = Catch::Session().run(argc, argv);

  return result;
}
