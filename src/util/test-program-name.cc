/** \file   src/util/test-program-name.cc
 *  \brief  Unit tests for program_name utils
 *  \author Copyright 2021, Matthew Gretton-Dann
 *          SPDX-License-Identifier: Apache-2.0
 */

#include "tawk/utils.hh"

#include <catch2/catch.hpp>

TEST_CASE("program_name", "[util][program_name]")
{
  char test1[] = "/usr/local/bin/tawk";  // NOLINT
  char test2[] = "AWK";                  // NOLINT
  Tawk::program_name(test1);
  REQUIRE(Tawk::program_name() == "tawk");

  Tawk::program_name(test2);
  REQUIRE(Tawk::program_name() == "AWK");
}
