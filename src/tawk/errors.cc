/** \file   errors.cc
 *  \brief  Implementation of Tawk::Error and derived classes
 *  \author Copyright 2022, Matthew Gretton-Dann
 *  SPDX-License-Identifier: Apache-2.0
 */

#include <string>
#include <string_view>

#include "tawk.hh"

Tawk::Error::Error(Location location, std::string const& msg)
    : std::runtime_error(msg), location_(std::move(location))
{
}

auto Tawk::Error::location() const noexcept -> Location const& { return location_; }

Tawk::ForeignCallError::ForeignCallError(std::string const& msg)
    : Error(Location{std::string_view{}}, msg)
{
}
