// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef user_error_hpp
#define user_error_hpp

#include <string>

#include "error.hpp"

namespace heredity {

// Raised for bad input: command line values, family files, records and probability tables
class UserError : public Error
{
    std::string do_type() const override { return "user"; }
};

} // namespace heredity

#endif
