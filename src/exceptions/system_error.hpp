// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef system_error_hpp
#define system_error_hpp

#include <string>

#include "error.hpp"

namespace heredity {

// Raised when the environment fails heredity, for example an unwritable output file
class SystemError : public Error
{
    std::string do_type() const override { return "system"; }
};

} // namespace heredity

#endif
