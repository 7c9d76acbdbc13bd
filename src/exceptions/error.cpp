// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "error.hpp"

namespace heredity {

const char* Error::what() const noexcept
{
    try {
        message_ = type() + " error in " + where() + ": " + why();
    } catch (const std::exception&) {
        message_ = "heredity error";
    }
    return message_.c_str();
}

} // namespace heredity
