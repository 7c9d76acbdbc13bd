// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "cyclic_ancestry_error.hpp"

#include <utility>

namespace heredity {

CyclicAncestryError::CyclicAncestryError(std::string person) : person_ {std::move(person)} {}

const std::string& CyclicAncestryError::person() const noexcept
{
    return person_;
}

std::string CyclicAncestryError::do_where() const
{
    return "make_family";
}

std::string CyclicAncestryError::do_why() const
{
    return "the family records make '" + person_ + "' their own ancestor";
}

std::string CyclicAncestryError::do_help() const
{
    return "check the mother and father columns of the family file";
}

} // namespace heredity
