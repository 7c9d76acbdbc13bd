// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "family_too_large_error.hpp"

#include <sstream>

namespace heredity {

FamilyTooLargeError::FamilyTooLargeError(const std::size_t num_members, const std::size_t num_unobserved)
: num_members_ {num_members}
, num_unobserved_ {num_unobserved}
{}

std::string FamilyTooLargeError::do_where() const
{
    return "HypothesisEnumerator";
}

std::string FamilyTooLargeError::do_why() const
{
    std::ostringstream ss {};
    ss << "a family of " << num_members_ << " members, " << num_unobserved_
       << " without an observed trait, has more than 2^64 hypotheses";
    return ss.str();
}

std::string FamilyTooLargeError::do_help() const
{
    return "exact inference is only feasible for small families, so split the family file into smaller families";
}

} // namespace heredity
