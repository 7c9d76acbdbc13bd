// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "impossible_evidence_error.hpp"

#include <utility>

namespace heredity {

ImpossibleEvidenceError::ImpossibleEvidenceError(std::string person) : person_ {std::move(person)} {}

const std::string& ImpossibleEvidenceError::person() const noexcept
{
    return person_;
}

std::string ImpossibleEvidenceError::do_where() const
{
    return "normalise";
}

std::string ImpossibleEvidenceError::do_why() const
{
    return "the observed traits have zero probability for '" + person_ + "' under the given probability tables";
}

std::string ImpossibleEvidenceError::do_help() const
{
    return "use a gene prior and trait penetrance that give every observed trait a non-zero probability";
}

} // namespace heredity
