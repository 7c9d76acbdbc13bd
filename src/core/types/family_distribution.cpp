// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "family_distribution.hpp"

#include <algorithm>
#include <functional>
#include <cmath>
#include <cassert>
#include <string>

#include "utils/maths.hpp"
#include "exceptions/impossible_evidence_error.hpp"
#include "exceptions/program_error.hpp"

namespace heredity {

FamilyDistribution::FamilyDistribution(std::size_t num_members) : members_(num_members) {}

const MemberDistribution& FamilyDistribution::operator[](const MemberIndex member) const noexcept
{
    return members_[member];
}

std::size_t FamilyDistribution::size() const noexcept
{
    return members_.size();
}

FamilyDistribution::const_iterator FamilyDistribution::begin() const noexcept
{
    return std::cbegin(members_);
}

FamilyDistribution::const_iterator FamilyDistribution::end() const noexcept
{
    return std::cend(members_);
}

void FamilyDistribution::reset() noexcept
{
    std::fill(std::begin(members_), std::end(members_), MemberDistribution {});
}

void FamilyDistribution::update(const Assignment& hypothesis, const Probability probability)
{
    assert(hypothesis.size() == members_.size());
    std::size_t member {0};
    for (const auto& state : hypothesis) {
        members_[member].genes[index_of(state.genes)] += probability;
        members_[member].traits[index_of(state.has_trait)] += probability;
        ++member;
    }
}

namespace {

class IncompatibleDistributions : public ProgramError
{
    std::string do_where() const override { return "FamilyDistribution::operator+="; }
    std::string do_why() const override
    {
        return "tried to add distributions over " + std::to_string(lhs_size_) + " and "
               + std::to_string(rhs_size_) + " family members";
    }
    std::size_t lhs_size_, rhs_size_;
public:
    IncompatibleDistributions(std::size_t lhs_size, std::size_t rhs_size) : lhs_size_ {lhs_size}, rhs_size_ {rhs_size} {}
};

template <typename Array>
void add(Array& lhs, const Array& rhs) noexcept
{
    std::transform(std::cbegin(lhs), std::cend(lhs), std::cbegin(rhs), std::begin(lhs), std::plus<> {});
}

template <typename Array>
bool is_normalisable(const Array& tallies) noexcept
{
    const auto norm = maths::sum(tallies);
    return std::isfinite(norm) && norm > 0;
}

} // namespace

FamilyDistribution& FamilyDistribution::operator+=(const FamilyDistribution& other)
{
    if (other.size() != size()) {
        throw IncompatibleDistributions {size(), other.size()};
    }
    for (std::size_t i {0}; i < members_.size(); ++i) {
        add(members_[i].genes, other.members_[i].genes);
        add(members_[i].traits, other.members_[i].traits);
    }
    return *this;
}

void FamilyDistribution::normalise(const Family& family)
{
    assert(family.size() == members_.size());
    for (MemberIndex i {0}; i < members_.size(); ++i) {
        auto& member = members_[i];
        if (!(is_normalisable(member.genes) && is_normalisable(member.traits))) {
            throw ImpossibleEvidenceError {family[i].name};
        }
        maths::normalise(member.genes);
        maths::normalise(member.traits);
    }
}

} // namespace heredity
