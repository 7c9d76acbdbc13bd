// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef family_distribution_hpp
#define family_distribution_hpp

#include <array>
#include <vector>
#include <cstddef>

#include "basics/gene_count.hpp"
#include "basics/family.hpp"
#include "assignment.hpp"

namespace heredity {

struct MemberDistribution
{
    using Probability = double;
    
    std::array<Probability, num_gene_counts> genes = {};
    std::array<Probability, 2> traits = {}; // indexed by trait status
};

/**
 A FamilyDistribution accumulates the joint probabilities of hypotheses into per-member gene
 and trait tallies. After normalise, each member's tallies are their marginal distributions.
 */
class FamilyDistribution
{
public:
    using Probability = MemberDistribution::Probability;
    using MemberIndex = Family::MemberIndex;
    using const_iterator = std::vector<MemberDistribution>::const_iterator;
    
    FamilyDistribution() = default;
    
    FamilyDistribution(std::size_t num_members);
    
    FamilyDistribution(const FamilyDistribution&)            = default;
    FamilyDistribution& operator=(const FamilyDistribution&) = default;
    FamilyDistribution(FamilyDistribution&&)                 = default;
    FamilyDistribution& operator=(FamilyDistribution&&)      = default;
    
    ~FamilyDistribution() = default;
    
    const MemberDistribution& operator[](MemberIndex member) const noexcept;
    
    std::size_t size() const noexcept;
    
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;
    
    // Sets every tally to zero
    void reset() noexcept;
    
    void update(const Assignment& hypothesis, Probability probability);
    
    // Elementwise sum. Throws a ProgramError if the distributions are over different families
    FamilyDistribution& operator+=(const FamilyDistribution& other);
    
    // Throws ImpossibleEvidenceError if a member has a zero or non-finite tally
    void normalise(const Family& family);
    
private:
    std::vector<MemberDistribution> members_;
};

} // namespace heredity

#endif
