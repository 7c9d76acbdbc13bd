// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef inheritance_model_hpp
#define inheritance_model_hpp

#include <array>

#include "basics/gene_count.hpp"

namespace heredity {

/**
 Each parent passes one of their two gene copies to their child, and the passed copy mutates
 (gains or loses the gene) with probability mutation_rate.
 */
class InheritanceModel
{
public:
    using Probability = double;
    
    InheritanceModel() = delete;
    
    InheritanceModel(Probability mutation_rate);
    
    InheritanceModel(const InheritanceModel&)            = default;
    InheritanceModel& operator=(const InheritanceModel&) = default;
    InheritanceModel(InheritanceModel&&)                 = default;
    InheritanceModel& operator=(InheritanceModel&&)      = default;
    
    ~InheritanceModel() = default;
    
    // p(parent passes a copy of the gene)
    Probability transmission_probability(GeneCount parent) const noexcept;
    
    // p(offspring | mother, father)
    Probability evaluate(GeneCount offspring, GeneCount mother, GeneCount father) const noexcept;
    
private:
    std::array<Probability, num_gene_counts> transmission_probabilities_;
};

} // namespace heredity

#endif
