// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "inheritance_model.hpp"

namespace heredity {

InheritanceModel::InheritanceModel(const Probability mutation_rate)
: transmission_probabilities_ {{mutation_rate, 0.5, 1 - mutation_rate}}
{}

InheritanceModel::Probability InheritanceModel::transmission_probability(const GeneCount parent) const noexcept
{
    return transmission_probabilities_[index_of(parent)];
}

InheritanceModel::Probability
InheritanceModel::evaluate(const GeneCount offspring, const GeneCount mother, const GeneCount father) const noexcept
{
    const auto p_mother = transmission_probability(mother);
    const auto p_father = transmission_probability(father);
    switch (offspring) {
        case GeneCount::two: return p_mother * p_father;
        case GeneCount::one: return p_mother * (1 - p_father) + (1 - p_mother) * p_father;
        case GeneCount::zero:
        default: return (1 - p_mother) * (1 - p_father);
    }
}

} // namespace heredity
