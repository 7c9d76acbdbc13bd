// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "joint_probability_model.hpp"

#include <utility>
#include <cassert>

namespace heredity {

JointProbabilityModel::JointProbabilityModel(const Family& family, ProbabilityTables tables)
: family_size_ {family.size()}
, founders_ {}
, offspring_with_two_parents_ {}
, tables_ {std::move(tables)}
, inheritance_model_ {tables_.mutation_rate()}
{
    for (MemberIndex member {0}; member < family.size(); ++member) {
        const auto mother = family.mother_of(member);
        const auto father = family.father_of(member);
        if (mother && father) {
            offspring_with_two_parents_.push_back({member, {*mother, *father}});
        } else {
            founders_.push_back(member);
        }
    }
}

JointProbabilityModel::Probability JointProbabilityModel::evaluate(const Assignment& assignment) const
{
    assert(assignment.size() == family_size_);
    Probability result {1};
    for (auto founder : founders_) {
        result *= tables_.gene_prior(assignment[founder].genes);
    }
    for (const auto& p : offspring_with_two_parents_) {
        result *= inheritance_model_.evaluate(assignment[p.first].genes,
                                              assignment[p.second.first].genes,
                                              assignment[p.second.second].genes);
    }
    for (const auto& state : assignment) {
        result *= tables_.trait_given_gene(state.genes, state.has_trait);
    }
    return result;
}

} // namespace heredity
