// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef joint_probability_model_hpp
#define joint_probability_model_hpp

#include <vector>
#include <utility>
#include <cstddef>

#include "basics/family.hpp"
#include "core/types/assignment.hpp"
#include "probability_tables.hpp"
#include "inheritance_model.hpp"

namespace heredity {

class JointProbabilityModel
{
public:
    using Probability = double;
    
    JointProbabilityModel() = delete;
    
    JointProbabilityModel(const Family& family, ProbabilityTables tables);
    
    JointProbabilityModel(const JointProbabilityModel&)            = default;
    JointProbabilityModel& operator=(const JointProbabilityModel&) = default;
    JointProbabilityModel(JointProbabilityModel&&)                 = default;
    JointProbabilityModel& operator=(JointProbabilityModel&&)      = default;
    
    ~JointProbabilityModel() = default;
    
    // p(assignment), unnormalised. The assignment must cover every member of the family.
    Probability evaluate(const Assignment& assignment) const;
    
private:
    using MemberIndex = Family::MemberIndex;
    
    std::size_t family_size_;
    std::vector<MemberIndex> founders_;
    std::vector<std::pair<MemberIndex, std::pair<MemberIndex, MemberIndex>>> offspring_with_two_parents_;
    ProbabilityTables tables_;
    InheritanceModel inheritance_model_;
};

} // namespace heredity

#endif
