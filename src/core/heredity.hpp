// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef heredity_hpp
#define heredity_hpp

#include "config/common.hpp"
#include "basics/family.hpp"
#include "core/models/probability_tables.hpp"
#include "core/types/family_distribution.hpp"

namespace heredity {

struct InferenceOptions
{
    ExecutionPolicy execution_policy = ExecutionPolicy::seq;
    unsigned max_threads = 1; // 0 means use all hardware threads
};

/**
 Computes the exact marginal gene and trait distributions of every member of the family by
 summing the joint probability of every hypothesis consistent with the observed traits.
 
 With ExecutionPolicy::par the hypotheses are split into one contiguous block per thread and the
 partial sums are combined in block order.
 */
FamilyDistribution infer(const Family& family, const ProbabilityTables& tables, InferenceOptions options = {});

} // namespace heredity

#endif
