// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef assignment_hpp
#define assignment_hpp

#include <vector>
#include <iosfwd>

#include "basics/gene_count.hpp"

namespace heredity {

struct MemberState
{
    GeneCount genes = GeneCount::zero;
    bool has_trait = false;
};

// One hypothesis for the whole family, indexed by Family::MemberIndex
using Assignment = std::vector<MemberState>;

bool operator==(const MemberState& lhs, const MemberState& rhs) noexcept;
bool operator!=(const MemberState& lhs, const MemberState& rhs) noexcept;
bool operator<(const MemberState& lhs, const MemberState& rhs) noexcept;

std::ostream& operator<<(std::ostream& os, const MemberState& state);
std::ostream& operator<<(std::ostream& os, const Assignment& assignment);

} // namespace heredity

#endif
