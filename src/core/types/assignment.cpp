// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "assignment.hpp"

#include <ostream>
#include <tuple>

namespace heredity {

bool operator==(const MemberState& lhs, const MemberState& rhs) noexcept
{
    return lhs.genes == rhs.genes && lhs.has_trait == rhs.has_trait;
}

bool operator!=(const MemberState& lhs, const MemberState& rhs) noexcept
{
    return !(lhs == rhs);
}

bool operator<(const MemberState& lhs, const MemberState& rhs) noexcept
{
    return std::tie(lhs.genes, lhs.has_trait) < std::tie(rhs.genes, rhs.has_trait);
}

std::ostream& operator<<(std::ostream& os, const MemberState& state)
{
    os << '(' << state.genes << ", " << (state.has_trait ? "trait" : "no trait") << ')';
    return os;
}

std::ostream& operator<<(std::ostream& os, const Assignment& assignment)
{
    os << '[';
    bool first {true};
    for (const auto& state : assignment) {
        if (!first) os << ' ';
        os << state;
        first = false;
    }
    os << ']';
    return os;
}

} // namespace heredity
