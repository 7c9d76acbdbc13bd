// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef maths_hpp
#define maths_hpp

#include <iterator>
#include <numeric>
#include <type_traits>

namespace heredity { namespace maths {

template <typename Range>
auto sum(const Range& probabilities)
{
    using Probability = typename std::decay<decltype(*std::cbegin(probabilities))>::type;
    return std::accumulate(std::cbegin(probabilities), std::cend(probabilities), Probability {0});
}

// Scales the probabilities to sum to one and returns the old sum. Nothing changes if the sum
// is not positive.
template <typename Range>
auto normalise(Range& probabilities)
{
    const auto norm = sum(probabilities);
    if (norm > 0) {
        for (auto& probability : probabilities) probability /= norm;
    }
    return norm;
}

} // namespace maths
} // namespace heredity

#endif
