// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef gene_count_hpp
#define gene_count_hpp

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>

namespace heredity {

// The number of copies of the gene carried by a person
enum class GeneCount : std::uint8_t { zero, one, two };

constexpr std::size_t num_gene_counts {3};

constexpr std::array<GeneCount, num_gene_counts> all_gene_counts {{GeneCount::zero, GeneCount::one, GeneCount::two}};

constexpr std::size_t index_of(const GeneCount genes) noexcept
{
    return static_cast<std::size_t>(genes);
}

constexpr std::size_t index_of(const bool has_trait) noexcept
{
    return has_trait ? 1 : 0;
}

GeneCount to_gene_count(unsigned copies);

std::ostream& operator<<(std::ostream& os, GeneCount genes);

} // namespace heredity

#endif
