// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "gene_count.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

namespace heredity {

GeneCount to_gene_count(const unsigned copies)
{
    if (copies >= num_gene_counts) {
        throw std::out_of_range {"to_gene_count: " + std::to_string(copies) + " is not a valid number of gene copies"};
    }
    return all_gene_counts[copies];
}

std::ostream& operator<<(std::ostream& os, const GeneCount genes)
{
    os << index_of(genes);
    return os;
}

} // namespace heredity
