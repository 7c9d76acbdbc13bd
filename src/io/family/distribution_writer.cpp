// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "distribution_writer.hpp"

#include <ostream>
#include <stdexcept>
#include <iterator>

#include "basics/gene_count.hpp"
#include "utils/string_utils.hpp"

namespace heredity { namespace io {

namespace {

void write(std::ostream& os, const PersonName& name, const MemberDistribution& distribution, const unsigned precision)
{
    os << name << ":\n";
    os << "  Gene:\n";
    for (auto itr = std::crbegin(all_gene_counts); itr != std::crend(all_gene_counts); ++itr) {
        os << "    " << *itr << ": " << utils::to_string(distribution.genes[index_of(*itr)], precision) << '\n';
    }
    os << "  Trait:\n";
    os << "    True: " << utils::to_string(distribution.traits[index_of(true)], precision) << '\n';
    os << "    False: " << utils::to_string(distribution.traits[index_of(false)], precision) << '\n';
}

} // namespace

void write_distributions(std::ostream& os, const Family& family, const FamilyDistribution& distribution,
                         const unsigned precision)
{
    if (distribution.size() != family.size()) {
        throw std::invalid_argument {"write_distributions: the distribution does not match the family"};
    }
    for (Family::MemberIndex member {0}; member < family.size(); ++member) {
        write(os, family[member].name, distribution[member], precision);
    }
}

} // namespace io
} // namespace heredity
