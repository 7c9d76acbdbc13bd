// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef distribution_writer_hpp
#define distribution_writer_hpp

#include <iosfwd>

#include "basics/family.hpp"
#include "core/types/family_distribution.hpp"

namespace heredity { namespace io {

// Writes each member's gene and trait distributions, in family order, with the given number of decimal places
void write_distributions(std::ostream& os, const Family& family, const FamilyDistribution& distribution,
                         unsigned precision = 4);

} // namespace io
} // namespace heredity

#endif
