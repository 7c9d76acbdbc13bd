// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef family_reader_hpp
#define family_reader_hpp

#include <vector>

#include <boost/filesystem/path.hpp>

#include "basics/family.hpp"

namespace heredity { namespace io {

// Reads a CSV file with the columns name, mother, father and trait (in any order)
std::vector<FamilyRecord> read_family_records(const boost::filesystem::path& family_file);

Family read_family(const boost::filesystem::path& family_file);

} // namespace io
} // namespace heredity

#endif
