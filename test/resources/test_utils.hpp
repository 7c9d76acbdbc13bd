// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef heredity_test_utils_hpp
#define heredity_test_utils_hpp

#include <cmath>
#include <string>
#include <vector>
#include <initializer_list>
#include <utility>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include <basics/family.hpp>

namespace heredity { namespace test {

inline boost::filesystem::path family_file(const std::string& name)
{
    return boost::filesystem::path {HEREDITY_TEST_RESOURCES_DIR} / "families" / name;
}

inline boost::filesystem::path config_file(const std::string& name)
{
    return boost::filesystem::path {HEREDITY_TEST_RESOURCES_DIR} / "config" / name;
}

template <typename RealType>
bool is_close_to_one(RealType x)
{
    return std::abs(x - 1) < 1e-9;
}

inline FamilyRecord founder(PersonName name, boost::optional<bool> trait = boost::none)
{
    return {std::move(name), boost::none, boost::none, trait};
}

inline FamilyRecord child(PersonName name, PersonName mother, PersonName father,
                          boost::optional<bool> trait = boost::none)
{
    return {std::move(name), std::move(mother), std::move(father), trait};
}

inline Family make_test_family(std::initializer_list<FamilyRecord> records)
{
    return make_family(std::vector<FamilyRecord> {records});
}

} // namespace test
} // namespace heredity

#endif
