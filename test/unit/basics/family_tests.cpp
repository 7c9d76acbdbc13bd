// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <vector>
#include <stdexcept>

#include <basics/family.hpp>
#include <exceptions/malformed_record_error.hpp>
#include <exceptions/cyclic_ancestry_error.hpp>

#include "resources/test_utils.hpp"

namespace heredity { namespace test {

BOOST_AUTO_TEST_SUITE(basics)
BOOST_AUTO_TEST_SUITE(family)

BOOST_AUTO_TEST_CASE(family_members_are_indexed_in_insertion_order)
{
    Family family {};
    BOOST_CHECK(family.is_empty());
    BOOST_CHECK_EQUAL(family.add_member({"James", true}), 0);
    BOOST_CHECK_EQUAL(family.add_member({"Lily", false}), 1);
    BOOST_CHECK_EQUAL(family.add_member({"Harry"}), 2);
    BOOST_CHECK_EQUAL(family.size(), 3);
    BOOST_CHECK_EQUAL(family.index_of("Harry"), 2);
    BOOST_CHECK_EQUAL(family[1].name, "Lily");
    BOOST_CHECK(family.is_observed(0));
    BOOST_CHECK(!family.is_observed(2));
    BOOST_CHECK_EQUAL(family.num_observed(), 2);
    BOOST_CHECK_THROW(family.add_member({"Lily"}), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(parents_can_be_found_by_name_and_index)
{
    Family family {};
    family.add_member({"James"});
    family.add_member({"Lily"});
    family.add_member({"Harry"});
    family.add_parents("Harry", "Lily", "James");
    BOOST_REQUIRE(family.mother_of("Harry"));
    BOOST_CHECK_EQUAL(*family.mother_of("Harry"), "Lily");
    BOOST_REQUIRE(family.father_of("Harry"));
    BOOST_CHECK_EQUAL(*family.father_of("Harry"), "James");
    BOOST_CHECK_EQUAL(*family.mother_of(2), 1);
    BOOST_CHECK_EQUAL(*family.father_of(2), 0);
    BOOST_CHECK(!family.mother_of("James"));
    BOOST_CHECK(family.is_founder("Lily"));
    BOOST_CHECK(!family.is_founder(2));
    BOOST_CHECK_EQUAL(family.num_parents("Harry"), 2);
    BOOST_CHECK_THROW(family.add_parents("Harry", "Lily", "James"), std::logic_error);
    BOOST_CHECK_THROW(family.add_parents("Lily", "Petunia", "James"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(make_family_allows_parents_to_be_listed_after_their_children)
{
    const auto family = make_test_family({child("Harry", "Lily", "James"), founder("James", true), founder("Lily", false)});
    BOOST_CHECK_EQUAL(family.size(), 3);
    BOOST_CHECK_EQUAL(family[0].name, "Harry");
    BOOST_CHECK_EQUAL(*family.mother_of("Harry"), "Lily");
    BOOST_CHECK(!family[0].trait);
    BOOST_CHECK(*family.at("James").trait);
    BOOST_CHECK(!*family.at("Lily").trait);
    const std::vector<PersonName> names {"Harry", "James", "Lily"};
    BOOST_CHECK(member_names(family) == names);
}

BOOST_AUTO_TEST_CASE(make_family_rejects_malformed_records)
{
    using Reason = MalformedRecordError::Reason;
    try {
        make_test_family({child("Harry", "Lily", "James"), founder("James")});
        BOOST_FAIL("unknown parent accepted");
    } catch (const MalformedRecordError& e) {
        BOOST_CHECK_EQUAL(e.person(), "Harry");
        BOOST_CHECK(e.reason() == Reason::unknown_parent);
    }
    try {
        make_test_family({{"Harry", PersonName {"Lily"}, boost::none, boost::none}, founder("Lily")});
        BOOST_FAIL("single parent accepted");
    } catch (const MalformedRecordError& e) {
        BOOST_CHECK(e.reason() == Reason::single_parent);
    }
    try {
        make_test_family({founder("Lily"), founder("Lily")});
        BOOST_FAIL("duplicate name accepted");
    } catch (const MalformedRecordError& e) {
        BOOST_CHECK(e.reason() == Reason::duplicate_name);
    }
    try {
        make_test_family({founder("")});
        BOOST_FAIL("empty name accepted");
    } catch (const MalformedRecordError& e) {
        BOOST_CHECK(e.reason() == Reason::empty_name);
    }
}

BOOST_AUTO_TEST_CASE(make_family_rejects_ancestral_cycles)
{
    BOOST_CHECK_THROW(make_test_family({child("Alice", "Beth", "Carl"), child("Beth", "Alice", "Carl"), founder("Carl")}),
                      CyclicAncestryError);
    BOOST_CHECK_THROW(make_test_family({child("Alice", "Alice", "Carl"), founder("Carl")}), CyclicAncestryError);
    BOOST_CHECK_NO_THROW(make_test_family({child("Alice", "Beth", "Carl"), child("Beth", "Dora", "Carl"),
                                           founder("Carl"), founder("Dora")}));
}

BOOST_AUTO_TEST_CASE(cycle_detection_names_a_member_of_the_cycle)
{
    try {
        make_test_family({founder("Dora"), child("Alice", "Beth", "Dora"), child("Beth", "Alice", "Dora")});
        BOOST_FAIL("cycle accepted");
    } catch (const CyclicAncestryError& e) {
        BOOST_CHECK(e.person() == "Alice" || e.person() == "Beth");
    }
}

BOOST_AUTO_TEST_CASE(empty_record_lists_make_empty_families)
{
    const auto family = make_family({});
    BOOST_CHECK(family.is_empty());
    BOOST_CHECK(!family.find_ancestral_cycle());
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace heredity
