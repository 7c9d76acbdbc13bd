// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>

#include <io/family/family_reader.hpp>
#include <exceptions/missing_file_error.hpp>
#include <exceptions/malformed_file_error.hpp>
#include <exceptions/malformed_record_error.hpp>
#include <exceptions/cyclic_ancestry_error.hpp>

#include "resources/test_utils.hpp"

namespace heredity { namespace test {

BOOST_AUTO_TEST_SUITE(io)
BOOST_AUTO_TEST_SUITE(family_reader)

BOOST_AUTO_TEST_CASE(read_family_records_reads_records_in_file_order)
{
    const auto records = heredity::io::read_family_records(family_file("family0.csv"));
    BOOST_REQUIRE_EQUAL(records.size(), 3);
    BOOST_CHECK_EQUAL(records[0].name, "Harry");
    BOOST_CHECK_EQUAL(*records[0].mother, "Lily");
    BOOST_CHECK_EQUAL(*records[0].father, "James");
    BOOST_CHECK(!records[0].trait);
    BOOST_CHECK_EQUAL(records[1].name, "James");
    BOOST_CHECK(!records[1].mother && !records[1].father);
    BOOST_CHECK(records[1].trait && *records[1].trait);
    BOOST_CHECK(records[2].trait && !*records[2].trait);
}

BOOST_AUTO_TEST_CASE(read_family_builds_the_family_graph)
{
    const auto family = heredity::io::read_family(family_file("family1.csv"));
    BOOST_CHECK_EQUAL(family.size(), 6);
    BOOST_CHECK_EQUAL(family.num_observed(), 3);
    BOOST_CHECK_EQUAL(*family.mother_of("Ron"), "Molly");
    BOOST_CHECK_EQUAL(*family.father_of("Ginny"), "Arthur");
    BOOST_CHECK(family.is_founder("Molly"));
}

BOOST_AUTO_TEST_CASE(columns_can_be_in_any_order)
{
    const auto records = heredity::io::read_family_records(family_file("reordered_columns.csv"));
    BOOST_REQUIRE_EQUAL(records.size(), 3);
    BOOST_CHECK_EQUAL(records[0].name, "James");
    BOOST_CHECK(records[0].trait && *records[0].trait);
    BOOST_CHECK_EQUAL(records[1].name, "Harry");
    BOOST_CHECK_EQUAL(*records[1].mother, "Lily");
    BOOST_CHECK_EQUAL(*records[1].father, "James");
    BOOST_CHECK(!records[1].trait);
    BOOST_CHECK_EQUAL(records[2].name, "Lily");
    BOOST_CHECK(records[2].trait && !*records[2].trait);
}

BOOST_AUTO_TEST_CASE(quoted_fields_can_contain_commas)
{
    const auto records = heredity::io::read_family_records(family_file("quoted_commas.csv"));
    BOOST_REQUIRE_EQUAL(records.size(), 4);
    BOOST_CHECK_EQUAL(records[0].name, "Smith, Jo");
    BOOST_CHECK(!records[0].mother && !records[0].father);
    BOOST_CHECK(records[0].trait && *records[0].trait);
    BOOST_CHECK_EQUAL(records[1].name, "Potter, Harry");
    BOOST_CHECK_EQUAL(*records[1].mother, "Evans, Lily");
    BOOST_CHECK_EQUAL(*records[1].father, "Potter, James");
    BOOST_CHECK(!records[1].trait);
    const auto family = heredity::io::read_family(family_file("quoted_commas.csv"));
    BOOST_CHECK_EQUAL(*family.mother_of("Potter, Harry"), "Evans, Lily");
}

BOOST_AUTO_TEST_CASE(missing_files_are_reported)
{
    BOOST_CHECK_THROW(heredity::io::read_family_records(family_file("no_such_family.csv")), MissingFileError);
}

BOOST_AUTO_TEST_CASE(malformed_files_are_reported)
{
    BOOST_CHECK_THROW(heredity::io::read_family_records(family_file("missing_trait_column.csv")), MalformedFileError);
    BOOST_CHECK_THROW(heredity::io::read_family_records(family_file("bad_trait.csv")), MalformedFileError);
    BOOST_CHECK_THROW(heredity::io::read_family_records(family_file("wrong_field_count.csv")), MalformedFileError);
    BOOST_CHECK_THROW(heredity::io::read_family_records(family_file("no_header.csv")), MalformedFileError);
    BOOST_CHECK_THROW(heredity::io::read_family_records(family_file("unterminated_quote.csv")), MalformedFileError);
}

BOOST_AUTO_TEST_CASE(malformed_file_errors_give_the_line_number)
{
    try {
        heredity::io::read_family_records(family_file("bad_trait.csv"));
        BOOST_FAIL("bad trait accepted");
    } catch (const MalformedFileError& e) {
        BOOST_CHECK(e.why().find("line 3") != std::string::npos);
        BOOST_CHECK(e.why().find("yes") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(invalid_families_are_reported)
{
    BOOST_CHECK_NO_THROW(heredity::io::read_family_records(family_file("unknown_parent.csv")));
    BOOST_CHECK_THROW(heredity::io::read_family(family_file("unknown_parent.csv")), MalformedRecordError);
    BOOST_CHECK_THROW(heredity::io::read_family(family_file("single_parent.csv")), MalformedRecordError);
    BOOST_CHECK_THROW(heredity::io::read_family(family_file("cyclic_ancestry.csv")), CyclicAncestryError);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace heredity
