// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>
#include <boost/test/floating_point_comparison.hpp>

#include <core/models/probability_tables.hpp>

#include "resources/test_utils.hpp"

namespace heredity { namespace test {

namespace { constexpr double tolerance {1e-10}; }

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(models)
BOOST_AUTO_TEST_SUITE(probability_tables)

BOOST_AUTO_TEST_CASE(default_tables_are_probability_distributions)
{
    const ProbabilityTables tables {};
    BOOST_CHECK_CLOSE(tables.gene_prior(GeneCount::zero), 0.96, tolerance);
    BOOST_CHECK_CLOSE(tables.gene_prior(GeneCount::one), 0.03, tolerance);
    BOOST_CHECK_CLOSE(tables.gene_prior(GeneCount::two), 0.01, tolerance);
    BOOST_CHECK_CLOSE(tables.trait_given_gene(GeneCount::two, true), 0.65, tolerance);
    BOOST_CHECK_CLOSE(tables.trait_given_gene(GeneCount::one, true), 0.56, tolerance);
    BOOST_CHECK_CLOSE(tables.trait_given_gene(GeneCount::zero, true), 0.01, tolerance);
    BOOST_CHECK_CLOSE(tables.mutation_rate(), 0.01, tolerance);
    for (auto genes : all_gene_counts) {
        const auto& row = tables.trait_given_gene(genes);
        BOOST_CHECK(is_close_to_one(row[0] + row[1]));
    }
}

BOOST_AUTO_TEST_CASE(tables_reject_values_that_are_not_probabilities)
{
    const ProbabilityTables::TraitTable trait_given_gene {{{0.99, 0.01}, {0.44, 0.56}, {0.35, 0.65}}};
    BOOST_CHECK_NO_THROW((ProbabilityTables {{{0.5, 0.25, 0.25}}, trait_given_gene, 0.0}));
    BOOST_CHECK_THROW((ProbabilityTables {{{0.5, 0.25, 0.5}}, trait_given_gene, 0.01}), InvalidProbabilityTables);
    BOOST_CHECK_THROW((ProbabilityTables {{{1.5, -0.25, -0.25}}, trait_given_gene, 0.01}), InvalidProbabilityTables);
    BOOST_CHECK_THROW((ProbabilityTables {{{0.96, 0.03, 0.01}}, {{{0.9, 0.01}, {0.44, 0.56}, {0.35, 0.65}}}, 0.01}),
                      InvalidProbabilityTables);
    BOOST_CHECK_THROW((ProbabilityTables {{{0.96, 0.03, 0.01}}, trait_given_gene, 1.01}), InvalidProbabilityTables);
}

BOOST_AUTO_TEST_CASE(make_probability_tables_builds_trait_rows_from_penetrance)
{
    const auto tables = make_probability_tables({{0.9, 0.08, 0.02}}, {{0.1, 0.5, 0.9}}, 0.02);
    BOOST_CHECK_CLOSE(tables.trait_given_gene(GeneCount::zero, false), 0.9, tolerance);
    BOOST_CHECK_CLOSE(tables.trait_given_gene(GeneCount::two, true), 0.9, tolerance);
    BOOST_CHECK_CLOSE(tables.trait_given_gene(GeneCount::one, false), 0.5, tolerance);
    BOOST_CHECK_CLOSE(tables.gene_prior(GeneCount::two), 0.02, tolerance);
    BOOST_CHECK_CLOSE(tables.mutation_rate(), 0.02, tolerance);
    BOOST_CHECK_THROW(make_probability_tables({{0.9, 0.08, 0.02}}, {{0.1, 1.5, 0.9}}, 0.02), InvalidProbabilityTables);
}

BOOST_AUTO_TEST_CASE(marginal_trait_prior_sums_over_the_gene_prior)
{
    const auto trait_prior = marginal_trait_prior(ProbabilityTables {});
    BOOST_CHECK_CLOSE(trait_prior[index_of(true)], 0.0329, tolerance);
    BOOST_CHECK_CLOSE(trait_prior[index_of(false)], 0.9671, tolerance);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace heredity
