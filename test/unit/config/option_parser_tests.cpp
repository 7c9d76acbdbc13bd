// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include <config/option_parser.hpp>
#include <config/option_collation.hpp>
#include <exceptions/user_error.hpp>

#include "resources/test_utils.hpp"

namespace heredity { namespace test {

BOOST_AUTO_TEST_SUITE(config)
BOOST_AUTO_TEST_SUITE(option_parser)

namespace {

static constexpr double tolerance {1e-12};

heredity::options::OptionMap parse(std::vector<const char*> args)
{
    args.insert(std::begin(args), "heredity");
    return heredity::options::parse_options(static_cast<int>(args.size()), args.data());
}

bool mentions(const heredity::options::CommandLineError& error, const std::string& text)
{
    return error.why().find(text) != std::string::npos;
}

} // namespace

BOOST_AUTO_TEST_CASE(the_family_file_can_be_given_by_position_or_by_name)
{
    BOOST_CHECK_EQUAL(heredity::options::get_family_file(parse({"family0.csv"})).string(), "family0.csv");
    BOOST_CHECK_EQUAL(heredity::options::get_family_file(parse({"--family", "family1.csv"})).string(), "family1.csv");
    BOOST_CHECK_EQUAL(heredity::options::get_family_file(parse({"-f", "family2.csv"})).string(), "family2.csv");
}

BOOST_AUTO_TEST_CASE(a_missing_family_file_option_is_a_user_error)
{
    BOOST_CHECK_THROW(parse({}), heredity::options::CommandLineError);
    BOOST_CHECK_THROW(parse({"--threads", "2"}), UserError);
    try {
        parse({"--precision", "3"});
        BOOST_FAIL("expected a CommandLineError");
    } catch (const heredity::options::CommandLineError& e) {
        BOOST_CHECK(mentions(e, "--family"));
        BOOST_CHECK_EQUAL(e.type(), "user");
    }
}

BOOST_AUTO_TEST_CASE(unknown_options_are_rejected)
{
    try {
        parse({"family.csv", "--generations", "3"});
        BOOST_FAIL("expected a CommandLineError");
    } catch (const heredity::options::CommandLineError& e) {
        BOOST_CHECK(mentions(e, "--generations"));
    }
}

BOOST_AUTO_TEST_CASE(defaults_are_used_when_no_model_options_are_given)
{
    const auto options = parse({"family.csv"});
    BOOST_CHECK(heredity::options::is_run_command(options));
    BOOST_CHECK(!heredity::options::get_output_file(options));
    BOOST_CHECK(!heredity::options::get_debug_log_file_name(options));
    BOOST_CHECK(!heredity::options::get_trace_log_file_name(options));
    BOOST_CHECK_EQUAL(heredity::options::get_output_precision(options), 4u);
    
    const auto tables = heredity::options::make_probability_tables(options);
    BOOST_CHECK_CLOSE(tables.gene_prior(GeneCount::zero), 0.96, tolerance);
    BOOST_CHECK_CLOSE(tables.gene_prior(GeneCount::two), 0.01, tolerance);
    BOOST_CHECK_CLOSE(tables.trait_given_gene(GeneCount::one, true), 0.56, tolerance);
    BOOST_CHECK_CLOSE(tables.mutation_rate(), 0.01, tolerance);
    
    const auto inference = heredity::options::make_inference_options(options);
    BOOST_CHECK(inference.execution_policy == ExecutionPolicy::seq);
    BOOST_CHECK_EQUAL(inference.max_threads, 1u);
}

BOOST_AUTO_TEST_CASE(model_options_are_collated_into_probability_tables)
{
    const auto options = parse({"--family", "family.csv",
                                "--gene-prior", "0.5", "0.3", "0.2",
                                "--trait-penetrance", "0.1", "0.4", "0.9",
                                "--mutation-rate", "0.2"});
    const auto tables = heredity::options::make_probability_tables(options);
    BOOST_CHECK_CLOSE(tables.gene_prior(GeneCount::zero), 0.5, tolerance);
    BOOST_CHECK_CLOSE(tables.gene_prior(GeneCount::one), 0.3, tolerance);
    BOOST_CHECK_CLOSE(tables.gene_prior(GeneCount::two), 0.2, tolerance);
    BOOST_CHECK_CLOSE(tables.trait_given_gene(GeneCount::zero, true), 0.1, tolerance);
    BOOST_CHECK_CLOSE(tables.trait_given_gene(GeneCount::two, true), 0.9, tolerance);
    BOOST_CHECK_CLOSE(tables.trait_given_gene(GeneCount::two, false), 0.1, tolerance);
    BOOST_CHECK_CLOSE(tables.mutation_rate(), 0.2, tolerance);
}

BOOST_AUTO_TEST_CASE(probabilities_must_be_between_zero_and_one)
{
    BOOST_CHECK_THROW(parse({"family.csv", "--mutation-rate", "1.5"}), heredity::options::CommandLineError);
    BOOST_CHECK_THROW(parse({"family.csv", "--mutation-rate=-0.1"}), heredity::options::CommandLineError);
    BOOST_CHECK_THROW(parse({"--family", "family.csv", "--trait-penetrance", "0.1", "1.2", "0.3"}),
                      heredity::options::CommandLineError);
    BOOST_CHECK_NO_THROW(parse({"family.csv", "--mutation-rate", "0"}));
    BOOST_CHECK_NO_THROW(parse({"family.csv", "--mutation-rate", "1"}));
    try {
        parse({"family.csv", "--mutation-rate", "1.5"});
        BOOST_FAIL("expected a CommandLineError");
    } catch (const heredity::options::CommandLineError& e) {
        BOOST_CHECK(mentions(e, "--mutation-rate"));
        BOOST_CHECK(mentions(e, "between 0 and 1"));
    }
}

BOOST_AUTO_TEST_CASE(per_gene_count_options_need_exactly_three_values)
{
    BOOST_CHECK_THROW(parse({"--family", "family.csv", "--gene-prior", "0.5", "0.5"}),
                      heredity::options::CommandLineError);
    BOOST_CHECK_THROW(parse({"--family", "family.csv", "--trait-penetrance", "0.1", "0.2", "0.3", "0.4"}),
                      heredity::options::CommandLineError);
    try {
        parse({"--family", "family.csv", "--gene-prior", "0.5", "0.5"});
        BOOST_FAIL("expected a CommandLineError");
    } catch (const heredity::options::CommandLineError& e) {
        BOOST_CHECK(mentions(e, "needs 3 values but 2 were given"));
    }
}

BOOST_AUTO_TEST_CASE(threads_and_precision_must_not_be_negative)
{
    BOOST_CHECK_THROW(parse({"family.csv", "--threads=-1"}), heredity::options::CommandLineError);
    BOOST_CHECK_THROW(parse({"family.csv", "--precision=-2"}), heredity::options::CommandLineError);
    try {
        parse({"family.csv", "--precision=-2"});
        BOOST_FAIL("expected a CommandLineError");
    } catch (const heredity::options::CommandLineError& e) {
        BOOST_CHECK(mentions(e, "--precision"));
        BOOST_CHECK(mentions(e, "must not be negative"));
    }
    BOOST_CHECK_EQUAL(heredity::options::get_output_precision(parse({"family.csv", "--precision", "0"})), 0u);
}

BOOST_AUTO_TEST_CASE(more_than_one_thread_selects_parallel_inference)
{
    const auto parallel = heredity::options::make_inference_options(parse({"family.csv", "--threads", "3"}));
    BOOST_CHECK(parallel.execution_policy == ExecutionPolicy::par);
    BOOST_CHECK_EQUAL(parallel.max_threads, 3u);
    
    const auto all_hardware = heredity::options::make_inference_options(parse({"family.csv", "-t", "0"}));
    BOOST_CHECK(all_hardware.execution_policy == ExecutionPolicy::par);
    BOOST_CHECK_EQUAL(all_hardware.max_threads, 0u);
    
    const auto sequential = heredity::options::make_inference_options(parse({"family.csv", "--threads", "1"}));
    BOOST_CHECK(sequential.execution_policy == ExecutionPolicy::seq);
}

BOOST_AUTO_TEST_CASE(command_line_values_take_precedence_over_the_config_file)
{
    const auto file = config_file("low_mutation.cfg").string();
    const auto from_file = parse({"family.csv", "--config", file.c_str()});
    BOOST_CHECK_EQUAL(heredity::options::make_inference_options(from_file).max_threads, 4u);
    BOOST_CHECK_CLOSE(heredity::options::make_probability_tables(from_file).mutation_rate(), 0.05, tolerance);
    
    const auto overridden = parse({"family.csv", "--config", file.c_str(), "--threads", "2"});
    BOOST_CHECK_EQUAL(heredity::options::make_inference_options(overridden).max_threads, 2u);
    BOOST_CHECK_CLOSE(heredity::options::make_probability_tables(overridden).mutation_rate(), 0.05, tolerance);
    
    BOOST_CHECK_THROW(parse({"family.csv", "--config", "no_such_file.cfg"}), heredity::options::CommandLineError);
}

BOOST_AUTO_TEST_CASE(help_requests_are_not_run_commands)
{
    const auto options = parse({"--help"});
    BOOST_CHECK(!heredity::options::is_run_command(options));
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace heredity
