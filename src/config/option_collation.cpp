// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "option_collation.hpp"

#include <array>
#include <vector>
#include <string>
#include <algorithm>

namespace fs = boost::filesystem;

namespace heredity { namespace options {

namespace {

bool is_given(const OptionMap& options, const std::string& option)
{
    return options.count(option) == 1;
}

template <typename T>
boost::optional<T> get_if_given(const OptionMap& options, const std::string& option)
{
    if (!is_given(options, option)) return boost::none;
    return options.at(option).as<T>();
}

// Integer options are stored as int so that negative input is caught by validation
unsigned get_unsigned(const OptionMap& options, const std::string& option)
{
    return static_cast<unsigned>(options.at(option).as<int>());
}

ProbabilityTables::GeneDistribution get_per_gene_count(const OptionMap& options, const std::string& option)
{
    const auto& values = options.at(option).as<std::vector<double>>();
    ProbabilityTables::GeneDistribution result {};
    std::copy_n(std::cbegin(values), std::min(values.size(), result.size()), std::begin(result));
    return result;
}

} // namespace

bool is_run_command(const OptionMap& options)
{
    return !is_given(options, "help") && !is_given(options, "version");
}

boost::optional<fs::path> get_debug_log_file_name(const OptionMap& options)
{
    return get_if_given<fs::path>(options, "debug");
}

boost::optional<fs::path> get_trace_log_file_name(const OptionMap& options)
{
    return get_if_given<fs::path>(options, "trace");
}

fs::path get_family_file(const OptionMap& options)
{
    return options.at("family").as<fs::path>();
}

boost::optional<fs::path> get_output_file(const OptionMap& options)
{
    return get_if_given<fs::path>(options, "output");
}

unsigned get_output_precision(const OptionMap& options)
{
    return get_unsigned(options, "precision");
}

ProbabilityTables make_probability_tables(const OptionMap& options)
{
    return heredity::make_probability_tables(get_per_gene_count(options, "gene-prior"),
                                             get_per_gene_count(options, "trait-penetrance"),
                                             options.at("mutation-rate").as<double>());
}

InferenceOptions make_inference_options(const OptionMap& options)
{
    InferenceOptions result {};
    result.max_threads = get_unsigned(options, "threads");
    result.execution_policy = result.max_threads == 1 ? ExecutionPolicy::seq : ExecutionPolicy::par;
    return result;
}

} // namespace options
} // namespace heredity
