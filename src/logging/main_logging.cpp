// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "main_logging.hpp"

#include <string>
#include <sstream>
#include <cstddef>

#include "config/config.hpp"
#include "config/common.hpp"
#include "logging.hpp"

namespace heredity {

namespace {

template <typename Distribution>
std::string to_string(const Distribution& probabilities)
{
    std::ostringstream ss {};
    ss << '{';
    for (std::size_t genes {0}; genes < probabilities.size(); ++genes) {
        if (genes > 0) ss << ", ";
        ss << genes << ": " << probabilities[genes];
    }
    ss << '}';
    return ss.str();
}

} // namespace

void log_program_startup()
{
    logging::InfoLogger log {};
    stream(log) << "heredity " << config::version_string() << " (" << config::Build.build_type << " build)";
    log << config::LicenseNotice;
}

void log_program_end(const bool succeeded)
{
    logging::InfoLogger log {};
    log << (succeeded ? "heredity finished" : "heredity stopped early because of an error");
}

void log_run_settings(const ProbabilityTables& tables, const InferenceOptions& options)
{
    auto debug_log = logging::get_debug_log();
    if (!debug_log) return;
    const ProbabilityTables::GeneDistribution penetrance {{tables.trait_given_gene(GeneCount::zero, true),
                                                          tables.trait_given_gene(GeneCount::one, true),
                                                          tables.trait_given_gene(GeneCount::two, true)}};
    stream(*debug_log) << "Gene prior " << to_string(tables.gene_prior())
                       << ", mutation rate " << tables.mutation_rate()
                       << ", trait penetrance " << to_string(penetrance);
    if (options.execution_policy == ExecutionPolicy::par) {
        stream(*debug_log) << "Evaluating hypotheses on up to " << options.max_threads << " threads (0 means all)";
    } else {
        stream(*debug_log) << "Evaluating hypotheses sequentially";
    }
}

} // namespace heredity
