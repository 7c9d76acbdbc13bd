// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "heredity.hpp"

#include <vector>
#include <future>
#include <thread>
#include <chrono>
#include <algorithm>
#include <cstddef>

#include "core/tools/hypothesis_enumerator.hpp"
#include "core/models/joint_probability_model.hpp"
#include "utils/thread_pool.hpp"
#include "utils/timing.hpp"
#include "utils/string_utils.hpp"
#include "logging/logging.hpp"

namespace heredity {

namespace {

using Rank = HypothesisEnumerator::Rank;

template <typename Range>
FamilyDistribution accumulate(const Range& hypotheses, const JointProbabilityModel& model, const std::size_t family_size)
{
    FamilyDistribution result {family_size};
    for (const auto& hypothesis : hypotheses) {
        result.update(hypothesis, model.evaluate(hypothesis));
    }
    return result;
}

unsigned count_threads(const InferenceOptions& options)
{
    if (options.execution_policy == ExecutionPolicy::seq) return 1;
    if (options.max_threads > 0) return options.max_threads;
    return std::max(std::thread::hardware_concurrency(), 1u);
}

struct RankBlock
{
    Rank first, last;
};

std::vector<RankBlock> make_blocks(const Rank num_hypotheses, const Rank max_blocks)
{
    const auto num_blocks = std::max(std::min(num_hypotheses, max_blocks), Rank {1});
    const auto block_size = num_hypotheses / num_blocks, remainder = num_hypotheses % num_blocks;
    std::vector<RankBlock> result {};
    result.reserve(num_blocks);
    Rank first {0};
    for (Rank block {0}; block < num_blocks; ++block) {
        const auto last = first + block_size + (block < remainder ? 1 : 0);
        result.push_back({first, last});
        first = last;
    }
    return result;
}

FamilyDistribution accumulate(const HypothesisEnumerator& hypotheses, const JointProbabilityModel& model,
                              const std::size_t family_size, const unsigned num_threads)
{
    const auto blocks = make_blocks(hypotheses.size(), num_threads);
    if (blocks.size() == 1) {
        return accumulate(hypotheses, model, family_size);
    }
    static auto debug_log = logging::get_debug_log();
    if (debug_log) stream(*debug_log) << "Splitting " << hypotheses.size() << " hypotheses into " << blocks.size() << " blocks";
    ThreadPool workers {blocks.size()};
    std::vector<std::future<FamilyDistribution>> partial_results {};
    partial_results.reserve(blocks.size());
    for (const auto& block : blocks) {
        if (debug_log) stream(*debug_log) << "Spawning block [" << block.first << ", " << block.last << ")";
        partial_results.push_back(workers.submit([&hypotheses, &model, family_size, block] () {
            return accumulate(hypotheses.range(block.first, block.last), model, family_size);
        }));
    }
    FamilyDistribution result {family_size};
    for (auto& partial_result : partial_results) {
        result += partial_result.get();
    }
    return result;
}

void log_distributions(const Family& family, const FamilyDistribution& distribution)
{
    static auto trace_log = logging::get_trace_log();
    if (trace_log) {
        for (Family::MemberIndex member {0}; member < family.size(); ++member) {
            const auto& marginals = distribution[member];
            stream(*trace_log) << family[member].name
                               << " genes: {0: " << marginals.genes[0] << ", 1: " << marginals.genes[1] << ", 2: " << marginals.genes[2] << '}'
                               << " trait: {false: " << marginals.traits[0] << ", true: " << marginals.traits[1] << '}';
        }
    }
}

} // namespace

FamilyDistribution infer(const Family& family, const ProbabilityTables& tables, const InferenceOptions options)
{
    logging::InfoLogger info_log {};
    static auto debug_log = logging::get_debug_log();
    utils::TimeInterval duration {std::chrono::steady_clock::now(), {}};
    const HypothesisEnumerator hypotheses {family};
    stream(info_log) << "Inferring distributions of " << family.size() << " family members ("
                     << family.num_observed() << " observed) from " << hypotheses.size() << " hypotheses";
    if (debug_log) stream(*debug_log) << "Family members: " << utils::join(member_names(family), ", ");
    const JointProbabilityModel model {family, tables};
    auto result = accumulate(hypotheses, model, family.size(), count_threads(options));
    result.normalise(family);
    duration.end = std::chrono::steady_clock::now();
    stream(info_log) << "Finished inference in " << duration;
    log_distributions(family, result);
    return result;
}

} // namespace heredity
