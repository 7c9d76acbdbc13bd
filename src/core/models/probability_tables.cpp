// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "probability_tables.hpp"

#include <cmath>
#include <sstream>
#include <utility>
#include <algorithm>

#include "utils/maths.hpp"

namespace heredity {

namespace {

static constexpr double distribution_tolerance {1e-9};

bool is_probability(const double p) noexcept
{
    return std::isfinite(p) && p >= 0 && p <= 1;
}

template <typename Range>
bool is_distribution(const Range& probabilities)
{
    return std::all_of(std::cbegin(probabilities), std::cend(probabilities), is_probability)
           && std::abs(maths::sum(probabilities) - 1.0) < distribution_tolerance;
}

template <typename Range>
std::string to_string(const Range& probabilities)
{
    std::ostringstream ss {};
    ss << '{';
    bool first {true};
    for (auto p : probabilities) {
        if (!first) ss << ", ";
        ss << p;
        first = false;
    }
    ss << '}';
    return ss.str();
}

void validate(const ProbabilityTables::GeneDistribution& gene_prior,
              const ProbabilityTables::TraitTable& trait_given_gene,
              const ProbabilityTables::Probability mutation_rate)
{
    if (!is_distribution(gene_prior)) {
        throw InvalidProbabilityTables {"the gene prior " + to_string(gene_prior) + " is not a probability distribution"};
    }
    for (auto genes : all_gene_counts) {
        const auto& row = trait_given_gene[index_of(genes)];
        if (!is_distribution(row)) {
            std::ostringstream ss {};
            ss << "the trait distribution " << to_string(row) << " for " << genes
               << " gene copies is not a probability distribution";
            throw InvalidProbabilityTables {ss.str()};
        }
    }
    if (!is_probability(mutation_rate)) {
        std::ostringstream ss {};
        ss << "the mutation rate " << mutation_rate << " is not a probability";
        throw InvalidProbabilityTables {ss.str()};
    }
}

} // namespace

ProbabilityTables::ProbabilityTables()
: ProbabilityTables {{0.96, 0.03, 0.01}, {{{0.99, 0.01}, {0.44, 0.56}, {0.35, 0.65}}}, 0.01}
{}

ProbabilityTables::ProbabilityTables(GeneDistribution gene_prior, TraitTable trait_given_gene, Probability mutation_rate)
: gene_prior_ {std::move(gene_prior)}
, trait_given_gene_ {std::move(trait_given_gene)}
, mutation_rate_ {mutation_rate}
{
    validate(gene_prior_, trait_given_gene_, mutation_rate_);
}

ProbabilityTables::Probability ProbabilityTables::gene_prior(const GeneCount genes) const noexcept
{
    return gene_prior_[index_of(genes)];
}

const ProbabilityTables::GeneDistribution& ProbabilityTables::gene_prior() const noexcept
{
    return gene_prior_;
}

ProbabilityTables::Probability ProbabilityTables::trait_given_gene(const GeneCount genes, const bool has_trait) const noexcept
{
    return trait_given_gene_[index_of(genes)][index_of(has_trait)];
}

const ProbabilityTables::TraitDistribution& ProbabilityTables::trait_given_gene(const GeneCount genes) const noexcept
{
    return trait_given_gene_[index_of(genes)];
}

ProbabilityTables::Probability ProbabilityTables::mutation_rate() const noexcept
{
    return mutation_rate_;
}

InvalidProbabilityTables::InvalidProbabilityTables(std::string why) : why_ {std::move(why)} {}

std::string InvalidProbabilityTables::do_where() const
{
    return "ProbabilityTables";
}

std::string InvalidProbabilityTables::do_why() const
{
    return why_;
}

std::string InvalidProbabilityTables::do_help() const
{
    return "check the values given to --gene-prior, --trait-penetrance and --mutation-rate";
}

// non-member methods

ProbabilityTables make_probability_tables(ProbabilityTables::GeneDistribution gene_prior,
                                          const std::array<ProbabilityTables::Probability, num_gene_counts>& trait_penetrance,
                                          const ProbabilityTables::Probability mutation_rate)
{
    ProbabilityTables::TraitTable trait_given_gene {};
    for (auto genes : all_gene_counts) {
        const auto q = trait_penetrance[index_of(genes)];
        trait_given_gene[index_of(genes)] = {{1 - q, q}};
    }
    return ProbabilityTables {std::move(gene_prior), trait_given_gene, mutation_rate};
}

ProbabilityTables::TraitDistribution marginal_trait_prior(const ProbabilityTables& tables) noexcept
{
    ProbabilityTables::TraitDistribution result {};
    for (auto genes : all_gene_counts) {
        for (bool has_trait : {false, true}) {
            result[index_of(has_trait)] += tables.gene_prior(genes) * tables.trait_given_gene(genes, has_trait);
        }
    }
    return result;
}

} // namespace heredity
