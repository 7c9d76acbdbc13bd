// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef probability_tables_hpp
#define probability_tables_hpp

#include <array>
#include <string>

#include "basics/gene_count.hpp"
#include "exceptions/user_error.hpp"

namespace heredity {

/**
 The fixed parameters of the inheritance model: the gene prior for founders, the rate at which a
 transmitted gene copy mutates, and the probability of expressing the trait for each gene count.
 */
class ProbabilityTables
{
public:
    using Probability       = double;
    using GeneDistribution  = std::array<Probability, num_gene_counts>;
    using TraitDistribution = std::array<Probability, 2>; // indexed by trait status
    using TraitTable        = std::array<TraitDistribution, num_gene_counts>;
    
    // The default tables
    ProbabilityTables();
    
    ProbabilityTables(GeneDistribution gene_prior, TraitTable trait_given_gene, Probability mutation_rate);
    
    ProbabilityTables(const ProbabilityTables&)            = default;
    ProbabilityTables& operator=(const ProbabilityTables&) = default;
    ProbabilityTables(ProbabilityTables&&)                 = default;
    ProbabilityTables& operator=(ProbabilityTables&&)      = default;
    
    ~ProbabilityTables() = default;
    
    Probability gene_prior(GeneCount genes) const noexcept;
    const GeneDistribution& gene_prior() const noexcept;
    Probability trait_given_gene(GeneCount genes, bool has_trait) const noexcept;
    const TraitDistribution& trait_given_gene(GeneCount genes) const noexcept;
    Probability mutation_rate() const noexcept;
    
private:
    GeneDistribution gene_prior_;
    TraitTable trait_given_gene_;
    Probability mutation_rate_;
};

class InvalidProbabilityTables : public UserError
{
public:
    InvalidProbabilityTables(std::string why);
    
private:
    std::string do_where() const override;
    std::string do_why() const override;
    std::string do_help() const override;
    
    std::string why_;
};

// Builds trait rows {1 - q, q} from the probability q of expressing the trait with each gene count
ProbabilityTables make_probability_tables(ProbabilityTables::GeneDistribution gene_prior,
                                          const std::array<ProbabilityTables::Probability, num_gene_counts>& trait_penetrance,
                                          ProbabilityTables::Probability mutation_rate);

// P(trait) for a person whose gene count follows the prior
ProbabilityTables::TraitDistribution marginal_trait_prior(const ProbabilityTables& tables) noexcept;

} // namespace heredity

#endif
