// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "hypothesis_enumerator.hpp"

#include <limits>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <memory>

#include "exceptions/family_too_large_error.hpp"

namespace heredity {

namespace {

using Rank = HypothesisEnumerator::Rank;

bool multiply_overflows(const Rank lhs, const Rank rhs) noexcept
{
    return lhs > std::numeric_limits<Rank>::max() / rhs;
}

Rank count_hypotheses(const std::size_t num_members, const std::size_t num_unobserved)
{
    Rank result {1};
    const auto multiply = [&] (const Rank radix) {
        if (multiply_overflows(result, radix)) {
            throw FamilyTooLargeError {num_members, num_unobserved};
        }
        result *= radix;
    };
    for (std::size_t i {0}; i < num_members; ++i) multiply(num_gene_counts);
    for (std::size_t i {0}; i < num_unobserved; ++i) multiply(2);
    return result;
}

GeneCount next(const GeneCount genes) noexcept
{
    return genes == GeneCount::zero ? GeneCount::one : GeneCount::two;
}

} // namespace

HypothesisEnumerator::HypothesisEnumerator(const Family& family)
: first_(family.size())
, unobserved_ {}
{
    unobserved_.reserve(family.size());
    for (Family::MemberIndex i {0}; i < family.size(); ++i) {
        const auto& trait = family[i].trait;
        if (trait) {
            first_[i].has_trait = *trait;
        } else {
            unobserved_.push_back(i);
        }
    }
    size_ = count_hypotheses(first_.size(), unobserved_.size());
}

HypothesisEnumerator::Rank HypothesisEnumerator::size() const noexcept
{
    return size_;
}

HypothesisEnumerator::Iterator HypothesisEnumerator::begin() const
{
    return Iterator {*this, 0};
}

HypothesisEnumerator::Iterator HypothesisEnumerator::end() const
{
    return Iterator {*this, size_};
}

HypothesisEnumerator::RankRange HypothesisEnumerator::range(const Rank first, Rank last) const
{
    last = std::min(last, size_);
    if (first >= last) return {end(), end()};
    return {Iterator {*this, first}, Iterator {*this, last}};
}

Assignment HypothesisEnumerator::at(Rank rank) const
{
    if (rank >= size_) {
        throw std::out_of_range {"HypothesisEnumerator: rank " + std::to_string(rank) + " is out of range"};
    }
    auto result = first_;
    for (auto& state : result) {
        state.genes = to_gene_count(rank % num_gene_counts);
        rank /= num_gene_counts;
    }
    for (auto member : unobserved_) {
        result[member].has_trait = rank % 2 == 1;
        rank /= 2;
    }
    return result;
}

// private methods

void HypothesisEnumerator::advance(Assignment& assignment) const noexcept
{
    for (auto& state : assignment) {
        if (state.genes != GeneCount::two) {
            state.genes = next(state.genes);
            return;
        }
        state.genes = GeneCount::zero;
    }
    for (auto member : unobserved_) {
        if (!assignment[member].has_trait) {
            assignment[member].has_trait = true;
            return;
        }
        assignment[member].has_trait = false;
    }
}

// HypothesisEnumerator::Iterator

HypothesisEnumerator::Iterator::Iterator(const HypothesisEnumerator& enumerator, const Rank rank)
: enumerator_ {std::addressof(enumerator)}
, rank_ {rank}
{
    if (rank_ < enumerator_->size()) {
        assignment_ = enumerator_->at(rank_);
    }
}

HypothesisEnumerator::Iterator::reference HypothesisEnumerator::Iterator::operator*() const noexcept
{
    return assignment_;
}

HypothesisEnumerator::Iterator::pointer HypothesisEnumerator::Iterator::operator->() const noexcept
{
    return std::addressof(assignment_);
}

HypothesisEnumerator::Iterator& HypothesisEnumerator::Iterator::operator++()
{
    ++rank_;
    if (rank_ < enumerator_->size()) {
        enumerator_->advance(assignment_);
    } else {
        assignment_.clear();
    }
    return *this;
}

HypothesisEnumerator::Iterator HypothesisEnumerator::Iterator::operator++(int)
{
    auto result = *this;
    ++(*this);
    return result;
}

HypothesisEnumerator::Rank HypothesisEnumerator::Iterator::rank() const noexcept
{
    return rank_;
}

bool operator==(const HypothesisEnumerator::Iterator& lhs, const HypothesisEnumerator::Iterator& rhs) noexcept
{
    return lhs.enumerator_ == rhs.enumerator_ && lhs.rank_ == rhs.rank_;
}

bool operator!=(const HypothesisEnumerator::Iterator& lhs, const HypothesisEnumerator::Iterator& rhs) noexcept
{
    return !(lhs == rhs);
}

} // namespace heredity
