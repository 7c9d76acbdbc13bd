// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef hypothesis_enumerator_hpp
#define hypothesis_enumerator_hpp

#include <vector>
#include <iterator>
#include <cstddef>
#include <cstdint>

#include <boost/range/iterator_range.hpp>

#include "basics/family.hpp"
#include "core/types/assignment.hpp"

namespace heredity {

/**
 HypothesisEnumerator lazily generates every Assignment of gene counts and trait statuses to the
 members of a family that agrees with the observed traits.
 
 Hypotheses are ranked by treating the assignment as a mixed-radix number: the gene count of
 each member (radix 3) in member order, followed by the trait status of each unobserved member
 (radix 2). Iteration is in rank order.
 */
class HypothesisEnumerator
{
public:
    using Rank = std::uint64_t;
    
    class Iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = Assignment;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const Assignment*;
        using reference         = const Assignment&;
        
        Iterator() = default;
        Iterator(const HypothesisEnumerator& enumerator, Rank rank);
        
        reference operator*() const noexcept;
        pointer operator->() const noexcept;
        
        Iterator& operator++();
        Iterator operator++(int);
        
        Rank rank() const noexcept;
        
        friend bool operator==(const Iterator& lhs, const Iterator& rhs) noexcept;
        
    private:
        const HypothesisEnumerator* enumerator_ = nullptr;
        Rank rank_ = 0;
        Assignment assignment_ = {};
    };
    
    using const_iterator = Iterator;
    using RankRange      = boost::iterator_range<Iterator>;
    
    HypothesisEnumerator() = delete;
    
    // Throws FamilyTooLargeError if the number of hypotheses is not representable
    HypothesisEnumerator(const Family& family);
    
    HypothesisEnumerator(const HypothesisEnumerator&)            = default;
    HypothesisEnumerator& operator=(const HypothesisEnumerator&) = default;
    HypothesisEnumerator(HypothesisEnumerator&&)                 = default;
    HypothesisEnumerator& operator=(HypothesisEnumerator&&)      = default;
    
    ~HypothesisEnumerator() = default;
    
    // 3^n * 2^u for n members with u unobserved
    Rank size() const noexcept;
    
    Iterator begin() const;
    Iterator end() const;
    
    // The hypotheses with ranks in [first, last)
    RankRange range(Rank first, Rank last) const;
    
    Assignment at(Rank rank) const;
    
private:
    Assignment first_;
    std::vector<Family::MemberIndex> unobserved_;
    Rank size_;
    
    void advance(Assignment& assignment) const noexcept;
};

bool operator!=(const HypothesisEnumerator::Iterator& lhs, const HypothesisEnumerator::Iterator& rhs) noexcept;

} // namespace heredity

#endif
