// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef family_hpp
#define family_hpp

#include <vector>
#include <unordered_map>
#include <cstddef>

#include <boost/graph/adjacency_list.hpp>
#include <boost/optional.hpp>

#include "config/common.hpp"

namespace heredity {

/**
 A Family is a set of named members linked by parent to offspring relationships. Members are
 indexed in the order they are added, and every member has either two parents or none.
 */
class Family
{
public:
    struct Member
    {
        PersonName name;
        boost::optional<bool> trait = boost::none; // observed trait status
    };
    
    using MemberIndex = std::size_t;
    
    Family() = default;
    Family(std::size_t family_size_hint);
    
    Family(const Family&)            = default;
    Family& operator=(const Family&) = default;
    Family(Family&&)                 = default;
    Family& operator=(Family&&)      = default;
    
    ~Family() = default;
    
    MemberIndex add_member(Member member);
    void add_parents(const PersonName& offspring, const PersonName& mother, const PersonName& father);
    
    bool is_member(const PersonName& member) const noexcept;
    bool is_founder(const PersonName& member) const;
    bool is_founder(MemberIndex member) const;
    bool is_observed(MemberIndex member) const;
    std::size_t num_parents(const PersonName& member) const;
    
    MemberIndex index_of(const PersonName& member) const;
    const Member& operator[](MemberIndex member) const;
    const Member& at(const PersonName& member) const;
    
    boost::optional<const PersonName&> mother_of(const PersonName& child) const;
    boost::optional<const PersonName&> father_of(const PersonName& child) const;
    boost::optional<MemberIndex> mother_of(MemberIndex child) const;
    boost::optional<MemberIndex> father_of(MemberIndex child) const;
    
    // Returns a member who is their own ancestor, if there is one
    boost::optional<const PersonName&> find_ancestral_cycle() const;
    
    std::size_t num_observed() const noexcept;
    
    bool is_empty() const noexcept;
    std::size_t size() const noexcept;
    
private:
    enum class ParentRole { mother, father };
    
    struct Parentage
    {
        ParentRole role;
    };
    
    using Tree   = boost::adjacency_list<boost::vecS, boost::vecS, boost::bidirectionalS, Member, Parentage>;
    using Vertex = typename boost::graph_traits<Tree>::vertex_descriptor;
    
    Tree tree_;
    std::unordered_map<PersonName, Vertex> members_;
    
    Vertex get_vertex(const PersonName& member) const;
    boost::optional<Vertex> parent_of(Vertex child, ParentRole role) const;
};

struct FamilyRecord
{
    PersonName name;
    boost::optional<PersonName> mother = boost::none, father = boost::none;
    boost::optional<bool> trait = boost::none;
};

// Throws MalformedRecordError or CyclicAncestryError if the records do not describe a valid family
Family make_family(const std::vector<FamilyRecord>& records);

std::vector<PersonName> member_names(const Family& family);

} // namespace heredity

#endif
