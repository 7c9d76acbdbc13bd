// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "family.hpp"

#include <utility>
#include <algorithm>
#include <iterator>
#include <stdexcept>

#include <boost/graph/depth_first_search.hpp>

#include "exceptions/malformed_record_error.hpp"
#include "exceptions/cyclic_ancestry_error.hpp"

namespace heredity {

// public methods

Family::Family(std::size_t family_size_hint)
{
    members_.reserve(family_size_hint);
}

Family::MemberIndex Family::add_member(Member member)
{
    if (is_member(member.name)) {
        throw std::invalid_argument {"Family: " + member.name + " is already a member"};
    }
    auto name = member.name;
    const auto result = boost::add_vertex(std::move(member), tree_);
    members_.emplace(std::move(name), result);
    return result;
}

void Family::add_parents(const PersonName& offspring, const PersonName& mother, const PersonName& father)
{
    try {
        const auto offspring_vertex = get_vertex(offspring);
        const auto mother_vertex = get_vertex(mother);
        const auto father_vertex = get_vertex(father);
        if (boost::in_degree(offspring_vertex, tree_) > 0) {
            throw std::logic_error {"Family: " + offspring + " already has parents"};
        }
        boost::add_edge(mother_vertex, offspring_vertex, Parentage {ParentRole::mother}, tree_);
        boost::add_edge(father_vertex, offspring_vertex, Parentage {ParentRole::father}, tree_);
    } catch (const std::out_of_range&) {
        throw std::runtime_error {"Family: parent not in family"};
    }
}

bool Family::is_member(const PersonName& member) const noexcept
{
    return members_.count(member) == 1;
}

bool Family::is_founder(const PersonName& member) const
{
    return num_parents(member) == 0;
}

bool Family::is_founder(const MemberIndex member) const
{
    return boost::in_degree(member, tree_) == 0;
}

bool Family::is_observed(const MemberIndex member) const
{
    return static_cast<bool>((*this)[member].trait);
}

std::size_t Family::num_parents(const PersonName& member) const
{
    return boost::in_degree(get_vertex(member), tree_);
}

Family::MemberIndex Family::index_of(const PersonName& member) const
{
    return get_vertex(member);
}

const Family::Member& Family::operator[](const MemberIndex member) const
{
    return tree_[member];
}

const Family::Member& Family::at(const PersonName& member) const
{
    return tree_[get_vertex(member)];
}

boost::optional<const PersonName&> Family::mother_of(const PersonName& child) const
{
    const auto mother = parent_of(get_vertex(child), ParentRole::mother);
    if (mother) return tree_[*mother].name;
    return boost::none;
}

boost::optional<const PersonName&> Family::father_of(const PersonName& child) const
{
    const auto father = parent_of(get_vertex(child), ParentRole::father);
    if (father) return tree_[*father].name;
    return boost::none;
}

boost::optional<Family::MemberIndex> Family::mother_of(const MemberIndex child) const
{
    return parent_of(child, ParentRole::mother);
}

boost::optional<Family::MemberIndex> Family::father_of(const MemberIndex child) const
{
    return parent_of(child, ParentRole::father);
}

namespace {

template <typename Vertex>
class AncestralCycleDetector : public boost::default_dfs_visitor
{
public:
    AncestralCycleDetector(boost::optional<Vertex>& cycle_member) : cycle_member_ {cycle_member} {}
    
    // The target of a back edge is an ancestor of its source
    template <typename Edge, typename Graph>
    void back_edge(Edge e, const Graph& g)
    {
        if (!cycle_member_) cycle_member_ = boost::target(e, g);
    }
    
private:
    boost::optional<Vertex>& cycle_member_;
};

} // namespace

boost::optional<const PersonName&> Family::find_ancestral_cycle() const
{
    if (is_empty()) return boost::none;
    boost::optional<Vertex> cycle_member {};
    boost::depth_first_search(tree_, boost::visitor(AncestralCycleDetector<Vertex> {cycle_member}));
    if (cycle_member) return tree_[*cycle_member].name;
    return boost::none;
}

std::size_t Family::num_observed() const noexcept
{
    const auto vertices = boost::vertices(tree_);
    return std::count_if(vertices.first, vertices.second, [this] (Vertex v) { return static_cast<bool>(tree_[v].trait); });
}

bool Family::is_empty() const noexcept
{
    return members_.empty();
}

std::size_t Family::size() const noexcept
{
    return members_.size();
}

// private methods

Family::Vertex Family::get_vertex(const PersonName& member) const
{
    return members_.at(member);
}

boost::optional<Family::Vertex> Family::parent_of(const Vertex child, const ParentRole role) const
{
    const auto parents = boost::in_edges(child, tree_);
    const auto itr = std::find_if(parents.first, parents.second, [&] (const auto& e) { return tree_[e].role == role; });
    if (itr == parents.second) {
        return boost::none;
    } else {
        return boost::source(*itr, tree_);
    }
}

// non-member methods

namespace {

void check_record(const FamilyRecord& record)
{
    using Reason = MalformedRecordError::Reason;
    if (record.name.empty()) {
        throw MalformedRecordError {record.name, Reason::empty_name};
    }
    if (static_cast<bool>(record.mother) != static_cast<bool>(record.father)) {
        throw MalformedRecordError {record.name, Reason::single_parent};
    }
}

void check_parent(const FamilyRecord& record, const PersonName& parent, const Family& family)
{
    if (!family.is_member(parent)) {
        throw MalformedRecordError {record.name, MalformedRecordError::Reason::unknown_parent, parent};
    }
}

} // namespace

Family make_family(const std::vector<FamilyRecord>& records)
{
    Family result {records.size()};
    for (const auto& record : records) {
        check_record(record);
        if (result.is_member(record.name)) {
            throw MalformedRecordError {record.name, MalformedRecordError::Reason::duplicate_name};
        }
        result.add_member({record.name, record.trait});
    }
    for (const auto& record : records) {
        if (record.mother) {
            check_parent(record, *record.mother, result);
            check_parent(record, *record.father, result);
            result.add_parents(record.name, *record.mother, *record.father);
        }
    }
    const auto cycle_member = result.find_ancestral_cycle();
    if (cycle_member) {
        throw CyclicAncestryError {*cycle_member};
    }
    return result;
}

std::vector<PersonName> member_names(const Family& family)
{
    std::vector<PersonName> result {};
    result.reserve(family.size());
    for (Family::MemberIndex i {0}; i < family.size(); ++i) {
        result.push_back(family[i].name);
    }
    return result;
}

} // namespace heredity
