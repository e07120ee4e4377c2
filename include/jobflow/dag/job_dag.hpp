#pragma once

#include "jobflow/core/error.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace jobflow {

// Graph of namespaced job names. Both adjacency directions are kept in step;
// a node without edges has no entry in either map.
//
// Acyclicity is the caller's invariant: mutators do not search for cycles.
// validate() checks the whole graph when a definition is submitted.
class JobDag {
public:
  using NodeSet = std::set<std::string, std::less<>>;
  using Adjacency = std::map<std::string, NodeSet, std::less<>>;

  auto add_node(std::string_view node) -> void;

  // Drops `node` and its edges. When it had exactly one parent and one child
  // the two are linked directly, so a chain stays a chain.
  auto remove_node(std::string_view node) -> bool;
  // Drops `node` and its edges without relinking its neighbours.
  auto erase_node(std::string_view node) -> bool;

  // Adds both endpoints when missing.
  auto add_parent_to_child(std::string_view parent, std::string_view child)
      -> void;
  auto remove_parent_to_child(std::string_view parent, std::string_view child)
      -> void;

  [[nodiscard]] auto has_node(std::string_view node) const -> bool {
    return all_nodes_.contains(node);
  }
  [[nodiscard]] auto direct_children(std::string_view node) const
      -> const NodeSet&;
  [[nodiscard]] auto direct_parents(std::string_view node) const
      -> const NodeSet&;
  [[nodiscard]] auto ancestors(std::string_view node) const -> NodeSet;

  [[nodiscard]] auto all_nodes() const noexcept -> const NodeSet& {
    return all_nodes_;
  }
  [[nodiscard]] auto parents_to_children() const noexcept -> const Adjacency& {
    return parents_to_children_;
  }
  [[nodiscard]] auto children_to_parents() const noexcept -> const Adjacency& {
    return children_to_parents_;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return all_nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return all_nodes_.empty();
  }
  auto clear() -> void;

  // Nodes in dependency order; shorter than size() when a cycle exists.
  [[nodiscard]] auto topological_order() const -> std::vector<std::string>;

  // Adjacency symmetry, edge endpoints present, no cycles.
  [[nodiscard]] auto validate() const -> Result<void>;

  [[nodiscard]] auto to_json() const -> std::string;
  [[nodiscard]] static auto from_json(std::string_view text) -> Result<JobDag>;

  [[nodiscard]] friend auto operator==(const JobDag&, const JobDag&)
      -> bool = default;

private:
  NodeSet all_nodes_;
  Adjacency parents_to_children_;
  Adjacency children_to_parents_;
};

}  // namespace jobflow
