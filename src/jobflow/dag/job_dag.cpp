#include "jobflow/dag/job_dag.hpp"

#include "jobflow/util/log.hpp"

#include <nlohmann/json.hpp>

#include <queue>
#include <unordered_map>

namespace jobflow {

namespace {

const JobDag::NodeSet kEmptyNodes;

auto link(JobDag::Adjacency& adj, std::string_view from, std::string_view to)
    -> void {
  auto it = adj.find(from);
  if (it == adj.end()) {
    it = adj.try_emplace(std::string(from)).first;
  }
  it->second.emplace(to);
}

auto unlink(JobDag::Adjacency& adj, std::string_view from, std::string_view to)
    -> void {
  auto it = adj.find(from);
  if (it == adj.end()) {
    return;
  }
  if (auto node = it->second.find(to); node != it->second.end()) {
    it->second.erase(node);
  }
  if (it->second.empty()) {
    adj.erase(it);
  }
}

auto adjacency_to_json(const JobDag::Adjacency& adj) -> nlohmann::json {
  auto out = nlohmann::json::object();
  for (const auto& [node, targets] : adj) {
    auto arr = nlohmann::json::array();
    for (const auto& t : targets) {
      arr.push_back(t);
    }
    out[node] = std::move(arr);
  }
  return out;
}

auto adjacency_from_json(const nlohmann::json& j, JobDag::Adjacency& adj)
    -> bool {
  if (!j.is_object()) {
    return false;
  }
  for (const auto& [node, targets] : j.items()) {
    if (!targets.is_array()) {
      return false;
    }
    for (const auto& t : targets) {
      if (!t.is_string()) {
        return false;
      }
      link(adj, node, t.get<std::string>());
    }
  }
  return true;
}

}  // namespace

auto JobDag::add_node(std::string_view node) -> void {
  all_nodes_.emplace(node);
}

auto JobDag::remove_node(std::string_view node) -> bool {
  if (!has_node(node)) {
    return false;
  }

  // Copies: erase_node edits the sets.
  NodeSet parents = direct_parents(node);
  NodeSet children = direct_children(node);
  erase_node(node);
  if (parents.size() == 1 && children.size() == 1) {
    add_parent_to_child(*parents.begin(), *children.begin());
  }
  return true;
}

auto JobDag::erase_node(std::string_view node) -> bool {
  auto it = all_nodes_.find(node);
  if (it == all_nodes_.end()) {
    return false;
  }

  NodeSet parents = direct_parents(node);
  NodeSet children = direct_children(node);
  for (const auto& p : parents) {
    remove_parent_to_child(p, node);
  }
  for (const auto& c : children) {
    remove_parent_to_child(node, c);
  }
  all_nodes_.erase(it);
  return true;
}

auto JobDag::add_parent_to_child(std::string_view parent,
                                 std::string_view child) -> void {
  add_node(parent);
  add_node(child);
  link(parents_to_children_, parent, child);
  link(children_to_parents_, child, parent);
}

auto JobDag::remove_parent_to_child(std::string_view parent,
                                    std::string_view child) -> void {
  unlink(parents_to_children_, parent, child);
  unlink(children_to_parents_, child, parent);
}

auto JobDag::direct_children(std::string_view node) const -> const NodeSet& {
  auto it = parents_to_children_.find(node);
  return it != parents_to_children_.end() ? it->second : kEmptyNodes;
}

auto JobDag::direct_parents(std::string_view node) const -> const NodeSet& {
  auto it = children_to_parents_.find(node);
  return it != children_to_parents_.end() ? it->second : kEmptyNodes;
}

auto JobDag::ancestors(std::string_view node) const -> NodeSet {
  NodeSet result;
  std::vector<std::string> stack;
  for (const auto& p : direct_parents(node)) {
    stack.push_back(p);
  }
  while (!stack.empty()) {
    std::string current = std::move(stack.back());
    stack.pop_back();
    if (!result.insert(current).second) {
      continue;
    }
    for (const auto& p : direct_parents(current)) {
      if (!result.contains(p)) {
        stack.push_back(p);
      }
    }
  }
  return result;
}

auto JobDag::clear() -> void {
  all_nodes_.clear();
  parents_to_children_.clear();
  children_to_parents_.clear();
}

auto JobDag::topological_order() const -> std::vector<std::string> {
  std::unordered_map<std::string_view, std::size_t> in_degree;
  in_degree.reserve(all_nodes_.size());
  for (const auto& node : all_nodes_) {
    in_degree[node] = direct_parents(node).size();
  }

  std::queue<std::string_view> ready;
  for (const auto& node : all_nodes_) {
    if (in_degree[node] == 0) {
      ready.push(node);
    }
  }

  std::vector<std::string> result;
  result.reserve(all_nodes_.size());
  while (!ready.empty()) {
    std::string_view current = ready.front();
    ready.pop();
    result.emplace_back(current);

    for (const auto& child : direct_children(current)) {
      auto it = in_degree.find(child);
      if (it != in_degree.end() && --it->second == 0) {
        ready.push(it->first);
      }
    }
  }
  return result;
}

auto JobDag::validate() const -> Result<void> {
  for (const auto& [parent, children] : parents_to_children_) {
    if (!all_nodes_.contains(parent)) {
      log::warn("DAG edge source {} is not a node", parent);
      return fail(Error::InvalidArgument);
    }
    for (const auto& child : children) {
      if (!all_nodes_.contains(child) ||
          !direct_parents(child).contains(parent)) {
        log::warn("DAG edge {} -> {} is not mirrored", parent, child);
        return fail(Error::InvalidArgument);
      }
    }
  }
  for (const auto& [child, parents] : children_to_parents_) {
    for (const auto& parent : parents) {
      if (!direct_children(parent).contains(child)) {
        log::warn("DAG edge {} -> {} is not mirrored", parent, child);
        return fail(Error::InvalidArgument);
      }
    }
  }

  if (topological_order().size() != all_nodes_.size()) {
    return fail(Error::CycleDetected);
  }
  return ok();
}

auto JobDag::to_json() const -> std::string {
  nlohmann::json j;
  auto nodes = nlohmann::json::array();
  for (const auto& node : all_nodes_) {
    nodes.push_back(node);
  }
  j["allNodes"] = std::move(nodes);
  j["parentsToChildren"] = adjacency_to_json(parents_to_children_);
  j["childrenToParents"] = adjacency_to_json(children_to_parents_);
  return j.dump();
}

auto JobDag::from_json(std::string_view text) -> Result<JobDag> {
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    log::error("Malformed job DAG: {}", text);
    return fail(Error::ParseError);
  }

  JobDag dag;
  if (auto nodes = j.find("allNodes"); nodes != j.end()) {
    if (!nodes->is_array()) {
      return fail(Error::ParseError);
    }
    for (const auto& node : *nodes) {
      if (!node.is_string()) {
        return fail(Error::ParseError);
      }
      dag.add_node(node.get<std::string>());
    }
  }
  if (auto p2c = j.find("parentsToChildren"); p2c != j.end()) {
    if (!adjacency_from_json(*p2c, dag.parents_to_children_)) {
      return fail(Error::ParseError);
    }
  }
  if (auto c2p = j.find("childrenToParents"); c2p != j.end()) {
    if (!adjacency_from_json(*c2p, dag.children_to_parents_)) {
      return fail(Error::ParseError);
    }
  }
  return ok(std::move(dag));
}

}  // namespace jobflow
