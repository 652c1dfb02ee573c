// Implementation file for graph.hpp

#include <agentflow/graph.hpp>
#include <spdlog/spdlog.h>
#include <taskflow/taskflow.hpp>
#include <algorithm>
#include <deque>
#include <stdexcept>

namespace agentflow {

// ============================================================================
// Graph implementation
// ============================================================================

const Graph::Vertex& Graph::vertex(const std::string& id) const {
  auto it = vertices_.find(id);
  if (it == vertices_.end()) {
    throw std::out_of_range("Node not found: " + id);
  }
  return it->second;
}

const NodeDef& Graph::node(const std::string& id) const {
  return vertex(id).def;
}

const std::vector<std::string>& Graph::successors(const std::string& id) const {
  return vertex(id).successors;
}

bool Graph::has_conditional_edge(const std::string& id) const {
  return vertex(id).conditional.has_value();
}

std::vector<std::string> Graph::unreachable() const {
  std::unordered_set<std::string> seen(reachable_.begin(), reachable_.end());
  std::vector<std::string> out;
  for (const auto& id : order_) {
    if (seen.count(id) == 0) {
      out.push_back(id);
    }
  }
  return out;
}

std::optional<std::string> Graph::next(const std::string& id, const State& state) const {
  const auto& v = vertex(id);
  if (v.conditional) {
    auto key = v.conditional->route(state);
    for (const auto& [label, target] : v.conditional->table) {
      if (label == key) {
        return target;
      }
    }
    throw RoutingError(id, key);
  }
  if (v.edge) {
    return *v.edge;
  }
  return std::nullopt;
}

int Graph::successor_index(const std::string& from, const std::string& to) const {
  const auto& succ = successors(from);
  auto it = std::find(succ.begin(), succ.end(), to);
  if (it == succ.end()) {
    throw std::out_of_range("'" + to + "' is not a successor of '" + from + "'");
  }
  return static_cast<int>(it - succ.begin());
}

void Graph::dump(std::ostream& os) const {
  tf::Taskflow taskflow(name_);
  std::unordered_map<std::string, tf::Task> tasks;
  for (const auto& id : order_) {
    tasks[id] = taskflow.placeholder().name(id);
  }
  auto start = taskflow.placeholder().name("START");
  auto end = taskflow.placeholder().name("END");
  if (auto it = tasks.find(entry_); it != tasks.end()) {
    start.precede(it->second);
  }
  for (const auto& id : order_) {
    const auto& succ = vertices_.at(id).successors;
    if (succ.empty()) {
      tasks[id].precede(end);
    }
    for (const auto& s : succ) {
      tasks[id].precede(tasks[s]);
    }
  }
  taskflow.dump(os);
}

// ============================================================================
// GraphBuilder implementation
// ============================================================================

GraphBuilder::GraphBuilder(const std::string& name) : name_(name) {}

GraphBuilder& GraphBuilder::add_node(const std::string& id, NodeFn fn, FieldSet writes) {
  nodes_.push_back(NodeDef{id, std::move(fn), writes});
  return *this;
}

GraphBuilder& GraphBuilder::add_edge(const std::string& from, const std::string& to) {
  edges_.emplace_back(from, to);
  return *this;
}

GraphBuilder& GraphBuilder::add_conditional_edge(const std::string& from, ConditionalEdge edge) {
  conditional_edges_.emplace_back(from, std::move(edge));
  return *this;
}

GraphBuilder& GraphBuilder::set_entry(const std::string& id) {
  entry_ = id;
  return *this;
}

GraphBuilder& GraphBuilder::set_terminal(const std::string& id) {
  terminals_.push_back(id);
  return *this;
}

Graph GraphBuilder::build() const {
  Graph graph;
  graph.name_ = name_;

  for (const auto& def : nodes_) {
    if (def.id.empty()) {
      throw ValidationError("Node id must not be empty");
    }
    if (!def.fn) {
      throw ValidationError("Node '" + def.id + "' has no function");
    }
    if (graph.vertices_.count(def.id) != 0) {
      throw ValidationError("Duplicate node id: " + def.id);
    }
    graph.vertices_.emplace(def.id, Graph::Vertex{def, std::nullopt, std::nullopt, {}});
    graph.order_.push_back(def.id);
  }

  auto require_node = [&graph](const std::string& id, const std::string& what) -> Graph::Vertex& {
    auto it = graph.vertices_.find(id);
    if (it == graph.vertices_.end()) {
      throw ValidationError(what + " references unknown node '" + id + "'");
    }
    return it->second;
  };

  for (const auto& [from, to] : edges_) {
    auto& v = require_node(from, "Edge " + from + " -> " + to);
    require_node(to, "Edge " + from + " -> " + to);
    if (v.edge || v.conditional) {
      throw ValidationError("Node '" + from + "' has more than one outgoing edge");
    }
    v.edge = to;
    v.successors.push_back(to);
  }

  for (const auto& [from, edge] : conditional_edges_) {
    auto& v = require_node(from, "Conditional edge from " + from);
    if (v.edge || v.conditional) {
      throw ValidationError("Node '" + from + "' has more than one outgoing edge");
    }
    if (!edge.route) {
      throw ValidationError("Conditional edge from '" + from + "' has no routing function");
    }
    for (const auto& key : edge.range) {
      auto hit = std::find_if(edge.table.begin(), edge.table.end(),
                              [&key](const auto& entry) { return entry.first == key; });
      if (hit == edge.table.end()) {
        throw ValidationError("Routing table of '" + from + "' is missing key '" + key + "'");
      }
    }
    for (const auto& [key, target] : edge.table) {
      require_node(target, "Routing table of '" + from + "' (key '" + key + "')");
      if (std::find(v.successors.begin(), v.successors.end(), target) == v.successors.end()) {
        v.successors.push_back(target);
      }
    }
    v.conditional = edge;
  }

  if (!entry_) {
    throw ValidationError("Graph '" + name_ + "' has no entry node");
  }
  require_node(*entry_, "Entry");
  graph.entry_ = *entry_;

  for (const auto& id : terminals_) {
    const auto& v = require_node(id, "Terminal marker");
    if (!v.successors.empty()) {
      throw ValidationError("Terminal node '" + id + "' has outgoing edges");
    }
  }

  // Breadth-first walk from the entry
  std::unordered_set<std::string> seen{graph.entry_};
  std::deque<std::string> queue{graph.entry_};
  bool reaches_end = false;
  while (!queue.empty()) {
    auto id = queue.front();
    queue.pop_front();
    graph.reachable_.push_back(id);
    const auto& succ = graph.vertices_.at(id).successors;
    if (succ.empty()) {
      reaches_end = true;
    }
    for (const auto& s : succ) {
      if (seen.insert(s).second) {
        queue.push_back(s);
      }
    }
  }
  if (!reaches_end) {
    throw ValidationError("No terminal node is reachable from entry '" + graph.entry_ + "'");
  }

  for (const auto& id : graph.unreachable()) {
    spdlog::warn("graph '{}': node '{}' is not reachable from '{}'", name_, id, graph.entry_);
  }
  spdlog::debug("graph '{}' built: {} nodes, entry '{}'", name_, graph.order_.size(), graph.entry_);
  return graph;
}

}  // namespace agentflow
