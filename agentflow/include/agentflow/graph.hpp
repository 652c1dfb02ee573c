// Workflow graph definition: nodes operating on a shared State, unconditional
// edges, conditional routing edges, entry and terminal markers.
// A GraphBuilder collects the definition; build() validates it and returns an
// immutable Graph that any number of concurrent runs may read.

#ifndef AGENTFLOW_GRAPH_HPP
#define AGENTFLOW_GRAPH_HPP

#include <agentflow/cancellation.hpp>
#include <agentflow/errors.hpp>
#include <agentflow/state.hpp>
#include <array>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace agentflow {

class Graph;
class GraphBuilder;

/**
 * @brief Body of a node
 * @details Reads the merged state, may suspend through the NodeContext, and
 *          returns only the fields it sets.
 */
using NodeFn = std::function<PartialUpdate(const State&, const NodeContext&)>;

struct NodeDef {
  std::string id;
  NodeFn fn;
  FieldSet writes;  // fields the node is allowed to set
};

// ============================================================================
// Routing keys
// ============================================================================

/**
 * @brief Declares the finite range of a routing key type
 * @details Specialize with a static `values` array listing every key a routing
 *          function over @p Key may produce. Keys are labelled with an
 *          ADL-visible `to_string(Key)`.
 */
template <typename Key>
struct RouteKeys;

template <>
struct RouteKeys<PlanNeeded> {
  static constexpr std::array<PlanNeeded, 2> values{PlanNeeded::yes, PlanNeeded::no};
};

// Type-erased conditional edge: routing yields a key label
struct ConditionalEdge {
  std::function<std::string(const State&)> route;
  std::vector<std::string> range;
  std::vector<std::pair<std::string, std::string>> table;  // label -> node id
};

// ============================================================================
// Graph (immutable)
// ============================================================================

class Graph {
 public:
  Graph(const Graph&) = delete;
  Graph& operator=(const Graph&) = delete;
  Graph(Graph&&) = default;
  Graph& operator=(Graph&&) = default;

  const std::string& name() const { return name_; }
  const std::string& entry() const { return entry_; }

  bool contains(const std::string& id) const { return vertices_.count(id) != 0; }

  /**
   * @brief Look up a node definition
   * @throws std::out_of_range if @p id is not a node of this graph
   */
  const NodeDef& node(const std::string& id) const;

  // Nodes reachable from the entry, breadth-first
  const std::vector<std::string>& reachable() const { return reachable_; }

  // Nodes declared but never reachable from the entry
  std::vector<std::string> unreachable() const;

  /**
   * @brief Possible next nodes of @p id, in routing-table order
   * @return Empty for nodes that lead to END
   */
  const std::vector<std::string>& successors(const std::string& id) const;

  bool is_terminal(const std::string& id) const { return successors(id).empty(); }
  bool has_conditional_edge(const std::string& id) const;

  /**
   * @brief Select the node that follows @p id
   * @param id Node that just completed
   * @param state State as merged after @p id
   * @return Next node id, or std::nullopt when @p id leads to END
   * @throws RoutingError if a routing function yields a key missing from its table
   */
  std::optional<std::string> next(const std::string& id, const State& state) const;

  // Position of @p to in successors(@p from)
  int successor_index(const std::string& from, const std::string& to) const;

  // Writes the graph in DOT format (Taskflow dump)
  void dump(std::ostream& os = std::cout) const;

 private:
  friend class GraphBuilder;
  Graph() = default;

  struct Vertex {
    NodeDef def;
    std::optional<std::string> edge;
    std::optional<ConditionalEdge> conditional;
    std::vector<std::string> successors;
  };

  const Vertex& vertex(const std::string& id) const;

  std::string name_;
  std::string entry_;
  std::unordered_map<std::string, Vertex> vertices_;
  std::vector<std::string> order_;  // declaration order
  std::vector<std::string> reachable_;
};

// ============================================================================
// GraphBuilder
// ============================================================================

class GraphBuilder {
 public:
  explicit GraphBuilder(const std::string& name = "agentflow");

  /**
   * @brief Register a node
   * @param id Unique node id
   * @param fn Node body
   * @param writes State fields the node may set; merging any other field fails the run
   */
  GraphBuilder& add_node(const std::string& id, NodeFn fn, FieldSet writes = {});

  // Unconditional edge from -> to
  GraphBuilder& add_edge(const std::string& from, const std::string& to);

  /**
   * @brief Conditional routing edge
   * @param from Node whose completion triggers the routing
   * @param route Routing function, evaluated on the state merged after @p from
   * @param table Key -> node id; must cover every value of RouteKeys<Key>
   */
  template <typename Key>
  GraphBuilder& add_conditional_edge(const std::string& from,
                                     std::function<Key(const State&)> route,
                                     const std::vector<std::pair<Key, std::string>>& table);

  GraphBuilder& add_conditional_edge(const std::string& from, ConditionalEdge edge);

  GraphBuilder& set_entry(const std::string& id);
  GraphBuilder& set_terminal(const std::string& id);

  /**
   * @brief Validate the definition and freeze it into a Graph
   * @throws ValidationError on duplicate ids, dangling edges, non-total routing
   *         tables, a missing entry, or no END reachable from the entry
   */
  Graph build() const;

 private:
  std::string name_;
  std::vector<NodeDef> nodes_;
  std::vector<std::pair<std::string, std::string>> edges_;
  std::vector<std::pair<std::string, ConditionalEdge>> conditional_edges_;
  std::optional<std::string> entry_;
  std::vector<std::string> terminals_;
};

}  // namespace agentflow

#include <agentflow/graph_impl.hpp>

#endif  // AGENTFLOW_GRAPH_HPP
