// Template implementations for graph.hpp

#ifndef AGENTFLOW_GRAPH_IMPL_HPP
#define AGENTFLOW_GRAPH_IMPL_HPP

#include <agentflow/graph.hpp>
#include <type_traits>

namespace agentflow {

template <typename Key>
GraphBuilder& GraphBuilder::add_conditional_edge(const std::string& from,
                                                 std::function<Key(const State&)> route,
                                                 const std::vector<std::pair<Key, std::string>>& table) {
  static_assert(std::is_enum_v<Key>, "routing keys must be an enumeration");

  ConditionalEdge edge;
  for (const auto& key : RouteKeys<Key>::values) {
    edge.range.push_back(to_string(key));
  }
  for (const auto& [key, target] : table) {
    edge.table.emplace_back(to_string(key), target);
  }
  edge.route = [fn = std::move(route)](const State& state) {
    return to_string(fn(state));
  };
  return add_conditional_edge(from, std::move(edge));
}

}  // namespace agentflow

#endif  // AGENTFLOW_GRAPH_IMPL_HPP
