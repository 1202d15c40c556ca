/**
 * @file graph_algorithms.hpp
 * @brief Traversal and ordering algorithms over IDirectedGraph.
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/common/directed_graph_interface.hpp"
#include "plotgraph/common/graph_exceptions.hpp"

namespace plotgraph
{

/**
 * @brief Breadth-first traversal from a set of start nodes.
 *
 * @details
 * Each node is visited at most once. Start nodes are visited first, in the
 * given order (duplicates ignored), followed by their successors level by
 * level. Start nodes that are not in the graph are still reported; they simply
 * have no successors.
 *
 * @return Nodes in visit order.
 */
template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
std::vector<TNode> breadth_first(const IDirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>& graph,
                                 const NonDeducedT<std::vector<TNode>>& start_nodes)
{
    auto visited = graph.make_node_set();
    std::queue<TNode> queue;
    std::vector<TNode> order;

    for (const auto& start : start_nodes)
    {
        if (visited.insert(start).second)
        {
            queue.push(start);
        }
    }

    while (!queue.empty())
    {
        TNode node = queue.front();
        queue.pop();
        order.push_back(node);

        for (const auto& e : graph.outgoing_edges(node))
        {
            if (visited.insert(e.to).second)
            {
                queue.push(e.to);
            }
        }
    }
    return order;
}

/**
 * @brief Depth-first traversal from a set of start nodes.
 *
 * @details
 * Each node is visited at most once. A node is marked when it is pushed, so
 * the order is the stack-based pre-order rather than the recursive one.
 *
 * @return Nodes in visit order.
 */
template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
std::vector<TNode> depth_first(const IDirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>& graph,
                               const NonDeducedT<std::vector<TNode>>& start_nodes)
{
    auto visited = graph.make_node_set();
    std::vector<TNode> stack;
    std::vector<TNode> order;

    for (const auto& start : start_nodes)
    {
        if (visited.insert(start).second)
        {
            stack.push_back(start);
        }
    }

    while (!stack.empty())
    {
        TNode node = stack.back();
        stack.pop_back();
        order.push_back(node);

        for (const auto& e : graph.outgoing_edges(node))
        {
            if (visited.insert(e.to).second)
            {
                stack.push_back(e.to);
            }
        }
    }
    return order;
}

namespace detail
{

/// Kahn's algorithm. Returns a partial order if the graph has a cycle.
template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
std::vector<TNode> kahn_order(const IDirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>& graph)
{
    auto in_degree = graph.template make_node_map<size_t>();
    std::queue<TNode> ready;

    for (const auto& n : graph.nodes())
    {
        size_t degree = graph.in_degree(n);
        in_degree.emplace(n, degree);
        if (degree == 0)
        {
            ready.push(n);
        }
    }

    std::vector<TNode> order;
    order.reserve(graph.node_count());
    while (!ready.empty())
    {
        TNode node = ready.front();
        ready.pop();
        order.push_back(node);

        for (const auto& e : graph.outgoing_edges(node))
        {
            size_t& degree = in_degree.find(e.to)->second;
            --degree;
            if (degree == 0)
            {
                ready.push(e.to);
            }
        }
    }
    return order;
}

} // namespace detail

/**
 * @brief Topological order of a directed acyclic graph (Kahn's algorithm).
 * @return All nodes, each before every node it has an edge to.
 * @throw GraphError with `CycleDetected` if the graph has a directed cycle.
 */
template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
std::vector<TNode> topological_sort(const IDirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>& graph)
{
    auto order = detail::kahn_order(graph);
    if (order.size() != graph.node_count())
    {
        throw GraphError(
            GraphErrorCode::CycleDetected,
            "Graph contains at least one cycle (" +
                std::to_string(graph.node_count() - order.size()) +
                " node(s) could not be ordered)");
    }
    return order;
}

/**
 * @brief Check whether the graph contains at least one directed cycle.
 */
template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
bool has_cycle(const IDirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>& graph)
{
    return detail::kahn_order(graph).size() != graph.node_count();
}

} // namespace plotgraph
