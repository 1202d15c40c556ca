/**
 * @file dominator_analysis.hpp
 * @brief Immediate dominators and dominator paths from a start node.
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/common/directed_graph_interface.hpp"
#include "plotgraph/common/graph_exceptions.hpp"

namespace plotgraph
{

/**
 * @brief Immediate dominator of every node reachable from a start node.
 *
 * @details
 * The start node maps to `std::nullopt`. Nodes that are not reachable from
 * the start are absent.
 */
template <typename TNode, typename Hash = std::hash<TNode>, typename KeyEqual = std::equal_to<TNode>>
using DominatorTree = std::unordered_map<TNode, std::optional<TNode>, Hash, KeyEqual>;

/**
 * @brief Compute immediate dominators (Cooper, Harvey and Kennedy).
 *
 * @details
 * Node `d` dominates node `n` if every path from `start` to `n` passes through
 * `d`. The immediate dominator of `n` is its closest strict dominator.
 *
 * Nodes reachable from `start` are numbered in depth-first post-order, then
 * the dominator estimates are refined in reverse post-order until they stop
 * changing. Predecessors not reachable from `start` are ignored.
 *
 * @param graph The graph to analyse.
 * @param start The entry node.
 * @return Immediate dominators of all reachable nodes.
 * @throw AnalysisError with `InvalidStartNode` if `start` is not in the graph.
 */
template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
DominatorTree<TNode, Hash, KeyEqual> compute_immediate_dominators(
    const IDirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>& graph,
    const NonDeducedT<TNode>& start)
{
    if (!graph.contains(start))
    {
        throw AnalysisError(
            AnalysisErrorCode::InvalidStartNode,
            "Dominator analysis start node is not part of the graph");
    }

    constexpr size_t undefined = std::numeric_limits<size_t>::max();

    // ---------------------------------------------------------------------
    // Post-order numbering of reachable nodes (iterative DFS)
    // ---------------------------------------------------------------------

    std::vector<TNode> post_order;
    auto index_of = graph.template make_node_map<size_t>();
    auto visited = graph.make_node_set();

    struct Frame
    {
        TNode node;
        std::vector<TNode> successors;
        size_t next;
    };

    std::vector<Frame> stack;
    visited.insert(start);
    stack.push_back(Frame{start, graph.successors(start), 0});

    while (!stack.empty())
    {
        Frame& frame = stack.back();
        if (frame.next < frame.successors.size())
        {
            TNode succ = frame.successors[frame.next++];
            if (visited.insert(succ).second)
            {
                auto succs = graph.successors(succ);
                stack.push_back(Frame{std::move(succ), std::move(succs), 0});
            }
            continue;
        }
        index_of.emplace(frame.node, post_order.size());
        post_order.push_back(frame.node);
        stack.pop_back();
    }

    // ---------------------------------------------------------------------
    // Iterative refinement in reverse post-order
    // ---------------------------------------------------------------------

    const size_t count = post_order.size();
    const size_t start_index = count - 1;
    std::vector<size_t> idom(count, undefined);
    idom[start_index] = start_index;

    std::vector<std::vector<size_t>> preds(count);
    for (size_t i = 0; i < count; ++i)
    {
        for (const auto& p : graph.predecessors(post_order[i]))
        {
            auto it = index_of.find(p);
            if (it != index_of.end())
            {
                preds[i].push_back(it->second);
            }
        }
    }

    auto intersect = [&idom](size_t a, size_t b) {
        while (a != b)
        {
            while (a < b)
            {
                a = idom[a];
            }
            while (b < a)
            {
                b = idom[b];
            }
        }
        return a;
    };

    bool changed = true;
    while (changed)
    {
        changed = false;
        for (size_t i = start_index; i-- > 0;)
        {
            size_t new_idom = undefined;
            for (size_t p : preds[i])
            {
                if (idom[p] == undefined)
                {
                    continue;
                }
                new_idom = (new_idom == undefined) ? p : intersect(p, new_idom);
            }
            if (new_idom != undefined && idom[i] != new_idom)
            {
                idom[i] = new_idom;
                changed = true;
            }
        }
    }

    auto tree = graph.template make_node_map<std::optional<TNode>>();
    tree.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        if (i == start_index)
        {
            tree.emplace(post_order[i], std::nullopt);
        }
        else
        {
            tree.emplace(post_order[i], post_order[idom[i]]);
        }
    }
    return tree;
}

/**
 * @brief The chain of dominators from the start node down to `target`.
 * @return `start, ..., idom(target), target`; empty if `target` is not in the tree.
 */
template <typename TNode, typename Hash, typename KeyEqual>
std::vector<TNode> dominator_path(const DominatorTree<TNode, Hash, KeyEqual>& tree,
                                  const NonDeducedT<TNode>& target)
{
    std::vector<TNode> path;
    auto it = tree.find(target);
    if (it == tree.end())
    {
        return path;
    }

    path.push_back(target);
    while (it->second)
    {
        path.push_back(*it->second);
        it = tree.find(*it->second);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

/**
 * @brief Check whether `dominator` dominates `node` (every node dominates itself).
 */
template <typename TNode, typename Hash, typename KeyEqual>
bool dominates(const DominatorTree<TNode, Hash, KeyEqual>& tree,
               const NonDeducedT<TNode>& dominator,
               const NonDeducedT<TNode>& node)
{
    KeyEqual equal = tree.key_eq();
    for (const auto& d : dominator_path(tree, node))
    {
        if (equal(d, dominator))
        {
            return true;
        }
    }
    return false;
}

} // namespace plotgraph
