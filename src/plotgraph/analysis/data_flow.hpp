/**
 * @file data_flow.hpp
 * @brief Forward fixed-point analyses of entity introduction over a graph.
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/common/directed_graph_interface.hpp"
#include "plotgraph/common/graph_exceptions.hpp"

namespace plotgraph
{

template <typename TEntity>
using EntitySet = std::unordered_set<TEntity>;

/**
 * @brief Per-node input record of the entity dataflow analyses.
 *
 * @details
 * `introduced_entities` and `removed_entities` may overlap; the transfer
 * function applies removal after introduction, so an entity both introduced
 * and removed at the same node is absent after it.
 *
 * Predecessor and successor ids may name nodes that are missing from the
 * analysed node map. Such dangling ids are skipped.
 */
template <typename TNodeId, typename TEntity>
struct DataFlowNode
{
    TNodeId id;
    std::vector<TNodeId> predecessor_ids;
    std::vector<TNodeId> successor_ids;
    EntitySet<TEntity> introduced_entities;
    EntitySet<TEntity> removed_entities;
};

/// Complete analysis input, keyed by node id.
template <typename TNodeId, typename TEntity>
using DataFlowGraph = std::unordered_map<TNodeId, DataFlowNode<TNodeId, TEntity>>;

/// Analysis output: node id to entity set.
template <typename TNodeId, typename TEntity>
using EntitySetMap = std::unordered_map<TNodeId, EntitySet<TEntity>>;

namespace detail
{

enum class MeetOperator
{
    Intersection,
    Union
};

/// `(incoming ∪ introduced) − removed`
template <typename TNodeId, typename TEntity>
void apply_transfer(const DataFlowNode<TNodeId, TEntity>& node, EntitySet<TEntity>& incoming)
{
    incoming.insert(node.introduced_entities.begin(), node.introduced_entities.end());
    for (const auto& e : node.removed_entities)
    {
        incoming.erase(e);
    }
}

template <typename TEntity>
void intersect_into(EntitySet<TEntity>& target, const EntitySet<TEntity>& other)
{
    for (auto it = target.begin(); it != target.end();)
    {
        if (other.count(*it) == 0)
        {
            it = target.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

/**
 * Worklist solver shared by the must and may analyses. Only the meet
 * operator differs between them.
 */
template <typename TNodeId, typename TEntity>
EntitySetMap<TNodeId, TEntity> solve_forward(const DataFlowGraph<TNodeId, TEntity>& nodes,
                                             const TNodeId& start_id,
                                             MeetOperator meet)
{
    auto start_it = nodes.find(start_id);
    if (start_it == nodes.end())
    {
        throw AnalysisError(
            AnalysisErrorCode::InvalidStartNode,
            "Start node is not present in the dataflow node set");
    }
    const auto& start_node = start_it->second;

    EntitySetMap<TNodeId, TEntity> result;
    result.reserve(nodes.size());
    for (const auto& [id, node] : nodes)
    {
        result.emplace(id, EntitySet<TEntity>{});
    }

    EntitySet<TEntity> start_set;
    apply_transfer(start_node, start_set);
    result[start_id] = start_set;

    std::queue<TNodeId> worklist;
    std::unordered_set<TNodeId> in_queue;

    worklist.push(start_id);
    in_queue.insert(start_id);
    for (const auto& succ_id : start_node.successor_ids)
    {
        if (nodes.count(succ_id) > 0 && in_queue.insert(succ_id).second)
        {
            worklist.push(succ_id);
        }
    }

    while (!worklist.empty())
    {
        TNodeId node_id = worklist.front();
        worklist.pop();
        in_queue.erase(node_id);

        const auto& node = nodes.at(node_id);
        EntitySet<TEntity> updated;

        if (node.predecessor_ids.empty())
        {
            // The start node reuses its seed. Any other predecessor-less node
            // only guarantees its own local introductions.
            if (node_id == start_id)
            {
                updated = start_set;
            }
            else
            {
                apply_transfer(node, updated);
            }
        }
        else
        {
            bool first = true;
            for (const auto& pred_id : node.predecessor_ids)
            {
                auto pred_it = result.find(pred_id);
                if (pred_it == result.end())
                {
                    continue;
                }
                if (first)
                {
                    updated = pred_it->second;
                    first = false;
                }
                else if (meet == MeetOperator::Intersection)
                {
                    intersect_into(updated, pred_it->second);
                }
                else
                {
                    updated.insert(pred_it->second.begin(), pred_it->second.end());
                }
            }
            apply_transfer(node, updated);
        }

        auto& stored = result[node_id];
        if (stored == updated)
        {
            continue;
        }
        stored = std::move(updated);

        for (const auto& succ_id : node.successor_ids)
        {
            if (nodes.count(succ_id) > 0 && in_queue.insert(succ_id).second)
            {
                worklist.push(succ_id);
            }
        }
    }

    return result;
}

} // namespace detail

/**
 * @brief Compute the entities guaranteed to be present at each node.
 *
 * @details
 * Classic forward "must" analysis. The meet over predecessors is set
 * intersection, so an entity is guaranteed only if it is present on every
 * incoming path. The transfer function is
 * `(meet ∪ introduced) − removed`.
 *
 * @par Algorithm
 * - Every node starts with an empty set; the start node is seeded with
 *   `introduced − removed`.
 * - A FIFO worklist is seeded with the start node and its direct successors.
 *   An in-queue set prevents duplicate scheduling.
 * - A node without predecessors takes the seed if it is the start node and
 *   only its own local transfer otherwise.
 * - A node with predecessors intersects the current sets of the predecessors
 *   that exist in `nodes`, then applies its transfer function.
 * - When a node's set changes (by set equality), its successors are enqueued.
 *
 * The analysis answers "what must be introduced given that we started at
 * `start_id`". Nodes that are never scheduled keep an empty set; subgraphs
 * reachable only from other roots are not solved to a whole-graph fixpoint.
 *
 * @param nodes Complete node map.
 * @param start_id The designated start node.
 * @return A set for every node id in `nodes`.
 * @throw AnalysisError with `InvalidStartNode` if `start_id` is not in `nodes`.
 */
template <typename TNodeId, typename TEntity>
EntitySetMap<TNodeId, TEntity> compute_must_introduced_sets(const DataFlowGraph<TNodeId, TEntity>& nodes,
                                                            const NonDeducedT<TNodeId>& start_id)
{
    return detail::solve_forward(nodes, start_id, detail::MeetOperator::Intersection);
}

/**
 * @brief Compute the entities that may be present at each node.
 *
 * @details
 * The dual of `compute_must_introduced_sets()`: the meet is set union, so an
 * entity is reported if it is present on at least one incoming path. The
 * worklist discipline, the handling of predecessor-less nodes and the
 * failure mode are identical.
 *
 * @throw AnalysisError with `InvalidStartNode` if `start_id` is not in `nodes`.
 */
template <typename TNodeId, typename TEntity>
EntitySetMap<TNodeId, TEntity> compute_may_introduced_sets(const DataFlowGraph<TNodeId, TEntity>& nodes,
                                                           const NonDeducedT<TNodeId>& start_id)
{
    return detail::solve_forward(nodes, start_id, detail::MeetOperator::Union);
}

/**
 * @brief Derive dataflow input records from a directed graph.
 *
 * @details
 * Each graph node becomes one `DataFlowNode` whose predecessor and successor
 * lists come from the graph's adjacency. Introduced and removed sets are
 * looked up in the given maps; nodes absent from a map get an empty set.
 */
template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual, typename TEntity>
DataFlowGraph<TNode, TEntity> make_data_flow_nodes(
    const IDirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>& graph,
    const EntitySetMap<TNode, TEntity>& introduced,
    const EntitySetMap<TNode, TEntity>& removed)
{
    DataFlowGraph<TNode, TEntity> result;
    result.reserve(graph.node_count());

    for (const auto& n : graph.nodes())
    {
        DataFlowNode<TNode, TEntity> node{n, graph.predecessors(n), graph.successors(n), {}, {}};
        auto intro_it = introduced.find(n);
        if (intro_it != introduced.end())
        {
            node.introduced_entities = intro_it->second;
        }
        auto removed_it = removed.find(n);
        if (removed_it != removed.end())
        {
            node.removed_entities = removed_it->second;
        }
        result.emplace(n, std::move(node));
    }
    return result;
}

} // namespace plotgraph
