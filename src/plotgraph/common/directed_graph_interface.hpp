/**
 * @file directed_graph_interface.hpp
 * @brief Read-only interface over a directed graph with labelled edges.
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/common/edge.hpp"

namespace plotgraph
{

namespace detail
{

template <typename T>
struct NonDeduced
{
    using type = T;
};

} // namespace detail

/**
 * @brief Excludes a function parameter from template argument deduction.
 *
 * @details
 * Algorithms deduce `TNode` from the graph alone, so that a string literal
 * start node or a lambda predicate converts to the graph's node type instead
 * of conflicting with it.
 */
template <typename T>
using NonDeducedT = typename detail::NonDeduced<T>::type;

/**
 * @brief Predicate over nodes, e.g. a terminal-node test.
 */
template <typename TNode>
using NodePredicate = std::function<bool(const TNode&)>;

/**
 * @brief Read-only view of a directed graph.
 *
 * @details
 * `IDirectedGraph` is the seam the generic algorithms are written against.
 * Implementations expose a node set, an edge set and adjacency queries.
 * Queries on a node that is not part of the graph behave as queries on a
 * node with no edges: they return empty sequences and zero degrees.
 *
 * The hash and equality functors are part of the interface so that
 * algorithms can build visited sets and lookup tables that agree with the
 * graph's own notion of node identity.
 *
 * @tparam TNode Node identifier type.
 * @tparam TEdgeLabel Edge label type.
 * @tparam Hash Hash functor for `TNode`.
 * @tparam KeyEqual Equality functor for `TNode`.
 *
 * @par Thread safety
 * - Implementations are expected to be immutable once constructed.
 * - Concurrent calls to const methods are safe.
 */
template <typename TNode,
          typename TEdgeLabel,
          typename Hash = std::hash<TNode>,
          typename KeyEqual = std::equal_to<TNode>>
class IDirectedGraph
{
public:
    using NodeType = TNode;
    using LabelType = TEdgeLabel;
    using EdgeType = Edge<TNode, TEdgeLabel>;
    using EdgeList = std::vector<EdgeType>;
    using NodeSet = std::unordered_set<TNode, Hash, KeyEqual>;

    template <typename TValue>
    using NodeMap = std::unordered_map<TNode, TValue, Hash, KeyEqual>;

    virtual ~IDirectedGraph() = default;

    virtual Hash hash_function() const = 0;
    virtual KeyEqual key_eq() const = 0;

    /**
     * @brief Create an empty node set that uses this graph's node identity.
     */
    NodeSet make_node_set() const
    {
        return NodeSet(0, hash_function(), key_eq());
    }

    /**
     * @brief Create an empty node-keyed map that uses this graph's node identity.
     */
    template <typename TValue>
    NodeMap<TValue> make_node_map() const
    {
        return NodeMap<TValue>(0, hash_function(), key_eq());
    }

    /**
     * @brief All nodes of the graph, each exactly once.
     */
    virtual const std::vector<TNode>& nodes() const noexcept = 0;

    /**
     * @brief All edges of the graph, in construction order.
     */
    virtual const EdgeList& edges() const noexcept = 0;

    /**
     * @brief Check whether a node is part of the graph.
     */
    virtual bool contains(const TNode& node) const = 0;

    /**
     * @brief Edges whose source is `node`; empty for unknown nodes.
     */
    virtual const EdgeList& outgoing_edges(const TNode& node) const = 0;

    /**
     * @brief Edges whose target is `node`; empty for unknown nodes.
     */
    virtual const EdgeList& incoming_edges(const TNode& node) const = 0;

    /**
     * @brief Targets of the outgoing edges of `node`, one per edge.
     */
    std::vector<TNode> successors(const TNode& node) const
    {
        std::vector<TNode> result;
        const auto& out = outgoing_edges(node);
        result.reserve(out.size());
        for (const auto& e : out)
        {
            result.push_back(e.to);
        }
        return result;
    }

    /**
     * @brief Sources of the incoming edges of `node`, one per edge.
     */
    std::vector<TNode> predecessors(const TNode& node) const
    {
        std::vector<TNode> result;
        const auto& in = incoming_edges(node);
        result.reserve(in.size());
        for (const auto& e : in)
        {
            result.push_back(e.from);
        }
        return result;
    }

    size_t out_degree(const TNode& node) const
    {
        return outgoing_edges(node).size();
    }

    size_t in_degree(const TNode& node) const
    {
        return incoming_edges(node).size();
    }

    /**
     * @brief All nodes with in-degree zero.
     */
    std::vector<TNode> roots() const
    {
        std::vector<TNode> result;
        for (const auto& n : nodes())
        {
            if (in_degree(n) == 0)
            {
                result.push_back(n);
            }
        }
        return result;
    }

    /**
     * @brief All nodes with out-degree zero.
     */
    std::vector<TNode> terminals() const
    {
        std::vector<TNode> result;
        for (const auto& n : nodes())
        {
            if (out_degree(n) == 0)
            {
                result.push_back(n);
            }
        }
        return result;
    }

    size_t node_count() const noexcept
    {
        return nodes().size();
    }

    size_t edge_count() const noexcept
    {
        return edges().size();
    }
};

} // namespace plotgraph
