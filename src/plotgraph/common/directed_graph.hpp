/**
 * @file directed_graph.hpp
 * @brief Immutable adjacency-indexed directed graph.
 *
 * Member definitions live in `directed_graph.inline.hpp`; include that header
 * to instantiate the template.
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/common/directed_graph_interface.hpp"

namespace plotgraph
{

/**
 * @brief Immutable directed graph over a set of nodes and labelled edges.
 *
 * @details
 * A `DirectedGraph` is constructed once, by `from_edges()`, from a collection
 * of edges and an optional explicit node collection. Construction derives the
 * node set and two adjacency indices (outgoing and incoming edges by node).
 * After construction the graph is a read-only mathematical object: nothing
 * can be added, removed or relabelled.
 *
 * @par Invariants
 * - Every endpoint of every edge is in `nodes()`.
 * - `nodes()` contains no duplicates under `KeyEqual`.
 * - `outgoing_edges(n)` and `incoming_edges(n)` list exactly the edges that
 *   reference `n` as source or target, in construction order.
 *
 * @par Node order
 * Nodes appear in first-seen order: explicit nodes first, then edge endpoints
 * in edge order (source before target).
 *
 * @par Thread safety
 * - Immutable after construction; concurrent reads are safe without
 *   synchronization.
 *
 * @tparam TNode Node identifier type. Must be copyable.
 * @tparam TEdgeLabel Edge label type.
 * @tparam Hash Hash functor for `TNode`.
 * @tparam KeyEqual Equality functor for `TNode`.
 */
template <typename TNode,
          typename TEdgeLabel,
          typename Hash = std::hash<TNode>,
          typename KeyEqual = std::equal_to<TNode>>
class DirectedGraph final : public IDirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>
{
public:
    using Base = IDirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>;
    using EdgeType = typename Base::EdgeType;
    using EdgeList = typename Base::EdgeList;
    using NodeSet = typename Base::NodeSet;

    /**
     * @brief Construct a graph from edges and an optional explicit node set.
     * @param edges The directed edges; endpoints are added to the node set.
     * @param nodes Extra nodes to include even if no edge references them.
     * @param hash Hash functor for node identity.
     * @param equal Equality functor for node identity.
     * @return The constructed graph.
     */
    static DirectedGraph from_edges(EdgeList edges,
                                    const std::vector<TNode>& nodes = {},
                                    const Hash& hash = Hash(),
                                    const KeyEqual& equal = KeyEqual());

    Hash hash_function() const override;
    KeyEqual key_eq() const override;

    const std::vector<TNode>& nodes() const noexcept override;
    const EdgeList& edges() const noexcept override;
    bool contains(const TNode& node) const override;
    const EdgeList& outgoing_edges(const TNode& node) const override;
    const EdgeList& incoming_edges(const TNode& node) const override;

private:
    DirectedGraph(const Hash& hash, const KeyEqual& equal);

    /// Add `node` to the node list and both indices if not yet present.
    void add_node(const TNode& node);

    Hash m_hash;
    KeyEqual m_equal;

    std::vector<TNode> m_nodes;
    EdgeList m_edges;

    std::unordered_map<TNode, EdgeList, Hash, KeyEqual> m_outgoing;
    std::unordered_map<TNode, EdgeList, Hash, KeyEqual> m_incoming;

    /// Returned for nodes that are not part of the graph.
    EdgeList m_no_edges;
};

} // namespace plotgraph
