/**
 * @file directed_graph.inline.hpp
 */
#pragma once
#include "plotgraph/common/directed_graph.hpp"

namespace plotgraph
{

// =============================================================================
// Construction
// =============================================================================

template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::DirectedGraph(const Hash& hash,
                                                                const KeyEqual& equal)
    : m_hash(hash)
    , m_equal(equal)
    , m_nodes()
    , m_edges()
    , m_outgoing(0, hash, equal)
    , m_incoming(0, hash, equal)
    , m_no_edges()
{
}

template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>
DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::from_edges(EdgeList edges,
                                                             const std::vector<TNode>& nodes,
                                                             const Hash& hash,
                                                             const KeyEqual& equal)
{
    DirectedGraph graph(hash, equal);

    for (const auto& n : nodes)
    {
        graph.add_node(n);
    }

    for (const auto& e : edges)
    {
        graph.add_node(e.from);
        graph.add_node(e.to);
    }

    // Indices are filled after every endpoint is registered, so the lookups
    // below cannot insert.
    for (const auto& e : edges)
    {
        graph.m_outgoing.find(e.from)->second.push_back(e);
        graph.m_incoming.find(e.to)->second.push_back(e);
    }

    graph.m_edges = std::move(edges);
    return graph;
}

template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
void DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::add_node(const TNode& node)
{
    if (m_outgoing.find(node) != m_outgoing.end())
    {
        return;
    }
    m_nodes.push_back(node);
    m_outgoing.emplace(node, EdgeList{});
    m_incoming.emplace(node, EdgeList{});
}

// =============================================================================
// Queries
// =============================================================================

template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
Hash DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::hash_function() const
{
    return m_hash;
}

template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
KeyEqual DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::key_eq() const
{
    return m_equal;
}

template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
const std::vector<TNode>& DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::nodes() const noexcept
{
    return m_nodes;
}

template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
const typename DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::EdgeList&
DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::edges() const noexcept
{
    return m_edges;
}

template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
bool DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::contains(const TNode& node) const
{
    return m_outgoing.find(node) != m_outgoing.end();
}

template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
const typename DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::EdgeList&
DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::outgoing_edges(const TNode& node) const
{
    auto it = m_outgoing.find(node);
    return it == m_outgoing.end() ? m_no_edges : it->second;
}

template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
const typename DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::EdgeList&
DirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>::incoming_edges(const TNode& node) const
{
    auto it = m_incoming.find(node);
    return it == m_incoming.end() ? m_no_edges : it->second;
}

} // namespace plotgraph
