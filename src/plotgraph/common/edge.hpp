/**
 * @file edge.hpp
 * @brief Labelled directed edge value type.
 */
#pragma once
#include "plotgraph/common/common.hpp"

namespace plotgraph
{

/**
 * @brief An immutable directed edge `(from, to, label)`.
 *
 * @details
 * The label carries domain metadata (transition type, choice text, ...) and
 * is never part of the edge's identity. Two edges between the same endpoints
 * with different labels are distinct entries in a graph's edge list; this
 * type deliberately provides no equality operator.
 *
 * @tparam TNode Node identifier type.
 * @tparam TEdgeLabel Label type.
 */
template <typename TNode, typename TEdgeLabel>
struct Edge
{
    Edge(TNode from_node, TNode to_node, TEdgeLabel edge_label)
        : from(std::move(from_node))
        , to(std::move(to_node))
        , label(std::move(edge_label))
    {
    }

    TNode from;
    TNode to;
    TEdgeLabel label;
};

} // namespace plotgraph
