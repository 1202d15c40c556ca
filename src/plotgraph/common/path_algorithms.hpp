/**
 * @file path_algorithms.hpp
 * @brief Bounded path enumeration and shared-suffix path compression.
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/common/directed_graph_interface.hpp"
#include "plotgraph/common/graph_exceptions.hpp"

namespace plotgraph
{

/**
 * @brief Bounds applied by `enumerate_paths()`.
 */
struct PathEnumerationOptions
{
    /**
     * @brief Maximum number of edges in a path.
     * @details A node reached at this depth is not expanded. Unless
     *          `report_depth_cut_paths` is false, the path ending there is
     *          reported even if the node has successors.
     */
    std::optional<size_t> max_depth{};

    /**
     * @brief Whether paths cut by `max_depth` at a non-terminal node are reported.
     * @details When false, such paths are discarded and do not count toward
     *          `max_paths`.
     */
    bool report_depth_cut_paths{true};

    /**
     * @brief Maximum number of paths to return.
     * @details Enumeration stops as soon as this many paths were found.
     */
    std::optional<size_t> max_paths{};
};

/**
 * @brief Enumerate simple paths from `start` to terminal nodes, depth first.
 *
 * @details
 * A node is terminal when `is_terminal` returns true for it, or when it is
 * reached at `options.max_depth` and `options.report_depth_cut_paths` is
 * set. With an empty `is_terminal`, nodes with out-degree zero are terminal.
 * Terminal nodes end a path and are not expanded further. Other nodes at the
 * depth bound end their branch without producing a path.
 *
 * A node never appears twice in one path, so enumeration terminates on
 * cyclic graphs. Branches that can only continue through nodes already on
 * the current path are dropped without producing a path.
 *
 * Paths are reported in depth-first order following the edge order of
 * `outgoing_edges()`. Parallel edges produce repeated paths.
 *
 * @param graph The graph to explore.
 * @param start The node every path starts with.
 * @param is_terminal Terminal predicate; may be empty.
 * @param options Depth and count bounds.
 * @return Node sequences, each starting at `start`.
 */
template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
std::vector<std::vector<TNode>> enumerate_paths(
    const IDirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>& graph,
    const NonDeducedT<TNode>& start,
    const NonDeducedT<NodePredicate<TNode>>& is_terminal = {},
    const PathEnumerationOptions& options = {})
{
    std::vector<std::vector<TNode>> paths;
    if (options.max_paths && *options.max_paths == 0)
    {
        return paths;
    }

    enum class Visit
    {
        Expand,
        Report,
        Discard
    };

    auto classify = [&](const TNode& node, size_t depth) {
        bool at_depth_bound = options.max_depth && depth >= *options.max_depth;
        if (at_depth_bound && options.report_depth_cut_paths)
        {
            return Visit::Report;
        }
        if (is_terminal ? is_terminal(node) : graph.out_degree(node) == 0)
        {
            return Visit::Report;
        }
        return at_depth_bound ? Visit::Discard : Visit::Expand;
    };
    auto limit_reached = [&]() {
        return options.max_paths && paths.size() >= *options.max_paths;
    };

    switch (classify(start, 0))
    {
    case Visit::Report:
        paths.push_back({start});
        return paths;
    case Visit::Discard:
        return paths;
    case Visit::Expand:
        break;
    }

    struct Frame
    {
        std::vector<TNode> successors;
        size_t next;
        size_t depth;
    };

    std::vector<TNode> path{start};
    auto on_path = graph.make_node_set();
    on_path.insert(start);

    std::vector<Frame> stack;
    stack.push_back(Frame{graph.successors(start), 0, 0});

    while (!stack.empty())
    {
        Frame& frame = stack.back();
        if (frame.next >= frame.successors.size())
        {
            on_path.erase(path.back());
            path.pop_back();
            stack.pop_back();
            continue;
        }

        TNode child = frame.successors[frame.next++];
        size_t child_depth = frame.depth + 1;
        if (on_path.count(child) > 0)
        {
            continue;
        }

        Visit visit = classify(child, child_depth);
        if (visit == Visit::Discard)
        {
            continue;
        }
        path.push_back(child);
        if (visit == Visit::Report)
        {
            paths.push_back(path);
            path.pop_back();
            if (limit_reached())
            {
                break;
            }
            continue;
        }

        on_path.insert(child);
        stack.push_back(Frame{graph.successors(child), 0, child_depth});
    }
    return paths;
}

namespace detail
{

template <typename TNode, typename Hash>
struct NodeSequenceHash
{
    Hash hash;

    size_t operator()(const std::vector<TNode>& nodes) const
    {
        size_t seed = nodes.size();
        for (const auto& n : nodes)
        {
            seed ^= hash(n) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

template <typename TNode, typename KeyEqual>
struct NodeSequenceEqual
{
    KeyEqual equal;

    bool operator()(const std::vector<TNode>& a, const std::vector<TNode>& b) const
    {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), equal);
    }
};

} // namespace detail

/**
 * @brief Compress a set of paths by cutting them where they rejoin a known suffix.
 *
 * @details
 * Paths are inserted, back to front, into a trie of suffixes. Each trie node
 * remembers the first path that created it. When a later path walks into a
 * suffix of at least two nodes owned by an earlier path, and the two paths
 * differ somewhere before the join point, the later path is truncated to end
 * at the join node: the remainder has already been covered. Identical
 * resulting prefixes are emitted once, in input order.
 *
 * @param paths Paths to compress.
 * @return Compressed paths; a subset of prefixes of the input paths.
 */
template <typename TNode, typename Hash = std::hash<TNode>, typename KeyEqual = std::equal_to<TNode>>
std::vector<std::vector<TNode>> compress_by_shared_suffixes(const std::vector<std::vector<TNode>>& paths)
{
    constexpr size_t no_owner = std::numeric_limits<size_t>::max();

    struct TrieNode
    {
        std::unordered_map<TNode, size_t, Hash, KeyEqual> children;
        size_t owner = std::numeric_limits<size_t>::max();
    };

    std::vector<std::vector<TNode>> result;
    if (paths.empty())
    {
        return result;
    }

    KeyEqual equal{};
    std::vector<size_t> keep_length(paths.size());
    for (size_t p = 0; p < paths.size(); ++p)
    {
        keep_length[p] = paths[p].size();
    }

    // Arena of trie nodes; index 0 is the root.
    std::vector<TrieNode> trie(1);

    for (size_t p = 0; p < paths.size(); ++p)
    {
        const auto& path = paths[p];
        const size_t length = path.size();
        size_t node = 0;
        size_t matched_depth = 0;

        for (size_t i = length; i-- > 0;)
        {
            const TNode& symbol = path[i];

            size_t child;
            auto it = trie[node].children.find(symbol);
            if (it == trie[node].children.end())
            {
                child = trie.size();
                trie[node].children.emplace(symbol, child);
                trie.emplace_back();
            }
            else
            {
                child = it->second;
            }

            node = child;
            ++matched_depth;

            size_t owner = trie[node].owner;
            if (owner == no_owner)
            {
                trie[node].owner = p;
                continue;
            }
            if (owner == p || matched_depth < 2 || matched_depth >= length)
            {
                continue;
            }

            const auto& owner_path = paths[owner];
            bool same_prefix_up_to_join = owner_path.size() > i;
            for (size_t k = 0; same_prefix_up_to_join && k <= i; ++k)
            {
                if (!equal(path[k], owner_path[k]))
                {
                    same_prefix_up_to_join = false;
                }
            }

            if (!same_prefix_up_to_join && i + 1 < keep_length[p])
            {
                keep_length[p] = i + 1;
            }
        }
    }

    std::unordered_set<std::vector<TNode>,
                       detail::NodeSequenceHash<TNode, Hash>,
                       detail::NodeSequenceEqual<TNode, KeyEqual>>
        seen_prefixes;

    for (size_t p = 0; p < paths.size(); ++p)
    {
        const size_t length = keep_length[p];
        if (length == 0)
        {
            continue;
        }
        std::vector<TNode> prefix(paths[p].begin(), paths[p].begin() + length);
        if (seen_prefixes.insert(prefix).second)
        {
            result.push_back(std::move(prefix));
        }
    }
    return result;
}

/**
 * @brief Enumerate root-to-terminal paths, compress them, and return them as edge paths.
 *
 * @details
 * Combines `enumerate_paths()` and `compress_by_shared_suffixes()`, then maps
 * each node path back to the first matching edge between consecutive nodes.
 * Node paths of fewer than two nodes produce empty edge paths.
 *
 * @throw GraphError with `MissingEdge` if consecutive nodes of a path are not
 *        connected by any edge.
 */
template <typename TNode, typename TEdgeLabel, typename Hash, typename KeyEqual>
std::vector<std::vector<Edge<TNode, TEdgeLabel>>> compress_graph_paths_to_edge_paths(
    const IDirectedGraph<TNode, TEdgeLabel, Hash, KeyEqual>& graph,
    const NonDeducedT<TNode>& root,
    const NonDeducedT<NodePredicate<TNode>>& is_terminal = {},
    const PathEnumerationOptions& options = {})
{
    auto node_paths = enumerate_paths(graph, root, is_terminal, options);
    auto compressed = compress_by_shared_suffixes<TNode, Hash, KeyEqual>(node_paths);

    KeyEqual equal = graph.key_eq();
    std::vector<std::vector<Edge<TNode, TEdgeLabel>>> result;
    result.reserve(compressed.size());

    for (const auto& node_path : compressed)
    {
        std::vector<Edge<TNode, TEdgeLabel>> edge_path;
        if (node_path.size() >= 2)
        {
            edge_path.reserve(node_path.size() - 1);
        }
        for (size_t i = 0; i + 1 < node_path.size(); ++i)
        {
            const auto& out = graph.outgoing_edges(node_path[i]);
            auto it = std::find_if(out.begin(), out.end(), [&](const auto& e) {
                return equal(e.to, node_path[i + 1]);
            });
            if (it == out.end())
            {
                throw GraphError(
                    GraphErrorCode::MissingEdge,
                    "No edge found between consecutive path nodes " + std::to_string(i) +
                        " and " + std::to_string(i + 1) + " when reconstructing edge path");
            }
            edge_path.push_back(*it);
        }
        result.push_back(std::move(edge_path));
    }
    return result;
}

} // namespace plotgraph
