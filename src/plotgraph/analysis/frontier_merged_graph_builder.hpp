/**
 * @file frontier_merged_graph_builder.hpp
 * @brief Breadth-first state-space exploration with merging on abstract state.
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/common/directed_graph.hpp"
#include "plotgraph/common/directed_graph.inline.hpp"

namespace plotgraph
{

/**
 * @brief A vertex of a frontier-merged graph: a scene paired with an abstract state.
 *
 * @details
 * Equality and hashing are over both fields. Concrete states that project to
 * the same signature at the same scene share one `StateNode`.
 */
template <typename TSceneId, typename TStateSig>
struct StateNode
{
    TSceneId scene_id;
    TStateSig signature;

    bool operator==(const StateNode& other) const
    {
        return scene_id == other.scene_id && signature == other.signature;
    }

    bool operator!=(const StateNode& other) const
    {
        return !(*this == other);
    }
};

/**
 * @brief Hash functor for `StateNode`, combining a scene hash and a signature hash.
 */
template <typename TSceneId,
          typename TStateSig,
          typename SceneHash = std::hash<TSceneId>,
          typename SigHash = std::hash<TStateSig>>
struct StateNodeHash
{
    size_t operator()(const StateNode<TSceneId, TStateSig>& node) const
    {
        size_t seed = SceneHash{}(node.scene_id);
        seed ^= SigHash{}(node.signature) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

/**
 * @brief One outgoing move produced by a transition function.
 */
template <typename TSceneId, typename TState, typename TEdgeLabel>
struct StateTransition
{
    TSceneId to_scene;
    TEdgeLabel label;
    TState next_state;
};

/**
 * @brief Bounds applied by `FrontierMergedGraphBuilder::build()`.
 *
 * @details
 * At least one of the two must bound the exploration. With neither set, a
 * transition function that keeps producing new signatures never terminates.
 */
template <typename TSceneId>
struct ExplorationOptions
{
    /// Scenes at which exploration stops; may be empty.
    NodePredicate<TSceneId> is_terminal_scene{};

    /// Nodes dequeued at this depth are not expanded.
    std::optional<size_t> max_depth{};
};

/**
 * @brief Output of a frontier-merged exploration.
 */
template <typename TSceneId,
          typename TState,
          typename TStateSig,
          typename TEdgeLabel,
          typename SceneHash = std::hash<TSceneId>,
          typename SigHash = std::hash<TStateSig>>
struct FrontierMergedGraphResult
{
    using NodeType = StateNode<TSceneId, TStateSig>;
    using NodeHash = StateNodeHash<TSceneId, TStateSig, SceneHash, SigHash>;
    using GraphType = DirectedGraph<NodeType, TEdgeLabel, NodeHash>;

    /// Quotient graph over merged state nodes, one edge per transition taken.
    GraphType graph;

    /// The first concrete state seen for each state node.
    std::unordered_map<NodeType, TState, NodeHash> representative_states;

    /// Nodes at which exploration stopped, in discovery order.
    std::vector<NodeType> terminal_nodes;
};

/**
 * @brief Builds a quotient graph of a narrative's state space.
 *
 * @details
 * The state space of a branching story grows exponentially with the number
 * of independent facts it tracks. This builder explores it breadth first and
 * collapses every concrete state reaching a scene into the state node
 * `(scene, signature(state))`, so the graph is bounded by the number of
 * distinct `(scene, signature)` pairs.
 *
 * @par Algorithm
 * - The initial node `(initial_scene, signature(initial_state))` is recorded
 *   with `initial_state` as its representative and enqueued at depth 0.
 * - A dequeued node is terminal if `max_depth` is reached or the scene
 *   matches `is_terminal_scene`; terminal nodes are not expanded.
 * - Otherwise the transition function is called with the node's
 *   representative state. If it yields nothing, the node is terminal.
 * - Each transition leads to `(to_scene, signature(next_state))`. A node not
 *   seen before is recorded with that transition's state as representative
 *   and enqueued at depth + 1. An edge carrying the transition's label is
 *   recorded in every case.
 *
 * @par Precision
 * - The signature decides what counts as "the same" state. A signature that
 *   is too coarse merges states that should be distinguished; only the first
 *   representative of a merged node is ever expanded.
 *
 * @tparam TSceneId Scene identifier type.
 * @tparam TState Concrete state type; copied into the result.
 * @tparam TStateSig Signature type; equality comparable.
 * @tparam TEdgeLabel Edge label type.
 * @tparam SceneHash Hash functor for `TSceneId`.
 * @tparam SigHash Hash functor for `TStateSig`.
 */
template <typename TSceneId,
          typename TState,
          typename TStateSig,
          typename TEdgeLabel,
          typename SceneHash = std::hash<TSceneId>,
          typename SigHash = std::hash<TStateSig>>
class FrontierMergedGraphBuilder
{
public:
    using ResultType = FrontierMergedGraphResult<TSceneId, TState, TStateSig, TEdgeLabel, SceneHash, SigHash>;
    using NodeType = typename ResultType::NodeType;
    using NodeHash = typename ResultType::NodeHash;
    using GraphType = typename ResultType::GraphType;
    using TransitionType = StateTransition<TSceneId, TState, TEdgeLabel>;
    using TransitionFunction = std::function<std::vector<TransitionType>(const TSceneId&, const TState&)>;
    using SignatureFunction = std::function<TStateSig(const TState&)>;

    /**
     * @brief Explore the state space from an initial scene and state.
     * @param initial_scene Scene the exploration starts at.
     * @param initial_state Concrete state at `initial_scene`.
     * @param get_transitions Produces the moves available from a scene in a state.
     * @param state_signature Projects a concrete state onto its merge key.
     * @param options Terminal predicate and depth bound.
     * @return The quotient graph, representatives and terminal nodes.
     */
    static ResultType build(const TSceneId& initial_scene,
                            const TState& initial_state,
                            const TransitionFunction& get_transitions,
                            const SignatureFunction& state_signature,
                            const ExplorationOptions<TSceneId>& options = {})
    {
        struct Pending
        {
            NodeType node;
            size_t depth;
        };

        std::unordered_map<NodeType, TState, NodeHash> representatives;
        std::vector<NodeType> discovered;
        std::vector<NodeType> terminals;
        typename GraphType::EdgeList edges;
        std::queue<Pending> queue;

        NodeType start{initial_scene, state_signature(initial_state)};
        representatives.emplace(start, initial_state);
        discovered.push_back(start);
        queue.push(Pending{start, 0});

        while (!queue.empty())
        {
            Pending current = queue.front();
            queue.pop();

            const bool depth_reached = options.max_depth && current.depth >= *options.max_depth;
            if (depth_reached ||
                (options.is_terminal_scene && options.is_terminal_scene(current.node.scene_id)))
            {
                terminals.push_back(current.node);
                continue;
            }

            // Copied: inserting new representatives may rehash the map.
            const TState state = representatives.at(current.node);
            auto transitions = get_transitions(current.node.scene_id, state);
            if (transitions.empty())
            {
                terminals.push_back(current.node);
                continue;
            }

            for (auto& t : transitions)
            {
                NodeType next{t.to_scene, state_signature(t.next_state)};
                if (representatives.find(next) == representatives.end())
                {
                    representatives.emplace(next, std::move(t.next_state));
                    discovered.push_back(next);
                    queue.push(Pending{next, current.depth + 1});
                }
                edges.emplace_back(current.node, next, std::move(t.label));
            }
        }

        return ResultType{GraphType::from_edges(std::move(edges), discovered),
                          std::move(representatives),
                          std::move(terminals)};
    }
};

} // namespace plotgraph
