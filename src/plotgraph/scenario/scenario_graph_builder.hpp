/**
 * @file scenario_graph_builder.hpp
 * @brief Turns a scenario into a scene graph and enumerates playthroughs.
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/common/directed_graph.hpp"
#include "plotgraph/common/directed_graph.inline.hpp"
#include "plotgraph/scenario/scenario_enums.hpp"
#include "plotgraph/scenario/scenario_model.hpp"

namespace plotgraph
{

/**
 * @brief Edge label of scenario graphs.
 */
struct SceneTransition
{
    SceneId from_scene_id;
    SceneId to_scene_id;
    TransitionType type{TransitionType::Linear};

    /// Set for branch transitions only.
    std::optional<std::string> choice_text{};
};

using SceneGraph = DirectedGraph<SceneId, SceneTransition>;
using ScenePath = std::vector<SceneId>;

/**
 * @brief Configuration for scenario path enumeration.
 */
struct ScenarioPathConfig
{
    /**
     * @brief Maximum number of paths returned by `enumerate_all_paths()`.
     */
    size_t max_paths{100};

    /**
     * @brief Maximum number of transitions in a path.
     * @details Unset means unbounded. Paths cut short by this bound do not end
     *          at an ending scene and are not reported.
     */
    std::optional<size_t> max_depth{};
};

/**
 * @brief Builds scene graphs from scenarios.
 *
 * @details
 * Nodes are scene ids. Each scene contributes one `Linear` edge for its
 * `next_scene_id` and one `Branch` edge per branch with a target, in that
 * order. Every scene is a node even if no edge touches it. Targets that name
 * no scene become nodes as well; `ScenarioConsistencyChecker` reports them.
 *
 * @par Thread safety
 * - Stateless apart from its configuration; concurrent calls are safe.
 */
class ScenarioGraphBuilder
{
public:
    explicit ScenarioGraphBuilder(ScenarioPathConfig config = {});

    const ScenarioPathConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Build the scene graph of a scenario.
     */
    SceneGraph build(const Scenario& scenario) const;

    /**
     * @brief Find the scene the story starts at.
     *
     * @details
     * Returns the first scene, in scene order, that no linear successor or
     * branch targets. If every scene is targeted (a cyclic scenario), falls
     * back to the first scene. This is a heuristic: a scenario with several
     * untargeted scenes yields the first of them.
     *
     * @return The start scene id, or `std::nullopt` for an empty scenario.
     */
    std::optional<SceneId> find_start_scene(const Scenario& scenario) const;

    /**
     * @brief All scenes with neither a linear successor nor a branch target, in scene order.
     */
    std::vector<SceneId> find_ending_scenes(const Scenario& scenario) const;

    /**
     * @brief Enumerate playthroughs from the start scene to ending scenes.
     *
     * @details
     * Uses `config().max_paths` and `config().max_depth`. Every returned path
     * starts at `find_start_scene()` and ends at a scene of
     * `find_ending_scenes()`. A scene never repeats within a path.
     *
     * @return At most `max_paths` paths; empty if there is no start or no ending.
     */
    std::vector<ScenePath> enumerate_all_paths(const Scenario& scenario) const;

    /**
     * @brief As above, with an explicit path count bound.
     */
    std::vector<ScenePath> enumerate_all_paths(const Scenario& scenario, size_t max_paths) const;

private:
    ScenarioPathConfig m_config;
};

} // namespace plotgraph
