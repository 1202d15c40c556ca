/**
 * @file scenario_entity_analyzer.hpp
 * @brief Entity presence and dominator analyses over scenario graphs.
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/analysis/data_flow.hpp"
#include "plotgraph/analysis/dominator_analysis.hpp"
#include "plotgraph/analysis/frontier_merged_graph_builder.hpp"
#include "plotgraph/scenario/scenario_graph_builder.hpp"
#include "plotgraph/scenario/scenario_model.hpp"

namespace plotgraph
{

/**
 * @brief Classification of every known entity after one scene.
 *
 * @details
 * All three vectors are sorted and pairwise disjoint. Their union is the set
 * of entities the scenario knows about (introduced, removed or referenced by
 * any scene).
 */
struct EntityState
{
    SceneId scene_id;

    /// Present on every path from the start scene.
    std::vector<EntityId> guaranteed_present;

    /// Present on some but not all paths.
    std::vector<EntityId> possibly_present;

    /// Present on no path.
    std::vector<EntityId> guaranteed_absent;
};

/// Merge key of entity exploration: the sorted present entities.
using EntitySignature = std::vector<EntityId>;

struct EntitySignatureHash
{
    size_t operator()(const EntitySignature& signature) const
    {
        std::hash<EntityId> hash;
        size_t seed = signature.size();
        for (const auto& e : signature)
        {
            seed ^= hash(e) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

/**
 * @brief Concrete state of entity exploration.
 */
struct EntityExplorationState
{
    /// Entities present after the current scene, sorted.
    std::vector<EntityId> present;

    /// Scenes visited so far, ending with the current scene.
    ScenePath path;
};

using EntityExplorationResult = FrontierMergedGraphResult<SceneId,
                                                          EntityExplorationState,
                                                          EntitySignature,
                                                          SceneTransition,
                                                          std::hash<SceneId>,
                                                          EntitySignatureHash>;

/**
 * @brief Runs the generic analyses over a scenario's scene graph.
 *
 * @details
 * All analyses start at `ScenarioGraphBuilder::find_start_scene()`. When
 * several scenes share an id, the first one supplies the entity lists.
 * Targets that name no scene are graph nodes without entity effects.
 *
 * Every operation throws `AnalysisError` with `InvalidStartNode` for an empty
 * scenario.
 */
class ScenarioEntityAnalyzer
{
public:
    explicit ScenarioEntityAnalyzer(ScenarioGraphBuilder builder = ScenarioGraphBuilder{});

    /**
     * @brief Entities guaranteed to be present after each scene.
     */
    EntitySetMap<SceneId, EntityId> must_introduced_sets(const Scenario& scenario) const;

    /**
     * @brief Entities present after each scene on at least one path.
     */
    EntitySetMap<SceneId, EntityId> may_introduced_sets(const Scenario& scenario) const;

    /**
     * @brief Classify the known entities after every scene.
     * @return One state per distinct scene id, in scene order.
     */
    std::vector<EntityState> guaranteed_entity_states(const Scenario& scenario) const;

    /**
     * @brief Classify the known entities after one scene.
     * @throw AnalysisError with `InvalidTarget` if no scene has id `scene_id`.
     */
    EntityState guaranteed_entity_state(const Scenario& scenario, const SceneId& scene_id) const;

    /**
     * @brief Immediate dominators of all scenes reachable from the start scene.
     */
    DominatorTree<SceneId> dominator_tree(const Scenario& scenario) const;

    /**
     * @brief Scenes every playthrough passes on its way to `target`, start first.
     * @return Empty if `target` is unreachable.
     */
    ScenePath dominator_path_to(const Scenario& scenario, const SceneId& target) const;

    /**
     * @brief Explore entity states, merging playthroughs with equal present sets.
     *
     * @details
     * The concrete state is the present entity set plus the path taken; the
     * signature is the present set alone. Exploration stops at ending scenes,
     * at dead ends, and at `max_depth` if given. Each merged node keeps the
     * path of the first (shortest) playthrough that reached it.
     */
    EntityExplorationResult explore_entity_states(const Scenario& scenario,
                                                  std::optional<size_t> max_depth = std::nullopt) const;

private:
    SceneId require_start(const Scenario& scenario) const;
    DataFlowGraph<SceneId, EntityId> make_nodes(const Scenario& scenario, const SceneGraph& graph) const;
    EntityState classify(const SceneId& scene_id,
                         const EntitySet<EntityId>& must,
                         const EntitySet<EntityId>& may,
                         const std::vector<EntityId>& known) const;

    ScenarioGraphBuilder m_builder;
};

/**
 * @brief Every entity a scenario introduces, removes or references, sorted.
 */
std::vector<EntityId> known_entities(const Scenario& scenario);

/**
 * @brief Sorted copy of an entity set.
 */
std::vector<EntityId> sorted_entities(const EntitySet<EntityId>& entities);

} // namespace plotgraph
