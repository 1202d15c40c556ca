#include "plotgraph/scenario/scenario_entity_analyzer.hpp"
#include "plotgraph/common/graph_exceptions.hpp"
#include <set>

namespace plotgraph
{

std::vector<EntityId> known_entities(const Scenario& scenario)
{
    std::set<EntityId> known;
    for (const auto& scene : scenario.scenes)
    {
        known.insert(scene.introduced_entities.begin(), scene.introduced_entities.end());
        known.insert(scene.removed_entities.begin(), scene.removed_entities.end());
        known.insert(scene.referenced_entities.begin(), scene.referenced_entities.end());
    }
    return std::vector<EntityId>(known.begin(), known.end());
}

std::vector<EntityId> sorted_entities(const EntitySet<EntityId>& entities)
{
    std::vector<EntityId> result(entities.begin(), entities.end());
    std::sort(result.begin(), result.end());
    return result;
}

ScenarioEntityAnalyzer::ScenarioEntityAnalyzer(ScenarioGraphBuilder builder)
    : m_builder{std::move(builder)}
{}

SceneId ScenarioEntityAnalyzer::require_start(const Scenario& scenario) const
{
    auto start = m_builder.find_start_scene(scenario);
    if (!start)
    {
        throw AnalysisError(
            AnalysisErrorCode::InvalidStartNode,
            "Scenario '" + scenario.id + "' has no scenes to start from");
    }
    return *start;
}

DataFlowGraph<SceneId, EntityId> ScenarioEntityAnalyzer::make_nodes(const Scenario& scenario,
                                                                   const SceneGraph& graph) const
{
    EntitySetMap<SceneId, EntityId> introduced;
    EntitySetMap<SceneId, EntityId> removed;
    for (const auto& scene : scenario.scenes)
    {
        // First scene with an id wins; emplace keeps the existing entry.
        introduced.emplace(scene.id,
                           EntitySet<EntityId>(scene.introduced_entities.begin(),
                                               scene.introduced_entities.end()));
        removed.emplace(scene.id,
                        EntitySet<EntityId>(scene.removed_entities.begin(),
                                            scene.removed_entities.end()));
    }
    return make_data_flow_nodes(graph, introduced, removed);
}

EntitySetMap<SceneId, EntityId> ScenarioEntityAnalyzer::must_introduced_sets(const Scenario& scenario) const
{
    SceneId start = require_start(scenario);
    auto graph = m_builder.build(scenario);
    return compute_must_introduced_sets(make_nodes(scenario, graph), start);
}

EntitySetMap<SceneId, EntityId> ScenarioEntityAnalyzer::may_introduced_sets(const Scenario& scenario) const
{
    SceneId start = require_start(scenario);
    auto graph = m_builder.build(scenario);
    return compute_may_introduced_sets(make_nodes(scenario, graph), start);
}

EntityState ScenarioEntityAnalyzer::classify(const SceneId& scene_id,
                                             const EntitySet<EntityId>& must,
                                             const EntitySet<EntityId>& may,
                                             const std::vector<EntityId>& known) const
{
    EntityState state{scene_id, {}, {}, {}};
    for (const auto& e : known)
    {
        if (must.count(e) > 0)
        {
            state.guaranteed_present.push_back(e);
        }
        else if (may.count(e) > 0)
        {
            state.possibly_present.push_back(e);
        }
        else
        {
            state.guaranteed_absent.push_back(e);
        }
    }
    return state;
}

std::vector<EntityState> ScenarioEntityAnalyzer::guaranteed_entity_states(const Scenario& scenario) const
{
    SceneId start = require_start(scenario);
    auto graph = m_builder.build(scenario);
    auto nodes = make_nodes(scenario, graph);
    auto must = compute_must_introduced_sets(nodes, start);
    auto may = compute_may_introduced_sets(nodes, start);
    auto known = known_entities(scenario);

    std::vector<EntityState> states;
    std::unordered_set<SceneId> seen;
    for (const auto& scene : scenario.scenes)
    {
        if (!seen.insert(scene.id).second)
        {
            continue;
        }
        states.push_back(classify(scene.id, must.at(scene.id), may.at(scene.id), known));
    }
    return states;
}

EntityState ScenarioEntityAnalyzer::guaranteed_entity_state(const Scenario& scenario,
                                                            const SceneId& scene_id) const
{
    if (scenario.find_scene(scene_id) == nullptr)
    {
        throw AnalysisError(
            AnalysisErrorCode::InvalidTarget,
            "Scene '" + scene_id + "' is not part of scenario '" + scenario.id + "'");
    }

    SceneId start = require_start(scenario);
    auto graph = m_builder.build(scenario);
    auto nodes = make_nodes(scenario, graph);
    auto must = compute_must_introduced_sets(nodes, start);
    auto may = compute_may_introduced_sets(nodes, start);
    return classify(scene_id, must.at(scene_id), may.at(scene_id), known_entities(scenario));
}

DominatorTree<SceneId> ScenarioEntityAnalyzer::dominator_tree(const Scenario& scenario) const
{
    SceneId start = require_start(scenario);
    auto graph = m_builder.build(scenario);
    return compute_immediate_dominators(graph, start);
}

ScenePath ScenarioEntityAnalyzer::dominator_path_to(const Scenario& scenario, const SceneId& target) const
{
    return dominator_path(dominator_tree(scenario), target);
}

EntityExplorationResult ScenarioEntityAnalyzer::explore_entity_states(const Scenario& scenario,
                                                                      std::optional<size_t> max_depth) const
{
    using Builder = FrontierMergedGraphBuilder<SceneId,
                                               EntityExplorationState,
                                               EntitySignature,
                                               SceneTransition,
                                               std::hash<SceneId>,
                                               EntitySignatureHash>;

    SceneId start = require_start(scenario);
    auto graph = m_builder.build(scenario);
    auto ending_list = m_builder.find_ending_scenes(scenario);
    std::unordered_set<SceneId> endings(ending_list.begin(), ending_list.end());

    // Applies the entity effects of `scene_id` to a sorted present list.
    auto enter_scene = [&scenario](const SceneId& scene_id, const std::vector<EntityId>& before) {
        std::set<EntityId> present(before.begin(), before.end());
        const Scene* scene = scenario.find_scene(scene_id);
        if (scene != nullptr)
        {
            present.insert(scene->introduced_entities.begin(), scene->introduced_entities.end());
            for (const auto& e : scene->removed_entities)
            {
                present.erase(e);
            }
        }
        return std::vector<EntityId>(present.begin(), present.end());
    };

    EntityExplorationState initial{enter_scene(start, {}), {start}};

    auto transitions = [&graph, &enter_scene](const SceneId& scene_id, const EntityExplorationState& state) {
        std::vector<Builder::TransitionType> result;
        for (const auto& edge : graph.outgoing_edges(scene_id))
        {
            EntityExplorationState next{enter_scene(edge.to, state.present), state.path};
            next.path.push_back(edge.to);
            result.push_back(Builder::TransitionType{edge.to, edge.label, std::move(next)});
        }
        return result;
    };

    auto signature = [](const EntityExplorationState& state) { return state.present; };

    ExplorationOptions<SceneId> options;
    options.is_terminal_scene = [&endings](const SceneId& id) { return endings.count(id) > 0; };
    options.max_depth = max_depth;

    return Builder::build(start, initial, transitions, signature, options);
}

} // namespace plotgraph
