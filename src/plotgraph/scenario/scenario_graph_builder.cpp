#include "plotgraph/scenario/scenario_graph_builder.hpp"
#include "plotgraph/common/path_algorithms.hpp"

namespace plotgraph
{

ScenarioGraphBuilder::ScenarioGraphBuilder(ScenarioPathConfig config)
    : m_config{std::move(config)}
{}

SceneGraph ScenarioGraphBuilder::build(const Scenario& scenario) const
{
    SceneGraph::EdgeList edges;
    std::vector<SceneId> scene_ids;
    scene_ids.reserve(scenario.scenes.size());

    for (const auto& scene : scenario.scenes)
    {
        scene_ids.push_back(scene.id);

        if (scene.has_next_scene())
        {
            SceneTransition transition{scene.id, *scene.next_scene_id, TransitionType::Linear, std::nullopt};
            edges.emplace_back(scene.id, *scene.next_scene_id, std::move(transition));
        }

        for (const auto& branch : scene.branches)
        {
            if (!branch.has_target())
            {
                continue;
            }
            SceneTransition transition{scene.id, *branch.next_scene_id, TransitionType::Branch, branch.choice};
            edges.emplace_back(scene.id, *branch.next_scene_id, std::move(transition));
        }
    }

    return SceneGraph::from_edges(std::move(edges), scene_ids);
}

std::optional<SceneId> ScenarioGraphBuilder::find_start_scene(const Scenario& scenario) const
{
    if (scenario.scenes.empty())
    {
        return std::nullopt;
    }

    std::unordered_set<SceneId> targets;
    for (const auto& scene : scenario.scenes)
    {
        if (scene.has_next_scene())
        {
            targets.insert(*scene.next_scene_id);
        }
        for (const auto& branch : scene.branches)
        {
            if (branch.has_target())
            {
                targets.insert(*branch.next_scene_id);
            }
        }
    }

    for (const auto& scene : scenario.scenes)
    {
        if (targets.count(scene.id) == 0)
        {
            return scene.id;
        }
    }

    // Every scene is targeted: fall back to the first one.
    return scenario.scenes.front().id;
}

std::vector<SceneId> ScenarioGraphBuilder::find_ending_scenes(const Scenario& scenario) const
{
    std::vector<SceneId> endings;
    for (const auto& scene : scenario.scenes)
    {
        if (scene.is_ending())
        {
            endings.push_back(scene.id);
        }
    }
    return endings;
}

std::vector<ScenePath> ScenarioGraphBuilder::enumerate_all_paths(const Scenario& scenario) const
{
    return enumerate_all_paths(scenario, m_config.max_paths);
}

std::vector<ScenePath> ScenarioGraphBuilder::enumerate_all_paths(const Scenario& scenario,
                                                                 size_t max_paths) const
{
    std::vector<ScenePath> result;
    auto start = find_start_scene(scenario);
    auto ending_list = find_ending_scenes(scenario);
    if (!start || ending_list.empty() || max_paths == 0)
    {
        return result;
    }

    std::unordered_set<SceneId> endings(ending_list.begin(), ending_list.end());
    auto graph = build(scenario);

    PathEnumerationOptions options;
    options.max_depth = m_config.max_depth;
    options.max_paths = max_paths;
    options.report_depth_cut_paths = false;

    return enumerate_paths(
        graph,
        *start,
        [&endings](const SceneId& id) { return endings.count(id) > 0; },
        options);
}

} // namespace plotgraph
