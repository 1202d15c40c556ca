#include "plotgraph/scenario/dominator_path_planner.hpp"
#include "plotgraph/common/graph_exceptions.hpp"
#include <sstream>

namespace plotgraph
{

std::string ScenarioEvaluationSummary::summary() const
{
    size_t failed = 0;
    size_t issue_count = 0;
    for (const auto& r : results)
    {
        failed += r.is_consistent ? 0 : 1;
        issue_count += r.issues.size();
    }

    std::ostringstream oss;
    oss << "Scenario '" << scenario_id << "': "
        << (is_consistent ? "consistent" : "inconsistent") << ", "
        << results.size() << " path(s) evaluated, "
        << failed << " inconsistent, "
        << issue_count << " issue(s), score " << overall_score;
    return oss.str();
}

DominatorPathPlanner::DominatorPathPlanner(ScenarioEntityAnalyzer analyzer)
    : m_analyzer{std::move(analyzer)}
    , m_builder{}
{}

std::vector<PathEvaluationRequest> DominatorPathPlanner::plan(const Scenario& scenario,
                                                              const std::vector<SceneId>& target_scene_ids) const
{
    for (const auto& target : target_scene_ids)
    {
        if (scenario.find_scene(target) == nullptr)
        {
            throw AnalysisError(
                AnalysisErrorCode::InvalidTarget,
                "Target scene '" + target + "' is not part of scenario '" + scenario.id + "'");
        }
    }

    auto tree = m_analyzer.dominator_tree(scenario);
    auto targets = target_scene_ids.empty() ? m_builder.find_ending_scenes(scenario) : target_scene_ids;

    std::unordered_map<SceneId, EntityState> states;
    for (auto& state : m_analyzer.guaranteed_entity_states(scenario))
    {
        SceneId id = state.scene_id;
        states.emplace(std::move(id), std::move(state));
    }

    std::vector<PathEvaluationRequest> requests;
    std::unordered_set<SceneId> planned;
    for (const auto& target : targets)
    {
        if (!planned.insert(target).second)
        {
            continue;
        }
        auto path = dominator_path(tree, target);
        if (path.empty())
        {
            continue;
        }

        PathEvaluationRequest request;
        request.scenario_id = scenario.id;
        request.target_scene_id = target;
        request.immediate_dominator_id = tree.at(target);

        std::ostringstream content;
        for (size_t i = 0; i < path.size(); ++i)
        {
            const Scene* scene = scenario.find_scene(path[i]);
            if (i > 0)
            {
                content << "\n\n";
            }
            content << "[" << path[i] << "]";
            if (scene != nullptr)
            {
                if (!scene->title.empty())
                {
                    content << " " << scene->title;
                }
                if (!scene->content.empty())
                {
                    content << "\n" << scene->content;
                }
            }
        }
        request.content = content.str();
        request.path_scene_ids = std::move(path);
        request.entity_state = states.at(target);
        requests.push_back(std::move(request));
    }
    return requests;
}

ScenarioEvaluationSummary DominatorPathPlanner::evaluate(const Scenario& scenario,
                                                         IPathConsistencyEvaluator& evaluator,
                                                         const std::vector<SceneId>& target_scene_ids) const
{
    ScenarioEvaluationSummary summary;
    summary.scenario_id = scenario.id;

    double total = 0.0;
    for (const auto& request : plan(scenario, target_scene_ids))
    {
        auto result = evaluator.evaluate(request);
        if (result.evaluated_path.empty())
        {
            result.evaluated_path = request.path_scene_ids;
        }
        summary.is_consistent = summary.is_consistent && result.is_consistent;
        total += result.score;
        summary.results.push_back(std::move(result));
    }

    if (!summary.results.empty())
    {
        summary.overall_score = total / static_cast<double>(summary.results.size());
    }
    return summary;
}

} // namespace plotgraph
