#include "plotgraph/scenario/dominator_path_planner.hpp"
#include "plotgraph/scenario/scenario_consistency_checker.hpp"
#include "plotgraph/scenario/scenario_entity_analyzer.hpp"
#include "plotgraph/scenario/scenario_graph_builder.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace plotgraph;

namespace
{

Scenario make_sample_scenario()
{
    Scenario s;
    s.id = "lighthouse";
    s.title = "The Lighthouse Keeper";

    Scene arrival;
    arrival.id = "arrival";
    arrival.title = "Arrival";
    arrival.content = "You row to the island. The keeper waves from the rocks.";
    arrival.next_scene_id = "crossroads";
    arrival.introduced_entities = {"keeper", "lantern"};

    Scene crossroads;
    crossroads.id = "crossroads";
    crossroads.title = "Crossroads";
    crossroads.content = "The keeper hands you the lantern and points two ways.";
    crossroads.branches = {Branch{"Climb the tower", SceneId("tower")},
                           Branch{"Search the cellar", SceneId("cellar")}};
    crossroads.referenced_entities = {"keeper", "lantern"};

    Scene tower;
    tower.id = "tower";
    tower.title = "The Tower";
    tower.content = "At the top you find a logbook. The lantern gutters out.";
    tower.next_scene_id = "storm";
    tower.introduced_entities = {"logbook"};
    tower.removed_entities = {"lantern"};

    Scene cellar;
    cellar.id = "cellar";
    cellar.title = "The Cellar";
    cellar.content = "Among the barrels the keeper shows you a hidden map.";
    cellar.next_scene_id = "storm";
    cellar.introduced_entities = {"map"};
    cellar.referenced_entities = {"keeper"};

    Scene storm;
    storm.id = "storm";
    storm.title = "The Storm";
    storm.content = "A storm hits. You read the logbook by the light of the lantern.";
    storm.branches = {Branch{"Ring the bell", SceneId("rescue")},
                      Branch{"Hide below", SceneId("wreck")}};
    storm.referenced_entities = {"logbook", "lantern", "keeper"};

    Scene rescue;
    rescue.id = "rescue";
    rescue.title = "Rescue";
    rescue.content = "The ship sees the light and turns away from the rocks.";

    Scene wreck;
    wreck.id = "wreck";
    wreck.title = "Wreck";
    wreck.content = "The ship runs aground. The keeper never forgives you.";
    wreck.referenced_entities = {"keeper", "ghost"};

    s.scenes = {arrival, crossroads, tower, cellar, storm, rescue, wreck};
    return s;
}

/// Flags paths whose target state lacks an entity that the path content mentions.
class EntityMentionEvaluator : public IPathConsistencyEvaluator
{
public:
    PathConsistencyResult evaluate(const PathEvaluationRequest& request) override
    {
        PathConsistencyResult result;
        result.evaluated_path = request.path_scene_ids;
        for (const auto& e : request.entity_state.guaranteed_absent)
        {
            if (request.content.find(e) != std::string::npos)
            {
                ConsistencyIssue issue;
                issue.type = ConsistencyIssueType::EntityInconsistency;
                issue.severity = IssueSeverity::Warning;
                issue.description = "'" + e + "' is mentioned but absent at '" + request.target_scene_id + "'";
                issue.scene_id = request.target_scene_id;
                issue.entity_name = e;
                result.issues.push_back(std::move(issue));
            }
        }
        result.is_consistent = result.issues.empty();
        result.score = result.is_consistent ? 1.0 : 0.5;
        return result;
    }
};

std::string join(const std::vector<std::string>& items, const char* separator)
{
    std::string result;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
        {
            result += separator;
        }
        result += items[i];
    }
    return result;
}

void run_demo()
{
    Scenario scenario = make_sample_scenario();
    ScenarioGraphBuilder builder;

    auto graph = builder.build(scenario);
    std::cout << "Scenario '" << scenario.title << "': " << graph.node_count() << " scenes, "
              << graph.edge_count() << " transitions\n";
    std::cout << "Start: " << builder.find_start_scene(scenario).value_or("(none)") << "\n";
    std::cout << "Endings: " << join(builder.find_ending_scenes(scenario), ", ") << "\n";

    std::cout << "\n--- Playthroughs ---\n";
    for (const auto& path : builder.enumerate_all_paths(scenario))
    {
        std::cout << "  " << join(path, " -> ") << "\n";
    }

    ScenarioEntityAnalyzer analyzer;
    std::cout << "\n--- Entity states ---\n";
    for (const auto& state : analyzer.guaranteed_entity_states(scenario))
    {
        std::cout << "  " << state.scene_id << ": present {" << join(state.guaranteed_present, ", ")
                  << "} maybe {" << join(state.possibly_present, ", ") << "}\n";
    }

    auto explored = analyzer.explore_entity_states(scenario);
    std::cout << "\n--- Entity state space ---\n";
    std::cout << "  " << explored.graph.node_count() << " merged states, "
              << explored.terminal_nodes.size() << " terminal\n";

    ScenarioConsistencyChecker checker;
    auto diagnostics = checker.check(scenario);
    std::cout << "\n--- Diagnostics: " << diagnostics->summary() << " ---\n";
    for (const auto& item : diagnostics->all_items())
    {
        std::cout << "  [" << (item.severity == DiagnosticSeverity::Error ? "error" : "warning") << "] "
                  << to_string(item.category) << ": " << item.message << "\n";
    }

    DominatorPathPlanner planner;
    EntityMentionEvaluator evaluator;
    auto summary = planner.evaluate(scenario, evaluator);
    std::cout << "\n--- Dominator path evaluation ---\n";
    for (const auto& result : summary.results)
    {
        std::cout << "  " << join(result.evaluated_path, " -> ") << ": "
                  << (result.is_consistent ? "ok" : "issues") << "\n";
        for (const auto& issue : result.issues)
        {
            std::cout << "    " << to_string(issue.severity) << ": " << issue.description << "\n";
        }
    }
    std::cout << "  " << summary.summary() << "\n";
}

} // namespace

int main()
{
    try
    {
        std::cout << "\n\n====== plotgraph ======\n" << std::flush;

        run_demo();

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
