#include "plotgraph/scenario/scenario_consistency_checker.hpp"
#include "plotgraph/common/graph_algorithms.hpp"
#include <sstream>

namespace plotgraph
{

const char* to_string(DiagnosticCategory category) noexcept
{
    switch (category)
    {
    case DiagnosticCategory::DuplicateSceneId:
        return "DuplicateSceneId";
    case DiagnosticCategory::DanglingSceneReference:
        return "DanglingSceneReference";
    case DiagnosticCategory::MissingStartScene:
        return "MissingStartScene";
    case DiagnosticCategory::NoEndingScene:
        return "NoEndingScene";
    case DiagnosticCategory::UnreachableScene:
        return "UnreachableScene";
    case DiagnosticCategory::UndefinedEntityReference:
        return "UndefinedEntityReference";
    case DiagnosticCategory::PossiblyAbsentEntity:
        return "PossiblyAbsentEntity";
    }
    return "Unknown";
}

ScenarioConsistencyChecker::ScenarioConsistencyChecker(ConsistencyCheckConfig config)
    : m_config{config}
    , m_builder{}
    , m_analyzer{}
{}

void ScenarioConsistencyChecker::add_error(ScenarioDiagnostics& diagnostics, DiagnosticItem item)
{
    item.severity = DiagnosticSeverity::Error;
    diagnostics.m_errors.push_back(std::move(item));
}

void ScenarioConsistencyChecker::add_warning(ScenarioDiagnostics& diagnostics, DiagnosticItem item)
{
    item.severity = DiagnosticSeverity::Warning;
    diagnostics.m_warnings.push_back(std::move(item));
}

std::shared_ptr<ScenarioDiagnostics> ScenarioConsistencyChecker::check(const Scenario& scenario) const
{
    auto diagnostics = std::make_shared<ScenarioDiagnostics>();

    auto start = m_builder.find_start_scene(scenario);
    if (!start)
    {
        add_error(*diagnostics,
                  DiagnosticItem{DiagnosticSeverity::Error,
                                 DiagnosticCategory::MissingStartScene,
                                 "Scenario '" + scenario.id + "' has no scenes",
                                 {},
                                 {}});
        return diagnostics;
    }

    check_structure(scenario, *diagnostics);

    auto graph = m_builder.build(scenario);
    if (m_config.check_reachability)
    {
        check_reachability(scenario, graph, *start, *diagnostics);
    }
    if (m_config.check_entities)
    {
        check_entities(scenario, graph, *start, *diagnostics);
    }
    return diagnostics;
}

void ScenarioConsistencyChecker::check_structure(const Scenario& scenario,
                                                 ScenarioDiagnostics& diagnostics) const
{
    std::unordered_map<SceneId, size_t> occurrences;
    for (const auto& scene : scenario.scenes)
    {
        ++occurrences[scene.id];
    }

    std::unordered_set<SceneId> reported;
    for (const auto& scene : scenario.scenes)
    {
        size_t n = occurrences[scene.id];
        if (n > 1 && reported.insert(scene.id).second)
        {
            std::ostringstream oss;
            oss << "Scene id '" << scene.id << "' is used by " << n << " scenes";
            add_error(diagnostics,
                      DiagnosticItem{DiagnosticSeverity::Error,
                                     DiagnosticCategory::DuplicateSceneId,
                                     oss.str(),
                                     {scene.id},
                                     {}});
        }
    }

    auto report_dangling = [&](const Scene& scene, const SceneId& target, const std::string& via) {
        if (occurrences.count(target) > 0)
        {
            return;
        }
        add_error(diagnostics,
                  DiagnosticItem{DiagnosticSeverity::Error,
                                 DiagnosticCategory::DanglingSceneReference,
                                 "Scene '" + scene.id + "' " + via + " unknown scene '" + target + "'",
                                 {scene.id, target},
                                 {}});
    };

    for (const auto& scene : scenario.scenes)
    {
        if (scene.has_next_scene())
        {
            report_dangling(scene, *scene.next_scene_id, "continues to");
        }
        for (const auto& branch : scene.branches)
        {
            if (branch.has_target())
            {
                report_dangling(scene, *branch.next_scene_id, "branches (\"" + branch.choice + "\") to");
            }
        }
    }

    if (m_builder.find_ending_scenes(scenario).empty())
    {
        add_warning(diagnostics,
                    DiagnosticItem{DiagnosticSeverity::Warning,
                                   DiagnosticCategory::NoEndingScene,
                                   "Scenario '" + scenario.id + "' has no ending scene",
                                   {},
                                   {}});
    }
}

void ScenarioConsistencyChecker::check_reachability(const Scenario& scenario,
                                                    const SceneGraph& graph,
                                                    const SceneId& start,
                                                    ScenarioDiagnostics& diagnostics) const
{
    auto order = breadth_first(graph, {start});
    std::unordered_set<SceneId> reachable(order.begin(), order.end());

    std::unordered_set<SceneId> reported;
    for (const auto& scene : scenario.scenes)
    {
        if (reachable.count(scene.id) > 0 || !reported.insert(scene.id).second)
        {
            continue;
        }
        add_warning(diagnostics,
                    DiagnosticItem{DiagnosticSeverity::Warning,
                                   DiagnosticCategory::UnreachableScene,
                                   "Scene '" + scene.id + "' cannot be reached from start scene '" +
                                       start + "'",
                                   {scene.id},
                                   {}});
    }
}

void ScenarioConsistencyChecker::check_entities(const Scenario& scenario,
                                                const SceneGraph& graph,
                                                const SceneId& start,
                                                ScenarioDiagnostics& diagnostics) const
{
    auto must = m_analyzer.must_introduced_sets(scenario);
    auto may = m_analyzer.may_introduced_sets(scenario);

    auto order = breadth_first(graph, {start});
    std::unordered_set<SceneId> reachable(order.begin(), order.end());

    std::unordered_set<SceneId> checked;
    for (const auto& scene : scenario.scenes)
    {
        if (reachable.count(scene.id) == 0 || !checked.insert(scene.id).second)
        {
            continue;
        }

        // Entry sets: meet of the reachable predecessors' sets.
        EntitySet<EntityId> entry_must;
        EntitySet<EntityId> entry_may;
        bool first = true;
        for (const auto& pred : graph.predecessors(scene.id))
        {
            if (reachable.count(pred) == 0)
            {
                continue;
            }
            const auto& pred_must = must.at(pred);
            const auto& pred_may = may.at(pred);
            if (first)
            {
                entry_must = pred_must;
                first = false;
            }
            else
            {
                detail::intersect_into(entry_must, pred_must);
            }
            entry_may.insert(pred_may.begin(), pred_may.end());
        }

        EntitySet<EntityId> local(scene.introduced_entities.begin(), scene.introduced_entities.end());

        std::unordered_set<EntityId> seen;
        for (const auto& entity : scene.referenced_entities)
        {
            if (!seen.insert(entity).second || local.count(entity) > 0 || entry_must.count(entity) > 0)
            {
                continue;
            }

            if (entry_may.count(entity) == 0)
            {
                add_error(diagnostics,
                          DiagnosticItem{DiagnosticSeverity::Error,
                                         DiagnosticCategory::UndefinedEntityReference,
                                         "Scene '" + scene.id + "' references '" + entity +
                                             "', which is not present on any path reaching it",
                                         {scene.id},
                                         {entity}});
            }
            else if (m_config.report_possibly_absent)
            {
                add_warning(diagnostics,
                            DiagnosticItem{DiagnosticSeverity::Warning,
                                           DiagnosticCategory::PossiblyAbsentEntity,
                                           "Scene '" + scene.id + "' references '" + entity +
                                               "', which is absent on some paths reaching it",
                                           {scene.id},
                                           {entity}});
            }
        }
    }
}

} // namespace plotgraph
