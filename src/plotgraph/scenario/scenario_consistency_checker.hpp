/**
 * @file scenario_consistency_checker.hpp
 * @brief Structural and entity consistency checks for scenarios.
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/scenario/scenario_diagnostics.hpp"
#include "plotgraph/scenario/scenario_entity_analyzer.hpp"
#include "plotgraph/scenario/scenario_graph_builder.hpp"
#include "plotgraph/scenario/scenario_model.hpp"

namespace plotgraph
{

/**
 * @brief Configuration for scenario consistency checks.
 */
struct ConsistencyCheckConfig
{
    /**
     * @brief Whether to report scenes unreachable from the start scene.
     */
    bool check_reachability{true};

    /**
     * @brief Whether to check referenced entities against the entity analyses.
     */
    bool check_entities{true};

    /**
     * @brief Whether a possibly absent entity is reported at all.
     * @details Only effective when `check_entities` is set.
     */
    bool report_possibly_absent{true};
};

/**
 * @brief Detects broken and suspicious scenarios.
 *
 * @details
 * Structural checks always run:
 * - An empty scenario yields a single `MissingStartScene` error and nothing else.
 * - Each scene id used more than once yields one `DuplicateSceneId` error.
 * - Each linear successor or branch target that names no scene yields one
 *   `DanglingSceneReference` error.
 * - A scenario without ending scenes yields a `NoEndingScene` warning.
 *
 * Reachability (`UnreachableScene` warnings) and entity checks are optional.
 *
 * @par Entity checks
 * An entity referenced by a reachable scene must be available when the scene
 * is entered: present after every predecessor, or introduced by the scene
 * itself. Availability is judged with the must and may analyses:
 * - absent on every path: `UndefinedEntityReference` error,
 * - absent on some path: `PossiblyAbsentEntity` warning.
 * Unreachable scenes are not entity-checked.
 */
class ScenarioConsistencyChecker
{
public:
    explicit ScenarioConsistencyChecker(ConsistencyCheckConfig config = {});

    const ConsistencyCheckConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Check a scenario.
     * @return Diagnostics; `is_valid()` is true if no errors were found.
     */
    std::shared_ptr<ScenarioDiagnostics> check(const Scenario& scenario) const;

private:
    void check_structure(const Scenario& scenario, ScenarioDiagnostics& diagnostics) const;
    void check_reachability(const Scenario& scenario,
                            const SceneGraph& graph,
                            const SceneId& start,
                            ScenarioDiagnostics& diagnostics) const;
    void check_entities(const Scenario& scenario,
                        const SceneGraph& graph,
                        const SceneId& start,
                        ScenarioDiagnostics& diagnostics) const;

    static void add_error(ScenarioDiagnostics& diagnostics, DiagnosticItem item);
    static void add_warning(ScenarioDiagnostics& diagnostics, DiagnosticItem item);

    ConsistencyCheckConfig m_config;
    ScenarioGraphBuilder m_builder;
    ScenarioEntityAnalyzer m_analyzer;
};

} // namespace plotgraph
