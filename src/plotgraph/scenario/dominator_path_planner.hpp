/**
 * @file dominator_path_planner.hpp
 * @brief Selects dominator paths of a scenario and hands them to an evaluator.
 */
#pragma once
#include "plotgraph/common/common.hpp"
#include "plotgraph/scenario/scenario_entity_analyzer.hpp"
#include "plotgraph/scenario/scenario_enums.hpp"
#include "plotgraph/scenario/scenario_graph_builder.hpp"
#include "plotgraph/scenario/scenario_model.hpp"

namespace plotgraph
{

/**
 * @brief Everything an evaluator needs to judge one dominator path.
 */
struct PathEvaluationRequest
{
    std::string scenario_id;
    SceneId target_scene_id;

    /// Immediate dominator of the target; unset when the target is the start scene.
    std::optional<SceneId> immediate_dominator_id{};

    /// Dominator path, start scene first, target last.
    ScenePath path_scene_ids;

    /// Scene contents along the path, one block per scene.
    std::string content;

    /// Entity classification after the target scene.
    EntityState entity_state;
};

/**
 * @brief One problem reported by an evaluator.
 */
struct ConsistencyIssue
{
    ConsistencyIssueType type{ConsistencyIssueType::Unknown};
    IssueSeverity severity{IssueSeverity::Warning};
    std::string description;
    std::optional<SceneId> scene_id{};
    std::optional<EntityId> entity_name{};
    std::optional<std::string> suggested_fix{};
};

/**
 * @brief Verdict of an evaluator on one path.
 */
struct PathConsistencyResult
{
    bool is_consistent{true};

    /// Quality score in `[0, 1]`.
    double score{1.0};

    std::vector<ConsistencyIssue> issues;
    ScenePath evaluated_path;
};

/**
 * @brief Judges the consistency of a narrative path.
 *
 * @details
 * The production implementation sits behind a language-model service and is
 * not part of this library. Implementations may block; the planner calls
 * `evaluate()` sequentially, once per request.
 */
class IPathConsistencyEvaluator
{
public:
    virtual ~IPathConsistencyEvaluator() = default;

    /**
     * @brief Evaluate one path.
     * @throw May throw; the exception propagates out of `DominatorPathPlanner::evaluate()`.
     */
    virtual PathConsistencyResult evaluate(const PathEvaluationRequest& request) = 0;
};

/**
 * @brief Aggregate of all path verdicts for a scenario.
 */
struct ScenarioEvaluationSummary
{
    std::string scenario_id;

    /// True if every result is consistent (also when there are none).
    bool is_consistent{true};

    /// Mean of the result scores; 1.0 when nothing was evaluated.
    double overall_score{1.0};

    std::vector<PathConsistencyResult> results;

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const;
};

/**
 * @brief Plans and runs dominator-path consistency evaluation.
 *
 * @details
 * Checking every playthrough of a branching story is exponential. The
 * planner instead evaluates, per target scene, the chain of scenes that
 * every playthrough passes on its way there (the dominator path), together
 * with the entity state that is guaranteed at the target.
 */
class DominatorPathPlanner
{
public:
    explicit DominatorPathPlanner(ScenarioEntityAnalyzer analyzer = ScenarioEntityAnalyzer{});

    /**
     * @brief Build one evaluation request per target scene.
     *
     * @details
     * With no targets, every ending scene is a target. Targets unreachable
     * from the start scene are skipped. A target listed more than once is
     * planned once, at its first position.
     *
     * @throw AnalysisError with `InvalidTarget` if a target names no scene.
     * @throw AnalysisError with `InvalidStartNode` if the scenario is empty.
     */
    std::vector<PathEvaluationRequest> plan(const Scenario& scenario,
                                            const std::vector<SceneId>& target_scene_ids = {}) const;

    /**
     * @brief Plan, evaluate each request in order, and aggregate the verdicts.
     */
    ScenarioEvaluationSummary evaluate(const Scenario& scenario,
                                       IPathConsistencyEvaluator& evaluator,
                                       const std::vector<SceneId>& target_scene_ids = {}) const;

private:
    ScenarioEntityAnalyzer m_analyzer;
    ScenarioGraphBuilder m_builder;
};

} // namespace plotgraph
