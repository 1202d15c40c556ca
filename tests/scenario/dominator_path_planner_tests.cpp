/**
 * @file dominator_path_planner_tests.cpp
 * @brief Unit tests for DominatorPathPlanner and evaluation aggregation.
 */
#include <gtest/gtest.h>
#include "plotgraph/scenario/dominator_path_planner.hpp"

using namespace plotgraph;

namespace
{

Scene scene(const std::string& id, const std::string& content, std::optional<SceneId> next = std::nullopt)
{
    Scene s;
    s.id = id;
    s.title = "Title " + id;
    s.content = content;
    s.next_scene_id = std::move(next);
    return s;
}

/// start (lamp) -> [a, b] -> join -> finale; b -> alt_end
Scenario make_story()
{
    Scenario s;
    s.id = "story";

    Scene start = scene("start", "You wake up.");
    start.introduced_entities = {"lamp"};
    start.branches = {Branch{"left", SceneId("a")}, Branch{"right", SceneId("b")}};

    Scene b = scene("b", "A dark corridor.");
    b.branches = {Branch{"forward", SceneId("join")}, Branch{"give up", SceneId("alt_end")}};

    s.scenes = {start,
                scene("a", "A bright room.", SceneId("join")),
                b,
                scene("join", "The paths meet.", SceneId("finale")),
                scene("finale", "The end."),
                scene("alt_end", "You turn back.")};
    return s;
}

/// Records requests and returns scripted verdicts.
class RecordingEvaluator : public IPathConsistencyEvaluator
{
public:
    explicit RecordingEvaluator(std::vector<PathConsistencyResult> verdicts = {})
        : m_verdicts(std::move(verdicts))
    {}

    PathConsistencyResult evaluate(const PathEvaluationRequest& request) override
    {
        requests.push_back(request);
        if (m_next < m_verdicts.size())
        {
            return m_verdicts[m_next++];
        }
        return PathConsistencyResult{};
    }

    std::vector<PathEvaluationRequest> requests;

private:
    std::vector<PathConsistencyResult> m_verdicts;
    size_t m_next = 0;
};

PathConsistencyResult verdict(bool consistent, double score)
{
    PathConsistencyResult r;
    r.is_consistent = consistent;
    r.score = score;
    return r;
}

} // namespace

// ============================================================================
// plan
// ============================================================================

TEST(DominatorPathPlannerTests, Plan_DefaultTargetsAreEndings)
{
    auto requests = DominatorPathPlanner().plan(make_story());

    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].target_scene_id, "finale");
    EXPECT_EQ(requests[0].path_scene_ids, (ScenePath{"start", "join", "finale"}));
    EXPECT_EQ(requests[0].immediate_dominator_id, std::optional<SceneId>("join"));
    EXPECT_EQ(requests[1].target_scene_id, "alt_end");
    EXPECT_EQ(requests[1].path_scene_ids, (ScenePath{"start", "b", "alt_end"}));
    EXPECT_EQ(requests[0].scenario_id, "story");
}

TEST(DominatorPathPlannerTests, Plan_ContentConcatenatedInPathOrder)
{
    auto requests = DominatorPathPlanner().plan(make_story(), {"join"});

    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].content,
              "[start] Title start\nYou wake up.\n\n[join] Title join\nThe paths meet.");
}

TEST(DominatorPathPlannerTests, Plan_CarriesEntityStateOfTarget)
{
    auto requests = DominatorPathPlanner().plan(make_story(), {"finale"});

    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].entity_state.scene_id, "finale");
    EXPECT_EQ(requests[0].entity_state.guaranteed_present, (std::vector<EntityId>{"lamp"}));
}

TEST(DominatorPathPlannerTests, Plan_StartTargetHasNoDominator)
{
    auto requests = DominatorPathPlanner().plan(make_story(), {"start"});

    ASSERT_EQ(requests.size(), 1u);
    EXPECT_FALSE(requests[0].immediate_dominator_id.has_value());
    EXPECT_EQ(requests[0].path_scene_ids, (ScenePath{"start"}));
}

TEST(DominatorPathPlannerTests, Plan_UnknownTarget_Throws)
{
    try
    {
        DominatorPathPlanner().plan(make_story(), {"nowhere"});
        FAIL() << "Expected AnalysisError";
    }
    catch (const AnalysisError& e)
    {
        EXPECT_EQ(e.code(), AnalysisErrorCode::InvalidTarget);
    }
}

TEST(DominatorPathPlannerTests, Plan_UnreachableTarget_Skipped)
{
    Scenario s = make_story();
    s.scenes.push_back(scene("secret", "Hidden.", SceneId("secret")));

    auto requests = DominatorPathPlanner().plan(s, {"secret", "finale"});

    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].target_scene_id, "finale");
}

TEST(DominatorPathPlannerTests, Plan_DuplicateEndingId_PlannedOnce)
{
    Scenario s = make_story();
    s.scenes.push_back(scene("finale", "Another ending with the same id."));

    auto requests = DominatorPathPlanner().plan(s);

    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].target_scene_id, "finale");
    EXPECT_EQ(requests[1].target_scene_id, "alt_end");
}

TEST(DominatorPathPlannerTests, Plan_RepeatedExplicitTarget_PlannedOnce)
{
    auto requests = DominatorPathPlanner().plan(make_story(), {"join", "finale", "join"});

    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].target_scene_id, "join");
    EXPECT_EQ(requests[1].target_scene_id, "finale");
}

TEST(DominatorPathPlannerTests, Plan_EmptyScenario_Throws)
{
    Scenario s;
    s.id = "empty";

    EXPECT_THROW(DominatorPathPlanner().plan(s), AnalysisError);
}

// ============================================================================
// evaluate
// ============================================================================

TEST(DominatorPathPlannerTests, Evaluate_ForwardsRequestsInOrder)
{
    RecordingEvaluator evaluator;

    auto summary = DominatorPathPlanner().evaluate(make_story(), evaluator);

    ASSERT_EQ(evaluator.requests.size(), 2u);
    EXPECT_EQ(evaluator.requests[0].target_scene_id, "finale");
    EXPECT_EQ(evaluator.requests[1].target_scene_id, "alt_end");
    EXPECT_EQ(summary.scenario_id, "story");
    EXPECT_EQ(summary.results.size(), 2u);
}

TEST(DominatorPathPlannerTests, Evaluate_AggregatesScoresAndConsistency)
{
    RecordingEvaluator evaluator({verdict(true, 1.0), verdict(false, 0.5)});

    auto summary = DominatorPathPlanner().evaluate(make_story(), evaluator);

    EXPECT_FALSE(summary.is_consistent);
    EXPECT_DOUBLE_EQ(summary.overall_score, 0.75);
}

TEST(DominatorPathPlannerTests, Evaluate_FillsMissingEvaluatedPath)
{
    RecordingEvaluator evaluator;

    auto summary = DominatorPathPlanner().evaluate(make_story(), evaluator, {"join"});

    ASSERT_EQ(summary.results.size(), 1u);
    EXPECT_EQ(summary.results[0].evaluated_path, (ScenePath{"start", "join"}));
}

TEST(DominatorPathPlannerTests, Evaluate_NothingToEvaluate_PerfectScore)
{
    Scenario s;
    s.id = "loop";
    s.scenes = {scene("x", "", SceneId("y")), scene("y", "", SceneId("x"))};
    RecordingEvaluator evaluator;

    auto summary = DominatorPathPlanner().evaluate(s, evaluator);

    EXPECT_TRUE(evaluator.requests.empty());
    EXPECT_TRUE(summary.is_consistent);
    EXPECT_DOUBLE_EQ(summary.overall_score, 1.0);
    EXPECT_NE(summary.summary().find("0 path(s) evaluated"), std::string::npos);
}

TEST(DominatorPathPlannerTests, Evaluate_EvaluatorExceptionPropagates)
{
    class ThrowingEvaluator : public IPathConsistencyEvaluator
    {
    public:
        PathConsistencyResult evaluate(const PathEvaluationRequest&) override
        {
            throw std::runtime_error("evaluator unavailable");
        }
    };
    ThrowingEvaluator evaluator;

    EXPECT_THROW(DominatorPathPlanner().evaluate(make_story(), evaluator), std::runtime_error);
}
