/**
 * @file data_flow_tests.cpp
 * @brief Unit tests for the must- and may-introduced entity analyses.
 */
#include <gtest/gtest.h>
#include "plotgraph/analysis/data_flow.hpp"
#include "plotgraph/common/directed_graph.hpp"
#include "plotgraph/common/directed_graph.inline.hpp"

using namespace plotgraph;

namespace
{

using Node = DataFlowNode<std::string, std::string>;
using Nodes = DataFlowGraph<std::string, std::string>;
using Set = EntitySet<std::string>;

void add(Nodes& nodes,
         const std::string& id,
         std::vector<std::string> preds,
         std::vector<std::string> succs,
         Set introduced = {},
         Set removed = {})
{
    nodes.emplace(id, Node{id, std::move(preds), std::move(succs), std::move(introduced), std::move(removed)});
}

/// A (introduces x) -> B (introduces y, removes x) -> C
Nodes make_chain()
{
    Nodes nodes;
    add(nodes, "A", {}, {"B"}, {"x"});
    add(nodes, "B", {"A"}, {"C"}, {"y"}, {"x"});
    add(nodes, "C", {"B"}, {});
    return nodes;
}

/// S (k) -> L (a), S -> R (b), L -> J, R -> J (c)
Nodes make_diamond()
{
    Nodes nodes;
    add(nodes, "S", {}, {"L", "R"}, {"k"});
    add(nodes, "L", {"S"}, {"J"}, {"a"});
    add(nodes, "R", {"S"}, {"J"}, {"b"});
    add(nodes, "J", {"L", "R"}, {}, {"c"});
    return nodes;
}

} // namespace

// ============================================================================
// Must analysis
// ============================================================================

TEST(DataFlowTests, MustIntroduced_ChainSample)
{
    auto must = compute_must_introduced_sets(make_chain(), "A");

    EXPECT_EQ(must.at("A"), (Set{"x"}));
    EXPECT_EQ(must.at("B"), (Set{"y"}));
    EXPECT_EQ(must.at("C"), (Set{"y"}));
}

TEST(DataFlowTests, MustIntroduced_StartSeedIsIntroducedMinusRemoved)
{
    Nodes nodes;
    add(nodes, "S", {}, {"T"}, {"a", "b"}, {"b"});
    add(nodes, "T", {"S"}, {});

    auto must = compute_must_introduced_sets(nodes, "S");

    EXPECT_EQ(must.at("S"), (Set{"a"}));
    EXPECT_EQ(must.at("T"), (Set{"a"}));
}

TEST(DataFlowTests, MustIntroduced_JoinIntersectsPredecessors)
{
    auto must = compute_must_introduced_sets(make_diamond(), "S");

    EXPECT_EQ(must.at("L"), (Set{"k", "a"}));
    EXPECT_EQ(must.at("R"), (Set{"k", "b"}));
    EXPECT_EQ(must.at("J"), (Set{"k", "c"}));
}

TEST(DataFlowTests, MustIntroduced_JoinNeverExceedsMeetBound)
{
    auto nodes = make_diamond();
    auto must = compute_must_introduced_sets(nodes, "S");

    for (const auto& [id, node] : nodes)
    {
        if (node.predecessor_ids.size() < 2)
        {
            continue;
        }
        Set bound = must.at(node.predecessor_ids.front());
        for (const auto& p : node.predecessor_ids)
        {
            Set kept;
            for (const auto& e : bound)
            {
                if (must.at(p).count(e) > 0)
                {
                    kept.insert(e);
                }
            }
            bound = kept;
        }
        bound.insert(node.introduced_entities.begin(), node.introduced_entities.end());
        for (const auto& e : node.removed_entities)
        {
            bound.erase(e);
        }
        for (const auto& e : must.at(id))
        {
            EXPECT_EQ(bound.count(e), 1u) << id << " " << e;
        }
    }
}

TEST(DataFlowTests, MustIntroduced_InvalidStart_Throws)
{
    try
    {
        compute_must_introduced_sets(make_chain(), "Z");
        FAIL() << "Expected AnalysisError";
    }
    catch (const AnalysisError& e)
    {
        EXPECT_EQ(e.code(), AnalysisErrorCode::InvalidStartNode);
    }
}

TEST(DataFlowTests, MustIntroduced_Idempotent)
{
    auto nodes = make_diamond();

    auto first = compute_must_introduced_sets(nodes, "S");
    auto second = compute_must_introduced_sets(nodes, "S");

    EXPECT_EQ(first, second);
}

TEST(DataFlowTests, MustIntroduced_DanglingIdsSkipped)
{
    Nodes nodes;
    add(nodes, "A", {}, {"B", "ghost"}, {"x"});
    add(nodes, "B", {"A", "phantom"}, {}, {"y"});

    auto must = compute_must_introduced_sets(nodes, "A");

    EXPECT_EQ(must.size(), 2u);
    EXPECT_EQ(must.at("B"), (Set{"x", "y"}));
}

TEST(DataFlowTests, MustIntroduced_PredecessorlessNonStart_LocalOnly)
{
    // O has no predecessors and is not the start. It is only reached by the
    // worklist if something schedules it; as a start successor it is.
    Nodes nodes;
    add(nodes, "S", {}, {"O"}, {"s"});
    add(nodes, "O", {}, {}, {"o"}, {"s"});

    auto must = compute_must_introduced_sets(nodes, "S");

    EXPECT_EQ(must.at("O"), (Set{"o"}));
}

TEST(DataFlowTests, MustIntroduced_UnscheduledNodesStayEmpty)
{
    Nodes nodes;
    add(nodes, "S", {}, {}, {"s"});
    add(nodes, "Island", {}, {}, {"i"});

    auto must = compute_must_introduced_sets(nodes, "S");

    EXPECT_TRUE(must.at("Island").empty());
}

TEST(DataFlowTests, MustIntroduced_LoopReachesFixpoint)
{
    // S (a) -> H (h) -> B (b, removes a) -> H, H -> E
    Nodes nodes;
    add(nodes, "S", {}, {"H"}, {"a"});
    add(nodes, "H", {"S", "B"}, {"B", "E"}, {"h"});
    add(nodes, "B", {"H"}, {"H"}, {"b"}, {"a"});
    add(nodes, "E", {"H"}, {});

    auto must = compute_must_introduced_sets(nodes, "S");

    EXPECT_EQ(must.at("H"), (Set{"h"}));
    EXPECT_EQ(must.at("B"), (Set{"h", "b"}));
    EXPECT_EQ(must.at("E"), (Set{"h"}));
}

TEST(DataFlowTests, MustIntroduced_UnchangedNodeDoesNotScheduleSuccessors)
{
    // H stays empty on its first visit, so B and E are never scheduled.
    Nodes nodes;
    add(nodes, "S", {}, {"H"}, {"a"});
    add(nodes, "H", {"S", "B"}, {"B", "E"});
    add(nodes, "B", {"H"}, {"H"}, {"b"});
    add(nodes, "E", {"H"}, {});

    auto must = compute_must_introduced_sets(nodes, "S");

    EXPECT_TRUE(must.at("H").empty());
    EXPECT_TRUE(must.at("B").empty());
    EXPECT_TRUE(must.at("E").empty());
}

// ============================================================================
// May analysis
// ============================================================================

TEST(DataFlowTests, MayIntroduced_JoinUnitesPredecessors)
{
    auto may = compute_may_introduced_sets(make_diamond(), "S");

    EXPECT_EQ(may.at("J"), (Set{"k", "a", "b", "c"}));
}

TEST(DataFlowTests, MayIntroduced_IsSupersetOfMust)
{
    auto nodes = make_diamond();
    auto must = compute_must_introduced_sets(nodes, "S");
    auto may = compute_may_introduced_sets(nodes, "S");

    for (const auto& [id, set] : must)
    {
        for (const auto& e : set)
        {
            EXPECT_EQ(may.at(id).count(e), 1u) << id << " " << e;
        }
    }
}

TEST(DataFlowTests, MayIntroduced_InvalidStart_Throws)
{
    EXPECT_THROW(compute_may_introduced_sets(make_chain(), "Z"), AnalysisError);
}

// ============================================================================
// make_data_flow_nodes
// ============================================================================

TEST(DataFlowTests, MakeDataFlowNodes_DerivesAdjacencyFromGraph)
{
    using Graph = DirectedGraph<std::string, int>;
    auto g = Graph::from_edges({Graph::EdgeType("A", "B", 0), Graph::EdgeType("B", "C", 0)});
    EntitySetMap<std::string, std::string> introduced{{"A", {"x"}}, {"B", {"y"}}};
    EntitySetMap<std::string, std::string> removed{{"B", {"x"}}};

    auto nodes = make_data_flow_nodes(g, introduced, removed);

    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes.at("B").predecessor_ids, (std::vector<std::string>{"A"}));
    EXPECT_EQ(nodes.at("B").successor_ids, (std::vector<std::string>{"C"}));
    EXPECT_TRUE(nodes.at("C").introduced_entities.empty());

    auto must = compute_must_introduced_sets(nodes, "A");
    EXPECT_EQ(must.at("C"), (Set{"y"}));
}
