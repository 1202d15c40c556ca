/**
 * @file path_algorithms_tests.cpp
 * @brief Unit tests for path enumeration and shared-suffix compression.
 */
#include <gtest/gtest.h>
#include "plotgraph/common/directed_graph.hpp"
#include "plotgraph/common/directed_graph.inline.hpp"
#include "plotgraph/common/path_algorithms.hpp"

using namespace plotgraph;

namespace
{

using Graph = DirectedGraph<std::string, std::string>;
using GEdge = Graph::EdgeType;
using Path = std::vector<std::string>;

Graph make_diamond_with_tail()
{
    // A -> B -> D -> E
    // A -> C -> D
    return Graph::from_edges({GEdge("A", "B", "ab"),
                              GEdge("A", "C", "ac"),
                              GEdge("B", "D", "bd"),
                              GEdge("C", "D", "cd"),
                              GEdge("D", "E", "de")});
}

} // namespace

// ============================================================================
// enumerate_paths
// ============================================================================

TEST(PathAlgorithmsTests, EnumeratePaths_DefaultTerminalIsSink)
{
    auto g = make_diamond_with_tail();

    auto paths = enumerate_paths(g, "A");

    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], (Path{"A", "B", "D", "E"}));
    EXPECT_EQ(paths[1], (Path{"A", "C", "D", "E"}));
}

TEST(PathAlgorithmsTests, EnumeratePaths_CustomTerminalStopsEarly)
{
    auto g = make_diamond_with_tail();

    auto paths = enumerate_paths(g, "A", [](const std::string& n) { return n == "D"; });

    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], (Path{"A", "B", "D"}));
    EXPECT_EQ(paths[1], (Path{"A", "C", "D"}));
}

TEST(PathAlgorithmsTests, EnumeratePaths_StartIsTerminal_SingleNodePath)
{
    auto g = make_diamond_with_tail();

    auto paths = enumerate_paths(g, "E");

    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], (Path{"E"}));
}

TEST(PathAlgorithmsTests, EnumeratePaths_MaxPathsBound)
{
    auto g = make_diamond_with_tail();
    PathEnumerationOptions options;
    options.max_paths = 1;

    auto paths = enumerate_paths(g, "A", {}, options);

    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], (Path{"A", "B", "D", "E"}));
}

TEST(PathAlgorithmsTests, EnumeratePaths_MaxDepthEndsPathsEarly)
{
    auto g = make_diamond_with_tail();
    PathEnumerationOptions options;
    options.max_depth = 2;

    auto paths = enumerate_paths(g, "A", {}, options);

    ASSERT_EQ(paths.size(), 2u);
    for (const auto& p : paths)
    {
        EXPECT_EQ(p.size(), 3u);
        EXPECT_EQ(p.back(), "D");
    }
}

TEST(PathAlgorithmsTests, EnumeratePaths_CycleTerminates)
{
    // A -> B -> C -> A, B -> D
    auto g = Graph::from_edges(
        {GEdge("A", "B", ""), GEdge("B", "C", ""), GEdge("C", "A", ""), GEdge("B", "D", "")});

    auto paths = enumerate_paths(g, "A");

    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], (Path{"A", "B", "D"}));
}

TEST(PathAlgorithmsTests, EnumeratePaths_NoNodeRepeatsWithinPath)
{
    auto g = Graph::from_edges({GEdge("A", "B", ""),
                                GEdge("B", "A", ""),
                                GEdge("B", "C", ""),
                                GEdge("C", "B", ""),
                                GEdge("C", "D", "")});

    auto paths = enumerate_paths(g, "A");

    for (const auto& p : paths)
    {
        std::unordered_set<std::string> unique(p.begin(), p.end());
        EXPECT_EQ(unique.size(), p.size());
    }
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], (Path{"A", "B", "C", "D"}));
}

TEST(PathAlgorithmsTests, EnumeratePaths_DepthCutPathsDiscarded)
{
    auto g = make_diamond_with_tail();
    PathEnumerationOptions options;
    options.max_depth = 2;
    options.report_depth_cut_paths = false;

    EXPECT_TRUE(enumerate_paths(g, "A", {}, options).empty());

    options.max_depth = 3;
    auto paths = enumerate_paths(g, "A", {}, options);

    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], (Path{"A", "B", "D", "E"}));
}

TEST(PathAlgorithmsTests, EnumeratePaths_MaxPathsStopsEnumerationUnderDepthBound)
{
    // 18 binary choices in a row: 2^18 paths from c0 to "end".
    std::vector<GEdge> edges;
    const int choices = 18;
    for (int i = 0; i < choices; ++i)
    {
        std::string c = "c" + std::to_string(i);
        std::string next = i + 1 == choices ? "end" : "c" + std::to_string(i + 1);
        edges.emplace_back(c, c + "L", "");
        edges.emplace_back(c, c + "R", "");
        edges.emplace_back(c + "L", next, "");
        edges.emplace_back(c + "R", next, "");
    }
    auto g = Graph::from_edges(edges);

    size_t visited = 0;
    auto is_end = [&visited](const std::string& n) {
        ++visited;
        return n == "end";
    };
    PathEnumerationOptions options;
    options.max_depth = 1000;
    options.max_paths = 3;
    options.report_depth_cut_paths = false;

    auto paths = enumerate_paths(g, "c0", is_end, options);

    ASSERT_EQ(paths.size(), 3u);
    for (const auto& p : paths)
    {
        EXPECT_EQ(p.back(), "end");
    }
    EXPECT_LT(visited, 200u);
}

// ============================================================================
// compress_by_shared_suffixes
// ============================================================================

TEST(PathAlgorithmsTests, CompressBySharedSuffixes_TruncatesAtJoin)
{
    std::vector<Path> paths{{"A", "B", "D", "E"}, {"A", "C", "D", "E"}};

    auto compressed = compress_by_shared_suffixes(paths);

    ASSERT_EQ(compressed.size(), 2u);
    EXPECT_EQ(compressed[0], (Path{"A", "B", "D", "E"}));
    EXPECT_EQ(compressed[1], (Path{"A", "C", "D"}));
}

TEST(PathAlgorithmsTests, CompressBySharedSuffixes_SingleNodeSuffixNotCompressed)
{
    std::vector<Path> paths{{"A", "B", "D"}, {"A", "C", "D"}};

    auto compressed = compress_by_shared_suffixes(paths);

    EXPECT_EQ(compressed, paths);
}

TEST(PathAlgorithmsTests, CompressBySharedSuffixes_DuplicatesRemoved)
{
    std::vector<Path> paths{{"A", "B"}, {"A", "B"}, {"A", "C"}};

    auto compressed = compress_by_shared_suffixes(paths);

    ASSERT_EQ(compressed.size(), 2u);
    EXPECT_EQ(compressed[0], (Path{"A", "B"}));
    EXPECT_EQ(compressed[1], (Path{"A", "C"}));
}

TEST(PathAlgorithmsTests, CompressBySharedSuffixes_EmptyInput)
{
    EXPECT_TRUE(compress_by_shared_suffixes(std::vector<Path>{}).empty());
}

// ============================================================================
// compress_graph_paths_to_edge_paths
// ============================================================================

TEST(PathAlgorithmsTests, CompressGraphPathsToEdgePaths_MapsNodesToEdges)
{
    auto g = make_diamond_with_tail();

    auto edge_paths = compress_graph_paths_to_edge_paths(g, "A");

    ASSERT_EQ(edge_paths.size(), 2u);
    ASSERT_EQ(edge_paths[0].size(), 3u);
    EXPECT_EQ(edge_paths[0][0].label, "ab");
    EXPECT_EQ(edge_paths[0][1].label, "bd");
    EXPECT_EQ(edge_paths[0][2].label, "de");
    ASSERT_EQ(edge_paths[1].size(), 2u);
    EXPECT_EQ(edge_paths[1][0].label, "ac");
    EXPECT_EQ(edge_paths[1][1].label, "cd");
}

TEST(PathAlgorithmsTests, CompressGraphPathsToEdgePaths_TerminalStartGivesEmptyEdgePath)
{
    auto g = make_diamond_with_tail();

    auto edge_paths = compress_graph_paths_to_edge_paths(g, "E");

    ASSERT_EQ(edge_paths.size(), 1u);
    EXPECT_TRUE(edge_paths[0].empty());
}
