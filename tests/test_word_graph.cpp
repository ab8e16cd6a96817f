#include "ladder/word_graph.hpp"
#include "word_fixtures.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <stdexcept>


using namespace ::testing;
using namespace ladder;


// ====================
// Test fixture
// ====================

class SameLengthGraphTest : public ::testing::Test {
 protected:
    void SetUp() override {
        for (const char* w : {"cat", "cot", "cog", "dog", "cag", "pig", "pit", "pin"}) {
            graph_.add_word(w);
        }
    }

    SameLengthGraph graph_{3};
};


// ====================
// Hamming distance
// ====================

TEST(HammingDistance, CountsDifferingPositions) {
    EXPECT_EQ(hamming_distance("cat", "cat"), 0u);
    EXPECT_EQ(hamming_distance("cat", "cot"), 1u);
    EXPECT_EQ(hamming_distance("cat", "dog"), 3u);
}

TEST(HammingDistance, NeighborsNeedExactlyOneChangeAndSameLength) {
    EXPECT_TRUE(are_neighbors("cat", "cot"));
    EXPECT_FALSE(are_neighbors("cat", "cat"));
    EXPECT_FALSE(are_neighbors("cat", "dog"));
    EXPECT_FALSE(are_neighbors("cat", "cats"));
}


// ====================
// SameLengthGraph construction
// ====================

TEST_F(SameLengthGraphTest, AddWord_WrongLengthIsAProgrammingError) {
    EXPECT_THROW(graph_.add_word("goat"), std::logic_error);
    EXPECT_THROW(graph_.add_word("at"), std::logic_error);
    EXPECT_EQ(graph_.word_count(), 8u);
}

TEST_F(SameLengthGraphTest, AddWord_DuplicateReplacesEntry) {
    graph_.add_word("cat");
    EXPECT_EQ(graph_.word_count(), 8u);
    ASSERT_NE(graph_.find("cat"), nullptr);
    EXPECT_EQ(graph_.find("cat")->label, 0u);
    EXPECT_TRUE(graph_.find("cat")->neighbors.empty());
}

TEST_F(SameLengthGraphTest, NodesStartUnlabeled) {
    for (const auto& [word, node] : graph_.nodes()) {
        EXPECT_EQ(node.label, 0u) << word;
        EXPECT_TRUE(node.neighbors.empty()) << word;
    }
    EXPECT_EQ(graph_.forest_count(), 0u);
}

TEST_F(SameLengthGraphTest, ComputeNeighbors_OneLetterApartOnly) {
    EXPECT_THAT(graph_.compute_neighbors(*graph_.find("cat")), UnorderedElementsAre("cot", "cag"));
    EXPECT_THAT(graph_.compute_neighbors(*graph_.find("cog")), UnorderedElementsAre("cot", "dog", "cag"));
    EXPECT_THAT(graph_.compute_neighbors(*graph_.find("pin")), UnorderedElementsAre("pig", "pit"));
}


// ====================
// Component labeling
// ====================

TEST_F(SameLengthGraphTest, ExploreComponent_LabelsWholeForestOnce) {
    EXPECT_EQ(graph_.explore_component("dog"), 5u);
    for (const char* w : {"cat", "cot", "cog", "dog", "cag"}) {
        EXPECT_GT(graph_.find(w)->label, 0u) << w;
    }
    for (const char* w : {"pig", "pit", "pin"}) {
        EXPECT_EQ(graph_.find(w)->label, 0u) << w;
    }
    // Already labeled seed: nothing new.
    EXPECT_EQ(graph_.explore_component("cat"), 0u);
    EXPECT_EQ(graph_.forest_count(), 1u);
}

TEST_F(SameLengthGraphTest, ExploreComponent_UnknownSeedLabelsNothing) {
    EXPECT_EQ(graph_.explore_component("zzz"), 0u);
    EXPECT_EQ(graph_.explore_component("goat"), 0u);
    EXPECT_EQ(graph_.forest_count(), 0u);
}

TEST_F(SameLengthGraphTest, ExploreAll_EveryWordLabeledWithValidAdjacency) {
    graph_.explore_all_components();
    EXPECT_EQ(graph_.forest_count(), 2u);
    for (const auto& [word, node] : graph_.nodes()) {
        EXPECT_GT(node.label, 0u) << word;
        for (const auto& n : node.neighbors) {
            EXPECT_EQ(n.size(), word.size());
            EXPECT_EQ(hamming_distance(word, n), 1u) << word << " / " << n;
            ASSERT_NE(graph_.find(n), nullptr);
        }
    }
    EXPECT_NO_THROW(graph_.check_invariants());
}

TEST_F(SameLengthGraphTest, ExploreAll_AdjacencyIsSymmetric) {
    graph_.explore_all_components();
    for (const auto& [u, nu] : graph_.nodes()) {
        for (const auto& [v, nv] : graph_.nodes()) {
            const bool uv = std::find(nu.neighbors.begin(), nu.neighbors.end(), v) != nu.neighbors.end();
            const bool vu = std::find(nv.neighbors.begin(), nv.neighbors.end(), u) != nv.neighbors.end();
            EXPECT_EQ(uv, vu) << u << " / " << v;
        }
    }
}

TEST_F(SameLengthGraphTest, ExploreAll_ConnectivityIsAnEquivalenceRelation) {
    graph_.explore_all_components();
    std::vector<std::string> words;
    for (const auto& [w, n] : graph_.nodes()) words.push_back(w);

    for (const auto& a : words) {
        EXPECT_TRUE(graph_.are_connected(a, a)) << a;
        for (const auto& b : words) {
            EXPECT_EQ(graph_.are_connected(a, b), graph_.are_connected(b, a)) << a << " / " << b;
            for (const auto& c : words) {
                if (graph_.are_connected(a, b) && graph_.are_connected(b, c)) {
                    EXPECT_TRUE(graph_.are_connected(a, c)) << a << " / " << b << " / " << c;
                }
            }
        }
    }
}

TEST_F(SameLengthGraphTest, ExploreAll_LabelsSeparateForests) {
    graph_.explore_all_components();
    // Only label equality carries meaning; the numbers themselves vary by run.
    EXPECT_EQ(graph_.find("cat")->label, graph_.find("dog")->label);
    EXPECT_EQ(graph_.find("pig")->label, graph_.find("pin")->label);
    EXPECT_NE(graph_.find("cat")->label, graph_.find("pig")->label);
    EXPECT_THAT(graph_.forest_sizes(), UnorderedElementsAre(5u, 3u));
}

TEST_F(SameLengthGraphTest, Unexplored_NothingIsConnected) {
    // Every word still carries label 0.
    EXPECT_FALSE(graph_.are_connected("cat", "dog"));
    EXPECT_FALSE(graph_.are_connected("cat", "pig"));
    EXPECT_FALSE(graph_.are_connected("cat", "cat"));
    EXPECT_FALSE(graph_.shortest_path("cat", "cot").has_value());
    EXPECT_FALSE(graph_.shortest_path("cat", "pig").has_value());
}

TEST_F(SameLengthGraphTest, PartiallyExplored_UnlabeledWordsStayApart) {
    ASSERT_EQ(graph_.explore_component("pig"), 3u);
    EXPECT_TRUE(graph_.are_connected("pig", "pin"));
    EXPECT_FALSE(graph_.are_connected("cat", "dog"));
    EXPECT_FALSE(graph_.shortest_path("cat", "dog").has_value());
}

TEST_F(SameLengthGraphTest, AreConnected_UnknownWordIsFalse) {
    graph_.explore_all_components();
    EXPECT_FALSE(graph_.are_connected("cat", "zzz"));
    EXPECT_FALSE(graph_.are_connected("zzz", "zzz"));
}


// ====================
// Shortest path
// ====================

TEST_F(SameLengthGraphTest, ShortestPath_CatToDogHasFourWords) {
    graph_.explore_all_components();
    auto path = graph_.shortest_path("cat", "dog");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 4u);
    EXPECT_TRUE(IsValidLadder(*path, "cat", "dog"));
}

TEST_F(SameLengthGraphTest, ShortestPath_SameWordIsSingleStep) {
    graph_.explore_all_components();
    auto path = graph_.shortest_path("cog", "cog");
    ASSERT_TRUE(path.has_value());
    EXPECT_THAT(*path, ElementsAre("cog"));
}

TEST_F(SameLengthGraphTest, ShortestPath_DisconnectedOrUnknownIsAbsent) {
    graph_.explore_all_components();
    EXPECT_FALSE(graph_.shortest_path("cat", "pig").has_value());
    EXPECT_FALSE(graph_.shortest_path("cat", "zzz").has_value());
    EXPECT_FALSE(graph_.shortest_path("zzz", "cat").has_value());
}

TEST_F(SameLengthGraphTest, ShortestPath_LengthMatchesGraphDistanceForAllPairs) {
    graph_.explore_all_components();
    std::vector<std::string> words;
    for (const auto& [w, n] : graph_.nodes()) words.push_back(w);

    for (const auto& a : words) {
        for (const auto& b : words) {
            auto expected = brute_force_distance(words, a, b);
            auto path = graph_.shortest_path(a, b);
            ASSERT_EQ(path.has_value(), expected.has_value()) << a << " -> " << b;
            if (!path) continue;
            EXPECT_TRUE(graph_.are_connected(a, b));
            EXPECT_TRUE(IsValidLadder(*path, a, b));
            EXPECT_EQ(path->size(), *expected + 1) << a << " -> " << b;
        }
    }
}


// ====================
// Restoration and invariant checks
// ====================

TEST(SameLengthGraphRestore, RestoredNodesAnswerQueries) {
    SameLengthGraph g(3);
    g.restore_node("cat", 7, {"cot"});
    g.restore_node("cot", 7, {"cat"});
    g.restore_node("pig", 2, {});
    EXPECT_EQ(g.forest_count(), 2u);
    EXPECT_THAT(g.forest_sizes(), UnorderedElementsAre(2u, 1u));
    EXPECT_TRUE(g.are_connected("cat", "cot"));
    EXPECT_FALSE(g.are_connected("cat", "pig"));
    EXPECT_THAT(*g.shortest_path("cat", "cot"), ElementsAre("cat", "cot"));
    EXPECT_NO_THROW(g.check_invariants());
}

TEST(SameLengthGraphRestore, RejectsBadNodes) {
    SameLengthGraph g(3);
    EXPECT_THROW(g.restore_node("goat", 1, {}), std::invalid_argument);
    EXPECT_THROW(g.restore_node("cat", 0, {}), std::invalid_argument);
    EXPECT_THROW(g.restore_node("Cat", 1, {}), std::invalid_argument);
    EXPECT_THROW(g.restore_node("c-t", 1, {}), std::invalid_argument);
    EXPECT_EQ(g.word_count(), 0u);
}

TEST(SameLengthGraphRestore, RejectsRepeatedWord) {
    SameLengthGraph g(3);
    g.restore_node("cat", 1, {});
    EXPECT_THROW(g.restore_node("cat", 2, {}), std::invalid_argument);
    EXPECT_EQ(g.find("cat")->label, 1u);
    EXPECT_EQ(g.word_count(), 1u);
}

TEST(SameLengthGraphRestore, ExploringAfterRestoreOpensNewForest) {
    SameLengthGraph g(3);
    g.restore_node("cat", 4, {});
    g.add_word("pig");
    g.explore_all_components();
    EXPECT_EQ(g.forest_count(), 2u);
    EXPECT_NE(g.find("pig")->label, g.find("cat")->label);
    EXPECT_NO_THROW(g.check_invariants());
}

TEST(SameLengthGraphRestore, CheckInvariantsCatchesAsymmetricAdjacency) {
    SameLengthGraph g(3);
    g.restore_node("cat", 1, {"cot"});
    g.restore_node("cot", 1, {});
    EXPECT_THROW(g.check_invariants(), std::runtime_error);
}

TEST(SameLengthGraphRestore, CheckInvariantsCatchesBadEdges) {
    SameLengthGraph far(3);
    far.restore_node("cat", 1, {"dog"});
    far.restore_node("dog", 1, {"cat"});
    EXPECT_THROW(far.check_invariants(), std::runtime_error);

    SameLengthGraph dangling(3);
    dangling.restore_node("cat", 1, {"cot"});
    EXPECT_THROW(dangling.check_invariants(), std::runtime_error);

    SameLengthGraph split(3);
    split.restore_node("cat", 1, {"cot"});
    split.restore_node("cot", 2, {"cat"});
    EXPECT_THROW(split.check_invariants(), std::runtime_error);
}

TEST(SameLengthGraphRestore, ShortestPathToleratesLabelsWithoutEdges) {
    // Same label but no adjacency linking the words: search runs dry.
    SameLengthGraph g(3);
    g.restore_node("cat", 1, {});
    g.restore_node("dog", 1, {});
    EXPECT_TRUE(g.are_connected("cat", "dog"));
    EXPECT_FALSE(g.shortest_path("cat", "dog").has_value());
}


// ====================
// LengthPartitionedGraph
// ====================

TEST(LengthPartitionedGraph, BucketsWordsByLength) {
    auto g = build_sample_graph();
    EXPECT_EQ(g.distinct_lengths(), 2u);
    EXPECT_EQ(g.total_words(), 12u);
    EXPECT_EQ(g.total_forests(), 4u);
    ASSERT_NE(g.subgraph(3), nullptr);
    ASSERT_NE(g.subgraph(4), nullptr);
    EXPECT_EQ(g.subgraph(3)->word_count(), 8u);
    EXPECT_EQ(g.subgraph(4)->word_count(), 4u);
    EXPECT_EQ(g.subgraph(5), nullptr);
    EXPECT_NO_THROW(g.check_invariants());
}

TEST(LengthPartitionedGraph, ConnectivityScenarios) {
    auto g = build_sample_graph();
    EXPECT_TRUE(g.are_connected("cat", "dog"));
    EXPECT_TRUE(g.are_connected("dog", "cat"));
    EXPECT_FALSE(g.are_connected("cat", "pig"));
    EXPECT_FALSE(g.are_connected("cat", "goat"));
    EXPECT_FALSE(g.are_connected("cat", "zzz"));
    EXPECT_TRUE(g.are_connected("goat", "coat"));
    EXPECT_FALSE(g.are_connected("goat", "fish"));
    // No bucket for this length at all.
    EXPECT_FALSE(g.are_connected("abcdefgh", "abcdefgi"));
}

TEST(LengthPartitionedGraph, ShortestPathScenarios) {
    auto g = build_sample_graph();
    auto path = g.shortest_path("cat", "dog");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->size(), 4u);
    EXPECT_TRUE(IsValidLadder(*path, "cat", "dog"));

    auto back = g.shortest_path("dog", "cat");
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->size(), 4u);
    EXPECT_TRUE(IsValidLadder(*back, "dog", "cat"));

    EXPECT_FALSE(g.shortest_path("cat", "pig").has_value());
    EXPECT_FALSE(g.shortest_path("cat", "goat").has_value());
    EXPECT_FALSE(g.shortest_path("abcdefgh", "abcdefgi").has_value());
    EXPECT_THAT(*g.shortest_path("goat", "coat"), ElementsAre("goat", "coat"));
}

TEST(LengthPartitionedGraph, ThreadedExploreMatchesSingleThreaded) {
    auto serial = build_sample_graph(1);
    auto threaded = build_sample_graph(4);
    const auto words = admitted_words();
    for (const auto& a : words) {
        for (const auto& b : words) {
            EXPECT_EQ(serial.are_connected(a, b), threaded.are_connected(a, b)) << a << " / " << b;
            auto ps = serial.shortest_path(a, b);
            auto pt = threaded.shortest_path(a, b);
            ASSERT_EQ(ps.has_value(), pt.has_value()) << a << " / " << b;
            if (ps) EXPECT_EQ(ps->size(), pt->size()) << a << " / " << b;
        }
    }
    EXPECT_EQ(serial.total_forests(), threaded.total_forests());
    EXPECT_NO_THROW(threaded.check_invariants());
}

TEST(LengthPartitionedGraph, UnexploredGraphAnswersNo) {
    LengthPartitionedGraph g;
    for (const char* w : {"cat", "cot", "goat", "coat"}) g.add_word(w);
    EXPECT_FALSE(g.are_connected("cat", "cot"));
    EXPECT_FALSE(g.are_connected("goat", "coat"));
    EXPECT_FALSE(g.shortest_path("cat", "cot").has_value());
    EXPECT_EQ(g.total_forests(), 0u);

    g.explore_forests(1);
    EXPECT_TRUE(g.are_connected("cat", "cot"));
    EXPECT_EQ(g.total_forests(), 2u);
}

TEST(LengthPartitionedGraph, MoreBucketsThanWorkersAllLabeled) {
    LengthPartitionedGraph g;
    for (const char* w : {"a", "b", "at", "it", "cat", "cot", "goat", "boat", "fishy", "dishy", "fished"}) {
        g.add_word(w);
    }
    g.explore_forests(2);
    EXPECT_EQ(g.distinct_lengths(), 6u);
    EXPECT_EQ(g.total_forests(), 6u);
    EXPECT_NO_THROW(g.check_invariants());
}

TEST(LengthPartitionedGraph, ZeroThreadsRejected) {
    LengthPartitionedGraph g;
    g.add_word("cat");
    EXPECT_THROW(g.explore_forests(0), std::invalid_argument);
}

TEST(LengthPartitionedGraph, EmptyGraphHasNothing) {
    LengthPartitionedGraph g;
    EXPECT_NO_THROW(g.explore_forests());
    EXPECT_EQ(g.total_words(), 0u);
    EXPECT_EQ(g.total_forests(), 0u);
    EXPECT_FALSE(g.are_connected("cat", "cat"));
}
