#include <gtest/gtest.h>
#include <random>
#include <unordered_set>
#include "depot_selection.hpp"

static Graph path_graph(int n) {
    Graph g;
    for (int id = 1; id <= n; ++id) g.addNode(id);
    for (int id = 1; id < n; ++id) g.addEdge(id, id + 1, 1.0, id % 2 == 1);
    return g;
}

TEST(SelectDepots, PathGraphPicksCentres) {
    Graph g = path_graph(5);
    DepotSelection sel = select_depots(compute_coverage(g, 1.0), g.nodeIds());

    EXPECT_EQ(sel.depots, (std::vector<int>{2, 4}));
    EXPECT_EQ(sel.covered_after, (std::vector<size_t>{3, 5}));
    EXPECT_TRUE(sel.uncovered.empty());
}

TEST(SelectDepots, TiesGoToFirstNodeInOrder) {
    CoverageMap cov = {
        {1, {1, 2}},
        {2, {1, 2}},
        {3, {3, 4}},
        {4, {3, 4}}
    };
    DepotSelection sel = select_depots(cov, {4, 3, 2, 1});
    EXPECT_EQ(sel.depots, (std::vector<int>{4, 2}));
    EXPECT_EQ(sorted_depots(sel), (std::vector<int>{2, 4}));
}

TEST(SelectDepots, StopsWhenNothingGains) {
    CoverageMap cov = {{1, {1, 2}}};
    DepotSelection sel = select_depots(cov, {1, 2, 3});
    EXPECT_EQ(sel.depots, (std::vector<int>{1}));
    EXPECT_EQ(sel.uncovered, (std::vector<int>{3}));
}

TEST(SelectDepots, ZeroRadiusSelectsEveryNode) {
    Graph g = path_graph(4);
    DepotSelection sel = select_depots(compute_coverage(g, 0.0), g.nodeIds());
    EXPECT_EQ(sel.depots, (std::vector<int>{1, 2, 3, 4}));
}

TEST(SelectDepots, ExampleInstanceNeedsOneDepot) {
    Graph g;
    for (int id = 1; id <= 4; ++id) g.addNode(id);
    g.addEdge(1, 2, 3.0, true);
    g.addEdge(3, 4, 4.0, true);
    g.addEdge(1, 3, 2.0, false);
    g.addEdge(2, 4, 2.0, false);

    double radius = coverage_radius(10.0, 2.0);
    DepotSelection sel = select_depots(compute_coverage(g, radius), g.nodeIds());

    EXPECT_EQ(sel.depots, (std::vector<int>{1}));
    EXPECT_TRUE(sel.uncovered.empty());
}

TEST(SelectDepots, NeverRepeatsAndCoverageGrows) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> pick(1, 60);
    std::uniform_real_distribution<double> weight(0.5, 6.0);

    Graph g;
    for (int id = 1; id <= 60; ++id) g.addNode(id);
    for (int i = 0; i < 90; ++i) {
        int u = pick(rng), v = pick(rng);
        if (u != v) g.addEdge(u, v, weight(rng), i % 3 == 0);
    }

    for (double radius : {0.0, 2.0, 5.0, 12.0}) {
        DepotSelection sel = select_depots(compute_coverage(g, radius), g.nodeIds());

        std::unordered_set<int> seen(sel.depots.begin(), sel.depots.end());
        EXPECT_EQ(seen.size(), sel.depots.size());
        ASSERT_EQ(sel.covered_after.size(), sel.depots.size());
        for (size_t i = 1; i < sel.covered_after.size(); ++i)
            EXPECT_GT(sel.covered_after[i], sel.covered_after[i - 1]);
        // every node covers itself, so the greedy always finishes the cover
        EXPECT_TRUE(sel.uncovered.empty());
        EXPECT_EQ(sel.covered_after.back(), 60u);
    }
}
