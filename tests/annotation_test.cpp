#include <gtest/gtest.h>
#include "annotation.hpp"

TEST(ExtractWeight, ReadsEdgeWeightToken) {
    WeightParse w = extract_weight("edge weight 3.5");
    EXPECT_TRUE(w.found_token);
    EXPECT_TRUE(w.parsed);
    EXPECT_DOUBLE_EQ(w.weight, 3.5);
}

TEST(ExtractWeight, FallsBackToCostToken) {
    WeightParse w = extract_weight("demand 3 cost 7");
    EXPECT_TRUE(w.found_token);
    EXPECT_TRUE(w.parsed);
    EXPECT_DOUBLE_EQ(w.weight, 7.0);
}

TEST(ExtractWeight, PrefersWeightOverCost) {
    EXPECT_DOUBLE_EQ(extract_weight("cost 5 edge weight 2").weight, 2.0);
}

TEST(ExtractWeight, NoTokenDefaultsToOne) {
    WeightParse w = extract_weight("demand 4");
    EXPECT_FALSE(w.found_token);
    EXPECT_FALSE(w.parsed);
    EXPECT_DOUBLE_EQ(w.weight, 1.0);
}

TEST(ExtractWeight, UnparsableValueDefaultsSilently) {
    for (const char *text : {"edge weight abc", "edge weight 3.0 demand 1", "cost", "edge weight -2",
                             "edge weight inf"}) {
        WeightParse w = extract_weight(text);
        EXPECT_TRUE(w.found_token) << text;
        EXPECT_FALSE(w.parsed) << text;
        EXPECT_DOUBLE_EQ(w.weight, 1.0) << text;
    }
}

TEST(EdgeMarker, SplitsEndpointsAndAnnotation) {
    auto m = split_edge_marker("  (12,7) edge weight 3");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->u, 12);
    EXPECT_EQ(m->v, 7);
    EXPECT_EQ(m->rest, "edge weight 3");

    auto spaced = split_edge_marker("( 3 , 4 )cost 1");
    ASSERT_TRUE(spaced.has_value());
    EXPECT_EQ(spaced->u, 3);
    EXPECT_EQ(spaced->v, 4);
}

TEST(EdgeMarker, RejectsMalformedLines) {
    EXPECT_FALSE(split_edge_marker("1,2) edge weight 3").has_value());
    EXPECT_FALSE(split_edge_marker("(1,2 edge weight 3").has_value());
    EXPECT_FALSE(split_edge_marker("(a,b) edge weight 3").has_value());
    EXPECT_FALSE(split_edge_marker("(1) edge weight 3").has_value());
    EXPECT_FALSE(split_edge_marker("").has_value());
}

TEST(NodeList, AcceptsCommasAndWhitespace) {
    EXPECT_EQ(split_node_list("1, 2 3,,4\t5"), (std::vector<int>{1, 2, 3, 4, 5}));
    EXPECT_TRUE(split_node_list("  ").empty());
    EXPECT_THROW(split_node_list("1,x"), std::invalid_argument);
}

TEST(TextHelpers, TrimAndKeyValue) {
    EXPECT_EQ(trim("  a b \r\n"), "a b");
    EXPECT_EQ(value_after_colon("NUMBER OF VERTICES : 12"), "12");
    EXPECT_EQ(value_after_colon("no colon"), "");
    EXPECT_TRUE(starts_with("DEPOT: 1", "DEPOT:"));
    EXPECT_TRUE(ends_with("FAILURE_SCENARIO:", ":"));
    EXPECT_FALSE(parse_int("12x").has_value());
    EXPECT_EQ(parse_number(" 2.5 ").value(), 2.5);
}
