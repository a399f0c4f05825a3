#include <gtest/gtest.h>
#include "roadnet/core/error.hpp"
#include "roadnet/core/verify.hpp"
#include "test_utils.hpp"

using namespace roadnet::core;
using namespace roadnet::core::test;

TEST(VerifyEdgeAttribute, AcceptsNumericAndNumericText) {
  MultiDiGraph g;
  g.add_edge(0, 1, len(1.5));
  g.add_edge(1, 2, AttributeMap{{"length", Text{"20"}}});
  EXPECT_NO_THROW(verify_edge_attribute(g, "length"));
  EXPECT_EQ(edge_weight(g, 1, "length").value(), 20.0);
}

TEST(VerifyEdgeAttribute, MissingAndNullOnlyWarn) {
  MultiDiGraph g;
  g.add_edge(0, 1, len(1.0));
  g.add_edge(1, 2, AttributeMap{{"length", Null{}}});
  g.add_edge(2, 3);
  EXPECT_NO_THROW(verify_edge_attribute(g, "length"));
  EXPECT_FALSE(edge_weight(g, 1, "length").has_value());
  EXPECT_FALSE(edge_weight(g, 2, "length").has_value());
}

TEST(VerifyEdgeAttribute, RejectsNonNumericValues) {
  MultiDiGraph g;
  g.add_edge(0, 1, len(1.0));
  g.add_edge(1, 2, AttributeMap{{"length", Text{"long"}}});
  EXPECT_THROW(verify_edge_attribute(g, "length"), InvalidAttributeType);

  MultiDiGraph h;
  h.add_edge(0, 1, AttributeMap{{"length", TextList{"1", "2"}}});
  EXPECT_THROW(verify_edge_attribute(h, "length"), InvalidAttributeType);
}

TEST(VerifyEdgeAttribute, RejectsNegativeWeights) {
  MultiDiGraph g;
  g.add_edge(0, 1, len(-3.0));
  EXPECT_THROW(verify_edge_attribute(g, "length"), InvalidAttributeType);
}

TEST(VerifyEdgeAttribute, EmptyGraphPasses) {
  MultiDiGraph g;
  EXPECT_NO_THROW(verify_edge_attribute(g, "travel_time"));
}
