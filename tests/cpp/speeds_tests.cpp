#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "roadnet/core/error.hpp"
#include "roadnet/core/speeds.hpp"
#include "roadnet/core/travel_times.hpp"
#include "test_utils.hpp"

using namespace roadnet::core;
using namespace roadnet::core::test;

TEST(CleanMaxspeed, PlainAndUnitValues) {
  EXPECT_DOUBLE_EQ(clean_maxspeed("50", mean).value(), 50.0);
  EXPECT_DOUBLE_EQ(clean_maxspeed("5", mean).value(), 5.0);
  EXPECT_DOUBLE_EQ(clean_maxspeed("50 km/h", mean).value(), 50.0);
  EXPECT_DOUBLE_EQ(clean_maxspeed("50kph", mean).value(), 50.0);
  EXPECT_DOUBLE_EQ(clean_maxspeed("50 KMH", mean).value(), 50.0);
  EXPECT_DOUBLE_EQ(clean_maxspeed("30,5", mean).value(), 30.5);
  EXPECT_NEAR(clean_maxspeed("60 mph", mean).value(), 96.5604, 1e-9);
  EXPECT_NEAR(clean_maxspeed("10 knots", mean).value(), 18.52, 1e-9);
}

TEST(CleanMaxspeed, UnitsKeptWhenConversionDisabled) {
  EXPECT_DOUBLE_EQ(clean_maxspeed("60 mph", mean, false).value(), 60.0);
}

TEST(CleanMaxspeed, PerLaneValuesAggregated) {
  EXPECT_DOUBLE_EQ(clean_maxspeed("50|70", mean).value(), 60.0);
  EXPECT_DOUBLE_EQ(clean_maxspeed("30|50|90", median).value(), 50.0);
}

TEST(CleanMaxspeed, UnparseableValues) {
  EXPECT_FALSE(clean_maxspeed("signals", mean).has_value());
  EXPECT_FALSE(clean_maxspeed("", mean).has_value());
  EXPECT_FALSE(clean_maxspeed("50 furlongs", mean).has_value());
  EXPECT_FALSE(clean_maxspeed("50|none", mean).has_value());
  EXPECT_FALSE(clean_maxspeed("50.", mean).has_value());
  EXPECT_FALSE(clean_maxspeed("50 ", mean).has_value());
}

TEST(CollapseMaxspeed, ListsAndNumbers) {
  EXPECT_FALSE(collapse_maxspeed_values(AttrValue{Null{}}, mean).has_value());
  EXPECT_DOUBLE_EQ(collapse_maxspeed_values(AttrValue{40.0}, mean).value(), 40.0);
  EXPECT_DOUBLE_EQ(collapse_maxspeed_values(AttrValue{Text{"40"}}, mean).value(), 40.0);
  // Each element keeps its own unit; unusable elements are dropped
  auto v = collapse_maxspeed_values(AttrValue{TextList{"40", "60 mph", "walk"}}, mean);
  ASSERT_TRUE(v.has_value());
  EXPECT_NEAR(*v, (40.0 + 96.5604) / 2.0, 1e-9);
  EXPECT_FALSE(collapse_maxspeed_values(AttrValue{TextList{"walk"}}, mean).has_value());
}

TEST(EdgeClassification, CollapsesLists) {
  AttrValue text{Text{"primary"}};
  AttrValue list{TextList{"secondary", "tertiary"}};
  AttrValue null{Null{}};
  EXPECT_EQ(edge_classification(&text).value(), "primary");
  EXPECT_EQ(edge_classification(&list).value(), "secondary");
  EXPECT_FALSE(edge_classification(&null).has_value());
  EXPECT_FALSE(edge_classification(nullptr).has_value());
}

TEST(AddEdgeSpeeds, ImputesFromClassMean) {
  MultiDiGraph g;
  g.add_edge(1, 2, road(1000.0, "residential", Text{"50"}));
  g.add_edge(2, 3, road(2000.0, "residential"));
  add_edge_speeds(g);
  EXPECT_DOUBLE_EQ(number_attr(g, 1, 2, 0, "speed_kph"), 50.0);
  EXPECT_DOUBLE_EQ(number_attr(g, 2, 3, 0, "speed_kph"), 50.0);

  add_edge_travel_times(g);
  EXPECT_DOUBLE_EQ(number_attr(g, 1, 2, 0, "travel_time"), 72.0);
  EXPECT_DOUBLE_EQ(number_attr(g, 2, 3, 0, "travel_time"), 144.0);
}

TEST(AddEdgeSpeeds, ConvertsMph) {
  MultiDiGraph g;
  g.add_edge(1, 2, road(100.0, "primary", Text{"60 mph"}));
  add_edge_speeds(g);
  EXPECT_NEAR(number_attr(g, 1, 2, 0, "speed_kph"), 96.5604, 1e-9);
}

TEST(AddEdgeSpeeds, OverridesTakePrecedenceForMissingValues) {
  MultiDiGraph g;
  g.add_edge(1, 2, road(100.0, "primary", Text{"80"}));
  g.add_edge(2, 3, road(100.0, "primary"));
  g.add_edge(3, 4, road(100.0, "track"));
  SpeedOptions opts;
  opts.hwy_speeds = {{"primary", 70.0}, {"track", 20.0}};
  add_edge_speeds(g, opts);
  // Observed values are kept; overrides fill the rest
  EXPECT_DOUBLE_EQ(number_attr(g, 1, 2, 0, "speed_kph"), 80.0);
  EXPECT_DOUBLE_EQ(number_attr(g, 2, 3, 0, "speed_kph"), 70.0);
  EXPECT_DOUBLE_EQ(number_attr(g, 3, 4, 0, "speed_kph"), 20.0);
}

TEST(AddEdgeSpeeds, UnknownClassesUseFallbackOrMeanOfDefaults) {
  MultiDiGraph g;
  g.add_edge(1, 2, road(100.0, "primary", Text{"80"}));
  g.add_edge(2, 3, road(100.0, "secondary", Text{"40"}));
  g.add_edge(3, 4, road(100.0, "service"));
  MultiDiGraph h = g;

  add_edge_speeds(g);
  EXPECT_DOUBLE_EQ(number_attr(g, 3, 4, 0, "speed_kph"), 60.0);

  SpeedOptions opts;
  opts.fallback = 15.0;
  add_edge_speeds(h, opts);
  EXPECT_DOUBLE_EQ(number_attr(h, 3, 4, 0, "speed_kph"), 15.0);
}

TEST(AddEdgeSpeeds, ListClassificationUsesFirstEntry) {
  MultiDiGraph g;
  g.add_edge(1, 2, road(100.0, "primary", Text{"90"}));
  g.add_edge(2, 3, AttributeMap{{"length", 100.0}, {"highway", TextList{"primary", "secondary"}}});
  add_edge_speeds(g);
  EXPECT_DOUBLE_EQ(number_attr(g, 2, 3, 0, "speed_kph"), 90.0);
}

TEST(AddEdgeSpeeds, CustomAggregator) {
  MultiDiGraph g;
  g.add_edge(1, 2, road(100.0, "primary", Text{"30"}));
  g.add_edge(2, 3, road(100.0, "primary", Text{"40"}));
  g.add_edge(3, 4, road(100.0, "primary", Text{"100"}));
  g.add_edge(4, 5, road(100.0, "primary"));
  SpeedOptions opts;
  opts.agg = median;
  add_edge_speeds(g, opts);
  EXPECT_DOUBLE_EQ(number_attr(g, 4, 5, 0, "speed_kph"), 40.0);
}

TEST(AddEdgeSpeeds, NoDataThrowsAndLeavesGraphUnchanged) {
  MultiDiGraph g;
  g.add_edge(1, 2, road(100.0, "primary"));
  g.add_edge(2, 3, road(100.0, "residential", Text{"none"}));
  EXPECT_THROW(add_edge_speeds(g), UnresolvableSpeedData);
  EXPECT_EQ(g.edge_attribute(0, "speed_kph"), nullptr);
  EXPECT_EQ(g.edge_attribute(1, "speed_kph"), nullptr);

  SpeedOptions opts;
  opts.fallback = 30.0;
  add_edge_speeds(g, opts);
  EXPECT_DOUBLE_EQ(number_attr(g, 1, 2, 0, "speed_kph"), 30.0);
}

TEST(AddEdgeSpeeds, EmptyGraphIsNoOp) {
  MultiDiGraph g;
  EXPECT_NO_THROW(add_edge_speeds(g));
  g.add_node(1);
  EXPECT_NO_THROW(add_edge_speeds(g));
}

TEST(AddEdgeSpeeds, Idempotent) {
  auto g = make_grid_graph(3, 3);
  std::vector<std::string> classes{"primary", "residential", "service"};
  for (EdgeIndex e = 0; e < g.num_edges(); ++e) {
    g.set_edge_attribute(e, "highway", classes[static_cast<std::size_t>(e) % classes.size()]);
    if (e % 2 == 0) g.set_edge_attribute(e, "maxspeed", Text{std::to_string(30 + 5 * e)});
  }
  add_edge_speeds(g);
  std::vector<AttrValue> first;
  for (EdgeIndex e = 0; e < g.num_edges(); ++e) first.push_back(*g.edge_attribute(e, "speed_kph"));
  add_edge_speeds(g);
  for (EdgeIndex e = 0; e < g.num_edges(); ++e) {
    EXPECT_EQ(*g.edge_attribute(e, "speed_kph"), first[static_cast<std::size_t>(e)]);
  }
}
