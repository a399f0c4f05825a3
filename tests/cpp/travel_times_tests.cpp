#include <gtest/gtest.h>
#include "roadnet/core/error.hpp"
#include "roadnet/core/shortest_paths.hpp"
#include "roadnet/core/travel_times.hpp"
#include "test_utils.hpp"

using namespace roadnet::core;
using namespace roadnet::core::test;

TEST(AddEdgeTravelTimes, SecondsFromMetersAndKph) {
  MultiDiGraph g;
  g.add_edge(0, 1, AttributeMap{{"length", 1000.0}, {"speed_kph", 36.0}});
  g.add_edge(1, 2, AttributeMap{{"length", Text{"500"}}, {"speed_kph", 90.0}});
  add_edge_travel_times(g);
  EXPECT_DOUBLE_EQ(number_attr(g, 0, 1, 0, "travel_time"), 100.0);
  EXPECT_DOUBLE_EQ(number_attr(g, 1, 2, 0, "travel_time"), 20.0);
}

TEST(AddEdgeTravelTimes, MissingEverywhereThrowsMissingAttribute) {
  MultiDiGraph g;
  g.add_edge(0, 1, len(100.0));
  g.add_edge(1, 2, len(100.0));
  EXPECT_THROW(add_edge_travel_times(g), MissingAttribute);
  EXPECT_THROW(add_edge_travel_times(g), KeyError);
}

TEST(AddEdgeTravelTimes, NullOnSomeEdgesThrowsNullAttribute) {
  MultiDiGraph g;
  g.add_edge(0, 1, AttributeMap{{"length", 100.0}, {"speed_kph", 50.0}});
  g.add_edge(1, 2, AttributeMap{{"length", 100.0}, {"speed_kph", Null{}}});
  EXPECT_THROW(add_edge_travel_times(g), NullAttribute);
  // Nothing written on failure
  EXPECT_EQ(g.edge_attribute(0, "travel_time"), nullptr);

  MultiDiGraph h;
  h.add_edge(0, 1, AttributeMap{{"length", 100.0}, {"speed_kph", 50.0}});
  h.add_edge(1, 2, AttributeMap{{"speed_kph", 50.0}});
  EXPECT_THROW(add_edge_travel_times(h), NullAttribute);
}

TEST(AddEdgeTravelTimes, NonNumericThrows) {
  MultiDiGraph g;
  g.add_edge(0, 1, AttributeMap{{"length", 100.0}, {"speed_kph", Text{"fast"}}});
  EXPECT_THROW(add_edge_travel_times(g), InvalidAttributeType);
}

TEST(AddEdgeTravelTimes, RoutesByTravelTime) {
  MultiDiGraph g;
  g.add_edge(0, 1, AttributeMap{{"length", 1000.0}, {"speed_kph", 10.0}});
  g.add_edge(0, 2, AttributeMap{{"length", 1500.0}, {"speed_kph", 90.0}});
  g.add_edge(2, 1, AttributeMap{{"length", 1500.0}, {"speed_kph", 90.0}});
  add_edge_travel_times(g);
  EXPECT_EQ(std::get<Path>(shortest_path(g, 0, 1, "length")), (Path{0, 1}));
  EXPECT_EQ(std::get<Path>(shortest_path(g, 0, 1, "travel_time")), (Path{0, 2, 1}));
}
