#include "Stitch.hpp"
#include "TestShapes.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace coverage;
using namespace coverage::test;

namespace {

SweepLine Line(double x, std::vector<std::pair<double, double>> chords) {
  auto line = SweepLine{x * metre, {}};
  for (const auto& [a, b]: chords)
    line.segments.push_back(Segment{P(x, a), P(x, b)});
  return line;
} // Line

void ExpectPath(const xy::Path& path,
                std::vector<std::pair<double, double>> expected)
{
  ASSERT_EQ(path.size(), expected.size());
  for (auto i = std::size_t{0}; i != path.size(); ++i) {
    EXPECT_DOUBLE_EQ(X(path[i]), expected[i].first)  << "waypoint " << i;
    EXPECT_DOUBLE_EQ(Y(path[i]), expected[i].second) << "waypoint " << i;
  }
} // ExpectPath

} // local

TEST(Stitch, EmptyInput) {
  EXPECT_TRUE(StitchSweeps({}).empty());
  const auto lines = std::vector<SweepLine>{Line(0, {}), Line(1, {})};
  EXPECT_TRUE(StitchSweeps(lines).empty());
}

TEST(Stitch, AlternatesDirection) {
  const auto lines = std::vector<SweepLine>{
    Line(0, {{10, 0}}), Line(5, {{10, 0}}), Line(10, {{8, 2}})
  };
  ExpectPath(StitchSweeps(lines),
             {{0,10}, {0,0}, {5,0}, {5,10}, {10,8}, {10,2}});
}

TEST(Stitch, OrientsChordsTopFirst) {
  // Chords given bottom first.
  const auto lines = std::vector<SweepLine>{
    Line(0, {{0, 10}}), Line(5, {{1, 9}})
  };
  ExpectPath(StitchSweeps(lines), {{0,10}, {0,0}, {5,1}, {5,9}});
}

TEST(Stitch, SortsChordsByMeanHeight) {
  const auto lines = std::vector<SweepLine>{
    Line(4, {{3, 0}, {10, 7}}), Line(5, {{3, 0}, {10, 7}})
  };
  ExpectPath(StitchSweeps(lines),
             {{4,10}, {4,7}, {4,3}, {4,0},
              {5,0}, {5,3}, {5,7}, {5,10}});
}

TEST(Stitch, EmptyLinesDoNotFlipDirection) {
  const auto lines = std::vector<SweepLine>{
    Line(0, {{10, 0}}), Line(1, {}), Line(2, {{10, 0}})
  };
  ExpectPath(StitchSweeps(lines), {{0,10}, {0,0}, {2,0}, {2,10}});
}
