#include "Geometry.hpp"
#include "TestShapes.hpp"

#include <gtest/gtest.h>

#include <mp-units/systems/si.h>

using namespace coverage;
using namespace coverage::test;
using mp_units::si::degree;

TEST(Geometry, RotateQuarterTurn) {
  const auto path = xy::Path{P(1, 0), P(3, 2)};
  const auto out  = Rotate(path, 90.0 * degree, P(1, 0));
  ASSERT_EQ(out.size(), 2U);
  EXPECT_NEAR(X(out[0]), 1.0, 1e-12);
  EXPECT_NEAR(Y(out[0]), 0.0, 1e-12);
  EXPECT_NEAR(X(out[1]), -1.0, 1e-12);
  EXPECT_NEAR(Y(out[1]), 2.0, 1e-12);
}

TEST(Geometry, RotateRoundTrip) {
  const auto ring  = SidewaysU();
  const auto pivot = P(3.5, -2.25);
  const auto back  = Rotate(Rotate(ring, -37.0 * degree, pivot),
                            37.0 * degree, pivot);
  ASSERT_EQ(back.size(), ring.size());
  for (auto i = std::size_t{0}; i != ring.size(); ++i) {
    EXPECT_NEAR(X(back[i]), X(ring[i]), 1e-9);
    EXPECT_NEAR(Y(back[i]), Y(ring[i]), 1e-9);
  }
}

TEST(Geometry, BoundingBoxAndCentroid) {
  const auto box = BoundingBox(MakeRing({{0,0}, {1,3}, {4,0}, {0,0}}));
  EXPECT_DOUBLE_EQ(X(box.min_corner()), 0.0);
  EXPECT_DOUBLE_EQ(Y(box.min_corner()), 0.0);
  EXPECT_DOUBLE_EQ(X(box.max_corner()), 4.0);
  EXPECT_DOUBLE_EQ(Y(box.max_corner()), 3.0);

  const auto c = Centroid(Square10());
  EXPECT_NEAR(X(c), 5.0, 1e-12);
  EXPECT_NEAR(Y(c), 5.0, 1e-12);
}

TEST(Geometry, PathLength) {
  EXPECT_EQ(M(PathLength(xy::Path{})), 0.0);
  EXPECT_EQ(M(PathLength(xy::Path{P(4, 4)})), 0.0);
  EXPECT_NEAR(M(PathLength(xy::Path{P(0, 0), P(3, 4), P(3, 10)})), 11.0,
              1e-12);
}

TEST(Geometry, VertexCountIgnoresClosingPoint) {
  EXPECT_EQ(VertexCount(Square10()), 4U);
  EXPECT_EQ(VertexCount(MakeRing({{0,0}, {0,10}, {10,0}})), 3U);
  EXPECT_EQ(VertexCount(xy::Ring{}), 0U);
}

TEST(Geometry, IntersectThroughInterior) {
  const auto segs = IntersectVerticalLine(Square10(), 5.0 * metre,
                                          -5.0 * metre, 15.0 * metre);
  ASSERT_EQ(segs.size(), 1U);
  EXPECT_DOUBLE_EQ(X(segs[0].top), 5.0);
  EXPECT_DOUBLE_EQ(Y(segs[0].top), 10.0);
  EXPECT_DOUBLE_EQ(Y(segs[0].bottom), 0.0);
  EXPECT_DOUBLE_EQ(M(segs[0].midY()), 5.0);
}

TEST(Geometry, IntersectOutsideIsEmpty) {
  EXPECT_TRUE(IntersectVerticalLine(Square10(), 20.0 * metre,
                                    -5.0 * metre, 15.0 * metre).empty());
  EXPECT_TRUE(IntersectVerticalLine(Square10(), -0.5 * metre,
                                    -5.0 * metre, 15.0 * metre).empty());
}

TEST(Geometry, IntersectVerticalEdges) {
  // Left edge counts, right edge does not.
  const auto left = IntersectVerticalLine(Square10(), 0.0 * metre,
                                          -5.0 * metre, 15.0 * metre);
  ASSERT_EQ(left.size(), 1U);
  EXPECT_DOUBLE_EQ(Y(left[0].top), 10.0);
  EXPECT_DOUBLE_EQ(Y(left[0].bottom), 0.0);
  EXPECT_TRUE(IntersectVerticalLine(Square10(), 10.0 * metre,
                                    -5.0 * metre, 15.0 * metre).empty());
}

TEST(Geometry, IntersectTouchingVertexIsDiscarded) {
  EXPECT_TRUE(IntersectVerticalLine(Diamond(), 0.0 * metre,
                                    -5.0 * metre, 5.0 * metre).empty());
  EXPECT_TRUE(IntersectVerticalLine(Diamond(), 2.0 * metre,
                                    -5.0 * metre, 5.0 * metre).empty());
  EXPECT_EQ(IntersectVerticalLine(Diamond(), 1.0 * metre,
                                  -5.0 * metre, 5.0 * metre).size(), 1U);
}

TEST(Geometry, IntersectTwoChordsInIncreasingY) {
  const auto segs = IntersectVerticalLine(SidewaysU(), 5.0 * metre,
                                          -5.0 * metre, 15.0 * metre);
  ASSERT_EQ(segs.size(), 2U);
  EXPECT_DOUBLE_EQ(Y(segs[0].top), 3.0);
  EXPECT_DOUBLE_EQ(Y(segs[0].bottom), 0.0);
  EXPECT_DOUBLE_EQ(Y(segs[1].top), 10.0);
  EXPECT_DOUBLE_EQ(Y(segs[1].bottom), 7.0);
}

TEST(Geometry, IntersectClipsToRange) {
  const auto segs = IntersectVerticalLine(Square10(), 5.0 * metre,
                                          2.0 * metre, 8.0 * metre);
  ASSERT_EQ(segs.size(), 1U);
  EXPECT_DOUBLE_EQ(Y(segs[0].top), 8.0);
  EXPECT_DOUBLE_EQ(Y(segs[0].bottom), 2.0);

  EXPECT_TRUE(IntersectVerticalLine(Square10(), 5.0 * metre,
                                    8.0 * metre, 2.0 * metre).empty());
}
