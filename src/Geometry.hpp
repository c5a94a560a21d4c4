#pragma once
#include "CoverageXy.hpp"

#include <mp-units/systems/si/units.h>

#include <vector>
#include <cstddef>

namespace coverage {

using mp_units::si::metre;

/// One chord of a sweep line inside the polygon.
struct Segment {
  xy::Point top;
  xy::Point bottom;
  Distance midY() const { return (top.y() + bottom.y()) / 2.0; }
}; // Segment

namespace Tune {

// Chords no longer than this are touching points, not crossings.
constexpr Distance MinChord = 1.0e-9 * metre;

} // Tune

/// Rotates every point of @p geo about @p origin, counter-clockwise by
/// @p angle.  Rotate(Rotate(g, -a, o), a, o) reproduces g up to rounding.
template<class Geo>
Geo Rotate(const Geo& geo, Angle angle, const xy::Point& origin) {
  auto out = Geo{};
  out.reserve(geo.size());
  for (const auto& p: geo)
    out.push_back(geom::RotateAbout(p, origin, angle));
  return out;
} // Rotate

xy::Box   BoundingBox(const xy::Ring& ring);
xy::Point Centroid(const xy::Ring& ring);
Distance  PathLength(const xy::Path& path);

/// Number of distinct vertices; an explicit closing vertex is not counted.
std::size_t VertexCount(const xy::Ring& ring) noexcept;

/// Chords of the vertical line at @p x, clipped to [yMin, yMax], that lie
/// inside @p ring, ordered by increasing y.  Each segment is oriented top
/// first.  An edge is crossed when exactly one of its ends lies strictly to
/// the right of @p x, so the rightmost vertical edge of a ring never
/// produces a chord while the leftmost one does.
std::vector<Segment> IntersectVerticalLine(const xy::Ring& ring, Distance x,
                                           Distance yMin, Distance yMax);

} // coverage
