#include "Geometry.hpp"

#include <boost/geometry/algorithms/centroid.hpp>
#include <boost/geometry/algorithms/envelope.hpp>
#include <boost/geometry/algorithms/length.hpp>

#include <gsl-lite/gsl-lite.hpp>
namespace gsl = gsl_lite;

#include <algorithm>
#include <iterator>
#include <vector>

namespace coverage {

xy::Box BoundingBox(const xy::Ring& ring) {
  gsl_Expects(!ring.empty());
  return ggl::return_envelope<xy::Box>(ring);
} // BoundingBox

xy::Point Centroid(const xy::Ring& ring) {
  gsl_Expects(ring.size() >= 3);
  return ggl::return_centroid<xy::Point>(ring);
} // Centroid

Distance PathLength(const xy::Path& path)
  { return ggl::length(path) * metre; }

std::size_t VertexCount(const xy::Ring& ring) noexcept {
  auto n = ring.size();
  if (n > 1 && ring.front() == ring.back())
    --n;
  return n;
} // VertexCount

std::vector<Segment> IntersectVerticalLine(const xy::Ring& ring, Distance x,
                                           Distance yMin, Distance yMax)
{
  auto segments = std::vector<Segment>{};
  if (yMax < yMin)
    return segments;

  // Crossing heights; the half-open rule counts a vertex on the line once.
  auto ys = std::vector<Distance>{};
  const auto n = std::ssize(ring);
  for (auto i = gsl::index{0}; i != n; ++i) {
    const auto& a = ring[i];
    const auto& b = ring[(i + 1) % n];
    if ((a.x() > x) == (b.x() > x))
      continue;
    const auto t =
          ((x - a.x()) / (b.x() - a.x())).numerical_value_in(mp_units::one);
    ys.push_back(a.y() + t * (b.y() - a.y()));
  }
  gsl_Assert(ys.size() % 2 == 0);
  std::ranges::sort(ys);

  // Even-odd: consecutive pairs bound the interior.
  segments.reserve(ys.size() / 2);
  for (auto i = std::size_t{0}; i + 1 < ys.size(); i += 2) {
    const auto lo = std::max(ys[i], yMin);
    const auto hi = std::min(ys[i+1], yMax);
    if (hi - lo <= Tune::MinChord)
      continue;
    segments.push_back(Segment{xy::Point{x, hi}, xy::Point{x, lo}});
  }
  return segments;
} // IntersectVerticalLine

} // coverage
