#include "Sweep.hpp"

#include <gsl-lite/gsl-lite.hpp>
namespace gsl = gsl_lite;

#include <cmath>
#include <utility>
#include <vector>

namespace coverage {

std::vector<Distance> SweepOffsets(const xy::Box& box, Distance spacing) {
  gsl_Expects(spacing > Distance::zero());
  const auto margin = Tune::Overshoot * spacing;
  const auto first  = box.min_corner().x() - margin;
  const auto last   = box.max_corner().x() + margin;
  auto xs = std::vector<Distance>{};
  // An overflowing extent has no usable offsets.
  if (!std::isfinite(first.numerical_value_in(metre))
      || !std::isfinite(last.numerical_value_in(metre)) || last < first)
  {
    return xs;
  }
  // Index-based so rounding does not accumulate along the box.
  for (auto k = gsl::index{0}; ; ++k) {
    const auto x = first + static_cast<double>(k) * spacing;
    if (x > last)
      break;
    xs.push_back(x);
  }
  return xs;
} // SweepOffsets

std::vector<SweepLine> GenerateSweeps(const xy::Ring& ring, const xy::Box& box,
                                      Distance spacing)
{
  const auto margin = Tune::Overshoot * spacing;
  const auto yMin = box.min_corner().y() - margin;
  const auto yMax = box.max_corner().y() + margin;
  auto lines = std::vector<SweepLine>{};
  for (const auto x: SweepOffsets(box, spacing)) {
    auto segments = IntersectVerticalLine(ring, x, yMin, yMax);
    if (segments.empty())
      continue;
    lines.push_back(SweepLine{x, std::move(segments)});
  }
  return lines;
} // GenerateSweeps

std::vector<SweepLine> GenerateSweeps(const xy::Ring& ring, Distance spacing)
  { return GenerateSweeps(ring, BoundingBox(ring), spacing); }

} // coverage
