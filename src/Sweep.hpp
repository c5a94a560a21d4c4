#pragma once
#include "Geometry.hpp"

#include <vector>

namespace coverage {

struct SweepLine {
  Distance x;
  std::vector<Segment> segments;
}; // SweepLine

namespace Tune {

// Sweep lines run this many spacings past the bounding box on every side so
// the first and last real crossings are captured.  A heuristic margin: a
// spike narrower than one spacing can still fall between two lines.
constexpr double Overshoot = 1.0;

} // Tune

/// Offsets minx - margin, minx - margin + spacing, ... up to and including
/// the last one not exceeding maxx + margin.  Empty for an inverted box or
/// when the widened box overflows.
std::vector<Distance> SweepOffsets(const xy::Box& box, Distance spacing);

/// Non-empty sweep lines over @p box, in increasing x.
std::vector<SweepLine> GenerateSweeps(const xy::Ring& ring, const xy::Box& box,
                                      Distance spacing);

/// Non-empty sweep lines over the bounding box of @p ring.
std::vector<SweepLine> GenerateSweeps(const xy::Ring& ring, Distance spacing);

} // coverage
