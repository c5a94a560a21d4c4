#pragma once
#include "Sweep.hpp"

#include <span>

namespace coverage {

/// Joins sweep lines, given in increasing x, into one serpentine path.
/// Within a line the chords run from the top of the shape to the bottom
/// (by mean y, ties keep discovery order); every odd non-empty line is then
/// walked in reverse so consecutive lines alternate direction.
xy::Path StitchSweeps(std::span<const SweepLine> lines);

} // coverage
