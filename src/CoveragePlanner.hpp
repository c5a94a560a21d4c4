/// @file
/// Boustrophedon coverage planning over a simple planar polygon.
#pragma once
#include "CoverageErrors.hpp"
#include "CoverageXy.hpp"

#include <mp-units/systems/si/units.h>

#include <optional>
#include <vector>

namespace coverage {

struct PlannerConfig {
  Distance spacing  = 20.0 * mp_units::si::metre; ///< between sweep lines
  int angleSamples  = 36;   ///< headings tried over [0, 180) degrees
  unsigned threads  = 0;    ///< 0: one worker per hardware thread

  /// @throw std::invalid_argument
  void validate() const;
}; // PlannerConfig

/// The stitched path for one sampled heading, in the input frame.
struct Candidate {
  Angle    heading;
  int      index = 0;
  xy::Path path;
  Distance length;
}; // Candidate

/// Heading of sample @p index out of @p samples evenly spaced over [0, 180).
Angle SampleHeading(int index, int samples);

/// Sweeps @p ring at sample @p index, rotating about @p pivot.
/// Empty when no sweep line crosses the ring.
std::optional<Candidate> EvaluateHeading(const xy::Ring& ring,
                                         const xy::Point& pivot, int index,
                                         const PlannerConfig& config);

/// Ordered fold: the strictly shortest candidate, lowest index on ties.
std::optional<Candidate>
SelectBest(std::vector<std::optional<Candidate>> candidates);

/// Validates @p ring and returns it closed and consistently oriented.
/// @throw InvalidPolygon
xy::Ring PrepareRing(const xy::Ring& ring);

/// @throw InvalidPolygon, PlanningFailed, std::invalid_argument
Candidate PlanBestCandidate(const xy::Ring& ring, const PlannerConfig& config);

/// @throw InvalidPolygon, PlanningFailed, std::invalid_argument
xy::Path PlanCoverage(const xy::Ring& ring, const PlannerConfig& config);

} // coverage
