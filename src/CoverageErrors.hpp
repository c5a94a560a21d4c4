#pragma once

#include <stdexcept>

namespace coverage {

/// The input ring cannot be planned: too few vertices, or empty or
/// degenerate geometry. The caller must fix the input.
class InvalidPolygon : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
}; // InvalidPolygon

/// Every sampled heading produced an empty path.
class PlanningFailed : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
}; // PlanningFailed

} // coverage
