/// @file
/// Geographic front end: lat/lon rings in, lat/lon waypoints out.
#pragma once
#include "CoveragePlanner.hpp"
#include "CoverageXy.hpp"

#include <mp-units/systems/isq/space_and_time.h>
#include <mp-units/systems/si.h>
#include <mp-units/framework/quantity.h>

#include <boost/geometry/core/access.hpp>
#include <boost/geometry/core/coordinate_dimension.hpp>
#include <boost/geometry/core/coordinate_system.hpp>
#include <boost/geometry/core/coordinate_type.hpp>
#include <boost/geometry/core/tags.hpp>
#include <boost/geometry/core/cs.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/ring.hpp>
#include <boost/geometry/srs/projection.hpp>

#include <type_traits>
#include <cstddef>

namespace coverage {

namespace units {

constexpr auto deg = mp_units::si::degree;

constexpr struct latitude final
  : mp_units::quantity_spec<mp_units::isq::angular_measure> {} latitude;
constexpr struct longitude final
  : mp_units::quantity_spec<mp_units::isq::angular_measure> {} longitude;

} // units

using LatDeg = mp_units::quantity<units::latitude [units::deg]>;
using LonDeg = mp_units::quantity<units::longitude[units::deg]>;

struct LatLon {
  LatDeg latitude;
  LonDeg longitude;
  LatLon() = default;
  LatLon(LatDeg lat_, LonDeg lon_) : latitude{lat_}, longitude(lon_) { }
}; // LatLon

} // coverage

namespace boost::geometry::traits {

template<>
struct tag<coverage::LatLon> { using type = point_tag; };

template<>
struct coordinate_type<coverage::LatLon> { using type = double; };

template<>
struct coordinate_system<coverage::LatLon>
  { using type = cs::geographic<degree>; };

template<>
struct dimension<coverage::LatLon>
  : std::integral_constant<std::size_t, 2> { };

template<std::size_t Dim>
requires (Dim == 0 || Dim == 1)
struct access<coverage::LatLon, Dim> {
  static double get(const coverage::LatLon& p) {
    if constexpr (Dim == 0)
      return p.longitude.numerical_value_in(coverage::units::deg);
    else
      return p.latitude.numerical_value_in(coverage::units::deg);
  }
  static void set(coverage::LatLon& p, double v) {
    if constexpr (Dim == 0)
      p.longitude = v * coverage::units::deg;
    else
      p.latitude  = v * coverage::units::deg;
  }
}; // access

} // boost::geometry::traits

namespace coverage {

namespace geo {

using Point = LatLon;
using Ring  = ggl::model::ring<Point, true>;
using Path  = ggl::model::linestring<Point>;

} // geo

/// Azimuthal equidistant projection (WGS84) centred on the ring's envelope.
using Projection = ggl::srs::projection<>;

Projection MakeProjection(const geo::Ring& ring);

/// @throw std::runtime_error if a point cannot be projected.
xy::Ring  ProjectToXy(const geo::Ring& ring, const Projection& proj);
xy::Path  ProjectToXy(const geo::Path& path, const Projection& proj);
geo::Path ProjectToGeo(const xy::Path& path, const Projection& proj);

/// Drops repeated vertices and spikes, closes the ring and fixes its
/// orientation.  Returns an empty ring when fewer than three vertices remain
/// or the result is still not a valid simple polygon.
xy::Ring RepairRing(const xy::Ring& ring);

/// Compass bearing, clockwise from grid north in [0, 180), of the sweep
/// lines of a path planned at @p sweepHeading.
Angle CompassHeading(Angle sweepHeading);

/// Plans a lat/lon boundary in a local planar frame.
/// @throw InvalidPolygon, PlanningFailed, std::invalid_argument,
///        std::runtime_error
geo::Path PlanCoverage(const geo::Ring& ring, const PlannerConfig& config);

struct GeoPlan {
  Candidate best;      ///< heading, planar path and length
  geo::Path waypoints; ///< best.path, back in lat/lon
}; // GeoPlan

/// As PlanCoverage(), also reporting the chosen heading and planar length.
GeoPlan PlanGeoCoverage(const geo::Ring& ring, const PlannerConfig& config);

} // coverage
