#pragma once
#include "geom_ggl.hpp"

#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/ring.hpp>

namespace coverage {

namespace ggl = boost::geometry;

using geom::Distance;
using geom::Angle;

/// Planar geometry, metres.
namespace xy {

using Point = geom::Pt;
using Ring  = ggl::model::ring<Point, true>;
using Path  = ggl::model::linestring<Point>;
using Box   = ggl::model::box<Point>;

} // xy

} // coverage
