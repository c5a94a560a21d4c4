#pragma once
#include "geom.hpp"

#include <boost/geometry/core/access.hpp>
#include <boost/geometry/core/coordinate_dimension.hpp>
#include <boost/geometry/core/coordinate_system.hpp>
#include <boost/geometry/core/coordinate_type.hpp>
#include <boost/geometry/core/tags.hpp>
#include <boost/geometry/core/cs.hpp>

#include <type_traits>
#include <cstddef>

// Boost.Geometry sees geom::Pt as a cartesian point in plain metres.
namespace boost::geometry::traits {

template<>
struct tag<geom::Pt> { using type = point_tag; };

template<>
struct coordinate_type<geom::Pt> { using type = double; };

template<>
struct coordinate_system<geom::Pt> { using type = cs::cartesian; };

template<>
struct dimension<geom::Pt> : std::integral_constant<std::size_t, 2> { };

template<std::size_t Dim>
requires (Dim == 0 || Dim == 1)
struct access<geom::Pt, Dim> {
  static double get(const geom::Pt& p)
    { return p.get<Dim>().numerical_value_in(mp_units::si::metre); }
  static void set(geom::Pt& p, double v)
    { p.get<Dim>() = v * mp_units::si::metre; }
}; // access

} // boost::geometry::traits
