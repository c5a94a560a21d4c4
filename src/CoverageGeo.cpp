#include "CoverageGeo.hpp"

#include "Geometry.hpp"

#include <boost/geometry/algorithms/correct.hpp>
#include <boost/geometry/algorithms/envelope.hpp>
#include <boost/geometry/algorithms/is_valid.hpp>
#include <boost/geometry/algorithms/remove_spikes.hpp>
#include <boost/geometry/algorithms/unique.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/srs/projection.hpp>

#include <cmath>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>

namespace coverage {

namespace detail {

template<class Out, class In, class Proj>
Out Forward(const In& in, const Proj& proj, const char* what) {
  auto out = Out{};
  if (!proj.forward(in, out))
    throw std::runtime_error{std::string{what} + ": projection failed"};
  return out;
} // Forward

template<class Out, class In, class Proj>
Out Inverse(const In& in, const Proj& proj, const char* what) {
  auto out = Out{};
  if (!proj.inverse(in, out))
    throw std::runtime_error{std::string{what} + ": inverse projection failed"};
  return out;
} // Inverse

} // detail

Projection MakeProjection(const geo::Ring& ring) {
  using namespace ggl::srs::dpar;

  using GeoBox = ggl::model::box<geo::Point>;
  const auto env = ggl::return_envelope<GeoBox>(ring);
  const auto& lo = env.min_corner();
  const auto& hi = env.max_corner();
  const auto origin_lat =
        ((lo.latitude + hi.latitude) / 2.0).numerical_value_in(units::deg);
  const auto origin_lon =
        ((lo.longitude + hi.longitude) / 2.0).numerical_value_in(units::deg);
  Projection proj = parameters<>(proj_aeqd)
                          (ellps_wgs84) (lat_0, origin_lat)(lon_0, origin_lon)
                          (x_0,0)(y_0,0)(units_m);
  return proj;
} // MakeProjection

xy::Ring ProjectToXy(const geo::Ring& ring, const Projection& proj)
  { return detail::Forward<xy::Ring>(ring, proj, "ProjectToXy"); }

xy::Path ProjectToXy(const geo::Path& path, const Projection& proj)
  { return detail::Forward<xy::Path>(path, proj, "ProjectToXy"); }

geo::Path ProjectToGeo(const xy::Path& path, const Projection& proj)
  { return detail::Inverse<geo::Path>(path, proj, "ProjectToGeo"); }

Angle CompassHeading(Angle sweepHeading) {
  constexpr auto Half = 180.0 * units::deg;
  // Sweep lines run along +y rotated counter-clockwise by the heading.
  auto bearing = Half - sweepHeading;
  bearing -= std::floor((bearing / Half).numerical_value_in(mp_units::one)) * Half;
  if (bearing >= Half)
    bearing -= Half;
  return bearing;
} // CompassHeading

xy::Ring RepairRing(const xy::Ring& ring) {
  auto out = ring;
  ggl::unique(out);
  ggl::correct(out);
  ggl::remove_spikes(out);
  ggl::correct(out);
  if (VertexCount(out) < 3)
    return xy::Ring{};
  auto failure = ggl::validity_failure_type{};
  if (!ggl::is_valid(out, failure))
    return xy::Ring{};
  return out;
} // RepairRing

GeoPlan PlanGeoCoverage(const geo::Ring& ring, const PlannerConfig& config) {
  auto n = ring.size();
  if (n > 1 && ring.front().latitude  == ring.back().latitude
            && ring.front().longitude == ring.back().longitude)
    --n;
  if (n < 3) {
    auto msg = std::format("polygon must have at least 3 vertices, got {}", n);
    throw InvalidPolygon{msg};
  }
  config.validate();
  const auto proj = MakeProjection(ring);
  const auto poly = RepairRing(ProjectToXy(ring, proj));
  if (poly.empty())
    throw InvalidPolygon{"polygon is empty after repair"};
  auto plan = GeoPlan{PlanBestCandidate(poly, config), geo::Path{}};
  plan.waypoints = ProjectToGeo(plan.best.path, proj);
  return plan;
} // PlanGeoCoverage

geo::Path PlanCoverage(const geo::Ring& ring, const PlannerConfig& config)
  { return PlanGeoCoverage(ring, config).waypoints; }

} // coverage
