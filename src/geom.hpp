#pragma once

#include <mp-units/systems/isq/space_and_time.h>
#include <mp-units/systems/si/units.h>
#include <mp-units/systems/si/unit_symbols.h>

#include <array>
#include <cmath>
#include <cstddef>

namespace geom {

using Distance =
      mp_units::quantity<mp_units::isq::distance[mp_units::si::metre]>;

using Angle =
      mp_units::quantity<mp_units::isq::angular_measure[mp_units::si::degree]>;

/// Planar point, metres.  Sweep lines run along y, so x is the offset
/// across the field and y the position along a line.
class Pt {
  std::array<Distance, 2> c;

public:
  template<std::size_t I> requires (I < 2)
  [[nodiscard]] constexpr Distance& get() noexcept { return std::get<I>(c); }
  template<std::size_t I> requires (I < 2)
  [[nodiscard]] constexpr const Distance& get() const noexcept
    { return std::get<I>(c); }

  [[nodiscard]] constexpr Distance& x() noexcept { return c[0]; }
  [[nodiscard]] constexpr const Distance& x() const noexcept { return c[0]; }
  [[nodiscard]] constexpr Distance& y() noexcept { return c[1]; }
  [[nodiscard]] constexpr const Distance& y() const noexcept { return c[1]; }

  constexpr Pt() = default;
  constexpr Pt(Distance x_, Distance y_) : c{x_, y_} { }
  constexpr bool operator==(const Pt&) const = default;
}; // Pt

/// Rotates @p p about @p pivot, counter-clockwise by @p theta.
inline Pt RotateAbout(const Pt& p, const Pt& pivot, Angle theta) noexcept {
  const auto rad = theta.numerical_value_in(mp_units::si::radian);
  const auto cs = std::cos(rad);
  const auto sn = std::sin(rad);
  const auto dx = p.x() - pivot.x();
  const auto dy = p.y() - pivot.y();
  return Pt{pivot.x() + cs * dx - sn * dy, pivot.y() + sn * dx + cs * dy};
} // RotateAbout

} // geom

namespace geom::test {

using namespace mp_units::si::unit_symbols;

constexpr auto a = Pt{3 * m, 4 * m};
constexpr auto b = Pt{3 * m, 4 * m};
static_assert(a == b);
static_assert(a.get<0>() == a.x() && a.get<1>() == 4.0 * m);

} // geom::test
