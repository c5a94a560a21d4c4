#include "PointsIo.hpp"

#include <boost/geometry/io/wkt/write.hpp>

#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace coverage {

namespace {

namespace fs = std::filesystem;

[[noreturn]] void ThrowReadError(const fs::path& path, int line,
                                 const std::string& msg)
{
  auto oss = std::ostringstream{};
  oss << path.generic_string() << '(' << line << "): " << msg;
  throw std::runtime_error{oss.str()};
} // ThrowReadError

std::string_view Trim(std::string_view s) noexcept {
  constexpr auto Space = " \t\r";
  const auto first = s.find_first_not_of(Space);
  if (first == std::string_view::npos)
    return {};
  const auto last = s.find_last_not_of(Space);
  return s.substr(first, last - first + 1);
} // Trim

bool ParseDouble(std::string_view s, double& value) noexcept {
  s = Trim(s);
  if (!s.empty() && s.front() == '+')
    s.remove_prefix(1);
  if (s.empty())
    return false;
  const auto last = s.data() + s.size();
  auto r = std::from_chars(s.data(), last, value);
  return r.ptr == last && r.ec == std::errc{};
} // ParseDouble

std::vector<std::pair<double, double>> ReadPairs(const fs::path& input) {
  auto is = std::ifstream{input};
  if (!is) {
    throw std::runtime_error{"cannot read '" + input.generic_string() + "'"};
  }
  auto pairs = std::vector<std::pair<double, double>>{};
  auto text  = std::string{};
  auto lineNum = 0;
  while (std::getline(is, text)) {
    ++lineNum;
    auto line = std::string_view{text};
    if (auto hash = line.find('#'); hash != std::string_view::npos)
      line = line.substr(0, hash);
    line = Trim(line);
    if (line.empty())
      continue;
    const auto comma = line.find(',');
    if (comma == std::string_view::npos)
      ThrowReadError(input, lineNum, "expected two comma-separated numbers");
    auto a = 0.0;
    auto b = 0.0;
    if (!ParseDouble(line.substr(0, comma), a)
        || !ParseDouble(line.substr(comma + 1), b))
    {
      ThrowReadError(input, lineNum, "invalid number in '"
                                     + std::string{line} + "'");
    }
    pairs.emplace_back(a, b);
  }
  if (is.bad())
    throw std::runtime_error{"error reading '" + input.generic_string() + "'"};
  return pairs;
} // ReadPairs

template<class Ring, class Path>
void WriteWktImpl(const fs::path& output, std::string_view name,
                  const Ring& boundary, const Path& path)
{
  auto os = std::ofstream{output, std::ios::binary};
  os.precision(15);
  if (!os) {
    throw std::runtime_error{"WriteWkt: cannot write to '"
                             + output.generic_string() + "'"};
  }
  os << name << '\t' << "Boundary" << '\t' << ggl::wkt(boundary) << '\n'
     << name << '\t' << "Coverage" << '\t' << ggl::wkt(path)     << '\n';
  if (!os.flush()) {
    throw std::runtime_error{"WriteWkt: error writing '"
                             + output.generic_string() + "'"};
  }
} // WriteWktImpl

} // local

geo::Ring ReadGeoRing(const std::filesystem::path& input) {
  auto ring = geo::Ring{};
  for (const auto& [lat, lon]: ReadPairs(input)) {
    if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) {
      auto msg = std::format("{}: coordinate out of range: {},{}",
                             input.generic_string(), lat, lon);
      throw std::runtime_error{msg};
    }
    ring.emplace_back(lat * units::deg, lon * units::deg);
  }
  return ring;
} // ReadGeoRing

xy::Ring ReadXyRing(const std::filesystem::path& input) {
  using mp_units::si::metre;
  auto ring = xy::Ring{};
  for (const auto& [x, y]: ReadPairs(input))
    ring.emplace_back(x * metre, y * metre);
  return ring;
} // ReadXyRing

void WritePoints(std::ostream& os, const geo::Path& path) {
  for (const auto& p: path) {
    os << std::format("{:.6f},{:.6f}\n",
                      p.latitude .numerical_value_in(units::deg),
                      p.longitude.numerical_value_in(units::deg));
  }
} // WritePoints(geo)

void WritePoints(std::ostream& os, const xy::Path& path) {
  using mp_units::si::metre;
  for (const auto& p: path) {
    os << std::format("{:.3f},{:.3f}\n", p.x().numerical_value_in(metre),
                                         p.y().numerical_value_in(metre));
  }
} // WritePoints(xy)

void WriteWkt(const std::filesystem::path& output, std::string_view name,
              const geo::Ring& boundary, const geo::Path& path)
  { WriteWktImpl(output, name, boundary, path); }

void WriteWkt(const std::filesystem::path& output, std::string_view name,
              const xy::Ring& boundary, const xy::Path& path)
  { WriteWktImpl(output, name, boundary, path); }

} // coverage
