/// @file
/// Plain-text vertex lists and WKT export.
#pragma once
#include "CoverageGeo.hpp"
#include "CoverageXy.hpp"

#include <filesystem>
#include <iosfwd>
#include <string_view>

namespace coverage {

/// Reads one "lat,lon" pair per line.  Blank lines and '#' comments are
/// skipped.
/// @throw std::runtime_error naming the file and line at fault.
geo::Ring ReadGeoRing(const std::filesystem::path& input);

/// Reads one "x,y" pair (metres) per line, same layout as ReadGeoRing().
xy::Ring ReadXyRing(const std::filesystem::path& input);

/// Writes "lat,lon" with six decimals, one waypoint per line.
void WritePoints(std::ostream& os, const geo::Path& path);

/// Writes "x,y" in metres with three decimals, one waypoint per line.
void WritePoints(std::ostream& os, const xy::Path& path);

/// Writes "name<TAB>kind<TAB>WKT" lines for the boundary and the path.
/// @throw std::runtime_error if @p output cannot be written.
void WriteWkt(const std::filesystem::path& output, std::string_view name,
              const geo::Ring& boundary, const geo::Path& path);
void WriteWkt(const std::filesystem::path& output, std::string_view name,
              const xy::Ring& boundary, const xy::Path& path);

} // coverage
