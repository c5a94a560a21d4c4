#include "TaskData.hpp"

#include <pugixml.hpp>

#include <gsl-lite/gsl-lite.hpp>

#include <algorithm>
#include <charconv>
#include <format>
#include <iostream>
#include <iterator>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace gsl = gsl_lite;

// ---------------------------------------------------------------------
// ISOXML constants (centralized so parse/write share the same strings).
namespace isoxml {

constexpr char Root[] = "ISO11783_TaskData";

enum class PointType {
  Flag=1, Other, Access, Storage, Obstacle, GuideA, GuideB,
  GuideCenter, GuidePoint, Field, Base
};

enum class LineStringType {
  Exterior=1, Interior, TramLine, Sampling, Guidance, Drainage, Fence, Flag,
  Obstacle
};

enum class PolygonType {
  Boundary=1, Treatment, Water, Building, Road, Obstacle, Flag, Other, Field,
  Headland, Buffer, Windbreak
};

enum class GuidanceType { AB=1, APlus, Curve, Pivot, Spiral };

const char* Name(LineStringType x) noexcept {
  switch (x) {
    case LineStringType::Exterior:  return "Exterior";
    case LineStringType::Interior:  return "Interior";
    case LineStringType::TramLine:  return "TramLine";
    case LineStringType::Sampling:  return "Sampling";
    case LineStringType::Guidance:  return "Guidance";
    case LineStringType::Drainage:  return "Drainage";
    case LineStringType::Fence:     return "Fence";
    case LineStringType::Flag:      return "Flag";
    case LineStringType::Obstacle:  return "Obstacle";
    default: return nullptr;
  }
} // Name(LineStringType)

} // isoxml

namespace coverage {

namespace {

using XmlNode = pugi::xml_node;

std::string_view name(const XmlNode& n) noexcept
  { return std::string_view{n.name()}; }

[[noreturn]] void InvalidNode(const XmlNode& xml, std::string what) {
  auto k = name(xml);
  what.reserve(what.size() + 8 + k.size());
  what += " on <";
  what += k;
  what += ">";
  throw std::runtime_error{what};
} // InvalidNode

[[noreturn]] void InvalidAttr(const XmlNode& xml, const char* key,
                              std::string what="Invalid attribute")
{
  what += " \"";
  what += key;
  what += "\" ";
  auto a = xml.attribute(key);
  if (a) {
    what += "= ";
    what += a.as_string();
  }
  else {
    what += "is missing";
  }
  InvalidNode(xml, what);
} // InvalidAttr

template<typename T>
std::optional<T> GetAttr(const XmlNode& x, const char* key) {
  const auto a = x.attribute(key);
  if (!a)
    return std::nullopt;
  auto s = std::string_view{a.value()};
  if constexpr (std::is_same_v<T, std::string>) {
    if (s.empty())
      return std::nullopt;
    return std::string{s};
  }
  else {
    if (!s.empty() && s.front() == '+')
      s.remove_prefix(1);
    auto value = T{};
    const auto last = s.data() + s.size();
    auto r = std::from_chars(s.data(), last, value);
    if (s.empty() || r.ptr != last || r.ec != std::errc{})
      return std::nullopt;
    return value;
  }
} // GetAttr

template<typename T=std::string>
T RequireAttr(const XmlNode& x, const char* key) {
  auto v = GetAttr<T>(x, key);
  if (!v)
    InvalidAttr(x, key);
  return *v;
} // RequireAttr

int GetId(std::string pfx, const std::string& attr) {
  pfx += "-?([0-9]+)";
  const auto re = std::regex{pfx};
  auto m = std::smatch{};
  if (!std::regex_match(attr, m, re) || m.size() != 2 || !m[1].matched)
    return -1;
  return std::stoi(m[1]);
} // GetId

// One past the highest numeric id used by any <tag> element.
int NextId(const XmlNode& root, const char* tag) {
  auto id = 0;
  for (const auto& x: root.select_nodes((std::string{"//"} + tag).c_str())) {
    const auto attr = x.node().attribute("A");
    if (attr)
      id = std::max(id, GetId(tag, attr.value()));
  }
  return id + 1;
} // NextId

geo::Path ReadPath(const XmlNode& lsg) {
  auto pts = geo::Path{};
  pts.reserve(std::distance(lsg.begin(), lsg.end()));
  for (const auto& c: lsg.children()) {
    if (c.type() != pugi::node_element)
      continue;
    auto k = name(c);
    if (k != "PNT") {
      std::cerr << "ReadPath: element ignored: " << k << '\n';
      continue;
    }
    const auto lat = RequireAttr<double>(c, "C");
    const auto lon = RequireAttr<double>(c, "D");
    if (lat < -90.0 || lat > 90.0)
      InvalidAttr(c, "C", "Latitude out of range");
    if (lon < -180.0 || lon > 180.0)
      InvalidAttr(c, "D", "Longitude out of range");
    pts.emplace_back(lat * units::deg, lon * units::deg);
  }
  return pts;
} // ReadPath

std::optional<geo::Ring> ReadBoundary(const XmlNode& pfd) {
  using isoxml::LineStringType;
  using isoxml::PolygonType;
  for (const auto& pln: pfd.children("PLN")) {
    if (RequireAttr<int>(pln, "A") != static_cast<int>(PolygonType::Boundary))
      continue;
    auto ring = std::optional<geo::Ring>{};
    for (const auto& lsg: pln.children("LSG")) {
      const auto type = static_cast<LineStringType>(RequireAttr<int>(lsg, "A"));
      switch (type) {
        case LineStringType::Exterior: {
          if (ring)
            InvalidNode(pln, "Multiple exterior rings");
          auto path = ReadPath(lsg);
          ring.emplace(path.begin(), path.end());
          break;
        }
        case LineStringType::Interior:
          std::cerr << "ReadBoundary: interior ring ignored in field "
                    << pfd.attribute("A").value() << '\n';
          break;
        default: {
          const auto* n = isoxml::Name(type);
          auto msg = std::string{"Unexpected LineString type "}
                   + ((n != nullptr) ? n : "(unknown)");
          InvalidNode(lsg, msg);
        }
      }
    }
    if (!ring)
      InvalidNode(pln, "Missing exterior ring");
    return ring;
  }
  return std::nullopt;
} // ReadBoundary

void WritePoint(XmlNode& node, const LatLon& pt, isoxml::PointType type) {
  auto pnt = node.append_child("PNT");
  pnt.append_attribute("A") = static_cast<int>(type);
  pnt.append_attribute("C") = pt.latitude .numerical_value_in(units::deg);
  pnt.append_attribute("D") = pt.longitude.numerical_value_in(units::deg);
} // WritePoint

void WriteGuidancePath(XmlNode& node, const geo::Path& path) {
  using namespace isoxml;
  auto lsg = node.append_child("LSG");
  lsg.append_attribute("A") = static_cast<int>(LineStringType::Guidance);
  if (path.empty())
    return;
  auto iter = path.begin();
  WritePoint(lsg, *iter, PointType::GuideA);
  if (++iter == path.end())
    return;
  const auto last = std::prev(path.end());
  while (iter != last)
    WritePoint(lsg, *iter++, PointType::GuidePoint);
  WritePoint(lsg, *iter, PointType::GuideB);
} // WriteGuidancePath

XmlNode RequireRoot(const pugi::xml_document& doc, std::string_view source) {
  auto root = doc.child(isoxml::Root);
  if (!root) {
    auto msg = std::format("{}: missing root <{}>", source, isoxml::Root);
    throw std::runtime_error{msg};
  }
  return root;
} // RequireRoot

constexpr auto ParseOptions = pugi::parse_default | pugi::parse_ws_pcdata;

} // local

TaskData::TaskData() : doc{std::make_unique<pugi::xml_document>()} { }
TaskData::TaskData(TaskData&&) noexcept = default;
TaskData& TaskData::operator=(TaskData&&) noexcept = default;
TaskData::~TaskData() = default;

TaskData TaskData::Read(const std::filesystem::path& input) {
  auto data = TaskData{};
  auto res = data.doc->load_file(input.c_str(), ParseOptions);
  if (!res) {
    auto msg = std::format("{}: XML parse error: {} (offset {})",
                       input.generic_string(), res.description(), res.offset);
    throw std::runtime_error{msg};
  }
  (void) RequireRoot(*data.doc, input.generic_string());
  return data;
} // TaskData::Read

TaskData TaskData::Parse(std::string_view xml) {
  auto data = TaskData{};
  auto res = data.doc->load_buffer(xml.data(), xml.size(), ParseOptions);
  if (!res) {
    auto msg = std::format("XML parse error: {} (offset {})",
                           res.description(), res.offset);
    throw std::runtime_error{msg};
  }
  (void) RequireRoot(*data.doc, "<buffer>");
  return data;
} // TaskData::Parse

std::vector<FieldBoundary> TaskData::fields() const {
  const auto root = doc->child(isoxml::Root);
  gsl_Expects(root);
  auto out = std::vector<FieldBoundary>{};
  for (const auto& pfd: root.children("PFD")) {
    auto id   = RequireAttr<std::string>(pfd, "A");
    auto name = GetAttr<std::string>(pfd, "C").value_or(id);
    auto ring = ReadBoundary(pfd);
    if (!ring) {
      std::cerr << "TaskData: field " << id << " has no boundary\n";
      continue;
    }
    out.push_back(FieldBoundary{std::move(id), std::move(name),
                                std::move(*ring)});
  }
  return out;
} // TaskData::fields

void TaskData::addGuidance(std::string_view fieldId, std::string_view name,
                           const geo::Path& path, Angle heading)
{
  auto root = doc->child(isoxml::Root);
  gsl_Expects(root);
  auto pfd = root.find_child_by_attribute("PFD", "A",
                                          std::string{fieldId}.c_str());
  if (!pfd) {
    auto msg = std::format("TaskData: no field {}", fieldId);
    throw std::runtime_error{msg};
  }
  const auto ggpId = "GGP" + std::to_string(NextId(root, "GGP"));
  const auto gpnId = "GPN" + std::to_string(NextId(root, "GPN"));
  const auto nameStr = std::string{name};

  auto ggp = pfd.append_child("GGP");
  ggp.append_attribute("A") = ggpId.c_str();
  ggp.append_attribute("B") = nameStr.c_str();
  auto gpn = ggp.append_child("GPN");
  gpn.append_attribute("A") = gpnId.c_str();
  gpn.append_attribute("B") = nameStr.c_str();
  gpn.append_attribute("C") = static_cast<int>(isoxml::GuidanceType::Curve);
  gpn.append_attribute("G") = heading.numerical_value_in(units::deg);
  WriteGuidancePath(gpn, path);
} // TaskData::addGuidance

void TaskData::write(const std::filesystem::path& output) const {
  if (!doc->save_file(output.c_str(), "  ")) {
    auto msg = std::format("TaskData: error writing '{}'",
                           output.generic_string());
    throw std::runtime_error{msg};
  }
} // TaskData::write

std::string TaskData::str() const {
  auto os = std::ostringstream{};
  doc->save(os, "  ");
  return os.str();
} // TaskData::str

} // coverage
