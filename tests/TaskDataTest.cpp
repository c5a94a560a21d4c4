#include "TaskData.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

using namespace coverage;
using units::deg;

namespace fs = std::filesystem;

namespace {

constexpr auto Sample = R"(<?xml version="1.0" encoding="UTF-8"?>
<ISO11783_TaskData VersionMajor="4" VersionMinor="3" DataTransferOrigin="1">
  <PFD A="PFD1" C="North 40" D="12000">
    <PLN A="1">
      <LSG A="1">
        <PNT A="2" C="40.000" D="-90.000"/>
        <PNT A="2" C="40.001" D="-90.000"/>
        <PNT A="2" C="40.001" D="-89.999"/>
        <PNT A="2" C="40.000" D="-89.999"/>
      </LSG>
    </PLN>
    <GGP A="GGP3" B="Old">
      <GPN A="GPN7" B="Old" C="1"/>
    </GGP>
  </PFD>
  <PFD A="PFD2" C="Yard"/>
</ISO11783_TaskData>
)";

std::size_t Count(const std::string& text, const std::string& what) {
  auto n = std::size_t{0};
  for (auto pos = text.find(what); pos != std::string::npos;
       pos = text.find(what, pos + what.size()))
    ++n;
  return n;
} // Count

} // local

TEST(TaskData, ReadsFieldBoundaries) {
  const auto task   = TaskData::Parse(Sample);
  const auto fields = task.fields();
  ASSERT_EQ(fields.size(), 1U);
  EXPECT_EQ(fields[0].id, "PFD1");
  EXPECT_EQ(fields[0].name, "North 40");
  ASSERT_EQ(fields[0].boundary.size(), 4U);
  EXPECT_DOUBLE_EQ(fields[0].boundary[1].latitude.numerical_value_in(deg),
                   40.001);
  EXPECT_DOUBLE_EQ(fields[0].boundary[2].longitude.numerical_value_in(deg),
                   -89.999);
}

TEST(TaskData, RejectsBadDocuments) {
  EXPECT_THROW(TaskData::Parse("<ISO11783_TaskData>"), std::runtime_error);
  EXPECT_THROW(TaskData::Parse("<TaskData/>"), std::runtime_error);

  const auto tram = std::string{R"(<ISO11783_TaskData>
    <PFD A="PFD1"><PLN A="1"><LSG A="3"/></PLN></PFD>
  </ISO11783_TaskData>)"};
  EXPECT_THROW(TaskData::Parse(tram).fields(), std::runtime_error);

  const auto badLat = std::string{R"(<ISO11783_TaskData>
    <PFD A="PFD1"><PLN A="1"><LSG A="1">
      <PNT A="2" C="95" D="0"/>
    </LSG></PLN></PFD>
  </ISO11783_TaskData>)"};
  EXPECT_THROW(TaskData::Parse(badLat).fields(), std::runtime_error);
}

TEST(TaskData, AddsGuidancePattern) {
  auto task = TaskData::Parse(Sample);
  const auto path = geo::Path{
    { 40.0001 * deg, -89.9999 * deg },
    { 40.0009 * deg, -89.9999 * deg },
    { 40.0009 * deg, -89.9998 * deg },
  };
  task.addGuidance("PFD1", "Coverage", path, 90.0 * deg);
  const auto text = task.str();
  EXPECT_NE(text.find(R"(<GGP A="GGP4" B="Coverage">)"), std::string::npos)
      << text;
  EXPECT_NE(text.find(R"(<GPN A="GPN8" B="Coverage" C="3" G="90")"),
            std::string::npos) << text;
  EXPECT_NE(text.find(R"(<LSG A="5">)"), std::string::npos) << text;
  EXPECT_EQ(Count(text, R"(<PNT A="6")"), 1U);
  EXPECT_EQ(Count(text, R"(<PNT A="9")"), 1U);
  EXPECT_EQ(Count(text, R"(<PNT A="7")"), 1U);

  // Guidance does not change the boundary.
  const auto again = TaskData::Parse(text).fields();
  ASSERT_EQ(again.size(), 1U);
  EXPECT_EQ(again[0].boundary.size(), 4U);
}

TEST(TaskData, UnknownField) {
  auto task = TaskData::Parse(Sample);
  EXPECT_THROW(task.addGuidance("PFD9", "x", geo::Path{}, 0.0 * deg),
               std::runtime_error);
}

TEST(TaskData, WriteAndRead) {
  const auto file = fs::temp_directory_path() / "coverage_TASKDATA.XML";
  auto task = TaskData::Parse(Sample);
  task.write(file);
  const auto fields = TaskData::Read(file).fields();
  auto ec = std::error_code{};
  fs::remove(file, ec);
  ASSERT_EQ(fields.size(), 1U);
  EXPECT_EQ(fields[0].name, "North 40");

  EXPECT_THROW(TaskData::Read(file), std::runtime_error);
}
