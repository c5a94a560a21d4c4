#include "CoverageCli.hpp"

#include "CoverageGeo.hpp"
#include "PointsIo.hpp"
#include "TaskData.hpp"

#include <boost/program_options.hpp>

#include <mp-units/systems/si.h>

#include <cmath>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace coverage::cli {

namespace {

namespace po = boost::program_options;
namespace fs = std::filesystem;

std::string Usage(const po::options_description& desc) {
  auto os = std::ostringstream{};
  os << "Usage:\n"
     << "  PlanCoverage [options]\n\n"
     << desc
     << "\n";
  return os.str();
} // Usage

geo::Ring DemoField() {
  using units::deg;
  return geo::Ring{
    { 37.7749 * deg, -122.4194 * deg },
    { 37.7749 * deg, -122.4184 * deg },
    { 37.7740 * deg, -122.4184 * deg },
    { 37.7740 * deg, -122.4194 * deg },
    { 37.7741 * deg, -122.4196 * deg },
  };
} // DemoField

void Report(const Options& opts, std::ostream& log, std::string_view name,
            const Candidate& best)
{
  if (!opts.verbose)
    return;
  log << std::format("{}: heading {:.1f} deg, length {:.1f} m, "
                     "{} waypoints\n", name,
                     best.heading.numerical_value_in(units::deg),
                     best.length.numerical_value_in(mp_units::si::metre),
                     best.path.size());
} // Report

void PlanXy(const Options& opts, std::ostream& out, std::ostream& log) {
  const auto ring = ReadXyRing(opts.inputPath);
  const auto best = PlanBestCandidate(ring, MakeConfig(opts));
  Report(opts, log, opts.inputPath, best);
  out << "Generated " << best.path.size() << " waypoints:\n";
  WritePoints(out, best.path);
  if (!opts.wktPath.empty())
    WriteWkt(opts.wktPath, fs::path{opts.inputPath}.stem().string(), ring,
             best.path);
} // PlanXy

void PlanGeo(const Options& opts, std::ostream& out, std::ostream& log) {
  const auto ring = opts.inputPath.empty() ? DemoField()
                                           : ReadGeoRing(opts.inputPath);
  const auto name = opts.inputPath.empty()
                  ? std::string{"demo"}
                  : fs::path{opts.inputPath}.stem().string();
  const auto plan = PlanGeoCoverage(ring, MakeConfig(opts));
  Report(opts, log, name, plan.best);
  out << "Generated " << plan.waypoints.size() << " waypoints:\n";
  WritePoints(out, plan.waypoints);
  if (!opts.wktPath.empty())
    WriteWkt(opts.wktPath, name, ring, plan.waypoints);
} // PlanGeo

// Returns the number of fields that could not be planned.
int PlanTaskData(const Options& opts, std::ostream& out, std::ostream& log) {
  const auto config = MakeConfig(opts);
  auto task = TaskData::Read(opts.taskPath);
  const auto fields = task.fields();
  out << fields.size() << " fields\n";
  auto failed = 0;
  for (const auto& field: fields) {
    try {
      const auto plan = PlanGeoCoverage(field.boundary, config);
      Report(opts, log, field.name, plan.best);
      task.addGuidance(field.id, field.name + " coverage", plan.waypoints,
                       CompassHeading(plan.best.heading));
      out << std::format("{} ({}): {} waypoints\n", field.name,
                         field.id, plan.waypoints.size());
      if (!opts.wktPath.empty()) {
        auto path = fs::path{opts.wktPath};
        path.replace_filename(std::format("{}_{}", field.id,
                                          path.filename().string()));
        WriteWkt(path, field.name, field.boundary, plan.waypoints);
      }
    }
    catch (const InvalidPolygon& x) {
      log << std::format("{} ({}): skipped: {}\n", field.name,
                         field.id, x.what());
      ++failed;
    }
    catch (const PlanningFailed& x) {
      log << std::format("{} ({}): skipped: {}\n", field.name,
                         field.id, x.what());
      ++failed;
    }
  }
  task.write(opts.outputPath);
  return failed;
} // PlanTaskData

} // local

std::optional<Options> ParseArgs(int argc, const char* const argv[],
                                 std::ostream& out)
{
  auto opts = Options{};

  auto desc = po::options_description("Options");
  desc.add_options()
    ("help,h", "Show help.")
    ("config,c", po::value<std::string>(&opts.configPath),
      "Read options from an INI-style file.")
    ("input,i", po::value<std::string>(&opts.inputPath),
      "Boundary vertices, one \"lat,lon\" per line"
      " (default: built-in demo field).")
    ("xy", po::bool_switch(&opts.xy),
      "Input and output are planar \"x,y\" metres.")
    ("taskdata,t", po::value<std::string>(&opts.taskPath),
      "Input ISO11783 file: plan every field boundary.")
    ("output,o", po::value<std::string>(&opts.outputPath),
      "Output ISO11783 file (required with --taskdata).")
    ("spacing,s", po::value<double>(&opts.spacingM)->default_value(10.0),
      "Sweep spacing in metres.")
    ("samples,n", po::value<int>(&opts.samples)->default_value(36),
      "Number of headings tried over [0, 180) degrees.")
    ("threads,j", po::value<unsigned>(&opts.threads)->default_value(0),
      "Worker threads (0: hardware concurrency).")
    ("wkt,w", po::value<std::string>(&opts.wktPath),
      "Also write boundary and path as WKT.")
    ("verbose,v", po::bool_switch(&opts.verbose),
      "Report the chosen heading and path length.");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);

    if (vm.count("help") != 0U) {
      out << Usage(desc)
          << "\n"
          << "Examples:\n"
          << "  PlanCoverage -s 12 -i field.txt\n"
          << "  PlanCoverage --xy -i field_xy.txt -w coverage.wkt\n"
          << "  PlanCoverage -t TASKDATA.XML -o out_TASKDATA.XML\n";
      return std::nullopt;
    }

    if (vm.count("config") != 0U) {
      const auto& cfgPath = vm["config"].as<std::string>();
      auto cfg = std::ifstream{cfgPath};
      if (!cfg)
        throw po::error{"cannot read config file '" + cfgPath + "'"};
      po::store(po::parse_config_file(cfg, desc), vm);
    }

    po::notify(vm);
  }
  catch (const po::error& e) {
    throw UsageError{std::format("Command line error: {}\n\n{}", e.what(),
                                 Usage(desc))};
  }

  if (!std::isfinite(opts.spacingM) || opts.spacingM <= 0.0)
    throw UsageError{"Error: spacing must be a finite number > 0."};

  if (opts.samples < 1)
    throw UsageError{"Error: samples must be >= 1."};

  if (!opts.taskPath.empty()) {
    if (!opts.inputPath.empty())
      throw UsageError{"Error: --input and --taskdata are exclusive."};
    if (opts.outputPath.empty())
      throw UsageError{"Error: --output is required with --taskdata."};
    if (fs::path{opts.outputPath} == fs::path{opts.taskPath})
      throw UsageError{"Error: output file must be different than input file."};
  }
  else if (!opts.outputPath.empty()) {
    throw UsageError{"Error: --output applies only to --taskdata."};
  }

  if (opts.xy && opts.inputPath.empty())
    throw UsageError{"Error: --xy needs --input."};

  return opts;
} // ParseArgs

PlannerConfig MakeConfig(const Options& opts) {
  auto config = PlannerConfig{};
  config.spacing      = opts.spacingM * mp_units::si::metre;
  config.angleSamples = opts.samples;
  config.threads      = opts.threads;
  return config;
} // MakeConfig

int Run(const Options& opts, std::ostream& out, std::ostream& log) {
  if (!opts.taskPath.empty())
    return (PlanTaskData(opts, out, log) == 0) ? 0 : 1;
  if (opts.xy)
    PlanXy(opts, out, log);
  else
    PlanGeo(opts, out, log);
  return 0;
} // Run

} // coverage::cli
