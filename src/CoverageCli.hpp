/// @file
/// Command line front end of PlanCoverage.
#pragma once
#include "CoveragePlanner.hpp"

#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

namespace coverage::cli {

struct Options {
  std::string inputPath;
  std::string taskPath;
  std::string outputPath;
  std::string wktPath;
  std::string configPath;
  double spacingM = 10.0;
  int samples = 36;
  unsigned threads = 0;
  bool xy = false;
  bool verbose = false;
}; // Options

/// Bad command line or config file.  what() is the full text to show,
/// usage included where it helps.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
}; // UsageError

/// Empty when help was requested; the help text goes to @p out.
/// Values from --config fill in options not given on the command line.
/// @throw UsageError
std::optional<Options> ParseArgs(int argc, const char* const argv[],
                                 std::ostream& out);

PlannerConfig MakeConfig(const Options& opts);

/// Runs the selected mode.  Waypoints and progress go to @p out; verbose
/// reports and skipped fields go to @p log.  Returns the exit status:
/// 1 if any task field could not be planned, else 0.
/// @throw std::exception on I/O or planning errors.
int Run(const Options& opts, std::ostream& out, std::ostream& log);

} // coverage::cli
