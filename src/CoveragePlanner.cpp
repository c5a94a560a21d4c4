#include "CoveragePlanner.hpp"

#include "Geometry.hpp"
#include "Stitch.hpp"
#include "Sweep.hpp"

#include <boost/geometry/algorithms/area.hpp>
#include <boost/geometry/algorithms/correct.hpp>

#include <gsl-lite/gsl-lite.hpp>
namespace gsl = gsl_lite;

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <format>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace coverage {

namespace {

unsigned WorkerCount(unsigned requested, int jobs) {
  auto n = requested;
  if (n == 0)
    n = std::max(1U, std::thread::hardware_concurrency());
  return std::min(n, static_cast<unsigned>(jobs));
} // WorkerCount

// Runs fn(0) .. fn(count-1) on @p workers threads pulling from a shared cursor.
template<class Fn>
void ForEachIndex(int count, unsigned workers, Fn&& fn) {
  if (workers <= 1) {
    for (int i = 0; i != count; ++i)
      fn(i);
    return;
  }
  auto next = std::atomic<int>{0};
  auto worker = [&] {
    for (;;) {
      const auto i = next.fetch_add(1);
      if (i >= count)
        return;
      fn(i);
    }
  };
  auto pool = std::vector<std::jthread>{};
  pool.reserve(workers);
  for (auto t = 0U; t != workers; ++t)
    pool.emplace_back(worker);
} // ForEachIndex

} // local

void PlannerConfig::validate() const {
  if (!std::isfinite(spacing.numerical_value_in(mp_units::si::metre))
      || spacing <= Distance::zero())
  {
    throw std::invalid_argument{"PlannerConfig: spacing must be > 0"};
  }
  if (angleSamples < 1)
    throw std::invalid_argument{"PlannerConfig: angleSamples must be >= 1"};
} // PlannerConfig::validate

Angle SampleHeading(int index, int samples) {
  gsl_Expects(samples >= 1 && index >= 0 && index < samples);
  return (180.0 * index / samples) * mp_units::si::degree;
} // SampleHeading

std::optional<Candidate> EvaluateHeading(const xy::Ring& ring,
                                         const xy::Point& pivot, int index,
                                         const PlannerConfig& config)
{
  const auto heading = SampleHeading(index, config.angleSamples);
  // Sweep lines are vertical in the working frame.
  const auto work  = Rotate(ring, -heading, pivot);
  const auto lines = GenerateSweeps(work, config.spacing);
  auto path = StitchSweeps(lines);
  if (path.empty())
    return std::nullopt;
  path = Rotate(path, heading, pivot);
  const auto length = PathLength(path);
  return Candidate{heading, index, std::move(path), length};
} // EvaluateHeading

std::optional<Candidate>
SelectBest(std::vector<std::optional<Candidate>> candidates)
{
  auto best = std::optional<gsl::index>{};
  for (auto i = gsl::index{0}; i != std::ssize(candidates); ++i) {
    const auto& c = candidates[i];
    if (!c)
      continue;
    if (!best || c->length < candidates[*best]->length)
      best = i;
  }
  if (!best)
    return std::nullopt;
  return std::move(candidates[*best]);
} // SelectBest

xy::Ring PrepareRing(const xy::Ring& ring) {
  const auto n = VertexCount(ring);
  if (n < 3) {
    auto msg = std::format("polygon must have at least 3 vertices, got {}", n);
    throw InvalidPolygon{msg};
  }
  for (const auto& p: ring) {
    if (!std::isfinite(p.x().numerical_value_in(metre))
        || !std::isfinite(p.y().numerical_value_in(metre)))
    {
      throw InvalidPolygon{"polygon has a non-finite coordinate"};
    }
  }
  auto out = ring;
  ggl::correct(out);
  if (!(ggl::area(out) > 0.0))
    throw InvalidPolygon{"polygon is empty or degenerate"};
  return out;
} // PrepareRing

Candidate PlanBestCandidate(const xy::Ring& ring, const PlannerConfig& config) {
  const auto poly = PrepareRing(ring);
  config.validate();
  const auto pivot = Centroid(poly);
  const auto count = config.angleSamples;

  // Each heading writes only its own slot.
  auto results = std::vector<std::optional<Candidate>>(count);
  auto errors  = std::vector<std::exception_ptr>(count);
  ForEachIndex(count, WorkerCount(config.threads, count), [&](int i) {
    try {
      results[i] = EvaluateHeading(poly, pivot, i, config);
    }
    catch (...) {
      errors[i] = std::current_exception();
    }
  });
  for (const auto& e: errors) {
    if (e)
      std::rethrow_exception(e);
  }

  auto best = SelectBest(std::move(results));
  if (!best) {
    auto msg = std::format("no coverage path at any of {} headings "
                           "(spacing {} m)", count,
                           config.spacing.numerical_value_in(metre));
    throw PlanningFailed{msg};
  }
  return std::move(*best);
} // PlanBestCandidate

xy::Path PlanCoverage(const xy::Ring& ring, const PlannerConfig& config)
  { return PlanBestCandidate(ring, config).path; }

} // coverage
