#include "Stitch.hpp"

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

namespace coverage {

xy::Path StitchSweeps(std::span<const SweepLine> lines) {
  auto path  = xy::Path{};
  auto strip = std::vector<xy::Point>{};
  auto segs  = std::vector<Segment>{};
  auto stripNum = 0;
  for (const auto& line: lines) {
    if (line.segments.empty())
      continue;
    segs.assign(line.segments.begin(), line.segments.end());
    for (auto& s: segs) {
      if (s.top.y() < s.bottom.y())
        std::swap(s.top, s.bottom);
    }
    std::ranges::stable_sort(segs, std::ranges::greater{}, &Segment::midY);
    strip.clear();
    for (const auto& s: segs) {
      strip.push_back(s.top);
      strip.push_back(s.bottom);
    }
    if (stripNum++ % 2 == 1)
      std::ranges::reverse(strip);
    path.insert(path.end(), strip.begin(), strip.end());
  }
  return path;
} // StitchSweeps

} // coverage
