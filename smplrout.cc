/*
    Route / track simplification

    Copyright (C) 2002-2023 Robert Lipe, robertlipe+source@gpsbabel.org

    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.

 */

/*
 * For each span A..C we find the vertex B with the largest cross-track
 * error against the great circle segment AC.  If that error is over the
 * tolerance B is kept and both halves A..B and B..C are examined in turn,
 * otherwise everything strictly between A and C goes.  The spans are kept
 * on an explicit stack so long tracks can't blow the call stack.
 */

#include "smplrout.h"

#include <algorithm>            // for max
#include <cmath>                // for llround
#include <cstddef>              // for size_t
#include <vector>               // for vector

#include "defs.h"
#include "grtcirc.h"            // for linedist, radtometers
#include "src/core/logging.h"   // for gbDebug

#define MYNAME "simplify"

bool
RouteSimplifier::same_sample(const TrackPoint& a, const TrackPoint& b)
{
  return a.latitude == b.latitude && a.longitude == b.longitude &&
         a.elevation == b.elevation && a.timestamp == b.timestamp;
}

TrackPointList
RouteSimplifier::remove_duplicates(const TrackPointList& points)
{
  TrackPointList result;
  result.reserve(points.size());
  for (std::size_t i = 0; i < points.size(); ++i) {
    // the last point is always kept, even when it repeats its neighbor.
    if (i > 0 && i + 1 < points.size() && same_sample(points[i], points[i - 1])) {
      continue;
    }
    result.push_back(points[i]);
  }
  return result;
}

TrackPointList
RouteSimplifier::simplify(const TrackPointList& points, double tolerance_m)
{
  if (points.size() <= 2) {
    return points;
  }
  if (tolerance_m <= 0) {
    return remove_duplicates(points);
  }

  std::vector<bool> keep(points.size(), false);
  keep.front() = true;
  keep.back() = true;

  std::vector<segment> pending{{0, points.size() - 1}};
  while (!pending.empty()) {
    segment seg = pending.back();
    pending.pop_back();
    if (seg.last - seg.first < 2) {
      continue;
    }

    const TrackPoint& a = points[seg.first];
    const TrackPoint& c = points[seg.last];
    double max_error = -1.0;
    std::size_t max_index = seg.first;
    for (std::size_t i = seg.first + 1; i < seg.last; ++i) {
      double xte = radtometers(linedist(a.position(), c.position(), points[i].position()));
      if (xte > max_error) {
        max_error = xte;
        max_index = i;
      }
    }

    if (max_error > tolerance_m) {
      keep[max_index] = true;
      pending.push_back({seg.first, max_index});
      pending.push_back({max_index, seg.last});
    }
  }

  TrackPointList result;
  for (std::size_t i = 0; i < points.size(); ++i) {
    if (keep[i]) {
      result.push_back(points[i]);
    }
  }

  gbDebug(2) << MYNAME ": " << points.size() << " -> " << result.size()
             << " points at " << tolerance_m << " m";
  return result;
}

TrackPointList
RouteSimplifier::downsample(const TrackPointList& points, int max_points)
{
  const auto limit = static_cast<std::size_t>(std::max(max_points, 2));
  if (points.size() <= limit) {
    return points;
  }

  TrackPointList result;
  result.reserve(limit);
  const double step = static_cast<double>(points.size() - 1) / static_cast<double>(limit - 1);
  for (std::size_t k = 0; k < limit; ++k) {
    auto idx = static_cast<std::size_t>(std::llround(k * step));
    result.push_back(points[idx]);
  }
  result.back() = points.back();
  return result;
}

void
RouteSimplifier::smooth_elevation(TrackPointList& points)
{
  const TrackPointList original = points;
  const int half = kSmoothingWindow / 2;
  const int n = static_cast<int>(original.size());

  for (int i = 0; i < n; ++i) {
    if (!original[i].elevation.has_value()) {
      continue;
    }
    double sum = 0.0;
    int count = 0;
    for (int j = std::max(0, i - half); j <= i + half && j < n; ++j) {
      if (original[j].elevation.has_value()) {
        sum += *original[j].elevation;
        ++count;
      }
    }
    points[i].elevation = sum / count;
  }
}

TrackPointList
RouteSimplifier::simplify_for_render(const TrackPointList& points) const
{
  if (points.size() <= static_cast<std::size_t>(std::max(options.min_points, 0))) {
    return points;
  }

  TrackPointList result = simplify(points, options.tolerance_m);
  if (result.size() > static_cast<std::size_t>(std::max(options.max_points, 2))) {
    result = downsample(result, options.max_points);
    gbDebug(2) << MYNAME ": down-sampled to " << result.size() << " points";
  }
  if (options.smooth_elevation) {
    smooth_elevation(result);
  }
  return result;
}
