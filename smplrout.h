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

#ifndef SMPLROUT_H_INCLUDED_
#define SMPLROUT_H_INCLUDED_

#include <cstddef>  // for size_t

#include "defs.h"   // for TrackPointList, TrackPoint


/*
 * The simplified output only ever feeds the render geometry.  Stats are
 * computed from the full point list and never from anything produced here.
 */
class RouteSimplifier
{
public:

  /* Types */

  struct Options {
    double tolerance_m{11.0};
    int max_points{1000};
    int min_points{10};
    bool smooth_elevation{true};
  };

  /* Member Functions */

  RouteSimplifier() = default;
  explicit RouteSimplifier(const Options& opts) : options(opts) {}

  // Douglas-Peucker.  The first and last points always survive and the
  // order is never changed.  A tolerance <= 0 only drops exact duplicates.
  static TrackPointList simplify(const TrackPointList& points, double tolerance_m);

  TrackPointList simplify_for_render(const TrackPointList& points) const;

private:

  /* Types */

  struct segment {
    std::size_t first;
    std::size_t last;
  };

  /* Constants */

  static constexpr int kSmoothingWindow = 5;

  /* Member Functions */

  static bool same_sample(const TrackPoint& a, const TrackPoint& b);
  static TrackPointList remove_duplicates(const TrackPointList& points);
  static TrackPointList downsample(const TrackPointList& points, int max_points);
  static void smooth_elevation(TrackPointList& points);

  /* Data Members */

  Options options;
};

#endif // SMPLROUT_H_INCLUDED_
