/*
    Statistics derived from a recorded track.

    Copyright (C) 2024 The trailbook authors

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
#ifndef TRACKSTATS_H_INCLUDED_
#define TRACKSTATS_H_INCLUDED_

#include <QList>    // for QList
#include <QString>  // for QString

#include "defs.h"   // for ActivityStats, BoundingBox, TrackPointList


struct StatsOptions {
  // Segments shorter than this don't contribute to the maximum speed.
  int min_speed_interval_ms{1000};
  QString activity_type;
};

struct ElevationChange {
  double gain{0.0};
  double loss{0.0};
};

struct ElevationProfilePoint {
  double distance{0.0};   /* Meters from the start */
  double elevation{0.0};  /* Meters */
  double grade{0.0};      /* Percent */
};

struct SpeedProfilePoint {
  double distance{0.0};   /* Meters from the start */
  double elapsed{0.0};    /* Seconds from the start */
  double speed{0.0};      /* Meters/sec */
};

/*
 * Pure functions, no I/O, no shared state.  Internal arithmetic is in
 * double; activity_recompute rounds at the ActivityStats boundary.
 */
double track_distance(const TrackPointList& points);
BoundingBox track_bounds(const TrackPointList& points);
ElevationChange track_elevation_change(const TrackPointList& points);
double track_duration(const TrackPointList& points);
double track_max_speed(const TrackPointList& points, int min_speed_interval_ms);

ActivityStats activity_recompute(const TrackPointList& points, const StatsOptions& opts = StatsOptions());

// Fills avg_speed, avg_pace and estimated_calories from distance,
// duration and elevation_gain.
void stats_finish_derived(ActivityStats& stats, const QString& activity_type);

int estimate_calories(const QString& activity_type, double avg_speed, double duration_s, double elevation_gain_m);

QList<ElevationProfilePoint> elevation_profile(const TrackPointList& points);
QList<SpeedProfilePoint> speed_profile(const TrackPointList& points);

#endif // TRACKSTATS_H_INCLUDED_
