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

#include "trackstats.h"

#include <algorithm>           // for clamp, max, min
#include <cmath>               // for round
#include <cstddef>             // for size_t
#include <optional>            // for optional

#include <QList>               // for QList
#include <QString>             // for QString
#include <Qt>                  // for CaseInsensitive
#include <QtGlobal>            // for qRound, qint64

#include "defs.h"
#include "grtcirc.h"           // for gcdist_meters
#include "src/core/logging.h"  // for gbDebug

#define MYNAME "stats"

namespace
{

struct met_entry {
  const char* activity_type;
  double met;
  double reference_speed;   /* Meters/sec, 0 when the MET doesn't scale */
};

// Compendium of Physical Activities, rounded.
constexpr met_entry met_table[] = {
  {"running",      9.8, 2.8},
  {"cycling",      7.5, 5.5},
  {"hiking",       6.0, 0.0},
  {"walking",      3.5, 1.4},
  {"skiing",       7.0, 0.0},
  {"snowboarding", 5.3, 0.0},
  {"climbing",     8.0, 0.0},
  {"kayaking",     5.0, 0.0},
  {"sailing",      3.0, 0.0},
  {"motorcycle",   2.5, 0.0},
  {"driving",      1.5, 0.0},
};
constexpr double kDefaultMet = 4.0;
constexpr double kReferenceMassKg = 70.0;
constexpr double kGravity = 9.81;
constexpr double kJoulesPerKcal = 4184.0;
constexpr double kMuscleEfficiency = 0.25;

float round_speed(double speed)
{
  return static_cast<float>(std::round(speed * 100.0) / 100.0);
}

} // namespace

double
track_distance(const TrackPointList& points)
{
  double distance = 0.0;
  for (std::size_t i = 1; i < points.size(); ++i) {
    distance += gcdist_meters(points[i - 1].position(), points[i].position());
  }
  return distance;
}

BoundingBox
track_bounds(const TrackPointList& points)
{
  BoundingBox bounds;
  if (points.empty()) {
    return bounds;
  }

  bounds.north = bounds.south = points.front().latitude;
  bounds.east = bounds.west = points.front().longitude;
  for (const auto& pt : points) {
    bounds.north = std::max(bounds.north, pt.latitude);
    bounds.south = std::min(bounds.south, pt.latitude);
    bounds.east = std::max(bounds.east, pt.longitude);
    bounds.west = std::min(bounds.west, pt.longitude);
  }
  return bounds;
}

// Points without an elevation are skipped, not treated as zero.
ElevationChange
track_elevation_change(const TrackPointList& points)
{
  ElevationChange change;
  const TrackPoint* prev = nullptr;

  for (const auto& pt : points) {
    if (!pt.elevation.has_value()) {
      continue;
    }
    if (prev != nullptr) {
      double delta = *pt.elevation - *prev->elevation;
      if (delta > 0) {
        change.gain += delta;
      } else {
        change.loss -= delta;
      }
    }
    prev = &pt;
  }
  return change;
}

double
track_duration(const TrackPointList& points)
{
  std::optional<qint64> first;
  std::optional<qint64> last;

  for (const auto& pt : points) {
    if (pt.timestamp.has_value()) {
      if (!first) {
        first = pt.timestamp;
      }
      last = pt.timestamp;
    }
  }
  if (!first || *last <= *first) {
    return 0.0;
  }
  return (*last - *first) / 1000.0;
}

double
track_max_speed(const TrackPointList& points, int min_speed_interval_ms)
{
  double max_spd = 0.0;
  bool have_segment = false;

  for (std::size_t i = 1; i < points.size(); ++i) {
    const TrackPoint& prev = points[i - 1];
    const TrackPoint& thisw = points[i];
    if (!prev.timestamp || !thisw.timestamp) {
      continue;
    }
    qint64 dt = *thisw.timestamp - *prev.timestamp;
    if (dt <= 0 || dt < min_speed_interval_ms) {
      continue;
    }
    double dist = gcdist_meters(prev.position(), thisw.position());
    if (dist > 0) {
      have_segment = true;
      max_spd = std::max(max_spd, dist / (dt / 1000.0));
    }
  }

  // Without usable timing fall back on what the device recorded.
  if (!have_segment) {
    for (const auto& pt : points) {
      if (pt.speed.has_value()) {
        max_spd = std::max(max_spd, *pt.speed);
      }
    }
  }
  return max_spd;
}

int
estimate_calories(const QString& activity_type, double avg_speed, double duration_s, double elevation_gain_m)
{
  if (duration_s <= 0) {
    return 0;
  }

  double met = kDefaultMet;
  for (const auto& entry : met_table) {
    if (activity_type.compare(QLatin1String(entry.activity_type), Qt::CaseInsensitive) == 0) {
      met = entry.met;
      if (entry.reference_speed > 0 && avg_speed > 0) {
        met *= std::clamp(avg_speed / entry.reference_speed, 0.5, 2.0);
      }
      break;
    }
  }

  double kcal = met * kReferenceMassKg * duration_s / SECONDS_PER_HOUR;
  // work against gravity
  kcal += elevation_gain_m * kReferenceMassKg * kGravity / kJoulesPerKcal / kMuscleEfficiency;
  return qRound(kcal);
}

void
stats_finish_derived(ActivityStats& stats, const QString& activity_type)
{
  if (stats.duration > 0) {
    stats.avg_speed = round_speed(static_cast<double>(stats.distance) / stats.duration);
  } else {
    stats.avg_speed = 0.0f;
  }
  if (stats.distance > 0) {
    stats.avg_pace = qRound(stats.duration / (stats.distance / kMetersPerKilometer));
  } else {
    stats.avg_pace = 0;
  }
  stats.estimated_calories = estimate_calories(activity_type, stats.avg_speed,
                             stats.duration, stats.elevation_gain);
}

/*
 * Run over all the points and return a collection of (hopefully
 * interesting) statistics about the track.  Fewer than two points
 * is not an error, it just yields zeros.
 */
ActivityStats
activity_recompute(const TrackPointList& points, const StatsOptions& opts)
{
  ActivityStats stats;
  std::optional<double> max_alt;
  std::optional<double> min_alt;
  int pts_hrt = 0;
  double tot_hrt = 0.0;
  int pts_cad = 0;
  double tot_cad = 0.0;
  int pts_pwr = 0;
  double tot_pwr = 0.0;

  for (const auto& thisw : points) {
    if (thisw.elevation.has_value()) {
      if (!min_alt || (*thisw.elevation < *min_alt)) {
        min_alt = thisw.elevation;
      }
      if (!max_alt || (*thisw.elevation > *max_alt)) {
        max_alt = thisw.elevation;
      }
    }

    if (thisw.heart_rate.has_value() && *thisw.heart_rate > 0) {
      pts_hrt++;
      tot_hrt += *thisw.heart_rate;
      if (!stats.max_heart_rate || (*thisw.heart_rate > *stats.max_heart_rate)) {
        stats.max_heart_rate = thisw.heart_rate;
      }
    }

    if (thisw.cadence.has_value() && *thisw.cadence > 0) {
      pts_cad++;
      tot_cad += *thisw.cadence;
    }

    if (thisw.power.has_value() && *thisw.power > 0) {
      pts_pwr++;
      tot_pwr += *thisw.power;
    }

    if (thisw.timestamp.has_value()) {
      if (!stats.start_time || (*thisw.timestamp < *stats.start_time)) {
        stats.start_time = thisw.timestamp;
      }
      if (!stats.end_time || (*thisw.timestamp > *stats.end_time)) {
        stats.end_time = thisw.timestamp;
      }
    }
  }

  ElevationChange change = track_elevation_change(points);
  double distance = track_distance(points);

  stats.point_count = static_cast<int>(points.size());
  stats.distance = qRound(distance);
  stats.duration = qRound(track_duration(points));
  stats.elevation_gain = qRound(change.gain);
  stats.elevation_loss = qRound(change.loss);
  if (max_alt) {
    stats.max_elevation = qRound(*max_alt);
  }
  if (min_alt) {
    stats.min_elevation = qRound(*min_alt);
  }
  stats.max_speed = round_speed(track_max_speed(points, opts.min_speed_interval_ms));

  stats.bounding_box = track_bounds(points);
  stats.center_lat = (stats.bounding_box.north + stats.bounding_box.south) / 2.0;
  stats.center_lng = (stats.bounding_box.east + stats.bounding_box.west) / 2.0;

  if (pts_hrt > 0) {
    stats.avg_heart_rate = qRound(tot_hrt / pts_hrt);
  }
  if (pts_cad > 0) {
    stats.avg_cadence = qRound(tot_cad / pts_cad);
  }
  if (pts_pwr > 0) {
    stats.avg_power = qRound(tot_pwr / pts_pwr);
  }

  stats_finish_derived(stats, opts.activity_type);

  gbDebug(3) << MYNAME ": " << stats.point_count << " points, distance " << distance
             << " m, duration " << stats.duration << " s, gain " << change.gain << " m";
  return stats;
}

QList<ElevationProfilePoint>
elevation_profile(const TrackPointList& points)
{
  QList<ElevationProfilePoint> profile;
  double cumulative = 0.0;
  std::optional<ElevationProfilePoint> prev;

  for (std::size_t i = 0; i < points.size(); ++i) {
    if (i > 0) {
      cumulative += gcdist_meters(points[i - 1].position(), points[i].position());
    }
    if (!points[i].elevation.has_value()) {
      continue;
    }
    ElevationProfilePoint sample;
    sample.distance = cumulative;
    sample.elevation = *points[i].elevation;
    if (prev) {
      double run = sample.distance - prev->distance;
      if (run > 0) {
        sample.grade = (sample.elevation - prev->elevation) / run * 100.0;
      }
    }
    profile.append(sample);
    prev = sample;
  }
  return profile;
}

QList<SpeedProfilePoint>
speed_profile(const TrackPointList& points)
{
  QList<SpeedProfilePoint> profile;
  double cumulative = 0.0;
  std::optional<qint64> origin;

  for (std::size_t i = 0; i < points.size(); ++i) {
    const TrackPoint& thisw = points[i];
    double dist = 0.0;
    if (i > 0) {
      dist = gcdist_meters(points[i - 1].position(), thisw.position());
      cumulative += dist;
    }
    if (thisw.timestamp && !origin) {
      origin = thisw.timestamp;
    }
    if (i == 0 || !thisw.timestamp || !points[i - 1].timestamp) {
      continue;
    }
    qint64 dt = *thisw.timestamp - *points[i - 1].timestamp;
    if (dt <= 0) {
      continue;
    }
    SpeedProfilePoint sample;
    sample.distance = cumulative;
    sample.elapsed = (*thisw.timestamp - *origin) / 1000.0;
    sample.speed = dist / (dt / 1000.0);
    profile.append(sample);
  }
  return profile;
}
