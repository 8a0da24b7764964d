/*
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

#include "test_geometry.h"

#include <algorithm>            // for find
#include <cmath>                // for fabs, round
#include <optional>             // for optional, nullopt

#include <QJsonArray>           // for QJsonArray
#include <QJsonDocument>        // for QJsonDocument
#include <QJsonObject>          // for QJsonObject
#include <QJsonValue>           // for QJsonValue
#include <QString>              // for QString
#include <QtTest>               // for QVERIFY, QCOMPARE, QTEST_GUILESS_MAIN

#include "defs.h"               // for TrackPoint, TrackPointList
#include "geojson.h"            // for GeoJson
#include "smplrout.h"           // for RouteSimplifier
#include "trackstats.h"         // for activity_recompute, track_distance


namespace
{

TrackPoint
pt(double lat, double lon, std::optional<double> ele = std::nullopt, std::optional<qint64> ms = std::nullopt)
{
  TrackPoint p;
  p.latitude = lat;
  p.longitude = lon;
  p.elevation = ele;
  p.timestamp = ms;
  return p;
}

bool
within(double value, double expected, double fraction)
{
  return std::fabs(value - expected) <= std::fabs(expected) * fraction;
}

// Heads east along the equator with a kink every third point.
TrackPointList
zigzag(int count)
{
  TrackPointList points;
  for (int i = 0; i < count; ++i) {
    double lat = (i % 3 == 1) ? 0.002 : 0.0;
    points.push_back(pt(lat, i * 0.001, 100.0 + i, 1600000000000LL + i * 10000LL));
  }
  return points;
}

} // namespace

void GeometryTest::two_point_distance()
{
  TrackPointList points = {pt(0, 0), pt(0, 0.001)};
  QVERIFY(within(track_distance(points), 111.2, 0.01));
  QCOMPARE(activity_recompute(points).distance, 111);
}

void GeometryTest::three_point_distance()
{
  TrackPointList points = {pt(0, 0), pt(0, 0.001), pt(0, 0.002)};
  double full = track_distance(points);
  QVERIFY(within(full, 222.4, 0.01));
  QCOMPARE(track_distance(RouteSimplifier::simplify(points, 0)), full);
}

void GeometryTest::short_tracks_yield_zeros()
{
  ActivityStats none = activity_recompute({});
  QCOMPARE(none.distance, 0);
  QCOMPARE(none.duration, 0);
  QCOMPARE(none.point_count, 0);
  QVERIFY(!none.start_time.has_value());

  ActivityStats one = activity_recompute({pt(47.5, 8.5, 400.0, 1600000000000LL)});
  QCOMPARE(one.distance, 0);
  QCOMPARE(one.duration, 0);
  QCOMPARE(one.point_count, 1);
  QCOMPARE(one.avg_speed, 0.0f);
  QCOMPARE(one.estimated_calories, 0);
  QCOMPARE(one.center_lat, 47.5);
  QCOMPARE(one.center_lng, 8.5);
}

void GeometryTest::bounds_and_center()
{
  TrackPointList points = {pt(10, 20), pt(12, 26), pt(11, 21)};
  ActivityStats stats = activity_recompute(points);
  QCOMPARE(stats.bounding_box.north, 12.0);
  QCOMPARE(stats.bounding_box.south, 10.0);
  QCOMPARE(stats.bounding_box.east, 26.0);
  QCOMPARE(stats.bounding_box.west, 20.0);
  QCOMPARE(stats.center_lat, 11.0);
  QCOMPARE(stats.center_lng, 23.0);
}

void GeometryTest::elevation_gain_and_loss()
{
  // The point without an elevation is skipped, not read as sea level.
  TrackPointList points = {
    pt(0, 0.000, 100.0), pt(0, 0.001, 130.0), pt(0, 0.002),
    pt(0, 0.003, 110.0), pt(0, 0.004, 125.4)
  };
  ActivityStats stats = activity_recompute(points);
  QCOMPARE(stats.elevation_gain, 45);
  QCOMPARE(stats.elevation_loss, 20);
  QCOMPARE(stats.max_elevation, std::optional<int>(130));
  QCOMPARE(stats.min_elevation, std::optional<int>(100));
}

void GeometryTest::duration_in_seconds()
{
  TrackPointList points = {
    pt(0, 0.000, {}, 1600000000000LL),
    pt(0, 0.001),
    pt(0, 0.002, {}, 1600000125400LL)
  };
  ActivityStats stats = activity_recompute(points);
  QCOMPARE(stats.duration, 125);
  QCOMPARE(stats.start_time, std::optional<qint64>(1600000000000LL));
  QCOMPARE(stats.end_time, std::optional<qint64>(1600000125400LL));

  // Time running backwards is no duration at all.
  TrackPointList backwards = {pt(0, 0, {}, 1600000100000LL), pt(0, 0.001, {}, 1600000000000LL)};
  QCOMPARE(activity_recompute(backwards).duration, 0);
}

void GeometryTest::max_speed_skips_short_intervals()
{
  // 111 m in 10 s, then 111 m in 0.5 s which is ignored.
  TrackPointList points = {
    pt(0, 0.000, {}, 1600000000000LL),
    pt(0, 0.001, {}, 1600000010000LL),
    pt(0, 0.002, {}, 1600000010500LL)
  };
  QVERIFY(within(track_max_speed(points, 1000), 11.12, 0.01));
  QVERIFY(track_max_speed(points, 100) > 200.0);

  ActivityStats stats = activity_recompute(points);
  QVERIFY(within(stats.max_speed, 11.12, 0.01));
  // avg_speed = distance / duration, rounded to two decimals.
  QCOMPARE(stats.duration, 11);
  QCOMPARE(stats.avg_speed, static_cast<float>(std::round(stats.distance / 11.0 * 100.0) / 100.0));
}

void GeometryTest::max_speed_falls_back_on_recorded_speed()
{
  TrackPointList points = {pt(0, 0), pt(0, 0.001)};
  points[0].speed = 3.2;
  points[1].speed = 4.75;
  QCOMPARE(activity_recompute(points).max_speed, 4.75f);
}

void GeometryTest::sensor_averages()
{
  TrackPointList points = {pt(0, 0), pt(0, 0.001), pt(0, 0.002)};
  points[0].heart_rate = 120;
  points[1].heart_rate = 150;
  points[2].heart_rate = 0;   // a dropout, not a reading
  points[0].cadence = 80;
  points[2].power = 200.0;
  ActivityStats stats = activity_recompute(points);
  QCOMPARE(stats.avg_heart_rate, std::optional<int>(135));
  QCOMPARE(stats.max_heart_rate, std::optional<int>(150));
  QCOMPARE(stats.avg_cadence, std::optional<int>(80));
  QCOMPARE(stats.avg_power, std::optional<int>(200));
}

void GeometryTest::calories_scale_with_speed_and_climb()
{
  // One hour at the reference running speed: 9.8 MET * 70 kg.
  QCOMPARE(estimate_calories("running", 2.8, 3600, 0), 686);
  // Twice the speed is capped at twice the MET.
  QCOMPARE(estimate_calories("running", 10.0, 3600, 0), 1372);
  // Unknown activities use 4 MET and climbing adds work against gravity.
  QCOMPARE(estimate_calories("yoga", 0, 3600, 0), 280);
  QCOMPARE(estimate_calories("yoga", 0, 3600, 100), 280 + 66);
  QCOMPARE(estimate_calories("running", 2.8, 0, 500), 0);
}

void GeometryTest::simplify_keeps_endpoints()
{
  TrackPointList points = zigzag(31);
  for (double tolerance : {0.0, 1.0, 50.0, 500.0, 1.0e7}) {
    TrackPointList simple = RouteSimplifier::simplify(points, tolerance);
    QVERIFY(simple.size() >= 2);
    QCOMPARE(simple.front(), points.front());
    QCOMPARE(simple.back(), points.back());
    // Order is preserved.
    for (std::size_t i = 1; i < simple.size(); ++i) {
      QVERIFY(*simple[i - 1].timestamp < *simple[i].timestamp);
    }
  }
  QCOMPARE(RouteSimplifier::simplify(points, 1.0e7).size(), std::size_t(2));
}

void GeometryTest::simplify_zero_tolerance_only_drops_duplicates()
{
  // Collinear points survive a zero tolerance; exact repeats do not.
  TrackPointList points = {pt(0, 0, 1.0, 1000), pt(0, 0.001, 1.0, 2000), pt(0, 0.001, 1.0, 2000),
                           pt(0, 0.002, 1.0, 3000), pt(0, 0.002, 1.0, 4000)
                          };
  TrackPointList simple = RouteSimplifier::simplify(points, 0);
  QCOMPARE(simple.size(), std::size_t(4));
  QCOMPARE(simple[1], points[1]);
  QCOMPARE(simple[2], points[3]);
  QCOMPARE(simple[3], points[4]);
}

void GeometryTest::simplify_removes_collinear_points()
{
  TrackPointList points;
  for (int i = 0; i <= 20; ++i) {
    points.push_back(pt(0, i * 0.0005));
  }
  TrackPointList simple = RouteSimplifier::simplify(points, 1.0);
  QCOMPARE(simple.size(), std::size_t(2));

  // A 222 m detour is well above an 11 m tolerance.
  points[10].latitude = 0.002;
  simple = RouteSimplifier::simplify(points, 11.0);
  QVERIFY(simple.size() > 2);
  QVERIFY(std::find(simple.begin(), simple.end(), points[10]) != simple.end());
}

void GeometryTest::render_geometry_is_capped()
{
  RouteSimplifier::Options opts;
  opts.tolerance_m = 0;
  opts.max_points = 50;
  opts.smooth_elevation = false;
  TrackPointList points = zigzag(400);
  TrackPointList render = RouteSimplifier(opts).simplify_for_render(points);
  QCOMPARE(render.size(), std::size_t(50));
  QCOMPARE(render.front(), points.front());
  QCOMPARE(render.back(), points.back());
}

void GeometryTest::render_geometry_leaves_short_tracks()
{
  RouteSimplifier::Options opts;
  opts.tolerance_m = 1.0e7;
  TrackPointList points = zigzag(10);
  QCOMPARE(RouteSimplifier(opts).simplify_for_render(points), points);

  // Smoothing only touches the render copy.
  opts.min_points = 2;
  opts.tolerance_m = 0;
  TrackPointList spiky = {pt(0, 0, 0.0), pt(0, 0.001, 0.0), pt(0, 0.002, 100.0), pt(0, 0.003, 0.0), pt(0, 0.004, 0.0)};
  TrackPointList render = RouteSimplifier(opts).simplify_for_render(spiky);
  QCOMPARE(render.size(), spiky.size());
  QCOMPARE(*render[2].elevation, 20.0);
  QCOMPARE(*spiky[2].elevation, 100.0);
}

void GeometryTest::stats_ignore_simplification()
{
  TrackPointList points = zigzag(61);
  ActivityStats before = activity_recompute(points);
  RouteSimplifier::Options opts;
  opts.tolerance_m = 1000;
  opts.min_points = 0;
  TrackPointList render = RouteSimplifier(opts).simplify_for_render(points);
  QVERIFY(render.size() < points.size());
  QCOMPARE(activity_recompute(points), before);
  QVERIFY(activity_recompute(render).distance < before.distance);
}

void GeometryTest::geojson_linestring_and_point()
{
  TrackPointList points = {pt(47.1234567, 8.7654321, 432.16), pt(47.2, 8.8)};
  QString text = GeoJson::write_geometry(points);
  QJsonObject geometry = QJsonDocument::fromJson(text.toUtf8()).object();
  QCOMPARE(geometry.value("type").toString(), QString("LineString"));

  const QJsonArray coordinates = geometry.value("coordinates").toArray();
  QCOMPARE(coordinates.size(), 2);
  const QJsonArray first = coordinates.at(0).toArray();
  QCOMPARE(first.size(), 3);
  QCOMPARE(first.at(0).toDouble(), 8.765432);
  QCOMPARE(first.at(1).toDouble(), 47.123457);
  QCOMPARE(first.at(2).toDouble(), 432.2);
  QCOMPARE(coordinates.at(1).toArray().size(), 2);

  QString single = GeoJson::write_geometry({pt(1, 2)});
  QCOMPARE(QJsonDocument::fromJson(single.toUtf8()).object().value("type").toString(), QString("Point"));
  QVERIFY(GeoJson::write_geometry({}).isEmpty());
}

void GeometryTest::elevation_profile_grades()
{
  TrackPointList points = {pt(0, 0, 100.0), pt(0, 0.001), pt(0, 0.002, 111.12)};
  QList<ElevationProfilePoint> profile = elevation_profile(points);
  QCOMPARE(profile.size(), 2);
  QCOMPARE(profile[0].grade, 0.0);
  QVERIFY(within(profile[1].distance, 222.4, 0.01));
  QVERIFY(within(profile[1].grade, 5.0, 0.01));
}

void GeometryTest::speed_profile_segments()
{
  TrackPointList points = {
    pt(0, 0.000, {}, 1600000000000LL),
    pt(0, 0.001, {}, 1600000010000LL),
    pt(0, 0.002, {}, 1600000010000LL),
    pt(0, 0.003, {}, 1600000030000LL)
  };
  QList<SpeedProfilePoint> profile = speed_profile(points);
  QCOMPARE(profile.size(), 2);
  QCOMPARE(profile[0].elapsed, 10.0);
  QVERIFY(within(profile[0].speed, 11.12, 0.01));
  QCOMPARE(profile[1].elapsed, 30.0);
  QVERIFY(within(profile[1].distance, 333.6, 0.01));
}

QTEST_GUILESS_MAIN(GeometryTest)
