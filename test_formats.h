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
#ifndef TEST_FORMATS_H_INCLUDED_
#define TEST_FORMATS_H_INCLUDED_

#include <QObject>  // for QObject, Q_OBJECT, slots


class FormatsTest : public QObject
{
  Q_OBJECT

private slots:
  /* Member Functions */

  void gpx_track_with_extensions();
  void gpx_falls_back_to_route_then_waypoints();
  void gpx_drops_out_of_range_points();
  void tcx_activity();
  void tcx_course_name();
  void kml_linestring_with_timespan();
  void kml_reversed_timespan_is_ignored();
  void kml_gx_track();
  void kml_track_count_mismatch();
  void kml_point_only();
  void kmz_archive();
  void kmz_without_kml_entry();
  void fit_records();
  void fit_sports_map_to_activity_types();
  void fit_compressed_timestamps();
  void fit_bad_crc();
  void fit_truncated();
  void fit_without_positions();
  void sniff_content();
  void hints_pick_the_reader();
  void unusable_input();
};

#endif // TEST_FORMATS_H_INCLUDED_
