/*

    Activity edit operations
    Copyright (c) 2009 - 2013 Robert Lipe, robertlipe+source@gpsbabel.org
    Copyright (C) 2005-2006 Olaf Klein, o.b.klein@gpsbabel.org

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

#include <algorithm>                       // for max, min, stable_sort
#include <cstddef>                         // for size_t
#include <utility>                         // for move, pair

#include <QList>                           // for QList
#include <QSet>                            // for QSet
#include <QString>                         // for QString
#include <QStringList>                     // for QStringList
#include <QtGlobal>                        // for qint64

#include "defs.h"
#include "trackfilter.h"

#include "geojson.h"                       // for GeoJson
#include "smplrout.h"                      // for RouteSimplifier
#include "src/core/logging.h"              // for gbDebug, Warning
#include "trackstats.h"                    // for activity_recompute, stats_finish_derived


#define MYNAME "edit"

/*******************************************************************************
* helpers
*******************************************************************************/

Activity
ActivityEditor::load(const QString& activity_id) const
{
  try {
    return store.read_activity(activity_id);
  } catch (const StorageError& e) {
    throw ValidationError(QStringLiteral(MYNAME ": unknown activity %1 (%2)").arg(activity_id, QString::fromUtf8(e.what())));
  }
}

ActivityUpdate
ActivityEditor::geometry_update(const TrackPointList& points, const QString& activity_type) const
{
  StatsOptions stats_opts;
  stats_opts.min_speed_interval_ms = options.min_speed_interval_ms;
  stats_opts.activity_type = activity_type;

  ActivityUpdate update;
  update.stats = activity_recompute(points, stats_opts);
  update.render_geometry = GeoJson::write_geometry(RouteSimplifier(options.simplify).simplify_for_render(points));
  update.points = points;
  if (update.stats->start_time) {
    update.activity_date = *update.stats->start_time;
  }
  return update;
}

/*
 * Activities with a start time order by it.  The others fall back to
 * their activity date.  Ties keep the caller's order.
 */
bool
ActivityEditor::merge_sort_cb(const Activity& a, const Activity& b)
{
  const qint64 ta = a.stats.start_time.value_or(a.activity_date);
  const qint64 tb = b.stats.start_time.value_or(b.activity_date);
  return ta < tb;
}

void
ActivityEditor::remove_blob(const QString& file_ref)
{
  if (file_ref.isEmpty()) {
    return;
  }
  int refs = store.file_ref_count(file_ref);
  if (refs > 0) {
    gbDebug(2) << MYNAME ": keeping " << file_ref << ", still referenced " << refs << " time(s)";
    return;
  }
  try {
    storage.remove(file_ref);
  } catch (const StorageError& e) {
    // The record is already gone.
    Warning() << MYNAME ": could not remove stored file" << file_ref << ":" << e.what();
  }
}

/*******************************************************************************
* the edit operations
*******************************************************************************/

Activity
ActivityEditor::trim(const QString& activity_id, int start_index, int end_index)
{
  Activity activity = load(activity_id);
  const int count = static_cast<int>(activity.points.size());

  if (start_index < 0 || start_index >= end_index || end_index > count - 1) {
    throw ValidationError(QStringLiteral(MYNAME ": invalid trim range %1..%2 for %3 points")
                          .arg(start_index).arg(end_index).arg(count));
  }

  TrackPointList trimmed(activity.points.begin() + start_index,
                         activity.points.begin() + end_index + 1);
  ActivityUpdate update = geometry_update(trimmed, activity.activity_type);
  store.patch_activity(activity_id, update);

  gbDebug(1) << MYNAME "-trim: " << activity_id << " kept " << trimmed.size()
             << " of " << count << " points";

  recalculator.recalculate(activity.journey_id);
  return store.read_activity(activity_id);
}

std::pair<Activity, Activity>
ActivityEditor::split(const QString& activity_id, int split_index, const QString& new_name)
{
  Activity activity = load(activity_id);
  const int count = static_cast<int>(activity.points.size());

  if (split_index < 0 || split_index >= count - 1) {
    throw ValidationError(QStringLiteral(MYNAME ": invalid split index %1 for %2 points")
                          .arg(split_index).arg(count));
  }
  if (new_name.trimmed().isEmpty()) {
    throw ValidationError(MYNAME ": the second part of a split needs a name");
  }

  TrackPointList first(activity.points.begin(), activity.points.begin() + split_index + 1);
  TrackPointList second(activity.points.begin() + split_index, activity.points.end());

  ActivityUpdate first_update = geometry_update(first, activity.activity_type);
  ActivityUpdate second_update = geometry_update(second, activity.activity_type);

  Activity part;
  part.journey_id = activity.journey_id;
  part.name = new_name.trimmed();
  part.description = activity.description;
  part.activity_type = activity.activity_type;
  part.original_file_name = activity.original_file_name;
  part.file_ref = activity.file_ref;
  part.color = activity.color;
  part.notes = activity.notes;
  part.tags = activity.tags;
  part.activity_date = activity.activity_date;
  part.status = processing_status::completed;
  second_update.apply_to(part);

  // A failed patch of the original deletes the new part again.
  QString part_id = store.create_activity(part);
  try {
    store.patch_activity(activity_id, first_update);
  } catch (const StorageError&) {
    store.delete_activity(part_id);
    throw;
  }

  gbDebug(1) << MYNAME "-split: " << activity_id << " at " << split_index << " into "
             << first.size() << " + " << second.size() << " points, new part " << part_id;

  recalculator.recalculate(activity.journey_id);
  return {store.read_activity(activity_id), store.read_activity(part_id)};
}

ActivityStats
ActivityEditor::merge_stats(const QList<Activity>& ordered, const QString& activity_type)
{
  ActivityStats stats;
  bool have_bounds = false;
  int pts_hrt = 0;
  double tot_hrt = 0.0;
  int pts_cad = 0;
  double tot_cad = 0.0;
  int pts_pwr = 0;
  double tot_pwr = 0.0;

  for (const auto& activity : ordered) {
    const ActivityStats& s = activity.stats;
    stats.distance += s.distance;
    stats.duration += s.duration;
    stats.elevation_gain += s.elevation_gain;
    stats.elevation_loss += s.elevation_loss;
    stats.point_count += static_cast<int>(activity.points.size());
    stats.max_speed = std::max(stats.max_speed, s.max_speed);

    if (s.max_elevation && (!stats.max_elevation || *s.max_elevation > *stats.max_elevation)) {
      stats.max_elevation = s.max_elevation;
    }
    if (s.min_elevation && (!stats.min_elevation || *s.min_elevation < *stats.min_elevation)) {
      stats.min_elevation = s.min_elevation;
    }
    if (s.start_time && (!stats.start_time || *s.start_time < *stats.start_time)) {
      stats.start_time = s.start_time;
    }
    if (s.end_time && (!stats.end_time || *s.end_time > *stats.end_time)) {
      stats.end_time = s.end_time;
    }

    if (s.point_count > 0) {
      if (!have_bounds) {
        stats.bounding_box = s.bounding_box;
        have_bounds = true;
      } else {
        stats.bounding_box.north = std::max(stats.bounding_box.north, s.bounding_box.north);
        stats.bounding_box.south = std::min(stats.bounding_box.south, s.bounding_box.south);
        stats.bounding_box.east = std::max(stats.bounding_box.east, s.bounding_box.east);
        stats.bounding_box.west = std::min(stats.bounding_box.west, s.bounding_box.west);
      }
    }

    // Sensor averages are weighted by the number of samples behind them.
    if (s.avg_heart_rate) {
      pts_hrt += s.point_count;
      tot_hrt += static_cast<double>(*s.avg_heart_rate) * s.point_count;
    }
    if (s.max_heart_rate && (!stats.max_heart_rate || *s.max_heart_rate > *stats.max_heart_rate)) {
      stats.max_heart_rate = s.max_heart_rate;
    }
    if (s.avg_cadence) {
      pts_cad += s.point_count;
      tot_cad += static_cast<double>(*s.avg_cadence) * s.point_count;
    }
    if (s.avg_power) {
      pts_pwr += s.point_count;
      tot_pwr += static_cast<double>(*s.avg_power) * s.point_count;
    }
  }

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

  stats_finish_derived(stats, activity_type);
  return stats;
}

Activity
ActivityEditor::merge(const QStringList& activity_ids, const QString& merged_name, bool keep_originals)
{
  if (activity_ids.size() < 2) {
    throw ValidationError(QStringLiteral(MYNAME ": merge needs at least 2 activities, got %1")
                          .arg(activity_ids.size()));
  }

  QSet<QString> seen;
  QList<Activity> sources;
  for (const auto& id : activity_ids) {
    if (seen.contains(id)) {
      throw ValidationError(QStringLiteral(MYNAME ": activity %1 listed twice in merge").arg(id));
    }
    seen.insert(id);
    sources.append(load(id));
  }

  const QString journey_id = sources.first().journey_id;
  for (const auto& activity : std::as_const(sources)) {
    if (activity.journey_id != journey_id) {
      throw ValidationError(QStringLiteral(MYNAME ": cannot merge across journeys (%1 is in %2, expected %3)")
                            .arg(activity.id, activity.journey_id, journey_id));
    }
  }

  QList<Activity> ordered = sources;
  std::stable_sort(ordered.begin(), ordered.end(), merge_sort_cb);
  const Activity& earliest = ordered.first();

  Activity merged;
  merged.journey_id = journey_id;
  merged.name = merged_name.trimmed().isEmpty() ? earliest.name : merged_name.trimmed();
  merged.description = QStringLiteral("Merged from %1 activities").arg(ordered.size());
  merged.activity_type = earliest.activity_type;
  merged.color = earliest.color;
  merged.status = processing_status::completed;

  QStringList notes;
  std::size_t total_points = 0;
  for (const auto& activity : std::as_const(ordered)) {
    total_points += activity.points.size();
    if (!activity.notes.trimmed().isEmpty()) {
      notes.append(activity.notes);
    }
    for (const auto& tag : activity.tags) {
      if (!merged.tags.contains(tag)) {
        merged.tags.append(tag);
      }
    }
  }
  merged.notes = notes.join(QStringLiteral("\n\n"));

  merged.points.reserve(total_points);
  for (const auto& activity : std::as_const(ordered)) {
    merged.points.insert(merged.points.end(), activity.points.begin(), activity.points.end());
  }

  merged.stats = merge_stats(ordered, merged.activity_type);
  merged.activity_date = merged.stats.start_time.value_or(earliest.activity_date);
  merged.render_geometry = GeoJson::write_geometry(RouteSimplifier(options.simplify).simplify_for_render(merged.points));

  QString merged_id = store.create_activity(merged);

  if (!keep_originals) {
    for (const auto& activity : std::as_const(sources)) {
      store.delete_activity(activity.id);
      remove_blob(activity.file_ref);
    }
  }

  gbDebug(1) << MYNAME "-merge: " << ordered.size() << " activities, " << merged.points.size()
             << " points into " << merged_id << (keep_originals ? ", originals kept" : "");

  recalculator.recalculate(journey_id);
  return store.read_activity(merged_id);
}

void
ActivityEditor::remove(const QString& activity_id)
{
  Activity activity = load(activity_id);

  store.delete_activity(activity_id);
  remove_blob(activity.file_ref);

  gbDebug(1) << MYNAME "-remove: " << activity_id;

  recalculator.recalculate(activity.journey_id);
}
