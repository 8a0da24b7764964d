/*
    Journey totals, rolled up from the journey's activities.

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

#include "journey.h"

#include <QList>               // for QList
#include <QMutexLocker>        // for QMutexLocker
#include <QString>             // for QString

#include "defs.h"              // for Activity, JourneyTotals, processing_status
#include "src/core/logging.h"  // for gbDebug


#define MYNAME "journey"

JourneyTotals
JourneyRecalculator::totals_of(const QList<Activity>& activities)
{
  JourneyTotals totals;
  for (const auto& activity : activities) {
    if (activity.status != processing_status::completed) {
      continue;
    }
    totals.total_distance += activity.stats.distance;
    totals.total_elevation_gain += activity.stats.elevation_gain;
    totals.total_duration += activity.stats.duration;
    totals.activity_count++;
    if (!totals.last_activity_date || activity.activity_date > *totals.last_activity_date) {
      totals.last_activity_date = activity.activity_date;
    }
  }
  return totals;
}

JourneyTotals
JourneyRecalculator::recalculate(const QString& journey_id)
{
  QMutexLocker locker(&mutex_);
  JourneyTotals totals = totals_of(store_.journey_activities(journey_id));
  store_.patch_journey(journey_id, totals);
  gbDebug(1) << MYNAME ": " << journey_id << " has " << totals.activity_count
             << " activities, " << totals.total_distance << " m";
  return totals;
}
