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
#ifndef TRACKFILTER_H_INCLUDED_
#define TRACKFILTER_H_INCLUDED_

#include <utility>              // for pair

#include <QList>                // for QList
#include <QString>              // for QString
#include <QStringList>          // for QStringList

#include "defs.h"               // for Activity, ActivityStats, TrackPointList
#include "journey.h"            // for JourneyRecalculator
#include "persistence.h"        // for ActivityStore, ObjectStorage
#include "smplrout.h"           // for RouteSimplifier


/*
 * trim, split, merge and remove.  Every precondition is checked before
 * the first store call; a ValidationError leaves everything untouched.
 * On success the affected journey totals are recalculated before the
 * call returns.
 */
class ActivityEditor
{
public:

  /* Types */

  struct Options {
    int min_speed_interval_ms{1000};
    RouteSimplifier::Options simplify;
  };

  /* Member Functions */

  ActivityEditor(ActivityStore& store, ObjectStorage& storage, JourneyRecalculator& recalculator,
                 const Options& opts = Options()) :
    store(store), storage(storage), recalculator(recalculator), options(opts) {}

  // Keeps points [start_index..end_index], both inclusive.
  Activity trim(const QString& activity_id, int start_index, int end_index);

  // The boundary point belongs to both halves.  Returns {first, second}.
  std::pair<Activity, Activity> split(const QString& activity_id, int split_index, const QString& new_name);

  Activity merge(const QStringList& activity_ids, const QString& merged_name, bool keep_originals);

  void remove(const QString& activity_id);

  static ActivityStats merge_stats(const QList<Activity>& ordered, const QString& activity_type);

private:

  /* Member Functions */

  Activity load(const QString& activity_id) const;
  ActivityUpdate geometry_update(const TrackPointList& points, const QString& activity_type) const;
  static bool merge_sort_cb(const Activity& a, const Activity& b);
  void remove_blob(const QString& file_ref);

  /* Data Members */

  ActivityStore& store;
  ObjectStorage& storage;
  JourneyRecalculator& recalculator;
  Options options;
};

#endif // TRACKFILTER_H_INCLUDED_
