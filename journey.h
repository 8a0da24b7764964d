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
#ifndef JOURNEY_H_INCLUDED_
#define JOURNEY_H_INCLUDED_

#include <QList>          // for QList
#include <QMutex>         // for QMutex
#include <QString>        // for QString

#include "defs.h"         // for Activity, JourneyTotals
#include "persistence.h"  // for ActivityStore


class JourneyRecalculator
{
public:
  explicit JourneyRecalculator(ActivityStore& store) : store_(store) {}

  /*
   * Full recompute over the journey's completed activities, written
   * back in one patch.  Nothing is incremental, so running it again
   * converges on the same totals.  The read and the patch happen under
   * one lock, so a stale snapshot is never written after a newer one.
   */
  JourneyTotals recalculate(const QString& journey_id);

  static JourneyTotals totals_of(const QList<Activity>& activities);

private:
  ActivityStore& store_;
  QMutex mutex_;
};

#endif // JOURNEY_H_INCLUDED_
