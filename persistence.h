/*
    Collaborators that hold activities, journeys and uploaded files.

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
#ifndef PERSISTENCE_H_INCLUDED_
#define PERSISTENCE_H_INCLUDED_

#include <QByteArray>   // for QByteArray
#include <QList>        // for QList
#include <QString>      // for QString

#include "defs.h"       // for Activity, ActivityUpdate, Journey, JourneyTotals


/*
 * Entity records.  Every call is atomic with respect to every other call,
 * and reports failures, including unknown ids, as StorageError.
 */
class ActivityStore
{
public:
  ActivityStore() = default;
  virtual ~ActivityStore() = default;
  ActivityStore(const ActivityStore&) = delete;
  ActivityStore& operator=(const ActivityStore&) = delete;
  ActivityStore(ActivityStore&&) = delete;
  ActivityStore& operator=(ActivityStore&&) = delete;

  // Assigns the id, created_at and updated_at.  Returns the id.
  virtual QString create_activity(const Activity& activity) = 0;
  virtual void patch_activity(const QString& id, const ActivityUpdate& update) = 0;
  virtual Activity read_activity(const QString& id) const = 0;
  virtual void delete_activity(const QString& id) = 0;
  // In creation order.
  virtual QList<Activity> journey_activities(const QString& journey_id) const = 0;
  // Number of activities whose file_ref is ref.
  virtual int file_ref_count(const QString& ref) const = 0;

  virtual QString create_journey(const QString& name) = 0;
  virtual Journey read_journey(const QString& journey_id) const = 0;
  virtual void patch_journey(const QString& journey_id, const JourneyTotals& totals) = 0;
};

/*
 * Opaque blobs.  Bytes go to a write location and come back by the
 * reference push() returns.  Push failures are TransportError, missing
 * blobs StorageError.
 */
class ObjectStorage
{
public:
  ObjectStorage() = default;
  virtual ~ObjectStorage() = default;
  ObjectStorage(const ObjectStorage&) = delete;
  ObjectStorage& operator=(const ObjectStorage&) = delete;
  ObjectStorage(ObjectStorage&&) = delete;
  ObjectStorage& operator=(ObjectStorage&&) = delete;

  virtual QString upload_location() = 0;
  virtual QString push(const QString& location, const QByteArray& bytes, const QString& content_type) = 0;
  virtual QByteArray read(const QString& ref) const = 0;
  virtual void remove(const QString& ref) = 0;
};

#endif // PERSISTENCE_H_INCLUDED_
