/*
    In-memory activity store and object storage.

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

#include "memstore.h"

#include <QByteArray>          // for QByteArray
#include <QList>               // for QList
#include <QMutexLocker>        // for QMutexLocker
#include <QString>             // for QString, QStringLiteral

#include "defs.h"              // for StorageError, TransportError, current_time_ms
#include "src/core/logging.h"  // for gbDebug


#define MYNAME "store"

/*******************************************************************************
* MemoryStore
*******************************************************************************/

QString
MemoryStore::create_activity(const Activity& activity)
{
  QMutexLocker locker(&mutex);
  if (!journeys.contains(activity.journey_id)) {
    throw StorageError(QStringLiteral(MYNAME ": unknown journey %1").arg(activity.journey_id));
  }

  Activity record = activity;
  record.id = QStringLiteral("activity-%1").arg(next_activity++);
  record.created_at = current_time_ms();
  record.updated_at = record.created_at;
  activities.insert(record.id, record);
  activity_order.append(record.id);
  gbDebug(3) << MYNAME ": created " << record.id << " in " << record.journey_id;
  return record.id;
}

void
MemoryStore::patch_activity(const QString& id, const ActivityUpdate& update)
{
  QMutexLocker locker(&mutex);
  auto it = activities.find(id);
  if (it == activities.end()) {
    throw StorageError(QStringLiteral(MYNAME ": unknown activity %1").arg(id));
  }
  update.apply_to(*it);
  it->updated_at = current_time_ms();
}

Activity
MemoryStore::read_activity(const QString& id) const
{
  QMutexLocker locker(&mutex);
  auto it = activities.constFind(id);
  if (it == activities.cend()) {
    throw StorageError(QStringLiteral(MYNAME ": unknown activity %1").arg(id));
  }
  return *it;
}

void
MemoryStore::delete_activity(const QString& id)
{
  QMutexLocker locker(&mutex);
  if (activities.remove(id) == 0) {
    throw StorageError(QStringLiteral(MYNAME ": unknown activity %1").arg(id));
  }
  activity_order.removeOne(id);
  gbDebug(3) << MYNAME ": deleted " << id;
}

QList<Activity>
MemoryStore::journey_activities(const QString& journey_id) const
{
  QMutexLocker locker(&mutex);
  if (!journeys.contains(journey_id)) {
    throw StorageError(QStringLiteral(MYNAME ": unknown journey %1").arg(journey_id));
  }

  QList<Activity> result;
  for (const auto& id : activity_order) {
    const Activity activity = activities.value(id);
    if (activity.journey_id == journey_id) {
      result.append(activity);
    }
  }
  return result;
}

int
MemoryStore::file_ref_count(const QString& ref) const
{
  QMutexLocker locker(&mutex);
  int count = 0;
  for (const auto& activity : activities) {
    if (!ref.isEmpty() && activity.file_ref == ref) {
      ++count;
    }
  }
  return count;
}

QString
MemoryStore::create_journey(const QString& name)
{
  QMutexLocker locker(&mutex);
  Journey journey;
  journey.id = QStringLiteral("journey-%1").arg(next_journey++);
  journey.name = name;
  journeys.insert(journey.id, journey);
  return journey.id;
}

Journey
MemoryStore::read_journey(const QString& journey_id) const
{
  QMutexLocker locker(&mutex);
  auto it = journeys.constFind(journey_id);
  if (it == journeys.cend()) {
    throw StorageError(QStringLiteral(MYNAME ": unknown journey %1").arg(journey_id));
  }
  return *it;
}

void
MemoryStore::patch_journey(const QString& journey_id, const JourneyTotals& totals)
{
  QMutexLocker locker(&mutex);
  auto it = journeys.find(journey_id);
  if (it == journeys.end()) {
    throw StorageError(QStringLiteral(MYNAME ": unknown journey %1").arg(journey_id));
  }
  it->totals = totals;
}

bool
MemoryStore::contains(const QString& id) const
{
  QMutexLocker locker(&mutex);
  return activities.contains(id);
}

int
MemoryStore::activity_count() const
{
  QMutexLocker locker(&mutex);
  return activities.size();
}

/*******************************************************************************
* MemoryObjectStorage
*******************************************************************************/

QString
MemoryObjectStorage::upload_location()
{
  QMutexLocker locker(&mutex);
  QString location = QStringLiteral("mem://upload/%1").arg(next_location++);
  open_locations.insert(location);
  return location;
}

QString
MemoryObjectStorage::push(const QString& location, const QByteArray& bytes, const QString& content_type)
{
  QMutexLocker locker(&mutex);
  ++push_count;
  if (failing_pushes.contains(push_count)) {
    throw TransportError(QStringLiteral(MYNAME ": push %1 to %2 failed").arg(push_count).arg(location));
  }
  if (!open_locations.remove(location)) {
    throw TransportError(QStringLiteral(MYNAME ": %1 is not an open upload location").arg(location));
  }

  QString ref = QStringLiteral("blob-%1").arg(next_blob++);
  blobs.insert(ref, {bytes, content_type});
  gbDebug(3) << MYNAME ": stored " << bytes.size() << " bytes as " << ref;
  return ref;
}

QByteArray
MemoryObjectStorage::read(const QString& ref) const
{
  QMutexLocker locker(&mutex);
  auto it = blobs.constFind(ref);
  if (it == blobs.cend()) {
    throw StorageError(QStringLiteral(MYNAME ": no blob %1").arg(ref));
  }
  return it->bytes;
}

void
MemoryObjectStorage::remove(const QString& ref)
{
  QMutexLocker locker(&mutex);
  if (blobs.remove(ref) == 0) {
    throw StorageError(QStringLiteral(MYNAME ": no blob %1").arg(ref));
  }
}

void
MemoryObjectStorage::fail_push(int nth)
{
  QMutexLocker locker(&mutex);
  failing_pushes.insert(nth);
}

bool
MemoryObjectStorage::contains(const QString& ref) const
{
  QMutexLocker locker(&mutex);
  return blobs.contains(ref);
}

int
MemoryObjectStorage::blob_count() const
{
  QMutexLocker locker(&mutex);
  return blobs.size();
}
