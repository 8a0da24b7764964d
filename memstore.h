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
#ifndef MEMSTORE_H_INCLUDED_
#define MEMSTORE_H_INCLUDED_

#include <QByteArray>     // for QByteArray
#include <QHash>          // for QHash
#include <QList>          // for QList
#include <QMutex>         // for QMutex
#include <QSet>           // for QSet
#include <QString>        // for QString
#include <QStringList>    // for QStringList

#include "defs.h"         // for Activity, ActivityUpdate, Journey, JourneyTotals
#include "persistence.h"  // for ActivityStore, ObjectStorage


class MemoryStore : public ActivityStore
{
public:
  /* Member Functions */

  QString create_activity(const Activity& activity) override;
  void patch_activity(const QString& id, const ActivityUpdate& update) override;
  Activity read_activity(const QString& id) const override;
  void delete_activity(const QString& id) override;
  QList<Activity> journey_activities(const QString& journey_id) const override;
  int file_ref_count(const QString& ref) const override;

  QString create_journey(const QString& name) override;
  Journey read_journey(const QString& journey_id) const override;
  void patch_journey(const QString& journey_id, const JourneyTotals& totals) override;

  bool contains(const QString& id) const;
  int activity_count() const;

private:
  /* Data Members */

  mutable QMutex mutex;
  int next_activity{1};
  int next_journey{1};
  QHash<QString, Activity> activities;
  QStringList activity_order;
  QHash<QString, Journey> journeys;
};

class MemoryObjectStorage : public ObjectStorage
{
public:
  /* Member Functions */

  QString upload_location() override;
  QString push(const QString& location, const QByteArray& bytes, const QString& content_type) override;
  QByteArray read(const QString& ref) const override;
  void remove(const QString& ref) override;

  // Make the nth push (counting from 1) throw TransportError.
  void fail_push(int nth);
  bool contains(const QString& ref) const;
  int blob_count() const;

private:
  /* Types */

  struct blob_t {
    QByteArray bytes;
    QString content_type;
  };

  /* Data Members */

  mutable QMutex mutex;
  int next_location{1};
  int next_blob{1};
  int push_count{0};
  QSet<int> failing_pushes;
  QSet<QString> open_locations;
  QHash<QString, blob_t> blobs;
};

#endif // MEMSTORE_H_INCLUDED_
