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
#ifndef TEST_EDIT_H_INCLUDED_
#define TEST_EDIT_H_INCLUDED_

#include <memory>           // for unique_ptr

#include <QObject>          // for QObject, Q_OBJECT, slots
#include <QString>          // for QString
#include <QStringList>      // for QStringList
#include <QtGlobal>         // for qint64

#include "journey.h"        // for JourneyRecalculator
#include "memstore.h"       // for MemoryStore, MemoryObjectStorage
#include "trackfilter.h"    // for ActivityEditor


class EditTest : public QObject
{
  Q_OBJECT

private:
  /* Member Functions */

  // don't declare these slots so they won't be run as tests.
  QString add_activity(const QString& name, int count, qint64 start_ms, double lon0,
                       const QStringList& tags = QStringList(), const QString& notes = QString());
  QString add_blob();

private slots:
  /* Member Functions */

  void init();
  void cleanup();

  void trim_keeps_inclusive_range();
  void trim_rejects_bad_ranges();
  void split_shares_the_boundary_point();
  void split_rejects_bad_input();
  void merge_orders_by_start_time();
  void merge_keeps_originals_on_request();
  void merge_rejects_bad_input();
  void merge_stats_weight_sensor_averages();
  void remove_keeps_shared_files();

private:
  /* Data Members */

  std::unique_ptr<MemoryStore> store;
  std::unique_ptr<MemoryObjectStorage> storage;
  std::unique_ptr<JourneyRecalculator> recalculator;
  std::unique_ptr<ActivityEditor> editor;
  QString journey;
};

#endif // TEST_EDIT_H_INCLUDED_
