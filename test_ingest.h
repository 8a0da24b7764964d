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
#ifndef TEST_INGEST_H_INCLUDED_
#define TEST_INGEST_H_INCLUDED_

#include <memory>         // for unique_ptr

#include <QByteArray>     // for QByteArray
#include <QObject>        // for QObject, Q_OBJECT, slots
#include <QString>        // for QString

#include "ingest.h"       // for IngestRequest, IngestResult, IngestOptions
#include "journey.h"      // for JourneyRecalculator
#include "memstore.h"     // for MemoryStore, MemoryObjectStorage


class IngestTest : public QObject
{
  Q_OBJECT

private:
  /* Member Functions */

  // don't declare these slots so they won't be run as tests.
  IngestRequest request(const QString& file_name, const QByteArray& data) const;
  IngestResult run_one(const IngestRequest& req, const IngestOptions& opts = IngestOptions());

private slots:
  /* Member Functions */

  void init();
  void cleanup();

  void transition_table();
  void content_types();
  void gpx_completes();
  void type_override_wins();
  void malformed_file_fails();
  void unsupported_file_fails();
  void upload_failure_fails();
  void refused_first_patch_still_fails_the_record();
  void unknown_journey_has_no_record();
  void oversized_file_fails();
  void slow_parse_times_out();
  void batch_isolates_failures();
  void concurrent_recalculations_keep_the_newest_totals();
  void totals_skip_failed_activities();
  void retry_starts_a_new_record();
  void retry_rejects_other_states();
  void options_from_inifile();

private:
  /* Data Members */

  std::unique_ptr<MemoryStore> store;
  std::unique_ptr<MemoryObjectStorage> storage;
  std::unique_ptr<JourneyRecalculator> recalculator;
  QString journey;
};

#endif // TEST_INGEST_H_INCLUDED_
