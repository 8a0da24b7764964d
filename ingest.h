/*
    File ingestion: one state machine per uploaded file, and a pool
    that runs a batch of them.

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
#ifndef INGEST_H_INCLUDED_
#define INGEST_H_INCLUDED_

#include <QByteArray>     // for QByteArray
#include <QList>          // for QList
#include <QString>        // for QString
#include <QThread>        // for QThread
#include <QThreadPool>    // for QThreadPool
#include <QtGlobal>       // for qint64

#include "defs.h"         // for processing_status, ActivityUpdate
#include "inifile.h"      // for inifile_t
#include "journey.h"      // for JourneyRecalculator
#include "persistence.h"  // for ActivityStore, ObjectStorage
#include "smplrout.h"     // for RouteSimplifier


struct IngestOptions {
  int timeout_ms{30000};
  int max_workers{QThread::idealThreadCount()};
  qint64 max_file_size{52428800};
  int min_speed_interval_ms{1000};
  int debug_level{0};
  RouteSimplifier::Options simplify;
};

// Reads [ingest], [simplify], [stats] and [debug].  A null inifile
// gives the defaults.
IngestOptions ingest_options_from_inifile(const inifile_t* inifile);

struct IngestRequest {
  QString journey_id;
  QString file_name;
  QByteArray data;
  QString format_hint;          /* format name or extension, may be empty */
  QString activity_type;        /* overrides what the file declares */
};

struct IngestResult {
  QString activity_id;          /* empty if no placeholder could be created */
  processing_status status{processing_status::pending};
  QString error;
};

/*
 * Drives one file through pending, uploading, processing and on to
 * completed or failed.  Every status change is a single patch of the
 * activity record.  run() does not throw; whatever goes wrong ends up
 * in the result and on the record.
 */
class IngestJob
{
public:

  /* Member Functions */

  IngestJob(ActivityStore& store, ObjectStorage& storage, JourneyRecalculator& recalculator,
            const IngestOptions& opts, QThreadPool* decode_pool = nullptr);

  IngestResult run(const IngestRequest& request);

  static bool transition_allowed(processing_status from, processing_status to);
  static QString content_type(const QString& file_name);

private:

  /* Constants */

  static constexpr int kPollIntervalMs = 5;

  /* Member Functions */

  void transition(processing_status to, ActivityUpdate update = ActivityUpdate());
  void create_placeholder(const IngestRequest& request);
  QString upload(const IngestRequest& request);
  void process(const IngestRequest& request, const QString& file_ref);
  void fail(const QString& error);
  void finish(const QString& journey_id);

  /* Data Members */

  ActivityStore& store;
  ObjectStorage& storage;
  JourneyRecalculator& recalculator;
  IngestOptions options;
  QThreadPool* decode_pool;

  processing_status state{processing_status::pending};
  QString activity_id;
  QString error_text;
};

/*
 * Runs one IngestJob per file on a bounded pool.  Jobs share nothing but
 * the store and the object storage, so one failure never touches its
 * siblings.
 */
class BatchIngestor
{
public:

  /* Member Functions */

  BatchIngestor(ActivityStore& store, ObjectStorage& storage, JourneyRecalculator& recalculator,
                const IngestOptions& opts);
  ~BatchIngestor();
  BatchIngestor(const BatchIngestor&) = delete;
  BatchIngestor& operator=(const BatchIngestor&) = delete;
  BatchIngestor(BatchIngestor&&) = delete;
  BatchIngestor& operator=(BatchIngestor&&) = delete;

  // Results come back in request order.
  QList<IngestResult> ingest(const QList<IngestRequest>& requests);

  /*
   * Starts a fresh pending cycle from a failed activity's stored file.
   * The failed record is deleted, not revived.  Throws ValidationError
   * if the activity is not failed or has no stored file.
   */
  IngestResult retry(const QString& failed_activity_id);

private:

  /* Data Members */

  ActivityStore& store;
  ObjectStorage& storage;
  JourneyRecalculator& recalculator;
  IngestOptions options;
  QThreadPool job_pool;
  QThreadPool decode_pool;
};

#endif // INGEST_H_INCLUDED_
