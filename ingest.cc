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

#include "ingest.h"

#include <algorithm>             // for max
#include <exception>             // for exception, rethrow_exception
#include <stdexcept>             // for logic_error
#include <utility>               // for move

#include <QByteArray>            // for QByteArray
#include <QDeadlineTimer>        // for QDeadlineTimer
#include <QException>            // for QUnhandledException
#include <QFileInfo>             // for QFileInfo
#include <QFuture>               // for QFuture
#include <QList>                 // for QList
#include <QString>               // for QString
#include <QThread>               // for QThread
#include <QThreadPool>           // for QThreadPool
#include <QtConcurrent>          // for run

#include "defs.h"                // for ParseError, StorageError, TransportError, strip_track_extension
#include "format.h"              // for RawTrack
#include "geojson.h"             // for GeoJson
#include "src/core/logging.h"    // for gbDebug, Warning
#include "trackstats.h"          // for activity_recompute, StatsOptions
#include "vecs.h"                // for Vecs


#define MYNAME "ingest"

IngestOptions
ingest_options_from_inifile(const inifile_t* inifile)
{
  IngestOptions opts;
  opts.timeout_ms = inifile_readint_def(inifile, "ingest", "timeout_ms", opts.timeout_ms);
  opts.max_workers = inifile_readint_def(inifile, "ingest", "max_workers", opts.max_workers);
  opts.max_file_size = inifile_readint_def(inifile, "ingest", "max_file_size",
                       static_cast<int>(opts.max_file_size));

  opts.simplify.tolerance_m = inifile_readdbl_def(inifile, "simplify", "tolerance_m", opts.simplify.tolerance_m);
  opts.simplify.max_points = inifile_readint_def(inifile, "simplify", "max_points", opts.simplify.max_points);
  opts.simplify.min_points = inifile_readint_def(inifile, "simplify", "min_points", opts.simplify.min_points);
  opts.simplify.smooth_elevation = inifile_readint_def(inifile, "simplify", "smooth_elevation",
                                   opts.simplify.smooth_elevation ? 1 : 0) != 0;

  opts.min_speed_interval_ms = inifile_readint_def(inifile, "stats", "min_speed_interval_ms",
                               opts.min_speed_interval_ms);
  opts.debug_level = inifile_readint_def(inifile, "debug", "level", opts.debug_level);

  if (opts.timeout_ms <= 0) {
    Warning() << MYNAME ": ignoring non positive timeout_ms" << opts.timeout_ms;
    opts.timeout_ms = IngestOptions().timeout_ms;
  }
  if (opts.max_workers <= 0) {
    opts.max_workers = QThread::idealThreadCount();
  }
  return opts;
}

/*******************************************************************************
* IngestJob
*******************************************************************************/

IngestJob::IngestJob(ActivityStore& store, ObjectStorage& storage, JourneyRecalculator& recalculator,
                     const IngestOptions& opts, QThreadPool* decode_pool) :
  store(store),
  storage(storage),
  recalculator(recalculator),
  options(opts),
  decode_pool(decode_pool ? decode_pool : QThreadPool::globalInstance())
{
}

bool
IngestJob::transition_allowed(processing_status from, processing_status to)
{
  switch (from) {
  case processing_status::pending:
    return to == processing_status::uploading;
  case processing_status::uploading:
    return to == processing_status::processing || to == processing_status::failed;
  case processing_status::processing:
    return to == processing_status::completed || to == processing_status::failed;
  case processing_status::completed:
  case processing_status::failed:
    return false;
  }
  return false;
}

QString
IngestJob::content_type(const QString& file_name)
{
  const QString ext = QFileInfo(file_name).suffix().toLower();
  if (ext == "gpx") {
    return QStringLiteral("application/gpx+xml");
  }
  if (ext == "tcx") {
    return QStringLiteral("application/vnd.garmin.tcx+xml");
  }
  if (ext == "kml") {
    return QStringLiteral("application/vnd.google-earth.kml+xml");
  }
  if (ext == "kmz") {
    return QStringLiteral("application/vnd.google-earth.kmz");
  }
  if (ext == "fit") {
    return QStringLiteral("application/vnd.ant.fit");
  }
  return QStringLiteral("application/octet-stream");
}

void
IngestJob::transition(processing_status to, ActivityUpdate update)
{
  if (!transition_allowed(state, to)) {
    throw std::logic_error(qPrintable(QStringLiteral(MYNAME ": illegal transition %1 -> %2")
                                      .arg(status_name(state), status_name(to))));
  }
  update.status = to;
  store.patch_activity(activity_id, update);
  gbDebug(2) << MYNAME ": " << activity_id << " " << status_name(state) << " -> " << status_name(to);
  state = to;
}

void
IngestJob::create_placeholder(const IngestRequest& request)
{
  Activity placeholder;
  placeholder.journey_id = request.journey_id;
  placeholder.name = strip_track_extension(request.file_name);
  if (placeholder.name.isEmpty()) {
    placeholder.name = QStringLiteral("Untitled Activity");
  }
  placeholder.original_file_name = request.file_name;
  placeholder.activity_type = request.activity_type;
  placeholder.status = processing_status::pending;
  placeholder.activity_date = current_time_ms();
  activity_id = store.create_activity(placeholder);
  state = processing_status::pending;
  gbDebug(1) << MYNAME ": " << request.file_name << " is " << activity_id;
}

QString
IngestJob::upload(const IngestRequest& request)
{
  transition(processing_status::uploading);
  const QString location = storage.upload_location();
  QString ref = storage.push(location, request.data, content_type(request.file_name));
  gbDebug(2) << MYNAME ": " << activity_id << " stored " << request.data.size() << " bytes as " << ref;
  return ref;
}

void
IngestJob::process(const IngestRequest& request, const QString& file_ref)
{
  const QByteArray bytes = storage.read(file_ref);
  if (bytes.size() > options.max_file_size) {
    throw ParseError(ParseError::kind_t::malformed,
                     QStringLiteral("file too large (%1 bytes, limit %2)")
                     .arg(bytes.size()).arg(options.max_file_size));
  }

  const QString hint = request.format_hint.isEmpty() ? request.file_name : request.format_hint;
  QFuture<RawTrack> future = QtConcurrent::run(decode_pool, [bytes, hint]() {
    return Vecs::Instance().parse(bytes, hint);
  });

  // There is no cancelling a parse.  Past the deadline the result,
  // whenever it arrives, is dropped.
  QDeadlineTimer deadline(options.timeout_ms);
  while (!future.isFinished()) {
    if (deadline.hasExpired()) {
      throw std::runtime_error(qPrintable(QStringLiteral("processing timed out after %1 ms")
                                          .arg(options.timeout_ms)));
    }
    QThread::msleep(kPollIntervalMs);
  }

  RawTrack track;
  try {
    track = future.result();
  } catch (const QUnhandledException& e) {
    if (e.exception()) {
      std::rethrow_exception(e.exception());
    }
    throw;
  }

  QString type = request.activity_type;
  if (type.isEmpty()) {
    type = track.activity_type();
  }
  if (type.isEmpty()) {
    type = QStringLiteral("other");
  }

  StatsOptions stats_opts;
  stats_opts.min_speed_interval_ms = options.min_speed_interval_ms;
  stats_opts.activity_type = type;

  ActivityUpdate update;
  update.name = track.name();
  update.activity_type = type;
  update.stats = activity_recompute(track.samples, stats_opts);
  update.render_geometry = GeoJson::write_geometry(RouteSimplifier(options.simplify).simplify_for_render(track.samples));
  update.activity_date = update.stats->start_time.value_or(current_time_ms());
  update.error = QString();
  update.points = std::move(track.samples);

  gbDebug(1) << MYNAME ": " << activity_id << " " << track.format_name() << ", "
             << update.points->size() << " points, " << update.stats->distance << " m";

  transition(processing_status::completed, std::move(update));
}

void
IngestJob::fail(const QString& error)
{
  error_text = error;
  Warning() << MYNAME ":" << activity_id << "failed:" << error;
  ActivityUpdate update;
  update.error = error;
  if (!transition_allowed(state, processing_status::failed)) {
    // The store refused the first patch and the record is still pending.
    // One more try to close it out, or it stays pending for good.
    state = processing_status::failed;
    update.status = processing_status::failed;
    try {
      store.patch_activity(activity_id, update);
    } catch (const StorageError& e) {
      Warning() << MYNAME ":" << activity_id << "left orphaned in pending:" << e.what();
    }
    return;
  }
  try {
    transition(processing_status::failed, update);
  } catch (const StorageError& e) {
    Warning() << MYNAME ": could not record failure of" << activity_id << ":" << e.what();
    state = processing_status::failed;
  }
}

void
IngestJob::finish(const QString& journey_id)
{
  try {
    recalculator.recalculate(journey_id);
  } catch (const StorageError& e) {
    Warning() << MYNAME ": journey" << journey_id << "not recalculated:" << e.what();
  }
}

IngestResult
IngestJob::run(const IngestRequest& request)
{
  IngestResult result;

  try {
    create_placeholder(request);
  } catch (const StorageError& e) {
    Warning() << MYNAME ": no placeholder for" << request.file_name << ":" << e.what();
    result.status = processing_status::failed;
    result.error = QStringLiteral("storage: %1").arg(QString::fromUtf8(e.what()));
    return result;
  }
  result.activity_id = activity_id;

  QString file_ref;
  try {
    file_ref = upload(request);
    ActivityUpdate update;
    update.file_ref = file_ref;
    transition(processing_status::processing, update);
  } catch (const TransportError& e) {
    fail(QStringLiteral("transport: %1").arg(QString::fromUtf8(e.what())));
  } catch (const StorageError& e) {
    fail(QStringLiteral("storage: %1").arg(QString::fromUtf8(e.what())));
  }

  if (state == processing_status::processing) {
    try {
      process(request, file_ref);
    } catch (const ParseError& e) {
      fail(QStringLiteral("%1: %2").arg(QString::fromLatin1(e.kind_name()), QString::fromUtf8(e.what())));
    } catch (const StorageError& e) {
      fail(QStringLiteral("storage: %1").arg(QString::fromUtf8(e.what())));
    } catch (const TransportError& e) {
      fail(QStringLiteral("transport: %1").arg(QString::fromUtf8(e.what())));
    } catch (const std::exception& e) {
      fail(QString::fromUtf8(e.what()));
    }
  }

  finish(request.journey_id);

  result.status = state;
  result.error = error_text;
  return result;
}

/*******************************************************************************
* BatchIngestor
*******************************************************************************/

BatchIngestor::BatchIngestor(ActivityStore& store, ObjectStorage& storage, JourneyRecalculator& recalculator,
                             const IngestOptions& opts) :
  store(store),
  storage(storage),
  recalculator(recalculator),
  options(opts)
{
  job_pool.setMaxThreadCount(std::max(1, options.max_workers));
  decode_pool.setMaxThreadCount(std::max(1, options.max_workers));
}

BatchIngestor::~BatchIngestor()
{
  job_pool.waitForDone();
  decode_pool.waitForDone();
}

QList<IngestResult>
BatchIngestor::ingest(const QList<IngestRequest>& requests)
{
  QList<QFuture<IngestResult>> futures;
  futures.reserve(requests.size());
  for (const auto& request : requests) {
    futures.append(QtConcurrent::run(&job_pool, [this, request]() {
      IngestJob job(store, storage, recalculator, options, &decode_pool);
      return job.run(request);
    }));
  }

  QList<IngestResult> results;
  results.reserve(futures.size());
  for (auto& future : futures) {
    results.append(future.result());
  }

  int completed = 0;
  for (const auto& result : std::as_const(results)) {
    if (result.status == processing_status::completed) {
      completed++;
    }
  }
  gbDebug(1) << MYNAME ": batch of " << results.size() << " files, " << completed << " completed";
  return results;
}

IngestResult
BatchIngestor::retry(const QString& failed_activity_id)
{
  Activity failed;
  try {
    failed = store.read_activity(failed_activity_id);
  } catch (const StorageError& e) {
    throw ValidationError(QStringLiteral(MYNAME ": unknown activity %1 (%2)")
                          .arg(failed_activity_id, QString::fromUtf8(e.what())));
  }
  if (failed.status != processing_status::failed) {
    throw ValidationError(QStringLiteral(MYNAME ": %1 is %2, only failed activities can be retried")
                          .arg(failed_activity_id, status_name(failed.status)));
  }
  if (failed.file_ref.isEmpty()) {
    throw ValidationError(QStringLiteral(MYNAME ": %1 has no stored file to retry from").arg(failed_activity_id));
  }

  IngestRequest request;
  request.journey_id = failed.journey_id;
  request.file_name = failed.original_file_name;
  request.activity_type = failed.activity_type;
  request.data = storage.read(failed.file_ref);

  store.delete_activity(failed_activity_id);
  if (store.file_ref_count(failed.file_ref) == 0) {
    try {
      storage.remove(failed.file_ref);
    } catch (const StorageError& e) {
      Warning() << MYNAME ": could not remove stored file" << failed.file_ref << ":" << e.what();
    }
  }
  gbDebug(1) << MYNAME ": retrying " << failed.original_file_name << ", dropped " << failed_activity_id;

  IngestJob job(store, storage, recalculator, options, &decode_pool);
  return job.run(request);
}
