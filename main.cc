/*
    Copyright (C) 2002-2005 Robert Lipe, robertlipe+source@gpsbabel.org

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

#include <clocale>                    // for setlocale, LC_NUMERIC, LC_TIME
#include <cstdio>                     // for printf, fflush, fprintf, stderr, stdout
#include <cstring>                    // for strcmp
#include <optional>                   // for optional
#include <utility>                    // for as_const

#include <QByteArray>                 // for QByteArray
#include <QCoreApplication>           // for QCoreApplication
#include <QDebug>                     // for QDebug
#include <QElapsedTimer>              // for QElapsedTimer
#include <QFile>                      // for QFile
#include <QFileInfo>                  // for QFileInfo
#include <QIODevice>                  // for QIODevice::ReadOnly
#include <QList>                      // for QList
#include <QLocale>                    // for QLocale
#include <QMessageLogContext>         // for QMessageLogContext
#include <QPair>                      // for QPair, qMakePair
#include <QString>                    // for QString
#include <QStringList>                // for QStringList
#include <QSysInfo>                   // for QSysInfo
#include <QtConfig>                   // for QT_VERSION_STR
#include <QtGlobal>                   // for qPrintable, qVersion, QT_VERSION, QT_VERSION_CHECK

#include "defs.h"
#include "ingest.h"                   // for BatchIngestor, IngestOptions, IngestRequest
#include "inifile.h"                  // for inifile_done, inifile_init
#include "journey.h"                  // for JourneyRecalculator
#include "memstore.h"                 // for MemoryStore, MemoryObjectStorage
#include "src/core/datetime.h"        // for DateTime
#include "src/core/file.h"            // for File
#include "src/core/logging.h"         // for Warning, FatalMsg
#include "trackfilter.h"              // for ActivityEditor
#include "vecs.h"                     // for Vecs

// be careful not to advance argn passed the end of the list, i.e. ensure argn < qargs.size()
#define FETCH_OPTARG qargs.at(argn).size() > 2 ? QString(qargs.at(argn)).remove(0,2) : qargs.size()>(argn+1) ? qargs.at(++argn) : QString()
#define FETCH_LONGARG qargs.size()>(argn+1) ? qargs.at(++argn) : QString()

static QElapsedTimer timer;

struct cli_options {
  std::optional<int> debug_level;
  std::optional<int> timeout_ms;
  QString activity_type;
  QString journey_name{"Journey"};
  bool print_geojson{false};
  std::optional<QPair<int, int>> trim;
  std::optional<QPair<int, QString>> split;
  bool merge{false};
  int fail_upload{0};
  QStringList files;
};

static void
usage(const char* pname, bool verbose)
{
  printf("trailbook Version %s\n\n", trailbook_version);
  printf(
    "Usage:\n"
    "    %s [options] file...\n"
    "\n"
    "    Ingests GPX, TCX, KML, KMZ and FIT track files into a journey and\n"
    "    prints one line per activity followed by the journey totals.\n"
    "\n"
    "Options:\n"
    "    -D level         Set debug level [%d]\n"
    "    -c file          Configuration file (trailbook.ini)\n"
    "    -t type          Activity type for every file, e.g. running\n"
    "    -T ms            Processing timeout per file\n"
    "    -j name          Journey name\n"
    "    --geojson        Print the render geometry of each activity\n"
    "    --trim s,e       Trim the first activity to points s..e\n"
    "    --split i,name   Split the first activity at point i\n"
    "    --merge          Merge all completed activities\n"
    "    --fail-upload N  Make the Nth upload fail\n"
    "    -h, -?           Print detailed help and exit\n"
    "    -V               Print trailbook version and exit\n"
    "\n"
    , pname
    , global_opts.debug_level
  );
  if (verbose) {
    printf("File Types:\n");
    Vecs::Instance().disp_formats();
  }
}

static void setMessagePattern(const QString& id = QString())
{
  if (id.isEmpty()) {
    qSetMessagePattern("%{if-category}%{category}: %{endif}main: %{message}");
  } else {
    qSetMessagePattern(QStringLiteral("%{if-category}%{category}: %{endif}%1: %{message}").arg(id));
  }
}

static void MessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
  QString message = qFormatLogMessage(type, context, msg);
  /* flush any buffered standard output */
  fflush(stdout);
  fprintf(stderr, "%s\n", qPrintable(message));
  fflush(stderr);
}

static int
parse_int_arg(const QString& argument, const char* what)
{
  bool ok;
  int value = argument.toInt(&ok);
  if (!ok) {
    fatal("the %s option requires an integer value\n", what);
  }
  return value;
}

static QByteArray
read_track_file(const QString& fname)
{
  trailbook::File file(fname);
  file.open(QFile::ReadOnly);
  QByteArray data = file.readAll();
  file.close();
  return data;
}

static void
print_activity(const Activity& activity, bool print_geojson)
{
  const ActivityStats& stats = activity.stats;
  QString when = stats.start_time ?
                 trailbook::DateTime::fromMSecs(*stats.start_time).toPrettyString() :
                 QStringLiteral("-");
  printf("%-12s %-10s %-9s %-24s %s %8.2f km %7d s %5d m up %6d pts",
         qPrintable(activity.id),
         qPrintable(status_name(activity.status)),
         qPrintable(activity.activity_type.isEmpty() ? QStringLiteral("-") : activity.activity_type),
         qPrintable(activity.name),
         qPrintable(when),
         stats.distance / kMetersPerKilometer,
         stats.duration,
         stats.elevation_gain,
         stats.point_count);
  if (!activity.error.isEmpty()) {
    printf("  error: %s", qPrintable(activity.error));
  }
  printf("\n");
  if (print_geojson && !activity.render_geometry.isEmpty()) {
    printf("%s\n", qPrintable(activity.render_geometry));
  }
}

static void
print_journey(const Journey& journey)
{
  const JourneyTotals& totals = journey.totals;
  printf("journey %s \"%s\": %d activities, %.2f km, %lld s, %lld m up",
         qPrintable(journey.id),
         qPrintable(journey.name),
         totals.activity_count,
         totals.total_distance / kMetersPerKilometer,
         static_cast<long long>(totals.total_duration),
         static_cast<long long>(totals.total_elevation_gain));
  if (totals.last_activity_date) {
    printf(", last %s", qPrintable(trailbook::DateTime::fromMSecs(*totals.last_activity_date).toPrettyString()));
  }
  printf("\n");
}

/*
 * The edits apply to what the batch produced.  A rejected edit is
 * reported and makes the run fail, it never undoes the ingestion.
 */
static bool
run_edits(const cli_options& cli, const IngestOptions& opts, ActivityStore& store, ObjectStorage& storage,
          JourneyRecalculator& recalculator, const QString& journey_id)
{
  if (!cli.trim && !cli.split && !cli.merge) {
    return true;
  }

  ActivityEditor::Options edit_opts;
  edit_opts.min_speed_interval_ms = opts.min_speed_interval_ms;
  edit_opts.simplify = opts.simplify;
  ActivityEditor editor(store, storage, recalculator, edit_opts);

  QStringList completed;
  for (const auto& activity : store.journey_activities(journey_id)) {
    if (activity.status == processing_status::completed) {
      completed.append(activity.id);
    }
  }

  setMessagePattern("edit");
  bool ok = true;
  try {
    if ((cli.trim || cli.split) && completed.isEmpty()) {
      throw ValidationError("no completed activity to edit");
    }
    if (cli.trim) {
      editor.trim(completed.first(), cli.trim->first, cli.trim->second);
    }
    if (cli.split) {
      auto parts = editor.split(completed.first(), cli.split->first, cli.split->second);
      completed.append(parts.second.id);
    }
    if (cli.merge) {
      editor.merge(completed, QStringLiteral("Merged Activity"), false);
    }
  } catch (const ValidationError& e) {
    Warning() << e.what();
    ok = false;
  } catch (const StorageError& e) {
    Warning() << e.what();
    ok = false;
  }
  setMessagePattern();
  return ok;
}

static int
run(const char* prog_name)
{
  cli_options cli;

  // Use QCoreApplication::arguments() to process the command line.
  QStringList qargs = QCoreApplication::arguments();

  if (qargs.size() < 2) {
    usage(prog_name, false);
    return 0;
  }

  /*
   * Open-code getopts, with the few long options matched first.
   */
  int argn = 1;
  while (argn < qargs.size()) {
    QString argument;
    const QString& arg = qargs.at(argn);

    if (arg.size() > 0 && arg.at(0).toLatin1() != '-') {
      cli.files.append(arg);
      argn++;
      continue;
    }

    if (arg == "--geojson") {
      cli.print_geojson = true;
    } else if (arg == "--merge") {
      cli.merge = true;
    } else if (arg == "--trim") {
      argument = FETCH_LONGARG;
      const QStringList range = argument.split(',');
      if (range.size() != 2) {
        fatal("--trim requires start,end, e.g. --trim 10,250\n");
      }
      cli.trim = qMakePair(parse_int_arg(range.at(0), "--trim"), parse_int_arg(range.at(1), "--trim"));
    } else if (arg == "--split") {
      argument = FETCH_LONGARG;
      int comma = argument.indexOf(',');
      if (comma < 0) {
        fatal("--split requires index,name, e.g. --split 120,\"Second half\"\n");
      }
      cli.split = qMakePair(parse_int_arg(argument.left(comma), "--split"), argument.mid(comma + 1));
    } else if (arg == "--fail-upload") {
      argument = FETCH_LONGARG;
      cli.fail_upload = parse_int_arg(argument, "--fail-upload");
    } else if (arg.startsWith("--")) {
      fatal("Unknown option '%s'.  Use '%s -h' for command-line options.\n", qPrintable(arg), prog_name);
    } else {
      int c = arg.size() > 1 ? arg.at(1).toLatin1() : '\0';

      switch (c) {
      case 'V':
        printf("\ntrailbook Version %s\n\n", trailbook_version);
        return 0;
      case 'h':
      case '?':
        usage(prog_name, true);
        return 0;
      case 'D':
        argument = FETCH_OPTARG;
        cli.debug_level = parse_int_arg(argument, "-D");
        global_opts.debug_level = *cli.debug_level;
        /*
         * When debugging, announce version.
         */
        if (global_opts.debug_level > 0)  {
          Debug() << "trailbook Version: " << trailbook_version;
          Debug() << "Compiled with Qt " << QT_VERSION_STR << " for architecture " << QSysInfo::buildAbi();
          Debug() << "Running with Qt " << qVersion() << " on " << QSysInfo::prettyProductName()
                  << ", " << QSysInfo::currentCpuArchitecture();
          Debug() << "QLocale::system() is " << QLocale::system().name();
        }
        break;
      case 'c':
        argument = FETCH_OPTARG;
        inifile_done(global_opts.inifile);
        if (argument.isEmpty()) {
          fatal("the -c option requires a file name\n");
        }
        global_opts.inifile = inifile_init(argument);
        break;
      case 't':
        cli.activity_type = (FETCH_OPTARG).toLower();
        break;
      case 'T':
        argument = FETCH_OPTARG;
        cli.timeout_ms = parse_int_arg(argument, "-T");
        break;
      case 'j':
        argument = FETCH_OPTARG;
        cli.journey_name = argument;
        break;
      default:
        fatal("Unknown option '%s'.  Use '%s -h' for command-line options.\n", qPrintable(arg), prog_name);
      }
    }
    argn++;
  }

  if (cli.files.isEmpty()) {
    fatal("Nothing to do!  Use '%s -h' for command-line options.\n", prog_name);
  }

  IngestOptions opts = ingest_options_from_inifile(global_opts.inifile);
  if (cli.debug_level) {
    opts.debug_level = *cli.debug_level;
  }
  global_opts.debug_level = opts.debug_level;
  if (cli.timeout_ms) {
    if (*cli.timeout_ms <= 0) {
      fatal("the -T option requires a positive number of milliseconds\n");
    }
    opts.timeout_ms = *cli.timeout_ms;
  }

  QList<IngestRequest> requests;
  for (const auto& fname : std::as_const(cli.files)) {
    IngestRequest request;
    request.file_name = QFileInfo(fname).fileName();
    request.data = read_track_file(fname);
    request.activity_type = cli.activity_type;
    requests.append(request);
  }

  MemoryStore store;
  MemoryObjectStorage storage;
  if (cli.fail_upload > 0) {
    storage.fail_push(cli.fail_upload);
  }
  JourneyRecalculator recalculator(store);
  const QString journey_id = store.create_journey(cli.journey_name);
  for (auto& request : requests) {
    request.journey_id = journey_id;
  }

  if (global_opts.debug_level > 0)  {
    timer.start();
  }
  setMessagePattern("ingest");
  QList<IngestResult> results;
  {
    BatchIngestor batch(store, storage, recalculator, opts);
    results = batch.ingest(requests);
  }
  setMessagePattern();
  if (global_opts.debug_level > 0)  {
    qDebug().noquote() << QStringLiteral("ingesting %1 files took %2 seconds.")
                        .arg(requests.size()).arg(QString::number(timer.elapsed()/1000.0, 'f', 3));
  }

  int rc = 0;
  for (const auto& result : std::as_const(results)) {
    if (result.status != processing_status::completed) {
      rc = 1;
    }
  }

  if (!run_edits(cli, opts, store, storage, recalculator, journey_id)) {
    rc = 1;
  }

  for (const auto& activity : store.journey_activities(journey_id)) {
    print_activity(activity, cli.print_geojson);
  }
  print_journey(store.read_journey(journey_id));

  return rc;
}

int
main(int argc, char* argv[])
{
  const char* prog_name = argv[0]; /* may not match QCoreApplication::arguments().at(0)! */

#if (QT_VERSION < QT_VERSION_CHECK(6, 3, 0))
#error This version of Qt is not supported.
#endif

  QCoreApplication app(argc, argv);

  // As recommended in QCoreApplication reset the locale to the default.
  // Note the documentation says to set LC_NUMERIC, but QCoreApplicationPrivate::initLocale()
  // actually sets LC_ALL.
  if (strcmp(setlocale(LC_NUMERIC,nullptr), "C") != 0) {
    setlocale(LC_NUMERIC,"C");
  }
  /* reset LC_TIME for strftime */
  if (strcmp(setlocale(LC_TIME,nullptr), "C") != 0) {
    setlocale(LC_TIME,"C");
  }
  qInstallMessageHandler(MessageHandler);
  setMessagePattern();

  global_opts.inifile = inifile_init(QString());

  int rc = run(prog_name);

  inifile_done(global_opts.inifile);

  return rc;
}
