/*
    Copyright (C) 2002-2014 Robert Lipe, robertlipe+source@gpsbabel.org

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
#ifndef DEFS_H_INCLUDED_
#define DEFS_H_INCLUDED_

#include <cstdint>                   // for int32_t, uint32_t
#include <numbers>                   // for pi
#include <optional>                  // for optional
#include <stdexcept>                 // for runtime_error
#include <vector>                    // for vector

#include <QDebug>                    // for QDebug
#include <QString>                   // for QString
#include <QStringList>               // for QStringList
#include <QtGlobal>                  // for qint64

#include "inifile.h"                 // for inifile_t
#include "src/core/datetime.h"       // for DateTime


#define CSTR(qstr) ((qstr).toUtf8().constData())

constexpr double kEarthRadiusMeters = 6371000.0;
constexpr double kMetersPerKilometer = 1000.0;

constexpr long SECONDS_PER_HOUR = 60L * 60;

constexpr double RAD(double deg) { return deg * (std::numbers::pi / 180.0);}
constexpr double DEG(double rad) { return rad * (180.0 / std::numbers::pi);}

/*
 * Common definitions.   There should be no protocol or file-specific
 * data in this file.
 */

struct global_options {
  int debug_level{0};
  inifile_t* inifile{nullptr};
};

extern global_options global_opts;
extern const char trailbook_version[];

/* Note PositionDeg and PositionRad can be implicitly converted to
 * each other, so either may be passed to the great circle routines.
 */
struct PositionRad;

struct PositionDeg {
  PositionDeg() = default;
  PositionDeg(double lat, double lon) : lat(lat), lon(lon) {}
  inline PositionDeg(const PositionRad& posr);

  double lat{0.0};
  double lon{0.0};
};

struct PositionRad {
  PositionRad() = default;
  PositionRad(double latR, double lonR) : latR(latR), lonR(lonR) {}
  PositionRad(const PositionDeg& posd) : latR(RAD(posd.lat)), lonR(RAD(posd.lon)) {}

  double latR{0.0};
  double lonR{0.0};
};

inline PositionDeg::PositionDeg(const PositionRad& posr) : lat(DEG(posr.latR)), lon(DEG(posr.lonR)) {}

/*
 * One canonical sample of a recorded activity.
 * Only latitude and longitude are mandatory.
 */
struct TrackPoint {
  double latitude{0.0};                 /* Degrees, WGS84 */
  double longitude{0.0};                /* Degrees, WGS84 */
  std::optional<double> elevation;      /* Meters */
  std::optional<qint64> timestamp;      /* ms since the epoch, UTC */
  std::optional<double> speed;          /* Meters/sec */
  std::optional<int> heart_rate;        /* Beats/min */
  std::optional<int> cadence;           /* Revolutions/min */
  std::optional<double> power;          /* Watts */
  std::optional<double> temperature;    /* Degrees Celsius */

  PositionDeg position() const
  {
    return {latitude, longitude};
  }

  bool operator==(const TrackPoint& other) const = default;
};

// Each Activity owns its own list; copies never share storage.
using TrackPointList = std::vector<TrackPoint>;

struct BoundingBox {
  double north{0.0};
  double south{0.0};
  double east{0.0};
  double west{0.0};

  bool operator==(const BoundingBox& other) const = default;
};

/*
 * Derived from the canonical points, never edited by hand.
 * Distances and elevations are whole meters, durations whole seconds.
 */
struct ActivityStats {
  int distance{0};                      /* Meters */
  int duration{0};                      /* Seconds */
  int elevation_gain{0};                /* Meters */
  int elevation_loss{0};                /* Meters */
  std::optional<int> max_elevation;     /* Meters */
  std::optional<int> min_elevation;     /* Meters */
  float avg_speed{0.0f};                /* Meters/sec */
  float max_speed{0.0f};                /* Meters/sec */
  int avg_pace{0};                      /* Seconds/km */
  int estimated_calories{0};            /* kcal */
  BoundingBox bounding_box;
  double center_lat{0.0};
  double center_lng{0.0};
  std::optional<qint64> start_time;     /* ms since the epoch */
  std::optional<qint64> end_time;       /* ms since the epoch */
  int point_count{0};
  std::optional<int> avg_heart_rate;
  std::optional<int> max_heart_rate;
  std::optional<int> avg_cadence;
  std::optional<int> avg_power;

  bool operator==(const ActivityStats& other) const = default;
};

enum class processing_status {
  pending,
  uploading,
  processing,
  completed,
  failed
};

QString status_name(processing_status status);

class Activity
{
public:
  QString id;
  QString journey_id;
  QString name;
  QString description;
  QString activity_type;
  QString original_file_name;
  QString file_ref;             /* object storage reference, may be empty */
  TrackPointList points;
  QString render_geometry;      /* GeoJSON of the simplified track */
  ActivityStats stats;
  processing_status status{processing_status::pending};
  QString error;
  QString color;
  QString notes;
  QStringList tags;
  qint64 activity_date{0};
  qint64 created_at{0};
  qint64 updated_at{0};
};

/*
 * A partial update.  Every engaged member is written, all of them
 * in a single store operation.
 */
class ActivityUpdate
{
public:
  std::optional<QString> name;
  std::optional<QString> description;
  std::optional<QString> activity_type;
  std::optional<QString> file_ref;
  std::optional<TrackPointList> points;
  std::optional<QString> render_geometry;
  std::optional<ActivityStats> stats;
  std::optional<processing_status> status;
  std::optional<QString> error;
  std::optional<QString> color;
  std::optional<QString> notes;
  std::optional<QStringList> tags;
  std::optional<qint64> activity_date;

  void apply_to(Activity& activity) const;
  bool empty() const;
};

struct JourneyTotals {
  qint64 total_distance{0};             /* Meters */
  qint64 total_elevation_gain{0};       /* Meters */
  qint64 total_duration{0};             /* Seconds */
  int activity_count{0};
  std::optional<qint64> last_activity_date;

  bool operator==(const JourneyTotals& other) const = default;
};

class Journey
{
public:
  QString id;
  QString name;
  JourneyTotals totals;
};

/*
 * Error taxonomy.  Each is terminal for the operation that raised it.
 */
class ParseError : public std::runtime_error
{
public:
  enum class kind_t {
    unsupported_format,
    malformed,
    empty_track
  };

  ParseError(kind_t kind, const QString& msg) :
    std::runtime_error(msg.toStdString()), kind_(kind) {}

  kind_t kind() const
  {
    return kind_;
  }
  const char* kind_name() const;

private:
  kind_t kind_;
};

class ValidationError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
  explicit ValidationError(const QString& msg) : std::runtime_error(msg.toStdString()) {}
};

class StorageError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
  explicit StorageError(const QString& msg) : std::runtime_error(msg.toStdString()) {}
};

class TransportError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
  explicit TransportError(const QString& msg) : std::runtime_error(msg.toStdString()) {}
};

[[noreturn]] void fatal(QDebug& msginstance);
// cppcheck fails to assign noreturn attribute to fatal if
// the noreturn attribute is listed before the gnu::format attribute.
[[gnu::format(printf, 1, 2)]] [[noreturn]] void fatal(const char*, ...);
[[gnu::format(printf, 1, 2)]] void warning(const char*, ...);

qint64 current_time_ms();
QString get_filename(const QString& fname);			/* extract the filename portion */
QString strip_track_extension(const QString& fname);

/* this lives in gpx.cc */
trailbook::DateTime xml_parse_time(const QString& dateTimeString);

/*
 * Prototypes for Endianness helpers.
 */

signed int be_read16(const void* ptr);
signed int be_read32(const void* ptr);
signed int le_read16(const void* ptr);
unsigned int le_readu16(const void* ptr);
signed int le_read32(const void* ptr);

#endif // DEFS_H_INCLUDED_
