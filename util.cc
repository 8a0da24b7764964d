/*
    Misc utilities.

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

#include <cstdint>                      // for int16_t

#include <QDateTime>                    // for QDateTime
#include <QFileInfo>                    // for QFileInfo
#include <QRegularExpression>           // for QRegularExpression
#include <QString>                      // for QString

#include "defs.h"

global_options global_opts;
const char trailbook_version[] = "1.0.0";

QString
status_name(processing_status status)
{
  switch (status) {
  case processing_status::pending:
    return QStringLiteral("pending");
  case processing_status::uploading:
    return QStringLiteral("uploading");
  case processing_status::processing:
    return QStringLiteral("processing");
  case processing_status::completed:
    return QStringLiteral("completed");
  case processing_status::failed:
    return QStringLiteral("failed");
  }
  return QStringLiteral("unknown");
}

const char*
ParseError::kind_name() const
{
  switch (kind_) {
  case kind_t::unsupported_format:
    return "unsupported-format";
  case kind_t::malformed:
    return "malformed";
  case kind_t::empty_track:
    return "empty-track";
  }
  return "unknown";
}

void
ActivityUpdate::apply_to(Activity& activity) const
{
  if (name) {
    activity.name = *name;
  }
  if (description) {
    activity.description = *description;
  }
  if (activity_type) {
    activity.activity_type = *activity_type;
  }
  if (file_ref) {
    activity.file_ref = *file_ref;
  }
  if (points) {
    activity.points = *points;
  }
  if (render_geometry) {
    activity.render_geometry = *render_geometry;
  }
  if (stats) {
    activity.stats = *stats;
  }
  if (status) {
    activity.status = *status;
  }
  if (error) {
    activity.error = *error;
  }
  if (color) {
    activity.color = *color;
  }
  if (notes) {
    activity.notes = *notes;
  }
  if (tags) {
    activity.tags = *tags;
  }
  if (activity_date) {
    activity.activity_date = *activity_date;
  }
}

bool
ActivityUpdate::empty() const
{
  return !name && !description && !activity_type && !file_ref &&
         !points && !render_geometry && !stats && !status && !error &&
         !color && !notes && !tags && !activity_date;
}

qint64
current_time_ms()
{
  return QDateTime::currentMSecsSinceEpoch();
}

QString get_filename(const QString& fname)
{
  return QFileInfo(fname).fileName();
}

// "Morning Ride.gpx" -> "Morning Ride".  Unknown extensions are kept.
QString strip_track_extension(const QString& fname)
{
  static const QRegularExpression re(QStringLiteral("\\.(gpx|tcx|kml|kmz|fit)$"),
                                     QRegularExpression::CaseInsensitiveOption);
  QString name = get_filename(fname);
  name.remove(re);
  return name;
}

signed int
be_read32(const void* ptr)
{
  const auto* i = (const unsigned char*) ptr;
  return i[0] << 24 | i[1] << 16  | i[2] << 8 | i[3];
}

signed int
be_read16(const void* ptr)
{
  const auto* i = (const unsigned char*) ptr;
  return static_cast<int16_t>(i[0] << 8 | i[1]);
}

signed int
le_read16(const void* ptr)
{
  const auto* p = (const unsigned char*) ptr;
  return static_cast<int16_t>(p[0] | (p[1] << 8));
}

unsigned int
le_readu16(const void* ptr)
{
  const auto* p = (const unsigned char*) ptr;
  return p[0] | (p[1] << 8);
}

signed int
le_read32(const void* ptr)
{
  const auto* p = (const unsigned char*) ptr;
  return p[0] | (p[1] << 8) | (p[2] << 16) | (p[3] << 24);
}
