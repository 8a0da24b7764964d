/*
    Track file reader interface.

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

#include "format.h"

#include <cmath>        // for fabs, isfinite
#include <variant>      // for get_if

#include <QChar>        // for QChar
#include <QLatin1Char>  // for QLatin1Char
#include <QString>      // for QString

#include "defs.h"
#include "src/core/logging.h"  // for gbDebug

namespace
{

// "running" -> "Running", "alpine_skiing" -> "Alpine skiing"
QString
sport_title(const QString& sport)
{
  QString title = sport;
  title.replace(QLatin1Char('_'), QLatin1Char(' '));
  if (!title.isEmpty()) {
    title[0] = title.at(0).toUpper();
  }
  return title;
}

QString
tcx_activity_type(const QString& sport)
{
  if (sport.compare(QLatin1String("Biking"), Qt::CaseInsensitive) == 0) {
    return QStringLiteral("cycling");
  }
  if (sport.compare(QLatin1String("Other"), Qt::CaseInsensitive) == 0) {
    return {};
  }
  return sport.toLower();
}

// FIT profile sport names onto the activity types the calorie table knows.
QString
fit_activity_type(const QString& sport)
{
  if (sport == QLatin1String("generic")) {
    return {};
  }
  if (sport == QLatin1String("alpine_skiing")) {
    return QStringLiteral("skiing");
  }
  if (sport == QLatin1String("rock_climbing")) {
    return QStringLiteral("climbing");
  }
  if (sport == QLatin1String("paddling")) {
    return QStringLiteral("kayaking");
  }
  return sport;
}

} // namespace

const char*
RawTrack::format_name() const
{
  switch (metadata.index()) {
  case 0:
    return "gpx";
  case 1:
    return "tcx";
  case 2:
    return "kml";
  case 3:
    return "kmz";
  case 4:
    return "fit";
  }
  return "unknown";
}

QString
RawTrack::name() const
{
  if (const auto* gpx = std::get_if<GpxMetadata>(&metadata)) {
    return gpx->name.isEmpty() ? QStringLiteral("GPX Activity") : gpx->name;
  }
  if (const auto* tcx = std::get_if<TcxMetadata>(&metadata)) {
    if (!tcx->name.isEmpty()) {
      return tcx->name;
    }
    QString type = tcx_activity_type(tcx->sport);
    return type.isEmpty() ? QStringLiteral("TCX Activity") : sport_title(type) + QStringLiteral(" Activity");
  }
  const KmlMetadata* kml = std::get_if<KmlMetadata>(&metadata);
  if (const auto* kmz = std::get_if<KmzMetadata>(&metadata)) {
    kml = &kmz->kml;
  }
  if (kml != nullptr) {
    if (!kml->placemark_name.isEmpty()) {
      return kml->placemark_name;
    }
    return kml->document_name.isEmpty() ? QStringLiteral("KML Track") : kml->document_name;
  }
  if (const auto* fit = std::get_if<FitMetadata>(&metadata)) {
    if (fit->sport.isEmpty() || fit->sport == QLatin1String("generic")) {
      return QStringLiteral("FIT Activity");
    }
    return sport_title(fit->sport) + QStringLiteral(" Activity");
  }
  return {};
}

QString
RawTrack::activity_type() const
{
  if (const auto* gpx = std::get_if<GpxMetadata>(&metadata)) {
    return gpx->type.trimmed().toLower();
  }
  if (const auto* tcx = std::get_if<TcxMetadata>(&metadata)) {
    return tcx_activity_type(tcx->sport);
  }
  if (const auto* fit = std::get_if<FitMetadata>(&metadata)) {
    return fit_activity_type(fit->sport);
  }
  return {};
}

bool
Format::valid_position(double lat, double lon)
{
  return std::isfinite(lat) && std::isfinite(lon) &&
         std::fabs(lat) <= 90.0 && std::fabs(lon) <= 180.0;
}

void
Format::check_samples(const RawTrack& track, const char* myname)
{
  if (track.samples.empty()) {
    throw ParseError(ParseError::kind_t::empty_track,
                     QStringLiteral("%1: no valid track points found").arg(myname));
  }
  gbDebug(2) << myname << ": " << track.samples.size() << " samples";
}
