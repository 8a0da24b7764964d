/*
	Support for Google Earth & Keyhole "kml" format.

	Copyright (C) 2005-2013 Robert Lipe, robertlipe+source@gpsbabel.org
	Updates by Andrew Kirmse, akirmse at google.com

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

#include "kml.h"

#include <cstdio>                      // for sscanf, EOF
#include <tuple>                       // for make_tuple
#include <utility>                     // for move

#include <QByteArray>                  // for QByteArray
#include <QString>                     // for QString
#include <QStringList>                 // for QStringList
#include <QXmlStreamAttributes>        // for QXmlStreamAttributes
#include <QtGlobal>                    // for qint64

#include "defs.h"                      // for ParseError, TrackPoint, xml_parse_time, CSTR
#include "src/core/logging.h"          // for gbDebug, Warning
#include "xmlgeneric.h"                // for XmlGenericReader


#define MYNAME "kml"

const QStringList KmlFormat::kml_tags_to_ignore = {
  "kml",
  "Document",
  "Folder",
};

const QStringList KmlFormat::kml_tags_to_skip = {
  "Style",
  "StyleMap",
  "LookAt",
  "Camera",
  "ExtendedData",
  "Schema",
};

RawTrack
KmlFormat::read(const QByteArray& data)
{
  XmlGenericReader xml_reader;
  xml_reader.xml_init(this, kml_map, kml_tags_to_ignore, kml_tags_to_skip);
  xml_reader.xml_read(data, MYNAME);

  RawTrack track;
  // Lines and tracks make the activity; bare Points only when there is nothing else.
  if (!trk_samples.empty()) {
    track.samples = std::move(trk_samples);
  } else {
    track.samples = std::move(wpt_samples);
  }
  track.metadata = metadata;
  check_samples(track, MYNAME);
  return track;
}

void
KmlFormat::doc_name(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (metadata.document_name.isEmpty()) {
    metadata.document_name = args.trimmed();
  }
}

void
KmlFormat::wpt_s(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/)
{
  if (in_placemark) {
    throw ParseError(ParseError::kind_t::malformed, MYNAME ": nested Placemark");
  }
  in_placemark = true;
  placemark_count++;
  wpt_tmp.reset();
  wpt_when.reset();
  placemark_first = trk_samples.size();
  placemark_has_line = false;

  /* Invalidate timespan elements for a beginning Placemark,
   * so that each Placemark has its own (or no) TimeSpan. */
  wpt_timespan_begin = trailbook::DateTime();
  wpt_timespan_end = trailbook::DateTime();
}

void
KmlFormat::wpt_e(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/)
{
  if (placemark_has_line) {
    interpolate_timespan();
  }
  if (wpt_tmp) {
    wpt_tmp->timestamp = wpt_when;
    wpt_samples.push_back(*wpt_tmp);
    wpt_tmp.reset();
  }
  in_placemark = false;
}

void
KmlFormat::wpt_name(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (placemark_count == 1 && metadata.placemark_name.isEmpty()) {
    metadata.placemark_name = args.trimmed();
  }
}

void
KmlFormat::wpt_desc(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (placemark_count == 1) {
    metadata.description += args.trimmed();
  }
}

void
KmlFormat::wpt_time(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  wpt_when = xml_parse_time(args).toOptionalMSecs();
}

void
KmlFormat::wpt_ts_begin(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  wpt_timespan_begin = xml_parse_time(args);
}

void
KmlFormat::wpt_ts_end(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  wpt_timespan_end = xml_parse_time(args);
}

void
KmlFormat::wpt_coord(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  double lat;
  double lon;
  double alt;
  // Alt is actually optional.
  int n = sscanf(CSTR(args.trimmed()), "%lf,%lf,%lf", &lon, &lat, &alt);
  if (n < 2 || !valid_position(lat, lon)) {
    gbDebug(1) << MYNAME ": ignoring Point with bad coordinates " << args;
    return;
  }
  wpt_tmp = TrackPoint();
  wpt_tmp->latitude = lat;
  wpt_tmp->longitude = lon;
  if (n == 3) {
    wpt_tmp->elevation = alt;
  }
}

void
KmlFormat::trk_coord(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  placemark_has_line = true;

  const auto vecs = args.simplified().split(' ', Qt::SkipEmptyParts);
  for (const auto& vec : vecs) {
    const QStringList coords = vec.split(',');
    auto csize = coords.size();
    if (csize != 2 && csize != 3) {
      Warning() << MYNAME << ": malformed coordinates " << vec;
      continue;
    }

    bool lat_ok;
    bool lon_ok;
    TrackPoint trkpt;
    trkpt.latitude = coords[1].toDouble(&lat_ok);
    trkpt.longitude = coords[0].toDouble(&lon_ok);
    if (!lat_ok || !lon_ok || !valid_position(trkpt.latitude, trkpt.longitude)) {
      gbDebug(2) << MYNAME ": dropping coordinate " << vec;
      continue;
    }
    if (csize == 3) {
      bool alt_ok;
      double alt = coords[2].toDouble(&alt_ok);
      if (alt_ok) {
        trkpt.elevation = alt;
      }
    }
    trk_samples.push_back(trkpt);
  }
}

/* The line coordinates do not have a time associated with them. This is specified by using:
 *
 * <TimeSpan>
 *   <begin>2017-08-21T17:00:05Z</begin>
 *   <end>2017-08-21T17:22:32Z</end>
 * </TimeSpan>
 *
 * If this is specified, the span is distributed evenly over the line's points.
 * TimeSpan may appear before or after the geometry, so this runs at the
 * end of the Placemark.
 */
void
KmlFormat::interpolate_timespan()
{
  if (!wpt_timespan_begin.isValid() || !wpt_timespan_end.isValid()) {
    return;
  }

  auto count = static_cast<qint64>(trk_samples.size() - placemark_first);
  if (count <= 0) {
    return;
  }

  qint64 begin_ms = wpt_timespan_begin.toMSecsSinceEpoch();
  qint64 timespan_ms = wpt_timespan_begin.msecsTo(wpt_timespan_end);
  if (timespan_ms < 0) {
    Warning() << MYNAME << ": ignoring TimeSpan that ends before it begins";
    return;
  }
  qint64 ms_per_point = (count < 2) ? 0 : timespan_ms / (count - 1);
  for (qint64 i = 0; i < count; ++i) {
    auto& trkpt = trk_samples[placemark_first + i];
    if (!trkpt.timestamp) {
      trkpt.timestamp = begin_ms + i * ms_per_point;
    }
  }
}

void
KmlFormat::gx_trk_s(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/)
{
  gx_trk_times.emplace();
  gx_trk_coords.emplace();
}

void
KmlFormat::gx_trk_e(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/)
{
  if (!gx_trk_times || !gx_trk_coords) {
    throw ParseError(ParseError::kind_t::malformed, MYNAME ": unbalanced Track element");
  }

  // Check that for every temporal value (kml:when) in a kml:Track there is a position (kml:coord) value.
  // Check that for every temporal value (kml:when) in a gx:Track there is a position (gx:coord) value.
  if (gx_trk_times->size() != gx_trk_coords->size()) {
    throw ParseError(ParseError::kind_t::malformed,
                     QStringLiteral(MYNAME ": Track has %1 when elements but %2 coord elements")
                     .arg(gx_trk_times->size()).arg(gx_trk_coords->size()));
  }

  // In KML 2.3 kml:Track elements kml:coord and kml:when elements are not required to be in any order.
  // In gx:Track elements all kml:when elements are required to precede all gx:coord elements.
  // For both we allow any order.  Many writers using gx:Track elements don't adhere to the schema.
  while (!gx_trk_times->isEmpty()) {
    trailbook::DateTime when = gx_trk_times->takeFirst();
    auto [n, lat, lon, alt] = gx_trk_coords->takeFirst();
    // An empty kml:coord element is permitted to indicate missing position data.
    // If we get one we throw away the time as we don't have a location.
    if (n >= 2 && valid_position(lat, lon)) {
      TrackPoint trkpt;
      trkpt.latitude = lat;
      trkpt.longitude = lon;
      if (n >= 3) {
        trkpt.elevation = alt;
      }
      trkpt.timestamp = when.toOptionalMSecs();
      trk_samples.push_back(trkpt);
    }
  }

  gx_trk_times.reset();
  gx_trk_coords.reset();
}

void
KmlFormat::gx_trk_when(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (!gx_trk_times) {
    throw ParseError(ParseError::kind_t::malformed, MYNAME ": when outside of a Track");
  }
  gx_trk_times->append(xml_parse_time(args));
}

void
KmlFormat::gx_trk_coord(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (!gx_trk_coords) {
    throw ParseError(ParseError::kind_t::malformed, MYNAME ": coord outside of a Track");
  }

  double lat = 0;
  double lon = 0;
  double alt = 0;
  int n = sscanf(CSTR(args), "%lf %lf %lf", &lon, &lat, &alt);
  if (EOF != n && 2 != n && 3 != n) {
    throw ParseError(ParseError::kind_t::malformed,
                     QStringLiteral(MYNAME ": coord field decode failure on \"%1\"").arg(args));
  }
  gx_trk_coords->append(std::make_tuple(n, lat, lon, alt));
}
