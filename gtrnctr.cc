/*
    Access Garmin Training Center (Forerunner/Foretracker/Edge) data files.

    Copyright (C) 2006, 2007 Robert Lipe, robertlipe+source@gpsbabel.org

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

#include "gtrnctr.h"

#include <utility>               // for move

#include <QLatin1String>         // for QLatin1String
#include <QString>               // for QString
#include <QStringList>           // for QStringList
#include <QXmlStreamAttributes>  // for QXmlStreamAttributes

#include "defs.h"                // for TrackPoint, xml_parse_time
#include "src/core/logging.h"    // for gbDebug
#include "xmlgeneric.h"          // for XmlGenericReader


#define MYNAME "gtc"

const QStringList GtrnctrFormat::gtc_tags_to_ignore = {
  "TrainingCenterDatabase",
  "CourseFolder",
  "Running",
  "Biking",
  "Other",
  "Multisport"
};

RawTrack
GtrnctrFormat::read(const QByteArray& data)
{
  XmlGenericReader xml_reader;
  xml_reader.xml_init(this, gtc_map, gtc_tags_to_ignore);
  xml_reader.xml_read(data, MYNAME);

  if (dropped > 0) {
    gbDebug(1) << MYNAME ": dropped " << dropped << " trackpoints without a position";
  }

  RawTrack track;
  track.samples = std::move(samples);
  track.metadata = metadata;
  check_samples(track, MYNAME);
  return track;
}

void
GtrnctrFormat::gtc_act_s(const QString& /*unused*/, const QXmlStreamAttributes* attrs)
{
  if (attrs != nullptr && metadata.sport.isEmpty() && attrs->hasAttribute(QLatin1String("Sport"))) {
    metadata.sport = attrs->value(QLatin1String("Sport")).toString();
  }
}

void
GtrnctrFormat::gtc_act_notes(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (metadata.notes.isEmpty()) {
    metadata.notes = args.trimmed();
  }
}

void
GtrnctrFormat::gtc_crs_name(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (metadata.name.isEmpty()) {
    metadata.name = args.trimmed();
  }
}

void
GtrnctrFormat::gtc_trk_lap_s(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/)
{
  metadata.lap_count++;
}

void
GtrnctrFormat::gtc_trk_pnt_s(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/)
{
  wpt_tmp = TrackPoint();
  lat_tmp.reset();
  lon_tmp.reset();
}

void
GtrnctrFormat::gtc_trk_pnt_e(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/)
{
  // Trackpoints that only carry sensor data, e.g. during a pause, have no Position.
  if (wpt_tmp && lat_tmp && lon_tmp && valid_position(*lat_tmp, *lon_tmp)) {
    wpt_tmp->latitude = *lat_tmp;
    wpt_tmp->longitude = *lon_tmp;
    samples.push_back(*wpt_tmp);
  } else {
    dropped++;
  }

  wpt_tmp.reset();
}

void
GtrnctrFormat::gtc_trk_utc(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (wpt_tmp) {
    wpt_tmp->timestamp = xml_parse_time(args).toOptionalMSecs();
  }
}

void
GtrnctrFormat::gtc_trk_lat(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  bool ok;
  double lat = args.toDouble(&ok);
  if (ok) {
    lat_tmp = lat;
  }
}

void
GtrnctrFormat::gtc_trk_long(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  bool ok;
  double lon = args.toDouble(&ok);
  if (ok) {
    lon_tmp = lon;
  }
}

void
GtrnctrFormat::gtc_trk_alt(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (wpt_tmp) {
    wpt_tmp->elevation = args.toDouble();
  }
}

void GtrnctrFormat::gtc_trk_hr(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (wpt_tmp) {
    wpt_tmp->heart_rate = args.trimmed().toInt();
  }
}
void GtrnctrFormat::gtc_trk_cad(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (wpt_tmp) {
    wpt_tmp->cadence = args.toInt();
  }
}

void
GtrnctrFormat::gtc_trk_pwr(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (wpt_tmp) {
    wpt_tmp->power = args.toDouble();
  }
}

void
GtrnctrFormat::gtc_trk_spd(const QString& args, const QXmlStreamAttributes* /*unused*/)
{
  if (wpt_tmp) {
    wpt_tmp->speed = args.toDouble();
  }
}
