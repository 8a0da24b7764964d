/*
    Access GPX data files.

    Copyright (C) 2002-2015 Robert Lipe, gpsbabel.org

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

#include "gpx.h"

#include <cmath>                       // for lround
#include <cstdio>                      // for sscanf
#include <cstring>                     // for strchr
#include <utility>                     // for move

#include <QByteArray>                  // for QByteArray
#include <QDate>                       // for QDate
#include <QDateTime>                   // for QDateTime
#include <QHash>                       // for QHash
#include <QLatin1Char>                 // for QLatin1Char
#include <QLatin1String>               // for QLatin1String
#include <QString>                     // for QString, QStringLiteral
#include <QStringView>                 // for QStringView
#include <QTime>                       // for QTime
#include <QTimeZone>                   // for QTimeZone
#include <QXmlStreamAttributes>        // for QXmlStreamAttributes
#include <QXmlStreamReader>            // for QXmlStreamReader, QXmlStreamReader::Characters, QXmlStreamReader::EndElement, QXmlStreamReader::StartElement

#include "defs.h"
#include "src/core/datetime.h"         // for DateTime
#include "src/core/logging.h"          // for gbDebug


#define MYNAME "gpx"

GpxFormat::tag_type
GpxFormat::get_tag(const QString& t) const
{
  return hash.value(t, tag_type::unknown);
}

void
GpxFormat::tag_wpt(const QXmlStreamAttributes& attr)
{
  bool lat_ok = false;
  bool lon_ok = false;

  wpt_tmp = TrackPoint();
  if (attr.hasAttribute(QLatin1String("lat"))) {
    wpt_tmp->latitude = attr.value(QLatin1String("lat")).toDouble(&lat_ok);
  }
  if (attr.hasAttribute(QLatin1String("lon"))) {
    wpt_tmp->longitude = attr.value(QLatin1String("lon")).toDouble(&lon_ok);
  }
  wpt_tmp_valid = lat_ok && lon_ok;
}

void
GpxFormat::gpx_start(const QXmlStreamAttributes& attr)
{
  /*
   * Reset end-of-string without actually emptying/reallocing cdatastr.
   */
  cdatastr = QString();

  switch (get_tag(current_tag)) {
  case tag_type::wpt:
  case tag_type::rte_rtept:
  case tag_type::trk_trkseg_trkpt:
    tag_wpt(attr);
    break;
  case tag_type::trk:
    trk_count++;
    break;
  default:
    break;
  }
}

trailbook::DateTime
xml_parse_time(const QString& dateTimeString)
{
  int off_hr = 0;
  int off_min = 0;
  int off_sign = 1;

  QByteArray dts = dateTimeString.trimmed().toUtf8();
  char* timestr = dts.data();

  char* offsetstr = strchr(timestr, 'Z');
  if (offsetstr) {
    /* zulu time; offsets stay at defaults */
    *offsetstr = '\0';
  } else {
    offsetstr = strchr(timestr, '+');
    if (offsetstr) {
      /* positive offset; parse it */
      *offsetstr = '\0';
      sscanf(offsetstr + 1, "%d:%d", &off_hr, &off_min);
    } else {
      offsetstr = strchr(timestr, 'T');
      if (offsetstr) {
        offsetstr = strchr(offsetstr, '-');
        if (offsetstr) {
          /* negative offset; parse it */
          *offsetstr = '\0';
          sscanf(offsetstr + 1, "%d:%d", &off_hr, &off_min);
          off_sign = -1;
        }
      }
    }
  }

  double fsec = 0;
  char* pointstr = strchr(timestr, '.');
  if (pointstr) {
    sscanf(pointstr, "%le", &fsec);
    *pointstr = '\0';
  }

  int year = 0;
  int mon = 1;
  int mday = 1;
  int hour = 0;
  int min = 0;
  int sec = 0;
  trailbook::DateTime dt;
  int res = sscanf(timestr, "%d-%d-%dT%d:%d:%d", &year, &mon, &mday, &hour,
                   &min, &sec);
  if (res > 0) {
    QDate date(year, mon, mday);
    QTime time(hour, min, sec);
    dt = QDateTime(date, time, QTimeZone::utc());

    // Fractional part of time.
    if (fsec != 0) {
      dt = dt.addMSecs(std::lround(fsec * 1000));
    }

    // Any offsets that were stuck at the end.
    dt = dt.addSecs(-off_sign * off_hr * 3600 - off_sign * off_min * 60);
  }
  return dt;
}

void
GpxFormat::gpx_end()
{
  // Remove leading, trailing whitespace.
  cdatastr = cdatastr.trimmed();

  switch (get_tag(current_tag)) {
  /*
   * First, the tags that are file-global.
   */
  case tag_type::name:
    if (metadata.name.isEmpty()) {
      metadata.name = cdatastr;
    }
    break;
  case tag_type::desc:
    if (metadata.description.isEmpty()) {
      metadata.description = cdatastr;
    }
    break;
  case tag_type::time:
    metadata.time = xml_parse_time(cdatastr).toOptionalMSecs();
    break;

  /*
   * Track-specific tags.  Only the first track names the activity.
   */
  case tag_type::trk_name:
    if (trk_count == 1 && trk_name.isEmpty()) {
      trk_name = cdatastr;
    }
    break;
  case tag_type::trk_desc:
    if (trk_count == 1 && trk_desc.isEmpty()) {
      trk_desc = cdatastr;
    }
    break;
  case tag_type::trk_type:
    if (trk_count == 1 && metadata.type.isEmpty()) {
      metadata.type = cdatastr;
    }
    break;

  /*
   * Point tags, shared by wpt, rtept and trkpt.
   */
  case tag_type::wpt:
  case tag_type::rte_rtept:
  case tag_type::trk_trkseg_trkpt: {
    TrackPointList* list = &wpt_samples;
    if (get_tag(current_tag) == tag_type::trk_trkseg_trkpt) {
      list = &trk_samples;
    } else if (get_tag(current_tag) == tag_type::rte_rtept) {
      list = &rte_samples;
    }
    if (wpt_tmp && wpt_tmp_valid && valid_position(wpt_tmp->latitude, wpt_tmp->longitude)) {
      list->push_back(*wpt_tmp);
    } else {
      gbDebug(2) << MYNAME ": dropping point without a valid position";
    }
    wpt_tmp.reset();
    break;
  }
  case tag_type::pt_ele:
    if (wpt_tmp) {
      bool ok;
      double ele = cdatastr.toDouble(&ok);
      if (ok) {
        wpt_tmp->elevation = ele;
      }
    }
    break;
  case tag_type::pt_time:
    if (wpt_tmp) {
      wpt_tmp->timestamp = xml_parse_time(cdatastr).toOptionalMSecs();
    }
    break;
  case tag_type::pt_speed:
    if (wpt_tmp) {
      wpt_tmp->speed = cdatastr.toDouble();
    }
    break;
  case tag_type::pt_heartrate:
    if (wpt_tmp) {
      wpt_tmp->heart_rate = cdatastr.toInt();
    }
    break;
  case tag_type::pt_cadence:
    if (wpt_tmp) {
      wpt_tmp->cadence = cdatastr.toInt();
    }
    break;
  case tag_type::pt_temperature:
    if (wpt_tmp) {
      wpt_tmp->temperature = cdatastr.toDouble();
    }
    break;
  case tag_type::pt_power:
    if (wpt_tmp) {
      wpt_tmp->power = cdatastr.toDouble();
    }
    break;
  default:
    break;
  }
}

void
GpxFormat::gpx_cdata(QStringView s)
{
  cdatastr += s.toString();
}

QString
GpxFormat::qualifiedName() const
{
  /* The prefixes used in our hash table may not match those used in the input
   * file.  So we map from the namespaceUris to the prefixes used in our
   * hash table.
   */
  static const QHash<QString, QString> tag_ns_prefixes = {
    {"http://www.garmin.com/xmlschemas/TrackPointExtension/v1", "gpxtpx"},
    {"http://www.garmin.com/xmlschemas/TrackPointExtension/v2", "gpxtpx"},
  };

  if (auto uri = reader->namespaceUri().toString(); tag_ns_prefixes.contains(uri)) {
    return QStringLiteral("%1:%2").arg(tag_ns_prefixes.value(uri), reader->name());
  } else {
    return reader->qualifiedName().toString();
  }
}

RawTrack
GpxFormat::read(const QByteArray& data)
{
  QXmlStreamReader xml(data);
  reader = &xml;
  current_tag.clear();
  cdatastr = QString();

  for (bool atEnd = false; !reader->atEnd() && !atEnd;) {
    reader->readNext();
    // do processing
    switch (reader->tokenType()) {
    case QXmlStreamReader::StartElement:
      current_tag.append(QLatin1Char('/'));
      current_tag.append(qualifiedName());
      gpx_start(reader->attributes());
      break;

    case QXmlStreamReader::EndElement:
      gpx_end();
      current_tag.chop(qualifiedName().length() + 1);
      cdatastr.clear();
      break;

    case QXmlStreamReader::Characters:
      gpx_cdata(reader->text());
      break;

    // To avoid reading an Invalid token after the EndDocument
    // we quit reading when we see the EndDocument.
    case QXmlStreamReader::EndDocument:
    case QXmlStreamReader::Invalid:
      atEnd = true;
      break;

    default:
      break;
    }
  }

  reader = nullptr;
  if (xml.hasError()) {
    throw ParseError(ParseError::kind_t::malformed,
                     QStringLiteral(MYNAME ": read error: %1 (line %2, col %3)")
                     .arg(xml.errorString())
                     .arg(xml.lineNumber())
                     .arg(xml.columnNumber()));
  }

  if (metadata.name.isEmpty()) {
    metadata.name = trk_name;
  }
  if (!trk_desc.isEmpty()) {
    metadata.description = trk_desc;
  }

  RawTrack track;
  if (!trk_samples.empty()) {
    track.samples = std::move(trk_samples);
    metadata.source = GpxMetadata::source_t::track;
  } else if (!rte_samples.empty()) {
    track.samples = std::move(rte_samples);
    metadata.source = GpxMetadata::source_t::route;
  } else {
    track.samples = std::move(wpt_samples);
    metadata.source = GpxMetadata::source_t::waypoint;
  }
  track.metadata = metadata;

  check_samples(track, MYNAME);
  return track;
}
