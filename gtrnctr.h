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
/*
 * Relevant schema definitions can be found at
 * https://www8.garmin.com/xmlschemas/TrainingCenterDatabasev2.xsd
 * https://www8.garmin.com/xmlschemas/ActivityExtensionv2.xsd
 * The v1 History/Run layout is still produced by older devices.
 */
#ifndef GTRNCTR_H_INCLUDED_
#define GTRNCTR_H_INCLUDED_

#include <optional>             // for optional

#include <QByteArray>           // for QByteArray
#include <QList>                // for QList
#include <QString>              // for QString
#include <QStringList>          // for QStringList
#include <QXmlStreamAttributes> // for QXmlStreamAttributes

#include "defs.h"
#include "format.h"             // for Format, RawTrack, TcxMetadata
#include "xmlgeneric.h"         // for xg_cb_type, XmlGenericReader


class GtrnctrFormat : public Format
{
public:
  /* Member Functions */

  RawTrack read(const QByteArray& data) override;

private:
  /* Member Functions */

  void gtc_act_s(const QString& /*unused*/, const QXmlStreamAttributes* attrs);
  void gtc_act_notes(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void gtc_crs_name(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void gtc_trk_lap_s(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/);
  void gtc_trk_pnt_s(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/);
  void gtc_trk_pnt_e(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/);
  void gtc_trk_utc(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void gtc_trk_lat(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void gtc_trk_long(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void gtc_trk_alt(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void gtc_trk_hr(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void gtc_trk_cad(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void gtc_trk_pwr(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void gtc_trk_spd(const QString& args, const QXmlStreamAttributes* /*unused*/);

  /* Data Members */

  static const QStringList gtc_tags_to_ignore;

  std::optional<TrackPoint> wpt_tmp;
  std::optional<double> lat_tmp;
  std::optional<double> lon_tmp;
  TrackPointList samples;
  TcxMetadata metadata;
  int dropped{0};

#define GTC_TRKPT(base) \
    { &GtrnctrFormat::gtc_trk_pnt_s, xg_cb_type::cb_start, base "/Track/Trackpoint" }, \
    { &GtrnctrFormat::gtc_trk_pnt_e, xg_cb_type::cb_end,   base "/Track/Trackpoint" }, \
    { &GtrnctrFormat::gtc_trk_utc, xg_cb_type::cb_cdata, base "/Track/Trackpoint/Time" }, \
    { &GtrnctrFormat::gtc_trk_lat, xg_cb_type::cb_cdata, base "/Track/Trackpoint/Position/LatitudeDegrees" }, \
    { &GtrnctrFormat::gtc_trk_long, xg_cb_type::cb_cdata, base "/Track/Trackpoint/Position/LongitudeDegrees" }, \
    { &GtrnctrFormat::gtc_trk_alt, xg_cb_type::cb_cdata, base "/Track/Trackpoint/AltitudeMeters" }, \
    { &GtrnctrFormat::gtc_trk_hr, xg_cb_type::cb_cdata, base "/Track/Trackpoint/HeartRateBpm" }, \
    { &GtrnctrFormat::gtc_trk_cad, xg_cb_type::cb_cdata, base "/Track/Trackpoint/Cadence" }, \
    { &GtrnctrFormat::gtc_trk_pwr, xg_cb_type::cb_cdata, base "/Track/Trackpoint/Extensions/([^/]+:)?TPX/([^/]+:)?Watts" }, \
    { &GtrnctrFormat::gtc_trk_spd, xg_cb_type::cb_cdata, base "/Track/Trackpoint/Extensions/([^/]+:)?TPX/([^/]+:)?Speed" }

  const QList<XmlGenericReader::xg_fmt_map_entry<GtrnctrFormat>> gtc_map = {
    /* courses tcx v2 */
    { &GtrnctrFormat::gtc_crs_name, xg_cb_type::cb_cdata, "/Courses/Course/Name" },
    GTC_TRKPT("/Courses/Course"),

    /* history tcx v2 (activities) */
    { &GtrnctrFormat::gtc_act_s, xg_cb_type::cb_start, "/Activities/Activity" },
    { &GtrnctrFormat::gtc_act_notes, xg_cb_type::cb_cdata, "/Activities/Activity/Notes" },
    { &GtrnctrFormat::gtc_trk_lap_s, xg_cb_type::cb_start, "/Activities/Activity/Lap" },
    GTC_TRKPT("/Activities/Activity/Lap"),

    /* history tcx v1 */
    { &GtrnctrFormat::gtc_trk_lap_s, xg_cb_type::cb_start, "/History/Run/Lap" },
    GTC_TRKPT("/History/Run/Lap"),
  };

#undef GTC_TRKPT
};

#endif // GTRNCTR_H_INCLUDED_
