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
#ifndef GPX_H_INCLUDED_
#define GPX_H_INCLUDED_

#include <optional>                    // for optional

#include <QByteArray>                  // for QByteArray
#include <QHash>                       // for QHash
#include <QString>                     // for QString
#include <QStringView>                 // for QStringView
#include <QXmlStreamAttributes>        // for QXmlStreamAttributes
#include <QXmlStreamReader>            // for QXmlStreamReader

#include "defs.h"
#include "format.h"                    // for Format, RawTrack, GpxMetadata


class GpxFormat : public Format
{
public:
  /* Member Functions */

  RawTrack read(const QByteArray& data) override;

private:
  /* Types */

  enum class tag_type {
    unknown = 0,
    gpx,
    name,
    desc,
    time,

    wpt,
    rte_rtept,
    trk,
    trk_name,
    trk_desc,
    trk_type,
    trk_trkseg_trkpt,

    pt_ele,
    pt_time,
    pt_speed,
    pt_heartrate,
    pt_cadence,
    pt_temperature,
    pt_power
  };

  /* Member Functions */

  tag_type get_tag(const QString& t) const;
  QString qualifiedName() const;
  void tag_wpt(const QXmlStreamAttributes& attr);
  void gpx_start(const QXmlStreamAttributes& attr);
  void gpx_end();
  void gpx_cdata(QStringView s);

  /* Data Members */

  QXmlStreamReader* reader{nullptr};
  QString current_tag;
  QString cdatastr;

  std::optional<TrackPoint> wpt_tmp;
  bool wpt_tmp_valid{false};
  int trk_count{0};
  QString trk_name;
  QString trk_desc;

  TrackPointList trk_samples;
  TrackPointList rte_samples;
  TrackPointList wpt_samples;
  GpxMetadata metadata;

  /*
   * xpath(ish) mappings between full tag paths and internal identifiers.
   * If it's not a tag we explicitly handle, it doesn't go here.
   */

  /* /gpx/<name> for GPX 1.0, /gpx/metadata/<name> for GPX 1.1 */
#define METATAG(type,name) \
  {"/gpx/" name, type}, \
  {"/gpx/metadata/" name, type}

#define GPXWPTTYPETAG(name,type) \
  {"/gpx/wpt/" name, type}, \
  {"/gpx/trk/trkseg/trkpt/" name, type}, \
  {"/gpx/rte/rtept/" name, type}

#define GARMIN_TRKPT_EXT "/gpx/trk/trkseg/trkpt/extensions/gpxtpx:TrackPointExtension"

  const QHash<QString, tag_type> hash = {
    {"/gpx", tag_type::gpx},
    METATAG(tag_type::name, "name"),
    METATAG(tag_type::desc, "desc"),
    METATAG(tag_type::time, "time"),

    {"/gpx/wpt", tag_type::wpt},
    {"/gpx/rte/rtept", tag_type::rte_rtept},

    {"/gpx/trk", tag_type::trk},
    {"/gpx/trk/name", tag_type::trk_name},
    {"/gpx/trk/desc", tag_type::trk_desc},
    {"/gpx/trk/type", tag_type::trk_type},
    {"/gpx/trk/trkseg/trkpt", tag_type::trk_trkseg_trkpt},

    GPXWPTTYPETAG("ele", tag_type::pt_ele),
    GPXWPTTYPETAG("time", tag_type::pt_time),
    /* GPX 1.0 only */
    {"/gpx/trk/trkseg/trkpt/speed", tag_type::pt_speed},

    {GARMIN_TRKPT_EXT "/gpxtpx:hr", tag_type::pt_heartrate},
    {GARMIN_TRKPT_EXT "/gpxtpx:cad", tag_type::pt_cadence},
    {GARMIN_TRKPT_EXT "/gpxtpx:atemp", tag_type::pt_temperature},
    {GARMIN_TRKPT_EXT "/gpxtpx:speed", tag_type::pt_speed},
    {"/gpx/trk/trkseg/trkpt/extensions/power", tag_type::pt_power},
  };

#undef METATAG
#undef GPXWPTTYPETAG
#undef GARMIN_TRKPT_EXT
};

#endif // GPX_H_INCLUDED_
