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
#ifndef KML_H_INCLUDED_
#define KML_H_INCLUDED_

#include <cstddef>                     // for size_t
#include <optional>                    // for optional
#include <tuple>                       // for tuple

#include <QByteArray>                  // for QByteArray
#include <QList>                       // for QList
#include <QString>                     // for QString
#include <QStringList>                 // for QStringList
#include <QXmlStreamAttributes>        // for QXmlStreamAttributes
#include <QtGlobal>                    // for qint64

#include "defs.h"
#include "format.h"                    // for Format, RawTrack, KmlMetadata
#include "src/core/datetime.h"         // for DateTime
#include "xmlgeneric.h"                // for xg_cb_type, XmlGenericReader


class KmlFormat : public Format
{
public:
  /* Member Functions */

  RawTrack read(const QByteArray& data) override;

private:
  /* Member Functions */

  void doc_name(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void wpt_s(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/);
  void wpt_e(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/);
  void wpt_name(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void wpt_desc(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void wpt_time(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void wpt_ts_begin(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void wpt_ts_end(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void wpt_coord(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void trk_coord(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void gx_trk_s(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/);
  void gx_trk_e(const QString& /*unused*/, const QXmlStreamAttributes* /*unused*/);
  void gx_trk_when(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void gx_trk_coord(const QString& args, const QXmlStreamAttributes* /*unused*/);
  void interpolate_timespan();

  /* Data Members */

  static const QStringList kml_tags_to_ignore;
  static const QStringList kml_tags_to_skip;

  bool in_placemark{false};
  int placemark_count{0};
  std::optional<TrackPoint> wpt_tmp;
  std::optional<qint64> wpt_when;
  std::size_t placemark_first{0};      /* first line sample of this Placemark */
  bool placemark_has_line{false};

  // The TimeSpan/begin and TimeSpan/end DateTimes:
  trailbook::DateTime wpt_timespan_begin, wpt_timespan_end;

  std::optional<QList<trailbook::DateTime>> gx_trk_times;
  std::optional<QList<std::tuple<int, double, double, double>>> gx_trk_coords;

  TrackPointList trk_samples;
  TrackPointList wpt_samples;
  KmlMetadata metadata;

  const QList<XmlGenericReader::xg_fmt_map_entry<KmlFormat>> kml_map = {
    {&KmlFormat::doc_name, xg_cb_type::cb_cdata, "/name"},
    {&KmlFormat::wpt_s, xg_cb_type::cb_start, "/Placemark"},
    {&KmlFormat::wpt_e, xg_cb_type::cb_end, "/Placemark"},
    {&KmlFormat::wpt_name, xg_cb_type::cb_cdata, "/Placemark/name"},
    {&KmlFormat::wpt_desc, xg_cb_type::cb_cdata, "/Placemark/description"},
    {&KmlFormat::wpt_ts_begin, xg_cb_type::cb_cdata,"/Placemark/TimeSpan/begin"},
    {&KmlFormat::wpt_ts_end, xg_cb_type::cb_cdata, "/Placemark/TimeSpan/end"},
    {&KmlFormat::wpt_time, xg_cb_type::cb_cdata, "/Placemark/TimeStamp/when"},
    // Alias for above used in KML 2.0
    {&KmlFormat::wpt_time, xg_cb_type::cb_cdata, "/Placemark/TimeInstant/timePosition"},
    {&KmlFormat::wpt_coord, xg_cb_type::cb_cdata, "/Placemark/(.+/)?Point/coordinates"},
    {&KmlFormat::trk_coord, xg_cb_type::cb_cdata, "/Placemark/(.+/)?LineString/coordinates"},
    {&KmlFormat::trk_coord, xg_cb_type::cb_cdata, "/Placemark/(.+)/?LinearRing/coordinates"},
    {&KmlFormat::gx_trk_s, xg_cb_type::cb_start, "/Placemark/(.+/)?gx:Track"},
    {&KmlFormat::gx_trk_e, xg_cb_type::cb_end, "/Placemark/(.+/)?gx:Track"},
    {&KmlFormat::gx_trk_when, xg_cb_type::cb_cdata, "/Placemark/(.+/)?gx:Track/when"},
    {&KmlFormat::gx_trk_coord, xg_cb_type::cb_cdata, "/Placemark/(.+/)?gx:Track/gx:coord"},
    {&KmlFormat::gx_trk_s, xg_cb_type::cb_start, "/Placemark/(.+/)?Track"}, // KML 2.3
    {&KmlFormat::gx_trk_e, xg_cb_type::cb_end, "/Placemark/(.+/)?Track"}, // KML 2.3
    {&KmlFormat::gx_trk_when, xg_cb_type::cb_cdata, "/Placemark/(.+/)?Track/when"}, // KML 2.3
    {&KmlFormat::gx_trk_coord, xg_cb_type::cb_cdata, "/Placemark/(.+/)?Track/coord"}, // KML 2.3
  };
};

#endif // KML_H_INCLUDED_
