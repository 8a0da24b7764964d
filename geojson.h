/*
    Copyright (C) 2016 Tobias Smolka

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
#ifndef GEOJSON_H_INCLUDED_
#define GEOJSON_H_INCLUDED_

#include <QJsonArray>                // for QJsonArray
#include <QString>                   // for QString, QStringLiteral

#include "defs.h"                    // for TrackPointList, TrackPoint


/*
 * Render geometry is a bare GeoJSON geometry object: a LineString for a
 * track, a Point for a single sample, nothing for an empty list.
 */
class GeoJson
{
public:
  /* Member Functions */

  static QString write_geometry(const TrackPointList& points);

private:
  /* Constants */

  static constexpr double kCoordinateScale = 1.0e6;
  static constexpr double kElevationScale = 10.0;

  /* Member Functions */

  static QJsonArray coordinates_from_point(const TrackPoint& point);

  /* Data Members */

  static inline const QString POINT = QStringLiteral("Point");
  static inline const QString LINESTRING = QStringLiteral("LineString");
  static inline const QString TYPE = QStringLiteral("type");
  static inline const QString COORDINATES = QStringLiteral("coordinates");
};
#endif // GEOJSON_H_INCLUDED_
