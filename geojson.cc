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

#include <cmath>                   // for round

#include <QJsonArray>              // for QJsonArray
#include <QJsonDocument>           // for QJsonDocument, QJsonDocument::Compact
#include <QJsonObject>             // for QJsonObject
#include <QString>                 // for QString

#include "defs.h"
#include "geojson.h"
#include "src/core/logging.h"      // for gbDebug

#define MYNAME "geojson"

QJsonArray
GeoJson::coordinates_from_point(const TrackPoint& point)
{
  QJsonArray coordinates;
  coordinates.append(std::round(point.longitude * kCoordinateScale) / kCoordinateScale);
  coordinates.append(std::round(point.latitude * kCoordinateScale) / kCoordinateScale);
  if (point.elevation.has_value()) {
    coordinates.append(std::round(*point.elevation * kElevationScale) / kElevationScale);
  }
  return coordinates;
}

QString
GeoJson::write_geometry(const TrackPointList& points)
{
  if (points.empty()) {
    return {};
  }

  QJsonObject geometry;
  if (points.size() == 1) {
    geometry[TYPE] = POINT;
    geometry[COORDINATES] = coordinates_from_point(points.front());
  } else {
    geometry[TYPE] = LINESTRING;
    QJsonArray coordinates;
    for (const auto& pt : points) {
      coordinates.append(coordinates_from_point(pt));
    }
    geometry[COORDINATES] = coordinates;
  }

  gbDebug(3) << MYNAME ": wrote " << points.size() << " positions";
  QJsonDocument save(geometry);
  return QString::fromUtf8(save.toJson(QJsonDocument::Compact));
}
