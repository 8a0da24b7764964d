/*
    Shim to move between QDateTime and the epoch millisecond values
    carried by track points.

    Copyright (C) 2012, 2013 Robert Lipe, robertlipe@gpsbabel.org

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
    Foundation, Inc., 59 Temple Place - Suite 330, Boston, MA 02111 USA

 */

#ifndef DATETIME_H_INCLUDED_
#define DATETIME_H_INCLUDED_

#include <optional>              // for optional

#include <QDateTime>             // for QDateTime
#include <QString>               // for QString
#include <QTimeZone>             // for QTimeZone
#include <QtGlobal>              // for qint64

namespace trailbook
{

class DateTime : public QDateTime
{
public:
  DateTime() = default;
  DateTime(const QDateTime& dt) : QDateTime(dt) {}

  static DateTime fromMSecs(qint64 msecs)
  {
    return QDateTime::fromMSecsSinceEpoch(msecs, QTimeZone::utc());
  }

  // Empty if the time could not be parsed or predates the epoch.
  std::optional<qint64> toOptionalMSecs() const
  {
    if (!isValid()) {
      return std::nullopt;
    }
    return toMSecsSinceEpoch();
  }

  bool isValid() const
  {
    return QDateTime::isValid() && toMSecsSinceEpoch() > 0;
  }

  // Like toString, but with subsecond time that's included only when
  // the trailing digits aren't .000.  Always UTC.
  QString toPrettyString() const
  {
    if (time().msec()) {
      return toUTC().toString(QStringLiteral("yyyy-MM-ddTHH:mm:ss.zzzZ"));
    } else {
      return toUTC().toString(QStringLiteral("yyyy-MM-ddTHH:mm:ssZ"));
    }
  }
};

} // namespace trailbook

#endif // DATETIME_H_INCLUDED_
