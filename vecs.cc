/*
    Describe vectors containing file operations.

    Copyright (C) 2002, 2004, 2005, 2006, 2007 Robert Lipe, robertlipe+source@gpsbabel.org

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

#include "vecs.h"

#include <cstdio>              // for printf
#include <memory>              // for unique_ptr
#include <type_traits>         // for is_base_of

#include <QByteArray>          // for QByteArray
#include <QLatin1String>       // for QLatin1String
#include <QList>               // for QList
#include <QString>             // for QString
#include <QStringList>         // for QStringList
#include <QXmlStreamReader>    // for QXmlStreamReader, QXmlStreamReader::StartElement

#include "defs.h"              // for ParseError, CSTR
#include "format.h"            // for Format, RawTrack
#include "garmin_fit.h"        // for GarminFitFormat
#include "gpx.h"               // for GpxFormat
#include "gtrnctr.h"           // for GtrnctrFormat
#include "kml.h"               // for KmlFormat
#include "kmz.h"               // for KmzFormat
#include "src/core/logging.h"  // for gbDebug


#define MYNAME "vecs"

template <typename T>
Format* fmtfactory()
{
  static_assert(std::is_base_of<Format, T>::value, "T must be derived from Format");
  return new T;
}

struct Vecs::Impl {
  const QList<vecs_t> vec_list = {
    {
      "gpx",
      "GPS XML format",
      "gpx",
      &fmtfactory<GpxFormat>
    },
    {
      "tcx",
      "Garmin Training Center (.tcx)",
      "tcx/crs/hst",
      &fmtfactory<GtrnctrFormat>
    },
    {
      "kml",
      "Google Earth (Keyhole) Markup Language",
      "kml",
      &fmtfactory<KmlFormat>
    },
    {
      "kmz",
      "Zipped Google Earth (Keyhole) Markup Language",
      "kmz",
      &fmtfactory<KmzFormat>
    },
    {
      "fit",
      "Flexible and Interoperable Data Transfer (FIT) Activity file",
      "fit",
      &fmtfactory<GarminFitFormat>
    },
  };
};

Vecs& Vecs::Instance()
{
  static Impl impl;
  static Vecs instance(&impl);
  return instance;
}

const Vecs::vecs_t* Vecs::find_by_name(const QString& name) const
{
  for (const auto& vec : d_ptr_->vec_list) {
    if (name.compare(vec.name, Qt::CaseInsensitive) == 0) {
      return &vec;
    }
  }
  return nullptr;
}

/*
 * Identify a buffer by its leading bytes.  FIT carries a signature in
 * its header, KMZ is a zip local file header, and the XML formats are
 * told apart by their root element.
 */
QString Vecs::sniff(const QByteArray& data)
{
  if (data.size() >= 12 && data.mid(8, 4) == ".FIT") {
    return QStringLiteral("fit");
  }
  if (data.startsWith(QByteArray("PK\x03\x04", 4))) {
    return QStringLiteral("kmz");
  }

  QXmlStreamReader reader(data);
  while (!reader.atEnd()) {
    if (reader.readNext() == QXmlStreamReader::StartElement) {
      const auto root = reader.name();
      if (root == QLatin1String("gpx")) {
        return QStringLiteral("gpx");
      }
      if (root == QLatin1String("TrainingCenterDatabase")) {
        return QStringLiteral("tcx");
      }
      if (root == QLatin1String("kml")) {
        return QStringLiteral("kml");
      }
      break;
    }
  }
  return {};
}

QString Vecs::find_vec(const QByteArray& data, const QString& hint) const
{
  if (!hint.isEmpty()) {
    if (const vecs_t* vec = find_by_name(hint)) {
      return vec->name;
    }
    for (const auto& vec : d_ptr_->vec_list) {
      const QStringList extensions = vec.extensions.split('/');
      for (const auto& ext : extensions) {
        if (hint.endsWith(QLatin1Char('.') + ext, Qt::CaseInsensitive)) {
          return vec.name;
        }
      }
    }
    gbDebug(1) << MYNAME ": hint " << hint << " matches no format, sniffing content";
  }
  return sniff(data);
}

RawTrack Vecs::parse(const QByteArray& data, const QString& hint) const
{
  if (data.isEmpty()) {
    throw ParseError(ParseError::kind_t::empty_track, MYNAME ": file is empty");
  }

  const QString fmtname = find_vec(data, hint);
  const vecs_t* vec = fmtname.isEmpty() ? nullptr : find_by_name(fmtname);
  if (vec == nullptr) {
    throw ParseError(ParseError::kind_t::unsupported_format,
                     QStringLiteral(MYNAME ": cannot determine the format of %1").arg(hint.isEmpty() ? QStringLiteral("input") : hint));
  }

  gbDebug(1) << MYNAME ": reading " << data.size() << " bytes as " << vec->name;
  std::unique_ptr<Format> fmt(vec->factory());
  fmt->set_name(vec->name);
  return fmt->read(data);
}

QList<Vecs::vecinfo_t> Vecs::formats() const
{
  QList<vecinfo_t> svp;
  for (const auto& vec : d_ptr_->vec_list) {
    svp.append({vec.name, vec.desc, vec.extensions});
  }
  return svp;
}

void Vecs::disp_formats() const
{
  const auto svp = formats();
  for (const auto& vec : svp) {
    printf("%s\t%s\t%s\n", CSTR(vec.name), CSTR(vec.extensions), CSTR(vec.desc));
  }
}
