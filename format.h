/*
    Track file reader interface.

    Copyright (C) 2001-2024 Robert Lipe, robertlipe+source@gpsbabel.org

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
#ifndef FORMAT_H_INCLUDED_
#define FORMAT_H_INCLUDED_

#include <optional>     // for optional
#include <variant>      // for variant

#include <QByteArray>   // for QByteArray
#include <QString>      // for QString

#include "defs.h"       // for TrackPointList


struct GpxMetadata {
  enum class source_t {track, route, waypoint};

  QString name;
  QString description;
  QString type;
  std::optional<qint64> time;
  source_t source{source_t::track};
};

struct TcxMetadata {
  QString sport;                /* Sport attribute of the Activity, verbatim */
  QString notes;
  QString name;                 /* Course name */
  int lap_count{0};
};

struct KmlMetadata {
  QString document_name;
  QString placemark_name;
  QString description;
};

struct KmzMetadata {
  QString entry_name;           /* archive member the KML came from */
  KmlMetadata kml;
};

struct FitMetadata {
  QString sport;                /* lower case, e.g. "running" */
  std::optional<int> manufacturer;
  std::optional<int> product;
  std::optional<qint64> time_created;
  int protocol_version{0};
  int profile_version{0};
};

using FormatMetadata = std::variant<GpxMetadata, TcxMetadata, KmlMetadata, KmzMetadata, FitMetadata>;

/*
 * Format agnostic decode result.  Samples keep source file order and
 * carry only the optional fields the format had.
 */
struct RawTrack {
  TrackPointList samples;
  FormatMetadata metadata;

  const char* format_name() const;
  // Display name from the file content, with a per format fallback.
  QString name() const;
  // Lower case activity type the file declared, or empty.
  QString activity_type() const;
};

class Format
{
public:
  Format() = default;
  virtual ~Format() = default;
  // To prevent slicing we delete the copy and move operations.
  Format(const Format&) = delete;
  Format& operator=(const Format&) = delete;
  Format(Format&&) = delete;
  Format& operator=(Format&&) = delete;

  /*******************************************************************************
  * %%%                         entry point                                  %%% *
  *******************************************************************************/

  /*
   * Decode one complete file.  A reader never returns a track without
   * samples; anything it can't use is reported as a ParseError.
   */
  virtual RawTrack read(const QByteArray& data) = 0;

  /*******************************************************************************
  * %%%                          Accessors                                   %%% *
  *******************************************************************************/

  QString get_name() const
  {
    return name;
  }

  void set_name(const QString& nm)
  {
    name = nm;
  }

protected:
  static bool valid_position(double lat, double lon);
  // Throws ParseError(empty_track) when nothing survived.
  static void check_samples(const RawTrack& track, const char* myname);

private:
  QString name;
};

#endif // FORMAT_H_INCLUDED_
