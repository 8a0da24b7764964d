/*
    Read zipped KML (KMZ) files.

    Copyright (C) 2024 The trailbook authors

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

#include "kmz.h"

#include <optional>                    // for optional
#include <variant>                     // for get
#include <utility>                     // for move

#include <QByteArray>                  // for QByteArray
#include <QRegularExpression>          // for QRegularExpression, QRegularExpression::CaseInsensitiveOption
#include <QString>                     // for QString
#include <QStringList>                 // for QStringList
#include <QTemporaryFile>              // for QTemporaryFile

#include "defs.h"                      // for ParseError
#include "format.h"                    // for KmzMetadata, KmlMetadata
#include "kml.h"                       // for KmlFormat
#include "src/core/logging.h"          // for gbDebug
#include "src/core/ziparchive.h"       // for ZipArchive


#define MYNAME "kmz"

RawTrack
KmzFormat::read(const QByteArray& data)
{
  // minizip reads from a file, so the payload goes through a temporary one.
  QTemporaryFile ftemp;
  if (!ftemp.open()) {
    throw ParseError(ParseError::kind_t::malformed,
                     QStringLiteral(MYNAME ": cannot create temporary file: %1").arg(ftemp.errorString()));
  }
  if (ftemp.write(data) != data.size() || !ftemp.flush()) {
    throw ParseError(ParseError::kind_t::malformed,
                     QStringLiteral(MYNAME ": cannot write temporary file: %1").arg(ftemp.errorString()));
  }

  trailbook::ZipArchive archive(ftemp.fileName(), trailbook::ZipArchive::mode_t::read);
  if (!archive.IsValid()) {
    throw ParseError(ParseError::kind_t::malformed, MYNAME ": not a readable zip archive");
  }

  static const QRegularExpression kml_re(QStringLiteral("\\.kml$"),
                                         QRegularExpression::CaseInsensitiveOption);
  const QStringList entries = archive.Entries();
  QString entry_name;
  for (const auto& entry : entries) {
    if (kml_re.match(entry).hasMatch()) {
      entry_name = entry;
      break;
    }
  }
  if (entry_name.isEmpty()) {
    throw ParseError(ParseError::kind_t::malformed,
                     QStringLiteral(MYNAME ": no KML entry among %1 archive entries").arg(entries.size()));
  }

  std::optional<QByteArray> kml_bytes = archive.Extract(entry_name);
  archive.Close();
  if (!kml_bytes) {
    throw ParseError(ParseError::kind_t::malformed,
                     QStringLiteral(MYNAME ": cannot extract %1").arg(entry_name));
  }
  if (kml_bytes->trimmed().isEmpty()) {
    throw ParseError(ParseError::kind_t::empty_track,
                     QStringLiteral(MYNAME ": %1 is empty").arg(entry_name));
  }

  gbDebug(1) << MYNAME ": reading " << entry_name << " (" << kml_bytes->size() << " bytes)";

  KmlFormat kml;
  RawTrack inner = kml.read(*kml_bytes);

  RawTrack track;
  track.samples = std::move(inner.samples);
  track.metadata = KmzMetadata{entry_name, std::get<KmlMetadata>(inner.metadata)};
  return track;
}
