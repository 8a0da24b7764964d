/*
    Read and create .zip archives.

    Copyright (C) 2015 Robert Lipe, gpsbabel.org

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

#ifndef SRC_CORE_ZIPARCHIVE_H_INCLUDED_
#define SRC_CORE_ZIPARCHIVE_H_INCLUDED_

#include <optional>          // for optional

#include <QByteArray>        // for QByteArray
#include <QString>           // for QString
#include <QStringList>       // for QStringList

#include <minizip/unzip.h>   // for unzFile
#include <minizip/zip.h>     // for zipFile

namespace trailbook
{

/*
 * Thin wrapper over minizip.  An archive is opened either for reading
 * an existing file or for creating a new one, never both.
 */
class ZipArchive
{
public:
  enum class mode_t {read, create};

  ZipArchive(const QString& filename, mode_t mode);
  ~ZipArchive();
  ZipArchive(const ZipArchive&) = delete;
  ZipArchive& operator=(const ZipArchive&) = delete;
  ZipArchive(ZipArchive&&) = delete;
  ZipArchive& operator=(ZipArchive&&) = delete;

  bool IsValid() const
  {
    return valid_;
  }

  // Reading.  Entry names in archive order; empty if unreadable.
  QStringList Entries();
  std::optional<QByteArray> Extract(const QString& entry_name);

  // Writing.  Returns true on error.
  bool Add(const QString& entry_name, const QByteArray& data);

  void Close();

private:
  static constexpr int kReadChunk = 8192;

  QString filename_;
  mode_t mode_;
  zipFile zipfile_{nullptr};
  unzFile unzfile_{nullptr};
  bool valid_{false};
};

} // namespace trailbook

#endif // SRC_CORE_ZIPARCHIVE_H_INCLUDED_
