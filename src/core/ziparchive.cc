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

#include "src/core/ziparchive.h"

#include <optional>                // for optional, nullopt

#include <QByteArray>              // for QByteArray
#include <QString>                 // for QString
#include <QStringList>             // for QStringList

#include <minizip/unzip.h>         // for unzOpen64, unzGoToFirstFile, unzReadCurrentFile...
#include <minizip/zip.h>           // for zipOpen64, zipOpenNewFileInZip64, zipWriteInFileInZip...
#include <zlib.h>                  // for Z_DEFLATED, Z_DEFAULT_COMPRESSION

#include "defs.h"
#include "src/core/logging.h"      // for Warning, gbDebug

namespace trailbook
{

ZipArchive::ZipArchive(const QString& filename, mode_t mode)
  : filename_(filename), mode_(mode)
{
  if (mode_ == mode_t::create) {
    zipfile_ = zipOpen64(CSTR(filename_), APPEND_STATUS_CREATE);
    valid_ = zipfile_ != nullptr;
  } else {
    unzfile_ = unzOpen64(CSTR(filename_));
    valid_ = unzfile_ != nullptr;
  }
  if (!valid_) {
    gbDebug(1) << "zip: can't open" << filename_;
  }
}

ZipArchive::~ZipArchive()
{
  Close();
}

void ZipArchive::Close()
{
  if (zipfile_ != nullptr) {
    if (zipClose(zipfile_, nullptr) != ZIP_OK) {
      Warning() << "zip: error closing" << filename_;
    }
    zipfile_ = nullptr;
  }
  if (unzfile_ != nullptr) {
    unzClose(unzfile_);
    unzfile_ = nullptr;
  }
  valid_ = false;
}

QStringList ZipArchive::Entries()
{
  QStringList names;
  if (unzfile_ == nullptr) {
    return names;
  }

  for (int err = unzGoToFirstFile(unzfile_); err == UNZ_OK; err = unzGoToNextFile(unzfile_)) {
    unz_file_info64 info;
    char name[512];
    if (unzGetCurrentFileInfo64(unzfile_, &info, name, sizeof(name), nullptr, 0, nullptr, 0) != UNZ_OK) {
      Warning() << "zip: damaged directory in" << filename_;
      break;
    }
    names.append(QString::fromUtf8(name));
  }
  return names;
}

std::optional<QByteArray> ZipArchive::Extract(const QString& entry_name)
{
  if (unzfile_ == nullptr) {
    return std::nullopt;
  }
  if (unzLocateFile(unzfile_, CSTR(entry_name), 1) != UNZ_OK) {
    return std::nullopt;
  }
  if (unzOpenCurrentFile(unzfile_) != UNZ_OK) {
    return std::nullopt;
  }

  QByteArray data;
  char buf[kReadChunk];
  int n;
  while ((n = unzReadCurrentFile(unzfile_, buf, sizeof(buf))) > 0) {
    data.append(buf, n);
  }
  // Closing verifies the CRC of what was read.
  int close_err = unzCloseCurrentFile(unzfile_);
  if (n < 0 || close_err != UNZ_OK) {
    Warning() << "zip: error reading" << entry_name << "from" << filename_;
    return std::nullopt;
  }
  return data;
}

bool ZipArchive::Add(const QString& entry_name, const QByteArray& data)
{
  if (zipfile_ == nullptr) {
    return true;
  }

  zip_fileinfo zi = {};

  int err = zipOpenNewFileInZip64(zipfile_, CSTR(entry_name), &zi,
                                  nullptr, 0, nullptr, 0, nullptr,
                                  Z_DEFLATED,
                                  Z_DEFAULT_COMPRESSION,
                                  0);
  if (err != ZIP_OK) {
    Warning() << "zip: error adding" << entry_name << "to" << filename_;
    return true;
  }
  if (zipWriteInFileInZip(zipfile_, data.constData(), data.size()) != ZIP_OK) {
    Warning() << "zip: error writing" << entry_name << "to" << filename_;
    zipCloseFileInZip(zipfile_);
    return true;
  }
  if (zipCloseFileInZip(zipfile_) != ZIP_OK) {
    Warning() << "zip: error closing" << entry_name << "in" << filename_;
    return true;
  }
  return false;
}

} // namespace trailbook
