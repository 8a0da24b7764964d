/*
    Copyright (C) 2013 Robert Lipe, robertlipe+source@gpsbabel.org

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

#ifndef SRC_CORE_FILE_INCLUDED_H_
#define SRC_CORE_FILE_INCLUDED_H_

#include <QFile>            // for QFile
#include <QFileInfo>        // for QFileInfo
#include <QIODevice>        // for QIODevice
#include <QStringBuilder>   // for operator%

#include "defs.h"               // for fatal
#include "src/core/logging.h"   // for FatalMsg

// A QFile that refuses to continue when it can't be opened.
// Only for use at the command line and configuration boundary.

namespace trailbook
{

class File : public QFile
{
public:
  explicit File(const QString& s) : QFile(s) {}

  /* we assume WriteOnly or ReadOnly, not ReadWrite */
  bool open(OpenMode mode) override
  {
    bool status;

    if (QFile::fileName() == "-") {
      if (mode & QIODevice::WriteOnly) {
        status = QFile::open(stdout, mode);
      } else {
        status = QFile::open(stdin, mode);
      }
    } else {
      status = QFile::open(mode);
    }

    if (!status) {
      fatal(FatalMsg().noquote() << "Cannot open '" %
            QFileInfo(*this).absoluteFilePath() %
            "' for " %
            (mode & QIODevice::WriteOnly ? "write" : "read") %
            ".  Error was '" %
            QFile::errorString()  %
            "'.");
    }
    return status;
  }
};

} // namespace trailbook

#endif // SRC_CORE_FILE_INCLUDED_H_
