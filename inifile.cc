/*
    Library for inifile like data files.

    Copyright (C) 2006 Olaf Klein, o.b.klein@gpsbabel.org

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

#include "defs.h"              // for fatal, warning
#include "inifile.h"
#include "src/core/file.h"     // for File
#include <QByteArray>          // for QByteArray
#include <QChar>               // for operator==, QChar
#include <QDir>                // for QDir
#include <QFile>               // for QFile
#include <QFileInfo>           // for QFileInfo
#include <QHash>               // for QHash
#include <QIODevice>           // for QIODevice::ReadOnly, QIODevice
#include <QTextStream>         // for QTextStream
#include <QtGlobal>            // for qPrintable, qEnvironmentVariable

#define MYNAME "inifile"

/* internal procedures */

#define TRAILBOOK_INIFILE "trailbook.ini"
#define TRAILBOOK_SUBDIR ".trailbook"


static QString
find_trailbook_inifile(const QString& path)  /* can be empty or NULL */
{
  if (path.isNull()) {
    return QString();
  }
  QString inipath(QDir(path).filePath(TRAILBOOK_INIFILE));
  return QFile(inipath).open(QIODevice::ReadOnly) ? inipath : QString();
}

static QString
open_trailbook_inifile()
{
  QString res;

  QString envstr = qEnvironmentVariable("TRAILBOOKINI");
  if (!envstr.isNull()) {
    if (QFile(envstr).open(QIODevice::ReadOnly)) {
      return envstr;
    }
    warning("WARNING: trailbook inifile, defined in environment, NOT found!\n");
    return res;
  }
  QString name = find_trailbook_inifile("");  // Check in current directory first.
  if (name.isNull()) {
    // Use &&'s early-out behaviour to try successive file locations: first
    // ~/.trailbook, then /usr/local/etc, then /etc.
    (name = find_trailbook_inifile(QDir::home().filePath(TRAILBOOK_SUBDIR))).
    isNull()
    && (name = find_trailbook_inifile("/usr/local/etc")).isNull()
    && (name = find_trailbook_inifile("/etc")).isNull();
  }
  if (!name.isNull()) {
    res = name;
  }
  return res;
}

static void
inifile_load_file(QTextStream* stream, inifile_t* inifile, const char* myname)
{
  QString buf;
  InifileSection section;

  while (!(buf = stream->readLine()).isNull()) {
    buf = buf.trimmed();

    if (buf.isEmpty()) {
      continue;  /* skip empty lines */
    }
    if ((buf.at(0) == '#') || (buf.at(0) == ';')) {
      continue;  /* skip comments */
    }

    if (buf.at(0) == '[') {
      QString section_name;
      if (buf.contains(']')) {
        section_name = buf.mid(1, buf.indexOf(']') - 1).trimmed();
      }
      if (section_name.isEmpty()) {
        fatal("%s: invalid section header '%s' in '%s'.\n", myname, qPrintable(buf),
              qPrintable(inifile->source));
      }

      // form lowercase key to implement CaseInsensitive matching.
      section_name = section_name.toLower();
      if (!inifile->sections.contains(section_name)) {
        inifile->sections.insert(section_name, InifileSection(section_name));
      }
      section = inifile->sections.value(section_name);
    } else {
      if (section.name.isEmpty()) {
        fatal("%s: missing section header in '%s'.\n", myname,
              qPrintable(inifile->source));
      }

      // Store key in lower case to implement CaseInsensitive matching.
      QString key = buf.section('=', 0, 0).trimmed().toLower();
      // Force value to be non-null but possibly empty so a found key
      // without a value differs from a key that isn't found.
      QString value = buf.section('=', 1).append("").trimmed();
      section.entries.insert(key, value);

      // update the QHash sections with the modified InifileSection section.
      inifile->sections.insert(section.name, section);
    }
  }
}

static QString
inifile_find_value(const inifile_t* inifile, const QString& sec_name, const QString& key)
{
  if (inifile == nullptr) {
    return QString();
  }

  // CaseInsensitive matching implemented by forcing sec_name & key to lower case.
  return inifile->sections.value(sec_name.toLower()).entries.value(key.toLower());
}

/* public procedures */

inifile_t*
inifile_init(const QString& filename, const char* myname)
{
  QString name;

  if (filename.isEmpty()) {
    name = open_trailbook_inifile();
    if (name.isEmpty()) {
      return nullptr;
    }
  } else {
    name = filename;
  }

  trailbook::File file(name);
  file.open(QFile::ReadOnly);
  QTextStream stream(&file);
  stream.setAutoDetectUnicode(true);

  auto* result = new inifile_t;
  QFileInfo fileinfo(file);
  result->source = fileinfo.absoluteFilePath();
  inifile_load_file(&stream, result, myname);

  file.close();
  return result;
}

inifile_t*
inifile_from_string(const QString& text, const QString& source, const char* myname)
{
  QString buffer(text);
  QTextStream stream(&buffer, QIODevice::ReadOnly);

  auto* result = new inifile_t;
  result->source = source;
  inifile_load_file(&stream, result, myname);
  return result;
}

void
inifile_done(inifile_t* inifile)
{
  delete inifile;
}

QString
inifile_readstr(const inifile_t* inifile, const char* section, const char* key)
{
  return inifile_find_value(inifile, section, key);
}

int
inifile_readint(const inifile_t* inifile, const char* section, const char* key, int* value)
{
  const QString str = inifile_find_value(inifile, section, key);

  if (str.isNull()) {
    return 0;
  }

  if (value != nullptr) {
    *value = str.toInt();
  }
  return 1;
}

int
inifile_readint_def(const inifile_t* inifile, const char* section, const char* key, const int def)
{
  int result;

  if (inifile_readint(inifile, section, key, &result) == 0) {
    return def;
  } else {
    return result;
  }
}

double
inifile_readdbl_def(const inifile_t* inifile, const char* section, const char* key, const double def)
{
  const QString str = inifile_find_value(inifile, section, key);

  bool ok = false;
  double result = str.toDouble(&ok);
  if (str.isNull() || !ok) {
    if (!str.isNull()) {
      warning(MYNAME ": ignoring non numeric value '%s' for %s.%s.\n", qPrintable(str), section, key);
    }
    return def;
  }
  return result;
}
