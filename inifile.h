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

#ifndef INIFILE_H_INCLUDED_
#define INIFILE_H_INCLUDED_

#include <QHash>    // for QHash
#include <QString>  // for QString

#include <utility>  // for move

class InifileSection
{
public:
  QString name;
  QHash<QString, QString> entries;

  InifileSection() = default;
  explicit InifileSection(QString nm) : name{std::move(nm)} {}
};

class inifile_t
{
public:
  QHash<QString, InifileSection> sections;
  QString source;
};

/*
	inifile_init:
	  reads inifile filename into memory
	  myname represents the calling module
	  filename is empty: search for the global trailbook.ini
 */
inifile_t* inifile_init(const QString& filename = QString(), const char* myname = "trailbook");
// parses ini text that is already in memory.
inifile_t* inifile_from_string(const QString& text, const QString& source, const char* myname = "trailbook");
void inifile_done(inifile_t* inifile);

/*
     inifile_readstr:
       returns a null QString if not found, otherwise a non-null but possibly
       empty Qstring with the value of key ...
 */
QString inifile_readstr(const inifile_t* inifile, const char* section, const char* key);

/*
     inifile_readint:
       on success the value is stored into "*value" and "inifile_readint" returns 1,
       otherwise inifile_readint returns 0
 */
int inifile_readint(const inifile_t* inifile, const char* section, const char* key, int* value);

/*
     inifile_readint_def:
       if found inifile_readint_def returns value of key, otherwise a default value "def"
 */
int inifile_readint_def(const inifile_t* inifile, const char* section, const char* key, int def);

double inifile_readdbl_def(const inifile_t* inifile, const char* section, const char* key, double def);

#endif // INIFILE_H_INCLUDED_
