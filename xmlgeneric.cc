/*
    Common utilities for XML-based formats.

    Copyright (C) 2004, 2005, 2006, 2007 Robert Lipe, robertlipe@usa.net

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

#include "xmlgeneric.h"

#include <QByteArray>            // for QByteArray
#include <QHash>                 // for QHash
#include <QLatin1Char>           // for QLatin1Char
#include <QStringView>           // for QStringView
#include <QXmlStreamAttributes>  // for QXmlStreamAttributes
#include <QXmlStreamReader>      // for QXmlStreamReader, QXmlStreamReader::Characters, QXmlStreamReader::EndElement, QXmlStreamReader::IncludeChildElements, QXmlStreamReader::StartElement

#include "defs.h"                // for ParseError
#include "src/core/logging.h"    // for gbDebug


/***********************************************************************
 * These implement a simple interface for "generic" XML that
 * maps reasonably close to 1:1 between XML tags and internal data
 * structures.
 *
 * It doesn't work well for formats (like GPX) that really are "real"
 * XML with extended namespaces and such, but it handles many simpler
 * xml strains.
 */

XmlGenericReader::XgCallbackBase*
XmlGenericReader::xml_tbl_lookup(const QString& tag, xg_cb_type cb_type) const
{
  for (const auto& tm : xg_tag_tbl) {
    if (cb_type == tm.cb_type) {
      QRegularExpressionMatch match = tm.tag_re.match(tag);
      if (match.hasMatch()) {
        return tm.tag_cb.get();
      }
    }
  }
  return nullptr;
}

void
XmlGenericReader::xml_common_init(const QStringList& ignorelist, const QStringList& skiplist)
{
  xg_shortcut_taglist.clear();
  for (const auto& tag : ignorelist) {
    xg_shortcut_taglist.insert(tag, xg_shortcut::sc_ignore);
  }
  for (const auto& tag : skiplist) {
    xg_shortcut_taglist.insert(tag, xg_shortcut::sc_skip);
  }
}

XmlGenericReader::xg_shortcut
XmlGenericReader::xml_shortcut(QStringView name) const
{
  return xg_shortcut_taglist.value(name.toString(), xg_shortcut::sc_none);
}

void
XmlGenericReader::xml_run_parser(QXmlStreamReader& reader)
{
  XgCallbackBase* cb;
  QString current_tag;

  while (!reader.atEnd()) {
    switch (reader.tokenType()) {
    case QXmlStreamReader::StartElement:
      switch (xml_shortcut(reader.name())) {
      case xg_shortcut::sc_skip:
        reader.skipCurrentElement();
        goto readnext;
      case xg_shortcut::sc_ignore:
        goto readnext;
      default:
        break;
      }

      current_tag.append(QLatin1Char('/'));
      current_tag.append(reader.qualifiedName());

      cb = xml_tbl_lookup(current_tag, xg_cb_type::cb_start);
      if (cb) {
        const QXmlStreamAttributes attrs = reader.attributes();
        (*cb)(QString(), &attrs);
      }

      cb = xml_tbl_lookup(current_tag, xg_cb_type::cb_cdata);
      if (cb) {
        QString c = reader.readElementText(QXmlStreamReader::IncludeChildElements);
        // readElementText advances the tokenType to QXmlStreamReader::EndElement,
        // thus we will not process the EndElement case as we will issue a readNext first.
        (*cb)(c, nullptr);
        current_tag.chop(reader.qualifiedName().length() + 1);
      }
      break;

    case QXmlStreamReader::EndElement:
      if (xml_shortcut(reader.name()) != xg_shortcut::sc_none) {
        goto readnext;
      }

      cb = xml_tbl_lookup(current_tag, xg_cb_type::cb_end);
      if (cb) {
        (*cb)(reader.name().toString(), nullptr);
      }
      current_tag.chop(reader.qualifiedName().length() + 1);
      break;

    default:
      break;
    }

readnext:
    reader.readNext();
  }
}

// Parses a bytestream.  QXmlStreamReader looks for an <?xml encoding= to
// determine the encoding and falls back to UTF-8 if unspecified.
void
XmlGenericReader::xml_read(const QByteArray& data, const char* myname)
{
  QXmlStreamReader reader(data);

  xml_run_parser(reader);
  if (reader.hasError()) {
    gbDebug(1) << myname << ": XML error at line " << reader.lineNumber()
               << ", column " << reader.columnNumber();
    throw ParseError(ParseError::kind_t::malformed,
                     QStringLiteral("%1: read error: %2 (line %3, col %4)")
                     .arg(QString::fromUtf8(myname), reader.errorString())
                     .arg(reader.lineNumber())
                     .arg(reader.columnNumber()));
  }
}
