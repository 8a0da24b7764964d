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

#ifndef XMLGENERIC_H_INCLUDED_
#define XMLGENERIC_H_INCLUDED_

#include <memory>                // for unique_ptr, make_unique
#include <vector>                // for vector

#include <QByteArray>            // for QByteArray
#include <QHash>                 // for QHash
#include <QList>                 // for QList
#include <QRegularExpression>    // for QRegularExpression
#include <QString>               // for QString
#include <QStringList>           // for QStringList
#include <QStringView>           // for QStringView
#include <QXmlStreamAttributes>  // for QXmlStreamAttributes
#include <QXmlStreamReader>      // for QXmlStreamReader


enum class xg_cb_type {
  cb_unknown = 0,
  cb_start,
  cb_cdata,
  cb_end,
};

/*
 *  xml_init builds and owns a table of callbacks from a list of
 *  non-static member functions:
 *
 *  QList<XmlGenericReader::xg_fmt_map_entry<SomeFormat>> some_map = {
 *    {&SomeFormat::memberfn, xg_cb_type::cb_start, "/Placemark"},
 *    {&SomeFormat::otherfn, xg_cb_type::cb_cdata, "/Placemark/coord"},
 *  };
 *
 *  xml_init(this, some_map, ignorelist, skiplist);
 *  xml_read(bytes, MYNAME);
 *
 *  Tag patterns are anchored regular expressions over the path of
 *  qualified element names.  Ignored elements are left out of the path,
 *  skipped elements are left out along with everything inside them.
 */
class XmlGenericReader
{
public:
  /* Types */

  template<class MyFormat>
  struct xg_fmt_map_entry {
    using XgMfpCb = void (MyFormat::*)(const QString&, const QXmlStreamAttributes*);
    xg_fmt_map_entry(XgMfpCb mfp, xg_cb_type ty, const char* tp) : tag_mfp_cb(mfp), cb_type(ty), tag_pattern(tp) {}

    /* Data Members */

    XgMfpCb tag_mfp_cb{nullptr};
    xg_cb_type cb_type{xg_cb_type::cb_unknown};
    const char* tag_pattern{nullptr};
  };

  /* Special Member Functions */

  XmlGenericReader() = default;
  XmlGenericReader(const XmlGenericReader&) = delete;
  XmlGenericReader& operator=(const XmlGenericReader&) = delete;
  XmlGenericReader(XmlGenericReader&&) = delete;
  XmlGenericReader& operator=(XmlGenericReader&&) = delete;
  ~XmlGenericReader() = default;

  /* Member Functions */

  template<class MyFormat>
  void xml_init(MyFormat* instance, const QList<xg_fmt_map_entry<MyFormat>>& tbl,
                const QStringList& ignorelist = QStringList(),
                const QStringList& skiplist = QStringList())
  {
    xg_tag_tbl.clear();
    for (const auto& entry : tbl) {
      xg_tag_map_entry tme;
      tme.tag_cb = std::make_unique<XgFunctor<MyFormat>>(instance, entry.tag_mfp_cb);
      tme.cb_type = entry.cb_type;
      tme.tag_re = QRegularExpression(QRegularExpression::anchoredPattern(QString::fromUtf8(entry.tag_pattern)));
      xg_tag_tbl.push_back(std::move(tme));
    }

    xml_common_init(ignorelist, skiplist);
  }

  // Throws ParseError(malformed) if the document isn't well formed.
  void xml_read(const QByteArray& data, const char* myname);

private:
  /* Types */

  class XgCallbackBase
  {
  public:
    XgCallbackBase() = default;
    virtual ~XgCallbackBase() = default;
    XgCallbackBase(const XgCallbackBase&) = delete;
    XgCallbackBase& operator=(const XgCallbackBase&) = delete;
    XgCallbackBase(XgCallbackBase&&) = delete;
    XgCallbackBase& operator=(XgCallbackBase&&) = delete;

    virtual void operator()(const QString& string, const QXmlStreamAttributes* attrs) const = 0;
  };

  template<class XgFormat>
  class XgFunctor : public XgCallbackBase
  {
  public:
    using XgCb = void (XgFormat::*)(const QString&, const QXmlStreamAttributes*);
    XgFunctor(XgFormat* obj, XgCb cb) : that_(obj), cb_(cb) {}
    void operator()(const QString& string, const QXmlStreamAttributes* attrs) const override
    {
      (that_->*cb_)(string, attrs);
    }

  private:
    XgFormat* that_;
    XgCb cb_;
  };

  struct xg_tag_map_entry {
    std::unique_ptr<XgCallbackBase> tag_cb;
    xg_cb_type cb_type{xg_cb_type::cb_unknown};
    QRegularExpression tag_re;
  };

  enum class xg_shortcut {
    sc_none = 0,
    sc_skip,
    sc_ignore
  };

  /* Member Functions */

  XgCallbackBase* xml_tbl_lookup(const QString& tag, xg_cb_type cb_type) const;
  void xml_common_init(const QStringList& ignorelist, const QStringList& skiplist);
  xg_shortcut xml_shortcut(QStringView name) const;
  void xml_run_parser(QXmlStreamReader& reader);

  /* Data Members */

  std::vector<xg_tag_map_entry> xg_tag_tbl;
  QHash<QString, xg_shortcut> xg_shortcut_taglist;
};

#endif  // XMLGENERIC_H_INCLUDED_
