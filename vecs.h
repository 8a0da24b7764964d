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
#ifndef VECS_H_INCLUDED_
#define VECS_H_INCLUDED_

#include <QByteArray>   // for QByteArray
#include <QList>        // for QList
#include <QString>      // for QString

#include "defs.h"
#include "format.h"     // for Format, RawTrack


class Vecs
{
// Meyers Singleton
public:

  /* Types */

  using FormatFactory = Format* (*)();

  struct vecinfo_t {
    QString name;
    QString desc;
    QString extensions; // list of possible extensions separated by '/'
  };

  /* Special Member Functions */

  static Vecs& Instance();
  Vecs(const Vecs&) = delete;
  Vecs& operator= (const Vecs&) = delete;
  Vecs(Vecs&&) = delete;
  Vecs& operator=(Vecs&&) = delete;

  /* Member Functions */

  /*
   * Decode a file with a fresh reader.  The hint is a format name, a
   * file name or a bare extension, and may be empty.  Without a usable
   * hint the content decides.
   */
  RawTrack parse(const QByteArray& data, const QString& hint) const;
  // Name of the format parse() would use, or empty if there is none.
  QString find_vec(const QByteArray& data, const QString& hint) const;
  static QString sniff(const QByteArray& data);
  QList<vecinfo_t> formats() const;
  void disp_formats() const;

private:
  /* Types */

  struct Impl;                   // Not defined here

  struct vecs_t {
    QString name;
    QString desc;
    QString extensions;
    FormatFactory factory{nullptr};
  };

  /* Special Member Functions */

  explicit Vecs(Impl* i) : d_ptr_(i) {}
  ~Vecs() = default;

  /* Member Functions */

  const vecs_t* find_by_name(const QString& name) const;

  /* Data Members */

  Impl* d_ptr_;                  // Opaque pointer
};
#endif // VECS_H_INCLUDED_
