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
#ifndef KMZ_H_INCLUDED_
#define KMZ_H_INCLUDED_

#include <QByteArray>   // for QByteArray

#include "format.h"     // for Format, RawTrack


/*
 * A KMZ is a zip archive with the document as its first .kml member.
 * Everything after extraction is handled by KmlFormat.
 */
class KmzFormat : public Format
{
public:
  RawTrack read(const QByteArray& data) override;
};

#endif // KMZ_H_INCLUDED_
