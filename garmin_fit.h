/*

    Support for FIT track files.

    Copyright (C) 2011 Paul Brook, paul@nowt.org
    Copyright (C) 2003-2011  Robert Lipe, robertlipe+source@gpsbabel.org
    Copyright (C) 2019 Martin Buck, mb-tmp-tvguho.pbz@gromit.dyndns.org

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
#ifndef GARMIN_FIT_H_INCLUDED_
#define GARMIN_FIT_H_INCLUDED_

#include <cstdint>              // for uint8_t, uint16_t, uint32_t
#include <stdexcept>            // for runtime_error

#include <QByteArray>           // for QByteArray
#include <QHash>                // for QHash
#include <QList>                // for QList
#include <QString>              // for QString
#include <QVariant>             // for QVariant
#include <QtGlobal>             // for qint64, qsizetype

#include "defs.h"
#include "format.h"             // for Format, RawTrack, FitMetadata


class GarminFitFormat : public Format
{
public:
  /* Member Functions */

  RawTrack read(const QByteArray& data) override;

  // CRC-16 as used by the FIT header and file trailer.
  static uint16_t fit_crc16(uint8_t data, uint16_t crc);

  static QString fit_sport_name(int sport);

private:
  /* Types */

  struct fit_field_t {
    int id {};
    int size{};
    int type{};
  };

  struct fit_message_def {
    int endian{};
    int global_id{};
    QList<fit_field_t> fields;
  };

  struct fit_data_t {
    int len{};
    int endian{};
    bool have_timestamp{false};
    uint32_t last_timestamp{};
    uint32_t global_utc_offset{};
    QHash<int, fit_message_def> message_def;
  };

  class ReaderException : public std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /* Constants */

  // constants for global IDs
  static constexpr int kIdFileId = 0;
  static constexpr int kIdDeviceSettings = 2;
  static constexpr int kIdSession = 18;
  static constexpr int kIdRecord = 20;
  static constexpr int kIdCourse = 31;

  // constants for message fields
  // for all global IDs
  static constexpr int kFieldTimestamp = 253;
  // for global ID: file id
  static constexpr int kFieldManufacturer = 1;
  static constexpr int kFieldProduct = 2;
  static constexpr int kFieldTimeCreated = 4;
  // for global ID: device settings
  static constexpr int kFieldUtcOffset = 1;
  // for global ID: session
  static constexpr int kFieldSessionSport = 5;
  // for global ID: record
  static constexpr int kFieldLatitude = 0;
  static constexpr int kFieldLongitude = 1;
  static constexpr int kFieldAltitude = 2;
  static constexpr int kFieldHeartRate = 3;
  static constexpr int kFieldCadence = 4;
  static constexpr int kFieldSpeed = 6;
  static constexpr int kFieldPower = 7;
  static constexpr int kFieldTemperature = 13;
  static constexpr int kFieldEnhancedSpeed = 73;
  static constexpr int kFieldEnhancedAltitude = 78;
  // for global ID: course
  static constexpr int kFieldCourseSport = 4;
  // For developer fields as a non conflicting id
  static constexpr int kFieldInvalid = 255;

  static constexpr int kReadHeaderMinLen = 12;
  static constexpr int kReadHeaderCrcLen = 14;
  // Seconds between the Unix epoch and the FIT epoch, 1989-12-31T00:00:00Z.
  static constexpr qint64 kFitEpochOffset = 631065600;
  // Timestamps below this are relative to device power on.
  static constexpr uint32_t kSystemTimeLimit = 0x10000000;

  /* Member Functions */

  void fit_parse_header();
  void fit_check_file_crc() const;
  uint8_t fit_getuint8();
  uint16_t fit_getuint16();
  uint32_t fit_getuint32();
  QString fit_getstring(int size);
  void fit_parse_definition_message(uint8_t header);
  QVariant fit_read_field(const fit_field_t& f);
  void fit_parse_data(const fit_message_def& def, int time_offset);
  void fit_parse_data_message(uint8_t header);
  void fit_parse_compressed_message(uint8_t header);
  void fit_parse_record();
  static double fit_semi_to_deg(int32_t semicircles);
  static qint64 fit_time_to_msecs(uint32_t fit_time);

  /* Data Members */

  const QByteArray* fin{nullptr};
  qsizetype pos{0};
  fit_data_t fit_data;
  TrackPointList samples;
  FitMetadata metadata;
};

#endif // GARMIN_FIT_H_INCLUDED_
