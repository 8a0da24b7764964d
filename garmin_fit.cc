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

#include "garmin_fit.h"

#include <cstdint>              // for int32_t, int8_t, uint16_t, uint32_t, uint8_t
#include <string>               // for operator+, to_string
#include <utility>              // for move

#include <QByteArray>           // for QByteArray
#include <QString>              // for QString, QStringLiteral
#include <QVariant>             // for QVariant
#include <QtGlobal>             // for qint64

#include "defs.h"               // for ParseError, TrackPoint, be_read16, be_read32, le_read16, le_read32
#include "src/core/logging.h"   // for Debug


#define MYNAME "fit"

/*******************************************************************************
* fit_parse_header- parse the global FIT header
*******************************************************************************/
void
GarminFitFormat::fit_parse_header()
{
  if (fin->size() < kReadHeaderMinLen) {
    throw ReaderException("Bad header: file is only " + std::to_string(fin->size()) + " bytes.");
  }

  const auto* hdr = reinterpret_cast<const unsigned char*>(fin->constData());
  int len = hdr[0];
  if (len < kReadHeaderMinLen || len > fin->size()) {
    throw ReaderException("Bad header length " + std::to_string(len) + ".");
  }
  if (global_opts.debug_level >= 1) {
    Debug(1) << MYNAME ": header len=" << len;
  }

  int ver = hdr[1];
  if ((ver >> 4) > 2) {
    throw ReaderException("Unsupported protocol version " + std::to_string(ver >> 4) + "." +
                          std::to_string(ver & 0xf) + ".");
  }
  metadata.protocol_version = ver;

  // profile version
  metadata.profile_version = le_readu16(hdr + 2);
  // data length
  fit_data.len = le_read32(hdr + 4);
  // File signature
  if (hdr[8] != '.' || hdr[9] != 'F' || hdr[10] != 'I' || hdr[11] != 'T') {
    throw ReaderException(".FIT signature missing.");
  }
  if (fit_data.len < 0) {
    throw ReaderException("Bad data length " + std::to_string(fit_data.len) + ".");
  }

  if (global_opts.debug_level >= 1) {
    Debug(1) << MYNAME ": protocol version=" << metadata.protocol_version;
    Debug(1) << MYNAME ": profile version=" << metadata.profile_version;
    Debug(1) << MYNAME ": fit_data.len=" << fit_data.len;
  }

  // Header CRC may be omitted entirely
  if (len >= kReadHeaderCrcLen) {
    uint16_t hdr_crc = le_readu16(hdr + 12);
    // Header CRC may be set to 0, or contain the CRC over previous bytes.
    if (hdr_crc != 0) {
      uint16_t crc = 0;
      for (int i = 0; i < kReadHeaderCrcLen; ++i) {
        crc = fit_crc16(hdr[i], crc);
      }
      if (crc != 0) {
        throw ReaderException("Header CRC mismatch.");
      } else if (global_opts.debug_level >= 1) {
        Debug(1) << MYNAME ": Header CRC verified.";
      }
    }
  }

  qint64 size = fin->size();
  if ((len + fit_data.len + 2) != size) {
    throw ReaderException("File size " + std::to_string(size) + " is not expected given header len " +
                          std::to_string(len) + ", data length " + std::to_string(fit_data.len) +
                          " and a 2 byte file CRC.");
  } else if (global_opts.debug_level >= 1) {
    Debug(1) << MYNAME ": File size matches expectations from information in the header.";
  }

  pos = len;
  fit_data.global_utc_offset = 0;
}

void
GarminFitFormat::fit_check_file_crc() const
{
  // Check file CRC, which covers the header and the data.
  uint16_t crc = 0;
  for (char c : *fin) {
    crc = fit_crc16(static_cast<uint8_t>(c), crc);
  }
  if (crc != 0) {
    throw ReaderException("File CRC mismatch.");
  } else if (global_opts.debug_level >= 1) {
    Debug(1) << MYNAME ": File CRC verified.";
  }
}

uint8_t
GarminFitFormat::fit_getuint8()
{
  if (fit_data.len < 1) {
    throw ReaderException("record truncated: expecting char[1], but only got " + std::to_string(fit_data.len) + ".");
  }
  if (pos + 1 > fin->size()) {
    throw ReaderException("unexpected end of file with fit_data.len=" + std::to_string(fit_data.len) + ".");
  }
  --fit_data.len;
  return static_cast<uint8_t>(fin->at(pos++));
}

uint16_t
GarminFitFormat::fit_getuint16()
{
  if (fit_data.len < 2) {
    throw ReaderException("record truncated: expecting char[2], but only got " + std::to_string(fit_data.len) + ".");
  }
  if (pos + 2 > fin->size()) {
    throw ReaderException("unexpected end of file with fit_data.len=" + std::to_string(fit_data.len) + ".");
  }
  const char* buf = fin->constData() + pos;
  pos += 2;
  fit_data.len -= 2;
  if (fit_data.endian) {
    return be_read16(buf);
  } else {
    return le_read16(buf);
  }
}

uint32_t
GarminFitFormat::fit_getuint32()
{
  if (fit_data.len < 4) {
    throw ReaderException("record truncated: expecting char[4], but only got " + std::to_string(fit_data.len) + ".");
  }
  if (pos + 4 > fin->size()) {
    throw ReaderException("unexpected end of file with fit_data.len=" + std::to_string(fit_data.len) + ".");
  }
  const char* buf = fin->constData() + pos;
  pos += 4;
  fit_data.len -= 4;
  if (fit_data.endian) {
    return be_read32(buf);
  } else {
    return le_read32(buf);
  }
}

QString
GarminFitFormat::fit_getstring(int size)
{
  if (fit_data.len < size) {
    throw ReaderException("record truncated: expecting " + std::to_string(size) + " bytes, but only got " + std::to_string(fit_data.len) + ".");
  }
  if (pos + size > fin->size()) {
    throw ReaderException("unexpected end of file with fit_data.len=" + std::to_string(fit_data.len) + ".");
  }
  // Strings are null terminated within the field.
  QByteArray buf = fin->mid(pos, size);
  pos += size;
  fit_data.len -= size;
  return QString::fromUtf8(buf.constData());
}

void
GarminFitFormat::fit_parse_definition_message(uint8_t header)
{
  int local_id = header & 0x0f;
  fit_message_def def;

  // first byte is reserved.  It's usually 0 and we don't know what it is,
  // but we've seen some files that are 0x40.  So we just read it and toss it.
  (void) fit_getuint8();

  // second byte is endianness
  def.endian = fit_getuint8();
  if (def.endian > 1) {
    throw ReaderException(QStringLiteral("Bad endian field 0x%1 at file position 0x%2.").arg(def.endian, 0, 16).arg(pos - 1, 0, 16).toStdString());
  }
  fit_data.endian = def.endian;

  // next two bytes are the global message number
  def.global_id = fit_getuint16();

  // byte 5 has the number of records in the remainder of the definition message
  int num_fields = fit_getuint8();
  if (global_opts.debug_level >= 8) {
    Debug(8) << MYNAME ": definition message contains " << num_fields << " records";
  }

  // remainder of the definition message is data at one byte per field * 3 fields
  for (int i = 0; i < num_fields; ++i) {
    int id   = fit_getuint8();
    int size = fit_getuint8();
    int type = fit_getuint8();
    fit_field_t field = {id, size, type};
    if (global_opts.debug_level >= 8) {
      Debug(8) << MYNAME ": record " << i << "  ID: " << field.id << "  SIZE: "
               << field.size << "  TYPE: " << field.type << "  fit_data.len="
               << fit_data.len;
    }
    def.fields.append(field);
  }

  // Developer fields (protocol 2.0) follow as one count byte and three
  // bytes per field.  They are read like normal fields so their data is
  // consumed, but under an id that can't collide with a profile field.
  bool hasDevFields = static_cast<bool>(header & 0x20);

  if (hasDevFields) {
    int numOfDevFields = fit_getuint8();
    if (global_opts.debug_level >= 8) {
      Debug(8) << MYNAME ": definition message contains " << numOfDevFields << " developer records";
    }
    for (int i = 0; i < numOfDevFields; ++i) {
      int id   = fit_getuint8();
      int size = fit_getuint8();
      int type = fit_getuint8();
      fit_field_t field = {id, size, type};
      if (global_opts.debug_level >= 8) {
        Debug(8) << MYNAME ": developer record " << i <<
                 "  ID: " << field.id << "  SIZE: " << field.size <<
                 "  TYPE: " << field.type << "  fit_data.len=" << fit_data.len;
      }
      field.id = kFieldInvalid;
      // The third byte is the developer data index, not a base type.
      field.type = -1;
      def.fields.append(field);
    }
  }

  fit_data.message_def.insert(local_id, def);
}

QVariant
GarminFitFormat::fit_read_field(const fit_field_t& f)
{
  /*
   * Per section 4.2.1.4.2 of the FIT Protocol the size of a field may be a
   * multiple of the size of the underlying type, indicating the field
   * contains multiple elements represented as an array.
   */
  // In the case that the field contains one value of the indicated type we return that value,
  // otherwise we just skip over the data.

  if (global_opts.debug_level >= 8) {
    Debug(8) << MYNAME ": fit_read_field: read data field with f.type=0x" <<
             Qt::hex << f.type << " and f.size=" <<
             Qt::dec << f.size << " fit_data.len=" << fit_data.len;
  }
  switch (f.type) {
  case 0: // enum
  case 1: // sint8
  case 2: // uint8
    if (f.size == 1) {
      return fit_getuint8();
    }
    break;
  case 0x7:
    return fit_getstring(f.size);

  case 0x83: // sint16
  case 0x84: // uint16
    if (f.size == 2) {
      return fit_getuint16();
    }
    break;
  case 0x85: // sint32
  case 0x86: // uint32
    if (f.size == 4) {
      return fit_getuint32();
    }
    break;
  default: // Ignore everything else for now.
    break;
  }

  for (int i = 0; i < f.size; ++i) {
    fit_getuint8();
  }
  if (global_opts.debug_level >= 8) {
    Debug(8) << MYNAME ": fit_read_field: skipping array or unrecognized data";
  }
  return {};
}

void
GarminFitFormat::fit_parse_data(const fit_message_def& def, int time_offset)
{
  uint32_t timestamp = fit_data.last_timestamp;
  bool have_timestamp = fit_data.have_timestamp;
  if (time_offset >= 0) {
    // Compressed timestamp headers carry the low 5 bits of the time.
    timestamp = (fit_data.last_timestamp & ~0x1fu) + time_offset;
    if (static_cast<uint32_t>(time_offset) < (fit_data.last_timestamp & 0x1fu)) {
      timestamp += 0x20;
    }
  }
  int32_t lat = 0x7fffffff;
  int32_t lon = 0x7fffffff;
  uint32_t alt = 0xffffffff;
  uint32_t speed = 0xffffffff;
  uint8_t heartrate = 0xff;
  uint8_t cadence = 0xff;
  uint16_t power = 0xffff;
  int8_t temperature = 0x7f;

  fit_data.endian = def.endian;

  if (global_opts.debug_level >= 7) {
    Debug(7) << MYNAME ": parsing fit data ID " << def.global_id << " with num_fields=" << def.fields.size();
  }
  for (const auto& f : def.fields) {
    QVariant field = fit_read_field(f);
    if (!field.isValid()) {
      continue;
    }
    uint32_t val = field.toUInt();
    if (f.id == kFieldTimestamp) {
      if (global_opts.debug_level >= 7) {
        Debug(7) << MYNAME ": parsing fit data: timestamp=" << val;
      }
      timestamp = val;
      // if the timestamp is < 0x10000000, this value represents
      // system time; to convert it to UTC, add the global utc offset to it
      if (timestamp < kSystemTimeLimit) {
        timestamp += fit_data.global_utc_offset;
      }
      have_timestamp = true;
      continue;
    }

    switch (def.global_id) {
    case kIdFileId:
      switch (f.id) {
      case kFieldManufacturer:
        metadata.manufacturer = static_cast<int>(val);
        break;
      case kFieldProduct:
        metadata.product = static_cast<int>(val);
        break;
      case kFieldTimeCreated:
        metadata.time_created = fit_time_to_msecs(val);
        break;
      default:
        break;
      }
      break;

    case kIdDeviceSettings:
      if (f.id == kFieldUtcOffset) {
        if (global_opts.debug_level >= 7) {
          Debug(7) << MYNAME ": parsing fit data: global utc_offset=" << val;
        }
        fit_data.global_utc_offset = val;
      }
      break;

    case kIdSession:
      if (f.id == kFieldSessionSport && metadata.sport.isEmpty()) {
        metadata.sport = fit_sport_name(static_cast<int>(val));
      }
      break;

    case kIdCourse:
      if (f.id == kFieldCourseSport && metadata.sport.isEmpty()) {
        metadata.sport = fit_sport_name(static_cast<int>(val));
      }
      break;

    case kIdRecord: // record message - trkType is a track
      switch (f.id) {
      case kFieldLatitude:
        lat = static_cast<int32_t>(val);
        break;
      case kFieldLongitude:
        lon = static_cast<int32_t>(val);
        break;
      case kFieldAltitude:
        if (val != 0xffff) {
          alt = val;
        }
        break;
      case kFieldHeartRate:
        heartrate = val;
        break;
      case kFieldCadence:
        cadence = val;
        break;
      case kFieldSpeed:
        if (val != 0xffff) {
          speed = val;
        }
        break;
      case kFieldPower:
        power = val;
        break;
      case kFieldTemperature:
        temperature = static_cast<int8_t>(val);
        break;
      case kFieldEnhancedSpeed:
        if (val != 0xffffffff) {
          speed = val;
        }
        break;
      case kFieldEnhancedAltitude:
        if (val != 0xffffffff) {
          alt = val;
        }
        break;
      default:
        if (global_opts.debug_level >= 7) {
          Debug(7) << MYNAME ": unrecognized data type in FIT record: f.id=" << f.id;
        }
        break;
      } // switch (f.id)
      break;

    default:
      break;
    } // switch (def.global_id)
  }

  if (have_timestamp) {
    fit_data.last_timestamp = timestamp;
    fit_data.have_timestamp = true;
  }

  if (def.global_id != kIdRecord) {
    return;
  }
  if (lat == 0x7fffffff || lon == 0x7fffffff) {
    if (global_opts.debug_level >= 6) {
      Debug(6) << MYNAME ": skipping record without a position";
    }
    return;
  }

  TrackPoint trkpt;
  trkpt.latitude = fit_semi_to_deg(lat);
  trkpt.longitude = fit_semi_to_deg(lon);
  if (!valid_position(trkpt.latitude, trkpt.longitude)) {
    return;
  }
  if (alt != 0xffffffff) {
    trkpt.elevation = (alt / 5.0) - 500;
  }
  if (have_timestamp) {
    trkpt.timestamp = fit_time_to_msecs(timestamp);
  }
  if (speed != 0xffffffff) {
    trkpt.speed = speed / 1000.0;
  }
  if (heartrate != 0xff) {
    trkpt.heart_rate = heartrate;
  }
  if (cadence != 0xff) {
    trkpt.cadence = cadence;
  }
  if (power != 0xffff) {
    trkpt.power = power;
  }
  if (temperature != 0x7f) {
    trkpt.temperature = temperature;
  }
  samples.push_back(trkpt);
}

void
GarminFitFormat::fit_parse_data_message(uint8_t header)
{
  int local_id = header & 0x0f;
  if (fit_data.message_def.contains(local_id)) {
    fit_parse_data(fit_data.message_def.value(local_id), -1);
  } else {
    throw ReaderException(
      QString("Message %1 hasn't been defined before being used at file position 0x%2.").
      arg(local_id).arg(pos - 1, 0, 16).toStdString());
  }
}

void
GarminFitFormat::fit_parse_compressed_message(uint8_t header)
{
  int local_id = (header >> 5) & 3;
  if (fit_data.message_def.contains(local_id)) {
    fit_parse_data(fit_data.message_def.value(local_id), header & 0x1f);
  } else {
    throw ReaderException(
      QString("Compressed message %1 hasn't been defined before being used at file position 0x%2.").
      arg(local_id).arg(pos - 1, 0, 16).toStdString());
  }
}

/*******************************************************************************
* fit_parse_record- parse each record in the file
*******************************************************************************/
void
GarminFitFormat::fit_parse_record()
{
  qsizetype position = pos;
  uint8_t header = fit_getuint8();
  // high bit 7 set -> compressed message (0 for normal)
  // second bit 6 set -> 0 for data message, 1 for definition message
  // bit 5 -> message type specific
  //    definition message: Bit set means that we have additional Developer Field definitions
  //                        behind the field definitions inside the record content
  //    data message: currently not used
  // bit 4 -> reserved
  // bits 3..0 -> local message type
  if (header & 0x80) {
    if (global_opts.debug_level >= 6) {
      Debug(6) << MYNAME ": got compressed message at file position 0x" <<
               Qt::hex << position << ", fit_data.len=" << Qt::dec << fit_data.len
               << " ...local message type 0x" << Qt::hex << ((header >> 5) & 3);
    }
    fit_parse_compressed_message(header);
  } else if (header & 0x40) {
    if (global_opts.debug_level >= 6) {
      Debug(6) << MYNAME ": got definition message at file position 0x" <<
               Qt::hex << position << ", fit_data.len=" << Qt::dec << fit_data.len
               << " ...local message type 0x" << Qt::hex << (header & 0x0f);
    }
    fit_parse_definition_message(header);
  } else {
    if (global_opts.debug_level >= 6) {
      Debug(6) << MYNAME ": got data message at file position 0x" <<
               Qt::hex << position << ", fit_data.len=" << Qt::dec << fit_data.len
               << " ...local message type 0x" << Qt::hex << (header & 0x0f);
    }
    fit_parse_data_message(header);
  }
}

/*******************************************************************************
* read- global entry point
* - parse the header
* - check the file CRC
* - parse all the records in the file
*******************************************************************************/
RawTrack
GarminFitFormat::read(const QByteArray& data)
{
  fin = &data;
  pos = 0;

  try {
    fit_parse_header();
    fit_check_file_crc();

    if (global_opts.debug_level >= 1) {
      Debug(1) << MYNAME ": starting to read data with fit_data.len=" << fit_data.len;
    }
    while (fit_data.len) {
      fit_parse_record();
    }
  } catch (ReaderException& e) {
    fin = nullptr;
    throw ParseError(ParseError::kind_t::malformed, QStringLiteral(MYNAME ": %1").arg(QString::fromStdString(e.what())));
  }
  fin = nullptr;

  RawTrack track;
  track.samples = std::move(samples);
  track.metadata = metadata;
  check_samples(track, MYNAME);
  return track;
}

uint16_t
GarminFitFormat::fit_crc16(uint8_t data, uint16_t crc)
{
  static const uint16_t crc_table[] = {
    0x0000, 0xcc01, 0xd801, 0x1400, 0xf001, 0x3c00, 0x2800, 0xe401,
    0xa001, 0x6c00, 0x7800, 0xb401, 0x5000, 0x9c01, 0x8801, 0x4400
  };

  crc = (crc >> 4) ^ crc_table[crc & 0xf] ^ crc_table[data & 0xf];
  crc = (crc >> 4) ^ crc_table[crc & 0xf] ^ crc_table[(data >> 4) & 0xf];
  return crc;
}

// Names of the FIT profile sport enum, lower case.
QString
GarminFitFormat::fit_sport_name(int sport)
{
  switch (sport) {
  case 0:
    return QStringLiteral("generic");
  case 1:
    return QStringLiteral("running");
  case 2:
    return QStringLiteral("cycling");
  case 5:
    return QStringLiteral("swimming");
  case 11:
    return QStringLiteral("walking");
  case 13:
    return QStringLiteral("alpine_skiing");
  case 14:
    return QStringLiteral("snowboarding");
  case 17:
    return QStringLiteral("hiking");
  case 19:
    return QStringLiteral("paddling");
  case 31:
    return QStringLiteral("rock_climbing");
  default:
    return QStringLiteral("generic");
  }
}

double
GarminFitFormat::fit_semi_to_deg(int32_t semicircles)
{
  return semicircles * (180.0 / 2147483648.0);
}

qint64
GarminFitFormat::fit_time_to_msecs(uint32_t fit_time)
{
  return (static_cast<qint64>(fit_time) + kFitEpochOffset) * 1000;
}
