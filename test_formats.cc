/*
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

#include "test_formats.h"

#include <cmath>                    // for fabs, lround
#include <cstdint>                  // for uint8_t, uint16_t, int32_t, uint32_t
#include <optional>                 // for optional, nullopt
#include <variant>                  // for get_if

#include <QByteArray>               // for QByteArray
#include <QFile>                    // for QFile
#include <QList>                    // for QList
#include <QString>                  // for QString
#include <QTemporaryDir>            // for QTemporaryDir
#include <QtTest>                   // for QVERIFY, QCOMPARE, QTEST_GUILESS_MAIN

#include "defs.h"                   // for ParseError, TrackPoint
#include "format.h"                 // for RawTrack, GpxMetadata, TcxMetadata, KmlMetadata, KmzMetadata, FitMetadata
#include "src/core/ziparchive.h"    // for ZipArchive
#include "trackstats.h"             // for estimate_calories
#include "vecs.h"                   // for Vecs


namespace
{

constexpr qint64 kStartMs = 1600000000000LL;         /* 2020-09-13T12:26:40Z */
constexpr uint32_t kStartFit = 1600000000 - 631065600;

std::optional<ParseError::kind_t>
parse_failure(const QByteArray& data, const QString& hint = QString())
{
  try {
    Vecs::Instance().parse(data, hint);
  } catch (const ParseError& e) {
    return e.kind();
  }
  return std::nullopt;
}

bool
near(double value, double expected)
{
  return std::fabs(value - expected) < 1.0e-6;
}

/*
 * Hand assembled FIT files.  Everything is little endian, CRCs are
 * filled in by file().
 */
class FitWriter
{
public:
  struct field_t {
    int id;
    int size;
    int type;
  };

  void define(int local_id, int global_id, const QList<field_t>& fields)
  {
    put8(0x40 | local_id);
    put8(0);                    // reserved
    put8(0);                    // little endian
    put16(global_id);
    put8(fields.size());
    for (const auto& f : fields) {
      put8(f.id);
      put8(f.size);
      put8(f.type);
    }
  }

  void put8(unsigned value)
  {
    body.append(static_cast<char>(value & 0xff));
  }
  void put16(unsigned value)
  {
    append16(body, value);
  }
  void put32(uint32_t value)
  {
    put16(value & 0xffff);
    put16(value >> 16);
  }

  QByteArray file() const
  {
    QByteArray out;
    out.append(static_cast<char>(14));
    out.append(static_cast<char>(0x20));
    append16(out, 2132);
    append16(out, body.size() & 0xffff);
    append16(out, body.size() >> 16);
    out.append(".FIT");
    append16(out, crc(out));
    out.append(body);
    append16(out, crc(out));
    return out;
  }

  static uint32_t semicircles(double degrees)
  {
    return static_cast<uint32_t>(static_cast<int32_t>(std::lround(degrees * 2147483648.0 / 180.0)));
  }

private:
  static void append16(QByteArray& buf, unsigned value)
  {
    buf.append(static_cast<char>(value & 0xff));
    buf.append(static_cast<char>((value >> 8) & 0xff));
  }

  static uint16_t crc(const QByteArray& buf)
  {
    static const uint16_t table[] = {
      0x0000, 0xcc01, 0xd801, 0x1400, 0xf001, 0x3c00, 0x2800, 0xe401,
      0xa001, 0x6c00, 0x7800, 0xb401, 0x5000, 0x9c01, 0x8801, 0x4400
    };
    uint16_t crc = 0;
    for (char c : buf) {
      auto byte = static_cast<uint8_t>(c);
      crc = (crc >> 4) ^ table[crc & 0xf] ^ table[byte & 0xf];
      crc = (crc >> 4) ^ table[crc & 0xf] ^ table[(byte >> 4) & 0xf];
    }
    return crc;
  }

  QByteArray body;
};

const QList<FitWriter::field_t> kRecordFields = {
  {253, 4, 0x86},               // timestamp
  {0, 4, 0x85},                 // position_lat
  {1, 4, 0x85},                 // position_long
  {2, 2, 0x84},                 // altitude
  {3, 1, 0x02},                 // heart_rate
  {4, 1, 0x02},                 // cadence
  {6, 2, 0x84},                 // speed
  {7, 2, 0x84},                 // power
  {13, 1, 0x01},                // temperature
};

void
put_record(FitWriter& fit, uint32_t timestamp, double lat, double lon)
{
  fit.put8(0);
  fit.put32(timestamp);
  fit.put32(FitWriter::semicircles(lat));
  fit.put32(FitWriter::semicircles(lon));
  fit.put16((400 + 500) * 5);
  fit.put8(150);
  fit.put8(90);
  fit.put16(3500);
  fit.put16(250);
  fit.put8(20);
}

QByteArray
running_fit(int sport = 1)
{
  FitWriter fit;
  fit.define(2, 0, {{1, 2, 0x84}, {2, 2, 0x84}, {4, 4, 0x86}});
  fit.put8(2);
  fit.put16(1);
  fit.put16(1234);
  fit.put32(kStartFit);

  fit.define(0, 20, kRecordFields);
  put_record(fit, kStartFit, 47.0, 8.0);
  put_record(fit, kStartFit + 1, 47.0001, 8.0);
  put_record(fit, kStartFit + 2, 47.0002, 8.0);

  fit.define(1, 18, {{5, 1, 0x00}});
  fit.put8(1);
  fit.put8(sport);              // 1 is running
  return fit.file();
}

const char kGpxTrack[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<gpx version="1.1" creator="test" xmlns="http://www.topografix.com/GPX/1/1"
     xmlns:ns3="http://www.garmin.com/xmlschemas/TrackPointExtension/v1">
  <metadata>
    <name>Morning loop</name>
    <time>2020-09-13T12:26:40Z</time>
  </metadata>
  <trk>
    <name>Ignored track name</name>
    <desc>Along the lake</desc>
    <type>Running</type>
    <trkseg>
      <trkpt lat="47.0" lon="8.0">
        <ele>400.5</ele>
        <time>2020-09-13T12:26:40Z</time>
        <extensions>
          <ns3:TrackPointExtension>
            <ns3:hr>141</ns3:hr>
            <ns3:cad>88</ns3:cad>
            <ns3:atemp>21.5</ns3:atemp>
          </ns3:TrackPointExtension>
          <power>250</power>
        </extensions>
      </trkpt>
      <trkpt lat="47.001" lon="8.001">
        <ele>402</ele>
        <time>2020-09-13T12:26:50.500Z</time>
      </trkpt>
    </trkseg>
  </trk>
</gpx>
)";

const char kTcxActivity[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<TrainingCenterDatabase xmlns="http://www.garmin.com/xmlschemas/TrainingCenterDatabase/v2"
                        xmlns:ns3="http://www.garmin.com/xmlschemas/ActivityExtension/v2">
  <Activities>
    <Activity Sport="Biking">
      <Id>2020-09-13T12:26:40Z</Id>
      <Lap StartTime="2020-09-13T12:26:40Z">
        <Track>
          <Trackpoint>
            <Time>2020-09-13T12:26:40Z</Time>
            <Position>
              <LatitudeDegrees>47.0</LatitudeDegrees>
              <LongitudeDegrees>8.0</LongitudeDegrees>
            </Position>
            <AltitudeMeters>410.0</AltitudeMeters>
            <HeartRateBpm><Value>132</Value></HeartRateBpm>
            <Cadence>85</Cadence>
            <Extensions>
              <ns3:TPX>
                <ns3:Speed>8.5</ns3:Speed>
                <ns3:Watts>210</ns3:Watts>
              </ns3:TPX>
            </Extensions>
          </Trackpoint>
          <Trackpoint>
            <Time>2020-09-13T12:26:45Z</Time>
            <HeartRateBpm><Value>133</Value></HeartRateBpm>
          </Trackpoint>
        </Track>
      </Lap>
      <Lap StartTime="2020-09-13T12:26:50Z">
        <Track>
          <Trackpoint>
            <Time>2020-09-13T12:26:50Z</Time>
            <Position>
              <LatitudeDegrees>47.001</LatitudeDegrees>
              <LongitudeDegrees>8.001</LongitudeDegrees>
            </Position>
          </Trackpoint>
        </Track>
      </Lap>
      <Notes>Tempo ride</Notes>
    </Activity>
  </Activities>
</TrainingCenterDatabase>
)";

const char kKmlLine[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<kml xmlns="http://www.opengis.net/kml/2.2">
  <Document>
    <name>Summer trips</name>
    <Style id="red"><LineStyle><color>ff0000ff</color></LineStyle></Style>
    <Placemark>
      <name>Ridge walk</name>
      <description>Windy</description>
      <LineString>
        <coordinates>
          8.0,47.0,500 8.001,47.0,505
          8.002,47.0,510
        </coordinates>
      </LineString>
      <TimeSpan>
        <begin>2020-09-13T12:26:40Z</begin>
        <end>2020-09-13T12:27:40Z</end>
      </TimeSpan>
    </Placemark>
  </Document>
</kml>
)";

} // namespace

void FormatsTest::gpx_track_with_extensions()
{
  RawTrack track = Vecs::Instance().parse(kGpxTrack, "morning.gpx");
  QCOMPARE(QString(track.format_name()), QString("gpx"));
  QCOMPARE(track.samples.size(), std::size_t(2));

  const TrackPoint& first = track.samples[0];
  QCOMPARE(first.latitude, 47.0);
  QCOMPARE(first.longitude, 8.0);
  QCOMPARE(first.elevation, std::optional<double>(400.5));
  QCOMPARE(first.timestamp, std::optional<qint64>(kStartMs));
  QCOMPARE(first.heart_rate, std::optional<int>(141));
  QCOMPARE(first.cadence, std::optional<int>(88));
  QCOMPARE(first.temperature, std::optional<double>(21.5));
  QCOMPARE(first.power, std::optional<double>(250.0));
  QCOMPARE(track.samples[1].timestamp, std::optional<qint64>(kStartMs + 10500));
  QVERIFY(!track.samples[1].heart_rate.has_value());

  const auto* meta = std::get_if<GpxMetadata>(&track.metadata);
  QVERIFY(meta != nullptr);
  QCOMPARE(meta->source, GpxMetadata::source_t::track);
  QCOMPARE(meta->description, QString("Along the lake"));
  QCOMPARE(meta->time, std::optional<qint64>(kStartMs));
  QCOMPARE(track.name(), QString("Morning loop"));
  QCOMPARE(track.activity_type(), QString("running"));
}

void FormatsTest::gpx_falls_back_to_route_then_waypoints()
{
  QByteArray route = R"(<gpx version="1.1" xmlns="http://www.topografix.com/GPX/1/1">
    <wpt lat="46.0" lon="7.0"/>
    <rte><rtept lat="46.1" lon="7.1"><ele>1200</ele></rtept><rtept lat="46.2" lon="7.2"/></rte>
  </gpx>)";
  RawTrack track = Vecs::Instance().parse(route, QString());
  QCOMPARE(track.samples.size(), std::size_t(2));
  QCOMPARE(track.samples[0].elevation, std::optional<double>(1200.0));
  QCOMPARE(std::get<GpxMetadata>(track.metadata).source, GpxMetadata::source_t::route);
  QCOMPARE(track.name(), QString("GPX Activity"));
  QVERIFY(track.activity_type().isEmpty());

  QByteArray waypoints = R"(<gpx version="1.0"><name>Huts</name>
    <wpt lat="46.0" lon="7.0"><time>2020-09-13T12:26:40Z</time></wpt>
    <wpt lat="46.5" lon="7.5"/>
  </gpx>)";
  track = Vecs::Instance().parse(waypoints, QString());
  QCOMPARE(track.samples.size(), std::size_t(2));
  QCOMPARE(std::get<GpxMetadata>(track.metadata).source, GpxMetadata::source_t::waypoint);
  QCOMPARE(track.samples[0].timestamp, std::optional<qint64>(kStartMs));
  QCOMPARE(track.name(), QString("Huts"));
}

void FormatsTest::gpx_drops_out_of_range_points()
{
  QByteArray gpx = R"(<gpx version="1.1"><trk><trkseg>
    <trkpt lat="95.0" lon="8.0"/>
    <trkpt lat="47.0" lon="181.0"/>
    <trkpt lat="north" lon="8.0"/>
    <trkpt lon="8.0"/>
    <trkpt lat="47.0" lon="8.0"/>
  </trkseg></trk></gpx>)";
  RawTrack track = Vecs::Instance().parse(gpx, "gpx");
  QCOMPARE(track.samples.size(), std::size_t(1));
  QCOMPARE(track.samples[0].latitude, 47.0);

  QByteArray nothing_valid = R"(<gpx version="1.1"><trk><trkseg>
    <trkpt lat="-91" lon="0"/>
  </trkseg></trk></gpx>)";
  QCOMPARE(parse_failure(nothing_valid, "gpx"), std::optional(ParseError::kind_t::empty_track));
}

void FormatsTest::tcx_activity()
{
  RawTrack track = Vecs::Instance().parse(kTcxActivity, "ride.tcx");
  QCOMPARE(QString(track.format_name()), QString("tcx"));
  // The second Trackpoint has no Position.
  QCOMPARE(track.samples.size(), std::size_t(2));

  const TrackPoint& first = track.samples[0];
  QCOMPARE(first.timestamp, std::optional<qint64>(kStartMs));
  QCOMPARE(first.elevation, std::optional<double>(410.0));
  QCOMPARE(first.heart_rate, std::optional<int>(132));
  QCOMPARE(first.cadence, std::optional<int>(85));
  QCOMPARE(first.power, std::optional<double>(210.0));
  QCOMPARE(first.speed, std::optional<double>(8.5));
  QCOMPARE(track.samples[1].latitude, 47.001);
  QCOMPARE(track.samples[1].timestamp, std::optional<qint64>(kStartMs + 10000));

  const auto* meta = std::get_if<TcxMetadata>(&track.metadata);
  QVERIFY(meta != nullptr);
  QCOMPARE(meta->sport, QString("Biking"));
  QCOMPARE(meta->lap_count, 2);
  QCOMPARE(meta->notes, QString("Tempo ride"));
  QCOMPARE(track.activity_type(), QString("cycling"));
  QCOMPARE(track.name(), QString("Cycling Activity"));
}

void FormatsTest::tcx_course_name()
{
  QByteArray course = R"(<TrainingCenterDatabase xmlns="http://www.garmin.com/xmlschemas/TrainingCenterDatabase/v2">
    <Courses><Course>
      <Name>Hill repeats</Name>
      <Track>
        <Trackpoint><Position><LatitudeDegrees>46.5</LatitudeDegrees><LongitudeDegrees>7.5</LongitudeDegrees></Position></Trackpoint>
      </Track>
    </Course></Courses>
  </TrainingCenterDatabase>)";
  RawTrack track = Vecs::Instance().parse(course, QString());
  QCOMPARE(track.samples.size(), std::size_t(1));
  QCOMPARE(track.name(), QString("Hill repeats"));
  QVERIFY(track.activity_type().isEmpty());

  QByteArray other = R"(<TrainingCenterDatabase><Activities><Activity Sport="Other"><Lap><Track>
    <Trackpoint><Position><LatitudeDegrees>46.5</LatitudeDegrees><LongitudeDegrees>7.5</LongitudeDegrees></Position></Trackpoint>
  </Track></Lap></Activity></Activities></TrainingCenterDatabase>)";
  track = Vecs::Instance().parse(other, "tcx");
  QVERIFY(track.activity_type().isEmpty());
  QCOMPARE(track.name(), QString("TCX Activity"));
}

void FormatsTest::kml_linestring_with_timespan()
{
  RawTrack track = Vecs::Instance().parse(kKmlLine, "ridge.kml");
  QCOMPARE(QString(track.format_name()), QString("kml"));
  QCOMPARE(track.samples.size(), std::size_t(3));
  QCOMPARE(track.samples[0].longitude, 8.0);
  QCOMPARE(track.samples[2].longitude, 8.002);
  QCOMPARE(track.samples[2].elevation, std::optional<double>(510.0));

  // The span is spread evenly over the points even though it follows them.
  QCOMPARE(track.samples[0].timestamp, std::optional<qint64>(kStartMs));
  QCOMPARE(track.samples[1].timestamp, std::optional<qint64>(kStartMs + 30000));
  QCOMPARE(track.samples[2].timestamp, std::optional<qint64>(kStartMs + 60000));

  const auto* meta = std::get_if<KmlMetadata>(&track.metadata);
  QVERIFY(meta != nullptr);
  QCOMPARE(meta->document_name, QString("Summer trips"));
  QCOMPARE(meta->description, QString("Windy"));
  QCOMPARE(track.name(), QString("Ridge walk"));
}

void FormatsTest::kml_reversed_timespan_is_ignored()
{
  QByteArray kml(kKmlLine);
  kml.replace("<begin>2020-09-13T12:26:40Z</begin>", "<begin>2020-09-13T12:27:40Z</begin>");
  kml.replace("<end>2020-09-13T12:27:40Z</end>", "<end>2020-09-13T12:26:40Z</end>");

  RawTrack track = Vecs::Instance().parse(kml, "ridge.kml");
  QCOMPARE(track.samples.size(), std::size_t(3));
  for (const auto& sample : track.samples) {
    QVERIFY(!sample.timestamp);
  }
}

void FormatsTest::kml_gx_track()
{
  QByteArray kml = R"(<kml xmlns="http://www.opengis.net/kml/2.2" xmlns:gx="http://www.google.com/kml/ext/2.2">
    <Document><Placemark>
      <gx:Track>
        <when>2020-09-13T12:26:40Z</when>
        <when>2020-09-13T12:26:41Z</when>
        <when>2020-09-13T12:26:42Z</when>
        <gx:coord>8.0 47.0 500</gx:coord>
        <gx:coord></gx:coord>
        <gx:coord>8.002 47.0</gx:coord>
      </gx:Track>
    </Placemark></Document>
  </kml>)";
  RawTrack track = Vecs::Instance().parse(kml, QString());
  // The empty coord drops its time as well.
  QCOMPARE(track.samples.size(), std::size_t(2));
  QCOMPARE(track.samples[0].elevation, std::optional<double>(500.0));
  QCOMPARE(track.samples[0].timestamp, std::optional<qint64>(kStartMs));
  QVERIFY(!track.samples[1].elevation.has_value());
  QCOMPARE(track.samples[1].timestamp, std::optional<qint64>(kStartMs + 2000));
  QCOMPARE(track.name(), QString("KML Track"));
}

void FormatsTest::kml_track_count_mismatch()
{
  QByteArray kml = R"(<kml xmlns:gx="http://www.google.com/kml/ext/2.2"><Placemark>
      <gx:Track>
        <when>2020-09-13T12:26:40Z</when>
        <when>2020-09-13T12:26:41Z</when>
        <gx:coord>8.0 47.0 500</gx:coord>
      </gx:Track>
    </Placemark></kml>)";
  QCOMPARE(parse_failure(kml, "kml"), std::optional(ParseError::kind_t::malformed));
}

void FormatsTest::kml_point_only()
{
  QByteArray kml = R"(<kml xmlns="http://www.opengis.net/kml/2.2"><Document>
    <Placemark><name>Summit</name>
      <TimeStamp><when>2020-09-13T12:26:40Z</when></TimeStamp>
      <Point><coordinates>7.6586,45.9763,4478</coordinates></Point>
    </Placemark>
    <Placemark><Point><coordinates>200,45,0</coordinates></Point></Placemark>
  </Document></kml>)";
  RawTrack track = Vecs::Instance().parse(kml, "kml");
  QCOMPARE(track.samples.size(), std::size_t(1));
  QCOMPARE(track.samples[0].latitude, 45.9763);
  QCOMPARE(track.samples[0].elevation, std::optional<double>(4478.0));
  QCOMPARE(track.samples[0].timestamp, std::optional<qint64>(kStartMs));
  QCOMPARE(track.name(), QString("Summit"));
}

void FormatsTest::kmz_archive()
{
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = dir.filePath("ridge.kmz");
  {
    trailbook::ZipArchive zip(path, trailbook::ZipArchive::mode_t::create);
    QVERIFY(zip.IsValid());
    QVERIFY(!zip.Add("files/icon.png", QByteArray("\x89PNG", 4)));
    QVERIFY(!zip.Add("files/doc.kml", kKmlLine));
    zip.Close();
  }
  QFile file(path);
  QVERIFY(file.open(QIODevice::ReadOnly));
  const QByteArray bytes = file.readAll();

  QCOMPARE(Vecs::sniff(bytes), QString("kmz"));
  RawTrack track = Vecs::Instance().parse(bytes, QString());
  QCOMPARE(QString(track.format_name()), QString("kmz"));
  QCOMPARE(track.samples.size(), std::size_t(3));
  QCOMPARE(track.samples[1].timestamp, std::optional<qint64>(kStartMs + 30000));

  const auto* meta = std::get_if<KmzMetadata>(&track.metadata);
  QVERIFY(meta != nullptr);
  QCOMPARE(meta->entry_name, QString("files/doc.kml"));
  QCOMPARE(track.name(), QString("Ridge walk"));
}

void FormatsTest::kmz_without_kml_entry()
{
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = dir.filePath("photos.kmz");
  {
    trailbook::ZipArchive zip(path, trailbook::ZipArchive::mode_t::create);
    QVERIFY(!zip.Add("readme.txt", "no placemarks in here"));
    zip.Close();
  }
  QFile file(path);
  QVERIFY(file.open(QIODevice::ReadOnly));
  QCOMPARE(parse_failure(file.readAll(), "photos.kmz"), std::optional(ParseError::kind_t::malformed));

  // A zip signature followed by garbage.
  QCOMPARE(parse_failure(QByteArray("PK\x03\x04garbage", 11)), std::optional(ParseError::kind_t::malformed));
}

void FormatsTest::fit_records()
{
  const QByteArray data = running_fit();
  QCOMPARE(Vecs::sniff(data), QString("fit"));

  RawTrack track = Vecs::Instance().parse(data, "run.fit");
  QCOMPARE(QString(track.format_name()), QString("fit"));
  QCOMPARE(track.samples.size(), std::size_t(3));

  const TrackPoint& first = track.samples[0];
  QVERIFY(near(first.latitude, 47.0));
  QVERIFY(near(first.longitude, 8.0));
  QCOMPARE(first.elevation, std::optional<double>(400.0));
  QCOMPARE(first.timestamp, std::optional<qint64>(kStartMs));
  QCOMPARE(first.heart_rate, std::optional<int>(150));
  QCOMPARE(first.cadence, std::optional<int>(90));
  QCOMPARE(first.speed, std::optional<double>(3.5));
  QCOMPARE(first.power, std::optional<double>(250.0));
  QCOMPARE(first.temperature, std::optional<double>(20.0));
  QVERIFY(near(track.samples[2].latitude, 47.0002));
  QCOMPARE(track.samples[2].timestamp, std::optional<qint64>(kStartMs + 2000));

  const auto* meta = std::get_if<FitMetadata>(&track.metadata);
  QVERIFY(meta != nullptr);
  QCOMPARE(meta->sport, QString("running"));
  QCOMPARE(meta->manufacturer, std::optional<int>(1));
  QCOMPARE(meta->product, std::optional<int>(1234));
  QCOMPARE(meta->time_created, std::optional<qint64>(kStartMs));
  QCOMPARE(meta->protocol_version, 0x20);
  QCOMPARE(meta->profile_version, 2132);
  QCOMPARE(track.activity_type(), QString("running"));
  QCOMPARE(track.name(), QString("Running Activity"));
}

void FormatsTest::fit_sports_map_to_activity_types()
{
  RawTrack skiing = Vecs::Instance().parse(running_fit(13), "ski.fit");
  QCOMPARE(std::get_if<FitMetadata>(&skiing.metadata)->sport, QString("alpine_skiing"));
  QCOMPARE(skiing.activity_type(), QString("skiing"));
  QCOMPARE(skiing.name(), QString("Alpine skiing Activity"));
  // One hour at the skiing MET, not the fallback of 4.0.
  QCOMPARE(estimate_calories(skiing.activity_type(), 0.0, 3600.0, 0.0), 490);
  QCOMPARE(estimate_calories(QString("alpine_skiing"), 0.0, 3600.0, 0.0), 280);

  QCOMPARE(Vecs::Instance().parse(running_fit(31), "wall.fit").activity_type(), QString("climbing"));
  QCOMPARE(Vecs::Instance().parse(running_fit(19), "lake.fit").activity_type(), QString("kayaking"));
  QCOMPARE(Vecs::Instance().parse(running_fit(17), "hill.fit").activity_type(), QString("hiking"));
  QVERIFY(Vecs::Instance().parse(running_fit(0), "any.fit").activity_type().isEmpty());
}

void FormatsTest::fit_compressed_timestamps()
{
  FitWriter fit;
  fit.define(0, 20, {{253, 4, 0x86}, {0, 4, 0x85}, {1, 4, 0x85}});
  fit.put8(0);
  fit.put32(kStartFit);         // low five bits are zero
  fit.put32(FitWriter::semicircles(47.0));
  fit.put32(FitWriter::semicircles(8.0));

  fit.define(1, 20, {{0, 4, 0x85}, {1, 4, 0x85}});
  fit.put8(0x80 | (1 << 5) | 10);
  fit.put32(FitWriter::semicircles(47.001));
  fit.put32(FitWriter::semicircles(8.0));
  // An offset below the previous one has rolled over.
  fit.put8(0x80 | (1 << 5) | 3);
  fit.put32(FitWriter::semicircles(47.002));
  fit.put32(FitWriter::semicircles(8.0));

  RawTrack track = Vecs::Instance().parse(fit.file(), "fit");
  QCOMPARE(track.samples.size(), std::size_t(3));
  QCOMPARE(track.samples[1].timestamp, std::optional<qint64>(kStartMs + 10000));
  QCOMPARE(track.samples[2].timestamp, std::optional<qint64>(kStartMs + 35000));
  QCOMPARE(track.name(), QString("FIT Activity"));
  QVERIFY(track.activity_type().isEmpty());
}

void FormatsTest::fit_bad_crc()
{
  QByteArray data = running_fit();
  data[20] = static_cast<char>(data.at(20) ^ 0x01);
  QCOMPARE(parse_failure(data, "run.fit"), std::optional(ParseError::kind_t::malformed));
}

void FormatsTest::fit_truncated()
{
  QByteArray data = running_fit();
  data.chop(7);
  QCOMPARE(parse_failure(data, "run.fit"), std::optional(ParseError::kind_t::malformed));
  QCOMPARE(parse_failure(data.left(10), "run.fit"), std::optional(ParseError::kind_t::malformed));

  // A data message for a local type nobody defined.
  FitWriter fit;
  fit.put8(3);
  fit.put8(0);
  QCOMPARE(parse_failure(fit.file(), "fit"), std::optional(ParseError::kind_t::malformed));
}

void FormatsTest::fit_without_positions()
{
  FitWriter fit;
  fit.define(0, 20, {{253, 4, 0x86}, {0, 4, 0x85}, {1, 4, 0x85}, {3, 1, 0x02}});
  fit.put8(0);
  fit.put32(kStartFit);
  fit.put32(0x7fffffff);
  fit.put32(0x7fffffff);
  fit.put8(120);
  QCOMPARE(parse_failure(fit.file(), "fit"), std::optional(ParseError::kind_t::empty_track));
}

void FormatsTest::sniff_content()
{
  QCOMPARE(Vecs::sniff(kGpxTrack), QString("gpx"));
  QCOMPARE(Vecs::sniff(kTcxActivity), QString("tcx"));
  QCOMPARE(Vecs::sniff(kKmlLine), QString("kml"));
  QCOMPARE(Vecs::sniff("<?xml version=\"1.0\"?><html/>"), QString());
  QCOMPARE(Vecs::sniff("lat,lon\n47,8\n"), QString());
}

void FormatsTest::hints_pick_the_reader()
{
  const Vecs& vecs = Vecs::Instance();
  QCOMPARE(vecs.formats().size(), 5);
  QCOMPARE(vecs.find_vec(QByteArray(), "RIDE.TCX"), QString("tcx"));
  QCOMPARE(vecs.find_vec(QByteArray(), "course.crs"), QString("tcx"));
  QCOMPARE(vecs.find_vec(QByteArray(), "kmz"), QString("kmz"));
  QCOMPARE(vecs.find_vec(QByteArray(), "FIT"), QString("fit"));
  // A hint that names nothing falls back on the content.
  QCOMPARE(vecs.find_vec(kKmlLine, "export.xml"), QString("kml"));
  QCOMPARE(QString(vecs.parse(kGpxTrack, "upload.dat").format_name()), QString("gpx"));

  // The hint wins over the content.
  QCOMPARE(parse_failure(kGpxTrack, "track.kml"), std::optional(ParseError::kind_t::empty_track));
}

void FormatsTest::unusable_input()
{
  QCOMPARE(parse_failure(QByteArray(), "track.gpx"), std::optional(ParseError::kind_t::empty_track));
  QCOMPARE(parse_failure("just some text"), std::optional(ParseError::kind_t::unsupported_format));
  QCOMPARE(parse_failure("lat,lon\n47,8\n", "track.csv"), std::optional(ParseError::kind_t::unsupported_format));
  QCOMPARE(parse_failure("<gpx><trk><trkseg><trkpt lat=\"1\" lon=\"2\">", "gpx"),
           std::optional(ParseError::kind_t::malformed));
  QCOMPARE(parse_failure("<TrainingCenterDatabase><Activities></Activity>"),
           std::optional(ParseError::kind_t::malformed));
  QCOMPARE(parse_failure("<gpx version=\"1.1\"></gpx>"), std::optional(ParseError::kind_t::empty_track));
}

QTEST_GUILESS_MAIN(FormatsTest)
