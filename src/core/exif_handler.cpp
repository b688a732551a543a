#include "exif_handler.h"
#include "exiftool.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QTimeZone>
#include <cmath>
#include <initializer_list>
#include <exiv2/exiv2.hpp>

namespace ptt {

QString ExifHandler::s_lastError;

// Key: extension (lowercase), Value: {level, warning}
static const QHash<QString, FormatInfo> &getFormatDatabase() {
  static const QHash<QString, FormatInfo> db = {
      // FullWrite - exiv2 handles natively
      {"jpg", {FormatSupportLevel::FullWrite, ""}},
      {"jpeg", {FormatSupportLevel::FullWrite, ""}},
      {"tiff", {FormatSupportLevel::FullWrite, ""}},
      {"tif", {FormatSupportLevel::FullWrite, ""}},
      {"dng", {FormatSupportLevel::FullWrite, ""}},
      {"arw", {FormatSupportLevel::FullWrite, ""}}, // Sony
      {"cr2", {FormatSupportLevel::FullWrite, ""}}, // Canon
      {"nef", {FormatSupportLevel::FullWrite, ""}}, // Nikon
      {"png", {FormatSupportLevel::FullWrite, ""}},

      // NeedsExifTool - BMFF formats require external exiftool
      {"heic",
       {FormatSupportLevel::NeedsExifTool, "Will use external exiftool"}},
      {"heif",
       {FormatSupportLevel::NeedsExifTool, "Will use external exiftool"}},
  };
  return db;
}

namespace {

// Value of the first key present, or empty
QString firstValue(const Exiv2::ExifData &exifData,
                   std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    auto it = exifData.findKey(Exiv2::ExifKey(key));
    if (it != exifData.end()) {
      QString value = QString::fromStdString(it->toString()).trimmed();
      if (!value.isEmpty()) {
        return value;
      }
    }
  }
  return {};
}

double rationalToDouble(const Exiv2::Rational &r) {
  if (r.second == 0)
    return 0.0;
  return r.first / static_cast<double>(r.second);
}

} // namespace

const QStringList &ExifHandler::supportedExtensions() {
  static const QStringList extensions = {"jpg", "jpeg", "heic", "heif",
                                         "png", "tiff", "tif",  "dng",
                                         "arw", "cr2",  "nef"};
  return extensions;
}

bool ExifHandler::isSupported(const QString &path) {
  QString ext = QFileInfo(path).suffix().toLower();
  return supportedExtensions().contains(ext);
}

QStringList ExifHandler::findImageFiles(const QString &directory) {
  QStringList result;
  const QFileInfoList entries =
      QDir(directory).entryInfoList(QDir::Files | QDir::Readable, QDir::Name);
  for (const QFileInfo &info : entries) {
    if (isSupported(info.fileName())) {
      result.append(info.absoluteFilePath());
    }
  }
  return result;
}

std::optional<int> ExifHandler::parseUtcOffset(const QString &text) {
  QString s = text.trimmed();
  if (s.isEmpty())
    return std::nullopt;
  if (s == "Z" || s == "z")
    return 0;

  int sign = 1;
  if (s.startsWith('+')) {
    s.remove(0, 1);
  } else if (s.startsWith('-')) {
    sign = -1;
    s.remove(0, 1);
  } else {
    return std::nullopt;
  }

  s.remove(':');
  if (s.size() != 2 && s.size() != 4)
    return std::nullopt;

  bool okHours = false;
  bool okMinutes = true;
  int hours = s.left(2).toInt(&okHours);
  int minutes = s.size() == 4 ? s.mid(2, 2).toInt(&okMinutes) : 0;
  if (!okHours || !okMinutes || hours > 14 || minutes > 59)
    return std::nullopt;

  return sign * (hours * 3600 + minutes * 60);
}

std::optional<QDateTime>
ExifHandler::parseExifDateTime(const QString &dateText,
                               const QString &offsetText,
                               std::optional<int> fallbackOffsetSeconds) {
  QString dateStr = dateText.trimmed();
  if (dateStr.isEmpty() || dateStr.startsWith("0000:00:00"))
    return std::nullopt;

  // EXIF format: "YYYY:MM:DD HH:MM:SS", optionally followed by a fraction
  // and/or zone
  QString wallClock = dateStr.left(19);
  QString rest = dateStr.mid(19);
  if (rest.startsWith('.')) {
    int end = 1;
    while (end < rest.size() && rest[end].isDigit())
      ++end;
    rest = rest.mid(end);
  }

  QDateTime dt = QDateTime::fromString(wallClock, "yyyy:MM:dd HH:mm:ss");
  if (!dt.isValid())
    dt = QDateTime::fromString(wallClock, "yyyy-MM-dd HH:mm:ss");
  if (!dt.isValid())
    return std::nullopt;

  std::optional<int> offset = parseUtcOffset(rest);
  if (!offset)
    offset = parseUtcOffset(offsetText);
  if (!offset)
    offset = fallbackOffsetSeconds;

  if (offset) {
    dt.setTimeZone(QTimeZone(*offset));
  } else {
    // Camera clock assumed to follow this machine's zone
    dt.setTimeZone(QTimeZone::systemTimeZone());
  }
  return dt.toUTC();
}

PhotoMetadata ExifHandler::readMetadata(const QString &filePath,
                                        std::optional<int> fallbackOffsetSeconds) {
  s_lastError.clear();

  if (getFormatInfo(filePath).level == FormatSupportLevel::NeedsExifTool &&
      ExifTool::isAvailable()) {
    auto viaExifTool = ExifTool::readMetadata(filePath, fallbackOffsetSeconds);
    if (viaExifTool.has_value())
      return *viaExifTool;
    s_lastError = ExifTool::lastError();
  }

  PhotoMetadata metadata;

  try {
    auto image = Exiv2::ImageFactory::open(filePath.toStdString());
    image->readMetadata();

    const Exiv2::ExifData &exifData = image->exifData();
    if (exifData.empty()) {
      s_lastError = "No EXIF data found";
      return metadata;
    }

    // Try DateTimeOriginal first, then digitized and file change times
    QString offsetStr = firstValue(
        exifData, {"Exif.Photo.OffsetTimeOriginal", "Exif.Photo.OffsetTime"});
    QString dateStr =
        firstValue(exifData, {"Exif.Photo.DateTimeOriginal",
                              "Exif.Image.DateTimeOriginal",
                              "Exif.Photo.DateTimeDigitized"});
    metadata.captureTime =
        parseExifDateTime(dateStr, offsetStr, fallbackOffsetSeconds);
    if (!metadata.captureTime) {
      dateStr = firstValue(exifData, {"Exif.Image.DateTime"});
      metadata.captureTime = parseExifDateTime(
          dateStr, firstValue(exifData, {"Exif.Photo.OffsetTime"}),
          fallbackOffsetSeconds);
    }
    if (!metadata.captureTime) {
      s_lastError = "No valid timestamp found in EXIF";
    }

    auto latIt = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLatitude"));
    auto lonIt = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLongitude"));
    auto latRefIt =
        exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLatitudeRef"));
    auto lonRefIt =
        exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLongitudeRef"));

    if (latIt == exifData.end() || lonIt == exifData.end()) {
      return metadata;
    }

    // Parse DMS to decimal degrees
    auto parseCoord = [](const Exiv2::Value &value) -> std::optional<double> {
      if (value.count() < 3)
        return std::nullopt;
      double deg = rationalToDouble(value.toRational(0));
      double min = rationalToDouble(value.toRational(1));
      double sec = rationalToDouble(value.toRational(2));
      return deg + min / 60.0 + sec / 3600.0;
    };

    auto lat = parseCoord(latIt->value());
    auto lon = parseCoord(lonIt->value());
    if (!lat || !lon) {
      qWarning() << "Malformed GPS coordinates in" << filePath;
      return metadata;
    }

    GeoCoordinate coord{*lat, *lon};

    // Apply reference (N/S, E/W)
    if (latRefIt != exifData.end() && latRefIt->toString() == "S") {
      coord.latitude = -coord.latitude;
    }
    if (lonRefIt != exifData.end() && lonRefIt->toString() == "W") {
      coord.longitude = -coord.longitude;
    }
    metadata.coordinate = coord;

    auto altIt = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSAltitude"));
    if (altIt != exifData.end()) {
      auto altRefIt =
          exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSAltitudeRef"));
      double alt = altIt->toFloat();
      if (altRefIt != exifData.end() && altRefIt->toInt64() == 1) {
        alt = -alt; // Below sea level
      }
      metadata.altitude = alt;
    }

    return metadata;

  } catch (const Exiv2::Error &e) {
    s_lastError = QString("Exiv2 error: %1").arg(e.what());
    qWarning() << s_lastError;

    if (ExifTool::isAvailable()) {
      auto viaExifTool =
          ExifTool::readMetadata(filePath, fallbackOffsetSeconds);
      if (viaExifTool.has_value()) {
        s_lastError.clear();
        return *viaExifTool;
      }
    }
    return metadata;
  }
}

DmsValue ExifHandler::toDms(double decimalDegrees) {
  // Whole value in 1/10000 arc seconds so rounding carries naturally
  constexpr qint64 kUnitsPerMinute = 60 * 10000;
  constexpr qint64 kUnitsPerDegree = 60 * kUnitsPerMinute;
  qint64 units = std::llround(std::abs(decimalDegrees) * kUnitsPerDegree);

  DmsValue dms;
  dms.degrees = static_cast<quint32>(units / kUnitsPerDegree);
  units %= kUnitsPerDegree;
  dms.minutes = static_cast<quint32>(units / kUnitsPerMinute);
  dms.secondsE4 = static_cast<quint32>(units % kUnitsPerMinute);
  return dms;
}

bool ExifHandler::writeGpsData(const QString &filePath, double latitude,
                               double longitude,
                               std::optional<double> elevation) {
  s_lastError.clear();

  try {
    auto image = Exiv2::ImageFactory::open(filePath.toStdString());
    image->readMetadata();

    Exiv2::ExifData &exifData = image->exifData();

    auto toRationals = [](double decimal) -> Exiv2::URationalValue {
      DmsValue dms = toDms(decimal);
      Exiv2::URationalValue value;
      value.value_.push_back({dms.degrees, 1u});
      value.value_.push_back({dms.minutes, 1u});
      value.value_.push_back({dms.secondsE4, 10000u});
      return value;
    };

    // Set GPS Version ID
    Exiv2::Value::UniquePtr versionValue =
        Exiv2::Value::create(Exiv2::unsignedByte);
    versionValue->read("2 3 0 0");
    exifData["Exif.GPSInfo.GPSVersionID"] = *versionValue;

    exifData["Exif.GPSInfo.GPSLatitudeRef"] = (latitude >= 0) ? "N" : "S";
    exifData["Exif.GPSInfo.GPSLatitude"] = toRationals(latitude);

    exifData["Exif.GPSInfo.GPSLongitudeRef"] = (longitude >= 0) ? "E" : "W";
    exifData["Exif.GPSInfo.GPSLongitude"] = toRationals(longitude);

    if (elevation.has_value()) {
      double alt = elevation.value();
      Exiv2::Value::UniquePtr altRefValue =
          Exiv2::Value::create(Exiv2::unsignedByte);
      altRefValue->read(alt >= 0 ? "0" : "1");
      exifData["Exif.GPSInfo.GPSAltitudeRef"] = *altRefValue;

      Exiv2::URationalValue altValue;
      altValue.value_.push_back(
          {static_cast<uint32_t>(std::lround(std::abs(alt) * 100)), 100u});
      exifData["Exif.GPSInfo.GPSAltitude"] = altValue;
    }

    image->writeMetadata();

    qInfo() << "Wrote GPS to" << filePath << ":" << latitude << ","
            << longitude;
    return true;

  } catch (const Exiv2::Error &e) {
    s_lastError = QString("Failed to write GPS to %1: %2")
                      .arg(QFileInfo(filePath).fileName(),
                           QString::fromStdString(e.what()));
    qWarning() << s_lastError;
    return false;
  }
}

QString ExifHandler::lastError() { return s_lastError; }

FormatInfo ExifHandler::getFormatInfo(const QString &path) {
  QString ext = QFileInfo(path).suffix().toLower();
  const auto &db = getFormatDatabase();

  if (db.contains(ext)) {
    return db.value(ext);
  }

  // Unknown format - let exiv2 try and report its own error
  return {FormatSupportLevel::FullWrite,
          QString("Unknown format '%1'").arg(ext)};
}

} // namespace ptt
