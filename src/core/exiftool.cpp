#include "exiftool.h"
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>
#include <QStandardPaths>

namespace ptt {

QString ExifTool::s_lastError;
bool ExifTool::s_availabilityChecked = false;
bool ExifTool::s_isAvailable = false;

namespace {

constexpr int kTimeoutMs = 30000;

// exiftool prints numbers unquoted with -n, but some tags stay strings
std::optional<double> jsonNumber(const QJsonObject &obj, const char *key) {
  QJsonValue value = obj.value(QLatin1String(key));
  if (value.isDouble())
    return value.toDouble();
  if (value.isString()) {
    bool ok = false;
    double d = value.toString().toDouble(&ok);
    if (ok)
      return d;
  }
  return std::nullopt;
}

QString jsonString(const QJsonObject &obj, const char *key) {
  QJsonValue value = obj.value(QLatin1String(key));
  return value.isString() ? value.toString().trimmed() : QString();
}

// Runs exiftool to completion; on failure returns nullopt and fills error
std::optional<QByteArray> runExifTool(const QStringList &args,
                                      QString &error) {
  QProcess process;
  process.start("exiftool", args);

  if (!process.waitForFinished(kTimeoutMs)) {
    error = QString("exiftool timed out (%1)").arg(args.join(' '));
    process.kill();
    process.waitForFinished();
    return std::nullopt;
  }

  if (process.exitStatus() != QProcess::NormalExit ||
      process.exitCode() != 0) {
    QString stderrText = QString::fromUtf8(process.readAllStandardError());
    error = QString("exiftool failed: %1").arg(stderrText.trimmed());
    return std::nullopt;
  }

  return process.readAllStandardOutput();
}

} // namespace

bool ExifTool::isAvailable() {
  if (!s_availabilityChecked) {
    s_availabilityChecked = true;

    // Try to find exiftool in PATH
    QString exiftoolPath = QStandardPaths::findExecutable("exiftool");
    s_isAvailable = !exiftoolPath.isEmpty();

    if (s_isAvailable) {
      qInfo() << "Found exiftool at:" << exiftoolPath;
    } else {
      qWarning() << "exiftool not found in PATH";
    }
  }
  return s_isAvailable;
}

QString ExifTool::version() {
  if (!isAvailable())
    return {};

  QString error;
  auto output = runExifTool({"-ver"}, error);
  if (!output) {
    s_lastError = error;
    qWarning() << s_lastError;
    return {};
  }
  return QString::fromUtf8(*output).trimmed();
}

std::optional<PhotoMetadata>
ExifTool::parseJson(const QByteArray &json,
                    std::optional<int> fallbackOffsetSeconds) {
  QJsonParseError parseError;
  QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
  if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
    s_lastError =
        QString("Unexpected exiftool output: %1").arg(parseError.errorString());
    return std::nullopt;
  }

  PhotoMetadata metadata;
  QJsonArray entries = doc.array();
  if (entries.isEmpty())
    return metadata;

  QJsonObject info = entries.first().toObject();

  // With -n, coordinates are signed decimal degrees
  auto lat = jsonNumber(info, "GPSLatitude");
  auto lon = jsonNumber(info, "GPSLongitude");
  if (lat && lon) {
    metadata.coordinate = GeoCoordinate{*lat, *lon};
  }

  if (auto alt = jsonNumber(info, "GPSAltitude")) {
    auto altRef = jsonNumber(info, "GPSAltitudeRef");
    metadata.altitude = (altRef && *altRef == 1.0) ? -*alt : *alt;
  }

  QString dateStr = jsonString(info, "DateTimeOriginal");
  if (dateStr.isEmpty())
    dateStr = jsonString(info, "CreateDate");
  QString offsetStr = jsonString(info, "OffsetTimeOriginal");
  if (offsetStr.isEmpty())
    offsetStr = jsonString(info, "OffsetTime");

  metadata.captureTime = ExifHandler::parseExifDateTime(dateStr, offsetStr,
                                                        fallbackOffsetSeconds);
  return metadata;
}

std::optional<PhotoMetadata>
ExifTool::readMetadata(const QString &filePath,
                       std::optional<int> fallbackOffsetSeconds) {
  s_lastError.clear();

  if (!isAvailable()) {
    s_lastError = "exiftool is not installed or not in PATH";
    return std::nullopt;
  }

  QStringList args = {"-j",
                      "-n",
                      "-DateTimeOriginal",
                      "-CreateDate",
                      "-OffsetTimeOriginal",
                      "-OffsetTime",
                      "-GPSLatitude",
                      "-GPSLongitude",
                      "-GPSAltitude",
                      "-GPSAltitudeRef",
                      filePath};

  QString error;
  auto output = runExifTool(args, error);
  if (!output) {
    s_lastError = error;
    qWarning() << s_lastError;
    return std::nullopt;
  }

  return parseJson(*output, fallbackOffsetSeconds);
}

bool ExifTool::writeGpsData(const QString &filePath, double latitude,
                            double longitude,
                            std::optional<double> elevation) {
  s_lastError.clear();

  if (!isAvailable()) {
    s_lastError = "exiftool is not installed or not in PATH";
    return false;
  }

  QStringList args;
  args << "-overwrite_original"; // Don't create backup files

  QString latRef = latitude >= 0 ? "N" : "S";
  QString lonRef = longitude >= 0 ? "E" : "W";

  args << QString("-GPSLatitude=%1").arg(qAbs(latitude), 0, 'f', 8);
  args << QString("-GPSLatitudeRef=%1").arg(latRef);
  args << QString("-GPSLongitude=%1").arg(qAbs(longitude), 0, 'f', 8);
  args << QString("-GPSLongitudeRef=%1").arg(lonRef);

  if (elevation.has_value()) {
    double alt = elevation.value();
    args << QString("-GPSAltitude=%1").arg(qAbs(alt), 0, 'f', 2);
    args << QString("-GPSAltitudeRef=%1")
                .arg(alt >= 0 ? "Above Sea Level" : "Below Sea Level");
  }

  args << filePath;

  QString error;
  if (!runExifTool(args, error)) {
    s_lastError = error;
    qWarning() << s_lastError;
    return false;
  }

  qInfo() << "exiftool wrote GPS to" << filePath << ":" << latitude << ","
          << longitude;
  return true;
}

QString ExifTool::lastError() { return s_lastError; }

} // namespace ptt
