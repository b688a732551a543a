#pragma once

#include "models/photo_record.h"
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <optional>

namespace ptt {

/**
 * @brief Capture time and GPS read from a photo file.
 *
 * Every field is optional; a file without EXIF yields an empty result.
 */
struct PhotoMetadata {
  std::optional<QDateTime> captureTime; // UTC
  std::optional<GeoCoordinate> coordinate;
  std::optional<double> altitude;

  bool hasGps() const { return coordinate.has_value(); }
};

/**
 * @brief Which backend can write GPS tags to a format.
 */
enum class FormatSupportLevel {
  FullWrite,    // exiv2 reads and writes natively
  NeedsExifTool // BMFF containers (HEIC/HEIF) go through external exiftool
};

/**
 * @brief Extended info about format support.
 */
struct FormatInfo {
  FormatSupportLevel level;
  QString warning; // Warning message for non-full support formats
};

/**
 * @brief Unsigned degrees/minutes/seconds as stored in EXIF GPS rationals.
 *
 * Seconds are in units of 1/10000 s and always below 60 s.
 */
struct DmsValue {
  quint32 degrees = 0;
  quint32 minutes = 0;
  quint32 secondsE4 = 0;
};

/**
 * @brief Handler for reading and writing EXIF metadata using exiv2.
 *
 * Supports JPEG, PNG, TIFF, HEIC/HEIF and common RAW formats (DNG, ARW, CR2,
 * NEF).
 */
class ExifHandler {
public:
  /**
   * @brief Supported photo file extensions (lowercase, without dots).
   */
  static const QStringList &supportedExtensions();

  /**
   * @brief Check if a file extension is supported.
   * @param path File path to check
   * @return true if the file type is supported
   */
  static bool isSupported(const QString &path);

  /**
   * @brief List supported image files in a directory.
   * @param directory Directory to scan (not recursive)
   * @return Absolute paths sorted by file name
   */
  static QStringList findImageFiles(const QString &directory);

  /**
   * @brief Read capture time and existing GPS from a photo.
   *
   * The capture time zone comes from the OffsetTimeOriginal/OffsetTime tags
   * when present, then from @p fallbackOffsetSeconds, then from the system
   * time zone. Falls back to exiftool for formats exiv2 cannot open.
   *
   * @param filePath Path to the photo file
   * @param fallbackOffsetSeconds Camera offset from UTC in seconds (positive =
   * camera ahead of UTC), used when the file has no offset tag
   * @return Metadata; missing fields are nullopt
   */
  static PhotoMetadata
  readMetadata(const QString &filePath,
               std::optional<int> fallbackOffsetSeconds = std::nullopt);

  /**
   * @brief Convert an EXIF date/time string to UTC.
   *
   * Accepts "yyyy:MM:dd HH:mm:ss" and "yyyy-MM-dd HH:mm:ss", with optional
   * fractional seconds and an optional trailing "+HH:MM"/"Z" zone.
   *
   * @param dateText EXIF date/time value
   * @param offsetText Value of an OffsetTime* tag, may be empty
   * @param fallbackOffsetSeconds Used when neither text carries a zone
   * @return UTC time, or nullopt for empty/zeroed/unparseable values
   */
  static std::optional<QDateTime>
  parseExifDateTime(const QString &dateText, const QString &offsetText = {},
                    std::optional<int> fallbackOffsetSeconds = std::nullopt);

  /**
   * @brief Parse an EXIF offset such as "+09:00", "-0530" or "Z".
   * @return Offset in seconds ahead of UTC, or nullopt
   */
  static std::optional<int> parseUtcOffset(const QString &text);

  /**
   * @brief Split an absolute decimal degree value into DMS.
   *
   * Rounds to 1/10000 s, carrying a rounded-up 60 s into the minutes and
   * 60 min into the degrees. The sign is dropped; EXIF keeps it in the
   * N/S and E/W reference tags.
   */
  static DmsValue toDms(double decimalDegrees);

  /**
   * @brief Write GPS coordinates to photo EXIF.
   * @param filePath Path to the photo file
   * @param latitude GPS latitude
   * @param longitude GPS longitude
   * @param elevation GPS elevation (optional)
   * @return true on success
   */
  static bool writeGpsData(const QString &filePath, double latitude,
                           double longitude,
                           std::optional<double> elevation = std::nullopt);

  /**
   * @brief Get the last error message.
   * @return Error message or empty string
   */
  static QString lastError();

  /**
   * @brief Get detailed format support info for a file.
   * @param path File path to check
   * @return FormatInfo with support level and warning message
   */
  static FormatInfo getFormatInfo(const QString &path);

private:
  static QString s_lastError;
};

} // namespace ptt
