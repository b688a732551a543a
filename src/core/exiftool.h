#pragma once

#include "exif_handler.h"
#include <QString>
#include <optional>

namespace ptt {

/**
 * @brief Wrapper around the external exiftool command.
 *
 * Used for BMFF formats (HEIC, HEIF) that exiv2 can't write to, and as a
 * metadata reader when exiv2 can't open a file.
 */
class ExifTool {
public:
  /**
   * @brief Check if exiftool is available in PATH.
   * @return true if exiftool executable is found
   */
  static bool isAvailable();

  /**
   * @brief Version reported by `exiftool -ver`.
   * @return Version string, empty if exiftool is unavailable
   */
  static QString version();

  /**
   * @brief Read capture time and GPS via `exiftool -j -n`.
   * @param filePath Path to the photo file
   * @param fallbackOffsetSeconds See ExifHandler::readMetadata
   * @return Metadata, or nullopt if exiftool failed
   */
  static std::optional<PhotoMetadata>
  readMetadata(const QString &filePath,
               std::optional<int> fallbackOffsetSeconds = std::nullopt);

  /**
   * @brief Parse the JSON printed by `exiftool -j -n` for one file.
   * @param json Raw exiftool output
   * @param fallbackOffsetSeconds See ExifHandler::readMetadata
   * @return Metadata, or nullopt if the JSON is not an exiftool result array
   */
  static std::optional<PhotoMetadata>
  parseJson(const QByteArray &json,
            std::optional<int> fallbackOffsetSeconds = std::nullopt);

  /**
   * @brief Write GPS coordinates using exiftool.
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

private:
  static QString s_lastError;
  static bool s_availabilityChecked;
  static bool s_isAvailable;
};

} // namespace ptt
