#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

namespace ptt {

/**
 * @brief Latitude/longitude pair in decimal degrees (WGS84).
 */
struct GeoCoordinate {
    double latitude = 0.0;
    double longitude = 0.0;
};

/**
 * @brief Geotagging state of a photo.
 *
 * The batch matcher only produces HasGps, NoTime, Matched and NoMatch.
 * Written and Error are set by the write-back step.
 */
enum class PhotoStatus {
    Pending,        // Metadata not evaluated yet
    HasGps,         // Photo already carries GPS, left untouched
    NoTime,         // No capture time available
    Matched,        // Position interpolated from the track
    NoMatch,        // No track data close enough in time
    Written,        // Matched position written to the file
    Error           // Write-back failed
};

/**
 * @brief Short lowercase name of a status, for logs and reports.
 */
inline const char* statusName(PhotoStatus status)
{
    switch (status) {
    case PhotoStatus::Pending: return "pending";
    case PhotoStatus::HasGps:  return "has_gps";
    case PhotoStatus::NoTime:  return "no_time";
    case PhotoStatus::Matched: return "matched";
    case PhotoStatus::NoMatch: return "no_match";
    case PhotoStatus::Written: return "written";
    case PhotoStatus::Error:   return "error";
    }
    return "unknown";
}

/**
 * @brief A photo file with its metadata and geotagging state.
 */
struct PhotoRecord {
    QString filePath;
    QString fileName;
    std::optional<QDateTime> captureTime;   // UTC
    PhotoStatus status = PhotoStatus::Pending;
    QString errorMessage;

    // GPS already present in the file
    std::optional<GeoCoordinate> existingCoordinate;
    std::optional<double> existingElevation;

    // Set by the batch matcher or by a manual placement
    std::optional<GeoCoordinate> matchedCoordinate;
    std::optional<double> matchedElevation;
    bool manualPlacement = false;           // Matched fields given by the user

    bool hasMatchedCoordinates() const {
        return matchedCoordinate.has_value() && matchedElevation.has_value();
    }
};

/**
 * @brief Per-status counts over a photo collection.
 */
struct MatchSummary {
    int total = 0;
    int hasGps = 0;
    int noTime = 0;
    int matched = 0;
    int noMatch = 0;
    int written = 0;
    int error = 0;
    int pending = 0;
};

} // namespace ptt
