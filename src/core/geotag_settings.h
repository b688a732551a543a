#pragma once

#include "track_interpolator.h"
#include <QString>
#include <optional>

namespace ptt {

/**
 * @brief Settings for a geotagging run.
 */
struct GeotagSettings {
    double maxGapSeconds = kDefaultMaxGapSeconds;  // Tolerance for matching
    std::optional<double> timeOffsetHours;         // Camera offset from UTC when the photo has none
    bool dryRun = false;                           // Preview only, don't write changes
    bool moveUnmatched = true;                     // Move no-time/no-match photos aside
    QString gpxFolder = "gpx";                     // Relative to the photo folder
    QString unmatchedFolder = "no_gps";            // Relative to the photo folder

    std::optional<int> timeOffsetSeconds() const {
        if (!timeOffsetHours)
            return std::nullopt;
        return static_cast<int>(*timeOffsetHours * 3600.0);
    }
};

/**
 * @brief A position given by the user for chosen photos.
 */
struct ManualPlacement {
    GeoCoordinate coordinate;
    std::optional<double> elevation;    // Written as sea level when absent
};

/**
 * @brief Reads GeotagSettings from an INI file.
 *
 * Keys live in the [geotag] group: maxGapSeconds, timeOffsetHours, dryRun,
 * moveUnmatched, gpxFolder, unmatchedFolder. Absent keys keep the value
 * already in the settings object.
 */
class SettingsLoader {
public:
    /**
     * @brief Overlay values from an INI file onto @p settings.
     * @param filePath INI file
     * @param settings Settings to update; untouched on failure
     * @return false if the file is missing/unreadable or a value is invalid
     */
    static bool load(const QString& filePath, GeotagSettings& settings);

    /**
     * @brief Check value ranges.
     * @return false with lastError() set if a value is out of range
     */
    static bool validate(const GeotagSettings& settings);

    /**
     * @brief Parse a "LAT,LON" or "LAT,LON,ELE" position in decimal degrees/meters.
     * @return nullopt with lastError() set if malformed or out of range
     */
    static std::optional<ManualPlacement> parsePlacement(const QString& text);

    static QString lastError();

private:
    static QString s_lastError;
};

} // namespace ptt
