#pragma once

#include "models/photo_record.h"
#include "models/track_point.h"
#include <QVector>
#include <optional>
#include <utility>

namespace ptt {

/// Default tolerance between a photo and the track data around it: one hour.
constexpr double kDefaultMaxGapSeconds = 3600.0;

/**
 * @brief Position estimated for a point in time.
 */
struct InterpolatedFix {
    GeoCoordinate coordinate;
    double elevation = 0.0;
};

/**
 * @brief Estimates a position for a timestamp from a GPS track.
 * 
 * Uses linear interpolation between the two trackpoints bracketing the
 * timestamp. Latitude, longitude and elevation are interpolated independently
 * in degrees/meters.
 *
 * All functions are stateless and do not modify their inputs, so they can be
 * called concurrently on the same (unmodified) trackpoint vector.
 */
class TrackInterpolator {
public:
    /**
     * @brief Estimate the position at a given time.
     *
     * Outside the track's time span the first/last point is returned as long
     * as it is at most @p maxGapSeconds away. Inside the span, the bracketing
     * points must be at most @p maxGapSeconds apart. Ties between equal
     * timestamps resolve to the leftmost point.
     *
     * @param trackpoints Trackpoints sorted ascending by timestamp (not checked)
     * @param targetTime Timestamp to locate (UTC)
     * @param maxGapSeconds Maximum tolerated gap in seconds
     * @return Estimated fix, or nullopt if the track is too sparse around @p targetTime
     */
    static std::optional<InterpolatedFix>
    interpolate(const QVector<TrackPoint>& trackpoints,
                const QDateTime& targetTime,
                double maxGapSeconds = kDefaultMaxGapSeconds);
    
    /**
     * @brief Check if a timestamp is within the track time range.
     * @param trackpoints Sorted trackpoints
     * @param time Timestamp to check
     * @return true if within range
     */
    static bool isWithinTrackRange(const QVector<TrackPoint>& trackpoints,
                                   const QDateTime& time);
    
    /**
     * @brief Get the time range of the track.
     * @return Pair of (start, end) timestamps, invalid if the track is empty
     */
    static std::pair<QDateTime, QDateTime>
    trackTimeRange(const QVector<TrackPoint>& trackpoints);
};

} // namespace ptt
