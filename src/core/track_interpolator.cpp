#include "track_interpolator.h"
#include <algorithm>

namespace ptt {

namespace {

InterpolatedFix fixFromPoint(const TrackPoint& p)
{
    return {GeoCoordinate{p.latitude, p.longitude}, p.elevation};
}

double secondsBetween(const QDateTime& from, const QDateTime& to)
{
    return from.msecsTo(to) / 1000.0;
}

} // namespace

std::optional<InterpolatedFix>
TrackInterpolator::interpolate(const QVector<TrackPoint>& trackpoints,
                               const QDateTime& targetTime,
                               double maxGapSeconds)
{
    if (trackpoints.isEmpty() || !targetTime.isValid()) {
        return std::nullopt;
    }
    
    // Leftmost trackpoint not earlier than the target
    auto it = std::lower_bound(trackpoints.cbegin(), trackpoints.cend(), targetTime,
        [](const TrackPoint& p, const QDateTime& t) {
            return p.timestamp < t;
        });
    const int idx = static_cast<int>(it - trackpoints.cbegin());
    
    if (idx < trackpoints.size() && trackpoints[idx].timestamp == targetTime) {
        return fixFromPoint(trackpoints[idx]);
    }
    
    if (idx == 0) {
        // Photo is before first trackpoint
        const TrackPoint& first = trackpoints.first();
        if (secondsBetween(targetTime, first.timestamp) <= maxGapSeconds) {
            return fixFromPoint(first);
        }
        return std::nullopt;
    }
    
    if (idx >= trackpoints.size()) {
        // Photo is after last trackpoint
        const TrackPoint& last = trackpoints.last();
        if (secondsBetween(last.timestamp, targetTime) <= maxGapSeconds) {
            return fixFromPoint(last);
        }
        return std::nullopt;
    }
    
    const TrackPoint& before = trackpoints[idx - 1];
    const TrackPoint& after = trackpoints[idx];
    
    // Bracketing points too far apart to trust a position between them
    double totalGap = secondsBetween(before.timestamp, after.timestamp);
    if (totalGap > maxGapSeconds) {
        return std::nullopt;
    }
    
    if (totalGap == 0.0) {
        return fixFromPoint(before);
    }
    
    double ratio = secondsBetween(before.timestamp, targetTime) / totalGap;
    
    InterpolatedFix fix;
    fix.coordinate.latitude = before.latitude + (after.latitude - before.latitude) * ratio;
    fix.coordinate.longitude = before.longitude + (after.longitude - before.longitude) * ratio;
    fix.elevation = before.elevation + (after.elevation - before.elevation) * ratio;
    return fix;
}

bool TrackInterpolator::isWithinTrackRange(const QVector<TrackPoint>& trackpoints,
                                           const QDateTime& time)
{
    if (trackpoints.isEmpty()) {
        return false;
    }
    return time >= trackpoints.first().timestamp && 
           time <= trackpoints.last().timestamp;
}

std::pair<QDateTime, QDateTime>
TrackInterpolator::trackTimeRange(const QVector<TrackPoint>& trackpoints)
{
    if (trackpoints.isEmpty()) {
        return {QDateTime(), QDateTime()};
    }
    return {trackpoints.first().timestamp, trackpoints.last().timestamp};
}

} // namespace ptt
