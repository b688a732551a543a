#pragma once

#include "models/photo_record.h"
#include "models/track_point.h"
#include "track_interpolator.h"
#include <QVector>

namespace ptt {

/**
 * @brief Applies the track interpolator across a photo collection.
 */
class BatchMatcher {
public:
    /**
     * @brief Match every photo against the track, updating records in place.
     *
     * For each record, in order: existing GPS -> HasGps; no capture time ->
     * NoTime; otherwise Matched (with coordinate and elevation set) or NoMatch.
     * Prior status is ignored, so the call can be repeated after the track or
     * the collection changes. Matched fields are left as they were on NoMatch.
     *
     * @param photos Records to evaluate
     * @param trackpoints Trackpoints sorted ascending by timestamp
     * @param maxGapSeconds Tolerance passed to TrackInterpolator::interpolate
     */
    static void matchPhotos(QVector<PhotoRecord>& photos,
                            const QVector<TrackPoint>& trackpoints,
                            double maxGapSeconds = kDefaultMaxGapSeconds);

    /**
     * @brief Match a single record. Same rules as matchPhotos().
     */
    static void matchPhoto(PhotoRecord& photo,
                           const QVector<TrackPoint>& trackpoints,
                           double maxGapSeconds = kDefaultMaxGapSeconds);

    /**
     * @brief Count records per status.
     */
    static MatchSummary summarize(const QVector<PhotoRecord>& photos);
};

} // namespace ptt
