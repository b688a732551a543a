#include "batch_matcher.h"

namespace ptt {

void BatchMatcher::matchPhotos(QVector<PhotoRecord>& photos,
                               const QVector<TrackPoint>& trackpoints,
                               double maxGapSeconds)
{
    for (PhotoRecord& photo : photos) {
        matchPhoto(photo, trackpoints, maxGapSeconds);
    }
}

void BatchMatcher::matchPhoto(PhotoRecord& photo,
                              const QVector<TrackPoint>& trackpoints,
                              double maxGapSeconds)
{
    // Existing GPS is never overwritten
    if (photo.existingCoordinate.has_value()) {
        photo.status = PhotoStatus::HasGps;
        return;
    }
    
    // An invalid QDateTime sorts before every trackpoint, treat it as absent
    if (!photo.captureTime.has_value() || !photo.captureTime->isValid()) {
        photo.status = PhotoStatus::NoTime;
        return;
    }
    
    auto fix = TrackInterpolator::interpolate(trackpoints, *photo.captureTime, maxGapSeconds);
    if (!fix.has_value()) {
        photo.status = PhotoStatus::NoMatch;
        return;
    }
    
    photo.matchedCoordinate = fix->coordinate;
    photo.matchedElevation = fix->elevation;
    photo.status = PhotoStatus::Matched;
}

MatchSummary BatchMatcher::summarize(const QVector<PhotoRecord>& photos)
{
    MatchSummary summary;
    summary.total = photos.size();
    
    for (const PhotoRecord& photo : photos) {
        switch (photo.status) {
        case PhotoStatus::Pending: ++summary.pending; break;
        case PhotoStatus::HasGps:  ++summary.hasGps; break;
        case PhotoStatus::NoTime:  ++summary.noTime; break;
        case PhotoStatus::Matched: ++summary.matched; break;
        case PhotoStatus::NoMatch: ++summary.noMatch; break;
        case PhotoStatus::Written: ++summary.written; break;
        case PhotoStatus::Error:   ++summary.error; break;
        }
    }
    return summary;
}

} // namespace ptt
