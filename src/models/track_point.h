#pragma once

#include <QDateTime>

namespace ptt {

/**
 * @brief A single timestamped GPS fix from a logged route.
 *
 * Timestamps are always UTC. Sources without an elevation reading
 * store 0.0.
 */
struct TrackPoint {
    QDateTime timestamp;
    double latitude = 0.0;
    double longitude = 0.0;
    double elevation = 0.0;
    
    bool isValid() const {
        return timestamp.isValid() && 
               latitude >= -90.0 && latitude <= 90.0 &&
               longitude >= -180.0 && longitude <= 180.0;
    }
};

} // namespace ptt
