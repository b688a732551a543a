#pragma once

#include "models/track_point.h"
#include <QString>
#include <QStringList>
#include <QVector>

namespace ptt {

/**
 * @brief Parser for GPX trace files.
 * 
 * Extracts GPS trackpoints (trk/trkseg/trkpt) and timestamped waypoints (wpt)
 * from GPX 1.0/1.1 files. Points without a timestamp are dropped.
 */
class GpxParser {
public:
    /**
     * @brief Parse a GPX file and extract all timestamped points.
     * @param filePath Path to the GPX file
     * @return Vector of trackpoints sorted by timestamp, empty on error
     */
    static QVector<TrackPoint> parse(const QString& filePath);
    
    /**
     * @brief Parse several GPX files into one time-ordered sequence.
     *
     * Each distinct file is read once. Files that fail to parse are skipped;
     * lastError() then holds the message of the last failure.
     *
     * @param filePaths GPX files to merge
     * @return All points, sorted by timestamp (stable among equal times)
     */
    static QVector<TrackPoint> parseFiles(const QStringList& filePaths);
    
    /**
     * @brief List the GPX files in a directory, sorted by name.
     * @param directory Directory to scan (not recursive)
     * @return Absolute file paths
     */
    static QStringList findGpxFiles(const QString& directory);
    
    /**
     * @brief Parse a GPX timestamp (ISO 8601, optional fraction and zone).
     * @param text Timestamp text
     * @return UTC time; invalid QDateTime if unparseable
     */
    static QDateTime parseTimestamp(const QString& text);
    
    /**
     * @brief Calculate the average time interval between trackpoints.
     * @param trackpoints Vector of trackpoints
     * @return Average interval in seconds, or 300.0 if unable to calculate
     */
    static double calculateAverageInterval(const QVector<TrackPoint>& trackpoints);
    
    /**
     * @brief Get the last error message.
     * @return Error message or empty string if no error
     */
    static QString lastError();

private:
    static QString s_lastError;
};

} // namespace ptt
