#pragma once

#include "models/photo_record.h"
#include "models/track_point.h"
#include <QObject>
#include <QStringList>
#include <QVector>
#include <optional>

namespace ptt {

/**
 * @brief Orchestrates the photo geotagging process.
 * 
 * Coordinates GPX parsing, photo scanning, batch matching, EXIF writing and
 * relocation of photos that could not be matched. Runs on the caller's thread;
 * progress is reported through signals.
 */
class PhotoProcessor : public QObject {
    Q_OBJECT

public:
    explicit PhotoProcessor(QObject* parent = nullptr);
    
    /**
     * @brief Load GPX files, merging them with any track already loaded.
     * @param filePaths Paths to GPX files
     * @return true if at least one trackpoint is loaded afterwards
     */
    bool loadTrackFiles(const QStringList& filePaths);
    
    /**
     * @brief Load every GPX file of a directory.
     * @param directory Directory containing *.gpx files
     * @return true if at least one trackpoint is loaded afterwards
     */
    bool loadTrackDirectory(const QString& directory);
    
    /**
     * @brief Get the loaded trackpoints, sorted by time.
     */
    const QVector<TrackPoint>& trackpoints() const { return m_trackpoints; }
    
    /**
     * @brief Check if a track is loaded.
     */
    bool hasTrackLoaded() const { return !m_trackpoints.isEmpty(); }
    
    /**
     * @brief Read metadata of photo files and add them as records.
     * @param filePaths Photo file paths; unsupported and already known files are skipped
     * @param fallbackOffsetSeconds Camera offset used when a photo has no offset tag
     * @return Number of records added
     */
    int scanPhotos(const QStringList& filePaths,
                   std::optional<int> fallbackOffsetSeconds = std::nullopt);
    
    /**
     * @brief Add records whose metadata was read elsewhere.
     * @return Number of records added (duplicates by path are skipped)
     */
    int addRecords(const QVector<PhotoRecord>& records);
    
    const QVector<PhotoRecord>& photos() const { return m_photos; }
    
    /**
     * @brief Match photos against the loaded track.
     *
     * Every record not yet written (or failed) and not placed by hand is
     * re-evaluated, so this can be called again after more tracks or photos
     * are added.
     *
     * @param maxGapSeconds Matching tolerance
     * @return Status counts after matching
     */
    MatchSummary runMatching(double maxGapSeconds);
    
    /**
     * @brief Place photos at a user-given position.
     *
     * The photos become Matched with the given coordinate, whatever their
     * current state, and later runMatching() calls leave them alone.
     *
     * @param indices Indices into photos(); out-of-range ones are skipped
     * @param coordinate Position in decimal degrees
     * @param elevation Elevation in meters, sea level when absent
     * @return Number of photos placed, 0 if the coordinate is out of range
     */
    int applyCoordinate(const QVector<int>& indices, const GeoCoordinate& coordinate,
                        std::optional<double> elevation = std::nullopt);
    
    /**
     * @brief Write matched coordinates into the photo files.
     * @param dryRun Only report what would be written
     * @return Number of photos written (or that would be written)
     */
    int writeMatched(bool dryRun);
    
    /**
     * @brief Move photos without capture time or match into a folder.
     * @param targetDirectory Destination, created when needed
     * @param dryRun Only report what would be moved
     * @return Number of photos moved (or that would be moved)
     */
    int moveUnmatched(const QString& targetDirectory, bool dryRun);
    
    /**
     * @brief Stop ongoing writing after the current photo.
     */
    void stopProcessing();
    
    /**
     * @brief Drop all photos and trackpoints.
     */
    void clear();
    
    MatchSummary summary() const;

signals:
    /**
     * @brief Emitted when GPX files are loaded.
     * @param trackpointCount Total number of trackpoints loaded
     */
    void tracksLoaded(int trackpointCount);
    
    /**
     * @brief Emitted when GPX loading fails.
     * @param error Error message
     */
    void trackLoadError(const QString& error);
    
    /**
     * @brief Emitted when photo scanning is complete.
     * @param photoCount Number of photos added
     */
    void photosScanComplete(int photoCount);
    
    void matchingComplete(const ptt::MatchSummary& summary);
    
    /**
     * @brief Emitted when a single photo is written.
     * @param index Photo index in photos()
     * @param success Whether writing succeeded
     */
    void photoWritten(int index, bool success);
    
    /**
     * @brief Emitted when all matched photos are processed.
     * @param successCount Number of photos successfully written
     * @param totalCount Number of matched photos
     */
    void writeComplete(int successCount, int totalCount);
    
    void photoMoved(int index, const QString& destination);
    
    /**
     * @brief Emitted with progress updates while writing.
     * @param current Current photo (1-based)
     * @param total Total photos to write
     */
    void progressUpdated(int current, int total);

private:
    bool containsFile(const QString& filePath) const;
    
    QVector<TrackPoint> m_trackpoints;
    QStringList m_trackFiles;
    QVector<PhotoRecord> m_photos;
    bool m_stopRequested = false;
};

} // namespace ptt
