#include "photo_processor.h"
#include "batch_matcher.h"
#include "exif_handler.h"
#include "exiftool.h"
#include "gpx_parser.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <algorithm>
#include <cmath>

namespace ptt {

PhotoProcessor::PhotoProcessor(QObject *parent) : QObject(parent) {}

bool PhotoProcessor::loadTrackFiles(const QStringList &filePaths) {
  QStringList newFiles;
  for (const QString &path : filePaths) {
    QString key = QFileInfo(path).absoluteFilePath();
    if (m_trackFiles.contains(key) || newFiles.contains(key)) {
      qInfo() << "Skipping already loaded GPX file:" << path;
      continue;
    }
    newFiles.append(key);
  }

  QVector<TrackPoint> points = GpxParser::parseFiles(newFiles);
  QString error = GpxParser::lastError();

  if (!points.isEmpty()) {
    m_trackFiles += newFiles;
    m_trackpoints += points;
    std::stable_sort(m_trackpoints.begin(), m_trackpoints.end(),
                     [](const TrackPoint &a, const TrackPoint &b) {
                       return a.timestamp < b.timestamp;
                     });
  }

  if (m_trackpoints.isEmpty()) {
    if (error.isEmpty())
      error = "No timestamped trackpoints found";
    emit trackLoadError(error);
    return false;
  }

  double avgInterval = GpxParser::calculateAverageInterval(m_trackpoints);
  qInfo() << "Loaded" << m_trackFiles.size() << "GPX file(s) with"
          << m_trackpoints.size() << "trackpoints,"
          << "avg interval:" << avgInterval << "seconds";

  emit tracksLoaded(m_trackpoints.size());
  return true;
}

bool PhotoProcessor::loadTrackDirectory(const QString &directory) {
  QStringList files = GpxParser::findGpxFiles(directory);
  if (files.isEmpty() && m_trackpoints.isEmpty()) {
    emit trackLoadError(QString("No GPX files in %1").arg(directory));
    return false;
  }
  return loadTrackFiles(files);
}

bool PhotoProcessor::containsFile(const QString &filePath) const {
  return std::any_of(m_photos.cbegin(), m_photos.cend(),
                     [&filePath](const PhotoRecord &photo) {
                       return photo.filePath == filePath;
                     });
}

int PhotoProcessor::scanPhotos(const QStringList &filePaths,
                               std::optional<int> fallbackOffsetSeconds) {
  QVector<PhotoRecord> items;
  int skippedDuplicates = 0;

  for (const QString &path : filePaths) {
    if (!ExifHandler::isSupported(path)) {
      qInfo() << "Skipping unsupported file:" << path;
      continue;
    }

    QString absolutePath = QFileInfo(path).absoluteFilePath();
    if (containsFile(absolutePath) ||
        std::any_of(items.cbegin(), items.cend(),
                    [&absolutePath](const PhotoRecord &item) {
                      return item.filePath == absolutePath;
                    })) {
      qInfo() << "Skipping duplicate file:" << path;
      ++skippedDuplicates;
      continue;
    }

    PhotoMetadata metadata =
        ExifHandler::readMetadata(absolutePath, fallbackOffsetSeconds);

    PhotoRecord item;
    item.filePath = absolutePath;
    item.fileName = QFileInfo(absolutePath).fileName();
    item.captureTime = metadata.captureTime;
    item.existingCoordinate = metadata.coordinate;
    item.existingElevation = metadata.altitude;
    item.status =
        metadata.hasGps() ? PhotoStatus::HasGps : PhotoStatus::Pending;

    items.append(item);
  }

  m_photos += items;
  if (skippedDuplicates > 0) {
    qInfo() << "Skipped" << skippedDuplicates << "duplicate file(s)";
  }
  emit photosScanComplete(items.size());
  return items.size();
}

int PhotoProcessor::addRecords(const QVector<PhotoRecord> &records) {
  int added = 0;
  for (const PhotoRecord &record : records) {
    if (containsFile(record.filePath))
      continue;
    m_photos.append(record);
    ++added;
  }
  return added;
}

MatchSummary PhotoProcessor::runMatching(double maxGapSeconds) {
  if (m_trackpoints.isEmpty()) {
    qWarning() << "Matching without trackpoints, every timed photo will be "
                  "unmatched";
  }

  qInfo() << "Matching" << m_photos.size() << "photos against"
          << m_trackpoints.size() << "trackpoints, maxGap=" << maxGapSeconds
          << "s";

  for (PhotoRecord &photo : m_photos) {
    // Written and failed photos belong to the write-back step, hand-placed
    // ones keep the position they were given
    if (photo.status == PhotoStatus::Written ||
        photo.status == PhotoStatus::Error || photo.manualPlacement)
      continue;
    BatchMatcher::matchPhoto(photo, m_trackpoints, maxGapSeconds);
  }

  MatchSummary result = summary();
  qInfo() << "Matched" << result.matched << "/" << result.total << "photos";
  emit matchingComplete(result);
  return result;
}

int PhotoProcessor::applyCoordinate(const QVector<int> &indices,
                                    const GeoCoordinate &coordinate,
                                    std::optional<double> elevation) {
  if (!std::isfinite(coordinate.latitude) ||
      !std::isfinite(coordinate.longitude) ||
      std::abs(coordinate.latitude) > 90.0 ||
      std::abs(coordinate.longitude) > 180.0) {
    qWarning() << "Refusing out of range position" << coordinate.latitude
               << "," << coordinate.longitude;
    return 0;
  }

  int placed = 0;
  for (int i : indices) {
    if (i < 0 || i >= m_photos.size()) {
      qWarning() << "No photo at index" << i;
      continue;
    }
    PhotoRecord &photo = m_photos[i];
    photo.matchedCoordinate = coordinate;
    photo.matchedElevation = elevation.value_or(0.0);
    photo.manualPlacement = true;
    photo.errorMessage.clear();
    photo.status = PhotoStatus::Matched;
    ++placed;
  }

  qInfo() << "Placed" << placed << "photo(s) at" << coordinate.latitude << ","
          << coordinate.longitude;
  return placed;
}

int PhotoProcessor::writeMatched(bool dryRun) {
  m_stopRequested = false;

  QVector<int> targets;
  for (int i = 0; i < m_photos.size(); ++i) {
    if (m_photos[i].status == PhotoStatus::Matched)
      targets.append(i);
  }

  int successCount = 0;

  for (int n = 0; n < targets.size(); ++n) {
    if (m_stopRequested) {
      qInfo() << "Writing stopped by user";
      break;
    }

    emit progressUpdated(n + 1, targets.size());

    const int i = targets[n];
    PhotoRecord &photo = m_photos[i];
    if (!photo.hasMatchedCoordinates()) {
      photo.status = PhotoStatus::Error;
      photo.errorMessage = "Matched photo has no coordinates";
      emit photoWritten(i, false);
      continue;
    }

    const GeoCoordinate coord = *photo.matchedCoordinate;
    const double elevation = *photo.matchedElevation;

    if (dryRun) {
      qInfo() << "[dry run] Would write" << coord.latitude << ","
              << coord.longitude << "to" << photo.fileName;
      ++successCount;
      emit photoWritten(i, true);
      continue;
    }

    FormatInfo formatInfo = ExifHandler::getFormatInfo(photo.filePath);
    bool writeSuccess = false;

    if (formatInfo.level == FormatSupportLevel::NeedsExifTool) {
      // Use exiftool for BMFF formats
      writeSuccess = ExifTool::writeGpsData(photo.filePath, coord.latitude,
                                            coord.longitude, elevation);
      if (!writeSuccess)
        photo.errorMessage = ExifTool::lastError();
    } else {
      writeSuccess = ExifHandler::writeGpsData(photo.filePath, coord.latitude,
                                               coord.longitude, elevation);
      if (!writeSuccess)
        photo.errorMessage = ExifHandler::lastError();
    }

    if (!writeSuccess) {
      photo.status = PhotoStatus::Error;
      emit photoWritten(i, false);
      continue;
    }

    photo.existingCoordinate = coord;
    photo.existingElevation = elevation;
    photo.errorMessage.clear();
    photo.status = PhotoStatus::Written;
    emit photoWritten(i, true);
    ++successCount;
  }

  qInfo() << "Writing complete:" << successCount << "/" << targets.size()
          << "photos" << (dryRun ? "(dry run)" : "updated");
  emit writeComplete(successCount, targets.size());
  return successCount;
}

int PhotoProcessor::moveUnmatched(const QString &targetDirectory,
                                  bool dryRun) {
  QDir target(targetDirectory);
  int moved = 0;

  for (int i = 0; i < m_photos.size(); ++i) {
    PhotoRecord &photo = m_photos[i];
    if (photo.status != PhotoStatus::NoTime &&
        photo.status != PhotoStatus::NoMatch)
      continue;

    QString destination = target.absoluteFilePath(photo.fileName);

    if (dryRun) {
      qInfo() << "[dry run] Would move" << photo.fileName << "to"
              << destination;
      ++moved;
      continue;
    }

    if (!target.exists() && !QDir().mkpath(target.absolutePath())) {
      qWarning() << "Cannot create folder" << target.absolutePath();
      return moved;
    }

    if (QFile::exists(destination)) {
      qWarning() << "Not moving" << photo.fileName << "-" << destination
                 << "already exists";
      continue;
    }

    if (!QFile::rename(photo.filePath, destination)) {
      qWarning() << "Failed to move" << photo.filePath << "to" << destination;
      continue;
    }

    photo.filePath = destination;
    ++moved;
    emit photoMoved(i, destination);
  }

  return moved;
}

void PhotoProcessor::stopProcessing() { m_stopRequested = true; }

void PhotoProcessor::clear() {
  m_photos.clear();
  m_trackpoints.clear();
  m_trackFiles.clear();
}

MatchSummary PhotoProcessor::summary() const {
  return BatchMatcher::summarize(m_photos);
}

} // namespace ptt
