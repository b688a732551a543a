#include "gpx_parser.h"
#include <pugixml.hpp>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <QTimeZone>
#include <algorithm>
#include <optional>

namespace ptt {

QString GpxParser::s_lastError;

namespace {

// Missing or non-numeric attribute yields false
bool readCoordinate(const pugi::xml_attribute& attr, double& out)
{
    if (!attr) {
        return false;
    }
    bool ok = false;
    out = QString::fromUtf8(attr.value()).trimmed().toDouble(&ok);
    return ok;
}

std::optional<TrackPoint> readPoint(const pugi::xml_node& node)
{
    TrackPoint point;
    
    // Latitude and longitude are required attributes
    if (!readCoordinate(node.attribute("lat"), point.latitude) ||
        !readCoordinate(node.attribute("lon"), point.longitude)) {
        return std::nullopt;
    }
    
    pugi::xml_node timeNode = node.child("time");
    if (timeNode) {
        point.timestamp = GpxParser::parseTimestamp(QString::fromUtf8(timeNode.text().get()));
    }
    
    // Missing elevation is stored as sea level
    pugi::xml_node eleNode = node.child("ele");
    if (eleNode) {
        point.elevation = eleNode.text().as_double(0.0);
    }
    
    return point;
}

void sortByTime(QVector<TrackPoint>& trackpoints)
{
    std::stable_sort(trackpoints.begin(), trackpoints.end(), 
        [](const TrackPoint& a, const TrackPoint& b) {
            return a.timestamp < b.timestamp;
        });
}

} // namespace

QVector<TrackPoint> GpxParser::parse(const QString& filePath)
{
    s_lastError.clear();
    QVector<TrackPoint> trackpoints;
    
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(filePath.toUtf8().constData());
    
    if (!result) {
        s_lastError = QString("Failed to parse GPX file %1: %2")
                          .arg(QFileInfo(filePath).fileName(), QString::fromUtf8(result.description()));
        qWarning() << s_lastError;
        return trackpoints;
    }
    
    // GPX root element
    pugi::xml_node gpx = doc.child("gpx");
    if (!gpx) {
        s_lastError = QString("Invalid GPX file %1: missing <gpx> root element")
                          .arg(QFileInfo(filePath).fileName());
        qWarning() << s_lastError;
        return trackpoints;
    }
    
    int dropped = 0;
    
    for (pugi::xml_node trk : gpx.children("trk")) {
        for (pugi::xml_node trkseg : trk.children("trkseg")) {
            for (pugi::xml_node trkpt : trkseg.children("trkpt")) {
                auto point = readPoint(trkpt);
                if (point && point->isValid()) {
                    trackpoints.append(*point);
                } else {
                    ++dropped;
                }
            }
        }
    }
    
    // Timestamped waypoints count as fixes too
    for (pugi::xml_node wpt : gpx.children("wpt")) {
        auto point = readPoint(wpt);
        if (point && point->isValid()) {
            trackpoints.append(*point);
        } else {
            ++dropped;
        }
    }
    
    sortByTime(trackpoints);
    
    qInfo() << "Parsed" << trackpoints.size() << "trackpoints from" << filePath;
    if (dropped > 0) {
        qDebug() << "Dropped" << dropped << "points without time or with invalid coordinates";
    }
    
    if (!trackpoints.isEmpty()) {
        qInfo() << "Time range:" << trackpoints.first().timestamp 
                << "to" << trackpoints.last().timestamp;
    }
    
    return trackpoints;
}

QVector<TrackPoint> GpxParser::parseFiles(const QStringList& filePaths)
{
    QVector<TrackPoint> merged;
    QSet<QString> seen;
    QString failure;
    
    for (const QString& path : filePaths) {
        QFileInfo info(path);
        QString key = info.canonicalFilePath();
        if (key.isEmpty()) {
            failure = QString("GPX file not found: %1").arg(path);
            qWarning() << failure;
            continue;
        }
        if (seen.contains(key)) {
            qInfo() << "Skipping duplicate GPX file:" << path;
            continue;
        }
        seen.insert(key);
        
        QVector<TrackPoint> points = parse(path);
        if (points.isEmpty() && !s_lastError.isEmpty()) {
            failure = s_lastError;
            continue;
        }
        merged += points;
    }
    
    sortByTime(merged);
    s_lastError = failure;
    return merged;
}

QStringList GpxParser::findGpxFiles(const QString& directory)
{
    QDir dir(directory);
    QStringList result;
    const QFileInfoList entries =
        dir.entryInfoList({"*.gpx"}, QDir::Files | QDir::Readable, QDir::Name);
    for (const QFileInfo& info : entries) {
        result.append(info.absoluteFilePath());
    }
    return result;
}

QDateTime GpxParser::parseTimestamp(const QString& text)
{
    QString timeStr = text.trimmed();
    
    // GPX uses ISO 8601: 2025-12-01T07:35:10Z, with offset or fraction
    QDateTime dt = QDateTime::fromString(timeStr, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        // Try alternative format without 'T'
        dt = QDateTime::fromString(timeStr, "yyyy-MM-dd HH:mm:ss");
    }
    if (!dt.isValid()) {
        return dt;
    }
    
    // Times without a zone designator are taken as UTC
    if (dt.timeSpec() == Qt::LocalTime) {
        dt.setTimeZone(QTimeZone::utc());
        return dt;
    }
    return dt.toUTC();
}

double GpxParser::calculateAverageInterval(const QVector<TrackPoint>& trackpoints)
{
    if (trackpoints.size() < 2) {
        return 300.0; // Default 5 minutes
    }
    
    double totalSeconds = 0.0;
    int count = 0;
    
    for (int i = 1; i < trackpoints.size(); ++i) {
        qint64 msecs = trackpoints[i - 1].timestamp.msecsTo(trackpoints[i].timestamp);
        double seconds = msecs / 1000.0;
        if (seconds > 0) {
            totalSeconds += seconds;
            ++count;
        }
    }
    
    if (count == 0) {
        return 300.0;
    }
    
    double avgInterval = totalSeconds / count;
    qInfo() << "Average trackpoint interval:" << avgInterval << "seconds";
    return avgInterval;
}

QString GpxParser::lastError()
{
    return s_lastError;
}

} // namespace ptt
