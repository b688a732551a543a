#include "geotag_settings.h"
#include <QDebug>
#include <QFileInfo>
#include <QSettings>
#include <QStringList>
#include <cmath>

namespace ptt {

QString SettingsLoader::s_lastError;

namespace {

bool readDouble(const QSettings& ini, const char* key, double& out, QString& error)
{
    if (!ini.contains(key))
        return true;
    bool ok = false;
    double value = ini.value(key).toDouble(&ok);
    if (!ok) {
        error = QString("Invalid number for %1: %2")
                    .arg(QString::fromLatin1(key), ini.value(key).toString());
        return false;
    }
    out = value;
    return true;
}

} // namespace

bool SettingsLoader::load(const QString& filePath, GeotagSettings& settings)
{
    s_lastError.clear();
    
    if (!QFileInfo(filePath).isReadable()) {
        s_lastError = QString("Settings file not readable: %1").arg(filePath);
        return false;
    }
    
    QSettings ini(filePath, QSettings::IniFormat);
    if (ini.status() != QSettings::NoError) {
        s_lastError = QString("Malformed settings file: %1").arg(filePath);
        return false;
    }
    
    GeotagSettings updated = settings;
    ini.beginGroup("geotag");
    
    QString error;
    if (!readDouble(ini, "maxGapSeconds", updated.maxGapSeconds, error)) {
        s_lastError = error;
        return false;
    }
    if (ini.contains("timeOffsetHours")) {
        double hours = 0.0;
        if (!readDouble(ini, "timeOffsetHours", hours, error)) {
            s_lastError = error;
            return false;
        }
        updated.timeOffsetHours = hours;
    }
    
    updated.dryRun = ini.value("dryRun", updated.dryRun).toBool();
    updated.moveUnmatched = ini.value("moveUnmatched", updated.moveUnmatched).toBool();
    updated.gpxFolder = ini.value("gpxFolder", updated.gpxFolder).toString();
    updated.unmatchedFolder = ini.value("unmatchedFolder", updated.unmatchedFolder).toString();
    ini.endGroup();
    
    if (!validate(updated)) {
        s_lastError = QString("%1 (in %2)").arg(s_lastError, filePath);
        return false;
    }
    
    settings = updated;
    qInfo() << "Loaded settings from" << filePath;
    return true;
}

bool SettingsLoader::validate(const GeotagSettings& settings)
{
    s_lastError.clear();
    
    if (!std::isfinite(settings.maxGapSeconds) || settings.maxGapSeconds < 0.0) {
        s_lastError = QString("maxGapSeconds must be a non-negative number, got %1")
                          .arg(settings.maxGapSeconds);
        return false;
    }
    if (settings.timeOffsetHours &&
        (!std::isfinite(*settings.timeOffsetHours) || std::abs(*settings.timeOffsetHours) > 14.0)) {
        s_lastError = QString("timeOffsetHours must be within [-14, 14], got %1")
                          .arg(*settings.timeOffsetHours);
        return false;
    }
    if (settings.gpxFolder.isEmpty() || settings.unmatchedFolder.isEmpty()) {
        s_lastError = "Folder names must not be empty";
        return false;
    }
    return true;
}

std::optional<ManualPlacement> SettingsLoader::parsePlacement(const QString& text)
{
    s_lastError.clear();
    
    const QStringList parts = text.split(',');
    if (parts.size() != 2 && parts.size() != 3) {
        s_lastError = QString("Expected LAT,LON or LAT,LON,ELE, got '%1'").arg(text);
        return std::nullopt;
    }
    
    double values[3] = {0.0, 0.0, 0.0};
    for (int i = 0; i < parts.size(); ++i) {
        bool ok = false;
        values[i] = parts[i].trimmed().toDouble(&ok);
        if (!ok || !std::isfinite(values[i])) {
            s_lastError = QString("Invalid number '%1' in '%2'").arg(parts[i].trimmed(), text);
            return std::nullopt;
        }
    }
    
    if (std::abs(values[0]) > 90.0 || std::abs(values[1]) > 180.0) {
        s_lastError = QString("Position out of range: %1").arg(text);
        return std::nullopt;
    }
    
    ManualPlacement placement;
    placement.coordinate = GeoCoordinate{values[0], values[1]};
    if (parts.size() == 3) {
        placement.elevation = values[2];
    }
    return placement;
}

QString SettingsLoader::lastError()
{
    return s_lastError;
}

} // namespace ptt
