#include "core/exif_handler.h"
#include "core/exiftool.h"
#include "core/geotag_settings.h"
#include "core/photo_processor.h"
#include "core/track_interpolator.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

namespace {

bool g_verbose = false;

void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg)
{
    const char* level = "";
    switch (type) {
    case QtDebugMsg:
        if (!g_verbose)
            return;
        level = "debug";
        break;
    case QtInfoMsg:
        if (!g_verbose)
            return;
        level = "info";
        break;
    case QtWarningMsg:
        level = "warning";
        break;
    case QtCriticalMsg:
        level = "critical";
        break;
    case QtFatalMsg:
        level = "fatal";
        break;
    }
    QTextStream err(stderr);
    err << "[" << level << "] " << msg << Qt::endl;
}

QString describe(const ptt::PhotoRecord& photo, const QVector<ptt::TrackPoint>& trackpoints)
{
    switch (photo.status) {
    case ptt::PhotoStatus::HasGps:
        return "already has GPS, skipped";
    case ptt::PhotoStatus::NoTime:
        return "no capture time";
    case ptt::PhotoStatus::NoMatch:
        if (ptt::TrackInterpolator::isWithinTrackRange(trackpoints, *photo.captureTime))
            return "gap between trackpoints too large";
        return "outside track time range";
    case ptt::PhotoStatus::Matched:
        return QString("lat %1, lon %2, ele %3 m")
            .arg(photo.matchedCoordinate->latitude, 0, 'f', 6)
            .arg(photo.matchedCoordinate->longitude, 0, 'f', 6)
            .arg(*photo.matchedElevation, 0, 'f', 1);
    default:
        return ptt::statusName(photo.status);
    }
}

void reportWriteFailures(ptt::PhotoProcessor& processor, QTextStream& err)
{
    QObject::connect(&processor, &ptt::PhotoProcessor::photoWritten,
                     [&processor, &err](int index, bool success) {
                         if (!success) {
                             const ptt::PhotoRecord& photo = processor.photos()[index];
                             err << "Failed to write " << photo.fileName << ": "
                                 << photo.errorMessage << Qt::endl;
                         }
                     });
}

// Writes one user-given position into the named photos, no track involved
int runManualPlacement(const QDir& photoDir, const QStringList& fileNames,
                       const ptt::ManualPlacement& placement,
                       const ptt::GeotagSettings& settings, QTextStream& out, QTextStream& err)
{
    QStringList paths;
    for (const QString& name : fileNames) {
        QFileInfo info(photoDir, name);
        if (!info.isFile()) {
            err << "Error: photo '" << name << "' not found in " << photoDir.absolutePath()
                << Qt::endl;
            return 1;
        }
        if (!ptt::ExifHandler::isSupported(info.fileName())) {
            err << "Error: unsupported image format: " << name << Qt::endl;
            return 1;
        }
        paths.append(info.absoluteFilePath());
    }

    ptt::PhotoProcessor processor;
    processor.scanPhotos(paths, settings.timeOffsetSeconds());

    QVector<int> indices;
    for (int i = 0; i < processor.photos().size(); ++i)
        indices.append(i);
    processor.applyCoordinate(indices, placement.coordinate, placement.elevation);

    out << "Placing " << indices.size() << " photo(s) at "
        << QString::number(placement.coordinate.latitude, 'f', 6) << ", "
        << QString::number(placement.coordinate.longitude, 'f', 6)
        << (settings.dryRun ? " (dry run)" : "") << Qt::endl;

    reportWriteFailures(processor, err);
    int written = processor.writeMatched(settings.dryRun);

    out << "  Tagged:           " << written << (settings.dryRun ? " (dry run)" : "") << Qt::endl;
    if (written < indices.size())
        out << "  Errors:           " << (indices.size() - written) << Qt::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("PhotoTrackTagger");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("PhotoTrackTagger");

    qInstallMessageHandler(messageHandler);
    QTextStream out(stdout);
    QTextStream err(stderr);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Write GPS positions from GPX tracks into photos that have none.\n"
        "Positions are interpolated between the trackpoints around each capture time.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("photo_dir", "Folder with the photos (default: current folder)",
                                 "[photo_dir]");

    QCommandLineOption gpxDirOption("gpx-dir", "Folder with GPX files (default: <photo_dir>/gpx).",
                                    "dir");
    QCommandLineOption maxGapOption("max-gap",
                                    "Maximum tolerated gap in seconds (default: 3600).",
                                    "seconds");
    QCommandLineOption offsetOption("time-offset",
                                    "Camera clock offset from UTC in hours, for photos "
                                    "without an offset tag (default: system time zone).",
                                    "hours");
    QCommandLineOption dryRunOption("dry-run", "Show results without modifying any file.");
    QCommandLineOption noMoveOption("no-move", "Leave unmatched photos in place.");
    QCommandLineOption configOption("config", "Read settings from an INI file.", "file");
    QCommandLineOption setOption("set",
                                 "Write this position into the photos named with --file "
                                 "instead of matching against GPX tracks.",
                                 "lat,lon[,ele]");
    QCommandLineOption fileOption("file", "Photo inside photo_dir to place with --set "
                                          "(repeatable).",
                                  "name");
    QCommandLineOption verboseOption({"v", "verbose"}, "Print diagnostic messages.");
    parser.addOptions({gpxDirOption, maxGapOption, offsetOption, dryRunOption, noMoveOption,
                       configOption, setOption, fileOption, verboseOption});
    parser.process(app);

    g_verbose = parser.isSet(verboseOption);

    ptt::GeotagSettings settings;
    if (parser.isSet(configOption) &&
        !ptt::SettingsLoader::load(parser.value(configOption), settings)) {
        err << "Error: " << ptt::SettingsLoader::lastError() << Qt::endl;
        return 1;
    }

    if (parser.isSet(maxGapOption)) {
        bool ok = false;
        settings.maxGapSeconds = parser.value(maxGapOption).toDouble(&ok);
        if (!ok) {
            err << "Error: --max-gap expects a number of seconds" << Qt::endl;
            parser.showHelp(1);
        }
    }
    if (parser.isSet(offsetOption)) {
        bool ok = false;
        settings.timeOffsetHours = parser.value(offsetOption).toDouble(&ok);
        if (!ok) {
            err << "Error: --time-offset expects a number of hours" << Qt::endl;
            parser.showHelp(1);
        }
    }
    if (parser.isSet(dryRunOption))
        settings.dryRun = true;
    if (parser.isSet(noMoveOption))
        settings.moveUnmatched = false;

    if (!ptt::SettingsLoader::validate(settings)) {
        err << "Error: " << ptt::SettingsLoader::lastError() << Qt::endl;
        return 1;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1) {
        err << "Error: expected at most one photo folder" << Qt::endl;
        parser.showHelp(1);
    }

    QDir photoDir(positional.isEmpty() ? QDir::currentPath() : positional.first());
    QString gpxDir = parser.isSet(gpxDirOption) ? parser.value(gpxDirOption)
                                                : photoDir.absoluteFilePath(settings.gpxFolder);

    if (!photoDir.exists()) {
        err << "Error: folder '" << photoDir.absolutePath() << "' does not exist" << Qt::endl;
        return 1;
    }

    if (parser.isSet(setOption) || parser.isSet(fileOption)) {
        if (!parser.isSet(setOption) || !parser.isSet(fileOption)) {
            err << "Error: --set and --file must be used together" << Qt::endl;
            return 1;
        }
        auto placement = ptt::SettingsLoader::parsePlacement(parser.value(setOption));
        if (!placement) {
            err << "Error: " << ptt::SettingsLoader::lastError() << Qt::endl;
            return 1;
        }
        return runManualPlacement(photoDir, parser.values(fileOption), *placement, settings,
                                  out, err);
    }
    if (!QFileInfo(gpxDir).isDir()) {
        err << "Error: folder '" << gpxDir << "' does not exist" << Qt::endl;
        err << "  Create a '" << settings.gpxFolder
            << "' folder inside the photo folder and put the GPX files there." << Qt::endl;
        return 1;
    }

    out << "Photo folder: " << photoDir.absolutePath() << Qt::endl;
    out << "GPX folder:   " << QFileInfo(gpxDir).absoluteFilePath() << Qt::endl;
    out << "Max gap:      " << settings.maxGapSeconds << " s" << Qt::endl;
    if (settings.dryRun)
        out << "DRY RUN - no file will be modified" << Qt::endl;
    out << Qt::endl;

    // exiftool is only required for HEIC/HEIF
    if (ptt::ExifTool::isAvailable()) {
        out << "exiftool version: " << ptt::ExifTool::version() << Qt::endl;
    } else {
        out << "exiftool not found, HEIC/HEIF photos cannot be written" << Qt::endl;
    }

    ptt::PhotoProcessor processor;
    QObject::connect(&processor, &ptt::PhotoProcessor::trackLoadError,
                     [&err](const QString& error) { err << "Error: " << error << Qt::endl; });

    if (!processor.loadTrackDirectory(gpxDir)) {
        err << "Error: no valid trackpoints found" << Qt::endl;
        return 1;
    }

    auto range = ptt::TrackInterpolator::trackTimeRange(processor.trackpoints());
    out << "Loaded " << processor.trackpoints().size() << " trackpoints" << Qt::endl;
    out << "Track time range: " << range.first.toString(Qt::ISODate) << " - "
        << range.second.toString(Qt::ISODate) << Qt::endl;

    const QStringList images = ptt::ExifHandler::findImageFiles(photoDir.absolutePath());
    out << "Found " << images.size() << " image file(s)" << Qt::endl;
    if (images.isEmpty()) {
        out << "Nothing to do." << Qt::endl;
        return 0;
    }
    out << Qt::endl;

    processor.scanPhotos(images, settings.timeOffsetSeconds());
    processor.runMatching(settings.maxGapSeconds);

    const auto& photos = processor.photos();
    for (int i = 0; i < photos.size(); ++i) {
        const ptt::PhotoRecord& photo = photos[i];
        out << "[" << (i + 1) << "/" << photos.size() << "] " << photo.fileName;
        if (photo.captureTime)
            out << " (" << photo.captureTime->toString(Qt::ISODate) << ")";
        out << ": " << describe(photo, processor.trackpoints()) << Qt::endl;
    }

    reportWriteFailures(processor, err);
    int tagged = processor.writeMatched(settings.dryRun);

    // Counted before relocation so the report reflects the matching outcome
    ptt::MatchSummary summary = processor.summary();

    if (settings.moveUnmatched && summary.noTime + summary.noMatch > 0) {
        QString target = photoDir.absoluteFilePath(settings.unmatchedFolder);
        out << Qt::endl << "Moving " << (summary.noTime + summary.noMatch)
            << " unmatched photo(s) to '" << settings.unmatchedFolder << "/'"
            << (settings.dryRun ? " (dry run)" : "") << Qt::endl;
        int moved = processor.moveUnmatched(target, settings.dryRun);
        if (moved < summary.noTime + summary.noMatch) {
            err << (summary.noTime + summary.noMatch - moved)
                << " photo(s) could not be moved" << Qt::endl;
        }
    }

    out << Qt::endl << "Summary" << Qt::endl;
    out << "  Images:           " << summary.total << Qt::endl;
    out << "  Already had GPS:  " << summary.hasGps << Qt::endl;
    out << "  Tagged:           " << tagged << (settings.dryRun ? " (dry run)" : "") << Qt::endl;
    out << "  No capture time:  " << summary.noTime << Qt::endl;
    out << "  No track match:   " << summary.noMatch << Qt::endl;
    if (summary.error > 0)
        out << "  Errors:           " << summary.error << Qt::endl;

    return 0;
}
