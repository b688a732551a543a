#include "core/batch_matcher.h"
#include "test_util.h"
#include <gtest/gtest.h>

namespace
{
    using namespace ptt;
    using ptt::test::photo;
    using ptt::test::point;
    using ptt::test::utc;

    QVector<TrackPoint> twoPointTrack()
    {
        return {
            point("2024-05-01T10:00:00", 37.50, 127.00, 10.0),
            point("2024-05-01T10:10:00", 37.52, 127.05, 20.0),
        };
    }

    // ========================================================================
    // Precedence rules
    // ========================================================================

    TEST(BatchMatcher, ExistingGpsTakesPrecedence)
    {
        QVector<PhotoRecord> photos = {
            photo("tagged.jpg", utc("2024-05-01T10:05:00"), GeoCoordinate{48.85, 2.35}),
            photo("tagged_no_time.jpg", std::nullopt, GeoCoordinate{48.85, 2.35}),
            photo("tagged_far.jpg", utc("2020-01-01T00:00:00"), GeoCoordinate{48.85, 2.35}),
        };

        BatchMatcher::matchPhotos(photos, twoPointTrack(), 3600);

        for (const PhotoRecord& p : photos) {
            EXPECT_EQ(p.status, PhotoStatus::HasGps) << p.fileName.toStdString();
            EXPECT_FALSE(p.matchedCoordinate.has_value());
            EXPECT_FALSE(p.matchedElevation.has_value());
            EXPECT_DOUBLE_EQ(p.existingCoordinate->latitude, 48.85);
        }
    }

    TEST(BatchMatcher, ExistingGpsWinsEvenWithEmptyTrack)
    {
        QVector<PhotoRecord> photos = {photo("a.jpg", std::nullopt, GeoCoordinate{1.0, 2.0})};
        BatchMatcher::matchPhotos(photos, {}, 3600);
        EXPECT_EQ(photos[0].status, PhotoStatus::HasGps);
    }

    TEST(BatchMatcher, MissingCaptureTime)
    {
        QVector<PhotoRecord> photos = {photo("no_time.jpg", std::nullopt)};
        BatchMatcher::matchPhotos(photos, twoPointTrack(), 3600);

        EXPECT_EQ(photos[0].status, PhotoStatus::NoTime);
        EXPECT_FALSE(photos[0].matchedCoordinate.has_value());
    }

    TEST(BatchMatcher, InvalidCaptureTimeCountsAsMissing)
    {
        QVector<PhotoRecord> photos = {photo("bad_time.jpg", QDateTime())};
        BatchMatcher::matchPhotos(photos, twoPointTrack(), 3600);

        EXPECT_EQ(photos[0].status, PhotoStatus::NoTime);
        EXPECT_FALSE(photos[0].matchedCoordinate.has_value());
    }

    TEST(BatchMatcher, MatchedRecordsCarryCoordinateAndElevation)
    {
        QVector<PhotoRecord> photos = {
            photo("a.jpg", utc("2024-05-01T10:00:00")),
            photo("b.jpg", utc("2024-05-01T10:02:00")),
            photo("c.jpg", utc("2024-05-01T10:30:00")),
        };
        BatchMatcher::matchPhotos(photos, twoPointTrack(), 3600);

        for (const PhotoRecord& p : photos) {
            ASSERT_EQ(p.status, PhotoStatus::Matched) << p.fileName.toStdString();
            EXPECT_TRUE(p.hasMatchedCoordinates());
        }
        EXPECT_NEAR(photos[1].matchedCoordinate->latitude, 37.504, 1e-9);
        EXPECT_NEAR(*photos[1].matchedElevation, 12.0, 1e-9);
        EXPECT_DOUBLE_EQ(photos[2].matchedCoordinate->longitude, 127.05);
    }

    TEST(BatchMatcher, EmptyTrackLeavesTimedPhotosUnmatched)
    {
        QVector<PhotoRecord> photos = {photo("a.jpg", utc("2024-05-01T10:00:00"))};
        BatchMatcher::matchPhotos(photos, {}, 3600);
        EXPECT_EQ(photos[0].status, PhotoStatus::NoMatch);
    }

    TEST(BatchMatcher, EmptyCollectionIsFine)
    {
        QVector<PhotoRecord> photos;
        BatchMatcher::matchPhotos(photos, twoPointTrack(), 3600);
        EXPECT_TRUE(photos.isEmpty());
    }

    // ========================================================================
    // Re-running
    // ========================================================================

    TEST(BatchMatcher, RepeatedRunsGiveIdenticalResults)
    {
        QVector<PhotoRecord> photos = {
            photo("a.jpg", utc("2024-05-01T10:05:00")),
            photo("b.jpg", utc("2024-05-01T08:00:00")),
            photo("c.jpg", std::nullopt),
            photo("d.jpg", utc("2024-05-01T10:07:13"), GeoCoordinate{0.0, 0.0}),
        };
        const auto track = twoPointTrack();

        BatchMatcher::matchPhotos(photos, track, 3600);
        const QVector<PhotoRecord> first = photos;
        BatchMatcher::matchPhotos(photos, track, 3600);

        ASSERT_EQ(first.size(), photos.size());
        for (int i = 0; i < photos.size(); ++i) {
            EXPECT_EQ(first[i].status, photos[i].status);
            EXPECT_EQ(first[i].matchedCoordinate.has_value(), photos[i].matchedCoordinate.has_value());
            if (photos[i].matchedCoordinate) {
                EXPECT_EQ(first[i].matchedCoordinate->latitude, photos[i].matchedCoordinate->latitude);
                EXPECT_EQ(first[i].matchedCoordinate->longitude, photos[i].matchedCoordinate->longitude);
                EXPECT_EQ(*first[i].matchedElevation, *photos[i].matchedElevation);
            }
        }
    }

    TEST(BatchMatcher, RerunPicksUpNewTrackData)
    {
        QVector<PhotoRecord> photos = {photo("early.jpg", utc("2024-05-01T08:00:00"))};

        BatchMatcher::matchPhotos(photos, twoPointTrack(), 3600);
        EXPECT_EQ(photos[0].status, PhotoStatus::NoMatch);

        auto extended = twoPointTrack();
        extended.prepend(point("2024-05-01T08:00:00", 37.40, 126.90, 5.0));
        BatchMatcher::matchPhotos(photos, extended, 3600);
        ASSERT_EQ(photos[0].status, PhotoStatus::Matched);
        EXPECT_DOUBLE_EQ(photos[0].matchedCoordinate->latitude, 37.40);
    }

    TEST(BatchMatcher, NoMatchKeepsPreviousMatchedValues)
    {
        QVector<PhotoRecord> photos = {photo("a.jpg", utc("2024-05-01T10:05:00"))};
        BatchMatcher::matchPhotos(photos, twoPointTrack(), 3600);
        ASSERT_EQ(photos[0].status, PhotoStatus::Matched);

        BatchMatcher::matchPhotos(photos, twoPointTrack(), 60);
        EXPECT_EQ(photos[0].status, PhotoStatus::NoMatch);
        ASSERT_TRUE(photos[0].matchedCoordinate.has_value());
        EXPECT_NEAR(photos[0].matchedCoordinate->latitude, 37.51, 1e-9);
    }

    TEST(BatchMatcher, PriorStatusIsIgnored)
    {
        PhotoRecord written = photo("w.jpg", utc("2024-05-01T10:05:00"));
        written.status = PhotoStatus::Written;
        PhotoRecord failed = photo("e.jpg", std::nullopt);
        failed.status = PhotoStatus::Error;
        QVector<PhotoRecord> photos = {written, failed};

        BatchMatcher::matchPhotos(photos, twoPointTrack(), 3600);
        EXPECT_EQ(photos[0].status, PhotoStatus::Matched);
        EXPECT_EQ(photos[1].status, PhotoStatus::NoTime);
    }

    // ========================================================================
    // Scenario
    // ========================================================================

    TEST(BatchMatcher, WalkAroundTheBlock)
    {
        QVector<PhotoRecord> photos = {
            photo("midway.jpg", utc("2024-05-01T10:05:00")),
            photo("too_early.jpg", utc("2024-05-01T08:00:00")),
            photo("undated.jpg", std::nullopt),
        };

        BatchMatcher::matchPhotos(photos, twoPointTrack(), 3600);

        ASSERT_EQ(photos[0].status, PhotoStatus::Matched);
        EXPECT_NEAR(photos[0].matchedCoordinate->latitude, 37.51, 1e-9);
        EXPECT_NEAR(photos[0].matchedCoordinate->longitude, 127.025, 1e-9);
        EXPECT_NEAR(*photos[0].matchedElevation, 15.0, 1e-9);

        EXPECT_EQ(photos[1].status, PhotoStatus::NoMatch);
        EXPECT_FALSE(photos[1].matchedCoordinate.has_value());

        EXPECT_EQ(photos[2].status, PhotoStatus::NoTime);

        MatchSummary summary = BatchMatcher::summarize(photos);
        EXPECT_EQ(summary.total, 3);
        EXPECT_EQ(summary.matched, 1);
        EXPECT_EQ(summary.noMatch, 1);
        EXPECT_EQ(summary.noTime, 1);
        EXPECT_EQ(summary.hasGps, 0);
    }

    TEST(BatchMatcher, SummarizeCountsEveryStatus)
    {
        QVector<PhotoRecord> photos(7);
        photos[0].status = PhotoStatus::Pending;
        photos[1].status = PhotoStatus::HasGps;
        photos[2].status = PhotoStatus::NoTime;
        photos[3].status = PhotoStatus::Matched;
        photos[4].status = PhotoStatus::NoMatch;
        photos[5].status = PhotoStatus::Written;
        photos[6].status = PhotoStatus::Error;

        MatchSummary summary = BatchMatcher::summarize(photos);
        EXPECT_EQ(summary.total, 7);
        EXPECT_EQ(summary.pending, 1);
        EXPECT_EQ(summary.hasGps, 1);
        EXPECT_EQ(summary.noTime, 1);
        EXPECT_EQ(summary.matched, 1);
        EXPECT_EQ(summary.noMatch, 1);
        EXPECT_EQ(summary.written, 1);
        EXPECT_EQ(summary.error, 1);
        EXPECT_STREQ(statusName(PhotoStatus::NoMatch), "no_match");
    }
}
