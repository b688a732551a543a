#include "core/track_interpolator.h"
#include "test_util.h"
#include <gtest/gtest.h>

namespace
{
    using namespace ptt;
    using ptt::test::point;
    using ptt::test::utc;

    constexpr double kTolerance = 1e-9;

    QVector<TrackPoint> morningWalk()
    {
        return {
            point("2024-05-01T10:00:00", 37.50, 127.00, 10.0),
            point("2024-05-01T10:10:00", 37.52, 127.05, 20.0),
            point("2024-05-01T10:20:00", 37.53, 127.07, 25.0),
        };
    }

    // ========================================================================
    // Degenerate input
    // ========================================================================

    TEST(TrackInterpolator, EmptyTrackNeverMatches)
    {
        QVector<TrackPoint> empty;
        EXPECT_FALSE(TrackInterpolator::interpolate(empty, utc("2024-05-01T10:00:00"), 3600).has_value());
        EXPECT_FALSE(TrackInterpolator::interpolate(empty, utc("2024-05-01T10:00:00"), 1e9).has_value());
    }

    TEST(TrackInterpolator, InvalidTimeNeverMatches)
    {
        const auto track = morningWalk();
        EXPECT_FALSE(TrackInterpolator::interpolate(track, QDateTime(), 3600).has_value());
        EXPECT_FALSE(TrackInterpolator::interpolate(track, QDateTime(), 1e9).has_value());
    }

    TEST(TrackInterpolator, SinglePointClampsWithinGap)
    {
        QVector<TrackPoint> track = {point("2024-05-01T10:00:00", 1.0, 2.0, 3.0)};

        auto before = TrackInterpolator::interpolate(track, utc("2024-05-01T09:30:00"), 3600);
        ASSERT_TRUE(before.has_value());
        EXPECT_DOUBLE_EQ(before->coordinate.latitude, 1.0);

        auto after = TrackInterpolator::interpolate(track, utc("2024-05-01T10:30:00"), 3600);
        ASSERT_TRUE(after.has_value());
        EXPECT_DOUBLE_EQ(after->elevation, 3.0);
    }

    // ========================================================================
    // Exact timestamps
    // ========================================================================

    TEST(TrackInterpolator, ExactTimestampReturnsPointUnmodified)
    {
        const auto track = morningWalk();
        for (const TrackPoint& p : track) {
            for (double maxGap : {0.0, 1.0, 3600.0}) {
                auto fix = TrackInterpolator::interpolate(track, p.timestamp, maxGap);
                ASSERT_TRUE(fix.has_value());
                EXPECT_EQ(fix->coordinate.latitude, p.latitude);
                EXPECT_EQ(fix->coordinate.longitude, p.longitude);
                EXPECT_EQ(fix->elevation, p.elevation);
            }
        }
    }

    TEST(TrackInterpolator, DuplicateTimestampsResolveToFirstPoint)
    {
        QVector<TrackPoint> track = {
            point("2024-05-01T10:00:00", 10.0, 20.0, 1.0),
            point("2024-05-01T10:05:00", 11.0, 21.0, 2.0),
            point("2024-05-01T10:05:00", 12.0, 22.0, 3.0),
            point("2024-05-01T10:10:00", 13.0, 23.0, 4.0),
        };

        auto fix = TrackInterpolator::interpolate(track, utc("2024-05-01T10:05:00"), 3600);
        ASSERT_TRUE(fix.has_value());
        EXPECT_EQ(fix->coordinate.latitude, 11.0);
        EXPECT_EQ(fix->coordinate.longitude, 21.0);
        EXPECT_EQ(fix->elevation, 2.0);

        // Before the tie the leftmost duplicate is the upper bracket
        auto between = TrackInterpolator::interpolate(track, utc("2024-05-01T10:02:30"), 3600);
        ASSERT_TRUE(between.has_value());
        EXPECT_NEAR(between->coordinate.latitude, 10.5, kTolerance);

        // After the tie the last duplicate is the lower bracket
        auto later = TrackInterpolator::interpolate(track, utc("2024-05-01T10:07:30"), 3600);
        ASSERT_TRUE(later.has_value());
        EXPECT_NEAR(later->coordinate.latitude, 12.5, kTolerance);
    }

    TEST(TrackInterpolator, AllPointsAtSameTime)
    {
        QVector<TrackPoint> track = {
            point("2024-05-01T10:00:00", 1.0, 1.0, 1.0),
            point("2024-05-01T10:00:00", 2.0, 2.0, 2.0),
        };

        auto fix = TrackInterpolator::interpolate(track, utc("2024-05-01T10:00:00"), 0);
        ASSERT_TRUE(fix.has_value());
        EXPECT_EQ(fix->coordinate.latitude, 1.0);
    }

    // ========================================================================
    // Boundary clamp
    // ========================================================================

    TEST(TrackInterpolator, ClampsBeforeFirstPointUpToMaxGap)
    {
        const auto track = morningWalk();

        auto atLimit = TrackInterpolator::interpolate(track, utc("2024-05-01T09:00:00"), 3600);
        ASSERT_TRUE(atLimit.has_value());
        EXPECT_EQ(atLimit->coordinate.latitude, 37.50);
        EXPECT_EQ(atLimit->coordinate.longitude, 127.00);
        EXPECT_EQ(atLimit->elevation, 10.0);

        auto pastLimit = TrackInterpolator::interpolate(track, utc("2024-05-01T08:59:59.999"), 3600);
        EXPECT_FALSE(pastLimit.has_value());
    }

    TEST(TrackInterpolator, ClampsAfterLastPointUpToMaxGap)
    {
        const auto track = morningWalk();

        auto atLimit = TrackInterpolator::interpolate(track, utc("2024-05-01T11:20:00"), 3600);
        ASSERT_TRUE(atLimit.has_value());
        EXPECT_EQ(atLimit->coordinate.latitude, 37.53);
        EXPECT_EQ(atLimit->coordinate.longitude, 127.07);
        EXPECT_EQ(atLimit->elevation, 25.0);

        auto pastLimit = TrackInterpolator::interpolate(track, utc("2024-05-01T11:20:00.001"), 3600);
        EXPECT_FALSE(pastLimit.has_value());
    }

    TEST(TrackInterpolator, BoundaryClampDoesNotExtrapolate)
    {
        const auto track = morningWalk();

        auto fix = TrackInterpolator::interpolate(track, utc("2024-05-01T09:55:00"), 3600);
        ASSERT_TRUE(fix.has_value());
        EXPECT_EQ(fix->coordinate.latitude, track.first().latitude);
        EXPECT_EQ(fix->coordinate.longitude, track.first().longitude);
    }

    // ========================================================================
    // Interior interpolation
    // ========================================================================

    TEST(TrackInterpolator, InterpolatesLinearlyBetweenBracketingPoints)
    {
        QVector<TrackPoint> track = {
            point("2024-05-01T12:00:00", -33.0, 151.0, 100.0),
            point("2024-05-01T12:16:40", -34.0, 150.0, 50.0),
        };
        const QDateTime t0 = track[0].timestamp;
        const double span = t0.msecsTo(track[1].timestamp);

        for (double r : {0.0, 0.1, 0.25, 0.5, 0.75, 0.999}) {
            QDateTime target = t0.addMSecs(static_cast<qint64>(span * r));
            auto fix = TrackInterpolator::interpolate(track, target, 3600);
            ASSERT_TRUE(fix.has_value()) << "ratio " << r;
            EXPECT_NEAR(fix->coordinate.latitude, -33.0 + r * (-34.0 + 33.0), kTolerance);
            EXPECT_NEAR(fix->coordinate.longitude, 151.0 + r * (150.0 - 151.0), kTolerance);
            EXPECT_NEAR(fix->elevation, 100.0 + r * (50.0 - 100.0), kTolerance);
        }
    }

    TEST(TrackInterpolator, UsesMillisecondResolution)
    {
        QVector<TrackPoint> track = {
            point("2024-05-01T12:00:00", 0.0, 0.0, 0.0),
            point("2024-05-01T12:00:01", 1.0, 1.0, 1.0),
        };

        auto fix = TrackInterpolator::interpolate(track, utc("2024-05-01T12:00:00.250"), 60);
        ASSERT_TRUE(fix.has_value());
        EXPECT_NEAR(fix->coordinate.latitude, 0.25, kTolerance);
    }

    TEST(TrackInterpolator, BracketGapEqualToMaxGapIsAccepted)
    {
        QVector<TrackPoint> track = {
            point("2024-05-01T10:00:00", 0.0, 0.0),
            point("2024-05-01T11:00:00", 1.0, 1.0),
        };

        auto fix = TrackInterpolator::interpolate(track, utc("2024-05-01T10:30:00"), 3600);
        ASSERT_TRUE(fix.has_value());
        EXPECT_NEAR(fix->coordinate.latitude, 0.5, kTolerance);
    }

    TEST(TrackInterpolator, RejectsTargetBetweenPointsTooFarApart)
    {
        QVector<TrackPoint> track = {
            point("2024-05-01T10:00:00", 0.0, 0.0),
            point("2024-05-01T12:00:00", 1.0, 1.0),
        };

        // Even one second from a trackpoint, the bracket is too wide
        EXPECT_FALSE(TrackInterpolator::interpolate(track, utc("2024-05-01T10:00:01"), 3600).has_value());
        EXPECT_FALSE(TrackInterpolator::interpolate(track, utc("2024-05-01T11:00:00"), 3600).has_value());
        EXPECT_FALSE(TrackInterpolator::interpolate(track, utc("2024-05-01T11:59:59"), 3600).has_value());

        // The trackpoints themselves still match
        EXPECT_TRUE(TrackInterpolator::interpolate(track, utc("2024-05-01T12:00:00"), 3600).has_value());
    }

    TEST(TrackInterpolator, ZeroMaxGapOnlyMatchesExactTimes)
    {
        const auto track = morningWalk();
        EXPECT_FALSE(TrackInterpolator::interpolate(track, utc("2024-05-01T10:05:00"), 0).has_value());
        EXPECT_FALSE(TrackInterpolator::interpolate(track, utc("2024-05-01T09:59:59"), 0).has_value());
        EXPECT_TRUE(TrackInterpolator::interpolate(track, utc("2024-05-01T10:10:00"), 0).has_value());
    }

    TEST(TrackInterpolator, ComparesInstantsAcrossTimeZones)
    {
        const auto track = morningWalk();
        QDateTime seoul = QDateTime::fromString("2024-05-01T19:05:00+09:00", Qt::ISODate);

        auto fix = TrackInterpolator::interpolate(track, seoul, 3600);
        ASSERT_TRUE(fix.has_value());
        EXPECT_NEAR(fix->coordinate.latitude, 37.51, kTolerance);
    }

    TEST(TrackInterpolator, MiddleOfFirstSegment)
    {
        auto fix = TrackInterpolator::interpolate(morningWalk(), utc("2024-05-01T10:05:00"), 3600);
        ASSERT_TRUE(fix.has_value());
        EXPECT_NEAR(fix->coordinate.latitude, 37.51, kTolerance);
        EXPECT_NEAR(fix->coordinate.longitude, 127.025, kTolerance);
        EXPECT_NEAR(fix->elevation, 15.0, kTolerance);
    }

    // ========================================================================
    // Track range helpers
    // ========================================================================

    TEST(TrackInterpolator, RangeSeparatesGapsFromOutsideTimes)
    {
        QVector<TrackPoint> track = {
            point("2024-05-01T10:00:00", 37.50, 127.00),
            point("2024-05-01T13:00:00", 37.60, 127.10),
        };

        QDateTime inGap = utc("2024-05-01T11:30:00");
        EXPECT_FALSE(TrackInterpolator::interpolate(track, inGap, 3600).has_value());
        EXPECT_TRUE(TrackInterpolator::isWithinTrackRange(track, inGap));

        QDateTime late = utc("2024-05-01T15:00:00");
        EXPECT_FALSE(TrackInterpolator::interpolate(track, late, 3600).has_value());
        EXPECT_FALSE(TrackInterpolator::isWithinTrackRange(track, late));
    }

    TEST(TrackInterpolator, TrackRange)
    {
        const auto track = morningWalk();
        EXPECT_TRUE(TrackInterpolator::isWithinTrackRange(track, utc("2024-05-01T10:00:00")));
        EXPECT_TRUE(TrackInterpolator::isWithinTrackRange(track, utc("2024-05-01T10:20:00")));
        EXPECT_FALSE(TrackInterpolator::isWithinTrackRange(track, utc("2024-05-01T10:20:01")));
        EXPECT_FALSE(TrackInterpolator::isWithinTrackRange({}, utc("2024-05-01T10:00:00")));

        auto range = TrackInterpolator::trackTimeRange(track);
        EXPECT_EQ(range.first, utc("2024-05-01T10:00:00"));
        EXPECT_EQ(range.second, utc("2024-05-01T10:20:00"));

        auto emptyRange = TrackInterpolator::trackTimeRange({});
        EXPECT_FALSE(emptyRange.first.isValid());
        EXPECT_FALSE(emptyRange.second.isValid());
    }
}
